#include "gpu_context.h"
#include <webgpu/wgpu.h>
#include <glfw3webgpu.h>
#include <cstdio>
#include <cstdlib>

void GpuContext::onDeviceError(WGPUErrorType type, const char* message, void* userdata) {
    fprintf(stderr, "[WebGPU Error] type=%d: %s\n", (int)type, message ? message : "");
    if (type == WGPUErrorType_OutOfMemory || type == WGPUErrorType_Internal ||
        type == WGPUErrorType_DeviceLost) {
        // Nothing downstream can be trusted after this
        fprintf(stderr, "[WebGPU Error] fatal, terminating\n");
        std::exit(EXIT_FAILURE);
    }
    auto* ctx = (GpuContext*)userdata;
    if (ctx) ctx->m_errorCount++;
}

void GpuContext::onDeviceLost(WGPUDeviceLostReason reason, const char* message, void*) {
    if (reason == WGPUDeviceLostReason_Destroyed) return;
    fprintf(stderr, "[WebGPU Error] device lost (%d): %s\n", (int)reason, message ? message : "");
    std::exit(EXIT_FAILURE);
}

bool GpuContext::init(uint32_t w, uint32_t h, const char* title) {
    width = w;
    height = h;

    if (!glfwInit()) return false;
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    window = glfwCreateWindow(width, height, title, nullptr, nullptr);
    if (!window) return false;

    WGPUInstanceDescriptor instanceDesc = {};
    instance = wgpuCreateInstance(&instanceDesc);
    if (!instance) { fprintf(stderr, "Failed to create WebGPU instance\n"); return false; }

    surface = glfwGetWGPUSurface(instance, window);
    if (!surface) { fprintf(stderr, "Failed to get WebGPU surface\n"); return false; }

    if (!requestDevice("zounds device")) return false;

    surfaceFormat = wgpuSurfaceGetPreferredFormat(surface, adapter);
    configureSurface();
    return true;
}

bool GpuContext::initHeadless() {
    WGPUInstanceDescriptor instanceDesc = {};
    instance = wgpuCreateInstance(&instanceDesc);
    if (!instance) { fprintf(stderr, "Failed to create WebGPU instance\n"); return false; }
    return requestDevice("zounds headless device");
}

bool GpuContext::requestDevice(const char* label) {
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = surface;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    struct AdapterData { WGPUAdapter adapter = nullptr; bool done = false; };
    AdapterData adapterData;

    wgpuInstanceRequestAdapter(instance, &adapterOpts,
        [](WGPURequestAdapterStatus status, WGPUAdapter adapter, const char* message, void* ud) {
            auto* data = (AdapterData*)ud;
            if (status == WGPURequestAdapterStatus_Success) data->adapter = adapter;
            else fprintf(stderr, "Adapter request failed: %s\n", message ? message : "unknown");
            data->done = true;
        }, &adapterData);

    // wgpu-native answers requests before returning
    if (!adapterData.done) { fprintf(stderr, "Adapter request did not complete\n"); return false; }
    adapter = adapterData.adapter;
    if (!adapter) return false;

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = label;
    deviceDesc.deviceLostCallback = onDeviceLost;
    deviceDesc.deviceLostUserdata = this;

    struct DeviceData { WGPUDevice device = nullptr; bool done = false; };
    DeviceData deviceData;

    wgpuAdapterRequestDevice(adapter, &deviceDesc,
        [](WGPURequestDeviceStatus status, WGPUDevice device, const char* message, void* ud) {
            auto* data = (DeviceData*)ud;
            if (status == WGPURequestDeviceStatus_Success) data->device = device;
            else fprintf(stderr, "Device request failed: %s\n", message ? message : "unknown");
            data->done = true;
        }, &deviceData);

    if (!deviceData.done) { fprintf(stderr, "Device request did not complete\n"); return false; }
    device = deviceData.device;
    if (!device) return false;

    wgpuDeviceSetUncapturedErrorCallback(device, onDeviceError, this);
    queue = wgpuDeviceGetQueue(device);
    return true;
}

void GpuContext::configureSurface() {
    WGPUSurfaceConfiguration config = {};
    config.device = device;
    config.format = surfaceFormat;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.width = width;
    config.height = height;
    config.presentMode = WGPUPresentMode_Fifo;
    wgpuSurfaceConfigure(surface, &config);
}

bool GpuContext::updateSize() {
    int w = 0, h = 0;
    glfwGetFramebufferSize(window, &w, &h);
    // Minimized windows report 0x0; keep the last real size
    if (w <= 0 || h <= 0) return false;
    if ((uint32_t)w == width && (uint32_t)h == height) return false;
    width = (uint32_t)w;
    height = (uint32_t)h;
    configureSurface();
    return true;
}

WGPUTextureView GpuContext::getNextSurfaceTextureView() {
    WGPUSurfaceTexture surfTex;
    wgpuSurfaceGetCurrentTexture(surface, &surfTex);
    if (surfTex.status != WGPUSurfaceGetCurrentTextureStatus_Success) return nullptr;

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    return wgpuTextureCreateView(surfTex.texture, &viewDesc);
}

void GpuContext::present() {
    wgpuSurfacePresent(surface);
}

void GpuContext::waitIdle() {
    wgpuDevicePoll(device, true, nullptr);
}

void GpuContext::shutdown() {
    if (queue) wgpuQueueRelease(queue);
    if (device) wgpuDeviceRelease(device);
    if (adapter) wgpuAdapterRelease(adapter);
    if (surface) wgpuSurfaceRelease(surface);
    if (instance) wgpuInstanceRelease(instance);
    queue = nullptr;
    device = nullptr;
    adapter = nullptr;
    surface = nullptr;
    instance = nullptr;
    if (window) {
        glfwDestroyWindow(window);
        glfwTerminate();
        window = nullptr;
    }
}
