#pragma once
#include <webgpu/webgpu.h>
#include <GLFW/glfw3.h>
#include <cstdint>

struct GpuContext {
    GLFWwindow* window = nullptr;
    WGPUInstance instance = nullptr;
    WGPUSurface surface = nullptr;
    WGPUAdapter adapter = nullptr;
    WGPUDevice device = nullptr;
    WGPUQueue queue = nullptr;
    WGPUTextureFormat surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    uint32_t width = 1024;
    uint32_t height = 768;

    bool init(uint32_t w, uint32_t h, const char* title);
    bool initHeadless(); // no window or surface
    void configureSurface();
    bool updateSize(); // true when the framebuffer size changed
    WGPUTextureView getNextSurfaceTextureView();
    void present();
    void waitIdle();
    void shutdown();

    // Non-fatal device errors reported since init
    uint32_t errorCount() const { return m_errorCount; }

private:
    bool requestDevice(const char* label);
    static void onDeviceError(WGPUErrorType type, const char* message, void* userdata);
    static void onDeviceLost(WGPUDeviceLostReason reason, const char* message, void* userdata);

    uint32_t m_errorCount = 0;
};
