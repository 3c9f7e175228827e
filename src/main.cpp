#include "gpu_context.h"
#include "binder.h"
#include "life.h"
#include "renderer.h"
#include "settings.h"
#include "ui.h"
#include <GLFW/glfw3.h>
#include <cstdio>
#include <exception>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

static std::string loadShader(const Settings& settings, const char* name) {
    std::string path = settings.shaderDir + "/" + name;
    std::string code = loadShaderFile(path);
    if (code.empty()) throw std::runtime_error("could not load shader " + path);
    return code;
}

static void submit(GpuContext& gpu, WGPUCommandEncoder encoder) {
    WGPUCommandBufferDescriptor cbDesc = {};
    WgpuHandle<WGPUCommandBuffer> cmdBuf(wgpuCommandEncoderFinish(encoder, &cbDesc));
    WGPUCommandBuffer raw = cmdBuf;
    wgpuQueueSubmit(gpu.queue, 1, &raw);
}

static WgpuHandle<WGPUCommandEncoder> beginEncoder(GpuContext& gpu, const char* label) {
    WGPUCommandEncoderDescriptor encDesc = {};
    encDesc.label = label;
    return WgpuHandle<WGPUCommandEncoder>(wgpuDeviceCreateCommandEncoder(gpu.device, &encDesc));
}

static void loop(GpuContext& gpu, UI& ui, const Settings& settings) {
    std::mt19937 rng(settings.seed);

    LifeShaders shaders;
    shaders.kernel = loadShader(settings, "life.wgsl");
    shaders.copyTemplate = loadShader(settings, "buffer_copy.wgsl");
    std::string renderCode = loadShader(settings, "renderer.wgsl");

    Dimensions dim = { gpu.width, gpu.height };
    auto params = std::make_unique<Buffer>(makeLifeParams(gpu.device, dim, settings.threshold));
    auto image = std::make_unique<Texture>(gpu.device, "life output", dim);

    Life life(gpu.device, gpu.queue, dim, shaders, *params, *image, rng);
    Renderer renderer(gpu.device, gpu.surfaceFormat, renderCode, *params, *image);

    life.import(randomCells(dim, rng));

    {
        WgpuHandle<WGPUCommandEncoder> encoder = beginEncoder(gpu, "warm-up");
        for (uint32_t i = 0; i < settings.warmupSteps; i++)
            life.step(encoder);
        submit(gpu, encoder);
    }
    printf("[zounds] %ux%u grid, %u warm-up steps\n", dim.width, dim.height, settings.warmupSteps);

    double lastTime = glfwGetTime();
    int frameCount = 0;
    float fps = 0.0f;

    while (!glfwWindowShouldClose(gpu.window)) {
        glfwPollEvents();

        // FPS counter
        frameCount++;
        double now = glfwGetTime();
        if (now - lastTime >= 0.5) {
            fps = (float)(frameCount / (now - lastTime));
            frameCount = 0;
            lastTime = now;
        }

        // Every earlier encoder has been submitted, so the old generation can go
        if (gpu.updateSize()) {
            dim = { gpu.width, gpu.height };
            auto nextParams = std::make_unique<Buffer>(makeLifeParams(gpu.device, dim, settings.threshold));
            auto nextImage = std::make_unique<Texture>(gpu.device, "life output", dim);
            life.resize(dim, *nextParams, *nextImage, rng);
            renderer.rebind(gpu.device, *nextParams, *nextImage);
            params = std::move(nextParams);
            image = std::move(nextImage);
        }

        WGPUTextureView surfaceView = gpu.getNextSurfaceTextureView();
        if (!surfaceView) continue;

        WgpuHandle<WGPUCommandEncoder> encoder = beginEncoder(gpu, "frame");
        for (uint32_t i = 0; i < settings.stepsPerFrame; i++)
            life.step(encoder);

        WGPURenderPassColorAttachment colorAtt = {};
        colorAtt.view = surfaceView;
        colorAtt.loadOp = WGPULoadOp_Clear;
        colorAtt.storeOp = WGPUStoreOp_Store;
        colorAtt.clearValue = { 0.0, 0.0, 0.0, 1.0 };

        WGPURenderPassDescriptor rpDesc = {};
        rpDesc.colorAttachmentCount = 1;
        rpDesc.colorAttachments = &colorAtt;

        WGPURenderPassEncoder rpass = wgpuCommandEncoderBeginRenderPass(encoder, &rpDesc);
        renderer.draw(rpass);

        if (settings.overlay) {
            ui.beginFrame();
            OverlayStats stats;
            stats.fps = fps;
            stats.grid = life.dimensions();
            stats.stepCount = life.stepCount();
            stats.phase = life.phase();
            stats.deviceErrors = gpu.errorCount();
            ui.drawOverlay(stats);
            ui.endFrame(rpass);
        }

        wgpuRenderPassEncoderEnd(rpass);
        wgpuRenderPassEncoderRelease(rpass);

        submit(gpu, encoder);
        gpu.present();
        wgpuTextureViewRelease(surfaceView);
    }

    gpu.waitIdle();
}

static int run(const Settings& settings) {
    GpuContext gpu;
    if (!gpu.init(settings.width, settings.height, "zounds")) {
        fprintf(stderr, "Failed to initialize GPU context\n");
        return 1;
    }

    // Update to actual framebuffer size (handles Retina displays)
    gpu.updateSize();

    UI ui;
    if (settings.overlay) ui.init(gpu);

    // GPU objects owned by loop() are gone before the device is released
    try {
        loop(gpu, ui, settings);
    } catch (...) {
        if (settings.overlay) ui.shutdown();
        gpu.shutdown();
        throw;
    }

    if (settings.overlay) ui.shutdown();
    gpu.shutdown();
    return 0;
}

int main(int argc, char** argv) {
    const char* settingsPath = argc > 1 ? argv[1] : "settings.txt";
    try {
        Settings settings = loadSettings(settingsPath);
        return run(settings);
    } catch (const std::exception& e) {
        fprintf(stderr, "[zounds] %s\n", e.what());
        return 1;
    }
}
