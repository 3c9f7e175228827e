#pragma once
#include "gpu_context.h"
#include "dimensions.h"
#include "phase.h"
#include <webgpu/webgpu.h>
#include <cstdint>

// Read-only stats shown over the grid
struct OverlayStats {
    float fps = 0.0f;
    Dimensions grid;
    uint64_t stepCount = 0;
    Phase phase = Phase::Forward;
    uint32_t deviceErrors = 0;
};

struct UI {
    void init(GpuContext& ctx);
    void beginFrame();
    void drawOverlay(const OverlayStats& stats);
    void endFrame(WGPURenderPassEncoder renderPass);
    void shutdown();
};
