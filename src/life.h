#pragma once
#include <webgpu/webgpu.h>
#include "bindable.h"
#include "binder.h"
#include "buffer_copy.h"
#include "debug_buffer.h"
#include "dimensions.h"
#include "grid_buffer.h"
#include "phase.h"
#include <array>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

// Must match @workgroup_size in shaders/life.wgsl
constexpr uint32_t kLifeTileSize = 8;

// Per-cell state for the kernel's xorshift generator
using RandomState = std::array<uint32_t, 4>;

// Kernel parameters, shared by the life kernel and the renderer
struct LifeParams {
    uint32_t width;
    uint32_t height;
    float threshold;
    uint32_t _pad;
};
static_assert(sizeof(LifeParams) == 16, "LifeParams must be 16 bytes");

Buffer makeLifeParams(WGPUDevice device, Dimensions dim, float threshold);

// Uniform random cell values in [0, 1]
std::vector<float> randomCells(Dimensions dim, std::mt19937& rng);
std::vector<RandomState> randomStates(Dimensions dim, std::mt19937& rng);

struct LifeShaders {
    std::string kernel;       // compute entry point "life"
    std::string copyTemplate; // buffer_copy.wgsl with placeholders
};

// Double-buffered cell grid plus the kernel that steps it.
//
// Kernel slots: 0 params (ReadOnly), 1 source cells (ReadOnly),
// 2 destination cells (WriteOnly), 3 random state (WriteOnly),
// 4 output image (WriteOnly).
class Life {
public:
    Life(WGPUDevice device, WGPUQueue queue, Dimensions dim, const LifeShaders& shaders,
         const Bindable& params, const Bindable& image, std::mt19937& rng);
    ~Life();

    // Record one step into encoder. Roles flip with the step counter; no data moves.
    void step(WGPUCommandEncoder encoder);

    // Replace every buffer and binding with a new generation at dim, carrying
    // the centred overlap across. Submit any encoder holding steps first.
    void resize(Dimensions dim, const Bindable& params, const Bindable& image, std::mt19937& rng);

    // Write initial state into the source buffer. Only before the first step
    // or right after a resize.
    void import(const std::vector<float>& cells);

    Phase phase() const { return phaseOf(m_stepCount); }
    uint64_t stepCount() const { return m_stepCount; }
    Dimensions dimensions() const;

    const GridBuffer<float>& sourceBuffer() const;
    const GridBuffer<float>& destinationBuffer() const;
    const GridBuffer<RandomState>& randomBuffer() const;

    // Blocking read-back of the source buffer; diagnostics only
    std::vector<float> readSource() const;
    void dumpDebug() const;

private:
    struct Generation;

    std::unique_ptr<Generation> buildGeneration(Dimensions dim, std::mt19937& rng) const;
    void bindKernel(Generation& gen, const Bindable& params, const Bindable& image) const;

    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WgpuHandle<WGPUShaderModule> m_shader;
    BufferCopier<float, float> m_cellCopier;
    BufferCopier<RandomState, RandomState> m_randomCopier;
    std::unique_ptr<Generation> m_gen;
    uint64_t m_stepCount = 0;
    bool m_importAllowed = true;
};
