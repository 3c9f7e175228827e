#pragma once
#include <webgpu/webgpu.h>
#include "bindable.h"
#include "gpu_handle.h"
#include "phase.h"
#include <string>
#include <vector>

// Load a WGSL file; returns "" (and logs) when it can't be read
std::string loadShaderFile(const std::string& path);

// Compile WGSL source. Throws on empty source.
WgpuHandle<WGPUShaderModule> createShaderModule(WGPUDevice device, const std::string& code,
                                                const char* label = nullptr);

struct ComputeBinding {
    WgpuHandle<WGPUComputePipeline> pipeline;
    WgpuHandle<WGPUBindGroup> bindGroup;
};

// One pipeline, one bind group per phase
struct PhasedComputeBinding {
    WgpuHandle<WGPUComputePipeline> pipeline;
    PhaseTable<WgpuHandle<WGPUBindGroup>> bindGroups;
};

struct RenderBinding {
    WgpuHandle<WGPURenderPipeline> pipeline;
    WgpuHandle<WGPUBindGroup> bindGroup;
};

// Wires an ordered list of resources to bind group 0 of a pipeline. Slot
// index is list position, so the order must match the shader's @binding()s.
class Binder {
public:
    static ComputeBinding bindStatic(WGPUDevice device, WGPUShaderModule shader,
                                     const char* entryPoint, const BindArgs& args);

    // argsFor(Phase) -> BindArgs is evaluated exactly once per phase, here.
    template <typename F>
    static PhasedComputeBinding bindPhased(WGPUDevice device, WGPUShaderModule shader,
                                           const char* entryPoint, F&& argsFor) {
        return bindPhasedTable(device, shader, entryPoint,
                               PhaseTable<BindArgs>::generate(argsFor));
    }

    static PhasedComputeBinding bindPhasedTable(WGPUDevice device, WGPUShaderModule shader,
                                                const char* entryPoint,
                                                const PhaseTable<BindArgs>& args);

    // Fullscreen-style render pipeline: no vertex buffers, triangle list
    static RenderBinding bindRender(WGPUDevice device, WGPUShaderModule shader,
                                    const char* vsEntry, const char* fsEntry,
                                    WGPUTextureFormat targetFormat, const BindArgs& args);

    static std::vector<WGPUBindGroupLayoutEntry> layoutEntries(const BindArgs& args,
                                                               WGPUShaderStageFlags visibility);
    static std::vector<WGPUBindGroupEntry> groupEntries(const BindArgs& args);

    static WgpuHandle<WGPUBindGroupLayout> createLayout(WGPUDevice device, const std::string& label,
                                                        const BindArgs& args,
                                                        WGPUShaderStageFlags visibility);
    static WgpuHandle<WGPUBindGroup> createBindGroup(WGPUDevice device, const std::string& label,
                                                     WGPUBindGroupLayout layout,
                                                     const BindArgs& args);

private:
    static WgpuHandle<WGPUComputePipeline> createComputePipeline(
        WGPUDevice device, WGPUShaderModule shader, const char* entryPoint,
        WGPUBindGroupLayout layout, const std::string& label);
};
