#include "binder.h"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

std::string loadShaderFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        fprintf(stderr, "Failed to load shader: %s\n", path.c_str());
        return "";
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

WgpuHandle<WGPUShaderModule> createShaderModule(WGPUDevice device, const std::string& code,
                                                const char* label) {
    if (code.empty()) {
        throw std::runtime_error(std::string("empty shader source for ") + (label ? label : "module"));
    }

    WGPUShaderModuleWGSLDescriptor wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderModuleWGSLDescriptor;
    wgslDesc.code = code.c_str();

    WGPUShaderModuleDescriptor smDesc = {};
    smDesc.nextInChain = &wgslDesc.chain;
    smDesc.label = label;
    return WgpuHandle<WGPUShaderModule>(wgpuDeviceCreateShaderModule(device, &smDesc));
}

std::vector<WGPUBindGroupLayoutEntry> Binder::layoutEntries(const BindArgs& args,
                                                            WGPUShaderStageFlags visibility) {
    std::vector<WGPUBindGroupLayoutEntry> entries(args.size());
    for (size_t i = 0; i < args.size(); i++) {
        WGPUBindGroupLayoutEntry& e = entries[i];
        memset(&e, 0, sizeof(e));
        e.binding = (uint32_t)i;
        e.visibility = visibility;
        args[i].resource().bindingType(args[i].access(), e);
    }
    return entries;
}

std::vector<WGPUBindGroupEntry> Binder::groupEntries(const BindArgs& args) {
    std::vector<WGPUBindGroupEntry> entries(args.size());
    for (size_t i = 0; i < args.size(); i++) {
        WGPUBindGroupEntry& e = entries[i];
        memset(&e, 0, sizeof(e));
        e.binding = (uint32_t)i;
        args[i].resource().bindingResource(e);
    }
    return entries;
}

WgpuHandle<WGPUBindGroupLayout> Binder::createLayout(WGPUDevice device, const std::string& label,
                                                     const BindArgs& args,
                                                     WGPUShaderStageFlags visibility) {
    std::vector<WGPUBindGroupLayoutEntry> entries = layoutEntries(args, visibility);

    WGPUBindGroupLayoutDescriptor desc = {};
    desc.label = label.c_str();
    desc.entryCount = entries.size();
    desc.entries = entries.data();
    return WgpuHandle<WGPUBindGroupLayout>(wgpuDeviceCreateBindGroupLayout(device, &desc));
}

WgpuHandle<WGPUBindGroup> Binder::createBindGroup(WGPUDevice device, const std::string& label,
                                                  WGPUBindGroupLayout layout,
                                                  const BindArgs& args) {
    std::vector<WGPUBindGroupEntry> entries = groupEntries(args);

    WGPUBindGroupDescriptor desc = {};
    desc.label = label.c_str();
    desc.layout = layout;
    desc.entryCount = entries.size();
    desc.entries = entries.data();
    return WgpuHandle<WGPUBindGroup>(wgpuDeviceCreateBindGroup(device, &desc));
}

WgpuHandle<WGPUComputePipeline> Binder::createComputePipeline(
    WGPUDevice device, WGPUShaderModule shader, const char* entryPoint,
    WGPUBindGroupLayout layout, const std::string& label)
{
    std::string plLabel = label + " pipeline layout";
    WGPUPipelineLayoutDescriptor plDesc = {};
    plDesc.label = plLabel.c_str();
    plDesc.bindGroupLayoutCount = 1;
    plDesc.bindGroupLayouts = &layout;
    WgpuHandle<WGPUPipelineLayout> pipelineLayout(wgpuDeviceCreatePipelineLayout(device, &plDesc));

    std::string cpLabel = label + " compute pipeline";
    WGPUComputePipelineDescriptor cpDesc = {};
    cpDesc.label = cpLabel.c_str();
    cpDesc.layout = pipelineLayout;
    cpDesc.compute.module = shader;
    cpDesc.compute.entryPoint = entryPoint;
    return WgpuHandle<WGPUComputePipeline>(wgpuDeviceCreateComputePipeline(device, &cpDesc));
}

ComputeBinding Binder::bindStatic(WGPUDevice device, WGPUShaderModule shader,
                                  const char* entryPoint, const BindArgs& args) {
    std::string label = entryPoint;
    WgpuHandle<WGPUBindGroupLayout> layout =
        createLayout(device, label + " bind group layout", args, WGPUShaderStage_Compute);

    ComputeBinding out;
    out.bindGroup = createBindGroup(device, label + " bind group", layout, args);
    out.pipeline = createComputePipeline(device, shader, entryPoint, layout, label);
    return out;
}

static bool sameBindingType(const WGPUBindGroupLayoutEntry& a, const WGPUBindGroupLayoutEntry& b) {
    return a.buffer.type == b.buffer.type &&
           a.buffer.minBindingSize == b.buffer.minBindingSize &&
           a.sampler.type == b.sampler.type &&
           a.texture.sampleType == b.texture.sampleType &&
           a.texture.viewDimension == b.texture.viewDimension &&
           a.storageTexture.access == b.storageTexture.access &&
           a.storageTexture.format == b.storageTexture.format;
}

PhasedComputeBinding Binder::bindPhasedTable(WGPUDevice device, WGPUShaderModule shader,
                                             const char* entryPoint,
                                             const PhaseTable<BindArgs>& args) {
    const BindArgs& fwd = args[Phase::Forward];
    const BindArgs& bwd = args[Phase::Backward];
    if (fwd.size() != bwd.size()) {
        throw std::invalid_argument(std::string(entryPoint) + ": phases bind " +
            std::to_string(fwd.size()) + " vs " + std::to_string(bwd.size()) + " resources");
    }

    // Both phases share one layout, so their slots must agree on type
    std::vector<WGPUBindGroupLayoutEntry> fwdEntries = layoutEntries(fwd, WGPUShaderStage_Compute);
    std::vector<WGPUBindGroupLayoutEntry> bwdEntries = layoutEntries(bwd, WGPUShaderStage_Compute);
    for (size_t i = 0; i < fwdEntries.size(); i++) {
        if (!sameBindingType(fwdEntries[i], bwdEntries[i])) {
            throw std::invalid_argument(std::string(entryPoint) + ": slot " + std::to_string(i) +
                                        " differs between phases");
        }
    }

    std::string label = entryPoint;
    WgpuHandle<WGPUBindGroupLayout> layout =
        createLayout(device, label + " bind group layout", fwd, WGPUShaderStage_Compute);

    PhaseTable<WgpuHandle<WGPUBindGroup>> groups = PhaseTable<WgpuHandle<WGPUBindGroup>>::generate(
        [&](Phase p) {
            return createBindGroup(device, label + " bind group " + phaseName(p), layout, args[p]);
        });

    WgpuHandle<WGPUComputePipeline> pipeline =
        createComputePipeline(device, shader, entryPoint, layout, label);
    return PhasedComputeBinding{ std::move(pipeline), std::move(groups) };
}

RenderBinding Binder::bindRender(WGPUDevice device, WGPUShaderModule shader,
                                 const char* vsEntry, const char* fsEntry,
                                 WGPUTextureFormat targetFormat, const BindArgs& args) {
    std::string label = fsEntry;
    WgpuHandle<WGPUBindGroupLayout> layout =
        createLayout(device, label + " bind group layout", args, WGPUShaderStage_Fragment);

    RenderBinding out;
    out.bindGroup = createBindGroup(device, label + " bind group", layout, args);

    WGPUBindGroupLayout rawLayout = layout;
    WGPUPipelineLayoutDescriptor plDesc = {};
    plDesc.bindGroupLayoutCount = 1;
    plDesc.bindGroupLayouts = &rawLayout;
    WgpuHandle<WGPUPipelineLayout> pipelineLayout(wgpuDeviceCreatePipelineLayout(device, &plDesc));

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = targetFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragState = {};
    fragState.module = shader;
    fragState.entryPoint = fsEntry;
    fragState.targetCount = 1;
    fragState.targets = &colorTarget;

    WGPURenderPipelineDescriptor rpDesc = {};
    rpDesc.layout = pipelineLayout;
    rpDesc.vertex.module = shader;
    rpDesc.vertex.entryPoint = vsEntry;
    rpDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    rpDesc.multisample.count = 1;
    rpDesc.multisample.mask = 0xFFFFFFFF;
    rpDesc.fragment = &fragState;
    out.pipeline.reset(wgpuDeviceCreateRenderPipeline(device, &rpDesc));
    return out;
}
