#pragma once
#include <webgpu/webgpu.h>
#include "bindable.h"
#include "binder.h"
#include "gpu_handle.h"
#include <string>

// Fullscreen quad that samples the life output image onto the surface.
// Slots: 0 params (ReadOnly), 1 image (ReadSampled), 2 sampler (ReadSampled).
class Renderer {
public:
    Renderer(WGPUDevice device, WGPUTextureFormat surfaceFormat, const std::string& shaderCode,
             const Bindable& params, const Bindable& image);

    // Rebuild the bind group after the params buffer or image were replaced
    void rebind(WGPUDevice device, const Bindable& params, const Bindable& image);

    void draw(WGPURenderPassEncoder pass) const;

private:
    WGPUTextureFormat m_surfaceFormat;
    WgpuHandle<WGPUShaderModule> m_shader;
    Sampler m_sampler;
    RenderBinding m_binding;
};
