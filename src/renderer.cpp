#include "renderer.h"

Renderer::Renderer(WGPUDevice device, WGPUTextureFormat surfaceFormat, const std::string& shaderCode,
                   const Bindable& params, const Bindable& image)
    : m_surfaceFormat(surfaceFormat),
      m_shader(createShaderModule(device, shaderCode, "renderer")),
      m_sampler(device, WGPUAddressMode_Repeat, WGPUFilterMode_Linear)
{
    rebind(device, params, image);
}

void Renderer::rebind(WGPUDevice device, const Bindable& params, const Bindable& image) {
    BindArgs args = {
        { BindAccess::ReadOnly,    params },
        { BindAccess::ReadSampled, image },
        { BindAccess::ReadSampled, m_sampler },
    };
    m_binding = Binder::bindRender(device, m_shader, "vs_main", "fs_main", m_surfaceFormat, args);
}

void Renderer::draw(WGPURenderPassEncoder pass) const {
    wgpuRenderPassEncoderSetPipeline(pass, m_binding.pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_binding.bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 6, 1, 0, 0); // fullscreen quad (2 triangles)
}
