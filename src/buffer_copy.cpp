#include "buffer_copy.h"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

CopyParams computeCopyParams(Dimensions from, Dimensions to) {
    const uint32_t ow = from.width, oh = from.height;
    const uint32_t nw = to.width, nh = to.height;

    CopyParams p = {};
    p.oldOffsetX = nw < ow ? (ow - nw) / 2 : 0;
    p.newOffsetX = nw > ow ? (nw - ow) / 2 : 0;
    p.oldOffsetY = nh < oh ? (oh - nh) / 2 : 0;
    p.newOffsetY = nh > oh ? (nh - oh) / 2 : 0;
    p.oldWidth = ow;
    p.newWidth = nw;
    p.overlapWidth = std::min(ow, nw);
    p.overlapHeight = std::min(oh, nh);
    return p;
}

static void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string instantiateCopyShader(const std::string& shaderTemplate, const CopyShaderInfo& info) {
    if (shaderTemplate.find("{manip}") == std::string::npos) {
        throw std::invalid_argument("copy shader template has no {manip} placeholder");
    }
    std::string code = shaderTemplate;
    replaceAll(code, "{src_type}", info.srcType);
    replaceAll(code, "{dst_type}", info.dstType);
    replaceAll(code, "{manip}", info.manip ? info.manip : "new_value = old_value");
    return code;
}

BufferCopierBase::BufferCopierBase(WGPUDevice device, const std::string& shaderTemplate,
                                   const CopyShaderInfo& info)
    : m_shader(createShaderModule(device, instantiateCopyShader(shaderTemplate, info), "buffer copy"))
{
}

void BufferCopierBase::dispatch(WGPUDevice device, WGPUQueue queue,
                                const Bindable& src, const Bindable& dst,
                                const CopyParams& params) const {
    printf("[buffer_copy] old offset (%u,%u) new offset (%u,%u) widths %u->%u overlap %ux%u\n",
           params.oldOffsetX, params.oldOffsetY, params.newOffsetX, params.newOffsetY,
           params.oldWidth, params.newWidth, params.overlapWidth, params.overlapHeight);

    // Empty overlap: zero tiles, nothing to submit
    if (params.overlapWidth == 0 || params.overlapHeight == 0) return;

    Buffer paramBuf(device, "copy data parameters", BufferKind::Uniform, &params, sizeof(params));

    BindArgs args = {
        { BindAccess::ReadOnly,  paramBuf },
        { BindAccess::ReadOnly,  src },
        { BindAccess::WriteOnly, dst },
    };
    ComputeBinding binding = Binder::bindStatic(device, m_shader, "copy", args);

    WGPUCommandEncoderDescriptor encDesc = {};
    encDesc.label = "buffer copy";
    WgpuHandle<WGPUCommandEncoder> encoder(wgpuDeviceCreateCommandEncoder(device, &encDesc));

    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, nullptr);
    wgpuComputePassEncoderSetPipeline(pass, binding.pipeline);
    wgpuComputePassEncoderSetBindGroup(pass, 0, binding.bindGroup, 0, nullptr);
    wgpuComputePassEncoderDispatchWorkgroups(pass, tileCount(params.overlapWidth),
                                             tileCount(params.overlapHeight), 1);
    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cbDesc = {};
    WgpuHandle<WGPUCommandBuffer> cmdBuf(wgpuCommandEncoderFinish(encoder, &cbDesc));
    WGPUCommandBuffer raw = cmdBuf;
    wgpuQueueSubmit(queue, 1, &raw);
}
