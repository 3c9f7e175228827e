#pragma once
#include <webgpu/webgpu.h>
#include "bindable.h"
#include "binder.h"
#include "dimensions.h"
#include "gpu_handle.h"
#include "grid_buffer.h"
#include <array>
#include <cstdint>
#include <string>

// Must match @workgroup_size in shaders/buffer_copy.wgsl
constexpr uint32_t kCopyTileSize = 8;

// Uniform record for the copy kernel; field order is the shader's layout
struct CopyParams {
    uint32_t oldOffsetX;
    uint32_t oldOffsetY;
    uint32_t newOffsetX;
    uint32_t newOffsetY;
    uint32_t oldWidth;
    uint32_t newWidth;
    uint32_t overlapWidth;
    uint32_t overlapHeight;
};
static_assert(sizeof(CopyParams) == 32, "CopyParams must be 8 packed u32s");

// Centre the overlap of an old and a new grid
CopyParams computeCopyParams(Dimensions from, Dimensions to);

inline uint32_t tileCount(uint32_t extent) {
    return (extent + kCopyTileSize - 1) / kCopyTileSize;
}

// WGSL substitutions for one (source, destination) element type pair
struct CopyShaderInfo {
    const char* srcType;
    const char* dstType;
    const char* manip; // nullptr means a plain assignment
};

// Specialise for every pair the copy kernel may move. Unlisted pairs fail to compile.
template <typename T, typename U> struct BufferCopyTraits;

template <> struct BufferCopyTraits<float, float> {
    static CopyShaderInfo shaderInfo() { return { "f32", "f32", nullptr }; }
};

template <> struct BufferCopyTraits<std::array<uint32_t, 4>, std::array<uint32_t, 4>> {
    static CopyShaderInfo shaderInfo() { return { "vec4<u32>", "vec4<u32>", nullptr }; }
};

// Fill the {src_type}/{dst_type}/{manip} placeholders of the copy kernel template
std::string instantiateCopyShader(const std::string& shaderTemplate, const CopyShaderInfo& info);

class BufferCopierBase {
protected:
    BufferCopierBase(WGPUDevice device, const std::string& shaderTemplate, const CopyShaderInfo& info);

    // Bind params/src/dst, dispatch over the overlap, submit
    void dispatch(WGPUDevice device, WGPUQueue queue, const Bindable& src, const Bindable& dst,
                  const CopyParams& params) const;

private:
    WgpuHandle<WGPUShaderModule> m_shader;
};

// Copies the centred overlap of one grid into a differently-sized grid.
// Destination cells outside the overlap keep whatever they held.
template <typename T, typename U>
class BufferCopier : private BufferCopierBase {
public:
    BufferCopier(WGPUDevice device, const std::string& shaderTemplate)
        : BufferCopierBase(device, shaderTemplate, BufferCopyTraits<T, U>::shaderInfo()) {}

    void copy(WGPUDevice device, WGPUQueue queue,
              const GridBuffer<T>& src, const GridBuffer<U>& dst) const {
        dispatch(device, queue, src, dst, computeCopyParams(src.dimensions(), dst.dimensions()));
    }
};
