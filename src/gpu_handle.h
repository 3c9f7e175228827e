#pragma once
#include <webgpu/webgpu.h>
#include <utility>

// Release hooks for the WebGPU handle types this project owns
inline void wgpuRelease(WGPUBuffer h) { wgpuBufferRelease(h); }
inline void wgpuRelease(WGPUTexture h) { wgpuTextureRelease(h); }
inline void wgpuRelease(WGPUTextureView h) { wgpuTextureViewRelease(h); }
inline void wgpuRelease(WGPUSampler h) { wgpuSamplerRelease(h); }
inline void wgpuRelease(WGPUShaderModule h) { wgpuShaderModuleRelease(h); }
inline void wgpuRelease(WGPUBindGroup h) { wgpuBindGroupRelease(h); }
inline void wgpuRelease(WGPUBindGroupLayout h) { wgpuBindGroupLayoutRelease(h); }
inline void wgpuRelease(WGPUPipelineLayout h) { wgpuPipelineLayoutRelease(h); }
inline void wgpuRelease(WGPUComputePipeline h) { wgpuComputePipelineRelease(h); }
inline void wgpuRelease(WGPURenderPipeline h) { wgpuRenderPipelineRelease(h); }
inline void wgpuRelease(WGPUCommandEncoder h) { wgpuCommandEncoderRelease(h); }
inline void wgpuRelease(WGPUCommandBuffer h) { wgpuCommandBufferRelease(h); }

// Move-only owner of one WebGPU handle. Dropping it releases our reference;
// wgpu keeps the object alive for as long as submitted work still uses it.
template <typename T>
class WgpuHandle {
public:
    WgpuHandle() = default;
    explicit WgpuHandle(T handle) : m_handle(handle) {}
    ~WgpuHandle() { reset(); }

    WgpuHandle(const WgpuHandle&) = delete;
    WgpuHandle& operator=(const WgpuHandle&) = delete;

    WgpuHandle(WgpuHandle&& other) noexcept : m_handle(std::exchange(other.m_handle, nullptr)) {}
    WgpuHandle& operator=(WgpuHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_handle = std::exchange(other.m_handle, nullptr);
        }
        return *this;
    }

    void reset(T handle = nullptr) {
        if (m_handle) wgpuRelease(m_handle);
        m_handle = handle;
    }

    T get() const { return m_handle; }
    operator T() const { return m_handle; }
    explicit operator bool() const { return m_handle != nullptr; }

private:
    T m_handle = nullptr;
};
