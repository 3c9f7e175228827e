#pragma once
#include <webgpu/webgpu.h>
#include <webgpu/wgpu.h>
#include "bindable.h"
#include "dimensions.h"
#include "gpu_handle.h"
#include "grid_buffer.h"
#include <array>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

inline void formatCell(char* out, size_t n, float v) { snprintf(out, n, "%g", v); }
inline void formatCell(char* out, size_t n, const std::array<uint32_t, 4>& v) {
    snprintf(out, n, "[%08x %08x %08x %08x]", v[0], v[1], v[2], v[3]);
}

// Host-readable mirror of a GridBuffer for diagnostics. read() blocks on
// the device, so keep this off the per-frame path.
template <typename T>
class DebugBuffer {
public:
    DebugBuffer(WGPUDevice device, Dimensions dim)
        : m_dim(dim), m_size(GridBuffer<T>::byteSizeFor(dim)),
          m_allocatedSize(GridBuffer<T>::allocationSizeFor(dim))
    {
        WGPUBufferDescriptor desc = {};
        desc.label = "debug buffer";
        desc.size = m_allocatedSize;
        desc.usage = WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead;
        m_buffer.reset(wgpuDeviceCreateBuffer(device, &desc));
    }

    Dimensions dimensions() const { return m_dim; }

    // Record a copy into this buffer. Its contents are only meaningful once
    // the encoder has been finished and submitted.
    void enqueueCopyIn(WGPUCommandEncoder encoder, const GridBuffer<T>& src) const {
        if (src.dimensions() != m_dim) {
            throw std::invalid_argument("debug buffer size differs from " + src.label());
        }
        wgpuCommandEncoderCopyBufferToBuffer(encoder, src.handle(), 0, m_buffer, 0, m_allocatedSize);
    }

    // Map and copy out. Waits for every submitted command first.
    std::vector<T> read(WGPUDevice device) const {
        std::vector<T> result(m_dim.area());
        if (result.empty()) return result;

        struct MapData { bool done = false; WGPUBufferMapAsyncStatus status; };
        MapData mapData;
        wgpuBufferMapAsync(m_buffer, WGPUMapMode_Read, 0, m_allocatedSize,
            [](WGPUBufferMapAsyncStatus status, void* ud) {
                auto* d = (MapData*)ud;
                d->status = status;
                d->done = true;
            }, &mapData);
        while (!mapData.done)
            wgpuDevicePoll(device, true, nullptr);

        if (mapData.status != WGPUBufferMapAsyncStatus_Success) {
            throw std::runtime_error("failed to map debug buffer (status " +
                                     std::to_string((int)mapData.status) + ")");
        }
        const void* mapped = wgpuBufferGetConstMappedRange(m_buffer, 0, m_allocatedSize);
        memcpy(result.data(), mapped, m_size);
        wgpuBufferUnmap(m_buffer);
        return result;
    }

    // Copy src in and submit straight away
    void copyIn(WGPUDevice device, WGPUQueue queue, const GridBuffer<T>& src) const {
        WGPUCommandEncoderDescriptor encDesc = {};
        encDesc.label = "debug copy-in";
        WgpuHandle<WGPUCommandEncoder> encoder(wgpuDeviceCreateCommandEncoder(device, &encDesc));
        enqueueCopyIn(encoder, src);

        WGPUCommandBufferDescriptor cbDesc = {};
        WgpuHandle<WGPUCommandBuffer> cmdBuf(wgpuCommandEncoderFinish(encoder, &cbDesc));
        WGPUCommandBuffer raw = cmdBuf;
        wgpuQueueSubmit(queue, 1, &raw);
    }

    std::vector<T> copyInAndRead(WGPUDevice device, WGPUQueue queue, const GridBuffer<T>& src) const {
        copyIn(device, queue, src);
        return read(device);
    }

    void display(WGPUDevice device) const {
        std::vector<T> cells = read(device);
        char text[64];
        for (uint32_t y = 0; y < m_dim.height; y++) {
            for (uint32_t x = 0; x < m_dim.width; x++) {
                formatCell(text, sizeof(text), cells[(size_t)y * m_dim.width + x]);
                printf("%s%s", x ? " " : "", text);
            }
            printf("\n");
        }
    }

private:
    WgpuHandle<WGPUBuffer> m_buffer;
    Dimensions m_dim;
    uint64_t m_size;
    uint64_t m_allocatedSize;
};
