#pragma once
#include <webgpu/webgpu.h>
#include "bindable.h"
#include "dimensions.h"
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

// A storage Buffer viewed as width x height elements of T. Dimensions are
// fixed; resizing means building a new GridBuffer.
template <typename T>
class GridBuffer : public Bindable {
    static_assert(std::is_trivially_copyable<T>::value, "grid elements are copied bytewise");
    static_assert(sizeof(T) % 4 == 0, "buffer copies work in 4-byte units");

public:
    GridBuffer(WGPUDevice device, const std::string& label, Dimensions dim)
        : m_buffer(device, label, BufferKind::Storage, byteSizeFor(dim), sizeof(T)), m_dim(dim) {}

    GridBuffer(WGPUDevice device, const std::string& label, Dimensions dim,
               const std::vector<T>& contents)
        : m_buffer(device, label, BufferKind::Storage, checkedData(contents, dim),
                   byteSizeFor(dim), sizeof(T)),
          m_dim(dim) {}

    static uint64_t byteSizeFor(Dimensions dim) { return (uint64_t)dim.area() * sizeof(T); }
    static uint64_t allocationSizeFor(Dimensions dim) {
        return Buffer::allocationSize(byteSizeFor(dim), sizeof(T));
    }

    // Write host data into the buffer through the queue
    void importFrom(WGPUQueue queue, const std::vector<T>& data) const {
        const T* src = checkedData(data, m_dim);
        if (data.empty()) return;
        wgpuQueueWriteBuffer(queue, m_buffer.handle(), 0, src, byteSize());
    }

    // Record a same-size buffer-to-buffer copy
    void copyFrom(WGPUCommandEncoder encoder, const GridBuffer<T>& src) const {
        if (src.dimensions() != m_dim) {
            throw std::invalid_argument("copyFrom: " + src.label() + " is " +
                describe(src.dimensions()) + ", " + label() + " is " + describe(m_dim));
        }
        wgpuCommandEncoderCopyBufferToBuffer(encoder, src.handle(), 0, handle(), 0,
                                             m_buffer.allocatedSize());
    }

    AccessSet supportedAccess() const override { return m_buffer.supportedAccess(); }
    void bindingType(BindAccess access, WGPUBindGroupLayoutEntry& entry) const override {
        m_buffer.bindingType(access, entry);
    }
    void bindingResource(WGPUBindGroupEntry& entry) const override {
        m_buffer.bindingResource(entry);
    }

    Dimensions dimensions() const { return m_dim; }
    uint64_t byteSize() const { return m_buffer.size(); }
    const Buffer& buffer() const { return m_buffer; }
    WGPUBuffer handle() const { return m_buffer.handle(); }
    const std::string& label() const { return m_buffer.label(); }

private:
    static std::string describe(Dimensions d) {
        return std::to_string(d.width) + "x" + std::to_string(d.height);
    }

    static const T* checkedData(const std::vector<T>& data, Dimensions dim) {
        if (data.size() != dim.area()) {
            throw std::invalid_argument("grid data has " + std::to_string(data.size()) +
                " cells, expected " + std::to_string(dim.area()) + " for " + describe(dim));
        }
        return data.data();
    }

    Buffer m_buffer;
    Dimensions m_dim;
};
