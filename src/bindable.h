#pragma once
#include <webgpu/webgpu.h>
#include "dimensions.h"
#include "gpu_handle.h"
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

// How a pipeline stage intends to use a bound resource
enum class BindAccess : uint32_t {
    ReadOnly    = 0,
    ReadSampled = 1, // filtered sampling, image-like resources only
    WriteOnly   = 2,
};

const char* bindAccessName(BindAccess access);

// Subset of access modes a resource kind accepts
class AccessSet {
public:
    constexpr AccessSet() = default;
    constexpr AccessSet(std::initializer_list<BindAccess> modes) {
        for (BindAccess m : modes) m_bits |= bit(m);
    }

    static constexpr AccessSet all() {
        return { BindAccess::ReadOnly, BindAccess::ReadSampled, BindAccess::WriteOnly };
    }

    constexpr bool contains(BindAccess m) const { return (m_bits & bit(m)) != 0; }
    constexpr bool operator==(const AccessSet& o) const { return m_bits == o.m_bits; }

private:
    static constexpr uint32_t bit(BindAccess m) { return 1u << (uint32_t)m; }
    uint32_t m_bits = 0;
};

// A resource that can sit in a bind group slot
class Bindable {
public:
    virtual ~Bindable() = default;

    virtual AccessSet supportedAccess() const = 0;
    bool supports(BindAccess access) const { return supportedAccess().contains(access); }

    // Fill the binding-type half of a layout entry for the given access
    virtual void bindingType(BindAccess access, WGPUBindGroupLayoutEntry& entry) const = 0;
    // Fill the resource half of a bind group entry
    virtual void bindingResource(WGPUBindGroupEntry& entry) const = 0;
};

// One (access, resource) slot. Rejects access modes the resource can't honor.
class BindArg {
public:
    BindArg(BindAccess access, const Bindable& resource);

    BindAccess access() const { return m_access; }
    const Bindable& resource() const { return *m_resource; }

private:
    BindAccess m_access;
    const Bindable* m_resource;
};

using BindArgs = std::vector<BindArg>;

// ---------------------------------------------------------------------------

enum class BufferKind : uint32_t {
    Uniform, // small constant data
    Storage, // general storage
};

// Fixed-size GPU memory region. Size and kind never change after creation.
class Buffer : public Bindable {
public:
    // minSize is the smallest allocation, for bindings whose element is wider than a word
    Buffer(WGPUDevice device, const std::string& label, BufferKind kind, uint64_t size,
           uint64_t minSize = 4);
    Buffer(WGPUDevice device, const std::string& label, BufferKind kind,
           const void* contents, uint64_t size, uint64_t minSize = 4);

    AccessSet supportedAccess() const override;
    void bindingType(BindAccess access, WGPUBindGroupLayoutEntry& entry) const override;
    void bindingResource(WGPUBindGroupEntry& entry) const override;

    WGPUBuffer handle() const { return m_buffer; }
    BufferKind kind() const { return m_kind; }
    uint64_t size() const { return m_size; }                 // requested byte size
    uint64_t allocatedSize() const { return m_allocatedSize; } // rounded for the API
    const std::string& label() const { return m_label; }

    static uint64_t allocationSize(uint64_t size, uint64_t minSize = 4);

private:
    void create(WGPUDevice device, bool mappedAtCreation);

    WgpuHandle<WGPUBuffer> m_buffer;
    BufferKind m_kind;
    uint64_t m_size;
    uint64_t m_allocatedSize;
    std::string m_label;
};

// 2D image usable as storage target and as sampled texture. ReadOnly storage
// access is offered only for the single-channel 32-bit formats.
class Texture : public Bindable {
public:
    Texture(WGPUDevice device, const std::string& label, Dimensions dim,
            WGPUTextureFormat format = WGPUTextureFormat_RGBA8Unorm);

    static AccessSet accessFor(WGPUTextureFormat format);

    AccessSet supportedAccess() const override { return accessFor(m_format); }
    void bindingType(BindAccess access, WGPUBindGroupLayoutEntry& entry) const override;
    void bindingResource(WGPUBindGroupEntry& entry) const override;

    WGPUTexture texture() const { return m_texture; }
    WGPUTextureView view() const { return m_view; }
    WGPUTextureFormat format() const { return m_format; }
    Dimensions dimensions() const { return m_dim; }

private:
    WgpuHandle<WGPUTexture> m_texture;
    WgpuHandle<WGPUTextureView> m_view;
    WGPUTextureFormat m_format;
    Dimensions m_dim;
};

class Sampler : public Bindable {
public:
    Sampler(WGPUDevice device, WGPUAddressMode addressMode, WGPUFilterMode filterMode);

    AccessSet supportedAccess() const override { return AccessSet::all(); }
    void bindingType(BindAccess access, WGPUBindGroupLayoutEntry& entry) const override;
    void bindingResource(WGPUBindGroupEntry& entry) const override;

    WGPUSampler handle() const { return m_sampler; }

private:
    WgpuHandle<WGPUSampler> m_sampler;
};
