#include "bindable.h"
#include <algorithm>
#include <cstring>
#include <stdexcept>

const char* bindAccessName(BindAccess access) {
    switch (access) {
        case BindAccess::ReadOnly:    return "ReadOnly";
        case BindAccess::ReadSampled: return "ReadSampled";
        case BindAccess::WriteOnly:   return "WriteOnly";
    }
    return "?";
}

BindArg::BindArg(BindAccess access, const Bindable& resource)
    : m_access(access), m_resource(&resource)
{
    if (!resource.supports(access)) {
        throw std::invalid_argument(std::string("resource does not support ") +
                                    bindAccessName(access) + " access");
    }
}

// --- Buffer ---

uint64_t Buffer::allocationSize(uint64_t size, uint64_t minSize) {
    // Copies and mapped ranges work in 4-byte units, and a zero-sized
    // binding is invalid, so an empty grid still gets one element.
    return (std::max(size, minSize) + 3) & ~uint64_t(3);
}

Buffer::Buffer(WGPUDevice device, const std::string& label, BufferKind kind, uint64_t size,
               uint64_t minSize)
    : m_kind(kind), m_size(size), m_allocatedSize(allocationSize(size, minSize)), m_label(label)
{
    create(device, false);
}

Buffer::Buffer(WGPUDevice device, const std::string& label, BufferKind kind,
               const void* contents, uint64_t size, uint64_t minSize)
    : m_kind(kind), m_size(size), m_allocatedSize(allocationSize(size, minSize)), m_label(label)
{
    create(device, true);
    void* mapped = wgpuBufferGetMappedRange(m_buffer, 0, m_allocatedSize);
    if (mapped && size > 0) memcpy(mapped, contents, size);
    wgpuBufferUnmap(m_buffer);
}

void Buffer::create(WGPUDevice device, bool mappedAtCreation) {
    WGPUBufferDescriptor desc = {};
    desc.label = m_label.c_str();
    desc.size = m_allocatedSize;
    desc.usage = (m_kind == BufferKind::Uniform ? WGPUBufferUsage_Uniform : WGPUBufferUsage_Storage)
               | WGPUBufferUsage_CopySrc | WGPUBufferUsage_CopyDst;
    desc.mappedAtCreation = mappedAtCreation;
    m_buffer.reset(wgpuDeviceCreateBuffer(device, &desc));
}

AccessSet Buffer::supportedAccess() const {
    if (m_kind == BufferKind::Uniform) return { BindAccess::ReadOnly };
    return { BindAccess::ReadOnly, BindAccess::WriteOnly };
}

void Buffer::bindingType(BindAccess access, WGPUBindGroupLayoutEntry& entry) const {
    if (m_kind == BufferKind::Uniform) {
        entry.buffer.type = WGPUBufferBindingType_Uniform;
    } else {
        // WGSL has no write-only storage buffers; writes need read_write
        entry.buffer.type = access == BindAccess::ReadOnly
            ? WGPUBufferBindingType_ReadOnlyStorage
            : WGPUBufferBindingType_Storage;
    }
    entry.buffer.hasDynamicOffset = false;
    entry.buffer.minBindingSize = m_allocatedSize;
}

void Buffer::bindingResource(WGPUBindGroupEntry& entry) const {
    entry.buffer = m_buffer;
    entry.offset = 0;
    entry.size = m_allocatedSize;
}

// --- Texture ---

static WGPUTextureSampleType sampleTypeFor(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_R32Float:
        case WGPUTextureFormat_RG32Float:
        case WGPUTextureFormat_RGBA32Float:
            return WGPUTextureSampleType_UnfilterableFloat;
        case WGPUTextureFormat_R32Uint:
        case WGPUTextureFormat_RGBA32Uint:
            return WGPUTextureSampleType_Uint;
        case WGPUTextureFormat_R32Sint:
        case WGPUTextureFormat_RGBA32Sint:
            return WGPUTextureSampleType_Sint;
        default:
            return WGPUTextureSampleType_Float;
    }
}

AccessSet Texture::accessFor(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_R32Float:
        case WGPUTextureFormat_R32Uint:
        case WGPUTextureFormat_R32Sint:
            return AccessSet::all();
        default:
            return { BindAccess::ReadSampled, BindAccess::WriteOnly };
    }
}

Texture::Texture(WGPUDevice device, const std::string& label, Dimensions dim, WGPUTextureFormat format)
    : m_format(format), m_dim(dim)
{
    if (dim.empty()) throw std::invalid_argument("texture '" + label + "' has zero area");

    WGPUTextureDescriptor desc = {};
    desc.label = label.c_str();
    desc.size = { dim.width, dim.height, 1 };
    desc.format = format;
    desc.usage = WGPUTextureUsage_StorageBinding | WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopySrc;
    desc.dimension = WGPUTextureDimension_2D;
    desc.mipLevelCount = 1;
    desc.sampleCount = 1;
    m_texture.reset(wgpuDeviceCreateTexture(device, &desc));

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = format;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    m_view.reset(wgpuTextureCreateView(m_texture, &viewDesc));
}

void Texture::bindingType(BindAccess access, WGPUBindGroupLayoutEntry& entry) const {
    switch (access) {
        case BindAccess::ReadOnly:
            entry.storageTexture.access = WGPUStorageTextureAccess_ReadOnly;
            entry.storageTexture.format = m_format;
            entry.storageTexture.viewDimension = WGPUTextureViewDimension_2D;
            break;
        case BindAccess::ReadSampled:
            entry.texture.sampleType = sampleTypeFor(m_format);
            entry.texture.viewDimension = WGPUTextureViewDimension_2D;
            entry.texture.multisampled = false;
            break;
        case BindAccess::WriteOnly:
            entry.storageTexture.access = WGPUStorageTextureAccess_WriteOnly;
            entry.storageTexture.format = m_format;
            entry.storageTexture.viewDimension = WGPUTextureViewDimension_2D;
            break;
    }
}

void Texture::bindingResource(WGPUBindGroupEntry& entry) const {
    entry.textureView = m_view;
}

// --- Sampler ---

Sampler::Sampler(WGPUDevice device, WGPUAddressMode addressMode, WGPUFilterMode filterMode) {
    WGPUSamplerDescriptor desc = {};
    desc.addressModeU = addressMode;
    desc.addressModeV = addressMode;
    desc.addressModeW = addressMode;
    desc.magFilter = filterMode;
    desc.minFilter = filterMode;
    desc.mipmapFilter = filterMode == WGPUFilterMode_Linear
        ? WGPUMipmapFilterMode_Linear : WGPUMipmapFilterMode_Nearest;
    desc.lodMaxClamp = 32.0f;
    desc.maxAnisotropy = 1;
    m_sampler.reset(wgpuDeviceCreateSampler(device, &desc));
}

void Sampler::bindingType(BindAccess, WGPUBindGroupLayoutEntry& entry) const {
    entry.sampler.type = WGPUSamplerBindingType_Filtering;
}

void Sampler::bindingResource(WGPUBindGroupEntry& entry) const {
    entry.sampler = m_sampler;
}
