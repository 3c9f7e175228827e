#include <gtest/gtest.h>
#include "bindable.h"
#include "gpu_test_env.h"
#include <cstring>
#include <stdexcept>
#include <utility>

namespace {

class WriteOnlyThing : public Bindable {
public:
    AccessSet supportedAccess() const override { return { BindAccess::WriteOnly }; }
    void bindingType(BindAccess, WGPUBindGroupLayoutEntry&) const override {}
    void bindingResource(WGPUBindGroupEntry&) const override {}
};

WGPUBindGroupLayoutEntry layoutFor(const Bindable& b, BindAccess access) {
    WGPUBindGroupLayoutEntry e;
    memset(&e, 0, sizeof(e));
    b.bindingType(access, e);
    return e;
}

} // namespace

TEST(AccessSetTest, Contains) {
    AccessSet s = { BindAccess::ReadOnly, BindAccess::WriteOnly };
    EXPECT_TRUE(s.contains(BindAccess::ReadOnly));
    EXPECT_FALSE(s.contains(BindAccess::ReadSampled));
    EXPECT_TRUE(s.contains(BindAccess::WriteOnly));
    EXPECT_FALSE(AccessSet().contains(BindAccess::ReadOnly));
}

TEST(AccessSetTest, AllHasEveryMode) {
    AccessSet all = AccessSet::all();
    EXPECT_TRUE(all.contains(BindAccess::ReadOnly));
    EXPECT_TRUE(all.contains(BindAccess::ReadSampled));
    EXPECT_TRUE(all.contains(BindAccess::WriteOnly));
    EXPECT_TRUE(all == AccessSet({ BindAccess::WriteOnly, BindAccess::ReadSampled, BindAccess::ReadOnly }));
}

TEST(BindArgTest, RejectsUnsupportedAccess) {
    WriteOnlyThing thing;
    EXPECT_NO_THROW(BindArg(BindAccess::WriteOnly, thing));
    EXPECT_THROW(BindArg(BindAccess::ReadOnly, thing), std::invalid_argument);
    EXPECT_THROW(BindArg(BindAccess::ReadSampled, thing), std::invalid_argument);
}

TEST(TextureAccessTest, ReadOnlyStorageOnlyForSingleChannelFormats) {
    EXPECT_TRUE(Texture::accessFor(WGPUTextureFormat_R32Float) == AccessSet::all());
    EXPECT_TRUE(Texture::accessFor(WGPUTextureFormat_R32Uint) == AccessSet::all());
    AccessSet rgba = Texture::accessFor(WGPUTextureFormat_RGBA8Unorm);
    EXPECT_FALSE(rgba.contains(BindAccess::ReadOnly));
    EXPECT_TRUE(rgba.contains(BindAccess::ReadSampled));
    EXPECT_TRUE(rgba.contains(BindAccess::WriteOnly));
}

TEST(BufferSizeTest, AllocationRoundsToWords) {
    EXPECT_EQ(Buffer::allocationSize(0), 4u);
    EXPECT_EQ(Buffer::allocationSize(1), 4u);
    EXPECT_EQ(Buffer::allocationSize(4), 4u);
    EXPECT_EQ(Buffer::allocationSize(6), 8u);
    EXPECT_EQ(Buffer::allocationSize(0, 16), 16u);
    EXPECT_EQ(Buffer::allocationSize(64, 16), 64u);
}

TEST(WgpuHandleTest, EmptyHandle) {
    WgpuHandle<WGPUBuffer> h;
    EXPECT_FALSE(h);
    EXPECT_EQ(h.get(), nullptr);
    h.reset();
    WgpuHandle<WGPUBuffer> moved(std::move(h));
    EXPECT_FALSE(moved);
}

class BindableGpuTest : public GpuTest {};

// Ownership moves with the handle; each object is released exactly once
TEST_F(BindableGpuTest, HandleMoveReleasesOnce) {
    WGPUSamplerDescriptor desc = {};
    desc.maxAnisotropy = 1;
    desc.lodMaxClamp = 32.0f;
    WgpuHandle<WGPUSampler> a(wgpuDeviceCreateSampler(gpu->device, &desc));
    ASSERT_TRUE(a);
    WGPUSampler raw = a;

    WgpuHandle<WGPUSampler> b(std::move(a));
    EXPECT_FALSE(a);
    EXPECT_EQ(b.get(), raw);

    WgpuHandle<WGPUSampler> c;
    c = std::move(b);
    EXPECT_EQ(c.get(), raw);
    c.reset();
    EXPECT_FALSE(c);
}

TEST_F(BindableGpuTest, UniformBufferIsReadOnly) {
    Buffer uniform(gpu->device, "u", BufferKind::Uniform, 16);
    EXPECT_TRUE(uniform.supports(BindAccess::ReadOnly));
    EXPECT_FALSE(uniform.supports(BindAccess::WriteOnly));
    EXPECT_FALSE(uniform.supports(BindAccess::ReadSampled));
    EXPECT_THROW(BindArg(BindAccess::WriteOnly, uniform), std::invalid_argument);
    EXPECT_EQ(layoutFor(uniform, BindAccess::ReadOnly).buffer.type, WGPUBufferBindingType_Uniform);
}

TEST_F(BindableGpuTest, StorageBufferBindingTypes) {
    Buffer storage(gpu->device, "s", BufferKind::Storage, 6);
    EXPECT_EQ(storage.size(), 6u);
    EXPECT_EQ(storage.allocatedSize(), 8u);
    EXPECT_THROW(BindArg(BindAccess::ReadSampled, storage), std::invalid_argument);

    WGPUBindGroupLayoutEntry ro = layoutFor(storage, BindAccess::ReadOnly);
    EXPECT_EQ(ro.buffer.type, WGPUBufferBindingType_ReadOnlyStorage);
    EXPECT_EQ(ro.buffer.minBindingSize, 8u);
    EXPECT_EQ(layoutFor(storage, BindAccess::WriteOnly).buffer.type, WGPUBufferBindingType_Storage);
}

TEST_F(BindableGpuTest, TextureBindingTypes) {
    Texture tex(gpu->device, "t", { 4, 2 });
    EXPECT_FALSE(tex.supports(BindAccess::ReadOnly));
    EXPECT_THROW(BindArg(BindAccess::ReadOnly, tex), std::invalid_argument);

    WGPUBindGroupLayoutEntry sampled = layoutFor(tex, BindAccess::ReadSampled);
    EXPECT_EQ(sampled.texture.sampleType, WGPUTextureSampleType_Float);
    EXPECT_EQ(sampled.texture.viewDimension, WGPUTextureViewDimension_2D);

    WGPUBindGroupLayoutEntry written = layoutFor(tex, BindAccess::WriteOnly);
    EXPECT_EQ(written.storageTexture.access, WGPUStorageTextureAccess_WriteOnly);
    EXPECT_EQ(written.storageTexture.format, WGPUTextureFormat_RGBA8Unorm);
}

TEST_F(BindableGpuTest, SingleChannelTextureIsStorageReadable) {
    Texture tex(gpu->device, "r32", { 4, 2 }, WGPUTextureFormat_R32Float);
    EXPECT_TRUE(tex.supportedAccess() == AccessSet::all());
    EXPECT_EQ(layoutFor(tex, BindAccess::ReadOnly).storageTexture.access,
              WGPUStorageTextureAccess_ReadOnly);
    EXPECT_EQ(layoutFor(tex, BindAccess::ReadSampled).texture.sampleType,
              WGPUTextureSampleType_UnfilterableFloat);
}

TEST_F(BindableGpuTest, ZeroAreaTextureThrows) {
    EXPECT_THROW(Texture(gpu->device, "empty", { 0, 3 }), std::invalid_argument);
}

TEST_F(BindableGpuTest, SamplerIsFiltering) {
    Sampler sampler(gpu->device, WGPUAddressMode_Repeat, WGPUFilterMode_Linear);
    EXPECT_EQ(layoutFor(sampler, BindAccess::ReadSampled).sampler.type,
              WGPUSamplerBindingType_Filtering);
}
