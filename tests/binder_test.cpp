#include <gtest/gtest.h>
#include "binder.h"
#include "debug_buffer.h"
#include "gpu_test_env.h"
#include "grid_buffer.h"
#include <stdexcept>

namespace {

// Marks each slot with its own id so entry order is observable
class TaggedResource : public Bindable {
public:
    explicit TaggedResource(uint64_t id, WGPUBufferBindingType type = WGPUBufferBindingType_Storage)
        : m_id(id), m_type(type) {}

    AccessSet supportedAccess() const override { return AccessSet::all(); }
    void bindingType(BindAccess, WGPUBindGroupLayoutEntry& entry) const override {
        entry.buffer.type = m_type;
        entry.buffer.minBindingSize = 4;
    }
    void bindingResource(WGPUBindGroupEntry& entry) const override { entry.size = m_id; }

private:
    uint64_t m_id;
    WGPUBufferBindingType m_type;
};

} // namespace

TEST(BinderTest, SlotsFollowListOrder) {
    TaggedResource a(100), b(200), c(300);
    BindArgs args = { { BindAccess::ReadOnly, b }, { BindAccess::WriteOnly, c }, { BindAccess::ReadOnly, a } };

    std::vector<WGPUBindGroupEntry> group = Binder::groupEntries(args);
    ASSERT_EQ(group.size(), 3u);
    for (uint32_t i = 0; i < 3; i++) EXPECT_EQ(group[i].binding, i);
    EXPECT_EQ(group[0].size, 200u);
    EXPECT_EQ(group[1].size, 300u);
    EXPECT_EQ(group[2].size, 100u);

    std::vector<WGPUBindGroupLayoutEntry> layout = Binder::layoutEntries(args, WGPUShaderStage_Compute);
    ASSERT_EQ(layout.size(), 3u);
    for (uint32_t i = 0; i < 3; i++) {
        EXPECT_EQ(layout[i].binding, i);
        EXPECT_EQ(layout[i].visibility, (WGPUShaderStageFlags)WGPUShaderStage_Compute);
    }
}

TEST(BinderTest, EmptyArgsGiveNoEntries) {
    EXPECT_TRUE(Binder::groupEntries({}).empty());
    EXPECT_TRUE(Binder::layoutEntries({}, WGPUShaderStage_Compute).empty());
}

// Rejected before any device call, so no device is needed
TEST(BinderTest, PhasesWithDifferentSlotCountsThrow) {
    TaggedResource a(1), b(2);
    PhaseTable<BindArgs> args(BindArgs{ { BindAccess::ReadOnly, a }, { BindAccess::WriteOnly, b } },
                              BindArgs{ { BindAccess::ReadOnly, b } });
    EXPECT_THROW(Binder::bindPhasedTable(nullptr, nullptr, "main", args), std::invalid_argument);
}

TEST(BinderTest, PhasesWithDifferentSlotTypesThrow) {
    TaggedResource storage(1), uniform(2, WGPUBufferBindingType_Uniform);
    EXPECT_THROW(Binder::bindPhased(nullptr, nullptr, "main", [&](Phase p) {
        return BindArgs{ { BindAccess::ReadOnly, p == Phase::Forward ? storage : uniform } };
    }), std::invalid_argument);
}

TEST(BinderTest, EmptyShaderSourceThrows) {
    EXPECT_THROW(createShaderModule(nullptr, "", "nothing"), std::runtime_error);
}

class BinderGpuTest : public GpuTest {};

static const char* kSwapShader = R"(
@group(0) @binding(0) var<storage, read> src: array<u32>;
@group(0) @binding(1) var<storage, read_write> dst: array<u32>;

@compute @workgroup_size(1)
fn main() {
    dst[0] = src[0] + 1u;
}
)";

// Ping-pong between two buffers through the per-phase bind groups
TEST_F(BinderGpuTest, PhasedBindingPingPongs) {
    std::vector<uint32_t> zero = { 0 };
    PhaseTable<GridBuffer<uint32_t>> buffers(
        GridBuffer<uint32_t>(gpu->device, "a", { 1, 1 }, zero),
        GridBuffer<uint32_t>(gpu->device, "b", { 1, 1 }, zero));

    WgpuHandle<WGPUShaderModule> shader = createShaderModule(gpu->device, kSwapShader, "swap");
    PhasedComputeBinding binding = Binder::bindPhased(gpu->device, shader, "main", [&](Phase p) {
        return BindArgs{
            { BindAccess::ReadOnly,  buffers.source(p) },
            { BindAccess::WriteOnly, buffers.destination(p) },
        };
    });

    WgpuHandle<WGPUCommandEncoder> encoder = makeEncoder(*gpu);
    for (uint64_t step = 0; step < 5; step++) {
        WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, nullptr);
        wgpuComputePassEncoderSetPipeline(pass, binding.pipeline);
        wgpuComputePassEncoderSetBindGroup(pass, 0, binding.bindGroups[phaseOf(step)], 0, nullptr);
        wgpuComputePassEncoderDispatchWorkgroups(pass, 1, 1, 1);
        wgpuComputePassEncoderEnd(pass);
        wgpuComputePassEncoderRelease(pass);
    }
    submitEncoder(*gpu, encoder);

    // Five steps: the last write went to the source of phase 5 (Backward)
    DebugBuffer<uint32_t> debug(gpu->device, { 1, 1 });
    EXPECT_EQ(debug.copyInAndRead(gpu->device, gpu->queue, buffers.source(phaseOf(5))),
              std::vector<uint32_t>{ 5 });
}
