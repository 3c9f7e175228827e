#include "life.h"
#include <cstdio>
#include <stdexcept>

struct Life::Generation {
    Generation(WGPUDevice device, Dimensions d, std::mt19937& rng)
        : dim(d),
          cells(PhaseTable<GridBuffer<float>>::generate([&](Phase p) {
              return GridBuffer<float>(device, std::string("cells (") + phaseName(p) + " source)", d);
          })),
          random(device, "random data", d, randomStates(d, rng)),
          debug(device, d) {}

    Dimensions dim;
    PhaseTable<GridBuffer<float>> cells;
    GridBuffer<RandomState> random;
    DebugBuffer<float> debug;
    PhasedComputeBinding binding;
};

Buffer makeLifeParams(WGPUDevice device, Dimensions dim, float threshold) {
    LifeParams p = {};
    p.width = dim.width;
    p.height = dim.height;
    p.threshold = threshold;
    return Buffer(device, "life parameters", BufferKind::Uniform, &p, sizeof(p));
}

std::vector<float> randomCells(Dimensions dim, std::mt19937& rng) {
    std::uniform_real_distribution<float> u(0.0f, 1.0f);
    std::vector<float> cells(dim.area());
    for (float& c : cells) c = u(rng);
    return cells;
}

std::vector<RandomState> randomStates(Dimensions dim, std::mt19937& rng) {
    std::uniform_int_distribution<uint32_t> u;
    std::vector<RandomState> states(dim.area());
    for (RandomState& s : states) s = { u(rng), u(rng), u(rng), u(rng) };
    return states;
}

Life::Life(WGPUDevice device, WGPUQueue queue, Dimensions dim, const LifeShaders& shaders,
           const Bindable& params, const Bindable& image, std::mt19937& rng)
    : m_device(device),
      m_queue(queue),
      m_shader(createShaderModule(device, shaders.kernel, "life algorithm")),
      m_cellCopier(device, shaders.copyTemplate),
      m_randomCopier(device, shaders.copyTemplate)
{
    std::unique_ptr<Generation> gen = buildGeneration(dim, rng);
    bindKernel(*gen, params, image);
    m_gen = std::move(gen);
}

Life::~Life() = default;

std::unique_ptr<Life::Generation> Life::buildGeneration(Dimensions dim, std::mt19937& rng) const {
    return std::make_unique<Generation>(m_device, dim, rng);
}

void Life::bindKernel(Generation& gen, const Bindable& params, const Bindable& image) const {
    gen.binding = Binder::bindPhased(m_device, m_shader, "life", [&](Phase p) {
        return BindArgs{
            { BindAccess::ReadOnly,  params },
            { BindAccess::ReadOnly,  gen.cells.source(p) },
            { BindAccess::WriteOnly, gen.cells.destination(p) },
            { BindAccess::WriteOnly, gen.random },
            { BindAccess::WriteOnly, image },
        };
    });
}

void Life::resize(Dimensions dim, const Bindable& params, const Bindable& image, std::mt19937& rng) {
    printf("[life] resizing %ux%u -> %ux%u at step %llu\n",
           m_gen->dim.width, m_gen->dim.height, dim.width, dim.height,
           (unsigned long long)m_stepCount);

    std::unique_ptr<Generation> next = buildGeneration(dim, rng);

    // Each phase's buffer maps onto the same phase in the new generation,
    // so the current source stays the source.
    for (Phase p : kPhases)
        m_cellCopier.copy(m_device, m_queue, m_gen->cells[p], next->cells[p]);
    m_randomCopier.copy(m_device, m_queue, m_gen->random, next->random);

    bindKernel(*next, params, image);

    m_gen = std::move(next);
    m_importAllowed = true;
}

void Life::step(WGPUCommandEncoder encoder) {
    const Generation& gen = *m_gen;

    WGPUComputePassDescriptor passDesc = {};
    passDesc.label = "life grid step";
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
    wgpuComputePassEncoderSetPipeline(pass, gen.binding.pipeline);
    wgpuComputePassEncoderSetBindGroup(pass, 0, gen.binding.bindGroups[phase()], 0, nullptr);

    uint32_t wgX = (gen.dim.width + kLifeTileSize - 1) / kLifeTileSize;
    uint32_t wgY = (gen.dim.height + kLifeTileSize - 1) / kLifeTileSize;
    if (wgX > 0 && wgY > 0)
        wgpuComputePassEncoderDispatchWorkgroups(pass, wgX, wgY, 1);
    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);

    m_stepCount++;
    m_importAllowed = false;
}

void Life::import(const std::vector<float>& cells) {
    if (!m_importAllowed) {
        throw std::logic_error("Life::import after stepping; only valid at start or after resize");
    }
    sourceBuffer().importFrom(m_queue, cells);
}

Dimensions Life::dimensions() const {
    return m_gen->dim;
}

const GridBuffer<float>& Life::sourceBuffer() const {
    return m_gen->cells.source(phase());
}

const GridBuffer<float>& Life::destinationBuffer() const {
    return m_gen->cells.destination(phase());
}

const GridBuffer<RandomState>& Life::randomBuffer() const {
    return m_gen->random;
}

std::vector<float> Life::readSource() const {
    return m_gen->debug.copyInAndRead(m_device, m_queue, sourceBuffer());
}

void Life::dumpDebug() const {
    printf("[life] data entering step %llu (%s):\n", (unsigned long long)m_stepCount,
           phaseName(phase()));
    m_gen->debug.copyIn(m_device, m_queue, sourceBuffer());
    m_gen->debug.display(m_device);
    printf("\n");
}
