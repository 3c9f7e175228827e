#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

// Which of the two ping-pong buffers is the source. Always derived from a
// step counter, never stored on its own.
enum class Phase : uint32_t {
    Forward  = 0,
    Backward = 1,
};

inline Phase phaseOf(uint64_t stepCount) {
    return stepCount % 2 == 0 ? Phase::Forward : Phase::Backward;
}

inline Phase opposite(Phase p) {
    return p == Phase::Forward ? Phase::Backward : Phase::Forward;
}

inline const char* phaseName(Phase p) {
    return p == Phase::Forward ? "Forward" : "Backward";
}

constexpr Phase kPhases[2] = { Phase::Forward, Phase::Backward };

// Two values indexed by Phase. Built by evaluating a mapping once per phase.
template <typename T>
class PhaseTable {
public:
    PhaseTable() = default;
    PhaseTable(T forward, T backward)
        : m_values{ { std::move(forward), std::move(backward) } } {}

    template <typename F>
    static PhaseTable generate(F&& f) {
        T forward = f(Phase::Forward);
        T backward = f(Phase::Backward);
        return PhaseTable(std::move(forward), std::move(backward));
    }

    T& operator[](Phase p) { return m_values[(size_t)p]; }
    const T& operator[](Phase p) const { return m_values[(size_t)p]; }

    // Ping-pong roles: in phase p the buffer at p is read and the other one written
    const T& source(Phase p) const { return (*this)[p]; }
    const T& destination(Phase p) const { return (*this)[opposite(p)]; }

private:
    std::array<T, 2> m_values;
};
