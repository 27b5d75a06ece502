#pragma once

#include <QtGlobal>

#include <cmath>

namespace airsynth::util {

// StableRng: frozen deterministic PRNG (no Qt RNG dependency).
// Implementation: xorshift32 (13, 17, 5). A zero seed is forced to 1 since
// zero is the generator's fixed point.
class StableRng final {
public:
    StableRng() = default;
    explicit StableRng(quint32 seed) { this->seed(seed); }

    void seed(quint32 s) { m_state = (s == 0u) ? 1u : s; }

    quint32 nextU32() {
        quint32 x = m_state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        m_state = x;
        return x;
    }

    // Uniform double in [0,1): state / 2^32.
    double nextDouble01() {
        return double(nextU32()) / 4294967296.0;
    }

    // Uniform integer in [lo, hi).
    int nextInt(int lo, int hi) {
        if (hi <= lo) return lo;
        return lo + int(std::floor(nextDouble01() * double(hi - lo)));
    }

    quint32 state() const { return m_state; }

private:
    quint32 m_state = 1u;
};

} // namespace airsynth::util
