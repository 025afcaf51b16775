/**
 * SimRNG — Seeded PRNG for deterministic Monte Carlo trials.
 *
 * mulberry32 core: 32-bit state, full period 2^32, fast and portable, so a
 * given seed reproduces the same sample path on every platform.
 *
 * Each trial owns exactly one SimRNG and passes it by reference to every
 * component that draws (link failure, infection, detection, firewall,
 * traffic). Copying is disabled so one stream cannot silently be shared
 * or duplicated across trials.
 */

#ifndef WORMSIM_MC_SIM_RNG_HPP
#define WORMSIM_MC_SIM_RNG_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace wormsim::mc {

class SimRNG {
public:
    explicit SimRNG(uint32_t seed = 42)
        : seed_(seed), state_(seed ? seed : 1u) {}

    SimRNG(const SimRNG&) = delete;
    SimRNG& operator=(const SimRNG&) = delete;
    SimRNG(SimRNG&&) = default;
    SimRNG& operator=(SimRNG&&) = default;

    /** Next double in [0, 1). */
    double random() {
        state_ += 0x6D2B79F5u;
        uint32_t t = state_;
        t = imul(t ^ (t >> 15), t | 1u);
        t ^= t + imul(t ^ (t >> 7), t | 61u);
        return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
    }

    /** Bernoulli trial: true with probability p (p >= 1 always true). */
    bool bernoulli(double p) {
        return random() < p;
    }

    /** Uniform integer in [0, n). n must be positive. */
    int uniform_int(int n) {
        int k = static_cast<int>(random() * n);
        return k < n ? k : n - 1;
    }

    /** Fisher-Yates shuffle driven by this stream. */
    template<typename T>
    void shuffle(std::vector<T>& items) {
        for (std::size_t i = items.size(); i > 1; i--) {
            std::size_t j = static_cast<std::size_t>(uniform_int(static_cast<int>(i)));
            std::swap(items[i - 1], items[j]);
        }
    }

    uint32_t seed() const { return seed_; }
    uint32_t state() const { return state_; }

private:
    uint32_t seed_;
    uint32_t state_;

    // Low 32 bits of the 64-bit product
    static uint32_t imul(uint32_t a, uint32_t b) {
        return static_cast<uint32_t>(
            static_cast<uint64_t>(a) * static_cast<uint64_t>(b)
        );
    }
};

} // namespace wormsim::mc

#endif // WORMSIM_MC_SIM_RNG_HPP
