#pragma once

#include <cstdint>
#include <random>

namespace ckpt {

// Explicit, seedable random source. Every stochastic call in the kernel takes
// one of these by reference; there is no global generator (do not use std::rand()).
class RandomStream {
public:
    RandomStream() : engine_(kDefaultSeed), seed_u32_(kDefaultSeed) {}
    explicit RandomStream(std::uint32_t seed) : engine_(seed), seed_u32_(seed) {}

    void reseed(std::uint32_t seed);
    std::uint32_t seed() const { return seed_u32_; }

    // [0,1)
    double uniform01();

    // Normal(mean, sigma). sigma <= 0 (or non-finite) returns mean without drawing.
    double gaussian(double mean, double sigma);

    // True with probability p; p is clamped to [0,1]. Always consumes one draw.
    bool chance(double p);

private:
    static constexpr std::uint32_t kDefaultSeed = 1337u;

    std::mt19937 engine_;
    std::uint32_t seed_u32_ = kDefaultSeed;
};

// Per-agent stream seed: FNV-1a32 over (run seed, agent id), so streams are
// independent of pair processing order.
std::uint32_t deriveAgentSeed(std::uint32_t run_seed, int agent_uid);

} // namespace ckpt
