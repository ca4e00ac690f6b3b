#include "Random.h"

#include "Digest.h"

#include <algorithm>
#include <cmath>

namespace ckpt {

void RandomStream::reseed(std::uint32_t seed) {
    seed_u32_ = seed;
    engine_.seed(seed);
}

double RandomStream::uniform01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

double RandomStream::gaussian(double mean, double sigma) {
    if (!std::isfinite(sigma) || sigma <= 0.0) {
        return mean;
    }
    std::normal_distribution<double> dist(mean, sigma);
    return dist(engine_);
}

bool RandomStream::chance(double p) {
    const double u = uniform01();
    if (!std::isfinite(p)) return false;
    return u < std::clamp(p, 0.0, 1.0);
}

std::uint32_t deriveAgentSeed(std::uint32_t run_seed, int agent_uid) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, run_seed);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(agent_uid));
    return h;
}

} // namespace ckpt
