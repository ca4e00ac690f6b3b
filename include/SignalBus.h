#pragma once

#include "CheckpointConfig.h"

namespace ckpt {

// Leaky integrator of the inhibitory flux emitted by all agents (the MCC pool).
//   c' = max(0, c * (1 - degradation) + flux * production)
class SignalBus {
public:
    SignalBus() = default;
    explicit SignalBus(const BusParams& params);

    // Re-reads rates and restores the initial concentration.
    void reset(const BusParams& params);

    // One tick. Non-finite or negative flux is treated as zero.
    void update(double total_flux);

    double concentration() const noexcept { return concentration_; }
    const BusParams& params() const noexcept { return params_; }

private:
    BusParams params_{};
    double concentration_ = 100.0;
};

} // namespace ckpt
