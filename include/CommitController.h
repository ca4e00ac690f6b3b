#pragma once

namespace ckpt {

// One-way latch (APC/C activation). Once committed it stays committed until
// the owning Simulation is reset.
class CommitController {
public:
    CommitController() = default;
    explicit CommitController(double activation_threshold) : activation_threshold_(activation_threshold) {}

    // Sets the latch when bus_level is strictly below the threshold; returns the latch.
    bool evaluate(double bus_level);

    bool committed() const noexcept { return committed_; }
    double activationThreshold() const noexcept { return activation_threshold_; }

    void reset(double activation_threshold) {
        activation_threshold_ = activation_threshold;
        committed_ = false;
    }

private:
    double activation_threshold_ = 5.0;
    bool committed_ = false;
};

} // namespace ckpt
