#pragma once

#include <vector>

#include "CheckpointConfig.h"

namespace ckpt {

// Latin-hypercube uncertainty over the agent physics. Each sample is one run
// with its own seed; outcome distributions are summarized across samples.
class MonteCarloUQ {
public:
    struct ParameterRange {
        double min = 0.0;
        double max = 0.0;
    };

    struct UQResult {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct UQSummary {
        int samples = 0;
        int rejected = 0; // sampled configs that failed validation
        double commit_fraction = 0.0;
        double violation_fraction = 0.0;
        double apoptosis_fraction = 0.0;
        UQResult end_tick{};     // last executed tick
        UQResult commit_tick{};  // committed runs only
        UQResult final_mcc{};
        UQResult misattachment_events{};
    };

    struct UQRanges {
        ParameterRange noise_level{0.05, 0.2};
        ParameterRange attach_probability{0.2, 0.4};
        ParameterRange detach_probability{0.005, 0.02};
        ParameterRange misattach_probability{0.0, 0.05};
    };

    MonteCarloUQ();

    void setBaseConfig(const RunConfig& cfg);
    void setRanges(const UQRanges& ranges);

    UQSummary runMonteCarlo(const RunConfig& base, int num_samples = 100) const;
    UQSummary runMonteCarlo(int num_samples = 100) const;

private:
    RunConfig base_{};
    UQRanges ranges_{};

    UQResult summarize(const std::vector<double>& values) const;
};

} // namespace ckpt
