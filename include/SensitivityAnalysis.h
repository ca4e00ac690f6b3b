#pragma once

#include <string>
#include <vector>

#include "CheckpointConfig.h"

namespace ckpt {

// One-parameter sweep. Each sampled value runs an ensemble of seeds and the
// outcome frequencies are tabulated per value.
class SensitivityAnalyzer {
public:
    enum class Parameter : int {
        NoiseLevel = 0,
        AttachProbability,
        DetachProbability,
        MisattachProbability,
        TensionThreshold,
        DegradationRate,
        ActivationThreshold,
        Count
    };

    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct SampleResult {
        int runs = 0; // 0 = sampled config rejected by validation
        double commit_fraction = 0.0;
        double mean_commit_tick = 0.0; // over committed runs only
        double violation_fraction = 0.0;
        double arrest_fraction = 0.0;
        double apoptosis_fraction = 0.0;
        double mean_misattachment_events = 0.0;
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        SampleResult metrics{};
    };

    SensitivityAnalyzer();

    void setBaseConfig(const RunConfig& cfg);
    // Seeds base.seed_u32 .. base.seed_u32 + n - 1 per sampled value.
    void setSeedsPerSample(int n);
    void clearResults();

    void analyze(Parameter p, const ParameterRange& range);

    bool exportSensitivityMatrixCSV(const std::string& filename) const;
    const std::vector<SensitivityRow>& results() const;

    static const char* parameterName(Parameter p);
    static bool parseParameter(const std::string& name, Parameter* out);
    static double nominalValue(const RunConfig& cfg, Parameter p);

private:
    RunConfig base_{};
    int seeds_per_sample_ = 8;
    std::vector<SensitivityRow> results_{};

    SampleResult runEnsemble(const RunConfig& cfg) const;
    std::vector<double> sampleValues(const ParameterRange& range) const;
    static void applyParameter(RunConfig* cfg, Parameter p, double value);
};

} // namespace ckpt
