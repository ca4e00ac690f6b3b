#include "SensitivityAnalysis.h"

#include "Simulation.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>

namespace ckpt {

SensitivityAnalyzer::SensitivityAnalyzer() = default;

void SensitivityAnalyzer::setBaseConfig(const RunConfig& cfg) {
    base_ = cfg;
}

void SensitivityAnalyzer::setSeedsPerSample(int n) {
    seeds_per_sample_ = std::max(1, n);
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

const char* SensitivityAnalyzer::parameterName(Parameter p) {
    switch (p) {
        case Parameter::NoiseLevel: return "noise_level";
        case Parameter::AttachProbability: return "attach_probability";
        case Parameter::DetachProbability: return "detach_probability";
        case Parameter::MisattachProbability: return "misattach_probability";
        case Parameter::TensionThreshold: return "tension_threshold";
        case Parameter::DegradationRate: return "mcc_degradation_rate";
        case Parameter::ActivationThreshold: return "apc_activation_threshold";
        default: return "unknown";
    }
}

bool SensitivityAnalyzer::parseParameter(const std::string& name, Parameter* out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    Parameter p = Parameter::Count;
    if (v == "noise" || v == "noise_level") p = Parameter::NoiseLevel;
    else if (v == "attach" || v == "attach_probability") p = Parameter::AttachProbability;
    else if (v == "detach" || v == "detach_probability") p = Parameter::DetachProbability;
    else if (v == "misattach" || v == "misattach_probability") p = Parameter::MisattachProbability;
    else if (v == "threshold" || v == "tension_threshold") p = Parameter::TensionThreshold;
    else if (v == "degradation" || v == "mcc_degradation_rate") p = Parameter::DegradationRate;
    else if (v == "activation" || v == "apc_activation_threshold") p = Parameter::ActivationThreshold;
    if (p == Parameter::Count) return false;
    if (out) *out = p;
    return true;
}

double SensitivityAnalyzer::nominalValue(const RunConfig& cfg, Parameter p) {
    switch (p) {
        case Parameter::NoiseLevel: return cfg.physics.noise_level;
        case Parameter::AttachProbability: return cfg.physics.attach_probability;
        case Parameter::DetachProbability: return cfg.physics.detach_probability;
        case Parameter::MisattachProbability: return cfg.physics.misattach_probability;
        case Parameter::TensionThreshold: return cfg.physics.tension_threshold;
        case Parameter::DegradationRate: return cfg.bus.mcc_degradation_rate;
        case Parameter::ActivationThreshold: return cfg.bus.apc_activation_threshold;
        default: return 0.0;
    }
}

void SensitivityAnalyzer::applyParameter(RunConfig* cfg, Parameter p, double value) {
    switch (p) {
        case Parameter::NoiseLevel: cfg->physics.noise_level = value; break;
        case Parameter::AttachProbability: cfg->physics.attach_probability = value; break;
        case Parameter::DetachProbability: cfg->physics.detach_probability = value; break;
        case Parameter::MisattachProbability: cfg->physics.misattach_probability = value; break;
        case Parameter::TensionThreshold: cfg->physics.tension_threshold = value; break;
        case Parameter::DegradationRate: cfg->bus.mcc_degradation_rate = value; break;
        case Parameter::ActivationThreshold: cfg->bus.apc_activation_threshold = value; break;
        default: break;
    }
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

SensitivityAnalyzer::SampleResult SensitivityAnalyzer::runEnsemble(const RunConfig& cfg) const {
    SampleResult m{};
    if (!validateConfig(cfg, nullptr)) {
        return m;
    }

    Simulation sim;
    int commits = 0;
    double commit_tick_sum = 0.0;
    int violated = 0;
    int arrested = 0;
    int apoptotic = 0;
    double misattachment_sum = 0.0;

    for (int s = 0; s < seeds_per_sample_; ++s) {
        RunConfig seeded = cfg;
        seeded.seed_u32 = cfg.seed_u32 + static_cast<std::uint32_t>(s);
        if (!sim.reset(seeded, nullptr)) {
            continue;
        }
        sim.run();

        m.runs++;
        // A latch set on the apoptosis tick is not a completed anaphase.
        if (sim.outcome() == MitosisOutcome::AnaphaseCompleted) {
            commits++;
            commit_tick_sum += sim.commitTick();
        }
        if (!sim.monitor().passed()) violated++;
        if (sim.arrestTick() >= 0) arrested++;
        if (sim.outcome() == MitosisOutcome::Apoptosis) apoptotic++;
        misattachment_sum += static_cast<double>(sim.monitor().misattachmentEvents().size());
    }

    if (m.runs > 0) {
        const double n = static_cast<double>(m.runs);
        m.commit_fraction = commits / n;
        m.mean_commit_tick = (commits > 0) ? commit_tick_sum / commits : 0.0;
        m.violation_fraction = violated / n;
        m.arrest_fraction = arrested / n;
        m.apoptosis_fraction = apoptotic / n;
        m.mean_misattachment_events = misattachment_sum / n;
    }
    return m;
}

void SensitivityAnalyzer::analyze(Parameter p, const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        RunConfig cfg = base_;
        applyParameter(&cfg, p, value);
        const auto metrics = runEnsemble(cfg);
        results_.push_back({parameterName(p), value, metrics});
    }
}

bool SensitivityAnalyzer::exportSensitivityMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,runs,commit_fraction,mean_commit_tick,violation_fraction,"
           "arrest_fraction,apoptosis_fraction,mean_misattachment_events\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.metrics.runs << ','
            << row.metrics.commit_fraction << ','
            << row.metrics.mean_commit_tick << ','
            << row.metrics.violation_fraction << ','
            << row.metrics.arrest_fraction << ','
            << row.metrics.apoptosis_fraction << ','
            << row.metrics.mean_misattachment_events << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace ckpt
