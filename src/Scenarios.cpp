#include "Scenarios.h"

#include <algorithm>
#include <cctype>

namespace ckpt {

namespace {

// Shared deterministic physics: every attach succeeds, nothing detaches and
// tension readings are exact.
RunConfig deterministicBase(int chromosome_count) {
    RunConfig cfg;
    cfg.population.chromosome_count = chromosome_count;
    cfg.population.kinetochores_per_chromosome = 2;

    PhysicsParams& ph = cfg.physics;
    ph.attach_probability = 1.0;
    ph.detach_probability = 0.0;
    ph.misattach_probability = 0.0;
    ph.noise_level = 0.0;
    ph.tension_threshold = 0.9;
    ph.tension_stability_window = 3;

    cfg.bus.initial_concentration = 0.0;
    cfg.bus.mcc_production_rate = 1.0;
    cfg.bus.mcc_degradation_rate = 0.5;
    cfg.bus.apc_activation_threshold = 1.0;
    return cfg;
}

} // namespace

const char* scenarioName(ScenarioId id) {
    switch (id) {
        case ScenarioId::Default: return "default";
        case ScenarioId::NormalCommit: return "normal_commit";
        case ScenarioId::FaultInjection: return "fault_injection";
        case ScenarioId::PermanentMisattachment: return "permanent_misattachment";
        case ScenarioId::CoincidentThresholds: return "coincident_thresholds";
        case ScenarioId::MutantMix: return "mutant_mix";
        default: return "unknown";
    }
}

const char* scenarioDescription(ScenarioId id) {
    switch (id) {
        case ScenarioId::Default: return "23 chromosome pairs, default physics";
        case ScenarioId::NormalCommit: return "1 pair, exact tension; commit at tick 4, no violations";
        case ScenarioId::FaultInjection: return "2 pairs, pair 0 faulty sensor; unsafe commit at tick 0";
        case ScenarioId::PermanentMisattachment: return "2 pairs, pair 1 always misattached; arrest then apoptosis";
        case ScenarioId::CoincidentThresholds: return "permanent misattachment with arrest tick == apoptosis tick";
        case ScenarioId::MutantMix: return "default population, one or more pairs of every variant";
        default: return "";
    }
}

bool parseScenarioName(const std::string& name, ScenarioId* out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    ScenarioId id = ScenarioId::Count;
    if (v == "a") id = ScenarioId::NormalCommit;
    else if (v == "b") id = ScenarioId::FaultInjection;
    else if (v == "c") id = ScenarioId::PermanentMisattachment;
    else if (v == "d") id = ScenarioId::CoincidentThresholds;
    else {
        for (int i = 0; i < static_cast<int>(ScenarioId::Count); ++i) {
            if (v == scenarioName(static_cast<ScenarioId>(i))) {
                id = static_cast<ScenarioId>(i);
                break;
            }
        }
    }
    if (id == ScenarioId::Count) return false;
    if (out) *out = id;
    return true;
}

RunConfig makeScenarioConfig(ScenarioId id) {
    switch (id) {
        case ScenarioId::NormalCommit: {
            // Bus: 2, 3, 3.5, 1.75, 0.875 -> commit at tick 4.
            return deterministicBase(1);
        }
        case ScenarioId::FaultInjection: {
            // Pair 0 emits nothing, pair 1 emits 2: bus = 2 < 2.5 at tick 0
            // while pair 1 is still relaxed.
            RunConfig cfg = deterministicBase(2);
            cfg.bus.apc_activation_threshold = 2.5;
            cfg.variants.faulty_sensor = {0};
            return cfg;
        }
        case ScenarioId::PermanentMisattachment: {
            // Effective misattach for pair 1 is 0.2 * 5.0 = 1.0; the pair never
            // detaches, so the bus settles at >= 2 * production / degradation = 4.
            // Pair 0 rolls the base 0.2 once at its tick-0 attach; either way
            // pair 1 alone holds the bus above threshold.
            RunConfig cfg = deterministicBase(2);
            cfg.physics.misattach_probability = 0.2;
            cfg.physics.merotelic_drift_multiplier = 5.0;
            cfg.variants.elevated_misattachment = {1};
            return cfg;
        }
        case ScenarioId::CoincidentThresholds: {
            RunConfig cfg = makeScenarioConfig(ScenarioId::PermanentMisattachment);
            cfg.limits.max_mitosis_time = 120;
            cfg.limits.apoptosis_threshold = 120;
            return cfg;
        }
        case ScenarioId::MutantMix: {
            RunConfig cfg;
            cfg.variants.faulty_sensor = {0};
            cfg.variants.unstable_boundary = {1, 2};
            cfg.variants.hyperstable = {3, 4};
            cfg.variants.elevated_misattachment = {5, 6};
            return cfg;
        }
        case ScenarioId::Default:
        default:
            return RunConfig{};
    }
}

} // namespace ckpt
