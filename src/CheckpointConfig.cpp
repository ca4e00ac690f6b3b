#include "CheckpointConfig.h"

#include "Digest.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace ckpt {

namespace {

constexpr int kMaxAgents = 1000000;

bool contains(const std::vector<int>& ids, int pair_id) {
    return std::find(ids.begin(), ids.end(), pair_id) != ids.end();
}

bool fail(ConfigError* err, const std::string& msg) {
    if (err) {
        err->line = 0;
        err->message = msg;
    }
    return false;
}

bool isProbability(double p) {
    return std::isfinite(p) && p >= 0.0 && p <= 1.0;
}

bool isFiniteNonNegative(double x) {
    return std::isfinite(x) && x >= 0.0;
}

bool pairIdsInRange(const std::vector<int>& ids, int pair_count, const char* list, ConfigError* err) {
    for (int id : ids) {
        if (id < 0 || id >= pair_count) {
            char buf[160];
            std::snprintf(buf, sizeof(buf), "variants.%s: pair id %d out of range [0,%d)", list, id, pair_count);
            return fail(err, buf);
        }
    }
    return true;
}

std::uint32_t hashIds(std::uint32_t h, const std::vector<int>& ids) {
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(ids.size()));
    for (int id : ids) h = fnv1a32_add_i32(h, id);
    return h;
}

} // namespace

AgentVariant VariantAssignment::variantForPair(int pair_id) const {
    if (contains(faulty_sensor, pair_id)) return AgentVariant::FaultySensor;
    if (contains(unstable_boundary, pair_id)) return AgentVariant::UnstableBoundary;
    if (contains(hyperstable, pair_id)) return AgentVariant::Hyperstable;
    if (contains(elevated_misattachment, pair_id)) return AgentVariant::ElevatedMisattachmentRisk;
    return AgentVariant::None;
}

bool VariantAssignment::empty() const {
    return faulty_sensor.empty() && unstable_boundary.empty()
        && hyperstable.empty() && elevated_misattachment.empty();
}

bool validateConfig(const RunConfig& cfg, ConfigError* err) {
    const PopulationConfig& pop = cfg.population;
    if (pop.chromosome_count < 1) return fail(err, "population.chromosome_count must be >= 1");
    if (pop.kinetochores_per_chromosome < 1) return fail(err, "population.kinetochores_per_chromosome must be >= 1");
    const long long total = static_cast<long long>(pop.chromosome_count)
                          * static_cast<long long>(pop.kinetochores_per_chromosome);
    if (pop.chromosome_count > kMaxAgents || pop.kinetochores_per_chromosome > kMaxAgents
        || total > kMaxAgents) {
        return fail(err, "population: agent count too large");
    }
    if (pop.agentCount() % 2 != 0) return fail(err, "population: total agent count must be even (sister pairs)");

    const PhysicsParams& ph = cfg.physics;
    if (!std::isfinite(ph.tension_threshold)) return fail(err, "physics.tension_threshold must be finite");
    if (!isFiniteNonNegative(ph.noise_level)) return fail(err, "physics.noise_level must be >= 0");
    if (!isProbability(ph.attach_probability)) return fail(err, "physics.attach_probability must be in [0,1]");
    if (!isProbability(ph.detach_probability)) return fail(err, "physics.detach_probability must be in [0,1]");
    if (!isProbability(ph.misattach_probability)) return fail(err, "physics.misattach_probability must be in [0,1]");
    if (!isFiniteNonNegative(ph.misattach_detach_multiplier)) return fail(err, "physics.misattach_detach_multiplier must be >= 0");
    if (ph.tension_stability_window < 1) return fail(err, "physics.tension_stability_window must be >= 1");
    if (!isFiniteNonNegative(ph.wapl_relaxed_threshold)) return fail(err, "physics.wapl_relaxed_threshold must be >= 0");
    if (!isProbability(ph.wapl_unload_probability)) return fail(err, "physics.wapl_unload_probability must be in [0,1]");
    if (!isProbability(ph.ctcf_instability)) return fail(err, "physics.ctcf_instability must be in [0,1]");
    if (!isFiniteNonNegative(ph.hyperstabilization_factor)) return fail(err, "physics.hyperstabilization_factor must be >= 0");
    if (!isFiniteNonNegative(ph.merotelic_drift_multiplier)) return fail(err, "physics.merotelic_drift_multiplier must be >= 0");

    const BusParams& bus = cfg.bus;
    if (!isFiniteNonNegative(bus.mcc_production_rate)) return fail(err, "bus.mcc_production_rate must be >= 0");
    if (!isProbability(bus.mcc_degradation_rate)) return fail(err, "bus.mcc_degradation_rate must be in [0,1]");
    if (!std::isfinite(bus.apc_activation_threshold)) return fail(err, "bus.apc_activation_threshold must be finite");
    if (!isFiniteNonNegative(bus.initial_concentration)) return fail(err, "bus.initial_concentration must be >= 0");

    const LimitsConfig& lim = cfg.limits;
    if (lim.max_mitosis_time < 0) return fail(err, "limits.max_mitosis_time must be >= 0");
    if (lim.apoptosis_threshold < 0) return fail(err, "limits.apoptosis_threshold must be >= 0");
    if (lim.max_ticks < 0) return fail(err, "limits.max_ticks must be >= 0");

    const int pair_count = pop.agentCount() / 2;
    if (!pairIdsInRange(cfg.variants.faulty_sensor, pair_count, "faulty_sensor", err)) return false;
    if (!pairIdsInRange(cfg.variants.unstable_boundary, pair_count, "unstable_boundary", err)) return false;
    if (!pairIdsInRange(cfg.variants.hyperstable, pair_count, "hyperstable", err)) return false;
    if (!pairIdsInRange(cfg.variants.elevated_misattachment, pair_count, "elevated_misattachment", err)) return false;

    if (cfg.telemetry_every < 1) return fail(err, "run.telemetry_every must be >= 1");
    return true;
}

std::uint32_t hashRunConfig(const RunConfig& cfg) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, cfg.version_u32);
    h = fnv1a32_add_u32(h, cfg.size_bytes_u32);

    h = fnv1a32_add_i32(h, cfg.population.chromosome_count);
    h = fnv1a32_add_i32(h, cfg.population.kinetochores_per_chromosome);

    const PhysicsParams& ph = cfg.physics;
    h = fnv1a32_add_f64(h, ph.tension_threshold);
    h = fnv1a32_add_f64(h, ph.noise_level);
    h = fnv1a32_add_f64(h, ph.attach_probability);
    h = fnv1a32_add_f64(h, ph.detach_probability);
    h = fnv1a32_add_f64(h, ph.misattach_probability);
    h = fnv1a32_add_f64(h, ph.misattach_detach_multiplier);
    h = fnv1a32_add_i32(h, ph.tension_stability_window);
    h = fnv1a32_add_f64(h, ph.wapl_relaxed_threshold);
    h = fnv1a32_add_f64(h, ph.wapl_unload_probability);
    h = fnv1a32_add_f64(h, ph.ctcf_instability);
    h = fnv1a32_add_f64(h, ph.hyperstabilization_factor);
    h = fnv1a32_add_f64(h, ph.merotelic_drift_multiplier);

    h = fnv1a32_add_f64(h, cfg.bus.mcc_production_rate);
    h = fnv1a32_add_f64(h, cfg.bus.mcc_degradation_rate);
    h = fnv1a32_add_f64(h, cfg.bus.apc_activation_threshold);
    h = fnv1a32_add_f64(h, cfg.bus.initial_concentration);

    h = fnv1a32_add_i32(h, cfg.limits.max_mitosis_time);
    h = fnv1a32_add_i32(h, cfg.limits.apoptosis_threshold);
    h = fnv1a32_add_i32(h, cfg.limits.max_ticks);

    h = hashIds(h, cfg.variants.faulty_sensor);
    h = hashIds(h, cfg.variants.unstable_boundary);
    h = hashIds(h, cfg.variants.hyperstable);
    h = hashIds(h, cfg.variants.elevated_misattachment);

    h = fnv1a32_add_u32(h, cfg.seed_u32);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(cfg.sibling_policy));
    h = fnv1a32_add_i32(h, cfg.telemetry_every);
    return h;
}

int lastTickBudget(const LimitsConfig& limits) {
    const int derived = std::max(limits.max_mitosis_time, limits.apoptosis_threshold);
    if (limits.max_ticks > 0) {
        return std::min(derived, limits.max_ticks - 1);
    }
    return derived;
}

const char* variantName(AgentVariant v) {
    switch (v) {
        case AgentVariant::None: return "none";
        case AgentVariant::FaultySensor: return "faulty_sensor";
        case AgentVariant::UnstableBoundary: return "unstable_boundary";
        case AgentVariant::Hyperstable: return "hyperstable";
        case AgentVariant::ElevatedMisattachmentRisk: return "elevated_misattachment";
        default: return "unknown";
    }
}

bool parseVariantName(const std::string& name, AgentVariant* out) {
    struct Alias { const char* text; AgentVariant v; };
    static const Alias kAliases[] = {
        {"none", AgentVariant::None},
        {"faulty_sensor", AgentVariant::FaultySensor},
        {"mad2", AgentVariant::FaultySensor},
        {"unstable_boundary", AgentVariant::UnstableBoundary},
        {"weak_ctcf", AgentVariant::UnstableBoundary},
        {"hyperstable", AgentVariant::Hyperstable},
        {"hyperstabilized", AgentVariant::Hyperstable},
        {"elevated_misattachment", AgentVariant::ElevatedMisattachmentRisk},
        {"merotelic_drift", AgentVariant::ElevatedMisattachmentRisk},
    };
    for (const Alias& a : kAliases) {
        if (name == a.text) {
            if (out) *out = a.v;
            return true;
        }
    }
    return false;
}

const char* siblingPolicyName(SiblingPolicy p) {
    return (p == SiblingPolicy::Sequential) ? "sequential" : "snapshot";
}

} // namespace ckpt
