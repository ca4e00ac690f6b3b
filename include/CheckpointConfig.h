#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ckpt {

// ============================================================
// Run configuration (explicit defaults for every parameter).
//
// Rules:
// - The kernel never reads configuration it did not receive here.
// - Blocks are plain values; agents receive a const reference and
//   variants derive local copies (see AgentVariants.h).
// ============================================================

struct PopulationConfig {
    int chromosome_count = 23;
    int kinetochores_per_chromosome = 2;

    int agentCount() const { return chromosome_count * kinetochores_per_chromosome; }
};

struct PhysicsParams {
    double tension_threshold = 0.8;
    double noise_level = 0.1;            // sigma of the tension reading
    double attach_probability = 0.3;
    double detach_probability = 0.01;
    double misattach_probability = 0.02;
    double misattach_detach_multiplier = 2.0;
    int tension_stability_window = 3;    // ticks
    double wapl_relaxed_threshold = 0.5;
    double wapl_unload_probability = 0.005;

    // Variant-only tunables
    double ctcf_instability = 0.1;           // UnstableBoundary
    double hyperstabilization_factor = 0.1;  // Hyperstable
    double merotelic_drift_multiplier = 5.0; // ElevatedMisattachmentRisk
};

struct BusParams {
    double mcc_production_rate = 1.0;
    double mcc_degradation_rate = 0.1;
    double apc_activation_threshold = 5.0;
    double initial_concentration = 100.0;
};

struct LimitsConfig {
    int max_mitosis_time = 200;
    int apoptosis_threshold = 250;
    // 0 = run until max(max_mitosis_time, apoptosis_threshold) inclusive.
    int max_ticks = 0;
};

enum class AgentVariant : int {
    None = 0,
    FaultySensor = 1,
    UnstableBoundary = 2,
    Hyperstable = 3,
    ElevatedMisattachmentRisk = 4,
};

// Pair-id lists. When a pair appears in several lists the first one in
// declaration order wins.
struct VariantAssignment {
    std::vector<int> faulty_sensor;
    std::vector<int> unstable_boundary;
    std::vector<int> hyperstable;
    std::vector<int> elevated_misattachment;

    AgentVariant variantForPair(int pair_id) const;
    bool empty() const;
};

// How the two agents of a sister pair see each other within one tick.
enum class SiblingPolicy : int {
    PreTickSnapshot = 0, // both read the pair's state from before the tick
    Sequential = 1,      // second agent reads the first agent's updated state
};

struct RunConfig {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(PopulationConfig) + sizeof(PhysicsParams)
                                 + sizeof(BusParams) + sizeof(LimitsConfig);

    PopulationConfig population{};
    PhysicsParams physics{};
    BusParams bus{};
    LimitsConfig limits{};
    VariantAssignment variants{};

    std::uint32_t seed_u32 = 1337u;
    SiblingPolicy sibling_policy = SiblingPolicy::PreTickSnapshot;
    int telemetry_every = 1; // ticks between telemetry samples
};

struct ConfigError {
    int line = 0; // 0 = not tied to a line (validation)
    std::string message;
};

// Semantic checks (ranges, pairing, thresholds). Returns false and fills err.
bool validateConfig(const RunConfig& cfg, ConfigError* err);

// FNV-1a32 over every effective field in a fixed order.
std::uint32_t hashRunConfig(const RunConfig& cfg);

// Last tick index that a run under cfg may execute.
int lastTickBudget(const LimitsConfig& limits);

const char* variantName(AgentVariant v);
bool parseVariantName(const std::string& name, AgentVariant* out);

const char* siblingPolicyName(SiblingPolicy p);

} // namespace ckpt
