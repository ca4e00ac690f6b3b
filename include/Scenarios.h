#pragma once

#include <string>

#include "CheckpointConfig.h"

namespace ckpt {

// ---- Deterministic scenario presets ----
// NormalCommit .. CoincidentThresholds use noise_level = 0, attach = 1 and
// detach = 0 so every tick is fixed; their expected traces are pinned in tests.
enum class ScenarioId : int {
    Default = 0,              // RunConfig defaults (23 chromosomes)
    NormalCommit = 1,         // one healthy pair commits at tick 4
    FaultInjection = 2,       // FaultySensor pair drives an unsafe commit at tick 0
    PermanentMisattachment = 3, // arrest, then apoptosis, never commits
    CoincidentThresholds = 4, // arrest and apoptosis on the same tick
    MutantMix = 5,            // default population with every variant present
    Count
};

const char* scenarioName(ScenarioId id);
const char* scenarioDescription(ScenarioId id);

// Accepts the names above and the single-letter aliases a..d.
bool parseScenarioName(const std::string& name, ScenarioId* out);

RunConfig makeScenarioConfig(ScenarioId id);

} // namespace ckpt
