#pragma once

#include "CheckpointConfig.h"
#include "Random.h"

namespace ckpt {

enum class KinetochoreState : int;

// ============================================================
// Variant hooks (tagged dispatch over AgentVariant).
//
// Every variant shares the base transition table in Kinetochore.cpp and
// overrides at most these four slices:
//   - parameter derivation (before the base update)
//   - post-transition adjustment (after the base update)
//   - signal emission
//   - readiness query
// Parameter derivation returns a local copy; the shared PhysicsParams
// block is never written.
// ============================================================

PhysicsParams deriveEffectivePhysics(AgentVariant v, const PhysicsParams& base);

// Returns true when the post-transition hook demotes a tensioned agent to
// relaxed this tick. Consumes randomness only when the agent is tensioned.
bool variantRequestsRelax(AgentVariant v, KinetochoreState state_after_update,
                          const PhysicsParams& physics, RandomStream& rng);

// Returns true and writes *signal when the variant replaces the base signal.
bool variantOverridesSignal(AgentVariant v, double* signal);

// Returns true and writes *ready when the variant replaces the base readiness.
bool variantOverridesReadiness(AgentVariant v, bool* ready);

} // namespace ckpt
