#include "AgentVariants.h"

#include "Kinetochore.h"

#include <algorithm>

namespace ckpt {

PhysicsParams deriveEffectivePhysics(AgentVariant v, const PhysicsParams& base) {
    PhysicsParams p = base;
    switch (v) {
        case AgentVariant::Hyperstable:
            p.detach_probability = std::clamp(base.detach_probability * base.hyperstabilization_factor, 0.0, 1.0);
            break;
        case AgentVariant::ElevatedMisattachmentRisk:
            p.misattach_probability = std::clamp(base.misattach_probability * base.merotelic_drift_multiplier, 0.0, 1.0);
            break;
        default:
            break;
    }
    return p;
}

bool variantRequestsRelax(AgentVariant v, KinetochoreState state_after_update,
                          const PhysicsParams& physics, RandomStream& rng) {
    if (v != AgentVariant::UnstableBoundary) return false;
    if (state_after_update != KinetochoreState::AttachedTensioned) return false;
    return rng.chance(physics.ctcf_instability);
}

bool variantOverridesSignal(AgentVariant v, double* signal) {
    if (v != AgentVariant::FaultySensor) return false;
    // Never inhibits, whatever the real attachment state is.
    if (signal) *signal = 0.0;
    return true;
}

bool variantOverridesReadiness(AgentVariant v, bool* ready) {
    if (v != AgentVariant::FaultySensor) return false;
    if (ready) *ready = true;
    return true;
}

} // namespace ckpt
