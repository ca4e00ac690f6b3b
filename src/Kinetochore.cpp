#include "Kinetochore.h"

#include "AgentVariants.h"

#include <algorithm>
#include <cmath>

namespace ckpt {

namespace {

// Mean of the false tension reading produced by a merotelic attachment.
constexpr double kMisattachedTensionMean = 0.5;
// Nominal tension of a correctly bi-oriented pair.
constexpr double kBiorientedTension = 1.0;

} // namespace

const char* kinetochoreStateName(KinetochoreState s) {
    switch (s) {
        case KinetochoreState::Detached: return "DETACHED";
        case KinetochoreState::AttachedRelaxed: return "RELAXED";
        case KinetochoreState::AttachedTensioned: return "TENSIONED";
        case KinetochoreState::Misattached: return "MISATTACHED";
        default: return "UNKNOWN";
    }
}

Kinetochore::Kinetochore(int uid, int pair_id, double tension_threshold, double noise_sigma, AgentVariant variant)
    : uid_(uid),
      pair_id_(pair_id),
      tension_threshold_(tension_threshold),
      noise_sigma_(noise_sigma),
      variant_(variant) {}

void Kinetochore::update(const AgentSnapshot& sibling, const PhysicsParams& physics, RandomStream& rng) {
    const PhysicsParams effective = deriveEffectivePhysics(variant_, physics);
    transition(sibling, effective, rng);

    if (variantRequestsRelax(variant_, state_, effective, rng)) {
        state_ = KinetochoreState::AttachedRelaxed;
        stability_counter_ = 0;
    }
}

double Kinetochore::emitSignal() const {
    double s = 0.0;
    if (variantOverridesSignal(variant_, &s)) return s;
    // Misattached also inhibits.
    return (state_ == KinetochoreState::AttachedTensioned) ? 0.0 : 1.0;
}

bool Kinetochore::isReady() const {
    bool ready = false;
    if (variantOverridesReadiness(variant_, &ready)) return ready;
    return state_ == KinetochoreState::AttachedTensioned;
}

void Kinetochore::detach() {
    state_ = KinetochoreState::Detached;
    tension_ = 0.0;
    stability_counter_ = 0;
    misattachment_ticks_ = 0;
}

void Kinetochore::transition(const AgentSnapshot& sibling, const PhysicsParams& physics, RandomStream& rng) {
    // 1) Stochastic attachment / detachment.
    if (state_ == KinetochoreState::Detached) {
        if (rng.chance(physics.attach_probability)) {
            if (rng.chance(physics.misattach_probability)) {
                state_ = KinetochoreState::Misattached;
                misattachment_ticks_ = 0;
            } else {
                state_ = KinetochoreState::AttachedRelaxed;
            }
        }
    } else {
        double detach_p = physics.detach_probability;
        if (state_ == KinetochoreState::Misattached) {
            detach_p *= physics.misattach_detach_multiplier;
        }
        if (rng.chance(detach_p)) {
            detach();
        }
    }

    // 2) Merotelic attachment reads a noisy false tension and never leaves
    //    through TENSIONED.
    if (state_ == KinetochoreState::Misattached) {
        ++misattachment_ticks_;
        stability_counter_ = 0;
        tension_ = std::max(0.0, rng.gaussian(kMisattachedTensionMean, noise_sigma_ * 2.0));
        return;
    }

    // 3) Tension exists only when both sisters are properly attached.
    const AgentSnapshot self = snapshot();
    if (!self.canBearTension() || !sibling.canBearTension()) {
        tension_ = 0.0;
        stability_counter_ = 0;
        return;
    }

    const double measured = std::max(0.0, rng.gaussian(kBiorientedTension, noise_sigma_));
    tension_ = measured;

    if (measured >= tension_threshold_) {
        // Stability filter: the reading must hold for a full window.
        ++stability_counter_;
        state_ = (stability_counter_ >= physics.tension_stability_window)
            ? KinetochoreState::AttachedTensioned
            : KinetochoreState::AttachedRelaxed;
        return;
    }

    stability_counter_ = 0;
    state_ = KinetochoreState::AttachedRelaxed;

    // Low tension unloads the attachment; the chance grows as tension falls
    // further below the relaxed threshold.
    const double relaxed = physics.wapl_relaxed_threshold;
    if (relaxed > 0.0 && measured < relaxed) {
        const double unload_p = physics.wapl_unload_probability * (1.0 - measured / relaxed);
        if (rng.chance(unload_p)) {
            detach();
        }
    }
}

} // namespace ckpt
