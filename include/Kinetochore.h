#pragma once

#include <cstdint>

#include "CheckpointConfig.h"
#include "Random.h"

namespace ckpt {

enum class KinetochoreState : int {
    Detached = 0,
    AttachedRelaxed = 1,
    AttachedTensioned = 2,
    Misattached = 3, // merotelic: bound to both poles at once
};

const char* kinetochoreStateName(KinetochoreState s);

// Immutable view of an agent, used as the sibling input to update().
struct AgentSnapshot {
    KinetochoreState state = KinetochoreState::Detached;
    double tension = 0.0;

    // Attached and not misattached: the only states that can carry tension.
    bool canBearTension() const {
        return state == KinetochoreState::AttachedRelaxed || state == KinetochoreState::AttachedTensioned;
    }
};

// One sensor agent. The transition table lives here; variant behavior is
// layered on through the hooks in AgentVariants.h, selected by the variant tag.
class Kinetochore {
public:
    Kinetochore(int uid, int pair_id, double tension_threshold, double noise_sigma,
                AgentVariant variant = AgentVariant::None);

    // One tick. Reads only the sibling snapshot, the shared physics block and
    // this agent's own stream; writes only this agent.
    void update(const AgentSnapshot& sibling, const PhysicsParams& physics, RandomStream& rng);

    // 0.0 when tension is satisfied, 1.0 (full inhibition) otherwise.
    double emitSignal() const;
    bool isReady() const;
    bool isMisattached() const noexcept { return state_ == KinetochoreState::Misattached; }

    AgentSnapshot snapshot() const { return AgentSnapshot{state_, tension_}; }

    int uid() const noexcept { return uid_; }
    int pairId() const noexcept { return pair_id_; }
    AgentVariant variant() const noexcept { return variant_; }
    KinetochoreState state() const noexcept { return state_; }
    double tension() const noexcept { return tension_; }
    double tensionThreshold() const noexcept { return tension_threshold_; }
    int stabilityCounter() const noexcept { return stability_counter_; }
    int misattachmentDuration() const noexcept { return misattachment_ticks_; }

private:
    void transition(const AgentSnapshot& sibling, const PhysicsParams& physics, RandomStream& rng);
    void detach();

    int uid_ = 0;
    int pair_id_ = 0;
    double tension_threshold_ = 0.8;
    double noise_sigma_ = 0.1;
    AgentVariant variant_ = AgentVariant::None;

    KinetochoreState state_ = KinetochoreState::Detached;
    double tension_ = 0.0;
    int stability_counter_ = 0;   // consecutive ticks at or above threshold
    int misattachment_ticks_ = 0; // ticks spent misattached since attaching
};

} // namespace ckpt
