#include "Simulation.h"

#include "ConfigText.h"
#include "Digest.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace ckpt {

const char* outcomeName(MitosisOutcome o) {
    switch (o) {
        case MitosisOutcome::Running: return "RUNNING";
        case MitosisOutcome::MitoticArrest: return "MITOTIC_ARREST";
        case MitosisOutcome::Apoptosis: return "APOPTOSIS";
        case MitosisOutcome::AnaphaseCompleted: return "ANAPHASE_COMPLETED";
        default: return "UNKNOWN";
    }
}

bool isTerminal(MitosisOutcome o) {
    return o == MitosisOutcome::Apoptosis || o == MitosisOutcome::AnaphaseCompleted;
}

const char* simEventKindName(SimEventKind k) {
    switch (k) {
        case SimEventKind::MitoticArrest: return "MITOTIC_ARREST";
        case SimEventKind::Apoptosis: return "APOPTOSIS";
        case SimEventKind::AnaphaseCommitted: return "ANAPHASE";
        case SimEventKind::SafetyViolation: return "SAFETY";
        case SimEventKind::FirstMisattachment: return "MISATTACHMENT";
        default: return "UNKNOWN";
    }
}

Simulation::Simulation() {
    // Defaults always validate.
    reset(RunConfig{}, nullptr);
}

bool Simulation::reset(const RunConfig& cfg, ConfigError* err) {
    if (!validateConfig(cfg, err)) {
        return false;
    }

    config_ = cfg;
    buildPopulation();

    bus_.reset(config_.bus);
    controller_.reset(config_.bus.apc_activation_threshold);
    monitor_.clear();

    outcome_ = MitosisOutcome::Running;
    arrested_ = false;
    budget_exhausted_ = false;
    next_tick_ = 0;
    last_tick_ = lastTickBudget(config_.limits);
    commit_tick_ = -1;
    arrest_tick_ = -1;
    outcome_tick_ = -1;
    events_.clear();

    last_obs_ = TickObservation{};
    last_obs_.bus_concentration = bus_.concentration();
    last_obs_.agent_count = static_cast<int>(agents_.size());

    run_signatures_ = RunSignatures{};
    run_signatures_.run_param_hash_u32 = hashRunConfig(config_);
    latest_events_bits_ = 0;
    seen_misattachment_ = false;
    prev_all_ready_ = false;

    telemetry_head_ = 0;
    telemetry_count_ = 0;
    return true;
}

void Simulation::buildPopulation() {
    const int n = config_.population.agentCount();
    agents_.clear();
    streams_.clear();
    agents_.reserve(static_cast<std::size_t>(n));
    streams_.reserve(static_cast<std::size_t>(n));

    for (int uid = 0; uid < n; ++uid) {
        const int pair_id = uid / 2;
        agents_.emplace_back(uid, pair_id,
                             config_.physics.tension_threshold,
                             config_.physics.noise_level,
                             config_.variants.variantForPair(pair_id));
        streams_.emplace_back(deriveAgentSeed(config_.seed_u32, uid));
    }
}

void Simulation::updatePair(std::size_t first) {
    Kinetochore& a = agents_[first];
    Kinetochore& b = agents_[first + 1];
    const PhysicsParams& physics = config_.physics;

    if (config_.sibling_policy == SiblingPolicy::Sequential) {
        a.update(b.snapshot(), physics, streams_[first]);
        b.update(a.snapshot(), physics, streams_[first + 1]);
        return;
    }

    const AgentSnapshot sa = a.snapshot();
    const AgentSnapshot sb = b.snapshot();
    a.update(sb, physics, streams_[first]);
    b.update(sa, physics, streams_[first + 1]);
}

bool Simulation::step() {
    if (finished()) return false;

    const int tick = next_tick_;
    const int agent_count = static_cast<int>(agents_.size());
    std::uint32_t events = 0u;

    // --------------------
    // A) Agents, fixed pair order
    // --------------------
    double total_flux = 0.0;
    int ready_count = 0;
    int misattached_count = 0;
    for (std::size_t i = 0; i + 1 < agents_.size(); i += 2) {
        updatePair(i);
        for (std::size_t k = i; k < i + 2; ++k) {
            const Kinetochore& a = agents_[k];
            total_flux += a.emitSignal();
            if (a.isReady()) ++ready_count;
            if (a.isMisattached()) {
                ++misattached_count;
                monitor_.logMisattachment(tick, a.uid());
                if (!seen_misattachment_) {
                    seen_misattachment_ = true;
                    events |= Event_FirstMisattachment;
                    char buf[96];
                    std::snprintf(buf, sizeof(buf), "first misattachment: agent %d (pair %d)", a.uid(), a.pairId());
                    logEvent(tick, SimEventKind::FirstMisattachment, buf);
                }
            }
        }
    }

    // --------------------
    // B) Serialization point: bus -> controller -> monitor
    // --------------------
    bus_.update(total_flux);
    const bool was_committed = controller_.committed();
    const bool committed = controller_.evaluate(bus_.concentration());
    if (committed && !was_committed) commit_tick_ = tick;

    const bool all_ready = (ready_count == agent_count);
    const std::size_t violations_before = monitor_.violations().size();
    monitor_.check(tick, all_ready, committed, misattached_count);
    const std::vector<ViolationRecord>& violations = monitor_.violations();
    for (std::size_t i = violations_before; i < violations.size(); ++i) {
        const ViolationRecord& v = violations[i];
        events |= (v.kind == ViolationKind::CommitWithoutReadiness) ? Warn_CommitWithoutReadiness
                                                                   : Warn_CommitWithMisattachment;
        logEvent(tick, SimEventKind::SafetyViolation, v.message);
    }

    if (all_ready && !prev_all_ready_) events |= Event_AllReady;
    prev_all_ready_ = all_ready;

    // --------------------
    // C) Timeout policy and commit
    // --------------------
    const MitosisOutcome before = outcome_;
    const bool arrested_before = arrested_;
    applyOutcomePolicy(tick, committed, ready_count);
    if (arrested_ && !arrested_before) events |= Event_MitoticArrest;
    if (outcome_ != before) {
        if (outcome_ == MitosisOutcome::Apoptosis) events |= Event_Apoptosis;
        if (outcome_ == MitosisOutcome::AnaphaseCompleted) events |= Event_AnaphaseCommitted;
    }

    // --------------------
    // D) Bookkeeping
    // --------------------
    TickObservation obs;
    obs.tick = tick;
    obs.bus_concentration = bus_.concentration();
    obs.total_flux = total_flux;
    obs.ready_count = ready_count;
    obs.agent_count = agent_count;
    obs.misattached_count = misattached_count;
    obs.arrested = arrested_;
    obs.committed = committed;
    obs.outcome = outcome_;
    obs.violations_this_tick = static_cast<int>(violations.size() - violations_before);
    last_obs_ = obs;

    if (tick % config_.telemetry_every == 0) {
        pushTelemetry(obs);
    }
    foldStateDigest(tick);

    next_tick_ = tick + 1;
    if (!isTerminal(outcome_) && tick >= last_tick_) {
        budget_exhausted_ = true;
        events |= Event_BudgetExhausted;
    }

    latest_events_bits_ |= events;
    return true;
}

void Simulation::applyOutcomePolicy(int tick, bool committed, int ready_count) {
    const LimitsConfig& lim = config_.limits;
    char buf[160];

    if (!arrested_ && !committed && tick >= lim.max_mitosis_time) {
        arrested_ = true;
        arrest_tick_ = tick;
        outcome_ = MitosisOutcome::MitoticArrest;
        std::snprintf(buf, sizeof(buf), "mitosis arrested at tick %d: ready %d/%d, MCC %.2f",
                      tick, ready_count, static_cast<int>(agents_.size()), bus_.concentration());
        logEvent(tick, SimEventKind::MitoticArrest, buf);
    }

    if (tick >= lim.apoptosis_threshold) {
        outcome_ = MitosisOutcome::Apoptosis;
        outcome_tick_ = tick;
        std::snprintf(buf, sizeof(buf), "apoptosis at tick %d: mitosis exceeded maximum safe duration", tick);
        logEvent(tick, SimEventKind::Apoptosis, buf);
        return;
    }

    if (committed) {
        outcome_ = MitosisOutcome::AnaphaseCompleted;
        outcome_tick_ = tick;
        std::snprintf(buf, sizeof(buf), "anaphase triggered at tick %d (MCC %.4f < %.4f)",
                      tick, bus_.concentration(), controller_.activationThreshold());
        logEvent(tick, SimEventKind::AnaphaseCommitted, buf);
    }
}

MitosisOutcome Simulation::run() {
    while (step()) {
    }
    return outcome_;
}

void Simulation::logEvent(int tick, SimEventKind kind, const std::string& text) {
    events_.push_back(SimEvent{tick, kind, text});
}

void Simulation::pushTelemetry(const TickObservation& obs) {
    TelemetrySampleV1 s{};
    s.tick_u32 = static_cast<std::uint32_t>(obs.tick);
    s.mcc_concentration = static_cast<float>(obs.bus_concentration);
    s.total_flux = static_cast<float>(obs.total_flux);
    s.ready_u32 = static_cast<std::uint32_t>(obs.ready_count);
    s.misattached_u32 = static_cast<std::uint32_t>(obs.misattached_count);
    if (obs.committed) s.flags_u32 |= Flag_Committed;
    if (obs.arrested) s.flags_u32 |= Flag_Arrested;
    if (obs.ready_count == obs.agent_count) s.flags_u32 |= Flag_AllReady;

    telemetry_rb_[telemetry_head_] = s;
    telemetry_head_ = (telemetry_head_ + 1) % kTelemetryCapacity_;
    if (telemetry_count_ < kTelemetryCapacity_) telemetry_count_++;

    std::uint32_t crc = run_signatures_.telemetry_crc_u32;
    crc = crc32_add_u32(crc, s.tick_u32);
    crc = crc32_add_f32(crc, s.mcc_concentration);
    crc = crc32_add_f32(crc, s.total_flux);
    crc = crc32_add_u32(crc, s.ready_u32);
    crc = crc32_add_u32(crc, s.misattached_u32);
    crc = crc32_add_u32(crc, s.flags_u32);
    run_signatures_.telemetry_crc_u32 = crc;
}

void Simulation::foldStateDigest(int tick) {
    std::uint32_t h = run_signatures_.state_digest_u32;
    if (h == 0) h = fnv1a32_begin();
    h = fnv1a32_add_i32(h, tick);
    h = fnv1a32_add_f32(h, static_cast<float>(bus_.concentration()));
    for (const Kinetochore& a : agents_) {
        h = fnv1a32_add_i32(h, static_cast<std::int32_t>(a.state()));
        h = fnv1a32_add_i32(h, a.stabilityCounter());
        h = fnv1a32_add_f32(h, static_cast<float>(a.tension()));
    }
    run_signatures_.state_digest_u32 = h;
}

std::uint32_t Simulation::getLatestEvents() {
    const std::uint32_t out = latest_events_bits_;
    latest_events_bits_ = 0;
    return out;
}

int Simulation::getTelemetrySamples(TelemetrySampleV1* out_ptr, int cap) const {
    if (!out_ptr || cap <= 0) return 0;
    const int n = std::min<int>(telemetry_count_, cap);
    // Oldest sample index = head - count (mod capacity)
    int idx = (telemetry_head_ - telemetry_count_);
    while (idx < 0) idx += kTelemetryCapacity_;
    for (int i = 0; i < n; ++i) {
        out_ptr[i] = telemetry_rb_[(idx + i) % kTelemetryCapacity_];
    }
    return n;
}

int Simulation::exportConfigText(char* buf, int cap) const {
    return ckpt::exportConfigText(config_, buf, cap);
}

} // namespace ckpt
