#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "AgentVariants.h"
#include "CommitController.h"
#include "Kinetochore.h"
#include "SafetyMonitor.h"
#include "Scenarios.h"
#include "SignalBus.h"
#include "Simulation.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_FINITE(double x, const char* name) {
    if (!std::isfinite(x)) {
        std::cerr << "[FAIL] Non-finite: " << name << " = " << x << "\n";
        std::exit(1);
    }
}

static void requireExact(const char* label, double a, double b) {
    REQUIRE_FINITE(a, label);
    REQUIRE_FINITE(b, label);
    if (!(a == b)) {
        std::cerr << "[FAIL] " << label << " mismatch: a=" << a << " b=" << b << "\n";
        std::exit(1);
    }
}

static void requireObservationExact(const char* context,
                                    const ckpt::TickObservation& a,
                                    const ckpt::TickObservation& b) {
    const std::string prefix = std::string(context) + ": ";
    REQUIRE(a.tick == b.tick, prefix + "tick");
    requireExact((prefix + "bus_concentration").c_str(), a.bus_concentration, b.bus_concentration);
    requireExact((prefix + "total_flux").c_str(), a.total_flux, b.total_flux);
    REQUIRE(a.ready_count == b.ready_count, prefix + "ready_count");
    REQUIRE(a.agent_count == b.agent_count, prefix + "agent_count");
    REQUIRE(a.misattached_count == b.misattached_count, prefix + "misattached_count");
    REQUIRE(a.arrested == b.arrested, prefix + "arrested");
    REQUIRE(a.committed == b.committed, prefix + "committed");
    REQUIRE(a.outcome == b.outcome, prefix + "outcome");
    REQUIRE(a.violations_this_tick == b.violations_this_tick, prefix + "violations_this_tick");
}

// Exact physics: attach always, never detach, noise-free readings.
static ckpt::PhysicsParams exactPhysics() {
    ckpt::PhysicsParams p;
    p.attach_probability = 1.0;
    p.detach_probability = 0.0;
    p.misattach_probability = 0.0;
    p.noise_level = 0.0;
    p.tension_threshold = 0.9;
    p.tension_stability_window = 3;
    return p;
}

static ckpt::AgentSnapshot relaxedSibling() {
    ckpt::AgentSnapshot s;
    s.state = ckpt::KinetochoreState::AttachedRelaxed;
    s.tension = 1.0;
    return s;
}

/* =======================
 * Components
 * ======================= */

static void runCommitLatch_1A() {
    ckpt::CommitController c(1.0);
    REQUIRE(!c.committed(), "1A: latch set at construction");
    REQUIRE(!c.evaluate(2.0), "1A: committed above threshold");
    REQUIRE(!c.evaluate(1.0), "1A: committed at threshold (must be strictly below)");
    REQUIRE(!c.evaluate(std::numeric_limits<double>::quiet_NaN()), "1A: NaN committed");
    REQUIRE(c.evaluate(0.999), "1A: not committed below threshold");

    // Once set, the latch ignores every later level.
    REQUIRE(c.evaluate(100.0), "1A: latch cleared by high level");
    REQUIRE(c.evaluate(std::numeric_limits<double>::quiet_NaN()), "1A: latch cleared by NaN");
    REQUIRE(c.committed(), "1A: committed() disagrees with evaluate()");

    c.reset(0.5);
    REQUIRE(!c.committed(), "1A: reset did not clear latch");
    requireExact("1A: threshold after reset", c.activationThreshold(), 0.5);
    REQUIRE(!c.evaluate(0.7), "1A: new threshold ignored");
}

static void runSignalBusIntegrator_1B() {
    ckpt::BusParams p;
    p.initial_concentration = 10.0;
    p.mcc_production_rate = 2.0;
    p.mcc_degradation_rate = 0.25;

    ckpt::SignalBus bus(p);
    requireExact("1B: initial", bus.concentration(), 10.0);

    bus.update(3.0);
    requireExact("1B: decay + production", bus.concentration(), 13.5);

    bus.update(-5.0);
    requireExact("1B: negative flux treated as zero", bus.concentration(), 10.125);

    bus.update(std::numeric_limits<double>::quiet_NaN());
    requireExact("1B: NaN flux treated as zero", bus.concentration(), 7.59375);

    p.mcc_degradation_rate = 1.0;
    bus.reset(p);
    requireExact("1B: reset restores initial", bus.concentration(), 10.0);
    bus.update(0.0);
    requireExact("1B: full degradation", bus.concentration(), 0.0);

    p.initial_concentration = -4.0;
    bus.reset(p);
    requireExact("1B: negative initial clamped", bus.concentration(), 0.0);

    // Constant flux converges to flux * production / degradation.
    ckpt::BusParams q;
    q.initial_concentration = 0.0;
    q.mcc_production_rate = 1.0;
    q.mcc_degradation_rate = 0.5;
    ckpt::SignalBus steady(q);
    for (int i = 0; i < 200; ++i) steady.update(2.0);
    REQUIRE(std::abs(steady.concentration() - 4.0) < 1e-9, "1B: steady state != 4");
}

static void runMonitorTruthTable_1C() {
    for (int ready = 0; ready < 2; ++ready) {
        for (int committed = 0; committed < 2; ++committed) {
            for (int mis = 0; mis < 2; ++mis) {
                ckpt::SafetyMonitor m;
                const int misattached = mis ? 2 : 0;
                const bool ok = m.check(7, ready != 0, committed != 0, misattached);

                int expected = 0;
                if (committed && !ready) ++expected;
                if (committed && mis) ++expected;

                REQUIRE(static_cast<int>(m.violations().size()) == expected, "1C: violation count");
                REQUIRE(ok == (expected == 0), "1C: check() return value");
                REQUIRE(m.passed() == (expected == 0), "1C: passed()");

                const ckpt::SafetyReport r = m.summarize();
                REQUIRE(r.violation_count == expected, "1C: summary count");
                REQUIRE(r.commit_without_readiness == ((committed && !ready) ? 1 : 0), "1C: A count");
                REQUIRE(r.commit_with_misattachment == ((committed && mis) ? 1 : 0), "1C: B count");
                REQUIRE(r.first_violation_tick == (expected > 0 ? 7 : -1), "1C: first violation tick");
                for (const auto& v : m.violations()) {
                    REQUIRE(v.tick == 7, "1C: violation tick");
                    REQUIRE(v.message.find("[SAFETY VIOLATION] Tick 7") == 0, "1C: message prefix");
                }
            }
        }
    }

    // Both properties broken on one tick: A is recorded before B.
    ckpt::SafetyMonitor m;
    m.check(3, false, true, 4);
    REQUIRE(m.violations().size() == 2, "1C: A and B not both recorded");
    REQUIRE(m.violations()[0].kind == ckpt::ViolationKind::CommitWithoutReadiness, "1C: A not first");
    REQUIRE(m.violations()[1].kind == ckpt::ViolationKind::CommitWithMisattachment, "1C: B not second");
    REQUIRE(m.violations()[1].message.find("4 MISATTACHED") != std::string::npos, "1C: B message count");

    m.logMisattachment(1, 5);
    m.logMisattachment(2, 5);
    m.logMisattachment(2, 9);
    const ckpt::SafetyReport r = m.summarize();
    REQUIRE(r.misattachment_event_count == 3, "1C: misattachment events");
    REQUIRE(r.affected_agent_count == 2, "1C: affected agents");

    m.clear();
    REQUIRE(m.passed() && m.misattachmentEvents().empty(), "1C: clear()");
}

/* =======================
 * Agent transition table
 * ======================= */

static void runAgentAttachAndStabilityWindow_2A() {
    const ckpt::PhysicsParams ph = exactPhysics();
    ckpt::RandomStream rng(42u);
    ckpt::Kinetochore k(0, 0, ph.tension_threshold, ph.noise_level);

    REQUIRE(k.state() == ckpt::KinetochoreState::Detached, "2A: initial state");
    REQUIRE(k.emitSignal() == 1.0, "2A: detached must inhibit");
    REQUIRE(!k.isReady(), "2A: detached ready");

    // Attaches and reads tension in the same tick; counter 1..3, TENSIONED at 3.
    for (int t = 1; t <= 3; ++t) {
        k.update(relaxedSibling(), ph, rng);
        REQUIRE(k.stabilityCounter() == t, "2A: counter did not advance");
        requireExact("2A: noise-free tension", k.tension(), 1.0);
        if (t < 3) {
            REQUIRE(k.state() == ckpt::KinetochoreState::AttachedRelaxed, "2A: tensioned before window");
            REQUIRE(k.emitSignal() == 1.0, "2A: relaxed must inhibit");
        }
    }
    REQUIRE(k.state() == ckpt::KinetochoreState::AttachedTensioned, "2A: not tensioned after window");
    REQUIRE(k.emitSignal() == 0.0, "2A: tensioned inhibits");
    REQUIRE(k.isReady(), "2A: tensioned not ready");

    // Sibling loses its attachment: tension and counter clear, the state holds.
    ckpt::AgentSnapshot gone;
    k.update(gone, ph, rng);
    REQUIRE(k.state() == ckpt::KinetochoreState::AttachedTensioned, "2A: state changed without sibling");
    REQUIRE(k.isReady(), "2A: ready lost with sibling");
    REQUIRE(k.emitSignal() == 0.0, "2A: signal changed with sibling");
    REQUIRE(k.stabilityCounter() == 0, "2A: counter not reset");
    requireExact("2A: tension without sibling", k.tension(), 0.0);

    // A misattached sibling is not eligible either.
    ckpt::AgentSnapshot merotelic;
    merotelic.state = ckpt::KinetochoreState::Misattached;
    merotelic.tension = 0.5;
    k.update(merotelic, ph, rng);
    REQUIRE(k.state() == ckpt::KinetochoreState::AttachedTensioned, "2A: state changed with merotelic sibling");
    REQUIRE(k.stabilityCounter() == 0, "2A: counter with merotelic sibling");

    // Sibling back: the window restarts from 1, so the agent is RELAXED again.
    k.update(relaxedSibling(), ph, rng);
    REQUIRE(k.stabilityCounter() == 1, "2A: counter after sibling returns");
    REQUIRE(k.state() == ckpt::KinetochoreState::AttachedRelaxed, "2A: window not restarted");
}

static void runAgentCounterResetBelowThreshold_2B() {
    const ckpt::PhysicsParams ph = exactPhysics();
    ckpt::RandomStream rng(7u);

    // Threshold above the noise-free reading: the counter never advances.
    ckpt::Kinetochore strict(1, 0, 1.5, 0.0);
    strict.update(relaxedSibling(), ph, rng);
    REQUIRE(strict.state() == ckpt::KinetochoreState::AttachedRelaxed, "2B: strict agent state");
    REQUIRE(strict.stabilityCounter() == 0, "2B: counter advanced below threshold");
    for (int i = 0; i < 20; ++i) strict.update(relaxedSibling(), ph, rng);
    REQUIRE(strict.state() == ckpt::KinetochoreState::AttachedRelaxed, "2B: strict agent left RELAXED");
}

static void runAgentMisattachmentIsolation_2C() {
    ckpt::PhysicsParams ph = exactPhysics();
    ph.misattach_probability = 1.0;
    ckpt::RandomStream rng(11u);
    ckpt::Kinetochore k(0, 0, ph.tension_threshold, ph.noise_level);

    ckpt::AgentSnapshot tensioned;
    tensioned.state = ckpt::KinetochoreState::AttachedTensioned;
    tensioned.tension = 1.0;

    for (int t = 1; t <= 50; ++t) {
        k.update(tensioned, ph, rng);
        REQUIRE(k.state() == ckpt::KinetochoreState::Misattached, "2C: misattached agent escaped");
        REQUIRE(k.isMisattached(), "2C: isMisattached()");
        REQUIRE(k.stabilityCounter() == 0, "2C: misattached counter non-zero");
        requireExact("2C: false tension reading", k.tension(), 0.5);
        REQUIRE(k.misattachmentDuration() == t, "2C: duration");
        REQUIRE(k.emitSignal() == 1.0, "2C: misattached must inhibit");
        REQUIRE(!k.isReady(), "2C: misattached ready");
    }

    // Sibling of a misattached agent cannot build tension.
    ckpt::Kinetochore sib(1, 0, ph.tension_threshold, ph.noise_level);
    ckpt::PhysicsParams clean = exactPhysics();
    for (int i = 0; i < 5; ++i) sib.update(k.snapshot(), clean, rng);
    REQUIRE(sib.state() == ckpt::KinetochoreState::AttachedRelaxed, "2C: sibling tensioned against misattachment");
    REQUIRE(sib.stabilityCounter() == 0, "2C: sibling counter advanced");
}

static void runAgentLowTensionUnload_2D() {
    ckpt::PhysicsParams ph = exactPhysics();
    ph.tension_threshold = 2.0;
    ph.wapl_relaxed_threshold = 2.0;
    ph.wapl_unload_probability = 1.0; // reading 1.0 -> unload chance 0.5
    ckpt::RandomStream rng(99u);

    int unloaded = 0;
    int kept = 0;
    for (int i = 0; i < 200; ++i) {
        ckpt::Kinetochore k(0, 0, ph.tension_threshold, ph.noise_level);
        k.update(relaxedSibling(), ph, rng);
        if (k.state() == ckpt::KinetochoreState::Detached) {
            ++unloaded;
            REQUIRE(k.stabilityCounter() == 0 && k.tension() == 0.0, "2D: detach did not clear state");
        } else {
            REQUIRE(k.state() == ckpt::KinetochoreState::AttachedRelaxed, "2D: unexpected state");
            ++kept;
        }
    }
    REQUIRE(unloaded > 0, "2D: low tension never unloaded");
    REQUIRE(kept > 0, "2D: low tension always unloaded");
}

/* =======================
 * Variants
 * ======================= */

static void runVariantDerivation_3A() {
    ckpt::PhysicsParams base;
    base.detach_probability = 0.02;
    base.hyperstabilization_factor = 0.1;
    base.misattach_probability = 0.3;
    base.merotelic_drift_multiplier = 5.0;
    const ckpt::PhysicsParams before = base;

    const ckpt::PhysicsParams hyper = ckpt::deriveEffectivePhysics(ckpt::AgentVariant::Hyperstable, base);
    REQUIRE(std::abs(hyper.detach_probability - 0.002) < 1e-15, "3A: hyperstable detach");
    requireExact("3A: hyperstable misattach untouched", hyper.misattach_probability, 0.3);

    const ckpt::PhysicsParams drift = ckpt::deriveEffectivePhysics(ckpt::AgentVariant::ElevatedMisattachmentRisk, base);
    requireExact("3A: drift clamped to 1", drift.misattach_probability, 1.0);
    requireExact("3A: drift detach untouched", drift.detach_probability, 0.02);

    const ckpt::PhysicsParams none = ckpt::deriveEffectivePhysics(ckpt::AgentVariant::None, base);
    requireExact("3A: none detach", none.detach_probability, base.detach_probability);
    requireExact("3A: none misattach", none.misattach_probability, base.misattach_probability);

    requireExact("3A: base detach mutated", base.detach_probability, before.detach_probability);
    requireExact("3A: base misattach mutated", base.misattach_probability, before.misattach_probability);
}

static void runFaultySensor_3B() {
    const ckpt::PhysicsParams ph = exactPhysics();
    ckpt::RandomStream rng(5u);
    ckpt::Kinetochore k(0, 0, ph.tension_threshold, ph.noise_level, ckpt::AgentVariant::FaultySensor);

    REQUIRE(k.state() == ckpt::KinetochoreState::Detached, "3B: initial state");
    REQUIRE(k.emitSignal() == 0.0, "3B: faulty sensor emitted while detached");
    REQUIRE(k.isReady(), "3B: faulty sensor not ready while detached");

    // Real state still evolves underneath.
    k.update(ckpt::AgentSnapshot{}, ph, rng);
    REQUIRE(k.state() == ckpt::KinetochoreState::AttachedRelaxed, "3B: faulty sensor state frozen");
    REQUIRE(k.emitSignal() == 0.0 && k.isReady(), "3B: override lost after update");
}

static void runUnstableBoundary_3C() {
    ckpt::PhysicsParams ph = exactPhysics();
    ph.tension_stability_window = 1;
    ph.ctcf_instability = 1.0;
    ckpt::RandomStream rng(3u);
    ckpt::Kinetochore k(0, 0, ph.tension_threshold, ph.noise_level, ckpt::AgentVariant::UnstableBoundary);

    for (int i = 0; i < 30; ++i) {
        k.update(relaxedSibling(), ph, rng);
        REQUIRE(k.state() == ckpt::KinetochoreState::AttachedRelaxed, "3C: unstable boundary held tension");
        REQUIRE(k.stabilityCounter() == 0, "3C: counter survived relax");
        REQUIRE(!k.isReady(), "3C: ready without tension");
    }
}

static void runHyperstable_3D() {
    ckpt::PhysicsParams ph = exactPhysics();
    ph.detach_probability = 1.0;
    ph.hyperstabilization_factor = 0.0;
    ckpt::RandomStream rng(8u);
    ckpt::Kinetochore hyper(0, 0, ph.tension_threshold, ph.noise_level, ckpt::AgentVariant::Hyperstable);
    ckpt::Kinetochore plain(1, 0, ph.tension_threshold, ph.noise_level);

    hyper.update(relaxedSibling(), ph, rng);
    plain.update(relaxedSibling(), ph, rng);
    for (int i = 0; i < 20; ++i) {
        hyper.update(relaxedSibling(), ph, rng);
        plain.update(relaxedSibling(), ph, rng);
        REQUIRE(hyper.state() != ckpt::KinetochoreState::Detached, "3D: hyperstable detached");
        REQUIRE(plain.state() != ckpt::KinetochoreState::AttachedTensioned, "3D: plain agent kept attachment");
    }
}

/* =======================
 * Orchestrator
 * ======================= */

static void runNormalCommitTrace_4A() {
    ckpt::Simulation sim;
    REQUIRE(sim.reset(ckpt::makeScenarioConfig(ckpt::ScenarioId::NormalCommit)), "4A: reset failed");
    REQUIRE(sim.observe().tick == -1, "4A: observation before first step");

    const double bus[5] = {2.0, 3.0, 3.5, 1.75, 0.875};
    const int ready[5] = {0, 0, 0, 2, 2};
    for (int t = 0; t < 5; ++t) {
        REQUIRE(sim.step(), "4A: step refused before commit");
        const ckpt::TickObservation o = sim.observe();
        REQUIRE(o.tick == t, "4A: tick");
        requireExact("4A: bus trace", o.bus_concentration, bus[t]);
        REQUIRE(o.ready_count == ready[t], "4A: ready trace");
        REQUIRE(o.committed == (t == 4), "4A: commit tick");
    }

    REQUIRE(sim.outcome() == ckpt::MitosisOutcome::AnaphaseCompleted, "4A: outcome");
    REQUIRE(sim.finished() && !sim.budgetExhausted(), "4A: finished flags");
    REQUIRE(sim.commitTick() == 4 && sim.outcomeTick() == 4, "4A: commit/outcome tick");
    REQUIRE(sim.monitor().passed(), "4A: safety violation in healthy run");

    // Terminal: further steps are no-ops.
    const ckpt::TickObservation before = sim.observe();
    const ckpt::RunSignatures sig = sim.getRunSignatures();
    REQUIRE(!sim.step(), "4A: step after terminal outcome");
    requireObservationExact("4A: terminal no-op", before, sim.observe());
    REQUIRE(sim.getRunSignatures().state_digest_u32 == sig.state_digest_u32, "4A: digest changed after terminal");
    REQUIRE(sim.run() == ckpt::MitosisOutcome::AnaphaseCompleted, "4A: run() after terminal");
}

static void runFaultInjection_4B() {
    ckpt::Simulation sim;
    REQUIRE(sim.reset(ckpt::makeScenarioConfig(ckpt::ScenarioId::FaultInjection)), "4B: reset failed");
    REQUIRE(sim.run() == ckpt::MitosisOutcome::AnaphaseCompleted, "4B: outcome");
    REQUIRE(sim.commitTick() == 0, "4B: commit tick");

    const ckpt::TickObservation o = sim.observe();
    requireExact("4B: bus at commit", o.bus_concentration, 2.0);
    REQUIRE(o.ready_count == 2 && o.agent_count == 4, "4B: ready count (faulty pair only)");
    REQUIRE(o.violations_this_tick == 1, "4B: violations this tick");

    const auto& v = sim.monitor().violations();
    REQUIRE(v.size() == 1, "4B: violation count");
    REQUIRE(v[0].tick == 0 && v[0].kind == ckpt::ViolationKind::CommitWithoutReadiness, "4B: violation kind");

    bool logged = false;
    for (const auto& e : sim.events()) {
        if (e.kind == ckpt::SimEventKind::SafetyViolation) logged = true;
    }
    REQUIRE(logged, "4B: violation not in event log");

    const std::uint32_t bits = sim.getLatestEvents();
    REQUIRE((bits & ckpt::Warn_CommitWithoutReadiness) != 0, "4B: warn bit");
    REQUIRE((bits & ckpt::Warn_CommitWithMisattachment) == 0, "4B: spurious B bit");
    REQUIRE((bits & ckpt::Event_AnaphaseCommitted) != 0, "4B: commit bit");
}

static void runPermanentMisattachment_4C() {
    const ckpt::RunConfig cfg = ckpt::makeScenarioConfig(ckpt::ScenarioId::PermanentMisattachment);
    ckpt::Simulation sim;
    REQUIRE(sim.reset(cfg), "4C: reset failed");
    REQUIRE(sim.lastTick() == cfg.limits.apoptosis_threshold, "4C: tick budget");

    bool prev_committed = false;
    while (sim.step()) {
        const ckpt::TickObservation o = sim.observe();
        REQUIRE(!o.committed, "4C: committed with a permanent misattachment");
        REQUIRE(o.misattached_count >= 2, "4C: pair 1 not misattached");
        REQUIRE(o.bus_concentration >= 2.0, "4C: bus fell below pair-1 floor");
        REQUIRE(o.arrested == (o.tick >= cfg.limits.max_mitosis_time), "4C: arrest flag");
        if (o.tick >= cfg.limits.max_mitosis_time && o.tick < cfg.limits.apoptosis_threshold) {
            REQUIRE(o.outcome == ckpt::MitosisOutcome::MitoticArrest, "4C: arrest is not a stop");
        }
        REQUIRE(!(prev_committed && !o.committed), "4C: latch regressed");
        prev_committed = o.committed;
    }

    REQUIRE(sim.outcome() == ckpt::MitosisOutcome::Apoptosis, "4C: outcome");
    REQUIRE(sim.arrestTick() == cfg.limits.max_mitosis_time, "4C: arrest tick");
    REQUIRE(sim.outcomeTick() == cfg.limits.apoptosis_threshold, "4C: apoptosis tick");
    REQUIRE(sim.commitTick() == -1, "4C: commit tick");
    REQUIRE(sim.monitor().passed(), "4C: violation without commit");

    const ckpt::SafetyReport r = sim.monitor().summarize();
    REQUIRE(r.misattachment_event_count >= 2 * (cfg.limits.apoptosis_threshold + 1), "4C: misattachment events");
    REQUIRE(r.affected_agent_count >= 2, "4C: affected agents");

    const auto& ev = sim.events();
    REQUIRE(!ev.empty() && ev.front().kind == ckpt::SimEventKind::FirstMisattachment, "4C: first event");
    REQUIRE(ev.front().tick == 0, "4C: first misattachment tick");
    int first_misattachment = 0;
    for (const auto& e : ev) {
        if (e.kind == ckpt::SimEventKind::FirstMisattachment) ++first_misattachment;
    }
    REQUIRE(first_misattachment == 1, "4C: first misattachment logged more than once");

    // The base misattach rate also reaches pair 0, once per agent at its
    // tick-0 attach. Whatever pair 0 does, pair 1 alone fixes the outcome.
    for (std::uint32_t seed = 1; seed <= 16; ++seed) {
        ckpt::RunConfig seeded = cfg;
        seeded.seed_u32 = seed;
        ckpt::Simulation s2;
        REQUIRE(s2.reset(seeded), "4C: seeded reset failed");
        REQUIRE(s2.run() == ckpt::MitosisOutcome::Apoptosis, "4C: seeded outcome");
        REQUIRE(s2.arrestTick() == seeded.limits.max_mitosis_time, "4C: seeded arrest tick");
        REQUIRE(s2.outcomeTick() == seeded.limits.apoptosis_threshold, "4C: seeded apoptosis tick");
        REQUIRE(s2.commitTick() == -1, "4C: seeded commit");
        const auto& agents = s2.agents();
        REQUIRE(agents[2].isMisattached() && agents[3].isMisattached(), "4C: pair 1 left misattachment");
        REQUIRE(s2.observe().misattached_count >= 2 && s2.observe().misattached_count <= 4, "4C: seeded count");
    }
}

static void runCoincidentThresholds_4D() {
    const ckpt::RunConfig cfg = ckpt::makeScenarioConfig(ckpt::ScenarioId::CoincidentThresholds);
    ckpt::Simulation sim;
    REQUIRE(sim.reset(cfg), "4D: reset failed");
    REQUIRE(sim.run() == ckpt::MitosisOutcome::Apoptosis, "4D: outcome");
    REQUIRE(sim.arrestTick() == 120 && sim.outcomeTick() == 120, "4D: ticks");
    REQUIRE(sim.observe().arrested, "4D: arrest flag missing on final tick");

    int arrest_idx = -1;
    int apoptosis_idx = -1;
    const auto& ev = sim.events();
    for (int i = 0; i < static_cast<int>(ev.size()); ++i) {
        if (ev[i].kind == ckpt::SimEventKind::MitoticArrest) arrest_idx = i;
        if (ev[i].kind == ckpt::SimEventKind::Apoptosis) apoptosis_idx = i;
    }
    REQUIRE(arrest_idx >= 0 && apoptosis_idx > arrest_idx, "4D: arrest must be logged before apoptosis");
    REQUIRE(ev[arrest_idx].tick == 120 && ev[apoptosis_idx].tick == 120, "4D: event ticks");

    const std::uint32_t bits = sim.getLatestEvents();
    REQUIRE((bits & ckpt::Event_MitoticArrest) && (bits & ckpt::Event_Apoptosis), "4D: event bits");
    REQUIRE(sim.getLatestEvents() == 0u, "4D: event bits not cleared on read");
}

static void runSiblingPolicy_4E() {
    ckpt::RunConfig cfg = ckpt::makeScenarioConfig(ckpt::ScenarioId::NormalCommit);

    ckpt::Simulation snap;
    REQUIRE(snap.reset(cfg), "4E: snapshot reset");
    snap.step();
    REQUIRE(snap.agents()[0].stabilityCounter() == 0, "4E: snapshot agent 0");
    REQUIRE(snap.agents()[1].stabilityCounter() == 0, "4E: snapshot agent 1");

    cfg.sibling_policy = ckpt::SiblingPolicy::Sequential;
    ckpt::Simulation seq;
    REQUIRE(seq.reset(cfg), "4E: sequential reset");
    seq.step();
    // Second agent already sees its sister attached in the same tick.
    REQUIRE(seq.agents()[0].stabilityCounter() == 0, "4E: sequential agent 0");
    REQUIRE(seq.agents()[1].stabilityCounter() == 1, "4E: sequential agent 1");

    REQUIRE(snap.getRunSignatures().run_param_hash_u32 != seq.getRunSignatures().run_param_hash_u32,
            "4E: policy not part of the config hash");
}

static void runDeterministicReplay_4F() {
    ckpt::RunConfig cfg = ckpt::makeScenarioConfig(ckpt::ScenarioId::MutantMix);
    cfg.limits.max_mitosis_time = 150;
    cfg.limits.apoptosis_threshold = 180;

    ckpt::Simulation a;
    ckpt::Simulation b;
    REQUIRE(a.reset(cfg) && b.reset(cfg), "4F: reset failed");
    bool more = true;
    while (more) {
        const bool sa = a.step();
        const bool sb = b.step();
        REQUIRE(sa == sb, "4F: step() diverged");
        more = sa;
        requireObservationExact("4F: replay", a.observe(), b.observe());
    }

    const ckpt::RunSignatures s1 = a.getRunSignatures();
    const ckpt::RunSignatures s2 = b.getRunSignatures();
    REQUIRE(s1.run_param_hash_u32 == s2.run_param_hash_u32, "4F: param hash");
    REQUIRE(s1.telemetry_crc_u32 == s2.telemetry_crc_u32, "4F: telemetry crc");
    REQUIRE(s1.state_digest_u32 == s2.state_digest_u32, "4F: state digest");

    // Reset on the same instance replays the same run.
    REQUIRE(a.reset(cfg), "4F: second reset");
    a.run();
    REQUIRE(a.getRunSignatures().state_digest_u32 == s1.state_digest_u32, "4F: reset replay digest");

    cfg.seed_u32 += 1u;
    REQUIRE(b.reset(cfg), "4F: reseed reset");
    b.run();
    REQUIRE(b.getRunSignatures().run_param_hash_u32 != s1.run_param_hash_u32, "4F: seed not hashed");
    REQUIRE(b.getRunSignatures().state_digest_u32 != s1.state_digest_u32, "4F: seed did not change the run");
}

static void runRandomizedTraceInvariants_4G() {
    ckpt::RunConfig cfg = ckpt::makeScenarioConfig(ckpt::ScenarioId::MutantMix);
    cfg.physics.misattach_probability = 0.2;
    cfg.physics.detach_probability = 0.05;
    cfg.limits.max_ticks = 300;

    for (std::uint32_t seed = 1; seed <= 3; ++seed) {
        cfg.seed_u32 = seed;
        ckpt::Simulation sim;
        REQUIRE(sim.reset(cfg), "4G: reset failed");
        const int window = cfg.physics.tension_stability_window;

        std::vector<ckpt::KinetochoreState> prev;
        for (const auto& k : sim.agents()) prev.push_back(k.state());
        bool was_committed = false;

        while (sim.step()) {
            const ckpt::TickObservation o = sim.observe();
            REQUIRE_FINITE(o.bus_concentration, "4G: bus");
            REQUIRE(o.bus_concentration >= 0.0, "4G: negative bus");
            REQUIRE(o.ready_count >= 0 && o.ready_count <= o.agent_count, "4G: ready bounds");
            REQUIRE(!(was_committed && !o.committed), "4G: latch regressed");
            was_committed = o.committed;

            const auto& agents = sim.agents();
            int misattached = 0;
            for (std::size_t i = 0; i < agents.size(); ++i) {
                const ckpt::Kinetochore& k = agents[i];
                const ckpt::KinetochoreState s = k.state();
                if (prev[i] == ckpt::KinetochoreState::Misattached) {
                    REQUIRE(s == ckpt::KinetochoreState::Misattached || s == ckpt::KinetochoreState::Detached,
                            "4G: misattachment resolved through an attached state");
                }
                switch (s) {
                    case ckpt::KinetochoreState::Detached:
                        REQUIRE(k.stabilityCounter() == 0 && k.tension() == 0.0, "4G: detached carries state");
                        break;
                    case ckpt::KinetochoreState::AttachedRelaxed:
                        REQUIRE(k.stabilityCounter() < window, "4G: relaxed with full window");
                        break;
                    case ckpt::KinetochoreState::AttachedTensioned:
                        // Either a full window or a sibling that lost eligibility.
                        REQUIRE(k.stabilityCounter() >= window
                                    || (k.stabilityCounter() == 0 && k.tension() == 0.0),
                                "4G: tensioned before window");
                        break;
                    case ckpt::KinetochoreState::Misattached:
                        REQUIRE(k.stabilityCounter() == 0, "4G: misattached counter");
                        ++misattached;
                        break;
                }
                REQUIRE(k.tension() >= 0.0, "4G: negative tension");
                prev[i] = s;
            }
            REQUIRE(misattached == o.misattached_count, "4G: misattached count");
        }
        REQUIRE(sim.finished(), "4G: run did not finish");
    }
}

static void runBudgetAndTelemetry_4H() {
    ckpt::LimitsConfig lim;
    lim.max_mitosis_time = 200;
    lim.apoptosis_threshold = 250;
    REQUIRE(ckpt::lastTickBudget(lim) == 250, "4H: derived budget");
    lim.max_ticks = 100;
    REQUIRE(ckpt::lastTickBudget(lim) == 99, "4H: max_ticks budget");
    lim.max_ticks = 0;
    lim.max_mitosis_time = 10;
    lim.apoptosis_threshold = 5;
    REQUIRE(ckpt::lastTickBudget(lim) == 10, "4H: max of thresholds");

    // Budget stop while still RUNNING.
    ckpt::RunConfig cfg;
    cfg.limits.max_ticks = 10;
    ckpt::Simulation sim;
    REQUIRE(sim.reset(cfg), "4H: reset failed");
    REQUIRE(sim.run() == ckpt::MitosisOutcome::Running, "4H: default run resolved within 10 ticks");
    REQUIRE(sim.budgetExhausted() && sim.finished(), "4H: budget flags");
    REQUIRE(sim.observe().tick == 9, "4H: last tick");
    REQUIRE(!sim.step(), "4H: step after budget");
    REQUIRE((sim.getLatestEvents() & ckpt::Event_BudgetExhausted) != 0, "4H: budget bit");

    // Telemetry ring: every sample of a short run, in order.
    ckpt::Simulation nc;
    REQUIRE(nc.reset(ckpt::makeScenarioConfig(ckpt::ScenarioId::NormalCommit)), "4H: normal commit reset");
    nc.run();
    std::vector<ckpt::TelemetrySampleV1> buf(16);
    const int n = nc.getTelemetrySamples(buf.data(), static_cast<int>(buf.size()));
    REQUIRE(n == 5 && nc.telemetryCount() == 5, "4H: telemetry count");
    for (int i = 0; i < n; ++i) REQUIRE(buf[i].tick_u32 == static_cast<std::uint32_t>(i), "4H: telemetry order");
    REQUIRE((buf[4].flags_u32 & ckpt::Flag_Committed) && (buf[4].flags_u32 & ckpt::Flag_AllReady), "4H: final flags");
    REQUIRE((buf[0].flags_u32 & ckpt::Flag_Committed) == 0, "4H: early commit flag");
    REQUIRE(nc.getTelemetrySamples(nullptr, 4) == 0 && nc.getTelemetrySamples(buf.data(), 0) == 0, "4H: null output");

    ckpt::RunConfig sparse = ckpt::makeScenarioConfig(ckpt::ScenarioId::NormalCommit);
    sparse.telemetry_every = 2;
    REQUIRE(nc.reset(sparse), "4H: sparse reset");
    nc.run();
    REQUIRE(nc.telemetryCount() == 3, "4H: decimated telemetry count");

    // Overflow keeps the newest samples.
    ckpt::RunConfig longRun = ckpt::makeScenarioConfig(ckpt::ScenarioId::PermanentMisattachment);
    longRun.limits.max_mitosis_time = 2500;
    longRun.limits.apoptosis_threshold = 2500;
    REQUIRE(nc.reset(longRun), "4H: long reset");
    nc.run();
    std::vector<ckpt::TelemetrySampleV1> all(4096);
    const int m = nc.getTelemetrySamples(all.data(), static_cast<int>(all.size()));
    REQUIRE(m == 2048, "4H: ring capacity");
    REQUIRE(all[0].tick_u32 == 2501u - 2048u, "4H: oldest retained sample");
    REQUIRE(all[m - 1].tick_u32 == 2500u, "4H: newest sample");
}

static void runResetValidation_4I() {
    ckpt::Simulation sim;
    REQUIRE(sim.reset(ckpt::makeScenarioConfig(ckpt::ScenarioId::NormalCommit)), "4I: reset failed");
    sim.step();
    sim.step();
    const std::uint32_t hash = sim.getRunSignatures().run_param_hash_u32;

    ckpt::RunConfig bad;
    bad.population.chromosome_count = 0;
    ckpt::ConfigError err;
    REQUIRE(!sim.reset(bad, &err), "4I: zero chromosomes accepted");
    REQUIRE(!err.message.empty(), "4I: no error message");

    ckpt::RunConfig odd;
    odd.population.chromosome_count = 3;
    odd.population.kinetochores_per_chromosome = 1;
    REQUIRE(!sim.reset(odd, &err), "4I: odd agent count accepted");

    ckpt::RunConfig range;
    range.population.chromosome_count = 2;
    range.variants.hyperstable = {2};
    REQUIRE(!sim.reset(range, &err), "4I: out-of-range variant pair accepted");
    REQUIRE(err.message.find("hyperstable") != std::string::npos, "4I: message does not name the list");

    // The product overflows int; each factor alone is within range.
    ckpt::RunConfig huge;
    huge.population.chromosome_count = 1000000;
    huge.population.kinetochores_per_chromosome = 4096;
    REQUIRE(!sim.reset(huge, &err), "4I: overflowing agent count accepted");
    REQUIRE(err.message.find("too large") != std::string::npos, "4I: overflow message");

    ckpt::RunConfig prob;
    prob.physics.attach_probability = 1.5;
    REQUIRE(!sim.reset(prob, nullptr), "4I: probability > 1 accepted");

    // Rejected resets leave the current run alone.
    REQUIRE(sim.nextTick() == 2, "4I: rejected reset changed tick");
    REQUIRE(sim.getRunSignatures().run_param_hash_u32 == hash, "4I: rejected reset changed config");
    REQUIRE(sim.step() && sim.observe().tick == 2, "4I: run not resumable");
}

} // namespace

int main() {
    // Canary: prove the test fails in Release when checks are active.
    if (std::getenv("CKPT_CANARY_NAN")) {
        REQUIRE_FINITE(std::nan(""), "CANARY_NAN");
        return 0; // unreachable
    }

    // Components
    runCommitLatch_1A();
    runSignalBusIntegrator_1B();
    runMonitorTruthTable_1C();

    // Agent transition table
    runAgentAttachAndStabilityWindow_2A();
    runAgentCounterResetBelowThreshold_2B();
    runAgentMisattachmentIsolation_2C();
    runAgentLowTensionUnload_2D();

    // Variants
    runVariantDerivation_3A();
    runFaultySensor_3B();
    runUnstableBoundary_3C();
    runHyperstable_3D();

    // Orchestrator
    runNormalCommitTrace_4A();
    runFaultInjection_4B();
    runPermanentMisattachment_4C();
    runCoincidentThresholds_4D();
    runSiblingPolicy_4E();
    runDeterministicReplay_4F();
    runRandomizedTraceInvariants_4G();
    runBudgetAndTelemetry_4H();
    runResetValidation_4I();

    std::cout << "[PASS] TestCheckpointKernel\n";
    return 0;
}
