#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "CheckpointConfig.h"
#include "CommitController.h"
#include "Kinetochore.h"
#include "Random.h"
#include "SafetyMonitor.h"
#include "SignalBus.h"

namespace ckpt {

// ============================================================
// Tick scheduler and outcome machine.
//
// Per tick:
//   agents (pair order) -> SignalBus -> CommitController -> SafetyMonitor
//   -> arrest check -> apoptosis check -> commit check -> bookkeeping
//
// Rules:
// - Agents read a const physics block and their own RandomStream.
// - Bus, controller and monitor are touched once per tick, after every agent.
// - Telemetry, events and signatures are observational only.
// ============================================================

enum class MitosisOutcome : int {
    Running = 0,
    MitoticArrest = 1,     // soft, the run continues
    Apoptosis = 2,         // terminal
    AnaphaseCompleted = 3, // terminal
};

const char* outcomeName(MitosisOutcome o);
bool isTerminal(MitosisOutcome o);

struct TickObservation {
    int tick = -1; // -1 before the first step
    double bus_concentration = 0.0;
    double total_flux = 0.0;
    int ready_count = 0;
    int agent_count = 0;
    int misattached_count = 0;
    bool arrested = false;
    bool committed = false;
    MitosisOutcome outcome = MitosisOutcome::Running;
    int violations_this_tick = 0;
};

struct TelemetrySampleV1 {
    // Fixed order; folded into RunSignatures::telemetry_crc_u32.
    std::uint32_t tick_u32 = 0;
    float mcc_concentration = 0.0f;
    float total_flux = 0.0f;
    std::uint32_t ready_u32 = 0;
    std::uint32_t misattached_u32 = 0;
    std::uint32_t flags_u32 = 0; // TelemetryFlagBits
};

enum TelemetryFlagBits : std::uint32_t {
    Flag_Committed = 1u << 0,
    Flag_Arrested  = 1u << 1,
    Flag_AllReady  = 1u << 2,
};

struct RunSignatures {
    std::uint32_t run_param_hash_u32 = 0; // FNV-1a32 over the effective RunConfig
    std::uint32_t telemetry_crc_u32  = 0; // CRC32 over sampled telemetry stream
    std::uint32_t state_digest_u32   = 0; // FNV-1a32 over compact agent snapshots
};

// Event / warning bitmask. Edge-triggered; read and cleared via getLatestEvents().
enum CheckpointEventBits : std::uint32_t {
    Event_None               = 0u,
    Event_FirstMisattachment = 1u << 0,
    Event_AllReady           = 1u << 1,
    Event_MitoticArrest      = 1u << 2,
    Event_Apoptosis          = 1u << 3,
    Event_AnaphaseCommitted  = 1u << 4,
    Event_BudgetExhausted    = 1u << 5,
    // Safety monitor findings
    Warn_CommitWithoutReadiness  = 1u << 16,
    Warn_CommitWithMisattachment = 1u << 17,
};

enum class SimEventKind : int {
    MitoticArrest = 0,
    Apoptosis,
    AnaphaseCommitted,
    SafetyViolation,
    FirstMisattachment,
};

const char* simEventKindName(SimEventKind k);

struct SimEvent {
    int tick = 0;
    SimEventKind kind = SimEventKind::MitoticArrest;
    std::string text;
};

class Simulation {
public:
    // Starts from the default RunConfig.
    Simulation();

    // Large fixed ring buffer; pass by reference.
    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Validates cfg. On failure returns false, fills err and keeps the current run untouched.
    bool reset(const RunConfig& cfg, ConfigError* err = nullptr);

    // Executes one tick. Returns false (no-op) once the run is finished.
    bool step();

    // Steps until finished; returns the final outcome.
    MitosisOutcome run();

    // Side-effect free.
    TickObservation observe() const { return last_obs_; }

    MitosisOutcome outcome() const noexcept { return outcome_; }
    bool finished() const noexcept { return isTerminal(outcome_) || budget_exhausted_; }
    // Stopped by the tick budget while Running or MitoticArrest.
    bool budgetExhausted() const noexcept { return budget_exhausted_; }

    int nextTick() const noexcept { return next_tick_; }
    int lastTick() const noexcept { return last_tick_; }
    int commitTick() const noexcept { return commit_tick_; }
    int arrestTick() const noexcept { return arrest_tick_; }
    int outcomeTick() const noexcept { return outcome_tick_; }

    const RunConfig& config() const noexcept { return config_; }
    const std::vector<Kinetochore>& agents() const noexcept { return agents_; }
    const SignalBus& bus() const noexcept { return bus_; }
    const CommitController& controller() const noexcept { return controller_; }
    const SafetyMonitor& monitor() const noexcept { return monitor_; }
    const std::vector<SimEvent>& events() const noexcept { return events_; }

    RunSignatures getRunSignatures() const { return run_signatures_; }
    std::uint32_t getLatestEvents();
    int getTelemetrySamples(TelemetrySampleV1* out_ptr, int cap) const;
    int telemetryCount() const noexcept { return telemetry_count_; }
    int exportConfigText(char* buf, int cap) const;

private:
    void buildPopulation();
    void updatePair(std::size_t first);
    void applyOutcomePolicy(int tick, bool committed, int ready_count);
    void pushTelemetry(const TickObservation& obs);
    void foldStateDigest(int tick);
    void logEvent(int tick, SimEventKind kind, const std::string& text);

    RunConfig config_{};

    std::vector<Kinetochore> agents_;
    std::vector<RandomStream> streams_; // one per agent, same index
    SignalBus bus_{};
    CommitController controller_{};
    SafetyMonitor monitor_{};

    MitosisOutcome outcome_ = MitosisOutcome::Running;
    bool arrested_ = false;
    bool budget_exhausted_ = false;
    int next_tick_ = 0;
    int last_tick_ = 0;
    int commit_tick_ = -1;
    int arrest_tick_ = -1;
    int outcome_tick_ = -1;

    TickObservation last_obs_{};
    std::vector<SimEvent> events_;

    // ---- signatures + telemetry ----
    RunSignatures run_signatures_{};
    std::uint32_t latest_events_bits_ = 0;
    bool seen_misattachment_ = false;
    bool prev_all_ready_ = false;

    // Telemetry ring buffer (fixed capacity, no dynamic alloc during step)
    static constexpr int kTelemetryCapacity_ = 2048;
    std::array<TelemetrySampleV1, kTelemetryCapacity_> telemetry_rb_{};
    int telemetry_head_ = 0;  // next write
    int telemetry_count_ = 0; // number valid
};

} // namespace ckpt
