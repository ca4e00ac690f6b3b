#include "Scenarios.h"
#include "Simulation.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {
struct RunMetrics {
    ckpt::MitosisOutcome outcome = ckpt::MitosisOutcome::Running;
    int end_tick = -1;
    int commit_tick = -1;
    int arrest_tick = -1;
    int violations = 0;
    int first_violation_tick = -1;
    int misattachment_events = 0;
    bool arrest_before_apoptosis = false;
    ckpt::RunSignatures sig{};
};

struct CheckRow {
    std::string scenario;
    std::string check;
    std::string expected;
    std::string observed;
    bool pass = false;
};

static RunMetrics runScenario(const ckpt::RunConfig& cfg) {
    ckpt::Simulation sim;
    RunMetrics m{};
    if (!sim.reset(cfg, nullptr)) {
        return m;
    }
    sim.run();

    const ckpt::SafetyReport r = sim.monitor().summarize();
    m.outcome = sim.outcome();
    m.end_tick = sim.observe().tick;
    m.commit_tick = sim.commitTick();
    m.arrest_tick = sim.arrestTick();
    m.violations = r.violation_count;
    m.first_violation_tick = r.first_violation_tick;
    m.misattachment_events = r.misattachment_event_count;
    m.sig = sim.getRunSignatures();

    int arrest_idx = -1;
    int apoptosis_idx = -1;
    const auto& events = sim.events();
    for (int i = 0; i < static_cast<int>(events.size()); ++i) {
        if (events[i].kind == ckpt::SimEventKind::MitoticArrest && arrest_idx < 0) arrest_idx = i;
        if (events[i].kind == ckpt::SimEventKind::Apoptosis && apoptosis_idx < 0) apoptosis_idx = i;
    }
    m.arrest_before_apoptosis = (arrest_idx >= 0 && apoptosis_idx > arrest_idx);
    return m;
}

static std::string num(int v) { return std::to_string(v); }

} // namespace

int main() {
    std::cout << "=== CHECKPOINT KERNEL VALIDATION SUITE ===\n";
    std::cout << "Deterministic scenarios and replay signatures\n\n";

    std::vector<CheckRow> rows;
    auto addRow = [&](const std::string& scenario, const std::string& check,
                      const std::string& expected, const std::string& observed, bool pass) {
        rows.push_back({scenario, check, expected, observed, pass});
    };

    // A: normal commit
    std::cout << "=== Scenario A: Normal Commit ===\n";
    const RunMetrics a = runScenario(ckpt::makeScenarioConfig(ckpt::ScenarioId::NormalCommit));
    std::cout << "Outcome: " << ckpt::outcomeName(a.outcome) << ", commit tick " << a.commit_tick
              << ", violations " << a.violations << "\n\n";
    addRow("A normal commit", "outcome", "ANAPHASE_COMPLETED", ckpt::outcomeName(a.outcome),
           a.outcome == ckpt::MitosisOutcome::AnaphaseCompleted);
    addRow("A normal commit", "commit tick", "4", num(a.commit_tick), a.commit_tick == 4);
    addRow("A normal commit", "violations", "0", num(a.violations), a.violations == 0);

    // B: fault injection
    std::cout << "=== Scenario B: Fault Injection ===\n";
    const RunMetrics b = runScenario(ckpt::makeScenarioConfig(ckpt::ScenarioId::FaultInjection));
    std::cout << "Outcome: " << ckpt::outcomeName(b.outcome) << ", commit tick " << b.commit_tick
              << ", violations " << b.violations << " (first at tick " << b.first_violation_tick << ")\n\n";
    addRow("B fault injection", "commit tick", "0", num(b.commit_tick), b.commit_tick == 0);
    addRow("B fault injection", "first violation tick", "0", num(b.first_violation_tick), b.first_violation_tick == 0);
    addRow("B fault injection", "violations", ">=1", num(b.violations), b.violations >= 1);

    // C: permanent misattachment
    std::cout << "=== Scenario C: Permanent Misattachment ===\n";
    const ckpt::RunConfig c_cfg = ckpt::makeScenarioConfig(ckpt::ScenarioId::PermanentMisattachment);
    const RunMetrics c = runScenario(c_cfg);
    std::cout << "Outcome: " << ckpt::outcomeName(c.outcome) << ", arrest tick " << c.arrest_tick
              << ", end tick " << c.end_tick << ", misattachment events " << c.misattachment_events << "\n\n";
    addRow("C permanent misattachment", "arrest tick", num(c_cfg.limits.max_mitosis_time), num(c.arrest_tick),
           c.arrest_tick == c_cfg.limits.max_mitosis_time);
    addRow("C permanent misattachment", "apoptosis tick", num(c_cfg.limits.apoptosis_threshold), num(c.end_tick),
           c.outcome == ckpt::MitosisOutcome::Apoptosis && c.end_tick == c_cfg.limits.apoptosis_threshold);
    addRow("C permanent misattachment", "commits", "0", (c.commit_tick < 0) ? "0" : "1", c.commit_tick < 0);

    // D: coincident thresholds
    std::cout << "=== Scenario D: Coincident Thresholds ===\n";
    const ckpt::RunConfig d_cfg = ckpt::makeScenarioConfig(ckpt::ScenarioId::CoincidentThresholds);
    const RunMetrics d = runScenario(d_cfg);
    std::cout << "Outcome: " << ckpt::outcomeName(d.outcome) << ", arrest tick " << d.arrest_tick
              << ", end tick " << d.end_tick << "\n\n";
    addRow("D coincident thresholds", "arrest and apoptosis tick", num(d_cfg.limits.max_mitosis_time),
           num(d.arrest_tick) + "/" + num(d.end_tick),
           d.arrest_tick == d_cfg.limits.max_mitosis_time && d.end_tick == d_cfg.limits.apoptosis_threshold
               && d.outcome == ckpt::MitosisOutcome::Apoptosis);
    addRow("D coincident thresholds", "arrest logged first", "YES", d.arrest_before_apoptosis ? "YES" : "NO",
           d.arrest_before_apoptosis);

    // Determinism: identical signatures for identical config + seed
    std::cout << "=== Determinism (default population, seed 1337) ===\n";
    const ckpt::RunConfig def_cfg = ckpt::makeScenarioConfig(ckpt::ScenarioId::Default);
    const RunMetrics r1 = runScenario(def_cfg);
    const RunMetrics r2 = runScenario(def_cfg);
    const bool same = r1.sig.run_param_hash_u32 == r2.sig.run_param_hash_u32
        && r1.sig.telemetry_crc_u32 == r2.sig.telemetry_crc_u32
        && r1.sig.state_digest_u32 == r2.sig.state_digest_u32
        && r1.end_tick == r2.end_tick;
    std::cout << std::hex << std::uppercase << "Signatures: 0x" << r1.sig.telemetry_crc_u32
              << " / 0x" << r1.sig.state_digest_u32 << std::dec << std::nouppercase << "\n\n";
    addRow("Determinism", "replay signatures", "identical", same ? "identical" : "different", same);

    // Summary table
    int pass = 0;
    std::cout << "Scenario                   | Check                      | Expected           | Observed           | Status\n";
    std::cout << "-----------------------------------------------------------------------------------------------------------\n";
    for (const CheckRow& row : rows) {
        if (row.pass) ++pass;
        std::cout << std::left << std::setw(26) << row.scenario << " | "
                  << std::setw(26) << row.check << " | "
                  << std::setw(18) << row.expected << " | "
                  << std::setw(18) << row.observed << " | "
                  << (row.pass ? "PASS" : "FAIL") << "\n";
    }

    std::cout << "\nTOTAL: " << pass << "/" << rows.size() << " checks passed\n\n";

    // Write CSV
    const std::string csv_name = "validation_results.csv";
    std::ofstream csv(csv_name);
    if (csv) {
        csv << "Scenario,Check,Expected,Observed,Status\n";
        for (const CheckRow& row : rows) {
            csv << row.scenario << "," << row.check << "," << row.expected << ","
                << row.observed << "," << (row.pass ? "PASS" : "FAIL") << "\n";
        }
        csv.close();
        std::cout << "Results exported to: " << csv_name << "\n";
    } else {
        std::cerr << "Could not write " << csv_name << "\n";
    }

    return (pass == static_cast<int>(rows.size())) ? 0 : 1;
}
