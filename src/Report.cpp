#include "Report.h"

#include <cstdio>
#include <ostream>
#include <vector>

namespace ckpt {

std::string formatTickLine(const TickObservation& obs) {
    char buf[192];
    int n = std::snprintf(buf, sizeof(buf), "T=%03d | MCC: %.2f | Ready: %d/%d",
                          obs.tick, obs.bus_concentration, obs.ready_count, obs.agent_count);
    auto app = [&](const char* text) {
        if (n < 0 || n >= static_cast<int>(sizeof(buf))) return;
        const int w = std::snprintf(buf + n, sizeof(buf) - static_cast<std::size_t>(n), "%s", text);
        if (w > 0) n += w;
    };
    if (obs.misattached_count > 0) {
        char mis[48];
        std::snprintf(mis, sizeof(mis), " | Misattached: %d", obs.misattached_count);
        app(mis);
    }
    if (obs.arrested) app(" | ARRESTED");
    app(obs.committed ? " | Anaphase: yes" : " | Anaphase: no");
    return std::string(buf);
}

bool shouldLogTick(const TickObservation& obs, int every) {
    if (obs.tick < 0) return false;
    if (every > 0 && obs.tick % every == 0) return true;
    return obs.committed || obs.misattached_count > 0 || obs.arrested;
}

void printRunHeader(std::ostream& os, const Simulation& sim, const std::string& scenario) {
    const RunConfig& cfg = sim.config();
    char buf[160];
    std::snprintf(buf, sizeof(buf), "Agents: %d, APC/C threshold: %.3f, seed: %u, siblings: %s",
                  cfg.population.agentCount(), cfg.bus.apc_activation_threshold,
                  cfg.seed_u32, siblingPolicyName(cfg.sibling_policy));
    os << "--- CHECKPOINT KERNEL START (" << scenario << ") ---\n" << buf << "\n";

    if (!cfg.variants.empty()) {
        os << "[VARIANTS] enabled:\n";
        auto line = [&](AgentVariant v, const std::vector<int>& ids) {
            if (ids.empty()) return;
            os << "  - " << variantName(v) << ": " << ids.size() << " chromosome pair(s)\n";
        };
        line(AgentVariant::FaultySensor, cfg.variants.faulty_sensor);
        line(AgentVariant::UnstableBoundary, cfg.variants.unstable_boundary);
        line(AgentVariant::Hyperstable, cfg.variants.hyperstable);
        line(AgentVariant::ElevatedMisattachmentRisk, cfg.variants.elevated_misattachment);
    }
}

void printEvent(std::ostream& os, const SimEvent& e) {
    os << "[" << simEventKindName(e.kind) << "] " << e.text << "\n";
}

void printFinalReport(std::ostream& os, const Simulation& sim) {
    os << "\n";
    sim.monitor().report(os);

    const RunSignatures sig = sim.getRunSignatures();
    char buf[160];
    std::snprintf(buf, sizeof(buf), "[SIGNATURES] param=0x%08X telemetry=0x%08X state=0x%08X",
                  sig.run_param_hash_u32, sig.telemetry_crc_u32, sig.state_digest_u32);
    os << buf << "\n";

    const TickObservation obs = sim.observe();
    os << "\n[FINAL STATE] " << outcomeName(sim.outcome());
    if (sim.budgetExhausted()) os << " (terminated by tick budget)";
    os << " after " << (obs.tick + 1) << " tick(s)";
    if (sim.commitTick() >= 0) os << ", commit at tick " << sim.commitTick();
    if (sim.arrestTick() >= 0) os << ", arrest at tick " << sim.arrestTick();
    os << "\n";
}

} // namespace ckpt
