#include "ConfigText.h"
#include "Report.h"
#include "Scenarios.h"
#include "Simulation.h"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {
bool parseInt(const char* text, long long lo, long long hi, long long* out) {
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text, &end, 10);
    if (errno == ERANGE || end == text || *end != '\0' || v < lo || v > hi) return false;
    *out = v;
    return true;
}

void printUsage() {
    std::cout << "CheckpointRun usage:\n"
              << "  CheckpointRun [--config file] [--scenario name] [--seed n] [--max-ticks n]\n"
              << "                [--log-every n] [--sequential] [--dump-config] [--quiet]\n"
              << "Scenarios:\n";
    for (int i = 0; i < static_cast<int>(ckpt::ScenarioId::Count); ++i) {
        const auto id = static_cast<ckpt::ScenarioId>(i);
        std::cout << "  " << ckpt::scenarioName(id) << ": " << ckpt::scenarioDescription(id) << "\n";
    }
    std::cout << "Exit codes: 0 clean run, 1 usage or config error, 2 safety violations\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string scenario_name = "default";
    long long seed = -1;
    long long max_ticks = -1;
    long long log_every = 10;
    bool sequential = false;
    bool dump_config = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--scenario" && i + 1 < argc) {
            scenario_name = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            ok = parseInt(argv[++i], 0, 0xFFFFFFFFll, &seed);
        } else if (arg == "--max-ticks" && i + 1 < argc) {
            ok = parseInt(argv[++i], 1, 100000000ll, &max_ticks);
        } else if (arg == "--log-every" && i + 1 < argc) {
            ok = parseInt(argv[++i], 0, 100000000ll, &log_every);
        } else if (arg == "--sequential") {
            sequential = true;
        } else if (arg == "--dump-config") {
            dump_config = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
        if (!ok) {
            std::cerr << "Invalid value for " << arg << ": " << argv[i] << "\n";
            return 1;
        }
    }

    ckpt::ScenarioId scenario = ckpt::ScenarioId::Default;
    if (!ckpt::parseScenarioName(scenario_name, &scenario)) {
        std::cerr << "Unknown scenario: " << scenario_name << "\n";
        printUsage();
        return 1;
    }

    // Scenario preset, then config file, then command line overrides.
    ckpt::RunConfig cfg = ckpt::makeScenarioConfig(scenario);
    if (!config_path.empty()) {
        ckpt::ConfigError err;
        if (!ckpt::loadConfigFile(config_path, &cfg, &err)) {
            std::cerr << "FATAL: " << config_path << ":" << err.line << ": " << err.message << "\n";
            return 1;
        }
    }
    if (seed >= 0) cfg.seed_u32 = static_cast<std::uint32_t>(seed);
    if (max_ticks > 0) cfg.limits.max_ticks = static_cast<int>(max_ticks);
    if (sequential) cfg.sibling_policy = ckpt::SiblingPolicy::Sequential;

    ckpt::Simulation sim;
    ckpt::ConfigError err;
    if (!sim.reset(cfg, &err)) {
        std::cerr << "FATAL: invalid configuration: " << err.message << "\n";
        return 1;
    }

    if (dump_config) {
        std::cout << ckpt::configToText(sim.config());
        return 0;
    }

    if (!quiet) ckpt::printRunHeader(std::cout, sim, ckpt::scenarioName(scenario));

    std::size_t events_seen = 0;
    while (sim.step()) {
        if (quiet) continue;
        const auto& events = sim.events();
        for (; events_seen < events.size(); ++events_seen) {
            ckpt::printEvent(std::cout, events[events_seen]);
        }
        const ckpt::TickObservation obs = sim.observe();
        if (ckpt::shouldLogTick(obs, static_cast<int>(log_every))) {
            std::cout << ckpt::formatTickLine(obs) << "\n";
        }
    }

    ckpt::printFinalReport(std::cout, sim);
    return sim.monitor().passed() ? 0 : 2;
}
