#include "ConfigText.h"
#include "Scenarios.h"
#include "SensitivityAnalysis.h"
#include "UncertaintyQuantification.h"

#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
bool parseNumber(const char* text, double* out) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text, &end);
    if (errno == ERANGE || end == text || *end != '\0') return false;
    *out = v;
    return true;
}

bool parseCount(const char* text, int* out) {
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(text, &end, 10);
    if (errno == ERANGE || end == text || *end != '\0' || v < 1 || v > 1000000) return false;
    *out = static_cast<int>(v);
    return true;
}

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <noise|attach|detach|misattach|threshold|degradation|activation>\n"
              << "            [--min v] [--max v] [--samples n] [--seeds n] [--out file]\n"
              << "            [--config file] [--scenario name]\n"
              << "  SweepTool --monte-carlo n [--config file] [--scenario name]\n";
}

void printUQ(const char* name, const ckpt::MonteCarloUQ::UQResult& r) {
    std::cout << std::left << std::setw(22) << name
              << " mean " << std::setw(10) << r.mean
              << " median " << std::setw(10) << r.median
              << " 95% [" << r.ci_lower_95 << ", " << r.ci_upper_95 << "]"
              << " sd " << r.std_dev << "\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    int seeds = 8;
    int monte_carlo = 0;
    std::string out = "sensitivity.csv";
    std::string config_path;
    std::string scenario_name = "default";
    bool min_set = false;
    bool max_set = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "--param" && i + 1 < argc) {
            param = argv[++i];
        } else if (arg == "--min" && i + 1 < argc) {
            ok = parseNumber(argv[++i], &min_val);
            min_set = true;
        } else if (arg == "--max" && i + 1 < argc) {
            ok = parseNumber(argv[++i], &max_val);
            max_set = true;
        } else if (arg == "--samples" && i + 1 < argc) {
            ok = parseCount(argv[++i], &samples);
        } else if (arg == "--seeds" && i + 1 < argc) {
            ok = parseCount(argv[++i], &seeds);
        } else if (arg == "--monte-carlo" && i + 1 < argc) {
            ok = parseCount(argv[++i], &monte_carlo);
        } else if (arg == "--out" && i + 1 < argc) {
            out = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--scenario" && i + 1 < argc) {
            scenario_name = argv[++i];
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
        return 1;
    }
    ckpt::RunConfig base = ckpt::makeScenarioConfig(scenario);
    if (!config_path.empty()) {
        ckpt::ConfigError err;
        if (!ckpt::loadConfigFile(config_path, &base, &err)) {
            std::cerr << "FATAL: " << config_path << ":" << err.line << ": " << err.message << "\n";
            return 1;
        }
    }

    if (monte_carlo > 0) {
        ckpt::MonteCarloUQ uq;
        uq.setBaseConfig(base);
        const auto s = uq.runMonteCarlo(monte_carlo);
        std::cout << "Monte Carlo over " << s.samples << " sample(s), " << s.rejected << " rejected\n";
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "commit fraction    " << s.commit_fraction << "\n";
        std::cout << "violation fraction " << s.violation_fraction << "\n";
        std::cout << "apoptosis fraction " << s.apoptosis_fraction << "\n";
        printUQ("end_tick", s.end_tick);
        printUQ("commit_tick", s.commit_tick);
        printUQ("final_mcc", s.final_mcc);
        printUQ("misattachment_events", s.misattachment_events);
        return 0;
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    ckpt::SensitivityAnalyzer::Parameter p = ckpt::SensitivityAnalyzer::Parameter::NoiseLevel;
    if (!ckpt::SensitivityAnalyzer::parseParameter(param, &p)) {
        std::cerr << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    ckpt::SensitivityAnalyzer analyzer;
    analyzer.setBaseConfig(base);
    analyzer.setSeedsPerSample(seeds);

    ckpt::SensitivityAnalyzer::ParameterRange range;
    range.samples = samples;
    range.nominal = ckpt::SensitivityAnalyzer::nominalValue(base, p);

    if (!min_set) {
        min_val = range.nominal * 0.75;
    }
    if (!max_set) {
        max_val = range.nominal * 1.25;
    }

    range.min = min_val;
    range.max = max_val;

    analyzer.analyze(p, range);

    if (!analyzer.exportSensitivityMatrixCSV(out)) {
        std::cerr << "FATAL: cannot write " << out << "\n";
        return 1;
    }
    std::cout << "Wrote sensitivity sweep to: " << out << "\n";
    return 0;
}
