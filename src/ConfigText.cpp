#include "ConfigText.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace ckpt {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

bool parseDouble(const std::string& text, double* out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') return false;
    *out = v;
    return true;
}

bool parseInt(const std::string& text, long long lo, long long hi, long long* out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') return false;
    if (v < lo || v > hi) return false;
    *out = v;
    return true;
}

bool parseIdList(const std::string& text, std::vector<int>* out) {
    out->clear();
    if (trim(text).empty()) return true;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        long long v = 0;
        if (!parseInt(trim(item), INT_MIN, INT_MAX, &v)) return false;
        out->push_back(static_cast<int>(v));
    }
    return true;
}

std::vector<int>* variantList(RunConfig* cfg, AgentVariant v) {
    switch (v) {
        case AgentVariant::FaultySensor: return &cfg->variants.faulty_sensor;
        case AgentVariant::UnstableBoundary: return &cfg->variants.unstable_boundary;
        case AgentVariant::Hyperstable: return &cfg->variants.hyperstable;
        case AgentVariant::ElevatedMisattachmentRisk: return &cfg->variants.elevated_misattachment;
        default: return nullptr;
    }
}

// Returns nullptr when key does not name a double-valued field.
double* doubleField(RunConfig* cfg, const std::string& key) {
    PhysicsParams& ph = cfg->physics;
    BusParams& bus = cfg->bus;
    if (key == "physics.tension_threshold") return &ph.tension_threshold;
    if (key == "physics.noise_level") return &ph.noise_level;
    if (key == "physics.attach_probability") return &ph.attach_probability;
    if (key == "physics.detach_probability") return &ph.detach_probability;
    if (key == "physics.misattach_probability") return &ph.misattach_probability;
    if (key == "physics.misattach_detach_multiplier") return &ph.misattach_detach_multiplier;
    if (key == "physics.wapl_relaxed_threshold") return &ph.wapl_relaxed_threshold;
    if (key == "physics.wapl_unload_probability") return &ph.wapl_unload_probability;
    if (key == "physics.ctcf_instability") return &ph.ctcf_instability;
    if (key == "physics.hyperstabilization_factor") return &ph.hyperstabilization_factor;
    if (key == "physics.merotelic_drift_multiplier") return &ph.merotelic_drift_multiplier;
    if (key == "bus.mcc_production_rate") return &bus.mcc_production_rate;
    if (key == "bus.mcc_degradation_rate") return &bus.mcc_degradation_rate;
    if (key == "bus.apc_activation_threshold") return &bus.apc_activation_threshold;
    if (key == "bus.initial_concentration") return &bus.initial_concentration;
    return nullptr;
}

int* intField(RunConfig* cfg, const std::string& key) {
    if (key == "population.chromosome_count") return &cfg->population.chromosome_count;
    if (key == "population.kinetochores_per_chromosome") return &cfg->population.kinetochores_per_chromosome;
    if (key == "physics.tension_stability_window") return &cfg->physics.tension_stability_window;
    if (key == "limits.max_mitosis_time") return &cfg->limits.max_mitosis_time;
    if (key == "limits.apoptosis_threshold") return &cfg->limits.apoptosis_threshold;
    if (key == "limits.max_ticks") return &cfg->limits.max_ticks;
    if (key == "run.telemetry_every") return &cfg->telemetry_every;
    return nullptr;
}

bool lineError(ConfigError* err, int line, const std::string& msg) {
    if (err) {
        err->line = line;
        err->message = msg;
    }
    return false;
}

bool applyKey(RunConfig* cfg, const std::string& key, const std::string& value, int line, ConfigError* err) {
    if (double* d = doubleField(cfg, key)) {
        if (!parseDouble(value, d)) return lineError(err, line, key + ": expected a number, got '" + value + "'");
        return true;
    }
    if (int* i = intField(cfg, key)) {
        long long v = 0;
        if (!parseInt(value, INT_MIN, INT_MAX, &v)) return lineError(err, line, key + ": expected an integer, got '" + value + "'");
        *i = static_cast<int>(v);
        return true;
    }
    if (key == "run.seed") {
        long long v = 0;
        if (!parseInt(value, 0, 0xFFFFFFFFll, &v)) return lineError(err, line, "run.seed: expected an unsigned 32-bit integer");
        cfg->seed_u32 = static_cast<std::uint32_t>(v);
        return true;
    }
    if (key == "run.sibling_policy") {
        const std::string p = toLower(value);
        if (p == "snapshot") {
            cfg->sibling_policy = SiblingPolicy::PreTickSnapshot;
        } else if (p == "sequential") {
            cfg->sibling_policy = SiblingPolicy::Sequential;
        } else {
            return lineError(err, line, "run.sibling_policy: expected 'snapshot' or 'sequential'");
        }
        return true;
    }
    const std::string kVariantsPrefix = "variants.";
    if (key.compare(0, kVariantsPrefix.size(), kVariantsPrefix) == 0) {
        AgentVariant v = AgentVariant::None;
        const std::string name = key.substr(kVariantsPrefix.size());
        if (!parseVariantName(name, &v) || v == AgentVariant::None) {
            return lineError(err, line, "unknown variant list '" + name + "'");
        }
        if (!parseIdList(value, variantList(cfg, v))) {
            return lineError(err, line, key + ": expected a comma separated list of pair ids");
        }
        return true;
    }
    return lineError(err, line, "unknown key '" + key + "'");
}

} // namespace

bool parseConfigText(const std::string& text, RunConfig* cfg, ConfigError* err) {
    if (!cfg) return lineError(err, 0, "no output config");

    std::istringstream in(text);
    std::string raw;
    int line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        const std::size_t hash = raw.find('#');
        const std::string line = trim(hash == std::string::npos ? raw : raw.substr(0, hash));
        if (line.empty()) continue;

        const std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return lineError(err, line_no, "expected 'section.key = value'");
        }
        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string value = trim(line.substr(eq + 1));
        if (key.empty()) return lineError(err, line_no, "empty key");
        if (!applyKey(cfg, key, value, line_no, err)) return false;
    }
    return validateConfig(*cfg, err);
}

bool loadConfigFile(const std::string& path, RunConfig* cfg, ConfigError* err) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return lineError(err, 0, "cannot open config file '" + path + "'");
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return parseConfigText(ss.str(), cfg, err);
}

int exportConfigText(const RunConfig& cfg, char* buf, int cap) {
    if (!buf || cap <= 0) return 0;
    buf[0] = '\0';

    int n = 0;
    auto app = [&](const char* fmt, auto... args) {
        if (n >= cap - 1) return;
        const int w = std::snprintf(buf + n, static_cast<std::size_t>(cap - n), fmt, args...);
        if (w > 0) n += std::min(w, cap - 1 - n);
    };
    auto appList = [&](const char* name, const std::vector<int>& ids) {
        app("variants.%s =", name);
        for (std::size_t i = 0; i < ids.size(); ++i) {
            app("%s %d", (i == 0) ? "" : ",", ids[i]);
        }
        app("\n");
    };

    const PhysicsParams& ph = cfg.physics;
    app("# RunConfigV1 version_u32=%u size_bytes_u32=%u\n", cfg.version_u32, cfg.size_bytes_u32);
    app("population.chromosome_count = %d\n", cfg.population.chromosome_count);
    app("population.kinetochores_per_chromosome = %d\n", cfg.population.kinetochores_per_chromosome);
    app("physics.tension_threshold = %.17g\n", ph.tension_threshold);
    app("physics.noise_level = %.17g\n", ph.noise_level);
    app("physics.attach_probability = %.17g\n", ph.attach_probability);
    app("physics.detach_probability = %.17g\n", ph.detach_probability);
    app("physics.misattach_probability = %.17g\n", ph.misattach_probability);
    app("physics.misattach_detach_multiplier = %.17g\n", ph.misattach_detach_multiplier);
    app("physics.tension_stability_window = %d\n", ph.tension_stability_window);
    app("physics.wapl_relaxed_threshold = %.17g\n", ph.wapl_relaxed_threshold);
    app("physics.wapl_unload_probability = %.17g\n", ph.wapl_unload_probability);
    app("physics.ctcf_instability = %.17g\n", ph.ctcf_instability);
    app("physics.hyperstabilization_factor = %.17g\n", ph.hyperstabilization_factor);
    app("physics.merotelic_drift_multiplier = %.17g\n", ph.merotelic_drift_multiplier);
    app("bus.mcc_production_rate = %.17g\n", cfg.bus.mcc_production_rate);
    app("bus.mcc_degradation_rate = %.17g\n", cfg.bus.mcc_degradation_rate);
    app("bus.apc_activation_threshold = %.17g\n", cfg.bus.apc_activation_threshold);
    app("bus.initial_concentration = %.17g\n", cfg.bus.initial_concentration);
    app("limits.max_mitosis_time = %d\n", cfg.limits.max_mitosis_time);
    app("limits.apoptosis_threshold = %d\n", cfg.limits.apoptosis_threshold);
    app("limits.max_ticks = %d\n", cfg.limits.max_ticks);
    appList("faulty_sensor", cfg.variants.faulty_sensor);
    appList("unstable_boundary", cfg.variants.unstable_boundary);
    appList("hyperstable", cfg.variants.hyperstable);
    appList("elevated_misattachment", cfg.variants.elevated_misattachment);
    app("run.seed = %u\n", cfg.seed_u32);
    app("run.sibling_policy = %s\n", siblingPolicyName(cfg.sibling_policy));
    app("run.telemetry_every = %d\n", cfg.telemetry_every);
    app("# fnv_hash_u32=0x%08X\n", hashRunConfig(cfg));
    return n;
}

std::string configToText(const RunConfig& cfg) {
    std::vector<char> buf(8192 + 16 * (cfg.variants.faulty_sensor.size() + cfg.variants.unstable_boundary.size()
                                      + cfg.variants.hyperstable.size() + cfg.variants.elevated_misattachment.size()));
    const int n = exportConfigText(cfg, buf.data(), static_cast<int>(buf.size()));
    return std::string(buf.data(), static_cast<std::size_t>(n));
}

} // namespace ckpt
