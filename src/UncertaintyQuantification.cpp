#include "UncertaintyQuantification.h"

#include "Simulation.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace ckpt {

namespace {
std::vector<double> latinHypercubeSamples(double min_val, double max_val, int samples, std::mt19937& rng) {
    std::vector<double> bins;
    bins.reserve(static_cast<std::size_t>(samples));

    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    for (int i = 0; i < samples; ++i) {
        const double u = (static_cast<double>(i) + unit_dist(rng)) / static_cast<double>(samples);
        bins.push_back(u);
    }
    std::shuffle(bins.begin(), bins.end(), rng);

    const double span = max_val - min_val;
    for (double& v : bins) {
        v = min_val + span * v;
    }
    return bins;
}

int clampSamples(int samples) {
    return samples < 1 ? 1 : samples;
}
} // namespace

MonteCarloUQ::MonteCarloUQ() = default;

void MonteCarloUQ::setBaseConfig(const RunConfig& cfg) {
    base_ = cfg;
}

void MonteCarloUQ::setRanges(const UQRanges& ranges) {
    ranges_ = ranges;
}

MonteCarloUQ::UQResult MonteCarloUQ::summarize(const std::vector<double>& values) const {
    UQResult result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(const RunConfig& base, int num_samples) const {
    const int samples = clampSamples(num_samples);
    std::mt19937 rng(1337u);

    auto noise_samples = latinHypercubeSamples(ranges_.noise_level.min,
                                               ranges_.noise_level.max,
                                               samples,
                                               rng);
    auto attach_samples = latinHypercubeSamples(ranges_.attach_probability.min,
                                                ranges_.attach_probability.max,
                                                samples,
                                                rng);
    auto detach_samples = latinHypercubeSamples(ranges_.detach_probability.min,
                                                ranges_.detach_probability.max,
                                                samples,
                                                rng);
    auto misattach_samples = latinHypercubeSamples(ranges_.misattach_probability.min,
                                                   ranges_.misattach_probability.max,
                                                   samples,
                                                   rng);

    std::vector<double> end_tick;
    std::vector<double> commit_tick;
    std::vector<double> final_mcc;
    std::vector<double> misattachment_events;
    end_tick.reserve(static_cast<std::size_t>(samples));
    final_mcc.reserve(static_cast<std::size_t>(samples));
    misattachment_events.reserve(static_cast<std::size_t>(samples));

    UQSummary summary{};
    int violated = 0;
    int apoptotic = 0;

    Simulation sim;
    for (int i = 0; i < samples; ++i) {
        RunConfig varied = base;
        varied.physics.noise_level = noise_samples[i];
        varied.physics.attach_probability = attach_samples[i];
        varied.physics.detach_probability = detach_samples[i];
        varied.physics.misattach_probability = misattach_samples[i];
        varied.seed_u32 = base.seed_u32 + static_cast<std::uint32_t>(i);

        if (!sim.reset(varied, nullptr)) {
            summary.rejected++;
            continue;
        }
        sim.run();

        const TickObservation o = sim.observe();
        end_tick.push_back(static_cast<double>(o.tick));
        final_mcc.push_back(o.bus_concentration);
        misattachment_events.push_back(static_cast<double>(sim.monitor().misattachmentEvents().size()));
        if (sim.outcome() == MitosisOutcome::AnaphaseCompleted) {
            commit_tick.push_back(static_cast<double>(sim.commitTick()));
        }
        if (!sim.monitor().passed()) violated++;
        if (sim.outcome() == MitosisOutcome::Apoptosis) apoptotic++;
    }

    summary.samples = static_cast<int>(end_tick.size());
    if (summary.samples > 0) {
        const double n = static_cast<double>(summary.samples);
        summary.commit_fraction = static_cast<double>(commit_tick.size()) / n;
        summary.violation_fraction = violated / n;
        summary.apoptosis_fraction = apoptotic / n;
    }
    summary.end_tick = summarize(end_tick);
    summary.commit_tick = summarize(commit_tick);
    summary.final_mcc = summarize(final_mcc);
    summary.misattachment_events = summarize(misattachment_events);
    return summary;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(int num_samples) const {
    return runMonteCarlo(base_, num_samples);
}

} // namespace ckpt
