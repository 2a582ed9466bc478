/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/series/SeriesWriter.hpp"
#include "equisim/simulation/Tasks.hpp"
#include "DistributionFactory.hpp"
#include "SampleSummary.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace equisim::simulation
{

//-------------------------------------------------------------------------

DistributionTask::DistributionTask(
    std::string name,
    uint64_t seed,
    std::unique_ptr<stats::Distribution> distribution,
    size_t sampleCount,
    size_t binCount,
    std::optional<double> clip)
    : ScenarioTask{std::move(name), seed},
      m_rng{seed},
      m_distribution{std::move(distribution)},
      m_sampleCount{sampleCount},
      m_binCount{binCount},
      m_clip{clip}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_sampleCount == 0 || m_binCount == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: sample and bin counts must be positive, got {} and {}",
            ctx, m_sampleCount, m_binCount)};
    }
    if (m_clip && !(*m_clip > 0.0 && *m_clip < 1.0)) {
        throw std::invalid_argument{fmt::format(
            "{}: clip quantile must lie in (0, 1), was {}", ctx, *m_clip)};
    }
}

//-------------------------------------------------------------------------

void DistributionTask::run(const ScenarioContext& ctx)
{
    fmt::println(
        "Sampling {} draws from '{}' into {} bins (seed {})",
        m_sampleCount, m_name, m_binCount, m_seed);

    m_samples.resize(m_sampleCount);
    for (double& x : m_samples) {
        x = m_distribution->sample(m_rng);
    }

    auto range = [&]() -> std::optional<std::pair<double, double>> {
        if (!m_clip) return {};
        auto finite = m_samples | views::filter([](double x) { return std::isfinite(x); });
        if (ranges::empty(finite)) return {};
        const double lo = ranges::min(finite);
        const double hi = m_distribution->quantile(*m_clip);
        if (!(hi > lo)) return {};
        return std::make_pair(lo, hi);
    }();
    if (range) {
        ctx.logDebug("  clipping histogram at q({}) = {}", *m_clip, range->second);
    }
    m_histogram = stats::Histogram::fromSamples(m_samples, m_binCount, range);

    m_output = ctx.outputPath(m_name);
    switch (ctx.format) {
        case OutputFormat::csv:
            series::writeHistogramCSV(m_output, *m_histogram, m_distribution.get());
            break;
        case OutputFormat::json:
            json::dumpJson(series::histogramToJson(*m_histogram, m_distribution.get()), m_output);
            break;
    }
    ctx.logDebug("  written to {}", m_output.string());

    fmt::println("  {}", stats::SampleSummary::compute(m_samples));
    fmt::println("  theoretical mean = {:.6g}", m_distribution->mean());

    if (ctx.render) {
        fmt::print("{}", m_histogram->render());
    }
}

//-------------------------------------------------------------------------

std::unique_ptr<DistributionTask> DistributionTask::fromXML(
    pugi::xml_node node, std::string name, uint64_t seed)
{
    return std::make_unique<DistributionTask>(
        std::move(name),
        seed,
        stats::DistributionFactory::createFromXML(node),
        node.attribute("samples").as_ullong(10'000),
        node.attribute("bins").as_ullong(50),
        node.attribute("clip")
            ? std::make_optional(node.attribute("clip").as_double())
            : std::nullopt);
}

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------
