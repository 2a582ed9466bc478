/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/series/SeriesWriter.hpp"
#include "equisim/simulation/Tasks.hpp"
#include "SampleSummary.hpp"
#include "util.hpp"

//-------------------------------------------------------------------------

namespace equisim::simulation
{

//-------------------------------------------------------------------------

namespace
{

size_t checkPathCount(size_t pathCount)
{
    if (pathCount == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: path count must be positive",
            std::source_location::current().function_name())};
    }
    return pathCount;
}

}  // namespace

//-------------------------------------------------------------------------

PricePathTask::PricePathTask(
    std::string name,
    uint64_t seed,
    calendar::Date start,
    calendar::Date end,
    std::unique_ptr<series::PriceGenerator> generator,
    size_t pathCount)
    : ScenarioTask{std::move(name), seed},
      m_start{start},
      m_end{end},
      m_generator{std::move(generator)},
      m_pathCount{checkPathCount(pathCount)}
{
    // Rejects inverted ranges at configuration time.
    [[maybe_unused]] const auto dayCount = calendar::businessDayCount(start, end);
}

//-------------------------------------------------------------------------

PricePathTask::PricePathTask(
    std::string name,
    uint64_t seed,
    std::unique_ptr<GBM> gbm,
    size_t steps,
    size_t pathCount)
    : ScenarioTask{std::move(name), seed},
      m_gbm{std::move(gbm)},
      m_steps{steps},
      m_pathCount{checkPathCount(pathCount)}
{}

//-------------------------------------------------------------------------

const RNG& PricePathTask::rng() const noexcept
{
    return dated() ? m_generator->process().rng() : m_gbm->rng();
}

//-------------------------------------------------------------------------

void PricePathTask::run(const ScenarioContext& ctx)
{
    m_output = ctx.outputPath(m_name);
    if (dated()) {
        runDated(ctx);
    } else {
        runHorizon(ctx);
    }
    ctx.logDebug("  written to {}", m_output.string());
}

//-------------------------------------------------------------------------

void PricePathTask::runDated(const ScenarioContext& ctx)
{
    fmt::println(
        "Generating {} price path(s) '{}' over {} .. {} (seed {})",
        m_pathCount,
        m_name,
        calendar::formatDate(m_start),
        calendar::formatDate(m_end),
        m_seed);

    m_datedResult = m_generator->generate(m_start, m_end, m_pathCount);

    const std::span<const series::DateSeries<double>> columns{m_datedResult};
    switch (ctx.format) {
        case OutputFormat::csv:
            series::writeCSV(m_output, columns);
            break;
        case OutputFormat::json:
            series::writeJSON(m_output, columns);
            break;
    }

    for (const auto& path : m_datedResult) {
        if (path.size() < 2) continue;
        const auto logReturns = views::zip(path.values, path.values | views::drop(1))
            | views::transform([](auto&& pair) {
                  auto [prev, next] = pair;
                  return std::log(next / prev);
              })
            | ranges::to<std::vector>();
        ctx.logDebug("  {} log returns: {}", path.name, stats::SampleSummary::compute(logReturns));
        fmt::println("  {}: {:.4f} -> {:.4f}", path.name, path.values.front(), path.values.back());
    }

    if (ctx.render) {
        fmt::print("{}", series::formatHead(columns));
    }
}

//-------------------------------------------------------------------------

void PricePathTask::runHorizon(const ScenarioContext& ctx)
{
    fmt::println(
        "Generating {} GBM path(s) '{}' with {} steps of dt = {} (seed {})",
        m_pathCount,
        m_name,
        m_steps,
        m_gbm->dt(),
        m_seed);

    m_ensembleResult = makePathEnsemble(*m_gbm, m_steps, m_pathCount);

    switch (ctx.format) {
        case OutputFormat::csv:
            series::writeEnsembleCSV(m_output, m_ensembleResult);
            break;
        case OutputFormat::json:
            json::dumpJson(series::ensembleToJson(m_ensembleResult), m_output);
            break;
    }

    const auto terminal = m_ensembleResult.paths
        | views::transform([](const auto& path) { return path.back(); })
        | ranges::to<std::vector>();
    fmt::println("  terminal values: {}", stats::SampleSummary::compute(terminal));
}

//-------------------------------------------------------------------------

std::unique_ptr<PricePathTask> PricePathTask::fromXML(
    pugi::xml_node node, std::string name, uint64_t seed)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const size_t pathCount = node.attribute("paths").as_ullong(1);

    if (node.attribute("start") || node.attribute("end")) {
        auto getAttribute = [&](const char* attr) {
            return util::requireAttribute(node, attr, ctx).as_double();
        };
        return std::make_unique<PricePathTask>(
            std::move(name),
            seed,
            calendar::parseDate(util::requireAttribute(node, "start", ctx).as_string()),
            calendar::parseDate(util::requireAttribute(node, "end", ctx).as_string()),
            std::make_unique<series::PriceGenerator>(
                getAttribute("S0"),
                getAttribute("mu"),
                getAttribute("sigma"),
                seed,
                node.attribute("tradingDaysPerYear").as_double(
                    series::PriceGenerator::kTradingDaysPerYear)),
            pathCount);
    }

    return std::make_unique<PricePathTask>(
        std::move(name),
        seed,
        GBM::fromXML(node, seed),
        util::requireAttribute(node, "steps", ctx).as_ullong(),
        pathCount);
}

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------
