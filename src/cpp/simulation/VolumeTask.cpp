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

VolumeTask::VolumeTask(
    std::string name,
    uint64_t seed,
    calendar::Date start,
    calendar::Date end,
    double paretoShape)
    : ScenarioTask{std::move(name), seed},
      m_start{start},
      m_end{end},
      m_generator{paretoShape, seed, "Volume"}
{
    // Rejects inverted ranges at configuration time.
    [[maybe_unused]] const auto dayCount = calendar::businessDayCount(start, end);
}

//-------------------------------------------------------------------------

void VolumeTask::run(const ScenarioContext& ctx)
{
    fmt::println(
        "Generating volume '{}' over {} .. {} (pareto shape {}, seed {})",
        m_name,
        calendar::formatDate(m_start),
        calendar::formatDate(m_end),
        m_generator.paretoShape(),
        m_seed);

    m_result = m_generator.generate(m_start, m_end);
    ctx.logDebug("  {} business days, {} draws", m_result.size(), m_generator.rng().callCount());

    const std::span<const series::DateSeries<uint64_t>> columns{&m_result, 1};
    m_output = ctx.outputPath(m_name);
    switch (ctx.format) {
        case OutputFormat::csv:
            series::writeCSV(m_output, columns);
            break;
        case OutputFormat::json:
            series::writeJSON(m_output, columns);
            break;
    }
    ctx.logDebug("  written to {}", m_output.string());

    const auto values = m_result.values
        | views::transform([](uint64_t v) { return static_cast<double>(v); })
        | ranges::to<std::vector>();
    fmt::println("  {}", stats::SampleSummary::compute(values));

    if (ctx.render) {
        fmt::print("{}", series::formatHead(columns));
    }
}

//-------------------------------------------------------------------------

std::unique_ptr<VolumeTask> VolumeTask::fromXML(
    pugi::xml_node node, std::string name, uint64_t seed)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    return std::make_unique<VolumeTask>(
        std::move(name),
        seed,
        calendar::parseDate(util::requireAttribute(node, "start", ctx).as_string()),
        calendar::parseDate(util::requireAttribute(node, "end", ctx).as_string()),
        util::requireAttribute(node, "paretoShape", ctx).as_double());
}

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------
