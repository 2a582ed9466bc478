/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/series/PriceGenerator.hpp"

//-------------------------------------------------------------------------

namespace equisim::series
{

//-------------------------------------------------------------------------

PriceGenerator::PriceGenerator(
    double S0, double mu, double sigma, uint64_t seed, double tradingDaysPerYear)
    : m_gbm{
        S0,
        mu,
        sigma,
        [&] {
            if (!(tradingDaysPerYear > 0.0)) {
                throw std::invalid_argument{fmt::format(
                    "{}: trading days per year must be positive, was {}",
                    std::source_location::current().function_name(),
                    tradingDaysPerYear)};
            }
            return 1.0 / tradingDaysPerYear;
        }(),
        seed}
{}

//-------------------------------------------------------------------------

std::vector<DateSeries<double>> PriceGenerator::generate(
    calendar::Date start, calendar::Date end, size_t pathCount)
{
    const auto dates = calendar::businessDays(start, end);
    return generate(dates, pathCount);
}

//-------------------------------------------------------------------------

std::vector<DateSeries<double>> PriceGenerator::generate(
    std::span<const calendar::Date> dates, size_t pathCount)
{
    std::vector<DateSeries<double>> paths;
    paths.reserve(pathCount);

    for (size_t p = 0; p < pathCount; ++p) {
        auto& series = paths.emplace_back(DateSeries<double>{
            .name = pathCount == 1 ? "Close" : fmt::format("Path{}", p),
            .index = {dates.begin(), dates.end()}});
        if (dates.empty()) continue;

        series.values.reserve(dates.size());
        m_gbm.reset();
        series.values.push_back(m_gbm.value());

        bs2::scoped_connection feed = m_gbm.valueSignal().connect(
            [&series](double value) { series.values.push_back(value); });
        for (Timestamp step = 1; step < dates.size(); ++step) {
            m_gbm.update(step);
        }
    }

    return paths;
}

//-------------------------------------------------------------------------

}  // namespace equisim::series

//-------------------------------------------------------------------------
