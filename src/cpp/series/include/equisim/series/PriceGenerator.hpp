/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "equisim/series/DateSeries.hpp"
#include "GBM.hpp"

#include <cstdint>
#include <span>
#include <vector>

//-------------------------------------------------------------------------

namespace equisim::series
{

//-------------------------------------------------------------------------

// GBM price paths stepped once per business day; the first date carries S0.
class PriceGenerator
{
public:
    static constexpr double kTradingDaysPerYear = 252.0;

    PriceGenerator(
        double S0,
        double mu,
        double sigma,
        uint64_t seed,
        double tradingDaysPerYear = kTradingDaysPerYear);

    [[nodiscard]] std::vector<DateSeries<double>> generate(
        calendar::Date start, calendar::Date end, size_t pathCount = 1);
    [[nodiscard]] std::vector<DateSeries<double>> generate(
        std::span<const calendar::Date> dates, size_t pathCount = 1);

    [[nodiscard]] const GBM& process() const noexcept { return m_gbm; }

private:
    GBM m_gbm;
};

//-------------------------------------------------------------------------

}  // namespace equisim::series

//-------------------------------------------------------------------------
