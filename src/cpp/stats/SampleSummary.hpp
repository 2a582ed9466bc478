/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <span>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

struct SampleSummary
{
    std::size_t count{};
    double mean{}, variance{}, min{}, max{};
    double lag1Autocorrelation{};

    [[nodiscard]] static SampleSummary compute(std::span<const double> samples);
};

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<equisim::stats::SampleSummary>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const equisim::stats::SampleSummary& summary, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "n = {}, mean = {:.6g}, variance = {:.6g}, min = {:.6g}, max = {:.6g}, acf(1) = {:.4f}",
            summary.count,
            summary.mean,
            summary.variance,
            summary.min,
            summary.max,
            summary.lag1Autocorrelation);
    }
};

//-------------------------------------------------------------------------
