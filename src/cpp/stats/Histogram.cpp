/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Histogram.hpp"

#include "common.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

Histogram::Histogram(double lo, double hi, std::size_t binCount)
    : m_lo{lo}, m_hi{hi}, m_width{(hi - lo) / static_cast<double>(binCount)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (binCount == 0) {
        throw std::invalid_argument{fmt::format("{}: bin count must be positive", ctx)};
    }
    if (!std::isfinite(lo) || !std::isfinite(hi) || !(hi > lo)) {
        throw std::invalid_argument{fmt::format(
            "{}: invalid range [{}, {}]", ctx, lo, hi)};
    }
    m_counts.resize(binCount);
}

//-------------------------------------------------------------------------

void Histogram::add(double x) noexcept
{
    ++m_total;
    if (!(x >= m_lo)) {
        ++m_underflow;
        return;
    }
    if (x > m_hi) {
        ++m_overflow;
        return;
    }
    const auto idx = std::min(
        static_cast<std::size_t>((x - m_lo) / m_width), m_counts.size() - 1);
    ++m_counts[idx];
}

//-------------------------------------------------------------------------

void Histogram::add(std::span<const double> xs) noexcept
{
    for (double x : xs) {
        add(x);
    }
}

//-------------------------------------------------------------------------

double Histogram::binHigh(std::size_t i) const noexcept
{
    return i + 1 == m_counts.size() ? m_hi : binLow(i + 1);
}

//-------------------------------------------------------------------------

double Histogram::density(std::size_t i) const
{
    if (m_total == 0) return 0.0;
    return static_cast<double>(count(i)) / (static_cast<double>(m_total) * m_width);
}

//-------------------------------------------------------------------------

std::string Histogram::render(std::size_t width) const
{
    const uint64_t maxCount = std::ranges::max(m_counts);

    std::string out;
    for (std::size_t i = 0; i < m_counts.size(); ++i) {
        const auto barLength = maxCount == 0
            ? 0uz
            : static_cast<std::size_t>(std::lround(
                static_cast<double>(m_counts[i]) / static_cast<double>(maxCount) * width));
        out += fmt::format(
            "{:>12.4g} | {:<{}} {}\n", binCenter(i), std::string(barLength, '#'), width, m_counts[i]);
    }
    if (m_underflow > 0 || m_overflow > 0) {
        out += fmt::format("{:>12} | underflow {}, overflow {}\n", "", m_underflow, m_overflow);
    }
    return out;
}

//-------------------------------------------------------------------------

Histogram Histogram::fromSamples(
    std::span<const double> samples,
    std::size_t binCount,
    std::optional<std::pair<double, double>> range)
{
    auto [lo, hi] = range.or_else([&]() -> std::optional<std::pair<double, double>> {
        // Non-finite draws land in underflow or overflow.
        auto finite = samples | views::filter([](double x) { return std::isfinite(x); });
        if (ranges::empty(finite)) {
            return std::make_pair(0.0, 1.0);
        }
        const auto [minIt, maxIt] = ranges::minmax_element(finite);
        return std::make_pair(*minIt, *maxIt);
    }).value();

    if (lo == hi) {
        lo -= 0.5;
        hi += 0.5;
    }

    Histogram histogram{lo, hi, binCount};
    histogram.add(samples);
    return histogram;
}

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
