/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/series/VolumeGenerator.hpp"

#include <cmath>
#include <limits>

//-------------------------------------------------------------------------

namespace equisim::series
{

//-------------------------------------------------------------------------

VolumeGenerator::VolumeGenerator(double paretoShape, uint64_t seed, std::string name)
    : m_rng{seed}, m_distribution{paretoShape}, m_name{std::move(name)}
{}

//-------------------------------------------------------------------------

DateSeries<uint64_t> VolumeGenerator::generate(calendar::Date start, calendar::Date end)
{
    const auto dates = calendar::businessDays(start, end);
    return generate(dates);
}

//-------------------------------------------------------------------------

DateSeries<uint64_t> VolumeGenerator::generate(std::span<const calendar::Date> dates)
{
    DateSeries<uint64_t> series{.name = m_name, .index = {dates.begin(), dates.end()}};
    series.values.reserve(dates.size());
    for (size_t i = 0; i < dates.size(); ++i) {
        series.values.push_back(toVolume(m_distribution.sample(m_rng)));
    }
    return series;
}

//-------------------------------------------------------------------------

uint64_t VolumeGenerator::toVolume(double draw) noexcept
{
    static constexpr double kLimit = 18446744073709551616.0;  // 2^64

    const double scaled = draw * kVolumeScale;
    if (!(scaled > 0.0)) return 0;
    if (scaled >= kLimit) return std::numeric_limits<uint64_t>::max();
    return static_cast<uint64_t>(scaled);
}

//-------------------------------------------------------------------------

}  // namespace equisim::series

//-------------------------------------------------------------------------
