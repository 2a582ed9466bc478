/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "equisim/series/DateSeries.hpp"
#include "ParetoDistribution.hpp"
#include "RNG.hpp"

#include <cstdint>
#include <span>
#include <string>

//-------------------------------------------------------------------------

namespace equisim::series
{

//-------------------------------------------------------------------------

// Daily trading volume as i.i.d. Pareto draws scaled by kVolumeScale and
// truncated towards zero.
class VolumeGenerator
{
public:
    static constexpr double kVolumeScale = 1'000'000.0;

    VolumeGenerator(double paretoShape, uint64_t seed, std::string name = "Volume");

    [[nodiscard]] DateSeries<uint64_t> generate(calendar::Date start, calendar::Date end);
    [[nodiscard]] DateSeries<uint64_t> generate(std::span<const calendar::Date> dates);

    [[nodiscard]] double paretoShape() const noexcept { return m_distribution.shape(); }
    [[nodiscard]] const RNG& rng() const noexcept { return m_rng; }

    // Saturates at the largest uint64_t.
    [[nodiscard]] static uint64_t toVolume(double draw) noexcept;

private:
    RNG m_rng;
    stats::ParetoDistribution m_distribution;
    std::string m_name;
};

//-------------------------------------------------------------------------

}  // namespace equisim::series

//-------------------------------------------------------------------------
