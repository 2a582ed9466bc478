/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "RNG.hpp"

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

struct Distribution
{
    virtual ~Distribution() noexcept = default;

    [[nodiscard]] virtual double sample(RNG& rng) noexcept = 0;
    [[nodiscard]] virtual double quantile(double p) const = 0;
    [[nodiscard]] virtual double pdf(double x) const = 0;
    [[nodiscard]] virtual double mean() const noexcept = 0;
};

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
