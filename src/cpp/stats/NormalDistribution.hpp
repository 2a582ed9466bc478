/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Distribution.hpp"

#include <boost/math/distributions/normal.hpp>
#include <pugixml.hpp>

#include <memory>
#include <optional>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

// Marsaglia polar method; each accepted pair yields two variates, the second
// one is kept for the next call.
class NormalDistribution : public Distribution
{
public:
    NormalDistribution(double mu = 0.0, double sigma = 1.0);

    virtual double sample(RNG& rng) noexcept override;
    virtual double quantile(double p) const override;
    virtual double pdf(double x) const override;
    virtual double mean() const noexcept override { return m_mu; }

    [[nodiscard]] double stddev() const noexcept { return m_sigma; }

    [[nodiscard]] static double standard(RNG& rng, std::optional<double>& spare) noexcept;

    [[nodiscard]] static std::unique_ptr<NormalDistribution> fromXML(pugi::xml_node node);

private:
    double m_mu, m_sigma;
    std::optional<double> m_spare;
    boost::math::normal_distribution<double> m_distribution;
};

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
