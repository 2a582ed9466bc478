/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Distribution.hpp"

#include <boost/math/distributions/lognormal.hpp>
#include <pugixml.hpp>

#include <memory>
#include <optional>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

class LognormalDistribution : public Distribution
{
public:
    LognormalDistribution(double mu, double sigma);

    virtual double sample(RNG& rng) noexcept override;
    virtual double quantile(double p) const override;
    virtual double pdf(double x) const override;
    virtual double mean() const noexcept override;

    [[nodiscard]] static std::unique_ptr<LognormalDistribution> fromXML(pugi::xml_node node);

private:
    double m_mu, m_sigma;
    std::optional<double> m_spare;
    boost::math::lognormal_distribution<double> m_distribution;
};

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
