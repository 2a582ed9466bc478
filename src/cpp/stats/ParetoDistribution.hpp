/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Distribution.hpp"

#include <boost/math/distributions/pareto.hpp>
#include <pugixml.hpp>

#include <memory>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

// Pareto type II (Lomax) with support [loc, inf):
//   X = loc + scale * (exp(E / shape) - 1),  E ~ Exp(1).
// With loc == scale this is the classical Pareto distribution with mode scale.
class ParetoDistribution : public Distribution
{
public:
    explicit ParetoDistribution(double shape, double scale = 1.0, double loc = 0.0);

    virtual double sample(RNG& rng) noexcept override;
    virtual double quantile(double p) const override;
    virtual double pdf(double x) const override;
    virtual double mean() const noexcept override;

    [[nodiscard]] double shape() const noexcept { return m_shape; }
    [[nodiscard]] double scale() const noexcept { return m_scale; }
    [[nodiscard]] double loc() const noexcept { return m_loc; }

    [[nodiscard]] static std::unique_ptr<ParetoDistribution> fromXML(pugi::xml_node node);

private:
    double m_shape, m_scale, m_loc;
    boost::math::pareto_distribution<double> m_distribution;
};

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
