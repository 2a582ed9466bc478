/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ParetoDistribution.hpp"

#include "util.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <source_location>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

namespace
{

double checkArg(double arg, const char* name, const char* ctx)
{
    if (!(arg > 0.0) || !std::isfinite(arg)) {
        throw std::invalid_argument{fmt::format(
            "{}: parameter '{}' should be > 0.0, was {}",
            ctx, name, arg)};
    }
    return arg;
}

}  // namespace

//-------------------------------------------------------------------------

ParetoDistribution::ParetoDistribution(double shape, double scale, double loc)
    : m_shape{checkArg(shape, "shape", std::source_location::current().function_name())},
      m_scale{checkArg(scale, "scale", std::source_location::current().function_name())},
      m_loc{loc},
      m_distribution{scale, shape}
{}

//-------------------------------------------------------------------------

double ParetoDistribution::sample(RNG& rng) noexcept
{
    const double e = -std::log(1.0 - rng.uniform());
    return m_loc + m_scale * std::expm1(e / m_shape);
}

//-------------------------------------------------------------------------

double ParetoDistribution::quantile(double p) const
{
    return boost::math::quantile(m_distribution, p) - m_scale + m_loc;
}

//-------------------------------------------------------------------------

double ParetoDistribution::pdf(double x) const
{
    if (x < m_loc) return 0.0;
    return boost::math::pdf(m_distribution, x - m_loc + m_scale);
}

//-------------------------------------------------------------------------

double ParetoDistribution::mean() const noexcept
{
    if (m_shape <= 1.0) {
        return std::numeric_limits<double>::infinity();
    }
    return m_loc + m_scale / (m_shape - 1.0);
}

//-------------------------------------------------------------------------

std::unique_ptr<ParetoDistribution> ParetoDistribution::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    return std::make_unique<ParetoDistribution>(
        util::requireAttribute(node, "shape", ctx).as_double(),
        node.attribute("scale").as_double(1.0),
        node.attribute("loc").as_double(0.0));
}

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
