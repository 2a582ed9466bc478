/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "NormalDistribution.hpp"

#include "util.hpp"

#include <fmt/format.h>

#include <cmath>
#include <source_location>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

namespace
{

double checkScale(double mu, double sigma, const char* ctx)
{
    if (!std::isfinite(mu) || !(sigma > 0.0) || !std::isfinite(sigma)) {
        throw std::invalid_argument{fmt::format(
            "{}: expected finite mu and sigma > 0.0, got mu = {}, sigma = {}", ctx, mu, sigma)};
    }
    return sigma;
}

}  // namespace

//-------------------------------------------------------------------------

NormalDistribution::NormalDistribution(double mu, double sigma)
    : m_mu{mu},
      m_sigma{checkScale(mu, sigma, std::source_location::current().function_name())},
      m_distribution{mu, sigma}
{}

//-------------------------------------------------------------------------

double NormalDistribution::sample(RNG& rng) noexcept
{
    return m_mu + m_sigma * standard(rng, m_spare);
}

//-------------------------------------------------------------------------

double NormalDistribution::quantile(double p) const
{
    return boost::math::quantile(m_distribution, p);
}

//-------------------------------------------------------------------------

double NormalDistribution::pdf(double x) const
{
    return boost::math::pdf(m_distribution, x);
}

//-------------------------------------------------------------------------

double NormalDistribution::standard(RNG& rng, std::optional<double>& spare) noexcept
{
    if (spare) {
        const double z = *spare;
        spare.reset();
        return z;
    }

    double x1, x2, r2;
    do {
        x1 = 2.0 * rng.uniform() - 1.0;
        x2 = 2.0 * rng.uniform() - 1.0;
        r2 = x1 * x1 + x2 * x2;
    } while (r2 >= 1.0 || r2 == 0.0);

    const double f = std::sqrt(-2.0 * std::log(r2) / r2);
    spare = f * x1;
    return f * x2;
}

//-------------------------------------------------------------------------

std::unique_ptr<NormalDistribution> NormalDistribution::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    return std::make_unique<NormalDistribution>(
        node.attribute("mu").as_double(0.0),
        util::requireAttribute(node, "sigma", ctx).as_double());
}

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
