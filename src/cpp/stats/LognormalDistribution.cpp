/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LognormalDistribution.hpp"

#include "NormalDistribution.hpp"

#include <fmt/format.h>

#include <cmath>
#include <source_location>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

LognormalDistribution::LognormalDistribution(double mu, double sigma)
    : m_mu{mu},
      m_sigma{[&] {
          if (!std::isfinite(mu) || !(sigma > 0.0) || !std::isfinite(sigma)) {
              throw std::invalid_argument{fmt::format(
                  "{}: expected finite mu and sigma > 0.0, got mu = {}, sigma = {}",
                  std::source_location::current().function_name(), mu, sigma)};
          }
          return sigma;
      }()},
      m_distribution{mu, sigma}
{}

//-------------------------------------------------------------------------

double LognormalDistribution::sample(RNG& rng) noexcept
{
    return std::exp(m_mu + m_sigma * NormalDistribution::standard(rng, m_spare));
}

//-------------------------------------------------------------------------

double LognormalDistribution::quantile(double p) const
{
    return boost::math::quantile(m_distribution, p);
}

//-------------------------------------------------------------------------

double LognormalDistribution::pdf(double x) const
{
    return boost::math::pdf(m_distribution, x);
}

//-------------------------------------------------------------------------

double LognormalDistribution::mean() const noexcept
{
    return std::exp(m_mu + 0.5 * m_sigma * m_sigma);
}

//-------------------------------------------------------------------------

std::unique_ptr<LognormalDistribution> LognormalDistribution::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    return std::make_unique<LognormalDistribution>(
        [&] {
            if (pugi::xml_attribute attr = node.attribute("mu")) {
                return attr.as_double();
            }
            throw std::invalid_argument{fmt::format(
                "{}: missing required attribute 'mu'", ctx)};
        }(),
        [&] {
            if (pugi::xml_attribute attr = node.attribute("sigma")) {
                return attr.as_double();
            }
            throw std::invalid_argument{fmt::format(
                "{}: missing required attribute 'sigma'", ctx)};
        }());
}

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
