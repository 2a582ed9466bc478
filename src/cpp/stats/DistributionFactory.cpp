/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "DistributionFactory.hpp"

#include "LognormalDistribution.hpp"
#include "NormalDistribution.hpp"
#include "ParetoDistribution.hpp"

#include <fmt/format.h>

#include <source_location>
#include <string_view>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

std::unique_ptr<Distribution> DistributionFactory::createFromXML(pugi::xml_node node)
{
    std::string_view type = node.attribute("type").as_string();

    if (type == "normal") {
        return NormalDistribution::fromXML(node);
    }
    else if (type == "lognormal") {
        return LognormalDistribution::fromXML(node);
    }
    else if (type == "pareto") {
        return ParetoDistribution::fromXML(node);
    }

    throw std::invalid_argument{fmt::format(
        "{}: Unknown distribution type '{}'",
        std::source_location::current().function_name(),
        type)};
}

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
