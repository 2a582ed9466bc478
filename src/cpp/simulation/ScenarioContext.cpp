/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/simulation/ScenarioContext.hpp"

#include <fmt/ranges.h>

#include <source_location>

//-------------------------------------------------------------------------

namespace equisim::simulation
{

//-------------------------------------------------------------------------

OutputFormat parseOutputFormat(std::string_view str)
{
    if (auto format = magic_enum::enum_cast<OutputFormat>(str)) {
        return *format;
    }
    throw std::invalid_argument{fmt::format(
        "{}: Unknown output format '{}', expected one of {}",
        std::source_location::current().function_name(),
        str,
        fmt::join(magic_enum::enum_names<OutputFormat>(), ", "))};
}

//-------------------------------------------------------------------------

fs::path ScenarioContext::outputPath(std::string_view stem) const
{
    return outputDir / fmt::format("{}.{}", stem, format);
}

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------
