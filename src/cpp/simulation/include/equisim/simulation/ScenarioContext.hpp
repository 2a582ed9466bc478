/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

//-------------------------------------------------------------------------

namespace equisim::simulation
{

//-------------------------------------------------------------------------

enum class OutputFormat { csv, json };

[[nodiscard]] OutputFormat parseOutputFormat(std::string_view str);

//-------------------------------------------------------------------------

struct ScenarioContext
{
    fs::path outputDir{"."};
    OutputFormat format{OutputFormat::csv};
    bool render{true};
    bool debug{false};

    [[nodiscard]] fs::path outputPath(std::string_view stem) const;

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const noexcept
    {
        if (debug) {
            fmt::println(fmt, std::forward<Args>(args)...);
        }
    }
};

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<equisim::simulation::OutputFormat>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(equisim::simulation::OutputFormat format, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(format));
    }
};

//-------------------------------------------------------------------------
