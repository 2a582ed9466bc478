/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/series/CSVLogger.hpp"

#include "SimulationException.hpp"

#include <fmt/ranges.h>
#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace equisim::series
{

//-------------------------------------------------------------------------

CSVLogger::CSVLogger(const fs::path& filepath, std::span<const std::string> columns)
    : m_filepath{filepath}
{
    try {
        m_logger = std::make_unique<spdlog::logger>(
            fmt::format("CSVLogger-{}", filepath.stem().c_str()),
            std::make_unique<spdlog::sinks::basic_file_sink_st>(filepath.string(), true));
    }
    catch (const spdlog::spdlog_ex& e) {
        throw SimulationException{fmt::format(
            "{}: Unable to open '{}': {}",
            std::source_location::current().function_name(), filepath.c_str(), e.what())};
    }
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace(fmt::format("{}", fmt::join(columns, ",")));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace equisim::series

//-------------------------------------------------------------------------
