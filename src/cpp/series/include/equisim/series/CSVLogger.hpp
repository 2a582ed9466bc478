/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace equisim::series
{

//-------------------------------------------------------------------------

// Table sink: one line per call, written verbatim and flushed.
class CSVLogger
{
public:
    CSVLogger(const fs::path& filepath, std::span<const std::string> columns);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    template<typename... Args>
    void log(fmt::format_string<Args...> fmt, Args&&... args)
    {
        m_logger->trace(fmt::format(fmt, std::forward<Args>(args)...));
        m_logger->flush();
    }

private:
    fs::path m_filepath;
    std::unique_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

}  // namespace equisim::series

//-------------------------------------------------------------------------
