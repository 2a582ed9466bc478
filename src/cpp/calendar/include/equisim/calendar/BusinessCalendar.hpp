/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <date/date.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace equisim::calendar
{

//-------------------------------------------------------------------------

using Date = date::sys_days;

[[nodiscard]] Date parseDate(std::string_view str);
[[nodiscard]] std::string formatDate(Date d);

[[nodiscard]] bool isBusinessDay(Date d) noexcept;

// First business day on or after d.
[[nodiscard]] Date rollForward(Date d) noexcept;

// Weekdays in [start, end], both ends inclusive. Throws if end precedes start.
[[nodiscard]] std::vector<Date> businessDays(Date start, Date end);
[[nodiscard]] std::size_t businessDayCount(Date start, Date end);

//-------------------------------------------------------------------------

}  // namespace equisim::calendar

//-------------------------------------------------------------------------
