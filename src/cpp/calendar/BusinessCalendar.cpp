/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/calendar/BusinessCalendar.hpp"

#include <fmt/format.h>

#include <source_location>
#include <sstream>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace equisim::calendar
{

//-------------------------------------------------------------------------

namespace
{

void checkRange(Date start, Date end, const char* ctx)
{
    if (end < start) {
        throw std::invalid_argument{fmt::format(
            "{}: end date {} precedes start date {}", ctx, formatDate(end), formatDate(start))};
    }
}

}  // namespace

//-------------------------------------------------------------------------

Date parseDate(std::string_view str)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::istringstream in{std::string{str}};
    date::year_month_day ymd{};
    in >> date::parse("%Y-%m-%d", ymd);
    if (in.fail() || !ymd.ok() || in.peek() != std::char_traits<char>::eof()) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' is not a valid YYYY-MM-DD date", ctx, str)};
    }
    return Date{ymd};
}

//-------------------------------------------------------------------------

std::string formatDate(Date d)
{
    return date::format("%F", d);
}

//-------------------------------------------------------------------------

bool isBusinessDay(Date d) noexcept
{
    const date::weekday wd{d};
    return wd != date::Saturday && wd != date::Sunday;
}

//-------------------------------------------------------------------------

Date rollForward(Date d) noexcept
{
    while (!isBusinessDay(d)) {
        d += date::days{1};
    }
    return d;
}

//-------------------------------------------------------------------------

std::vector<Date> businessDays(Date start, Date end)
{
    checkRange(start, end, std::source_location::current().function_name());

    std::vector<Date> days;
    days.reserve(businessDayCount(start, end));
    for (Date d = rollForward(start); d <= end; d = rollForward(d + date::days{1})) {
        days.push_back(d);
    }
    return days;
}

//-------------------------------------------------------------------------

std::size_t businessDayCount(Date start, Date end)
{
    checkRange(start, end, std::source_location::current().function_name());

    const auto span = static_cast<std::size_t>((end - start).count()) + 1;
    const std::size_t weeks = span / 7;
    std::size_t count = weeks * 5;
    for (Date d = start + date::days{static_cast<int>(weeks * 7)}; d <= end; d += date::days{1}) {
        count += isBusinessDay(d);
    }
    return count;
}

//-------------------------------------------------------------------------

}  // namespace equisim::calendar

//-------------------------------------------------------------------------
