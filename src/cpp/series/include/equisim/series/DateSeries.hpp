/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "equisim/calendar/BusinessCalendar.hpp"

#include <cstddef>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace equisim::series
{

//-------------------------------------------------------------------------

template<typename T>
struct DateSeries
{
    std::string name;
    std::vector<calendar::Date> index;
    std::vector<T> values;

    [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
    [[nodiscard]] bool empty() const noexcept { return values.empty(); }
};

//-------------------------------------------------------------------------

}  // namespace equisim::series

//-------------------------------------------------------------------------
