/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "equisim/series/CSVLogger.hpp"
#include "equisim/series/DateSeries.hpp"
#include "Distribution.hpp"
#include "GBM.hpp"
#include "Histogram.hpp"
#include "SimulationException.hpp"
#include "common.hpp"
#include "json_util.hpp"

#include <fmt/ranges.h>
#include <rapidjson/document.h>

#include <algorithm>
#include <concepts>

//-------------------------------------------------------------------------

namespace equisim::series
{

//-------------------------------------------------------------------------

template<typename T>
void checkAligned(std::span<const DateSeries<T>> columns)
{
    for (const auto& column : columns) {
        if (column.index.size() != column.values.size()
            || column.index != columns.front().index) {
            throw SimulationException{fmt::format(
                "{}: Series '{}' is not aligned with '{}'",
                std::source_location::current().function_name(),
                column.name,
                columns.front().name)};
        }
    }
}

//-------------------------------------------------------------------------

template<typename T>
void writeCSV(const fs::path& path, std::span<const DateSeries<T>> columns)
{
    checkAligned(columns);

    std::vector<std::string> header{"Date"};
    for (const auto& column : columns) {
        header.push_back(column.name);
    }
    CSVLogger logger{path, header};

    if (columns.empty()) return;
    for (const auto& [i, date] : views::enumerate(columns.front().index)) {
        logger.log(
            "{},{}",
            calendar::formatDate(date),
            fmt::join(
                columns | views::transform([i](const auto& column) { return column.values[i]; }),
                ","));
    }
}

//-------------------------------------------------------------------------

// {"index": [dates...], "columns": {name: [values...], ...}}
template<typename T>
[[nodiscard]] rapidjson::Document toJson(std::span<const DateSeries<T>> columns)
{
    checkAligned(columns);

    rapidjson::Document json;
    json.SetObject();
    auto& allocator = json.GetAllocator();

    rapidjson::Value index{rapidjson::kArrayType};
    if (!columns.empty()) {
        for (calendar::Date date : columns.front().index) {
            index.PushBack(rapidjson::Value{calendar::formatDate(date).c_str(), allocator}, allocator);
        }
    }
    json.AddMember("index", index, allocator);

    rapidjson::Value columnsJson{rapidjson::kObjectType};
    for (const auto& column : columns) {
        rapidjson::Value values{rapidjson::kArrayType};
        for (T value : column.values) {
            values.PushBack(rapidjson::Value{value}, allocator);
        }
        columnsJson.AddMember(rapidjson::Value{column.name.c_str(), allocator}, values, allocator);
    }
    json.AddMember("columns", columnsJson, allocator);

    return json;
}

template<typename T>
void writeJSON(const fs::path& path, std::span<const DateSeries<T>> columns)
{
    json::dumpJson(toJson(columns), path);
}

//-------------------------------------------------------------------------

// First rows of aligned series as a fixed-width text table.
template<typename T>
[[nodiscard]] std::string formatHead(std::span<const DateSeries<T>> columns, size_t rows = 5)
{
    checkAligned(columns);

    std::string out = fmt::format("{:<10}", "Date");
    for (const auto& column : columns) {
        out += fmt::format(" {:>14}", column.name);
    }
    out += '\n';
    if (columns.empty()) return out;

    const size_t n = std::min(rows, columns.front().size());
    for (size_t i = 0; i < n; ++i) {
        out += calendar::formatDate(columns.front().index[i]);
        for (const auto& column : columns) {
            if constexpr (std::floating_point<T>) {
                out += fmt::format(" {:>14.4f}", column.values[i]);
            } else {
                out += fmt::format(" {:>14}", column.values[i]);
            }
        }
        out += '\n';
    }
    return out;
}

//-------------------------------------------------------------------------

// BinLow,BinHigh,Count,Density[,Pdf]
void writeHistogramCSV(
    const fs::path& path,
    const stats::Histogram& histogram,
    const stats::Distribution* reference = nullptr);

[[nodiscard]] rapidjson::Document histogramToJson(
    const stats::Histogram& histogram, const stats::Distribution* reference = nullptr);

// Time,Path0,Path1,...
void writeEnsembleCSV(const fs::path& path, const PathEnsemble& ensemble);

[[nodiscard]] rapidjson::Document ensembleToJson(const PathEnsemble& ensemble);

//-------------------------------------------------------------------------

}  // namespace equisim::series

//-------------------------------------------------------------------------
