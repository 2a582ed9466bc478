/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/series/SeriesWriter.hpp"

//-------------------------------------------------------------------------

namespace equisim::series
{

//-------------------------------------------------------------------------

namespace
{

std::vector<std::string> pathNames(size_t pathCount)
{
    return views::iota(0uz, pathCount)
        | views::transform([](size_t i) { return fmt::format("Path{}", i); })
        | ranges::to<std::vector>();
}

}  // namespace

//-------------------------------------------------------------------------

void writeHistogramCSV(
    const fs::path& path,
    const stats::Histogram& histogram,
    const stats::Distribution* reference)
{
    std::vector<std::string> header{"BinLow", "BinHigh", "Count", "Density"};
    if (reference != nullptr) {
        header.push_back("Pdf");
    }
    CSVLogger logger{path, header};

    for (size_t i = 0; i < histogram.binCount(); ++i) {
        if (reference != nullptr) {
            logger.log(
                "{},{},{},{},{}",
                histogram.binLow(i),
                histogram.binHigh(i),
                histogram.count(i),
                histogram.density(i),
                reference->pdf(histogram.binCenter(i)));
        } else {
            logger.log(
                "{},{},{},{}",
                histogram.binLow(i),
                histogram.binHigh(i),
                histogram.count(i),
                histogram.density(i));
        }
    }
}

//-------------------------------------------------------------------------

rapidjson::Document histogramToJson(
    const stats::Histogram& histogram, const stats::Distribution* reference)
{
    rapidjson::Document json;
    json.SetObject();
    auto& allocator = json.GetAllocator();

    rapidjson::Value bins{rapidjson::kArrayType};
    for (size_t i = 0; i < histogram.binCount(); ++i) {
        rapidjson::Value bin{rapidjson::kObjectType};
        bin.AddMember("low", rapidjson::Value{histogram.binLow(i)}, allocator);
        bin.AddMember("high", rapidjson::Value{histogram.binHigh(i)}, allocator);
        bin.AddMember("count", rapidjson::Value{histogram.count(i)}, allocator);
        bin.AddMember("density", rapidjson::Value{histogram.density(i)}, allocator);
        if (reference != nullptr) {
            bin.AddMember(
                "pdf", rapidjson::Value{reference->pdf(histogram.binCenter(i))}, allocator);
        }
        bins.PushBack(bin, allocator);
    }
    json.AddMember("bins", bins, allocator);
    json.AddMember("underflow", rapidjson::Value{histogram.underflow()}, allocator);
    json.AddMember("overflow", rapidjson::Value{histogram.overflow()}, allocator);
    json.AddMember("total", rapidjson::Value{histogram.total()}, allocator);

    return json;
}

//-------------------------------------------------------------------------

void writeEnsembleCSV(const fs::path& path, const PathEnsemble& ensemble)
{
    std::vector<std::string> header{"Time"};
    ranges::push_back(header, pathNames(ensemble.paths.size()));
    CSVLogger logger{path, header};

    for (const auto& [i, t] : views::enumerate(ensemble.time)) {
        logger.log(
            "{},{}",
            t,
            fmt::join(
                ensemble.paths | views::transform([i](const auto& path) { return path[i]; }),
                ","));
    }
}

//-------------------------------------------------------------------------

rapidjson::Document ensembleToJson(const PathEnsemble& ensemble)
{
    rapidjson::Document json;
    json.SetObject();
    auto& allocator = json.GetAllocator();

    rapidjson::Value time{rapidjson::kArrayType};
    for (double t : ensemble.time) {
        time.PushBack(t, allocator);
    }
    json.AddMember("time", time, allocator);

    const auto names = pathNames(ensemble.paths.size());
    rapidjson::Value paths{rapidjson::kObjectType};
    for (const auto& [name, path] : views::zip(names, ensemble.paths)) {
        rapidjson::Value values{rapidjson::kArrayType};
        for (double value : path) {
            values.PushBack(value, allocator);
        }
        paths.AddMember(rapidjson::Value{name.c_str(), allocator}, values, allocator);
    }
    json.AddMember("paths", paths, allocator);

    return json;
}

//-------------------------------------------------------------------------

}  // namespace equisim::series

//-------------------------------------------------------------------------
