/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "SampleSummary.hpp"

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>

#include <limits>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

SampleSummary SampleSummary::compute(std::span<const double> samples)
{
    namespace acc = boost::accumulators;

    static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

    if (samples.empty()) {
        return SampleSummary{
            .mean = kNaN, .variance = kNaN, .min = kNaN, .max = kNaN, .lag1Autocorrelation = kNaN};
    }

    acc::accumulator_set<
        double,
        acc::stats<acc::tag::count, acc::tag::mean, acc::tag::variance, acc::tag::min, acc::tag::max>>
        accumulator;
    for (double x : samples) {
        accumulator(x);
    }

    const auto n = acc::count(accumulator);
    const double mean = acc::mean(accumulator);

    SampleSummary summary{
        .count = n,
        .mean = mean,
        .variance = n > 1 ? acc::variance(accumulator) * n / (n - 1) : kNaN,
        .min = acc::min(accumulator),
        .max = acc::max(accumulator),
        .lag1Autocorrelation = kNaN
    };

    double num{}, den{};
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double d = samples[i] - mean;
        den += d * d;
        if (i + 1 < samples.size()) {
            num += d * (samples[i + 1] - mean);
        }
    }
    if (n > 1 && den > 0.0) {
        summary.lag1Autocorrelation = num / den;
    }

    return summary;
}

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
