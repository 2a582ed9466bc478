/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "SampleSummary.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

//-------------------------------------------------------------------------

using namespace equisim::stats;
using namespace testing;

//-------------------------------------------------------------------------

TEST(SampleSummaryTest, Moments)
{
    const std::vector<double> samples{1.0, 2.0, 3.0, 4.0};

    const auto summary = SampleSummary::compute(samples);

    EXPECT_EQ(summary.count, 4);
    EXPECT_DOUBLE_EQ(summary.mean, 2.5);
    EXPECT_NEAR(summary.variance, 5.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(summary.min, 1.0);
    EXPECT_DOUBLE_EQ(summary.max, 4.0);
    EXPECT_NEAR(summary.lag1Autocorrelation, 0.25, 1e-12);
}

//-------------------------------------------------------------------------

TEST(SampleSummaryTest, Alternating)
{
    const std::vector<double> samples{1.0, -1.0, 1.0, -1.0, 1.0, -1.0};

    EXPECT_NEAR(SampleSummary::compute(samples).lag1Autocorrelation, -5.0 / 6.0, 1e-12);
}

//-------------------------------------------------------------------------

TEST(SampleSummaryTest, Degenerate)
{
    const auto empty = SampleSummary::compute({});
    EXPECT_EQ(empty.count, 0);
    EXPECT_TRUE(std::isnan(empty.mean));
    EXPECT_TRUE(std::isnan(empty.lag1Autocorrelation));

    const std::vector<double> single{7.0};
    const auto one = SampleSummary::compute(single);
    EXPECT_EQ(one.count, 1);
    EXPECT_DOUBLE_EQ(one.mean, 7.0);
    EXPECT_TRUE(std::isnan(one.variance));
    EXPECT_TRUE(std::isnan(one.lag1Autocorrelation));

    const std::vector<double> constant(5, 3.0);
    const auto flat = SampleSummary::compute(constant);
    EXPECT_DOUBLE_EQ(flat.variance, 0.0);
    EXPECT_TRUE(std::isnan(flat.lag1Autocorrelation));
}

//-------------------------------------------------------------------------

TEST(SampleSummaryTest, Format)
{
    const std::vector<double> samples{1.0, 2.0, 3.0, 4.0};

    EXPECT_EQ(
        fmt::format("{}", SampleSummary::compute(samples)),
        "n = 4, mean = 2.5, variance = 1.66667, min = 1, max = 4, acf(1) = 0.2500");
}

//-------------------------------------------------------------------------
