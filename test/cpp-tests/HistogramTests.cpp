/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Histogram.hpp"
#include "LognormalDistribution.hpp"

#include "common.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

//-------------------------------------------------------------------------

using namespace equisim::stats;
using namespace testing;

//-------------------------------------------------------------------------

TEST(HistogramTest, InvalidConstruction)
{
    EXPECT_THROW(Histogram(0.0, 1.0, 0), std::invalid_argument);
    EXPECT_THROW(Histogram(1.0, 1.0, 4), std::invalid_argument);
    EXPECT_THROW(Histogram(2.0, 1.0, 4), std::invalid_argument);
    EXPECT_THROW(
        Histogram(0.0, std::numeric_limits<double>::infinity(), 4), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(HistogramTest, Binning)
{
    Histogram histogram{0.0, 1.0, 4};

    for (double x : {0.0, 0.25, 0.5, 0.99, 1.0, -0.1, 1.5, std::nan("")}) {
        histogram.add(x);
    }

    EXPECT_THAT(histogram.counts(), ElementsAre(1, 1, 1, 2));
    EXPECT_EQ(histogram.underflow(), 2);
    EXPECT_EQ(histogram.overflow(), 1);
    EXPECT_EQ(histogram.total(), 8);
    EXPECT_THROW(static_cast<void>(histogram.count(4)), std::out_of_range);
}

//-------------------------------------------------------------------------

TEST(HistogramTest, Geometry)
{
    Histogram histogram{-1.0, 1.0, 4};

    EXPECT_DOUBLE_EQ(histogram.binWidth(), 0.5);
    EXPECT_DOUBLE_EQ(histogram.binLow(1), -0.5);
    EXPECT_DOUBLE_EQ(histogram.binHigh(1), 0.0);
    EXPECT_DOUBLE_EQ(histogram.binHigh(3), 1.0);
    EXPECT_DOUBLE_EQ(histogram.binCenter(0), -0.75);
}

//-------------------------------------------------------------------------

TEST(HistogramTest, DensityIncludesOutOfRange)
{
    Histogram histogram{0.0, 1.0, 4};
    EXPECT_DOUBLE_EQ(histogram.density(0), 0.0);

    for (double x : {0.1, 0.6, 0.7, 0.8, 2.0}) {
        histogram.add(x);
    }

    EXPECT_DOUBLE_EQ(histogram.density(0), 1.0 / (5 * 0.25));
    EXPECT_DOUBLE_EQ(histogram.density(2), 2.0 / (5 * 0.25));

    double mass{};
    for (size_t i = 0; i < histogram.binCount(); ++i) {
        mass += histogram.density(i) * histogram.binWidth();
    }
    EXPECT_NEAR(mass, 0.8, 1e-12);
}

//-------------------------------------------------------------------------

TEST(HistogramTest, FromSamplesDefaultRange)
{
    const std::vector<double> samples{3.0, 1.0, 2.0, 5.0, 4.0};

    const auto histogram = Histogram::fromSamples(samples, 4);

    EXPECT_DOUBLE_EQ(histogram.lo(), 1.0);
    EXPECT_DOUBLE_EQ(histogram.hi(), 5.0);
    EXPECT_THAT(histogram.counts(), ElementsAre(1, 1, 1, 2));
    EXPECT_EQ(histogram.underflow() + histogram.overflow(), 0);
}

//-------------------------------------------------------------------------

TEST(HistogramTest, FromSamplesDegenerate)
{
    const std::vector<double> constant(10, 2.0);
    const auto histogram = Histogram::fromSamples(constant, 5);
    EXPECT_DOUBLE_EQ(histogram.lo(), 1.5);
    EXPECT_DOUBLE_EQ(histogram.hi(), 2.5);
    EXPECT_EQ(histogram.count(2), 10);

    const auto empty = Histogram::fromSamples({}, 3);
    EXPECT_DOUBLE_EQ(empty.lo(), 0.0);
    EXPECT_DOUBLE_EQ(empty.hi(), 1.0);
    EXPECT_EQ(empty.total(), 0);
}

//-------------------------------------------------------------------------

TEST(HistogramTest, FromSamplesIgnoresNonFiniteInRange)
{
    constexpr double inf = std::numeric_limits<double>::infinity();
    const std::vector<double> samples{0.5, 3.0, inf, -inf, std::nan("")};

    const auto histogram = Histogram::fromSamples(samples, 10);

    EXPECT_DOUBLE_EQ(histogram.lo(), 0.5);
    EXPECT_DOUBLE_EQ(histogram.hi(), 3.0);
    EXPECT_EQ(histogram.count(0), 1);
    EXPECT_EQ(histogram.count(9), 1);
    EXPECT_EQ(histogram.overflow(), 1);
    EXPECT_EQ(histogram.underflow(), 2);
    EXPECT_EQ(histogram.total(), 5);

    const std::vector<double> allInfinite(3, inf);
    const auto degenerate = Histogram::fromSamples(allInfinite, 2);
    EXPECT_DOUBLE_EQ(degenerate.lo(), 0.0);
    EXPECT_DOUBLE_EQ(degenerate.hi(), 1.0);
    EXPECT_EQ(degenerate.overflow(), 3);
}

//-------------------------------------------------------------------------

TEST(HistogramTest, MatchesReferencePdf)
{
    RNG rng{42};
    LognormalDistribution dist{0.0, 0.5};

    std::vector<double> samples(100'000);
    for (double& x : samples) {
        x = dist.sample(rng);
    }
    const auto histogram = Histogram::fromSamples(
        samples, 30, std::make_pair(0.0, dist.quantile(0.99)));

    EXPECT_NEAR(
        static_cast<double>(histogram.overflow()) / histogram.total(), 0.01, 0.002);
    for (size_t i = 0; i < histogram.binCount(); ++i) {
        EXPECT_NEAR(histogram.density(i), dist.pdf(histogram.binCenter(i)), 0.05)
            << "bin " << i;
    }
}

//-------------------------------------------------------------------------

TEST(HistogramTest, Render)
{
    Histogram histogram{0.0, 4.0, 4};
    for (double x : {0.5, 1.5, 1.6, 3.5, 3.6, 3.7, 3.8, 9.0}) {
        histogram.add(x);
    }

    const auto text = histogram.render(8);
    std::vector<std::string> lines = text
        | views::split('\n')
        | views::transform([](auto&& line) { return ranges::to<std::string>(line); })
        | views::filter([](const std::string& line) { return !line.empty(); })
        | ranges::to<std::vector>();

    ASSERT_THAT(lines, SizeIs(5));
    EXPECT_THAT(lines[0], HasSubstr("| ##       1"));
    EXPECT_THAT(lines[3], HasSubstr("| ######## 4"));
    EXPECT_THAT(lines[4], HasSubstr("underflow 0, overflow 1"));
}

//-------------------------------------------------------------------------
