/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/series/VolumeGenerator.hpp"
#include "SampleSummary.hpp"

#include "common.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

//-------------------------------------------------------------------------

using namespace equisim;
using namespace equisim::series;
using namespace testing;

//-------------------------------------------------------------------------

TEST(VolumeGeneratorTest, ReferenceWeek)
{
    VolumeGenerator generator{1.161, 42};

    const auto volume = generator.generate(
        calendar::parseDate("1970-01-01"), calendar::parseDate("1970-01-07"));

    EXPECT_EQ(volume.name, "Volume");
    EXPECT_THAT(
        volume.index,
        ElementsAre(
            calendar::parseDate("1970-01-01"),
            calendar::parseDate("1970-01-02"),
            calendar::parseDate("1970-01-05"),
            calendar::parseDate("1970-01-06"),
            calendar::parseDate("1970-01-07")));
    EXPECT_THAT(volume.values, ElementsAre(498093, 12365772, 2108523, 1195350, 157314));
    EXPECT_EQ(generator.rng().callCount(), 10);
}

//-------------------------------------------------------------------------

TEST(VolumeGeneratorTest, Deterministic)
{
    const auto start = calendar::parseDate("1970-01-01"), end = calendar::parseDate("1971-06-30");

    const auto lhs = VolumeGenerator{1.161, 42}.generate(start, end);
    const auto rhs = VolumeGenerator{1.161, 42}.generate(start, end);
    const auto other = VolumeGenerator{1.161, 43}.generate(start, end);

    EXPECT_EQ(lhs.values, rhs.values);
    EXPECT_NE(lhs.values, other.values);
}

//-------------------------------------------------------------------------

TEST(VolumeGeneratorTest, LengthMatchesBusinessDays)
{
    const auto start = calendar::parseDate("1970-01-03"), end = calendar::parseDate("1975-03-16");

    const auto volume = VolumeGenerator{2.0, 1}.generate(start, end);

    EXPECT_EQ(volume.size(), calendar::businessDayCount(start, end));
    EXPECT_EQ(volume.index, calendar::businessDays(start, end));
}

//-------------------------------------------------------------------------

TEST(VolumeGeneratorTest, WeekendOnlyRangeIsEmpty)
{
    VolumeGenerator generator{1.161, 42};

    const auto volume = generator.generate(
        calendar::parseDate("1970-01-03"), calendar::parseDate("1970-01-04"));

    EXPECT_TRUE(volume.empty());
    EXPECT_EQ(generator.rng().callCount(), 0);
}

//-------------------------------------------------------------------------

TEST(VolumeGeneratorTest, InvertedRangeThrows)
{
    VolumeGenerator generator{1.161, 42};

    EXPECT_THROW(
        static_cast<void>(generator.generate(
            calendar::parseDate("1970-01-07"), calendar::parseDate("1970-01-01"))),
        std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(VolumeGeneratorTest, InvalidShapeThrows)
{
    EXPECT_THROW(VolumeGenerator(0.0, 42), std::invalid_argument);
    EXPECT_THROW(VolumeGenerator(-1.161, 42), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(VolumeGeneratorTest, NoSerialCorrelation)
{
    const auto volume = VolumeGenerator{5.0, 42}.generate(
        calendar::parseDate("1970-01-01"), calendar::parseDate("2009-12-31"));

    const auto values = volume.values
        | views::transform([](uint64_t v) { return static_cast<double>(v); })
        | ranges::to<std::vector>();
    const auto summary = stats::SampleSummary::compute(values);

    ASSERT_GT(summary.count, 10'000);
    EXPECT_LT(std::abs(summary.lag1Autocorrelation), 0.05);
    EXPECT_NEAR(summary.mean, 250'000.0, 15'000.0);
}

//-------------------------------------------------------------------------

TEST(VolumeGeneratorTest, ExplicitDates)
{
    const std::vector<calendar::Date> dates{
        calendar::parseDate("2020-03-02"), calendar::parseDate("2020-03-03")};

    const auto volume = VolumeGenerator{1.161, 42, "Shares"}.generate(dates);

    EXPECT_EQ(volume.name, "Shares");
    EXPECT_EQ(volume.index, dates);
    EXPECT_THAT(volume.values, ElementsAre(498093, 12365772));
}

//-------------------------------------------------------------------------

TEST(VolumeGeneratorTest, ToVolumeTruncatesAndSaturates)
{
    static constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();

    EXPECT_EQ(VolumeGenerator::toVolume(0.4980939), 498093);
    EXPECT_EQ(VolumeGenerator::toVolume(1.9999999), 1999999);
    EXPECT_EQ(VolumeGenerator::toVolume(0.0), 0);
    EXPECT_EQ(VolumeGenerator::toVolume(-1.0), 0);
    EXPECT_EQ(VolumeGenerator::toVolume(std::nan("")), 0);
    EXPECT_EQ(VolumeGenerator::toVolume(1e20), kMax);
    EXPECT_EQ(VolumeGenerator::toVolume(std::numeric_limits<double>::infinity()), kMax);
}

//-------------------------------------------------------------------------
