/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/simulation/Scenario.hpp"
#include "equisim/simulation/Tasks.hpp"
#include "ParetoDistribution.hpp"
#include "TempDirectory.hpp"

#include "common.hpp"
#include "json_util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace equisim;
using namespace equisim::simulation;
using namespace testing;

//-------------------------------------------------------------------------

const auto kTestDataPath = fs::path{__FILE__}.parent_path() / "data";

//-------------------------------------------------------------------------

namespace
{

std::unique_ptr<Scenario> scenarioFromString(const char* xml, const ScenarioOverrides& overrides = {})
{
    pugi::xml_document doc;
    if (!doc.load_string(xml)) {
        throw std::invalid_argument{xml};
    }
    return Scenario::fromXML(doc.child("Scenario"), overrides);
}

std::string runCaptured(Scenario& scenario)
{
    testing::internal::CaptureStdout();
    scenario.run();
    return testing::internal::GetCapturedStdout();
}

}  // namespace

//-------------------------------------------------------------------------

TEST(ScenarioTest, FromFile)
{
    const auto scenario = Scenario::fromFile(kTestDataPath / "Scenario.xml");

    EXPECT_EQ(scenario->seed(), 42);
    EXPECT_EQ(scenario->context().outputDir, fs::path{"out"});
    EXPECT_EQ(scenario->context().format, OutputFormat::csv);
    EXPECT_TRUE(scenario->context().render);
    EXPECT_FALSE(scenario->context().debug);

    const auto& tasks = scenario->tasks();
    ASSERT_THAT(tasks, SizeIs(5));
    EXPECT_THAT(
        tasks | views::transform([](const auto& task) { return task->name(); })
            | ranges::to<std::vector>(),
        ElementsAre("volume", "prices", "gbm", "lognormal", "pareto"));
    EXPECT_THAT(
        tasks | views::transform([](const auto& task) { return std::string{task->type()}; })
            | ranges::to<std::vector>(),
        ElementsAre("Volume", "PricePath", "PricePath", "Distribution", "Distribution"));
    EXPECT_THAT(
        tasks | views::transform([](const auto& task) { return task->seed(); })
            | ranges::to<std::vector>(),
        ElementsAre(42, 43, 44, 45, 1234));

    EXPECT_TRUE(dynamic_cast<const PricePathTask&>(*tasks[1]).dated());
    EXPECT_FALSE(dynamic_cast<const PricePathTask&>(*tasks[2]).dated());
}

//-------------------------------------------------------------------------

TEST(ScenarioTest, RunWritesTables)
{
    TempDirectory dir;
    const auto scenario = Scenario::fromFile(
        kTestDataPath / "Scenario.xml", {.outputDir = dir.path()});

    const auto output = runCaptured(*scenario);

    EXPECT_THAT(output, HasSubstr("Running 5 task(s) with seed 42"));
    EXPECT_THAT(output, HasSubstr(" | "));
    EXPECT_THAT(output, EndsWith(" - scenario finished\n"));

    for (const char* file :
        {"volume.csv", "prices.csv", "gbm.csv", "lognormal.csv", "pareto.csv", "manifest.json"}) {
        EXPECT_TRUE(fs::exists(dir / file)) << file;
    }

    EXPECT_THAT(
        readLines(dir / "volume.csv"),
        ElementsAre(
            "Date,Volume",
            "1970-01-01,498093",
            "1970-01-02,12365772",
            "1970-01-05,2108523",
            "1970-01-06,1195350",
            "1970-01-07,157314"));

    const auto prices = readLines(dir / "prices.csv");
    EXPECT_EQ(prices.front(), "Date,Path0,Path1,Path2");
    EXPECT_EQ(
        prices.size(),
        1 + calendar::businessDayCount(
            calendar::parseDate("1970-01-01"), calendar::parseDate("1970-03-31")));

    const auto gbm = readLines(dir / "gbm.csv");
    EXPECT_EQ(gbm.front(), "Time,Path0,Path1,Path2,Path3,Path4,Path5,Path6,Path7,Path8,Path9");
    EXPECT_THAT(gbm, SizeIs(1 + 253));

    const auto& pareto = dynamic_cast<const DistributionTask&>(*scenario->tasks()[4]);
    ASSERT_TRUE(pareto.histogram().has_value());
    EXPECT_THAT(pareto.samples(), SizeIs(5000));
    EXPECT_DOUBLE_EQ(pareto.histogram()->hi(), stats::ParetoDistribution{3.0, 1.0, 1.0}.quantile(0.99));
    EXPECT_GT(pareto.histogram()->overflow(), 0);
    EXPECT_THAT(readLines(dir / "pareto.csv"), SizeIs(41));
}

//-------------------------------------------------------------------------

TEST(ScenarioTest, Manifest)
{
    TempDirectory dir;
    const auto scenario = Scenario::fromFile(
        kTestDataPath / "Scenario.xml", {.outputDir = dir.path()});
    static_cast<void>(runCaptured(*scenario));

    const auto manifest = json::loadJson(dir / "manifest.json");

    EXPECT_EQ(manifest["seed"].GetUint64(), 42);
    EXPECT_STREQ(manifest["format"].GetString(), "csv");
    ASSERT_EQ(manifest["tasks"].Size(), 5);

    const auto& volume = manifest["tasks"][0];
    EXPECT_STREQ(volume["name"].GetString(), "volume");
    EXPECT_STREQ(volume["type"].GetString(), "Volume");
    EXPECT_EQ(volume["seed"].GetUint64(), 42);
    EXPECT_THAT(volume["output"].GetString(), EndsWith("volume.csv"));
    EXPECT_EQ(volume["rng"]["seed"].GetUint64(), 42);
    EXPECT_EQ(volume["rng"]["callCount"].GetUint64(), 10);

    EXPECT_EQ(manifest["tasks"][4]["rng"]["seed"].GetUint64(), 1234);
}

//-------------------------------------------------------------------------

TEST(ScenarioTest, Overrides)
{
    TempDirectory dir;
    const auto scenario = Scenario::fromFile(
        kTestDataPath / "Scenario.xml",
        {
            .outputDir = dir.path(),
            .seed = 7,
            .format = OutputFormat::json,
            .render = false
        });

    EXPECT_THAT(
        scenario->tasks() | views::transform([](const auto& task) { return task->seed(); })
            | ranges::to<std::vector>(),
        ElementsAre(7, 8, 9, 10, 1234));

    const auto output = runCaptured(*scenario);
    EXPECT_THAT(output, Not(HasSubstr(" | ")));

    const auto volume = json::loadJson(dir / "volume.json");
    EXPECT_EQ(volume["columns"]["Volume"].Size(), 5);
    EXPECT_TRUE(json::loadJson(dir / "gbm.json")["paths"].HasMember("Path9"));
    EXPECT_TRUE(json::loadJson(dir / "pareto.json")["bins"].IsArray());
    EXPECT_FALSE(fs::exists(dir / "volume.csv"));
    EXPECT_STREQ(json::loadJson(dir / "manifest.json")["format"].GetString(), "json");
}

//-------------------------------------------------------------------------

TEST(ScenarioTest, DefaultTaskNames)
{
    const auto scenario = scenarioFromString(R"(
        <Scenario seed="1">
            <Volume start="1970-01-01" end="1970-01-31" paretoShape="2"/>
            <!-- comments are skipped -->
            <Volume start="1970-01-01" end="1970-01-31" paretoShape="2"/>
        </Scenario>)");

    ASSERT_THAT(scenario->tasks(), SizeIs(2));
    EXPECT_EQ(scenario->tasks()[0]->name(), "Volume0");
    EXPECT_EQ(scenario->tasks()[1]->name(), "Volume1");
    EXPECT_EQ(scenario->context().outputDir, fs::path{"."});
    EXPECT_EQ(scenario->context().format, OutputFormat::csv);
}

//-------------------------------------------------------------------------

TEST(ScenarioTest, HeavyTailedDistributionWithoutClip)
{
    TempDirectory dir;
    auto scenario = scenarioFromString(R"(
        <Scenario seed="3" render="false">
            <Distribution name="tail" type="pareto" shape="0.01" samples="10000" bins="20"/>
        </Scenario>)",
        {.outputDir = dir.path()});

    ASSERT_NO_THROW(runCaptured(*scenario));

    const auto& task = dynamic_cast<const DistributionTask&>(*scenario->tasks()[0]);
    ASSERT_TRUE(task.histogram().has_value());
    const auto nonFinite = static_cast<uint64_t>(ranges::count_if(
        task.samples(), [](double x) { return !std::isfinite(x); }));
    EXPECT_TRUE(std::isfinite(task.histogram()->hi()));
    EXPECT_EQ(task.histogram()->overflow() + task.histogram()->underflow(), nonFinite);
    EXPECT_EQ(task.histogram()->total(), 10000);
    EXPECT_TRUE(fs::exists(dir / "tail.csv"));
}

//-------------------------------------------------------------------------

struct InvalidScenarioTest : TestWithParam<std::string> {};

TEST_P(InvalidScenarioTest, Throws)
{
    EXPECT_THROW(
        static_cast<void>(scenarioFromString(GetParam().c_str())), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    Scenario,
    InvalidScenarioTest,
    Values(
        R"(<Scenario><Volume start="1970-01-01" end="1970-01-07" paretoShape="1"/></Scenario>)",
        R"(<Scenario seed="1"><Foo/></Scenario>)",
        R"(<Scenario seed="1" format="xml"/>)",
        R"(<Scenario seed="1"><Volume start="1970-01-01" end="1970-01-07"/></Scenario>)",
        R"(<Scenario seed="1"><Volume start="1970-01-07" end="1970-01-01" paretoShape="1"/></Scenario>)",
        R"(<Scenario seed="1"><Volume start="1970-01-01" end="1970-01-07" paretoShape="0"/></Scenario>)",
        R"(<Scenario seed="1"><Volume start="1970-1-1x" end="1970-01-07" paretoShape="1"/></Scenario>)",
        R"(<Scenario seed="1"><PricePath start="1970-01-01" S0="100" mu="0" sigma="0.2"/></Scenario>)",
        R"(<Scenario seed="1"><PricePath S0="100" mu="0" sigma="0.2" T="1" steps="10" paths="0"/></Scenario>)",
        R"(<Scenario seed="1"><PricePath S0="100" mu="0" sigma="0.2" T="1"/></Scenario>)",
        R"(<Scenario seed="1"><Distribution type="normal" sigma="1" samples="0"/></Scenario>)",
        R"(<Scenario seed="1"><Distribution type="pareto" shape="2" clip="1.5"/></Scenario>)",
        R"(<Scenario seed="1"><Distribution type="gamma"/></Scenario>)",
        R"(<Scenario seed="1"><Volume name="v" start="1970-01-01" end="1970-01-07" paretoShape="1"/>)"
            R"(<Distribution name="v" type="normal" sigma="1"/></Scenario>)",
        R"(<Scenario seed="1"><Volume start="1970-01-01" end="1970-01-07" paretoShape="1"/>)"
            R"(<Volume name="Volume0" start="1970-01-01" end="1970-01-07" paretoShape="1"/></Scenario>)"));

//-------------------------------------------------------------------------

TEST(ScenarioTest, FileErrors)
{
    TempDirectory dir;
    std::ofstream{dir / "noroot.xml"} << R"(<Simulation seed="1"/>)";

    EXPECT_THROW(
        static_cast<void>(Scenario::fromFile(dir / "noroot.xml")), std::invalid_argument);
    EXPECT_THROW(
        static_cast<void>(Scenario::fromFile(dir / "absent.xml")), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(ScenarioTest, OutputFormat)
{
    EXPECT_EQ(parseOutputFormat("csv"), OutputFormat::csv);
    EXPECT_EQ(parseOutputFormat("json"), OutputFormat::json);
    EXPECT_THAT(
        [] { static_cast<void>(parseOutputFormat("parquet")); },
        ThrowsMessage<std::invalid_argument>(HasSubstr("expected one of csv, json")));

    const ScenarioContext ctx{.outputDir = "tables", .format = OutputFormat::json};
    EXPECT_EQ(ctx.outputPath("volume"), fs::path{"tables"} / "volume.json");
}

//-------------------------------------------------------------------------
