/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "equisim/series/PriceGenerator.hpp"
#include "equisim/series/VolumeGenerator.hpp"
#include "equisim/simulation/Scenario.hpp"
#include "GBM.hpp"
#include "Histogram.hpp"
#include "LognormalDistribution.hpp"

//-------------------------------------------------------------------------

using namespace equisim;

static const fs::path kTestDataPath{
    fs::path{__FILE__}.parent_path().parent_path() / "test" / "cpp-tests" / "data"};

//-------------------------------------------------------------------------

struct CalendarFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        start = calendar::parseDate("1970-01-01");
        end = start + date::days{state.range(0)};
    }

    calendar::Date start{}, end{};
};

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(CalendarFixture, Volume)(benchmark::State& state)
{
    series::VolumeGenerator generator{1.161, 42};
    for (auto _ : state) {
        benchmark::DoNotOptimize(generator.generate(start, end));
    }
    state.SetItemsProcessed(state.iterations() * calendar::businessDayCount(start, end));
}
BENCHMARK_REGISTER_F(CalendarFixture, Volume)->Arg(365)->Arg(365 * 40);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(CalendarFixture, Prices)(benchmark::State& state)
{
    series::PriceGenerator generator{100.0, 0.05, 0.2, 42};
    for (auto _ : state) {
        benchmark::DoNotOptimize(generator.generate(start, end, state.range(1)));
    }
    state.SetItemsProcessed(
        state.iterations() * state.range(1) * calendar::businessDayCount(start, end));
}
BENCHMARK_REGISTER_F(CalendarFixture, Prices)->Args({365, 1})->Args({365 * 10, 10});

//-------------------------------------------------------------------------

static void BM_GBMEnsemble(benchmark::State& state)
{
    const auto steps = static_cast<size_t>(state.range(0));
    GBM gbm{100.0, 0.05, 0.2, 1.0 / steps, 42};
    for (auto _ : state) {
        benchmark::DoNotOptimize(makePathEnsemble(gbm, steps, state.range(1)));
    }
    state.SetItemsProcessed(state.iterations() * steps * state.range(1));
}
BENCHMARK(BM_GBMEnsemble)->Args({252, 100})->Args({252 * 8, 1000});

//-------------------------------------------------------------------------

static void BM_LognormalHistogram(benchmark::State& state)
{
    RNG rng{42};
    stats::LognormalDistribution dist{0.0, 0.5};
    std::vector<double> samples(state.range(0));
    for (auto _ : state) {
        for (double& x : samples) {
            x = dist.sample(rng);
        }
        benchmark::DoNotOptimize(stats::Histogram::fromSamples(samples, 50));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LognormalHistogram)->Arg(10'000)->Arg(1'000'000);

//-------------------------------------------------------------------------

static void BM_ScenarioFile(benchmark::State& state)
{
    const fs::path outputDir = fs::temp_directory_path() / "equisim-benchmark";
    for (auto _ : state) {
        auto scenario = simulation::Scenario::fromFile(
            kTestDataPath / "Scenario.xml", {.outputDir = outputDir, .render = false});
        scenario->run();
    }
    fs::remove_all(outputDir);
}
BENCHMARK(BM_ScenarioFile)->Unit(benchmark::kMillisecond);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    fmt::println("Test data: {}", kTestDataPath.c_str());
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
}

//-------------------------------------------------------------------------
