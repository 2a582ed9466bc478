/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "equisim/series/PriceGenerator.hpp"
#include "equisim/series/VolumeGenerator.hpp"
#include "equisim/simulation/ScenarioTask.hpp"
#include "Distribution.hpp"
#include "GBM.hpp"
#include "Histogram.hpp"

#include <memory>
#include <optional>
#include <vector>

//-------------------------------------------------------------------------

namespace equisim::simulation
{

//-------------------------------------------------------------------------

class VolumeTask : public ScenarioTask
{
public:
    VolumeTask(
        std::string name,
        uint64_t seed,
        calendar::Date start,
        calendar::Date end,
        double paretoShape);

    virtual void run(const ScenarioContext& ctx) override;

    virtual std::string_view type() const noexcept override { return "Volume"; }
    virtual const RNG& rng() const noexcept override { return m_generator.rng(); }

    [[nodiscard]] const series::DateSeries<uint64_t>& result() const noexcept { return m_result; }

    [[nodiscard]] static std::unique_ptr<VolumeTask> fromXML(
        pugi::xml_node node, std::string name, uint64_t seed);

private:
    calendar::Date m_start, m_end;
    series::VolumeGenerator m_generator;
    series::DateSeries<uint64_t> m_result;
};

//-------------------------------------------------------------------------

// Business-day aligned paths when 'start'/'end' are given, a uniform grid
// over [0, T] otherwise.
class PricePathTask : public ScenarioTask
{
public:
    PricePathTask(
        std::string name,
        uint64_t seed,
        calendar::Date start,
        calendar::Date end,
        std::unique_ptr<series::PriceGenerator> generator,
        size_t pathCount);

    PricePathTask(
        std::string name,
        uint64_t seed,
        std::unique_ptr<GBM> gbm,
        size_t steps,
        size_t pathCount);

    virtual void run(const ScenarioContext& ctx) override;

    virtual std::string_view type() const noexcept override { return "PricePath"; }
    virtual const RNG& rng() const noexcept override;

    [[nodiscard]] bool dated() const noexcept { return m_generator != nullptr; }
    [[nodiscard]] const std::vector<series::DateSeries<double>>& datedResult() const noexcept
    {
        return m_datedResult;
    }
    [[nodiscard]] const PathEnsemble& ensembleResult() const noexcept { return m_ensembleResult; }

    [[nodiscard]] static std::unique_ptr<PricePathTask> fromXML(
        pugi::xml_node node, std::string name, uint64_t seed);

private:
    void runDated(const ScenarioContext& ctx);
    void runHorizon(const ScenarioContext& ctx);

    calendar::Date m_start{}, m_end{};
    std::unique_ptr<series::PriceGenerator> m_generator;
    std::unique_ptr<GBM> m_gbm;
    size_t m_steps{}, m_pathCount;
    std::vector<series::DateSeries<double>> m_datedResult;
    PathEnsemble m_ensembleResult;
};

//-------------------------------------------------------------------------

class DistributionTask : public ScenarioTask
{
public:
    DistributionTask(
        std::string name,
        uint64_t seed,
        std::unique_ptr<stats::Distribution> distribution,
        size_t sampleCount,
        size_t binCount,
        std::optional<double> clip = {});

    virtual void run(const ScenarioContext& ctx) override;

    virtual std::string_view type() const noexcept override { return "Distribution"; }
    virtual const RNG& rng() const noexcept override { return m_rng; }

    [[nodiscard]] const std::vector<double>& samples() const noexcept { return m_samples; }
    [[nodiscard]] const std::optional<stats::Histogram>& histogram() const noexcept
    {
        return m_histogram;
    }

    [[nodiscard]] static std::unique_ptr<DistributionTask> fromXML(
        pugi::xml_node node, std::string name, uint64_t seed);

private:
    RNG m_rng;
    std::unique_ptr<stats::Distribution> m_distribution;
    size_t m_sampleCount, m_binCount;
    std::optional<double> m_clip;
    std::vector<double> m_samples;
    std::optional<stats::Histogram> m_histogram;
};

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------
