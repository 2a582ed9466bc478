/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "equisim/simulation/ScenarioContext.hpp"
#include "equisim/simulation/ScenarioTask.hpp"

#include <pugixml.hpp>
#include <rapidjson/document.h>

#include <optional>
#include <vector>

//-------------------------------------------------------------------------

namespace equisim::simulation
{

//-------------------------------------------------------------------------

// Command-line values taking precedence over the scenario file.
struct ScenarioOverrides
{
    std::optional<fs::path> outputDir;
    std::optional<uint64_t> seed;
    std::optional<OutputFormat> format;
    std::optional<bool> render;
    bool debug{};
};

//-------------------------------------------------------------------------

class Scenario
{
public:
    Scenario(uint64_t seed, ScenarioContext ctx, std::vector<std::unique_ptr<ScenarioTask>> tasks);

    void run();

    [[nodiscard]] uint64_t seed() const noexcept { return m_seed; }
    [[nodiscard]] const ScenarioContext& context() const noexcept { return m_ctx; }
    [[nodiscard]] const std::vector<std::unique_ptr<ScenarioTask>>& tasks() const noexcept
    {
        return m_tasks;
    }

    [[nodiscard]] rapidjson::Document manifest() const;

    [[nodiscard]] static std::unique_ptr<Scenario> fromXML(
        pugi::xml_node node, const ScenarioOverrides& overrides = {});
    [[nodiscard]] static std::unique_ptr<Scenario> fromFile(
        const fs::path& path, const ScenarioOverrides& overrides = {});

private:
    uint64_t m_seed;
    ScenarioContext m_ctx;
    std::vector<std::unique_ptr<ScenarioTask>> m_tasks;
};

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------
