/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "equisim/simulation/ScenarioContext.hpp"
#include "CheckpointSerializable.hpp"
#include "RNG.hpp"

#include <pugixml.hpp>

#include <cstdint>
#include <string>

//-------------------------------------------------------------------------

namespace equisim::simulation
{

//-------------------------------------------------------------------------

class ScenarioTask : public CheckpointSerializable
{
public:
    virtual ~ScenarioTask() noexcept = default;

    virtual void run(const ScenarioContext& ctx) = 0;

    [[nodiscard]] virtual std::string_view type() const noexcept = 0;
    [[nodiscard]] virtual const RNG& rng() const noexcept = 0;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] uint64_t seed() const noexcept { return m_seed; }
    [[nodiscard]] const fs::path& output() const noexcept { return m_output; }

    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

protected:
    ScenarioTask(std::string name, uint64_t seed) noexcept
        : m_name{std::move(name)}, m_seed{seed}
    {}

    std::string m_name;
    uint64_t m_seed;
    fs::path m_output;
};

//-------------------------------------------------------------------------

struct TaskFactory
{
    // Task seed is the element's own 'seed' attribute if present, defaultSeed otherwise.
    [[nodiscard]] static std::unique_ptr<ScenarioTask> createFromXML(
        pugi::xml_node node, uint64_t defaultSeed, size_t index);
};

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------
