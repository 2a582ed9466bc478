/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/simulation/ScenarioTask.hpp"

#include "equisim/simulation/Tasks.hpp"

#include <source_location>

//-------------------------------------------------------------------------

namespace equisim::simulation
{

//-------------------------------------------------------------------------

void ScenarioTask::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("name", rapidjson::Value{m_name.c_str(), allocator}, allocator);
        json.AddMember(
            "type", rapidjson::Value{std::string{type()}.c_str(), allocator}, allocator);
        json.AddMember("seed", rapidjson::Value{m_seed}, allocator);
        json.AddMember(
            "output", rapidjson::Value{m_output.generic_string().c_str(), allocator}, allocator);
        rng().checkpointSerialize(json, "rng");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<ScenarioTask> TaskFactory::createFromXML(
    pugi::xml_node node, uint64_t defaultSeed, size_t index)
{
    std::string_view type = node.name();

    std::string name = node.attribute("name")
        ? std::string{node.attribute("name").as_string()}
        : fmt::format("{}{}", type, index);
    const uint64_t seed = node.attribute("seed").as_ullong(defaultSeed);

    if (type == "Volume") {
        return VolumeTask::fromXML(node, std::move(name), seed);
    }
    else if (type == "PricePath") {
        return PricePathTask::fromXML(node, std::move(name), seed);
    }
    else if (type == "Distribution") {
        return DistributionTask::fromXML(node, std::move(name), seed);
    }

    throw std::invalid_argument{fmt::format(
        "{}: Unknown task type {}", std::source_location::current().function_name(), type)};
}

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------
