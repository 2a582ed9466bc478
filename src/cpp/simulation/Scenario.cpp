/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/simulation/Scenario.hpp"

#include "SimulationException.hpp"
#include "json_util.hpp"
#include "util.hpp"

#include <source_location>
#include <system_error>
#include <unordered_set>

//-------------------------------------------------------------------------

namespace equisim::simulation
{

//-------------------------------------------------------------------------

Scenario::Scenario(
    uint64_t seed, ScenarioContext ctx, std::vector<std::unique_ptr<ScenarioTask>> tasks)
    : m_seed{seed}, m_ctx{std::move(ctx)}, m_tasks{std::move(tasks)}
{}

//-------------------------------------------------------------------------

void Scenario::run()
{
    static constexpr auto ctx = std::source_location::current().function_name();

    fmt::println(
        "Running {} task(s) with seed {}, writing {} to {}",
        m_tasks.size(), m_seed, m_ctx.format, m_ctx.outputDir.string());

    if (std::error_code ec; !fs::create_directories(m_ctx.outputDir, ec) && ec) {
        throw SimulationException{fmt::format(
            "{}: Unable to create output directory '{}': {}",
            ctx, m_ctx.outputDir.string(), ec.message())};
    }

    for (const auto& task : m_tasks) {
        m_ctx.logDebug("[{}] {}", task->type(), task->name());
        task->run(m_ctx);
    }

    const fs::path manifestPath = m_ctx.outputDir / "manifest.json";
    json::dumpJson(manifest(), manifestPath, {.indent = json::IndentOptions{}});
    m_ctx.logDebug("Manifest written to {}", manifestPath.string());

    fmt::println(" - scenario finished");
}

//-------------------------------------------------------------------------

rapidjson::Document Scenario::manifest() const
{
    rapidjson::Document json;
    json.SetObject();
    auto& allocator = json.GetAllocator();

    json.AddMember("seed", rapidjson::Value{m_seed}, allocator);
    json.AddMember(
        "format",
        rapidjson::Value{std::string{magic_enum::enum_name(m_ctx.format)}.c_str(), allocator},
        allocator);

    rapidjson::Value tasks{rapidjson::kArrayType};
    for (const auto& task : m_tasks) {
        rapidjson::Document taskJson{&allocator};
        task->checkpointSerialize(taskJson);
        tasks.PushBack(taskJson, allocator);
    }
    json.AddMember("tasks", tasks, allocator);

    return json;
}

//-------------------------------------------------------------------------

std::unique_ptr<Scenario> Scenario::fromXML(
    pugi::xml_node node, const ScenarioOverrides& overrides)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const uint64_t seed = overrides.seed
        .or_else([&]() -> std::optional<uint64_t> {
            return std::make_optional(util::requireAttribute(node, "seed", ctx).as_ullong());
        })
        .value();

    ScenarioContext scenarioCtx{
        .outputDir = overrides.outputDir.value_or(node.attribute("outputDir").as_string(".")),
        .format = overrides.format.or_else([&] {
            return std::make_optional(parseOutputFormat(node.attribute("format").as_string("csv")));
        }).value(),
        .render = overrides.render.value_or(node.attribute("render").as_bool(true)),
        .debug = overrides.debug || node.attribute("debug").as_bool(false)
    };

    std::vector<std::unique_ptr<ScenarioTask>> tasks;
    std::unordered_set<std::string> names;
    size_t index{};
    for (pugi::xml_node child : node.children()) {
        if (child.type() != pugi::node_element) continue;
        auto task = TaskFactory::createFromXML(child, seed + index, index);
        if (!names.insert(task->name()).second) {
            throw std::invalid_argument{fmt::format(
                "{}: Duplicate task name '{}'", ctx, task->name())};
        }
        tasks.push_back(std::move(task));
        ++index;
    }

    return std::make_unique<Scenario>(seed, std::move(scenarioCtx), std::move(tasks));
}

//-------------------------------------------------------------------------

std::unique_ptr<Scenario> Scenario::fromFile(
    const fs::path& path, const ScenarioOverrides& overrides)
{
    pugi::xml_document doc = util::loadXML(path);
    pugi::xml_node node = doc.child("Scenario");
    if (!node) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' has no <Scenario> root element",
            std::source_location::current().function_name(),
            path.c_str())};
    }
    return fromXML(node, overrides);
}

//-------------------------------------------------------------------------

}  // namespace equisim::simulation

//-------------------------------------------------------------------------
