/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "equisim/simulation/Scenario.hpp"
#include "common.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"equisim v1.0 - Monte Carlo generators for synthetic equity-market data"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Scenario config file")
        ->required()
        ->check(CLI::ExistingFile);

    equisim::simulation::ScenarioOverrides overrides;

    app.add_option("-o,--output-dir", overrides.outputDir, "Directory receiving the tables");
    app.add_option("--seed", overrides.seed, "Scenario seed, replaces the file's");

    std::optional<std::string> format;
    app.add_option("--format", format, "Output format")
        ->check(CLI::IsMember({"csv", "json"}));

    bool noRender{};
    app.add_flag("--no-render", noRender, "Do not print tables and histograms");
    app.add_flag("--debug", overrides.debug, "Verbose progress output");

    CLI11_PARSE(app, argc, argv);

    fmt::println("{}", app.get_description());

    if (noRender) {
        overrides.render = false;
    }

    try {
        if (format) {
            overrides.format = equisim::simulation::parseOutputFormat(*format);
        }
        auto scenario = equisim::simulation::Scenario::fromFile(config, overrides);
        scenario->run();
    }
    catch (const std::exception& e) {
        fmt::println(stderr, "error: {}", e.what());
        return 1;
    }

    return 0;
}

//-------------------------------------------------------------------------
