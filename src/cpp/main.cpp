/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/scenario/ScenarioRunner.hpp"
#include "common.hpp"

#include <CLI/CLI.hpp>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"stablecore scenario runner"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Issuer config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path logDir;
    app.add_option("--log-dir", logDir, "Directory receiving the issuer event log");

    bool debug{};
    app.add_flag("--debug", debug, "Print every delivered message");

    CLI11_PARSE(app, argc, argv);

    fmt::print("{}\n", app.get_description());

    pugi::xml_document doc;
    auto runner = stablecore::scenario::ScenarioRunner::fromConfig(config, doc);
    fmt::print(" - '{}' loaded successfully\n", config.generic_string());

    if (debug) {
        runner->host().setDebug(true);
    }
    if (!logDir.empty()) {
        runner->attachEventLog(logDir);
    }

    runner->run(doc.child("Issuer").child("Script"));

    rapidjson::Document json;
    runner->report(json);
    fmt::print(
        "{}\n",
        stablecore::json::json2str(
            json, {.indent = stablecore::json::IndentOptions{}}));

    const auto failed = std::ranges::count_if(
        runner->outcomes(), [](const auto& outcome) { return !outcome.ok(); });
    fmt::print(" - {} operations, {} failed\n", runner->outcomes().size(), failed);

    return 0;
}

//-------------------------------------------------------------------------
