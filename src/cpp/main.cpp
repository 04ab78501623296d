/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/service/LendingService.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    using namespace lendcore;

    CLI::App app{"lendcore v1.0"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Lending config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path checkpoint;
    app.add_option(
        "-c,--checkpoint",
        checkpoint,
        "Checkpoint file, loaded at startup if present and written at shutdown");

    bool accrueNow{};
    app.add_flag("--accrue-now", accrueNow, "Run the interest accrual once, then exit");

    std::optional<std::string> logLevel;
    app.add_option("--log-level", logLevel, "Console log level, overriding the config")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "error", "critical", "off"}));

    CLI11_PARSE(app, argc, argv);

    fmt::print("{}\n", app.get_description());

    auto logger = spdlog::stdout_color_mt("lendcore");
    spdlog::set_default_logger(logger);

    try {
        auto service =
            service::LendingService::fromFile(config, std::make_shared<SystemClock>(), logger);
        if (logLevel) {
            logger->set_level(spdlog::level::from_str(*logLevel));
        }
        if (!checkpoint.empty() && fs::exists(checkpoint)) {
            service->loadCheckpoint(checkpoint);
        }
        if (accrueNow) {
            service->triggerInterestAccrualNow();
        }
        else {
            service->run();
        }
        if (!checkpoint.empty()) {
            service->writeCheckpoint(checkpoint);
        }
    }
    catch (const std::exception& e) {
        logger->critical("{}", e.what());
        return 1;
    }

    fmt::print(" - lending service finished, exiting\n");

    return 0;
}

//-------------------------------------------------------------------------
