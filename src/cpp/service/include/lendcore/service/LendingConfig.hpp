/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/Amount.hpp"
#include "lendcore/lending/LendingParameters.hpp"
#include "lendcore/util/common.hpp"

#include <pugixml.hpp>
#include <spdlog/common.h>

#include <chrono>

//-------------------------------------------------------------------------

namespace lendcore::service
{

//-------------------------------------------------------------------------

struct OracleConfig
{
    // Fixed rates select the static oracle; otherwise rates follow the reference feed.
    std::optional<accounting::Rate> buyRate;
    std::optional<accounting::Rate> sellRate;
    // Without a reference price the feed stays unavailable until updated.
    std::optional<decimal_t> referencePrice;
    decimal_t buyMultiplier{91};
    decimal_t sellMultiplier{88};
    Timestamp freshnessSeconds{300};
    // File rewritten by the price fetcher; required by the markup oracle.
    std::optional<fs::path> priceFile;
    std::chrono::seconds refreshInterval{60};

    [[nodiscard]] bool isStatic() const noexcept { return buyRate.has_value(); }
};

struct AccrualConfig
{
    std::chrono::minutes timeOfDay{1};
    std::string timeZone{"Asia/Kolkata"};
};

struct LoggingConfig
{
    fs::path dir{"logs"};
    spdlog::level::level_enum level{spdlog::level::info};
};

struct LendingConfig
{
    lending::LendingParameters parameters;
    std::chrono::seconds riskMonitorInterval{30};
    AccrualConfig accrual;
    OracleConfig oracle;
    LoggingConfig logging;
};

//-------------------------------------------------------------------------

[[nodiscard]] LendingConfig makeLendingConfig(pugi::xml_node node);

// "HH:MM" to minutes past midnight.
[[nodiscard]] std::chrono::minutes parseTimeOfDay(std::string_view str);

//-------------------------------------------------------------------------

}  // namespace lendcore::service

//-------------------------------------------------------------------------
