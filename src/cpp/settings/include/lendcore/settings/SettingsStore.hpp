/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/decimal/decimal.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendcore::settings
{

//-------------------------------------------------------------------------

namespace keys
{

inline constexpr std::string_view kLoanInterestRate = "loan_interest_rate";
inline constexpr std::string_view kDefaultLtvRatio = "default_ltv_ratio";
inline constexpr std::string_view kLiquidationThreshold = "liquidation_threshold";
inline constexpr std::string_view kWarningThreshold = "warning_threshold";
inline constexpr std::string_view kLiquidationTarget = "liquidation_target";
inline constexpr std::string_view kMinimumInterestDays = "minimum_interest_days";
inline constexpr std::string_view kBuyMultiplier = "buy_multiplier";
inline constexpr std::string_view kSellMultiplier = "sell_multiplier";

}  // namespace keys

//-------------------------------------------------------------------------

class SettingsStore
{
public:
    using Ptr = std::shared_ptr<SettingsStore>;

    using Key = std::string;
    using Val = std::string;

    SettingsStore() = default;
    explicit SettingsStore(std::map<Key, Val, std::less<>> items)
        : m_parameterMap{std::move(items)}
    {}

    void set(std::string_view key, const Val& val);
    void set(std::string_view key, decimal_t val);

    [[nodiscard]] Val get(std::string_view key) const;
    [[nodiscard]] std::optional<Val> tryGet(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const;

    [[nodiscard]] decimal_t getDecimal(std::string_view key) const;
    [[nodiscard]] decimal_t getDecimalOr(std::string_view key, decimal_t fallback) const;

private:
    mutable std::shared_mutex m_mtx;
    std::map<Key, Val, std::less<>> m_parameterMap;
};

//-------------------------------------------------------------------------

[[nodiscard]] decimal_t parseDecimal(std::string_view str);

//-------------------------------------------------------------------------

}  // namespace lendcore::settings

//-------------------------------------------------------------------------
