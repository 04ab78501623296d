/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/lending/LendingParameters.hpp"

#include <fmt/format.h>

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

void LendingParameters::validate() const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!(interestRate >= decimal_t{})) {
        throw std::invalid_argument{fmt::format(
            "{}: interest rate must be non-negative, was {}", ctx, interestRate)};
    }
    const bool ordered = decimal_t{} < liquidationTarget
        && liquidationTarget < warningThreshold
        && warningThreshold < liquidationThreshold
        && liquidationThreshold < decimal_t{100};
    if (!ordered) {
        throw std::invalid_argument{fmt::format(
            "{}: thresholds must satisfy 0 < target ({}) < warning ({}) < liquidation ({}) < 100",
            ctx, liquidationTarget, warningThreshold, liquidationThreshold)};
    }
    if (!(decimal_t{} < defaultLtvRatio && defaultLtvRatio < liquidationThreshold)) {
        throw std::invalid_argument{fmt::format(
            "{}: default LTV ratio must lie in (0, {}), was {}",
            ctx, liquidationThreshold, defaultLtvRatio)};
    }
    if (minimumInterestDays == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: minimum interest period must be at least one day", ctx)};
    }
}

//-------------------------------------------------------------------------

void LendingParameters::writeTo(settings::SettingsStore& store) const
{
    using namespace settings::keys;
    store.set(kLoanInterestRate, interestRate);
    store.set(kDefaultLtvRatio, defaultLtvRatio);
    store.set(kLiquidationThreshold, liquidationThreshold);
    store.set(kWarningThreshold, warningThreshold);
    store.set(kLiquidationTarget, liquidationTarget);
    store.set(kMinimumInterestDays, std::to_string(minimumInterestDays));
}

//-------------------------------------------------------------------------

LendingParameters LendingParameters::fromSettings(const settings::SettingsStore& store)
{
    using namespace settings::keys;

    LendingParameters params;
    params.interestRate = store.getDecimalOr(kLoanInterestRate, params.interestRate);
    params.defaultLtvRatio = store.getDecimalOr(kDefaultLtvRatio, params.defaultLtvRatio);
    params.liquidationThreshold =
        store.getDecimalOr(kLiquidationThreshold, params.liquidationThreshold);
    params.warningThreshold = store.getDecimalOr(kWarningThreshold, params.warningThreshold);
    params.liquidationTarget = store.getDecimalOr(kLiquidationTarget, params.liquidationTarget);
    const decimal_t days = store.getDecimalOr(
        kMinimumInterestDays, decimal_t{params.minimumInterestDays});
    if (!(days > decimal_t{}) || util::roundHalfAway(days) != days) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' must be a positive whole number of days, was {}",
            std::source_location::current().function_name(), kMinimumInterestDays, days)};
    }
    params.minimumInterestDays = static_cast<uint32_t>(util::toInteger(days));
    params.validate();
    return params;
}

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
