/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/Amount.hpp"
#include "lendcore/decimal/decimal.hpp"

#include <cstdint>

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

using accounting::BaseAmount;
using accounting::CryptoAmount;
using accounting::Rate;

// Percentages enter integer arithmetic in millionths of a percent.
inline constexpr int64_t kPercentScale = 1'000'000;
inline constexpr int64_t kDaysPerYear = 365;

// Reported for a loan whose debt is backed by no collateral value at all.
inline constexpr int64_t kLtvUnboundedPercent = 1'000'000;

//-------------------------------------------------------------------------

enum class RiskStatus : uint8_t
{
    SAFE,
    WARNING,
    LIQUIDATE
};

//-------------------------------------------------------------------------

struct RiskThresholds
{
    decimal_t warning;
    decimal_t liquidation;
};

//-------------------------------------------------------------------------

[[nodiscard]] int64_t scalePercent(decimal_t percent);
[[nodiscard]] decimal_t unscalePercent(int64_t scaled);

// floor(collateral * sell * ltv / (100 * ASSET_SCALE))
[[nodiscard]] BaseAmount maxBorrowable(CryptoAmount collateral, Rate sell, decimal_t ltvRatio);

// Price at which the collateral value puts the loan exactly at the liquidation threshold;
// zero while there is no debt.
[[nodiscard]] Rate liquidationPrice(
    BaseAmount borrowed, CryptoAmount collateral, decimal_t liquidationThreshold);

// LTV in millionths of a percent, truncated.
[[nodiscard]] int64_t currentLtvScaled(BaseAmount borrowed, CryptoAmount collateral, Rate sell);
[[nodiscard]] decimal_t currentLtv(BaseAmount borrowed, CryptoAmount collateral, Rate sell);

[[nodiscard]] RiskStatus classifyRisk(int64_t ltvScaled, const RiskThresholds& thresholds);

// round(principal * rate/100 * days/365), half away from zero.
[[nodiscard]] BaseAmount simpleInterest(BaseAmount principal, decimal_t annualRate, int64_t days);

[[nodiscard]] BaseAmount dailyInterest(BaseAmount borrowed, decimal_t annualRate);

// Least collateral whose sale at the sell rate brings the loan back to the target LTV,
// capped at the available collateral.
[[nodiscard]] CryptoAmount collateralToRestoreTarget(
    BaseAmount borrowed, CryptoAmount collateral, Rate sell, decimal_t targetLtv);

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
