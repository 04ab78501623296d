/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/lending/loan_math.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <limits>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

namespace
{

using wide_t = boost::multiprecision::checked_int128_t;
using accounting::kAssetScale;

int64_t narrow(const wide_t& val, std::source_location sl = std::source_location::current())
{
    if (val > std::numeric_limits<int64_t>::max() || val < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error{fmt::format(
            "{}: result does not fit into 64 bits", sl.function_name())};
    }
    return val.convert_to<int64_t>();
}

// Operands are non-negative throughout this file.
wide_t divCeil(const wide_t& num, const wide_t& den)
{
    return (num + den - 1) / den;
}

wide_t divRoundHalfAway(const wide_t& num, const wide_t& den)
{
    return (2 * num + den) / (2 * den);
}

}  // namespace

//-------------------------------------------------------------------------

int64_t scalePercent(decimal_t percent)
{
    return util::toInteger(util::roundHalfAway(percent * decimal_t{kPercentScale}));
}

decimal_t unscalePercent(int64_t scaled)
{
    return decimal_t{scaled} / decimal_t{kPercentScale};
}

//-------------------------------------------------------------------------

BaseAmount maxBorrowable(CryptoAmount collateral, Rate sell, decimal_t ltvRatio)
{
    if (!collateral.isPositive() || !sell.isValid()) {
        return BaseAmount{};
    }
    const wide_t num = wide_t{collateral.units()} * sell.units() * scalePercent(ltvRatio);
    const wide_t den = wide_t{100} * kPercentScale * kAssetScale;
    return BaseAmount{narrow(num / den)};
}

//-------------------------------------------------------------------------

Rate liquidationPrice(BaseAmount borrowed, CryptoAmount collateral, decimal_t liquidationThreshold)
{
    if (!borrowed.isPositive() || !collateral.isPositive()) {
        return Rate{};
    }
    const int64_t threshold = scalePercent(liquidationThreshold);
    if (threshold <= 0) {
        throw std::invalid_argument{fmt::format(
            "{}: liquidation threshold must be positive, was {}",
            std::source_location::current().function_name(), liquidationThreshold)};
    }
    const wide_t num = wide_t{borrowed.units()} * kAssetScale * 100 * kPercentScale;
    const wide_t den = wide_t{collateral.units()} * threshold;
    return Rate{narrow(num / den)};
}

//-------------------------------------------------------------------------

int64_t currentLtvScaled(BaseAmount borrowed, CryptoAmount collateral, Rate sell)
{
    if (!borrowed.isPositive()) {
        return 0;
    }
    if (!collateral.isPositive() || !sell.isValid()) {
        return kLtvUnboundedPercent * kPercentScale;
    }
    const wide_t num = wide_t{borrowed.units()} * kAssetScale * 100 * kPercentScale;
    const wide_t den = wide_t{collateral.units()} * sell.units();
    const wide_t ltv = num / den;
    const wide_t cap = wide_t{kLtvUnboundedPercent} * kPercentScale;
    return narrow(ltv < cap ? ltv : cap);
}

//-------------------------------------------------------------------------

decimal_t currentLtv(BaseAmount borrowed, CryptoAmount collateral, Rate sell)
{
    return decimal_t{currentLtvScaled(borrowed, collateral, sell)} / decimal_t{kPercentScale};
}

//-------------------------------------------------------------------------

RiskStatus classifyRisk(int64_t ltvScaled, const RiskThresholds& thresholds)
{
    if (ltvScaled >= scalePercent(thresholds.liquidation)) {
        return RiskStatus::LIQUIDATE;
    }
    if (ltvScaled >= scalePercent(thresholds.warning)) {
        return RiskStatus::WARNING;
    }
    return RiskStatus::SAFE;
}

//-------------------------------------------------------------------------

BaseAmount simpleInterest(BaseAmount principal, decimal_t annualRate, int64_t days)
{
    if (!principal.isPositive() || days <= 0) {
        return BaseAmount{};
    }
    const wide_t num = wide_t{principal.units()} * scalePercent(annualRate) * days;
    const wide_t den = wide_t{100} * kPercentScale * kDaysPerYear;
    return BaseAmount{narrow(divRoundHalfAway(num, den))};
}

//-------------------------------------------------------------------------

BaseAmount dailyInterest(BaseAmount borrowed, decimal_t annualRate)
{
    return simpleInterest(borrowed, annualRate, 1);
}

//-------------------------------------------------------------------------

CryptoAmount collateralToRestoreTarget(
    BaseAmount borrowed, CryptoAmount collateral, Rate sell, decimal_t targetLtv)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!sell.isValid()) {
        throw std::invalid_argument{fmt::format("{}: sell rate must be positive, was {}", ctx, sell)};
    }
    const int64_t target = scalePercent(targetLtv);
    if (target <= 0 || target >= 100 * kPercentScale) {
        throw std::invalid_argument{fmt::format(
            "{}: target LTV must lie in (0, 100), was {}", ctx, targetLtv)};
    }
    if (!borrowed.isPositive() || !collateral.isPositive()) {
        return CryptoAmount{};
    }

    // Selling x leaves (B - x*s/S) / ((C - x)*s/S) <= T/100, i.e.
    // x >= (100*B*S - T*C*s) / ((100 - T)*s).
    const wide_t num = wide_t{100} * kPercentScale * borrowed.units() * kAssetScale
        - wide_t{target} * collateral.units() * sell.units();
    if (num <= 0) {
        return CryptoAmount{};
    }
    const wide_t den = (wide_t{100} * kPercentScale - target) * sell.units();
    const wide_t sold = divCeil(num, den);
    return sold < collateral.units() ? CryptoAmount{narrow(sold)} : collateral;
}

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
