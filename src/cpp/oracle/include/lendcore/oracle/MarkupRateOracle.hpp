/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/oracle/RateOracle.hpp"
#include "lendcore/settings/SettingsStore.hpp"
#include "lendcore/util/Clock.hpp"

#include <mutex>
#include <optional>

//-------------------------------------------------------------------------

namespace lendcore::oracle
{

//-------------------------------------------------------------------------

/**
 * Derives buy and sell rates from a fed reference price by applying the
 * multipliers held in the settings store:
 *
 *   buy  = round(reference * buy_multiplier)
 *   sell = round(reference * sell_multiplier)
 *
 * A reference price older than the freshness window is treated as absent.
 */
class MarkupRateOracle : public RateOracle
{
public:
    static constexpr decimal_t kDefaultBuyMultiplier{91};
    static constexpr decimal_t kDefaultSellMultiplier{88};

    MarkupRateOracle(
        settings::SettingsStore::Ptr settings, Clock::Ptr clock, Timestamp freshnessWindow);

    void update(decimal_t referencePrice, Timestamp timestamp);
    void update(decimal_t referencePrice);

    [[nodiscard]] Timestamp freshnessWindow() const noexcept { return m_freshnessWindow; }

    [[nodiscard]] RateQuote quote() const override;

private:
    settings::SettingsStore::Ptr m_settings;
    Clock::Ptr m_clock;
    Timestamp m_freshnessWindow;

    mutable std::mutex m_mtx;
    std::optional<std::pair<decimal_t, Timestamp>> m_reference;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::oracle

//-------------------------------------------------------------------------
