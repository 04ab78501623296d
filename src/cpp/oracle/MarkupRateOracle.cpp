/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/oracle/MarkupRateOracle.hpp"

#include "lendcore/util/LendingException.hpp"

#include <fmt/format.h>

#include <source_location>

//-------------------------------------------------------------------------

namespace lendcore::oracle
{

//-------------------------------------------------------------------------

MarkupRateOracle::MarkupRateOracle(
    settings::SettingsStore::Ptr settings, Clock::Ptr clock, Timestamp freshnessWindow)
    : m_settings{std::move(settings)},
      m_clock{std::move(clock)},
      m_freshnessWindow{freshnessWindow}
{
    if (!m_settings || !m_clock) {
        throw std::invalid_argument{fmt::format(
            "{}: settings and clock are required",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

void MarkupRateOracle::update(decimal_t referencePrice, Timestamp timestamp)
{
    if (!(referencePrice > decimal_t{})
        || !BloombergLP::bdldfp::DecimalUtil::isFinite(referencePrice)) {
        throw std::invalid_argument{fmt::format(
            "{}: reference price must be positive and finite, was {}",
            std::source_location::current().function_name(), referencePrice)};
    }
    std::lock_guard lock{m_mtx};
    m_reference = std::make_pair(referencePrice, timestamp);
}

//-------------------------------------------------------------------------

void MarkupRateOracle::update(decimal_t referencePrice)
{
    update(referencePrice, m_clock->now());
}

//-------------------------------------------------------------------------

RateQuote MarkupRateOracle::quote() const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::optional<std::pair<decimal_t, Timestamp>> reference;
    {
        std::lock_guard lock{m_mtx};
        reference = m_reference;
    }
    if (!reference.has_value()) {
        throw RateUnavailable{fmt::format("{}: no reference price received yet", ctx)};
    }
    const auto [price, timestamp] = *reference;
    const Timestamp now = m_clock->now();
    if (now > timestamp && now - timestamp > m_freshnessWindow) {
        throw RateUnavailable{fmt::format(
            "{}: reference price from {} is stale at {} (window {}s)",
            ctx, timestamp, now, m_freshnessWindow)};
    }

    using settings::keys::kBuyMultiplier;
    using settings::keys::kSellMultiplier;
    const decimal_t buyMultiplier = m_settings->getDecimalOr(kBuyMultiplier, kDefaultBuyMultiplier);
    const decimal_t sellMultiplier =
        m_settings->getDecimalOr(kSellMultiplier, kDefaultSellMultiplier);

    const accounting::Rate buy{util::toInteger(util::roundHalfAway(price * buyMultiplier))};
    const accounting::Rate sell{util::toInteger(util::roundHalfAway(price * sellMultiplier))};
    if (!buy.isValid() || !sell.isValid()) {
        throw RateUnavailable{fmt::format(
            "{}: derived rates are not positive (buy {}, sell {})", ctx, buy, sell)};
    }

    return RateQuote{
        .buy = buy,
        .sell = sell,
        .referencePrice = price,
        .timestamp = timestamp
    };
}

//-------------------------------------------------------------------------

}  // namespace lendcore::oracle

//-------------------------------------------------------------------------
