/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/oracle/StaticRateOracle.hpp"

#include "lendcore/util/LendingException.hpp"

#include <fmt/format.h>

#include <source_location>

//-------------------------------------------------------------------------

namespace lendcore::oracle
{

//-------------------------------------------------------------------------

StaticRateOracle::StaticRateOracle(accounting::Rate buy, accounting::Rate sell)
{
    set(buy, sell);
}

//-------------------------------------------------------------------------

void StaticRateOracle::set(accounting::Rate buy, accounting::Rate sell)
{
    if (!buy.isValid() || !sell.isValid()) {
        throw std::invalid_argument{fmt::format(
            "{}: rates must be positive, were buy {} / sell {}",
            std::source_location::current().function_name(), buy, sell)};
    }
    std::lock_guard lock{m_mtx};
    m_quote = RateQuote{.buy = buy, .sell = sell};
}

//-------------------------------------------------------------------------

void StaticRateOracle::setSell(accounting::Rate sell)
{
    accounting::Rate buy;
    {
        std::lock_guard lock{m_mtx};
        buy = m_quote.has_value() ? m_quote->buy : sell;
    }
    set(std::max(buy, sell), sell);
}

//-------------------------------------------------------------------------

void StaticRateOracle::setAvailable(bool available) noexcept
{
    std::lock_guard lock{m_mtx};
    m_available = available;
}

//-------------------------------------------------------------------------

RateQuote StaticRateOracle::quote() const
{
    std::lock_guard lock{m_mtx};
    if (!m_available || !m_quote.has_value()) {
        throw RateUnavailable{fmt::format(
            "{}: no rate quote available", std::source_location::current().function_name())};
    }
    return *m_quote;
}

//-------------------------------------------------------------------------

}  // namespace lendcore::oracle

//-------------------------------------------------------------------------
