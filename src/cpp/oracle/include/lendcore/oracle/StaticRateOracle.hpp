/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/oracle/RateOracle.hpp"

#include <mutex>
#include <optional>

//-------------------------------------------------------------------------

namespace lendcore::oracle
{

//-------------------------------------------------------------------------

class StaticRateOracle : public RateOracle
{
public:
    StaticRateOracle() noexcept = default;
    StaticRateOracle(accounting::Rate buy, accounting::Rate sell);

    void set(accounting::Rate buy, accounting::Rate sell);
    void setSell(accounting::Rate sell);
    void setAvailable(bool available) noexcept;

    [[nodiscard]] RateQuote quote() const override;

private:
    mutable std::mutex m_mtx;
    std::optional<RateQuote> m_quote;
    bool m_available{true};
};

//-------------------------------------------------------------------------

}  // namespace lendcore::oracle

//-------------------------------------------------------------------------
