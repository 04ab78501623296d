/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/Amount.hpp"
#include "lendcore/decimal/decimal.hpp"
#include "lendcore/util/Clock.hpp"

#include <memory>

//-------------------------------------------------------------------------

namespace lendcore::oracle
{

//-------------------------------------------------------------------------

struct RateQuote
{
    accounting::Rate buy;
    // Conservative side; every collateral valuation uses it.
    accounting::Rate sell;
    decimal_t referencePrice{};
    Timestamp timestamp{};
};

//-------------------------------------------------------------------------

class RateOracle
{
public:
    using Ptr = std::shared_ptr<RateOracle>;

    virtual ~RateOracle() noexcept = default;

    // Throws RateUnavailable rather than returning a stale or default quote.
    [[nodiscard]] virtual RateQuote quote() const = 0;

protected:
    RateOracle() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::oracle

//-------------------------------------------------------------------------
