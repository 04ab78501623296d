/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/Amount.hpp"
#include "lendcore/decimal/decimal.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace lendcore
{

inline void PrintTo(const decimal_t& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

}  // namespace lendcore

namespace lendcore::accounting
{

template<typename Tag>
void PrintTo(const Amount<Tag>& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

inline void PrintTo(const Rate& val, std::ostream* os)
{
    *os << fmt::format("{}/coin", val);
}

}  // namespace lendcore::accounting

//-------------------------------------------------------------------------
