/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/accounting/Amount.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendcore::accounting
{

//-------------------------------------------------------------------------

namespace
{

using wide_t = boost::multiprecision::checked_int128_t;

int64_t narrow(const wide_t& val, std::source_location sl = std::source_location::current())
{
    if (val > std::numeric_limits<int64_t>::max() || val < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error{fmt::format(
            "{}: intermediate result does not fit into 64 bits", sl.function_name())};
    }
    return val.convert_to<int64_t>();
}

void checkDivisor(int64_t c, std::source_location sl = std::source_location::current())
{
    if (c == 0) {
        throw std::domain_error{fmt::format("{}: division by zero", sl.function_name())};
    }
}

}  // namespace

//-------------------------------------------------------------------------

int64_t checkedAdd(int64_t a, int64_t b)
{
    return narrow(wide_t{a} + b);
}

//-------------------------------------------------------------------------

int64_t checkedSub(int64_t a, int64_t b)
{
    return narrow(wide_t{a} - b);
}

//-------------------------------------------------------------------------

int64_t mulDivFloor(int64_t a, int64_t b, int64_t c)
{
    checkDivisor(c);
    const wide_t num = wide_t{a} * b;
    wide_t q = num / c;
    if (num % c != 0 && ((num < 0) != (c < 0))) {
        --q;
    }
    return narrow(q);
}

//-------------------------------------------------------------------------

int64_t mulDivCeil(int64_t a, int64_t b, int64_t c)
{
    checkDivisor(c);
    const wide_t num = wide_t{a} * b;
    wide_t q = num / c;
    if (num % c != 0 && ((num < 0) == (c < 0))) {
        ++q;
    }
    return narrow(q);
}

//-------------------------------------------------------------------------

BaseAmount valueOf(CryptoAmount crypto, Rate rate)
{
    return BaseAmount{mulDivFloor(crypto.units(), rate.units(), kAssetScale)};
}

//-------------------------------------------------------------------------

CryptoAmount cryptoFor(BaseAmount amount, Rate rate)
{
    if (!rate.isValid()) {
        throw std::invalid_argument{fmt::format(
            "{}: rate must be positive, was {}",
            std::source_location::current().function_name(), rate)};
    }
    return CryptoAmount{mulDivCeil(amount.units(), kAssetScale, rate.units())};
}

//-------------------------------------------------------------------------

}  // namespace lendcore::accounting

//-------------------------------------------------------------------------
