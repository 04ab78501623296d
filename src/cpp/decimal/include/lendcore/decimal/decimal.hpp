/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <source_location>
#include <spanstream>
#include <stdexcept>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace lendcore
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace lendcore

//-------------------------------------------------------------------------

namespace lendcore::util
{

// Half away from zero, to an integral value.
[[nodiscard]] inline decimal_t roundHalfAway(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalUtil::round(val);
}

[[nodiscard]] inline double decimal2double(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalConvertUtil::decimalToDouble(val);
}

// Values must already be integral and within the exactly representable range of a double.
[[nodiscard]] inline int64_t toInteger(decimal_t val)
{
    static constexpr double kMaxExact = 9007199254740992.0;
    const double d = decimal2double(val);
    if (!(std::abs(d) <= kMaxExact)) {
        throw std::overflow_error{fmt::format(
            "{}: decimal value {} does not fit an exact integer",
            std::source_location::current().function_name(), d)};
    }
    return static_cast<int64_t>(std::llround(d));
}

}  // namespace lendcore::util

//-------------------------------------------------------------------------

namespace lendcore::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace lendcore::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendcore::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendcore::decimal_t val, FormatContext& ctx) const
    {
        using namespace lendcore::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
