/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendcore::accounting
{

//-------------------------------------------------------------------------

// Smallest crypto units per whole coin.
inline constexpr int64_t kAssetScale = 100'000'000;

// Throw std::overflow_error rather than wrap.
[[nodiscard]] int64_t checkedAdd(int64_t a, int64_t b);
[[nodiscard]] int64_t checkedSub(int64_t a, int64_t b);

//-------------------------------------------------------------------------

struct CryptoTag
{
    static constexpr std::string_view symbol = "CRYPTO";
};

struct BaseTag
{
    static constexpr std::string_view symbol = "BASE";
};

//-------------------------------------------------------------------------

template<typename Tag>
class Amount
{
public:
    constexpr Amount() noexcept = default;
    constexpr explicit Amount(int64_t units) noexcept : m_units{units} {}

    [[nodiscard]] constexpr int64_t units() const noexcept { return m_units; }
    [[nodiscard]] constexpr bool isPositive() const noexcept { return m_units > 0; }
    [[nodiscard]] constexpr bool isZero() const noexcept { return m_units == 0; }
    [[nodiscard]] constexpr bool isNegative() const noexcept { return m_units < 0; }

    Amount& operator+=(Amount other)
    {
        m_units = checkedAdd(m_units, other.m_units);
        return *this;
    }

    Amount& operator-=(Amount other)
    {
        m_units = checkedSub(m_units, other.m_units);
        return *this;
    }

    [[nodiscard]] friend Amount operator+(Amount lhs, Amount rhs) { return lhs += rhs; }

    [[nodiscard]] friend Amount operator-(Amount lhs, Amount rhs) { return lhs -= rhs; }

    [[nodiscard]] friend Amount operator-(Amount val) { return Amount{checkedSub(0, val.m_units)}; }

    friend constexpr auto operator<=>(const Amount&, const Amount&) noexcept = default;

    static constexpr std::string_view symbol = Tag::symbol;

private:
    int64_t m_units{};
};

using CryptoAmount = Amount<CryptoTag>;
using BaseAmount = Amount<BaseTag>;

//-------------------------------------------------------------------------

// Base units fetched by kAssetScale crypto units.
class Rate
{
public:
    constexpr Rate() noexcept = default;
    constexpr explicit Rate(int64_t baseUnitsPerCoin) noexcept : m_units{baseUnitsPerCoin} {}

    [[nodiscard]] constexpr int64_t units() const noexcept { return m_units; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return m_units > 0; }

    friend constexpr auto operator<=>(const Rate&, const Rate&) noexcept = default;

private:
    int64_t m_units{};
};

//-------------------------------------------------------------------------

[[nodiscard]] int64_t mulDivFloor(int64_t a, int64_t b, int64_t c);
[[nodiscard]] int64_t mulDivCeil(int64_t a, int64_t b, int64_t c);

// floor(crypto * rate / kAssetScale)
[[nodiscard]] BaseAmount valueOf(CryptoAmount crypto, Rate rate);

// Least crypto quantity whose value at rate covers amount.
[[nodiscard]] CryptoAmount cryptoFor(BaseAmount amount, Rate rate);

//-------------------------------------------------------------------------

}  // namespace lendcore::accounting

//-------------------------------------------------------------------------

template<typename Tag>
struct fmt::formatter<lendcore::accounting::Amount<Tag>> : fmt::formatter<int64_t>
{
    template<typename FormatContext>
    auto format(lendcore::accounting::Amount<Tag> amount, FormatContext& ctx) const
    {
        return fmt::formatter<int64_t>::format(amount.units(), ctx);
    }
};

template<>
struct fmt::formatter<lendcore::accounting::Rate> : fmt::formatter<int64_t>
{
    template<typename FormatContext>
    auto format(lendcore::accounting::Rate rate, FormatContext& ctx) const
    {
        return fmt::formatter<int64_t>::format(rate.units(), ctx);
    }
};

//-------------------------------------------------------------------------
