/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/Amount.hpp"
#include "lendcore/serialization/json_util.hpp"

#include <pugixml.hpp>

#include <source_location>

//-------------------------------------------------------------------------

namespace lendcore::accounting
{

//-------------------------------------------------------------------------

struct AccountBalances : public JsonSerializable
{
    CryptoAmount availableCrypto{};
    CryptoAmount collateralCrypto{};
    BaseAmount availableBase{};
    BaseAmount borrowedBase{};
    BaseAmount interestAccruedBase{};

    AccountBalances() noexcept = default;
    AccountBalances(CryptoAmount availableCrypto, BaseAmount availableBase) noexcept
        : availableCrypto{availableCrypto}, availableBase{availableBase}
    {}

    [[nodiscard]] CryptoAmount totalCrypto() const
    {
        return availableCrypto + collateralCrypto;
    }

    // Liquid base currency minus what is owed.
    [[nodiscard]] BaseAmount netBase() const { return availableBase - borrowedBase; }

    void checkConsistency(std::source_location sl = std::source_location::current()) const;

    [[nodiscard]] bool operator==(const AccountBalances& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static AccountBalances fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace lendcore::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendcore::accounting::AccountBalances>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendcore::accounting::AccountBalances& bals, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "crypto {} (collateral {}) | base {} (borrowed {}, interest {})",
            bals.availableCrypto,
            bals.collateralCrypto,
            bals.availableBase,
            bals.borrowedBase,
            bals.interestAccruedBase);
    }
};

//-------------------------------------------------------------------------
