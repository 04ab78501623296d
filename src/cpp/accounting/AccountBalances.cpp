/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/accounting/AccountBalances.hpp"

#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendcore::accounting
{

//-------------------------------------------------------------------------

void AccountBalances::checkConsistency(std::source_location sl) const
{
    if (availableCrypto.isNegative()
        || collateralCrypto.isNegative()
        || availableBase.isNegative()
        || borrowedBase.isNegative()
        || interestAccruedBase.isNegative()) {
        throw std::runtime_error{fmt::format(
            "{}: negative balance bucket: {}", sl.function_name(), *this)};
    }
}

//-------------------------------------------------------------------------

bool AccountBalances::operator==(const AccountBalances& other) const noexcept
{
    return availableCrypto == other.availableCrypto
        && collateralCrypto == other.collateralCrypto
        && availableBase == other.availableBase
        && borrowedBase == other.borrowedBase
        && interestAccruedBase == other.interestAccruedBase;
}

//-------------------------------------------------------------------------

void AccountBalances::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("availableCrypto", rapidjson::Value{availableCrypto.units()}, allocator);
        json.AddMember("collateralCrypto", rapidjson::Value{collateralCrypto.units()}, allocator);
        json.AddMember("availableBase", rapidjson::Value{availableBase.units()}, allocator);
        json.AddMember("borrowedBase", rapidjson::Value{borrowedBase.units()}, allocator);
        json.AddMember(
            "interestAccruedBase", rapidjson::Value{interestAccruedBase.units()}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

AccountBalances AccountBalances::fromXML(pugi::xml_node node)
{
    AccountBalances bals{
        CryptoAmount{node.attribute("availableCrypto").as_llong()},
        BaseAmount{node.attribute("availableBase").as_llong()}};
    if (bals.availableCrypto.isNegative() || bals.availableBase.isNegative()) {
        throw std::invalid_argument{fmt::format(
            "{}: Initial balances must be non-negative, were {}",
            std::source_location::current().function_name(),
            bals)};
    }
    return bals;
}

//-------------------------------------------------------------------------

}  // namespace lendcore::accounting

//-------------------------------------------------------------------------
