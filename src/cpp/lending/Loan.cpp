/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/lending/Loan.hpp"

#include "lendcore/serialization/json_util.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

int64_t Loan::daysElapsed(Timestamp now) const noexcept
{
    if (now <= createdAt) {
        return 0;
    }
    return static_cast<int64_t>((now - createdAt) / kSecondsPerDay);
}

//-------------------------------------------------------------------------

void Loan::checkConsistency(std::source_location sl) const
{
    const bool negative = collateralAmount.isNegative()
        || borrowedAmount.isNegative()
        || principal.isNegative()
        || interestCharged.isNegative()
        || debtRepaid.isNegative()
        || writtenOff.isNegative();
    if (negative) {
        throw std::runtime_error{fmt::format(
            "{}: negative amount on {}", sl.function_name(), *this)};
    }
    if (borrowedAmount != principal + interestCharged - debtRepaid - writtenOff) {
        throw std::runtime_error{fmt::format(
            "{}: running totals disagree with outstanding debt on {} (written off {})",
            sl.function_name(), *this, writtenOff)};
    }
    if (!isActive() && (!borrowedAmount.isZero() || !collateralAmount.isZero())) {
        throw std::runtime_error{fmt::format(
            "{}: closed loan still holds funds: {}", sl.function_name(), *this)};
    }
}

//-------------------------------------------------------------------------

bool Loan::operator==(const Loan& other) const noexcept
{
    return id == other.id
        && owner == other.owner
        && collateralAmount == other.collateralAmount
        && borrowedAmount == other.borrowedAmount
        && ltvRatio == other.ltvRatio
        && interestRate == other.interestRate
        && liquidationPrice == other.liquidationPrice
        && status == other.status
        && createdAt == other.createdAt
        && closedAt == other.closedAt
        && principal == other.principal
        && interestCharged == other.interestCharged
        && debtRepaid == other.debtRepaid
        && writtenOff == other.writtenOff
        && lastAccrualDay == other.lastAccrualDay;
}

//-------------------------------------------------------------------------

void Loan::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json.AddMember("owner", rapidjson::Value{owner}, allocator);
        json.AddMember(
            "status",
            rapidjson::Value{std::string{toString(status)}.c_str(), allocator},
            allocator);
        json.AddMember("collateralAmount", rapidjson::Value{collateralAmount.units()}, allocator);
        json.AddMember("borrowedAmount", rapidjson::Value{borrowedAmount.units()}, allocator);
        json.AddMember("principal", rapidjson::Value{principal.units()}, allocator);
        json.AddMember("interestCharged", rapidjson::Value{interestCharged.units()}, allocator);
        json.AddMember("debtRepaid", rapidjson::Value{debtRepaid.units()}, allocator);
        json.AddMember("writtenOff", rapidjson::Value{writtenOff.units()}, allocator);
        json.AddMember(
            "ltvRatio", rapidjson::Value{util::decimal2double(ltvRatio)}, allocator);
        json.AddMember(
            "interestRate", rapidjson::Value{util::decimal2double(interestRate)}, allocator);
        json.AddMember("liquidationPrice", rapidjson::Value{liquidationPrice.units()}, allocator);
        json.AddMember("createdAt", rapidjson::Value{createdAt}, allocator);
        json::setOptionalMember(
            json,
            "closedAt",
            closedAt != TIMESTAMP_INVALID
                ? std::make_optional(static_cast<int64_t>(closedAt))
                : std::nullopt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
