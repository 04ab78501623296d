/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/lending/OperationRecord.hpp"

#include "lendcore/serialization/json_util.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

bool OperationRecord::operator==(const OperationRecord& other) const noexcept
{
    return id == other.id
        && loanId == other.loanId
        && accountId == other.accountId
        && type == other.type
        && baseDelta == other.baseDelta
        && cryptoDelta == other.cryptoDelta
        && executionRate == other.executionRate
        && detail == other.detail
        && timestamp == other.timestamp;
}

//-------------------------------------------------------------------------

void OperationRecord::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json.AddMember("loanId", rapidjson::Value{loanId}, allocator);
        json.AddMember("accountId", rapidjson::Value{accountId}, allocator);
        json.AddMember(
            "type",
            rapidjson::Value{std::string{toString(type)}.c_str(), allocator},
            allocator);
        json.AddMember("baseDelta", rapidjson::Value{baseDelta.units()}, allocator);
        json.AddMember("cryptoDelta", rapidjson::Value{cryptoDelta.units()}, allocator);
        json::setOptionalMember(
            json,
            "executionRate",
            executionRate.transform([](accounting::Rate rate) { return rate.units(); }));
        rapidjson::Document detailJson{&allocator};
        detailJson.CopyFrom(json::str2json(detail), allocator);
        json.AddMember("detail", detailJson, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

OperationDetail::OperationDetail()
{
    m_json.SetObject();
}

//-------------------------------------------------------------------------

OperationDetail& OperationDetail::add(const char* name, accounting::BaseAmount amount)
{
    return add(name, amount.units());
}

//-------------------------------------------------------------------------

OperationDetail& OperationDetail::add(const char* name, accounting::CryptoAmount amount)
{
    return add(name, amount.units());
}

//-------------------------------------------------------------------------

OperationDetail& OperationDetail::add(const char* name, accounting::Rate rate)
{
    return add(name, rate.units());
}

//-------------------------------------------------------------------------

OperationDetail& OperationDetail::add(const char* name, int64_t value)
{
    auto& allocator = m_json.GetAllocator();
    m_json.AddMember(rapidjson::Value{name, allocator}, rapidjson::Value{value}, allocator);
    return *this;
}

//-------------------------------------------------------------------------

OperationDetail& OperationDetail::add(const char* name, decimal_t value)
{
    auto& allocator = m_json.GetAllocator();
    m_json.AddMember(
        rapidjson::Value{name, allocator},
        rapidjson::Value{util::decimal2double(value)},
        allocator);
    return *this;
}

//-------------------------------------------------------------------------

OperationDetail& OperationDetail::add(const char* name, std::string_view value)
{
    auto& allocator = m_json.GetAllocator();
    m_json.AddMember(
        rapidjson::Value{name, allocator},
        rapidjson::Value{value.data(), static_cast<rapidjson::SizeType>(value.size()), allocator},
        allocator);
    return *this;
}

//-------------------------------------------------------------------------

std::string OperationDetail::str() const
{
    return json::json2str(m_json);
}

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
