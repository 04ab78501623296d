/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <rapidjson/document.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace lendcore
{

// State that can be dumped for inspection, either into the given document or
// under key within it.
class JsonSerializable
{
public:
    virtual ~JsonSerializable() noexcept = default;

    virtual void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const = 0;
};

}  // namespace lendcore

//-------------------------------------------------------------------------

namespace lendcore::json
{

//-------------------------------------------------------------------------

// Compact single-line form, as stored in operation details.
[[nodiscard]] std::string json2str(const rapidjson::Value& json);

[[nodiscard]] rapidjson::Document str2json(const std::string& str);

// Serializes into json itself, or into a new member named key.
void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

// Null when opt is empty.
void setOptionalMember(rapidjson::Document& json, const char* key, std::optional<int64_t> opt);

//-------------------------------------------------------------------------

}  // namespace lendcore::json

//-------------------------------------------------------------------------
