/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/serialization/json_util.hpp"

#include <fmt/format.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <source_location>
#include <stdexcept>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendcore::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer writer{buffer};
    json.Accept(writer);
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    if (json.Parse(str.c_str()).HasParseError()) {
        static constexpr size_t kMaxCharsShown = 200;
        const std::string_view shown{str.data(), std::min(kMaxCharsShown, str.size())};
        throw std::invalid_argument{fmt::format(
            "{}: Malformed operation detail at offset {}: {}{}",
            std::source_location::current().function_name(),
            json.GetErrorOffset(),
            shown,
            shown.size() < str.size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

void setOptionalMember(rapidjson::Document& json, const char* key, std::optional<int64_t> opt)
{
    auto& allocator = json.GetAllocator();
    rapidjson::Value val;
    if (opt.has_value()) {
        val.SetInt64(*opt);
    }
    json.AddMember(rapidjson::Value{key, allocator}, val, allocator);
}

//-------------------------------------------------------------------------

}  // namespace lendcore::json

//-------------------------------------------------------------------------
