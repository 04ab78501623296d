/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <msgpack.hpp>

#include <source_location>
#include <span>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendcore::serialization
{

//-------------------------------------------------------------------------

// Raised when a checkpoint does not have the expected shape.
struct MsgPackError : msgpack::type_error
{
    std::string message;

    explicit MsgPackError(
        std::string_view reason, std::source_location sl = std::source_location::current())
        : message{fmt::format("{}#L{}: {}", sl.file_name(), sl.line(), reason)}
    {}

    const char* what() const noexcept override { return message.c_str(); }
};

//-------------------------------------------------------------------------

// Value stored under key in a map object.
[[nodiscard]] inline const msgpack::object& msgpackAt(
    const msgpack::object& o,
    std::string_view key,
    std::source_location sl = std::source_location::current())
{
    if (o.type != msgpack::type::MAP) {
        throw MsgPackError{fmt::format("expected a map holding '{}'", key), sl};
    }
    for (const msgpack::object_kv& kv : std::span{o.via.map.ptr, o.via.map.size}) {
        if (kv.key.type == msgpack::type::STR
            && std::string_view{kv.key.via.str.ptr, kv.key.via.str.size} == key) {
            return kv.val;
        }
    }
    throw MsgPackError{fmt::format("missing key '{}'", key), sl};
}

//-------------------------------------------------------------------------

}  // namespace lendcore::serialization

//-------------------------------------------------------------------------
