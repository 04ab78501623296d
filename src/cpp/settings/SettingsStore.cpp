/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/settings/SettingsStore.hpp"

#include <fmt/core.h>

#include <mutex>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendcore::settings
{

//-------------------------------------------------------------------------

void SettingsStore::set(std::string_view key, const Val& val)
{
    std::unique_lock lock{m_mtx};
    m_parameterMap.insert_or_assign(Key{key}, val);
}

//-------------------------------------------------------------------------

void SettingsStore::set(std::string_view key, decimal_t val)
{
    set(key, fmt::format("{}", val));
}

//-------------------------------------------------------------------------

SettingsStore::Val SettingsStore::get(std::string_view key) const
{
    if (auto val = tryGet(key)) {
        return std::move(val).value();
    }
    throw std::out_of_range{fmt::format(
        "{}: no setting with name '{}' is currently in the settings store",
        std::source_location::current().function_name(),
        key)};
}

//-------------------------------------------------------------------------

std::optional<SettingsStore::Val> SettingsStore::tryGet(std::string_view key) const
{
    std::shared_lock lock{m_mtx};
    if (const auto it = m_parameterMap.find(key); it != m_parameterMap.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

bool SettingsStore::contains(std::string_view key) const
{
    std::shared_lock lock{m_mtx};
    return m_parameterMap.contains(key);
}

//-------------------------------------------------------------------------

decimal_t SettingsStore::getDecimal(std::string_view key) const
{
    return parseDecimal(get(key));
}

//-------------------------------------------------------------------------

decimal_t SettingsStore::getDecimalOr(std::string_view key, decimal_t fallback) const
{
    if (auto val = tryGet(key)) {
        return parseDecimal(*val);
    }
    return fallback;
}

//-------------------------------------------------------------------------

decimal_t parseDecimal(std::string_view str)
{
    const std::string buf{str};
    decimal_t val;
    if (BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&val, buf.c_str()) != 0) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' is not a decimal number",
            std::source_location::current().function_name(),
            str)};
    }
    return val;
}

//-------------------------------------------------------------------------

}  // namespace lendcore::settings

//-------------------------------------------------------------------------
