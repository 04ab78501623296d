/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/LendingSignals.hpp"
#include "lendcore/util/common.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace lendcore::service
{

//-------------------------------------------------------------------------

class OperationLogger
{
public:
    OperationLogger(const fs::path& filepath, decltype(lending::LendingSignals::operation)& signal);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(const lending::OperationRecord& record) const;

private:
    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_feed;
};

//-------------------------------------------------------------------------

// Quotes a CSV field, doubling embedded quotes.
[[nodiscard]] std::string csvQuote(std::string_view field);

//-------------------------------------------------------------------------

}  // namespace lendcore::service

//-------------------------------------------------------------------------
