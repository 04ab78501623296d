/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/service/OperationLogger.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace lendcore::service
{

//-------------------------------------------------------------------------

OperationLogger::OperationLogger(
    const fs::path& filepath, decltype(lending::LendingSignals::operation)& signal)
    : m_filepath{filepath}
{
    // Slots fire from the request, monitor and accrual threads.
    m_logger = std::make_unique<spdlog::logger>(
        "OperationLogger", std::make_unique<spdlog::sinks::basic_file_sink_mt>(m_filepath));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_feed = signal.connect([this](const lending::OperationRecord& record) { log(record); });

    m_logger->trace(
        "time,operationId,type,loanId,accountId,baseDelta,cryptoDelta,executionRate,detail");
    m_logger->flush();
}

//-------------------------------------------------------------------------

void OperationLogger::log(const lending::OperationRecord& record) const
{
    m_logger->trace(fmt::format(
        "{},{},{},{},{},{},{},{},{}",
        record.timestamp,
        record.id,
        lending::toString(record.type),
        record.loanId,
        record.accountId,
        record.baseDelta,
        record.cryptoDelta,
        record.executionRate ? fmt::to_string(*record.executionRate) : std::string{},
        csvQuote(record.detail)));
    m_logger->flush();
}

//-------------------------------------------------------------------------

std::string csvQuote(std::string_view field)
{
    std::string escaped{field};
    boost::algorithm::replace_all(escaped, "\"", "\"\"");
    return fmt::format("\"{}\"", escaped);
}

//-------------------------------------------------------------------------

}  // namespace lendcore::service

//-------------------------------------------------------------------------
