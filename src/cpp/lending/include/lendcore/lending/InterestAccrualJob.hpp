/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/LendingEngine.hpp"
#include "lendcore/util/net.hpp"

#include <date/tz.h>

#include <atomic>
#include <mutex>

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

struct AccrualFailure
{
    LoanId loanId{LOAN_ID_INVALID};
    std::string message;
};

struct AccrualReport
{
    int32_t localDay{};
    size_t processed{};
    size_t skipped{};
    size_t failed{};
    BaseAmount totalInterest;
    std::vector<AccrualFailure> failures;
};

//-------------------------------------------------------------------------

/**
 * Daily interest accrual over all active loans.
 *
 * A loan is charged at most once per local calendar day of the configured
 * time zone, so re-running the job on the same day is harmless. A failure on
 * one loan is reported and does not stop the others.
 */
class InterestAccrualJob
{
public:
    InterestAccrualJob(
        LendingEngine& engine,
        const date::time_zone* zone,
        std::chrono::minutes timeOfDay = std::chrono::minutes{1},
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    AccrualReport run();

    [[nodiscard]] int32_t localDay(Timestamp timestamp) const;
    [[nodiscard]] Timestamp nextRunAfter(Timestamp timestamp) const;

    void start(net::io_context& io);
    void stop();
    [[nodiscard]] bool isRunning() const noexcept { return m_running; }

    [[nodiscard]] const date::time_zone* zone() const noexcept { return m_zone; }
    [[nodiscard]] std::chrono::minutes timeOfDay() const noexcept { return m_timeOfDay; }

private:
    net::awaitable<void> loop();

    LendingEngine& m_engine;
    const date::time_zone* m_zone;
    std::chrono::minutes m_timeOfDay;
    std::shared_ptr<spdlog::logger> m_logger;

    std::mutex m_runMtx;
    std::atomic<bool> m_running{};
    std::unique_ptr<net::steady_timer> m_timer;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
