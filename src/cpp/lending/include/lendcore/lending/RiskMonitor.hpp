/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/LendingEngine.hpp"
#include "lendcore/util/net.hpp"

#include <atomic>

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

struct TickReport
{
    // Another tick was still running.
    bool skipped{};
    bool rateUnavailable{};
    size_t evaluated{};
    size_t warnings{};
    size_t liquidations{};
    size_t failed{};
};

struct MonitorStatus
{
    bool running{};
    bool tickInProgress{};
    std::chrono::seconds interval{};
    uint64_t ticks{};
    uint64_t liquidations{};
    Timestamp lastTick{TIMESTAMP_INVALID};
};

//-------------------------------------------------------------------------

/**
 * Periodically re-evaluates every active loan against a single fresh quote
 * and liquidates those at or above the liquidation threshold. Without a
 * quote the whole tick is skipped; nothing is evaluated at a stale rate.
 */
class RiskMonitor
{
public:
    static constexpr std::chrono::seconds kDefaultInterval{30};

    RiskMonitor(
        LendingEngine& engine,
        std::chrono::seconds interval = kDefaultInterval,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    TickReport tick();

    void start(net::io_context& io);
    void stop();
    [[nodiscard]] MonitorStatus status() const;

private:
    net::awaitable<void> loop();

    LendingEngine& m_engine;
    std::chrono::seconds m_interval;
    std::shared_ptr<spdlog::logger> m_logger;

    std::atomic<bool> m_running{};
    std::atomic<bool> m_tickInProgress{};
    std::atomic<uint64_t> m_ticks{};
    std::atomic<uint64_t> m_liquidations{};
    std::atomic<Timestamp> m_lastTick{TIMESTAMP_INVALID};
    std::unique_ptr<net::steady_timer> m_timer;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
