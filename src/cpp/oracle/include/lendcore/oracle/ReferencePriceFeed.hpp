/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/oracle/MarkupRateOracle.hpp"
#include "lendcore/util/common.hpp"
#include "lendcore/util/net.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>

//-------------------------------------------------------------------------

namespace lendcore::oracle
{

//-------------------------------------------------------------------------

/**
 * Feeds a MarkupRateOracle from a file holding a single reference price,
 * rewritten by an external price fetcher. The price is stamped with the
 * file's modification time, so a fetcher that stops writing lets the quote
 * go stale and the oracle fail closed.
 */
class ReferencePriceFeed
{
public:
    static constexpr std::chrono::seconds kDefaultInterval{60};

    ReferencePriceFeed(
        std::shared_ptr<MarkupRateOracle> oracle,
        fs::path path,
        Clock::Ptr clock,
        std::chrono::seconds interval = kDefaultInterval,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    // Reads the file once; false, with the oracle untouched, if it is missing or malformed.
    bool poll();

    void start(net::io_context& io);
    void stop();
    [[nodiscard]] bool isRunning() const noexcept { return m_running; }

    [[nodiscard]] const fs::path& path() const noexcept { return m_path; }
    [[nodiscard]] std::chrono::seconds interval() const noexcept { return m_interval; }
    [[nodiscard]] uint64_t failures() const noexcept { return m_failures; }

private:
    net::awaitable<void> loop();

    std::shared_ptr<MarkupRateOracle> m_oracle;
    fs::path m_path;
    Clock::Ptr m_clock;
    std::chrono::seconds m_interval;
    std::shared_ptr<spdlog::logger> m_logger;

    std::atomic<bool> m_running{};
    std::atomic<uint64_t> m_failures{};
    std::unique_ptr<net::steady_timer> m_timer;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::oracle

//-------------------------------------------------------------------------
