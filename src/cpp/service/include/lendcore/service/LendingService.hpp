/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/InterestAccrualJob.hpp"
#include "lendcore/lending/RiskMonitor.hpp"
#include "lendcore/oracle/MarkupRateOracle.hpp"
#include "lendcore/oracle/ReferencePriceFeed.hpp"
#include "lendcore/oracle/StaticRateOracle.hpp"
#include "lendcore/service/LendingConfig.hpp"
#include "lendcore/service/OperationLogger.hpp"

#include <boost/asio/signal_set.hpp>

#include <atomic>

//-------------------------------------------------------------------------

namespace lendcore::service
{

//-------------------------------------------------------------------------

/**
 * Owns the ledger, the loan store and the engine, and drives the risk monitor
 * and the daily accrual on one io_context.
 */
class LendingService
{
public:
    explicit LendingService(
        LendingConfig config,
        Clock::Ptr clock = std::make_shared<SystemClock>(),
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~LendingService() noexcept;

    // Parses <Lending> and seeds the ledger from its <Accounts> child.
    [[nodiscard]] static std::unique_ptr<LendingService> fromXML(
        pugi::xml_node node,
        Clock::Ptr clock = std::make_shared<SystemClock>(),
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    [[nodiscard]] static std::unique_ptr<LendingService> fromFile(
        const fs::path& path,
        Clock::Ptr clock = std::make_shared<SystemClock>(),
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    // Schedules the background jobs; run() then blocks until stop() or a signal.
    void start();
    void run();
    void stop();
    [[nodiscard]] bool isRunning() const noexcept { return m_running; }

    lending::AccrualReport triggerInterestAccrualNow();
    lending::TickReport triggerRiskCheckNow();

    // Feeds the markup oracle directly, between reads of the price file; ignored with fixed rates.
    void updateReferencePrice(decimal_t referencePrice);
    // Null with fixed rates.
    [[nodiscard]] oracle::ReferencePriceFeed* priceFeed() noexcept { return m_priceFeed.get(); }

    // Take with no operation in flight: accounts and loans are read one at a time.
    void writeCheckpoint(const fs::path& path) const;
    void loadCheckpoint(const fs::path& path);
    [[nodiscard]] rapidjson::Document stateJson() const;

    [[nodiscard]] const LendingConfig& config() const noexcept { return m_config; }
    [[nodiscard]] accounting::AccountLedger& ledger() noexcept { return m_ledger; }
    [[nodiscard]] lending::LoanStore& store() noexcept { return m_store; }
    [[nodiscard]] settings::SettingsStore& settings() noexcept { return *m_settings; }
    [[nodiscard]] lending::LendingEngine& engine() noexcept { return *m_engine; }
    [[nodiscard]] lending::InterestAccrualJob& accrualJob() noexcept { return *m_accrualJob; }
    [[nodiscard]] lending::RiskMonitor& riskMonitor() noexcept { return *m_riskMonitor; }
    [[nodiscard]] OperationLogger& operationLogger() noexcept { return *m_operationLogger; }
    [[nodiscard]] net::io_context& io() noexcept { return m_io; }

private:
    [[nodiscard]] oracle::RateOracle::Ptr makeOracle();

    LendingConfig m_config;
    Clock::Ptr m_clock;
    std::shared_ptr<spdlog::logger> m_logger;

    accounting::AccountLedger m_ledger;
    lending::LoanStore m_store;
    settings::SettingsStore::Ptr m_settings;
    std::shared_ptr<oracle::MarkupRateOracle> m_markupOracle;
    oracle::RateOracle::Ptr m_oracle;
    std::unique_ptr<lending::LendingEngine> m_engine;
    std::unique_ptr<OperationLogger> m_operationLogger;

    net::io_context m_io;
    std::unique_ptr<net::signal_set> m_signals;
    std::unique_ptr<oracle::ReferencePriceFeed> m_priceFeed;
    std::unique_ptr<lending::InterestAccrualJob> m_accrualJob;
    std::unique_ptr<lending::RiskMonitor> m_riskMonitor;
    std::atomic<bool> m_running{};
};

//-------------------------------------------------------------------------

}  // namespace lendcore::service

//-------------------------------------------------------------------------
