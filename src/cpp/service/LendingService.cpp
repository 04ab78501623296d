/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/service/LendingService.hpp"

#include "lendcore/accounting/serialization/AccountBalances.hpp"
#include "lendcore/lending/serialization/Loan.hpp"
#include "lendcore/lending/serialization/OperationRecord.hpp"
#include "lendcore/serialization/json_util.hpp"

#include <fmt/chrono.h>

#include <csignal>
#include <fstream>
#include <iterator>

//-------------------------------------------------------------------------

namespace lendcore::service
{

//-------------------------------------------------------------------------

LendingService::LendingService(
    LendingConfig config, Clock::Ptr clock, std::shared_ptr<spdlog::logger> logger)
    : m_config{std::move(config)},
      m_clock{std::move(clock)},
      m_logger{std::move(logger)},
      m_settings{std::make_shared<settings::SettingsStore>()}
{
    m_logger->set_level(m_config.logging.level);
    m_config.parameters.writeTo(*m_settings);
    m_settings->set(settings::keys::kBuyMultiplier, m_config.oracle.buyMultiplier);
    m_settings->set(settings::keys::kSellMultiplier, m_config.oracle.sellMultiplier);

    m_oracle = makeOracle();
    m_engine = std::make_unique<lending::LendingEngine>(
        m_ledger, m_store, m_oracle, m_settings, m_clock, m_logger);

    fs::create_directories(m_config.logging.dir);
    m_operationLogger = std::make_unique<OperationLogger>(
        m_config.logging.dir / "operations.csv", m_engine->signals().operation);

    m_accrualJob = std::make_unique<lending::InterestAccrualJob>(
        *m_engine,
        date::locate_zone(m_config.accrual.timeZone),
        m_config.accrual.timeOfDay,
        m_logger);
    m_riskMonitor = std::make_unique<lending::RiskMonitor>(
        *m_engine, m_config.riskMonitorInterval, m_logger);
}

//-------------------------------------------------------------------------

LendingService::~LendingService() noexcept
{
    if (m_priceFeed) {
        m_priceFeed->stop();
    }
    m_accrualJob->stop();
    m_riskMonitor->stop();
    m_io.stop();
}

//-------------------------------------------------------------------------

std::unique_ptr<LendingService> LendingService::fromXML(
    pugi::xml_node node, Clock::Ptr clock, std::shared_ptr<spdlog::logger> logger)
{
    auto service = std::make_unique<LendingService>(
        makeLendingConfig(node), std::move(clock), std::move(logger));
    service->ledger().registerXML(node.child("Accounts"));
    return service;
}

//-------------------------------------------------------------------------

std::unique_ptr<LendingService> LendingService::fromFile(
    const fs::path& path, Clock::Ptr clock, std::shared_ptr<spdlog::logger> logger)
{
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Error loading '{}': {}",
            std::source_location::current().function_name(),
            path.c_str(),
            result.description())};
    }
    return fromXML(doc.child("Lending"), std::move(clock), std::move(logger));
}

//-------------------------------------------------------------------------

void LendingService::start()
{
    if (m_running.exchange(true)) {
        return;
    }
    if (m_io.stopped()) {
        m_io.restart();
    }
    m_signals = std::make_unique<net::signal_set>(m_io, SIGINT, SIGTERM);
    m_signals->async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        m_logger->info("Received signal {}, shutting down", signo);
        stop();
    });
    if (m_priceFeed) {
        m_priceFeed->start(m_io);
    }
    m_riskMonitor->start(m_io);
    m_accrualJob->start(m_io);
    m_logger->info(
        "Lending service started: risk check every {}s, accrual at {:%H:%M} {}",
        m_config.riskMonitorInterval.count(),
        m_config.accrual.timeOfDay,
        m_config.accrual.timeZone);
}

//-------------------------------------------------------------------------

void LendingService::run()
{
    start();
    m_io.run();
    m_logger->info("Lending service stopped");
}

//-------------------------------------------------------------------------

void LendingService::stop()
{
    if (!m_running.exchange(false)) {
        return;
    }
    if (m_priceFeed) {
        m_priceFeed->stop();
    }
    m_riskMonitor->stop();
    m_accrualJob->stop();
    net::post(m_io, [this] {
        if (m_signals) {
            boost::system::error_code ec;
            m_signals->cancel(ec);
        }
    });
}

//-------------------------------------------------------------------------

lending::AccrualReport LendingService::triggerInterestAccrualNow()
{
    const lending::AccrualReport report = m_accrualJob->run();
    m_logger->info(
        "Manual interest accrual for day {}: {} processed, {} skipped, {} failed, {} charged",
        report.localDay,
        report.processed,
        report.skipped,
        report.failed,
        report.totalInterest);
    return report;
}

//-------------------------------------------------------------------------

lending::TickReport LendingService::triggerRiskCheckNow()
{
    return m_riskMonitor->tick();
}

//-------------------------------------------------------------------------

void LendingService::updateReferencePrice(decimal_t referencePrice)
{
    if (!m_markupOracle) {
        m_logger->warn("Reference price {} ignored: fixed rates are configured", referencePrice);
        return;
    }
    m_markupOracle->update(referencePrice);
}

//-------------------------------------------------------------------------

void LendingService::writeCheckpoint(const fs::path& path) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::map<AccountId, accounting::AccountBalances> accounts;
    for (AccountId accountId : m_ledger.accountIds()) {
        accounts.emplace(accountId, m_ledger.snapshot(accountId));
    }
    const std::vector<lending::Loan> loans = m_store.loans();
    const std::vector<lending::OperationRecord> operations = m_store.operations();

    msgpack::sbuffer stream;
    msgpack::packer<msgpack::sbuffer> packer{stream};
    packer.pack_map(3);
    packer.pack(std::string{"accounts"});
    packer.pack(accounts);
    packer.pack(std::string{"loans"});
    packer.pack(loans);
    packer.pack(std::string{"operations"});
    packer.pack(operations);

    const fs::path tmpPath = fs::path{path}.concat(".tmp");
    {
        std::ofstream ofs{tmpPath, std::ios::binary};
        if (!ofs) {
            throw std::runtime_error{fmt::format(
                "{}: Error writing checkpoint to '{}'", ctx, tmpPath.c_str())};
        }
        ofs.write(stream.data(), static_cast<std::streamsize>(stream.size()));
    }
    fs::rename(tmpPath, path);

    m_logger->info(
        "Checkpoint with {} account(s), {} loan(s), {} operation(s) written to {}",
        accounts.size(),
        loans.size(),
        operations.size(),
        path.c_str());
}

//-------------------------------------------------------------------------

void LendingService::loadCheckpoint(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::ifstream ifs{path, std::ios::binary};
    if (!ifs) {
        throw std::runtime_error{fmt::format(
            "{}: Error reading checkpoint from '{}'", ctx, path.c_str())};
    }
    const std::string data{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};

    msgpack::object_handle oh = msgpack::unpack(data.data(), data.size());
    const msgpack::object& o = oh.get();

    using serialization::msgpackAt;
    auto accounts =
        msgpackAt(o, "accounts").as<std::map<AccountId, accounting::AccountBalances>>();
    auto loans = msgpackAt(o, "loans").as<std::vector<lending::Loan>>();
    auto operations = msgpackAt(o, "operations").as<std::vector<lending::OperationRecord>>();

    const size_t loanCount = loans.size();
    const size_t operationCount = operations.size();
    m_store.restore(std::move(loans), std::move(operations));
    for (const auto& [accountId, balances] : accounts) {
        m_ledger.restore(accountId, balances);
    }

    m_logger->info(
        "Checkpoint with {} account(s), {} loan(s), {} operation(s) loaded from {}",
        accounts.size(),
        loanCount,
        operationCount,
        path.c_str());
}

//-------------------------------------------------------------------------

rapidjson::Document LendingService::stateJson() const
{
    rapidjson::Document json{rapidjson::kObjectType};
    m_ledger.jsonSerialize(json, "accounts");
    m_store.jsonSerialize(json, "store");
    return json;
}

//-------------------------------------------------------------------------

oracle::RateOracle::Ptr LendingService::makeOracle()
{
    const OracleConfig& cfg = m_config.oracle;
    if (cfg.isStatic()) {
        m_logger->info("Using fixed rates {}/{}", *cfg.buyRate, *cfg.sellRate);
        return std::make_shared<oracle::StaticRateOracle>(*cfg.buyRate, *cfg.sellRate);
    }
    if (!cfg.priceFile) {
        throw std::invalid_argument{fmt::format(
            "{}: the markup oracle needs a 'priceFile' to refresh its reference price",
            std::source_location::current().function_name())};
    }
    m_markupOracle =
        std::make_shared<oracle::MarkupRateOracle>(m_settings, m_clock, cfg.freshnessSeconds);
    if (cfg.referencePrice) {
        m_markupOracle->update(*cfg.referencePrice);
    }
    m_priceFeed = std::make_unique<oracle::ReferencePriceFeed>(
        m_markupOracle, *cfg.priceFile, m_clock, cfg.refreshInterval, m_logger);
    if (!m_priceFeed->poll() && !cfg.referencePrice) {
        m_logger->warn("No reference price yet, borrowing is unavailable until '{}' is written",
            cfg.priceFile->c_str());
    }
    return m_markupOracle;
}

//-------------------------------------------------------------------------

}  // namespace lendcore::service

//-------------------------------------------------------------------------
