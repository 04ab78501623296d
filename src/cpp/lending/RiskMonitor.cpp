/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/lending/RiskMonitor.hpp"

#include "lendcore/util/LendingException.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

namespace
{

struct InProgressGuard
{
    std::atomic<bool>& flag;

    ~InProgressGuard() noexcept { flag = false; }
};

}  // namespace

//-------------------------------------------------------------------------

RiskMonitor::RiskMonitor(
    LendingEngine& engine, std::chrono::seconds interval, std::shared_ptr<spdlog::logger> logger)
    : m_engine{engine}, m_interval{interval}, m_logger{std::move(logger)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_interval <= std::chrono::seconds{0}) {
        throw std::invalid_argument{fmt::format(
            "{}: interval must be positive, was {}s", ctx, m_interval.count())};
    }
    if (!m_logger) {
        throw std::invalid_argument{fmt::format("{}: logger is required", ctx)};
    }
}

//-------------------------------------------------------------------------

TickReport RiskMonitor::tick()
{
    TickReport report;

    bool expected = false;
    if (!m_tickInProgress.compare_exchange_strong(expected, true)) {
        m_logger->debug("Risk check already in progress, skipping tick");
        report.skipped = true;
        return report;
    }
    InProgressGuard guard{m_tickInProgress};
    ++m_ticks;
    m_lastTick = m_engine.clock().now();

    oracle::RateQuote quote;
    try {
        quote = m_engine.quote();
    }
    catch (const RateUnavailable& exc) {
        m_logger->warn("Risk check skipped, no usable rate: {}", exc.what());
        report.rateUnavailable = true;
        return report;
    }

    for (LoanId loanId : m_engine.store().activeLoanIds()) {
        try {
            const auto evaluation = m_engine.evaluateRisk(loanId, quote);
            if (!evaluation.has_value()) {
                continue;
            }
            ++report.evaluated;
            if (evaluation->liquidation.has_value()) {
                ++report.liquidations;
            } else if (evaluation->view.riskStatus == RiskStatus::WARNING) {
                ++report.warnings;
            }
        }
        catch (const std::exception& exc) {
            ++report.failed;
            m_logger->error("Risk check failed for loan #{}: {}", loanId, exc.what());
        }
    }
    m_liquidations += report.liquidations;

    if (report.liquidations > 0 || report.failed > 0) {
        m_logger->info(
            "Risk check at rate {}: {} evaluated, {} warnings, {} liquidations, {} failed",
            quote.sell, report.evaluated, report.warnings, report.liquidations, report.failed);
    }
    return report;
}

//-------------------------------------------------------------------------

void RiskMonitor::start(net::io_context& io)
{
    if (m_running.exchange(true)) {
        return;
    }
    m_timer = std::make_unique<net::steady_timer>(io);
    net::co_spawn(io, loop(), net::detached);
    m_logger->info("Risk monitor started with a {}s interval", m_interval.count());
}

//-------------------------------------------------------------------------

void RiskMonitor::stop()
{
    if (!m_running.exchange(false) || !m_timer) {
        return;
    }
    net::post(m_timer->get_executor(), [this] { m_timer->cancel(); });
    m_logger->info("Risk monitor stopped");
}

//-------------------------------------------------------------------------

MonitorStatus RiskMonitor::status() const
{
    return {
        .running = m_running,
        .tickInProgress = m_tickInProgress,
        .interval = m_interval,
        .ticks = m_ticks,
        .liquidations = m_liquidations,
        .lastTick = m_lastTick
    };
}

//-------------------------------------------------------------------------

net::awaitable<void> RiskMonitor::loop()
{
    while (m_running) {
        if (!co_await waitFor(*m_timer, m_interval) || !m_running) {
            break;
        }
        tick();
    }
}

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
