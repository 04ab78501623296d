/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/lending/InterestAccrualJob.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

InterestAccrualJob::InterestAccrualJob(
    LendingEngine& engine,
    const date::time_zone* zone,
    std::chrono::minutes timeOfDay,
    std::shared_ptr<spdlog::logger> logger)
    : m_engine{engine}, m_zone{zone}, m_timeOfDay{timeOfDay}, m_logger{std::move(logger)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_zone == nullptr || !m_logger) {
        throw std::invalid_argument{fmt::format("{}: time zone and logger are required", ctx)};
    }
    if (m_timeOfDay < std::chrono::minutes{0} || m_timeOfDay >= std::chrono::hours{24}) {
        throw std::invalid_argument{fmt::format(
            "{}: time of day must lie within one day, was {} minutes", ctx, m_timeOfDay.count())};
    }
}

//-------------------------------------------------------------------------

AccrualReport InterestAccrualJob::run()
{
    std::lock_guard lock{m_runMtx};

    AccrualReport report{.localDay = localDay(m_engine.clock().now())};
    m_logger->info("Starting interest accrual for local day {}", report.localDay);

    for (LoanId loanId : m_engine.store().activeLoanIds()) {
        try {
            if (const auto interest = m_engine.accrueDailyInterest(loanId, report.localDay)) {
                ++report.processed;
                report.totalInterest += *interest;
            } else {
                ++report.skipped;
            }
        }
        catch (const std::exception& exc) {
            ++report.failed;
            report.failures.push_back({.loanId = loanId, .message = exc.what()});
            m_logger->error("Interest accrual failed for loan #{}: {}", loanId, exc.what());
        }
    }

    m_logger->info(
        "Interest accrual for day {} done: {} charged, {} skipped, {} failed, total interest {}",
        report.localDay, report.processed, report.skipped, report.failed, report.totalInterest);
    return report;
}

//-------------------------------------------------------------------------

int32_t InterestAccrualJob::localDay(Timestamp timestamp) const
{
    const auto local = date::make_zoned(
        m_zone, date::sys_seconds{std::chrono::seconds{timestamp}}).get_local_time();
    return static_cast<int32_t>(date::floor<date::days>(local).time_since_epoch().count());
}

//-------------------------------------------------------------------------

Timestamp InterestAccrualJob::nextRunAfter(Timestamp timestamp) const
{
    const auto local = date::make_zoned(
        m_zone, date::sys_seconds{std::chrono::seconds{timestamp}}).get_local_time();
    auto target = date::floor<date::days>(local) + m_timeOfDay;
    if (target <= local) {
        target += date::days{1};
    }
    const auto sys = m_zone->to_sys(target, date::choose::earliest);
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count());
}

//-------------------------------------------------------------------------

void InterestAccrualJob::start(net::io_context& io)
{
    if (m_running.exchange(true)) {
        return;
    }
    m_timer = std::make_unique<net::steady_timer>(io);
    net::co_spawn(io, loop(), net::detached);
}

//-------------------------------------------------------------------------

void InterestAccrualJob::stop()
{
    if (!m_running.exchange(false) || !m_timer) {
        return;
    }
    net::post(m_timer->get_executor(), [this] { m_timer->cancel(); });
}

//-------------------------------------------------------------------------

net::awaitable<void> InterestAccrualJob::loop()
{
    while (m_running) {
        const Timestamp now = m_engine.clock().now();
        const Timestamp next = nextRunAfter(now);
        m_logger->debug("Next interest accrual at {}", next);
        if (!co_await waitFor(*m_timer, std::chrono::seconds{next - now}) || !m_running) {
            break;
        }
        const AccrualReport report = run();
        if (report.failed > 0) {
            m_logger->warn(
                "{} loan(s) could not be accrued on day {}", report.failed, report.localDay);
        }
    }
}

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
