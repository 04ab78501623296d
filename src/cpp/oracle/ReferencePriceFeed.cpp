/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/oracle/ReferencePriceFeed.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <source_location>

//-------------------------------------------------------------------------

namespace lendcore::oracle
{

//-------------------------------------------------------------------------

ReferencePriceFeed::ReferencePriceFeed(
    std::shared_ptr<MarkupRateOracle> oracle,
    fs::path path,
    Clock::Ptr clock,
    std::chrono::seconds interval,
    std::shared_ptr<spdlog::logger> logger)
    : m_oracle{std::move(oracle)},
      m_path{std::move(path)},
      m_clock{std::move(clock)},
      m_interval{interval},
      m_logger{std::move(logger)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!m_oracle || !m_clock || !m_logger) {
        throw std::invalid_argument{fmt::format("{}: oracle, clock and logger are required", ctx)};
    }
    if (m_interval <= std::chrono::seconds{0}) {
        throw std::invalid_argument{fmt::format(
            "{}: interval must be positive, was {}s", ctx, m_interval.count())};
    }
}

//-------------------------------------------------------------------------

bool ReferencePriceFeed::poll()
{
    std::error_code ec;
    const auto modified = fs::last_write_time(m_path, ec);
    std::ifstream ifs{m_path};
    if (ec || !ifs) {
        ++m_failures;
        m_logger->warn("Reference price file '{}' is unreadable", m_path.c_str());
        return false;
    }
    std::string content{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
    boost::algorithm::trim(content);

    const auto modifiedAt = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::file_clock::to_sys(modified).time_since_epoch()).count();
    const Timestamp timestamp =
        std::min(m_clock->now(), static_cast<Timestamp>(std::max<int64_t>(modifiedAt, 0)));

    try {
        m_oracle->update(settings::parseDecimal(content), timestamp);
    }
    catch (const std::invalid_argument& e) {
        ++m_failures;
        m_logger->warn("Reference price file '{}' rejected: {}", m_path.c_str(), e.what());
        return false;
    }
    m_logger->debug("Reference price {} read from '{}'", content, m_path.c_str());
    return true;
}

//-------------------------------------------------------------------------

void ReferencePriceFeed::start(net::io_context& io)
{
    if (m_running.exchange(true)) {
        return;
    }
    m_timer = std::make_unique<net::steady_timer>(io);
    net::co_spawn(io, loop(), net::detached);
    m_logger->info(
        "Reference price feed started on '{}' every {}s", m_path.c_str(), m_interval.count());
}

//-------------------------------------------------------------------------

void ReferencePriceFeed::stop()
{
    if (!m_running.exchange(false) || !m_timer) {
        return;
    }
    net::post(m_timer->get_executor(), [this] { m_timer->cancel(); });
    m_logger->info("Reference price feed stopped");
}

//-------------------------------------------------------------------------

net::awaitable<void> ReferencePriceFeed::loop()
{
    while (m_running) {
        if (!co_await waitFor(*m_timer, m_interval) || !m_running) {
            break;
        }
        poll();
    }
}

//-------------------------------------------------------------------------

}  // namespace lendcore::oracle

//-------------------------------------------------------------------------
