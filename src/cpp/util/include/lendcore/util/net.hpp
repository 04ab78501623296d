/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>

//-------------------------------------------------------------------------

namespace net = boost::asio;
using net::use_awaitable;
namespace this_coro = net::this_coro;

using namespace std::literals::chrono_literals;

//-------------------------------------------------------------------------

namespace lendcore
{

// Waits on the timer; false when the wait was cancelled.
[[nodiscard]] inline net::awaitable<bool> waitFor(
    net::steady_timer& timer, std::chrono::steady_clock::duration duration)
{
    boost::system::error_code ec;
    timer.expires_after(duration);
    co_await timer.async_wait(net::redirect_error(use_awaitable, ec));
    co_return !ec;
}

}  // namespace lendcore

//-------------------------------------------------------------------------
