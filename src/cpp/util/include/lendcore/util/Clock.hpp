/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

//-------------------------------------------------------------------------

// Seconds since the Unix epoch.
using Timestamp = uint64_t;

inline constexpr Timestamp TIMESTAMP_INVALID = 0;
inline constexpr Timestamp kSecondsPerDay = 86'400;

//-------------------------------------------------------------------------

namespace lendcore
{

//-------------------------------------------------------------------------

// Time source of the engine and its jobs; tests drive a ManualClock.
class Clock
{
public:
    using Ptr = std::shared_ptr<Clock>;

    virtual ~Clock() noexcept = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
};

//-------------------------------------------------------------------------

class SystemClock : public Clock
{
public:
    [[nodiscard]] Timestamp now() const override
    {
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
};

//-------------------------------------------------------------------------

class ManualClock : public Clock
{
public:
    explicit ManualClock(Timestamp start) noexcept : m_now{start} {}

    [[nodiscard]] Timestamp now() const override { return m_now.load(); }

    void set(Timestamp t) noexcept { m_now.store(t); }
    void advance(Timestamp seconds) noexcept { m_now.fetch_add(seconds); }
    void advanceDays(uint32_t days) noexcept { advance(days * kSecondsPerDay); }

private:
    std::atomic<Timestamp> m_now;
};

//-------------------------------------------------------------------------

}  // namespace lendcore

//-------------------------------------------------------------------------
