/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/oracle/ReferencePriceFeed.hpp"
#include "lendcore/util/LendingException.hpp"
#include "lending_fixture.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>
#include <thread>

//-------------------------------------------------------------------------

using namespace lendcore;
using namespace lendcore::accounting;
using namespace lendcore::oracle;
using namespace lendcore::test;

using namespace testing;

//-------------------------------------------------------------------------

struct ReferencePriceFeedTest : Test
{
    virtual void SetUp() override
    {
        dir = fs::temp_directory_path()
            / fmt::format("lendcore-feed-{}", UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
        oracle = std::make_shared<MarkupRateOracle>(
            std::make_shared<settings::SettingsStore>(), clock, 300);
        feed = std::make_unique<ReferencePriceFeed>(
            oracle, dir / "price.txt", clock, std::chrono::seconds{1}, nullLogger());
    }

    virtual void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void writePrice(std::string_view content)
    {
        std::ofstream ofs{dir / "price.txt", std::ios::trunc};
        ofs << content;
    }

    fs::path dir;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(kStart);
    std::shared_ptr<MarkupRateOracle> oracle;
    // Outlives the feed's timer.
    net::io_context io;
    std::unique_ptr<ReferencePriceFeed> feed;
};

//-------------------------------------------------------------------------

TEST_F(ReferencePriceFeedTest, PollFeedsTheOracle)
{
    writePrice("  102272.73\n");

    ASSERT_TRUE(feed->poll());

    const RateQuote q = oracle->quote();
    EXPECT_EQ(q.buy, kBuy);
    EXPECT_EQ(q.sell, kSell);
    // The file is newer than the manual clock, so the stamp is capped at now.
    EXPECT_EQ(q.timestamp, kStart);
    EXPECT_EQ(feed->failures(), 0);
}

TEST_F(ReferencePriceFeedTest, RefreshesAfterTheFileChanges)
{
    writePrice("102272.73");
    ASSERT_TRUE(feed->poll());
    clock->advance(301);
    EXPECT_THROW((void) oracle->quote(), RateUnavailable);

    writePrice("50000");
    ASSERT_TRUE(feed->poll());

    EXPECT_EQ(oracle->quote().sell, Rate{4'400'000});
    EXPECT_EQ(oracle->quote().timestamp, kStart + 301);
}

TEST_F(ReferencePriceFeedTest, FileNotRewrittenGoesStale)
{
    writePrice("102272.73");
    fs::last_write_time(
        dir / "price.txt",
        std::chrono::file_clock::from_sys(
            std::chrono::sys_seconds{std::chrono::seconds{kStart - 301}}));

    ASSERT_TRUE(feed->poll());

    EXPECT_THROW((void) oracle->quote(), RateUnavailable);
}

TEST_F(ReferencePriceFeedTest, MissingFileKeepsTheLastQuote)
{
    oracle->update(DEC(102272.73));

    EXPECT_FALSE(feed->poll());

    EXPECT_EQ(oracle->quote().sell, kSell);
    EXPECT_EQ(feed->failures(), 1);
}

struct MalformedPriceFileTest : ReferencePriceFeedTest, WithParamInterface<const char*>
{};

TEST_P(MalformedPriceFileTest, KeepsTheLastQuote)
{
    oracle->update(DEC(102272.73));
    writePrice(GetParam());

    EXPECT_FALSE(feed->poll());

    EXPECT_EQ(oracle->quote().sell, kSell);
    EXPECT_EQ(feed->failures(), 1);
}

INSTANTIATE_TEST_SUITE_P(
    ReferencePriceFeed,
    MalformedPriceFileTest,
    Values("", "price", "0", "-50000", "inf"));

TEST_F(ReferencePriceFeedTest, RejectsNonPositiveInterval)
{
    EXPECT_THROW(
        (ReferencePriceFeed{oracle, dir / "price.txt", clock, std::chrono::seconds{0}, nullLogger()}),
        std::invalid_argument);
}

TEST_F(ReferencePriceFeedTest, LoopRereadsUntilStopped)
{
    oracle->update(DEC(102272.73));
    writePrice("50000");

    feed->start(io);
    EXPECT_TRUE(feed->isRunning());
    {
        std::jthread runner{[&] { io.run(); }};
        for (int i = 0; i < 100 && oracle->quote().sell == kSell; ++i) {
            std::this_thread::sleep_for(50ms);
        }
        feed->stop();
    }

    EXPECT_FALSE(feed->isRunning());
    EXPECT_EQ(oracle->quote().sell, Rate{4'400'000});
}

//-------------------------------------------------------------------------
