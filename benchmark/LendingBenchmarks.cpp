/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <date/tz.h>
#include <fmt/format.h>
#include <spdlog/sinks/null_sink.h>

#include "lendcore/lending/InterestAccrualJob.hpp"
#include "lendcore/lending/LendingEngine.hpp"
#include "lendcore/lending/RiskMonitor.hpp"
#include "lendcore/oracle/StaticRateOracle.hpp"

//-------------------------------------------------------------------------

using namespace lendcore;
using namespace lendcore::accounting;
using namespace lendcore::lending;

//-------------------------------------------------------------------------

static constexpr Timestamp kStart = 1'700'000'000;
static constexpr Rate kBuy{9'306'818};
static constexpr Rate kSell{9'000'000};

//-------------------------------------------------------------------------

struct EngineFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        const auto kLoanCount = static_cast<AccountId>(state.range(0));

        ledger = std::make_unique<AccountLedger>();
        store = std::make_unique<LoanStore>();
        oracle = std::make_shared<oracle::StaticRateOracle>(kBuy, kSell);
        clock = std::make_shared<ManualClock>(kStart);

        auto settings = std::make_shared<settings::SettingsStore>();
        LendingParameters{}.writeTo(*settings);
        auto logger = std::make_shared<spdlog::logger>(
            "bench", std::make_shared<spdlog::sinks::null_sink_mt>());
        engine = std::make_unique<LendingEngine>(*ledger, *store, oracle, settings, clock, logger);

        for (AccountId accountId = 1; accountId <= kLoanCount; ++accountId) {
            ledger->registerAccount(
                accountId, AccountBalances{CryptoAmount{1'000'000}, BaseAmount{100'000}});
            engine->depositCollateral(accountId, CryptoAmount{300'000});
            engine->borrow(accountId, BaseAmount{10'000 + accountId % 500});
        }
    }

    void TearDown(benchmark::State&) override
    {
        engine.reset();
        store.reset();
        ledger.reset();
    }

    std::unique_ptr<AccountLedger> ledger;
    std::unique_ptr<LoanStore> store;
    std::shared_ptr<oracle::StaticRateOracle> oracle;
    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<LendingEngine> engine;
};

//-------------------------------------------------------------------------

struct MemoryManager : benchmark::MemoryManager
{
    benchmark::MemoryManager::Result stats;

    void Start() override
    {
        stats.num_allocs = 0;
        stats.max_bytes_used = 0;
        stats.total_allocated_bytes = 0;
        stats.net_heap_growth = 0;
    }

    void Stop(benchmark::MemoryManager::Result& result) override { result = stats; }
};

static MemoryManager s_mngr;

void* operator new(size_t size)
{
    void* ptr = malloc(size);
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }
    auto& [num_allocs, max_bytes_used, total_allocated_bytes, net_heap_growth] = s_mngr.stats;
    num_allocs++;
    total_allocated_bytes += size;
    net_heap_growth += size;
    max_bytes_used = std::max(max_bytes_used, net_heap_growth);
    return ptr;
}

void operator delete(void* ptr) noexcept
{
    free(ptr);
}

void operator delete(void* ptr, size_t size) noexcept
{
    s_mngr.stats.net_heap_growth -= static_cast<int64_t>(size);
    free(ptr);
}

//-------------------------------------------------------------------------

// One borrow and one partial repayment per iteration on every loan.
BENCHMARK_DEFINE_F(EngineFixture, BorrowRepayCycle)(benchmark::State& state)
{
    const auto kLoanCount = static_cast<AccountId>(state.range(0));
    for (auto _ : state) {
        for (AccountId accountId = 1; accountId <= kLoanCount; ++accountId) {
            engine->borrow(accountId, BaseAmount{100});
            engine->repay(accountId, BaseAmount{100});
        }
    }
    state.SetItemsProcessed(state.iterations() * kLoanCount * 2);
}
BENCHMARK_REGISTER_F(EngineFixture, BorrowRepayCycle)->Arg(100)->Arg(1'000);

// Risk checks with every loan in the warning zone, so nothing is liquidated.
BENCHMARK_DEFINE_F(EngineFixture, RiskTick)(benchmark::State& state)
{
    oracle->setSell(Rate{3'900'000});
    RiskMonitor monitor{*engine, RiskMonitor::kDefaultInterval, engine->logger().clone("monitor")};
    for (auto _ : state) {
        const auto report = monitor.tick();
        benchmark::DoNotOptimize(report.warnings);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(EngineFixture, RiskTick)->Arg(100)->Arg(1'000)->Arg(10'000);

// Daily accrual, one simulated day per iteration.
BENCHMARK_DEFINE_F(EngineFixture, DailyAccrual)(benchmark::State& state)
{
    InterestAccrualJob job{
        *engine,
        date::locate_zone("UTC"),
        std::chrono::minutes{1},
        engine->logger().clone("accrual")};
    for (auto _ : state) {
        const auto report = job.run();
        benchmark::DoNotOptimize(report.totalInterest);
        clock->advanceDays(1);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(EngineFixture, DailyAccrual)->Arg(100)->Arg(1'000)->Arg(10'000);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::RegisterMemoryManager(&s_mngr);
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::RegisterMemoryManager(nullptr);
}

//-------------------------------------------------------------------------
