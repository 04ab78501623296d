/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/service/LendingService.hpp"
#include "lending_fixture.hpp"

#include <fstream>
#include <thread>

//-------------------------------------------------------------------------

using namespace lendcore;
using namespace lendcore::accounting;
using namespace lendcore::lending;
using namespace lendcore::service;
using namespace lendcore::test;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

std::vector<std::string> readLines(const fs::path& path)
{
    std::ifstream ifs{path};
    std::vector<std::string> lines;
    for (std::string line; std::getline(ifs, line);) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

//-------------------------------------------------------------------------

struct LendingServiceTest : Test
{
    virtual void SetUp() override
    {
        dir = fs::temp_directory_path()
            / fmt::format("lendcore-{}", UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
    }

    virtual void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::unique_ptr<LendingService> makeService(const std::string& oracleNode)
    {
        const std::string xml = R"(<Lending><InterestAccrual time="00:01" timeZone="UTC"/>)"
            + oracleNode
            + R"(<Logging dir=")" + dir.string() + R"(" level="info"/>)"
            + R"(<Accounts>)"
            + R"(<Account id="1" availableCrypto="500000" availableBase="0"/>)"
            + R"(<Account id="2" availableCrypto="500000" availableBase="1000"/>)"
            + R"(</Accounts></Lending>)";
        pugi::xml_document doc;
        if (!doc.load_string(xml.c_str())) {
            throw std::runtime_error{"bad test XML"};
        }
        return LendingService::fromXML(doc.document_element(), clock, nullLogger());
    }

    std::unique_ptr<LendingService> makeService()
    {
        return makeService(R"(<Oracle buyRate="9306818" sellRate="9000000"/>)");
    }

    fs::path dir;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(kStart);
};

//-------------------------------------------------------------------------

TEST_F(LendingServiceTest, FromXmlSeedsAccountsAndOperationLog)
{
    const auto service = makeService();

    EXPECT_THAT(service->ledger().accountIds(), ElementsAre(1, 2));
    EXPECT_EQ(service->ledger().snapshot(2).availableBase, BaseAmount{1'000});
    EXPECT_EQ(service->engine().quote().sell, kSell);
    EXPECT_EQ(service->config().accrual.timeZone, "UTC");
    EXPECT_EQ(service->operationLogger().filepath(), dir / "operations.csv");
    EXPECT_THAT(
        readLines(dir / "operations.csv"),
        ElementsAre("time,operationId,type,loanId,accountId,baseDelta,cryptoDelta,executionRate,detail"));
}

TEST_F(LendingServiceTest, FromFileRejectsMissingFile)
{
    EXPECT_THROW(
        (void) LendingService::fromFile(dir / "missing.xml", clock, nullLogger()),
        std::invalid_argument);
}

TEST_F(LendingServiceTest, CommittedOperationsAreWrittenToCsv)
{
    const auto service = makeService();
    service->engine().depositCollateral(1, CryptoAmount{300'000});
    service->engine().borrow(1, BaseAmount{10'000});

    const auto lines = readLines(dir / "operations.csv");
    ASSERT_EQ(lines.size(), 3);
    EXPECT_THAT(lines[1], StartsWith("1700000000,1,COLLATERAL_DEPOSIT,1,1,0,300000,9000000,\"{"));
    EXPECT_THAT(lines[1], HasSubstr("\"\"max_borrowable\"\""));
    EXPECT_THAT(lines[2], StartsWith("1700000000,2,BORROW,1,1,10000,0,9000000,"));
}

TEST(CsvQuoteTest, DoublesEmbeddedQuotes)
{
    EXPECT_EQ(csvQuote(""), "\"\"");
    EXPECT_EQ(csvQuote("plain"), "\"plain\"");
    EXPECT_EQ(csvQuote(R"({"a":1})"), R"("{""a"":1}")");
}

//-------------------------------------------------------------------------

TEST_F(LendingServiceTest, CheckpointRestoresLedgerAndLoans)
{
    const fs::path checkpoint = dir / "state.msgpack";
    std::vector<Loan> loans;
    std::vector<OperationRecord> operations;
    {
        const auto service = makeService();
        service->engine().depositCollateral(1, CryptoAmount{300'000});
        service->engine().borrow(1, BaseAmount{10'000});
        service->engine().depositCollateral(2, CryptoAmount{100'000});
        service->engine().userPartialLiquidation(2, CryptoAmount{10'000});
        service->triggerInterestAccrualNow();
        service->writeCheckpoint(checkpoint);
        loans = service->store().loans();
        operations = service->store().operations();
    }
    ASSERT_TRUE(fs::exists(checkpoint));
    EXPECT_FALSE(fs::exists(fs::path{checkpoint}.concat(".tmp")));

    const auto restored = makeService();
    restored->loadCheckpoint(checkpoint);

    EXPECT_EQ(restored->store().loans(), loans);
    EXPECT_EQ(restored->store().operations(), operations);
    EXPECT_EQ(restored->store().activeLoanOf(1), loans[0].id);
    EXPECT_FALSE(restored->store().activeLoanOf(2).has_value());

    const auto bals = restored->ledger().snapshot(1);
    EXPECT_EQ(bals.availableCrypto, CryptoAmount{200'000});
    EXPECT_EQ(bals.collateralCrypto, CryptoAmount{300'000});
    EXPECT_EQ(bals.borrowedBase, BaseAmount{10'004});
    EXPECT_EQ(bals.interestAccruedBase, BaseAmount{4});
    EXPECT_EQ(restored->ledger().snapshot(2).availableBase, BaseAmount{1'900});

    // Ids continue after the restored ones.
    const auto deposit = restored->engine().depositCollateral(2, CryptoAmount{1'000});
    EXPECT_GT(deposit.loanId, loans.back().id);
    EXPECT_GT(restored->store().history(2)[0].id, operations.back().id);

    // The accrual day survives, so the same day is not charged twice.
    EXPECT_EQ(restored->triggerInterestAccrualNow().processed, 0);
}

TEST_F(LendingServiceTest, LoadingMissingCheckpointThrows)
{
    const auto service = makeService();
    EXPECT_THROW(service->loadCheckpoint(dir / "missing.msgpack"), std::runtime_error);
}

TEST_F(LendingServiceTest, StateJsonCarriesAccountsAndStore)
{
    const auto service = makeService();
    service->engine().depositCollateral(1, CryptoAmount{300'000});

    const auto json = service->stateJson();

    EXPECT_TRUE(json.HasMember("accounts"));
    EXPECT_TRUE(json.HasMember("store"));
}

//-------------------------------------------------------------------------

TEST_F(LendingServiceTest, ManualTriggersRunTheJobsOnce)
{
    const auto service = makeService();
    service->engine().depositCollateral(1, CryptoAmount{300'000});
    service->engine().borrow(1, BaseAmount{10'000});

    const auto accrual = service->triggerInterestAccrualNow();
    EXPECT_EQ(accrual.processed, 1);
    EXPECT_EQ(accrual.totalInterest, BaseAmount{4});
    EXPECT_EQ(service->triggerInterestAccrualNow().skipped, 1);

    const auto tick = service->triggerRiskCheckNow();
    EXPECT_EQ(tick.evaluated, 1);
    EXPECT_EQ(tick.liquidations, 0);
    EXPECT_EQ(service->riskMonitor().status().ticks, 1);
}

TEST_F(LendingServiceTest, MarkupOracleFollowsReferencePrice)
{
    fs::create_directories(dir);
    std::ofstream{dir / "price.txt"} << "102272.73\n";
    const auto service = makeService(
        R"(<Oracle buyMultiplier="91" sellMultiplier="88" priceFile=")"
        + (dir / "price.txt").string() + R"(" refreshSeconds="60"/>)");

    ASSERT_NE(service->priceFeed(), nullptr);
    EXPECT_EQ(service->engine().quote().buy, Rate{9'306'818});
    EXPECT_EQ(service->engine().quote().sell, Rate{9'000'000});

    service->updateReferencePrice(DEC(50000.0));
    EXPECT_EQ(service->engine().quote().sell, Rate{4'400'000});

    clock->advance(301);
    EXPECT_THROW((void) service->engine().quote(), RateUnavailable);

    std::ofstream{dir / "price.txt", std::ios::trunc} << "60000\n";
    ASSERT_TRUE(service->priceFeed()->poll());
    EXPECT_EQ(service->engine().quote().sell, Rate{5'280'000});
}

TEST_F(LendingServiceTest, MarkupOracleWithoutPriceFileIsRejected)
{
    EXPECT_THROW(
        (void) makeService(R"(<Oracle referencePrice="102272.73"/>)"), std::invalid_argument);
}

TEST_F(LendingServiceTest, StartsWithoutPriceFileYetWritten)
{
    const auto service = makeService(
        R"(<Oracle priceFile=")" + (dir / "price.txt").string() + R"("/>)");

    EXPECT_THROW((void) service->engine().quote(), RateUnavailable);
    EXPECT_EQ(service->priceFeed()->failures(), 1);
}

TEST_F(LendingServiceTest, ReferencePriceIsIgnoredWithFixedRates)
{
    const auto service = makeService();

    service->updateReferencePrice(DEC(50000.0));

    EXPECT_EQ(service->engine().quote().sell, kSell);
    EXPECT_EQ(service->priceFeed(), nullptr);
}

TEST_F(LendingServiceTest, StopDrainsTheEventLoop)
{
    const auto service = makeService();
    service->start();
    EXPECT_TRUE(service->isRunning());
    EXPECT_TRUE(service->riskMonitor().status().running);
    EXPECT_TRUE(service->accrualJob().isRunning());
    {
        std::jthread runner{[&] { service->io().run(); }};
        std::this_thread::sleep_for(50ms);
        service->stop();
    }

    EXPECT_FALSE(service->isRunning());
    EXPECT_FALSE(service->riskMonitor().status().running);
    EXPECT_FALSE(service->accrualJob().isRunning());
}

//-------------------------------------------------------------------------
