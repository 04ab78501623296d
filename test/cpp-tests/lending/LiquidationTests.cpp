/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lending_fixture.hpp"

//-------------------------------------------------------------------------

using namespace lendcore;
using namespace lendcore::accounting;
using namespace lendcore::lending;
using namespace lendcore::test;

using namespace testing;

//-------------------------------------------------------------------------

struct LiquidationTest : LendingFixture
{
    virtual void SetUp() override
    {
        LendingFixture::SetUp();
        engine->signals().liquidated.connect(
            [this](const LiquidationResult& res) { liquidations.push_back(res); });
    }

    std::vector<LiquidationResult> liquidations;
};

//-------------------------------------------------------------------------

TEST_F(LiquidationTest, ForceLiquidationChargesFloorAndReturnsTheRest)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});
    clock->advanceDays(1);

    const auto res = engine->forceLiquidate(loanId);

    EXPECT_EQ(res.trigger, LiquidationTrigger::OPERATOR);
    EXPECT_EQ(res.type, OperationType::FULL_LIQUIDATION);
    EXPECT_EQ(res.loanStatus, LoanStatus::LIQUIDATED);
    EXPECT_EQ(res.minimumInterestApplied, BaseAmount{123});
    EXPECT_EQ(res.debtCleared, BaseAmount{10'123});
    EXPECT_EQ(res.collateralSold, CryptoAmount{112'478});
    EXPECT_EQ(res.proceeds, BaseAmount{10'123});
    EXPECT_EQ(res.excessProceeds, BaseAmount{});
    EXPECT_EQ(res.collateralReturned, CryptoAmount{187'522});
    EXPECT_EQ(res.remainingDebt, BaseAmount{});
    EXPECT_EQ(res.executionRate, kSell);
    EXPECT_EQ(res.ltvBefore, DEC(37.037037));

    const auto bals = ledger.snapshot(1);
    EXPECT_EQ(bals.availableCrypto, CryptoAmount{387'522});
    EXPECT_EQ(bals.collateralCrypto, CryptoAmount{});
    EXPECT_EQ(bals.availableBase, BaseAmount{10'000});
    EXPECT_EQ(bals.borrowedBase, BaseAmount{});
    EXPECT_EQ(bals.interestAccruedBase, BaseAmount{});

    const Loan loan = store.get(loanId);
    EXPECT_EQ(loan.status, LoanStatus::LIQUIDATED);
    EXPECT_EQ(loan.debtRepaid, BaseAmount{10'123});
    EXPECT_FALSE(store.activeLoanOf(1).has_value());

    const auto history = engine->getHistory(1);
    ASSERT_EQ(history.size(), 4);
    EXPECT_EQ(history[0].type, OperationType::FULL_LIQUIDATION);
    EXPECT_EQ(history[0].baseDelta, BaseAmount{-10'123});
    EXPECT_EQ(history[0].cryptoDelta, CryptoAmount{-300'000});
    EXPECT_THAT(history[0].detail, HasSubstr("OPERATOR"));
    EXPECT_EQ(history[1].type, OperationType::INTEREST_ACCRUAL);

    ASSERT_EQ(liquidations.size(), 1);
    EXPECT_EQ(liquidations[0].loanId, loanId);
}

TEST_F(LiquidationTest, ForceLiquidationAbortsWhenCollateralFallsShort)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});
    oracle->setSell(Rate{3'000'000});

    EXPECT_THROW(engine->forceLiquidate(loanId), InsufficientCollateralForLiquidation);

    const Loan loan = store.get(loanId);
    EXPECT_TRUE(loan.isActive());
    EXPECT_EQ(loan.borrowedAmount, BaseAmount{10'000});
    EXPECT_EQ(loan.interestCharged, BaseAmount{});
    EXPECT_EQ(store.history(1).size(), 2);
    EXPECT_TRUE(liquidations.empty());
}

TEST_F(LiquidationTest, ForceLiquidationOfClosedOrUnknownLoan)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});
    engine->forceLiquidate(loanId);

    EXPECT_THROW(engine->forceLiquidate(loanId), NoActiveLoan);
    EXPECT_THROW(engine->forceLiquidate(777), LoanNotFound);
    EXPECT_EQ(liquidations.size(), 1);
}

TEST_F(LiquidationTest, ForceLiquidationWithoutDebtReturnsEverything)
{
    const LoanId loanId = openLoan(1, BaseAmount{});

    const auto res = engine->forceLiquidate(loanId);

    EXPECT_EQ(res.collateralSold, CryptoAmount{});
    EXPECT_EQ(res.collateralReturned, CryptoAmount{300'000});
    EXPECT_EQ(res.loanStatus, LoanStatus::LIQUIDATED);
    EXPECT_EQ(ledger.snapshot(1).availableCrypto, CryptoAmount{500'000});
}

//-------------------------------------------------------------------------

TEST_F(LiquidationTest, UserPartialSaleReducesDebt)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});

    const auto res = engine->userPartialLiquidation(1, CryptoAmount{100'000});

    EXPECT_EQ(res.trigger, LiquidationTrigger::USER);
    EXPECT_EQ(res.type, OperationType::PARTIAL_LIQUIDATION);
    EXPECT_EQ(res.loanStatus, LoanStatus::ACTIVE);
    EXPECT_EQ(res.proceeds, BaseAmount{9'000});
    EXPECT_EQ(res.debtCleared, BaseAmount{9'000});
    EXPECT_EQ(res.remainingDebt, BaseAmount{1'000});
    EXPECT_EQ(res.remainingCollateral, CryptoAmount{200'000});
    EXPECT_EQ(res.minimumInterestApplied, BaseAmount{});

    const Loan loan = store.get(loanId);
    EXPECT_EQ(loan.collateralAmount, CryptoAmount{200'000});
    EXPECT_EQ(loan.borrowedAmount, BaseAmount{1'000});
    const auto bals = ledger.snapshot(1);
    EXPECT_EQ(bals.collateralCrypto, CryptoAmount{200'000});
    EXPECT_EQ(bals.borrowedBase, BaseAmount{1'000});
    EXPECT_EQ(bals.availableBase, BaseAmount{10'000});

    const auto last = engine->getHistory(1)[0];
    EXPECT_EQ(last.type, OperationType::PARTIAL_LIQUIDATION);
    EXPECT_EQ(last.baseDelta, BaseAmount{-9'000});
    EXPECT_EQ(last.cryptoDelta, CryptoAmount{-100'000});
    EXPECT_EQ(liquidations.size(), 1);
}

TEST_F(LiquidationTest, UserSaleClearingTheDebtSettlesTheLoan)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});

    const auto res = engine->userPartialLiquidation(1, CryptoAmount{200'000});

    EXPECT_EQ(res.type, OperationType::FULL_LIQUIDATION);
    EXPECT_EQ(res.loanStatus, LoanStatus::REPAID);
    EXPECT_EQ(res.minimumInterestApplied, BaseAmount{123});
    EXPECT_EQ(res.proceeds, BaseAmount{18'000});
    EXPECT_EQ(res.debtCleared, BaseAmount{10'123});
    EXPECT_EQ(res.excessProceeds, BaseAmount{7'877});
    EXPECT_EQ(res.collateralReturned, CryptoAmount{100'000});

    const auto bals = ledger.snapshot(1);
    EXPECT_EQ(bals.availableBase, BaseAmount{17'877});
    EXPECT_EQ(bals.availableCrypto, CryptoAmount{300'000});
    EXPECT_EQ(bals.collateralCrypto, CryptoAmount{});
    EXPECT_EQ(bals.borrowedBase, BaseAmount{});

    EXPECT_EQ(store.get(loanId).status, LoanStatus::REPAID);
    const auto last = engine->getHistory(1)[0];
    EXPECT_EQ(last.baseDelta, BaseAmount{-10'123});
    EXPECT_EQ(last.cryptoDelta, CryptoAmount{-300'000});
}

TEST_F(LiquidationTest, UserSaleFailures)
{
    EXPECT_THROW(engine->userPartialLiquidation(1, CryptoAmount{1}), NoActiveLoan);

    const LoanId loanId = openLoan(1, BaseAmount{10'000});
    EXPECT_THROW(engine->userPartialLiquidation(1, CryptoAmount{}), InvalidAmount);
    EXPECT_THROW(engine->userPartialLiquidation(1, CryptoAmount{300'001}), InsufficientFunds);

    oracle->setSell(Rate{3'000'000});
    EXPECT_THROW(
        engine->userPartialLiquidation(1, CryptoAmount{300'000}),
        InsufficientCollateralForLiquidation);

    EXPECT_EQ(store.get(loanId).collateralAmount, CryptoAmount{300'000});
    EXPECT_EQ(store.history(1).size(), 2);
    EXPECT_TRUE(liquidations.empty());
}

TEST_F(LiquidationTest, UserSaleOfLoanWithoutDebtClosesIt)
{
    openLoan(1, BaseAmount{});

    const auto res = engine->userPartialLiquidation(1, CryptoAmount{100'000});

    EXPECT_EQ(res.loanStatus, LoanStatus::REPAID);
    EXPECT_EQ(res.debtCleared, BaseAmount{});
    EXPECT_EQ(res.excessProceeds, BaseAmount{9'000});
    EXPECT_EQ(res.collateralReturned, CryptoAmount{200'000});

    const auto bals = ledger.snapshot(1);
    EXPECT_EQ(bals.availableBase, BaseAmount{9'000});
    EXPECT_EQ(bals.availableCrypto, CryptoAmount{400'000});
}

//-------------------------------------------------------------------------
