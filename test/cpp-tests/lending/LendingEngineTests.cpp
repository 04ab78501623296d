/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lending_fixture.hpp"

#include <atomic>
#include <latch>
#include <thread>

//-------------------------------------------------------------------------

using namespace lendcore;
using namespace lendcore::accounting;
using namespace lendcore::lending;
using namespace lendcore::test;

using namespace testing;

//-------------------------------------------------------------------------

struct LendingEngineTest : LendingFixture
{
    AccountBalances balances(AccountId accountId) const { return ledger.snapshot(accountId); }
};

//-------------------------------------------------------------------------

TEST_F(LendingEngineTest, DepositOpensLoanAndLocksCollateral)
{
    const auto res = engine->depositCollateral(1, CryptoAmount{300'000});

    EXPECT_NE(res.loanId, LOAN_ID_INVALID);
    EXPECT_EQ(res.collateralAmount, CryptoAmount{300'000});
    EXPECT_EQ(res.maxBorrowable, BaseAmount{16'200});
    EXPECT_EQ(res.liquidationPrice, Rate{});
    EXPECT_EQ(res.sellRate, kSell);

    const auto bals = balances(1);
    EXPECT_EQ(bals.availableCrypto, CryptoAmount{200'000});
    EXPECT_EQ(bals.collateralCrypto, CryptoAmount{300'000});

    const Loan loan = store.get(res.loanId);
    EXPECT_EQ(loan.ltvRatio, DEC(60.0));
    EXPECT_EQ(loan.interestRate, DEC(15.0));
    EXPECT_EQ(loan.createdAt, kStart);

    const auto history = engine->getHistory(1);
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history[0].type, OperationType::COLLATERAL_DEPOSIT);
    EXPECT_EQ(history[0].cryptoDelta, CryptoAmount{300'000});
    EXPECT_EQ(history[0].executionRate, kSell);
}

TEST_F(LendingEngineTest, DepositAcceptsCustomLtv)
{
    const auto res = engine->depositCollateral(1, CryptoAmount{300'000}, DEC(50.0));

    EXPECT_EQ(res.maxBorrowable, BaseAmount{13'500});
    EXPECT_EQ(store.get(res.loanId).ltvRatio, DEC(50.0));
}

TEST_F(LendingEngineTest, DepositRejectsLtvOutsideBounds)
{
    EXPECT_THROW(engine->depositCollateral(1, CryptoAmount{1}, DEC(0.0)), std::invalid_argument);
    EXPECT_THROW(engine->depositCollateral(1, CryptoAmount{1}, DEC(90.0)), std::invalid_argument);
    EXPECT_THROW(engine->depositCollateral(1, CryptoAmount{1}, DEC(-5.0)), std::invalid_argument);
    EXPECT_FALSE(store.activeLoanOf(1).has_value());
}

TEST_F(LendingEngineTest, DepositFailuresChangeNothing)
{
    EXPECT_THROW(engine->depositCollateral(1, CryptoAmount{}), InvalidAmount);
    EXPECT_THROW(engine->depositCollateral(1, CryptoAmount{500'001}), InsufficientFunds);
    EXPECT_THROW(engine->depositCollateral(42, CryptoAmount{1}), AccountNotFound);

    oracle->setAvailable(false);
    EXPECT_THROW(engine->depositCollateral(1, CryptoAmount{1}), RateUnavailable);

    EXPECT_FALSE(store.activeLoanOf(1).has_value());
    EXPECT_TRUE(store.operations().empty());
    EXPECT_EQ(balances(1), (AccountBalances{CryptoAmount{500'000}, BaseAmount{}}));
}

TEST_F(LendingEngineTest, SecondDepositIsRejectedBeforeFundsAreChecked)
{
    openLoan(1, BaseAmount{});

    EXPECT_THROW(engine->depositCollateral(1, CryptoAmount{1}), LoanAlreadyActive);
    EXPECT_THROW(engine->depositCollateral(1, CryptoAmount{10'000'000}), LoanAlreadyActive);
    EXPECT_EQ(store.loansOf(1).size(), 1);
}

//-------------------------------------------------------------------------

TEST_F(LendingEngineTest, BorrowWithinCapacity)
{
    engine->depositCollateral(1, CryptoAmount{300'000});

    const auto res = engine->borrow(1, BaseAmount{10'000});

    EXPECT_EQ(res.newBorrowedTotal, BaseAmount{10'000});
    EXPECT_EQ(res.availableCapacity, BaseAmount{6'200});
    EXPECT_EQ(res.liquidationPrice, Rate{3'703'703});

    const auto bals = balances(1);
    EXPECT_EQ(bals.availableBase, BaseAmount{10'000});
    EXPECT_EQ(bals.borrowedBase, BaseAmount{10'000});

    const Loan loan = store.get(res.loanId);
    EXPECT_EQ(loan.principal, BaseAmount{10'000});
    EXPECT_EQ(loan.borrowedAmount, BaseAmount{10'000});
}

TEST_F(LendingEngineTest, BorrowUpToExactlyMaxBorrowable)
{
    engine->depositCollateral(1, CryptoAmount{300'000});

    const auto res = engine->borrow(1, BaseAmount{16'200});

    EXPECT_EQ(res.availableCapacity, BaseAmount{});
    EXPECT_THROW(engine->borrow(1, BaseAmount{1}), InsufficientCapacity);
}

TEST_F(LendingEngineTest, BorrowFailures)
{
    EXPECT_THROW(engine->borrow(1, BaseAmount{100}), NoActiveLoan);

    engine->depositCollateral(1, CryptoAmount{300'000});
    EXPECT_THROW(engine->borrow(1, BaseAmount{}), InvalidAmount);
    EXPECT_THROW(engine->borrow(1, BaseAmount{16'201}), InsufficientCapacity);

    oracle->setAvailable(false);
    EXPECT_THROW(engine->borrow(1, BaseAmount{100}), RateUnavailable);

    EXPECT_EQ(balances(1).availableBase, BaseAmount{});
    EXPECT_EQ(store.history(1).size(), 1);
}

TEST_F(LendingEngineTest, BorrowCapacityFollowsTheCurrentRate)
{
    engine->depositCollateral(1, CryptoAmount{300'000});
    oracle->setSell(Rate{4'500'000});

    EXPECT_THROW(engine->borrow(1, BaseAmount{8'101}), InsufficientCapacity);
    EXPECT_EQ(engine->borrow(1, BaseAmount{8'100}).availableCapacity, BaseAmount{});
}

//-------------------------------------------------------------------------

TEST_F(LendingEngineTest, FullRepayOnFirstDayChargesMinimumInterest)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});
    clock->advanceDays(1);
    ledger.deposit(1, BaseAmount{123});

    ASSERT_EQ(engine->getStatus(1)->interestFloor.totalAmountDue, BaseAmount{10'123});
    const auto res = engine->repay(1, BaseAmount{10'123});

    EXPECT_EQ(res.loanId, loanId);
    EXPECT_EQ(res.amountApplied, BaseAmount{10'123});
    EXPECT_EQ(res.remainingDebt, BaseAmount{});
    EXPECT_EQ(res.loanStatus, LoanStatus::REPAID);
    EXPECT_EQ(res.collateralReturned, CryptoAmount{300'000});
    EXPECT_EQ(res.minimumInterestApplied, BaseAmount{123});

    const auto bals = balances(1);
    EXPECT_EQ(bals.availableCrypto, CryptoAmount{500'000});
    EXPECT_EQ(bals.collateralCrypto, CryptoAmount{});
    EXPECT_EQ(bals.availableBase, BaseAmount{});
    EXPECT_EQ(bals.borrowedBase, BaseAmount{});
    EXPECT_EQ(bals.interestAccruedBase, BaseAmount{123});

    const Loan loan = store.get(loanId);
    EXPECT_EQ(loan.status, LoanStatus::REPAID);
    EXPECT_EQ(loan.interestCharged, BaseAmount{123});
    EXPECT_EQ(loan.debtRepaid, BaseAmount{10'123});
    EXPECT_EQ(loan.closedAt, kStart + kSecondsPerDay);
    EXPECT_FALSE(store.activeLoanOf(1).has_value());
    EXPECT_FALSE(engine->getStatus(1).has_value());

    const auto history = engine->getHistory(1);
    ASSERT_EQ(history.size(), 4);
    EXPECT_EQ(history[0].type, OperationType::REPAY);
    EXPECT_EQ(history[0].baseDelta, BaseAmount{-10'123});
    EXPECT_EQ(history[0].cryptoDelta, CryptoAmount{-300'000});
    EXPECT_EQ(history[1].type, OperationType::INTEREST_ACCRUAL);
    EXPECT_EQ(history[1].baseDelta, BaseAmount{123});
    EXPECT_THAT(history[1].detail, HasSubstr("minimum_interest_floor"));
    EXPECT_EQ(history[2].type, OperationType::BORROW);
    EXPECT_EQ(history[3].type, OperationType::COLLATERAL_DEPOSIT);
}

TEST_F(LendingEngineTest, PartialRepayKeepsLoanOpen)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});

    const auto res = engine->repay(1, BaseAmount{4'000});

    EXPECT_EQ(res.remainingDebt, BaseAmount{6'000});
    EXPECT_EQ(res.loanStatus, LoanStatus::ACTIVE);
    EXPECT_EQ(res.collateralReturned, CryptoAmount{});
    EXPECT_EQ(res.minimumInterestApplied, BaseAmount{});

    const Loan loan = store.get(loanId);
    EXPECT_EQ(loan.borrowedAmount, BaseAmount{6'000});
    EXPECT_EQ(loan.liquidationPrice, Rate{2'222'222});
    EXPECT_EQ(balances(1).availableBase, BaseAmount{6'000});
    EXPECT_EQ(balances(1).borrowedBase, BaseAmount{6'000});
}

TEST_F(LendingEngineTest, RepayNeedsNoQuote)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});
    ledger.deposit(1, BaseAmount{123});
    oracle->setAvailable(false);

    EXPECT_EQ(engine->repay(1, BaseAmount{4'000}).remainingDebt, BaseAmount{6'000});
    const auto res = engine->repay(1, BaseAmount{6'123});

    EXPECT_EQ(res.loanStatus, LoanStatus::REPAID);
    EXPECT_EQ(res.collateralReturned, CryptoAmount{300'000});
    EXPECT_EQ(store.get(loanId).debtRepaid, BaseAmount{10'123});
}

TEST_F(LendingEngineTest, RepayFailures)
{
    EXPECT_THROW(engine->repay(1, BaseAmount{1}), NoActiveLoan);

    openLoan(1, BaseAmount{10'000});
    EXPECT_THROW(engine->repay(1, BaseAmount{}), InvalidAmount);
    // Above the total due.
    EXPECT_THROW(engine->repay(1, BaseAmount{10'124}), ExceedsOutstandingDebt);
    // Below the total due but above the outstanding debt.
    ledger.deposit(1, BaseAmount{100});
    EXPECT_THROW(engine->repay(1, BaseAmount{10'050}), ExceedsOutstandingDebt);
    // The full settlement amount is not there.
    EXPECT_THROW(engine->repay(1, BaseAmount{10'123}), InsufficientFunds);

    EXPECT_EQ(store.history(1).size(), 2);
    EXPECT_EQ(balances(1).borrowedBase, BaseAmount{10'000});
    EXPECT_EQ(balances(1).interestAccruedBase, BaseAmount{});
}

TEST_F(LendingEngineTest, AccruedInterestAboveTheFloorIsNotToppedUp)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});
    clock->advanceDays(30);
    for (int32_t day = 1; day <= 40; ++day) {
        ASSERT_EQ(engine->accrueDailyInterest(loanId, day), BaseAmount{4});
    }

    const auto status = engine->getStatus(1);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->interestAccrued, BaseAmount{160});
    EXPECT_EQ(status->interestFloor.minimumInterestDue, BaseAmount{123});
    EXPECT_EQ(status->interestFloor.shortfall, BaseAmount{});
    EXPECT_EQ(status->interestFloor.totalAmountDue, BaseAmount{10'160});

    ledger.deposit(1, BaseAmount{160});
    const auto res = engine->repay(1, BaseAmount{10'160});
    EXPECT_EQ(res.loanStatus, LoanStatus::REPAID);
    EXPECT_EQ(res.minimumInterestApplied, BaseAmount{});
    EXPECT_EQ(store.get(loanId).interestCharged, BaseAmount{160});
}

TEST_F(LendingEngineTest, AccrualIsChargedOncePerDay)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});

    EXPECT_EQ(engine->accrueDailyInterest(loanId, 7), BaseAmount{4});
    EXPECT_FALSE(engine->accrueDailyInterest(loanId, 7).has_value());
    EXPECT_FALSE(engine->accrueDailyInterest(loanId, 6).has_value());
    EXPECT_EQ(engine->accrueDailyInterest(loanId, 8), BaseAmount{4});

    const Loan loan = store.get(loanId);
    EXPECT_EQ(loan.borrowedAmount, BaseAmount{10'008});
    EXPECT_EQ(loan.lastAccrualDay, 8);
    EXPECT_EQ(balances(1).interestAccruedBase, BaseAmount{8});
    EXPECT_THROW(engine->accrueDailyInterest(99, 9), LoanNotFound);
}

//-------------------------------------------------------------------------

TEST_F(LendingEngineTest, StatusReportsDerivedFiguresWithoutMutating)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});
    clock->advanceDays(3);
    const auto opsBefore = store.operations();

    const auto status = engine->getStatus(1);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->loanId, loanId);
    EXPECT_EQ(status->accountId, 1);
    EXPECT_EQ(status->status, LoanStatus::ACTIVE);
    EXPECT_EQ(status->collateralAmount, CryptoAmount{300'000});
    EXPECT_EQ(status->borrowedAmount, BaseAmount{10'000});
    EXPECT_EQ(status->principal, BaseAmount{10'000});
    EXPECT_EQ(status->currentLtv, DEC(37.037037));
    EXPECT_EQ(status->riskStatus, RiskStatus::SAFE);
    EXPECT_EQ(status->maxBorrowable, BaseAmount{16'200});
    EXPECT_EQ(status->availableCapacity, BaseAmount{6'200});
    EXPECT_EQ(status->liquidationPrice, Rate{3'703'703});
    EXPECT_EQ(status->sellRate, kSell);
    EXPECT_EQ(status->interestFloor.daysElapsed, 3);
    EXPECT_EQ(status->interestFloor.daysCharged, 30);
    EXPECT_EQ(status->createdAt, kStart);

    EXPECT_EQ(store.operations(), opsBefore);
    EXPECT_EQ(store.get(loanId).interestCharged, BaseAmount{});
}

TEST_F(LendingEngineTest, StatusAndHistoryOfUnknownAccount)
{
    EXPECT_FALSE(engine->getStatus(1).has_value());
    EXPECT_TRUE(engine->getHistory(1).empty());
    EXPECT_THROW((void) engine->getStatus(42), AccountNotFound);
    EXPECT_THROW((void) engine->getHistory(42), AccountNotFound);
}

TEST_F(LendingEngineTest, HistoryCanBeFilteredByLoan)
{
    const LoanId first = openLoan(1, BaseAmount{});
    engine->userPartialLiquidation(1, CryptoAmount{1});
    ASSERT_FALSE(store.activeLoanOf(1).has_value());
    const LoanId second = openLoan(1, BaseAmount{1'000});

    EXPECT_EQ(engine->getHistory(1).size(), 4);
    EXPECT_THAT(engine->getHistory(1, first), Each(Field(&OperationRecord::loanId, first)));
    EXPECT_EQ(engine->getHistory(1, second).size(), 2);
    EXPECT_TRUE(engine->getHistory(2).empty());
}

//-------------------------------------------------------------------------

TEST_F(LendingEngineTest, AddCollateralLowersLtv)
{
    const LoanId loanId = openLoan(1, BaseAmount{10'000});

    const auto res = engine->addCollateral(1, CryptoAmount{100'000});

    EXPECT_EQ(res.loanId, loanId);
    EXPECT_EQ(res.newTotalCollateral, CryptoAmount{400'000});
    EXPECT_EQ(res.newLtv, DEC(27.777777));
    EXPECT_EQ(res.maxBorrowable, BaseAmount{21'600});
    EXPECT_EQ(res.availableCapacity, BaseAmount{11'600});
    EXPECT_EQ(res.liquidationPrice, Rate{2'777'777});

    const auto bals = balances(1);
    EXPECT_EQ(bals.availableCrypto, CryptoAmount{100'000});
    EXPECT_EQ(bals.collateralCrypto, CryptoAmount{400'000});
    EXPECT_EQ(engine->getHistory(1)[0].type, OperationType::ADD_COLLATERAL);
}

TEST_F(LendingEngineTest, AddCollateralFailures)
{
    EXPECT_THROW(engine->addCollateral(1, CryptoAmount{1}), NoActiveLoan);
    openLoan(1, BaseAmount{});
    EXPECT_THROW(engine->addCollateral(1, CryptoAmount{-1}), InvalidAmount);
    EXPECT_THROW(engine->addCollateral(1, CryptoAmount{200'001}), InsufficientFunds);
    EXPECT_EQ(balances(1).collateralCrypto, CryptoAmount{300'000});
}

//-------------------------------------------------------------------------

TEST_F(LendingEngineTest, NonLiquidatingOperationsConserveHoldings)
{
    const auto before = balances(1);

    const LoanId loanId = openLoan(1, BaseAmount{10'000});
    engine->addCollateral(1, CryptoAmount{50'000});
    engine->accrueDailyInterest(loanId, 1);
    engine->repay(1, BaseAmount{2'500});

    const auto after = balances(1);
    const BaseAmount interest = store.get(loanId).interestCharged;
    EXPECT_EQ(interest, BaseAmount{4});
    EXPECT_EQ(after.totalCrypto(), before.totalCrypto());
    EXPECT_EQ(after.netBase() - before.netBase(), -interest);
}

TEST_F(LendingEngineTest, RateChangeAppliesToNewLoansOnly)
{
    const LoanId first = openLoan(1, BaseAmount{});
    settings->set(settings::keys::kLoanInterestRate, DEC(20.0));
    const LoanId second = openLoan(2, BaseAmount{});

    EXPECT_EQ(store.get(first).interestRate, DEC(15.0));
    EXPECT_EQ(store.get(second).interestRate, DEC(20.0));
}

//-------------------------------------------------------------------------

TEST_F(LendingEngineTest, ConcurrentDepositsOpenOneLoan)
{
    constexpr int kThreads = 8;
    std::latch startLine{kThreads};
    std::atomic<int> succeeded{};
    std::atomic<int> rejected{};
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < kThreads; ++i) {
            threads.emplace_back([&] {
                startLine.arrive_and_wait();
                try {
                    engine->depositCollateral(1, CryptoAmount{50'000});
                    ++succeeded;
                }
                catch (const LoanAlreadyActive&) {
                    ++rejected;
                }
            });
        }
    }

    EXPECT_EQ(succeeded, 1);
    EXPECT_EQ(rejected, kThreads - 1);
    EXPECT_EQ(store.loansOf(1).size(), 1);
    EXPECT_EQ(balances(1).availableCrypto, CryptoAmount{450'000});
    EXPECT_EQ(balances(1).collateralCrypto, CryptoAmount{50'000});
}

TEST_F(LendingEngineTest, ConcurrentFullRepaymentsSettleOnce)
{
    openLoan(1, BaseAmount{10'000});
    ledger.deposit(1, BaseAmount{20'000});

    std::latch startLine{2};
    std::atomic<int> succeeded{};
    std::atomic<int> rejected{};
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 2; ++i) {
            threads.emplace_back([&] {
                startLine.arrive_and_wait();
                try {
                    engine->repay(1, BaseAmount{10'123});
                    ++succeeded;
                }
                catch (const LendingException&) {
                    ++rejected;
                }
            });
        }
    }

    EXPECT_EQ(succeeded, 1);
    EXPECT_EQ(rejected, 1);
    EXPECT_EQ(balances(1).availableBase, BaseAmount{19'877});
    EXPECT_EQ(balances(1).borrowedBase, BaseAmount{});
}

TEST_F(LendingEngineTest, ConcurrentBorrowsNeverExceedCapacity)
{
    engine->depositCollateral(1, CryptoAmount{300'000});

    constexpr int kThreads = 10;
    std::latch startLine{kThreads};
    std::atomic<int> succeeded{};
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < kThreads; ++i) {
            threads.emplace_back([&] {
                startLine.arrive_and_wait();
                try {
                    engine->borrow(1, BaseAmount{5'000});
                    ++succeeded;
                }
                catch (const InsufficientCapacity&) {}
            });
        }
    }

    EXPECT_EQ(succeeded, 3);
    EXPECT_EQ(balances(1).borrowedBase, BaseAmount{15'000});
}

//-------------------------------------------------------------------------

TEST_F(LendingEngineTest, AtRiskLoansAreSortedByLtv)
{
    openLoan(1, BaseAmount{16'200});
    const LoanId warned = openLoan(2, BaseAmount{15'300});
    openLoan(3, BaseAmount{10'000});
    const LoanId critical = store.activeLoanOf(1).value();

    oracle->setSell(Rate{5'900'000});
    const auto atRisk = engine->listAtRiskLoans();

    ASSERT_EQ(atRisk.size(), 2);
    EXPECT_EQ(atRisk[0].loanId, critical);
    EXPECT_EQ(atRisk[0].riskStatus, RiskStatus::LIQUIDATE);
    EXPECT_EQ(atRisk[1].loanId, warned);
    EXPECT_EQ(atRisk[1].riskStatus, RiskStatus::WARNING);
    EXPECT_EQ(atRisk[1].sellRate, Rate{5'900'000});

    EXPECT_EQ(balances(1).borrowedBase, BaseAmount{16'200});
}

TEST_F(LendingEngineTest, OperationSignalFollowsEveryCommittedRecord)
{
    std::vector<OperationType> seen;
    engine->signals().operation.connect(
        [&](const OperationRecord& rec) { seen.push_back(rec.type); });

    openLoan(1, BaseAmount{10'000});
    EXPECT_THROW(engine->borrow(1, BaseAmount{50'000}), InsufficientCapacity);
    ledger.deposit(1, BaseAmount{123});
    engine->repay(1, BaseAmount{10'123});

    EXPECT_THAT(seen, ElementsAre(
        OperationType::COLLATERAL_DEPOSIT,
        OperationType::BORROW,
        OperationType::INTEREST_ACCRUAL,
        OperationType::REPAY));
}

//-------------------------------------------------------------------------
