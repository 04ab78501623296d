/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/AccountLedger.hpp"
#include "lendcore/lending/LendingParameters.hpp"
#include "lendcore/lending/LendingSignals.hpp"
#include "lendcore/lending/LoanStore.hpp"
#include "lendcore/oracle/RateOracle.hpp"
#include "lendcore/util/Clock.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace lendcore::lending
{

class LedgerTransaction;

//-------------------------------------------------------------------------

/**
 * Synchronous loan operations.
 *
 * Every mutating call runs as one LedgerTransaction: preconditions are checked
 * against the staged state, and a violation throws before anything is
 * published. Rates are fetched before any lock is taken; an unavailable oracle
 * fails the call with RateUnavailable.
 */
class LendingEngine
{
public:
    LendingEngine(
        accounting::AccountLedger& ledger,
        LoanStore& store,
        oracle::RateOracle::Ptr oracle,
        settings::SettingsStore::Ptr settings,
        Clock::Ptr clock,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    DepositCollateralResult depositCollateral(
        AccountId accountId,
        CryptoAmount amount,
        std::optional<decimal_t> ltvRatio = {});
    BorrowResult borrow(AccountId accountId, BaseAmount amount);
    // Moves base currency only and never asks the oracle for a quote, so debt
    // can be paid down while rates are unavailable.
    RepayResult repay(AccountId accountId, BaseAmount amount);
    AddCollateralResult addCollateral(AccountId accountId, CryptoAmount amount);

    // Never mutates; std::nullopt when the account has no active loan.
    [[nodiscard]] std::optional<LoanStatusView> getStatus(AccountId accountId) const;
    [[nodiscard]] std::vector<OperationRecord> getHistory(
        AccountId accountId, std::optional<LoanId> loanId = {}) const;

    // Forecloses the loan whatever its LTV, charging the interest floor first.
    LiquidationResult forceLiquidate(LoanId loanId);
    // Borrower-chosen sale of part of the collateral.
    LiquidationResult userPartialLiquidation(AccountId accountId, CryptoAmount amount);
    // WARNING and LIQUIDATE loans, highest LTV first.
    [[nodiscard]] std::vector<LoanRiskView> listAtRiskLoans() const;

    // Re-checks one loan under its lock and liquidates it if the threshold is breached.
    std::optional<RiskEvaluation> evaluateRisk(LoanId loanId, const oracle::RateQuote& quote);
    // Adds one day of interest unless the loan was already accrued on localDay.
    std::optional<BaseAmount> accrueDailyInterest(LoanId loanId, int32_t localDay);

    [[nodiscard]] oracle::RateQuote quote() const { return m_oracle->quote(); }
    [[nodiscard]] LendingParameters parameters() const;
    [[nodiscard]] InterestFloor interestFloor(const Loan& loan, Timestamp now) const;

    [[nodiscard]] LendingSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] accounting::AccountLedger& ledger() noexcept { return m_ledger; }
    [[nodiscard]] LoanStore& store() noexcept { return m_store; }
    [[nodiscard]] const Clock& clock() const noexcept { return *m_clock; }
    [[nodiscard]] spdlog::logger& logger() const noexcept { return *m_logger; }

private:
    [[nodiscard]] InterestFloor interestFloor(
        const Loan& loan, Timestamp now, const LendingParameters& params) const;

    // Stages the interest needed to meet the floor; returns the amount charged.
    BaseAmount applyInterestFloor(LedgerTransaction& tx, const InterestFloor& floor);

    [[nodiscard]] LiquidationResult stageRiskLiquidation(
        LedgerTransaction& tx, Rate sell, const LendingParameters& params, Timestamp now);

    void closeLoan(LedgerTransaction& tx, LoanStatus status, Timestamp now);

    void publish(const std::vector<OperationRecord>& records);
    void publish(const LiquidationResult& result);

    accounting::AccountLedger& m_ledger;
    LoanStore& m_store;
    oracle::RateOracle::Ptr m_oracle;
    settings::SettingsStore::Ptr m_settings;
    Clock::Ptr m_clock;
    std::shared_ptr<spdlog::logger> m_logger;
    LendingSignals m_signals;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
