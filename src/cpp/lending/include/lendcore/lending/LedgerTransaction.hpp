/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/AccountLedger.hpp"
#include "lendcore/lending/LoanStore.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

/**
 * Atomic unit of work over one account and at most one of its loans.
 *
 * Locks are taken account first, loan second, and held until destruction.
 * Balances and the loan are edited as staged copies; nothing becomes visible
 * before commit(), and an exception thrown earlier simply discards the stage.
 */
class LedgerTransaction
{
public:
    LedgerTransaction(accounting::AccountLedger& ledger, LoanStore& store, AccountId accountId);

    LedgerTransaction(const LedgerTransaction&) = delete;
    LedgerTransaction& operator=(const LedgerTransaction&) = delete;

    [[nodiscard]] AccountId accountId() const noexcept { return m_accountId; }
    [[nodiscard]] accounting::AccountBalances& balances() noexcept { return m_balances; }

    // Throws NoActiveLoan.
    Loan& bindActiveLoan();
    // Binds a loan of this account regardless of its status.
    Loan& bindLoan(LoanId loanId);
    // Throws LoanAlreadyActive.
    Loan& createLoan(Timestamp now);

    [[nodiscard]] bool hasLoan() const noexcept { return m_loan.has_value(); }
    [[nodiscard]] Loan& loan();

    void record(
        OperationType type,
        accounting::BaseAmount baseDelta,
        accounting::CryptoAmount cryptoDelta,
        std::optional<accounting::Rate> executionRate,
        std::string detail = "{}");

    [[nodiscard]] const std::vector<OperationRecord>& stagedRecords() const noexcept
    {
        return m_records;
    }

    std::vector<OperationRecord> commit(Timestamp now);

private:
    void checkMirror(std::source_location sl = std::source_location::current()) const;

    accounting::AccountLedger& m_ledger;
    LoanStore& m_store;
    AccountId m_accountId;

    accounting::AccountLedger::Entry* m_entry{};
    std::unique_lock<std::mutex> m_accountLock;
    accounting::AccountBalances m_balances;

    LoanStore::Slot* m_slot{};
    std::unique_lock<std::mutex> m_loanLock;
    std::unique_ptr<LoanStore::Slot> m_newSlot;
    std::optional<Loan> m_loan;

    std::vector<OperationRecord> m_records;
    bool m_committed{};
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
