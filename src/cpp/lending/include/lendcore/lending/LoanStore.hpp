/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/Loan.hpp"
#include "lendcore/lending/OperationRecord.hpp"

#include <atomic>
#include <mutex>
#include <shared_mutex>

//-------------------------------------------------------------------------

namespace lendcore::lending
{

class LedgerTransaction;

//-------------------------------------------------------------------------

/**
 * Loans and their operation log.
 *
 * Each loan lives in its own slot with its own mutex; slots are never removed
 * so references to them stay valid. The store-wide mutex guards the slot map,
 * the active-loan index and the log, and is never held while waiting on a slot.
 */
class LoanStore : public JsonSerializable
{
public:
    [[nodiscard]] std::optional<LoanId> activeLoanOf(AccountId accountId) const;
    [[nodiscard]] Loan get(LoanId loanId) const;
    [[nodiscard]] std::optional<Loan> tryGet(LoanId loanId) const;
    [[nodiscard]] bool contains(LoanId loanId) const;

    [[nodiscard]] std::vector<LoanId> activeLoanIds() const;
    [[nodiscard]] std::vector<Loan> loans() const;
    [[nodiscard]] std::vector<Loan> loansOf(AccountId accountId) const;
    [[nodiscard]] size_t activeCount(AccountId accountId) const;

    // Newest first.
    [[nodiscard]] std::vector<OperationRecord> history(
        AccountId accountId, std::optional<LoanId> loanId = {}) const;
    [[nodiscard]] std::vector<OperationRecord> operations() const;
    // Sum of the loan's committed BORROW records; takes no slot lock.
    [[nodiscard]] accounting::BaseAmount borrowedPrincipal(const Loan& loan) const;

    // Replaces the whole content, e.g. from a checkpoint. Each loan's principal
    // must match its BORROW records.
    void restore(std::vector<Loan> loans, std::vector<OperationRecord> operations);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    struct Slot
    {
        std::mutex mtx;
        Loan loan;
    };

    [[nodiscard]] Slot* findSlot(LoanId loanId) const;
    [[nodiscard]] LoanId nextLoanId() noexcept { return m_loanIdCounter++; }

    // Caller holds the loan's slot lock (or owns the new slot).
    std::vector<OperationRecord> commit(
        std::unique_ptr<Slot> newSlot,
        Slot* existing,
        const Loan& staged,
        std::vector<OperationRecord> records);

    mutable std::shared_mutex m_mtx;
    std::map<LoanId, std::unique_ptr<Slot>> m_loans;
    std::map<AccountId, LoanId> m_activeByAccount;
    std::vector<OperationRecord> m_log;
    std::map<AccountId, std::vector<size_t>> m_logByAccount;

    std::atomic<LoanId> m_loanIdCounter{1};

    friend class LedgerTransaction;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
