/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/lending/LedgerTransaction.hpp"

#include "lendcore/util/LendingException.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

LedgerTransaction::LedgerTransaction(
    accounting::AccountLedger& ledger, LoanStore& store, AccountId accountId)
    : m_ledger{ledger}, m_store{store}, m_accountId{accountId}
{
    {
        std::shared_lock lock{m_ledger.m_mtx};
        auto it = m_ledger.m_accounts.find(accountId);
        if (it == m_ledger.m_accounts.end()) {
            throw AccountNotFound{fmt::format(
                "{}: unknown account #{}",
                std::source_location::current().function_name(), accountId)};
        }
        m_entry = it->second.get();
    }
    m_accountLock = std::unique_lock{m_entry->mtx};
    m_balances = m_entry->balances;
}

//-------------------------------------------------------------------------

Loan& LedgerTransaction::bindActiveLoan()
{
    if (m_loan.has_value()) {
        if (!m_loan->isActive()) {
            throw NoActiveLoan{fmt::format(
                "{}: loan #{} of account #{} is {}",
                std::source_location::current().function_name(),
                m_loan->id, m_accountId, toString(m_loan->status))};
        }
        return *m_loan;
    }
    // No loan can be opened or closed for this account while its lock is held.
    const auto loanId = m_store.activeLoanOf(m_accountId);
    if (!loanId.has_value()) {
        throw NoActiveLoan{fmt::format(
            "{}: account #{} has no active loan",
            std::source_location::current().function_name(), m_accountId)};
    }
    return bindLoan(*loanId);
}

//-------------------------------------------------------------------------

Loan& LedgerTransaction::bindLoan(LoanId loanId)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_loan.has_value()) {
        if (m_loan->id != loanId) {
            throw std::logic_error{fmt::format(
                "{}: transaction is already bound to loan #{}", ctx, m_loan->id)};
        }
        return *m_loan;
    }
    LoanStore::Slot* slot = m_store.findSlot(loanId);
    if (slot == nullptr) {
        throw LoanNotFound{fmt::format("{}: unknown loan #{}", ctx, loanId)};
    }
    std::unique_lock lock{slot->mtx};
    if (slot->loan.owner != m_accountId) {
        throw std::logic_error{fmt::format(
            "{}: loan #{} belongs to account #{}, not #{}",
            ctx, loanId, slot->loan.owner, m_accountId)};
    }
    m_slot = slot;
    m_loanLock = std::move(lock);
    m_loan = m_slot->loan;
    return *m_loan;
}

//-------------------------------------------------------------------------

Loan& LedgerTransaction::createLoan(Timestamp now)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_loan.has_value()) {
        throw std::logic_error{fmt::format(
            "{}: transaction is already bound to loan #{}", ctx, m_loan->id)};
    }
    if (const auto active = m_store.activeLoanOf(m_accountId)) {
        throw LoanAlreadyActive{fmt::format(
            "{}: account #{} already has active loan #{}", ctx, m_accountId, *active)};
    }
    m_newSlot = std::make_unique<LoanStore::Slot>();
    Loan loan;
    loan.id = m_store.nextLoanId();
    loan.owner = m_accountId;
    loan.status = LoanStatus::ACTIVE;
    loan.createdAt = now;
    m_loan = loan;
    return *m_loan;
}

//-------------------------------------------------------------------------

Loan& LedgerTransaction::loan()
{
    if (!m_loan.has_value()) {
        throw std::logic_error{fmt::format(
            "{}: no loan bound to the transaction of account #{}",
            std::source_location::current().function_name(), m_accountId)};
    }
    return *m_loan;
}

//-------------------------------------------------------------------------

void LedgerTransaction::record(
    OperationType type,
    accounting::BaseAmount baseDelta,
    accounting::CryptoAmount cryptoDelta,
    std::optional<accounting::Rate> executionRate,
    std::string detail)
{
    OperationRecord rec;
    rec.loanId = loan().id;
    rec.accountId = m_accountId;
    rec.type = type;
    rec.baseDelta = baseDelta;
    rec.cryptoDelta = cryptoDelta;
    rec.executionRate = executionRate;
    rec.detail = std::move(detail);
    m_records.push_back(std::move(rec));
}

//-------------------------------------------------------------------------

void LedgerTransaction::checkMirror(std::source_location sl) const
{
    const bool active = m_loan.has_value() && m_loan->isActive();
    const auto expectedCollateral = active ? m_loan->collateralAmount : accounting::CryptoAmount{};
    const auto expectedBorrowed = active ? m_loan->borrowedAmount : accounting::BaseAmount{};
    if (m_balances.collateralCrypto != expectedCollateral
        || m_balances.borrowedBase != expectedBorrowed) {
        throw std::runtime_error{fmt::format(
            "{}: balances of account #{} ({}) do not mirror {}",
            sl.function_name(), m_accountId, m_balances,
            m_loan.has_value() ? fmt::format("{}", *m_loan) : std::string{"no loan"})};
    }
}

//-------------------------------------------------------------------------

std::vector<OperationRecord> LedgerTransaction::commit(Timestamp now)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_committed) {
        throw std::logic_error{fmt::format("{}: transaction committed twice", ctx)};
    }
    m_balances.checkConsistency();
    if (m_loan.has_value()) {
        checkMirror();
    }

    std::vector<OperationRecord> committed;
    if (m_loan.has_value()) {
        for (auto& rec : m_records) {
            rec.timestamp = now;
        }
        committed = m_store.commit(std::move(m_newSlot), m_slot, *m_loan, std::move(m_records));
    } else if (!m_records.empty()) {
        throw std::logic_error{fmt::format("{}: operation records without a loan", ctx)};
    }
    m_entry->balances = m_balances;
    m_committed = true;
    return committed;
}

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
