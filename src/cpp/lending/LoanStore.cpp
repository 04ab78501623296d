/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/lending/LoanStore.hpp"

#include "lendcore/util/LendingException.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

LoanStore::Slot* LoanStore::findSlot(LoanId loanId) const
{
    std::shared_lock lock{m_mtx};
    if (auto it = m_loans.find(loanId); it != m_loans.end()) {
        return it->second.get();
    }
    return nullptr;
}

//-------------------------------------------------------------------------

std::optional<LoanId> LoanStore::activeLoanOf(AccountId accountId) const
{
    std::shared_lock lock{m_mtx};
    if (auto it = m_activeByAccount.find(accountId); it != m_activeByAccount.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

Loan LoanStore::get(LoanId loanId) const
{
    if (auto loan = tryGet(loanId)) {
        return *loan;
    }
    throw LoanNotFound{fmt::format(
        "{}: unknown loan #{}", std::source_location::current().function_name(), loanId)};
}

//-------------------------------------------------------------------------

std::optional<Loan> LoanStore::tryGet(LoanId loanId) const
{
    Slot* slot = findSlot(loanId);
    if (slot == nullptr) {
        return std::nullopt;
    }
    std::lock_guard lock{slot->mtx};
    return slot->loan;
}

//-------------------------------------------------------------------------

bool LoanStore::contains(LoanId loanId) const
{
    return findSlot(loanId) != nullptr;
}

//-------------------------------------------------------------------------

std::vector<LoanId> LoanStore::activeLoanIds() const
{
    std::shared_lock lock{m_mtx};
    auto ids = m_activeByAccount | views::values | ranges::to<std::vector>();
    ranges::sort(ids);
    return ids;
}

//-------------------------------------------------------------------------

std::vector<Loan> LoanStore::loans() const
{
    std::vector<Slot*> slots;
    {
        std::shared_lock lock{m_mtx};
        slots = m_loans
            | views::values
            | views::transform([](const auto& slot) { return slot.get(); })
            | ranges::to<std::vector>();
    }
    std::vector<Loan> result;
    result.reserve(slots.size());
    for (Slot* slot : slots) {
        std::lock_guard lock{slot->mtx};
        result.push_back(slot->loan);
    }
    return result;
}

//-------------------------------------------------------------------------

std::vector<Loan> LoanStore::loansOf(AccountId accountId) const
{
    return loans()
        | views::filter([accountId](const Loan& loan) { return loan.owner == accountId; })
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

size_t LoanStore::activeCount(AccountId accountId) const
{
    return ranges::count_if(loansOf(accountId), &Loan::isActive);
}

//-------------------------------------------------------------------------

std::vector<OperationRecord> LoanStore::history(
    AccountId accountId, std::optional<LoanId> loanId) const
{
    std::shared_lock lock{m_mtx};
    auto it = m_logByAccount.find(accountId);
    if (it == m_logByAccount.end()) {
        return {};
    }
    return it->second
        | views::reverse
        | views::transform([this](size_t idx) -> const OperationRecord& { return m_log[idx]; })
        | views::filter([&](const OperationRecord& rec) {
            return !loanId.has_value() || rec.loanId == *loanId;
        })
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

std::vector<OperationRecord> LoanStore::operations() const
{
    std::shared_lock lock{m_mtx};
    return m_log;
}

//-------------------------------------------------------------------------

accounting::BaseAmount LoanStore::borrowedPrincipal(const Loan& loan) const
{
    std::shared_lock lock{m_mtx};
    accounting::BaseAmount principal{};
    const auto it = m_logByAccount.find(loan.owner);
    if (it == m_logByAccount.end()) {
        return principal;
    }
    for (size_t idx : it->second) {
        const OperationRecord& rec = m_log[idx];
        if (rec.loanId == loan.id && rec.type == OperationType::BORROW) {
            principal += rec.baseDelta;
        }
    }
    return principal;
}

//-------------------------------------------------------------------------

void LoanStore::restore(std::vector<Loan> loans, std::vector<OperationRecord> operations)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    decltype(m_loans) loanMap;
    decltype(m_activeByAccount) activeByAccount;
    LoanId maxLoanId{};
    for (Loan& loan : loans) {
        loan.checkConsistency();
        if (loan.isActive() && !activeByAccount.emplace(loan.owner, loan.id).second) {
            throw LoanAlreadyActive{fmt::format(
                "{}: account #{} has more than one active loan", ctx, loan.owner)};
        }
        const LoanId loanId = loan.id;
        maxLoanId = std::max(maxLoanId, loanId);
        auto slot = std::make_unique<Slot>();
        slot->loan = std::move(loan);
        if (!loanMap.emplace(loanId, std::move(slot)).second) {
            throw std::invalid_argument{fmt::format("{}: duplicate loan #{}", ctx, loanId)};
        }
    }

    ranges::sort(operations, std::less{}, &OperationRecord::id);
    decltype(m_logByAccount) logByAccount;
    std::map<LoanId, accounting::BaseAmount> borrowed;
    for (size_t i = 0; i < operations.size(); ++i) {
        logByAccount[operations[i].accountId].push_back(i);
        if (operations[i].type == OperationType::BORROW) {
            borrowed[operations[i].loanId] += operations[i].baseDelta;
        }
    }
    for (const auto& [loanId, slot] : loanMap) {
        const auto it = borrowed.find(loanId);
        const auto recorded = it != borrowed.end() ? it->second : accounting::BaseAmount{};
        if (slot->loan.principal != recorded) {
            throw std::invalid_argument{fmt::format(
                "{}: loan #{} carries principal {} but its BORROW records sum to {}",
                ctx, loanId, slot->loan.principal, recorded)};
        }
    }

    std::unique_lock lock{m_mtx};
    m_loans = std::move(loanMap);
    m_activeByAccount = std::move(activeByAccount);
    m_log = std::move(operations);
    m_logByAccount = std::move(logByAccount);
    m_loanIdCounter = maxLoanId + 1;
}

//-------------------------------------------------------------------------

std::vector<OperationRecord> LoanStore::commit(
    std::unique_ptr<Slot> newSlot,
    Slot* existing,
    const Loan& staged,
    std::vector<OperationRecord> records)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    staged.checkConsistency();

    std::unique_lock lock{m_mtx};

    // Everything that may throw happens before the first visible change.
    OperationId nextId = m_log.size() + 1;
    for (auto& rec : records) {
        rec.id = nextId++;
    }
    std::vector<OperationRecord> committed = records;
    m_log.reserve(m_log.size() + records.size());
    auto& accountLog = m_logByAccount[staged.owner];
    accountLog.reserve(accountLog.size() + records.size());

    if (newSlot != nullptr) {
        if (m_activeByAccount.contains(staged.owner)) {
            throw LoanAlreadyActive{fmt::format(
                "{}: account #{} already has active loan #{}",
                ctx, staged.owner, m_activeByAccount.at(staged.owner))};
        }
        newSlot->loan = staged;
        auto [it, inserted] = m_loans.emplace(staged.id, std::move(newSlot));
        if (!inserted) {
            throw std::logic_error{fmt::format("{}: loan #{} exists already", ctx, staged.id)};
        }
        try {
            m_activeByAccount.emplace(staged.owner, staged.id);
        }
        catch (...) {
            m_loans.erase(it);
            throw;
        }
    } else {
        existing->loan = staged;
        if (!staged.isActive()) {
            m_activeByAccount.erase(staged.owner);
        }
    }

    for (auto& rec : records) {
        accountLog.push_back(m_log.size());
        m_log.push_back(std::move(rec));
    }
    return committed;
}

//-------------------------------------------------------------------------

void LoanStore::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        rapidjson::Value loansJson{rapidjson::kArrayType};
        for (const Loan& loan : loans()) {
            rapidjson::Document loanJson{&allocator};
            loan.jsonSerialize(loanJson);
            loansJson.PushBack(loanJson, allocator);
        }
        json.AddMember("loans", loansJson, allocator);
        rapidjson::Value opsJson{rapidjson::kArrayType};
        for (const OperationRecord& rec : operations()) {
            rapidjson::Document recJson{&allocator};
            rec.jsonSerialize(recJson);
            opsJson.PushBack(recJson, allocator);
        }
        json.AddMember("operations", opsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
