/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/accounting/AccountLedger.hpp"

//-------------------------------------------------------------------------

namespace lendcore::accounting
{

//-------------------------------------------------------------------------

namespace
{

template<typename Tag>
void requirePositive(
    Amount<Tag> amount, std::source_location sl = std::source_location::current())
{
    if (!amount.isPositive()) {
        throw std::invalid_argument{fmt::format(
            "{}: {} amount must be positive, was {}", sl.function_name(), Amount<Tag>::symbol, amount)};
    }
}

}  // namespace

//-------------------------------------------------------------------------

AccountLedger::Entry& AccountLedger::entry(AccountId accountId) const
{
    std::shared_lock lock{m_mtx};
    if (auto it = m_accounts.find(accountId); it != m_accounts.end()) {
        return *it->second;
    }
    throw std::out_of_range{fmt::format(
        "{}: unknown account #{}", std::source_location::current().function_name(), accountId)};
}

//-------------------------------------------------------------------------

template<typename Fn>
void AccountLedger::mutate(AccountId accountId, Fn&& fn)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    Entry& e = entry(accountId);
    std::lock_guard lock{e.mtx};
    AccountBalances staged = e.balances;
    std::forward<Fn>(fn)(staged);
    if (staged.availableCrypto.isNegative() || staged.availableBase.isNegative()) {
        throw std::invalid_argument{fmt::format(
            "{}: insufficient available balance on account #{}: {}", ctx, accountId, e.balances)};
    }
    staged.checkConsistency();
    e.balances = staged;
}

//-------------------------------------------------------------------------

void AccountLedger::registerAccount(AccountId accountId, AccountBalances initial)
{
    initial.checkConsistency();
    std::unique_lock lock{m_mtx};
    auto entry = std::make_unique<Entry>();
    entry->balances = initial;
    if (!m_accounts.emplace(accountId, std::move(entry)).second) {
        throw std::invalid_argument{fmt::format(
            "{}: account #{} already registered",
            std::source_location::current().function_name(), accountId)};
    }
}

//-------------------------------------------------------------------------

void AccountLedger::registerXML(pugi::xml_node node)
{
    for (pugi::xml_node accountNode : node.children("Account")) {
        const pugi::xml_attribute idAttr = accountNode.attribute("id");
        if (idAttr.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: <Account> is missing the 'id' attribute",
                std::source_location::current().function_name())};
        }
        registerAccount(idAttr.as_uint(), AccountBalances::fromXML(accountNode));
    }
}

//-------------------------------------------------------------------------

bool AccountLedger::contains(AccountId accountId) const
{
    std::shared_lock lock{m_mtx};
    return m_accounts.contains(accountId);
}

//-------------------------------------------------------------------------

AccountBalances AccountLedger::snapshot(AccountId accountId) const
{
    Entry& e = entry(accountId);
    std::lock_guard lock{e.mtx};
    return e.balances;
}

//-------------------------------------------------------------------------

std::vector<AccountId> AccountLedger::accountIds() const
{
    std::shared_lock lock{m_mtx};
    return m_accounts | views::keys | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

void AccountLedger::deposit(AccountId accountId, CryptoAmount amount)
{
    requirePositive(amount);
    mutate(accountId, [&](AccountBalances& bals) { bals.availableCrypto += amount; });
}

//-------------------------------------------------------------------------

void AccountLedger::deposit(AccountId accountId, BaseAmount amount)
{
    requirePositive(amount);
    mutate(accountId, [&](AccountBalances& bals) { bals.availableBase += amount; });
}

//-------------------------------------------------------------------------

void AccountLedger::withdraw(AccountId accountId, CryptoAmount amount)
{
    requirePositive(amount);
    mutate(accountId, [&](AccountBalances& bals) { bals.availableCrypto -= amount; });
}

//-------------------------------------------------------------------------

void AccountLedger::withdraw(AccountId accountId, BaseAmount amount)
{
    requirePositive(amount);
    mutate(accountId, [&](AccountBalances& bals) { bals.availableBase -= amount; });
}

//-------------------------------------------------------------------------

void AccountLedger::restore(AccountId accountId, const AccountBalances& balances)
{
    balances.checkConsistency();
    std::unique_lock lock{m_mtx};
    auto& slot = m_accounts[accountId];
    if (!slot) {
        slot = std::make_unique<Entry>();
    }
    std::lock_guard entryLock{slot->mtx};
    slot->balances = balances;
}

//-------------------------------------------------------------------------

void AccountLedger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        std::shared_lock lock{m_mtx};
        for (const auto& [accountId, e] : m_accounts) {
            rapidjson::Document accountJson{&allocator};
            {
                std::lock_guard entryLock{e->mtx};
                e->balances.jsonSerialize(accountJson);
            }
            json.AddMember(
                rapidjson::Value{std::to_string(accountId).c_str(), allocator},
                accountJson,
                allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendcore::accounting

//-------------------------------------------------------------------------
