/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/AccountBalances.hpp"
#include "lendcore/util/common.hpp"

#include <pugixml.hpp>

#include <mutex>
#include <shared_mutex>

//-------------------------------------------------------------------------

namespace lendcore::lending
{
class LedgerTransaction;
}  // namespace lendcore::lending

//-------------------------------------------------------------------------

namespace lendcore::accounting
{

//-------------------------------------------------------------------------

class AccountLedger : public JsonSerializable
{
public:
    void registerAccount(AccountId accountId, AccountBalances initial = {});
    void registerXML(pugi::xml_node node);

    [[nodiscard]] bool contains(AccountId accountId) const;
    [[nodiscard]] AccountBalances snapshot(AccountId accountId) const;
    [[nodiscard]] std::vector<AccountId> accountIds() const;

    // Wallet flows owned by the outer system; never touch loan buckets.
    void deposit(AccountId accountId, CryptoAmount amount);
    void deposit(AccountId accountId, BaseAmount amount);
    void withdraw(AccountId accountId, CryptoAmount amount);
    void withdraw(AccountId accountId, BaseAmount amount);

    // Restores a checkpointed ledger; replaces any existing account.
    void restore(AccountId accountId, const AccountBalances& balances);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    struct Entry
    {
        std::mutex mtx;
        AccountBalances balances;
    };

    [[nodiscard]] Entry& entry(AccountId accountId) const;

    template<typename Fn>
    void mutate(AccountId accountId, Fn&& fn);

    mutable std::shared_mutex m_mtx;
    std::map<AccountId, std::unique_ptr<Entry>> m_accounts;

    friend class lending::LedgerTransaction;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::accounting

//-------------------------------------------------------------------------
