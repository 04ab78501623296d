/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/Amount.hpp"
#include "lendcore/serialization/json_util.hpp"
#include "lendcore/util/common.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

enum class OperationType : uint8_t
{
    COLLATERAL_DEPOSIT,
    BORROW,
    REPAY,
    ADD_COLLATERAL,
    INTEREST_ACCRUAL,
    PARTIAL_LIQUIDATION,
    FULL_LIQUIDATION
};

[[nodiscard]] constexpr std::string_view toString(OperationType type) noexcept
{
    return magic_enum::enum_name(type);
}

//-------------------------------------------------------------------------

/**
 * One committed state change of a loan. The deltas are signed changes of the
 * loan itself: baseDelta moves the outstanding debt and cryptoDelta the pledged
 * collateral, so a borrow is a positive base delta and a repayment a negative one.
 */
struct OperationRecord : public JsonSerializable
{
    OperationId id{};
    LoanId loanId{LOAN_ID_INVALID};
    AccountId accountId{};
    OperationType type{};
    accounting::BaseAmount baseDelta{};
    accounting::CryptoAmount cryptoDelta{};
    std::optional<accounting::Rate> executionRate;
    // JSON object text; "{}" when there is nothing to add.
    std::string detail{"{}"};
    Timestamp timestamp{TIMESTAMP_INVALID};

    [[nodiscard]] bool operator==(const OperationRecord& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

// Accumulates the structured detail of an operation record.
class OperationDetail
{
public:
    OperationDetail();

    OperationDetail& add(const char* name, accounting::BaseAmount amount);
    OperationDetail& add(const char* name, accounting::CryptoAmount amount);
    OperationDetail& add(const char* name, accounting::Rate rate);
    OperationDetail& add(const char* name, int64_t value);
    OperationDetail& add(const char* name, decimal_t value);
    OperationDetail& add(const char* name, std::string_view value);

    [[nodiscard]] std::string str() const;

private:
    rapidjson::Document m_json;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendcore::lending::OperationRecord>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendcore::lending::OperationRecord& rec, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "#{} {} loan #{} account #{}: base {:+}, crypto {:+}, rate {} {}",
            rec.id,
            lendcore::lending::toString(rec.type),
            rec.loanId,
            rec.accountId,
            rec.baseDelta.units(),
            rec.cryptoDelta.units(),
            rec.executionRate.has_value() ? rec.executionRate->units() : 0,
            rec.detail);
    }
};

//-------------------------------------------------------------------------
