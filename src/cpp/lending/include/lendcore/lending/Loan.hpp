/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/Amount.hpp"
#include "lendcore/serialization/json_util.hpp"
#include "lendcore/util/common.hpp"

#include <source_location>

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

enum class LoanStatus : uint8_t
{
    ACTIVE,
    REPAID,
    LIQUIDATED
};

[[nodiscard]] constexpr std::string_view toString(LoanStatus status) noexcept
{
    return magic_enum::enum_name(status);
}

// Local calendar day on which no accrual has happened yet.
inline constexpr int32_t kNoAccrualDay = std::numeric_limits<int32_t>::min();

//-------------------------------------------------------------------------

struct Loan : public JsonSerializable
{
    LoanId id{LOAN_ID_INVALID};
    AccountId owner{};
    accounting::CryptoAmount collateralAmount{};
    // Principal plus interest currently outstanding.
    accounting::BaseAmount borrowedAmount{};
    decimal_t ltvRatio{};
    decimal_t interestRate{};
    accounting::Rate liquidationPrice{};
    LoanStatus status{LoanStatus::ACTIVE};
    Timestamp createdAt{TIMESTAMP_INVALID};
    Timestamp closedAt{TIMESTAMP_INVALID};

    // Running totals; borrowedAmount == principal + interestCharged - debtRepaid - writtenOff.
    accounting::BaseAmount principal{};
    accounting::BaseAmount interestCharged{};
    accounting::BaseAmount debtRepaid{};
    accounting::BaseAmount writtenOff{};
    int32_t lastAccrualDay{kNoAccrualDay};

    [[nodiscard]] bool isActive() const noexcept { return status == LoanStatus::ACTIVE; }

    // Days fully elapsed since creation.
    [[nodiscard]] int64_t daysElapsed(Timestamp now) const noexcept;

    void checkConsistency(std::source_location sl = std::source_location::current()) const;

    [[nodiscard]] bool operator==(const Loan& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendcore::lending::Loan>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendcore::lending::Loan& loan, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Loan #{} of account #{} [{}]: collateral {}, borrowed {} (principal {}, interest {}, "
            "repaid {}), ltv {}, rate {}%",
            loan.id,
            loan.owner,
            lendcore::lending::toString(loan.status),
            loan.collateralAmount,
            loan.borrowedAmount,
            loan.principal,
            loan.interestCharged,
            loan.debtRepaid,
            loan.ltvRatio,
            loan.interestRate);
    }
};

//-------------------------------------------------------------------------
