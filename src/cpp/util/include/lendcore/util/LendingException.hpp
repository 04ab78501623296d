/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <magic_enum.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendcore
{

//-------------------------------------------------------------------------

enum class LendingErrorCode : uint32_t
{
    INVALID_AMOUNT,
    ACCOUNT_NOT_FOUND,
    LOAN_NOT_FOUND,
    INSUFFICIENT_FUNDS,
    INSUFFICIENT_CAPACITY,
    LOAN_ALREADY_ACTIVE,
    NO_ACTIVE_LOAN,
    EXCEEDS_OUTSTANDING_DEBT,
    INSUFFICIENT_COLLATERAL_FOR_LIQUIDATION,
    RATE_UNAVAILABLE
};

[[nodiscard]] constexpr std::string_view toString(LendingErrorCode code) noexcept
{
    return magic_enum::enum_name(code);
}

//-------------------------------------------------------------------------

class LendingException : public std::runtime_error
{
public:
    LendingException(LendingErrorCode code, const std::string& message)
        : std::runtime_error{message}, m_code{code}
    {}

    [[nodiscard]] LendingErrorCode code() const noexcept { return m_code; }

private:
    LendingErrorCode m_code;
};

//-------------------------------------------------------------------------

template<LendingErrorCode Code>
class LendingError : public LendingException
{
public:
    static constexpr LendingErrorCode kCode = Code;

    explicit LendingError(const std::string& message) : LendingException{Code, message} {}
};

using InvalidAmount = LendingError<LendingErrorCode::INVALID_AMOUNT>;
using AccountNotFound = LendingError<LendingErrorCode::ACCOUNT_NOT_FOUND>;
using LoanNotFound = LendingError<LendingErrorCode::LOAN_NOT_FOUND>;
using InsufficientFunds = LendingError<LendingErrorCode::INSUFFICIENT_FUNDS>;
using InsufficientCapacity = LendingError<LendingErrorCode::INSUFFICIENT_CAPACITY>;
using LoanAlreadyActive = LendingError<LendingErrorCode::LOAN_ALREADY_ACTIVE>;
using NoActiveLoan = LendingError<LendingErrorCode::NO_ACTIVE_LOAN>;
using ExceedsOutstandingDebt = LendingError<LendingErrorCode::EXCEEDS_OUTSTANDING_DEBT>;
using InsufficientCollateralForLiquidation =
    LendingError<LendingErrorCode::INSUFFICIENT_COLLATERAL_FOR_LIQUIDATION>;
using RateUnavailable = LendingError<LendingErrorCode::RATE_UNAVAILABLE>;

//-------------------------------------------------------------------------

}  // namespace lendcore

//-------------------------------------------------------------------------
