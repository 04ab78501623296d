/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/Loan.hpp"
#include "lendcore/lending/OperationRecord.hpp"
#include "lendcore/lending/loan_math.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

struct DepositCollateralResult
{
    LoanId loanId{LOAN_ID_INVALID};
    CryptoAmount collateralAmount;
    BaseAmount maxBorrowable;
    Rate liquidationPrice;
    Rate sellRate;
};

struct BorrowResult
{
    LoanId loanId{LOAN_ID_INVALID};
    BaseAmount newBorrowedTotal;
    BaseAmount availableCapacity;
    Rate liquidationPrice;
    Rate sellRate;
};

struct RepayResult
{
    LoanId loanId{LOAN_ID_INVALID};
    BaseAmount amountApplied;
    BaseAmount remainingDebt;
    LoanStatus loanStatus{LoanStatus::ACTIVE};
    CryptoAmount collateralReturned;
    BaseAmount minimumInterestApplied;
};

struct AddCollateralResult
{
    LoanId loanId{LOAN_ID_INVALID};
    CryptoAmount newTotalCollateral;
    decimal_t newLtv{};
    BaseAmount maxBorrowable;
    BaseAmount availableCapacity;
    Rate liquidationPrice;
    Rate sellRate;
};

//-------------------------------------------------------------------------

// Outcome of the 30-day floor computation at a given instant.
struct InterestFloor
{
    int64_t daysElapsed{};
    int64_t daysCharged{};
    BaseAmount minimumInterestDue;
    // Interest still owed for the floor to be met.
    BaseAmount shortfall;
    BaseAmount totalAmountDue;
};

//-------------------------------------------------------------------------

struct LoanStatusView
{
    LoanId loanId{LOAN_ID_INVALID};
    AccountId accountId{};
    LoanStatus status{LoanStatus::ACTIVE};
    CryptoAmount collateralAmount;
    BaseAmount borrowedAmount;
    BaseAmount principal;
    BaseAmount interestAccrued;
    decimal_t ltvRatio{};
    decimal_t interestRate{};
    decimal_t currentLtv{};
    RiskStatus riskStatus{RiskStatus::SAFE};
    BaseAmount maxBorrowable;
    BaseAmount availableCapacity;
    Rate liquidationPrice;
    Rate sellRate;
    InterestFloor interestFloor;
    Timestamp createdAt{TIMESTAMP_INVALID};
};

//-------------------------------------------------------------------------

struct LoanRiskView
{
    LoanId loanId{LOAN_ID_INVALID};
    AccountId accountId{};
    CryptoAmount collateralAmount;
    BaseAmount borrowedAmount;
    decimal_t currentLtv{};
    RiskStatus riskStatus{RiskStatus::SAFE};
    Rate liquidationPrice;
    Rate sellRate;
};

//-------------------------------------------------------------------------

enum class LiquidationTrigger : uint8_t
{
    RISK_MONITOR,
    OPERATOR,
    USER
};

struct LiquidationResult
{
    LoanId loanId{LOAN_ID_INVALID};
    AccountId accountId{};
    LiquidationTrigger trigger{LiquidationTrigger::RISK_MONITOR};
    OperationType type{OperationType::PARTIAL_LIQUIDATION};
    LoanStatus loanStatus{LoanStatus::ACTIVE};
    CryptoAmount collateralSold;
    CryptoAmount collateralReturned;
    CryptoAmount remainingCollateral;
    BaseAmount proceeds;
    BaseAmount debtCleared;
    BaseAmount excessProceeds;
    BaseAmount remainingDebt;
    BaseAmount badDebt;
    BaseAmount minimumInterestApplied;
    Rate executionRate;
    decimal_t ltvBefore{};
    decimal_t ltvAfter{};
};

//-------------------------------------------------------------------------

struct RiskEvaluation
{
    LoanRiskView view;
    std::optional<LiquidationResult> liquidation;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
