/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/LendingResults.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

// Emitted after the corresponding transaction has committed and released its locks.
struct LendingSignals
{
    Signal<void(const OperationRecord&)> operation;
    Signal<void(const LoanRiskView&)> warning;
    Signal<void(const LiquidationResult&)> liquidated;
    Signal<void(const LiquidationResult&)> badDebt;
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
