/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/decimal/decimal.hpp"
#include "lendcore/util/Clock.hpp"

#include <boost/signals2.hpp>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;
namespace views = ranges::views;

//-------------------------------------------------------------------------

namespace lendcore
{

using AccountId = uint32_t;
using LoanId = uint64_t;
using OperationId = uint64_t;

// Loan ids start at 1.
inline constexpr LoanId LOAN_ID_INVALID = 0;

// Slots may be invoked from the risk monitor and accrual threads.
template<typename SlotType>
using Signal = bs2::signal<SlotType>;

}  // namespace lendcore

//-------------------------------------------------------------------------
