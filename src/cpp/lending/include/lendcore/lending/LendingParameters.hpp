/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/loan_math.hpp"
#include "lendcore/settings/SettingsStore.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

struct LendingParameters
{
    decimal_t interestRate{15};
    decimal_t defaultLtvRatio{60};
    decimal_t liquidationThreshold{90};
    decimal_t warningThreshold{85};
    decimal_t liquidationTarget{60};
    uint32_t minimumInterestDays{30};

    [[nodiscard]] RiskThresholds thresholds() const noexcept
    {
        return {.warning = warningThreshold, .liquidation = liquidationThreshold};
    }

    // Throws std::invalid_argument unless 0 < target < warning < liquidation < 100.
    void validate() const;

    void writeTo(settings::SettingsStore& store) const;

    // Missing keys take the defaults above.
    [[nodiscard]] static LendingParameters fromSettings(const settings::SettingsStore& store);
};

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
