/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/lending/LendingEngine.hpp"

#include "lendcore/lending/LedgerTransaction.hpp"
#include "lendcore/util/LendingException.hpp"

//-------------------------------------------------------------------------

namespace lendcore::lending
{

//-------------------------------------------------------------------------

namespace
{

template<typename Tag>
void requirePositive(
    accounting::Amount<Tag> amount,
    std::source_location sl = std::source_location::current())
{
    if (!amount.isPositive()) {
        throw InvalidAmount{fmt::format(
            "{}: {} amount must be greater than 0, was {}",
            sl.function_name(), accounting::Amount<Tag>::symbol, amount)};
    }
}

[[nodiscard]] BaseAmount nonNegative(BaseAmount amount) noexcept
{
    return std::max(amount, BaseAmount{});
}

[[nodiscard]] std::string_view toString(LiquidationTrigger trigger) noexcept
{
    return magic_enum::enum_name(trigger);
}

[[nodiscard]] std::string liquidationDetail(const LiquidationResult& res)
{
    return OperationDetail{}
        .add("trigger", toString(res.trigger))
        .add("debt_cleared", res.debtCleared)
        .add("collateral_sold", res.collateralSold)
        .add("collateral_returned", res.collateralReturned)
        .add("execution_rate", res.executionRate)
        .add("minimum_interest_applied", res.minimumInterestApplied)
        .add("proceeds", res.proceeds)
        .add("excess_proceeds", res.excessProceeds)
        .add("bad_debt", res.badDebt)
        .add("ltv_before", res.ltvBefore)
        .add("ltv_after", res.ltvAfter)
        .str();
}

}  // namespace

//-------------------------------------------------------------------------

LendingEngine::LendingEngine(
    accounting::AccountLedger& ledger,
    LoanStore& store,
    oracle::RateOracle::Ptr oracle,
    settings::SettingsStore::Ptr settings,
    Clock::Ptr clock,
    std::shared_ptr<spdlog::logger> logger)
    : m_ledger{ledger},
      m_store{store},
      m_oracle{std::move(oracle)},
      m_settings{std::move(settings)},
      m_clock{std::move(clock)},
      m_logger{std::move(logger)}
{
    if (!m_oracle || !m_settings || !m_clock || !m_logger) {
        throw std::invalid_argument{fmt::format(
            "{}: oracle, settings, clock and logger are required",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

DepositCollateralResult LendingEngine::depositCollateral(
    AccountId accountId, CryptoAmount amount, std::optional<decimal_t> ltvRatio)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    requirePositive(amount);
    const auto params = parameters();
    const decimal_t ltv = ltvRatio.value_or(params.defaultLtvRatio);
    if (!(decimal_t{} < ltv && ltv < params.liquidationThreshold)) {
        throw std::invalid_argument{fmt::format(
            "{}: LTV ratio must lie in (0, {}), was {}", ctx, params.liquidationThreshold, ltv)};
    }
    const auto quote = m_oracle->quote();
    const Timestamp now = m_clock->now();

    DepositCollateralResult result;
    std::vector<OperationRecord> committed;
    {
        LedgerTransaction tx{m_ledger, m_store, accountId};
        Loan& loan = tx.createLoan(now);
        auto& bals = tx.balances();
        if (bals.availableCrypto < amount) {
            throw InsufficientFunds{fmt::format(
                "{}: account #{} holds {} available crypto, {} requested as collateral",
                ctx, accountId, bals.availableCrypto, amount)};
        }

        loan.collateralAmount = amount;
        loan.ltvRatio = ltv;
        loan.interestRate = params.interestRate;
        bals.availableCrypto -= amount;
        bals.collateralCrypto += amount;

        const BaseAmount maxBorrow = maxBorrowable(amount, quote.sell, ltv);
        tx.record(
            OperationType::COLLATERAL_DEPOSIT,
            BaseAmount{},
            amount,
            quote.sell,
            OperationDetail{}
                .add("ltv_ratio", ltv)
                .add("interest_rate", loan.interestRate)
                .add("max_borrowable", maxBorrow)
                .str());

        result = {
            .loanId = loan.id,
            .collateralAmount = loan.collateralAmount,
            .maxBorrowable = maxBorrow,
            .liquidationPrice = loan.liquidationPrice,
            .sellRate = quote.sell
        };
        committed = tx.commit(now);
    }

    m_logger->info(
        "Account #{} opened loan #{} with collateral {} at LTV {} (max borrowable {})",
        accountId, result.loanId, amount, ltv, result.maxBorrowable);
    publish(committed);
    return result;
}

//-------------------------------------------------------------------------

BorrowResult LendingEngine::borrow(AccountId accountId, BaseAmount amount)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    requirePositive(amount);
    const auto params = parameters();
    const auto quote = m_oracle->quote();
    const Timestamp now = m_clock->now();

    BorrowResult result;
    std::vector<OperationRecord> committed;
    {
        LedgerTransaction tx{m_ledger, m_store, accountId};
        Loan& loan = tx.bindActiveLoan();
        auto& bals = tx.balances();

        const BaseAmount maxBorrow = maxBorrowable(loan.collateralAmount, quote.sell, loan.ltvRatio);
        const BaseAmount capacity = maxBorrow - loan.borrowedAmount;
        if (amount > capacity) {
            throw InsufficientCapacity{fmt::format(
                "{}: loan #{} can take at most {} more (max borrowable {}, borrowed {}), {} requested",
                ctx, loan.id, nonNegative(capacity), maxBorrow, loan.borrowedAmount, amount)};
        }

        loan.borrowedAmount += amount;
        loan.principal += amount;
        loan.liquidationPrice = liquidationPrice(
            loan.borrowedAmount, loan.collateralAmount, params.liquidationThreshold);
        bals.availableBase += amount;
        bals.borrowedBase += amount;

        tx.record(
            OperationType::BORROW,
            amount,
            CryptoAmount{},
            quote.sell,
            OperationDetail{}
                .add("max_borrowable", maxBorrow)
                .add("available_capacity", capacity - amount)
                .add("liquidation_price", loan.liquidationPrice)
                .str());

        result = {
            .loanId = loan.id,
            .newBorrowedTotal = loan.borrowedAmount,
            .availableCapacity = capacity - amount,
            .liquidationPrice = loan.liquidationPrice,
            .sellRate = quote.sell
        };
        committed = tx.commit(now);
    }

    m_logger->info(
        "Account #{} borrowed {} on loan #{} (outstanding {}, capacity left {})",
        accountId, amount, result.loanId, result.newBorrowedTotal, result.availableCapacity);
    publish(committed);
    return result;
}

//-------------------------------------------------------------------------

RepayResult LendingEngine::repay(AccountId accountId, BaseAmount amount)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    requirePositive(amount);
    const auto params = parameters();
    const Timestamp now = m_clock->now();

    RepayResult result;
    std::vector<OperationRecord> committed;
    {
        LedgerTransaction tx{m_ledger, m_store, accountId};
        Loan& loan = tx.bindActiveLoan();
        auto& bals = tx.balances();

        const InterestFloor floor = interestFloor(loan, now, params);
        if (amount > floor.totalAmountDue) {
            throw ExceedsOutstandingDebt{fmt::format(
                "{}: repayment {} exceeds the total amount due {} on loan #{}",
                ctx, amount, floor.totalAmountDue, loan.id)};
        }
        if (bals.availableBase < amount) {
            throw InsufficientFunds{fmt::format(
                "{}: account #{} holds {} available base, {} requested for repayment",
                ctx, accountId, bals.availableBase, amount)};
        }

        BaseAmount minimumInterestApplied{};
        if (amount == floor.totalAmountDue) {
            minimumInterestApplied = applyInterestFloor(tx, floor);
        } else if (amount > loan.borrowedAmount) {
            throw ExceedsOutstandingDebt{fmt::format(
                "{}: partial repayment {} exceeds the outstanding debt {} on loan #{}; "
                "settling the loan requires exactly {}",
                ctx, amount, loan.borrowedAmount, loan.id, floor.totalAmountDue)};
        }

        loan.borrowedAmount -= amount;
        loan.debtRepaid += amount;
        bals.availableBase -= amount;
        bals.borrowedBase -= amount;

        CryptoAmount collateralReturned{};
        if (loan.borrowedAmount.isZero()) {
            collateralReturned = loan.collateralAmount;
            closeLoan(tx, LoanStatus::REPAID, now);
        } else {
            loan.liquidationPrice = liquidationPrice(
                loan.borrowedAmount, loan.collateralAmount, params.liquidationThreshold);
        }

        tx.record(
            OperationType::REPAY,
            -amount,
            -collateralReturned,
            std::nullopt,
            OperationDetail{}
                .add("total_amount_due", floor.totalAmountDue)
                .add("minimum_interest_applied", minimumInterestApplied)
                .add("days_charged", floor.daysCharged)
                .add("collateral_returned", collateralReturned)
                .str());

        result = {
            .loanId = loan.id,
            .amountApplied = amount,
            .remainingDebt = loan.borrowedAmount,
            .loanStatus = loan.status,
            .collateralReturned = collateralReturned,
            .minimumInterestApplied = minimumInterestApplied
        };
        committed = tx.commit(now);
    }

    m_logger->info(
        "Account #{} repaid {} on loan #{} (remaining {}, status {}, minimum interest applied {})",
        accountId, amount, result.loanId, result.remainingDebt,
        toString(result.loanStatus), result.minimumInterestApplied);
    publish(committed);
    return result;
}

//-------------------------------------------------------------------------

AddCollateralResult LendingEngine::addCollateral(AccountId accountId, CryptoAmount amount)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    requirePositive(amount);
    const auto params = parameters();
    const auto quote = m_oracle->quote();
    const Timestamp now = m_clock->now();

    AddCollateralResult result;
    std::vector<OperationRecord> committed;
    {
        LedgerTransaction tx{m_ledger, m_store, accountId};
        Loan& loan = tx.bindActiveLoan();
        auto& bals = tx.balances();
        if (bals.availableCrypto < amount) {
            throw InsufficientFunds{fmt::format(
                "{}: account #{} holds {} available crypto, {} requested as collateral",
                ctx, accountId, bals.availableCrypto, amount)};
        }

        loan.collateralAmount += amount;
        loan.liquidationPrice = liquidationPrice(
            loan.borrowedAmount, loan.collateralAmount, params.liquidationThreshold);
        bals.availableCrypto -= amount;
        bals.collateralCrypto += amount;

        const BaseAmount maxBorrow = maxBorrowable(loan.collateralAmount, quote.sell, loan.ltvRatio);
        result = {
            .loanId = loan.id,
            .newTotalCollateral = loan.collateralAmount,
            .newLtv = currentLtv(loan.borrowedAmount, loan.collateralAmount, quote.sell),
            .maxBorrowable = maxBorrow,
            .availableCapacity = nonNegative(maxBorrow - loan.borrowedAmount),
            .liquidationPrice = loan.liquidationPrice,
            .sellRate = quote.sell
        };

        tx.record(
            OperationType::ADD_COLLATERAL,
            BaseAmount{},
            amount,
            quote.sell,
            OperationDetail{}
                .add("new_total_collateral", result.newTotalCollateral)
                .add("new_ltv", result.newLtv)
                .add("liquidation_price", result.liquidationPrice)
                .str());
        committed = tx.commit(now);
    }

    m_logger->info(
        "Account #{} added collateral {} to loan #{} (total {}, LTV {})",
        accountId, amount, result.loanId, result.newTotalCollateral, result.newLtv);
    publish(committed);
    return result;
}

//-------------------------------------------------------------------------

std::optional<LoanStatusView> LendingEngine::getStatus(AccountId accountId) const
{
    if (!m_ledger.contains(accountId)) {
        throw AccountNotFound{fmt::format(
            "{}: unknown account #{}", std::source_location::current().function_name(), accountId)};
    }
    const auto loanId = m_store.activeLoanOf(accountId);
    if (!loanId.has_value()) {
        return std::nullopt;
    }
    const auto loan = m_store.tryGet(*loanId);
    if (!loan.has_value() || !loan->isActive()) {
        return std::nullopt;
    }

    const auto params = parameters();
    const auto quote = m_oracle->quote();
    const Timestamp now = m_clock->now();

    const int64_t ltvScaled = currentLtvScaled(loan->borrowedAmount, loan->collateralAmount, quote.sell);
    const BaseAmount maxBorrow = maxBorrowable(loan->collateralAmount, quote.sell, loan->ltvRatio);

    return LoanStatusView{
        .loanId = loan->id,
        .accountId = loan->owner,
        .status = loan->status,
        .collateralAmount = loan->collateralAmount,
        .borrowedAmount = loan->borrowedAmount,
        .principal = loan->principal,
        .interestAccrued = loan->interestCharged,
        .ltvRatio = loan->ltvRatio,
        .interestRate = loan->interestRate,
        .currentLtv = decimal_t{ltvScaled} / decimal_t{kPercentScale},
        .riskStatus = classifyRisk(ltvScaled, params.thresholds()),
        .maxBorrowable = maxBorrow,
        .availableCapacity = nonNegative(maxBorrow - loan->borrowedAmount),
        .liquidationPrice = loan->liquidationPrice,
        .sellRate = quote.sell,
        .interestFloor = interestFloor(*loan, now, params),
        .createdAt = loan->createdAt
    };
}

//-------------------------------------------------------------------------

std::vector<OperationRecord> LendingEngine::getHistory(
    AccountId accountId, std::optional<LoanId> loanId) const
{
    if (!m_ledger.contains(accountId)) {
        throw AccountNotFound{fmt::format(
            "{}: unknown account #{}", std::source_location::current().function_name(), accountId)};
    }
    return m_store.history(accountId, loanId);
}

//-------------------------------------------------------------------------

LiquidationResult LendingEngine::forceLiquidate(LoanId loanId)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto params = parameters();
    const auto quote = m_oracle->quote();
    const Timestamp now = m_clock->now();
    const AccountId owner = m_store.get(loanId).owner;

    LiquidationResult result;
    std::vector<OperationRecord> committed;
    {
        LedgerTransaction tx{m_ledger, m_store, owner};
        Loan& loan = tx.bindLoan(loanId);
        if (!loan.isActive()) {
            throw NoActiveLoan{fmt::format(
                "{}: loan #{} is already {}", ctx, loanId, toString(loan.status))};
        }
        auto& bals = tx.balances();

        const decimal_t ltvBefore = currentLtv(loan.borrowedAmount, loan.collateralAmount, quote.sell);
        const BaseAmount minimumInterestApplied =
            applyInterestFloor(tx, interestFloor(loan, now, params));

        const BaseAmount debt = loan.borrowedAmount;
        const CryptoAmount sold = debt.isPositive() ? cryptoFor(debt, quote.sell) : CryptoAmount{};
        if (sold > loan.collateralAmount) {
            throw InsufficientCollateralForLiquidation{fmt::format(
                "{}: clearing debt {} of loan #{} takes {} collateral at rate {}, only {} pledged",
                ctx, debt, loanId, sold, quote.sell, loan.collateralAmount)};
        }
        const BaseAmount proceeds = accounting::valueOf(sold, quote.sell);
        const CryptoAmount pledged = loan.collateralAmount;

        loan.collateralAmount -= sold;
        loan.borrowedAmount -= debt;
        loan.debtRepaid += debt;
        bals.collateralCrypto -= sold;
        bals.borrowedBase -= debt;
        bals.availableBase += proceeds - debt;
        bals.interestAccruedBase = BaseAmount{};
        const CryptoAmount returned = loan.collateralAmount;
        closeLoan(tx, LoanStatus::LIQUIDATED, now);

        result = {
            .loanId = loanId,
            .accountId = owner,
            .trigger = LiquidationTrigger::OPERATOR,
            .type = OperationType::FULL_LIQUIDATION,
            .loanStatus = loan.status,
            .collateralSold = sold,
            .collateralReturned = returned,
            .remainingCollateral = CryptoAmount{},
            .proceeds = proceeds,
            .debtCleared = debt,
            .excessProceeds = proceeds - debt,
            .remainingDebt = BaseAmount{},
            .badDebt = BaseAmount{},
            .minimumInterestApplied = minimumInterestApplied,
            .executionRate = quote.sell,
            .ltvBefore = ltvBefore,
            .ltvAfter = decimal_t{}
        };
        tx.record(
            OperationType::FULL_LIQUIDATION,
            -debt,
            -pledged,
            quote.sell,
            liquidationDetail(result));
        committed = tx.commit(now);
    }

    m_logger->warn(
        "Loan #{} of account #{} force-liquidated: sold {} for {}, cleared {}, returned {}",
        loanId, owner, result.collateralSold, result.proceeds, result.debtCleared,
        result.collateralReturned);
    publish(committed);
    publish(result);
    return result;
}

//-------------------------------------------------------------------------

LiquidationResult LendingEngine::userPartialLiquidation(AccountId accountId, CryptoAmount amount)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    requirePositive(amount);
    const auto params = parameters();
    const auto quote = m_oracle->quote();
    const Timestamp now = m_clock->now();

    LiquidationResult result;
    std::vector<OperationRecord> committed;
    {
        LedgerTransaction tx{m_ledger, m_store, accountId};
        Loan& loan = tx.bindActiveLoan();
        auto& bals = tx.balances();
        if (amount > loan.collateralAmount) {
            throw InsufficientFunds{fmt::format(
                "{}: {} exceeds the {} collateral of loan #{}",
                ctx, amount, loan.collateralAmount, loan.id)};
        }

        const decimal_t ltvBefore = currentLtv(loan.borrowedAmount, loan.collateralAmount, quote.sell);
        const BaseAmount proceeds = accounting::valueOf(amount, quote.sell);

        // A sale that would clear the debt settles the loan, so the interest floor applies.
        BaseAmount minimumInterestApplied{};
        if (proceeds >= loan.borrowedAmount) {
            minimumInterestApplied = applyInterestFloor(tx, interestFloor(loan, now, params));
        }
        const BaseAmount debtCleared = std::min(proceeds, loan.borrowedAmount);
        if (amount == loan.collateralAmount && debtCleared < loan.borrowedAmount) {
            throw InsufficientCollateralForLiquidation{fmt::format(
                "{}: selling all {} collateral of loan #{} yields {}, short of the debt {}",
                ctx, amount, loan.id, proceeds, loan.borrowedAmount)};
        }

        loan.collateralAmount -= amount;
        loan.borrowedAmount -= debtCleared;
        loan.debtRepaid += debtCleared;
        bals.collateralCrypto -= amount;
        bals.borrowedBase -= debtCleared;
        bals.availableBase += proceeds - debtCleared;
        bals.interestAccruedBase = BaseAmount{};

        CryptoAmount returned{};
        if (loan.borrowedAmount.isZero()) {
            returned = loan.collateralAmount;
            closeLoan(tx, LoanStatus::REPAID, now);
        } else {
            loan.liquidationPrice = liquidationPrice(
                loan.borrowedAmount, loan.collateralAmount, params.liquidationThreshold);
        }

        result = {
            .loanId = loan.id,
            .accountId = accountId,
            .trigger = LiquidationTrigger::USER,
            .type = loan.isActive()
                ? OperationType::PARTIAL_LIQUIDATION : OperationType::FULL_LIQUIDATION,
            .loanStatus = loan.status,
            .collateralSold = amount,
            .collateralReturned = returned,
            .remainingCollateral = loan.collateralAmount,
            .proceeds = proceeds,
            .debtCleared = debtCleared,
            .excessProceeds = proceeds - debtCleared,
            .remainingDebt = loan.borrowedAmount,
            .badDebt = BaseAmount{},
            .minimumInterestApplied = minimumInterestApplied,
            .executionRate = quote.sell,
            .ltvBefore = ltvBefore,
            .ltvAfter = currentLtv(loan.borrowedAmount, loan.collateralAmount, quote.sell)
        };
        tx.record(
            result.type,
            -debtCleared,
            -(amount + returned),
            quote.sell,
            liquidationDetail(result));
        committed = tx.commit(now);
    }

    m_logger->info(
        "Account #{} sold {} collateral of loan #{} for {} (debt cleared {}, remaining {})",
        accountId, amount, result.loanId, result.proceeds, result.debtCleared, result.remainingDebt);
    publish(committed);
    publish(result);
    return result;
}

//-------------------------------------------------------------------------

std::vector<LoanRiskView> LendingEngine::listAtRiskLoans() const
{
    const auto params = parameters();
    const auto quote = m_oracle->quote();

    std::vector<LoanRiskView> atRisk;
    for (LoanId loanId : m_store.activeLoanIds()) {
        const auto loan = m_store.tryGet(loanId);
        if (!loan.has_value() || !loan->isActive() || !loan->borrowedAmount.isPositive()) {
            continue;
        }
        const int64_t ltvScaled =
            currentLtvScaled(loan->borrowedAmount, loan->collateralAmount, quote.sell);
        const RiskStatus risk = classifyRisk(ltvScaled, params.thresholds());
        if (risk == RiskStatus::SAFE) {
            continue;
        }
        atRisk.push_back({
            .loanId = loan->id,
            .accountId = loan->owner,
            .collateralAmount = loan->collateralAmount,
            .borrowedAmount = loan->borrowedAmount,
            .currentLtv = decimal_t{ltvScaled} / decimal_t{kPercentScale},
            .riskStatus = risk,
            .liquidationPrice = loan->liquidationPrice,
            .sellRate = quote.sell
        });
    }
    ranges::sort(atRisk, [](const LoanRiskView& lhs, const LoanRiskView& rhs) {
        return lhs.currentLtv > rhs.currentLtv
            || (lhs.currentLtv == rhs.currentLtv && lhs.loanId < rhs.loanId);
    });
    return atRisk;
}

//-------------------------------------------------------------------------

std::optional<RiskEvaluation> LendingEngine::evaluateRisk(
    LoanId loanId, const oracle::RateQuote& quote)
{
    const auto params = parameters();
    const Timestamp now = m_clock->now();

    const auto snapshot = m_store.tryGet(loanId);
    if (!snapshot.has_value() || !snapshot->isActive()) {
        return std::nullopt;
    }

    RiskEvaluation evaluation;
    std::vector<OperationRecord> committed;
    {
        LedgerTransaction tx{m_ledger, m_store, snapshot->owner};
        Loan& loan = tx.bindLoan(loanId);
        if (!loan.isActive()
            || !loan.borrowedAmount.isPositive()
            || !loan.collateralAmount.isPositive()) {
            return std::nullopt;
        }

        const int64_t ltvScaled =
            currentLtvScaled(loan.borrowedAmount, loan.collateralAmount, quote.sell);
        evaluation.view = {
            .loanId = loan.id,
            .accountId = loan.owner,
            .collateralAmount = loan.collateralAmount,
            .borrowedAmount = loan.borrowedAmount,
            .currentLtv = decimal_t{ltvScaled} / decimal_t{kPercentScale},
            .riskStatus = classifyRisk(ltvScaled, params.thresholds()),
            .liquidationPrice = loan.liquidationPrice,
            .sellRate = quote.sell
        };
        if (evaluation.view.riskStatus == RiskStatus::LIQUIDATE) {
            evaluation.liquidation = stageRiskLiquidation(tx, quote.sell, params, now);
            committed = tx.commit(now);
        }
    }

    if (evaluation.view.riskStatus == RiskStatus::WARNING) {
        m_logger->warn(
            "Loan #{} of account #{} at LTV {} (warning threshold {})",
            loanId, evaluation.view.accountId, evaluation.view.currentLtv, params.warningThreshold);
        m_signals.warning(evaluation.view);
    }
    if (evaluation.liquidation.has_value()) {
        const auto& res = *evaluation.liquidation;
        m_logger->warn(
            "Loan #{} of account #{} liquidated at LTV {}: sold {} for {}, cleared {}, LTV now {}",
            loanId, res.accountId, res.ltvBefore, res.collateralSold, res.proceeds,
            res.debtCleared, res.ltvAfter);
        publish(committed);
        publish(res);
    }
    return evaluation;
}

//-------------------------------------------------------------------------

std::optional<BaseAmount> LendingEngine::accrueDailyInterest(LoanId loanId, int32_t localDay)
{
    const auto params = parameters();
    const Timestamp now = m_clock->now();
    const auto snapshot = m_store.tryGet(loanId);
    if (!snapshot.has_value()) {
        throw LoanNotFound{fmt::format(
            "{}: unknown loan #{}", std::source_location::current().function_name(), loanId)};
    }
    if (!snapshot->isActive()) {
        return std::nullopt;
    }

    BaseAmount interest;
    std::vector<OperationRecord> committed;
    {
        LedgerTransaction tx{m_ledger, m_store, snapshot->owner};
        Loan& loan = tx.bindLoan(loanId);
        if (!loan.isActive()
            || loan.lastAccrualDay >= localDay
            || !loan.borrowedAmount.isPositive()) {
            return std::nullopt;
        }
        interest = dailyInterest(loan.borrowedAmount, loan.interestRate);
        if (!interest.isPositive()) {
            return std::nullopt;
        }
        auto& bals = tx.balances();

        const BaseAmount borrowedBefore = loan.borrowedAmount;
        loan.borrowedAmount += interest;
        loan.interestCharged += interest;
        loan.lastAccrualDay = localDay;
        loan.liquidationPrice = liquidationPrice(
            loan.borrowedAmount, loan.collateralAmount, params.liquidationThreshold);
        bals.borrowedBase += interest;
        bals.interestAccruedBase += interest;

        tx.record(
            OperationType::INTEREST_ACCRUAL,
            interest,
            CryptoAmount{},
            std::nullopt,
            OperationDetail{}
                .add("reason", std::string_view{"daily"})
                .add("accrual_day", static_cast<int64_t>(localDay))
                .add("annual_rate", loan.interestRate)
                .add("borrowed_before", borrowedBefore)
                .str());
        committed = tx.commit(now);
    }

    m_logger->debug("Accrued {} interest on loan #{} for day {}", interest, loanId, localDay);
    publish(committed);
    return interest;
}

//-------------------------------------------------------------------------

LendingParameters LendingEngine::parameters() const
{
    return LendingParameters::fromSettings(*m_settings);
}

//-------------------------------------------------------------------------

InterestFloor LendingEngine::interestFloor(const Loan& loan, Timestamp now) const
{
    return interestFloor(loan, now, parameters());
}

//-------------------------------------------------------------------------

InterestFloor LendingEngine::interestFloor(
    const Loan& loan, Timestamp now, const LendingParameters& params) const
{
    InterestFloor floor;
    floor.daysElapsed = loan.daysElapsed(now);
    floor.daysCharged = std::max<int64_t>(floor.daysElapsed, params.minimumInterestDays);
    floor.minimumInterestDue = simpleInterest(loan.principal, loan.interestRate, floor.daysCharged);
    floor.shortfall = nonNegative(floor.minimumInterestDue - loan.interestCharged);
    floor.totalAmountDue = loan.borrowedAmount + floor.shortfall;
    return floor;
}

//-------------------------------------------------------------------------

BaseAmount LendingEngine::applyInterestFloor(LedgerTransaction& tx, const InterestFloor& floor)
{
    if (!floor.shortfall.isPositive()) {
        return BaseAmount{};
    }
    Loan& loan = tx.loan();
    auto& bals = tx.balances();

    loan.borrowedAmount += floor.shortfall;
    loan.interestCharged += floor.shortfall;
    bals.borrowedBase += floor.shortfall;
    bals.interestAccruedBase += floor.shortfall;

    tx.record(
        OperationType::INTEREST_ACCRUAL,
        floor.shortfall,
        CryptoAmount{},
        std::nullopt,
        OperationDetail{}
            .add("reason", std::string_view{"minimum_interest_floor"})
            .add("days_elapsed", floor.daysElapsed)
            .add("days_charged", floor.daysCharged)
            .add("minimum_interest_due", floor.minimumInterestDue)
            .str());
    return floor.shortfall;
}

//-------------------------------------------------------------------------

LiquidationResult LendingEngine::stageRiskLiquidation(
    LedgerTransaction& tx, Rate sell, const LendingParameters& params, Timestamp now)
{
    Loan& loan = tx.loan();
    auto& bals = tx.balances();

    const decimal_t ltvBefore = currentLtv(loan.borrowedAmount, loan.collateralAmount, sell);
    const CryptoAmount pledged = loan.collateralAmount;
    const CryptoAmount sold = collateralToRestoreTarget(
        loan.borrowedAmount, loan.collateralAmount, sell, params.liquidationTarget);
    const BaseAmount proceeds = accounting::valueOf(sold, sell);
    const BaseAmount debtCleared = std::min(proceeds, loan.borrowedAmount);

    loan.collateralAmount -= sold;
    loan.borrowedAmount -= debtCleared;
    loan.debtRepaid += debtCleared;
    bals.collateralCrypto -= sold;
    bals.borrowedBase -= debtCleared;
    bals.availableBase += proceeds - debtCleared;
    bals.interestAccruedBase = BaseAmount{};

    CryptoAmount returned{};
    BaseAmount badDebt{};
    if (loan.borrowedAmount.isZero()) {
        returned = loan.collateralAmount;
        closeLoan(tx, LoanStatus::LIQUIDATED, now);
    } else if (loan.collateralAmount.isZero()) {
        // Nothing left to sell; the remainder is written off.
        badDebt = loan.borrowedAmount;
        loan.writtenOff += badDebt;
        loan.borrowedAmount = BaseAmount{};
        bals.borrowedBase -= badDebt;
        closeLoan(tx, LoanStatus::LIQUIDATED, now);
    } else {
        loan.liquidationPrice = liquidationPrice(
            loan.borrowedAmount, loan.collateralAmount, params.liquidationThreshold);
    }

    LiquidationResult result{
        .loanId = loan.id,
        .accountId = loan.owner,
        .trigger = LiquidationTrigger::RISK_MONITOR,
        .type = loan.isActive()
            ? OperationType::PARTIAL_LIQUIDATION : OperationType::FULL_LIQUIDATION,
        .loanStatus = loan.status,
        .collateralSold = sold,
        .collateralReturned = returned,
        .remainingCollateral = loan.collateralAmount,
        .proceeds = proceeds,
        .debtCleared = debtCleared,
        .excessProceeds = proceeds - debtCleared,
        .remainingDebt = loan.borrowedAmount,
        .badDebt = badDebt,
        .minimumInterestApplied = BaseAmount{},
        .executionRate = sell,
        .ltvBefore = ltvBefore,
        .ltvAfter = currentLtv(loan.borrowedAmount, loan.collateralAmount, sell)
    };
    tx.record(
        result.type,
        -(debtCleared + badDebt),
        -pledged + loan.collateralAmount,
        sell,
        liquidationDetail(result));
    return result;
}

//-------------------------------------------------------------------------

void LendingEngine::closeLoan(LedgerTransaction& tx, LoanStatus status, Timestamp now)
{
    Loan& loan = tx.loan();
    auto& bals = tx.balances();

    bals.collateralCrypto -= loan.collateralAmount;
    bals.availableCrypto += loan.collateralAmount;
    loan.collateralAmount = CryptoAmount{};
    loan.liquidationPrice = Rate{};
    loan.status = status;
    loan.closedAt = now;
}

//-------------------------------------------------------------------------

void LendingEngine::publish(const std::vector<OperationRecord>& records)
{
    for (const auto& rec : records) {
        m_signals.operation(rec);
    }
}

//-------------------------------------------------------------------------

void LendingEngine::publish(const LiquidationResult& result)
{
    m_signals.liquidated(result);
    if (result.badDebt.isPositive()) {
        m_logger->error(
            "Loan #{} of account #{} closed with bad debt {}: collateral exhausted at rate {}",
            result.loanId, result.accountId, result.badDebt, result.executionRate);
        m_signals.badDebt(result);
    }
}

//-------------------------------------------------------------------------

}  // namespace lendcore::lending

//-------------------------------------------------------------------------
