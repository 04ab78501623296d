/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendcore/service/LendingConfig.hpp"

#include "lendcore/settings/SettingsStore.hpp"

#include <charconv>

//-------------------------------------------------------------------------

namespace lendcore::service
{

//-------------------------------------------------------------------------

namespace
{

decimal_t decimalAttribute(pugi::xml_node node, const char* name, decimal_t fallback)
{
    const pugi::xml_attribute attr = node.attribute(name);
    return attr.empty() ? fallback : settings::parseDecimal(attr.as_string());
}

decimal_t positiveDecimalAttribute(
    pugi::xml_node node,
    const char* name,
    decimal_t fallback,
    std::source_location sl = std::source_location::current())
{
    const decimal_t val = decimalAttribute(node, name, fallback);
    if (!(val > decimal_t{})) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' on <{}> must be positive, was {}", sl.function_name(), name, node.name(), val)};
    }
    return val;
}

}  // namespace

//-------------------------------------------------------------------------

LendingConfig makeLendingConfig(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (std::string_view{node.name()} != "Lending") {
        throw std::invalid_argument{fmt::format(
            "{}: expected a <Lending> node, got <{}>", ctx, node.name())};
    }

    LendingConfig config;

    auto& params = config.parameters;
    params.interestRate = decimalAttribute(node, "interestRate", params.interestRate);
    params.defaultLtvRatio = decimalAttribute(node, "defaultLtvRatio", params.defaultLtvRatio);
    params.liquidationThreshold =
        decimalAttribute(node, "liquidationThreshold", params.liquidationThreshold);
    params.warningThreshold = decimalAttribute(node, "warningThreshold", params.warningThreshold);
    params.liquidationTarget =
        decimalAttribute(node, "liquidationTarget", params.liquidationTarget);
    params.minimumInterestDays =
        node.attribute("minimumInterestDays").as_uint(params.minimumInterestDays);
    params.validate();

    if (pugi::xml_node monitorNode = node.child("RiskMonitor")) {
        const auto interval = monitorNode.attribute("intervalSeconds").as_llong(
            config.riskMonitorInterval.count());
        if (interval <= 0) {
            throw std::invalid_argument{fmt::format(
                "{}: 'intervalSeconds' must be positive, was {}", ctx, interval)};
        }
        config.riskMonitorInterval = std::chrono::seconds{interval};
    }

    if (pugi::xml_node accrualNode = node.child("InterestAccrual")) {
        if (pugi::xml_attribute attr = accrualNode.attribute("time")) {
            config.accrual.timeOfDay = parseTimeOfDay(attr.as_string());
        }
        config.accrual.timeZone =
            accrualNode.attribute("timeZone").as_string(config.accrual.timeZone.c_str());
    }

    if (pugi::xml_node oracleNode = node.child("Oracle")) {
        auto& oracle = config.oracle;
        const pugi::xml_attribute buyAttr = oracleNode.attribute("buyRate");
        const pugi::xml_attribute sellAttr = oracleNode.attribute("sellRate");
        if (buyAttr.empty() != sellAttr.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: 'buyRate' and 'sellRate' must be given together", ctx)};
        }
        if (!buyAttr.empty()) {
            oracle.buyRate = accounting::Rate{buyAttr.as_llong()};
            oracle.sellRate = accounting::Rate{sellAttr.as_llong()};
            if (!oracle.buyRate->isValid() || !oracle.sellRate->isValid()) {
                throw std::invalid_argument{fmt::format(
                    "{}: fixed rates must be positive, were {}/{}",
                    ctx, *oracle.buyRate, *oracle.sellRate)};
            }
        }
        if (!oracleNode.attribute("referencePrice").empty()) {
            oracle.referencePrice =
                positiveDecimalAttribute(oracleNode, "referencePrice", decimal_t{});
        }
        oracle.buyMultiplier =
            positiveDecimalAttribute(oracleNode, "buyMultiplier", oracle.buyMultiplier);
        oracle.sellMultiplier =
            positiveDecimalAttribute(oracleNode, "sellMultiplier", oracle.sellMultiplier);
        oracle.freshnessSeconds =
            oracleNode.attribute("freshnessSeconds").as_ullong(oracle.freshnessSeconds);
        if (pugi::xml_attribute attr = oracleNode.attribute("priceFile")) {
            oracle.priceFile = fs::path{attr.as_string()};
        }
        oracle.refreshInterval = std::chrono::seconds{
            oracleNode.attribute("refreshSeconds").as_llong(oracle.refreshInterval.count())};
        if (oracle.refreshInterval.count() <= 0
            || static_cast<Timestamp>(oracle.refreshInterval.count()) >= oracle.freshnessSeconds) {
            throw std::invalid_argument{fmt::format(
                "{}: 'refreshSeconds' must be positive and below 'freshnessSeconds' ({}), was {}",
                ctx, oracle.freshnessSeconds, oracle.refreshInterval.count())};
        }
    }

    if (pugi::xml_node loggingNode = node.child("Logging")) {
        config.logging.dir = loggingNode.attribute("dir").as_string(config.logging.dir.c_str());
        if (pugi::xml_attribute attr = loggingNode.attribute("level")) {
            config.logging.level = spdlog::level::from_str(attr.as_string());
        }
    }

    return config;
}

//-------------------------------------------------------------------------

std::chrono::minutes parseTimeOfDay(std::string_view str)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto fail = [&] {
        return std::invalid_argument{fmt::format(
            "{}: expected a time of day as HH:MM, got '{}'", ctx, str)};
    };

    const auto sep = str.find(':');
    if (sep == std::string_view::npos) {
        throw fail();
    }
    int hours{}, minutes{};
    const auto hoursPart = str.substr(0, sep);
    const auto minutesPart = str.substr(sep + 1);
    const auto [hEnd, hErr] =
        std::from_chars(hoursPart.data(), hoursPart.data() + hoursPart.size(), hours);
    const auto [mEnd, mErr] =
        std::from_chars(minutesPart.data(), minutesPart.data() + minutesPart.size(), minutes);
    const bool parsed = hErr == std::errc{}
        && mErr == std::errc{}
        && hEnd == hoursPart.data() + hoursPart.size()
        && mEnd == minutesPart.data() + minutesPart.size();
    if (!parsed || hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        throw fail();
    }
    return std::chrono::hours{hours} + std::chrono::minutes{minutes};
}

//-------------------------------------------------------------------------

}  // namespace lendcore::service

//-------------------------------------------------------------------------
