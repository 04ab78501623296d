/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/Loan.hpp"
#include "lendcore/lending/loan_math.hpp"
#include "lendcore/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct pack<lendcore::lending::Loan>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(
        msgpack::packer<Stream>& o, const lendcore::lending::Loan& v) const
    {
        using namespace std::string_literals;

        o.pack_map(15);

        o.pack("id"s);
        o.pack(v.id);

        o.pack("owner"s);
        o.pack(v.owner);

        o.pack("collateralAmount"s);
        o.pack(v.collateralAmount.units());

        o.pack("borrowedAmount"s);
        o.pack(v.borrowedAmount.units());

        // Percentages travel in millionths, like the rates.
        o.pack("ltvRatio"s);
        o.pack(lendcore::lending::scalePercent(v.ltvRatio));

        o.pack("interestRate"s);
        o.pack(lendcore::lending::scalePercent(v.interestRate));

        o.pack("liquidationPrice"s);
        o.pack(v.liquidationPrice.units());

        o.pack("status"s);
        o.pack(std::to_underlying(v.status));

        o.pack("createdAt"s);
        o.pack(v.createdAt);

        o.pack("closedAt"s);
        o.pack(v.closedAt);

        o.pack("principal"s);
        o.pack(v.principal.units());

        o.pack("interestCharged"s);
        o.pack(v.interestCharged.units());

        o.pack("debtRepaid"s);
        o.pack(v.debtRepaid.units());

        o.pack("writtenOff"s);
        o.pack(v.writtenOff.units());

        o.pack("lastAccrualDay"s);
        o.pack(v.lastAccrualDay);

        return o;
    }
};

template<>
struct convert<lendcore::lending::Loan>
{
    const msgpack::object& operator()(
        const msgpack::object& o, lendcore::lending::Loan& v) const
    {
        using namespace lendcore::accounting;
        using lendcore::lending::LoanStatus;
        using lendcore::serialization::msgpackAt;

        v.id = msgpackAt(o, "id").as<lendcore::LoanId>();
        v.owner = msgpackAt(o, "owner").as<lendcore::AccountId>();
        v.collateralAmount = CryptoAmount{msgpackAt(o, "collateralAmount").as<int64_t>()};
        v.borrowedAmount = BaseAmount{msgpackAt(o, "borrowedAmount").as<int64_t>()};
        v.ltvRatio = lendcore::lending::unscalePercent(msgpackAt(o, "ltvRatio").as<int64_t>());
        v.interestRate =
            lendcore::lending::unscalePercent(msgpackAt(o, "interestRate").as<int64_t>());
        v.liquidationPrice = Rate{msgpackAt(o, "liquidationPrice").as<int64_t>()};
        const auto status = magic_enum::enum_cast<LoanStatus>(
            msgpackAt(o, "status").as<std::underlying_type_t<LoanStatus>>());
        if (!status.has_value()) {
            throw lendcore::serialization::MsgPackError{"unknown loan status"};
        }
        v.status = *status;
        v.createdAt = msgpackAt(o, "createdAt").as<lendcore::Timestamp>();
        v.closedAt = msgpackAt(o, "closedAt").as<lendcore::Timestamp>();
        v.principal = BaseAmount{msgpackAt(o, "principal").as<int64_t>()};
        v.interestCharged = BaseAmount{msgpackAt(o, "interestCharged").as<int64_t>()};
        v.debtRepaid = BaseAmount{msgpackAt(o, "debtRepaid").as<int64_t>()};
        v.writtenOff = BaseAmount{msgpackAt(o, "writtenOff").as<int64_t>()};
        v.lastAccrualDay = msgpackAt(o, "lastAccrualDay").as<int32_t>();
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
