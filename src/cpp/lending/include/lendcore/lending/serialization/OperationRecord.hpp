/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/lending/OperationRecord.hpp"
#include "lendcore/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct pack<lendcore::lending::OperationRecord>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(
        msgpack::packer<Stream>& o, const lendcore::lending::OperationRecord& v) const
    {
        using namespace std::string_literals;

        o.pack_map(9);

        o.pack("id"s);
        o.pack(v.id);

        o.pack("loanId"s);
        o.pack(v.loanId);

        o.pack("accountId"s);
        o.pack(v.accountId);

        o.pack("type"s);
        o.pack(std::to_underlying(v.type));

        o.pack("baseDelta"s);
        o.pack(v.baseDelta.units());

        o.pack("cryptoDelta"s);
        o.pack(v.cryptoDelta.units());

        o.pack("executionRate"s);
        if (v.executionRate.has_value()) {
            o.pack(v.executionRate->units());
        } else {
            o.pack_nil();
        }

        o.pack("detail"s);
        o.pack(v.detail);

        o.pack("timestamp"s);
        o.pack(v.timestamp);

        return o;
    }
};

template<>
struct convert<lendcore::lending::OperationRecord>
{
    const msgpack::object& operator()(
        const msgpack::object& o, lendcore::lending::OperationRecord& v) const
    {
        using namespace lendcore::accounting;
        using lendcore::lending::OperationType;
        using lendcore::serialization::msgpackAt;

        v.id = msgpackAt(o, "id").as<lendcore::OperationId>();
        v.loanId = msgpackAt(o, "loanId").as<lendcore::LoanId>();
        v.accountId = msgpackAt(o, "accountId").as<lendcore::AccountId>();
        const auto type = magic_enum::enum_cast<OperationType>(
            msgpackAt(o, "type").as<std::underlying_type_t<OperationType>>());
        if (!type.has_value()) {
            throw lendcore::serialization::MsgPackError{"unknown operation type"};
        }
        v.type = *type;
        v.baseDelta = BaseAmount{msgpackAt(o, "baseDelta").as<int64_t>()};
        v.cryptoDelta = CryptoAmount{msgpackAt(o, "cryptoDelta").as<int64_t>()};
        const auto& rate = msgpackAt(o, "executionRate");
        v.executionRate = rate.is_nil()
            ? std::nullopt : std::make_optional(Rate{rate.as<int64_t>()});
        v.detail = msgpackAt(o, "detail").as<std::string>();
        v.timestamp = msgpackAt(o, "timestamp").as<lendcore::Timestamp>();
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
