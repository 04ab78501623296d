/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendcore/accounting/AccountBalances.hpp"
#include "lendcore/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct pack<lendcore::accounting::AccountBalances>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(
        msgpack::packer<Stream>& o, const lendcore::accounting::AccountBalances& v) const
    {
        using namespace std::string_literals;

        o.pack_map(5);

        o.pack("availableCrypto"s);
        o.pack(v.availableCrypto.units());

        o.pack("collateralCrypto"s);
        o.pack(v.collateralCrypto.units());

        o.pack("availableBase"s);
        o.pack(v.availableBase.units());

        o.pack("borrowedBase"s);
        o.pack(v.borrowedBase.units());

        o.pack("interestAccruedBase"s);
        o.pack(v.interestAccruedBase.units());

        return o;
    }
};

template<>
struct convert<lendcore::accounting::AccountBalances>
{
    const msgpack::object& operator()(
        const msgpack::object& o, lendcore::accounting::AccountBalances& v) const
    {
        using namespace lendcore::accounting;
        using lendcore::serialization::msgpackAt;

        v.availableCrypto = CryptoAmount{msgpackAt(o, "availableCrypto").as<int64_t>()};
        v.collateralCrypto = CryptoAmount{msgpackAt(o, "collateralCrypto").as<int64_t>()};
        v.availableBase = BaseAmount{msgpackAt(o, "availableBase").as<int64_t>()};
        v.borrowedBase = BaseAmount{msgpackAt(o, "borrowedBase").as<int64_t>()};
        v.interestAccruedBase = BaseAmount{msgpackAt(o, "interestAccruedBase").as<int64_t>()};
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
