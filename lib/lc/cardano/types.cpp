/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/types.hpp>

namespace ledger_codec::cardano {
    using namespace cddl;

    tx_input tx_input::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "transaction_input" };
        return { it.read<tx_hash>(), it.read<uint16_t>() };
    }

    cbor::value tx_input::to_cbor() const
    {
        return tuple_to_cbor(hash, idx);
    }

    credential_t credential_t::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "credential" };
        switch (const auto typ = it.read_type(); typ) {
            case 0:
            case 1: {
                const auto script = typ == 1;
                return { it.read<key_hash>(), script };
            }
            [[unlikely]] default:
                throw schema_error("unsupported credential type: {}", typ);
        }
    }

    cbor::value credential_t::to_cbor() const
    {
        return tuple_to_cbor(uint64_t { script ? 1U : 0U }, hash);
    }

    drep_t drep_t::from_cbor(const cbor::value &v)
    {
        const auto typ = v.at(0).uint();
        switch (typ) {
            case 0:
            case 1:
                return { credential_t::from_cbor(v) };
            case 2:
                array_reader { v, 1, "drep" };
                return { abstain_t {} };
            case 3:
                array_reader { v, 1, "drep" };
                return { no_confidence_t {} };
            [[unlikely]] default:
                throw schema_error("unsupported drep type: {}", typ);
        }
    }

    cbor::value drep_t::to_cbor() const
    {
        return std::visit([](const auto &d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, credential_t>) {
                return d.to_cbor();
            } else if constexpr (std::is_same_v<T, abstain_t>) {
                return tuple_to_cbor(uint64_t { 2 });
            } else if constexpr (std::is_same_v<T, no_confidence_t>) {
                return tuple_to_cbor(uint64_t { 3 });
            } else {
                static_assert(sizeof(T) == 0, "unsupported drep alternative");
                return cbor::value {};
            }
        }, val);
    }

    anchor_t anchor_t::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "anchor" };
        return { it.read<url>(), it.read<datum_hash>() };
    }

    cbor::value anchor_t::to_cbor() const
    {
        return tuple_to_cbor(uri, hash);
    }

    ex_units ex_units::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "ex_units" };
        return { it.read<uint64_t>(), it.read<uint64_t>() };
    }

    cbor::value ex_units::to_cbor() const
    {
        return tuple_to_cbor(mem, steps);
    }

    nonzero_int64 nonzero_int64::from_cbor(const cbor::value &v)
    {
        const auto amount = value_from_cbor<int64_t>(v);
        if (amount == 0) [[unlikely]]
            throw schema_error("a minted amount must not be zero");
        return { amount };
    }

    cbor::value nonzero_int64::to_cbor() const
    {
        if (amount == 0) [[unlikely]]
            throw encode_error("a minted amount must not be zero");
        return cbor::make_int(amount);
    }

    value_t value_t::from_cbor(const cbor::value &v)
    {
        if (v.is<cbor::uint_value>())
            return { v.uint() };
        array_reader it { v, 2, "value" };
        return { it.read<coin>(), it.read<multiasset>() };
    }

    cbor::value value_t::to_cbor() const
    {
        if (assets.empty())
            return cbor::make_uint(coins);
        return tuple_to_cbor(coins, assets);
    }
}
