/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/tx-output.hpp>

namespace ledger_codec::cardano {
    using namespace cddl;

    static cbor::value _embedded_from_cbor(const cbor::value &v)
    {
        const auto &t = v.tag();
        if (t.id != embedded_cbor_tag) [[unlikely]]
            throw schema_error("expected an embedded CBOR tag {} but got {}", embedded_cbor_tag, t.id);
        return cbor::decode_value(t.inner().bytes());
    }

    datum_option datum_option::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "datum_option" };
        switch (const auto typ = it.read_type(); typ) {
            case 0: return { it.read<datum_hash>() };
            case 1: return { plutus_data::from_cbor(_embedded_from_cbor(it.read())) };
            [[unlikely]] default:
                throw schema_error("unsupported datum_option type {}", typ);
        }
    }

    cbor::value datum_option::to_cbor() const
    {
        if (const auto *hash = std::get_if<datum_hash>(&val); hash)
            return tuple_to_cbor(uint64_t { 0 }, *hash);
        const auto &datum = std::get<plutus_data>(val);
        return tuple_to_cbor(uint64_t { 1 }, cbor::make_tag(embedded_cbor_tag, cbor::make_bytes(datum.bytes())));
    }

    script_ref script_ref::from_cbor(const cbor::value &v)
    {
        return { script_t::from_cbor(_embedded_from_cbor(v)) };
    }

    cbor::value script_ref::to_cbor() const
    {
        return cbor::make_tag(embedded_cbor_tag, cbor::make_bytes(cbor::encode(script.to_cbor())));
    }

    tx_output tx_output::from_cbor(const cbor::value &v)
    {
        if (v.is<cbor::array>()) {
            array_reader it { v, 2, 3, "legacy transaction_output" };
            tx_output out { it.read<address>(), it.read<value_t>() };
            if (!it.done())
                out.datum.emplace(datum_option { it.read<datum_hash>() });
            out.form = tx_output_form::legacy;
            return out;
        }
        const int_map_reader m { v, { 0, 1, 2, 3 }, "transaction_output" };
        return {
            m.required<address>(0),
            m.required<value_t>(1),
            m.optional<datum_option>(2),
            m.optional<script_ref>(3),
            tx_output_form::post_alonzo
        };
    }

    cbor::value tx_output::to_cbor() const
    {
        switch (form) {
            case tx_output_form::legacy: {
                if (ref) [[unlikely]]
                    throw encode_error("a legacy transaction output cannot carry a script reference");
                if (!datum)
                    return tuple_to_cbor(addr, amount);
                const auto *hash = std::get_if<datum_hash>(&datum->val);
                if (!hash) [[unlikely]]
                    throw encode_error("a legacy transaction output cannot carry an inline datum");
                return tuple_to_cbor(addr, amount, *hash);
            }
            case tx_output_form::post_alonzo:
                return int_map_builder {}.add(0, addr).add(1, amount).add(2, datum).add(3, ref).build();
            [[unlikely]] default:
                throw encode_error("unsupported transaction output form: {}", static_cast<int>(form));
        }
    }
}
