/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/hash.hpp>

namespace ledger_codec::cardano {
    template<typename H>
    static H _hash_payload(const std::string_view name, const uint8_vector &payload)
    {
        logger::trace("{} hash payload: {} bytes", name, payload.size());
        return blake2b<H>(payload);
    }

    result<tx_hash> hash_transaction_body(const tx_body &body)
    {
        return make_result([&] {
            return _hash_payload<tx_hash>("transaction body", cbor::encode(body.to_cbor(), cbor::canonical));
        });
    }

    result<auxiliary_data_hash> hash_auxiliary_data(const auxiliary_data &aux)
    {
        return make_result([&] {
            return _hash_payload<auxiliary_data_hash>("auxiliary data", cbor::encode(aux.to_cbor(), cbor::canonical));
        });
    }

    result<datum_hash> hash_plutus_data(const plutus_data &datum)
    {
        return make_result([&] {
            return _hash_payload<datum_hash>("plutus data", datum.bytes());
        });
    }

    static void _encode_datums(cbor::encoder &enc, const datum_list &datums)
    {
        enc.tag(cddl::set_tag_id);
        enc.array(datums.size());
        for (const auto &d: datums)
            enc.raw_cbor(d.bytes());
    }

    result<uint8_vector> script_data_payload(const redeemers_t &redeemers, const cost_models &models, const std::optional<datum_list> &datums)
    {
        return make_result([&] {
            const bool has_datums = datums && !datums->empty();
            cbor::encoder enc {};
            if (has_datums && redeemers.empty()) {
                enc.map(0);
                _encode_datums(enc, *datums);
                enc.map(0);
            } else {
                cbor::encode(enc, redeemers.to_array_cbor(), cbor::cml_default);
                if (has_datums)
                    _encode_datums(enc, *datums);
                enc.raw_cbor(models.language_views());
            }
            return std::move(enc.cbor());
        });
    }

    result<script_data_hash> hash_script_data(const redeemers_t &redeemers, const cost_models &models, const std::optional<datum_list> &datums)
    {
        return make_result([&] {
            return _hash_payload<script_data_hash>("script data", script_data_payload(redeemers, models, datums).unwrap());
        });
    }
}
