/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/tx-body.hpp>

namespace ledger_codec::cardano {
    using namespace cddl;

    template<typename S>
    static std::optional<S> _optional_nonempty(const int_map_reader &m, const uint64_t key, const std::string_view name)
    {
        if (!m.contains(key))
            return {};
        return nonempty_from_cbor<S>(m.required(key), name);
    }

    template<typename S>
    static const std::optional<S> &_check_nonempty(const std::optional<S> &s, const std::string_view name)
    {
        if (s && s->empty()) [[unlikely]]
            throw encode_error("{} must not be empty when present", name);
        return s;
    }

    tx_body tx_body::from_cbor(const cbor::value &v)
    {
        const int_map_reader m { v, { 0, 1, 2, 3, 4, 5, 7, 8, 9, 11, 13, 14, 15, 16, 17, 18, 19, 20, 21, 22 }, "transaction_body" };
        tx_body res {
            m.required<tx_input_set>(0),
            m.required<tx_output_list>(1),
            m.required<coin>(2),
            m.optional<slot>(3),
            _optional_nonempty<cert_list>(m, 4, "certificates"),
            _optional_nonempty<withdrawal_map>(m, 5, "withdrawals"),
            m.optional<auxiliary_data_hash>(7),
            m.optional<slot>(8),
            _optional_nonempty<mint_t>(m, 9, "mint"),
            m.optional<cardano::script_data_hash>(11),
            _optional_nonempty<tx_input_set>(m, 13, "collateral inputs"),
            _optional_nonempty<set_t<key_hash>>(m, 14, "required signers"),
            m.optional<uint8_t>(15),
            m.optional<tx_output>(16),
            m.optional<coin>(17),
            _optional_nonempty<tx_input_set>(m, 18, "reference inputs"),
            m.optional<voting_procedures_t>(19),
            _optional_nonempty<proposal_procedure_list>(m, 20, "proposal procedures"),
            m.optional<coin>(21),
            m.optional<positive_coin>(22)
        };
        if (res.network_id && *res.network_id > 1) [[unlikely]]
            throw schema_error("the network id must be 0 or 1 but got {}", *res.network_id);
        return res;
    }

    cbor::value tx_body::to_cbor() const
    {
        if (network_id && *network_id > 1) [[unlikely]]
            throw encode_error("the network id must be 0 or 1 but got {}", *network_id);
        return int_map_builder {}
            .add(0, inputs)
            .add(1, outputs)
            .add(2, fee)
            .add(3, ttl)
            .add(4, _check_nonempty(certs, "certificates"))
            .add(5, _check_nonempty(withdrawals, "withdrawals"))
            .add(7, aux_data_hash)
            .add(8, validity_start)
            .add(9, _check_nonempty(mint, "mint"))
            .add(11, script_data_hash)
            .add(13, _check_nonempty(collateral_inputs, "collateral inputs"))
            .add(14, _check_nonempty(required_signers, "required signers"))
            .add(15, network_id)
            .add(16, collateral_return)
            .add(17, total_collateral)
            .add(18, _check_nonempty(reference_inputs, "reference inputs"))
            .add(19, voting_procedures)
            .add(20, _check_nonempty(proposal_procedures, "proposal procedures"))
            .add(21, current_treasury)
            .add(22, donation)
            .build();
    }
}
