/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/governance.hpp>

namespace ledger_codec::cardano {
    using namespace cddl;

    voter_t voter_t::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "voter" };
        const auto typ = it.read_type();
        if (typ > static_cast<uint64_t>(type_t::pool_key)) [[unlikely]]
            throw schema_error("unsupported voter type: {}", typ);
        return { static_cast<type_t>(typ), it.read<key_hash>() };
    }

    cbor::value voter_t::to_cbor() const
    {
        return tuple_to_cbor(static_cast<uint64_t>(type), hash);
    }

    gov_action_id_t gov_action_id_t::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "gov_action_id" };
        return { it.read<tx_hash>(), it.read<uint16_t>() };
    }

    cbor::value gov_action_id_t::to_cbor() const
    {
        return tuple_to_cbor(tx_id, idx);
    }

    voting_procedure_t voting_procedure_t::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "voting_procedure" };
        const auto vote = it.read<uint8_t>();
        if (vote > static_cast<uint8_t>(vote_t::abstain)) [[unlikely]]
            throw schema_error("unsupported vote value: {}", vote);
        return { static_cast<vote_t>(vote), it.read<optional_anchor_t>() };
    }

    cbor::value voting_procedure_t::to_cbor() const
    {
        return tuple_to_cbor(static_cast<uint64_t>(vote), anchor);
    }

    voting_procedures_t voting_procedures_t::from_cbor(const cbor::value &v)
    {
        voting_procedures_t res { base_type::from_cbor(v) };
        if (res.empty()) [[unlikely]]
            throw schema_error("voting procedures must not be empty");
        for (const auto &[voter, votes]: res) {
            if (votes.empty()) [[unlikely]]
                throw schema_error("the votes of voter {} must not be empty", voter);
        }
        return res;
    }

    cbor::value voting_procedures_t::to_cbor() const
    {
        if (empty()) [[unlikely]]
            throw encode_error("voting procedures must not be empty");
        for (const auto &[voter, votes]: *this) {
            if (votes.empty()) [[unlikely]]
                throw encode_error("the votes of voter {} must not be empty", voter);
        }
        return base_type::to_cbor();
    }

    proposal_procedure_t proposal_procedure_t::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 4, "proposal_procedure" };
        return { it.read<coin>(), it.read<reward_account>(), it.read<cbor::value>(), it.read<anchor_t>() };
    }

    cbor::value proposal_procedure_t::to_cbor() const
    {
        return tuple_to_cbor(deposit, return_addr, action, anchor);
    }
}
