/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_GOVERNANCE_HPP
#define LEDGER_CODEC_CARDANO_GOVERNANCE_HPP

#include <lc/cardano/types.hpp>

namespace ledger_codec::cardano {
    struct voter_t {
        enum class type_t: uint8_t {
            const_comm_key = 0,
            const_comm_script = 1,
            drep_key = 2,
            drep_script = 3,
            pool_key = 4
        };

        type_t type {};
        key_hash hash {};

        static voter_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        auto operator<=>(const voter_t &) const =default;
    };

    struct gov_action_id_t {
        tx_hash tx_id {};
        uint16_t idx = 0;

        static gov_action_id_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        auto operator<=>(const gov_action_id_t &) const =default;
    };

    enum class vote_t: uint8_t {
        no = 0,
        yes = 1,
        abstain = 2
    };

    struct voting_procedure_t {
        vote_t vote {};
        optional_anchor_t anchor {};

        static voting_procedure_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const voting_procedure_t &) const =default;
    };

    using voter_votes_t = cddl::map_t<gov_action_id_t, voting_procedure_t>;

    // voter => gov_action_id => voting_procedure; neither level may be empty
    struct voting_procedures_t: cddl::map_t<voter_t, voter_votes_t> {
        using base_type = cddl::map_t<voter_t, voter_votes_t>;
        using base_type::base_type;

        voting_procedures_t() =default;

        explicit voting_procedures_t(base_type &&items): base_type { std::move(items) }
        {
        }

        static voting_procedures_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;
    };

    // The governance action is kept as a raw CBOR value.
    struct proposal_procedure_t {
        coin deposit = 0;
        reward_account return_addr {};
        cbor::value action {};
        anchor_t anchor {};

        static proposal_procedure_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const proposal_procedure_t &) const =default;
    };
    using proposal_procedure_list = cddl::oset_t<proposal_procedure_t>;
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::cardano::vote_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cardano::vote_t;
            switch (v) {
                case vote_t::no: return fmt::format_to(ctx.out(), "no");
                case vote_t::yes: return fmt::format_to(ctx.out(), "yes");
                case vote_t::abstain: return fmt::format_to(ctx.out(), "abstain");
                default: return fmt::format_to(ctx.out(), "vote: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !LEDGER_CODEC_CARDANO_GOVERNANCE_HPP
