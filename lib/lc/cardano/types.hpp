/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_TYPES_HPP
#define LEDGER_CODEC_CARDANO_TYPES_HPP

#include <variant>
#include <lc/blake2b.hpp>
#include <lc/cddl/transform.hpp>

namespace ledger_codec::cardano {
    using key_hash = blake2b_224_hash;
    using script_hash = blake2b_224_hash;
    using pool_hash = blake2b_224_hash;
    using tx_hash = blake2b_256_hash;
    using datum_hash = blake2b_256_hash;
    using auxiliary_data_hash = blake2b_256_hash;
    using script_data_hash = blake2b_256_hash;
    using vrf_key_hash = blake2b_256_hash;
    using coin = uint64_t;
    using epoch = uint64_t;
    using slot = uint64_t;
    using cddl::positive_coin;
    using address = uint8_vector;
    using reward_account = uint8_vector;
    using url = cddl::bounded_text<128>;
    using asset_name = cddl::bounded_bytes<32>;

    struct tx_input {
        tx_hash hash {};
        uint16_t idx = 0;

        static tx_input from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        auto operator<=>(const tx_input &) const =default;
    };

    struct credential_t {
        key_hash hash {};
        bool script { false };

        static credential_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        auto operator<=>(const credential_t &) const =default;
    };

    struct drep_t {
        struct abstain_t {
            bool operator==(const abstain_t &) const
            {
                return true;
            }
        };
        struct no_confidence_t {
            bool operator==(const no_confidence_t &) const
            {
                return true;
            }
        };
        using value_type = std::variant<credential_t, abstain_t, no_confidence_t>;

        value_type val { abstain_t {} };

        static drep_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const drep_t &) const =default;
    };

    struct anchor_t {
        url uri {};
        datum_hash hash {};

        static anchor_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const anchor_t &) const =default;
    };
    using optional_anchor_t = cddl::nil_optional_t<anchor_t>;

    struct ex_units {
        uint64_t mem = 0;
        uint64_t steps = 0;

        static ex_units from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const ex_units &) const =default;
    };

    // A minted or burnt amount; zero is not allowed.
    struct nonzero_int64 {
        int64_t amount = 0;

        static nonzero_int64 from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        auto operator<=>(const nonzero_int64 &) const =default;
    };

    // policy id => asset name => amount; the asset map of every policy must be non-empty
    template<typename A>
    struct multiasset_t: cddl::map_t<script_hash, cddl::map_t<asset_name, A>> {
        using policy_assets = cddl::map_t<asset_name, A>;
        using base_type = cddl::map_t<script_hash, policy_assets>;
        using base_type::base_type;

        multiasset_t() =default;

        explicit multiasset_t(base_type &&items): base_type { std::move(items) }
        {
        }

        static multiasset_t from_cbor(const cbor::value &v)
        {
            multiasset_t res { base_type::from_cbor(v) };
            for (const auto &[policy_id, assets]: res) {
                if (assets.empty()) [[unlikely]]
                    throw schema_error("the asset map of policy {} must not be empty", policy_id);
            }
            return res;
        }

        cbor::value to_cbor() const
        {
            for (const auto &[policy_id, assets]: *this) {
                if (assets.empty()) [[unlikely]]
                    throw encode_error("the asset map of policy {} must not be empty", policy_id);
            }
            return base_type::to_cbor();
        }
    };

    using multiasset = multiasset_t<positive_coin>;
    using mint_t = multiasset_t<nonzero_int64>;

    // Encoded as a bare coin when there are no assets.
    struct value_t {
        coin coins = 0;
        multiasset assets {};

        static value_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const value_t &) const =default;
    };
}

#endif // !LEDGER_CODEC_CARDANO_TYPES_HPP
