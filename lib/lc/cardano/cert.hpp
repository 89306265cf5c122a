/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_CERT_HPP
#define LEDGER_CODEC_CARDANO_CERT_HPP

#include <variant>
#include <lc/cardano/types.hpp>

namespace ledger_codec::cardano {
    using cddl::array_reader;
    using cddl::nil_optional_t;
    using ipv4_addr = byte_array<4>;
    using ipv6_addr = byte_array<16>;
    using dns_name = cddl::bounded_text<128>;

    // #6.30([numerator, denominator]) within [0, 1]
    struct rational_u64 {
        static constexpr uint64_t tag_id = 30;

        uint64_t numerator = 0;
        uint64_t denominator = 1;

        static rational_u64 from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const rational_u64 &o) const =default;
    };

    struct relay_addr {
        nil_optional_t<uint16_t> port {};
        nil_optional_t<ipv4_addr> ipv4 {};
        nil_optional_t<ipv6_addr> ipv6 {};

        static relay_addr from_cbor(array_reader &);
        cbor::value to_cbor() const;

        bool operator==(const relay_addr &o) const =default;
    };

    struct relay_host {
        nil_optional_t<uint16_t> port {};
        dns_name host {};

        static relay_host from_cbor(array_reader &);
        cbor::value to_cbor() const;

        bool operator==(const relay_host &o) const =default;
    };

    struct relay_dns {
        dns_name name {};

        static relay_dns from_cbor(array_reader &);
        cbor::value to_cbor() const;

        bool operator==(const relay_dns &o) const =default;
    };

    struct relay_info {
        using value_type = std::variant<relay_addr, relay_host, relay_dns>;
        value_type val;

        static relay_info from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const relay_info &o) const =default;
    };
    using relay_list = cddl::vector_t<relay_info>;

    struct pool_metadata {
        url uri {};
        blake2b_256_hash hash {};

        static pool_metadata from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const pool_metadata &o) const =default;
    };

    struct pool_params {
        vrf_key_hash vrf_vkey {};
        coin pledge = 0;
        coin cost = 0;
        rational_u64 margin {};
        reward_account reward_id {};
        cddl::set_t<key_hash> owners {};
        relay_list relays {};
        nil_optional_t<pool_metadata> metadata {};

        static pool_params from_cbor(array_reader &);
        void to_cbor(vector<cbor::value> &items) const;

        bool operator==(const pool_params &o) const =default;
    };

    // The certificate structs read and write the fields that follow the type id.
    struct stake_reg_cert {
        static constexpr uint64_t type_id = 0;
        static constexpr size_t num_fields = 1;

        credential_t stake_id {};

        bool operator==(const stake_reg_cert &o) const =default;
    };

    struct stake_dereg_cert {
        static constexpr uint64_t type_id = 1;
        static constexpr size_t num_fields = 1;

        credential_t stake_id {};

        bool operator==(const stake_dereg_cert &o) const =default;
    };

    struct stake_deleg_cert {
        static constexpr uint64_t type_id = 2;
        static constexpr size_t num_fields = 2;

        credential_t stake_id {};
        pool_hash pool_id {};

        bool operator==(const stake_deleg_cert &o) const =default;
    };

    struct pool_reg_cert {
        static constexpr uint64_t type_id = 3;
        static constexpr size_t num_fields = 9;

        pool_hash pool_id {};
        pool_params params {};

        bool operator==(const pool_reg_cert &o) const =default;
    };

    struct pool_retire_cert {
        static constexpr uint64_t type_id = 4;
        static constexpr size_t num_fields = 2;

        pool_hash pool_id {};
        cardano::epoch epoch {};

        bool operator==(const pool_retire_cert &o) const =default;
    };

    struct reg_cert {
        static constexpr uint64_t type_id = 7;
        static constexpr size_t num_fields = 2;

        credential_t stake_id {};
        coin deposit = 0;

        bool operator==(const reg_cert &o) const =default;
    };

    struct unreg_cert {
        static constexpr uint64_t type_id = 8;
        static constexpr size_t num_fields = 2;

        credential_t stake_id {};
        coin deposit = 0;

        bool operator==(const unreg_cert &o) const =default;
    };

    struct vote_deleg_cert {
        static constexpr uint64_t type_id = 9;
        static constexpr size_t num_fields = 2;

        credential_t stake_id {};
        drep_t drep {};

        bool operator==(const vote_deleg_cert &o) const =default;
    };

    struct stake_vote_deleg_cert {
        static constexpr uint64_t type_id = 10;
        static constexpr size_t num_fields = 3;

        credential_t stake_id {};
        pool_hash pool_id {};
        drep_t drep {};

        bool operator==(const stake_vote_deleg_cert &o) const =default;
    };

    struct stake_reg_deleg_cert {
        static constexpr uint64_t type_id = 11;
        static constexpr size_t num_fields = 3;

        credential_t stake_id {};
        pool_hash pool_id {};
        coin deposit = 0;

        bool operator==(const stake_reg_deleg_cert &o) const =default;
    };

    struct vote_reg_deleg_cert {
        static constexpr uint64_t type_id = 12;
        static constexpr size_t num_fields = 3;

        credential_t stake_id {};
        drep_t drep {};
        coin deposit = 0;

        bool operator==(const vote_reg_deleg_cert &o) const =default;
    };

    struct stake_vote_reg_deleg_cert {
        static constexpr uint64_t type_id = 13;
        static constexpr size_t num_fields = 4;

        credential_t stake_id {};
        pool_hash pool_id {};
        drep_t drep {};
        coin deposit = 0;

        bool operator==(const stake_vote_reg_deleg_cert &o) const =default;
    };

    struct auth_committee_hot_cert {
        static constexpr uint64_t type_id = 14;
        static constexpr size_t num_fields = 2;

        credential_t cold_id {};
        credential_t hot_id {};

        bool operator==(const auth_committee_hot_cert &o) const =default;
    };

    struct resign_committee_cold_cert {
        static constexpr uint64_t type_id = 15;
        static constexpr size_t num_fields = 2;

        credential_t cold_id {};
        optional_anchor_t anchor {};

        bool operator==(const resign_committee_cold_cert &o) const =default;
    };

    struct reg_drep_cert {
        static constexpr uint64_t type_id = 16;
        static constexpr size_t num_fields = 3;

        credential_t drep_id {};
        coin deposit = 0;
        optional_anchor_t anchor {};

        bool operator==(const reg_drep_cert &o) const =default;
    };

    struct unreg_drep_cert {
        static constexpr uint64_t type_id = 17;
        static constexpr size_t num_fields = 2;

        credential_t drep_id {};
        coin deposit = 0;

        bool operator==(const unreg_drep_cert &o) const =default;
    };

    struct update_drep_cert {
        static constexpr uint64_t type_id = 18;
        static constexpr size_t num_fields = 2;

        credential_t drep_id {};
        optional_anchor_t anchor {};

        bool operator==(const update_drep_cert &o) const =default;
    };

    using cert_value_t = std::variant<
        stake_reg_cert, stake_dereg_cert, stake_deleg_cert, pool_reg_cert, pool_retire_cert,
        reg_cert, unreg_cert, vote_deleg_cert, stake_vote_deleg_cert, stake_reg_deleg_cert,
        vote_reg_deleg_cert, stake_vote_reg_deleg_cert, auth_committee_hot_cert, resign_committee_cold_cert,
        reg_drep_cert, unreg_drep_cert, update_drep_cert>;

    // The genesis key delegation (5) and the instantaneous rewards (6) certificates are not supported.
    struct cert_t {
        cert_value_t val;

        static cert_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        uint64_t type_id() const;

        bool operator==(const cert_t &o) const =default;
    };
    using cert_list = cddl::oset_t<cert_t>;
}

#endif // !LEDGER_CODEC_CARDANO_CERT_HPP
