/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/cert.hpp>

namespace ledger_codec::cardano {
    using namespace cddl;

    rational_u64 rational_u64::from_cbor(const cbor::value &v)
    {
        const auto &t = v.tag();
        if (t.id != tag_id) [[unlikely]]
            throw schema_error("expected a rational tag {} but got {}", tag_id, t.id);
        array_reader it { t.inner(), 2, "rational" };
        rational_u64 res { it.read<uint64_t>(), it.read<uint64_t>() };
        if (res.denominator == 0 || res.numerator > res.denominator) [[unlikely]]
            throw schema_error("a unit interval must be within [0, 1] with a non-zero denominator but got {}/{}", res.numerator, res.denominator);
        return res;
    }

    cbor::value rational_u64::to_cbor() const
    {
        if (denominator == 0 || numerator > denominator) [[unlikely]]
            throw encode_error("a unit interval must be within [0, 1] with a non-zero denominator but got {}/{}", numerator, denominator);
        return cbor::make_tag(tag_id, tuple_to_cbor(numerator, denominator));
    }

    relay_addr relay_addr::from_cbor(array_reader &it)
    {
        return { it.read<decltype(port)>(), it.read<decltype(ipv4)>(), it.read<decltype(ipv6)>() };
    }

    cbor::value relay_addr::to_cbor() const
    {
        return tuple_to_cbor(uint64_t { 0 }, port, ipv4, ipv6);
    }

    relay_host relay_host::from_cbor(array_reader &it)
    {
        return { it.read<decltype(port)>(), it.read<dns_name>() };
    }

    cbor::value relay_host::to_cbor() const
    {
        return tuple_to_cbor(uint64_t { 1 }, port, host);
    }

    relay_dns relay_dns::from_cbor(array_reader &it)
    {
        return { it.read<dns_name>() };
    }

    cbor::value relay_dns::to_cbor() const
    {
        return tuple_to_cbor(uint64_t { 2 }, name);
    }

    relay_info relay_info::from_cbor(const cbor::value &v)
    {
        switch (const auto typ = v.at(0).uint(); typ) {
            case 0: {
                array_reader it { v, 4, "single_host_addr" };
                it.read_type();
                return { relay_addr::from_cbor(it) };
            }
            case 1: {
                array_reader it { v, 3, "single_host_name" };
                it.read_type();
                return { relay_host::from_cbor(it) };
            }
            case 2: {
                array_reader it { v, 2, "multi_host_name" };
                it.read_type();
                return { relay_dns::from_cbor(it) };
            }
            [[unlikely]] default:
                throw schema_error("unsupported relay type {}", typ);
        }
    }

    cbor::value relay_info::to_cbor() const
    {
        return std::visit([](const auto &r) {
            return r.to_cbor();
        }, val);
    }

    pool_metadata pool_metadata::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "pool_metadata" };
        return { it.read<url>(), it.read<blake2b_256_hash>() };
    }

    cbor::value pool_metadata::to_cbor() const
    {
        return tuple_to_cbor(uri, hash);
    }

    pool_params pool_params::from_cbor(array_reader &it)
    {
        return {
            it.read<decltype(vrf_vkey)>(),
            it.read<coin>(),
            it.read<coin>(),
            it.read<rational_u64>(),
            it.read<reward_account>(),
            it.read<decltype(owners)>(),
            it.read<relay_list>(),
            it.read<decltype(metadata)>()
        };
    }

    void pool_params::to_cbor(vector<cbor::value> &items) const
    {
        items.emplace_back(value_to_cbor(vrf_vkey));
        items.emplace_back(value_to_cbor(pledge));
        items.emplace_back(value_to_cbor(cost));
        items.emplace_back(value_to_cbor(margin));
        items.emplace_back(value_to_cbor(reward_id));
        items.emplace_back(value_to_cbor(owners));
        items.emplace_back(value_to_cbor(relays));
        items.emplace_back(value_to_cbor(metadata));
    }

    template<typename T>
    static array_reader _cert_reader(const cbor::value &v)
    {
        array_reader it { v, T::num_fields + 1, "certificate" };
        it.read_type();
        return it;
    }

    cert_t cert_t::from_cbor(const cbor::value &v)
    {
        switch (const auto typ = v.at(0).uint(); typ) {
            case stake_reg_cert::type_id: {
                auto it = _cert_reader<stake_reg_cert>(v);
                return { stake_reg_cert { it.read<credential_t>() } };
            }
            case stake_dereg_cert::type_id: {
                auto it = _cert_reader<stake_dereg_cert>(v);
                return { stake_dereg_cert { it.read<credential_t>() } };
            }
            case stake_deleg_cert::type_id: {
                auto it = _cert_reader<stake_deleg_cert>(v);
                return { stake_deleg_cert { it.read<credential_t>(), it.read<pool_hash>() } };
            }
            case pool_reg_cert::type_id: {
                auto it = _cert_reader<pool_reg_cert>(v);
                return { pool_reg_cert { it.read<pool_hash>(), pool_params::from_cbor(it) } };
            }
            case pool_retire_cert::type_id: {
                auto it = _cert_reader<pool_retire_cert>(v);
                return { pool_retire_cert { it.read<pool_hash>(), it.read<cardano::epoch>() } };
            }
            case 5:
            case 6:
                throw schema_error("the genesis-only certificate type {} is not supported", typ);
            case reg_cert::type_id: {
                auto it = _cert_reader<reg_cert>(v);
                return { reg_cert { it.read<credential_t>(), it.read<coin>() } };
            }
            case unreg_cert::type_id: {
                auto it = _cert_reader<unreg_cert>(v);
                return { unreg_cert { it.read<credential_t>(), it.read<coin>() } };
            }
            case vote_deleg_cert::type_id: {
                auto it = _cert_reader<vote_deleg_cert>(v);
                return { vote_deleg_cert { it.read<credential_t>(), it.read<drep_t>() } };
            }
            case stake_vote_deleg_cert::type_id: {
                auto it = _cert_reader<stake_vote_deleg_cert>(v);
                return { stake_vote_deleg_cert { it.read<credential_t>(), it.read<pool_hash>(), it.read<drep_t>() } };
            }
            case stake_reg_deleg_cert::type_id: {
                auto it = _cert_reader<stake_reg_deleg_cert>(v);
                return { stake_reg_deleg_cert { it.read<credential_t>(), it.read<pool_hash>(), it.read<coin>() } };
            }
            case vote_reg_deleg_cert::type_id: {
                auto it = _cert_reader<vote_reg_deleg_cert>(v);
                return { vote_reg_deleg_cert { it.read<credential_t>(), it.read<drep_t>(), it.read<coin>() } };
            }
            case stake_vote_reg_deleg_cert::type_id: {
                auto it = _cert_reader<stake_vote_reg_deleg_cert>(v);
                return { stake_vote_reg_deleg_cert { it.read<credential_t>(), it.read<pool_hash>(), it.read<drep_t>(), it.read<coin>() } };
            }
            case auth_committee_hot_cert::type_id: {
                auto it = _cert_reader<auth_committee_hot_cert>(v);
                return { auth_committee_hot_cert { it.read<credential_t>(), it.read<credential_t>() } };
            }
            case resign_committee_cold_cert::type_id: {
                auto it = _cert_reader<resign_committee_cold_cert>(v);
                return { resign_committee_cold_cert { it.read<credential_t>(), it.read<optional_anchor_t>() } };
            }
            case reg_drep_cert::type_id: {
                auto it = _cert_reader<reg_drep_cert>(v);
                return { reg_drep_cert { it.read<credential_t>(), it.read<coin>(), it.read<optional_anchor_t>() } };
            }
            case unreg_drep_cert::type_id: {
                auto it = _cert_reader<unreg_drep_cert>(v);
                return { unreg_drep_cert { it.read<credential_t>(), it.read<coin>() } };
            }
            case update_drep_cert::type_id: {
                auto it = _cert_reader<update_drep_cert>(v);
                return { update_drep_cert { it.read<credential_t>(), it.read<optional_anchor_t>() } };
            }
            [[unlikely]] default:
                throw schema_error("unsupported certificate type: {}", typ);
        }
    }

    cbor::value cert_t::to_cbor() const
    {
        return std::visit([](const auto &c) {
            using T = std::decay_t<decltype(c)>;
            const uint64_t typ = T::type_id;
            if constexpr (std::is_same_v<T, stake_reg_cert> || std::is_same_v<T, stake_dereg_cert>) {
                return tuple_to_cbor(typ, c.stake_id);
            } else if constexpr (std::is_same_v<T, stake_deleg_cert>) {
                return tuple_to_cbor(typ, c.stake_id, c.pool_id);
            } else if constexpr (std::is_same_v<T, pool_reg_cert>) {
                vector<cbor::value> items {};
                items.reserve(T::num_fields + 1);
                items.emplace_back(cbor::make_uint(typ));
                items.emplace_back(value_to_cbor(c.pool_id));
                c.params.to_cbor(items);
                return cbor::make_array(std::move(items));
            } else if constexpr (std::is_same_v<T, pool_retire_cert>) {
                return tuple_to_cbor(typ, c.pool_id, c.epoch);
            } else if constexpr (std::is_same_v<T, reg_cert> || std::is_same_v<T, unreg_cert>) {
                return tuple_to_cbor(typ, c.stake_id, c.deposit);
            } else if constexpr (std::is_same_v<T, vote_deleg_cert>) {
                return tuple_to_cbor(typ, c.stake_id, c.drep);
            } else if constexpr (std::is_same_v<T, stake_vote_deleg_cert>) {
                return tuple_to_cbor(typ, c.stake_id, c.pool_id, c.drep);
            } else if constexpr (std::is_same_v<T, stake_reg_deleg_cert>) {
                return tuple_to_cbor(typ, c.stake_id, c.pool_id, c.deposit);
            } else if constexpr (std::is_same_v<T, vote_reg_deleg_cert>) {
                return tuple_to_cbor(typ, c.stake_id, c.drep, c.deposit);
            } else if constexpr (std::is_same_v<T, stake_vote_reg_deleg_cert>) {
                return tuple_to_cbor(typ, c.stake_id, c.pool_id, c.drep, c.deposit);
            } else if constexpr (std::is_same_v<T, auth_committee_hot_cert>) {
                return tuple_to_cbor(typ, c.cold_id, c.hot_id);
            } else if constexpr (std::is_same_v<T, resign_committee_cold_cert>) {
                return tuple_to_cbor(typ, c.cold_id, c.anchor);
            } else if constexpr (std::is_same_v<T, reg_drep_cert>) {
                return tuple_to_cbor(typ, c.drep_id, c.deposit, c.anchor);
            } else if constexpr (std::is_same_v<T, unreg_drep_cert>) {
                return tuple_to_cbor(typ, c.drep_id, c.deposit);
            } else if constexpr (std::is_same_v<T, update_drep_cert>) {
                return tuple_to_cbor(typ, c.drep_id, c.anchor);
            } else {
                static_assert(sizeof(T) == 0, "unsupported certificate type");
                return cbor::value {};
            }
        }, val);
    }

    uint64_t cert_t::type_id() const
    {
        return std::visit([](const auto &c) {
            return std::decay_t<decltype(c)>::type_id;
        }, val);
    }
}
