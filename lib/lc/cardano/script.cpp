/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/script.hpp>

namespace ledger_codec::cardano {
    using namespace cddl;

    bool native_script::pubkey_t::operator==(const pubkey_t &o) const
    {
        return hash == o.hash;
    }

    bool native_script::all_t::operator==(const all_t &o) const
    {
        return scripts == o.scripts;
    }

    bool native_script::any_t::operator==(const any_t &o) const
    {
        return scripts == o.scripts;
    }

    bool native_script::n_of_k_t::operator==(const n_of_k_t &o) const
    {
        return required == o.required && scripts == o.scripts;
    }

    bool native_script::invalid_before_t::operator==(const invalid_before_t &o) const
    {
        return start == o.start;
    }

    bool native_script::invalid_hereafter_t::operator==(const invalid_hereafter_t &o) const
    {
        return end == o.end;
    }

    bool native_script::operator==(const native_script &o) const
    {
        return val == o.val;
    }

    static native_script_list _scripts_from_cbor(const cbor::value &v)
    {
        const auto &items = v.array();
        native_script_list res {};
        res.reserve(items.size());
        for (const auto &item: items)
            res.emplace_back(native_script::from_cbor(item));
        return res;
    }

    static cbor::value _scripts_to_cbor(const native_script_list &scripts)
    {
        vector<cbor::value> items {};
        items.reserve(scripts.size());
        for (const auto &s: scripts)
            items.emplace_back(s.to_cbor());
        return cbor::make_array(std::move(items));
    }

    native_script native_script::from_cbor(const cbor::value &v)
    {
        switch (const auto typ = v.at(0).uint(); typ) {
            case 0: {
                array_reader it { v, 2, "native_script pubkey" };
                it.read_type();
                return { pubkey_t { it.read<key_hash>() } };
            }
            case 1: {
                array_reader it { v, 2, "native_script all" };
                it.read_type();
                return { all_t { _scripts_from_cbor(it.read()) } };
            }
            case 2: {
                array_reader it { v, 2, "native_script any" };
                it.read_type();
                return { any_t { _scripts_from_cbor(it.read()) } };
            }
            case 3: {
                array_reader it { v, 3, "native_script n_of_k" };
                it.read_type();
                const auto required = it.read<uint64_t>();
                return { n_of_k_t { required, _scripts_from_cbor(it.read()) } };
            }
            case 4: {
                array_reader it { v, 2, "native_script invalid_before" };
                it.read_type();
                return { invalid_before_t { it.read<slot>() } };
            }
            case 5: {
                array_reader it { v, 2, "native_script invalid_hereafter" };
                it.read_type();
                return { invalid_hereafter_t { it.read<slot>() } };
            }
            [[unlikely]] default:
                throw schema_error("unsupported native script type {}", typ);
        }
    }

    cbor::value native_script::to_cbor() const
    {
        return std::visit([](const auto &s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, pubkey_t>) {
                return tuple_to_cbor(uint64_t { 0 }, s.hash);
            } else if constexpr (std::is_same_v<T, all_t>) {
                return tuple_to_cbor(uint64_t { 1 }, _scripts_to_cbor(s.scripts));
            } else if constexpr (std::is_same_v<T, any_t>) {
                return tuple_to_cbor(uint64_t { 2 }, _scripts_to_cbor(s.scripts));
            } else if constexpr (std::is_same_v<T, n_of_k_t>) {
                return tuple_to_cbor(uint64_t { 3 }, s.required, _scripts_to_cbor(s.scripts));
            } else if constexpr (std::is_same_v<T, invalid_before_t>) {
                return tuple_to_cbor(uint64_t { 4 }, s.start);
            } else if constexpr (std::is_same_v<T, invalid_hereafter_t>) {
                return tuple_to_cbor(uint64_t { 5 }, s.end);
            } else {
                static_assert(sizeof(T) == 0, "unsupported native script alternative");
                return cbor::value {};
            }
        }, val);
    }

    script_t script_t::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 2, "script" };
        switch (const auto typ = it.read_type(); typ) {
            case 0:
                return { native_script::from_cbor(it.read()) };
            case 1:
            case 2:
            case 3:
                return { plutus_script { static_cast<script_type>(typ), uint8_vector { it.read().bytes() } } };
            [[unlikely]] default:
                throw schema_error("unsupported script type {}", typ);
        }
    }

    cbor::value script_t::to_cbor() const
    {
        return std::visit([](const auto &s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, native_script>) {
                return tuple_to_cbor(uint64_t { 0 }, s);
            } else {
                if (s.typ == script_type::native) [[unlikely]]
                    throw encode_error("a plutus script must have a plutus language type");
                return tuple_to_cbor(static_cast<uint64_t>(s.typ), s.bytes);
            }
        }, val);
    }

    script_type script_t::type() const
    {
        if (const auto *ps = std::get_if<plutus_script>(&val); ps)
            return ps->typ;
        return script_type::native;
    }
}
