/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/plutus-data.hpp>

namespace ledger_codec::cardano {
    bool plutus_list::operator==(const plutus_list &o) const
    {
        return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
    }

    bool plutus_map::operator==(const plutus_map &o) const
    {
        return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
    }

    bool plutus_constr::operator==(const plutus_constr &o) const
    {
        return alternative == o.alternative && fields == o.fields;
    }

    bool plutus_data::operator==(const plutus_data &o) const
    {
        return val == o.val;
    }

    plutus_data plutus_data::constr(const uint64_t alternative, std::initializer_list<plutus_data> fields)
    {
        return { plutus_constr { alternative, plutus_list(fields) } };
    }

    plutus_data plutus_data::list(std::initializer_list<plutus_data> items)
    {
        return { plutus_list(items) };
    }

    plutus_data plutus_data::map(std::initializer_list<plutus_map_item> items)
    {
        return { plutus_map(items) };
    }

    plutus_data plutus_data::bint(const cpp_int &i)
    {
        return { i };
    }

    plutus_data plutus_data::bstr(const buffer bytes)
    {
        return { uint8_vector { bytes } };
    }

    static plutus_list _list_from_cbor(const cbor::value &v)
    {
        const auto &items = v.array();
        plutus_list dl {};
        dl.reserve(items.size());
        for (const auto &item: items)
            dl.emplace_back(plutus_data::from_cbor(item));
        dl.indefinite = items.indefinite;
        return dl;
    }

    static plutus_data _constr_from_cbor(const cbor::tag &t)
    {
        if (t.id >= 121 && t.id <= 127)
            return { plutus_constr { t.id - 121, _list_from_cbor(t.inner()) } };
        if (t.id >= 1280 && t.id <= 1400)
            return { plutus_constr { t.id - 1280 + 7, _list_from_cbor(t.inner()) } };
        if (t.id == 102) {
            cddl::array_reader it { t.inner(), 2, "plutus_data constr" };
            const auto alt = it.read<uint64_t>();
            return { plutus_constr { alt, _list_from_cbor(it.read()) } };
        }
        throw schema_error("unsupported plutus_data tag: {}", t.id);
    }

    plutus_data plutus_data::from_cbor(const cbor::value &v)
    {
        switch (const auto typ = v.type(); typ) {
            case cbor::major_type::uint:
            case cbor::major_type::nint:
                return { v.bigint() };
            case cbor::major_type::bytes:
                return { uint8_vector { v.bytes() } };
            case cbor::major_type::array:
                return { _list_from_cbor(v) };
            case cbor::major_type::map: {
                const auto &items = v.map();
                plutus_map m {};
                m.reserve(items.size());
                for (const auto &[k, val]: items)
                    m.emplace_back(from_cbor(k), from_cbor(val));
                m.indefinite = items.indefinite;
                return { std::move(m) };
            }
            case cbor::major_type::tag: {
                const auto &t = v.tag();
                // bignums are folded into integers by the decoder but may come from a manually built value
                if (t.id == 2 || t.id == 3) {
                    if (const auto sz = t.inner().bytes().size(); sz > big_int_max_size) [[unlikely]]
                        throw schema_error("a plutus_data bignum of {} bytes exceeds the supported maximum of {} bytes", sz, big_int_max_size);
                    const auto num = big_int_from_bytes(t.inner().bytes());
                    return { t.id == 2 ? cpp_int { num } : cpp_int { -1 - num } };
                }
                return _constr_from_cbor(t);
            }
            [[unlikely]] default:
                throw schema_error("unsupported plutus_data CBOR type {}: {}", typ, v);
        }
    }

    plutus_data plutus_data::from_bytes(const buffer bytes)
    {
        return from_cbor(cbor::decode_value(bytes));
    }

    static cbor::value _to_cbor(const plutus_data &d);

    static cbor::value _to_cbor(const plutus_list &l)
    {
        vector<cbor::value> items {};
        items.reserve(l.size());
        for (const auto &item: l)
            items.emplace_back(_to_cbor(item));
        return cbor::make_array(std::move(items), l.indefinite.value_or(!l.empty()));
    }

    static cbor::value _to_cbor(const plutus_map &m)
    {
        vector<cbor::map_item> items {};
        items.reserve(m.size());
        for (const auto &[k, v]: m)
            items.emplace_back(_to_cbor(k), _to_cbor(v));
        return cbor::make_map(std::move(items), m.indefinite.value_or(!m.empty()));
    }

    static cbor::value _to_cbor(const plutus_constr &c)
    {
        if (c.alternative <= 6)
            return cbor::make_tag(121 + c.alternative, _to_cbor(c.fields));
        if (c.alternative <= 127)
            return cbor::make_tag(1280 + c.alternative - 7, _to_cbor(c.fields));
        return cbor::make_tag(102, cbor::make_array({ cbor::make_uint(c.alternative), _to_cbor(c.fields) }));
    }

    static cbor::value _to_cbor(const cpp_int &i)
    {
        return cbor::make_int(i);
    }

    static cbor::value _to_cbor(const uint8_vector &b)
    {
        return cbor::make_bytes(b);
    }

    static cbor::value _to_cbor(const plutus_data &d)
    {
        return std::visit([](const auto &v) {
            return _to_cbor(v);
        }, d.val);
    }

    cbor::value plutus_data::to_cbor() const
    {
        return _to_cbor(*this);
    }

    uint8_vector plutus_data::bytes() const
    {
        return cbor::encode(to_cbor(), cbor::preserve);
    }
}
