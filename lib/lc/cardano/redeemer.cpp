/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/redeemer.hpp>

namespace ledger_codec::cardano {
    using namespace cddl;

    redeemer_tag redeemer_tag_from_cbor(const cbor::value &v)
    {
        const auto typ = v.uint();
        if (typ > static_cast<uint64_t>(redeemer_tag::propose)) [[unlikely]]
            throw schema_error("unsupported redeemer tag: {}", typ);
        return static_cast<redeemer_tag>(typ);
    }

    redeemer_t redeemer_t::from_cbor(const cbor::value &v)
    {
        array_reader it { v, 4, "redeemer" };
        return { redeemer_tag_from_cbor(it.read()), it.read<uint64_t>(), it.read<plutus_data>(), it.read<ex_units>() };
    }

    cbor::value redeemer_t::to_cbor() const
    {
        return tuple_to_cbor(static_cast<uint64_t>(tag), index, data, budget);
    }

    bool redeemers_t::operator==(const redeemers_t &o) const
    {
        return form == o.form && static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
    }

    redeemers_t redeemers_t::from_cbor(const cbor::value &v)
    {
        redeemers_t res {};
        switch (const auto typ = v.type(); typ) {
            case cbor::major_type::array: {
                const auto &items = v.array();
                res.reserve(items.size());
                for (const auto &item: items)
                    res.emplace_back(redeemer_t::from_cbor(item));
                res.form = redeemers_form::array;
                break;
            }
            case cbor::major_type::map: {
                const auto &items = v.map();
                res.reserve(items.size());
                for (const auto &[k, val]: items) {
                    array_reader key_it { k, 2, "redeemer key" };
                    const auto tag = redeemer_tag_from_cbor(key_it.read());
                    const auto index = key_it.read<uint64_t>();
                    const auto dup = std::find_if(res.begin(), res.end(), [&](const auto &r) {
                        return r.tag == tag && r.index == index;
                    });
                    if (dup != res.end()) [[unlikely]]
                        throw schema_error("redeemers contain a duplicate key [{}, {}]", tag, index);
                    array_reader val_it { val, 2, "redeemer value" };
                    res.emplace_back(redeemer_t { tag, index, val_it.read<plutus_data>(), val_it.read<ex_units>() });
                }
                res.form = redeemers_form::map;
                break;
            }
            [[unlikely]] default:
                throw schema_error("unsupported redeemers CBOR type {}: {}", typ, v);
        }
        return res;
    }

    cbor::value redeemers_t::to_array_cbor() const
    {
        vector<cbor::value> items {};
        items.reserve(size());
        for (const auto &r: *this)
            items.emplace_back(r.to_cbor());
        return cbor::make_array(std::move(items));
    }

    cbor::value redeemers_t::to_cbor() const
    {
        if (form == redeemers_form::array)
            return to_array_cbor();
        vector<cbor::map_item> items {};
        items.reserve(size());
        for (const auto &r: *this)
            items.emplace_back(tuple_to_cbor(static_cast<uint64_t>(r.tag), r.index), tuple_to_cbor(r.data, r.budget));
        return cbor::make_map(std::move(items));
    }

    result<ex_units> total_ex_units(const redeemers_t &redeemers)
    {
        return make_result([&] {
            static constexpr auto max_units = std::numeric_limits<uint64_t>::max();
            ex_units total {};
            for (const auto &r: redeemers) {
                if (r.budget.mem > max_units - total.mem || r.budget.steps > max_units - total.steps) [[unlikely]]
                    throw schema_error("the total execution units of {} redeemers overflow 64 bits", redeemers.size());
                total.mem += r.budget.mem;
                total.steps += r.budget.steps;
            }
            return total;
        });
    }
}
