/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <lc/cardano/cost-models.hpp>
#include <lc/json.hpp>

namespace ledger_codec::cardano {
    using namespace cddl;

    cost_models cost_models::from_cbor(const cbor::value &v)
    {
        const int_map_reader m { v, { 0, 1, 2 }, "cost_models" };
        return {
            m.optional<cost_model>(0).value_or(cost_model {}),
            m.optional<cost_model>(1).value_or(cost_model {}),
            m.optional<cost_model>(2).value_or(cost_model {})
        };
    }

    static cost_model _model_from_json(const json::value &j, const language lang)
    {
        cost_model res {};
        const auto add = [&](const json::value &c) {
            if (const auto *i = c.if_int64(); i)
                res.emplace_back(*i);
            else if (const auto *u = c.if_uint64(); u && *u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                res.emplace_back(static_cast<int64_t>(*u));
            else
                throw schema_error("{} costs must be 64-bit integers but got {}", lang, json::serialize(c));
        };
        if (const auto *arr = j.if_array(); arr) {
            res.reserve(arr->size());
            for (const auto &c: *arr)
                add(c);
        } else if (const auto *obj = j.if_object(); obj) {
            // named parameters are ordered by their names
            vector<const json::key_value_pair *> params {};
            params.reserve(obj->size());
            for (const auto &kv: *obj)
                params.emplace_back(&kv);
            std::sort(params.begin(), params.end(), [](const auto *a, const auto *b) {
                return a->key() < b->key();
            });
            res.reserve(params.size());
            for (const auto *kv: params)
                add(kv->value());
        } else {
            throw schema_error("an unsupported JSON value representing a {} cost model: {}", lang, json::serialize(j));
        }
        return res;
    }

    cost_models cost_models::from_json(const json::value &j)
    {
        const auto *obj = j.if_object();
        if (!obj) [[unlikely]]
            throw schema_error("cost models must be a JSON object but got: {}", json::serialize(j));
        if (const auto it = obj->find("costModels"); it != obj->end()) {
            obj = it->value().if_object();
            if (!obj) [[unlikely]]
                throw schema_error("costModels must be a JSON object but got: {}", json::serialize(it->value()));
        }
        cost_models res {};
        for (const auto &kv: *obj) {
            const std::string_view name { kv.key().data(), kv.key().size() };
            if (name == "PlutusV1")
                res.v1 = _model_from_json(kv.value(), language::plutus_v1);
            else if (name == "PlutusV2")
                res.v2 = _model_from_json(kv.value(), language::plutus_v2);
            else if (name == "PlutusV3")
                res.v3 = _model_from_json(kv.value(), language::plutus_v3);
            else
                throw schema_error("unsupported cost model language: {}", name);
        }
        logger::debug("loaded cost models with {}/{}/{} PlutusV1/V2/V3 costs", res.v1.size(), res.v2.size(), res.v3.size());
        return res;
    }

    static std::optional<cost_model> _nonempty(const cost_model &m)
    {
        if (m.empty())
            return {};
        return m;
    }

    cbor::value cost_models::to_cbor() const
    {
        return int_map_builder {}
            .add(0, _nonempty(v1))
            .add(1, _nonempty(v2))
            .add(2, _nonempty(v3))
            .build();
    }

    const cost_model &cost_models::at(const language lang) const
    {
        switch (lang) {
            case language::plutus_v1: return v1;
            case language::plutus_v2: return v2;
            case language::plutus_v3: return v3;
            [[unlikely]] default: throw error("unsupported language: {}", static_cast<int>(lang));
        }
    }

    uint8_vector cost_models::language_views() const
    {
        vector<cbor::map_item> views {};
        if (!v1.empty()) {
            // the language id and the costs are double encoded and the costs use an indefinite array
            views.emplace_back(
                cbor::make_bytes(cbor::encode(cbor::make_uint(static_cast<uint64_t>(language::plutus_v1)))),
                cbor::make_bytes(cbor::encode(v1.to_cbor(), cbor::quirk)));
        }
        if (!v2.empty())
            views.emplace_back(cbor::make_uint(static_cast<uint64_t>(language::plutus_v2)), v2.to_cbor());
        if (!v3.empty())
            views.emplace_back(cbor::make_uint(static_cast<uint64_t>(language::plutus_v3)), v3.to_cbor());
        return cbor::encode(cbor::make_map(std::move(views)), cbor::canonical);
    }
}
