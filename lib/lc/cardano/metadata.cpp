/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/metadata.hpp>

namespace ledger_codec::cardano {
    using namespace cddl;

    bool metadatum::operator==(const metadatum &o) const
    {
        return val == o.val;
    }

    static const cpp_int &_metadatum_int_check(const cpp_int &i, const bool encode)
    {
        static const cpp_int max_int { std::numeric_limits<uint64_t>::max() };
        static const cpp_int min_int { -max_int - 1 };
        if (i < min_int || i > max_int) [[unlikely]] {
            if (encode)
                throw encode_error("a metadatum integer must fit into 64 bits plus sign but got {}", i);
            throw schema_error("a metadatum integer must fit into 64 bits plus sign but got {}", i);
        }
        return i;
    }

    metadatum metadatum::from_cbor(const cbor::value &v)
    {
        switch (const auto typ = v.type(); typ) {
            case cbor::major_type::uint:
            case cbor::major_type::nint:
                return { _metadatum_int_check(v.bigint(), false) };
            case cbor::major_type::bytes:
                return { metadatum_bytes::from_cbor(v) };
            case cbor::major_type::text:
                return { metadatum_text::from_cbor(v) };
            case cbor::major_type::array: {
                const auto &items = v.array();
                metadatum_list l {};
                l.reserve(items.size());
                for (const auto &item: items)
                    l.emplace_back(from_cbor(item));
                return { std::move(l) };
            }
            case cbor::major_type::map: {
                const auto &items = v.map();
                metadatum_map m {};
                m.reserve(items.size());
                for (const auto &[k, val]: items)
                    m.emplace_back(from_cbor(k), from_cbor(val));
                return { std::move(m) };
            }
            [[unlikely]] default:
                throw schema_error("unsupported metadatum CBOR type {}: {}", typ, v);
        }
    }

    cbor::value metadatum::to_cbor() const
    {
        return std::visit([](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, cpp_int>) {
                return cbor::make_int(_metadatum_int_check(v, true));
            } else if constexpr (std::is_same_v<T, metadatum_bytes> || std::is_same_v<T, metadatum_text>) {
                return v.to_cbor();
            } else if constexpr (std::is_same_v<T, metadatum_list>) {
                vector<cbor::value> items {};
                items.reserve(v.size());
                for (const auto &item: v)
                    items.emplace_back(item.to_cbor());
                return cbor::make_array(std::move(items));
            } else if constexpr (std::is_same_v<T, metadatum_map>) {
                vector<cbor::map_item> items {};
                items.reserve(v.size());
                for (const auto &[k, val]: v)
                    items.emplace_back(k.to_cbor(), val.to_cbor());
                return cbor::make_map(std::move(items));
            } else {
                static_assert(sizeof(T) == 0, "unsupported metadatum alternative");
                return cbor::value {};
            }
        }, val);
    }

    auxiliary_data auxiliary_data::from_cbor(const cbor::value &v)
    {
        switch (const auto typ = v.type(); typ) {
            case cbor::major_type::map:
                return { metadata::from_cbor(v), {}, {}, {}, {}, auxiliary_data_form::shelley };
            case cbor::major_type::array: {
                array_reader it { v, 2, "auxiliary_data" };
                auto meta = it.read<metadata>();
                return { std::move(meta), it.read<vector_t<native_script>>(), {}, {}, {}, auxiliary_data_form::shelley_ma };
            }
            case cbor::major_type::tag: {
                const auto &t = v.tag();
                if (t.id != tag_id) [[unlikely]]
                    throw schema_error("expected an auxiliary data tag {} but got {}", tag_id, t.id);
                const int_map_reader m { t.inner(), { 0, 1, 2, 3, 4 }, "auxiliary_data" };
                return {
                    m.optional<metadata>(0),
                    m.optional<vector_t<native_script>>(1),
                    m.optional<vector_t<uint8_vector>>(2),
                    m.optional<vector_t<uint8_vector>>(3),
                    m.optional<vector_t<uint8_vector>>(4),
                    auxiliary_data_form::alonzo
                };
            }
            [[unlikely]] default:
                throw schema_error("unsupported auxiliary_data CBOR type {}: {}", typ, v);
        }
    }

    cbor::value auxiliary_data::to_cbor() const
    {
        const bool has_plutus = plutus_v1_scripts || plutus_v2_scripts || plutus_v3_scripts;
        switch (form) {
            case auxiliary_data_form::shelley:
                if (native_scripts || has_plutus) [[unlikely]]
                    throw encode_error("the shelley auxiliary data form does not support scripts");
                return value_to_cbor(meta.value_or(metadata {}));
            case auxiliary_data_form::shelley_ma:
                if (has_plutus) [[unlikely]]
                    throw encode_error("the shelley-ma auxiliary data form does not support plutus scripts");
                return tuple_to_cbor(meta.value_or(metadata {}), native_scripts.value_or(vector_t<native_script> {}));
            case auxiliary_data_form::alonzo:
                return cbor::make_tag(tag_id, int_map_builder {}
                    .add(0, meta)
                    .add(1, native_scripts)
                    .add(2, plutus_v1_scripts)
                    .add(3, plutus_v2_scripts)
                    .add(4, plutus_v3_scripts)
                    .build());
            [[unlikely]] default:
                throw encode_error("unsupported auxiliary data form: {}", static_cast<int>(form));
        }
    }
}
