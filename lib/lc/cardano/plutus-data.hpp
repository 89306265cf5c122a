/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_PLUTUS_DATA_HPP
#define LEDGER_CODEC_CARDANO_PLUTUS_DATA_HPP

#include <optional>
#include <variant>
#include <lc/cardano/types.hpp>

namespace ledger_codec::cardano {
    struct plutus_data;

    // Equality ignores the length mode: it only affects the encoding.
    struct plutus_list: vector<plutus_data> {
        using base_type = vector<plutus_data>;
        using base_type::base_type;

        // Set when decoded. Unset lists are encoded as indefinite unless empty.
        std::optional<bool> indefinite {};

        bool operator==(const plutus_list &o) const;
    };

    using plutus_map_item = std::pair<plutus_data, plutus_data>;

    struct plutus_map: vector<plutus_map_item> {
        using base_type = vector<plutus_map_item>;
        using base_type::base_type;

        // Set when decoded. Unset maps are encoded as definite.
        std::optional<bool> indefinite {};

        bool operator==(const plutus_map &o) const;
    };

    struct plutus_constr {
        uint64_t alternative = 0;
        plutus_list fields {};

        bool operator==(const plutus_constr &o) const;
    };

    struct plutus_data {
        using value_type = std::variant<plutus_constr, plutus_map, plutus_list, cpp_int, uint8_vector>;

        value_type val;

        static plutus_data constr(uint64_t alternative, std::initializer_list<plutus_data> fields);
        static plutus_data list(std::initializer_list<plutus_data> items);
        static plutus_data map(std::initializer_list<plutus_map_item> items);
        static plutus_data bint(const cpp_int &i);
        static plutus_data bstr(buffer bytes);

        static plutus_data from_cbor(const cbor::value &v);
        // the bytes must contain exactly one data item
        static plutus_data from_bytes(buffer bytes);
        cbor::value to_cbor() const;
        // the encoding used for datum hashes and for embedding in other entities
        uint8_vector bytes() const;

        bool operator==(const plutus_data &o) const;
    };
}

#endif // !LEDGER_CODEC_CARDANO_PLUTUS_DATA_HPP
