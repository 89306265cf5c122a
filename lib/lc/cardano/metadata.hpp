/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_METADATA_HPP
#define LEDGER_CODEC_CARDANO_METADATA_HPP

#include <optional>
#include <variant>
#include <lc/cardano/script.hpp>

namespace ledger_codec::cardano {
    struct metadatum;
    using metadatum_list = vector<metadatum>;
    using metadatum_map = vector<std::pair<metadatum, metadatum>>;
    using metadatum_bytes = cddl::bounded_bytes<64>;
    using metadatum_text = cddl::bounded_text<64>;

    // Integers must fit into [-2^64, 2^64 - 1].
    struct metadatum {
        using value_type = std::variant<cpp_int, metadatum_bytes, metadatum_text, metadatum_list, metadatum_map>;

        value_type val;

        static metadatum from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const metadatum &o) const;
    };

    using metadata = cddl::map_t<uint64_t, metadatum>;

    enum class auxiliary_data_form: uint8_t {
        shelley,
        shelley_ma,
        alonzo
    };

    struct auxiliary_data {
        static constexpr uint64_t tag_id = 259;

        std::optional<metadata> meta {};
        std::optional<cddl::vector_t<native_script>> native_scripts {};
        std::optional<cddl::vector_t<uint8_vector>> plutus_v1_scripts {};
        std::optional<cddl::vector_t<uint8_vector>> plutus_v2_scripts {};
        std::optional<cddl::vector_t<uint8_vector>> plutus_v3_scripts {};
        auxiliary_data_form form = auxiliary_data_form::alonzo;

        static auxiliary_data from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const auxiliary_data &o) const =default;
    };
}

#endif // !LEDGER_CODEC_CARDANO_METADATA_HPP
