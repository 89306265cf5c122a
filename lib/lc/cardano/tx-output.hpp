/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_TX_OUTPUT_HPP
#define LEDGER_CODEC_CARDANO_TX_OUTPUT_HPP

#include <optional>
#include <variant>
#include <lc/cardano/plutus-data.hpp>
#include <lc/cardano/script.hpp>

namespace ledger_codec::cardano {
    // tag 24 marks a byte string that holds an encoded CBOR item
    static constexpr uint64_t embedded_cbor_tag = 24;

    // Either a datum hash or an inline datum.
    struct datum_option {
        using value_type = std::variant<datum_hash, plutus_data>;

        value_type val;

        static datum_option from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const datum_option &o) const =default;
    };

    struct script_ref {
        script_t script;

        static script_ref from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const script_ref &o) const =default;
    };

    enum class tx_output_form: uint8_t {
        legacy,
        post_alonzo
    };

    // The legacy array form can carry only a datum hash.
    struct tx_output {
        address addr {};
        value_t amount {};
        std::optional<datum_option> datum {};
        std::optional<script_ref> ref {};
        tx_output_form form = tx_output_form::post_alonzo;

        static tx_output from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const tx_output &o) const =default;
    };
}

#endif // !LEDGER_CODEC_CARDANO_TX_OUTPUT_HPP
