/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_SCRIPT_HPP
#define LEDGER_CODEC_CARDANO_SCRIPT_HPP

#include <variant>
#include <lc/cardano/types.hpp>

namespace ledger_codec::cardano {
    struct native_script;
    using native_script_list = vector<native_script>;

    struct native_script {
        struct pubkey_t {
            key_hash hash {};

            bool operator==(const pubkey_t &o) const;
        };
        struct all_t {
            native_script_list scripts {};

            bool operator==(const all_t &o) const;
        };
        struct any_t {
            native_script_list scripts {};

            bool operator==(const any_t &o) const;
        };
        struct n_of_k_t {
            uint64_t required = 0;
            native_script_list scripts {};

            bool operator==(const n_of_k_t &o) const;
        };
        struct invalid_before_t {
            slot start = 0;

            bool operator==(const invalid_before_t &o) const;
        };
        struct invalid_hereafter_t {
            slot end = 0;

            bool operator==(const invalid_hereafter_t &o) const;
        };
        using value_type = std::variant<pubkey_t, all_t, any_t, n_of_k_t, invalid_before_t, invalid_hereafter_t>;

        value_type val;

        static native_script from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const native_script &o) const;
    };

    enum class script_type: uint8_t {
        native = 0,
        plutus_v1 = 1,
        plutus_v2 = 2,
        plutus_v3 = 3
    };

    struct plutus_script {
        script_type typ = script_type::plutus_v1;
        uint8_vector bytes {};

        bool operator==(const plutus_script &o) const =default;
    };

    struct script_t {
        using value_type = std::variant<native_script, plutus_script>;

        value_type val;

        static script_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        script_type type() const;

        bool operator==(const script_t &o) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::cardano::script_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cardano::script_type;
            switch (v) {
                case script_type::native: return fmt::format_to(ctx.out(), "native");
                case script_type::plutus_v1: return fmt::format_to(ctx.out(), "plutus_v1");
                case script_type::plutus_v2: return fmt::format_to(ctx.out(), "plutus_v2");
                case script_type::plutus_v3: return fmt::format_to(ctx.out(), "plutus_v3");
                default: return fmt::format_to(ctx.out(), "script_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !LEDGER_CODEC_CARDANO_SCRIPT_HPP
