/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_TYPES_HPP
#define LEDGER_CODEC_CBOR_TYPES_HPP

#include <cstdint>
#include <lc/common/format.hpp>

namespace ledger_codec::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    enum class length_mode: uint8_t {
        definite,
        indefinite,
        // keep the mode recorded in each value
        preserve
    };

    enum class key_order: uint8_t {
        insertion,
        // by the length of the encoded key, then by its bytes
        canonical
    };

    struct options {
        length_mode array_length = length_mode::definite;
        length_mode map_length = length_mode::definite;
        key_order map_keys = key_order::canonical;

        constexpr bool operator==(const options &) const noexcept =default;
    };

    // ledger-visible bytes
    constexpr options canonical { length_mode::definite, length_mode::definite, key_order::canonical };
    // the default behavior of the reference serialization library: definite lengths, keys in insertion order
    constexpr options cml_default { length_mode::definite, length_mode::definite, key_order::insertion };
    // indefinite arrays as required by the PlutusV1 language view and plutus data lists
    constexpr options quirk { length_mode::indefinite, length_mode::definite, key_order::insertion };
    constexpr options preserve { length_mode::preserve, length_mode::preserve, key_order::insertion };

    // the maximum nesting level accepted by the decoder
    static constexpr size_t max_depth = 1024;
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::cbor::special_val>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cbor::special_val;
            switch (v) {
                case special_val::s_false: return fmt::format_to(ctx.out(), "false");
                case special_val::s_true: return fmt::format_to(ctx.out(), "true");
                case special_val::s_null: return fmt::format_to(ctx.out(), "null");
                case special_val::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case special_val::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case special_val::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case special_val::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case special_val::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                case special_val::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "special_value: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<ledger_codec::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !LEDGER_CODEC_CBOR_TYPES_HPP
