/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_REDEEMER_HPP
#define LEDGER_CODEC_CARDANO_REDEEMER_HPP

#include <lc/cardano/plutus-data.hpp>

namespace ledger_codec::cardano {
    enum class redeemer_tag: uint8_t {
        spend, mint, cert, reward, vote, propose
    };

    extern redeemer_tag redeemer_tag_from_cbor(const cbor::value &v);

    struct redeemer_t {
        redeemer_tag tag = redeemer_tag::spend;
        uint64_t index = 0;
        plutus_data data { cpp_int {} };
        ex_units budget {};

        static redeemer_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const redeemer_t &o) const =default;
    };

    enum class redeemers_form: uint8_t {
        // [ + [tag, index, data, ex_units] ]
        array,
        // { + [tag, index] => [data, ex_units] }
        map
    };

    struct redeemers_t: vector<redeemer_t> {
        using base_type = vector<redeemer_t>;
        using base_type::base_type;

        redeemers_form form = redeemers_form::array;

        static redeemers_t from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;
        // the array form regardless of the recorded one
        cbor::value to_array_cbor() const;

        bool operator==(const redeemers_t &o) const;
    };

    extern result<ex_units> total_ex_units(const redeemers_t &redeemers);
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::cardano::redeemer_tag>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cardano::redeemer_tag;
            switch (v) {
                case redeemer_tag::spend: return fmt::format_to(ctx.out(), "spend");
                case redeemer_tag::mint: return fmt::format_to(ctx.out(), "mint");
                case redeemer_tag::cert: return fmt::format_to(ctx.out(), "cert");
                case redeemer_tag::reward: return fmt::format_to(ctx.out(), "reward");
                case redeemer_tag::vote: return fmt::format_to(ctx.out(), "vote");
                case redeemer_tag::propose: return fmt::format_to(ctx.out(), "propose");
                default: return fmt::format_to(ctx.out(), "redeemer_tag: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !LEDGER_CODEC_CARDANO_REDEEMER_HPP
