/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_COST_MODELS_HPP
#define LEDGER_CODEC_CARDANO_COST_MODELS_HPP

#include <boost/json/fwd.hpp>
#include <lc/cardano/types.hpp>

namespace ledger_codec::cardano {
    enum class language: uint8_t {
        plutus_v1 = 0,
        plutus_v2 = 1,
        plutus_v3 = 2
    };

    using cost_model = cddl::vector_t<int64_t>;

    // An empty model is the same as an absent one.
    struct cost_models {
        cost_model v1 {};
        cost_model v2 {};
        cost_model v3 {};

        static cost_models from_cbor(const cbor::value &v);
        // Accepts either the costModels object of protocol parameters or the whole parameters object.
        static cost_models from_json(const boost::json::value &j);
        cbor::value to_cbor() const;

        const cost_model &at(language lang) const;
        // The language views used by the script data hash.
        uint8_vector language_views() const;

        bool operator==(const cost_models &o) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::cardano::language>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cardano::language;
            switch (v) {
                case language::plutus_v1: return fmt::format_to(ctx.out(), "PlutusV1");
                case language::plutus_v2: return fmt::format_to(ctx.out(), "PlutusV2");
                case language::plutus_v3: return fmt::format_to(ctx.out(), "PlutusV3");
                default: return fmt::format_to(ctx.out(), "language: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !LEDGER_CODEC_CARDANO_COST_MODELS_HPP
