/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_ERROR_HPP
#define LEDGER_CODEC_ERROR_HPP

#include <cstdint>
#include <memory>
#include <string_view>
#include <lc/common/error.hpp>
#include <lc/common/format.hpp>

namespace ledger_codec {
    namespace cbor {
        struct value;
    }

    enum class decode_reason: uint8_t {
        truncated_input,
        unsupported_major_type,
        invalid_utf8,
        trailing_bytes,
        indefinite_break_mismatch
    };

    // Malformed bytes. The offset points to the first byte of the data item that could not be decoded.
    struct decode_error: error {
        using partial_ptr = std::shared_ptr<const cbor::value>;

        decode_error(decode_reason reason, size_t offset, std::string_view details={});

        decode_reason reason() const noexcept
        {
            return _reason;
        }

        size_t offset() const noexcept
        {
            return _offset;
        }

        const partial_ptr &partial() const noexcept
        {
            return _partial;
        }

        void partial(partial_ptr p) noexcept
        {
            _partial = std::move(p);
        }
    private:
        decode_reason _reason;
        size_t _offset;
        partial_ptr _partial {};
    };

    // A well-formed CBOR value that does not match the shape or the invariants of a ledger entity.
    struct schema_error: error {
        using error::error;
    };

    // A domain value that violates its own invariants and cannot be encoded.
    struct encode_error: error {
        using error::error;
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::decode_reason>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::decode_reason;
            switch (v) {
                case decode_reason::truncated_input: return fmt::format_to(ctx.out(), "truncated_input");
                case decode_reason::unsupported_major_type: return fmt::format_to(ctx.out(), "unsupported_major_type");
                case decode_reason::invalid_utf8: return fmt::format_to(ctx.out(), "invalid_utf8");
                case decode_reason::trailing_bytes: return fmt::format_to(ctx.out(), "trailing_bytes");
                case decode_reason::indefinite_break_mismatch: return fmt::format_to(ctx.out(), "indefinite_break_mismatch");
                default: return fmt::format_to(ctx.out(), "decode_reason: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !LEDGER_CODEC_ERROR_HPP
