#pragma once
#ifndef LEDGER_CODEC_ARRAY_HPP
#define LEDGER_CODEC_ARRAY_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <cstring>
#include <lc/common/bytes.hpp>

namespace ledger_codec {
    // A fixed-size byte string such as a key hash, a transaction id or an IP address.
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data {};
            init_from_hex(data, hex);
            return data;
        }

        byte_array() =default;

        byte_array(const buffer bytes)
        {
            *this = bytes;
        }

        byte_array &operator=(const buffer bytes)
        {
            if (bytes.size() != SZ) [[unlikely]]
                throw error("expected {} bytes but got {}: {}", SZ, bytes.size(), bytes);
            memcpy(base_type::data(), bytes.data(), SZ);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<ledger_codec::byte_array<SZ>>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const ledger_codec::byte_array<SZ> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::span<const uint8_t>>::format(static_cast<ledger_codec::buffer>(v), ctx);
        }
    };
}

#endif // !LEDGER_CODEC_ARRAY_HPP
