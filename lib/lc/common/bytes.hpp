/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_COMMON_BYTES_HPP
#define LEDGER_CODEC_COMMON_BYTES_HPP

#include <algorithm>
#include <compare>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace ledger_codec {
    // A non-owning view of encoded bytes. Orders like CBOR canonical byte comparison.
    struct buffer: std::span<const uint8_t> {
        buffer() =default;
        buffer(const buffer &) =default;

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        template <typename T, size_t SZ>
        buffer(const std::span<T, SZ> bytes):
            buffer { reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size() * sizeof(T) }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s):
            buffer { std::string_view { s } }
        {
        }

        buffer &operator=(const buffer &o) =default;

        std::string_view str() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            const auto min_sz = std::min(size(), o.size());
            if (const auto cmp = min_sz ? memcmp(data(), o.data(), min_sz) : 0; cmp != 0)
                return cmp < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
            return size() <=> o.size();
        }

        bool operator==(const buffer &o) const noexcept
        {
            return size() == o.size() && (*this <=> o) == std::strong_ordering::equal;
        }

        buffer subbuf(const size_t offset, const size_t sz) const
        {
            if (offset <= size() && sz <= size() - offset) [[likely]]
                return buffer { data() + offset, sz };
            throw error("a slice at offset {} of {} bytes exceeds the buffer size {}", offset, sz, size());
        }
    };

    inline uint8_t uint_from_hex(const char k)
    {
        if (k >= '0' && k <= '9')
            return k - '0';
        if (k >= 'a' && k <= 'f')
            return k - 'a' + 10;
        if (k >= 'A' && k <= 'F')
            return k - 'A' + 10;
        throw error("unexpected character in a hex string: {}", k);
    }

    inline void init_from_hex(std::span<uint8_t> out, const std::string_view hex)
    {
        if (hex.size() != out.size() * 2) [[unlikely]]
            throw error("a hex string must have {} characters but got {}: {}", out.size() * 2, hex.size(), hex);
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = uint_from_hex(hex[i * 2]) << 4 | uint_from_hex(hex[i * 2 + 1]);
    }

    // An owned byte string: encoder output, CBOR byte-string payloads and script bodies.
    struct uint8_vector: std::vector<uint8_t> {
        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0) [[unlikely]]
                throw error("a hex string must have an even number of characters but got {}", hex.size());
            uint8_vector data(hex.size() / 2);
            init_from_hex(data, hex);
            return data;
        }

        uint8_vector() =default;

        explicit uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(const size_t sz, const uint8_t val):
            std::vector<uint8_t>(sz, val)
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t> { bytes.begin(), bytes.end() }
        {
        }

        uint8_vector(const std::initializer_list<uint8_t> il):
            std::vector<uint8_t> { il }
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        std::string_view str() const noexcept
        {
            return static_cast<buffer>(*this).str();
        }

        uint8_vector &operator=(const buffer bytes)
        {
            assign(bytes.begin(), bytes.end());
            return *this;
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) <=> o;
        }

        std::strong_ordering operator<=>(const uint8_vector &o) const noexcept
        {
            return *this <=> static_cast<buffer>(o);
        }

        bool operator==(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) == o;
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return *this == static_cast<buffer>(o);
        }
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<ledger_codec::uint8_vector>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const ledger_codec::uint8_vector &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::span<const uint8_t>>::format(static_cast<ledger_codec::buffer>(v), ctx);
        }
    };
}

#endif // !LEDGER_CODEC_COMMON_BYTES_HPP
