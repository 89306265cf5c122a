/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_ENCODER_HPP
#define LEDGER_CODEC_CBOR_ENCODER_HPP

#include <limits>
#include <lc/common/bytes.hpp>
#include <lc/cbor/types.hpp>

namespace ledger_codec::cbor {
    // Low-level writer of CBOR heads and payloads. Every head uses the shortest possible argument width.
    struct encoder {
        encoder &array()
        {
            _encode_item(major_type::array, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &array(const size_t sz)
        {
            _encode_uint_item(major_type::array, sz);
            return *this;
        }

        encoder &map()
        {
            _encode_item(major_type::map, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &map(const size_t sz)
        {
            _encode_uint_item(major_type::map, sz);
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            _encode_uint_item(major_type::uint, val);
            return *this;
        }

        // the negative value must be already converted to its CBOR argument: -1 - val
        encoder &nint(const uint64_t val)
        {
            _encode_uint_item(major_type::nint, val);
            return *this;
        }

        encoder &bytes(const buffer buf)
        {
            _encode_uint_item(major_type::bytes, buf.size());
            _encode_data(buf);
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            _encode_uint_item(major_type::text, sv.size());
            _encode_data(sv);
            return *this;
        }

        encoder &raw_cbor(const buffer buf)
        {
            _encode_data(buf);
            return *this;
        }

        encoder &s_null()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_null));
            return *this;
        }

        encoder &s_break()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &s_false()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_false));
            return *this;
        }

        encoder &s_true()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_true));
            return *this;
        }

        encoder &simple(const uint8_t val)
        {
            if (val < 24) {
                _encode_item(major_type::simple, val);
            } else {
                _encode_item(major_type::simple, static_cast<uint8_t>(special_val::one_byte));
                _buf.emplace_back(val);
            }
            return *this;
        }

        encoder &tag(const uint64_t id)
        {
            _encode_uint_item(major_type::tag, id);
            return *this;
        }

        [[nodiscard]] uint8_vector &cbor()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    protected:
        void _encode_data(const buffer buf)
        {
            _buf.insert(_buf.end(), buf.begin(), buf.end());
        }
    private:
        uint8_vector _buf {};

        // the argument is written big-endian in the smallest of the 1, 2, 4 or 8-byte forms
        void _encode_uint_item(const major_type typ, const uint64_t val)
        {
            if (val < 24) {
                _encode_item(typ, static_cast<uint8_t>(val));
                return;
            }
            size_t width = 8;
            special_val ai = special_val::eight_bytes;
            if (val <= std::numeric_limits<uint8_t>::max()) {
                width = 1;
                ai = special_val::one_byte;
            } else if (val <= std::numeric_limits<uint16_t>::max()) {
                width = 2;
                ai = special_val::two_bytes;
            } else if (val <= std::numeric_limits<uint32_t>::max()) {
                width = 4;
                ai = special_val::four_bytes;
            }
            _encode_item(typ, static_cast<uint8_t>(ai));
            for (size_t i = width; i > 0; --i)
                _buf.emplace_back(static_cast<uint8_t>(val >> ((i - 1) * 8)));
        }

        void _encode_item(const major_type typ, const uint8_t special)
        {
            _buf.emplace_back((static_cast<uint8_t>(typ) << 5) | (special & 0x1F));
        }
    };
}

#endif // !LEDGER_CODEC_CBOR_ENCODER_HPP
