/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <limits>
#include <utfcpp/utf8.h>
#include <lc/cbor/codec.hpp>
#include <lc/narrow-cast.hpp>

namespace ledger_codec::cbor {
    static const cpp_int &max_uint64()
    {
        static const cpp_int max { std::numeric_limits<uint64_t>::max() };
        return max;
    }

    static bool use_indefinite(const length_mode mode, const bool recorded, const bool empty)
    {
        switch (mode) {
            case length_mode::definite: return false;
            // the reference library writes empty collections as definite even in its indefinite mode
            case length_mode::indefinite: return !empty;
            case length_mode::preserve: return recorded;
            default: throw error("unsupported length mode: {}", static_cast<int>(mode));
        }
    }

    static void encode_map(encoder &enc, const map &m, const options &opts)
    {
        const auto indefinite = use_indefinite(opts.map_length, m.indefinite, m.empty());
        if (indefinite)
            enc.map();
        else
            enc.map(m.size());
        if (opts.map_keys == key_order::canonical) {
            vector<std::pair<uint8_vector, uint8_vector>> items {};
            items.reserve(m.size());
            for (const auto &[k, v]: m)
                items.emplace_back(encode(k, opts), encode(v, opts));
            std::stable_sort(items.begin(), items.end(), [](const auto &a, const auto &b) {
                if (a.first.size() != b.first.size())
                    return a.first.size() < b.first.size();
                return a.first < b.first;
            });
            for (const auto &[k, v]: items) {
                enc.raw_cbor(k);
                enc.raw_cbor(v);
            }
        } else {
            for (const auto &[k, v]: m) {
                encode(enc, k, opts);
                encode(enc, v, opts);
            }
        }
        if (indefinite)
            enc.s_break();
    }

    // the decoder folds only bignums of up to big_int_max_size bytes back into integers
    static uint8_vector _bignum_bytes(const cpp_int &num)
    {
        auto bytes = big_int_to_bytes(num);
        if (bytes.size() > big_int_max_size) [[unlikely]]
            throw encode_error("a bignum of {} bytes exceeds the supported maximum of {} bytes", bytes.size(), big_int_max_size);
        return bytes;
    }

    void encode(encoder &enc, const value &v, const options &opts)
    {
        std::visit([&](const auto &c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, uint_value>) {
                if (c.num <= max_uint64())
                    enc.uint(c.num.template convert_to<uint64_t>());
                else
                    enc.tag(2).bytes(_bignum_bytes(c.num));
            } else if constexpr (std::is_same_v<T, nint_value>) {
                if (c.arg <= max_uint64())
                    enc.nint(c.arg.template convert_to<uint64_t>());
                else
                    enc.tag(3).bytes(_bignum_bytes(c.arg));
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                enc.bytes(c);
            } else if constexpr (std::is_same_v<T, std::string>) {
                enc.text(c);
            } else if constexpr (std::is_same_v<T, array>) {
                const auto indefinite = use_indefinite(opts.array_length, c.indefinite, c.empty());
                if (indefinite)
                    enc.array();
                else
                    enc.array(c.size());
                for (const auto &item: c)
                    encode(enc, item, opts);
                if (indefinite)
                    enc.s_break();
            } else if constexpr (std::is_same_v<T, map>) {
                encode_map(enc, c, opts);
            } else if constexpr (std::is_same_v<T, tag>) {
                enc.tag(c.id);
                encode(enc, c.inner(), opts);
            } else if constexpr (std::is_same_v<T, bool>) {
                if (c)
                    enc.s_true();
                else
                    enc.s_false();
            } else if constexpr (std::is_same_v<T, null_value>) {
                enc.s_null();
            } else if constexpr (std::is_same_v<T, simple_value>) {
                // 20..22 would read back as bool or null and 24..31 are not valid simple values
                if ((c.val >= 20 && c.val <= 22) || (c.val >= 24 && c.val <= 31)) [[unlikely]]
                    throw encode_error("simple value {} has no valid encoding of its own", c.val);
                enc.simple(c.val);
            } else {
                static_assert(sizeof(T) == 0, "unsupported CBOR value type");
            }
        }, v.storage());
    }

    struct decoder {
        explicit decoder(const buffer data): _data { data }
        {
        }

        value read(const size_t depth=0)
        {
            if (depth > max_depth) [[unlikely]]
                throw decode_error(decode_reason::unsupported_major_type, _offset, fmt::format("nesting deeper than {} levels", max_depth));
            const auto h = _read_head();
            switch (h.typ) {
                case major_type::uint:
                    if (h.indefinite) [[unlikely]]
                        throw decode_error(decode_reason::unsupported_major_type, h.start, "an indefinite unsigned integer");
                    return uint_value { h.arg };
                case major_type::nint:
                    if (h.indefinite) [[unlikely]]
                        throw decode_error(decode_reason::unsupported_major_type, h.start, "an indefinite negative integer");
                    return nint_value { h.arg };
                case major_type::bytes: return _read_bytes(h);
                case major_type::text: return _read_text(h);
                case major_type::array: return _read_array(h, depth);
                case major_type::map: return _read_map(h, depth);
                case major_type::tag: return _read_tag(h, depth);
                case major_type::simple: return _read_simple(h);
                default: throw error("internal error: unsupported major type: {}", h.typ);
            }
        }

        size_t offset() const noexcept
        {
            return _offset;
        }

        bool eof() const noexcept
        {
            return _offset >= _data.size();
        }
    private:
        struct head {
            major_type typ;
            uint8_t ai;
            uint64_t arg;
            bool indefinite;
            size_t start;
        };

        buffer _data;
        size_t _offset = 0;

        uint64_t _read_arg(const size_t sz, const size_t start)
        {
            if (_data.size() - _offset < sz) [[unlikely]]
                throw decode_error(decode_reason::truncated_input, start, fmt::format("a {}-byte head argument is cut short", sz));
            uint64_t x = 0;
            for (size_t i = 0; i < sz; ++i) {
                x <<= 8;
                x |= _data[_offset++];
            }
            return x;
        }

        head _read_head()
        {
            const auto start = _offset;
            if (eof()) [[unlikely]]
                throw decode_error(decode_reason::truncated_input, start, "a data item must contain at least one byte");
            const uint8_t hdr = _data[_offset++];
            head h { static_cast<major_type>(hdr >> 5), static_cast<uint8_t>(hdr & 0x1F), 0, false, start };
            switch (h.ai) {
                case 24: h.arg = _read_arg(1, start); break;
                case 25: h.arg = _read_arg(2, start); break;
                case 26: h.arg = _read_arg(4, start); break;
                case 27: h.arg = _read_arg(8, start); break;
                case 28:
                case 29:
                case 30:
                    throw decode_error(decode_reason::unsupported_major_type, start, fmt::format("reserved additional info value {}", h.ai));
                case 31:
                    h.indefinite = true;
                    break;
                default:
                    h.arg = h.ai;
                    break;
            }
            return h;
        }

        // consumes the break marker if it is next
        bool _next_is_break()
        {
            if (eof()) [[unlikely]]
                throw decode_error(decode_reason::truncated_input, _offset, "an indefinite item is missing its break marker");
            if (_data[_offset] == 0xFF) {
                ++_offset;
                return true;
            }
            return false;
        }

        buffer _read_payload(const head &h)
        {
            if (h.arg > _data.size() - _offset) [[unlikely]]
                throw decode_error(decode_reason::truncated_input, h.start, fmt::format("a string of {} bytes has only {} available", h.arg, _data.size() - _offset));
            const auto sz = narrow_cast<size_t>(h.arg);
            const auto res = _data.subbuf(_offset, sz);
            _offset += sz;
            return res;
        }

        template<typename F>
        void _read_chunks(const head &h, const F &observer)
        {
            while (!_next_is_break()) {
                const auto chunk = _read_head();
                if (chunk.typ != h.typ || chunk.indefinite) [[unlikely]]
                    throw decode_error(decode_reason::indefinite_break_mismatch, chunk.start,
                        fmt::format("an indefinite {} contains a chunk of type {}", h.typ, chunk.typ));
                observer(chunk, _read_payload(chunk));
            }
        }

        value _read_bytes(const head &h)
        {
            if (!h.indefinite)
                return uint8_vector { _read_payload(h) };
            uint8_vector res {};
            _read_chunks(h, [&](const head &, const buffer chunk) {
                res.insert(res.end(), chunk.begin(), chunk.end());
            });
            return res;
        }

        static void _check_utf8(const head &h, const buffer chunk)
        {
            if (utf8::find_invalid(chunk.begin(), chunk.end()) != chunk.end()) [[unlikely]]
                throw decode_error(decode_reason::invalid_utf8, h.start);
        }

        value _read_text(const head &h)
        {
            std::string res {};
            if (!h.indefinite) {
                const auto chunk = _read_payload(h);
                _check_utf8(h, chunk);
                res = chunk.str();
            } else {
                _read_chunks(h, [&](const head &chunk_h, const buffer chunk) {
                    _check_utf8(chunk_h, chunk);
                    res += chunk.str();
                });
            }
            return res;
        }

        value _read_array(const head &h, const size_t depth)
        {
            array items {};
            items.indefinite = h.indefinite;
            try {
                if (h.indefinite) {
                    while (!_next_is_break())
                        items.emplace_back(read(depth + 1));
                } else {
                    // every item takes at least one byte
                    items.reserve(std::min<uint64_t>(h.arg, _data.size() - _offset));
                    for (uint64_t i = 0; i < h.arg; ++i)
                        items.emplace_back(read(depth + 1));
                }
            } catch (decode_error &ex) {
                if (ex.partial())
                    items.emplace_back(*ex.partial());
                ex.partial(std::make_shared<const value>(std::move(items)));
                throw;
            }
            return items;
        }

        value _read_map(const head &h, const size_t depth)
        {
            map items {};
            items.indefinite = h.indefinite;
            std::optional<value> key {};
            try {
                for (uint64_t i = 0; h.indefinite || i < h.arg; ++i) {
                    if (h.indefinite && _next_is_break())
                        break;
                    key.emplace(read(depth + 1));
                    auto val = read(depth + 1);
                    items.emplace_back(std::move(*key), std::move(val));
                    key.reset();
                }
            } catch (decode_error &ex) {
                if (key)
                    items.emplace_back(std::move(*key), ex.partial() ? *ex.partial() : value {});
                ex.partial(std::make_shared<const value>(std::move(items)));
                throw;
            }
            return items;
        }

        value _read_tag(const head &h, const size_t depth)
        {
            if (h.indefinite) [[unlikely]]
                throw decode_error(decode_reason::unsupported_major_type, h.start, "an indefinite tag");
            value inner {};
            try {
                inner = read(depth + 1);
            } catch (decode_error &ex) {
                ex.partial(std::make_shared<const value>(tag { h.arg, ex.partial() ? *ex.partial() : value {} }));
                throw;
            }
            // bignums are folded into the integer types
            if ((h.arg == 2 || h.arg == 3) && inner.is<uint8_vector>() && inner.bytes().size() <= big_int_max_size) {
                auto num = big_int_from_bytes(inner.bytes());
                if (h.arg == 2)
                    return uint_value { std::move(num) };
                return nint_value { std::move(num) };
            }
            return tag { h.arg, std::move(inner) };
        }

        static value _read_simple(const head &h)
        {
            if (h.indefinite) [[unlikely]]
                throw decode_error(decode_reason::indefinite_break_mismatch, h.start, "a break marker outside of an indefinite item");
            switch (h.ai) {
                case static_cast<uint8_t>(special_val::s_false): return false;
                case static_cast<uint8_t>(special_val::s_true): return true;
                case static_cast<uint8_t>(special_val::s_null): return null_value {};
                case static_cast<uint8_t>(special_val::one_byte):
                    if (h.arg < 32) [[unlikely]]
                        throw decode_error(decode_reason::unsupported_major_type, h.start, fmt::format("a two-byte simple value {} below 32", h.arg));
                    return simple_value { narrow_cast<uint8_t>(h.arg) };
                case static_cast<uint8_t>(special_val::two_bytes):
                case static_cast<uint8_t>(special_val::four_bytes):
                case static_cast<uint8_t>(special_val::eight_bytes):
                    throw decode_error(decode_reason::unsupported_major_type, h.start, "floating-point values are not supported");
                default:
                    return simple_value { h.ai };
            }
        }
    };

    value decode_value(const buffer bytes)
    {
        decoder dec { bytes };
        auto v = dec.read();
        if (!dec.eof()) [[unlikely]] {
            decode_error err { decode_reason::trailing_bytes, dec.offset(), fmt::format("{} bytes follow the top-level item", bytes.size() - dec.offset()) };
            err.partial(std::make_shared<const value>(std::move(v)));
            throw err;
        }
        return v;
    }
}
