/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <random>
#include <lc/common/test.hpp>
#include <lc/cbor/codec.hpp>

using namespace ledger_codec;
using namespace ledger_codec::cbor;

namespace {
    void test_encode(const std::string_view exp_hex, const value &v, const options &opts=canonical, const std::source_location &loc=std::source_location::current())
    {
        test_same(uint8_vector::from_hex(exp_hex), encode(v, opts), loc);
    }

    const decode_error &test_decode_error(const result<value> &res, const decode_reason exp_reason, const size_t exp_offset,
        const std::source_location &loc=std::source_location::current())
    {
        const auto *err = res.error_if<decode_error>();
        expect((err != nullptr) >> fatal, loc) << "decode was expected to fail";
        test_same(exp_reason, err->reason(), loc);
        test_same(exp_offset, err->offset(), loc);
        return *err;
    }

    size_t expected_head_size(const uint64_t v)
    {
        if (v < 24)
            return 1;
        if (v <= 0xFF)
            return 2;
        if (v <= 0xFFFF)
            return 3;
        if (v <= 0xFFFFFFFF)
            return 5;
        return 9;
    }
}

suite cbor_codec_suite = [] {
    "cbor::codec"_test = [] {
        "unsigned integers"_test = [] {
            test_encode("00", make_uint(0));
            test_encode("17", make_uint(23));
            test_encode("1818", make_uint(24));
            test_encode("18ff", make_uint(255));
            test_encode("190100", make_uint(256));
            test_encode("19ffff", make_uint(65535));
            test_encode("1a00010000", make_uint(65536));
            test_encode("1affffffff", make_uint(0xFFFFFFFFULL));
            test_encode("1b0000000100000000", make_uint(0x100000000ULL));
            test_encode("1bffffffffffffffff", make_uint(0xFFFFFFFFFFFFFFFFULL));
        };
        "negative integers"_test = [] {
            test_encode("20", make_int(-1));
            test_encode("37", make_int(-24));
            test_encode("3818", make_int(-25));
            test_encode("3903e7", make_int(-1000));
            test_encode("3bffffffffffffffff", make_int(cpp_int { "-18446744073709551616" }));
        };
        "bignums"_test = [] {
            const cpp_int two_64 { "18446744073709551616" };
            test_encode("c249010000000000000000", make_int(two_64));
            test_encode("c349010000000000000000", make_int(cpp_int { -1 - two_64 }));
            const auto v = decode(uint8_vector::from_hex("c249010000000000000000")).unwrap();
            test_same(two_64, v.bigint());
            test_same(make_int(cpp_int { -1 - two_64 }), decode(uint8_vector::from_hex("c349010000000000000000")).unwrap());
        };
        "minimal width"_test = [] {
            std::vector<uint64_t> samples { 0, 1, 23, 24, 25, 254, 255, 256, 1000, 65535, 65536, 100000,
                0xFFFFFFFFULL, 0x100000000ULL, 0xFFFFFFFFFFFFFFFFULL };
            std::mt19937_64 rnd { 42 };
            for (size_t i = 0; i < 256; ++i)
                samples.emplace_back(rnd() >> (i % 64));
            for (const auto s: samples) {
                const auto enc_u = encode(make_uint(s));
                test_same(expected_head_size(s), enc_u.size());
                const auto enc_n = encode(make_nint(s));
                test_same(expected_head_size(s), enc_n.size());
                test_same(make_uint(s), decode(enc_u).unwrap());
                test_same(make_nint(s), decode(enc_n).unwrap());
            }
            // container and tag heads follow the same rule
            test_encode("d90102" "80", make_tag(258, make_array({})));
            test_encode("d81843" "010203", make_tag(24, make_bytes(uint8_vector::from_hex("010203"))));
            test_encode("5818" + std::string(48, '0'), make_bytes(uint8_vector(24)));
        };
        "strings and simple values"_test = [] {
            test_encode("40", make_bytes(uint8_vector {}));
            test_encode("4401020304", make_bytes(uint8_vector::from_hex("01020304")));
            test_encode("60", make_text(""));
            test_encode("6449455446", make_text("IETF"));
            test_encode("f4", make_bool(false));
            test_encode("f5", make_bool(true));
            test_encode("f6", make_null());
            test_encode("f0", make_simple(16));
            test_encode("f7", make_simple(23));
            test_encode("f8ff", make_simple(255));
        };
        "canonical map ordering"_test = [] {
            const auto m = make_map({
                { make_text("b"), make_uint(1) },
                { make_uint(10), make_uint(2) },
                { make_text("a"), make_uint(3) }
            });
            test_encode("a30a02616103616201", m);
            test_encode("a36162010a02616103", m, cml_default);
            // the classic example: keys ordered by the length of their encoding, then by its bytes
            const auto rfc = make_map({
                { make_array({ make_uint(100) }), make_uint(0) },
                { make_text("aa"), make_uint(0) },
                { make_array({ make_int(-1) }), make_uint(0) },
                { make_text("z"), make_uint(0) },
                { make_uint(100), make_uint(0) },
                { make_bool(false), make_uint(0) },
                { make_int(-1), make_uint(0) },
                { make_uint(10), make_uint(0) }
            });
            test_encode("a8" "0a00" "2000" "f400" "186400" "617a00" "812000" "62616100" "81186400", rfc);
        };
        "canonical ordering of random maps"_test = [] {
            std::mt19937_64 rnd { 7 };
            for (size_t round = 0; round < 16; ++round) {
                vector<map_item> items {};
                for (size_t i = 0; i < 32; ++i) {
                    const auto k = rnd();
                    switch (k % 3) {
                        case 0: items.emplace_back(make_uint(k >> (k % 64)), make_uint(i)); break;
                        case 1: items.emplace_back(make_bytes(uint8_vector(k % 40, static_cast<uint8_t>(i))), make_uint(i)); break;
                        default: items.emplace_back(make_text(std::string(k % 30, static_cast<char>('a' + i % 26))), make_uint(i)); break;
                    }
                }
                const auto bytes = encode(make_map(std::move(items)));
                const auto decoded = decode(bytes).unwrap();
                const auto &m = decoded.map();
                for (size_t i = 1; i < m.size(); ++i) {
                    const auto prev = encode(m[i - 1].first);
                    const auto cur = encode(m[i].first);
                    expect(prev.size() < cur.size() || (prev.size() == cur.size() && prev <= cur));
                }
                // re-encoding canonical bytes is idempotent
                test_same(bytes, encode(decoded));
            }
        };
        "length modes"_test = [] {
            const auto arr = make_array({ make_uint(1), make_uint(2) });
            test_encode("820102", arr);
            test_encode("9f0102ff", arr, quirk);
            test_encode("80", make_array({}), quirk);
            test_encode("a0", make_map({}), quirk);
            test_encode("820102", arr, preserve);
            test_encode("9f0102ff", make_array({ make_uint(1), make_uint(2) }, true), preserve);
            test_encode("bf0102ff", make_map({ { make_uint(1), make_uint(2) } }, true), preserve);
            test_encode("a10102", make_map({ { make_uint(1), make_uint(2) } }, true));
            // nested collections follow the same options
            test_encode("9f9f01ffa10102ff", make_array({ make_array({ make_uint(1) }), make_map({ { make_uint(1), make_uint(2) } }) }), quirk);
        };
        "decode preserves length mode"_test = [] {
            const auto arr = decode(uint8_vector::from_hex("9f0102ff")).unwrap();
            expect(arr.array().indefinite);
            test_same(make_array({ make_uint(1), make_uint(2) }, true), arr);
            test_same(uint8_vector::from_hex("9f0102ff"), encode(arr, preserve));
            test_same(uint8_vector::from_hex("820102"), encode(arr));
            const auto m = decode(uint8_vector::from_hex("bf6161f4ff")).unwrap();
            expect(m.map().indefinite);
            test_same(uint8_vector::from_hex("bf6161f4ff"), encode(m, preserve));
            const auto def = decode(uint8_vector::from_hex("a26162f46161f5")).unwrap();
            expect(!def.map().indefinite);
            // insertion order is kept on decode
            test_same(std::string_view { "b" }, def.map()[0].first.text());
        };
        "indefinite strings"_test = [] {
            test_same(make_bytes(uint8_vector::from_hex("010203")), decode(uint8_vector::from_hex("5f4101420203ff")).unwrap());
            test_same(make_text("ab"), decode(uint8_vector::from_hex("7f61616162ff")).unwrap());
            test_same(make_bytes(uint8_vector {}), decode(uint8_vector::from_hex("5fff")).unwrap());
            test_same(make_bytes(uint8_vector::from_hex("0102030405")), decode(uint8_vector::from_hex("5f42010243030405ff")).unwrap());
            // concatenated chunks are written back as a single definite string
            test_same(uint8_vector::from_hex("450102030405"), encode(decode(uint8_vector::from_hex("5f42010243030405ff")).unwrap(), preserve));
            test_decode_error(decode(uint8_vector::from_hex("5f6161ff")), decode_reason::indefinite_break_mismatch, 1);
            test_decode_error(decode(uint8_vector::from_hex("5f5f4101ffff")), decode_reason::indefinite_break_mismatch, 1);
            test_decode_error(decode(uint8_vector::from_hex("5f4101")), decode_reason::truncated_input, 3);
        };
        "bignum size limit"_test = [] {
            const cpp_int largest = (cpp_int { 1 } << (8 * big_int_max_size)) - 1;
            const auto max_pos = make_int(largest);
            test_same(max_pos, decode(encode(max_pos)).unwrap());
            const auto max_neg = make_int(-1 - largest);
            test_same(max_neg, decode(encode(max_neg)).unwrap());
            expect(throws<encode_error>([&] { encode(make_int(largest + 1)); }));
            expect(throws<encode_error>([&] { encode(make_int(-2 - largest)); }));
        };
        "simple values without an encoding"_test = [] {
            for (const uint8_t v: { 20, 21, 22, 24, 31 })
                expect(throws<encode_error>([v] { encode(value { simple_value { v } }); })) << fmt::format("simple value {}", v);
            test_encode("f7", value { simple_value { 23 } });
            test_encode("f820", value { simple_value { 32 } });
        };
        "truncated map"_test = [] {
            const auto &err = test_decode_error(decode(uint8_vector::from_hex("a301020304")), decode_reason::truncated_input, 5);
            expect((err.partial() != nullptr) >> fatal);
            test_same(make_map({ { make_uint(1), make_uint(2) }, { make_uint(3), make_uint(4) } }), *err.partial());
        };
        "truncated input"_test = [] {
            test_decode_error(decode(uint8_vector {}), decode_reason::truncated_input, 0);
            test_decode_error(decode(uint8_vector::from_hex("430102")), decode_reason::truncated_input, 0);
            test_decode_error(decode(uint8_vector::from_hex("1901")), decode_reason::truncated_input, 0);
            test_decode_error(decode(uint8_vector::from_hex("8201")), decode_reason::truncated_input, 2);
            test_decode_error(decode(uint8_vector::from_hex("9f01")), decode_reason::truncated_input, 2);
            test_decode_error(decode(uint8_vector::from_hex("d818")), decode_reason::truncated_input, 2);
            test_decode_error(decode(uint8_vector::from_hex("a1015a00000010")), decode_reason::truncated_input, 2);
        };
        "partial value of nested items"_test = [] {
            const auto &err = test_decode_error(decode(uint8_vector::from_hex("820182028201")), decode_reason::truncated_input, 6);
            expect((err.partial() != nullptr) >> fatal);
            const auto exp = make_array({ make_uint(1), make_array({ make_uint(2), make_array({ make_uint(1) }) }) });
            test_same(exp, *err.partial());
            const auto &tag_err = test_decode_error(decode(uint8_vector::from_hex("d90102820a")), decode_reason::truncated_input, 5);
            expect((tag_err.partial() != nullptr) >> fatal);
            test_same(make_tag(258, make_array({ make_uint(10) })), *tag_err.partial());
        };
        "trailing bytes"_test = [] {
            const auto &err = test_decode_error(decode(uint8_vector::from_hex("0000")), decode_reason::trailing_bytes, 1);
            expect((err.partial() != nullptr) >> fatal);
            test_same(make_uint(0), *err.partial());
            test_decode_error(decode(uint8_vector::from_hex("820102ff")), decode_reason::trailing_bytes, 3);
        };
        "unsupported items"_test = [] {
            test_decode_error(decode(uint8_vector::from_hex("f93c00")), decode_reason::unsupported_major_type, 0);
            test_decode_error(decode(uint8_vector::from_hex("fa47c35000")), decode_reason::unsupported_major_type, 0);
            test_decode_error(decode(uint8_vector::from_hex("fb3ff199999999999a")), decode_reason::unsupported_major_type, 0);
            test_decode_error(decode(uint8_vector::from_hex("1c")), decode_reason::unsupported_major_type, 0);
            test_decode_error(decode(uint8_vector::from_hex("811e")), decode_reason::unsupported_major_type, 1);
            test_decode_error(decode(uint8_vector::from_hex("1f")), decode_reason::unsupported_major_type, 0);
            test_decode_error(decode(uint8_vector::from_hex("3f")), decode_reason::unsupported_major_type, 0);
            test_decode_error(decode(uint8_vector::from_hex("df00")), decode_reason::unsupported_major_type, 0);
            test_decode_error(decode(uint8_vector::from_hex("f818")), decode_reason::unsupported_major_type, 0);
            test_same(make_simple(32), decode(uint8_vector::from_hex("f820")).unwrap());
            test_same(make_simple(23), decode(uint8_vector::from_hex("f7")).unwrap());
        };
        "break mismatch"_test = [] {
            test_decode_error(decode(uint8_vector::from_hex("ff")), decode_reason::indefinite_break_mismatch, 0);
            test_decode_error(decode(uint8_vector::from_hex("8201ff")), decode_reason::indefinite_break_mismatch, 2);
            test_decode_error(decode(uint8_vector::from_hex("a101ff")), decode_reason::indefinite_break_mismatch, 2);
        };
        "invalid utf8"_test = [] {
            test_decode_error(decode(uint8_vector::from_hex("62c328")), decode_reason::invalid_utf8, 0);
            test_decode_error(decode(uint8_vector::from_hex("82016180")), decode_reason::invalid_utf8, 2);
            test_decode_error(decode(uint8_vector::from_hex("7f6161" "61ff" "ff")), decode_reason::invalid_utf8, 3);
            test_same(make_text("\xc3\xa9"), decode(uint8_vector::from_hex("62c3a9")).unwrap());
        };
        "nesting depth"_test = [] {
            std::string nested_hex {};
            for (size_t i = 0; i < max_depth; ++i)
                nested_hex += "81";
            expect(decode(uint8_vector::from_hex(nested_hex + "00")).ok());
            test_decode_error(decode(uint8_vector::from_hex("81" + nested_hex + "00")), decode_reason::unsupported_major_type, max_depth + 1);
        };
        "round trip"_test = [] {
            const auto v = make_array({
                make_uint(0),
                make_int(-1000000),
                make_bytes(uint8_vector::from_hex("deadbeef")),
                make_text("ledger"),
                make_map({ { make_uint(1), make_array({}) }, { make_int(-5), make_map({}) } }),
                make_tag(258, make_array({ make_uint(3), make_uint(4) })),
                make_bool(true),
                make_null(),
                make_simple(99)
            });
            for (const auto &opts: { canonical, cml_default }) {
                const auto bytes = encode(v, opts);
                test_same(v, decode(bytes).unwrap());
                test_same(bytes, encode(decode(bytes).unwrap(), opts));
            }
            const auto quirk_bytes = encode(v, quirk);
            test_same(quirk_bytes, encode(decode(quirk_bytes).unwrap(), preserve));
        };
        "unwrap rethrows"_test = [] {
            expect(throws<decode_error>([] { decode(uint8_vector::from_hex("ff")).unwrap(); }));
        };
    };
};
