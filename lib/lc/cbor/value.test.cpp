/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/common/test.hpp>
#include <lc/cbor/value.hpp>

using namespace ledger_codec;
using namespace ledger_codec::cbor;

suite cbor_value_suite = [] {
    "cbor::value"_test = [] {
        "default is null"_test = [] {
            const value v {};
            expect(v.is_null());
            test_same(major_type::simple, v.type());
        };
        "integers"_test = [] {
            test_same(uint64_t { 24 }, make_uint(24).uint());
            test_same(major_type::nint, make_int(-1).type());
            test_same(cpp_int { -1 }, make_nint(0).bigint());
            test_same(make_nint(99), make_int(-100));
            test_same(make_uint(100), make_int(100));
            test_same(int64_t { -500 }, make_int(-500).int64());
            const cpp_int big { "18446744073709551616" };
            test_same(big, make_int(big).bigint());
            expect(throws<schema_error>([&] { make_int(big).uint(); }));
            expect(throws<schema_error>([&] { make_int(big).int64(); }));
        };
        "accessor type mismatch"_test = [] {
            const auto v = make_text("abc");
            test_same(std::string_view { "abc" }, v.text());
            expect(throws<schema_error>([&] { v.uint(); }));
            expect(throws<schema_error>([&] { v.bytes(); }));
            expect(throws<schema_error>([&] { v.array(); }));
            expect(throws<schema_error>([&] { make_uint(1).text(); }));
        };
        "array"_test = [] {
            const auto v = make_array({ make_uint(1), make_text("x") });
            test_same(size_t { 2 }, v.array().size());
            test_same(uint64_t { 1 }, v.at(0).uint());
            expect(throws<schema_error>([&] { v.at(2); }));
            expect(v.array() != make_array({ make_uint(1), make_text("x") }, true).array());
        };
        "map find"_test = [] {
            const auto v = make_map({ { make_uint(1), make_text("a") }, { make_text("k"), make_uint(2) } });
            const auto *found = v.map().find(make_text("k"));
            expect((found != nullptr) >> fatal);
            test_same(uint64_t { 2 }, found->uint());
            expect(v.map().find(make_uint(2)) == nullptr);
        };
        "tag equality is deep"_test = [] {
            test_same(make_tag(258, make_array({ make_uint(1) })), make_tag(258, make_array({ make_uint(1) })));
            expect(make_tag(258, make_array({ make_uint(1) })) != make_tag(258, make_array({ make_uint(2) })));
            expect(make_tag(24, make_uint(1)) != make_tag(258, make_uint(1)));
        };
        "simple"_test = [] {
            test_same(uint8_t { 16 }, make_simple(16).simple());
            test_same(uint8_t { 255 }, make_simple(255).simple());
            expect(throws<encode_error>([] { make_simple(21); }));
            expect(throws<encode_error>([] { make_simple(25); }));
            expect(make_bool(true).boolean());
            expect(make_bool(true) != make_bool(false));
        };
        "stringify"_test = [] {
            const auto v = make_array({
                make_int(-2),
                make_bytes(uint8_vector::from_hex("0102")),
                make_map({ { make_text("a"), make_null() } }),
                make_tag(258, make_array({}, true)),
                make_bool(false)
            });
            test_same(std::string { "[-2, h'0102', {\"a\": null}, 258([_ ]), false]" }, fmt::format("{}", v));
        };
    };
};
