/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cddl/test.hpp>

using namespace ledger_codec;
using namespace ledger_codec::cddl;

namespace {
    struct sample {
        uint64_t id = 0;
        std::string name {};
        std::optional<uint64_t> weight {};

        static sample from_cbor(const cbor::value &v)
        {
            const int_map_reader m { v, { 0, 1, 2 }, "sample" };
            return { m.required<uint64_t>(0), m.required<std::string>(1), m.optional<uint64_t>(2) };
        }

        cbor::value to_cbor() const
        {
            return int_map_builder {}.add(0, id).add(1, name).add(2, weight).build();
        }

        bool operator==(const sample &) const =default;
    };

    struct pair_entity {
        uint64_t a = 0;
        std::optional<int64_t> b {};

        static pair_entity from_cbor(const cbor::value &v)
        {
            array_reader it { v, 1, 2, "pair_entity" };
            pair_entity res { it.read<uint64_t>() };
            if (!it.done())
                res.b = it.read<int64_t>();
            return res;
        }

        cbor::value to_cbor() const
        {
            if (b)
                return tuple_to_cbor(a, *b);
            return tuple_to_cbor(a);
        }

        bool operator==(const pair_entity &) const =default;
    };
}

suite cddl_transform_suite = [] {
    "cddl::transform"_test = [] {
        "integer-keyed map"_test = [] {
            const sample s1 { 1, "a" };
            test_same(uint8_vector::from_hex("a20001016161"), encode_entity(s1).unwrap());
            const sample s2 { 1, "a", 5 };
            test_same(uint8_vector::from_hex("a300010161610205"), encode_entity(s2).unwrap());
            test_same(s2, decode_entity<sample>(uint8_vector::from_hex("a301616100010205")).unwrap());
            test_same(s1, decode_entity<sample>(encode_entity(s1).unwrap()).unwrap());
            expect(!decode_entity<sample>(encode_entity(s1).unwrap()).unwrap().weight);
        };
        "integer-keyed map rejects"_test = [] {
            // duplicate key
            test_decode_fails<sample, schema_error>("a300010161610002");
            // unknown key
            test_decode_fails<sample, schema_error>("a300010161610501");
            // missing required key
            test_decode_fails<sample, schema_error>("a10001");
            // non-integer key
            test_decode_fails<sample, schema_error>("a20001616101");
            // wrong shape
            test_decode_fails<sample, schema_error>("820001");
            // bytes that are not CBOR
            test_decode_fails<sample, decode_error>("a200");
            test_decode_fails<sample, decode_error>("a2000101616100");
        };
        "tuple"_test = [] {
            test_same(uint8_vector::from_hex("8107"), encode_entity(pair_entity { 7 }).unwrap());
            test_same(uint8_vector::from_hex("820720"), encode_entity(pair_entity { 7, -1 }).unwrap());
            test_same(pair_entity { 7, -1 }, decode_entity<pair_entity>(uint8_vector::from_hex("820720")).unwrap());
            test_same(pair_entity { 7 }, decode_entity<pair_entity>(uint8_vector::from_hex("9f07ff")).unwrap());
            test_decode_fails<pair_entity, schema_error>("80");
            test_decode_fails<pair_entity, schema_error>("83010203");
            test_decode_fails<pair_entity, schema_error>("8120");
        };
        "set"_test = [] {
            const set_t<uint64_t> s { 3, 1, 2 };
            test_same(uint8_vector::from_hex("d9010283010203"), encode_entity(s).unwrap());
            test_same(s, decode_entity<set_t<uint64_t>>(uint8_vector::from_hex("83030102")).unwrap());
            test_same(s, decode_entity<set_t<uint64_t>>(uint8_vector::from_hex("d9010283010203")).unwrap());
            test_decode_fails<set_t<uint64_t>, schema_error>("d90102820101");
            test_decode_fails<set_t<uint64_t>, schema_error>("820101");
            test_decode_fails<set_t<uint64_t>, schema_error>("d8188101");
            expect(throws<schema_error>([] { nonempty_set_from_cbor<uint64_t>(cbor::make_tag(258, cbor::make_array({})), "inputs"); }));
        };
        "ordered set"_test = [] {
            const oset_t<uint64_t> s { 3, 1, 2 };
            test_same(uint8_vector::from_hex("d9010283030102"), encode_entity(s).unwrap());
            test_same(s, decode_entity<oset_t<uint64_t>>(uint8_vector::from_hex("83030102")).unwrap());
            test_decode_fails<oset_t<uint64_t>, schema_error>("d90102820101");
            test_decode_fails<oset_t<uint64_t>, schema_error>("d901038101");
            expect(throws<schema_error>([] { nonempty_from_cbor<oset_t<uint64_t>>(cbor::make_array({}), "certificates"); }));
        };
        "map"_test = [] {
            const map_t<uint64_t, std::string> m { { 2, "b" }, { 1, "a" } };
            test_same(uint8_vector::from_hex("a2016161026162"), encode_entity(m).unwrap());
            test_same(m, decode_entity<map_t<uint64_t, std::string>>(uint8_vector::from_hex("a2026162016161")).unwrap());
            test_decode_fails<map_t<uint64_t, std::string>, schema_error>("a2016161016162");
        };
        "vector"_test = [] {
            const vector_t<uint64_t> v { 5, 5, 1 };
            test_same(uint8_vector::from_hex("83050501"), encode_entity(v).unwrap());
            test_same(v, decode_entity<vector_t<uint64_t>>(uint8_vector::from_hex("9f050501ff")).unwrap());
        };
        "nil optional"_test = [] {
            test_same(uint8_vector::from_hex("f6"), encode_entity(nil_optional_t<uint64_t> {}).unwrap());
            test_same(uint8_vector::from_hex("05"), encode_entity(nil_optional_t<uint64_t> { 5 }).unwrap());
            expect(!decode_entity<nil_optional_t<uint64_t>>(uint8_vector::from_hex("f6")).unwrap().has_value());
            test_same(uint64_t { 5 }, *decode_entity<nil_optional_t<uint64_t>>(uint8_vector::from_hex("05")).unwrap());
        };
        "bounded bytes"_test = [] {
            test_same(uint8_vector::from_hex("4401020304"), encode_entity(bounded_bytes<4> { uint8_vector::from_hex("01020304") }).unwrap());
            test_decode_fails<bounded_bytes<4>, schema_error>("450102030405");
            expect(encode_entity(bounded_bytes<4> { uint8_vector::from_hex("0102030405") }).error_if<encode_error>() != nullptr);
        };
        "bounded text"_test = [] {
            test_same(uint8_vector::from_hex("63616263"), encode_entity(bounded_text<3> { "abc" }).unwrap());
            test_same(bounded_text<3> { "ab" }, decode_entity<bounded_text<3>>(uint8_vector::from_hex("626162")).unwrap());
            test_decode_fails<bounded_text<3>, schema_error>("6461626364");
            expect(encode_entity(bounded_text<3> { "abcd" }).error_if<encode_error>() != nullptr);
        };
        "positive coin"_test = [] {
            test_same(uint8_vector::from_hex("1903e8"), encode_entity(positive_coin { 1000 }).unwrap());
            test_decode_fails<positive_coin, schema_error>("00");
            test_decode_fails<positive_coin, schema_error>("20");
            expect(encode_entity(positive_coin {}).error_if<encode_error>() != nullptr);
        };
        "primitive ranges"_test = [] {
            expect(throws<schema_error>([] { value_from_cbor<uint8_t>(cbor::make_uint(256)); }));
            expect(throws<schema_error>([] { value_from_cbor<int8_t>(cbor::make_int(-129)); }));
            expect(throws<schema_error>([] { value_from_cbor<uint64_t>(cbor::make_int(-1)); }));
            test_same(int8_t { -128 }, value_from_cbor<int8_t>(cbor::make_int(-128)));
            test_same(cpp_int { "-18446744073709551617" }, value_from_cbor<cpp_int>(cbor::make_int(cpp_int { "-18446744073709551617" })));
            expect(throws<schema_error>([] { value_from_cbor<byte_array<4>>(cbor::make_bytes(uint8_vector::from_hex("010203"))); }));
            test_same(byte_array<3>::from_hex("010203"), value_from_cbor<byte_array<3>>(cbor::make_bytes(uint8_vector::from_hex("010203"))));
        };
    };
};
