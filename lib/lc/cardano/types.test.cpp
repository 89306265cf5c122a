/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/types.hpp>
#include <lc/cddl/test.hpp>

using namespace ledger_codec;
using namespace ledger_codec::cardano;
using namespace ledger_codec::cddl;

suite cardano_types_suite = [] {
    "cardano::types"_test = [] {
        const std::string h28(56, 'b');
        const std::string h32(64, 'a');
        "tx_input"_test = [&] {
            const auto in = test_round_trip<tx_input>(fmt::format("825820{}05", h32));
            test_same(tx_hash::from_hex(h32), in.hash);
            test_same(uint16_t { 5 }, in.idx);
            test_decode_fails<tx_input, schema_error>(fmt::format("825820{}1a00010000", h32));
            test_decode_fails<tx_input, schema_error>(fmt::format("835820{}0505", h32));
            test_decode_fails<tx_input, schema_error>(fmt::format("82581f{}05", h32.substr(2)));
            expect(tx_input { tx_hash::from_hex(h32), 1 } < tx_input { tx_hash::from_hex(h32), 2 });
        };
        "credential"_test = [&] {
            test_same(credential_t { key_hash::from_hex(h28), false }, test_round_trip<credential_t>(fmt::format("8200581c{}", h28)));
            test_same(credential_t { key_hash::from_hex(h28), true }, test_round_trip<credential_t>(fmt::format("8201581c{}", h28)));
            test_decode_fails<credential_t, schema_error>(fmt::format("8202581c{}", h28));
            test_decode_fails<credential_t, schema_error>(fmt::format("8200581d{}00", h28));
        };
        "drep"_test = [&] {
            test_same(drep_t { drep_t::abstain_t {} }, test_round_trip<drep_t>("8102"));
            test_same(drep_t { drep_t::no_confidence_t {} }, test_round_trip<drep_t>("8103"));
            test_same(drep_t { credential_t { key_hash::from_hex(h28), true } }, test_round_trip<drep_t>(fmt::format("8201581c{}", h28)));
            test_decode_fails<drep_t, schema_error>("8104");
            test_decode_fails<drep_t, schema_error>("820201");
            test_decode_fails<drep_t, schema_error>("80");
        };
        "anchor"_test = [&] {
            const auto a = test_round_trip<anchor_t>(fmt::format("826968747470733a2f2f785820{}", h32));
            test_same(std::string { "https://x" }, a.uri.str);
            test_same(datum_hash::from_hex(h32), a.hash);
            test_decode_fails<anchor_t, schema_error>(fmt::format("827881{}5820{}", std::string(258, '6'), h32));
            const anchor_t long_url { url { std::string(129, 'x') }, datum_hash::from_hex(h32) };
            expect(encode_entity(long_url).error_if<encode_error>() != nullptr);
            test_same(uint8_vector::from_hex("f6"), encode_entity(optional_anchor_t {}).unwrap());
        };
        "ex_units"_test = [] {
            test_same(ex_units { 1000, 2000 }, test_round_trip<ex_units>("821903e81907d0"));
            test_decode_fails<ex_units, schema_error>("811903e8");
            test_decode_fails<ex_units, schema_error>("821903e820");
        };
        "value"_test = [&] {
            test_same(value_t { 1000000 }, test_round_trip<value_t>("1a000f4240"));
            const auto v = test_round_trip<value_t>(fmt::format("821a000f4240a1581c{}a1447465737405", h28));
            test_same(size_t { 1 }, v.assets.size());
            const auto &assets = v.assets.at(script_hash::from_hex(h28));
            test_same(uint64_t { 5 }, assets.at(asset_name { uint8_vector { 't', 'e', 's', 't' } }).amount());
            // an empty asset map of a policy
            test_decode_fails<value_t, schema_error>(fmt::format("8201a1581c{}a0", h28));
            // a zero amount
            test_decode_fails<value_t, schema_error>(fmt::format("8201a1581c{}a1447465737400", h28));
            // an asset name over 32 bytes
            test_decode_fails<value_t, schema_error>(fmt::format("8201a1581c{}a15821{}01", h28, std::string(66, 'c')));
            test_decode_fails<value_t, schema_error>("20");
        };
        "multiasset order"_test = [&] {
            multiasset ma {};
            ma[script_hash::from_hex(h28)][asset_name { uint8_vector { 0x02 } }] = positive_coin { 1 };
            ma[script_hash::from_hex(h28)][asset_name { uint8_vector { 0x01, 0x00 } }] = positive_coin { 2 };
            // canonical key order puts the shorter encoded asset name first
            test_same(uint8_vector::from_hex(fmt::format("a1581c{}a241020142010002", h28)), encode_entity(ma).unwrap());
            ma[script_hash::from_hex(h28)].clear();
            expect(encode_entity(ma).error_if<encode_error>() != nullptr);
        };
        "mint"_test = [&] {
            const auto m = test_round_trip<mint_t>(fmt::format("a1581c{}a144746573743863", h28));
            test_same(int64_t { -100 }, m.at(script_hash::from_hex(h28)).begin()->second.amount);
            test_decode_fails<mint_t, schema_error>(fmt::format("a1581c{}a1447465737400", h28));
            test_decode_fails<mint_t, schema_error>(fmt::format("a1581c{}a144746573741b8000000000000000", h28));
        };
    };
};
