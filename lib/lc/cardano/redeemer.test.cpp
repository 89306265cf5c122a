/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/redeemer.hpp>
#include <lc/cddl/test.hpp>

using namespace ledger_codec;
using namespace ledger_codec::cardano;
using namespace ledger_codec::cddl;

suite cardano_redeemer_suite = [] {
    "cardano::redeemer"_test = [] {
        "redeemer"_test = [] {
            const auto r = test_round_trip<redeemer_t>("840100d87980821903e81907d0");
            expect(r.tag == redeemer_tag::mint);
            test_same(uint64_t { 0 }, r.index);
            test_same(plutus_data::constr(0, {}), r.data);
            test_same(ex_units { 1000, 2000 }, r.budget);
            test_decode_fails<redeemer_t, schema_error>("840600d87980821903e81907d0");
            test_decode_fails<redeemer_t, schema_error>("830100d87980");
            test_same(std::string { "propose" }, fmt::format("{}", redeemer_tag::propose));
        };
        "array form"_test = [] {
            const auto rs = test_round_trip<redeemers_t>("82840000d87980821903e81907d08403050082182a1864");
            expect(rs.form == redeemers_form::array);
            test_same(size_t { 2 }, rs.size());
            expect(rs.at(1).tag == redeemer_tag::reward);
            test_same(uint64_t { 5 }, rs.at(1).index);
            // plutus data lengths are kept only by the preserving options
            test_round_trip<redeemers_t>("81840000d8799f01ff820102", cbor::preserve);
        };
        "map form"_test = [] {
            const auto rs = test_round_trip<redeemers_t>("a282000082008201028201018201820304");
            expect(rs.form == redeemers_form::map);
            test_same(size_t { 2 }, rs.size());
            expect(rs.at(1).tag == redeemer_tag::mint);
            test_same(ex_units { 3, 4 }, rs.at(1).budget);
            test_same(uint8_vector::from_hex("828400000082010284010101820304"), cbor::encode(rs.to_array_cbor()));
            test_decode_fails<redeemers_t, schema_error>("a282000082008201028200008201820304");
            test_decode_fails<redeemers_t, schema_error>("a18200008200");
            test_decode_fails<redeemers_t, schema_error>("01");
        };
        "total ex units"_test = [] {
            const auto rs = decode_entity<redeemers_t>(uint8_vector::from_hex("a282000082008201028201018201820304")).unwrap();
            test_same(ex_units { 4, 6 }, total_ex_units(rs).unwrap());
            test_same(ex_units {}, total_ex_units(redeemers_t {}).unwrap());
            redeemers_t big {};
            big.emplace_back(redeemer_t { redeemer_tag::spend, 0, plutus_data::bint(0), ex_units { std::numeric_limits<uint64_t>::max(), 1 } });
            big.emplace_back(redeemer_t { redeemer_tag::spend, 1, plutus_data::bint(0), ex_units { 1, 1 } });
            expect(total_ex_units(big).error_if<schema_error>() != nullptr);
        };
    };
};
