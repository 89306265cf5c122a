/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/cost-models.hpp>
#include <lc/cddl/test.hpp>
#include <lc/json.hpp>

using namespace ledger_codec;
using namespace ledger_codec::cardano;
using namespace ledger_codec::cddl;

suite cardano_cost_models_suite = [] {
    "cardano::cost_models"_test = [] {
        "cbor"_test = [] {
            const auto m = test_round_trip<cost_models>("a2008301200201820506");
            test_same(cost_model { 1, -1, 2 }, m.v1);
            test_same(cost_model { 5, 6 }, m.at(language::plutus_v2));
            expect(m.v3.empty());
            test_same(uint8_vector::from_hex("a1018101"), encode_entity(cost_models { {}, { 1 } }).unwrap());
            test_same(uint8_vector::from_hex("a0"), encode_entity(cost_models {}).unwrap());
            test_decode_fails<cost_models, schema_error>("a1038101");
            test_decode_fails<cost_models, schema_error>("a100a0");
        };
        "language views"_test = [] {
            cost_models v1_only {};
            v1_only.v1 = cost_model(166, 0);
            test_same(uint8_vector::from_hex(fmt::format("a1410058a89f{}ff", std::string(166 * 2, '0'))), v1_only.language_views());
            test_same(uint8_vector::from_hex("a101820102"), cost_models { {}, { 1, 2 } }.language_views());
            test_same(uint8_vector::from_hex("a20181024100439f01ff"), cost_models { { 1 }, { 2 } }.language_views());
            test_same(uint8_vector::from_hex("a1028120"), cost_models { {}, {}, { -1 } }.language_views());
            test_same(uint8_vector::from_hex("a0"), cost_models {}.language_views());
        };
        "from json"_test = [] {
            const auto m = cost_models::from_json(json::parse(R"({"costModels":{"PlutusV1":[1,2],"PlutusV2":{"b":2,"a":1}}})"));
            test_same(cost_model { 1, 2 }, m.v1);
            test_same(cost_model { 1, 2 }, m.v2);
            expect(m.v3.empty());
            test_same(cost_model { -5, 9223372036854775807LL }, cost_models::from_json(json::parse(R"({"PlutusV3":[-5,9223372036854775807]})")).v3);
            expect(throws<schema_error>([] { cost_models::from_json(json::parse(R"({"PlutusV4":[1]})")); }));
            expect(throws<schema_error>([] { cost_models::from_json(json::parse("[1]")); }));
            expect(throws<schema_error>([] { cost_models::from_json(json::parse(R"({"PlutusV1":[1.5]})")); }));
            expect(throws<schema_error>([] { cost_models::from_json(json::parse(R"({"PlutusV1":[18446744073709551615]})")); }));
            expect(throws<schema_error>([] { cost_models::from_json(json::parse(R"({"PlutusV1":"x"})")); }));
            expect(throws<schema_error>([] { cost_models::from_json(json::parse(R"({"costModels":[]})")); }));
        };
    };
};
