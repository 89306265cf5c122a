/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cardano/metadata.hpp>
#include <lc/cddl/test.hpp>

using namespace ledger_codec;
using namespace ledger_codec::cardano;
using namespace ledger_codec::cddl;

suite cardano_metadata_suite = [] {
    "cardano::metadata"_test = [] {
        const std::string h28(56, '6');
        "metadatum"_test = [] {
            const auto m = test_round_trip<metadata>("a11901f4a261610161624401020304");
            const auto &inner = std::get<metadatum_map>(m.at(500).val);
            test_same(size_t { 2 }, inner.size());
            test_same(std::string { "a" }, std::get<metadatum_text>(inner.at(0).first.val).str);
            const auto l = test_round_trip<metadata>("a10183203bffffffffffffffff6178");
            const auto &items = std::get<metadatum_list>(l.at(1).val);
            test_same(cpp_int { -1 }, std::get<cpp_int>(items.at(0).val));
            test_same(cpp_int { "-18446744073709551616" }, std::get<cpp_int>(items.at(1).val));
            test_round_trip<metadata>("a1011bffffffffffffffff");
        };
        "metadatum rejections"_test = [] {
            test_decode_fails<metadata, schema_error>("a101c249010000000000000000");
            test_decode_fails<metadata, schema_error>(fmt::format("a1015841{}", std::string(130, '0')));
            test_decode_fails<metadata, schema_error>(fmt::format("a1017841{}", std::string(130, '6')));
            test_decode_fails<metadata, schema_error>("a101f6");
            test_decode_fails<metadata, schema_error>("a1200a");
            const metadata too_big { { 1, metadatum { cpp_int { "18446744073709551616" } } } };
            expect(encode_entity(too_big).error_if<encode_error>() != nullptr);
        };
        "auxiliary data forms"_test = [&] {
            const auto shelley = test_round_trip<auxiliary_data>("a10101");
            expect(shelley.form == auxiliary_data_form::shelley);
            expect(shelley.meta.has_value());
            const auto ma = test_round_trip<auxiliary_data>(fmt::format("82a0818200581c{}", h28));
            expect(ma.form == auxiliary_data_form::shelley_ma);
            test_same(size_t { 1 }, ma.native_scripts->size());
            const auto alonzo = test_round_trip<auxiliary_data>("d90103a200a101010281434e4d01");
            expect(alonzo.form == auxiliary_data_form::alonzo);
            expect(!alonzo.native_scripts.has_value());
            test_same(size_t { 1 }, alonzo.plutus_v1_scripts->size());
        };
        "auxiliary data defaults"_test = [] {
            auxiliary_data aux {};
            aux.meta.emplace(metadata { { 1, metadatum { cpp_int { 1 } } } });
            test_same(uint8_vector::from_hex("d90103a100a10101"), encode_entity(aux).unwrap());
            aux.form = auxiliary_data_form::shelley;
            test_same(uint8_vector::from_hex("a10101"), encode_entity(aux).unwrap());
            aux.plutus_v2_scripts.emplace(vector_t<uint8_vector> { uint8_vector { 0x01 } });
            expect(encode_entity(aux).error_if<encode_error>() != nullptr);
            aux.form = auxiliary_data_form::shelley_ma;
            expect(encode_entity(aux).error_if<encode_error>() != nullptr);
        };
        "auxiliary data rejections"_test = [] {
            test_decode_fails<auxiliary_data, schema_error>("d90104a0");
            test_decode_fails<auxiliary_data, schema_error>("d90103a105a0");
            test_decode_fails<auxiliary_data, schema_error>("8102");
            test_decode_fails<auxiliary_data, schema_error>("01");
        };
    };
};
