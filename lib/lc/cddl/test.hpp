/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CDDL_TEST_HPP
#define LEDGER_CODEC_CDDL_TEST_HPP

#include <lc/common/test.hpp>
#include <lc/cddl/transform.hpp>

namespace ledger_codec::cddl {
    template<typename T, typename E>
    void test_decode_fails(const std::string_view hex, const std::source_location &loc=std::source_location::current())
    {
        const auto res = decode_entity<T>(uint8_vector::from_hex(hex));
        expect(res.template error_if<E>() != nullptr, loc) << hex;
    }

    // Decodes the hex and checks that the entity encodes back to the same bytes.
    template<typename T>
    T test_round_trip(const std::string_view hex, const cbor::options &opts=cbor::canonical, const std::source_location &loc=std::source_location::current())
    {
        const auto bytes = uint8_vector::from_hex(hex);
        const auto res = decode_entity<T>(bytes);
        expect(res.ok(), loc) << hex;
        if (!res)
            return T {};
        const auto &entity = res.unwrap();
        const auto enc = encode_entity(entity, opts);
        expect(enc.ok(), loc) << hex;
        if (enc)
            test_same(bytes, enc.unwrap(), loc);
        return entity;
    }
}

#endif // !LEDGER_CODEC_CDDL_TEST_HPP
