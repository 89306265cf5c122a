/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/narrow-cast.hpp>
#include <lc/common/test.hpp>

using namespace ledger_codec;

suite narrow_cast_suite = [] {
    "narrow_cast"_test = [] {
        test_same(uint8_t { 23 }, narrow_cast<uint8_t>(uint64_t { 23 }));
        test_same(uint16_t { 65535 }, narrow_cast<uint16_t>(uint64_t { 65535 }));
        test_same(int8_t { -24 }, narrow_cast<int8_t>(int64_t { -24 }));
        test_same(int64_t { 340000000 }, narrow_cast<int64_t>(uint64_t { 340000000 }));
        test_same(uint64_t { std::numeric_limits<int64_t>::max() }, narrow_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
        expect(throws<error>([] { narrow_cast<uint8_t>(uint64_t { 256 }); }));
        expect(throws<error>([] { narrow_cast<uint16_t>(uint64_t { 65536 }); }));
        expect(throws<error>([] { narrow_cast<int8_t>(int64_t { -129 }); }));
        expect(throws<error>([] { narrow_cast<uint64_t>(int64_t { -1 }); }));
        expect(throws<error>([] { narrow_cast<int64_t>(std::numeric_limits<uint64_t>::max()); }));
    };
};
