/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_CODEC_HPP
#define LEDGER_CODEC_CBOR_CODEC_HPP

#include <lc/result.hpp>
#include <lc/cbor/encoder.hpp>
#include <lc/cbor/value.hpp>

namespace ledger_codec::cbor {
    // Integers beyond 64 bits are written as bignums: tag 2 for non-negative and tag 3 for negative values.
    extern void encode(encoder &enc, const value &v, const options &opts);

    inline uint8_vector encode(const value &v, const options &opts=canonical)
    {
        encoder enc {};
        encode(enc, v, opts);
        return std::move(enc.cbor());
    }

    // Throws decode_error; the input must contain exactly one data item.
    extern value decode_value(buffer bytes);

    inline result<value> decode(const buffer bytes)
    {
        return make_result([&] { return decode_value(bytes); });
    }
}

#endif // !LEDGER_CODEC_CBOR_CODEC_HPP
