#pragma once
#ifndef LEDGER_CODEC_BLAKE2B_HPP
#define LEDGER_CODEC_BLAKE2B_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/array.hpp>

namespace ledger_codec
{
    // Cardano hashes keys and scripts to 28 bytes and everything else to 32 bytes.
    using blake2b_224_hash = byte_array<28>;
    using blake2b_256_hash = byte_array<32>;

    extern void blake2b_sodium(void *out, size_t out_len, const void *in, size_t in_len);

    template<typename T>
    T blake2b(const buffer in)
    {
        T out;
        blake2b_sodium(out.data(), out.size(), in.data(), in.size());
        return out;
    }
}

#endif // !LEDGER_CODEC_BLAKE2B_HPP
