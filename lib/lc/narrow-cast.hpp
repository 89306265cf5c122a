/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_NARROW_CAST_HPP
#define LEDGER_CODEC_NARROW_CAST_HPP

#include <limits>
#include <typeinfo>
#include <lc/common/error.hpp>

namespace ledger_codec {
    // Converts between integer types and throws when the value does not fit into the target type.
    template<typename TO, typename FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        using to_limits = std::numeric_limits<TO>;
        using from_limits = std::numeric_limits<FROM>;
        if constexpr (from_limits::is_signed && !to_limits::is_signed) {
            if (from < 0) [[unlikely]]
                throw error("a negative {} {} does not fit into {}", typeid(FROM).name(), from, typeid(TO).name());
        }
        if constexpr (from_limits::is_signed && to_limits::is_signed) {
            if (from < to_limits::min()) [[unlikely]]
                throw error("{} {} is below the minimum of {}", typeid(FROM).name(), from, typeid(TO).name());
        }
        if constexpr (from_limits::digits > to_limits::digits) {
            if (from > static_cast<FROM>(to_limits::max())) [[unlikely]]
                throw error("{} {} is above the maximum of {}", typeid(FROM).name(), from, typeid(TO).name());
        }
        return static_cast<TO>(from);
    }
}

#endif // !LEDGER_CODEC_NARROW_CAST_HPP
