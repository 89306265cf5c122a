/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_BIG_INT_HPP
#define LEDGER_CODEC_BIG_INT_HPP

#include <iterator>
#include <sstream>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <lc/common/bytes.hpp>
#include <lc/common/format.hpp>

namespace ledger_codec {
    using boost::multiprecision::cpp_int;

    static constexpr size_t big_int_max_size = 8192;

    inline cpp_int big_int_from_bytes(const buffer data)
    {
        if (data.size() > big_int_max_size)
            throw error("big ints larger than {} bytes are not supported but got: {}!", big_int_max_size, data.size());
        cpp_int val {};
        for (const uint8_t b: data) {
            val <<= 8;
            val |= b;
        }
        return val;
    }

    // big-endian without leading zeros; zero is encoded as an empty byte string
    inline uint8_vector big_int_to_bytes(const cpp_int &val)
    {
        if (val < 0) [[unlikely]]
            throw error("big_int_to_bytes expects a non-negative value but got: {}", val.str());
        uint8_vector res {};
        boost::multiprecision::export_bits(val, std::back_inserter(res), 8);
        if (res.size() == 1 && res[0] == 0)
            res.clear();
        return res;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif //LEDGER_CODEC_BIG_INT_HPP
