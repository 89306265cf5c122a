#pragma once
#ifndef LEDGER_CODEC_CONTAINER_HPP
#define LEDGER_CODEC_CONTAINER_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <vector>
#include <boost/container/flat_set.hpp>
#include <boost/container/flat_map.hpp>
#include <lc/common/format.hpp>

namespace ledger_codec {
    template<typename T>
    using vector = std::vector<T>;

    // Sorted containers back the CDDL sets and maps: iteration order is the key order.
    template<typename K>
    using flat_set = boost::container::flat_set<K>;

    template<typename K, typename V>
    using flat_map = boost::container::flat_map<K, V>;
}

#endif // !LEDGER_CODEC_CONTAINER_HPP
