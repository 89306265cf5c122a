/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_JSON_HPP
#define LEDGER_CODEC_JSON_HPP

#include <boost/json.hpp>
#include <lc/common/bytes.hpp>

namespace ledger_codec::json {
    using namespace boost::json;

    inline json::value parse(const buffer buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.str(), sp);
    }
}

#endif // !LEDGER_CODEC_JSON_HPP
