/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/error.hpp>

namespace ledger_codec {
    decode_error::decode_error(const decode_reason reason, const size_t offset, const std::string_view details):
        error { details.empty()
            ? fmt::format("CBOR decode error {} at offset {}", reason, offset)
            : fmt::format("CBOR decode error {} at offset {}: {}", reason, offset, details) },
        _reason { reason }, _offset { offset }
    {
    }
}
