/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "logger.hpp"

namespace ledger_codec {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // the top frames belong to safe_dump_to and the error constructors
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    const char *base_error::what() const noexcept
    {
        if (!_trace_logged) {
            _trace_logged = true;
            thread_local std::array<char, 0x2000> buf {};
            boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
            os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
            buf[os.buffer().second] = 0;
            logger::debug("{} thrown at:\n{}", _msg, buf.data());
        }
        return _msg.c_str();
    }

    error::error(const std::string_view msg):
        base_error { msg }
    {
    }
}
