/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_COMMON_ERROR_HPP
#define LEDGER_CODEC_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#   endif
#endif
#include <fmt/core.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

namespace ledger_codec {
    // Captures a raw stack trace at the throw site. The trace is symbolized and logged
    // at the debug level only when a handler asks for the message for the first time.
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
        mutable bool _trace_logged = false;
    };

    struct error: base_error {
        explicit error(std::string_view msg);

        template<typename... Args>
            requires (sizeof...(Args) > 0)
        explicit error(fmt::format_string<Args...> fmt, Args&&... a):
            error { std::string_view { fmt::format(fmt, std::forward<Args>(a)...) } }
        {
        }
    };
}

#endif // !LEDGER_CODEC_COMMON_ERROR_HPP
