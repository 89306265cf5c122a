/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_COMMON_LOGGER_HPP
#define LEDGER_CODEC_COMMON_LOGGER_HPP

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include "format.hpp"

namespace ledger_codec::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    // The console sink is always at info or above; the file sink receives everything allowed by min_level.
    struct settings {
        std::optional<std::string> path {};
        level min_level = level::debug;
        bool console = true;
    };

    extern void configure(const settings &);
    extern std::shared_ptr<std::string> last_error();
    extern void reset_last_error();
    extern void log(level lev, const std::string &msg);

    template<typename... Args>
    void log(const level lev, fmt::format_string<Args...> fmt, Args&&... a)
    {
        log(lev, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... a)
    {
        log(level::trace, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... a)
    {
        log(level::debug, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... a)
    {
        log(level::info, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... a)
    {
        log(level::warn, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... a)
    {
        log(level::error, fmt::format(fmt, std::forward<Args>(a)...));
    }

    using action = std::function<void()>;

    inline std::exception_ptr run_log_errors(const action &main, const std::source_location &loc=std::source_location::current())
    {
        try {
            main();
        } catch (const std::exception &ex) {
            logger::error("block at {}:{} failed with {}", loc.file_name(), loc.line(), ex.what());
            return std::current_exception();
        }
        return {};
    }
}

#endif // !LEDGER_CODEC_COMMON_LOGGER_HPP
