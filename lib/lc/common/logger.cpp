/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "logger.hpp"

namespace ledger_codec::logger {
    static std::mutex last_error_mutex {};
    static std::shared_ptr<std::string> last_error_ptr {};

    std::shared_ptr<std::string> last_error()
    {
        std::scoped_lock lk { last_error_mutex };
        return last_error_ptr;
    }

    void reset_last_error()
    {
        std::scoped_lock lk { last_error_mutex };
        last_error_ptr.reset();
    }

    static spdlog::level::level_enum native_level(const level lev)
    {
        switch (lev) {
            case level::trace: return spdlog::level::trace;
            case level::debug: return spdlog::level::debug;
            case level::info: return spdlog::level::info;
            case level::warn: return spdlog::level::warn;
            case level::error: return spdlog::level::err;
            default: throw ledger_codec::error("unsupported log level: {}", static_cast<int>(lev));
        }
    }

    static std::shared_ptr<spdlog::logger> create(const settings &cfg)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (cfg.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (cfg.path) {
            const std::filesystem::path log_path { *cfg.path };
            if (log_path.has_parent_path())
                std::filesystem::create_directories(log_path.parent_path());
            {
                std::ofstream os { *cfg.path, std::ios_base::app };
                if (!os)
                    throw ledger_codec::error("unable to write to the log file: {}", *cfg.path);
            }
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*cfg.path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        }
        auto logger = std::make_shared<spdlog::logger>("lc", sinks.begin(), sinks.end());
        logger->set_level(native_level(cfg.min_level));
        logger->flush_on(spdlog::level::debug);
        return logger;
    }

    static std::mutex logger_mutex {};

    static std::shared_ptr<spdlog::logger> &current()
    {
        static std::shared_ptr<spdlog::logger> logger = create(settings {});
        return logger;
    }

    static std::shared_ptr<spdlog::logger> get()
    {
        std::scoped_lock lk { logger_mutex };
        return current();
    }

    void configure(const settings &cfg)
    {
        auto logger = create(cfg);
        std::scoped_lock lk { logger_mutex };
        current() = std::move(logger);
        if (cfg.path)
            current()->debug("log file: {}", *cfg.path);
    }

    void log(level lev, const std::string &msg)
    {
        const auto logger = get();
        switch (lev) {
            case level::trace:
                logger->trace(msg);
                break;
            case level::debug:
                logger->debug(msg);
                break;
            case level::info:
                logger->info(msg);
                break;
            case level::warn:
                logger->warn(msg);
                break;
            case level::error: {
                logger->error(msg);
                std::scoped_lock lk { last_error_mutex };
                last_error_ptr = std::make_shared<std::string>(msg);
                break;
            }
            default:
                throw ledger_codec::error("unsupported log level: {}", static_cast<int>(lev));
        }
    }
}
