#pragma once

#include <chrono>
#include <filesystem>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include "simqc/Exception.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    // Static logger.
    class Logger {
    public:
        static void initialize();
        static void add_logfile(const std::filesystem::path& logfile);
        static void set_level(const std::string& level_name);

        template<typename... Args>
        static void error(fmt::format_string<Args...>&& fmt, Args&&... args) {
            s_logger.critical(fmt::runtime(fmt), std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void warn(fmt::format_string<Args...>&& fmt, Args&&... args) {
            s_logger.error(fmt::runtime(fmt), std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void status(fmt::format_string<Args...>&& fmt, Args&&... args) {
            s_logger.warn(fmt::runtime(fmt), std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void info(fmt::format_string<Args...>&& fmt, Args&&... args) {
            s_logger.info(fmt::runtime(fmt), std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void trace(fmt::format_string<Args...>&& fmt, Args&&... args) {
            s_logger.debug(fmt::runtime(fmt), std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void debug(fmt::format_string<Args...>&& fmt, Args&&... args) {
            s_logger.trace(fmt::runtime(fmt), std::forward<Args>(args)...);
        }

        /// Flushes every sink.
        static void flush() { s_logger.flush(); }

    public:
        struct ScopeTimer {
            std::chrono::steady_clock::time_point start{};
            std::string name{};
            spdlog::level::level_enum level{};

            explicit ScopeTimer(
                std::string_view name_,
                spdlog::level::level_enum level_
            ) : name(name_), level(level_)
            {
                s_logger.log(level, "{}...", name);
                start = std::chrono::steady_clock::now();
            }

            ~ScopeTimer();
        };

        template<typename... Args>
        [[nodiscard]] static auto status_scope_time(fmt::format_string<Args...>&& fmt, Args&&... args) -> ScopeTimer {
            return ScopeTimer(fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...), spdlog::level::warn);
        }
        template<typename... Args>
        [[nodiscard]] static auto info_scope_time(fmt::format_string<Args...>&& fmt, Args&&... args) -> ScopeTimer {
            return ScopeTimer(fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...), spdlog::level::info);
        }
        template<typename... Args>
        [[nodiscard]] static auto trace_scope_time(fmt::format_string<Args...>&& fmt, Args&&... args) -> ScopeTimer {
            return ScopeTimer(fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...), spdlog::level::debug);
        }

    public:
        static spdlog::logger s_logger;
    };
}
