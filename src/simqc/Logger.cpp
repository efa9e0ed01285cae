#include "simqc/Logger.hpp"

#include <fmt/chrono.h>

// Include this after our Logger.hpp to properly set the spdlog levels.
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace sqc {
    spdlog::logger Logger::s_logger(std::string{}); // empty logger

    void Logger::initialize() {
        // Configure the console sink.
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_color(spdlog::level::critical, console_sink->red_bold); // our error
        console_sink->set_color(spdlog::level::err, console_sink->yellow_bold); // our warn
        console_sink->set_color(spdlog::level::warn, console_sink->blue); // our status
        console_sink->set_color(spdlog::level::info, console_sink->green); // our info
        console_sink->set_color(spdlog::level::debug, console_sink->reset); // our trace
        console_sink->set_color(spdlog::level::trace, console_sink->cyan); // our debug
        console_sink->set_pattern("%^%v%$"); // colored log
        console_sink->set_level(spdlog::level::info); // default to our info

        // Configure the logger.
        s_logger = spdlog::logger("simqc", std::move(console_sink));
        s_logger.set_level(spdlog::level::trace); // no limits for the logger; the sinks set the levels.
        s_logger.flush_on(spdlog::level::err);
    }

    void Logger::add_logfile(const std::filesystem::path& logfile) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logfile.string());
        file_sink->set_pattern("[%T][%l]: %v"); // [time][level]: log
        file_sink->set_level(spdlog::level::debug); // default to our trace
        s_logger.sinks().push_back(std::move(file_sink));
    }

    void Logger::set_level(const std::string& level_name) {
        if (s_logger.sinks().empty()) // if not initialized
            return;

        // Our names are ["off", "error", "warn", "status", "info", "trace", "debug"].
        spdlog::level::level_enum level{};
        if (level_name == "off")
            level = spdlog::level::off;
        else if (level_name == "error")
            level = spdlog::level::critical;
        else if (level_name == "warn")
            level = spdlog::level::err;
        else if (level_name == "status")
            level = spdlog::level::warn;
        else if (level_name == "info")
            level = spdlog::level::info;
        else if (level_name == "trace")
            level = spdlog::level::debug;
        else if (level_name == "debug")
            level = spdlog::level::trace;
        else
            panic(Error::INVALID_CONFIG, "Invalid log level: {}", level_name);

        // The log level from the user does not affect the logfile.
        const auto console_sink = dynamic_cast<spdlog::sinks::stdout_color_sink_mt*>(s_logger.sinks()[0].get());
        if (console_sink)
            console_sink->set_level(level);
    }

    Logger::ScopeTimer::~ScopeTimer() {
        namespace stdc = std::chrono;
        const auto elapsed = stdc::steady_clock::now() - start;
        if (elapsed > stdc::minutes(1)) {
            auto minutes = stdc::floor<stdc::minutes>(elapsed);
            auto seconds = stdc::duration_cast<stdc::seconds>(elapsed - minutes);
            s_logger.log(level, "{}... done. Took {} {}", name, minutes, seconds);
        } else if (elapsed > stdc::seconds(1)) {
            auto seconds = stdc::floor<stdc::seconds>(elapsed);
            auto milliseconds = stdc::duration_cast<stdc::milliseconds>(elapsed - seconds);
            s_logger.log(level, "{}... done. Took {} {}", name, seconds, milliseconds);
        } else {
            auto milliseconds = stdc::round<stdc::milliseconds>(elapsed);
            s_logger.log(level, "{}... done. Took {}", name, milliseconds);
        }
    }
}
