#pragma once
/*
===============================================================================
LOG — Level-filtered diagnostic messages
===============================================================================

Messages go to std::clog, prefixed with their level, and are formatted with
std::format:

    sizing::log::debug("processing scenario {}", s);
    sizing::log::info("model: {}", modelSummary(model));

The threshold is process-wide and defaults to Info. Engine output (Gurobi's
own console log) is controlled separately through SolverSettings::output.

===============================================================================
*/

#include <atomic>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sizing {

    enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3, Off = 4 };

    namespace log_detail {
        inline std::atomic<LogLevel>& threshold() {
            static std::atomic<LogLevel> level{ LogLevel::Info };
            return level;
        }

        inline std::string_view prefix(LogLevel level) {
            switch (level) {
                case LogLevel::Debug:   return "[debug] ";
                case LogLevel::Info:    return "[info] ";
                case LogLevel::Warning: return "[warning] ";
                case LogLevel::Error:   return "[error] ";
                case LogLevel::Off:     break;
            }
            return "";
        }
    } // namespace log_detail

    inline void setLogLevel(LogLevel level) noexcept {
        log_detail::threshold().store(level);
    }

    [[nodiscard]] inline LogLevel logLevel() noexcept {
        return log_detail::threshold().load();
    }

    [[nodiscard]] inline bool logEnabled(LogLevel level) noexcept {
        return level != LogLevel::Off && level >= logLevel();
    }

    /// @brief "debug", "info", "warning", "error" or "off"; nullopt otherwise
    inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
        if (name == "debug")   return LogLevel::Debug;
        if (name == "info")    return LogLevel::Info;
        if (name == "warning") return LogLevel::Warning;
        if (name == "error")   return LogLevel::Error;
        if (name == "off")     return LogLevel::Off;
        return std::nullopt;
    }

    namespace log {

        template<typename... Args>
        void write(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
            if (!logEnabled(level))
                return;
            std::clog << log_detail::prefix(level)
                      << std::format(fmt, std::forward<Args>(args)...) << '\n';
        }

        template<typename... Args>
        void debug(std::format_string<Args...> fmt, Args&&... args) {
            write(LogLevel::Debug, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void info(std::format_string<Args...> fmt, Args&&... args) {
            write(LogLevel::Info, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warning(std::format_string<Args...> fmt, Args&&... args) {
            write(LogLevel::Warning, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void error(std::format_string<Args...> fmt, Args&&... args) {
            write(LogLevel::Error, fmt, std::forward<Args>(args)...);
        }

    } // namespace log

} // namespace sizing
