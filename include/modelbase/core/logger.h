/**
 * @file logger.h
 * @brief Wrapper around spdlog's functionality.
 */

#ifndef MODELBASE_LOGGER_H
#define MODELBASE_LOGGER_H

#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <format>
#include <string>

namespace mdb {
    /**
     * Enum for the different logging levels.
     */
    typedef enum class LogLevel : uint8_t {
        TRACE = 0, ///> Trace logging level
        DEBUG, ///> Debug Logging Level
        INFO, ///> Info Logging Level
        WARN, ///> Warning Logging Level
        CRITICAL ///> Critical Logging Level
    } LogLevel;

    /**
     * A wrapper class around the `spdlog's` logging functions.
     * For more info, check docs here: @see https://github.com/gabime/spdlog
     *
     * @code
     * logger::warn("Skipping malformed schema file `{}`", path.string());
     * @endcode
     */
    class Logger {
    public:
        Logger() = default;

        ~Logger() = default;

        /// Name of the spdlog logger registered by `init()`.
        static constexpr auto loggerName = "modelbase";

        /**
         * @brief Install a colored stderr logger as the spdlog default.
         *
         * stdout is left to command output.
         *
         * Calling it more than once is harmless, the existing logger is kept.
         */
        static void init();

        static void setLogLevel(const LogLevel &level = LogLevel::INFO);

        /**
         * @brief Parse a textual log level (`trace`, `debug`, `info`, `warn`, `critical`).
         * @param level Level name, case-insensitive
         * @return Parsed level, `LogLevel::INFO` for unknown values.
         */
        static LogLevel levelFromString(const std::string &level);

        template<typename... Args>
        static void trace(fmt::format_string<Args...> msg, Args &&... args) {
            spdlog::trace(msg, std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void info(fmt::format_string<Args...> msg, Args &&... args) {
            spdlog::info(msg, std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void debug(fmt::format_string<Args...> msg, Args &&... args) {
            spdlog::debug(msg, std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void warn(fmt::format_string<Args...> msg, Args &&... args) {
            spdlog::warn(msg, std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void critical(fmt::format_string<Args...> msg, Args &&... args) {
            spdlog::critical(msg, std::forward<Args>(args)...);
        }
    };

    using logger = Logger;

    /**
     * @brief A class for tracing function execution [entry, exit]
     * useful in following execution flow
     */
    class FuncLogger {
    public:
        explicit FuncLogger(std::string msg);

        ~FuncLogger();

    private:
        std::string m_msg;
    };
}

// Macro to automatically insert logger with function name
inline std::string getFile(const std::string &path) {
    const std::filesystem::path p = path;
    return p.filename().string();
}

#define TRACE_METHOD() mdb::FuncLogger _logger(std::format("{} {}()", getFile(__FILE__), __FUNCTION__));

#endif //MODELBASE_LOGGER_H
