#include "../../include/modelbase/core/logger.h"
#include "../../include/modelbase/utils/utils.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>

void mdb::Logger::setLogLevel(const LogLevel &level) {
    const auto set_spdlog_level = [&](const spdlog::level::level_enum lvl) {
        auto logger = spdlog::get(loggerName);
        if (!logger) {
            init();
            logger = spdlog::get(loggerName);
        }
        logger->set_level(lvl);

        // Also set sink levels
        for (const auto &sink: logger->sinks()) {
            sink->set_level(lvl);
        }
    };

    switch (level) {
        case LogLevel::TRACE:
            set_spdlog_level(spdlog::level::trace);
            break;
        case LogLevel::DEBUG:
            set_spdlog_level(spdlog::level::debug);
            break;
        case LogLevel::INFO:
            set_spdlog_level(spdlog::level::info);
            break;
        case LogLevel::WARN:
            set_spdlog_level(spdlog::level::warn);
            break;
        case LogLevel::CRITICAL:
            set_spdlog_level(spdlog::level::critical);
            break;
    }
}

mdb::LogLevel mdb::Logger::levelFromString(const std::string &level) {
    auto lvl = trim(level);
    toLowerCase(lvl);

    if (lvl == "trace") return LogLevel::TRACE;
    if (lvl == "debug") return LogLevel::DEBUG;
    if (lvl == "warn" || lvl == "warning") return LogLevel::WARN;
    if (lvl == "critical" || lvl == "error") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void mdb::Logger::init() {
    if (spdlog::get(loggerName)) return;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%-8l] %v");

    const auto logger = std::make_shared<spdlog::logger>(loggerName, console_sink);
    logger->set_level(spdlog::level::info);

    // Make `logger` the default logger
    spdlog::set_default_logger(logger);
}

mdb::FuncLogger::FuncLogger(std::string msg) : m_msg(std::move(msg)) {
    logger::trace("Enter: {}", m_msg);
}

mdb::FuncLogger::~FuncLogger() {
    logger::trace("Exit:  {}", m_msg);
}
