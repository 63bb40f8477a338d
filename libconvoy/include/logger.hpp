/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Logger is the single entry point for logging in convoy. It forwards
 * every message to the registered ILogSink implementations. Worker
 * processes inherit the sinks installed before the pool was started.
 */

#ifndef CONVOY_LOGGER_HPP
#define CONVOY_LOGGER_HPP

#include "log_sink.hpp"
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for convoy.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "convoy").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "convoy");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Converts a level name to LogLevel.
     * Case-insensitive. Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(std::string level) {
        for (auto& c : level) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        if (level == "NONE")
            return LogLevel::None;
        return LogLevel::Error;
    }

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif // CONVOY_LOGGER_HPP
