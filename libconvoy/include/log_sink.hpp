/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef CONVOY_LOG_SINK_HPP
#define CONVOY_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks compare the level of a message against their own threshold.
 * None is only meaningful as a threshold: it silences a sink.
 */
enum class LogLevel {
    Debug,   ///< Diagnostic detail (commands run, temp paths, retries)
    Info,    ///< Normal progress of a batch or a job
    Warning, ///< Recoverable problems (secondary output not moved, retrying cleanup)
    Error,   ///< A job or an operation failed
    None     ///< Threshold only: log nothing
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, a job's
 * result channel). Logger owns the installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component or job that produced the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // CONVOY_LOG_SINK_HPP
