/**
 * @file log_sink.hpp
 * @brief Severity levels and the abstract sink interface used by Logger.
 */

#ifndef NICLEAN_LOG_SINK_HPP
#define NICLEAN_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from least to most severe, so sinks can filter with a simple
 * threshold comparison.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (tool command lines, probe output)
    Info,    ///< Normal progress of a batch
    Warning, ///< Degraded operation (missing tool, unreadable timestamp)
    Error    ///< A file or the whole batch failed
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages end up (console, file, GUI bridge).
 * Logger fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "dispatcher").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // NICLEAN_LOG_SINK_HPP
