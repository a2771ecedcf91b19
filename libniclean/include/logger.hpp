/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of the pipeline logs through Logger::log() with its own
 * tag. The CLI decides which sinks are installed.
 */

#ifndef NICLEAN_LOGGER_HPP
#define NICLEAN_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for niclean.
 *
 * Delegates messages to all registered ILogSink implementations. With no
 * sink installed, messages are dropped.
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
     * @param tag Optional tag (default: "niclean").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "niclean");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parses a level name ("DEBUG", "info", "Warning", ...).
     * @return The level, or std::nullopt for "NONE" and unknown names.
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    /// List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    /// Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif // NICLEAN_LOGGER_HPP
