#ifndef NICLEAN_CONSOLE_LOG_SINK_HPP
#define NICLEAN_CONSOLE_LOG_SINK_HPP

#include "../../../libniclean/include/log_sink.hpp"
#include <iostream>
#include <mutex>
#include <optional>

/**
 * @brief Prints messages at or above a threshold.
 *
 * Debug and Info go to stdout, Warning and Error to stderr. An empty
 * threshold ("NONE") silences the sink.
 */
class ConsoleLogSink final : public ILogSink {
public:
    std::optional<LogLevel> log_level = LogLevel::Warning;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!log_level || level < *log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // NICLEAN_CONSOLE_LOG_SINK_HPP
