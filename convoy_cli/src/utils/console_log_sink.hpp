#ifndef CONVOY_CONSOLE_LOG_SINK_HPP
#define CONVOY_CONSOLE_LOG_SINK_HPP

#include "../../../libconvoy/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints messages at or above log_level; warnings and errors go to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (log_level == LogLevel::None || level < log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case LogLevel::Debug:
                std::cout << "\n[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "\n[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "\n[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "\n[ERROR][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::None:
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // CONVOY_CONSOLE_LOG_SINK_HPP
