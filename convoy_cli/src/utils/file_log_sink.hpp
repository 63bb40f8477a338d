#ifndef CONVOY_FILE_LOG_SINK_HPP
#define CONVOY_FILE_LOG_SINK_HPP

#include "../../../libconvoy/include/log_sink.hpp"
#include "../../../libconvoy/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <unistd.h>

/**
 * @brief Appends every message to a file, prefixed with the writing pid.
 *
 * Workers inherit the sink, so lines of several processes interleave in
 * the same file; each line is written with a single flush.
 */
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::string line = "[" + std::to_string(::getpid()) + "][" + Logger::level_to_string(level) + "]";
        if (!tag.empty()) line += "[" + std::string(tag) + "]";
        line += " ";
        line += message;
        line += "\n";

        std::lock_guard lock(mtx_);
        out_ << line;
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // CONVOY_FILE_LOG_SINK_HPP
