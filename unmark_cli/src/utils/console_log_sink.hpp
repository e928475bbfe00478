//
// Created on 24/10/26.
//

#ifndef UNMARK_CONSOLE_LOG_SINK_HPP
#define UNMARK_CONSOLE_LOG_SINK_HPP

#include "../../../libunmark/include/log_sink.hpp"
#include "../../../libunmark/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes records at or above a threshold to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    explicit ConsoleLogSink(const LogLevel threshold) : log_level(threshold) {}

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        const char* color = level == LogLevel::Error ? RED : level == LogLevel::Warning ? YELLOW : "";
        std::cerr << color << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) std::cerr << "[" << tag << "]";
        std::cerr << " " << message << (*color ? RESET : "") << "\n";
    }

    LogLevel log_level;

private:
    std::mutex mtx_;
};

#endif // UNMARK_CONSOLE_LOG_SINK_HPP
