#ifndef COMICONV_CONSOLE_LOG_SINK_HPP
#define COMICONV_CONSOLE_LOG_SINK_HPP

#include "../../../libcomiconv/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints log lines at or above a threshold.
 *
 * Debug and Info go to stdout, warnings and errors to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

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

#endif // COMICONV_CONSOLE_LOG_SINK_HPP
