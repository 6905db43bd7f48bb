/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of comiconv logs through Logger::log with a short tag
 * naming itself. Delivery is delegated to the registered ILogSink objects.
 */

#ifndef COMICONV_LOGGER_HPP
#define COMICONV_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for comiconv.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Remove a single sink previously added.
     * @param sink Raw pointer identifying the sink; ignored if not registered.
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "comiconv").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "comiconv");

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
     * @brief Converts a string to its LogLevel.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING")
            return LogLevel::Warning;
        return LogLevel::Error;
    }
private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // COMICONV_LOGGER_HPP
