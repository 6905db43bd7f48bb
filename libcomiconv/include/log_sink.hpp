/**
 * @file log_sink.hpp
 * @brief Severity levels and the abstract sink interface used by Logger.
 */

#ifndef COMICONV_LOG_SINK_HPP
#define COMICONV_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (per-entry codec steps, protocol phases)
    Info,    ///< Normal operation (file started, archive rebuilt)
    Warning, ///< Recoverable oddities (retrying, fallback container)
    Error    ///< Failures that abort a file conversion
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, observer bridge).
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // COMICONV_LOG_SINK_HPP
