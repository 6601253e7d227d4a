#ifndef PEG_LOGGER_HPP
#define PEG_LOGGER_HPP

#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace peg {

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    OFF = 4
};

// =============================================================================
// Logger - process-wide leveled logger
//
// Lines are formatted as "YYYY-MM-DD HH:MM:SS [LEVEL] file:line - message"
// and written to stderr unless a file or custom sink is installed.
// =============================================================================

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string& line)>;

    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    // Appends to `path`; returns false if the file cannot be opened
    static bool set_file(const std::string& path);

    // Replaces the output; an empty sink restores stderr
    static void set_sink(Sink sink);

    static void log(LogLevel level, const std::string& message,
                    const char* file, int line);

    // "debug" | "info" | "warning" | "error" | "off"; throws std::invalid_argument
    static LogLevel parse_level(std::string_view text);
    static const char* level_name(LogLevel level);
};

} // namespace peg

#define PEG_LOG(level, expr)                                                    \
    do {                                                                        \
        if (::peg::Logger::enabled(level)) {                                    \
            std::ostringstream peg_log_stream_;                                 \
            peg_log_stream_ << expr;                                            \
            ::peg::Logger::log(level, peg_log_stream_.str(), __FILE__, __LINE__); \
        }                                                                       \
    } while (0)

#define PEG_LOG_DEBUG(expr) PEG_LOG(::peg::LogLevel::DEBUG, expr)
#define PEG_LOG_INFO(expr)  PEG_LOG(::peg::LogLevel::INFO, expr)
#define PEG_LOG_WARN(expr)  PEG_LOG(::peg::LogLevel::WARNING, expr)
#define PEG_LOG_ERROR(expr) PEG_LOG(::peg::LogLevel::ERROR, expr)

#endif // PEG_LOGGER_HPP
