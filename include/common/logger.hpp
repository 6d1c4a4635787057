#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace statarb {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

/// Process-wide logger. The replay loop is single threaded, so entries are
/// formatted and written synchronously to the current output stream.
class Logger {
public:
    static Logger& instance();

    void log(LogLevel level, const char* msg);
    void logf(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    /// Redirect output to a file (appending). Returns false if it cannot be opened.
    bool open_file(const std::string& path);

    /// Write to an externally owned stream (stderr by default).
    void set_output(FILE* output);
    void flush();

    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

    static bool parse_level(std::string_view name, LogLevel& out) noexcept;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void close_owned();

    LogLevel min_level_ = LogLevel::Info;
    FILE* output_ = stderr;
    bool owns_output_ = false;
};

// Macros for convenience
#ifdef NDEBUG
#define LOG_DEBUG(...) ((void)0)
#else
#define LOG_DEBUG(...) do { \
    if (::statarb::Logger::instance().level() <= ::statarb::LogLevel::Debug) \
        ::statarb::Logger::instance().logf(::statarb::LogLevel::Debug, __VA_ARGS__); \
} while(0)
#endif

#define LOG_INFO(...)  do { ::statarb::Logger::instance().logf(::statarb::LogLevel::Info, __VA_ARGS__); } while(0)
#define LOG_WARN(...)  do { ::statarb::Logger::instance().logf(::statarb::LogLevel::Warn, __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { ::statarb::Logger::instance().logf(::statarb::LogLevel::Error, __VA_ARGS__); } while(0)

} // namespace statarb
