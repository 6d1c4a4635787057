#include "common/logger.hpp"
#include "common/types.hpp"
#include <cstdarg>
#include <cstdio>

namespace statarb {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    close_owned();
}

void Logger::close_owned() {
    if (owns_output_ && output_ != nullptr) {
        fclose(output_);
    }
    owns_output_ = false;
    output_ = stderr;
}

bool Logger::open_file(const std::string& path) {
    FILE* file = fopen(path.c_str(), "a");
    if (file == nullptr) return false;
    close_owned();
    output_ = file;
    owns_output_ = true;
    return true;
}

void Logger::set_output(FILE* output) {
    close_owned();
    output_ = (output != nullptr) ? output : stderr;
}

void Logger::flush() {
    fflush(output_);
}

void Logger::log(LogLevel level, const char* msg) {
    if (level < min_level_) return;

    static const char* level_names[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};
    int idx = static_cast<int>(level);
    if (idx < 0 || idx > 3) idx = 1;
    fprintf(output_, "[%s] [%lu] %s\n", level_names[idx],
            static_cast<unsigned long>(now_ns()), msg);
}

void Logger::logf(LogLevel level, const char* fmt, ...) {
    if (level < min_level_) return;

    char message[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);
    log(level, message);
}

bool Logger::parse_level(std::string_view name, LogLevel& out) noexcept {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

} // namespace statarb
