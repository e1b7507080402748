
#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace shotlink {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    bool enabled(LogLevel lvl) const { return lvl >= level_; }
    // nullptr restores stderr
    void set_output(std::FILE* out);
    void log(LogLevel lvl, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    std::FILE* out_ = nullptr;
    const char* level_str(LogLevel lvl);
};

} // namespace shotlink
