#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>

namespace shared::core {

enum class LogLevel : int {
    All = 0,
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal,
    None,
};

struct LoggingConfig {
    bool enabled{true};
    LogLevel level{LogLevel::Info};
    std::string file{};
};

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    bool enabled_for(LogLevel level) const;

    void write(LogLevel level, const char* tag, const char* fmt, std::va_list args);

private:
    Logger() = default;

    std::FILE* file_{nullptr};
    bool enabled_{true};
    LogLevel level_{LogLevel::Info};
};

const char* log_level_name(LogLevel level);

// printf-style logging: `logf(LogLevel::Info, "load", "read %zu bytes", n)`
// prints `[0.012][INFO][load] read 42 bytes`.
void logf(LogLevel level, const char* tag, const char* fmt, ...);

} // namespace shared::core
