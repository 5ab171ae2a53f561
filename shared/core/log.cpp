#include "log.hpp"

#include <chrono>
#include <cstdarg>

namespace shared::core {

namespace {

const auto g_start = std::chrono::steady_clock::now();

double seconds_since_start() {
    const auto dt = std::chrono::steady_clock::now() - g_start;
    return std::chrono::duration<double>(dt).count();
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const LoggingConfig& cfg) {
    shutdown();

    enabled_ = cfg.enabled;
    level_ = cfg.level;

    if (!enabled_) {
        return;
    }

    if (!cfg.file.empty()) {
        file_ = std::fopen(cfg.file.c_str(), "a");
        if (!file_) {
            std::fprintf(stderr, "[%.3f][WARN][log] cannot open log file %s\n",
                         seconds_since_start(), cfg.file.c_str());
        }
    }
}

void Logger::shutdown() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

bool Logger::enabled_for(LogLevel level) const {
    if (!enabled_ || level == LogLevel::None) return false;
    return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::write(LogLevel level, const char* tag, const char* fmt, std::va_list args) {
    const double t = seconds_since_start();
    const char* level_str = log_level_name(level);

    if (file_) {
        std::va_list args_copy;
        va_copy(args_copy, args);

        std::fprintf(file_, "[%.3f][%s][%s] ", t, level_str, tag);
        std::vfprintf(file_, fmt, args_copy);
        std::fputc('\n', file_);
        std::fflush(file_);

        va_end(args_copy);
    }

    std::fprintf(stderr, "[%.3f][%s][%s] ", t, level_str, tag);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::All: return "ALL";
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::None: return "NONE";
        default: break;
    }
    return "INFO";
}

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
    Logger& logger = Logger::instance();
    if (!logger.enabled_for(level)) return;

    std::va_list args;
    va_start(args, fmt);
    logger.write(level, tag, fmt, args);
    va_end(args);
}

} // namespace shared::core
