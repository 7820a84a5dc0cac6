#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <utility>

namespace Trace::Common {

/// Front end of the async file logger. Formatting happens on the calling
/// thread into a stack buffer, the writer thread only does I/O.
class Logger {
public:
    enum Level : uint16_t {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        FATAL = 4
    };

    static constexpr size_t MAX_MSG_SIZE = 480;

    explicit Logger(const char* filename);
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    template<typename... Args>
    void log(Level level, const char* format, Args&&... args) noexcept {
        if (level < min_level_.load(std::memory_order_relaxed)) {
            return;
        }
        char buffer[MAX_MSG_SIZE];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
        int len = snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
#pragma GCC diagnostic pop
        if (len > 0) {
            // Oversized messages are truncated, not dropped
            size_t n = std::min(static_cast<size_t>(len), sizeof(buffer) - 1);
            emit(level, buffer, n);
        }
    }

    template<typename... Args>
    void debug(const char* format, Args&&... args) noexcept {
        log(DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const char* format, Args&&... args) noexcept {
        log(INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const char* format, Args&&... args) noexcept {
        log(WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const char* format, Args&&... args) noexcept {
        log(ERROR, format, std::forward<Args>(args)...);
    }

    void setMinLevel(Level level) noexcept {
        min_level_.store(level, std::memory_order_relaxed);
    }

    struct Stats {
        uint64_t messages_written = 0;
        uint64_t messages_dropped = 0;
        uint64_t bytes_written = 0;
    };

    Stats getStats() const noexcept;

    const char* getFilename() const noexcept { return filename_; }

private:
    void emit(Level level, const char* msg, size_t len) noexcept;

    char filename_[512];
    std::atomic<uint16_t> min_level_{INFO};
};

// Global logger instance, null until initLogging()
extern Logger* g_logger;

// Start the writer thread and open (append) the log file
bool initLogging(const char* log_file) noexcept;

// Drain pending records, join the writer and close the file
void shutdownLogging() noexcept;

// Parse DEBUG/INFO/WARN/ERROR (case-insensitive); false on unknown names
bool parseLogLevel(const char* name, Logger::Level* level) noexcept;

} // namespace Trace::Common

#define LOG_DEBUG(...) if (Trace::Common::g_logger) Trace::Common::g_logger->debug(__VA_ARGS__)
#define LOG_INFO(...)  if (Trace::Common::g_logger) Trace::Common::g_logger->info(__VA_ARGS__)
#define LOG_WARN(...)  if (Trace::Common::g_logger) Trace::Common::g_logger->warn(__VA_ARGS__)
#define LOG_ERROR(...) if (Trace::Common::g_logger) Trace::Common::g_logger->error(__VA_ARGS__)
