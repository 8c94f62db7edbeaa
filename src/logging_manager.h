#ifndef LOGGING_MANAGER_H
#define LOGGING_MANAGER_H

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "infra/log_sink.h"

enum class LogLevel : uint8_t {
    Verbose = 0,
    Debug,
    Info,
    Warn,
    Error
};

struct LogEntry {
    uint32_t timestamp = 0;
    LogLevel level = LogLevel::Info;
    std::string message;
    uint32_t sequence = 0;
};

// Ring-buffered log store with optional forwarding to a stdio stream.
// Drops everything until begin() is called.
class LoggingManager {
public:
    static LoggingManager& instance();

    void begin(std::FILE* stream, size_t bufferCapacity = 2000, size_t startupCapacity = 500);
    void end();
    void enableStreamForwarding(bool enabled);
    void setMinimumLevel(LogLevel level);
    LogLevel minimumLevel() const;

    void registerListener(const std::function<void(const LogEntry&)>& listener);

    void getEntriesSince(uint32_t lastSequence, std::vector<LogEntry>& out) const;
    void getStartupEntries(std::vector<LogEntry>& out) const;
    uint32_t latestSequence() const;
    size_t entryCount() const;
    size_t bufferCapacity() const;
    size_t startupCount() const;
    bool isInitialized() const;

    void log(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

    static LogLevel parseLevel(const std::string& name, LogLevel fallback);

private:
    LoggingManager();

    void pushLine(LogLevel level, const std::string& line);
    uint32_t elapsedMillis() const;

    std::FILE* m_stream;
    bool m_streamForwardingEnabled;
    bool m_initialized;
    LogLevel m_minimumLevel;

    size_t m_capacity;
    size_t m_startupCapacity;
    size_t m_count;
    size_t m_head;
    uint32_t m_sequence;
    std::chrono::steady_clock::time_point m_origin;

    std::vector<LogEntry> m_entries;
    std::vector<LogEntry> m_startupEntries;
    std::vector<std::function<void(const LogEntry&)>> m_listeners;

    mutable std::mutex m_bufferMutex;
};

#define LOG_VERBOSE(tag, fmt, ...) do { infra::emitLog(infra::LogLevel::Verbose, tag, fmt, ##__VA_ARGS__); } while (0)
#define LOG_DEBUG(tag, fmt, ...)   do { infra::emitLog(infra::LogLevel::Debug, tag, fmt, ##__VA_ARGS__); } while (0)
#define LOG_INFO(tag, fmt, ...)    do { infra::emitLog(infra::LogLevel::Info, tag, fmt, ##__VA_ARGS__); } while (0)
#define LOG_WARN(tag, fmt, ...)    do { infra::emitLog(infra::LogLevel::Warn, tag, fmt, ##__VA_ARGS__); } while (0)
#define LOG_ERROR(tag, fmt, ...)   do { infra::emitLog(infra::LogLevel::Error, tag, fmt, ##__VA_ARGS__); } while (0)

#endif // LOGGING_MANAGER_H
