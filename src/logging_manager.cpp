#include "logging_manager.h"

#include <algorithm>
#include <cctype>

static constexpr const char* TAG = "LoggingManager";

LoggingManager& LoggingManager::instance() {
    static LoggingManager s_instance;
    return s_instance;
}

LoggingManager::LoggingManager()
    : m_stream(nullptr),
      m_streamForwardingEnabled(true),
      m_initialized(false),
      m_minimumLevel(LogLevel::Info),
      m_capacity(0),
      m_startupCapacity(0),
      m_count(0),
      m_head(0),
      m_sequence(0),
      m_origin(std::chrono::steady_clock::now()) {}

void LoggingManager::begin(std::FILE* stream, size_t bufferCapacity, size_t startupCapacity) {
    {
        std::lock_guard<std::mutex> lock(m_bufferMutex);
        m_stream = stream;
        m_capacity = bufferCapacity;
        m_startupCapacity = startupCapacity;
        m_entries.clear();
        m_entries.resize(bufferCapacity);
        m_startupEntries.clear();
        m_startupEntries.reserve(startupCapacity);
        m_count = 0;
        m_head = 0;
        m_sequence = 0;
        m_origin = std::chrono::steady_clock::now();
        m_initialized = true;
    }

    log(LogLevel::Debug, TAG, "LoggingManager initialized (capacity=%u, startup=%u)",
        static_cast<unsigned>(bufferCapacity), static_cast<unsigned>(startupCapacity));
}

void LoggingManager::end() {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    if (m_stream) {
        std::fflush(m_stream);
    }
    m_stream = nullptr;
    m_listeners.clear();
    m_initialized = false;
}

void LoggingManager::enableStreamForwarding(bool enabled) {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    m_streamForwardingEnabled = enabled;
}

void LoggingManager::setMinimumLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    m_minimumLevel = level;
}

LogLevel LoggingManager::minimumLevel() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_minimumLevel;
}

void LoggingManager::registerListener(const std::function<void(const LogEntry&)>& listener) {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    m_listeners.push_back(listener);
}

void LoggingManager::getEntriesSince(uint32_t lastSequence, std::vector<LogEntry>& out) const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    if (m_count == 0) {
        return;
    }

    size_t startIndex = (m_head + m_capacity - m_count) % m_capacity;
    for (size_t i = 0; i < m_count; ++i) {
        const LogEntry& entry = m_entries[(startIndex + i) % m_capacity];
        if (entry.sequence > lastSequence && entry.sequence != 0) {
            out.push_back(entry);
        }
    }
}

void LoggingManager::getStartupEntries(std::vector<LogEntry>& out) const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    out.insert(out.end(), m_startupEntries.begin(), m_startupEntries.end());
}

uint32_t LoggingManager::latestSequence() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_sequence;
}

size_t LoggingManager::entryCount() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_count;
}

size_t LoggingManager::bufferCapacity() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_capacity;
}

size_t LoggingManager::startupCount() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_startupEntries.size();
}

bool LoggingManager::isInitialized() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_initialized;
}

void LoggingManager::log(LogLevel level, const char* tag, const char* fmt, ...) {
    {
        std::lock_guard<std::mutex> lock(m_bufferMutex);
        if (!m_initialized || level < m_minimumLevel) {
            return;
        }
    }

    va_list args;
    va_start(args, fmt);
    va_list argsCopy;
    va_copy(argsCopy, args);
    int needed = vsnprintf(nullptr, 0, fmt, argsCopy);
    va_end(argsCopy);

    if (needed <= 0) {
        va_end(args);
        return;
    }

    std::vector<char> buffer(static_cast<size_t>(needed) + 1);
    vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    std::string message = std::string(infra::logLevelPrefix(static_cast<infra::LogLevel>(level))) + "/" +
                          (tag ? tag : "") + ": " + buffer.data();
    message.erase(std::remove(message.begin(), message.end(), '\r'), message.end());
    while (!message.empty() && message.back() == '\n') {
        message.pop_back();
    }

    pushLine(level, message);
}

void LoggingManager::pushLine(LogLevel level, const std::string& line) {
    LogEntry entry;
    entry.timestamp = elapsedMillis();
    entry.level = level;
    entry.message = line;

    std::vector<std::function<void(const LogEntry&)>> listeners;
    {
        std::lock_guard<std::mutex> lock(m_bufferMutex);
        entry.sequence = ++m_sequence;

        if (m_streamForwardingEnabled && m_stream) {
            std::fprintf(m_stream, "%s\n", line.c_str());
        }

        if (m_capacity > 0) {
            m_entries[m_head] = entry;
            m_head = (m_head + 1) % m_capacity;
            if (m_count < m_capacity) {
                ++m_count;
            }
        }

        if (m_startupEntries.size() < m_startupCapacity) {
            m_startupEntries.push_back(entry);
        }

        listeners = m_listeners;
    }

    for (auto& listener : listeners) {
        if (listener) {
            listener(entry);
        }
    }
}

uint32_t LoggingManager::elapsedMillis() const {
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - m_origin)
                                     .count());
}

LogLevel LoggingManager::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "verbose") return LogLevel::Verbose;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    return fallback;
}
