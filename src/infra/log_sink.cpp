#include "log_sink.h"
#include <cstdarg>
#include <cstdio>
#include "logging_manager.h"

namespace infra {

static ILogSink *g_sink = nullptr;

void setLogSink(ILogSink *sink) {
    g_sink = sink;
}

ILogSink *getLogSink() {
    return g_sink;
}

void emitLog(LogLevel level, const char *tag, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emitLogV(level, tag, fmt, args);
    va_end(args);
}

void emitLogV(LogLevel level, const char *tag, const char *fmt, va_list args) {
    if (!fmt) {
        return;
    }
    char buffer[256];
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (g_sink) {
        g_sink->log(level, tag ? tag : "", buffer);
        return;
    }
    LoggingManager::instance().log(static_cast<::LogLevel>(level), tag ? tag : "", "%s", buffer);
}

const char *logLevelPrefix(LogLevel level) {
    switch (level) {
        case LogLevel::Verbose: return "V";
        case LogLevel::Debug:   return "D";
        case LogLevel::Info:    return "I";
        case LogLevel::Warn:    return "W";
        case LogLevel::Error:   return "E";
        default:                return "?";
    }
}

} // namespace infra
