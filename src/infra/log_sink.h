#ifndef INFRA_LOG_SINK_H
#define INFRA_LOG_SINK_H

#include <cstdarg>

namespace infra {

enum class LogLevel : unsigned char {
    Verbose = 0,
    Debug,
    Info,
    Warn,
    Error
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const char *tag, const char *message) = 0;
};

// Process-wide override. When unset, lines go to LoggingManager.
void setLogSink(ILogSink *sink);
ILogSink *getLogSink();

void emitLog(LogLevel level, const char *tag, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;
void emitLogV(LogLevel level, const char *tag, const char *fmt, va_list args);

const char *logLevelPrefix(LogLevel level);

} // namespace infra

#endif // INFRA_LOG_SINK_H
