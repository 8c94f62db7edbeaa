#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "easing.h"
#include "infra/log_sink.h"
#include "jaw_animator.h"
#include "logging_manager.h"

namespace infra {
class IFileSystem;
}

class ConfigManager {
public:
    static constexpr const char *kDefaultPath = "config.txt";

    // Integer setting with a default and an inclusive valid range.
    struct UnsignedRule {
        const char *key;
        unsigned long fallback;
        unsigned long min;
        unsigned long max;
    };

    static ConfigManager& getInstance();

    void setFileSystem(infra::IFileSystem *fileSystem);
    void setLogSink(infra::ILogSink *sink);

    bool loadConfig(const std::string& path = kDefaultPath);
    const std::string& configPath() const { return m_path; }
    std::string getValue(const std::string& key, const std::string& defaultValue = "") const;
    bool hasValue(const std::string& key) const;
    void printConfig() const;

    // Servo bus
    std::vector<uint8_t> getServoIds() const;
    int getPositionMin() const;
    int getPositionMax() const;

    // Playback
    uint32_t getTickMs() const;
    uint32_t getPoseDurationMs() const;
    uint32_t getDurationStepMs() const;
    EasingMode getEasingMode() const;
    bool getLoop() const;
    uint32_t getInstantDwellMs() const;
    uint32_t getPoseSettleMs() const;
    uint32_t getRecordIntervalMs() const;

    // Audio sync
    uint32_t getEnvelopeChunkMs() const;
    size_t getJawChannel() const;
    int getJawClosed() const;
    int getJawOpen() const;
    JawSyncMode getJawMode() const;
    float getPulseThreshold() const;
    uint32_t getPulseDurationMs() const;
    uint32_t getPulseCooldownMs() const;
    float getAmplitudeGamma() const;
    float getAmplitudeSmoothing() const;
    std::string getAudioCommand() const;

    std::string getLibraryPath() const;
    LogLevel getLogLevel() const;

private:
    ConfigManager();

    void parseConfigLine(const std::string& line);
    bool readUnsigned(const UnsignedRule& rule, unsigned long& out) const;
    uint32_t unsignedSetting(const UnsignedRule& rule) const;
    bool parseServoIds(const std::string& text, std::vector<uint8_t>& ids) const;
    bool jawPositionsValid() const;
    void validate() const;
    void log(infra::LogLevel level, const char *fmt, ...) const
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    std::map<std::string, std::string> m_config;
    std::string m_path;
    infra::IFileSystem *m_fileSystem;
    infra::ILogSink *m_logSink;
};

#endif // CONFIG_MANAGER_H
