#include "config_manager.h"
#include "infra/filesystem.h"
#include "infra/posix_filesystem.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

static constexpr const char* TAG = "ConfigManager";

namespace
{

constexpr int kDefaultPositionMin = 0;
constexpr int kDefaultPositionMax = 4095;
constexpr int kPositionLimit = 65535;
constexpr int kDefaultJawClosed = 1945;
constexpr int kDefaultJawOpen = 2600;
constexpr size_t kDefaultJawChannel = 5;
constexpr size_t kMaxServoCount = 16;
constexpr long kMaxServoId = 253;
constexpr const char *kDefaultServoIds = "1,2,3,4,5,6";

std::string trim(const std::string &text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool iequals(const std::string &a, const char *b)
{
    size_t length = std::char_traits<char>::length(b);
    if (a.size() != length)
    {
        return false;
    }
    for (size_t i = 0; i < length; ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
        {
            return false;
        }
    }
    return true;
}

// Whole-string integer parse; rejects trailing junk.
bool parseLong(const std::string &text, long &out)
{
    if (text.empty())
    {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0')
    {
        return false;
    }
    out = value;
    return true;
}

bool parseFloat(const std::string &text, float &out)
{
    if (text.empty())
    {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    float value = std::strtof(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0')
    {
        return false;
    }
    out = value;
    return true;
}

bool parseBool(const std::string &text, bool &out)
{
    if (iequals(text, "true") || text == "1")
    {
        out = true;
        return true;
    }
    if (iequals(text, "false") || text == "0")
    {
        out = false;
        return true;
    }
    return false;
}

}  // namespace

static const ConfigManager::UnsignedRule kTickMs{"tick_ms", 10, 1, 100};
static const ConfigManager::UnsignedRule kPoseDurationMs{"pose_duration_ms", 1000, 100, 5000};
static const ConfigManager::UnsignedRule kDurationStepMs{"duration_step_ms", 100, 10, 1000};
static const ConfigManager::UnsignedRule kInstantDwellMs{"instant_dwell_ms", 1000, 0, 10000};
static const ConfigManager::UnsignedRule kPoseSettleMs{"pose_settle_ms", 50, 0, 2000};
static const ConfigManager::UnsignedRule kRecordIntervalMs{"record_interval_ms", 50, 10, 1000};
static const ConfigManager::UnsignedRule kEnvelopeChunkMs{"envelope_chunk_ms", 30, 5, 200};
static const ConfigManager::UnsignedRule kPulseDurationMs{"pulse_duration_ms", 100, 10, 2000};
static const ConfigManager::UnsignedRule kPulseCooldownMs{"pulse_cooldown_ms", 50, 0, 2000};

ConfigManager::ConfigManager()
    : m_path(kDefaultPath),
      m_fileSystem(nullptr),
      m_logSink(nullptr)
{
}

ConfigManager &ConfigManager::getInstance()
{
    static ConfigManager instance;
    return instance;
}

void ConfigManager::setFileSystem(infra::IFileSystem *fileSystem)
{
    m_fileSystem = fileSystem;
}

void ConfigManager::setLogSink(infra::ILogSink *sink)
{
    m_logSink = sink;
}

bool ConfigManager::loadConfig(const std::string &path)
{
    static infra::PosixFileSystem defaultFilesystem;
    infra::IFileSystem *fs = m_fileSystem ? m_fileSystem : &defaultFilesystem;

    auto configFile = fs->open(path.c_str(), infra::kFileRead);
    if (!configFile)
    {
        log(infra::LogLevel::Error, "Failed to open config file %s", path.c_str());
        return false;
    }

    m_config.clear();
    m_path = path;

    log(infra::LogLevel::Info, "Reading configuration file %s", path.c_str());
    while (configFile->available())
    {
        std::string line = trim(configFile->readStringUntil('\n'));
        if (!line.empty() && line[0] != '#')
        {
            parseConfigLine(line);
        }
    }

    configFile->close();

    for (const auto &pair : m_config)
    {
        log(infra::LogLevel::Debug, "  %s: %s", pair.first.c_str(), pair.second.c_str());
    }

    // Getters fall back to defaults on their own; this only reports problems.
    validate();
    return true;
}

void ConfigManager::parseConfigLine(const std::string &line)
{
    size_t separatorIndex = line.find('=');
    if (separatorIndex == std::string::npos)
    {
        log(infra::LogLevel::Warn, "Ignoring config line without '=': %s", line.c_str());
        return;
    }

    std::string key = trim(line.substr(0, separatorIndex));
    std::string value = trim(line.substr(separatorIndex + 1));
    if (key.empty())
    {
        log(infra::LogLevel::Warn, "Ignoring config line with empty key");
        return;
    }
    m_config[key] = value;
}

void ConfigManager::validate() const
{
    const UnsignedRule *rules[] = {
        &kTickMs, &kPoseDurationMs, &kDurationStepMs, &kInstantDwellMs, &kPoseSettleMs,
        &kRecordIntervalMs, &kEnvelopeChunkMs, &kPulseDurationMs, &kPulseCooldownMs,
    };
    for (const UnsignedRule *rule : rules)
    {
        unsigned long value = 0;
        if (!readUnsigned(*rule, value))
        {
            log(infra::LogLevel::Warn, "Invalid %s (%lu-%lu expected). Getter will return default of %lu.",
                rule->key, rule->min, rule->max, rule->fallback);
        }
    }

    std::vector<uint8_t> ids;
    if (!parseServoIds(getValue("servo_ids", kDefaultServoIds), ids))
    {
        log(infra::LogLevel::Warn, "Invalid servo_ids (1-%u ids of 0-%ld expected). Using %s.",
            static_cast<unsigned>(kMaxServoCount), kMaxServoId, kDefaultServoIds);
    }

    long positionMin = 0;
    long positionMax = 0;
    if (!parseLong(getValue("position_min", "0"), positionMin) ||
        !parseLong(getValue("position_max", "4095"), positionMax) ||
        positionMin < 0 || positionMax > kPositionLimit || positionMin >= positionMax)
    {
        log(infra::LogLevel::Warn, "Invalid position range (min >= max or outside 0-%d). Getters will return defaults.",
            kPositionLimit);
    }

    EasingMode easing = EasingMode::Smooth;
    if (!parseEasingMode(getValue("easing", "smooth"), easing))
    {
        log(infra::LogLevel::Warn, "Unknown easing '%s'. Getter will return SMOOTH.", getValue("easing").c_str());
    }

    bool loop = false;
    if (!parseBool(getValue("loop", "false"), loop))
    {
        log(infra::LogLevel::Warn, "Invalid loop value (true/false expected). Getter will return false.");
    }

    long jawChannel = 0;
    if (hasValue("jaw_channel") &&
        (!parseLong(getValue("jaw_channel"), jawChannel) || jawChannel < 0 ||
         static_cast<size_t>(jawChannel) >= getServoIds().size()))
    {
        log(infra::LogLevel::Warn, "Jaw channel out of range (0-%u expected). Getter will return default.",
            static_cast<unsigned>(getServoIds().size() - 1));
    }

    if (!jawPositionsValid())
    {
        log(infra::LogLevel::Warn, "Invalid jaw positions (must be distinct and inside the position range). "
            "Getters will return defaults.");
    }

    JawSyncMode jawMode = JawSyncMode::Pulse;
    if (!parseJawSyncMode(getValue("jaw_mode", "pulse"), jawMode))
    {
        log(infra::LogLevel::Warn, "Unknown jaw_mode '%s' (pulse/amplitude expected).", getValue("jaw_mode").c_str());
    }

    float threshold = 0.0f;
    if (!parseFloat(getValue("pulse_threshold", "0.05"), threshold) || threshold <= 0.0f || threshold > 1.0f)
    {
        log(infra::LogLevel::Warn, "Invalid pulse threshold (0-1 expected). Getter will return default.");
    }

    float gamma = 0.0f;
    if (!parseFloat(getValue("amplitude_gamma", "0.7"), gamma) || gamma <= 0.0f || gamma > 4.0f)
    {
        log(infra::LogLevel::Warn, "Invalid amplitude gamma (0-4 expected). Getter will return default.");
    }

    float smoothing = 0.0f;
    if (!parseFloat(getValue("amplitude_smoothing", "0.3"), smoothing) || smoothing < 0.0f || smoothing >= 1.0f)
    {
        log(infra::LogLevel::Warn, "Invalid amplitude smoothing (0-1 expected). Getter will return default.");
    }

    std::string level = getValue("log_level", "info");
    if (LoggingManager::parseLevel(level, LogLevel::Verbose) != LoggingManager::parseLevel(level, LogLevel::Error))
    {
        log(infra::LogLevel::Warn, "Unknown log_level '%s'. Getter will return info.", level.c_str());
    }
}

void ConfigManager::log(infra::LogLevel level, const char *fmt, ...) const
{
    char buffer[256]{0};
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (m_logSink) {
        m_logSink->log(level, TAG, buffer);
        return;
    }

    infra::emitLog(level, TAG, "%s", buffer);
}

std::string ConfigManager::getValue(const std::string &key, const std::string &defaultValue) const
{
    auto it = m_config.find(key);
    return (it != m_config.end()) ? it->second : defaultValue;
}

bool ConfigManager::hasValue(const std::string &key) const
{
    return m_config.find(key) != m_config.end();
}

void ConfigManager::printConfig() const
{
    log(infra::LogLevel::Info, "Configuration (%s):", m_path.c_str());
    for (const auto &pair : m_config)
    {
        log(infra::LogLevel::Info, "%s: %s", pair.first.c_str(), pair.second.c_str());
    }
}

bool ConfigManager::readUnsigned(const UnsignedRule &rule, unsigned long &out) const
{
    out = rule.fallback;
    auto it = m_config.find(rule.key);
    if (it == m_config.end())
    {
        return true;
    }

    long value = 0;
    if (!parseLong(it->second, value) || value < 0)
    {
        return false;
    }
    unsigned long unsignedValue = static_cast<unsigned long>(value);
    if (unsignedValue < rule.min || unsignedValue > rule.max)
    {
        return false;
    }
    out = unsignedValue;
    return true;
}

uint32_t ConfigManager::unsignedSetting(const UnsignedRule &rule) const
{
    unsigned long value = rule.fallback;
    readUnsigned(rule, value);
    return static_cast<uint32_t>(value);
}

bool ConfigManager::parseServoIds(const std::string &text, std::vector<uint8_t> &ids) const
{
    ids.clear();
    size_t start = 0;
    while (start <= text.size())
    {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos)
        {
            comma = text.size();
        }
        long id = 0;
        if (!parseLong(trim(text.substr(start, comma - start)), id) || id < 0 || id > kMaxServoId)
        {
            ids.clear();
            return false;
        }
        ids.push_back(static_cast<uint8_t>(id));
        start = comma + 1;
    }

    if (ids.empty() || ids.size() > kMaxServoCount)
    {
        ids.clear();
        return false;
    }
    return true;
}

std::vector<uint8_t> ConfigManager::getServoIds() const
{
    std::vector<uint8_t> ids;
    if (!parseServoIds(getValue("servo_ids", kDefaultServoIds), ids))
    {
        parseServoIds(kDefaultServoIds, ids);
    }
    return ids;
}

int ConfigManager::getPositionMin() const
{
    long minValue = 0;
    long maxValue = 0;
    if (!parseLong(getValue("position_min", "0"), minValue) ||
        !parseLong(getValue("position_max", "4095"), maxValue) ||
        minValue < 0 || maxValue > kPositionLimit || minValue >= maxValue)
    {
        return kDefaultPositionMin;
    }
    return static_cast<int>(minValue);
}

int ConfigManager::getPositionMax() const
{
    long minValue = 0;
    long maxValue = 0;
    if (!parseLong(getValue("position_min", "0"), minValue) ||
        !parseLong(getValue("position_max", "4095"), maxValue) ||
        minValue < 0 || maxValue > kPositionLimit || minValue >= maxValue)
    {
        return kDefaultPositionMax;
    }
    return static_cast<int>(maxValue);
}

uint32_t ConfigManager::getTickMs() const
{
    return unsignedSetting(kTickMs);
}

uint32_t ConfigManager::getPoseDurationMs() const
{
    return unsignedSetting(kPoseDurationMs);
}

uint32_t ConfigManager::getDurationStepMs() const
{
    return unsignedSetting(kDurationStepMs);
}

EasingMode ConfigManager::getEasingMode() const
{
    EasingMode mode = EasingMode::Smooth;
    if (!parseEasingMode(getValue("easing", "smooth"), mode))
    {
        return EasingMode::Smooth;
    }
    return mode;
}

bool ConfigManager::getLoop() const
{
    bool loop = false;
    if (!parseBool(getValue("loop", "false"), loop))
    {
        return false;
    }
    return loop;
}

uint32_t ConfigManager::getInstantDwellMs() const
{
    return unsignedSetting(kInstantDwellMs);
}

uint32_t ConfigManager::getPoseSettleMs() const
{
    return unsignedSetting(kPoseSettleMs);
}

uint32_t ConfigManager::getRecordIntervalMs() const
{
    return unsignedSetting(kRecordIntervalMs);
}

uint32_t ConfigManager::getEnvelopeChunkMs() const
{
    return unsignedSetting(kEnvelopeChunkMs);
}

size_t ConfigManager::getJawChannel() const
{
    size_t servoCount = getServoIds().size();
    size_t fallback = std::min(kDefaultJawChannel, servoCount - 1);
    long value = 0;
    if (!parseLong(getValue("jaw_channel", "5"), value) || value < 0 ||
        static_cast<size_t>(value) >= servoCount)
    {
        return fallback;
    }
    return static_cast<size_t>(value);
}

bool ConfigManager::jawPositionsValid() const
{
    long closed = 0;
    long open = 0;
    if (!parseLong(getValue("jaw_closed", "1945"), closed) || !parseLong(getValue("jaw_open", "2600"), open))
    {
        return false;
    }
    long minValue = getPositionMin();
    long maxValue = getPositionMax();
    return closed != open &&
           closed >= minValue && closed <= maxValue &&
           open >= minValue && open <= maxValue;
}

int ConfigManager::getJawClosed() const
{
    if (!jawPositionsValid())
    {
        return kDefaultJawClosed;
    }
    return std::atoi(getValue("jaw_closed", "1945").c_str());
}

int ConfigManager::getJawOpen() const
{
    if (!jawPositionsValid())
    {
        return kDefaultJawOpen;
    }
    return std::atoi(getValue("jaw_open", "2600").c_str());
}

JawSyncMode ConfigManager::getJawMode() const
{
    JawSyncMode mode = JawSyncMode::Pulse;
    if (!parseJawSyncMode(getValue("jaw_mode", "pulse"), mode))
    {
        return JawSyncMode::Pulse;
    }
    return mode;
}

float ConfigManager::getPulseThreshold() const
{
    float value = 0.0f;
    if (!parseFloat(getValue("pulse_threshold", "0.05"), value) || value <= 0.0f || value > 1.0f)
    {
        return 0.05f;
    }
    return value;
}

uint32_t ConfigManager::getPulseDurationMs() const
{
    return unsignedSetting(kPulseDurationMs);
}

uint32_t ConfigManager::getPulseCooldownMs() const
{
    return unsignedSetting(kPulseCooldownMs);
}

float ConfigManager::getAmplitudeGamma() const
{
    float value = 0.0f;
    if (!parseFloat(getValue("amplitude_gamma", "0.7"), value) || value <= 0.0f || value > 4.0f)
    {
        return 0.7f;
    }
    return value;
}

float ConfigManager::getAmplitudeSmoothing() const
{
    float value = 0.0f;
    if (!parseFloat(getValue("amplitude_smoothing", "0.3"), value) || value < 0.0f || value >= 1.0f)
    {
        return 0.3f;
    }
    return value;
}

std::string ConfigManager::getAudioCommand() const
{
    // An explicitly empty value selects silent, timed playback.
    return getValue("audio_command", "aplay -q");
}

std::string ConfigManager::getLibraryPath() const
{
    std::string path = getValue("library_path", "motion_library.json");
    return path.empty() ? "motion_library.json" : path;
}

LogLevel ConfigManager::getLogLevel() const
{
    return LoggingManager::parseLevel(getValue("log_level", "info"), LogLevel::Info);
}
