#include "motion_library.h"

#include <cstdarg>
#include <cstdio>
#include <utility>

#include "infra/filesystem.h"
#include "infra/posix_filesystem.h"

static constexpr const char *TAG = "MotionLibrary";

MotionLibrary::MotionLibrary()
    : m_fileSystem(nullptr),
      m_logSink(nullptr) {
}

void MotionLibrary::setFileSystem(infra::IFileSystem *fileSystem) {
    m_fileSystem = fileSystem;
}

void MotionLibrary::setLogSink(infra::ILogSink *sink) {
    m_logSink = sink;
}

void MotionLibrary::savePose(const Pose &pose) {
    m_poses.push_back(pose);
    log(infra::LogLevel::Info, "Saved pose #%u", static_cast<unsigned>(m_poses.size()));
}

void MotionLibrary::clearPoses() {
    m_poses.clear();
    log(infra::LogLevel::Info, "Cleared all saved poses");
}

void MotionLibrary::setRecordedMotion(const RecordedMotion &motion) {
    m_motion = motion;
}

void MotionLibrary::clearRecordedMotion() {
    m_motion = RecordedMotion();
    log(infra::LogLevel::Info, "Cleared recorded motion");
}

size_t MotionLibrary::channelCount() const {
    if (!m_poses.empty()) {
        return m_poses.front().size();
    }
    if (!m_motion.empty()) {
        return m_motion.frames.front().positions.size();
    }
    return 0;
}

bool MotionLibrary::load(const std::string &path) {
    infra::IFileSystem *fs = resolveFileSystem();
    if (!fs->exists(path.c_str())) {
        log(infra::LogLevel::Error, "Motion library not found: %s", path.c_str());
        return false;
    }

    auto file = fs->open(path.c_str(), infra::kFileRead);
    if (!file) {
        log(infra::LogLevel::Error, "Failed to open motion library: %s", path.c_str());
        return false;
    }

    std::string json = file->readString();
    file->close();

    if (!fromJson(json)) {
        log(infra::LogLevel::Error, "Motion library %s not loaded", path.c_str());
        return false;
    }

    log(infra::LogLevel::Info, "Loaded %u poses and %u motion frames from %s",
        static_cast<unsigned>(m_poses.size()), static_cast<unsigned>(m_motion.frameCount()), path.c_str());
    return true;
}

bool MotionLibrary::save(const std::string &path) {
    auto file = resolveFileSystem()->open(path.c_str(), infra::kFileWrite);
    if (!file) {
        log(infra::LogLevel::Error, "Failed to open %s for writing", path.c_str());
        return false;
    }

    std::string json = toJson();
    size_t written = file->write(json);
    file->close();

    if (written != json.size()) {
        log(infra::LogLevel::Error, "Short write to %s (%u of %u bytes)", path.c_str(),
            static_cast<unsigned>(written), static_cast<unsigned>(json.size()));
        return false;
    }

    log(infra::LogLevel::Info, "Saved %u poses and %u motion frames to %s",
        static_cast<unsigned>(m_poses.size()), static_cast<unsigned>(m_motion.frameCount()), path.c_str());
    return true;
}

bool MotionLibrary::fromJson(const std::string &json) {
#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
    DynamicJsonDocument doc(json.size() * 12 + 1024);
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        log(infra::LogLevel::Error, "Failed to parse motion library JSON: %s", error.c_str());
        return false;
    }

    if (!doc["version"].is<int>()) {
        log(infra::LogLevel::Error, "Motion library missing version");
        return false;
    }
    int version = doc["version"].as<int>();
    if (version != kFormatVersion) {
        log(infra::LogLevel::Error, "Unsupported motion library version %d", version);
        return false;
    }

    size_t channels = 0;
    if (!doc["channels"].isNull()) {
        if (!doc["channels"].is<unsigned int>()) {
            log(infra::LogLevel::Error, "Motion library has an invalid channel count");
            return false;
        }
        channels = doc["channels"].as<unsigned int>();
    }

    std::vector<Pose> poses;
    if (!doc["poses"].isNull()) {
        if (!doc["poses"].is<JsonArray>()) {
            log(infra::LogLevel::Error, "Motion library poses must be an array");
            return false;
        }
        if (!parsePoses(doc["poses"].as<JsonArrayConst>(), channels, poses)) {
            return false;
        }
        if (channels == 0 && !poses.empty()) {
            channels = poses.front().size();
        }
    }

    RecordedMotion motion;
    if (!doc["motion"].isNull()) {
        if (!doc["motion"].is<JsonArray>()) {
            log(infra::LogLevel::Error, "Motion library motion must be an array");
            return false;
        }
        if (!parseMotion(doc["motion"].as<JsonArrayConst>(), channels, motion)) {
            return false;
        }
    }

    m_poses = std::move(poses);
    m_motion = std::move(motion);
    return true;
}

bool MotionLibrary::parsePositions(JsonArrayConst array, size_t channels, Pose &out) {
    out.clear();
    for (JsonVariantConst value : array) {
        if (!value.is<int>()) {
            log(infra::LogLevel::Error, "Position values must be integers");
            return false;
        }
        out.push_back(value.as<int>());
    }
    if (channels != 0 && out.size() != channels) {
        log(infra::LogLevel::Error, "Expected %u channels, found %u",
            static_cast<unsigned>(channels), static_cast<unsigned>(out.size()));
        return false;
    }
    return true;
}

bool MotionLibrary::parsePoses(JsonArrayConst array, size_t channels, std::vector<Pose> &out) {
    for (JsonVariantConst entry : array) {
        if (!entry.is<JsonArrayConst>()) {
            log(infra::LogLevel::Error, "Pose #%u is not an array", static_cast<unsigned>(out.size() + 1));
            return false;
        }
        Pose pose;
        if (!parsePositions(entry.as<JsonArrayConst>(), channels, pose)) {
            log(infra::LogLevel::Error, "Pose #%u rejected", static_cast<unsigned>(out.size() + 1));
            return false;
        }
        if (channels == 0) {
            channels = pose.size();
        }
        out.push_back(pose);
    }
    return true;
}

bool MotionLibrary::parseMotion(JsonArrayConst array, size_t channels, RecordedMotion &out) {
    for (JsonVariantConst entry : array) {
        size_t index = out.frameCount();
        if (!entry["t"].is<unsigned int>() || !entry["p"].is<JsonArrayConst>()) {
            log(infra::LogLevel::Error, "Motion frame %u needs \"t\" and \"p\"", static_cast<unsigned>(index));
            return false;
        }

        MotionFrame frame;
        frame.timestampMs = entry["t"].as<unsigned int>();
        if (index == 0 && frame.timestampMs != 0) {
            log(infra::LogLevel::Error, "First motion frame must be at 0 ms (found %u)",
                static_cast<unsigned>(frame.timestampMs));
            return false;
        }
        if (index > 0 && frame.timestampMs <= out.frames.back().timestampMs) {
            log(infra::LogLevel::Error, "Motion timestamps must increase (frame %u at %u ms)",
                static_cast<unsigned>(index), static_cast<unsigned>(frame.timestampMs));
            return false;
        }
        if (!parsePositions(entry["p"].as<JsonArrayConst>(), channels, frame.positions)) {
            log(infra::LogLevel::Error, "Motion frame %u rejected", static_cast<unsigned>(index));
            return false;
        }
        if (channels == 0) {
            channels = frame.positions.size();
        }
        out.frames.push_back(frame);
    }
    return true;
}

std::string MotionLibrary::toJson() const {
    size_t channels = channelCount();
    size_t capacity = JSON_OBJECT_SIZE(4) + JSON_ARRAY_SIZE(m_poses.size()) + JSON_ARRAY_SIZE(m_motion.frameCount());
    for (const auto &pose : m_poses) {
        capacity += JSON_ARRAY_SIZE(pose.size());
    }
    for (const auto &frame : m_motion.frames) {
        capacity += JSON_OBJECT_SIZE(2) + JSON_ARRAY_SIZE(frame.positions.size());
    }

#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
    DynamicJsonDocument doc(capacity + 256);
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

    doc["version"] = kFormatVersion;
    doc["channels"] = static_cast<unsigned int>(channels);

    JsonArray poses = doc.createNestedArray("poses");
    for (const auto &pose : m_poses) {
        JsonArray values = poses.createNestedArray();
        for (int position : pose) {
            values.add(position);
        }
    }

    JsonArray motion = doc.createNestedArray("motion");
    for (const auto &frame : m_motion.frames) {
        JsonObject entry = motion.createNestedObject();
        entry["t"] = frame.timestampMs;
        JsonArray values = entry.createNestedArray("p");
        for (int position : frame.positions) {
            values.add(position);
        }
    }

    if (doc.overflowed()) {
        log(infra::LogLevel::Warn, "Motion library document overflowed; output is truncated");
    }

    std::string json;
    serializeJson(doc, json);
    return json;
}

infra::IFileSystem *MotionLibrary::resolveFileSystem() {
    if (m_fileSystem) {
        return m_fileSystem;
    }
    static infra::PosixFileSystem defaultFileSystem;
    return &defaultFileSystem;
}

void MotionLibrary::log(infra::LogLevel level, const char *fmt, ...) const {
    char buffer[256];
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
