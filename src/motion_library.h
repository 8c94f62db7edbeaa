#ifndef MOTION_LIBRARY_H
#define MOTION_LIBRARY_H

#include <ArduinoJson.h>

#include <string>
#include <vector>

#include "infra/log_sink.h"
#include "pose.h"

namespace infra {
class IFileSystem;
}

/**
 * Saved poses and the current recorded motion, persisted as JSON:
 *
 *   {"version":1,"channels":6,
 *    "poses":[[2048,...],...],
 *    "motion":[{"t":0,"p":[2048,...]},...]}
 *
 * A load that fails validation leaves the library untouched.
 */
class MotionLibrary {
public:
    static constexpr int kFormatVersion = 1;

    MotionLibrary();

    void setFileSystem(infra::IFileSystem *fileSystem);
    void setLogSink(infra::ILogSink *sink);

    void savePose(const Pose &pose);
    void clearPoses();
    const std::vector<Pose> &poses() const { return m_poses; }
    size_t poseCount() const { return m_poses.size(); }

    void setRecordedMotion(const RecordedMotion &motion);
    void clearRecordedMotion();
    const RecordedMotion &recordedMotion() const { return m_motion; }

    bool load(const std::string &path);
    bool save(const std::string &path);

    bool fromJson(const std::string &json);
    std::string toJson() const;

private:
    bool parsePoses(JsonArrayConst array, size_t channels, std::vector<Pose> &out);
    bool parseMotion(JsonArrayConst array, size_t channels, RecordedMotion &out);
    bool parsePositions(JsonArrayConst array, size_t channels, Pose &out);
    size_t channelCount() const;
    infra::IFileSystem *resolveFileSystem();
    void log(infra::LogLevel level, const char *fmt, ...) const;

    std::vector<Pose> m_poses;
    RecordedMotion m_motion;

    infra::IFileSystem *m_fileSystem;
    infra::ILogSink *m_logSink;
};

#endif  // MOTION_LIBRARY_H
