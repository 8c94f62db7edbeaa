#ifndef WAV_READER_H
#define WAV_READER_H

#include <string>
#include <vector>

#include "infra/log_sink.h"
#include "pcm_audio.h"

namespace infra {
class IFileSystem;
}

// Reads uncompressed PCM RIFF/WAVE files (format tag 1, or WAVE_FORMAT_EXTENSIBLE
// carrying PCM) into PcmAudio.
class WavReader {
public:
    WavReader();

    void setFileSystem(infra::IFileSystem *fileSystem);
    void setLogSink(infra::ILogSink *sink);

    bool read(const std::string &path, PcmAudio &out);
    bool parse(const std::vector<uint8_t> &bytes, PcmAudio &out);

private:
    infra::IFileSystem *resolveFileSystem();
    void log(infra::LogLevel level, const char *fmt, ...) const;

    infra::IFileSystem *m_fileSystem;
    infra::ILogSink *m_logSink;
};

#endif  // WAV_READER_H
