#include "wav_reader.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <utility>

#include "infra/filesystem.h"
#include "infra/posix_filesystem.h"

static constexpr const char *TAG = "WavReader";

namespace {

constexpr uint16_t kFormatPcm = 0x0001;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t readLe16(const uint8_t *p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readLe32(const uint8_t *p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

bool hasTag(const uint8_t *p, const char *tag) {
    return std::memcmp(p, tag, 4) == 0;
}

}  // namespace

WavReader::WavReader()
    : m_fileSystem(nullptr),
      m_logSink(nullptr) {
}

void WavReader::setFileSystem(infra::IFileSystem *fileSystem) {
    m_fileSystem = fileSystem;
}

void WavReader::setLogSink(infra::ILogSink *sink) {
    m_logSink = sink;
}

infra::IFileSystem *WavReader::resolveFileSystem() {
    static infra::PosixFileSystem defaultFileSystem;
    return m_fileSystem ? m_fileSystem : &defaultFileSystem;
}

bool WavReader::read(const std::string &path, PcmAudio &out) {
    auto file = resolveFileSystem()->open(path.c_str(), infra::kFileRead);
    if (!file) {
        log(infra::LogLevel::Error, "Failed to open audio file: %s", path.c_str());
        return false;
    }

    std::vector<uint8_t> bytes;
    uint8_t chunk[4096];
    std::size_t count = 0;
    while ((count = file->readBytes(chunk, sizeof(chunk))) > 0) {
        bytes.insert(bytes.end(), chunk, chunk + count);
    }
    file->close();

    if (!parse(bytes, out)) {
        log(infra::LogLevel::Error, "Unsupported or malformed WAV file: %s", path.c_str());
        return false;
    }

    log(infra::LogLevel::Info, "Loaded %s (%u Hz, %u ch, %u bit, %u ms)", path.c_str(),
        static_cast<unsigned>(out.sampleRate), static_cast<unsigned>(out.channelCount),
        static_cast<unsigned>(out.bitsPerSample), static_cast<unsigned>(out.durationMs()));
    return true;
}

bool WavReader::parse(const std::vector<uint8_t> &bytes, PcmAudio &out) {
    if (bytes.size() < 12 || !hasTag(bytes.data(), "RIFF") || !hasTag(bytes.data() + 8, "WAVE")) {
        log(infra::LogLevel::Error, "Missing RIFF/WAVE header");
        return false;
    }

    PcmAudio parsed;
    bool haveFormat = false;
    bool haveData = false;
    size_t offset = 12;

    while (offset + 8 <= bytes.size()) {
        const uint8_t *header = bytes.data() + offset;
        uint32_t chunkSize = readLe32(header + 4);
        size_t bodyOffset = offset + 8;
        size_t available = bytes.size() - bodyOffset;

        if (hasTag(header, "fmt ")) {
            if (chunkSize < 16 || available < 16) {
                log(infra::LogLevel::Error, "fmt chunk too short (%u bytes)", static_cast<unsigned>(chunkSize));
                return false;
            }
            const uint8_t *body = bytes.data() + bodyOffset;
            uint16_t formatTag = readLe16(body);
            if (formatTag == kFormatExtensible && chunkSize >= 26 && available >= 26) {
                formatTag = readLe16(body + 24);
            }
            if (formatTag != kFormatPcm) {
                log(infra::LogLevel::Error, "Compressed WAV format 0x%04x not supported", formatTag);
                return false;
            }
            parsed.channelCount = readLe16(body + 2);
            parsed.sampleRate = readLe32(body + 4);
            parsed.bitsPerSample = readLe16(body + 14);
            haveFormat = true;
        } else if (hasTag(header, "data")) {
            // Truncated files report a larger chunk than they carry.
            size_t dataSize = chunkSize > available ? available : chunkSize;
            parsed.data.assign(bytes.begin() + bodyOffset, bytes.begin() + bodyOffset + dataSize);
            haveData = true;
        }

        // Chunks are word aligned.
        size_t advance = 8 + static_cast<size_t>(chunkSize) + (chunkSize & 1u);
        if (advance > bytes.size() - offset) {
            break;
        }
        offset += advance;
    }

    if (!haveFormat || !haveData) {
        log(infra::LogLevel::Error, "WAV file missing %s chunk", haveFormat ? "data" : "fmt");
        return false;
    }

    out = std::move(parsed);
    return true;
}

void WavReader::log(infra::LogLevel level, const char *fmt, ...) const {
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
