#ifndef PCM_AUDIO_H
#define PCM_AUDIO_H

#include <stddef.h>
#include <stdint.h>

#include <vector>

// Interleaved little-endian PCM as stored in a WAV data chunk.
struct PcmAudio {
    uint32_t sampleRate = 0;
    uint16_t channelCount = 0;
    uint16_t bitsPerSample = 0;
    std::vector<uint8_t> data;

    size_t bytesPerFrame() const {
        return static_cast<size_t>(channelCount) * (bitsPerSample / 8);
    }

    size_t frameCount() const {
        size_t frameBytes = bytesPerFrame();
        return frameBytes == 0 ? 0 : data.size() / frameBytes;
    }

    uint32_t durationMs() const {
        if (sampleRate == 0) {
            return 0;
        }
        return static_cast<uint32_t>((static_cast<uint64_t>(frameCount()) * 1000ULL) / sampleRate);
    }
};

#endif  // PCM_AUDIO_H
