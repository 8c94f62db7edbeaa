#include "amplitude_envelope.h"

#include <algorithm>
#include <cmath>

#include "logging_manager.h"

static constexpr const char *TAG = "Envelope";

namespace {

// Sign-extends one little-endian sample and scales it to [-1, 1].
float decodeSample(const uint8_t *p, uint16_t bitsPerSample) {
    switch (bitsPerSample) {
        case 8:
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16: {
            int16_t value = static_cast<int16_t>(static_cast<uint16_t>(p[0] | (p[1] << 8)));
            return static_cast<float>(value) / 32768.0f;
        }
        case 24: {
            int32_t value = static_cast<int32_t>(static_cast<uint32_t>(p[0]) << 8 |
                                                 static_cast<uint32_t>(p[1]) << 16 |
                                                 static_cast<uint32_t>(p[2]) << 24) >> 8;
            return static_cast<float>(value) / 8388608.0f;
        }
        case 32: {
            int32_t value = static_cast<int32_t>(static_cast<uint32_t>(p[0]) |
                                                 static_cast<uint32_t>(p[1]) << 8 |
                                                 static_cast<uint32_t>(p[2]) << 16 |
                                                 static_cast<uint32_t>(p[3]) << 24);
            return static_cast<float>(static_cast<double>(value) / 2147483648.0);
        }
        default:
            return 0.0f;
    }
}

}  // namespace

AmplitudeEnvelope::AmplitudeEnvelope()
    : m_audioDurationMs(0),
      m_chunkMs(kDefaultChunkMs) {
}

bool AmplitudeEnvelope::decodeToMono(const PcmAudio &audio, std::vector<float> &mono) {
    mono.clear();
    if (audio.bitsPerSample != 8 && audio.bitsPerSample != 16 &&
        audio.bitsPerSample != 24 && audio.bitsPerSample != 32) {
        LOG_ERROR(TAG, "Unsupported sample width: %u bits", static_cast<unsigned>(audio.bitsPerSample));
        return false;
    }
    if (audio.channelCount == 0 || audio.sampleRate == 0) {
        LOG_ERROR(TAG, "Invalid audio format (channels=%u, rate=%u)",
                  static_cast<unsigned>(audio.channelCount), static_cast<unsigned>(audio.sampleRate));
        return false;
    }

    const size_t bytesPerSample = audio.bitsPerSample / 8;
    const size_t frames = audio.frameCount();
    mono.reserve(frames);

    const uint8_t *cursor = audio.data.data();
    for (size_t frame = 0; frame < frames; ++frame) {
        float sum = 0.0f;
        for (uint16_t channel = 0; channel < audio.channelCount; ++channel) {
            sum += decodeSample(cursor, audio.bitsPerSample);
            cursor += bytesPerSample;
        }
        mono.push_back(sum / static_cast<float>(audio.channelCount));
    }
    return true;
}

bool AmplitudeEnvelope::build(const PcmAudio &audio, uint32_t chunkMs) {
    m_points.clear();
    m_audioDurationMs = 0;

    std::vector<float> mono;
    if (!decodeToMono(audio, mono)) {
        return false;
    }

    buildFromSamples(mono, audio.sampleRate, chunkMs);
    LOG_DEBUG(TAG, "Built %u envelope points over %u ms (chunk=%u ms)",
              static_cast<unsigned>(m_points.size()), static_cast<unsigned>(m_audioDurationMs),
              static_cast<unsigned>(m_chunkMs));
    return true;
}

void AmplitudeEnvelope::buildFromSamples(const std::vector<float> &samples, uint32_t sampleRate, uint32_t chunkMs) {
    m_points.clear();
    m_chunkMs = chunkMs == 0 ? kDefaultChunkMs : chunkMs;
    m_audioDurationMs = 0;
    if (sampleRate == 0) {
        return;
    }
    m_audioDurationMs = static_cast<uint32_t>((static_cast<uint64_t>(samples.size()) * 1000ULL) / sampleRate);

    size_t chunkSamples = static_cast<size_t>((static_cast<uint64_t>(sampleRate) * m_chunkMs) / 1000ULL);
    if (chunkSamples == 0) {
        chunkSamples = 1;
    }

    float maxAmplitude = 0.0f;
    for (size_t start = 0; start < samples.size(); start += chunkSamples) {
        size_t end = std::min(samples.size(), start + chunkSamples);
        double sumSquares = 0.0;
        for (size_t i = start; i < end; ++i) {
            sumSquares += static_cast<double>(samples[i]) * samples[i];
        }

        Point point;
        point.timeMs = static_cast<float>(static_cast<double>(start) * 1000.0 / sampleRate);
        point.amplitude = static_cast<float>(std::sqrt(sumSquares / static_cast<double>(end - start)));
        maxAmplitude = std::max(maxAmplitude, point.amplitude);
        m_points.push_back(point);
    }

    if (maxAmplitude > 0.0f) {
        for (auto &point : m_points) {
            point.amplitude = point.amplitude / maxAmplitude;
        }
    } else if (!m_points.empty()) {
        LOG_INFO(TAG, "Audio is silent; jaw will stay closed");
    }
}

float AmplitudeEnvelope::amplitudeAt(float timeMs) const {
    if (m_points.empty() || timeMs < m_points.front().timeMs) {
        return 0.0f;
    }
    if (timeMs >= m_points.back().timeMs) {
        return m_points.back().amplitude;
    }

    auto upper = std::upper_bound(m_points.begin(), m_points.end(), timeMs,
                                  [](float t, const Point &point) { return t < point.timeMs; });
    const Point &after = *upper;
    const Point &before = *(upper - 1);
    float span = after.timeMs - before.timeMs;
    if (span <= 0.0f) {
        return before.amplitude;
    }
    float factor = (timeMs - before.timeMs) / span;
    return before.amplitude + (after.amplitude - before.amplitude) * factor;
}
