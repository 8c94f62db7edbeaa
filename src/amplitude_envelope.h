#ifndef AMPLITUDE_ENVELOPE_H
#define AMPLITUDE_ENVELOPE_H

#include <stdint.h>

#include <vector>

#include "pcm_audio.h"

/**
 * Normalized loudness over time, built once from decoded audio.
 *
 * Samples are chunk RMS values tagged with the chunk start time and scaled so
 * the loudest chunk reads exactly 1.0. Silent audio stays flat at 0.
 */
class AmplitudeEnvelope {
public:
    struct Point {
        float timeMs = 0.0f;
        float amplitude = 0.0f;
    };

    static constexpr uint32_t kDefaultChunkMs = 30;

    AmplitudeEnvelope();

    // Rejects unsupported bit depths and empty formats; leaves the envelope
    // empty in that case.
    bool build(const PcmAudio &audio, uint32_t chunkMs = kDefaultChunkMs);

    // Builds from mono samples already scaled to [-1, 1].
    void buildFromSamples(const std::vector<float> &samples, uint32_t sampleRate, uint32_t chunkMs);

    float amplitudeAt(float timeMs) const;

    const std::vector<Point> &points() const { return m_points; }
    bool empty() const { return m_points.empty(); }
    uint32_t audioDurationMs() const { return m_audioDurationMs; }
    uint32_t chunkMs() const { return m_chunkMs; }

    static bool decodeToMono(const PcmAudio &audio, std::vector<float> &mono);

private:
    std::vector<Point> m_points;
    uint32_t m_audioDurationMs;
    uint32_t m_chunkMs;
};

#endif  // AMPLITUDE_ENVELOPE_H
