#ifndef SERVO_BANK_H
#define SERVO_BANK_H

#include <stdint.h>

#include <vector>

#include "playback_engine.h"

// Transport to individual bus servos. Implementations own the wire protocol.
class IServoBus {
public:
    virtual ~IServoBus() = default;
    virtual bool writePosition(uint8_t id, int position) = 0;
    virtual bool readPosition(uint8_t id, int &position) = 0;
};

// Maps playback channels onto bus ids and keeps every command inside the
// device range. I/O failures are logged and counted, never retried.
class ServoBank : public PlaybackEngine::IActuator {
public:
    ServoBank(IServoBus &bus, const std::vector<uint8_t> &ids, int minPosition = 0, int maxPosition = 4095);

    size_t channelCount() const override { return m_ids.size(); }
    bool writeChannel(size_t channel, int position) override;
    bool writeAll(const Pose &positions) override;
    Pose readAll() override;

    int clampPosition(int position) const;
    void setLimits(int minPosition, int maxPosition);
    int minPosition() const { return m_minPosition; }
    int maxPosition() const { return m_maxPosition; }

    const std::vector<uint8_t> &ids() const { return m_ids; }
    const Pose &lastKnown() const { return m_lastKnown; }
    uint32_t writeFailures() const { return m_writeFailures; }
    uint32_t readFailures() const { return m_readFailures; }

private:
    IServoBus &m_bus;
    std::vector<uint8_t> m_ids;
    int m_minPosition;
    int m_maxPosition;
    Pose m_lastKnown;
    uint32_t m_writeFailures;
    uint32_t m_readFailures;
};

#endif  // SERVO_BANK_H
