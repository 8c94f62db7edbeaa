#include "servo_bank.h"

#include <algorithm>
#include <utility>

#include "logging_manager.h"

static constexpr const char *TAG = "ServoBank";

ServoBank::ServoBank(IServoBus &bus, const std::vector<uint8_t> &ids, int minPosition, int maxPosition)
    : m_bus(bus),
      m_ids(ids),
      m_minPosition(minPosition),
      m_maxPosition(maxPosition),
      m_writeFailures(0),
      m_readFailures(0)
{
    if (m_minPosition > m_maxPosition) {
        std::swap(m_minPosition, m_maxPosition);
    }
    // Unknown until the first read; assume the middle of travel.
    m_lastKnown.assign(m_ids.size(), m_minPosition + (m_maxPosition - m_minPosition) / 2);
}

void ServoBank::setLimits(int minPosition, int maxPosition)
{
    m_minPosition = std::min(minPosition, maxPosition);
    m_maxPosition = std::max(minPosition, maxPosition);
}

int ServoBank::clampPosition(int position) const
{
    return std::max(m_minPosition, std::min(m_maxPosition, position));
}

bool ServoBank::writeChannel(size_t channel, int position)
{
    if (channel >= m_ids.size()) {
        LOG_WARN(TAG, "Write to unknown channel %u ignored", static_cast<unsigned>(channel));
        ++m_writeFailures;
        return false;
    }

    int clamped = clampPosition(position);
    if (!m_bus.writePosition(m_ids[channel], clamped)) {
        LOG_WARN(TAG, "Write failed for servo %u (channel %u, position %d)",
                 static_cast<unsigned>(m_ids[channel]), static_cast<unsigned>(channel), clamped);
        ++m_writeFailures;
        return false;
    }

    m_lastKnown[channel] = clamped;
    return true;
}

bool ServoBank::writeAll(const Pose &positions)
{
    if (positions.size() != m_ids.size()) {
        LOG_DEBUG(TAG, "Pose has %u channels, bank has %u; writing the overlap",
                  static_cast<unsigned>(positions.size()), static_cast<unsigned>(m_ids.size()));
    }

    bool ok = true;
    size_t count = std::min(positions.size(), m_ids.size());
    for (size_t channel = 0; channel < count; ++channel) {
        if (!writeChannel(channel, positions[channel])) {
            ok = false;
        }
    }
    return ok;
}

Pose ServoBank::readAll()
{
    Pose positions(m_ids.size(), 0);
    for (size_t channel = 0; channel < m_ids.size(); ++channel) {
        int value = 0;
        if (m_bus.readPosition(m_ids[channel], value)) {
            m_lastKnown[channel] = value;
        } else {
            LOG_WARN(TAG, "Read failed for servo %u; using last known position %d",
                     static_cast<unsigned>(m_ids[channel]), m_lastKnown[channel]);
            ++m_readFailures;
        }
        positions[channel] = m_lastKnown[channel];
    }
    return positions;
}
