#include "simulated_servo_bus.h"

#include "logging_manager.h"

static constexpr const char *TAG = "SimBus";

SimulatedServoBus::SimulatedServoBus(const std::vector<uint8_t> &ids, int restPosition)
    : m_restPosition(restPosition),
      m_writeCount(0) {
    for (uint8_t id : ids) {
        m_positions[id] = restPosition;
    }
}

bool SimulatedServoBus::writePosition(uint8_t id, int position) {
    auto it = m_positions.find(id);
    if (it == m_positions.end()) {
        LOG_WARN(TAG, "No servo with id %u on the bus", static_cast<unsigned>(id));
        return false;
    }
    if (it->second != position) {
        LOG_VERBOSE(TAG, "Servo %u -> %d", static_cast<unsigned>(id), position);
    }
    it->second = position;
    ++m_writeCount;
    return true;
}

bool SimulatedServoBus::readPosition(uint8_t id, int &position) {
    auto it = m_positions.find(id);
    if (it == m_positions.end()) {
        position = m_restPosition;
        return false;
    }
    position = it->second;
    return true;
}
