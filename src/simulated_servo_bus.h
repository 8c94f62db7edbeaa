#ifndef SIMULATED_SERVO_BUS_H
#define SIMULATED_SERVO_BUS_H

#include <stdint.h>

#include <map>
#include <vector>

#include "servo_bank.h"

// In-memory bus for running sessions without hardware. Servos report the
// last commanded position; unseen ids start at the configured rest position.
class SimulatedServoBus : public IServoBus {
public:
    SimulatedServoBus(const std::vector<uint8_t> &ids, int restPosition);

    bool writePosition(uint8_t id, int position) override;
    bool readPosition(uint8_t id, int &position) override;

    uint32_t writeCount() const { return m_writeCount; }

private:
    std::map<uint8_t, int> m_positions;
    int m_restPosition;
    uint32_t m_writeCount;
};

#endif  // SIMULATED_SERVO_BUS_H
