#ifndef INFRA_STEADY_TIME_PROVIDER_H
#define INFRA_STEADY_TIME_PROVIDER_H

#include <chrono>
#include <thread>

#include "infra/time_provider.h"

namespace infra {

// Milliseconds since construction on the monotonic clock.
class SteadyTimeProvider : public ITimeProvider {
public:
    SteadyTimeProvider()
        : m_origin(std::chrono::steady_clock::now()) {}

    uint32_t nowMillis() const override {
        return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::steady_clock::now() - m_origin)
                                         .count());
    }

    uint64_t nowMicros() const override {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                         std::chrono::steady_clock::now() - m_origin)
                                         .count());
    }

    void delayMillis(uint32_t ms) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }

private:
    std::chrono::steady_clock::time_point m_origin;
};

}  // namespace infra

#endif  // INFRA_STEADY_TIME_PROVIDER_H
