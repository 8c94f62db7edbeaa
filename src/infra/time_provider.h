#ifndef INFRA_TIME_PROVIDER_H
#define INFRA_TIME_PROVIDER_H

#include <stdint.h>

namespace infra {

/**
 * Interface surface for time queries and bounded waits.
 * Lets host tests advance simulated time instead of sleeping.
 */
class ITimeProvider {
public:
    virtual ~ITimeProvider() = default;
    virtual uint32_t nowMillis() const = 0;
    virtual uint64_t nowMicros() const = 0;
    virtual void delayMillis(uint32_t ms) = 0;
};

}  // namespace infra

#endif  // INFRA_TIME_PROVIDER_H
