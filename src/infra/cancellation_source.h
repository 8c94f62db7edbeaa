#ifndef INFRA_CANCELLATION_SOURCE_H
#define INFRA_CANCELLATION_SOURCE_H

namespace infra {

// Non-blocking cancel poll. A request is reported once; the read drains it.
class ICancellationSource {
public:
    virtual ~ICancellationSource() = default;
    virtual bool pollCancelRequested() = 0;
};

} // namespace infra

#endif // INFRA_CANCELLATION_SOURCE_H
