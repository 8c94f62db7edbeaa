#ifndef INFRA_SIGNAL_CANCELLATION_SOURCE_H
#define INFRA_SIGNAL_CANCELLATION_SOURCE_H

#include "cancellation_source.h"

namespace infra {

/**
 * Latches SIGINT so Ctrl-C stops the running session instead of the process.
 * Only one instance may be installed at a time; the previous handler is
 * restored on destruction.
 */
class SignalCancellationSource : public ICancellationSource {
public:
    SignalCancellationSource();
    ~SignalCancellationSource() override;

    bool install();
    void uninstall();
    bool isInstalled() const { return m_installed; }

    bool pollCancelRequested() override;

private:
    bool m_installed;
};

} // namespace infra

#endif // INFRA_SIGNAL_CANCELLATION_SOURCE_H
