#include "signal_cancellation_source.h"

#include <atomic>
#include <csignal>

#include "log_sink.h"

namespace infra {

namespace {

constexpr const char *kTag = "Cancel";

std::atomic<int> g_pendingInterrupts{0};
struct sigaction g_previousAction;

void handleInterrupt(int) {
    g_pendingInterrupts.fetch_add(1);
}

}  // namespace

SignalCancellationSource::SignalCancellationSource()
    : m_installed(false) {
}

SignalCancellationSource::~SignalCancellationSource() {
    uninstall();
}

bool SignalCancellationSource::install() {
    if (m_installed) {
        return true;
    }

    struct sigaction action;
    action.sa_handler = handleInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, &g_previousAction) != 0) {
        emitLog(LogLevel::Error, kTag, "Failed to install SIGINT handler");
        return false;
    }

    g_pendingInterrupts.store(0);
    m_installed = true;
    emitLog(LogLevel::Debug, kTag, "SIGINT handler installed");
    return true;
}

void SignalCancellationSource::uninstall() {
    if (!m_installed) {
        return;
    }
    sigaction(SIGINT, &g_previousAction, nullptr);
    m_installed = false;
}

bool SignalCancellationSource::pollCancelRequested() {
    return g_pendingInterrupts.exchange(0) > 0;
}

} // namespace infra
