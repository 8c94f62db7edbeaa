#include <cstdio>
#include <string>

#include "app_controller.h"
#include "infra/log_sink.h"
#include "infra/signal_cancellation_source.h"
#include "infra/steady_time_provider.h"

int main(int argc, char** argv) {
    infra::SteadyTimeProvider timeProvider;
    infra::SignalCancellationSource cancellation;

    AppController::Options options;
    std::string error;
    if (!AppController::parseArguments(argc, argv, options, error)) {
        std::fprintf(stderr, "armsync: %s\n", error.c_str());
        std::fprintf(stderr, "Usage: armsync [--config <file>] <command> [args]\n");
        return 1;
    }

    if (!cancellation.install()) {
        std::fprintf(stderr, "armsync: Ctrl-C handler unavailable; sessions cannot be cancelled\n");
    }

    AppController app(timeProvider, cancellation, infra::getLogSink());
    return app.run(options);
}
