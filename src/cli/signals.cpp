#include "cli/signals.hpp"

#include <atomic>
#include <csignal>

namespace {
std::atomic shouldCancel = false;

void signalHandler(int) {
    shouldCancel = true;
}
}

namespace cw::cli {

void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

bool interruptRequested() { return shouldCancel; }

}
