#include "sync/Interrupt.hpp"

#include <csignal>
#include <cstdlib>

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void onSignal(int) {
    if (g_interrupted.exchange(true)) std::_Exit(130);
}

}

namespace ms::sync::interrupt {

void install() {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
}

std::atomic<bool>& flag() { return g_interrupted; }

void reset() { g_interrupted = false; }

}
