#include "eol_lib/Interrupt.hpp"

#include <csignal>

namespace eol_lib {

namespace {
std::atomic<bool> g_interrupted{false};

void onSignal(int) { g_interrupted.store(true); }
}

std::atomic<bool>& interruptFlag() { return g_interrupted; }

void installInterruptHandler()
{
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
}

} // namespace eol_lib
