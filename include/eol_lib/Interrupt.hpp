#pragma once
#include <atomic>

namespace eol_lib {

// SIGINT / SIGTERM only raise a flag; the Walker polls it between entries.
void installInterruptHandler();

std::atomic<bool>& interruptFlag();

} // namespace eol_lib
