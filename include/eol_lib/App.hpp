#pragma once
#include <atomic>
#include <ostream>
#include <string>
#include <vector>

namespace eol_lib {

// Whole command: parse, validate, walk. Returns the process exit code
// (0 on success and for --help / --version, 1 on bad arguments, a bad target
// or cancellation). `args` excludes the program name.
int runApp(const std::vector<std::string>& args, const std::string& prog,
           std::ostream& out, std::ostream& err,
           const std::atomic<bool>* cancel = nullptr);

} // namespace eol_lib
