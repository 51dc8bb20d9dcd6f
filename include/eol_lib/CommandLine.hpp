#pragma once
#include "Filter.hpp"

#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace eol_lib {

inline constexpr const char* kVersion = "1.0.0";

struct CliOptions {
    std::filesystem::path    directory = ".";
    std::vector<std::string> extensions;   // raw, as typed
    std::vector<std::string> excludes = FilterConfig::defaultExcludes();
    bool                     dryRun  = false;
    bool                     help    = false;
    bool                     version = false;
};

class InvalidTarget : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// args excludes argv[0]. Throws std::invalid_argument on malformed input.
CliOptions parseCommandLine(const std::vector<std::string>& args);

FilterConfig makeFilterConfig(const CliOptions& opts);

// throws InvalidTarget when `dir` is missing or not a directory
void validateTarget(const std::filesystem::path& dir);

void printUsage(std::ostream& os, const std::string& prog);

void printRunHeader(std::ostream& os, const std::filesystem::path& dir, bool dryRun);

} // namespace eol_lib
