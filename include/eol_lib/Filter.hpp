#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace eol_lib {

struct FilterConfig {
    std::set<std::string>    extensions;       // normalized (".txt"); empty == all
    std::vector<std::string> excludePatterns;  // plain substrings
    bool                     dryRun = false;

    static std::vector<std::string> defaultExcludes();
};

// Drops "." components and empty trailing parts, keeps "..": "./src/" -> "src".
// An empty result becomes ".". This is the form paths are printed and matched in.
std::filesystem::path cleanPath(const std::filesystem::path& path);

// ".TXT" -> ".txt", "py" -> ".py"
std::string normalizeExtension(const std::string& ext);

// lowercase suffix of the file name, "" when there is none
std::string extensionOf(const std::filesystem::path& path);

bool isBinaryExtension(const std::string& ext);

// Extension allow-list, exclude substrings and the built-in binary deny-list.
// Hidden names are the Walker's business, not checked here.
bool qualifies(const std::filesystem::path& path, const FilterConfig& config);

} // namespace eol_lib
