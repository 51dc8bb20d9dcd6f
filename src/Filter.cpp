#include "eol_lib/Filter.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace eol_lib {

static std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> FilterConfig::defaultExcludes()
{
    return {".git", "__pycache__", "node_modules", ".venv", "venv"};
}

std::filesystem::path cleanPath(const std::filesystem::path& path)
{
    std::filesystem::path out;
    for (const auto& part : path) {
        if (part.empty() || part == ".") continue;
        out /= part;
    }
    return out.empty() ? std::filesystem::path(".") : out;
}

std::string normalizeExtension(const std::string& ext)
{
    std::string lower = toLower(ext);
    if (lower.empty() || lower.front() != '.')
        lower.insert(lower.begin(), '.');
    return lower;
}

std::string extensionOf(const std::filesystem::path& path)
{
    const std::string name = path.filename().string();
    const auto dot = name.rfind('.');
    // ".bashrc" and "name." carry no extension
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size())
        return {};
    return toLower(name.substr(dot));
}

bool isBinaryExtension(const std::string& ext)
{
    static const std::unordered_set<std::string> binary {
        ".exe", ".dll", ".so", ".dylib", ".bin", ".obj", ".o",
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".ico", ".svg",
        ".mp3", ".mp4", ".avi", ".mov", ".wav", ".flac",
        ".zip", ".tar", ".gz", ".rar", ".7z",
        ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx"
    };
    return binary.count(toLower(ext)) != 0;
}

bool qualifies(const std::filesystem::path& path, const FilterConfig& config)
{
    const std::string ext = extensionOf(path);

    if (!config.extensions.empty() && !config.extensions.count(ext))
        return false;

    const std::string str = path.string();
    for (const auto& pattern : config.excludePatterns)
        if (str.find(pattern) != std::string::npos)
            return false;

    return !isBinaryExtension(ext);
}

} // namespace eol_lib
