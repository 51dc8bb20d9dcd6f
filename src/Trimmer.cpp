#include "eol_lib/Trimmer.hpp"
#include "eol_lib/FileStream.hpp"

#include <utility>

namespace eol_lib {

static bool isNewline(char c) { return c == '\n' || c == '\r'; }

TrimResult trimTrailingNewlines(std::vector<char> bytes)
{
    const std::size_t original = bytes.size();

    while (!bytes.empty() && isNewline(bytes.back())) {
        const std::size_t n = bytes.size();
        if (n >= 2 && bytes[n - 2] == '\r' && bytes[n - 1] == '\n')
            bytes.resize(n - 2);
        else
            bytes.pop_back();
    }

    TrimResult res;
    res.bytesRemoved = original - bytes.size();
    res.content      = std::move(bytes);
    return res;
}

ProcessResult Trimmer::process(const std::string& path) const
{
    std::vector<char> data = FileReader::readAll(path);
    if (data.empty()) return {};

    TrimResult trimmed = trimTrailingNewlines(std::move(data));
    if (trimmed.bytesRemoved == 0) return {};

    if (mode_ == Mode::Apply)
        FileWriter::writeAll(path, trimmed.content);

    return {true, trimmed.bytesRemoved};
}

} // namespace eol_lib
