#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace eol_lib {

struct TrimResult {
    std::vector<char> content;
    std::size_t       bytesRemoved = 0;
};

struct ProcessResult {
    bool        modified     = false;
    std::size_t bytesRemoved = 0;
};

// Strips the run of '\n' / '\r' bytes at the end of `bytes`.
// A trailing "\r\n" pair is dropped in one step, any other newline byte alone,
// until the data is empty or ends in something else.
TrimResult trimTrailingNewlines(std::vector<char> bytes);

class Trimmer {
public:
    enum class Mode { Apply, DryRun };

    explicit Trimmer(Mode mode) : mode_(mode) {}

    // reads `path`, computes the trim and rewrites the file in Apply mode
    // when something was removed. I/O errors propagate as std::system_error.
    ProcessResult process(const std::string& path) const;

    Mode mode() const { return mode_; }

private:
    Mode mode_;
};

} // namespace eol_lib
