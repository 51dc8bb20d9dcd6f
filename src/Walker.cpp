/*============================================================================
  Walker.cpp  -  part of eoltrim
  --------------------------------------------------------------------------
  Recursive directory walk: prunes hidden subtrees, filters files, trims or
  reports each one and keeps the running summary.
============================================================================*/

#include "eol_lib/Walker.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace eol_lib {

// "." / "a.txt" is just "a.txt"
static fs::path childPath(const fs::path& dir, const fs::path& name)
{
    return dir == fs::path(".") ? name : dir / name;
}

static bool isHidden(const fs::path& p)
{
    const std::string name = p.filename().string();
    return !name.empty() && name.front() == '.';
}

Walker::Walker(FilterConfig config, std::ostream& out, std::ostream& err,
               const std::atomic<bool>* cancel)
    : config_(std::move(config)),
      trimmer_(config_.dryRun ? Trimmer::Mode::DryRun : Trimmer::Mode::Apply),
      out_(out), err_(err), cancel_(cancel)
{}

RunSummary Walker::run(const fs::path& root) const
{
    RunSummary summary;
    walkDirectory(cleanPath(root), summary);
    printSummary(out_, summary);
    return summary;
}

void Walker::checkCancelled() const
{
    if (cancel_ && cancel_->load())
        throw OperationCancelled();
}

void Walker::walkDirectory(const fs::path& dir, RunSummary& summary) const
{
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        entries.push_back(*it);
    if (ec) {
        err_ << "Error reading directory " << dir.string() << ": " << ec.message() << "\n";
        if (entries.empty()) return;
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& entry : entries) {
        checkCancelled();

        const fs::path p = childPath(dir, entry.path().filename());
        std::error_code sec;
        if (entry.is_directory(sec)) {
            // hidden subtrees are pruned whole; linked directories are not followed
            if (isHidden(p) || entry.is_symlink(sec)) continue;
            walkDirectory(p, summary);
        } else if (entry.is_regular_file(sec)) {
            if (isHidden(p)) continue;
            if (!qualifies(p, config_)) continue;
            processFile(p, summary);
        }
    }
}

void Walker::processFile(const fs::path& file, RunSummary& summary) const
{
    ++summary.filesProcessed;

    ProcessResult res;
    try {
        res = trimmer_.process(file.string());
    } catch (const std::exception& e) {
        err_ << (config_.dryRun ? "Error reading " : "Error processing ")
             << file.string() << ": " << e.what() << "\n";
        return;
    }

    if (!res.modified) return;

    ++summary.filesModified;
    summary.totalBytesRemoved += res.bytesRemoved;

    if (config_.dryRun)
        out_ << "WOULD MODIFY: " << file.string() << " (" << res.bytesRemoved << " bytes)\n";
    else
        out_ << "Modified: " << file.string() << " (" << res.bytesRemoved << " bytes removed)\n";
}

void printSummary(std::ostream& out, const RunSummary& summary)
{
    out << "\nSummary:\n"
        << "Files processed: "     << summary.filesProcessed    << "\n"
        << "Files modified: "      << summary.filesModified     << "\n"
        << "Total bytes removed: " << summary.totalBytesRemoved << "\n";
}

} // namespace eol_lib
