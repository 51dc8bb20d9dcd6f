#pragma once
#include "Filter.hpp"
#include "Trimmer.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <stdexcept>

namespace eol_lib {

struct RunSummary {
    std::uint64_t filesProcessed    = 0;
    std::uint64_t filesModified     = 0;
    std::uint64_t totalBytesRemoved = 0;
};

class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("Operation cancelled by user") {}
};

class Walker {
public:
    Walker(FilterConfig config, std::ostream& out, std::ostream& err,
           const std::atomic<bool>* cancel = nullptr);

    // Walks `root` recursively, trims (or reports) every qualifying file and
    // prints the summary. Throws OperationCancelled when the cancel flag is
    // raised; no summary is printed in that case.
    RunSummary run(const std::filesystem::path& root) const;

private:
    void walkDirectory(const std::filesystem::path& dir, RunSummary& summary) const;
    void processFile(const std::filesystem::path& file, RunSummary& summary) const;
    void checkCancelled() const;

    FilterConfig             config_;
    Trimmer                  trimmer_;
    std::ostream&            out_;
    std::ostream&            err_;
    const std::atomic<bool>* cancel_;
};

void printSummary(std::ostream& out, const RunSummary& summary);

} // namespace eol_lib
