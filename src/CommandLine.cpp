#include "eol_lib/CommandLine.hpp"

#include <system_error>

namespace eol_lib {

static bool looksLikeOption(const std::string& a)
{
    return a.size() > 1 && a[0] == '-';
}

// consumes values after args[i] up to the next option; i ends on the last one
static std::vector<std::string> takeValues(const std::vector<std::string>& args,
                                           std::size_t& i)
{
    const std::string flag = args[i];
    std::vector<std::string> values;
    while (i + 1 < args.size() && !looksLikeOption(args[i + 1]))
        values.push_back(args[++i]);
    if (values.empty())
        throw std::invalid_argument(flag + " requires at least one value");
    return values;
}

CliOptions parseCommandLine(const std::vector<std::string>& args)
{
    CliOptions opts;
    bool haveDirectory = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        if (a == "--help" || a == "-h") {
            opts.help = true;
            return opts;
        }
        if (a == "--version" || a == "-v") {
            opts.version = true;
            return opts;
        }
        if (a == "--dry-run") {
            opts.dryRun = true;
            continue;
        }
        if (a == "--extensions") {
            opts.extensions = takeValues(args, i);
            continue;
        }
        if (a == "--exclude") {
            opts.excludes = takeValues(args, i);
            continue;
        }
        // "--flag=value" carries exactly one value
        if (a.rfind("--extensions=", 0) == 0) {
            opts.extensions = {a.substr(13)};
            continue;
        }
        if (a.rfind("--exclude=", 0) == 0) {
            opts.excludes = {a.substr(10)};
            continue;
        }
        if (looksLikeOption(a))
            throw std::invalid_argument("Unknown option: " + a);

        if (haveDirectory)
            throw std::invalid_argument("Extra positional argument: " + a);
        opts.directory = a;
        haveDirectory  = true;
    }
    return opts;
}

FilterConfig makeFilterConfig(const CliOptions& opts)
{
    FilterConfig cfg;
    for (const auto& ext : opts.extensions)
        cfg.extensions.insert(normalizeExtension(ext));
    cfg.excludePatterns = opts.excludes;
    cfg.dryRun          = opts.dryRun;
    return cfg;
}

void validateTarget(const std::filesystem::path& dir)
{
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec))
        throw InvalidTarget("Directory '" + dir.string() + "' does not exist");
    if (!std::filesystem::is_directory(dir, ec))
        throw InvalidTarget("'" + dir.string() + "' is not a directory");
}

void printUsage(std::ostream& os, const std::string& prog)
{
    os << "Usage: " << prog << " [directory] [--extensions EXT...] [--exclude PATTERN...] [--dry-run]\n"
       << "\nRecursively remove trailing newlines from files\n"
       << "\nArguments:\n"
       << "  directory              - Directory to process (default: current directory)\n"
       << "\nOptions:\n"
       << "  --extensions EXT...    - File extensions to include (e.g. .txt .py .js)\n"
       << "  --exclude PATTERN...   - Path substrings to exclude\n"
       << "                           (default: .git __pycache__ node_modules .venv venv)\n"
       << "  --dry-run              - Show what would be done without modifying files\n"
       << "  -h, --help             - Show this help\n"
       << "  -v, --version          - Show version\n"
       << "\nExamples:\n"
       << "  " << prog << " /path/to/directory\n"
       << "  " << prog << " . --extensions .txt .py .js\n"
       << "  " << prog << " /code --exclude node_modules __pycache__ .git\n"
       << "  " << prog << " . --dry-run\n";
}

void printRunHeader(std::ostream& os, const std::filesystem::path& dir, bool dryRun)
{
    os << "Processing directory: " << cleanPath(dir).string() << "\n";
    if (dryRun)
        os << "DRY RUN MODE - No files will be modified\n";
    os << "\n";
}

} // namespace eol_lib
