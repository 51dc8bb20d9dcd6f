#include "eol_lib/App.hpp"
#include "eol_lib/CommandLine.hpp"
#include "eol_lib/Walker.hpp"

namespace eol_lib {

int runApp(const std::vector<std::string>& args, const std::string& prog,
           std::ostream& out, std::ostream& err,
           const std::atomic<bool>* cancel)
{
    CliOptions opts;
    try {
        opts = parseCommandLine(args);
    } catch (const std::invalid_argument& e) {
        printUsage(err, prog);
        err << "\nError: " << e.what() << "\n";
        return 1;
    }

    if (opts.help) {
        printUsage(out, prog);
        return 0;
    }
    if (opts.version) {
        out << "eoltrim v" << kVersion << "\n";
        return 0;
    }

    try {
        validateTarget(opts.directory);
    } catch (const InvalidTarget& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }

    try {
        printRunHeader(out, opts.directory, opts.dryRun);
        Walker walker(makeFilterConfig(opts), out, err, cancel);
        walker.run(opts.directory);
    } catch (const OperationCancelled& e) {
        out.flush();
        err << "\n" << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace eol_lib
