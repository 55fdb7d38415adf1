#include <repofetch/cli/commands.h>
#include <repofetch/version.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    CLI::App app{"Conditional fetcher and cache for channel index documents", "repofetch"};
    app.set_version_flag("--version", REPOFETCH_VERSION_STRING);
    app.require_subcommand(1);

    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("-q,--quiet", quiet, "Only log errors");

    // Logs go to stderr so --json output on stdout stays parseable.
    spdlog::set_default_logger(spdlog::stderr_color_mt("repofetch"));
    app.parse_complete_callback([&]() {
        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else if (quiet) {
            spdlog::set_level(spdlog::level::err);
        } else {
            spdlog::set_level(spdlog::level::info);
        }
    });

    repofetch::cli::registerFetchCommand(app);
    repofetch::cli::registerStateCommand(app);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        if (rc == 0 || e.get_name() == "RuntimeError" || e.get_name() == "CallForHelp" ||
            e.get_name() == "CallForAllHelp" || e.get_name() == "CallForVersion") {
            return rc;
        }
        return repofetch::cli::kExitUsage;
    }
    return repofetch::cli::kExitOk;
}
