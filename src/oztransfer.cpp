#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"
#include "oztransfer/orchestrator.hpp"
#include "oztransfer/process.hpp"
#include "oztransfer/version.hpp"

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <exception>
#include <string>

namespace po = boost::program_options;

// Exit code for a malformed command line.
constexpr int usage_error = 1;

auto print_usage_info() noexcept -> void;

auto print_version_info() noexcept -> void;

int main(int _argc, char* _argv[])
{
    po::options_description desc{""};
    desc.add_options()
        ("log-level", po::value<std::string>()->default_value("info"), "")
        ("log-file", po::value<std::string>(), "")
        ("structured-log", "")
        ("summary-file", po::value<std::string>(), "")
        ("config-file", po::value<std::string>(), "")
        ("help,h", "")
        ("version,v", "");

    po::positional_options_description pod;
    pod.add("config-file", 1);

    po::variables_map vm;

    try {
        po::store(po::command_line_parser(_argc, _argv).options(desc).positional(pod).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        print_usage_info();
        return usage_error;
    }

    if (vm.count("help")) {
        print_usage_info();
        return 0;
    }

    if (vm.count("version")) {
        print_version_info();
        return 0;
    }

    if (!vm.count("config-file")) {
        fmt::print(stderr, "Error: Missing CONFIG_FILE argument.\n");
        print_usage_info();
        return usage_error;
    }

    try {
        namespace logging = oztransfer::log;

        logging::init_options log_options;
        log_options.log_level = logging::to_level(vm["log-level"].as<std::string>());
        log_options.structured = vm.count("structured-log") > 0;

        if (vm.count("log-file")) {
            log_options.log_file = vm["log-file"].as<std::string>();
        }

        logging::init(log_options);

        oztransfer::process_runner runner;
        oztransfer::run_summary summary;

        const auto ec = oztransfer::run_pipeline(vm["config-file"].as<std::string>(),
                                                 runner,
                                                 oztransfer::execution_environment::inherit(),
                                                 summary);

        if (vm.count("summary-file")) {
            oztransfer::write_summary(summary, vm["summary-file"].as<std::string>());
        }

        return ec;
    }
    catch (const oztransfer::exception& e) {
        fmt::print(stderr, "Error: {}", e.client_display_what());
        return oztransfer::exit_code_for(e.code());
    }
    catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return oztransfer::exit_code_for(SYS_INTERNAL_ERR);
    }
}

auto print_usage_info() noexcept -> void
{
    fmt::print(R"_(oztransfer - Copy a data set from HDFS to a remote Ozone service

Usage: oztransfer [OPTION]... CONFIG_FILE

Reads the KEY=value settings in CONFIG_FILE, prepares a client configuration
for the remote Ozone service, finds its current Ozone Manager leader, checks
that both clusters are reachable and runs DistCp on the manifest named by
SOURCE_DISTCP_FILE.

The destination path is derived from the first manifest entry by removing
the scheme, authority and SOURCE_ROOT_PREFIX and dropping the last component.

Options:
      --log-level=LEVEL  One of trace, debug, info, warn, error or critical.
                         Defaults to info.
      --log-file=PATH    Also write log records to PATH.
      --structured-log   Write log records as JSON objects.
      --summary-file=PATH
                         Write a JSON summary of the run to PATH.
  -h, --help             Display this help message and exit.
  -v, --version          Display version information and exit.

Exit status:
  0   DistCp completed successfully.
  1   Invalid command line.
  2   Configuration error.
  3   Client environment error.
  4   Leader discovery failed.
  5   Destination path could not be derived.
  6   Ticket login failed.
  7   Source or destination unreachable.
  8   Manifest staging failed.
  9   An external command could not be run.
  10  Internal error.
  Otherwise the exit status of DistCp.
)_");
}

auto print_version_info() noexcept -> void
{
    fmt::print("oztransfer {}.{}.{}\n", OZTRANSFER_VERSION_MAJOR, OZTRANSFER_VERSION_MINOR, OZTRANSFER_VERSION_PATCH);
}
