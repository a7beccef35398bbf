#include "pagesrestore/Config.hpp"
#include "pagesrestore/Errors.hpp"
#include "pagesrestore/cluster/ClusterFinalizer.hpp"
#include "pagesrestore/core/DeploymentMode.hpp"
#include "pagesrestore/core/Environment.hpp"
#include "pagesrestore/core/RestorePipeline.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"
#include "pagesrestore/remote/HostSpec.hpp"
#include "pagesrestore/remote/RemoteShell.hpp"
#include "pagesrestore/routing/RouteOracle.hpp"
#include "pagesrestore/transfer/Transferrer.hpp"

#include <cstddef>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifndef PAGESRESTORE_VERSION
#define PAGESRESTORE_VERSION "v1.0.0"
#endif

namespace {

constexpr std::string_view kVersion = PAGESRESTORE_VERSION;

using pagesrestore::throw_config_error;

struct CommandLine {
    std::optional<std::string> host;
    std::optional<std::string> snapshot;
    std::optional<std::string> data_dir;
    std::optional<std::string> remote_data_dir;
    std::optional<bool> cluster;
    std::optional<std::size_t> transfer_parallelism;
    std::optional<std::size_t> finalize_parallelism;
    bool verbose{false};
    bool quiet{false};
    bool help{false};
    bool version{false};
};

void print_usage(std::ostream& out) {
    out << "Usage: restore-pages [options] <host>\n\n"
        << "Restore the pages of a snapshot onto <host> ([user@]host[:port]).\n\n"
        << "Options:\n"
        << "  --snapshot <label>        Snapshot to restore (default: current)\n"
        << "  --data-dir <path>         Local backup data directory\n"
        << "  --remote-data-dir <path>  Live storage root on the target\n"
        << "  --cluster                 Restore onto a cluster through its head node\n"
        << "  --no-cluster              Restore onto a single host\n"
        << "  --parallel <n>            Concurrent node transfers (0 = one per node, default 1)\n"
        << "  --finalize-parallel <n>   Concurrent finalize calls (0 = head node slots)\n"
        << "  --verbose, -v             Emit debug events\n"
        << "  --quiet                   Suppress structured log events\n"
        << "  --version                 Print the version and exit\n"
        << "  --help, -h                Print this help message\n\n"
        << "Environment: RESTORE_DATA_DIR, RESTORE_SNAPSHOT, RESTORE_REMOTE_DATA_DIR, RESTORE_CLUSTER,\n"
        << "RESTORE_EXTRA_SSH_OPTS, RESTORE_SSH, RESTORE_RSYNC, RESTORE_ROUTE_COMMAND,\n"
        << "RESTORE_FINALIZE_COMMAND, RESTORE_NODES_COMMAND, RESTORE_STORAGE_USER,\n"
        << "RESTORE_TRANSFER_PARALLEL, RESTORE_FINALIZE_PARALLEL, RESTORE_VERBOSE" << std::endl;
}

void print_config_error(const pagesrestore::ConfigError& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

std::size_t parse_count_option(std::string_view option, const std::string& value) {
    std::size_t parsed = 0;
    if (!pagesrestore::parse_count_text(value, parsed)) {
        throw_config_error("E_INVALID_NUMBER",
                           std::string(option) + " must be a non-negative integer",
                           "For example: " + std::string(option) + " 4");
    }
    return parsed;
}

CommandLine parse_command_line(int argc, char** argv) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc));
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    CommandLine cli{};
    std::size_t index = 0;

    auto require_value = [&](std::string_view option) -> std::string {
        if (index >= args.size()) {
            throw_config_error("E_MISSING_VALUE",
                               std::string(option) + " requires a value",
                               "Provide an argument immediately after " + std::string(option));
        }
        return std::string(args[index++]);
    };

    auto reject_duplicate = [](bool already_set, std::string_view option) {
        if (already_set) {
            throw_config_error("E_DUPLICATE_OPTION",
                               "Option " + std::string(option) + " specified multiple times",
                               "Provide " + std::string(option) + " only once");
        }
    };

    bool options_done = false;
    while (index < args.size()) {
        const auto arg = args[index++];
        if (options_done || !arg.starts_with("-") || arg == "-") {
            if (cli.host.has_value()) {
                throw_config_error("E_UNEXPECTED_ARGUMENT",
                                   "Unexpected argument: " + std::string(arg),
                                   "restore-pages takes a single host argument");
            }
            cli.host = std::string(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            cli.help = true;
            continue;
        }
        if (arg == "--version") {
            cli.version = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v") {
            cli.verbose = true;
            continue;
        }
        if (arg == "--quiet") {
            cli.quiet = true;
            continue;
        }
        if (arg == "--snapshot") {
            reject_duplicate(cli.snapshot.has_value(), arg);
            cli.snapshot = require_value(arg);
            continue;
        }
        if (arg == "--data-dir") {
            reject_duplicate(cli.data_dir.has_value(), arg);
            cli.data_dir = require_value(arg);
            continue;
        }
        if (arg == "--remote-data-dir") {
            reject_duplicate(cli.remote_data_dir.has_value(), arg);
            cli.remote_data_dir = require_value(arg);
            continue;
        }
        if (arg == "--cluster" || arg == "--no-cluster") {
            if (cli.cluster.has_value()) {
                throw_config_error("E_DUPLICATE_OPTION",
                                   "Cluster options specified multiple times",
                                   "Use either --cluster or --no-cluster once");
            }
            cli.cluster = arg == "--cluster";
            continue;
        }
        if (arg == "--parallel") {
            reject_duplicate(cli.transfer_parallelism.has_value(), arg);
            cli.transfer_parallelism = parse_count_option(arg, require_value(arg));
            continue;
        }
        if (arg == "--finalize-parallel") {
            reject_duplicate(cli.finalize_parallelism.has_value(), arg);
            cli.finalize_parallelism = parse_count_option(arg, require_value(arg));
            continue;
        }

        throw_config_error("E_UNKNOWN_OPTION",
                           "Unknown option: " + std::string(arg),
                           "Run 'restore-pages --help' to see the available options");
    }

    return cli;
}

void apply_command_line(const CommandLine& cli, pagesrestore::Config& config) {
    if (cli.snapshot) {
        config.snapshot = *cli.snapshot;
    }
    if (cli.data_dir) {
        config.data_dir = *cli.data_dir;
    }
    if (cli.remote_data_dir) {
        config.remote_data_dir = *cli.remote_data_dir;
    }
    if (cli.cluster) {
        config.cluster = *cli.cluster;
    }
    if (cli.transfer_parallelism) {
        config.transfer_parallelism = *cli.transfer_parallelism;
    }
    if (cli.finalize_parallelism) {
        config.finalize_parallelism = *cli.finalize_parallelism;
    }
    if (cli.verbose) {
        config.verbose = true;
    }
    if (cli.quiet) {
        config.quiet = true;
    }
}

}  // namespace

int main(int argc, char** argv) {
    auto& logger = pagesrestore::log::StructuredLogger::instance();
    try {
        const auto cli = parse_command_line(argc, argv);
        if (cli.help) {
            print_usage(std::cout);
            return 0;
        }
        if (cli.version) {
            std::cout << "restore-pages " << kVersion << std::endl;
            return 0;
        }
        if (!cli.host) {
            print_usage(std::cerr);
            return 1;
        }

        auto config = pagesrestore::load_config(pagesrestore::process_environment());
        apply_command_line(cli, config);
        pagesrestore::validate_config(config);
        const pagesrestore::Config& settings = config;

        logger.set_verbose(settings.verbose);
        logger.set_enabled(!settings.quiet);

        const auto host = pagesrestore::remote::parse_host_spec(*cli.host, settings);

        pagesrestore::remote::SshRemoteShell shell(settings, host);
        pagesrestore::routing::RemoteRouteOracle oracle(settings, shell);
        pagesrestore::transfer::RsyncTransferrer transferrer(settings);
        pagesrestore::cluster::RemoteFinalizer finalizer(settings, shell);
        const auto mode = pagesrestore::make_deployment_mode(settings, host);

        pagesrestore::RestorePipeline pipeline(settings, host, {shell, oracle, transferrer, finalizer, *mode});
        const auto summary = pipeline.run();

        switch (summary.outcome) {
            case pagesrestore::RestoreOutcome::NothingToRestore:
                std::cout << "Pages snapshot is empty: nothing to restore." << std::endl;
                break;
            case pagesrestore::RestoreOutcome::NoRoutes:
                std::cout << "Warning: no routes found, skipping restore." << std::endl;
                break;
            case pagesrestore::RestoreOutcome::Restored:
                std::cout << "Restored " << summary.routed_paths << " page(s) to " << summary.nodes
                          << " node(s)." << std::endl;
                break;
        }
        return 0;
    } catch (const pagesrestore::ConfigError& ex) {
        print_config_error(ex);
        return 1;
    } catch (const pagesrestore::RestoreError& ex) {
        logger.error("restore_failed",
                     {{"phase", std::string(pagesrestore::phase_to_string(ex.phase()))},
                      {"code", ex.code()},
                      {"detail", ex.detail()}});
        std::cerr << "Error " << ex.what() << std::endl;
        if (!ex.detail().empty()) {
            std::cerr << "Detail: " << ex.detail() << std::endl;
        }
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
