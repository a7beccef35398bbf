#include "pagesrestore/transfer/Transferrer.hpp"

#include "pagesrestore/Errors.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"
#include "pagesrestore/process/Subprocess.hpp"

namespace pagesrestore::transfer {

RsyncTransferrer::RsyncTransferrer(const Config& config)
    : config_(config) {}

std::vector<std::string> RsyncTransferrer::build_argv(const TransferTask& task) const {
    // "/./" marks where the relative part of each listed path starts.
    auto source = task.source_root.string();
    while (!source.empty() && source.back() == '/') {
        source.pop_back();
    }
    source += "/./";

    auto destination_root = task.destination_root;
    if (destination_root.empty() || destination_root.back() != '/') {
        destination_root.push_back('/');
    }

    return {
        config_.rsync_program,
        "-avrHR",
        "--delete",
        "-e", task.remote_shell,
        "--rsync-path=sudo -u " + config_.storage_user + " rsync",
        "--files-from=" + task.files_from.string(),
        source,
        task.destination + ":" + destination_root,
    };
}

void RsyncTransferrer::transfer(const TransferTask& task) {
    const auto argv = build_argv(task);
    const auto identity = process::format_command(argv);
    log::StructuredLogger::instance().debug("transfer_command", {{"node", task.node}, {"command", identity}});

    process::ProcessResult result{};
    try {
        result = process::run_process(argv);
    } catch (const process::ProcessError& ex) {
        throw_restore_error(Phase::Transfer, "E_TRANSFER_FAILED",
                            "Transfer to " + task.node + " could not be started", identity + ": " + ex.what());
    }
    if (!result.success()) {
        throw_restore_error(Phase::Transfer, "E_TRANSFER_FAILED",
                            "Transfer to " + task.node + " failed", identity + " (" + result.describe() + ")");
    }
}

}  // namespace pagesrestore::transfer
