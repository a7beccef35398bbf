#include "pagesrestore/transfer/TransferDispatcher.hpp"

#include "pagesrestore/Errors.hpp"
#include "pagesrestore/core/BoundedExecutor.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"

#include <algorithm>
#include <chrono>

namespace pagesrestore::transfer {

std::vector<TransferTask> plan_transfers(const TransferPlanInput& input) {
    std::vector<TransferTask> tasks;
    tasks.reserve(input.partition.size());
    for (const auto& [node, paths] : input.partition) {
        if (paths.empty()) {
            continue;
        }
        const auto list = input.file_lists.find(node);
        if (list == input.file_lists.end()) {
            throw_restore_error(Phase::Transfer, "E_PARTITION_WRITE", "No file list was written for node", node);
        }

        TransferTask task{};
        task.node = node;
        task.destination = input.mode.destination_for(node);
        task.paths = paths;
        task.files_from = list->second;
        task.source_root = input.source_root;
        task.destination_root = input.destination_root;
        task.remote_shell = input.remote_shell;
        tasks.push_back(std::move(task));
    }
    return tasks;
}

TransferDispatcher::TransferDispatcher(const Config& config, Transferrer& transferrer)
    : config_(config),
      transferrer_(transferrer) {}

std::size_t TransferDispatcher::effective_parallelism(std::size_t task_count) const noexcept {
    if (config_.transfer_parallelism == 0) {
        return std::max<std::size_t>(task_count, 1);
    }
    return config_.transfer_parallelism;
}

std::size_t TransferDispatcher::dispatch(const std::vector<TransferTask>& tasks) {
    auto& logger = log::StructuredLogger::instance();
    return run_bounded(tasks.size(), effective_parallelism(tasks.size()), [&](std::size_t index) {
        const auto& task = tasks[index];
        logger.info("transfer_start",
                    {{"node", task.node}, {"destination", task.destination}, {"paths", std::to_string(task.paths.size())}});
        const auto started = std::chrono::steady_clock::now();
        try {
            transferrer_.transfer(task);
        } catch (const RestoreError& ex) {
            logger.error("transfer_failed", {{"node", task.node}, {"error", ex.what()}, {"detail", ex.detail()}});
            throw;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        logger.info("transfer_done", {{"node", task.node}, {"elapsed_ms", std::to_string(elapsed.count())}});
    });
}

}  // namespace pagesrestore::transfer
