#pragma once

#include "pagesrestore/Config.hpp"
#include "pagesrestore/Types.hpp"
#include "pagesrestore/core/DeploymentMode.hpp"
#include "pagesrestore/transfer/Transferrer.hpp"

#include <filesystem>
#include <map>
#include <vector>

namespace pagesrestore::transfer {

struct TransferPlanInput {
    const Partition& partition;
    const std::map<NodeId, std::filesystem::path>& file_lists;
    const DeploymentMode& mode;
    std::filesystem::path source_root;
    std::string destination_root;
    std::string remote_shell;
};

// One task per node with a non-empty partition, in node order.
std::vector<TransferTask> plan_transfers(const TransferPlanInput& input);

class TransferDispatcher {
public:
    TransferDispatcher(const Config& config, Transferrer& transferrer);

    // Runs every task, fail-fast. Completed transfers are left in place when
    // a later one fails. Returns the number of tasks started.
    std::size_t dispatch(const std::vector<TransferTask>& tasks);

    std::size_t effective_parallelism(std::size_t task_count) const noexcept;

private:
    const Config& config_;
    Transferrer& transferrer_;
};

}  // namespace pagesrestore::transfer
