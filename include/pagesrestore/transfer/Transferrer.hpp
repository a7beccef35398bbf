#pragma once

#include "pagesrestore/Config.hpp"
#include "pagesrestore/Types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace pagesrestore::transfer {

struct TransferTask {
    NodeId node;
    std::string destination;
    std::vector<ContentPath> paths;
    std::filesystem::path files_from;
    std::filesystem::path source_root;
    std::string destination_root;
    // Remote shell used by the mirror tool to reach `destination`.
    std::string remote_shell;
};

// Mirrors the task's paths from the snapshot onto one node. Implementations
// must be safe to run concurrently for distinct nodes and must throw
// RestoreError on failure.
class Transferrer {
public:
    virtual ~Transferrer() = default;

    virtual void transfer(const TransferTask& task) = 0;
};

class RsyncTransferrer : public Transferrer {
public:
    explicit RsyncTransferrer(const Config& config);

    void transfer(const TransferTask& task) override;

    std::vector<std::string> build_argv(const TransferTask& task) const;

private:
    const Config& config_;
};

}  // namespace pagesrestore::transfer
