#pragma once

#include "pagesrestore/Config.hpp"
#include "pagesrestore/Types.hpp"
#include "pagesrestore/remote/RemoteShell.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace pagesrestore::cluster {

struct FinalizeChunk {
    std::size_t index{0};
    std::span<const RouteEntry> entries;
};

// Contiguous slices of at most `chunk_size` entries covering the table once.
std::vector<FinalizeChunk> chunk_routes(const RouteTable& table, std::size_t chunk_size);

// Commits the placement of one chunk. Re-running a chunk must be harmless.
class Finalizer {
public:
    virtual ~Finalizer() = default;

    virtual void finalize(const FinalizeChunk& chunk) = 0;

    // Number of finalize calls the target can usefully run at once.
    virtual std::size_t execution_slots() {
        return 1;
    }
};

class RemoteFinalizer : public Finalizer {
public:
    RemoteFinalizer(const Config& config, remote::RemoteShell& shell);

    void finalize(const FinalizeChunk& chunk) override;
    std::size_t execution_slots() override;

private:
    const Config& config_;
    remote::RemoteShell& shell_;
};

class ClusterFinalizer {
public:
    ClusterFinalizer(const Config& config, Finalizer& finalizer);

    // Finalizes the whole table chunk by chunk, retrying a failed chunk up
    // to the configured attempt limit. Returns the number of chunks.
    std::size_t run(const RouteTable& table);

    std::size_t effective_parallelism(std::size_t chunk_count);

private:
    void finalize_with_retry(const FinalizeChunk& chunk);

    const Config& config_;
    Finalizer& finalizer_;
};

}  // namespace pagesrestore::cluster
