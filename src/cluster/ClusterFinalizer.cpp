#include "pagesrestore/cluster/ClusterFinalizer.hpp"

#include "pagesrestore/Errors.hpp"
#include "pagesrestore/core/BoundedExecutor.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"
#include "pagesrestore/routing/RouteOracle.hpp"

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>

namespace pagesrestore::cluster {

std::vector<FinalizeChunk> chunk_routes(const RouteTable& table, std::size_t chunk_size) {
    const auto size = std::max<std::size_t>(chunk_size, 1);
    std::vector<FinalizeChunk> chunks;
    chunks.reserve((table.size() + size - 1) / size);
    const std::span<const RouteEntry> all(table);
    for (std::size_t offset = 0; offset < all.size(); offset += size) {
        const auto count = std::min(size, all.size() - offset);
        chunks.push_back(FinalizeChunk{chunks.size(), all.subspan(offset, count)});
    }
    return chunks;
}

RemoteFinalizer::RemoteFinalizer(const Config& config, remote::RemoteShell& shell)
    : config_(config),
      shell_(shell) {}

void RemoteFinalizer::finalize(const FinalizeChunk& chunk) {
    remote::run_remote_checked(shell_, Phase::Finalize, "E_FINALIZE_FAILED",
                               "Finalize of chunk " + std::to_string(chunk.index),
                               {"/bin/sh", "-c", config_.finalize_command},
                               routing::serialize_routes(chunk.entries));
}

std::size_t RemoteFinalizer::execution_slots() {
    const auto result = remote::run_remote_checked(shell_, Phase::Finalize, "E_FINALIZE_FAILED",
                                                   "Execution slot query", {"nproc"});
    const auto& text = result.stdout_data;
    const auto begin = text.find_first_of("0123456789");
    std::size_t slots = 0;
    if (begin != std::string::npos) {
        const auto [ptr, ec] = std::from_chars(text.data() + begin, text.data() + text.size(), slots);
        if (ec != std::errc{}) {
            slots = 0;
        }
    }
    if (slots == 0) {
        throw_restore_error(Phase::Finalize, "E_FINALIZE_FAILED", "Unusable execution slot count", text);
    }
    return slots;
}

ClusterFinalizer::ClusterFinalizer(const Config& config, Finalizer& finalizer)
    : config_(config),
      finalizer_(finalizer) {}

std::size_t ClusterFinalizer::effective_parallelism(std::size_t chunk_count) {
    if (config_.finalize_parallelism != 0) {
        return config_.finalize_parallelism;
    }
    if (chunk_count < 2) {
        return 1;
    }
    try {
        return finalizer_.execution_slots();
    } catch (const RestoreError& ex) {
        log::StructuredLogger::instance().warning("finalize_slots_unknown", {{"error", ex.what()}, {"fallback", "1"}});
        return 1;
    }
}

void ClusterFinalizer::finalize_with_retry(const FinalizeChunk& chunk) {
    const auto limit = std::max<std::uint8_t>(config_.finalize_attempt_limit, 1);
    for (std::uint8_t attempt = 1;; ++attempt) {
        try {
            finalizer_.finalize(chunk);
            return;
        } catch (const RestoreError& ex) {
            if (attempt >= limit) {
                log::StructuredLogger::instance().error("finalize_failed",
                                                        {{"chunk", std::to_string(chunk.index)},
                                                         {"attempts", std::to_string(attempt)},
                                                         {"error", ex.what()}});
                throw;
            }
            log::StructuredLogger::instance().warning("finalize_retry",
                                                      {{"chunk", std::to_string(chunk.index)},
                                                       {"attempt", std::to_string(attempt)},
                                                       {"error", ex.what()}});
        }
    }
}

std::size_t ClusterFinalizer::run(const RouteTable& table) {
    const auto chunks = chunk_routes(table, config_.finalize_chunk_size);
    const auto parallelism = effective_parallelism(chunks.size());
    log::StructuredLogger::instance().info("finalize_start",
                                           {{"entries", std::to_string(table.size())},
                                            {"chunks", std::to_string(chunks.size())},
                                            {"parallelism", std::to_string(parallelism)}});
    run_bounded(chunks.size(), parallelism, [&](std::size_t index) {
        finalize_with_retry(chunks[index]);
    });
    return chunks.size();
}

}  // namespace pagesrestore::cluster
