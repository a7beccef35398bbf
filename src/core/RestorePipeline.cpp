#include "pagesrestore/core/RestorePipeline.hpp"

#include "pagesrestore/Errors.hpp"
#include "pagesrestore/core/ScratchSpace.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"
#include "pagesrestore/routing/RoutePartitioner.hpp"
#include "pagesrestore/snapshot/SnapshotEnumerator.hpp"
#include "pagesrestore/transfer/TransferDispatcher.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pagesrestore {

std::string_view outcome_to_string(RestoreOutcome outcome) {
    switch (outcome) {
        case RestoreOutcome::Restored:
            return "restored";
        case RestoreOutcome::NothingToRestore:
            return "nothing_to_restore";
        case RestoreOutcome::NoRoutes:
            return "no_routes";
    }
    return "unknown";
}

RestorePipeline::RestorePipeline(const Config& config, remote::HostSpec host, RestoreCollaborators collaborators)
    : config_(config),
      host_(std::move(host)),
      collaborators_(collaborators) {}

RestoreSummary RestorePipeline::run() {
    auto& logger = log::StructuredLogger::instance();
    RestoreSummary summary{};

    logger.info("restore_start",
                {{"host", host_.display()},
                 {"mode", std::string(collaborators_.mode.name())},
                 {"snapshot", config_.snapshot}});

    // A mistyped snapshot is reported before anything is touched remotely.
    const snapshot::SnapshotEnumerator enumerator(config_);
    enumerator.require_snapshot();

    std::optional<ScratchSpace> scratch;
    {
        log::PhaseTimer phase(Phase::Scratch);
        scratch.emplace(collaborators_.shell);
    }

    std::vector<ContentPath> paths;
    {
        log::PhaseTimer phase(Phase::Enumerate);
        paths = enumerator.enumerate();
    }
    summary.content_paths = paths.size();
    if (paths.empty()) {
        summary.outcome = RestoreOutcome::NothingToRestore;
        logger.warning("nothing_to_restore",
                       {{"snapshot", enumerator.snapshot_root().string()},
                        {"outcome", std::string(outcome_to_string(summary.outcome))}});
        return summary;
    }

    RouteTable routes;
    {
        log::PhaseTimer phase(Phase::Resolve);
        routes = collaborators_.oracle.resolve(paths, scratch->paths());
    }
    summary.route_entries = routes.size();
    if (routes.empty()) {
        summary.outcome = RestoreOutcome::NoRoutes;
        logger.warning("no_routes",
                       {{"reason", "empty route response"},
                        {"outcome", std::string(outcome_to_string(summary.outcome))}});
        return summary;
    }

    Partition partition;
    std::map<NodeId, std::filesystem::path> file_lists;
    {
        log::PhaseTimer phase(Phase::Partition);
        partition = routing::partition_routes(routes);
        file_lists = routing::write_partition_files(partition, scratch->local());
    }
    if (partition.empty()) {
        summary.outcome = RestoreOutcome::NoRoutes;
        logger.warning("no_routes",
                       {{"reason", "no path was routed to a node"},
                        {"outcome", std::string(outcome_to_string(summary.outcome))}});
        return summary;
    }
    summary.nodes = partition.size();
    for (const auto& entry : routes) {
        if (!entry.nodes.empty()) {
            ++summary.routed_paths;
        }
    }

    std::vector<transfer::TransferTask> tasks;
    {
        log::PhaseTimer phase(Phase::Discover);
        const auto targets = collaborators_.mode.discover_targets(collaborators_.shell);
        const std::set<std::string> known(targets.begin(), targets.end());
        for (const auto& [node, node_paths] : partition) {
            const auto destination = collaborators_.mode.destination_for(node);
            if (known.find(destination) == known.end()) {
                logger.warning("route_node_unknown", {{"node", node}, {"destination", destination}});
            }
        }
        const auto transport = collaborators_.mode.build_transport_config(scratch->paths(), targets);
        tasks = transfer::plan_transfers(transfer::TransferPlanInput{
            partition,
            file_lists,
            collaborators_.mode,
            enumerator.content_root(),
            config_.remote_data_dir + "/" + config_.pages_subdir,
            build_remote_shell_command(config_, host_, transport),
        });
    }

    {
        log::PhaseTimer phase(Phase::Transfer);
        transfer::TransferDispatcher dispatcher(config_, collaborators_.transferrer);
        summary.transfers = dispatcher.dispatch(tasks);
    }

    if (collaborators_.mode.requires_finalize()) {
        log::PhaseTimer phase(Phase::Finalize);
        cluster::ClusterFinalizer finalizer(config_, collaborators_.finalizer);
        summary.finalize_chunks = finalizer.run(routes);
    }

    summary.outcome = RestoreOutcome::Restored;
    logger.info("restore_done",
                {{"outcome", std::string(outcome_to_string(summary.outcome))},
                 {"paths", std::to_string(summary.routed_paths)},
                 {"nodes", std::to_string(summary.nodes)},
                 {"finalize_chunks", std::to_string(summary.finalize_chunks)}});
    return summary;
}

}  // namespace pagesrestore
