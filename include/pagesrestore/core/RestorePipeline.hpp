#pragma once

#include "pagesrestore/Config.hpp"
#include "pagesrestore/cluster/ClusterFinalizer.hpp"
#include "pagesrestore/core/DeploymentMode.hpp"
#include "pagesrestore/remote/HostSpec.hpp"
#include "pagesrestore/remote/RemoteShell.hpp"
#include "pagesrestore/routing/RouteOracle.hpp"
#include "pagesrestore/transfer/Transferrer.hpp"

#include <cstddef>
#include <string_view>

namespace pagesrestore {

enum class RestoreOutcome {
    Restored,
    NothingToRestore,
    NoRoutes
};

std::string_view outcome_to_string(RestoreOutcome outcome);

struct RestoreSummary {
    RestoreOutcome outcome{RestoreOutcome::NothingToRestore};
    std::size_t content_paths{0};
    std::size_t route_entries{0};
    std::size_t routed_paths{0};
    std::size_t nodes{0};
    std::size_t transfers{0};
    std::size_t finalize_chunks{0};
};

struct RestoreCollaborators {
    remote::RemoteShell& shell;
    routing::RouteOracle& oracle;
    transfer::Transferrer& transferrer;
    cluster::Finalizer& finalizer;
    DeploymentMode& mode;
};

// Enumerate, resolve, partition, transfer and (for clusters) finalize one
// snapshot. Scratch space is held for the whole run and released on every
// exit. Failures are thrown as RestoreError; the two empty cases are
// reported through the returned outcome.
class RestorePipeline {
public:
    RestorePipeline(const Config& config, remote::HostSpec host, RestoreCollaborators collaborators);

    RestoreSummary run();

private:
    const Config& config_;
    remote::HostSpec host_;
    RestoreCollaborators collaborators_;
};

}  // namespace pagesrestore
