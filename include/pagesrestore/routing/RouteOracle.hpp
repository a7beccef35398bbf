#pragma once

#include "pagesrestore/Config.hpp"
#include "pagesrestore/Types.hpp"
#include "pagesrestore/core/ScratchSpace.hpp"
#include "pagesrestore/remote/RemoteShell.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pagesrestore::routing {

// Maps content paths to the nodes that should hold them.
class RouteOracle {
public:
    virtual ~RouteOracle() = default;

    // Returns one entry per routed path. An empty table means the oracle
    // had nothing to place; failures are thrown as RestoreError.
    virtual RouteTable resolve(const std::vector<ContentPath>& paths, const ScratchPaths& scratch) = 0;
};

// Asks the route helper on the head host. The path list is staged in the
// remote scratch directory and the helper's output is read back from there,
// so each step reports its own exit status.
class RemoteRouteOracle : public RouteOracle {
public:
    RemoteRouteOracle(const Config& config, remote::RemoteShell& shell);

    RouteTable resolve(const std::vector<ContentPath>& paths, const ScratchPaths& scratch) override;

private:
    const Config& config_;
    remote::RemoteShell& shell_;
};

std::string serialize_paths(const std::vector<ContentPath>& paths);
std::string serialize_routes(std::span<const RouteEntry> entries);

// Parses "path node_1 ... node_k" lines. Blank lines are skipped, repeated
// nodes within a line are collapsed. Throws RestoreError (E_ROUTES_CORRUPT)
// for paths that were not requested, repeated paths and unusable node names.
RouteTable parse_route_response(std::string_view response, const std::vector<ContentPath>& requested);

}  // namespace pagesrestore::routing
