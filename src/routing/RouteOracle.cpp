#include "pagesrestore/routing/RouteOracle.hpp"

#include "pagesrestore/Errors.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"
#include "pagesrestore/process/Subprocess.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace pagesrestore::routing {

RemoteRouteOracle::RemoteRouteOracle(const Config& config, remote::RemoteShell& shell)
    : config_(config),
      shell_(shell) {}

RouteTable RemoteRouteOracle::resolve(const std::vector<ContentPath>& paths, const ScratchPaths& scratch) {
    const auto remote_paths = scratch.remote + "/paths";
    const auto remote_routes = scratch.remote + "/routes";

    remote::run_remote_checked(shell_, Phase::Resolve, "E_ROUTES_FAILED", "Path list upload",
                               {"/bin/sh", "-c", "cat > " + process::shell_quote(remote_paths)},
                               serialize_paths(paths));

    remote::run_remote_checked(shell_, Phase::Resolve, "E_ROUTES_FAILED", "Route generation",
                               {"/bin/sh", "-c",
                                config_.route_command + " < " + process::shell_quote(remote_paths) + " > " +
                                    process::shell_quote(remote_routes)});

    const auto fetched = remote::run_remote_checked(shell_, Phase::Resolve, "E_ROUTES_FAILED", "Route download",
                                                    {"cat", remote_routes});

    auto table = parse_route_response(fetched.stdout_data, paths);
    log::StructuredLogger::instance().debug("routes_received",
                                            {{"requested", std::to_string(paths.size())},
                                             {"entries", std::to_string(table.size())}});
    return table;
}

std::string serialize_paths(const std::vector<ContentPath>& paths) {
    std::string out;
    for (const auto& path : paths) {
        out.append(path);
        out.push_back('\n');
    }
    return out;
}

std::string serialize_routes(std::span<const RouteEntry> entries) {
    std::string out;
    for (const auto& entry : entries) {
        out.append(format_route_entry(entry));
        out.push_back('\n');
    }
    return out;
}

RouteTable parse_route_response(std::string_view response, const std::vector<ContentPath>& requested) {
    const std::unordered_set<std::string_view> allowed(requested.begin(), requested.end());
    std::unordered_set<std::string> seen;
    RouteTable table;

    std::istringstream stream{std::string(response)};
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        std::istringstream tokens(line);
        RouteEntry entry{};
        if (!(tokens >> entry.path)) {
            continue;
        }

        if (allowed.find(entry.path) == allowed.end()) {
            throw_restore_error(Phase::Resolve, "E_ROUTES_CORRUPT",
                                "Route response names a path that was not requested",
                                "line " + std::to_string(line_number) + ": " + entry.path);
        }
        if (!seen.insert(entry.path).second) {
            throw_restore_error(Phase::Resolve, "E_ROUTES_CORRUPT",
                                "Route response lists a path more than once",
                                "line " + std::to_string(line_number) + ": " + entry.path);
        }

        std::string node;
        while (tokens >> node) {
            if (!is_valid_node_id(node)) {
                throw_restore_error(Phase::Resolve, "E_ROUTES_CORRUPT",
                                    "Route response contains an unusable node name",
                                    "line " + std::to_string(line_number) + ": " + node);
            }
            if (std::find(entry.nodes.begin(), entry.nodes.end(), node) == entry.nodes.end()) {
                entry.nodes.push_back(node);
            }
        }
        table.push_back(std::move(entry));
    }
    return table;
}

}  // namespace pagesrestore::routing
