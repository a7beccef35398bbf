#pragma once

#include "pagesrestore/Types.hpp"

#include <filesystem>
#include <map>

namespace pagesrestore::routing {

// Inverts the route table: every path is appended to the list of each node
// it is routed to, in table order. Entries without nodes contribute nothing.
// A path never appears twice in the same node's list.
Partition partition_routes(const RouteTable& table);

std::filesystem::path partition_file_path(const std::filesystem::path& directory, const NodeId& node);

// Writes one "<node>.rsync" list per node into `directory` and returns the
// file written for each node.
std::map<NodeId, std::filesystem::path> write_partition_files(const Partition& partition,
                                                              const std::filesystem::path& directory);

}  // namespace pagesrestore::routing
