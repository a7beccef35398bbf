#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pagesrestore {

using ContentPath = std::string;
using NodeId = std::string;

struct RouteEntry {
    ContentPath path;
    std::vector<NodeId> nodes;
};

using RouteTable = std::vector<RouteEntry>;

// Ordered by node so transfers replay in a stable order.
using Partition = std::map<NodeId, std::vector<ContentPath>>;

bool is_valid_node_id(std::string_view node);
std::string format_route_entry(const RouteEntry& entry);

}  // namespace pagesrestore
