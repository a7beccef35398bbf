#include "pagesrestore/Types.hpp"

namespace pagesrestore {

bool is_valid_node_id(std::string_view node) {
    if (node.empty() || node == "." || node == "..") {
        return false;
    }
    return node.find_first_of("/ \t\r\n") == std::string_view::npos;
}

std::string format_route_entry(const RouteEntry& entry) {
    std::string line = entry.path;
    for (const auto& node : entry.nodes) {
        line.push_back(' ');
        line.append(node);
    }
    return line;
}

}  // namespace pagesrestore
