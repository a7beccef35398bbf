#include "pagesrestore/routing/RoutePartitioner.hpp"

#include "pagesrestore/Errors.hpp"

#include <fstream>
#include <set>
#include <string>

namespace pagesrestore::routing {

Partition partition_routes(const RouteTable& table) {
    Partition partition;
    std::map<NodeId, std::set<ContentPath>> seen;
    for (const auto& entry : table) {
        for (const auto& node : entry.nodes) {
            if (seen[node].insert(entry.path).second) {
                partition[node].push_back(entry.path);
            }
        }
    }
    return partition;
}

std::filesystem::path partition_file_path(const std::filesystem::path& directory, const NodeId& node) {
    return directory / (node + ".rsync");
}

std::map<NodeId, std::filesystem::path> write_partition_files(const Partition& partition,
                                                              const std::filesystem::path& directory) {
    std::map<NodeId, std::filesystem::path> files;
    for (const auto& [node, paths] : partition) {
        if (!is_valid_node_id(node)) {
            throw_restore_error(Phase::Partition, "E_ROUTES_CORRUPT", "Unusable node name in partition", node);
        }
        const auto path = partition_file_path(directory, node);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        for (const auto& content : paths) {
            out << content << '\n';
        }
        out.close();
        if (!out) {
            throw_restore_error(Phase::Partition, "E_PARTITION_WRITE", "Unable to write file list", path.string());
        }
        files.emplace(node, path);
    }
    return files;
}

}  // namespace pagesrestore::routing
