#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pagesrestore {

struct Config {
    std::string data_dir{"data"};
    std::string snapshot{"current"};
    std::string pages_subdir{"pages"};
    std::size_t path_depth{5};
    std::string remote_data_dir{"/data/user"};
    bool cluster{false};
    std::string node_role{"pages-server"};
    std::vector<std::string> extra_ssh_options;
    std::string ssh_program{"ssh"};
    std::string rsync_program{"rsync"};
    std::string route_command{"restore-pages-routes"};
    std::string finalize_command{"restore-pages-finalize"};
    std::string cluster_nodes_command{"cluster-find-nodes"};
    std::string storage_user{"git"};
    std::string default_remote_user{"admin"};
    std::uint16_t default_remote_port{122};
    // 0 means one slot per target node.
    std::size_t transfer_parallelism{1};
    // 0 means ask the head node how many execution slots it has.
    std::size_t finalize_parallelism{0};
    std::size_t finalize_chunk_size{1000};
    std::uint8_t finalize_attempt_limit{2};
    bool verbose{false};
    bool quiet{false};
};

}  // namespace pagesrestore
