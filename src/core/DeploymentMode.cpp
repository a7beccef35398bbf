#include "pagesrestore/core/DeploymentMode.hpp"

#include "pagesrestore/Errors.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"
#include "pagesrestore/process/Subprocess.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace pagesrestore {

namespace {

const std::vector<std::string> kClusterSshOptions{
    "-o", "UserKnownHostsFile=/dev/null",
    "-o", "StrictHostKeyChecking=no",
    "-o", "PasswordAuthentication=no",
};

}  // namespace

std::string build_remote_shell_command(const Config& config,
                                       const remote::HostSpec& host,
                                       const TransportConfig& transport) {
    std::vector<std::string> argv{config.ssh_program, "-q"};
    argv.insert(argv.end(), transport.ssh_options.begin(), transport.ssh_options.end());
    argv.insert(argv.end(), {"-p", std::to_string(host.port)});
    if (transport.ssh_config_file) {
        argv.insert(argv.end(), {"-F", transport.ssh_config_file->string()});
    }
    argv.insert(argv.end(), {"-l", host.user});
    return process::format_command(argv);
}

SingleHostMode::SingleHostMode(const Config& config, remote::HostSpec host)
    : config_(config),
      host_(std::move(host)) {}

std::vector<std::string> SingleHostMode::discover_targets(remote::RemoteShell&) {
    return {host_.address()};
}

TransportConfig SingleHostMode::build_transport_config(const ScratchPaths&, const std::vector<std::string>&) {
    TransportConfig transport{};
    transport.ssh_options = config_.extra_ssh_options;
    return transport;
}

std::string SingleHostMode::destination_for(const NodeId&) const {
    return host_.address();
}

ClusterMode::ClusterMode(const Config& config, remote::HostSpec host)
    : config_(config),
      host_(std::move(host)) {}

std::vector<std::string> ClusterMode::discover_targets(remote::RemoteShell& shell) {
    const auto result = remote::run_remote_checked(shell, Phase::Discover, "E_DISCOVERY_FAILED",
                                                   "Cluster node discovery",
                                                   {config_.cluster_nodes_command, config_.node_role});
    std::vector<std::string> targets;
    std::istringstream tokens(result.stdout_data);
    std::string node;
    while (tokens >> node) {
        if (!is_valid_node_id(node)) {
            throw_restore_error(Phase::Discover, "E_DISCOVERY_FAILED", "Cluster node lister returned an unusable name",
                                node);
        }
        targets.push_back(node);
    }
    if (targets.empty()) {
        throw_restore_error(Phase::Discover, "E_DISCOVERY_FAILED",
                            "No cluster nodes carry the " + config_.node_role + " role",
                            shell.describe_target());
    }
    log::StructuredLogger::instance().debug("cluster_targets", {{"count", std::to_string(targets.size())}});
    return targets;
}

std::string ClusterMode::render_ssh_config(const std::vector<std::string>& targets) const {
    std::vector<std::string> proxy{config_.ssh_program, "-q"};
    proxy.insert(proxy.end(), config_.extra_ssh_options.begin(), config_.extra_ssh_options.end());
    proxy.insert(proxy.end(), {"-p", std::to_string(host_.port), "-l", host_.user, "-W", "%h:%p", host_.host});

    std::ostringstream out;
    out << "Host";
    for (const auto& target : targets) {
        out << ' ' << target;
    }
    out << "\n"
        << "  ServerAliveInterval 60\n"
        << "  ProxyCommand " << process::format_command(proxy) << "\n"
        << "  StrictHostKeyChecking no\n";
    return out.str();
}

TransportConfig ClusterMode::build_transport_config(const ScratchPaths& scratch,
                                                    const std::vector<std::string>& targets) {
    const auto path = scratch.local / "ssh_config";
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << render_ssh_config(targets);
    file.close();
    if (!file) {
        throw_restore_error(Phase::Discover, "E_SSH_CONFIG_WRITE", "Unable to write ssh configuration", path.string());
    }

    TransportConfig transport{};
    transport.ssh_options = config_.extra_ssh_options;
    transport.ssh_options.insert(transport.ssh_options.end(), kClusterSshOptions.begin(), kClusterSshOptions.end());
    transport.ssh_config_file = path;
    return transport;
}

std::string ClusterMode::destination_for(const NodeId& node) const {
    return node;
}

std::unique_ptr<DeploymentMode> make_deployment_mode(const Config& config, const remote::HostSpec& host) {
    if (config.cluster) {
        return std::make_unique<ClusterMode>(config, host);
    }
    return std::make_unique<SingleHostMode>(config, host);
}

}  // namespace pagesrestore
