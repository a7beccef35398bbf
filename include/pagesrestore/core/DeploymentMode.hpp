#pragma once

#include "pagesrestore/Config.hpp"
#include "pagesrestore/Types.hpp"
#include "pagesrestore/core/ScratchSpace.hpp"
#include "pagesrestore/remote/HostSpec.hpp"
#include "pagesrestore/remote/RemoteShell.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagesrestore {

// How transfers reach their destination nodes.
struct TransportConfig {
    std::vector<std::string> ssh_options;
    std::optional<std::filesystem::path> ssh_config_file;
};

// The value passed to rsync's -e option.
std::string build_remote_shell_command(const Config& config,
                                       const remote::HostSpec& host,
                                       const TransportConfig& transport);

class DeploymentMode {
public:
    virtual ~DeploymentMode() = default;

    virtual std::string_view name() const noexcept = 0;

    // Cluster deployments commit placements with a finalize step.
    virtual bool requires_finalize() const noexcept = 0;

    virtual std::vector<std::string> discover_targets(remote::RemoteShell& shell) = 0;

    virtual TransportConfig build_transport_config(const ScratchPaths& scratch,
                                                   const std::vector<std::string>& targets) = 0;

    // Host that receives the transfer for `node`.
    virtual std::string destination_for(const NodeId& node) const = 0;
};

class SingleHostMode : public DeploymentMode {
public:
    SingleHostMode(const Config& config, remote::HostSpec host);

    std::string_view name() const noexcept override {
        return "single";
    }
    bool requires_finalize() const noexcept override {
        return false;
    }
    std::vector<std::string> discover_targets(remote::RemoteShell& shell) override;
    TransportConfig build_transport_config(const ScratchPaths& scratch,
                                           const std::vector<std::string>& targets) override;
    std::string destination_for(const NodeId& node) const override;

private:
    const Config& config_;
    remote::HostSpec host_;
};

// Nodes are reached through the head host with a generated ssh_config.
class ClusterMode : public DeploymentMode {
public:
    ClusterMode(const Config& config, remote::HostSpec host);

    std::string_view name() const noexcept override {
        return "cluster";
    }
    bool requires_finalize() const noexcept override {
        return true;
    }
    std::vector<std::string> discover_targets(remote::RemoteShell& shell) override;
    TransportConfig build_transport_config(const ScratchPaths& scratch,
                                           const std::vector<std::string>& targets) override;
    std::string destination_for(const NodeId& node) const override;

    std::string render_ssh_config(const std::vector<std::string>& targets) const;

private:
    const Config& config_;
    remote::HostSpec host_;
};

std::unique_ptr<DeploymentMode> make_deployment_mode(const Config& config, const remote::HostSpec& host);

}  // namespace pagesrestore
