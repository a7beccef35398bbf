#pragma once

#include "pagesrestore/Config.hpp"
#include "pagesrestore/Errors.hpp"
#include "pagesrestore/process/Subprocess.hpp"
#include "pagesrestore/remote/HostSpec.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pagesrestore::remote {

// Runs commands on the head host of the restore target.
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    // Each element of `command` is passed to the remote side as one word.
    virtual process::ProcessResult run(const std::vector<std::string>& command, std::string_view input = {}) = 0;

    virtual std::string describe_target() const = 0;
};

class SshRemoteShell : public RemoteShell {
public:
    SshRemoteShell(const Config& config, HostSpec host);

    process::ProcessResult run(const std::vector<std::string>& command, std::string_view input = {}) override;
    std::string describe_target() const override;

    std::vector<std::string> build_argv(const std::vector<std::string>& command) const;

private:
    const Config& config_;
    HostSpec host_;
};

// Runs `command` remotely and converts a spawn failure or a non-zero exit
// status into a RestoreError for `phase`.
process::ProcessResult run_remote_checked(RemoteShell& shell,
                                          Phase phase,
                                          const std::string& code,
                                          const std::string& step,
                                          const std::vector<std::string>& command,
                                          std::string_view input = {});

}  // namespace pagesrestore::remote
