#include "pagesrestore/remote/RemoteShell.hpp"

#include "pagesrestore/log/StructuredLogger.hpp"

#include <utility>

namespace pagesrestore::remote {

SshRemoteShell::SshRemoteShell(const Config& config, HostSpec host)
    : config_(config),
      host_(std::move(host)) {}

std::vector<std::string> SshRemoteShell::build_argv(const std::vector<std::string>& command) const {
    std::vector<std::string> argv{config_.ssh_program, "-o", "BatchMode=yes"};
    argv.insert(argv.end(), config_.extra_ssh_options.begin(), config_.extra_ssh_options.end());
    argv.insert(argv.end(), {"-p", std::to_string(host_.port), "-l", host_.user, host_.host, "--"});
    // ssh hands the remote shell a single string, so quote each word here.
    argv.push_back(process::format_command(command));
    return argv;
}

process::ProcessResult SshRemoteShell::run(const std::vector<std::string>& command, std::string_view input) {
    const auto argv = build_argv(command);
    log::StructuredLogger::instance().debug("remote_command",
                                            {{"host", host_.display()}, {"command", argv.back()}});
    return process::run_process(argv, input);
}

std::string SshRemoteShell::describe_target() const {
    return host_.user + '@' + host_.display();
}

process::ProcessResult run_remote_checked(RemoteShell& shell,
                                          Phase phase,
                                          const std::string& code,
                                          const std::string& step,
                                          const std::vector<std::string>& command,
                                          std::string_view input) {
    const auto identity = "ssh " + shell.describe_target() + " -- " + process::format_command(command);
    process::ProcessResult result{};
    try {
        result = shell.run(command, input);
    } catch (const process::ProcessError& ex) {
        throw_restore_error(phase, code, step + " could not be started", identity + ": " + ex.what());
    }
    if (!result.success()) {
        throw_restore_error(phase, code, step + " failed on " + shell.describe_target(),
                            identity + " (" + result.describe() + ")");
    }
    return result;
}

}  // namespace pagesrestore::remote
