#include "pagesrestore/core/ScratchSpace.hpp"

#include "pagesrestore/Errors.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace pagesrestore {

namespace {

std::string trim_line(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

ScratchSpace::ScratchSpace(remote::RemoteShell& shell)
    : shell_(shell) {
    std::error_code ec;
    const auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw_restore_error(Phase::Scratch, "E_SCRATCH_FAILED", "No usable temporary directory", ec.message());
    }

    auto pattern = (base / (std::string(kPrefix) + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw_restore_error(Phase::Scratch, "E_SCRATCH_FAILED",
                            "Unable to create local scratch directory under " + base.string(),
                            std::strerror(errno));
    }
    paths_.local = buffer.data();

    try {
        const auto result = remote::run_remote_checked(shell_, Phase::Scratch, "E_SCRATCH_FAILED",
                                                       "Remote scratch allocation",
                                                       {"mktemp", "-d", "-t", std::string(kPrefix) + "XXXXXX"});
        paths_.remote = trim_line(result.stdout_data);
        if (paths_.remote.empty() || paths_.remote.front() != '/') {
            throw_restore_error(Phase::Scratch, "E_SCRATCH_FAILED",
                                "Remote mktemp returned an unusable path", result.stdout_data);
        }
    } catch (...) {
        // The destructor does not run for a partially constructed object.
        release_local();
        throw;
    }

    log::StructuredLogger::instance().debug("scratch_allocated",
                                            {{"local", paths_.local.string()}, {"remote", paths_.remote}});
}

ScratchSpace::~ScratchSpace() {
    release_local();
    release_remote();
}

void ScratchSpace::release_local() noexcept {
    if (paths_.local.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(paths_.local, ec);
    if (ec) {
        log::StructuredLogger::instance().warning("scratch_cleanup_failed",
                                                  {{"scope", "local"},
                                                   {"path", paths_.local.string()},
                                                   {"error", ec.message()}});
    }
    paths_.local.clear();
}

void ScratchSpace::release_remote() noexcept {
    if (paths_.remote.empty()) {
        return;
    }
    try {
        const auto result = shell_.run({"rm", "-rf", paths_.remote});
        if (!result.success()) {
            log::StructuredLogger::instance().warning("scratch_cleanup_failed",
                                                      {{"scope", "remote"},
                                                       {"path", paths_.remote},
                                                       {"error", result.describe()}});
        }
    } catch (const std::exception& ex) {
        log::StructuredLogger::instance().warning("scratch_cleanup_failed",
                                                  {{"scope", "remote"}, {"path", paths_.remote}, {"error", ex.what()}});
    }
    paths_.remote.clear();
}

}  // namespace pagesrestore
