#pragma once

#include "pagesrestore/remote/RemoteShell.hpp"

#include <filesystem>
#include <string>

namespace pagesrestore {

struct ScratchPaths {
    std::filesystem::path local;
    std::string remote;
};

// Owns one local and one remote temporary directory for the length of a
// run. Both are removed when the object goes out of scope, whatever the
// reason; removal failures are logged and never thrown.
class ScratchSpace {
public:
    static constexpr const char* kPrefix = "restore-pages-";

    explicit ScratchSpace(remote::RemoteShell& shell);
    ~ScratchSpace();

    ScratchSpace(const ScratchSpace&) = delete;
    ScratchSpace& operator=(const ScratchSpace&) = delete;

    const ScratchPaths& paths() const noexcept {
        return paths_;
    }

    const std::filesystem::path& local() const noexcept {
        return paths_.local;
    }

    const std::string& remote() const noexcept {
        return paths_.remote;
    }

private:
    void release_local() noexcept;
    void release_remote() noexcept;

    remote::RemoteShell& shell_;
    ScratchPaths paths_;
};

}  // namespace pagesrestore
