#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace pagesrestore::process {

struct ProcessResult {
    int exit_code{-1};
    int term_signal{0};
    std::string stdout_data;
    std::string stderr_data;

    [[nodiscard]] bool success() const noexcept {
        return term_signal == 0 && exit_code == 0;
    }

    // "exit 3" or "signal 9", followed by the last stderr line if any.
    std::string describe() const;
};

// Raised when the child could not be started at all.
class ProcessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Owns a forked child until it has been waited for. A child still owned
// when the reaper is destroyed is killed and reaped, so error paths never
// leave a zombie behind.
class ChildReaper {
public:
    explicit ChildReaper(pid_t pid) noexcept : pid_(pid) {}
    ~ChildReaper();

    ChildReaper(const ChildReaper&) = delete;
    ChildReaper& operator=(const ChildReaper&) = delete;

    // Blocks until the child exits and returns its raw wait status.
    int wait();

    [[nodiscard]] pid_t pid() const noexcept {
        return pid_;
    }

private:
    pid_t pid_;
};

// Runs argv[0] (looked up in PATH) with the given stdin and waits for it.
// The returned status is the child's own status; nothing sits between the
// caller and the program.
ProcessResult run_process(const std::vector<std::string>& argv, std::string_view input = {});

std::string shell_quote(std::string_view value);
std::string format_command(const std::vector<std::string>& argv);

}  // namespace pagesrestore::process
