#include "pagesrestore/process/Subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pagesrestore::process {

namespace {

constexpr std::size_t kReadBufferSize = 64 * 1024;
constexpr std::size_t kStderrTailLimit = 512;

class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        reset();
    }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    ScopedFd(ScopedFd&& other) noexcept : fd_(other.release()) {}
    ScopedFd& operator=(ScopedFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.release();
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept {
        return fd_;
    }

    [[nodiscard]] bool valid() const noexcept {
        return fd_ >= 0;
    }

    int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    ScopedFd read_end;
    ScopedFd write_end;
};

Pipe make_pipe() {
    std::array<int, 2> fds{-1, -1};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        throw ProcessError(std::string("pipe2 failed: ") + std::strerror(errno));
    }
    return Pipe{ScopedFd(fds[0]), ScopedFd(fds[1])};
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        struct sigaction action{};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        ::sigaction(SIGPIPE, &action, nullptr);
    });
}

[[noreturn]] void exec_child(std::vector<char*>& argv_ptrs,
                             Pipe& stdin_pipe,
                             Pipe& stdout_pipe,
                             Pipe& stderr_pipe,
                             Pipe& exec_status) {
    if (::dup2(stdin_pipe.read_end.get(), STDIN_FILENO) < 0 ||
        ::dup2(stdout_pipe.write_end.get(), STDOUT_FILENO) < 0 ||
        ::dup2(stderr_pipe.write_end.get(), STDERR_FILENO) < 0) {
        const int error = errno;
        (void)!::write(exec_status.write_end.get(), &error, sizeof(error));
        _exit(127);
    }

    // Ignored dispositions survive exec; the child gets the default back.
    ::signal(SIGPIPE, SIG_DFL);
    ::execvp(argv_ptrs.front(), argv_ptrs.data());
    const int error = errno;
    (void)!::write(exec_status.write_end.get(), &error, sizeof(error));
    _exit(127);
}

bool drain(ScopedFd& fd, std::string& sink) {
    std::array<char, kReadBufferSize> buffer{};
    const auto received = ::read(fd.get(), buffer.data(), buffer.size());
    if (received > 0) {
        sink.append(buffer.data(), static_cast<std::size_t>(received));
        return true;
    }
    if (received < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    fd.reset();
    return false;
}

}  // namespace

ChildReaper::~ChildReaper() {
    if (pid_ <= 0) {
        return;
    }
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
}

int ChildReaper::wait() {
    int status = 0;
    const pid_t pid = pid_;
    pid_ = -1;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ProcessError(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    return status;
}

std::string ProcessResult::describe() const {
    std::string text = term_signal != 0 ? "signal " + std::to_string(term_signal)
                                        : "exit " + std::to_string(exit_code);

    const auto last = stderr_data.find_last_not_of(" \t\r\n");
    if (last == std::string::npos) {
        return text;
    }
    const auto newline = stderr_data.find_last_of('\n', last);
    const auto first = newline == std::string::npos ? 0 : newline + 1;
    auto tail = stderr_data.substr(first, last - first + 1);
    if (tail.size() > kStderrTailLimit) {
        tail.erase(0, tail.size() - kStderrTailLimit);
    }
    return text + ": " + tail;
}

ProcessResult run_process(const std::vector<std::string>& argv, std::string_view input) {
    if (argv.empty() || argv.front().empty()) {
        throw ProcessError("Cannot run an empty command");
    }

    ignore_sigpipe_once();

    auto stdin_pipe = make_pipe();
    auto stdout_pipe = make_pipe();
    auto stderr_pipe = make_pipe();
    auto exec_status = make_pipe();

    // Built before fork: the child must not allocate.
    std::vector<char*> argv_ptrs;
    argv_ptrs.reserve(argv.size() + 1);
    for (const auto& value : argv) {
        argv_ptrs.push_back(const_cast<char*>(value.c_str()));
    }
    argv_ptrs.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        exec_child(argv_ptrs, stdin_pipe, stdout_pipe, stderr_pipe, exec_status);
    }
    ChildReaper child(pid);

    stdin_pipe.read_end.reset();
    stdout_pipe.write_end.reset();
    stderr_pipe.write_end.reset();
    exec_status.write_end.reset();

    int exec_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(exec_status.read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);
    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        child.wait();
        throw ProcessError("Failed to start " + argv.front() + ": " + std::strerror(exec_errno));
    }

    ScopedFd to_child = std::move(stdin_pipe.write_end);
    ScopedFd from_stdout = std::move(stdout_pipe.read_end);
    ScopedFd from_stderr = std::move(stderr_pipe.read_end);

    if (input.empty()) {
        to_child.reset();
    } else {
        ::fcntl(to_child.get(), F_SETFL, ::fcntl(to_child.get(), F_GETFL) | O_NONBLOCK);
    }

    ProcessResult result{};
    std::size_t written = 0;

    while (to_child.valid() || from_stdout.valid() || from_stderr.valid()) {
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int stdin_slot = -1;
        int stdout_slot = -1;
        int stderr_slot = -1;
        if (to_child.valid()) {
            stdin_slot = static_cast<int>(count);
            fds[count++] = pollfd{to_child.get(), POLLOUT, 0};
        }
        if (from_stdout.valid()) {
            stdout_slot = static_cast<int>(count);
            fds[count++] = pollfd{from_stdout.get(), POLLIN, 0};
        }
        if (from_stderr.valid()) {
            stderr_slot = static_cast<int>(count);
            fds[count++] = pollfd{from_stderr.get(), POLLIN, 0};
        }

        if (::poll(fds.data(), count, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ProcessError(std::string("poll failed: ") + std::strerror(errno));
        }

        if (stdin_slot >= 0 && fds[stdin_slot].revents != 0) {
            if (fds[stdin_slot].revents & (POLLERR | POLLHUP)) {
                to_child.reset();
            } else {
                const auto sent = ::write(to_child.get(), input.data() + written, input.size() - written);
                if (sent > 0) {
                    written += static_cast<std::size_t>(sent);
                    if (written == input.size()) {
                        to_child.reset();
                    }
                } else if (sent < 0 && errno != EINTR && errno != EAGAIN) {
                    // The child stopped reading; its exit status tells the story.
                    to_child.reset();
                }
            }
        }
        if (stdout_slot >= 0 && fds[stdout_slot].revents != 0) {
            drain(from_stdout, result.stdout_data);
        }
        if (stderr_slot >= 0 && fds[stderr_slot].revents != 0) {
            drain(from_stderr, result.stderr_data);
        }
    }

    const int status = child.wait();
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

std::string shell_quote(std::string_view value) {
    if (!value.empty() &&
        value.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-./=:@%+,") ==
            std::string_view::npos) {
        return std::string(value);
    }
    std::string quoted = "'";
    for (const char ch : value) {
        if (ch == '\'') {
            quoted.append("'\\''");
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) {
            text.push_back(' ');
        }
        text.append(shell_quote(arg));
    }
    return text;
}

}  // namespace pagesrestore::process
