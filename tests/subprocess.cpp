#include "pagesrestore/process/Subprocess.hpp"

#include <cassert>
#include <cerrno>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

namespace {

bool no_children_left() {
    return ::waitpid(-1, nullptr, WNOHANG) < 0 && errno == ECHILD;
}

void test_child_reaper() {
    using pagesrestore::process::ChildReaper;

    // Released without wait(): the child is killed and reaped.
    pid_t stuck = ::fork();
    assert(stuck >= 0);
    if (stuck == 0) {
        for (;;) {
            ::pause();
        }
    }
    {
        ChildReaper reaper(stuck);
        assert(reaper.pid() == stuck);
    }
    assert(::waitpid(stuck, nullptr, WNOHANG) < 0 && errno == ECHILD);

    pid_t quick = ::fork();
    assert(quick >= 0);
    if (quick == 0) {
        ::_exit(7);
    }
    ChildReaper reaper(quick);
    const int status = reaper.wait();
    assert(WIFEXITED(status) && WEXITSTATUS(status) == 7);
    assert(reaper.pid() == -1);
    assert(no_children_left());
}

}  // namespace

int main() {
    using pagesrestore::process::ProcessError;
    using pagesrestore::process::run_process;

    const auto echoed = run_process({"/bin/sh", "-c", "cat"}, "5/d3/d9/44/10\n0/02/e7/4f/27\n");
    assert(echoed.success());
    assert(echoed.stdout_data == "5/d3/d9/44/10\n0/02/e7/4f/27\n");

    // Large inputs must not deadlock while the child writes back.
    std::string large;
    for (int i = 0; i < 20000; ++i) {
        large += "4/c1/6a/53/" + std::to_string(i) + "\n";
    }
    const auto large_echo = run_process({"cat"}, large);
    assert(large_echo.success());
    assert(large_echo.stdout_data == large);

    const auto failing = run_process({"/bin/sh", "-c", "echo partial; echo 'route helper crashed' >&2; exit 3"});
    assert(!failing.success());
    assert(failing.exit_code == 3);
    assert(failing.stdout_data == "partial\n");
    assert(failing.describe() == "exit 3: route helper crashed");

    // The child's own status is reported even when it ignores its input.
    const auto ignores_input = run_process({"/bin/sh", "-c", "exit 4"}, large);
    assert(ignores_input.exit_code == 4);

    const auto killed = run_process({"/bin/sh", "-c", "kill -9 $$"});
    assert(!killed.success());
    assert(killed.term_signal == 9);
    assert(killed.describe() == "signal 9");

    bool threw = false;
    try {
        run_process({"/nonexistent/restore-pages-helper"});
    } catch (const ProcessError& ex) {
        threw = std::string(ex.what()).find("/nonexistent/restore-pages-helper") != std::string::npos;
    }
    assert(threw);
    // Nothing is left behind by the failed start or by the runs above.
    assert(no_children_left());

    test_child_reaper();

    assert(pagesrestore::process::shell_quote("5/d3/d9/44/10") == "5/d3/d9/44/10");
    assert(pagesrestore::process::shell_quote("a b") == "'a b'");
    assert(pagesrestore::process::shell_quote("it's") == "'it'\\''s'");
    assert(pagesrestore::process::shell_quote("") == "''");
    assert(pagesrestore::process::format_command({"rm", "-rf", "/tmp/x y"}) == "rm -rf '/tmp/x y'");

    return 0;
}
