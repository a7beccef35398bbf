#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include <sys/wait.h>

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool check(const CommandResult& result, bool expect_success, const std::string& needle, const std::string& label) {
    const bool exit_ok = expect_success ? result.exit_code == 0 : result.exit_code != 0 && result.exit_code != -1;
    if (!exit_ok || !expect_contains(result.output, needle)) {
        std::cerr << "Failure on " << label << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
        return false;
    }
    return true;
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("RESTORE_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "RESTORE_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }
    const std::string executable = std::filesystem::path(executable_env).string();

    try {
        bool ok = true;
        ok &= check(run_cli(executable, ""), false, "Usage: restore-pages", "no arguments");
        ok &= check(run_cli(executable, "--help"), true, "Usage: restore-pages", "--help");
        ok &= check(run_cli(executable, "--version"), true, "restore-pages v", "--version");
        ok &= check(run_cli(executable, "--bogus example.com"), false, "[E_UNKNOWN_OPTION]", "unknown option");
        ok &= check(run_cli(executable, "--parallel many example.com"), false, "[E_INVALID_NUMBER]", "bad --parallel");
        ok &= check(run_cli(executable, "example.com --parallel"), false, "[E_MISSING_VALUE]", "missing value");
        ok &= check(run_cli(executable, "--snapshot a --snapshot b example.com"), false, "[E_DUPLICATE_OPTION]",
                    "duplicate option");
        ok &= check(run_cli(executable, "one.example.com two.example.com"), false, "[E_UNEXPECTED_ARGUMENT]",
                    "two hosts");
        ok &= check(run_cli(executable, "example.com:99999"), false, "[E_INVALID_HOST]", "bad port");
        ok &= check(run_cli(executable, "--snapshot ../etc example.com"), false, "[E_CONFIG_VALUE]", "bad snapshot");
        ok &= check(run_cli(executable, "--data-dir /nonexistent/restore-pages-data --quiet example.com"), false,
                    "[E_SNAPSHOT_MISSING]", "missing snapshot");
        return ok ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Unexpected exception: " << ex.what() << std::endl;
        return 1;
    }
}
