#include "pagesrestore/Config.hpp"
#include "pagesrestore/Errors.hpp"
#include "pagesrestore/core/DeploymentMode.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"
#include "pagesrestore/remote/HostSpec.hpp"
#include "pagesrestore/transfer/TransferDispatcher.hpp"
#include "pagesrestore/transfer/Transferrer.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<pagesrestore::transfer::TransferTask> make_tasks(std::size_t count) {
    std::vector<pagesrestore::transfer::TransferTask> tasks;
    for (std::size_t i = 1; i <= count; ++i) {
        pagesrestore::transfer::TransferTask task{};
        task.node = "pages-server-" + std::to_string(i);
        task.destination = task.node;
        task.paths = {pagesrestore::test::make_content_path(i)};
        tasks.push_back(task);
    }
    return tasks;
}

void test_sequential_stops_at_first_failure() {
    pagesrestore::Config config{};
    pagesrestore::test::FakeTransferrer transferrer;
    transferrer.fail_nodes = {"pages-server-2"};
    pagesrestore::transfer::TransferDispatcher dispatcher(config, transferrer);

    bool thrown = false;
    try {
        dispatcher.dispatch(make_tasks(3));
    } catch (const pagesrestore::RestoreError& ex) {
        thrown = ex.code() == "E_TRANSFER_FAILED" && ex.phase() == pagesrestore::Phase::Transfer;
    }
    assert(thrown);
    assert((transferrer.started_nodes() == std::vector<std::string>{"pages-server-1", "pages-server-2"}));
    // The first transfer is left in place.
    assert(transferrer.completed.size() == 1);
    assert(transferrer.completed.front().node == "pages-server-1");
}

void test_parallel_runs_all_within_bound() {
    pagesrestore::Config config{};
    config.transfer_parallelism = 2;
    pagesrestore::test::FakeTransferrer transferrer;
    transferrer.on_transfer = [](const pagesrestore::transfer::TransferTask&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(15));
    };
    pagesrestore::transfer::TransferDispatcher dispatcher(config, transferrer);

    assert(dispatcher.dispatch(make_tasks(6)) == 6);
    assert(transferrer.completed.size() == 6);
    assert(transferrer.peak_in_flight.load() <= 2);
}

void test_parallelism_per_node() {
    pagesrestore::Config config{};
    config.transfer_parallelism = 0;
    pagesrestore::test::FakeTransferrer transferrer;
    pagesrestore::transfer::TransferDispatcher dispatcher(config, transferrer);
    assert(dispatcher.effective_parallelism(4) == 4);
    assert(dispatcher.effective_parallelism(0) == 1);

    config.transfer_parallelism = 1;
    assert(dispatcher.effective_parallelism(4) == 1);
}

void test_plan_transfers() {
    pagesrestore::Config config{};
    config.cluster = true;
    const auto host = pagesrestore::remote::parse_host_spec("head.example.com", config);
    pagesrestore::ClusterMode mode(config, host);

    const pagesrestore::Partition partition{
        {"pages-server-2", {"b/b/b/b/b"}},
        {"pages-server-1", {"a/a/a/a/a", "c/c/c/c/c"}},
        {"pages-server-3", {}},
    };
    const std::map<pagesrestore::NodeId, std::filesystem::path> lists{
        {"pages-server-1", "/tmp/scratch/pages-server-1.rsync"},
        {"pages-server-2", "/tmp/scratch/pages-server-2.rsync"},
    };
    const auto tasks = pagesrestore::transfer::plan_transfers(pagesrestore::transfer::TransferPlanInput{
        partition, lists, mode, "/backup/current/pages", "/data/user/pages", "ssh -q -p 122 -l admin"});
    assert(tasks.size() == 2);
    assert(tasks[0].node == "pages-server-1");
    assert(tasks[0].destination == "pages-server-1");
    assert(tasks[0].paths.size() == 2);
    assert(tasks[1].files_from == "/tmp/scratch/pages-server-2.rsync");
    assert(tasks[1].destination_root == "/data/user/pages");
}

void test_rsync_arguments() {
    pagesrestore::Config config{};
    pagesrestore::transfer::RsyncTransferrer transferrer(config);
    pagesrestore::transfer::TransferTask task{};
    task.node = "pages-server-1";
    task.destination = "pages-server-1";
    task.files_from = "/tmp/scratch/pages-server-1.rsync";
    task.source_root = "/backup/current/pages/";
    task.destination_root = "/data/user/pages";
    task.remote_shell = "ssh -q -p 122 -F /tmp/scratch/ssh_config -l admin";

    const auto argv = transferrer.build_argv(task);
    const std::vector<std::string> expected{
        "rsync",
        "-avrHR",
        "--delete",
        "-e",
        "ssh -q -p 122 -F /tmp/scratch/ssh_config -l admin",
        "--rsync-path=sudo -u git rsync",
        "--files-from=/tmp/scratch/pages-server-1.rsync",
        "/backup/current/pages/./",
        "pages-server-1:/data/user/pages/",
    };
    assert(argv == expected);

    config.rsync_program = "/nonexistent/rsync-binary";
    bool thrown = false;
    try {
        transferrer.transfer(task);
    } catch (const pagesrestore::RestoreError& ex) {
        thrown = ex.code() == "E_TRANSFER_FAILED";
    }
    assert(thrown);
}

}  // namespace

int main() {
    pagesrestore::log::StructuredLogger::instance().set_enabled(false);
    test_sequential_stops_at_first_failure();
    test_parallel_runs_all_within_bound();
    test_parallelism_per_node();
    test_plan_transfers();
    test_rsync_arguments();
    return 0;
}
