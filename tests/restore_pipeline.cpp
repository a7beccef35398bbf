#include "pagesrestore/Config.hpp"
#include "pagesrestore/Errors.hpp"
#include "pagesrestore/core/DeploymentMode.hpp"
#include "pagesrestore/core/RestorePipeline.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"
#include "pagesrestore/remote/HostSpec.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace {

struct Harness {
    explicit Harness(const std::string& label, bool cluster = false)
        : data(label) {
        config.data_dir = data.path().string();
        config.cluster = cluster;
        config.finalize_parallelism = 1;
        host = pagesrestore::remote::parse_host_spec(cluster ? "head.example.com" : "pages.example.com", config);
        mode = pagesrestore::make_deployment_mode(config, host);
    }

    pagesrestore::RestoreSummary run() {
        pagesrestore::RestorePipeline pipeline(config, host, {shell, oracle, transferrer, finalizer, *mode});
        return pipeline.run();
    }

    pagesrestore::test::TempDir data;
    pagesrestore::Config config{};
    pagesrestore::remote::HostSpec host;
    std::unique_ptr<pagesrestore::DeploymentMode> mode;
    pagesrestore::test::FakeRemoteShell shell;
    pagesrestore::test::FakeRouteOracle oracle;
    pagesrestore::test::FakeTransferrer transferrer;
    pagesrestore::test::FakeFinalizer finalizer;
};

void test_empty_snapshot_skips_resolution() {
    Harness harness("pipeline-empty");
    std::filesystem::create_directories(harness.data.path() / "current" / "pages");

    const auto summary = harness.run();
    assert(summary.outcome == pagesrestore::RestoreOutcome::NothingToRestore);
    assert(summary.content_paths == 0);
    assert(harness.oracle.calls == 0);
    assert(harness.transferrer.started.empty());
    assert(harness.finalizer.attempts == 0);
    assert(harness.shell.removed.size() == 1);
}

void test_missing_snapshot_is_config_error() {
    Harness harness("pipeline-missing");
    harness.config.snapshot = "20260101T000000";
    bool thrown = false;
    try {
        harness.run();
    } catch (const pagesrestore::ConfigError& ex) {
        thrown = ex.code() == "E_SNAPSHOT_MISSING";
    }
    assert(thrown);
    assert(harness.oracle.calls == 0);
    assert(harness.shell.commands.empty());
}

void test_empty_route_response() {
    Harness harness("pipeline-noroutes");
    pagesrestore::test::populate_snapshot(harness.data.path(), "current", 3);

    const auto summary = harness.run();
    assert(summary.outcome == pagesrestore::RestoreOutcome::NoRoutes);
    assert(harness.oracle.calls == 1);
    assert(harness.transferrer.started.empty());
    assert(harness.shell.removed.size() == 1);
}

void test_unplaced_routes_only() {
    Harness harness("pipeline-unplaced", true);
    const auto paths = pagesrestore::test::populate_snapshot(harness.data.path(), "current", 2);
    for (const auto& path : paths) {
        harness.oracle.table.push_back(pagesrestore::RouteEntry{path, {}});
    }

    const auto summary = harness.run();
    assert(summary.outcome == pagesrestore::RestoreOutcome::NoRoutes);
    assert(summary.route_entries == 2);
    assert(harness.transferrer.started.empty());
    assert(harness.finalizer.attempts == 0);
}

void test_single_host_restore() {
    Harness harness("pipeline-single");
    const auto paths = pagesrestore::test::populate_snapshot(harness.data.path(), "current", 5);
    harness.oracle.route_all_to = {"localhost"};

    const auto summary = harness.run();
    assert(summary.outcome == pagesrestore::RestoreOutcome::Restored);
    assert(summary.content_paths == 5);
    assert(summary.routed_paths == 5);
    assert(summary.nodes == 1);
    assert(summary.transfers == 1);
    assert(summary.finalize_chunks == 0);
    assert(harness.oracle.requested == paths);
    assert(harness.oracle.scratch_seen.remote == "/tmp/fake-remote-scratch");

    assert(harness.transferrer.completed.size() == 1);
    const auto& task = harness.transferrer.completed.front();
    assert(task.node == "localhost");
    assert(task.destination == "pages.example.com");
    assert(task.paths == paths);
    assert(task.source_root == harness.data.path() / "current" / "pages");
    assert(task.destination_root == "/data/user/pages");
    assert(task.remote_shell == "ssh -q -p 122 -l admin");
    assert(task.files_from.filename() == "localhost.rsync");
    // The file list lived in scratch space and is gone with it.
    assert(!std::filesystem::exists(task.files_from));
    assert(harness.finalizer.attempts == 0);
    assert(harness.shell.removed.size() == 1);
}

void test_cluster_restore() {
    Harness harness("pipeline-cluster", true);
    const auto paths = pagesrestore::test::populate_snapshot(harness.data.path(), "current", 2500);
    harness.oracle.route_all_to = {"pages-server-1", "pages-server-2", "pages-server-3"};
    harness.shell.handler = [](const std::vector<std::string>& command, std::string_view) {
        if (command.front() == "cluster-find-nodes") {
            return pagesrestore::test::FakeRemoteShell::ok("pages-server-1\npages-server-2\npages-server-3\n");
        }
        return pagesrestore::test::FakeRemoteShell::ok({});
    };
    harness.transferrer.on_transfer = [](const pagesrestore::transfer::TransferTask& task) {
        // Every node's list reaches rsync while scratch space still exists.
        assert(std::filesystem::exists(task.files_from));
        assert(task.remote_shell.find(" -F ") != std::string::npos);
    };

    const auto summary = harness.run();
    assert(summary.outcome == pagesrestore::RestoreOutcome::Restored);
    assert(summary.nodes == 3);
    assert(summary.transfers == 3);
    assert(summary.finalize_chunks == 3);
    assert((harness.finalizer.chunk_sizes == std::vector<std::size_t>{1000, 1000, 500}));
    assert(harness.finalizer.finalized_paths.size() == 2500);

    std::set<std::string> transferred;
    for (const auto& task : harness.transferrer.completed) {
        assert(task.destination == task.node);
        assert(task.paths == paths);
        transferred.insert(task.paths.begin(), task.paths.end());
    }
    assert(transferred.size() == 2500);
    assert(harness.shell.count_commands_starting_with("cluster-find-nodes") == 1);
    assert(harness.shell.removed.size() == 1);
}

void test_transfer_failure_stops_run() {
    Harness harness("pipeline-failure", true);
    const auto paths = pagesrestore::test::populate_snapshot(harness.data.path(), "current", 4);
    harness.oracle.table = {
        pagesrestore::RouteEntry{paths[0], {"node-a"}},
        pagesrestore::RouteEntry{paths[1], {"node-b"}},
        pagesrestore::RouteEntry{paths[2], {"node-c"}},
        pagesrestore::RouteEntry{paths[3], {"node-a", "node-c"}},
    };
    harness.shell.handler = [](const std::vector<std::string>& command, std::string_view) {
        if (command.front() == "cluster-find-nodes") {
            return pagesrestore::test::FakeRemoteShell::ok("node-a node-b node-c\n");
        }
        return pagesrestore::test::FakeRemoteShell::ok({});
    };
    harness.transferrer.fail_nodes = {"node-b"};

    bool thrown = false;
    try {
        harness.run();
    } catch (const pagesrestore::RestoreError& ex) {
        thrown = ex.phase() == pagesrestore::Phase::Transfer && ex.code() == "E_TRANSFER_FAILED";
    }
    assert(thrown);
    assert((harness.transferrer.started_nodes() == std::vector<std::string>{"node-a", "node-b"}));
    assert(harness.finalizer.attempts == 0);
    assert(harness.shell.removed.size() == 1);
}

void test_route_failure_releases_scratch() {
    Harness harness("pipeline-routefail");
    pagesrestore::test::populate_snapshot(harness.data.path(), "current", 2);
    harness.oracle.fail = true;

    bool thrown = false;
    try {
        harness.run();
    } catch (const pagesrestore::RestoreError& ex) {
        thrown = ex.code() == "E_ROUTES_FAILED";
    }
    assert(thrown);
    assert(harness.transferrer.started.empty());
    assert(harness.shell.removed.size() == 1);
    assert(!std::filesystem::exists(harness.oracle.scratch_seen.local));
}

void test_repeat_run_is_identical() {
    Harness harness("pipeline-repeat");
    pagesrestore::test::populate_snapshot(harness.data.path(), "current", 7);
    harness.oracle.route_all_to = {"localhost"};

    const auto first = harness.run();
    const auto second = harness.run();
    assert(first.outcome == second.outcome);
    assert(first.routed_paths == second.routed_paths);
    assert(harness.transferrer.completed.size() == 2);
    assert(harness.transferrer.completed[0].paths == harness.transferrer.completed[1].paths);
    assert(harness.shell.removed.size() == 2);
}

void test_outcome_and_phase_events() {
    {
        Harness harness("pipeline-events-empty");
        std::filesystem::create_directories(harness.data.path() / "current" / "pages");
        pagesrestore::test::CapturedLog log(true);
        harness.run();
        assert(log.contains("\"event\":\"nothing_to_restore\""));
        assert(log.contains("\"outcome\":\"nothing_to_restore\""));
        assert(log.contains("\"event\":\"phase_end\",\"fields\":{\"phase\":\"enumerate\",\"elapsed_ms\":"));
        assert(!log.contains("\"phase\":\"resolve\""));
    }
    {
        Harness harness("pipeline-events-noroutes");
        pagesrestore::test::populate_snapshot(harness.data.path(), "current", 2);
        pagesrestore::test::CapturedLog log;
        harness.run();
        assert(log.contains("\"outcome\":\"no_routes\""));
        // Phase brackets are debug events.
        assert(!log.contains("phase_end"));
    }
    {
        Harness harness("pipeline-events-restored");
        pagesrestore::test::populate_snapshot(harness.data.path(), "current", 3);
        harness.oracle.route_all_to = {"localhost"};
        pagesrestore::test::CapturedLog log;
        harness.run();
        assert(log.contains("\"event\":\"restore_done\",\"fields\":{\"outcome\":\"restored\",\"paths\":\"3\""));
    }
    {
        Harness harness("pipeline-events-failed");
        pagesrestore::test::populate_snapshot(harness.data.path(), "current", 2);
        harness.oracle.fail = true;
        pagesrestore::test::CapturedLog log;
        bool thrown = false;
        try {
            harness.run();
        } catch (const pagesrestore::RestoreError&) {
            thrown = true;
        }
        assert(thrown);
        assert(log.contains("\"level\":\"error\",\"event\":\"phase_failed\",\"fields\":{\"phase\":\"resolve\""));
        assert(!log.contains("restore_done"));
    }
}

}  // namespace

int main() {
    pagesrestore::log::StructuredLogger::instance().set_enabled(false);
    test_empty_snapshot_skips_resolution();
    test_missing_snapshot_is_config_error();
    test_empty_route_response();
    test_unplaced_routes_only();
    test_single_host_restore();
    test_cluster_restore();
    test_transfer_failure_stops_run();
    test_route_failure_releases_scratch();
    test_repeat_run_is_identical();
    test_outcome_and_phase_events();
    return 0;
}
