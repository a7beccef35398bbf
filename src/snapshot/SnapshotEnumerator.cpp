#include "pagesrestore/snapshot/SnapshotEnumerator.hpp"

#include "pagesrestore/Errors.hpp"
#include "pagesrestore/log/StructuredLogger.hpp"

#include <algorithm>
#include <system_error>

namespace pagesrestore::snapshot {

SnapshotEnumerator::SnapshotEnumerator(const Config& config)
    : config_(config) {}

std::filesystem::path SnapshotEnumerator::snapshot_root() const {
    return std::filesystem::path(config_.data_dir) / config_.snapshot;
}

std::filesystem::path SnapshotEnumerator::content_root() const {
    return snapshot_root() / config_.pages_subdir;
}

void SnapshotEnumerator::require_snapshot() const {
    std::error_code ec;
    const auto root = snapshot_root();
    if (!std::filesystem::is_directory(root, ec)) {
        throw_config_error("E_SNAPSHOT_MISSING",
                           "Snapshot not found: " + root.string(),
                           "Check the data directory and snapshot label");
    }
}

std::vector<ContentPath> SnapshotEnumerator::enumerate() const {
    namespace fs = std::filesystem;

    require_snapshot();

    std::error_code ec;

    const auto content = content_root();
    if (!fs::is_directory(content, ec)) {
        log::StructuredLogger::instance().warning("snapshot_content_missing", {{"path", content.string()}});
        return {};
    }
    if (config_.path_depth == 0) {
        return {};
    }

    const auto leaf_depth = static_cast<int>(config_.path_depth) - 1;
    std::vector<ContentPath> paths;

    fs::recursive_directory_iterator it(content, fs::directory_options::none, ec);
    if (ec) {
        throw_restore_error(Phase::Enumerate, "E_SNAPSHOT_READ",
                            "Unable to read snapshot content at " + content.string(), ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw_restore_error(Phase::Enumerate, "E_SNAPSHOT_READ",
                                "Unable to walk snapshot content at " + content.string(), ec.message());
        }
        if (it.depth() < leaf_depth) {
            continue;
        }
        it.disable_recursion_pending();
        paths.push_back(it->path().lexically_relative(content).generic_string());
    }
    if (ec) {
        throw_restore_error(Phase::Enumerate, "E_SNAPSHOT_READ",
                            "Unable to walk snapshot content at " + content.string(), ec.message());
    }

    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

    log::StructuredLogger::instance().debug("snapshot_enumerated",
                                            {{"path", content.string()}, {"items", std::to_string(paths.size())}});
    return paths;
}

}  // namespace pagesrestore::snapshot
