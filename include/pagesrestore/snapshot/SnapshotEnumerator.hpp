#pragma once

#include "pagesrestore/Config.hpp"
#include "pagesrestore/Types.hpp"

#include <filesystem>
#include <vector>

namespace pagesrestore::snapshot {

class SnapshotEnumerator {
public:
    explicit SnapshotEnumerator(const Config& config);

    // <data_dir>/<snapshot>
    std::filesystem::path snapshot_root() const;
    // <data_dir>/<snapshot>/pages
    std::filesystem::path content_root() const;

    // Throws ConfigError E_SNAPSHOT_MISSING unless the snapshot directory exists.
    void require_snapshot() const;

    // Sorted, duplicate-free relative paths of every entry exactly
    // `path_depth` levels below the content root. Empty when the snapshot
    // holds no content directory.
    std::vector<ContentPath> enumerate() const;

private:
    const Config& config_;
};

}  // namespace pagesrestore::snapshot
