#pragma once

#include "wsbridge/core/constants.hpp"
#include "wsbridge/storage/backend.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace wsbridge {

struct WorkspaceEntry {
    std::string name;
    std::string path;          // workspace-relative (list_local) or walk-root-relative (walk)
    bool is_directory = false;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
};

/// Sandboxed access to tenant workspaces under
/// `<workspace_root>/<tenant>/<workspace_dir>`.
///
/// Every method validates the tenant and normalizes the relative path before
/// touching the filesystem. Failures throw BridgeError: Validation for bad
/// input or sandbox escapes, NotFound for missing paths, Io for filesystem
/// errors.
class WorkspaceBridge {
public:
    explicit WorkspaceBridge(std::filesystem::path workspace_root,
                             std::string workspace_dir = constants::WORKSPACE_DIR_NAME);

    const std::filesystem::path& workspace_root() const { return root_; }

    std::filesystem::path tenant_root(const std::string& tenant) const;

    /// Absolute path for `rel` inside the tenant's workspace. Rejects `..`,
    /// NUL, and symlinks that resolve outside the workspace.
    std::filesystem::path resolve(const std::string& tenant, const std::string& rel) const;

    /// Directory listing, directories first then by name.
    std::vector<WorkspaceEntry> list_local(const std::string& tenant, const std::string& rel) const;

    /// Files and empty directories below `rel`, paths relative to `rel`,
    /// sorted by path. Symlinks are skipped.
    std::vector<WorkspaceEntry> walk(const std::string& tenant, const std::string& rel) const;

    // Storage key <-> workspace path mapping
    std::string key_for(const std::string& tenant, const std::string& rel, const std::string& prefix) const;
    std::string path_for(const std::string& tenant, const std::string& key, const std::string& prefix) const;

    /// Returns false if the directory already existed.
    bool make_directory(const std::string& tenant, const std::string& rel) const;

    /// Recursive delete. Returns the number of filesystem entries removed.
    uint64_t remove(const std::string& tenant, const std::string& rel) const;

    /// Writes `data` through a temp file and rename, creating parents.
    void write_bytes(const std::string& tenant, const std::string& rel,
                     std::span<const uint8_t> data) const;

    std::string read_text(const std::string& tenant, const std::string& rel, uint64_t max_bytes) const;

    StreamResult stream_file(const std::string& tenant,
                             const std::string& rel,
                             const ObjectSink& sink,
                             size_t chunk_size) const;

private:
    std::filesystem::path root_;
    std::string workspace_dir_;
};

}  // namespace wsbridge
