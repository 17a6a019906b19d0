#include "wsbridge/workspace.hpp"
#include "wsbridge/core/log.hpp"
#include "wsbridge/errors.hpp"
#include "wsbridge/path_util.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace wsbridge {

namespace fs = std::filesystem;

namespace {

std::chrono::system_clock::time_point to_system_time(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

bool is_within(const fs::path& root, const fs::path& path) {
    auto root_str = root.string();
    auto path_str = path.string();
    while (root_str.size() > 1 && root_str.ends_with('/')) root_str.pop_back();
    return path_str == root_str || path_str.starts_with(root_str + "/");
}

WorkspaceEntry make_entry(const fs::directory_entry& entry, const std::string& rel) {
    WorkspaceEntry we;
    we.name = entry.path().filename().string();
    we.path = rel;

    std::error_code ec;
    we.is_directory = entry.is_directory(ec);
    if (!we.is_directory) {
        auto size = entry.file_size(ec);
        if (!ec) we.size = size;
    }
    auto mtime = entry.last_write_time(ec);
    if (!ec) we.last_modified = to_system_time(mtime);
    return we;
}

}  // namespace

WorkspaceBridge::WorkspaceBridge(fs::path workspace_root, std::string workspace_dir)
    : root_(std::move(workspace_root))
    , workspace_dir_(std::move(workspace_dir)) {}

fs::path WorkspaceBridge::tenant_root(const std::string& tenant) const {
    validate_tenant(tenant);
    return root_ / tenant / workspace_dir_;
}

fs::path WorkspaceBridge::resolve(const std::string& tenant, const std::string& rel) const {
    auto base = tenant_root(tenant);
    auto normalized = normalize_relative_path(rel);
    auto result = normalized.empty() ? base : base / normalized;

    // A symlink inside the workspace must not lead outside it
    std::error_code ec;
    auto canonical_base = fs::weakly_canonical(base, ec);
    if (ec) throw BridgeError(ErrorKind::Io, "Cannot resolve workspace root: " + ec.message());
    auto canonical_result = fs::weakly_canonical(result, ec);
    if (ec) throw BridgeError(ErrorKind::Io, "Cannot resolve path '" + rel + "': " + ec.message());
    if (!is_within(canonical_base, canonical_result)) {
        throw ValidationError("Path escapes the workspace: '" + rel + "'");
    }

    return result;
}

// --- Listing ---

std::vector<WorkspaceEntry> WorkspaceBridge::list_local(const std::string& tenant,
                                                        const std::string& rel) const {
    auto dir = resolve(tenant, rel);
    auto normalized = normalize_relative_path(rel);

    std::error_code ec;
    auto st = fs::status(dir, ec);
    if (ec || !fs::exists(st)) {
        throw BridgeError(ErrorKind::NotFound, "Path not found: '" + normalized + "'");
    }
    if (!fs::is_directory(st)) {
        throw ValidationError("Not a directory: '" + normalized + "'");
    }

    std::vector<WorkspaceEntry> entries;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        entries.push_back(make_entry(entry, join_path(normalized, name)));
    }
    if (ec) {
        throw BridgeError(ErrorKind::Io, "Cannot list '" + normalized + "': " + ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const WorkspaceEntry& a, const WorkspaceEntry& b) {
        if (a.is_directory != b.is_directory) return a.is_directory;
        return a.name < b.name;
    });
    return entries;
}

std::vector<WorkspaceEntry> WorkspaceBridge::walk(const std::string& tenant,
                                                  const std::string& rel) const {
    auto dir = resolve(tenant, rel);

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        throw BridgeError(ErrorKind::NotFound, "Path not found: '" + rel + "'");
    }
    if (!fs::is_directory(dir, ec)) {
        throw ValidationError("Not a directory: '" + rel + "'");
    }

    std::vector<WorkspaceEntry> entries;
    fs::recursive_directory_iterator it(dir, fs::directory_options::none, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec)) continue;

        auto relative = entry.path().lexically_relative(dir).generic_string();
        if (entry.is_directory(entry_ec)) {
            if (!fs::is_empty(entry.path(), entry_ec) || entry_ec) continue;
        } else if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        entries.push_back(make_entry(entry, relative));
    }
    if (ec) {
        throw BridgeError(ErrorKind::Io, "Cannot walk '" + rel + "': " + ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const WorkspaceEntry& a, const WorkspaceEntry& b) {
        return a.path < b.path;
    });
    return entries;
}

// --- Key mapping ---

std::string WorkspaceBridge::key_for(const std::string& tenant,
                                     const std::string& rel,
                                     const std::string& prefix) const {
    validate_tenant(tenant);
    return normalize_prefix(prefix) + normalize_relative_path(rel);
}

std::string WorkspaceBridge::path_for(const std::string& tenant,
                                      const std::string& key,
                                      const std::string& prefix) const {
    validate_tenant(tenant);
    auto normalized_prefix = normalize_prefix(prefix);
    if (!key.starts_with(normalized_prefix)) {
        throw ValidationError("Key '" + key + "' is outside prefix '" + normalized_prefix + "'");
    }
    return normalize_relative_path(key.substr(normalized_prefix.size()));
}

// --- Mutations ---

bool WorkspaceBridge::make_directory(const std::string& tenant, const std::string& rel) const {
    if (normalize_relative_path(rel).empty()) {
        throw ValidationError("Directory name is empty");
    }
    auto dir = resolve(tenant, rel);

    std::error_code ec;
    bool created = fs::create_directories(dir, ec);
    if (ec) {
        throw BridgeError(ErrorKind::Io, "Cannot create directory '" + rel + "': " + ec.message());
    }
    if (!fs::is_directory(dir, ec)) {
        throw ValidationError("A file named '" + rel + "' already exists");
    }
    return created;
}

uint64_t WorkspaceBridge::remove(const std::string& tenant, const std::string& rel) const {
    if (normalize_relative_path(rel).empty()) {
        throw ValidationError("Refusing to delete the workspace root");
    }
    auto path = resolve(tenant, rel);

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) {
        throw BridgeError(ErrorKind::NotFound, "Path not found: '" + rel + "'");
    }
    auto removed = fs::remove_all(path, ec);
    if (ec) {
        throw BridgeError(ErrorKind::Io, "Cannot delete '" + rel + "': " + ec.message());
    }
    log_debug("Removed %ju entries under %s", static_cast<uintmax_t>(removed), path.c_str());
    return removed;
}

void WorkspaceBridge::write_bytes(const std::string& tenant, const std::string& rel,
                                  std::span<const uint8_t> data) const {
    if (normalize_relative_path(rel).empty()) {
        throw ValidationError("File name is empty");
    }
    auto path = resolve(tenant, rel);

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw ValidationError("A directory named '" + rel + "' already exists");
    }
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw BridgeError(ErrorKind::Io, "Cannot create directory for '" + rel + "': " + ec.message());
    }

    auto part = path;
    part += ".part";
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) {
            out.close();
            fs::remove(part, ec);
            throw BridgeError(ErrorKind::Io, "Cannot write '" + rel + "'");
        }
    }
    fs::rename(part, path, ec);
    if (ec) {
        std::error_code remove_ec;
        fs::remove(part, remove_ec);
        throw BridgeError(ErrorKind::Io, "Cannot write '" + rel + "': " + ec.message());
    }
}

// --- Reads ---

std::string WorkspaceBridge::read_text(const std::string& tenant,
                                       const std::string& rel,
                                       uint64_t max_bytes) const {
    auto path = resolve(tenant, rel);

    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        throw BridgeError(ErrorKind::NotFound, "File not found: '" + rel + "'");
    }
    if (!fs::is_regular_file(st)) {
        throw ValidationError("Not a file: '" + rel + "'");
    }
    auto size = fs::file_size(path, ec);
    if (ec) throw BridgeError(ErrorKind::Io, "Cannot stat '" + rel + "': " + ec.message());
    if (size > max_bytes) {
        throw ValidationError("File too large to read (" + std::to_string(size) +
                              " bytes, limit " + std::to_string(max_bytes) + ")");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) throw BridgeError(ErrorKind::Io, "Cannot open '" + rel + "'");
    std::string content(size, '\0');
    in.read(content.data(), static_cast<std::streamsize>(size));
    content.resize(static_cast<size_t>(in.gcount()));
    return content;
}

StreamResult WorkspaceBridge::stream_file(const std::string& tenant,
                                          const std::string& rel,
                                          const ObjectSink& sink,
                                          size_t chunk_size) const {
    StreamResult result;
    auto path = resolve(tenant, rel);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.not_found = true;
        result.error_message = "File not found: '" + rel + "'";
        return result;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        result.error_message = "Cannot open '" + rel + "'";
        return result;
    }

    std::vector<char> buffer(chunk_size);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;
        if (!sink(buffer.data(), got)) {
            result.aborted = true;
            result.error_message = "Read aborted";
            return result;
        }
        result.bytes += got;
    }
    if (in.bad()) {
        result.error_message = "Read error on '" + rel + "'";
        return result;
    }

    result.success = true;
    return result;
}

}  // namespace wsbridge
