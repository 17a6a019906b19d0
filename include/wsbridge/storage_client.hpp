#pragma once

#include "wsbridge/storage/backend.hpp"
#include "wsbridge/storage_config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace wsbridge {

/// An object or folder, addressed relative to the client's prefix.
struct StorageEntry {
    std::string name;
    std::string path;         // relative, no trailing slash
    bool is_directory = false;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
};

struct StorageListResult {
    bool success = false;
    std::vector<StorageEntry> entries;
    std::string error_message;
};

struct ReadResult {
    bool success = false;
    bool not_found = false;
    bool too_large = false;
    uint64_t size = 0;
    std::vector<uint8_t> data;
    std::string error_message;
};

struct RemoveResult {
    bool success = false;
    size_t removed = 0;
    std::string error_message;
};

enum class ConnectionStatus {
    Ok,
    BucketNotFound,
    AccessDenied,
    InvalidCredentials,
    ConnectionError,
    Other
};

const char* connection_status_name(ConnectionStatus status);

struct ConnectionCheck {
    bool ok = false;
    ConnectionStatus status = ConnectionStatus::Other;
    std::string message;
};

/// Prefix-scoped view of one bucket. Every key argument is relative to the
/// prefix and normalized; traversal segments throw ValidationError.
class StorageClient {
public:
    /// Throws std::invalid_argument when the config cannot produce a backend.
    static std::unique_ptr<StorageClient> build(const StorageConfig& config);

    StorageClient(std::unique_ptr<StorageBackend> backend, const std::string& prefix);

    const std::string& prefix() const { return prefix_; }
    StorageBackend& backend() { return *backend_; }
    const StorageBackend& backend() const { return *backend_; }

    std::string full_key(const std::string& rel) const;

    /// Prefix of everything under `rel` ("<prefix><rel>/", or the prefix itself for the root).
    std::string folder_key(const std::string& rel) const;

    /// Inverse of full_key; nullopt for keys outside the prefix.
    std::optional<std::string> relative_key(const std::string& key) const;

    /// Non-recursive: folders first, then files, each sorted by name.
    /// Recursive: every object and folder marker below `rel`, sorted by path.
    StorageListResult list(const std::string& rel, bool recursive) const;

    /// True if anything (marker or object) exists below `rel/`.
    bool is_folder(const std::string& rel) const;

    std::optional<ObjectMetadata> head(const std::string& rel) const;

    ReadResult read(const std::string& rel, uint64_t max_bytes) const;

    StreamResult stream(const std::string& rel, const ObjectSink& sink) const;

    PutResult write(const std::string& rel, std::span<const uint8_t> data);

    PutResult write_file(const std::string& rel,
                         const std::filesystem::path& path,
                         const ProgressCallback& progress = nullptr);

    bool remove(const std::string& rel);

    /// Deletes every object under `rel/` plus its marker, in batches.
    RemoveResult remove_recursive(const std::string& rel);

    PutResult make_folder(const std::string& rel);

    /// Copies one object. Server-side when both clients share a store,
    /// otherwise streamed through a temp file under `staging_dir`.
    CopyResult copy_to(const std::string& src,
                       StorageClient& dest,
                       const std::string& dst,
                       const std::filesystem::path& staging_dir,
                       const ProgressCallback& progress = nullptr);

private:
    std::unique_ptr<StorageBackend> backend_;
    std::string prefix_;
};

/// Probes the configured bucket and classifies the outcome.
ConnectionCheck test_connection(const StorageConfig& config);

}  // namespace wsbridge
