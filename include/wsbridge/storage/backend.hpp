#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace wsbridge {

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
};

struct PutResult {
    bool success = false;
    std::string etag;
    std::string error_message;
};

struct GetResult {
    bool success = false;
    bool not_found = false;
    std::vector<uint8_t> data;
    ObjectMetadata metadata;
    std::string error_message;
};

// Result of a streamed read
struct StreamResult {
    bool success = false;
    bool not_found = false;
    bool aborted = false;  // sink returned false
    uint64_t bytes = 0;
    std::string error_message;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string etag;
    bool is_directory = false;  // common prefix (delimited listing only)
};

struct ListResult {
    bool success = false;
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
    std::string error_message;
};

struct CopyResult {
    bool success = false;
    bool unsupported = false;  // store cannot copy server-side; caller falls back
    std::string error_message;
};

// Bucket reachability probe, classified for the connection test
struct ProbeResult {
    enum class Status {
        Ok,
        BucketNotFound,
        AccessDenied,
        InvalidCredentials,
        ConnectionError,
        Other
    };

    Status status = Status::Other;
    int http_status = 0;
    std::string error_code;  // S3 <Code> when the server sent one
    std::string message;
};

struct PutOptions {
    std::string content_type = "application/octet-stream";
};

struct ListOptions {
    std::string prefix;
    std::string delimiter = "/";
    uint32_t max_keys = 1000;
    std::string continuation_token;
};

/// Receives object bytes in order. Return false to abort the read.
using ObjectSink = std::function<bool(const char* data, size_t size)>;

/// Reports cumulative bytes sent by a streamed write. Return false to abort.
using ProgressCallback = std::function<bool(uint64_t bytes_sent)>;

// Abstract interface for object stores.
// Keys are bucket-relative; a key ending in '/' is a folder marker.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual std::string type_name() const = 0;

    // Two backends with the same store id can copy between each other server-side
    virtual std::string store_id() const = 0;

    virtual std::optional<ObjectMetadata> head(const std::string& key) const = 0;

    virtual GetResult get(const std::string& key) const = 0;

    virtual StreamResult get_stream(const std::string& key,
                                    const ObjectSink& sink) const = 0;

    virtual PutResult put(const std::string& key,
                          std::span<const uint8_t> data,
                          const PutOptions& options = {}) = 0;

    // Streams the file; never holds more than one part in memory
    virtual PutResult put_file(const std::string& key,
                               const std::filesystem::path& path,
                               const PutOptions& options = {},
                               const ProgressCallback& progress = nullptr) = 0;

    virtual bool remove(const std::string& key) = 0;

    // Returns the keys that could not be deleted
    virtual std::vector<std::string> remove_batch(
        const std::vector<std::string>& keys) = 0;

    virtual ListResult list(const ListOptions& options = {}) const = 0;

    virtual CopyResult copy(const std::string& source,
                            const std::string& destination) = 0;

    virtual ProbeResult probe() const = 0;
};

// Factory for creating storage backends from configuration
class StorageBackendFactory {
public:
    // "local" needs "path"; "s3" needs "bucket" and accepts region, endpoint,
    // access_key, secret_key, use_path_style, verify_ssl, unsigned_payload,
    // multipart_threshold, multipart_chunk_size, connect_timeout,
    // request_timeout, max_retries
    static std::unique_ptr<StorageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& config);

    static std::unique_ptr<StorageBackend> create_local(
        const std::filesystem::path& root_path);
};

}  // namespace wsbridge
