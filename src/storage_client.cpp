#include "wsbridge/storage_client.hpp"
#include "wsbridge/core/constants.hpp"
#include "wsbridge/core/log.hpp"
#include "wsbridge/path_util.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <set>
#include <stdexcept>
#include <unistd.h>

namespace wsbridge {

namespace fs = std::filesystem;

const char* connection_status_name(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Ok: return "ok";
        case ConnectionStatus::BucketNotFound: return "bucket-not-found";
        case ConnectionStatus::AccessDenied: return "access-denied";
        case ConnectionStatus::InvalidCredentials: return "invalid-credentials";
        case ConnectionStatus::ConnectionError: return "connection-error";
        case ConnectionStatus::Other: return "other";
    }
    return "other";
}

// --- Construction ---

std::unique_ptr<StorageClient> StorageClient::build(const StorageConfig& config) {
    if (config.bucket.empty()) {
        throw std::invalid_argument("Storage config has no bucket");
    }
    auto backend = StorageBackendFactory::create(config.backend_type(), config.backend_params());
    return std::make_unique<StorageClient>(std::move(backend), config.prefix);
}

StorageClient::StorageClient(std::unique_ptr<StorageBackend> backend, const std::string& prefix)
    : backend_(std::move(backend))
    , prefix_(normalize_prefix(prefix)) {}

// --- Key mapping ---

std::string StorageClient::full_key(const std::string& rel) const {
    return prefix_ + normalize_relative_path(rel);
}

std::string StorageClient::folder_key(const std::string& rel) const {
    auto normalized = normalize_relative_path(rel);
    return normalized.empty() ? prefix_ : prefix_ + normalized + "/";
}

std::optional<std::string> StorageClient::relative_key(const std::string& key) const {
    if (!key.starts_with(prefix_)) return std::nullopt;
    return key.substr(prefix_.size());
}

// --- Reads ---

StorageListResult StorageClient::list(const std::string& rel, bool recursive) const {
    StorageListResult result;
    auto base = folder_key(rel);

    ListOptions options;
    options.prefix = base;
    options.delimiter = recursive ? "" : "/";
    options.max_keys = constants::DEFAULT_LIST_PAGE_SIZE;

    std::set<std::string> seen;
    while (true) {
        auto page = backend_->list(options);
        if (!page.success) {
            result.error_message = page.error_message;
            return result;
        }

        for (const auto& item : page.entries) {
            if (item.key == base) continue;  // the folder's own marker
            auto relative = relative_key(item.key);
            if (!relative) continue;

            StorageEntry entry;
            entry.is_directory = item.is_directory || item.key.ends_with('/');
            entry.path = *relative;
            while (entry.path.ends_with('/')) entry.path.pop_back();
            if (entry.path.empty() || !seen.insert(entry.path).second) continue;

            entry.name = base_name(entry.path);
            entry.size = entry.is_directory ? 0 : item.size;
            entry.last_modified = item.last_modified;
            result.entries.push_back(std::move(entry));
        }

        if (!page.truncated || page.continuation_token.empty()) break;
        options.continuation_token = page.continuation_token;
    }

    if (recursive) {
        std::sort(result.entries.begin(), result.entries.end(),
                  [](const StorageEntry& a, const StorageEntry& b) { return a.path < b.path; });
    } else {
        std::sort(result.entries.begin(), result.entries.end(),
                  [](const StorageEntry& a, const StorageEntry& b) {
                      if (a.is_directory != b.is_directory) return a.is_directory;
                      return a.name < b.name;
                  });
    }

    result.success = true;
    return result;
}

bool StorageClient::is_folder(const std::string& rel) const {
    if (normalize_relative_path(rel).empty()) return true;

    ListOptions options;
    options.prefix = folder_key(rel);
    options.delimiter = "";
    options.max_keys = 1;
    auto page = backend_->list(options);
    return page.success && !page.entries.empty();
}

std::optional<ObjectMetadata> StorageClient::head(const std::string& rel) const {
    return backend_->head(full_key(rel));
}

ReadResult StorageClient::read(const std::string& rel, uint64_t max_bytes) const {
    ReadResult result;
    auto key = full_key(rel);

    auto meta = backend_->head(key);
    if (!meta) {
        result.not_found = true;
        result.error_message = "File not found: " + rel;
        return result;
    }
    result.size = meta->size;
    if (meta->size > max_bytes) {
        result.too_large = true;
        result.error_message = "File too large to read (" + std::to_string(meta->size) +
                               " bytes, limit " + std::to_string(max_bytes) + ")";
        return result;
    }

    auto got = backend_->get(key);
    if (!got.success) {
        result.not_found = got.not_found;
        result.error_message = got.error_message;
        return result;
    }

    result.success = true;
    result.data = std::move(got.data);
    return result;
}

StreamResult StorageClient::stream(const std::string& rel, const ObjectSink& sink) const {
    return backend_->get_stream(full_key(rel), sink);
}

// --- Writes ---

PutResult StorageClient::write(const std::string& rel, std::span<const uint8_t> data) {
    return backend_->put(full_key(rel), data);
}

PutResult StorageClient::write_file(const std::string& rel,
                                    const fs::path& path,
                                    const ProgressCallback& progress) {
    return backend_->put_file(full_key(rel), path, {}, progress);
}

bool StorageClient::remove(const std::string& rel) {
    return backend_->remove(full_key(rel));
}

RemoveResult StorageClient::remove_recursive(const std::string& rel) {
    RemoveResult result;
    auto base = folder_key(rel);
    if (base == prefix_) {
        result.error_message = "Refusing to delete the storage root";
        return result;
    }

    ListOptions options;
    options.prefix = base;
    options.delimiter = "";
    options.max_keys = constants::MAX_DELETE_BATCH;

    // Delete page by page; each page is one DeleteObjects batch
    while (true) {
        auto page = backend_->list(options);
        if (!page.success) {
            result.error_message = page.error_message;
            return result;
        }

        std::vector<std::string> keys;
        for (const auto& item : page.entries) {
            if (item.key != base) keys.push_back(item.key);
        }
        if (!keys.empty()) {
            auto failed = backend_->remove_batch(keys);
            result.removed += keys.size() - failed.size();
            if (!failed.empty()) {
                result.error_message = "Failed to delete " + std::to_string(failed.size()) +
                                       " objects, first: " + failed.front();
                return result;
            }
        }

        if (!page.truncated || page.continuation_token.empty()) break;
        options.continuation_token = page.continuation_token;
    }

    if (!backend_->remove(base)) {
        result.error_message = "Failed to delete folder marker " + base;
        return result;
    }

    result.success = true;
    return result;
}

PutResult StorageClient::make_folder(const std::string& rel) {
    auto key = folder_key(rel);
    if (key == prefix_) {
        return {false, "", "Folder name is empty"};
    }
    return backend_->put(key, {});
}

// --- Copy ---

namespace {

fs::path staging_file(const fs::path& staging_dir) {
    static std::atomic<uint64_t> counter{0};
    return staging_dir / ("copy-" + std::to_string(getpid()) + "-" +
                          std::to_string(counter.fetch_add(1)) + ".tmp");
}

// Removes the staging file on every exit path
struct StagingGuard {
    fs::path path;
    ~StagingGuard() {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

}  // namespace

CopyResult StorageClient::copy_to(const std::string& src,
                                  StorageClient& dest,
                                  const std::string& dst,
                                  const fs::path& staging_dir,
                                  const ProgressCallback& progress) {
    auto src_key = full_key(src);
    auto dst_key = dest.full_key(dst);

    if (backend_->store_id() == dest.backend_->store_id()) {
        auto result = backend_->copy(src_key, dst_key);
        if (!result.unsupported) {
            if (result.success && progress) {
                auto meta = dest.backend_->head(dst_key);
                progress(meta ? meta->size : 0);
            }
            return result;
        }
        log_debug("Server-side copy unsupported, streaming %s", src_key.c_str());
    }

    CopyResult result;
    std::error_code ec;
    fs::create_directories(staging_dir, ec);
    if (ec) {
        result.error_message = "Cannot create staging directory: " + ec.message();
        return result;
    }

    StagingGuard staging{staging_file(staging_dir)};
    {
        std::ofstream out(staging.path, std::ios::binary);
        if (!out) {
            result.error_message = "Cannot create staging file " + staging.path.string();
            return result;
        }

        uint64_t received = 0;
        auto streamed = backend_->get_stream(src_key, [&](const char* data, size_t size) {
            out.write(data, static_cast<std::streamsize>(size));
            if (!out) return false;
            received += size;
            return !progress || progress(received);
        });
        if (!streamed.success) {
            result.error_message = !out ? "Failed to write staging file" : streamed.error_message;
            return result;
        }
    }

    auto put = dest.backend_->put_file(dst_key, staging.path, {}, progress);
    if (!put.success) {
        result.error_message = put.error_message;
        return result;
    }

    result.success = true;
    return result;
}

// --- Connection test ---

ConnectionCheck test_connection(const StorageConfig& config) {
    ConnectionCheck check;

    std::unique_ptr<StorageClient> client;
    try {
        client = StorageClient::build(config);
    } catch (const std::exception& e) {
        check.status = ConnectionStatus::Other;
        check.message = e.what();
        return check;
    }

    auto probe = client->backend().probe();
    switch (probe.status) {
        case ProbeResult::Status::Ok:
            check.ok = true;
            check.status = ConnectionStatus::Ok;
            check.message = "Connection successful";
            break;
        case ProbeResult::Status::BucketNotFound:
            check.status = ConnectionStatus::BucketNotFound;
            check.message = "Bucket not found";
            break;
        case ProbeResult::Status::AccessDenied:
            check.status = ConnectionStatus::AccessDenied;
            check.message = "Access denied";
            break;
        case ProbeResult::Status::InvalidCredentials:
            check.status = ConnectionStatus::InvalidCredentials;
            check.message = "Invalid credentials";
            break;
        case ProbeResult::Status::ConnectionError:
            check.status = ConnectionStatus::ConnectionError;
            check.message = probe.message;
            break;
        case ProbeResult::Status::Other:
            check.status = ConnectionStatus::Other;
            check.message = probe.message;
            break;
    }

    log_debug("Connection test for bucket %s: %s (%s)", config.bucket.c_str(),
              connection_status_name(check.status), check.message.c_str());
    return check;
}

}  // namespace wsbridge
