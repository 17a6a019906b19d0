#pragma once

#include "wsbridge/storage_client.hpp"
#include "wsbridge/task_registry.hpp"
#include "wsbridge/workspace.hpp"
#include "wsbridge/zip_writer.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace wsbridge {

/// One top-level thing being transferred: a file or a folder.
struct TransferRoot {
    std::string src;   // relative to the source side
    std::string dst;   // relative to the destination side
};

/// One unit of work. Directories are empty folders or folder markers and
/// carry no bytes.
struct WorkItem {
    std::string src;
    std::string dst;
    bool is_directory = false;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
};

struct TransferPlan {
    std::vector<WorkItem> items;
    uint64_t total_bytes = 0;
    std::vector<std::string> folder_roots;   // source roots that were folders
};

/// Maps a request onto roots. Without items the source path itself is the
/// one root and lands as `<destination>/<its name>`; the source root with no
/// items means "everything under it" landing directly in the destination.
/// With items, each item under the source path lands as `<destination>/<item name>`.
///
/// Throws ValidationError for traversal, identical source and destination,
/// or a folder copied into itself.
std::vector<TransferRoot> plan_roots(const Location& source,
                                     const Location& destination,
                                     const std::vector<std::string>& items);

/// Enumerates storage roots. Throws BridgeError: NotFound for a missing
/// root, Connection when a listing fails.
TransferPlan plan_from_storage(const StorageClient& client,
                               const std::vector<TransferRoot>& roots);

/// Enumerates workspace roots (files and empty directories).
TransferPlan plan_from_workspace(const WorkspaceBridge& workspace,
                                 const std::string& tenant,
                                 const std::vector<TransferRoot>& roots);

/// Hooks into an archive build. Any hook returning false aborts.
struct ZipHooks {
    std::function<bool(const WorkItem& item)> on_item_start;
    std::function<bool(uint64_t bytes_done)> on_bytes;   // cumulative over the archive
    std::function<void(const WorkItem& item)> on_item_done;
};

struct ZipBuildResult {
    bool success = false;
    bool aborted = false;        // a hook returned false
    uint64_t items_done = 0;
    uint64_t bytes = 0;          // uncompressed bytes read from storage
    std::string failed_item;
    std::string error_message;
};

/// Streams every planned item from storage into a ZIP written to `sink`.
ZipBuildResult write_zip_archive(const StorageClient& client,
                                 const TransferPlan& plan,
                                 const ZipSink& sink,
                                 const ZipHooks& hooks = {});

}  // namespace wsbridge
