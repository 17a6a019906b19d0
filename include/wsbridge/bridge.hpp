#pragma once

#include "wsbridge/core/constants.hpp"
#include "wsbridge/errors.hpp"
#include "wsbridge/storage_client.hpp"
#include "wsbridge/storage_config.hpp"
#include "wsbridge/task_registry.hpp"
#include "wsbridge/transfer_executor.hpp"
#include "wsbridge/workspace.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace wsbridge {

/// Common part of every synchronous facade result.
struct Outcome {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

struct ConfigOutcome : Outcome {
    std::optional<StorageConfig> config;
};

struct ConnectionOutcome : Outcome {
    ConnectionCheck check;
};

struct ListOutcome : Outcome {
    std::vector<WorkspaceEntry> entries;
};

struct TextOutcome : Outcome {
    std::string text;
};

struct StartOutcome : Outcome {
    std::string token;
};

struct TaskOutcome : Outcome {
    TransferTask task;
};

struct TaskListOutcome : Outcome {
    std::vector<TransferTask> tasks;
};

struct StreamOutcome : Outcome {
    uint64_t bytes = 0;
};

struct ZipOutcome : Outcome {
    bool streamed = false;   // archive written to the sink
    std::string token;       // otherwise: background export task
    uint64_t total_bytes = 0;
    uint64_t bytes = 0;
};

struct RemoveOutcome : Outcome {
    uint64_t removed = 0;
};

/// Task-oriented API for the web layer. Holds references to the engine's
/// parts, which must outlive it. Classified errors come back in the outcome;
/// nothing here throws them.
class StorageBridge {
public:
    StorageBridge(const ConfigResolver& resolver,
                  const WorkspaceBridge& workspace,
                  TaskRegistry& registry,
                  TransferExecutor& executor,
                  uint64_t zip_stream_threshold = constants::DEFAULT_ZIP_STREAM_THRESHOLD);

    StorageBridge(const StorageBridge&) = delete;
    StorageBridge& operator=(const StorageBridge&) = delete;

    /// Succeeds with an empty `config` when the tenant has no storage.
    ConfigOutcome resolve_config(const std::string& tenant) const;

    ConnectionOutcome test_connection(const StorageConfig& config);

    ListOutcome list(const std::string& tenant, const Location& location, bool recursive) const;

    TextOutcome read_text(const std::string& tenant, const Location& location) const;

    StartOutcome start_transfer(const TransferRequest& request);

    TaskOutcome get_transfer_status(const std::string& token) const;

    TaskListOutcome list_transfers(const std::string& tenant) const;

    Outcome cancel_transfer(const std::string& token);

    StreamOutcome stream_object(const std::string& tenant, const Location& location,
                                const ObjectSink& sink) const;

    /// Streams the archive when the folder is at or below the stream
    /// threshold, otherwise starts a background export and returns its token.
    ZipOutcome stream_folder_as_zip(const std::string& tenant, const Location& location,
                                    const ObjectSink& sink);

    /// Streams a finished background export.
    StreamOutcome fetch_export(const std::string& token, const ObjectSink& sink) const;

    Outcome make_directory(const std::string& tenant, const Location& location);

    RemoveOutcome remove(const std::string& tenant, const Location& location);

    Outcome put_object(const std::string& tenant, const Location& location,
                       std::span<const uint8_t> data);

    /// Connection probes run so far, by classification.
    std::map<ConnectionStatus, uint64_t> connection_check_counts() const;

private:
    std::unique_ptr<StorageClient> client_for(const std::string& tenant, LocationSide side) const;

    const ConfigResolver& resolver_;
    const WorkspaceBridge& workspace_;
    TaskRegistry& registry_;
    TransferExecutor& executor_;
    uint64_t zip_stream_threshold_;

    mutable std::mutex stats_mutex_;
    std::map<ConnectionStatus, uint64_t> connection_checks_;
};

}  // namespace wsbridge
