#pragma once

#include "wsbridge/core/constants.hpp"
#include "wsbridge/storage_client.hpp"
#include "wsbridge/storage_config.hpp"
#include "wsbridge/task_registry.hpp"
#include "wsbridge/transfer_plan.hpp"
#include "wsbridge/workspace.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace wsbridge {

struct TransferRequest {
    TransferKind kind = TransferKind::Copy;
    std::string tenant;
    Location source;
    Location destination;
    std::vector<std::string> items;
};

struct ExecutorConfig {
    size_t workers = constants::DEFAULT_TRANSFER_WORKERS;
    std::chrono::milliseconds max_task_lifetime{
        std::chrono::seconds(constants::DEFAULT_MAX_TASK_LIFETIME_SECONDS)};
    std::chrono::seconds sweep_interval{constants::DEFAULT_SWEEP_INTERVAL_SECONDS};
    std::filesystem::path staging_dir;   // holds exports/ and copy staging files
    size_t chunk_size = constants::DEFAULT_STREAM_CHUNK_SIZE;
    uint64_t max_zip_size = constants::DEFAULT_MAX_ZIP_SIZE;
};

/// Builds a client for a resolved config. Tests substitute their own.
using ClientFactory = std::function<std::unique_ptr<StorageClient>(const StorageConfig&)>;

/// Background transfer engine.
///
/// submit() validates and resolves synchronously, records a queued task and
/// returns its token. It throws once the executor is stopped or before it
/// has started, since no worker would ever pick the task up. A fixed pool of workers plans each task (enumerating
/// every item and byte) and then executes the items in order, reporting
/// progress to the registry after every chunk. Workers poll the registry's
/// cancellation flag and the task's lifetime between items and inside chunk
/// callbacks. The first failed item stops the task.
class TransferExecutor {
public:
    TransferExecutor(const ConfigResolver& resolver,
                     const WorkspaceBridge& workspace,
                     TaskRegistry& registry,
                     ExecutorConfig config,
                     ClientFactory client_factory = nullptr);
    ~TransferExecutor();

    TransferExecutor(const TransferExecutor&) = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    /// Create staging directories, start workers and the sweeper.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Cancel queued and running tasks, then join all threads.
    void stop();

    /// Throws ValidationError or BridgeError(ConfigAbsent).
    std::string submit(const TransferRequest& request);

    /// Config for a storage-like side. Throws BridgeError(ConfigAbsent).
    StorageConfig config_for(const std::string& tenant, LocationSide side) const;

    std::unique_ptr<StorageClient> open_client(const StorageConfig& config) const;

    /// Path of a background zip export's archive.
    std::filesystem::path export_path(const std::string& token) const;

    const ExecutorConfig& config() const { return config_; }

    size_t pending() const;

    /// Runs on the worker after a task reaches a terminal state.
    void set_completion_callback(std::function<void(const TransferTask&, double seconds)> callback);

    struct KindStats {
        uint64_t succeeded = 0;
        uint64_t failed = 0;
        uint64_t cancelled = 0;
        uint64_t bytes = 0;
    };

    struct Stats {
        std::map<TransferKind, KindStats> by_kind;
        uint64_t items_transferred = 0;
    };
    Stats get_stats() const;

private:
    struct Job {
        std::string token;
        TransferRequest request;
        std::optional<StorageConfig> source_config;
        std::optional<StorageConfig> dest_config;
    };

    enum class Abort { None, Cancelled, Timeout };

    /// Per-task state shared by the item loop and its chunk callbacks.
    struct TaskContext {
        const Job& job;
        std::chrono::system_clock::time_point created_at;
        uint64_t bytes_base = 0;       // bytes of completed items
        uint64_t items_done = 0;
        std::string failed_item;
        Abort abort = Abort::None;
    };

    void worker_loop();
    void sweeper_loop();
    void run_job(const Job& job);

    Abort check_abort(TaskContext& ctx) const;
    bool report_bytes(TaskContext& ctx, uint64_t item_bytes);

    std::string execute_plan(TaskContext& ctx, const TransferPlan& plan,
                             StorageClient* src_client, StorageClient* dst_client);
    std::string transfer_item(TaskContext& ctx, const WorkItem& item,
                              StorageClient* src_client, StorageClient* dst_client);
    std::string download_item(TaskContext& ctx, const WorkItem& item, StorageClient& src_client);
    std::string export_zip(TaskContext& ctx, const TransferPlan& plan, StorageClient& src_client);

    void finish_task(const Job& job, const TaskContext& ctx, const std::string& failure,
                     ErrorKind failure_kind, uint64_t items_total);
    void record_outcome(const std::string& token);

    const ConfigResolver& resolver_;
    const WorkspaceBridge& workspace_;
    TaskRegistry& registry_;
    ExecutorConfig config_;
    ClientFactory client_factory_;

    std::atomic<bool> running_{false};

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Job> queue_;
    std::vector<std::thread> workers_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::thread sweeper_thread_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
    std::function<void(const TransferTask&, double)> on_complete_;
};

}  // namespace wsbridge
