#pragma once

#include "wsbridge/core/constants.hpp"
#include "wsbridge/errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wsbridge {

enum class TaskStatus {
    Queued,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

const char* task_status_name(TaskStatus status);
std::optional<TaskStatus> parse_task_status(const std::string& name);
bool is_terminal(TaskStatus status);

enum class TransferKind {
    Upload,
    Download,
    Move,
    Copy,
    ZipExport
};

const char* transfer_kind_name(TransferKind kind);
std::optional<TransferKind> parse_transfer_kind(const std::string& name);

enum class LocationSide {
    Workspace,
    Storage,
    Shared,
    Archive    // zip-export destination
};

const char* location_side_name(LocationSide side);

/// A side plus a path relative to that side's root.
struct Location {
    LocationSide side = LocationSide::Workspace;
    std::string path;

    /// "workspace:a/b", "storage:x", "shared:", with "local:" and "remote:"
    /// accepted for workspace and storage. Nullopt on an unknown side.
    static std::optional<Location> parse(const std::string& text);

    std::string to_string() const;
};

struct TransferProgress {
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;   // 0 = unknown
    uint64_t items_done = 0;
    uint64_t items_total = 0;
    std::string current_item;
};

struct TransferTask {
    std::string token;
    TransferKind kind = TransferKind::Copy;
    std::string tenant;
    Location source;
    Location destination;
    std::vector<std::string> items;  // optional multi-select, relative to source.path

    TaskStatus status = TaskStatus::Queued;
    TransferProgress progress;

    // Set only when status is Failed
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::string failed_item;

    std::string artifact;  // materialized zip export

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
};

/// Partial update. Unset fields are left alone.
struct TaskUpdate {
    std::optional<TaskStatus> status;
    std::optional<uint64_t> bytes_done;
    std::optional<uint64_t> bytes_total;
    std::optional<uint64_t> items_done;
    std::optional<uint64_t> items_total;
    std::optional<std::string> current_item;
    std::optional<std::string> artifact;

    // Accepted only together with status = Failed
    ErrorKind error_kind = ErrorKind::None;
    std::optional<std::string> error;
    std::optional<std::string> failed_item;
};

enum class UpdateOutcome {
    Applied,
    NotFound,
    AlreadyTerminal,
    Rejected    // backwards status move, or error fields without Failed
};

enum class CancelOutcome {
    Cancelled,
    NotFound,
    AlreadyTerminal
};

/// In-memory task table. Every operation takes the one registry mutex;
/// nothing here performs I/O.
///
/// Terminal tasks are evicted once older than the retention window, and
/// beyond a per-tenant ceiling oldest-first. Queued and running tasks are
/// never evicted.
class TaskRegistry {
public:
    using Clock = std::chrono::system_clock;
    using EvictionCallback = std::function<void(const TransferTask&)>;

    explicit TaskRegistry(
        std::chrono::seconds retention = std::chrono::seconds(constants::DEFAULT_TASK_RETENTION_SECONDS),
        size_t max_tasks_per_tenant = constants::DEFAULT_MAX_TASKS_PER_TENANT);

    /// Runs after eviction, outside the lock.
    void set_eviction_callback(EvictionCallback callback);

    /// Assigns a fresh token, status Queued and created_at. Sweeps lazily.
    std::string create(TransferTask task);

    UpdateOutcome update(const std::string& token, const TaskUpdate& update);

    std::optional<TransferTask> get(const std::string& token) const;

    /// The tenant's tasks, oldest first.
    std::vector<TransferTask> list(const std::string& tenant) const;

    CancelOutcome cancel(const std::string& token);

    /// Cancellation flag polled by workers. True for cancelled or unknown tasks.
    bool cancel_requested(const std::string& token) const;

    /// Cancels every queued and running task. Returns their tokens.
    std::vector<std::string> cancel_all();

    /// Evicts aged terminal tasks, then enforces the per-tenant ceiling.
    /// Returns the number of tasks evicted.
    size_t sweep(Clock::time_point now);

    size_t size() const;

    /// Task count per status, every status present.
    std::map<TaskStatus, size_t> counts() const;

private:
    std::vector<TransferTask> collect_evictions_locked(Clock::time_point now);
    void notify_evicted(const std::vector<TransferTask>& evicted);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TransferTask> tasks_;
    std::chrono::seconds retention_;
    size_t max_tasks_per_tenant_;
    EvictionCallback on_evict_;
};

/// 128 random bits as 32 lower-case hex characters.
std::string generate_task_token();

}  // namespace wsbridge
