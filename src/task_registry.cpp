#include "wsbridge/task_registry.hpp"
#include "wsbridge/core/log.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <stdexcept>

namespace wsbridge {

// --- Names ---

const char* task_status_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::Queued: return "queued";
        case TaskStatus::Running: return "running";
        case TaskStatus::Succeeded: return "succeeded";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<TaskStatus> parse_task_status(const std::string& name) {
    for (auto status : {TaskStatus::Queued, TaskStatus::Running, TaskStatus::Succeeded,
                        TaskStatus::Failed, TaskStatus::Cancelled}) {
        if (name == task_status_name(status)) return status;
    }
    return std::nullopt;
}

bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Succeeded || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

const char* transfer_kind_name(TransferKind kind) {
    switch (kind) {
        case TransferKind::Upload: return "upload";
        case TransferKind::Download: return "download";
        case TransferKind::Move: return "move";
        case TransferKind::Copy: return "copy";
        case TransferKind::ZipExport: return "zip-export";
    }
    return "unknown";
}

std::optional<TransferKind> parse_transfer_kind(const std::string& name) {
    for (auto kind : {TransferKind::Upload, TransferKind::Download, TransferKind::Move,
                      TransferKind::Copy, TransferKind::ZipExport}) {
        if (name == transfer_kind_name(kind)) return kind;
    }
    return std::nullopt;
}

const char* location_side_name(LocationSide side) {
    switch (side) {
        case LocationSide::Workspace: return "workspace";
        case LocationSide::Storage: return "storage";
        case LocationSide::Shared: return "shared";
        case LocationSide::Archive: return "archive";
    }
    return "unknown";
}

std::optional<Location> Location::parse(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos) return std::nullopt;

    auto side = text.substr(0, colon);
    Location location;
    location.path = text.substr(colon + 1);

    if (side == "workspace" || side == "local") {
        location.side = LocationSide::Workspace;
    } else if (side == "storage" || side == "remote") {
        location.side = LocationSide::Storage;
    } else if (side == "shared") {
        location.side = LocationSide::Shared;
    } else if (side == "archive") {
        location.side = LocationSide::Archive;
    } else {
        return std::nullopt;
    }
    return location;
}

std::string Location::to_string() const {
    return std::string(location_side_name(side)) + ":" + path;
}

std::string generate_task_token() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce a task token");
    }

    static constexpr char hex[] = "0123456789abcdef";
    std::string token;
    token.reserve(sizeof(bytes) * 2);
    for (unsigned char b : bytes) {
        token += hex[b >> 4];
        token += hex[b & 0x0f];
    }
    return token;
}

// --- Registry ---

namespace {

int status_rank(TaskStatus status) {
    switch (status) {
        case TaskStatus::Queued: return 0;
        case TaskStatus::Running: return 1;
        default: return 2;
    }
}

void raise(uint64_t& field, const std::optional<uint64_t>& value) {
    if (value && *value > field) field = *value;
}

}  // namespace

TaskRegistry::TaskRegistry(std::chrono::seconds retention, size_t max_tasks_per_tenant)
    : retention_(retention)
    , max_tasks_per_tenant_(max_tasks_per_tenant) {}

void TaskRegistry::set_eviction_callback(EvictionCallback callback) {
    std::lock_guard lock(mutex_);
    on_evict_ = std::move(callback);
}

std::string TaskRegistry::create(TransferTask task) {
    auto now = Clock::now();
    std::vector<TransferTask> evicted;
    std::string token = generate_task_token();
    {
        std::lock_guard lock(mutex_);
        task.token = token;
        task.status = TaskStatus::Queued;
        task.created_at = now;
        task.started_at.reset();
        task.completed_at.reset();
        task.error_kind = ErrorKind::None;
        task.error.clear();
        task.failed_item.clear();
        tasks_[token] = std::move(task);

        evicted = collect_evictions_locked(now);
    }
    notify_evicted(evicted);
    return token;
}

UpdateOutcome TaskRegistry::update(const std::string& token, const TaskUpdate& update) {
    std::lock_guard lock(mutex_);

    auto it = tasks_.find(token);
    if (it == tasks_.end()) return UpdateOutcome::NotFound;
    auto& task = it->second;
    if (is_terminal(task.status)) return UpdateOutcome::AlreadyTerminal;

    bool has_error = update.error || update.failed_item || update.error_kind != ErrorKind::None;
    if (has_error && update.status != TaskStatus::Failed) return UpdateOutcome::Rejected;
    if (update.status && status_rank(*update.status) < status_rank(task.status)) {
        return UpdateOutcome::Rejected;
    }

    raise(task.progress.bytes_done, update.bytes_done);
    raise(task.progress.bytes_total, update.bytes_total);
    raise(task.progress.items_done, update.items_done);
    raise(task.progress.items_total, update.items_total);
    if (update.current_item) task.progress.current_item = *update.current_item;
    if (update.artifact) task.artifact = *update.artifact;

    if (update.status && *update.status != task.status) {
        auto now = Clock::now();
        task.status = *update.status;
        if (task.status == TaskStatus::Running && !task.started_at) task.started_at = now;
        if (is_terminal(task.status)) task.completed_at = now;
        if (task.status == TaskStatus::Failed) {
            task.error_kind = update.error_kind;
            if (update.error) task.error = *update.error;
            if (update.failed_item) task.failed_item = *update.failed_item;
        }
    }
    return UpdateOutcome::Applied;
}

std::optional<TransferTask> TaskRegistry::get(const std::string& token) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(token);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::vector<TransferTask> TaskRegistry::list(const std::string& tenant) const {
    std::vector<TransferTask> result;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [token, task] : tasks_) {
            if (task.tenant == tenant) result.push_back(task);
        }
    }
    std::sort(result.begin(), result.end(), [](const TransferTask& a, const TransferTask& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.token < b.token;
    });
    return result;
}

CancelOutcome TaskRegistry::cancel(const std::string& token) {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(token);
    if (it == tasks_.end()) return CancelOutcome::NotFound;
    auto& task = it->second;
    if (is_terminal(task.status)) return CancelOutcome::AlreadyTerminal;

    task.status = TaskStatus::Cancelled;
    task.completed_at = Clock::now();
    return CancelOutcome::Cancelled;
}

bool TaskRegistry::cancel_requested(const std::string& token) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(token);
    return it == tasks_.end() || it->second.status == TaskStatus::Cancelled;
}

std::vector<std::string> TaskRegistry::cancel_all() {
    std::vector<std::string> cancelled;
    std::lock_guard lock(mutex_);
    auto now = Clock::now();
    for (auto& [token, task] : tasks_) {
        if (is_terminal(task.status)) continue;
        task.status = TaskStatus::Cancelled;
        task.completed_at = now;
        cancelled.push_back(token);
    }
    return cancelled;
}

size_t TaskRegistry::sweep(Clock::time_point now) {
    std::vector<TransferTask> evicted;
    {
        std::lock_guard lock(mutex_);
        evicted = collect_evictions_locked(now);
    }
    notify_evicted(evicted);
    return evicted.size();
}

size_t TaskRegistry::size() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

std::map<TaskStatus, size_t> TaskRegistry::counts() const {
    std::map<TaskStatus, size_t> result{
        {TaskStatus::Queued, 0}, {TaskStatus::Running, 0}, {TaskStatus::Succeeded, 0},
        {TaskStatus::Failed, 0}, {TaskStatus::Cancelled, 0}};
    std::lock_guard lock(mutex_);
    for (const auto& [token, task] : tasks_) {
        ++result[task.status];
    }
    return result;
}

// --- Eviction ---

std::vector<TransferTask> TaskRegistry::collect_evictions_locked(Clock::time_point now) {
    std::vector<TransferTask> evicted;

    // Pass 1: retention window
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        const auto& task = it->second;
        if (is_terminal(task.status) && task.completed_at && *task.completed_at + retention_ < now) {
            evicted.push_back(std::move(it->second));
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }

    // Pass 2: per-tenant ceiling, oldest terminal first
    std::unordered_map<std::string, std::vector<const TransferTask*>> by_tenant;
    for (const auto& [token, task] : tasks_) {
        by_tenant[task.tenant].push_back(&task);
    }

    std::vector<std::string> over_limit;
    for (auto& [tenant, tasks] : by_tenant) {
        if (tasks.size() <= max_tasks_per_tenant_) continue;

        std::vector<const TransferTask*> terminal;
        for (const auto* task : tasks) {
            if (is_terminal(task->status)) terminal.push_back(task);
        }
        std::sort(terminal.begin(), terminal.end(), [](const TransferTask* a, const TransferTask* b) {
            return a->completed_at < b->completed_at;
        });

        size_t excess = tasks.size() - max_tasks_per_tenant_;
        for (size_t i = 0; i < excess && i < terminal.size(); ++i) {
            over_limit.push_back(terminal[i]->token);
        }
    }
    for (const auto& token : over_limit) {
        auto it = tasks_.find(token);
        evicted.push_back(std::move(it->second));
        tasks_.erase(it);
    }

    return evicted;
}

void TaskRegistry::notify_evicted(const std::vector<TransferTask>& evicted) {
    if (evicted.empty()) return;

    EvictionCallback callback;
    {
        std::lock_guard lock(mutex_);
        callback = on_evict_;
    }
    log_debug("Evicted %zu transfer tasks", evicted.size());
    if (!callback) return;
    for (const auto& task : evicted) {
        callback(task);
    }
}

}  // namespace wsbridge
