#include "wsbridge/transfer_executor.hpp"
#include "wsbridge/core/log.hpp"
#include "wsbridge/errors.hpp"
#include "wsbridge/path_util.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace wsbridge {

namespace fs = std::filesystem;

namespace {

bool is_storage_side(LocationSide side) {
    return side == LocationSide::Storage || side == LocationSide::Shared;
}

// Which sides each kind may read from and write to
bool sides_allowed(TransferKind kind, LocationSide src, LocationSide dst) {
    switch (kind) {
        case TransferKind::Upload:
            return src == LocationSide::Workspace && is_storage_side(dst);
        case TransferKind::Download:
            return is_storage_side(src) && dst == LocationSide::Workspace;
        case TransferKind::Copy:
            return is_storage_side(src) && (is_storage_side(dst) || dst == LocationSide::Workspace);
        case TransferKind::Move:
            // The shared space is read-only as a move source
            return src == LocationSide::Storage &&
                   (is_storage_side(dst) || dst == LocationSide::Workspace);
        case TransferKind::ZipExport:
            return is_storage_side(src) && dst == LocationSide::Archive;
    }
    return false;
}

}  // namespace

TransferExecutor::TransferExecutor(const ConfigResolver& resolver,
                                   const WorkspaceBridge& workspace,
                                   TaskRegistry& registry,
                                   ExecutorConfig config,
                                   ClientFactory client_factory)
    : resolver_(resolver)
    , workspace_(workspace)
    , registry_(registry)
    , config_(std::move(config))
    , client_factory_(std::move(client_factory)) {}

TransferExecutor::~TransferExecutor() {
    stop();
}

std::string TransferExecutor::start() {
    if (running_.load()) return {};
    if (config_.workers == 0) return "workers must be at least 1";
    if (config_.staging_dir.empty()) return "staging_dir is required";

    std::error_code ec;
    fs::create_directories(config_.staging_dir / "exports", ec);
    if (ec) return "Failed to create staging directory: " + ec.message();
    fs::create_directories(config_.staging_dir / "copies", ec);
    if (ec) return "Failed to create staging directory: " + ec.message();

    // Evicted exports take their archive with them
    registry_.set_eviction_callback([](const TransferTask& task) {
        if (task.artifact.empty()) return;
        std::error_code remove_ec;
        fs::remove(task.artifact, remove_ec);
        if (remove_ec) {
            log_error("Failed to remove export %s: %s", task.artifact.c_str(),
                      remove_ec.message().c_str());
        }
    });

    running_ = true;
    for (size_t i = 0; i < config_.workers; ++i) {
        workers_.emplace_back(&TransferExecutor::worker_loop, this);
    }
    sweeper_thread_ = std::thread(&TransferExecutor::sweeper_loop, this);

    log_info("Transfer executor started: %zu workers, max task lifetime %llds",
             config_.workers,
             static_cast<long long>(
                 std::chrono::duration_cast<std::chrono::seconds>(config_.max_task_lifetime).count()));
    return {};
}

void TransferExecutor::stop() {
    if (!running_.exchange(false)) return;

    // After the queue is cleared no submit can enqueue, so cancel_all sees every task
    {
        std::lock_guard lock(queue_mutex_);
        queue_.clear();
    }
    queue_cv_.notify_all();
    auto cancelled = registry_.cancel_all();
    {
        std::lock_guard lock(sweep_mutex_);
    }
    sweep_cv_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    if (sweeper_thread_.joinable()) sweeper_thread_.join();

    registry_.set_eviction_callback(nullptr);
    log_info("Transfer executor stopped (%zu tasks cancelled)", cancelled.size());
}

// --- Submission ---

StorageConfig TransferExecutor::config_for(const std::string& tenant, LocationSide side) const {
    if (side == LocationSide::Shared) {
        auto config = resolver_.resolve_shared();
        if (!config) throw BridgeError(ErrorKind::ConfigAbsent, "No shared storage is configured");
        return *config;
    }
    if (side != LocationSide::Storage) {
        throw ValidationError(std::string("Not a storage location: ") + location_side_name(side));
    }
    auto config = resolver_.resolve(tenant);
    if (!config) {
        throw BridgeError(ErrorKind::ConfigAbsent, "No storage configured for tenant '" + tenant + "'");
    }
    return *config;
}

std::unique_ptr<StorageClient> TransferExecutor::open_client(const StorageConfig& config) const {
    if (client_factory_) return client_factory_(config);
    return StorageClient::build(config);
}

fs::path TransferExecutor::export_path(const std::string& token) const {
    return config_.staging_dir / "exports" / (token + ".zip");
}

std::string TransferExecutor::submit(const TransferRequest& request) {
    validate_tenant(request.tenant);

    if (!sides_allowed(request.kind, request.source.side, request.destination.side)) {
        throw ValidationError(std::string("A ") + transfer_kind_name(request.kind) + " cannot go from " +
                              location_side_name(request.source.side) + " to " +
                              location_side_name(request.destination.side));
    }

    Job job;
    job.request = request;
    job.request.source.path = normalize_relative_path(request.source.path);
    job.request.destination.path = normalize_relative_path(request.destination.path);
    for (auto& item : job.request.items) {
        item = normalize_relative_path(item);
    }

    // Rejects identical paths and folders placed inside themselves
    plan_roots(job.request.source, job.request.destination, job.request.items);

    if (is_storage_side(request.source.side)) {
        job.source_config = config_for(request.tenant, request.source.side);
    }
    if (is_storage_side(request.destination.side)) {
        job.dest_config = config_for(request.tenant, request.destination.side);
    }

    TransferTask task;
    task.kind = job.request.kind;
    task.tenant = job.request.tenant;
    task.source = job.request.source;
    task.destination = job.request.destination;
    task.items = job.request.items;

    std::string token;
    {
        std::lock_guard lock(queue_mutex_);
        if (!running_.load()) {
            throw BridgeError(ErrorKind::Io, "Transfer executor is not running");
        }
        token = registry_.create(std::move(task));
        job.token = token;
        queue_.push_back(std::move(job));
    }
    queue_cv_.notify_one();

    log_debug("Queued %s %s: %s -> %s", transfer_kind_name(request.kind), token.c_str(),
              request.source.to_string().c_str(), request.destination.to_string().c_str());
    return token;
}

size_t TransferExecutor::pending() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.size();
}

void TransferExecutor::set_completion_callback(
    std::function<void(const TransferTask&, double)> callback) {
    std::lock_guard lock(stats_mutex_);
    on_complete_ = std::move(callback);
}

TransferExecutor::Stats TransferExecutor::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

// --- Threads ---

void TransferExecutor::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
            if (!running_.load()) break;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        run_job(job);
    }
}

void TransferExecutor::sweeper_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        {
            std::unique_lock lock(sweep_mutex_);
            sweep_cv_.wait_for(lock, config_.sweep_interval, [this] { return !running_.load(); });
        }
        if (!running_.load(std::memory_order_relaxed)) break;

        auto evicted = registry_.sweep(std::chrono::system_clock::now());
        if (evicted > 0) {
            log_debug("Sweeper evicted %zu tasks", evicted);
        }
    }
}

// --- Task execution ---

TransferExecutor::Abort TransferExecutor::check_abort(TaskContext& ctx) const {
    if (ctx.abort != Abort::None) return ctx.abort;
    if (registry_.cancel_requested(ctx.job.token)) {
        ctx.abort = Abort::Cancelled;
    } else if (std::chrono::system_clock::now() - ctx.created_at > config_.max_task_lifetime) {
        ctx.abort = Abort::Timeout;
    }
    return ctx.abort;
}

bool TransferExecutor::report_bytes(TaskContext& ctx, uint64_t item_bytes) {
    if (check_abort(ctx) != Abort::None) return false;
    TaskUpdate update;
    update.bytes_done = ctx.bytes_base + item_bytes;
    registry_.update(ctx.job.token, update);
    return true;
}

void TransferExecutor::run_job(const Job& job) {
    auto snapshot = registry_.get(job.token);
    if (!snapshot) return;
    if (is_terminal(snapshot->status)) {
        // Cancelled while queued
        record_outcome(job.token);
        return;
    }

    TaskContext ctx{job, snapshot->created_at};
    std::string failure;
    ErrorKind failure_kind = ErrorKind::None;
    uint64_t items_total = 0;

    if (check_abort(ctx) == Abort::None) {
        TaskUpdate running;
        running.status = TaskStatus::Running;
        registry_.update(job.token, running);

        const auto& request = job.request;
        try {
            std::unique_ptr<StorageClient> src_client;
            std::unique_ptr<StorageClient> dst_client;
            if (job.source_config) src_client = open_client(*job.source_config);
            if (job.dest_config) dst_client = open_client(*job.dest_config);

            auto roots = plan_roots(request.source, request.destination, request.items);
            auto plan = request.source.side == LocationSide::Workspace
                ? plan_from_workspace(workspace_, request.tenant, roots)
                : plan_from_storage(*src_client, roots);

            if (request.kind == TransferKind::ZipExport && plan.total_bytes > config_.max_zip_size) {
                throw ValidationError("Folder too large to export (" + std::to_string(plan.total_bytes) +
                                      " bytes, limit " + std::to_string(config_.max_zip_size) + ")");
            }

            items_total = plan.items.size();
            TaskUpdate planned;
            planned.items_total = items_total;
            planned.bytes_total = plan.total_bytes;
            registry_.update(job.token, planned);

            failure = request.kind == TransferKind::ZipExport
                ? export_zip(ctx, plan, *src_client)
                : execute_plan(ctx, plan, src_client.get(), dst_client.get());
            if (!failure.empty()) failure_kind = ErrorKind::PartialFailure;
        } catch (const BridgeError& e) {
            failure = e.what();
            failure_kind = e.kind();
        } catch (const std::exception& e) {
            failure = e.what();
            failure_kind = ErrorKind::Io;
        }
    }

    finish_task(job, ctx, failure, failure_kind, items_total);
    record_outcome(job.token);
}

std::string TransferExecutor::execute_plan(TaskContext& ctx, const TransferPlan& plan,
                                           StorageClient* src_client, StorageClient* dst_client) {
    for (const auto& item : plan.items) {
        if (check_abort(ctx) != Abort::None) return "aborted";

        TaskUpdate starting;
        starting.current_item = item.src;
        registry_.update(ctx.job.token, starting);

        std::string err;
        try {
            err = transfer_item(ctx, item, src_client, dst_client);
        } catch (const std::exception& e) {
            err = e.what();
        }
        if (!err.empty()) {
            if (check_abort(ctx) != Abort::None) return "aborted";
            ctx.failed_item = item.src;
            return err;
        }

        ctx.bytes_base += item.size;
        ++ctx.items_done;
        TaskUpdate done;
        done.items_done = ctx.items_done;
        done.bytes_done = ctx.bytes_base;
        registry_.update(ctx.job.token, done);
    }
    return {};
}

std::string TransferExecutor::transfer_item(TaskContext& ctx, const WorkItem& item,
                                            StorageClient* src_client, StorageClient* dst_client) {
    const auto& request = ctx.job.request;
    auto progress = [&](uint64_t bytes) {
        return report_bytes(ctx, std::min(bytes, item.size));
    };

    if (request.kind == TransferKind::Upload) {
        if (item.is_directory) {
            auto put = dst_client->make_folder(item.dst);
            return put.success ? std::string() : put.error_message;
        }
        auto path = workspace_.resolve(request.tenant, item.src);
        auto put = dst_client->write_file(item.dst, path, progress);
        return put.success ? std::string() : put.error_message;
    }

    // Download, copy, move: the source is storage
    std::string err;
    if (request.destination.side == LocationSide::Workspace) {
        err = download_item(ctx, item, *src_client);
    } else if (item.is_directory) {
        auto put = dst_client->make_folder(item.dst);
        if (!put.success) err = put.error_message;
    } else {
        auto copied = src_client->copy_to(item.src, *dst_client, item.dst,
                                          config_.staging_dir / "copies", progress);
        if (!copied.success) err = copied.error_message;
    }
    if (!err.empty() || request.kind != TransferKind::Move) return err;

    // Move: delete the source only after the copy landed
    bool removed = item.is_directory
        ? src_client->backend().remove(src_client->folder_key(item.src))
        : src_client->remove(item.src);
    if (!removed) return "copied, but the source could not be deleted";
    return {};
}

std::string TransferExecutor::download_item(TaskContext& ctx, const WorkItem& item,
                                            StorageClient& src_client) {
    auto target = workspace_.resolve(ctx.job.request.tenant, item.dst);

    std::error_code ec;
    if (item.is_directory) {
        fs::create_directories(target, ec);
        return ec ? "Cannot create directory: " + ec.message() : std::string();
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) return "Cannot create directory: " + ec.message();

    auto part = target;
    part += ".part";
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) return "Cannot create " + part.string();

    uint64_t received = 0;
    auto streamed = src_client.stream(item.src, [&](const char* data, size_t size) {
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) return false;
        received += size;
        return report_bytes(ctx, std::min(received, item.size));
    });
    out.close();

    if (!streamed.success || !out) {
        fs::remove(part, ec);
        if (!out) return "Failed to write " + item.dst;
        return streamed.error_message;
    }

    fs::rename(part, target, ec);
    if (ec) {
        std::error_code remove_ec;
        fs::remove(part, remove_ec);
        return "Cannot rename into place: " + ec.message();
    }
    return {};
}

std::string TransferExecutor::export_zip(TaskContext& ctx, const TransferPlan& plan,
                                         StorageClient& src_client) {
    auto final_path = export_path(ctx.job.token);
    auto part = final_path;
    part += ".part";

    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) return "Cannot create " + part.string();

    ZipHooks hooks;
    hooks.on_item_start = [&](const WorkItem& item) {
        if (check_abort(ctx) != Abort::None) return false;
        TaskUpdate update;
        update.current_item = item.src;
        registry_.update(ctx.job.token, update);
        return true;
    };
    hooks.on_bytes = [&](uint64_t bytes) {
        return report_bytes(ctx, std::min(bytes, plan.total_bytes));
    };
    hooks.on_item_done = [&](const WorkItem&) {
        ++ctx.items_done;
        TaskUpdate update;
        update.items_done = ctx.items_done;
        registry_.update(ctx.job.token, update);
    };

    auto result = write_zip_archive(src_client, plan, [&](const char* data, size_t size) {
        out.write(data, static_cast<std::streamsize>(size));
        return static_cast<bool>(out);
    }, hooks);
    out.close();

    std::error_code ec;
    if (!result.success || !out) {
        fs::remove(part, ec);
        ctx.failed_item = result.failed_item;
        if (!result.error_message.empty()) return result.error_message;
        return "Failed to write " + part.string();
    }

    fs::rename(part, final_path, ec);
    if (ec) {
        std::error_code remove_ec;
        fs::remove(part, remove_ec);
        return "Cannot rename export into place: " + ec.message();
    }

    TaskUpdate update;
    update.artifact = final_path.string();
    update.bytes_done = plan.total_bytes;
    registry_.update(ctx.job.token, update);
    return {};
}

void TransferExecutor::finish_task(const Job& job, const TaskContext& ctx, const std::string& failure,
                                   ErrorKind failure_kind, uint64_t items_total) {
    TaskUpdate update;
    update.current_item = "";

    switch (ctx.abort) {
        case Abort::Cancelled:
            // Already terminal in the registry
            log_info("Transfer %s cancelled after %llu items", job.token.c_str(),
                     static_cast<unsigned long long>(ctx.items_done));
            return;
        case Abort::Timeout:
            update.status = TaskStatus::Failed;
            update.error_kind = ErrorKind::Timeout;
            update.error = "Task exceeded its maximum lifetime of " +
                std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                    config_.max_task_lifetime).count()) + "s";
            break;
        case Abort::None:
            if (failure.empty()) {
                update.status = TaskStatus::Succeeded;
            } else if (!ctx.failed_item.empty()) {
                update.status = TaskStatus::Failed;
                update.error_kind = ErrorKind::PartialFailure;
                update.failed_item = ctx.failed_item;
                update.error = "failed after " + std::to_string(ctx.items_done) + " of " +
                    std::to_string(items_total) + " items: " + ctx.failed_item + ": " + failure;
            } else {
                update.status = TaskStatus::Failed;
                update.error_kind = failure_kind == ErrorKind::None ? ErrorKind::Io : failure_kind;
                update.error = failure;
            }
            break;
    }

    registry_.update(job.token, update);
    if (update.status == TaskStatus::Failed) {
        log_error("Transfer %s failed: %s", job.token.c_str(), update.error->c_str());
    } else {
        log_debug("Transfer %s succeeded (%llu items)", job.token.c_str(),
                  static_cast<unsigned long long>(ctx.items_done));
    }
}

void TransferExecutor::record_outcome(const std::string& token) {
    auto task = registry_.get(token);
    if (!task || !is_terminal(task->status)) return;

    double seconds = 0;
    if (task->completed_at) {
        auto started = task->started_at.value_or(task->created_at);
        seconds = std::chrono::duration<double>(*task->completed_at - started).count();
    }

    std::function<void(const TransferTask&, double)> callback;
    {
        std::lock_guard lock(stats_mutex_);
        auto& kind = stats_.by_kind[task->kind];
        switch (task->status) {
            case TaskStatus::Succeeded: ++kind.succeeded; break;
            case TaskStatus::Failed: ++kind.failed; break;
            case TaskStatus::Cancelled: ++kind.cancelled; break;
            default: break;
        }
        kind.bytes += task->progress.bytes_done;
        stats_.items_transferred += task->progress.items_done;
        callback = on_complete_;
    }
    if (callback) callback(*task, seconds);
}

}  // namespace wsbridge
