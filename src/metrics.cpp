#include "wsbridge/metrics.hpp"
#include "wsbridge/bridge.hpp"
#include "wsbridge/core/log.hpp"
#include "wsbridge/transfer_executor.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace wsbridge {

namespace {

constexpr TransferKind ALL_KINDS[] = {
    TransferKind::Upload, TransferKind::Download, TransferKind::Move,
    TransferKind::Copy, TransferKind::ZipExport};

constexpr TaskStatus ALL_STATUSES[] = {
    TaskStatus::Queued, TaskStatus::Running, TaskStatus::Succeeded,
    TaskStatus::Failed, TaskStatus::Cancelled};

constexpr ConnectionStatus ALL_CHECKS[] = {
    ConnectionStatus::Ok, ConnectionStatus::BucketNotFound, ConnectionStatus::AccessDenied,
    ConnectionStatus::InvalidCredentials, ConnectionStatus::ConnectionError,
    ConnectionStatus::Other};

void advance(prometheus::Counter* counter, uint64_t current, uint64_t& prev) {
    if (current > prev) {
        counter->Increment(static_cast<double>(current - prev));
        prev = current;
    }
}

}  // namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& transfers_family = prometheus::BuildCounter()
        .Name("wsbridge_transfers_total")
        .Help("Transfers finished, by kind and result")
        .Labels(labels)
        .Register(*registry_);

    auto& bytes_family = prometheus::BuildCounter()
        .Name("wsbridge_transfer_bytes_total")
        .Help("Bytes moved by transfers, by kind")
        .Labels(labels)
        .Register(*registry_);

    auto& duration_family = prometheus::BuildHistogram()
        .Name("wsbridge_transfer_duration_seconds")
        .Help("Transfer duration from submission to completion in seconds")
        .Labels(labels)
        .Register(*registry_);

    for (auto kind : ALL_KINDS) {
        std::string name = transfer_kind_name(kind);
        auto& tc = transfers_[kind];
        tc.succeeded = &transfers_family.Add({{"kind", name}, {"result", "succeeded"}});
        tc.failed = &transfers_family.Add({{"kind", name}, {"result", "failed"}});
        tc.cancelled = &transfers_family.Add({{"kind", name}, {"result", "cancelled"}});
        tc.bytes = &bytes_family.Add({{"kind", name}});
        tc.duration = &duration_family.Add({{"kind", name}}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 300, 900, 1800, 3600, 7200});
    }

    items_total_ = &prometheus::BuildCounter()
        .Name("wsbridge_transfer_items_total")
        .Help("Files and folders transferred")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& checks_family = prometheus::BuildCounter()
        .Name("wsbridge_connection_checks_total")
        .Help("Storage connection probes, by classification")
        .Labels(labels)
        .Register(*registry_);
    for (auto status : ALL_CHECKS) {
        checks_[status].counter = &checks_family.Add({{"result", connection_status_name(status)}});
    }

    // --- Gauges ---

    auto& tasks_family = prometheus::BuildGauge()
        .Name("wsbridge_tasks")
        .Help("Tasks held by the registry, by status")
        .Labels(labels)
        .Register(*registry_);
    for (auto status : ALL_STATUSES) {
        tasks_[status] = &tasks_family.Add({{"status", task_status_name(status)}});
    }

    queue_pending_ = &prometheus::BuildGauge()
        .Name("wsbridge_transfer_queue_pending")
        .Help("Transfers waiting for a worker")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    connection_check_duration_ = &prometheus::BuildHistogram()
        .Name("wsbridge_connection_check_duration_seconds")
        .Help("Connection probe duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    flush();
}

void MetricsExporter::flush() {
    update_gauges();
    write_file();
}

void MetricsExporter::observe_transfer(const TransferTask& task, double seconds) {
    auto it = transfers_.find(task.kind);
    if (it != transfers_.end()) {
        it->second.duration->Observe(seconds);
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        flush();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(snapshot_mutex_);

    if (registry_tasks_) {
        auto counts = registry_tasks_->counts();
        for (auto& [status, gauge] : tasks_) {
            auto it = counts.find(status);
            gauge->Set(it == counts.end() ? 0.0 : static_cast<double>(it->second));
        }
    }

    if (executor_) {
        queue_pending_->Set(static_cast<double>(executor_->pending()));

        // Increment counters by deltas since last snapshot
        auto stats = executor_->get_stats();
        for (auto& [kind, ks] : stats.by_kind) {
            auto it = transfers_.find(kind);
            if (it == transfers_.end()) continue;
            auto& tc = it->second;
            advance(tc.succeeded, ks.succeeded, tc.prev_succeeded);
            advance(tc.failed, ks.failed, tc.prev_failed);
            advance(tc.cancelled, ks.cancelled, tc.prev_cancelled);
            advance(tc.bytes, ks.bytes, tc.prev_bytes);
        }
        advance(items_total_, stats.items_transferred, prev_items_);
    }

    if (bridge_) {
        for (auto& [status, count] : bridge_->connection_check_counts()) {
            auto it = checks_.find(status);
            if (it == checks_.end()) continue;
            advance(it->second.counter, count, it->second.prev);
        }
    }
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_error("Cannot rename metrics file %s: %s", prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace wsbridge
