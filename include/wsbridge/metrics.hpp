#pragma once

#include "wsbridge/storage_client.hpp"
#include "wsbridge/task_registry.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace wsbridge {

class StorageBridge;
class TransferExecutor;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports bridge metrics to a Prometheus textfile for node_exporter pickup.
///
/// Counters for finished transfers and connection probes are advanced by
/// deltas against the executor's and facade's own statistics each time the
/// writer thread takes a snapshot. Task gauges come from the registry.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointers for snapshots (not owned).
    void set_bridge(const StorageBridge* bridge) { bridge_ = bridge; }
    void set_executor(const TransferExecutor* executor) { executor_ = executor; }
    void set_registry(const TaskRegistry* registry) { registry_tasks_ = registry; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Called from the executor's completion callback.
    void observe_transfer(const TransferTask& task, double seconds);

    prometheus::Histogram& connection_check_duration() { return *connection_check_duration_; }

    /// Take a snapshot and write the file now.
    void flush();

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    struct TransferCounters {
        prometheus::Counter* succeeded = nullptr;
        prometheus::Counter* failed = nullptr;
        prometheus::Counter* cancelled = nullptr;
        prometheus::Counter* bytes = nullptr;
        prometheus::Histogram* duration = nullptr;
        uint64_t prev_succeeded = 0;
        uint64_t prev_failed = 0;
        uint64_t prev_cancelled = 0;
        uint64_t prev_bytes = 0;
    };

    struct CheckCounter {
        prometheus::Counter* counter = nullptr;
        uint64_t prev = 0;
    };

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    const StorageBridge* bridge_ = nullptr;
    const TransferExecutor* executor_ = nullptr;
    const TaskRegistry* registry_tasks_ = nullptr;

    std::mutex snapshot_mutex_;
    std::map<TransferKind, TransferCounters> transfers_;
    std::map<ConnectionStatus, CheckCounter> checks_;
    prometheus::Counter* items_total_;
    uint64_t prev_items_ = 0;

    // --- Gauges ---
    std::map<TaskStatus, prometheus::Gauge*> tasks_;
    prometheus::Gauge* queue_pending_;

    prometheus::Histogram* connection_check_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace wsbridge
