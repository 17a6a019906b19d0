#pragma once

#include "wsbridge/core/constants.hpp"
#include "wsbridge/transfer_executor.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace wsbridge {

/// Configuration for the bridge engine and its CLI.
struct BridgeConfig {
    // Workspaces live at <workspace_root>/<tenant>/<workspace_dir>
    std::filesystem::path workspace_root = constants::DEFAULT_WORKSPACE_ROOT;
    std::string workspace_dir = constants::WORKSPACE_DIR_NAME;

    // State: config database, zip exports, copy staging
    std::filesystem::path state_dir;   // Default: /var/lib/wsbridge
    std::filesystem::path config_db;   // Default: <state_dir>/storage.db

    // Transfer executor
    size_t workers = constants::DEFAULT_TRANSFER_WORKERS;
    double max_task_hours = constants::DEFAULT_MAX_TASK_LIFETIME_SECONDS / 3600.0;
    size_t sweep_interval_secs = constants::DEFAULT_SWEEP_INTERVAL_SECONDS;

    // Task registry
    size_t task_retention_secs = constants::DEFAULT_TASK_RETENTION_SECONDS;
    size_t max_tasks_per_tenant = constants::DEFAULT_MAX_TASKS_PER_TENANT;

    // Zip export
    uint64_t zip_stream_threshold = constants::DEFAULT_ZIP_STREAM_THRESHOLD;
    uint64_t max_zip_bytes = constants::DEFAULT_MAX_ZIP_SIZE;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    bool verbose = false;

    /// Parse global options from argv[1..]. Stops at the first argument that
    /// is not an option and stores its index in `command_index`.
    /// Returns empty optional on error (message on stderr).
    static std::optional<BridgeConfig> from_args(int argc, char* argv[], int& command_index);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in state_dir and config_db.
    void apply_defaults();

    /// Validate settings. Returns error message or empty string.
    std::string validate() const;

    ExecutorConfig executor_config() const;
};

}  // namespace wsbridge
