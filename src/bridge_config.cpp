#include "wsbridge/bridge_config.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace wsbridge {

namespace {

constexpr uint64_t MB = 1024ULL * 1024;

}  // namespace

std::optional<BridgeConfig> BridgeConfig::from_args(int argc, char* argv[], int& command_index) {
    BridgeConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    int i = 1;
    try {
        for (; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.compare(0, 2, "--") != 0) break;

            if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--workspace-root") {
                auto* v = next_arg(i, "--workspace-root");
                if (!v) return std::nullopt;
                config.workspace_root = v;
            } else if (arg == "--workspace-dir") {
                auto* v = next_arg(i, "--workspace-dir");
                if (!v) return std::nullopt;
                config.workspace_dir = v;
            } else if (arg == "--config-db") {
                auto* v = next_arg(i, "--config-db");
                if (!v) return std::nullopt;
                config.config_db = v;
            } else if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--workers") {
                auto* v = next_arg(i, "--workers");
                if (!v) return std::nullopt;
                config.workers = std::stoull(v);
            } else if (arg == "--max-task-hours") {
                auto* v = next_arg(i, "--max-task-hours");
                if (!v) return std::nullopt;
                config.max_task_hours = std::stod(v);
            } else if (arg == "--task-retention") {
                auto* v = next_arg(i, "--task-retention");
                if (!v) return std::nullopt;
                config.task_retention_secs = std::stoull(v);
            } else if (arg == "--max-tasks-per-tenant") {
                auto* v = next_arg(i, "--max-tasks-per-tenant");
                if (!v) return std::nullopt;
                config.max_tasks_per_tenant = std::stoull(v);
            } else if (arg == "--zip-threshold-mb") {
                auto* v = next_arg(i, "--zip-threshold-mb");
                if (!v) return std::nullopt;
                config.zip_stream_threshold = std::stoull(v) * MB;
            } else if (arg == "--max-zip-mb") {
                auto* v = next_arg(i, "--max-zip-mb");
                if (!v) return std::nullopt;
                config.max_zip_bytes = std::stoull(v) * MB;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid value for " << argv[i] << ": " << e.what() << "\n";
        return std::nullopt;
    }

    command_index = i;
    config.apply_defaults();
    return config;
}

bool BridgeConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("workspace_root")) workspace_root = j["workspace_root"].get<std::string>();
        if (j.contains("workspace_dir")) workspace_dir = j["workspace_dir"].get<std::string>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("config_db")) config_db = j["config_db"].get<std::string>();
        if (j.contains("workers")) workers = j["workers"].get<size_t>();
        if (j.contains("max_task_hours")) max_task_hours = j["max_task_hours"].get<double>();
        if (j.contains("sweep_interval")) sweep_interval_secs = j["sweep_interval"].get<size_t>();
        if (j.contains("task_retention")) task_retention_secs = j["task_retention"].get<size_t>();
        if (j.contains("max_tasks_per_tenant"))
            max_tasks_per_tenant = j["max_tasks_per_tenant"].get<size_t>();
        if (j.contains("zip_threshold_mb"))
            zip_stream_threshold = j["zip_threshold_mb"].get<uint64_t>() * MB;
        if (j.contains("max_zip_mb")) max_zip_bytes = j["max_zip_mb"].get<uint64_t>() * MB;
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void BridgeConfig::apply_defaults() {
    if (state_dir.empty()) {
        state_dir = "/var/lib/wsbridge";
    }
    if (config_db.empty()) {
        config_db = state_dir / "storage.db";
    }
}

std::string BridgeConfig::validate() const {
    if (workspace_root.empty()) return "workspace_root is required (--workspace-root)";
    if (workspace_dir.empty() || workspace_dir.find('/') != std::string::npos) {
        return "workspace_dir must be a single directory name";
    }
    if (state_dir.empty()) return "state_dir is required (--state-dir)";
    if (workers == 0) return "workers must be > 0";
    if (max_task_hours <= 0) return "max_task_hours must be > 0";
    if (sweep_interval_secs == 0) return "sweep_interval must be > 0";
    if (max_tasks_per_tenant == 0) return "max_tasks_per_tenant must be > 0";
    if (zip_stream_threshold > max_zip_bytes) return "zip threshold must be <= max zip size";
    if (metrics_interval_secs == 0) return "metrics_interval must be > 0";
    return {};
}

ExecutorConfig BridgeConfig::executor_config() const {
    ExecutorConfig ec;
    ec.workers = workers;
    ec.max_task_lifetime = std::chrono::milliseconds(
        static_cast<int64_t>(max_task_hours * 3600.0 * 1000.0));
    ec.sweep_interval = std::chrono::seconds(sweep_interval_secs);
    ec.staging_dir = state_dir;
    ec.max_zip_size = max_zip_bytes;
    return ec;
}

}  // namespace wsbridge
