// wsbridge: command-line front end for the storage bridge engine.
//
// Usage: wsbridge [global options] <command> [args]
//
// Configuration records live in the SQLite config database; transfers run on
// the in-process executor and are followed until they finish.

#include "wsbridge/bridge.hpp"
#include "wsbridge/bridge_config.hpp"
#include "wsbridge/core/log.hpp"
#include "wsbridge/metrics.hpp"
#include "wsbridge/path_util.hpp"
#include "wsbridge/storage_config.hpp"
#include "wsbridge/task_registry.hpp"
#include "wsbridge/transfer_executor.hpp"
#include "wsbridge/workspace.hpp"

#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int sig) {
    (void)sig;
    g_interrupted = 1;
}

void print_usage() {
    fprintf(stderr,
        "Usage: wsbridge [global options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  set-system [record options]              Write the system default record\n"
        "  set-personal <tenant> [record options]   Write a tenant's personal record\n"
        "  remove-personal <tenant>                 Delete a tenant's personal record\n"
        "  resolve <tenant>                         Print the effective config\n"
        "  test-connection <tenant>                 Probe the tenant's bucket\n"
        "  ls <tenant> <loc> [--recursive]          List a folder\n"
        "  cat <tenant> <loc>                       Print a small text file\n"
        "  mkdir <tenant> <loc>                     Create a folder\n"
        "  rm <tenant> <loc>                        Delete a file or folder\n"
        "  transfer <kind> <tenant> <src> <dst> [--item <name>]...\n"
        "                                           Run upload|download|move|copy\n"
        "  zip <tenant> <loc> <out.zip>             Export a storage folder as zip\n"
        "\n"
        "Locations: workspace:<path>, storage:<path>, shared:<path>\n"
        "           (local: and remote: are accepted aliases)\n"
        "\n"
        "Record options:\n"
        "  --endpoint <url>        S3 endpoint, or file://<dir> for a local directory\n"
        "  --bucket <name>         Bucket name (required)\n"
        "  --prefix <prefix>       Key prefix (system: base under which tenants live)\n"
        "  --region <region>       Region (default: us-east-1)\n"
        "  --access-key <key>      Access key (set-system: $AWS_ACCESS_KEY_ID)\n"
        "  --secret-key <key>      Secret key (set-system: $AWS_SECRET_ACCESS_KEY)\n"
        "\n"
        "Global options:\n"
        "  --config <file>             JSON configuration file\n"
        "  --workspace-root <dir>      Root holding <tenant>/workspace (default: /home)\n"
        "  --workspace-dir <name>      Workspace directory name (default: workspace)\n"
        "  --config-db <file>          Config database (default: <state-dir>/storage.db)\n"
        "  --state-dir <dir>           Staging and exports (default: /var/lib/wsbridge)\n"
        "  --workers <N>               Transfer workers (default: 4)\n"
        "  --max-task-hours <H>        Transfer lifetime before timeout (default: 24)\n"
        "  --task-retention <secs>     Keep finished tasks this long (default: 3600)\n"
        "  --max-tasks-per-tenant <N>  Finished tasks kept per tenant (default: 100)\n"
        "  --zip-threshold-mb <MB>     Stream zips up to this size (default: 512)\n"
        "  --max-zip-mb <MB>           Refuse zips above this size (default: 2048)\n"
        "  --metrics-file <path>       Prometheus textfile output\n"
        "  --metrics-interval <secs>   Metrics write interval (default: 15)\n"
        "  --verbose                   Debug logging\n"
        "  --help                      Show this help\n"
    );
}

bool is_secret(const std::string& name) {
    return name.find("key") != std::string::npos || name.find("secret") != std::string::npos;
}

std::string mask(const std::string& value) {
    if (value.empty()) return "(none)";
    if (value.size() <= 4) return "****";
    return value.substr(0, 4) + "****";
}

void format_timestamp(std::chrono::system_clock::time_point tp, char* buf, size_t buf_size) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    strftime(buf, buf_size, "%Y-%m-%dT%H:%M:%SZ", &tm_val);
}

std::optional<wsbridge::Location> parse_location(const std::string& text) {
    auto loc = wsbridge::Location::parse(text);
    if (!loc) {
        fprintf(stderr, "Invalid location '%s' (expected workspace:, storage: or shared:)\n",
                text.c_str());
    }
    return loc;
}

int report(const wsbridge::Outcome& outcome) {
    if (outcome.success) return 0;
    fprintf(stderr, "Error (%s): %s\n", wsbridge::error_kind_name(outcome.error_kind),
            outcome.error_message.c_str());
    return 1;
}

/// Record options for set-system / set-personal.
int run_set_record(wsbridge::SqliteConfigStore& store, const std::string& tenant,
                   int argc, char* argv[], int i) {
    wsbridge::StorageRecord record;
    record.region = "us-east-1";
    bool system = tenant.empty();

    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--endpoint") {
            if (++i >= argc) { fprintf(stderr, "--endpoint requires argument\n"); return 1; }
            record.endpoint = argv[i];
        } else if (arg == "--bucket") {
            if (++i >= argc) { fprintf(stderr, "--bucket requires argument\n"); return 1; }
            record.bucket = argv[i];
        } else if (arg == "--prefix") {
            if (++i >= argc) { fprintf(stderr, "--prefix requires argument\n"); return 1; }
            record.prefix = argv[i];
        } else if (arg == "--region") {
            if (++i >= argc) { fprintf(stderr, "--region requires argument\n"); return 1; }
            record.region = argv[i];
        } else if (arg == "--access-key") {
            if (++i >= argc) { fprintf(stderr, "--access-key requires argument\n"); return 1; }
            record.access_key = argv[i];
        } else if (arg == "--secret-key") {
            if (++i >= argc) { fprintf(stderr, "--secret-key requires argument\n"); return 1; }
            record.secret_key = argv[i];
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            return 1;
        }
    }

    if (system) {
        if (record.access_key.empty()) {
            if (const char* v = std::getenv("AWS_ACCESS_KEY_ID")) record.access_key = v;
        }
        if (record.secret_key.empty()) {
            if (const char* v = std::getenv("AWS_SECRET_ACCESS_KEY")) record.secret_key = v;
        }
    }

    if (record.bucket.empty()) {
        fprintf(stderr, "Error: --bucket is required\n");
        return 1;
    }

    bool ok = system ? store.put_system_default(record) : store.put_personal(tenant, record);
    if (!ok) {
        fprintf(stderr, "Failed to write %s record\n", system ? "system" : "personal");
        return 1;
    }
    printf("Saved %s record (bucket %s)\n", system ? "system" : ("personal '" + tenant + "'").c_str(),
           record.bucket.c_str());
    return 0;
}

/// Everything a storage command needs, torn down in reverse order.
struct Engine {
    const wsbridge::BridgeConfig& config;
    wsbridge::ConfigResolver resolver;
    wsbridge::WorkspaceBridge workspace;
    wsbridge::TaskRegistry registry;
    wsbridge::TransferExecutor executor;
    wsbridge::StorageBridge bridge;
    std::unique_ptr<wsbridge::MetricsExporter> metrics;

    Engine(const wsbridge::BridgeConfig& cfg, const wsbridge::ConfigStore& store)
        : config(cfg)
        , resolver(store)
        , workspace(cfg.workspace_root, cfg.workspace_dir)
        , registry(std::chrono::seconds(cfg.task_retention_secs), cfg.max_tasks_per_tenant)
        , executor(resolver, workspace, registry, cfg.executor_config())
        , bridge(resolver, workspace, registry, executor, cfg.zip_stream_threshold) {}

    std::string start() {
        if (!config.metrics_file.empty()) {
            std::map<std::string, std::string> labels;
            char hostname[256] = {};
            if (gethostname(hostname, sizeof(hostname) - 1) == 0) {
                labels["host"] = hostname;
            }
            metrics = std::make_unique<wsbridge::MetricsExporter>(
                config.metrics_file, std::chrono::seconds(config.metrics_interval_secs), labels);
            metrics->set_bridge(&bridge);
            metrics->set_executor(&executor);
            metrics->set_registry(&registry);
            executor.set_completion_callback(
                [m = metrics.get()](const wsbridge::TransferTask& task, double seconds) {
                    m->observe_transfer(task, seconds);
                });
            metrics->start();
        }
        return executor.start();
    }

    void stop() {
        executor.stop();
        if (metrics) metrics->stop();
    }
};

void print_progress(const wsbridge::TransferTask& task) {
    const auto& p = task.progress;
    double pct = p.bytes_total ? 100.0 * static_cast<double>(p.bytes_done) /
                                     static_cast<double>(p.bytes_total)
                               : 0.0;
    fprintf(stderr, "\r[%s] %llu/%llu items, %llu/%llu bytes (%.1f%%) %s\x1b[K",
            wsbridge::task_status_name(task.status),
            static_cast<unsigned long long>(p.items_done),
            static_cast<unsigned long long>(p.items_total),
            static_cast<unsigned long long>(p.bytes_done),
            static_cast<unsigned long long>(p.bytes_total),
            pct, p.current_item.c_str());
}

/// Poll a task until it is terminal, cancelling it on SIGINT.
std::optional<wsbridge::TransferTask> follow_task(wsbridge::StorageBridge& bridge,
                                                  const std::string& token) {
    bool cancel_sent = false;
    while (true) {
        if (g_interrupted && !cancel_sent) {
            fprintf(stderr, "\nInterrupted; cancelling %s\n", token.c_str());
            report(bridge.cancel_transfer(token));
            cancel_sent = true;
        }
        auto status = bridge.get_transfer_status(token);
        if (!status.success) {
            report(status);
            return std::nullopt;
        }
        print_progress(status.task);
        if (wsbridge::is_terminal(status.task.status)) {
            fprintf(stderr, "\n");
            return status.task;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int task_exit_code(const wsbridge::TransferTask& task) {
    if (task.status == wsbridge::TaskStatus::Succeeded) return 0;
    if (task.status == wsbridge::TaskStatus::Cancelled) {
        fprintf(stderr, "Transfer cancelled\n");
        return 130;
    }
    fprintf(stderr, "Transfer failed (%s): %s\n", wsbridge::error_kind_name(task.error_kind),
            task.error.c_str());
    return 1;
}

int run_ls(Engine& engine, const std::string& tenant, const wsbridge::Location& loc, bool recursive) {
    auto out = engine.bridge.list(tenant, loc, recursive);
    if (!out.success) return report(out);
    for (const auto& e : out.entries) {
        char ts[32] = "-";
        if (e.last_modified.time_since_epoch().count() != 0) {
            format_timestamp(e.last_modified, ts, sizeof(ts));
        }
        printf("%c %12llu  %s  %s%s\n", e.is_directory ? 'd' : '-',
               static_cast<unsigned long long>(e.size), ts, e.path.c_str(),
               e.is_directory ? "/" : "");
    }
    return 0;
}

int run_transfer(Engine& engine, int argc, char* argv[], int i) {
    if (argc - i < 4) {
        print_usage();
        return 1;
    }
    auto kind = wsbridge::parse_transfer_kind(argv[i]);
    if (!kind || *kind == wsbridge::TransferKind::ZipExport) {
        fprintf(stderr, "Unknown transfer kind: %s\n", argv[i]);
        return 1;
    }

    wsbridge::TransferRequest request;
    request.kind = *kind;
    request.tenant = argv[i + 1];
    auto src = parse_location(argv[i + 2]);
    auto dst = parse_location(argv[i + 3]);
    if (!src || !dst) return 1;
    request.source = *src;
    request.destination = *dst;

    for (i += 4; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--item") {
            if (++i >= argc) { fprintf(stderr, "--item requires argument\n"); return 1; }
            request.items.push_back(argv[i]);
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            return 1;
        }
    }

    auto started = engine.bridge.start_transfer(request);
    if (!started.success) return report(started);
    wsbridge::log_info("Started %s transfer %s", wsbridge::transfer_kind_name(request.kind),
             started.token.c_str());

    auto task = follow_task(engine.bridge, started.token);
    if (!task) return 1;
    return task_exit_code(*task);
}

int run_zip(Engine& engine, const std::string& tenant, const wsbridge::Location& loc,
            const std::string& out_path) {
    auto part_path = out_path + ".part";
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        fprintf(stderr, "Cannot open output file: %s\n", part_path.c_str());
        return 1;
    }
    wsbridge::ObjectSink sink = [&out](const char* data, size_t size) {
        out.write(data, static_cast<std::streamsize>(size));
        return !g_interrupted && out.good();
    };

    auto zipped = engine.bridge.stream_folder_as_zip(tenant, loc, sink);
    if (zipped.success && !zipped.streamed) {
        wsbridge::log_info("Waiting for background export %s (%llu bytes of content)", zipped.token.c_str(),
                 static_cast<unsigned long long>(zipped.total_bytes));
        auto task = follow_task(engine.bridge, zipped.token);
        if (!task) {
            std::remove(part_path.c_str());
            return 1;
        }
        if (task->status != wsbridge::TaskStatus::Succeeded) {
            std::remove(part_path.c_str());
            return task_exit_code(*task);
        }
        auto fetched = engine.bridge.fetch_export(zipped.token, sink);
        if (!fetched.success) {
            std::remove(part_path.c_str());
            return report(fetched);
        }
        zipped.bytes = fetched.bytes;
    } else if (!zipped.success) {
        out.close();
        std::remove(part_path.c_str());
        return report(zipped);
    }

    out.close();
    if (!out.good() || std::rename(part_path.c_str(), out_path.c_str()) != 0) {
        fprintf(stderr, "Cannot write %s: %s\n", out_path.c_str(), strerror(errno));
        std::remove(part_path.c_str());
        return 1;
    }
    printf("Wrote %s (%llu bytes)\n", out_path.c_str(), static_cast<unsigned long long>(zipped.bytes));
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int a = 1; a < argc; ++a) {
        if (std::strcmp(argv[a], "--help") == 0 || std::strcmp(argv[a], "-h") == 0) {
            print_usage();
            return 0;
        }
    }

    int i = 1;
    auto config_opt = wsbridge::BridgeConfig::from_args(argc, argv, i);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }
    wsbridge::set_log_verbose(config.verbose);

    if (i >= argc) {
        print_usage();
        return 1;
    }
    std::string command = argv[i++];

    std::error_code ec;
    std::filesystem::create_directories(config.config_db.parent_path(), ec);
    wsbridge::SqliteConfigStore store;
    err = store.open(config.config_db);
    if (!err.empty()) {
        std::cerr << "Failed to open config database: " << err << std::endl;
        return 1;
    }

    // --- Config commands (no engine) ---

    if (command == "set-system") {
        return run_set_record(store, "", argc, argv, i);
    }
    if (command == "set-personal") {
        if (i >= argc) { fprintf(stderr, "set-personal requires <tenant>\n"); return 1; }
        std::string tenant = argv[i++];
        if (!wsbridge::is_valid_tenant(tenant)) {
            fprintf(stderr, "Invalid tenant: %s\n", tenant.c_str());
            return 1;
        }
        return run_set_record(store, tenant, argc, argv, i);
    }
    if (command == "remove-personal") {
        if (i >= argc) { fprintf(stderr, "remove-personal requires <tenant>\n"); return 1; }
        if (!wsbridge::is_valid_tenant(argv[i])) {
            fprintf(stderr, "Invalid tenant: %s\n", argv[i]);
            return 1;
        }
        if (!store.remove_personal(argv[i])) {
            fprintf(stderr, "No personal record for %s\n", argv[i]);
            return 1;
        }
        printf("Removed personal record for %s\n", argv[i]);
        return 0;
    }

    // --- Storage commands ---

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    Engine engine(config, store);
    err = engine.start();
    if (!err.empty()) {
        std::cerr << "Failed to start transfer executor: " << err << std::endl;
        engine.stop();
        return 1;
    }

    int rc = 1;
    auto need = [&](int n, const char* usage) {
        if (argc - i < n) {
            fprintf(stderr, "Usage: wsbridge %s\n", usage);
            return false;
        }
        return true;
    };

    if (command == "resolve") {
        if (need(1, "resolve <tenant>")) {
            auto out = engine.bridge.resolve_config(argv[i]);
            rc = report(out);
            if (out.success && !out.config) {
                printf("No storage configured for %s\n", argv[i]);
            } else if (out.success) {
                const auto& c = *out.config;
                printf("source:   %s\n", wsbridge::config_source_name(c.source));
                printf("backend:  %s\n", c.backend_type().c_str());
                printf("endpoint: %s\n", c.endpoint.empty() ? "(aws)" : c.endpoint.c_str());
                printf("region:   %s\n", c.region.c_str());
                printf("bucket:   %s\n", c.bucket.c_str());
                printf("prefix:   %s\n", c.prefix.empty() ? "(none)" : c.prefix.c_str());
                for (const auto& [k, v] : c.backend_params()) {
                    if (is_secret(k)) printf("%-9s %s\n", (k + ":").c_str(), mask(v).c_str());
                }
            }
        }
    } else if (command == "test-connection") {
        if (need(1, "test-connection <tenant>")) {
            auto resolved = engine.bridge.resolve_config(argv[i]);
            rc = report(resolved);
            if (resolved.success && !resolved.config) {
                fprintf(stderr, "No storage configured for %s\n", argv[i]);
                rc = 1;
            } else if (resolved.success) {
                wsbridge::ConnectionOutcome out;
                if (engine.metrics) {
                    wsbridge::ScopedTimer timer(engine.metrics->connection_check_duration());
                    out = engine.bridge.test_connection(*resolved.config);
                } else {
                    out = engine.bridge.test_connection(*resolved.config);
                }
                printf("%s: %s\n", wsbridge::connection_status_name(out.check.status),
                       out.check.message.c_str());
                rc = out.check.ok ? 0 : 1;
            }
        }
    } else if (command == "ls") {
        if (need(2, "ls <tenant> <loc> [--recursive]")) {
            bool recursive = argc - i > 2 && std::strcmp(argv[i + 2], "--recursive") == 0;
            if (auto loc = parse_location(argv[i + 1])) {
                rc = run_ls(engine, argv[i], *loc, recursive);
            }
        }
    } else if (command == "cat") {
        if (need(2, "cat <tenant> <loc>")) {
            if (auto loc = parse_location(argv[i + 1])) {
                auto out = engine.bridge.read_text(argv[i], *loc);
                rc = report(out);
                if (out.success) fwrite(out.text.data(), 1, out.text.size(), stdout);
            }
        }
    } else if (command == "mkdir") {
        if (need(2, "mkdir <tenant> <loc>")) {
            if (auto loc = parse_location(argv[i + 1])) {
                rc = report(engine.bridge.make_directory(argv[i], *loc));
            }
        }
    } else if (command == "rm") {
        if (need(2, "rm <tenant> <loc>")) {
            if (auto loc = parse_location(argv[i + 1])) {
                auto out = engine.bridge.remove(argv[i], *loc);
                rc = report(out);
                if (out.success) {
                    printf("Removed %llu entries\n", static_cast<unsigned long long>(out.removed));
                }
            }
        }
    } else if (command == "transfer") {
        rc = run_transfer(engine, argc, argv, i);
    } else if (command == "zip") {
        if (need(3, "zip <tenant> <loc> <out.zip>")) {
            if (auto loc = parse_location(argv[i + 1])) {
                rc = run_zip(engine, argv[i], *loc, argv[i + 2]);
            }
        }
    } else {
        fprintf(stderr, "Unknown command: %s\n", command.c_str());
        print_usage();
    }

    engine.stop();
    return rc;
}
