// Test suite for wsbridge.
//
// Tests:
//   1. Path helpers and tenant validation
//   2. BridgeConfig CLI parsing, JSON loading, defaults and validation
//   3. Config resolution: personal/system precedence, system prefixes, absence
//   4. Workspace bridge: path mapping, traversal and symlink escapes, I/O
//   5. Storage client over the local-directory backend
//   6. Task registry: status rules, cancellation, retention and per-tenant cap
//   7. Transfer executor through the facade, with a gated backend for
//      cancellation, timeouts and injected failures
//   8. Zip export: streamed and background archives checked with inflate
//   9. Connection classification
//  10. Metrics textfile

#include "wsbridge/bridge.hpp"
#include "wsbridge/bridge_config.hpp"
#include "wsbridge/errors.hpp"
#include "wsbridge/metrics.hpp"
#include "wsbridge/path_util.hpp"
#include "wsbridge/storage/backend.hpp"
#include "wsbridge/storage_client.hpp"
#include "wsbridge/storage_config.hpp"
#include "wsbridge/task_registry.hpp"
#include "wsbridge/transfer_executor.hpp"
#include "wsbridge/workspace.hpp"
#include "wsbridge/zip_writer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;
using namespace wsbridge;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    do {                                                              \
        auto value_ = (s);                                            \
        ASSERT_TRUE(value_.empty(), std::string(msg) + ": " + value_); \
    } while (0)

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

// Runs `stmt` and checks it throws `type`.
#define ASSERT_THROWS(stmt, type, msg)                                \
    do {                                                              \
        bool thrown_ = false;                                         \
        try { stmt; } catch (const type&) { thrown_ = true; }         \
        ASSERT_TRUE(thrown_, msg);                                    \
    } while (0)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return cond();
}

/// Deterministic pseudo-random content of the given size.
static std::string make_content(size_t size, unsigned seed) {
    std::string s(size, '\0');
    uint32_t x = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        x = x * 1103515245u + 12345u;
        s[i] = static_cast<char>(x >> 16);
    }
    return s;
}

static uint16_t rd16(const std::string& b, size_t off) {
    return static_cast<uint16_t>(static_cast<unsigned char>(b[off]) |
                                 (static_cast<unsigned char>(b[off + 1]) << 8));
}

static uint32_t rd32(const std::string& b, size_t off) {
    return static_cast<uint32_t>(rd16(b, off)) | (static_cast<uint32_t>(rd16(b, off + 2)) << 16);
}

/// Extract every entry of a ZIP archive via its central directory, inflating
/// deflated entries and checking each CRC-32. Returns an error or empty.
static std::string unzip_all(const std::string& zip, std::map<std::string, std::string>& out) {
    if (zip.size() < 22) return "archive too short";
    size_t eocd = std::string::npos;
    for (size_t i = zip.size() - 22 + 1; i-- > 0;) {
        if (rd32(zip, i) == 0x06054b50) { eocd = i; break; }
    }
    if (eocd == std::string::npos) return "no end of central directory record";

    uint16_t count = rd16(zip, eocd + 10);
    size_t pos = rd32(zip, eocd + 16);
    for (uint16_t n = 0; n < count; ++n) {
        if (pos + 46 > zip.size() || rd32(zip, pos) != 0x02014b50) return "bad central header";
        uint16_t method = rd16(zip, pos + 10);
        uint32_t crc = rd32(zip, pos + 16);
        uint32_t csize = rd32(zip, pos + 20);
        uint32_t usize = rd32(zip, pos + 24);
        uint16_t name_len = rd16(zip, pos + 28);
        uint16_t extra_len = rd16(zip, pos + 30);
        uint16_t comment_len = rd16(zip, pos + 32);
        uint32_t local = rd32(zip, pos + 42);
        std::string name = zip.substr(pos + 46, name_len);
        pos += 46 + name_len + extra_len + comment_len;

        if (rd32(zip, local) != 0x04034b50) return "bad local header for " + name;
        size_t data = local + 30 + rd16(zip, local + 26) + rd16(zip, local + 28);
        if (data + csize > zip.size()) return "truncated data for " + name;
        std::string compressed = zip.substr(data, csize);

        std::string content;
        if (method == 0) {
            content = compressed;
        } else if (method == 8) {
            z_stream zs{};
            if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) return "inflateInit2 failed";
            content.resize(static_cast<size_t>(usize) + 1);
            zs.next_in = reinterpret_cast<Bytef*>(compressed.data());
            zs.avail_in = static_cast<uInt>(compressed.size());
            zs.next_out = reinterpret_cast<Bytef*>(content.data());
            zs.avail_out = static_cast<uInt>(content.size());
            int rc = inflate(&zs, Z_FINISH);
            content.resize(zs.total_out);
            inflateEnd(&zs);
            if (rc != Z_STREAM_END) return "inflate failed for " + name;
        } else {
            return "unexpected method for " + name;
        }

        if (content.size() != usize) return "size mismatch for " + name;
        uLong actual = crc32(0L, reinterpret_cast<const Bytef*>(content.data()),
                             static_cast<uInt>(content.size()));
        if (actual != crc) return "CRC mismatch for " + name;
        out[name] = std::move(content);
    }
    return {};
}

// ---------------------------------------------------------------------------
// Gated backend: wraps a real backend, holds writes until the gate opens and
// fails writes (or removals) whose key ends with a given suffix.
// ---------------------------------------------------------------------------

class Gate {
public:
    explicit Gate(bool open = false) : open_(open) {}

    void open() {
        {
            std::lock_guard lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        ++waiting_;
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

    int waiting() const { return waiting_.load(); }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_;
    std::atomic<int> waiting_{0};
};

class GatedBackend : public StorageBackend {
public:
    GatedBackend(std::unique_ptr<StorageBackend> inner, std::shared_ptr<Gate> gate,
                 std::string fail_suffix, std::string fail_remove_suffix)
        : inner_(std::move(inner))
        , gate_(std::move(gate))
        , fail_suffix_(std::move(fail_suffix))
        , fail_remove_suffix_(std::move(fail_remove_suffix)) {}

    std::string type_name() const override { return "gated"; }
    std::string store_id() const override { return inner_->store_id(); }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        return inner_->head(key);
    }
    GetResult get(const std::string& key) const override {
        return inner_->get(key);
    }
    StreamResult get_stream(const std::string& key, const ObjectSink& sink) const override {
        return inner_->get_stream(key, sink);
    }

    PutResult put(const std::string& key, std::span<const uint8_t> data,
                  const PutOptions& options) override {
        gate_->wait();
        if (should_fail(key)) return {false, "", "injected failure"};
        return inner_->put(key, data, options);
    }

    PutResult put_file(const std::string& key, const fs::path& path,
                       const PutOptions& options, const ProgressCallback& progress) override {
        gate_->wait();
        if (should_fail(key)) return {false, "", "injected failure"};
        return inner_->put_file(key, path, options, progress);
    }

    bool remove(const std::string& key) override {
        if (!fail_remove_suffix_.empty() && key.ends_with(fail_remove_suffix_)) return false;
        return inner_->remove(key);
    }
    std::vector<std::string> remove_batch(const std::vector<std::string>& keys) override {
        return inner_->remove_batch(keys);
    }
    ListResult list(const ListOptions& options) const override { return inner_->list(options); }

    CopyResult copy(const std::string& source, const std::string& destination) override {
        gate_->wait();
        if (should_fail(destination)) {
            CopyResult result;
            result.error_message = "injected failure";
            return result;
        }
        return inner_->copy(source, destination);
    }

    ProbeResult probe() const override { return inner_->probe(); }

private:
    bool should_fail(const std::string& key) const {
        return !fail_suffix_.empty() && key.ends_with(fail_suffix_);
    }

    std::unique_ptr<StorageBackend> inner_;
    std::shared_ptr<Gate> gate_;
    std::string fail_suffix_;
    std::string fail_remove_suffix_;
};

static ClientFactory gated_factory(std::shared_ptr<Gate> gate, std::string fail_suffix = "",
                                   std::string fail_remove_suffix = "") {
    return [gate, fail_suffix, fail_remove_suffix](const StorageConfig& config) {
        auto inner = StorageBackendFactory::create(config.backend_type(), config.backend_params());
        return std::make_unique<StorageClient>(
            std::make_unique<GatedBackend>(std::move(inner), gate, fail_suffix, fail_remove_suffix),
            config.prefix);
    };
}

// ---------------------------------------------------------------------------
// Engine harness: temp root with home/, storage/bucket/ and state/
// ---------------------------------------------------------------------------

struct HarnessOptions {
    size_t workers = 2;
    std::chrono::milliseconds max_task_lifetime{std::chrono::hours(1)};
    ClientFactory factory;
    uint64_t zip_stream_threshold = constants::DEFAULT_ZIP_STREAM_THRESHOLD;
    bool system_default = true;
};

struct Harness {
    fs::path root;
    fs::path storage_dir;
    SqliteConfigStore store;
    std::unique_ptr<ConfigResolver> resolver;
    std::unique_ptr<WorkspaceBridge> workspace;
    std::unique_ptr<TaskRegistry> registry;
    std::unique_ptr<TransferExecutor> executor;
    std::unique_ptr<StorageBridge> bridge;

    ~Harness() {
        if (executor) executor->stop();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string endpoint() const { return "file://" + storage_dir.string(); }

    fs::path ws(const std::string& tenant, const std::string& rel = "") const {
        auto base = root / "home" / tenant / "workspace";
        return rel.empty() ? base : base / rel;
    }

    /// Object path inside the bucket directory.
    fs::path object(const std::string& key) const { return storage_dir / "bucket" / key; }
};

static std::unique_ptr<Harness> make_harness(const std::string& name, HarnessOptions opts = {}) {
    auto h = std::make_unique<Harness>();
    h->root = make_temp_dir("wsbridge-" + name);
    h->storage_dir = h->root / "storage";
    fs::create_directories(h->storage_dir / "bucket");
    fs::create_directories(h->root / "home" / "alice" / "workspace");
    fs::create_directories(h->root / "home" / "bob" / "workspace");

    auto err = h->store.open(h->root / "state" / "storage.db");
    if (!err.empty()) throw std::runtime_error("open config db: " + err);

    StorageRecord personal;
    personal.endpoint = h->endpoint();
    personal.bucket = "bucket";
    personal.prefix = "alice-data";
    h->store.put_personal("alice", personal);

    if (opts.system_default) {
        StorageRecord system;
        system.endpoint = h->endpoint();
        system.bucket = "bucket";
        h->store.put_system_default(system);
    }

    ExecutorConfig ec;
    ec.workers = opts.workers;
    ec.max_task_lifetime = opts.max_task_lifetime;
    ec.staging_dir = h->root / "state";

    h->resolver = std::make_unique<ConfigResolver>(h->store);
    h->workspace = std::make_unique<WorkspaceBridge>(h->root / "home");
    h->registry = std::make_unique<TaskRegistry>();
    h->executor = std::make_unique<TransferExecutor>(*h->resolver, *h->workspace, *h->registry,
                                                     ec, opts.factory);
    h->bridge = std::make_unique<StorageBridge>(*h->resolver, *h->workspace, *h->registry,
                                                *h->executor, opts.zip_stream_threshold);
    err = h->executor->start();
    if (!err.empty()) throw std::runtime_error("start executor: " + err);
    return h;
}

static std::optional<TransferTask> wait_terminal(StorageBridge& bridge, const std::string& token,
                                                 int timeout_ms = 10000) {
    std::optional<TransferTask> last;
    wait_for([&] {
        auto status = bridge.get_transfer_status(token);
        if (!status.success) return false;
        last = status.task;
        return is_terminal(status.task.status);
    }, timeout_ms);
    return last;
}

static TransferRequest request(TransferKind kind, const std::string& tenant,
                               const std::string& src, const std::string& dst,
                               std::vector<std::string> items = {}) {
    TransferRequest r;
    r.kind = kind;
    r.tenant = tenant;
    r.source = *Location::parse(src);
    r.destination = *Location::parse(dst);
    r.items = std::move(items);
    return r;
}

// ---------------------------------------------------------------------------
// 1. Path helpers
// ---------------------------------------------------------------------------

static void test_path_util() {
    std::cout << "\n=== Path helpers ===" << std::endl;

    {
        TEST(tenant_validation);
        ASSERT_TRUE(is_valid_tenant("alice"), "alice");
        ASSERT_TRUE(is_valid_tenant("a.b_c-1"), "punctuation");
        ASSERT_TRUE(!is_valid_tenant(""), "empty");
        ASSERT_TRUE(!is_valid_tenant(".hidden"), "leading dot");
        ASSERT_TRUE(!is_valid_tenant("-x"), "leading dash");
        ASSERT_TRUE(!is_valid_tenant("a/b"), "slash");
        ASSERT_TRUE(!is_valid_tenant(std::string(65, 'a')), "too long");
        ASSERT_TRUE(is_valid_tenant(std::string(64, 'a')), "64 chars");
        ASSERT_TRUE(!is_valid_tenant("_default"), "reserved owner");
        ASSERT_TRUE(!is_valid_tenant("_shared"), "shared area segment");
        ASSERT_THROWS(validate_tenant("../x"), ValidationError, "validate_tenant throws");
        PASS();
    }
    {
        TEST(normalize_relative_path);
        ASSERT_EQ(normalize_relative_path("/a//b/./c/"), "a/b/c", "collapsed");
        ASSERT_EQ(normalize_relative_path(""), "", "root");
        ASSERT_EQ(normalize_relative_path("./"), "", "dot root");
        ASSERT_THROWS(normalize_relative_path("a/../b"), ValidationError, "dotdot");
        ASSERT_THROWS(normalize_relative_path(".."), ValidationError, "bare dotdot");
        ASSERT_THROWS(normalize_relative_path(std::string("a\0b", 3)), ValidationError, "NUL");
        PASS();
    }
    {
        TEST(prefix_join_basename);
        ASSERT_EQ(normalize_prefix("users/alice"), "users/alice/", "prefix slash");
        ASSERT_EQ(normalize_prefix("/"), "", "empty prefix");
        ASSERT_EQ(join_path("", "b"), "b", "join empty left");
        ASSERT_EQ(join_path("a", ""), "a", "join empty right");
        ASSERT_EQ(join_path("a", "b"), "a/b", "join");
        ASSERT_EQ(base_name("a/b/c.txt"), "c.txt", "base_name");
        ASSERT_EQ(base_name("c"), "c", "base_name single");
        PASS();
    }
    {
        TEST(location_parse);
        auto loc = Location::parse("remote:docs/a");
        ASSERT_TRUE(loc.has_value(), "remote parses");
        ASSERT_TRUE(loc->side == LocationSide::Storage, "remote is storage");
        ASSERT_EQ(loc->path, "docs/a", "path");
        loc = Location::parse("local:");
        ASSERT_TRUE(loc && loc->side == LocationSide::Workspace, "local is workspace");
        loc = Location::parse("shared:x");
        ASSERT_TRUE(loc && loc->side == LocationSide::Shared, "shared");
        ASSERT_TRUE(!Location::parse("ftp:x").has_value(), "unknown side");
        ASSERT_TRUE(!Location::parse("nocolon").has_value(), "no colon");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. BridgeConfig
// ---------------------------------------------------------------------------

static void test_bridge_config() {
    std::cout << "\n=== BridgeConfig ===" << std::endl;

    {
        TEST(cli_global_options);
        const char* args[] = {
            "wsbridge",
            "--workspace-root", "/srv/home",
            "--workers", "8",
            "--zip-threshold-mb", "100",
            "--max-task-hours", "0.5",
            "--verbose",
            "ls", "alice", "workspace:",
        };
        int command_index = 0;
        auto cfg = BridgeConfig::from_args(13, const_cast<char**>(args), command_index);
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(command_index, 10, "command index");
        ASSERT_EQ(std::string(args[command_index]), "ls", "command");
        ASSERT_EQ(cfg->workspace_root.string(), "/srv/home", "workspace_root");
        ASSERT_EQ(cfg->workers, 8u, "workers");
        ASSERT_EQ(cfg->zip_stream_threshold, 100ULL * 1024 * 1024, "zip threshold");
        ASSERT_TRUE(cfg->verbose, "verbose");
        ASSERT_EQ(cfg->state_dir.string(), "/var/lib/wsbridge", "default state_dir");
        ASSERT_EQ(cfg->config_db.string(), "/var/lib/wsbridge/storage.db", "default config_db");
        ASSERT_EQ(cfg->executor_config().max_task_lifetime.count(), 1800000, "lifetime ms");
        ASSERT_EMPTY(cfg->validate(), "valid");
        PASS();
    }
    {
        TEST(cli_missing_argument);
        const char* args[] = {"wsbridge", "--workers"};
        int command_index = 0;
        auto cfg = BridgeConfig::from_args(2, const_cast<char**>(args), command_index);
        ASSERT_TRUE(!cfg.has_value(), "should fail");
        PASS();
    }
    {
        TEST(cli_unknown_option_and_bad_number);
        const char* args[] = {"wsbridge", "--frobnicate"};
        int command_index = 0;
        ASSERT_TRUE(!BridgeConfig::from_args(2, const_cast<char**>(args), command_index),
                    "unknown option");
        const char* bad[] = {"wsbridge", "--workers", "many"};
        ASSERT_TRUE(!BridgeConfig::from_args(3, const_cast<char**>(bad), command_index),
                    "bad number");
        PASS();
    }
    {
        TEST(json_overlay_and_validation);
        auto dir = make_temp_dir("wsbridge-config");
        write_file(dir / "config.json", R"({
            "workspace_root": "/data/home",
            "state_dir": "/data/state",
            "workers": 3,
            "task_retention": 120,
            "zip_threshold_mb": 20,
            "max_zip_mb": 10,
            "metrics_file": "/data/wsbridge.prom"
        })");

        std::string path = (dir / "config.json").string();
        const char* args[] = {"wsbridge", "--config", path.c_str(), "--workers", "5"};
        int command_index = 0;
        auto cfg = BridgeConfig::from_args(5, const_cast<char**>(args), command_index);
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(command_index, 5, "no command");
        ASSERT_EQ(cfg->workspace_root.string(), "/data/home", "json workspace_root");
        ASSERT_EQ(cfg->workers, 5u, "later CLI flag wins");
        ASSERT_EQ(cfg->task_retention_secs, 120u, "retention");
        ASSERT_EQ(cfg->config_db.string(), "/data/state/storage.db", "config_db under state_dir");
        ASSERT_NOT_EMPTY(cfg->validate(), "threshold above max must be rejected");

        write_file(dir / "broken.json", "{ not json");
        BridgeConfig broken;
        ASSERT_TRUE(!broken.load_json(dir / "broken.json"), "broken JSON rejected");
        fs::remove_all(dir);
        PASS();
    }
    {
        TEST(validate_rejects_zero_workers);
        BridgeConfig cfg;
        cfg.apply_defaults();
        ASSERT_EMPTY(cfg.validate(), "defaults valid");
        cfg.workers = 0;
        ASSERT_NOT_EMPTY(cfg.validate(), "zero workers");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Config resolution
// ---------------------------------------------------------------------------

static void test_config_resolution() {
    std::cout << "\n=== Config resolution ===" << std::endl;

    auto dir = make_temp_dir("wsbridge-resolve");
    SqliteConfigStore store;
    auto err = store.open(dir / "storage.db");
    {
        TEST(open_store);
        ASSERT_EMPTY(err, "open");
        PASS();
    }
    ConfigResolver resolver(store);

    {
        TEST(absent_without_records);
        ASSERT_TRUE(!resolver.resolve("alice").has_value(), "no config");
        ASSERT_TRUE(!resolver.resolve_shared().has_value(), "no shared");
        ASSERT_THROWS(resolver.resolve("bad/tenant"), ValidationError, "malformed tenant");
        PASS();
    }
    {
        TEST(system_prefix_derivation);
        ASSERT_EQ(ConfigResolver::system_prefix_for("", "alice"), "alice/", "empty base");
        ASSERT_EQ(ConfigResolver::system_prefix_for("alice", "alice"), "alice/", "base is tenant");
        ASSERT_EQ(ConfigResolver::system_prefix_for("users/alice/", "alice"), "users/alice/",
                  "nested base is tenant");
        ASSERT_EQ(ConfigResolver::system_prefix_for("users", "alice"), "users/alice/", "shared base");
        PASS();
    }
    {
        TEST(system_default_applies);
        StorageRecord system;
        system.endpoint = "https://s3.example.com";
        system.bucket = "corp";
        system.prefix = "alice";
        system.region = "eu-west-1";
        ASSERT_TRUE(store.put_system_default(system), "put system");

        auto config = resolver.resolve("alice");
        ASSERT_TRUE(config.has_value(), "resolved");
        ASSERT_TRUE(config->source == ConfigSource::System, "system source");
        ASSERT_EQ(config->bucket, "corp", "bucket");
        ASSERT_EQ(config->prefix, "alice/", "alice keeps her own prefix");
        ASSERT_EQ(config->region, "eu-west-1", "region");

        auto bob = resolver.resolve("bob");
        ASSERT_TRUE(bob.has_value(), "bob resolved");
        ASSERT_EQ(bob->prefix, "alice/bob/", "bob under the base");

        auto shared = resolver.resolve_shared();
        ASSERT_TRUE(shared.has_value(), "shared");
        ASSERT_EQ(shared->prefix, "alice/_shared/", "shared prefix");
        ASSERT_TRUE(shared->source == ConfigSource::Shared, "shared source");
        ASSERT_THROWS(resolver.resolve("_shared"), ValidationError,
                      "no tenant can own the shared area");
        PASS();
    }
    {
        TEST(personal_overrides_system);
        StorageRecord personal;
        personal.endpoint = "https://minio.local:9000";
        personal.bucket = "mine";
        personal.prefix = "/projects//";
        ASSERT_TRUE(store.put_personal("alice", personal), "put personal");

        auto config = resolver.resolve("alice");
        ASSERT_TRUE(config.has_value(), "resolved");
        ASSERT_TRUE(config->source == ConfigSource::Personal, "personal source");
        ASSERT_EQ(config->bucket, "mine", "bucket");
        ASSERT_EQ(config->prefix, "projects/", "normalized prefix");

        auto bob = resolver.resolve("bob");
        ASSERT_TRUE(bob && bob->source == ConfigSource::System, "bob still on system");
        PASS();
    }
    {
        TEST(incomplete_personal_falls_through);
        StorageRecord partial;
        partial.endpoint = "https://minio.local:9000";
        ASSERT_TRUE(store.put_personal("carol", partial), "put partial");
        auto config = resolver.resolve("carol");
        ASSERT_TRUE(config && config->source == ConfigSource::System, "system used");
        PASS();
    }
    {
        TEST(remove_personal_reverts);
        ASSERT_TRUE(store.remove_personal("alice"), "removed");
        ASSERT_TRUE(!store.remove_personal("alice"), "second remove finds nothing");
        auto config = resolver.resolve("alice");
        ASSERT_TRUE(config && config->source == ConfigSource::System, "back on system");
        PASS();
    }
    {
        TEST(file_endpoint_selects_local_backend);
        StorageConfig config;
        config.endpoint = "file:///srv/objects";
        config.bucket = "b";
        ASSERT_EQ(config.backend_type(), "local", "local");
        ASSERT_EQ(config.backend_params()["path"], "/srv/objects/b", "path");
        config.endpoint = "";
        ASSERT_EQ(config.backend_type(), "s3", "s3");
        PASS();
    }

    fs::remove_all(dir);
}

static void test_facade_config_absent() {
    std::cout << "\n=== Facade without configuration ===" << std::endl;

    HarnessOptions opts;
    opts.system_default = false;
    auto h = make_harness("absent", opts);

    {
        TEST(resolve_config_absent);
        auto out = h->bridge->resolve_config("bob");
        ASSERT_TRUE(out.success, "absence is a valid outcome");
        ASSERT_TRUE(!out.config, "no config returned");
        ASSERT_TRUE(out.error_kind == ErrorKind::None, "no error kind");
        auto alice = h->bridge->resolve_config("alice");
        ASSERT_TRUE(alice.success && alice.config, "alice configured");
        PASS();
    }
    {
        TEST(transfer_without_config);
        write_file(h->ws("bob", "a.txt"), "hello");
        auto out = h->bridge->start_transfer(
            request(TransferKind::Upload, "bob", "workspace:a.txt", "storage:"));
        ASSERT_TRUE(!out.success, "rejected");
        ASSERT_TRUE(out.error_kind == ErrorKind::ConfigAbsent, "config-absent");
        ASSERT_TRUE(h->registry->list("bob").empty(), "no task recorded");
        PASS();
    }
    {
        TEST(shared_without_system_default);
        auto out = h->bridge->list("alice", *Location::parse("shared:"), false);
        ASSERT_TRUE(!out.success, "fails");
        ASSERT_TRUE(out.error_kind == ErrorKind::ConfigAbsent, "config-absent");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Workspace bridge
// ---------------------------------------------------------------------------

static void test_workspace() {
    std::cout << "\n=== Workspace bridge ===" << std::endl;

    auto root = make_temp_dir("wsbridge-ws");
    WorkspaceBridge ws(root);
    auto base = root / "alice" / "workspace";
    fs::create_directories(base);

    {
        TEST(key_path_round_trip);
        auto key = ws.key_for("alice", "docs/report.txt", "alice-data");
        ASSERT_EQ(key, "alice-data/docs/report.txt", "key");
        ASSERT_EQ(ws.path_for("alice", key, "alice-data/"), "docs/report.txt", "path");
        ASSERT_EQ(ws.key_for("alice", "x", ""), "x", "empty prefix");
        ASSERT_THROWS(ws.path_for("alice", "other/x", "alice-data"), ValidationError,
                      "key outside prefix");
        PASS();
    }
    {
        TEST(resolve_stays_inside);
        ASSERT_EQ(ws.resolve("alice", "a/b").string(), (base / "a/b").string(), "inside");
        ASSERT_EQ(ws.resolve("alice", "").string(), base.string(), "root");
        ASSERT_THROWS(ws.resolve("alice", "../bob"), ValidationError, "traversal");
        ASSERT_THROWS(ws.resolve("alice", "a/../../x"), ValidationError, "nested traversal");
        ASSERT_THROWS(ws.resolve("../etc", "x"), ValidationError, "tenant traversal");
        PASS();
    }
    {
        TEST(symlink_escape_rejected);
        write_file(root / "outside" / "secret.txt", "secret");
        fs::create_directory_symlink(root / "outside", base / "link");
        ASSERT_THROWS(ws.resolve("alice", "link/secret.txt"), ValidationError, "escape via symlink");

        fs::create_directories(base / "real");
        fs::create_directory_symlink(base / "real", base / "inner");
        ASSERT_EQ(ws.resolve("alice", "inner/x").string(), (base / "inner/x").string(),
                  "symlink inside is fine");
        PASS();
    }
    {
        TEST(write_read_list);
        std::string data = "line one\nline two\n";
        ws.write_bytes("alice", "notes/todo.txt",
                       std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
        ASSERT_EQ(read_file(base / "notes/todo.txt"), data, "written");
        ASSERT_TRUE(!fs::exists(base / "notes/todo.txt.part"), "no part file left");
        ASSERT_EQ(ws.read_text("alice", "notes/todo.txt", 1024), data, "read back");
        ASSERT_THROWS(ws.read_text("alice", "notes/todo.txt", 4), ValidationError, "too large");
        ASSERT_THROWS(ws.read_text("alice", "notes/none.txt", 1024), BridgeError, "missing");

        write_file(base / "b.txt", "b");
        write_file(base / "a.txt", "aa");
        auto entries = ws.list_local("alice", "");
        ASSERT_TRUE(entries.size() >= 4, "entries");
        ASSERT_TRUE(entries[0].is_directory, "directories first");
        bool found_a = false;
        for (const auto& e : entries) {
            if (e.name == "a.txt") {
                found_a = true;
                ASSERT_EQ(e.size, 2u, "size");
                ASSERT_EQ(e.path, "a.txt", "path");
            }
        }
        ASSERT_TRUE(found_a, "a.txt listed");
        PASS();
    }
    {
        TEST(walk_and_remove);
        fs::create_directories(base / "tree/empty");
        write_file(base / "tree/x/y.txt", "y");
        write_file(base / "tree/z.txt", "zz");
        auto entries = ws.walk("alice", "tree");
        ASSERT_EQ(entries.size(), 3u, "two files and one empty dir");
        ASSERT_EQ(entries[0].path, "empty", "sorted by path");
        ASSERT_TRUE(entries[0].is_directory, "empty dir");
        ASSERT_EQ(entries[1].path, "x/y.txt", "nested file");

        ASSERT_TRUE(ws.make_directory("alice", "made/here"), "created");
        ASSERT_TRUE(fs::is_directory(base / "made/here"), "exists");
        ASSERT_THROWS(ws.remove("alice", ""), ValidationError, "refuse root");
        ASSERT_TRUE(ws.remove("alice", "tree") >= 5, "removed tree");
        ASSERT_TRUE(!fs::exists(base / "tree"), "gone");
        ASSERT_THROWS(ws.remove("alice", "tree"), BridgeError, "missing");
        PASS();
    }

    fs::remove_all(root);
}

// ---------------------------------------------------------------------------
// 5. Storage client
// ---------------------------------------------------------------------------

static void test_storage_client() {
    std::cout << "\n=== Storage client (local backend) ===" << std::endl;

    auto root = make_temp_dir("wsbridge-client");
    StorageClient client(StorageBackendFactory::create_local(root / "bucket"), "users/alice");
    fs::create_directories(root / "bucket");

    auto put = [&](const std::string& rel, const std::string& content) {
        return client.write(rel, std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(content.data()), content.size()));
    };

    {
        TEST(prefix_scoping);
        ASSERT_EQ(client.prefix(), "users/alice/", "prefix");
        ASSERT_EQ(client.full_key("a/b.txt"), "users/alice/a/b.txt", "full key");
        ASSERT_EQ(client.folder_key(""), "users/alice/", "root folder key");
        ASSERT_EQ(client.folder_key("a"), "users/alice/a/", "folder key");
        ASSERT_EQ(client.relative_key("users/alice/a/b").value_or("?"), "a/b", "relative");
        ASSERT_TRUE(!client.relative_key("users/bob/a").has_value(), "outside prefix");
        ASSERT_THROWS(client.full_key("../bob/x"), ValidationError, "traversal");
        PASS();
    }
    {
        TEST(write_list_read);
        ASSERT_TRUE(put("docs/b.txt", "bbb").success, "put b");
        ASSERT_TRUE(put("docs/a.txt", "a").success, "put a");
        ASSERT_TRUE(put("docs/sub/c.txt", "cc").success, "put c");
        ASSERT_TRUE(client.make_folder("docs/empty").success, "folder");
        ASSERT_TRUE(fs::exists(root / "bucket/users/alice/docs/a.txt"), "on disk under prefix");

        auto listing = client.list("docs", false);
        ASSERT_TRUE(listing.success, "list ok");
        ASSERT_EQ(listing.entries.size(), 4u, "four children");
        ASSERT_TRUE(listing.entries[0].is_directory && listing.entries[1].is_directory,
                    "folders first");
        ASSERT_EQ(listing.entries[0].name, "empty", "folder order");
        ASSERT_EQ(listing.entries[2].name, "a.txt", "file order");
        ASSERT_EQ(listing.entries[2].path, "docs/a.txt", "path relative to prefix");

        auto recursive = client.list("docs", true);
        ASSERT_TRUE(recursive.success, "recursive ok");
        ASSERT_EQ(recursive.entries.size(), 4u, "three files and one marker");
        ASSERT_EQ(recursive.entries[0].path, "docs/a.txt", "sorted by path");

        auto read = client.read("docs/b.txt", 100);
        ASSERT_TRUE(read.success, "read");
        ASSERT_EQ(std::string(read.data.begin(), read.data.end()), "bbb", "content");
        auto small = client.read("docs/b.txt", 2);
        ASSERT_TRUE(!small.success && small.too_large, "too large");
        auto missing = client.read("docs/none", 100);
        ASSERT_TRUE(!missing.success && missing.not_found, "not found");

        ASSERT_TRUE(client.is_folder("docs/sub"), "sub is folder");
        ASSERT_TRUE(!client.is_folder("docs/a.txt"), "file is not folder");
        PASS();
    }
    {
        TEST(copy_across_stores_falls_back_to_streaming);
        StorageClient other(StorageBackendFactory::create_local(root / "other"), "");
        fs::create_directories(root / "other");
        fs::create_directories(root / "staging");
        uint64_t last_progress = 0;
        auto copied = client.copy_to("docs/sub/c.txt", other, "copy/c.txt", root / "staging",
                                     [&](uint64_t bytes) { last_progress = bytes; return true; });
        ASSERT_TRUE(copied.success, "copied: " + copied.error_message);
        ASSERT_EQ(read_file(root / "other/copy/c.txt"), "cc", "content");
        ASSERT_EQ(last_progress, 2u, "progress reported");
        ASSERT_TRUE(fs::is_empty(root / "staging"), "staging file removed");
        PASS();
    }
    {
        TEST(remove_recursive);
        ASSERT_TRUE(!client.remove_recursive("").success, "refuses root");
        auto removed = client.remove_recursive("docs");
        ASSERT_TRUE(removed.success, "removed: " + removed.error_message);
        ASSERT_TRUE(removed.removed >= 3, "counted objects");
        ASSERT_TRUE(!client.is_folder("docs"), "folder gone");
        PASS();
    }

    fs::remove_all(root);
}

// ---------------------------------------------------------------------------
// 6. Task registry
// ---------------------------------------------------------------------------

static TransferTask sample_task(const std::string& tenant) {
    TransferTask task;
    task.kind = TransferKind::Upload;
    task.tenant = tenant;
    task.source = {LocationSide::Workspace, "a"};
    task.destination = {LocationSide::Storage, ""};
    return task;
}

static void finish(TaskRegistry& registry, const std::string& token, TaskStatus status) {
    TaskUpdate update;
    update.status = status;
    registry.update(token, update);
}

static void test_task_registry() {
    std::cout << "\n=== Task registry ===" << std::endl;

    {
        TEST(tokens_are_unique_hex);
        auto a = generate_task_token();
        auto b = generate_task_token();
        ASSERT_EQ(a.size(), 32u, "length");
        ASSERT_TRUE(a != b, "unique");
        ASSERT_TRUE(a.find_first_not_of("0123456789abcdef") == std::string::npos, "hex");
        PASS();
    }
    {
        TEST(create_and_query);
        TaskRegistry registry;
        auto token = registry.create(sample_task("alice"));
        auto task = registry.get(token);
        ASSERT_TRUE(task.has_value(), "queryable immediately");
        ASSERT_TRUE(task->status == TaskStatus::Queued, "queued");
        ASSERT_TRUE(!task->started_at && !task->completed_at, "no timestamps");
        ASSERT_TRUE(!registry.get("nope").has_value(), "unknown token");
        PASS();
    }
    {
        TEST(update_rules);
        TaskRegistry registry;
        auto token = registry.create(sample_task("alice"));

        TaskUpdate running;
        running.status = TaskStatus::Running;
        running.bytes_total = 100;
        ASSERT_TRUE(registry.update(token, running) == UpdateOutcome::Applied, "running");

        TaskUpdate progress;
        progress.bytes_done = 60;
        registry.update(token, progress);
        progress.bytes_done = 40;
        registry.update(token, progress);
        ASSERT_EQ(registry.get(token)->progress.bytes_done, 60u, "counters never go backwards");

        TaskUpdate back;
        back.status = TaskStatus::Queued;
        ASSERT_TRUE(registry.update(token, back) == UpdateOutcome::Rejected, "no backwards status");

        TaskUpdate stray_error;
        stray_error.error = "boom";
        ASSERT_TRUE(registry.update(token, stray_error) == UpdateOutcome::Rejected,
                    "error needs Failed");

        TaskUpdate failed;
        failed.status = TaskStatus::Failed;
        failed.error_kind = ErrorKind::Io;
        failed.error = "disk full";
        ASSERT_TRUE(registry.update(token, failed) == UpdateOutcome::Applied, "failed");
        auto task = registry.get(token);
        ASSERT_TRUE(task->completed_at.has_value(), "completed_at set");
        ASSERT_EQ(task->error, "disk full", "error kept");

        TaskUpdate late;
        late.bytes_done = 100;
        ASSERT_TRUE(registry.update(token, late) == UpdateOutcome::AlreadyTerminal, "terminal frozen");
        ASSERT_TRUE(registry.update("nope", late) == UpdateOutcome::NotFound, "unknown");
        PASS();
    }
    {
        TEST(cancel_terminal_is_rejected_and_unchanged);
        TaskRegistry registry;
        auto token = registry.create(sample_task("alice"));
        finish(registry, token, TaskStatus::Succeeded);
        auto before = registry.get(token);
        ASSERT_TRUE(registry.cancel(token) == CancelOutcome::AlreadyTerminal, "already terminal");
        auto after = registry.get(token);
        ASSERT_TRUE(after->status == TaskStatus::Succeeded, "status unchanged");
        ASSERT_TRUE(after->completed_at == before->completed_at, "completed_at unchanged");
        ASSERT_TRUE(registry.cancel("nope") == CancelOutcome::NotFound, "unknown");
        ASSERT_TRUE(registry.cancel_requested("nope"), "unknown reads as cancelled");
        PASS();
    }
    {
        TEST(cancel_all_and_counts);
        TaskRegistry registry;
        auto a = registry.create(sample_task("alice"));
        auto b = registry.create(sample_task("bob"));
        auto c = registry.create(sample_task("bob"));
        finish(registry, c, TaskStatus::Succeeded);
        auto cancelled = registry.cancel_all();
        ASSERT_EQ(cancelled.size(), 2u, "two active");
        ASSERT_TRUE(registry.cancel_requested(a) && registry.cancel_requested(b), "flags");
        auto counts = registry.counts();
        ASSERT_EQ(counts[TaskStatus::Cancelled], 2u, "cancelled count");
        ASSERT_EQ(counts[TaskStatus::Succeeded], 1u, "succeeded count");
        ASSERT_EQ(counts[TaskStatus::Queued], 0u, "queued present and zero");
        ASSERT_EQ(registry.list("bob").size(), 2u, "bob's tasks");
        PASS();
    }
    {
        TEST(retention_sweep_removes_aged_terminal_only);
        TaskRegistry registry(std::chrono::seconds(60), 100);
        std::vector<std::string> evicted;
        registry.set_eviction_callback([&](const TransferTask& t) { evicted.push_back(t.token); });

        auto done = registry.create(sample_task("alice"));
        auto failed = registry.create(sample_task("alice"));
        auto running = registry.create(sample_task("alice"));
        auto queued = registry.create(sample_task("alice"));
        finish(registry, done, TaskStatus::Succeeded);
        TaskUpdate f;
        f.status = TaskStatus::Failed;
        f.error_kind = ErrorKind::Io;
        f.error = "x";
        registry.update(failed, f);
        finish(registry, running, TaskStatus::Running);

        auto now = std::chrono::system_clock::now();
        ASSERT_EQ(registry.sweep(now + std::chrono::seconds(30)), 0u, "nothing aged yet");
        ASSERT_EQ(registry.sweep(now + std::chrono::seconds(120)), 2u, "two aged terminal tasks");
        ASSERT_EQ(evicted.size(), 2u, "callback per eviction");
        ASSERT_TRUE(!registry.get(done) && !registry.get(failed), "terminal gone");
        ASSERT_TRUE(registry.get(running) && registry.get(queued), "active kept");
        ASSERT_EQ(registry.sweep(now + std::chrono::hours(48)), 0u, "active never evicted");
        PASS();
    }
    {
        TEST(per_tenant_cap_evicts_oldest_terminal);
        TaskRegistry registry(std::chrono::seconds(3600), 2);
        auto first = registry.create(sample_task("alice"));
        finish(registry, first, TaskStatus::Succeeded);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto second = registry.create(sample_task("alice"));
        finish(registry, second, TaskStatus::Succeeded);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto bob = registry.create(sample_task("bob"));
        auto third = registry.create(sample_task("alice"));

        ASSERT_TRUE(!registry.get(first).has_value(), "oldest evicted");
        ASSERT_TRUE(registry.get(second).has_value(), "newer kept");
        ASSERT_TRUE(registry.get(third).has_value(), "new task kept");
        ASSERT_TRUE(registry.get(bob).has_value(), "other tenant unaffected");
        ASSERT_EQ(registry.list("alice").size(), 2u, "alice at cap");

        // Active tasks may exceed the cap; they are never evicted
        auto fourth = registry.create(sample_task("alice"));
        auto fifth = registry.create(sample_task("alice"));
        ASSERT_TRUE(registry.get(fourth) && registry.get(fifth), "active kept");
        ASSERT_TRUE(!registry.get(second).has_value(), "last terminal evicted");
        ASSERT_EQ(registry.list("alice").size(), 3u, "three active");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Transfers
// ---------------------------------------------------------------------------

static void test_transfers() {
    std::cout << "\n=== Transfers ===" << std::endl;

    {
        TEST(upload_scenario);
        auto h = make_harness("upload");
        auto big = make_content(3 * 1024 * 1024 + 17, 1);
        write_file(h->ws("alice", "proj/data.bin"), big);
        write_file(h->ws("alice", "proj/readme.md"), "# readme\n");
        fs::create_directories(h->ws("alice", "proj/empty"));

        auto out = h->bridge->start_transfer(
            request(TransferKind::Upload, "alice", "workspace:proj", "storage:backup"));
        ASSERT_TRUE(out.success, "started: " + out.error_message);
        ASSERT_EQ(out.token.size(), 32u, "token");

        auto first = h->bridge->get_transfer_status(out.token);
        ASSERT_TRUE(first.success, "queryable immediately");

        auto task = wait_terminal(*h->bridge, out.token);
        ASSERT_TRUE(task.has_value(), "task present");
        ASSERT_EQ(task_status_name(task->status), std::string("succeeded"), "succeeded: " + task->error);
        uint64_t expected = big.size() + 9;
        ASSERT_EQ(task->progress.bytes_total, expected, "bytes_total");
        ASSERT_EQ(task->progress.bytes_done, expected, "final progress equals size");
        ASSERT_EQ(task->progress.items_done, task->progress.items_total, "all items");
        ASSERT_EQ(task->progress.items_total, 4u, "root folder, empty folder, two files");
        ASSERT_TRUE(task->started_at && task->completed_at, "timestamps");

        ASSERT_EQ(read_file(h->object("alice-data/backup/proj/data.bin")), big, "object content");
        ASSERT_TRUE(fs::is_directory(h->object("alice-data/backup/proj/empty")), "empty folder marker");

        auto list = h->bridge->list_transfers("alice");
        ASSERT_TRUE(list.success && list.tasks.size() == 1, "listed");
        PASS();
    }
    {
        TEST(download_and_copy_and_move);
        auto h = make_harness("download");
        write_file(h->object("alice-data/reports/q1.csv"), "a,b\n1,2\n");
        write_file(h->object("alice-data/reports/q2.csv"), "a,b\n3,4\n");

        auto down = h->bridge->start_transfer(request(TransferKind::Download, "alice",
                                                      "storage:reports", "workspace:"));
        ASSERT_TRUE(down.success, "download started: " + down.error_message);
        auto task = wait_terminal(*h->bridge, down.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Succeeded, "download succeeded");
        ASSERT_EQ(read_file(h->ws("alice", "reports/q1.csv")), "a,b\n1,2\n", "downloaded");
        ASSERT_TRUE(!fs::exists(h->ws("alice", "reports/q1.csv.part")), "no part file");

        auto copy = h->bridge->start_transfer(request(TransferKind::Copy, "alice", "storage:reports",
                                                      "storage:archive", {"q1.csv"}));
        ASSERT_TRUE(copy.success, "copy started: " + copy.error_message);
        task = wait_terminal(*h->bridge, copy.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Succeeded, "copy succeeded");
        ASSERT_EQ(read_file(h->object("alice-data/archive/q1.csv")), "a,b\n1,2\n", "copied");
        ASSERT_TRUE(fs::exists(h->object("alice-data/reports/q1.csv")), "copy keeps source");

        auto move = h->bridge->start_transfer(request(TransferKind::Move, "alice", "storage:reports",
                                                      "storage:moved"));
        ASSERT_TRUE(move.success, "move started: " + move.error_message);
        task = wait_terminal(*h->bridge, move.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Succeeded, "move succeeded: " + task->error);
        ASSERT_EQ(read_file(h->object("alice-data/moved/reports/q2.csv")), "a,b\n3,4\n", "moved");
        ASSERT_TRUE(!fs::exists(h->object("alice-data/reports/q2.csv")), "source deleted");
        PASS();
    }
    {
        TEST(shared_space);
        auto h = make_harness("shared");
        write_file(h->ws("bob", "notes.txt"), "shared notes");
        auto up = h->bridge->start_transfer(request(TransferKind::Upload, "bob", "workspace:notes.txt",
                                                    "shared:team"));
        ASSERT_TRUE(up.success, "upload to shared: " + up.error_message);
        auto task = wait_terminal(*h->bridge, up.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Succeeded, "succeeded");
        ASSERT_EQ(read_file(h->object("_shared/team/notes.txt")), "shared notes", "under _shared");

        auto text = h->bridge->read_text("alice", *Location::parse("shared:team/notes.txt"));
        ASSERT_TRUE(text.success, "alice reads shared: " + text.error_message);
        ASSERT_EQ(text.text, "shared notes", "content");

        auto move = h->bridge->start_transfer(request(TransferKind::Move, "alice", "shared:team",
                                                      "storage:"));
        ASSERT_TRUE(!move.success && move.error_kind == ErrorKind::Validation, "no move out of shared");
        auto rm = h->bridge->remove("alice", *Location::parse("shared:team/notes.txt"));
        ASSERT_TRUE(!rm.success && rm.error_kind == ErrorKind::Validation, "no delete in shared");
        PASS();
    }
    {
        TEST(submit_validation);
        auto h = make_harness("validate");
        write_file(h->ws("alice", "a.txt"), "a");

        auto out = h->bridge->start_transfer(request(TransferKind::Upload, "alice", "workspace:a.txt",
                                                     "workspace:b"));
        ASSERT_TRUE(!out.success && out.error_kind == ErrorKind::Validation, "wrong sides");
        out = h->bridge->start_transfer(request(TransferKind::Upload, "alice", "workspace:../bob",
                                                "storage:"));
        ASSERT_TRUE(!out.success && out.error_kind == ErrorKind::Validation, "traversal");
        out = h->bridge->start_transfer(request(TransferKind::Copy, "alice", "storage:dir",
                                                "storage:dir/inner"));
        ASSERT_TRUE(!out.success && out.error_kind == ErrorKind::Validation, "into itself");
        out = h->bridge->start_transfer(request(TransferKind::Upload, "bad/tenant", "workspace:a",
                                                "storage:"));
        ASSERT_TRUE(!out.success && out.error_kind == ErrorKind::Validation, "bad tenant");

        out = h->bridge->start_transfer(request(TransferKind::Upload, "alice", "workspace:missing",
                                                "storage:"));
        ASSERT_TRUE(out.success, "missing source is found by the worker");
        auto task = wait_terminal(*h->bridge, out.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Failed, "failed");
        ASSERT_TRUE(task->error_kind == ErrorKind::NotFound, "not-found");

        auto status = h->bridge->get_transfer_status("0123");
        ASSERT_TRUE(!status.success && status.error_kind == ErrorKind::NotFound, "unknown token");
        PASS();
    }
    {
        TEST(failure_at_item_k_keeps_k_minus_one);
        auto gate = std::make_shared<Gate>(true);
        HarnessOptions opts;
        opts.factory = gated_factory(gate, "c.txt");
        auto h = make_harness("partial", opts);
        write_file(h->ws("alice", "proj/a.txt"), "aaaa");
        write_file(h->ws("alice", "proj/b.txt"), "bbbb");
        write_file(h->ws("alice", "proj/c.txt"), "cccc");
        write_file(h->ws("alice", "proj/d.txt"), "dddd");

        auto out = h->bridge->start_transfer(request(TransferKind::Upload, "alice", "workspace:proj",
                                                     "storage:", {"a.txt", "b.txt", "c.txt", "d.txt"}));
        ASSERT_TRUE(out.success, "started");
        auto task = wait_terminal(*h->bridge, out.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Failed, "failed");
        ASSERT_TRUE(task->error_kind == ErrorKind::PartialFailure, "partial-failure");
        ASSERT_EQ(task->progress.items_done, 2u, "K-1 items completed");
        ASSERT_EQ(task->failed_item, "proj/c.txt", "failed item");
        ASSERT_EQ(task->error, "failed after 2 of 4 items: proj/c.txt: injected failure", "message");
        ASSERT_TRUE(fs::exists(h->object("alice-data/a.txt")), "a uploaded");
        ASSERT_TRUE(fs::exists(h->object("alice-data/b.txt")), "b uploaded");
        ASSERT_TRUE(!fs::exists(h->object("alice-data/d.txt")), "stopped at first failure");
        PASS();
    }
    {
        TEST(recursive_copy_failure_at_item_k);
        auto gate = std::make_shared<Gate>(true);
        HarnessOptions opts;
        opts.factory = gated_factory(gate, "c.txt");
        auto h = make_harness("partial-copy", opts);
        write_file(h->object("alice-data/reports/a.txt"), "aaaa");
        write_file(h->object("alice-data/reports/b.txt"), "bbbb");
        write_file(h->object("alice-data/reports/c.txt"), "cccc");
        write_file(h->object("alice-data/reports/d.txt"), "dddd");

        auto out = h->bridge->start_transfer(request(TransferKind::Copy, "alice", "storage:reports",
                                                     "storage:archive"));
        ASSERT_TRUE(out.success, "started: " + out.error_message);
        auto task = wait_terminal(*h->bridge, out.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Failed, "failed");
        ASSERT_TRUE(task->error_kind == ErrorKind::PartialFailure, "partial-failure");
        // folder marker, then a, b, c, d
        ASSERT_EQ(task->progress.items_total, 5u, "items planned");
        ASSERT_EQ(task->progress.items_done, 3u, "K-1 items completed");
        ASSERT_EQ(task->failed_item, "reports/c.txt", "failed item");
        ASSERT_EQ(task->error, "failed after 3 of 5 items: reports/c.txt: injected failure", "message");
        ASSERT_TRUE(fs::exists(h->object("alice-data/archive/reports/a.txt")), "a copied");
        ASSERT_TRUE(fs::exists(h->object("alice-data/archive/reports/b.txt")), "b copied");
        ASSERT_TRUE(!fs::exists(h->object("alice-data/archive/reports/d.txt")), "stopped at c");
        ASSERT_TRUE(fs::exists(h->object("alice-data/reports/d.txt")), "sources untouched");
        PASS();
    }
    {
        TEST(move_keeps_source_when_delete_fails);
        auto gate = std::make_shared<Gate>(true);
        HarnessOptions opts;
        opts.factory = gated_factory(gate, "", "reports/q1.csv");
        auto h = make_harness("move-dup", opts);
        write_file(h->object("alice-data/reports/q1.csv"), "a,b\n1,2\n");

        auto out = h->bridge->start_transfer(request(TransferKind::Move, "alice",
                                                     "storage:reports/q1.csv", "storage:moved"));
        ASSERT_TRUE(out.success, "started: " + out.error_message);
        auto task = wait_terminal(*h->bridge, out.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Failed, "failed");
        ASSERT_TRUE(task->error.find("copied, but the source could not be deleted") != std::string::npos,
                    "reason: " + task->error);
        ASSERT_EQ(task->progress.items_done, 0u, "item not counted as moved");
        ASSERT_EQ(read_file(h->object("alice-data/moved/q1.csv")), "a,b\n1,2\n", "copy landed");
        ASSERT_TRUE(fs::exists(h->object("alice-data/reports/q1.csv")), "source duplicated, not lost");
        PASS();
    }
    {
        TEST(cancel_queued_and_running);
        auto gate = std::make_shared<Gate>(false);
        HarnessOptions opts;
        opts.workers = 1;
        opts.factory = gated_factory(gate);
        auto h = make_harness("cancel", opts);
        write_file(h->ws("alice", "one/a.txt"), "a");
        write_file(h->ws("alice", "one/b.txt"), "b");
        write_file(h->ws("alice", "two.txt"), "two");

        auto running = h->bridge->start_transfer(request(TransferKind::Upload, "alice",
                                                         "workspace:one", "storage:", {"a.txt", "b.txt"}));
        ASSERT_TRUE(running.success, "first started");
        ASSERT_TRUE(wait_for([&] { return gate->waiting() > 0; }), "first is inside a write");
        auto queued = h->bridge->start_transfer(request(TransferKind::Upload, "alice",
                                                        "workspace:two.txt", "storage:"));
        ASSERT_TRUE(queued.success, "second started");
        ASSERT_TRUE(h->bridge->get_transfer_status(queued.token).task.status == TaskStatus::Queued,
                    "second waits for the only worker");
        ASSERT_TRUE(h->bridge->get_transfer_status(running.token).task.status == TaskStatus::Running,
                    "first running");

        ASSERT_TRUE(h->bridge->cancel_transfer(queued.token).success, "cancel queued");
        ASSERT_TRUE(h->bridge->cancel_transfer(running.token).success, "cancel running");
        ASSERT_TRUE(h->bridge->get_transfer_status(running.token).task.status == TaskStatus::Cancelled,
                    "cancelled immediately");
        gate->open();

        ASSERT_TRUE(wait_for([&] {
            auto stats = h->executor->get_stats();
            return stats.by_kind[TransferKind::Upload].cancelled == 2;
        }), "both recorded as cancelled");
        ASSERT_TRUE(h->bridge->get_transfer_status(running.token).task.status == TaskStatus::Cancelled,
                    "stays cancelled");
        ASSERT_TRUE(!fs::exists(h->object("alice-data/b.txt")), "no further items after cancel");
        ASSERT_TRUE(!fs::exists(h->object("alice-data/two.txt")), "queued task never ran");

        auto again = h->bridge->cancel_transfer(running.token);
        ASSERT_TRUE(!again.success && again.error_kind == ErrorKind::AlreadyTerminal, "already terminal");
        PASS();
    }
    {
        TEST(timeout);
        auto gate = std::make_shared<Gate>(false);
        HarnessOptions opts;
        opts.max_task_lifetime = std::chrono::milliseconds(300);
        opts.factory = gated_factory(gate);
        auto h = make_harness("timeout", opts);
        write_file(h->ws("alice", "slow/a.txt"), "a");
        write_file(h->ws("alice", "slow/b.txt"), "b");

        auto out = h->bridge->start_transfer(request(TransferKind::Upload, "alice", "workspace:slow",
                                                     "storage:"));
        ASSERT_TRUE(out.success, "started");
        ASSERT_TRUE(wait_for([&] { return gate->waiting() > 0; }), "blocked in a write");
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        gate->open();

        auto task = wait_terminal(*h->bridge, out.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Failed, "failed");
        ASSERT_TRUE(task->error_kind == ErrorKind::Timeout, "timeout kind");
        PASS();
    }
    {
        TEST(stop_cancels_outstanding);
        auto gate = std::make_shared<Gate>(false);
        HarnessOptions opts;
        opts.workers = 1;
        opts.factory = gated_factory(gate);
        auto h = make_harness("stop", opts);
        write_file(h->ws("alice", "x.txt"), "x");
        auto a = h->bridge->start_transfer(request(TransferKind::Upload, "alice", "workspace:x.txt",
                                                   "storage:"));
        auto b = h->bridge->start_transfer(request(TransferKind::Upload, "alice", "workspace:x.txt",
                                                   "storage:copy"));
        ASSERT_TRUE(a.success && b.success, "started");
        ASSERT_TRUE(wait_for([&] { return gate->waiting() > 0; }), "first blocked");

        std::thread opener([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            gate->open();
        });
        h->executor->stop();
        opener.join();
        ASSERT_TRUE(h->registry->get(a.token)->status == TaskStatus::Cancelled, "running cancelled");
        ASSERT_TRUE(h->registry->get(b.token)->status == TaskStatus::Cancelled, "queued cancelled");

        auto late = h->bridge->start_transfer(request(TransferKind::Upload, "alice", "workspace:x.txt",
                                                      "storage:late"));
        ASSERT_TRUE(!late.success, "rejected after stop");
        ASSERT_TRUE(late.token.empty(), "no token");
        ASSERT_EQ(h->registry->list("alice").size(), size_t(2), "no task recorded");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Zip export
// ---------------------------------------------------------------------------

static void test_zip() {
    std::cout << "\n=== Zip export ===" << std::endl;

    {
        TEST(writer_produces_valid_archive);
        std::string archive;
        ZipWriter zip([&](const char* data, size_t size) {
            archive.append(data, size);
            return true;
        });
        auto now = std::chrono::system_clock::now();
        std::string repetitive(2 * 1024 * 1024, 'z');
        auto random = make_content(300 * 1024, 7);
        ASSERT_EMPTY(zip.add_directory("top", now), "dir");
        ASSERT_EMPTY(zip.begin_file("top/zeros.txt", now), "begin");
        for (size_t off = 0; off < repetitive.size(); off += 100000) {
            auto n = std::min<size_t>(100000, repetitive.size() - off);
            ASSERT_EMPTY(zip.write(repetitive.data() + off, n), "write");
        }
        ASSERT_EMPTY(zip.end_file(), "end");
        ASSERT_EMPTY(zip.begin_file("top/random.bin", now), "begin 2");
        ASSERT_EMPTY(zip.write(random.data(), random.size()), "write 2");
        ASSERT_EMPTY(zip.end_file(), "end 2");
        ASSERT_EMPTY(zip.begin_file("top/empty.txt", now), "begin 3");
        ASSERT_EMPTY(zip.end_file(), "end 3");
        ASSERT_EMPTY(zip.finish(), "finish");
        ASSERT_EQ(zip.entry_count(), 4u, "entries");
        ASSERT_EQ(zip.bytes_written(), archive.size(), "bytes written");
        ASSERT_TRUE(archive.size() < random.size() + repetitive.size() / 10, "compressed");

        std::map<std::string, std::string> entries;
        ASSERT_EMPTY(unzip_all(archive, entries), "readable");
        ASSERT_EQ(entries.size(), 4u, "all entries");
        ASSERT_TRUE(entries.count("top/"), "directory entry");
        ASSERT_TRUE(entries["top/zeros.txt"] == repetitive, "zeros content");
        ASSERT_TRUE(entries["top/random.bin"] == random, "random content");
        ASSERT_TRUE(entries["top/empty.txt"].empty(), "empty file");
        PASS();
    }
    {
        TEST(writer_errors_are_sticky);
        int calls = 0;
        ZipWriter zip([&](const char*, size_t) { return ++calls < 2; });
        auto now = std::chrono::system_clock::now();
        zip.begin_file("a", now);
        zip.write("abc", 3);
        auto end = zip.end_file();
        ASSERT_NOT_EMPTY(end.empty() ? zip.finish() : end, "sink refusal surfaces");
        ASSERT_NOT_EMPTY(zip.error(), "error kept");
        ASSERT_EQ(zip.finish(), zip.error(), "later calls repeat the error");
        PASS();
    }

    auto seed_folder = [](Harness& h) {
        write_file(h.object("alice-data/photos/a.jpg"), make_content(200 * 1024, 3));
        write_file(h.object("alice-data/photos/b/c.txt"), std::string(50000, 'c'));
        fs::create_directories(h.object("alice-data/photos/empty"));
    };

    {
        TEST(streamed_export);
        auto h = make_harness("zip-stream");
        seed_folder(*h);

        std::string archive;
        auto out = h->bridge->stream_folder_as_zip("alice", *Location::parse("storage:photos"),
            [&](const char* data, size_t size) {
                archive.append(data, size);
                return true;
            });
        ASSERT_TRUE(out.success, "zip: " + out.error_message);
        ASSERT_TRUE(out.streamed, "streamed below threshold");
        ASSERT_TRUE(out.token.empty(), "no task");
        ASSERT_EQ(out.total_bytes, 200u * 1024 + 50000, "total bytes");

        std::map<std::string, std::string> entries;
        ASSERT_EMPTY(unzip_all(archive, entries), "readable and CRC-valid");
        ASSERT_TRUE(entries.count("photos/"), "root folder");
        ASSERT_TRUE(entries.count("photos/empty/"), "empty folder");
        ASSERT_TRUE(entries["photos/a.jpg"] == make_content(200 * 1024, 3), "a.jpg");
        ASSERT_EQ(entries["photos/b/c.txt"].size(), 50000u, "c.txt");
        PASS();
    }
    {
        TEST(background_export_over_threshold);
        HarnessOptions opts;
        opts.zip_stream_threshold = 1024;
        auto h = make_harness("zip-bg", opts);
        seed_folder(*h);

        bool sink_called = false;
        auto out = h->bridge->stream_folder_as_zip("alice", *Location::parse("storage:photos"),
            [&](const char*, size_t) {
                sink_called = true;
                return true;
            });
        ASSERT_TRUE(out.success, "zip: " + out.error_message);
        ASSERT_TRUE(!out.streamed, "not streamed");
        ASSERT_TRUE(!sink_called, "sink untouched");
        ASSERT_EQ(out.token.size(), 32u, "token returned");

        auto task = wait_terminal(*h->bridge, out.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Succeeded, "export succeeded");
        ASSERT_TRUE(task->kind == TransferKind::ZipExport, "zip-export kind");
        ASSERT_NOT_EMPTY(task->artifact, "artifact recorded");
        ASSERT_EQ(task->progress.bytes_done, out.total_bytes, "progress complete");

        std::string archive;
        auto fetched = h->bridge->fetch_export(out.token, [&](const char* data, size_t size) {
            archive.append(data, size);
            return true;
        });
        ASSERT_TRUE(fetched.success, "fetched: " + fetched.error_message);
        ASSERT_EQ(fetched.bytes, archive.size(), "bytes");

        std::map<std::string, std::string> entries;
        ASSERT_EMPTY(unzip_all(archive, entries), "readable and CRC-valid");
        ASSERT_TRUE(entries["photos/a.jpg"] == make_content(200 * 1024, 3), "a.jpg");

        // Eviction takes the archive with it
        auto artifact = task->artifact;
        ASSERT_TRUE(fs::exists(artifact), "archive on disk");
        h->registry->sweep(std::chrono::system_clock::now() + std::chrono::hours(2));
        ASSERT_TRUE(!fs::exists(artifact), "archive removed with the task");
        PASS();
    }
    {
        TEST(export_rejects_missing_and_workspace);
        auto h = make_harness("zip-missing");
        auto sink = [](const char*, size_t) { return true; };
        auto out = h->bridge->stream_folder_as_zip("alice", *Location::parse("storage:nothing"), sink);
        ASSERT_TRUE(!out.success && out.error_kind == ErrorKind::NotFound, "missing folder");
        out = h->bridge->stream_folder_as_zip("alice", *Location::parse("workspace:"), sink);
        ASSERT_TRUE(!out.success && out.error_kind == ErrorKind::Validation, "workspace rejected");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Facade browsing and mutations
// ---------------------------------------------------------------------------

static void test_facade_operations() {
    std::cout << "\n=== Facade operations ===" << std::endl;

    auto h = make_harness("facade");
    auto bytes = [](const std::string& s) {
        return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    };

    {
        TEST(put_list_read_stream);
        ASSERT_TRUE(h->bridge->put_object("alice", *Location::parse("storage:docs/a.txt"),
                                          bytes("alpha")).success, "put");
        ASSERT_TRUE(h->bridge->make_directory("alice", *Location::parse("storage:docs/sub")).success,
                    "mkdir");

        auto list = h->bridge->list("alice", *Location::parse("storage:docs"), false);
        ASSERT_TRUE(list.success, "list: " + list.error_message);
        ASSERT_EQ(list.entries.size(), 2u, "two entries");
        ASSERT_EQ(list.entries[0].name, "sub", "folder first");
        ASSERT_EQ(list.entries[1].path, "docs/a.txt", "file path");

        auto text = h->bridge->read_text("alice", *Location::parse("storage:docs/a.txt"));
        ASSERT_TRUE(text.success && text.text == "alpha", "read_text");

        std::string streamed;
        auto out = h->bridge->stream_object("alice", *Location::parse("storage:docs/a.txt"),
            [&](const char* d, size_t n) { streamed.append(d, n); return true; });
        ASSERT_TRUE(out.success && streamed == "alpha", "stream");
        ASSERT_EQ(out.bytes, 5u, "stream bytes");

        auto missing = h->bridge->stream_object("alice", *Location::parse("storage:docs/none"),
            [](const char*, size_t) { return true; });
        ASSERT_TRUE(!missing.success && missing.error_kind == ErrorKind::NotFound, "not found");

        auto nolist = h->bridge->list("alice", *Location::parse("storage:nowhere"), false);
        ASSERT_TRUE(!nolist.success && nolist.error_kind == ErrorKind::NotFound, "missing folder");
        PASS();
    }
    {
        TEST(workspace_side_through_facade);
        ASSERT_TRUE(h->bridge->put_object("alice", *Location::parse("workspace:w/x.txt"),
                                          bytes("local")).success, "put workspace");
        auto list = h->bridge->list("alice", *Location::parse("workspace:"), true);
        ASSERT_TRUE(list.success, "recursive workspace list");
        ASSERT_EQ(list.entries.size(), 1u, "one file");
        ASSERT_EQ(list.entries[0].path, "w/x.txt", "path");

        auto escape = h->bridge->read_text("alice", *Location::parse("workspace:../bob/x"));
        ASSERT_TRUE(!escape.success && escape.error_kind == ErrorKind::Validation, "traversal");
        PASS();
    }
    {
        TEST(remove_file_and_folder);
        auto rm = h->bridge->remove("alice", *Location::parse("storage:docs/a.txt"));
        ASSERT_TRUE(rm.success && rm.removed == 1, "file removed");
        ASSERT_TRUE(h->bridge->put_object("alice", *Location::parse("storage:docs/sub/b.txt"),
                                          bytes("b")).success, "put nested");
        rm = h->bridge->remove("alice", *Location::parse("storage:docs"));
        ASSERT_TRUE(rm.success, "folder removed: " + rm.error_message);
        ASSERT_TRUE(!fs::exists(h->object("alice-data/docs/sub/b.txt")), "nested object gone");
        rm = h->bridge->remove("alice", *Location::parse("storage:"));
        ASSERT_TRUE(!rm.success && rm.error_kind == ErrorKind::Validation, "root refused");
        rm = h->bridge->remove("alice", *Location::parse("storage:docs"));
        ASSERT_TRUE(!rm.success && rm.error_kind == ErrorKind::NotFound, "already gone");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. Connection classification
// ---------------------------------------------------------------------------

static void test_connection_classification() {
    std::cout << "\n=== Connection classification ===" << std::endl;

    auto h = make_harness("probe");

    {
        TEST(ok);
        auto config = h->resolver->resolve("alice");
        auto out = h->bridge->test_connection(*config);
        ASSERT_TRUE(out.success && out.check.ok, "ok");
        ASSERT_EQ(out.check.message, "Connection successful", "message");
        PASS();
    }
    {
        TEST(missing_bucket);
        StorageConfig config;
        config.endpoint = h->endpoint();
        config.bucket = "no-such-bucket";
        auto out = h->bridge->test_connection(config);
        ASSERT_TRUE(!out.success && out.error_kind == ErrorKind::Connection, "connection error");
        ASSERT_TRUE(out.check.status == ConnectionStatus::BucketNotFound, "bucket-not-found");
        ASSERT_EQ(out.check.message, "Bucket not found", "message");
        PASS();
    }
    {
        TEST(no_credentials);
        StorageConfig config;
        config.endpoint = "http://127.0.0.1:1";
        config.bucket = "b";
        auto out = h->bridge->test_connection(config);
        ASSERT_TRUE(out.check.status == ConnectionStatus::InvalidCredentials, "invalid-credentials");
        ASSERT_EQ(out.check.message, "Invalid credentials", "message");
        PASS();
    }
    {
        TEST(unreachable_endpoint);
        StorageConfig config;
        config.endpoint = "http://127.0.0.1:1";
        config.bucket = "b";
        config.region = "us-east-1";
        config.access_key = "AKIDEXAMPLE";
        config.secret_key = "secret";
        auto out = h->bridge->test_connection(config);
        ASSERT_TRUE(!out.success, "fails");
        ASSERT_TRUE(out.check.status == ConnectionStatus::ConnectionError, "connection-error");
        ASSERT_NOT_EMPTY(out.check.message, "message carries the cause");
        PASS();
    }
    {
        TEST(counts_by_status);
        auto counts = h->bridge->connection_check_counts();
        ASSERT_EQ(counts[ConnectionStatus::Ok], 1u, "ok");
        ASSERT_EQ(counts[ConnectionStatus::BucketNotFound], 1u, "bucket");
        ASSERT_EQ(counts[ConnectionStatus::InvalidCredentials], 1u, "credentials");
        ASSERT_EQ(counts[ConnectionStatus::ConnectionError], 1u, "network");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 10. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    {
        TEST(creates_prom_file);
        auto tmpdir = make_temp_dir("wsbridge-metrics");
        auto prom_path = tmpdir / "test.prom";
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), {{"host", "test"}});
        exporter.start();
        bool created = wait_for([&] { return fs::exists(prom_path); }, 5000);
        exporter.stop();

        ASSERT_TRUE(created, ".prom file should be created");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("wsbridge_transfers_total") != std::string::npos, "transfers");
        ASSERT_TRUE(content.find("wsbridge_tasks") != std::string::npos, "tasks gauge");
        ASSERT_TRUE(content.find("wsbridge_transfer_duration_seconds") != std::string::npos,
                    "duration histogram");
        ASSERT_TRUE(!fs::exists(tmpdir / "test.prom.tmp"), "temp file renamed");
        fs::remove_all(tmpdir);
        PASS();
    }
    {
        TEST(engine_activity_appears);
        auto h = make_harness("metrics");
        auto prom_path = h->root / "engine.prom";
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        exporter.set_bridge(h->bridge.get());
        exporter.set_executor(h->executor.get());
        exporter.set_registry(h->registry.get());
        std::atomic<int> observed{0};
        h->executor->set_completion_callback([&](const TransferTask& task, double seconds) {
            exporter.observe_transfer(task, seconds);
            ++observed;
        });

        write_file(h->ws("alice", "m.txt"), "metrics");
        auto out = h->bridge->start_transfer(request(TransferKind::Upload, "alice", "workspace:m.txt",
                                                     "storage:"));
        ASSERT_TRUE(out.success, "started");
        auto task = wait_terminal(*h->bridge, out.token);
        ASSERT_TRUE(task && task->status == TaskStatus::Succeeded, "succeeded");
        ASSERT_TRUE(wait_for([&] { return observed.load() == 1; }), "outcome recorded");
        h->bridge->test_connection(*h->resolver->resolve("alice"));

        exporter.stop();
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("kind=\"upload\",result=\"succeeded\"} 1") != std::string::npos,
                    "upload success counted");
        ASSERT_TRUE(content.find("wsbridge_transfer_bytes_total{kind=\"upload\"} 7") != std::string::npos,
                    "bytes counted");
        ASSERT_TRUE(content.find("wsbridge_connection_checks_total{result=\"ok\"} 1") != std::string::npos,
                    "probe counted");
        ASSERT_TRUE(content.find("wsbridge_tasks{status=\"succeeded\"} 1") != std::string::npos,
                    "task gauge");
        ASSERT_TRUE(content.find("wsbridge_transfer_duration_seconds_count{kind=\"upload\"} 1") !=
                        std::string::npos, "duration observed");
        h->executor->set_completion_callback(nullptr);
        PASS();
    }
}

// ---------------------------------------------------------------------------

int main() {
    std::cout << "wsbridge test suite" << std::endl;
    std::cout << "===================" << std::endl;

    try {
        test_path_util();
        test_bridge_config();
        test_config_resolution();
        test_facade_config_absent();
        test_workspace();
        test_storage_client();
        test_task_registry();
        test_transfers();
        test_zip();
        test_facade_operations();
        test_connection_classification();
        test_metrics();
    } catch (const std::exception& e) {
        std::cout << "\nFATAL: " << e.what() << std::endl;
        ++tests_failed;
    }

    std::cout << "\n===================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
