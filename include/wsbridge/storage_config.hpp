#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace wsbridge {

enum class ConfigSource {
    Personal,
    System,
    Shared   // the _shared area of the system bucket
};

const char* config_source_name(ConfigSource source);

/// Effective storage settings for one tenant. Immutable snapshot: the
/// resolver builds a fresh one on every call.
struct StorageConfig {
    std::string endpoint;    // empty = AWS; "file:///dir" = local directory backend
    std::string access_key;
    std::string secret_key;
    std::string region;
    std::string bucket;      // never empty in a resolved config
    std::string prefix;      // "" or "a/b/"
    ConfigSource source = ConfigSource::Personal;

    /// "local" for file:// endpoints, otherwise "s3".
    std::string backend_type() const;

    /// Parameters for StorageBackendFactory::create().
    std::map<std::string, std::string> backend_params() const;
};

/// One row of the configuration table, as stored.
struct StorageRecord {
    std::string endpoint;
    std::string access_key;
    std::string secret_key;
    std::string region;
    std::string bucket;
    std::string prefix;      // personal: full prefix; system: base prefix
    int64_t updated_at = 0;
};

/// Read interface consumed by the resolver.
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual std::optional<StorageRecord> get(const std::string& tenant) const = 0;
    virtual std::optional<StorageRecord> get_system_default() const = 0;
};

/// SQLite-backed store. One connection, statements serialized by a mutex.
class SqliteConfigStore : public ConfigStore {
public:
    SqliteConfigStore() = default;
    ~SqliteConfigStore() override;

    SqliteConfigStore(const SqliteConfigStore&) = delete;
    SqliteConfigStore& operator=(const SqliteConfigStore&) = delete;

    /// Open (creating if needed) the database. Returns error message or empty.
    std::string open(const std::filesystem::path& db_path);

    std::optional<StorageRecord> get(const std::string& tenant) const override;
    std::optional<StorageRecord> get_system_default() const override;

    // Admin writers (CLI and tests)
    bool put_personal(const std::string& tenant, const StorageRecord& record);
    bool put_system_default(const StorageRecord& record);
    bool remove_personal(const std::string& tenant);

private:
    std::optional<StorageRecord> get_owner(const std::string& owner) const;
    bool put_owner(const std::string& owner, const StorageRecord& record);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_put_ = nullptr;
    sqlite3_stmt* stmt_remove_ = nullptr;
    mutable std::mutex db_mutex_;
};

/// Maps a tenant to its effective StorageConfig: personal record, else the
/// system default with a per-tenant prefix, else nothing.
class ConfigResolver {
public:
    using Step = std::function<std::optional<StorageConfig>(const std::string& tenant)>;

    explicit ConfigResolver(const ConfigStore& store);

    /// Throws ValidationError on a malformed tenant. Absence is not an error.
    std::optional<StorageConfig> resolve(const std::string& tenant) const;

    /// System bucket with the shared prefix, or nothing without a system default.
    std::optional<StorageConfig> resolve_shared() const;

    /// Per-tenant prefix under a system base prefix ("" -> "alice/",
    /// "users/alice" -> "users/alice/", "users" -> "users/alice/").
    /// A base ending in a tenant's name is that tenant's own root, so every
    /// other tenant nests inside it: with base "team/alice", bob resolves to
    /// "team/alice/bob/" and alice can see it. Such a base only suits a
    /// system default dedicated to that one tenant.
    static std::string system_prefix_for(const std::string& base, const std::string& tenant);

private:
    std::optional<StorageConfig> personal_step(const std::string& tenant) const;
    std::optional<StorageConfig> system_step(const std::string& tenant) const;

    const ConfigStore& store_;
    std::vector<Step> steps_;
};

}  // namespace wsbridge
