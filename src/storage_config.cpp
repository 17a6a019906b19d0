#include "wsbridge/storage_config.hpp"
#include "wsbridge/core/constants.hpp"
#include "wsbridge/core/log.hpp"
#include "wsbridge/path_util.hpp"

#include <chrono>
#include <sqlite3.h>
#include <thread>

namespace wsbridge {

namespace {

constexpr const char* CONFIG_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS storage_configs (
    owner TEXT PRIMARY KEY,
    endpoint TEXT NOT NULL DEFAULT '',
    access_key TEXT NOT NULL DEFAULT '',
    secret_key TEXT NOT NULL DEFAULT '',
    region TEXT NOT NULL DEFAULT '',
    bucket TEXT NOT NULL DEFAULT '',
    prefix TEXT NOT NULL DEFAULT '',
    updated_at INTEGER NOT NULL
) WITHOUT ROWID;
)";

constexpr const char* FILE_SCHEME = "file://";

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        log_error("SQL error: %s (rc=%d)", err ? err : sqlite3_errstr(rc), rc);
        if (err) sqlite3_free(err);
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

}  // namespace

const char* config_source_name(ConfigSource source) {
    switch (source) {
        case ConfigSource::Personal: return "personal";
        case ConfigSource::System: return "system";
        case ConfigSource::Shared: return "shared";
    }
    return "personal";
}

// --- StorageConfig ---

std::string StorageConfig::backend_type() const {
    return endpoint.starts_with(FILE_SCHEME) ? "local" : "s3";
}

std::map<std::string, std::string> StorageConfig::backend_params() const {
    if (endpoint.starts_with(FILE_SCHEME)) {
        auto dir = std::filesystem::path(endpoint.substr(std::char_traits<char>::length(FILE_SCHEME)));
        return {{"path", (dir / bucket).string()}};
    }

    std::map<std::string, std::string> params = {
        {"bucket", bucket},
        {"endpoint", endpoint},
        {"access_key", access_key},
        {"secret_key", secret_key},
    };
    if (!region.empty()) params["region"] = region;
    return params;
}

// --- SqliteConfigStore ---

SqliteConfigStore::~SqliteConfigStore() {
    if (stmt_get_) sqlite3_finalize(stmt_get_);
    if (stmt_put_) sqlite3_finalize(stmt_put_);
    if (stmt_remove_) sqlite3_finalize(stmt_remove_);
    if (db_) sqlite3_close(db_);
}

std::string SqliteConfigStore::open(const std::filesystem::path& db_path) {
    std::lock_guard lock(db_mutex_);
    if (db_) return "Config store already open";

    std::error_code ec;
    if (db_path.has_parent_path()) {
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            return "Cannot create directory for config store: " + ec.message();
        }
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return "Cannot open config store " + db_path.string() + ": " + err;
    }

    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, CONFIG_SCHEMA)) {
        return "Cannot create config schema: " + std::string(sqlite3_errmsg(db_));
    }

    struct { const char* sql; sqlite3_stmt** stmt; } statements[] = {
        {"SELECT endpoint, access_key, secret_key, region, bucket, prefix, updated_at "
         "FROM storage_configs WHERE owner = ?1", &stmt_get_},
        {"INSERT OR REPLACE INTO storage_configs "
         "(owner, endpoint, access_key, secret_key, region, bucket, prefix, updated_at) "
         "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)", &stmt_put_},
        {"DELETE FROM storage_configs WHERE owner = ?1", &stmt_remove_},
    };
    for (auto& s : statements) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            return "Cannot prepare statement: " + std::string(sqlite3_errmsg(db_));
        }
    }

    log_debug("Config store opened at %s", db_path.c_str());
    return "";
}

std::optional<StorageRecord> SqliteConfigStore::get(const std::string& tenant) const {
    return get_owner(tenant);
}

std::optional<StorageRecord> SqliteConfigStore::get_system_default() const {
    return get_owner(constants::SYSTEM_CONFIG_OWNER);
}

std::optional<StorageRecord> SqliteConfigStore::get_owner(const std::string& owner) const {
    std::lock_guard lock(db_mutex_);
    if (!stmt_get_) return std::nullopt;

    sqlite3_reset(stmt_get_);
    sqlite3_bind_text(stmt_get_, 1, owner.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sql_step_retry(stmt_get_);
    if (rc != SQLITE_ROW) {
        if (rc != SQLITE_DONE) {
            log_error("Config lookup for '%s' failed: %s", owner.c_str(), sqlite3_errmsg(db_));
        }
        sqlite3_reset(stmt_get_);
        return std::nullopt;
    }

    StorageRecord record;
    record.endpoint = column_text(stmt_get_, 0);
    record.access_key = column_text(stmt_get_, 1);
    record.secret_key = column_text(stmt_get_, 2);
    record.region = column_text(stmt_get_, 3);
    record.bucket = column_text(stmt_get_, 4);
    record.prefix = column_text(stmt_get_, 5);
    record.updated_at = sqlite3_column_int64(stmt_get_, 6);
    sqlite3_reset(stmt_get_);
    return record;
}

bool SqliteConfigStore::put_personal(const std::string& tenant, const StorageRecord& record) {
    validate_tenant(tenant);
    return put_owner(tenant, record);
}

bool SqliteConfigStore::put_system_default(const StorageRecord& record) {
    return put_owner(constants::SYSTEM_CONFIG_OWNER, record);
}

bool SqliteConfigStore::put_owner(const std::string& owner, const StorageRecord& record) {
    std::lock_guard lock(db_mutex_);
    if (!stmt_put_) return false;

    sqlite3_reset(stmt_put_);
    sqlite3_bind_text(stmt_put_, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_put_, 2, record.endpoint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_put_, 3, record.access_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_put_, 4, record.secret_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_put_, 5, record.region.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_put_, 6, record.bucket.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_put_, 7, record.prefix.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_put_, 8, now_epoch());

    int rc = sql_step_retry(stmt_put_);
    sqlite3_reset(stmt_put_);
    if (rc != SQLITE_DONE) {
        log_error("Storing config for '%s' failed: %s", owner.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SqliteConfigStore::remove_personal(const std::string& tenant) {
    validate_tenant(tenant);

    std::lock_guard lock(db_mutex_);
    if (!stmt_remove_) return false;

    sqlite3_reset(stmt_remove_);
    sqlite3_bind_text(stmt_remove_, 1, tenant.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_remove_);
    sqlite3_reset(stmt_remove_);
    if (rc != SQLITE_DONE) {
        log_error("Removing config for '%s' failed: %s", tenant.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

// --- ConfigResolver ---

ConfigResolver::ConfigResolver(const ConfigStore& store)
    : store_(store) {
    steps_.push_back([this](const std::string& tenant) { return personal_step(tenant); });
    steps_.push_back([this](const std::string& tenant) { return system_step(tenant); });
}

std::optional<StorageConfig> ConfigResolver::resolve(const std::string& tenant) const {
    validate_tenant(tenant);

    for (const auto& step : steps_) {
        if (auto config = step(tenant)) {
            log_debug("Resolved %s storage for %s: bucket=%s prefix=%s",
                      config_source_name(config->source), tenant.c_str(),
                      config->bucket.c_str(), config->prefix.c_str());
            return config;
        }
    }
    return std::nullopt;
}

std::optional<StorageConfig> ConfigResolver::personal_step(const std::string& tenant) const {
    auto record = store_.get(tenant);
    if (!record || record->endpoint.empty() || record->bucket.empty()) {
        return std::nullopt;
    }

    StorageConfig config;
    config.endpoint = record->endpoint;
    config.access_key = record->access_key;
    config.secret_key = record->secret_key;
    config.region = record->region;
    config.bucket = record->bucket;
    config.prefix = normalize_prefix(record->prefix);
    config.source = ConfigSource::Personal;
    return config;
}

std::optional<StorageConfig> ConfigResolver::system_step(const std::string& tenant) const {
    auto record = store_.get_system_default();
    if (!record || record->endpoint.empty() || record->bucket.empty()) {
        return std::nullopt;
    }

    StorageConfig config;
    config.endpoint = record->endpoint;
    config.access_key = record->access_key;
    config.secret_key = record->secret_key;
    config.region = record->region;
    config.bucket = record->bucket;
    config.prefix = system_prefix_for(record->prefix, tenant);
    config.source = ConfigSource::System;
    return config;
}

std::optional<StorageConfig> ConfigResolver::resolve_shared() const {
    auto record = store_.get_system_default();
    if (!record || record->endpoint.empty() || record->bucket.empty()) {
        return std::nullopt;
    }

    StorageConfig config;
    config.endpoint = record->endpoint;
    config.access_key = record->access_key;
    config.secret_key = record->secret_key;
    config.region = record->region;
    config.bucket = record->bucket;
    config.prefix = normalize_prefix(
        join_path(normalize_relative_path(record->prefix), constants::SHARED_PREFIX_SEGMENT));
    config.source = ConfigSource::Shared;
    return config;
}

std::string ConfigResolver::system_prefix_for(const std::string& base, const std::string& tenant) {
    auto normalized = normalize_relative_path(base);
    if (normalized.empty()) {
        return tenant + "/";
    }
    // A base that already names the tenant is used as-is
    if (base_name(normalized) == tenant) {
        return normalized + "/";
    }
    return normalized + "/" + tenant + "/";
}

}  // namespace wsbridge
