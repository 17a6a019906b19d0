#pragma once

#include <cstddef>
#include <cstdint>

namespace wsbridge::constants {

// Workspace layout: <root>/<tenant>/<dir>
constexpr const char* DEFAULT_WORKSPACE_ROOT = "/home";
constexpr const char* WORKSPACE_DIR_NAME = "workspace";
constexpr size_t MAX_TENANT_ID_LENGTH = 64;

// Config store
constexpr const char* SYSTEM_CONFIG_OWNER = "_default";
constexpr const char* SHARED_PREFIX_SEGMENT = "_shared";

// Streaming
constexpr size_t DEFAULT_STREAM_CHUNK_SIZE = 1024 * 1024;               // 1MB
constexpr size_t MAX_TEXT_READ_SIZE = 5 * 1024 * 1024;                  // 5MB
constexpr size_t ZIP_DEFLATE_BUFFER_SIZE = 64 * 1024;                   // 64KB

// Storage defaults
constexpr uint64_t DEFAULT_MULTIPART_THRESHOLD = 100ULL * 1024 * 1024;  // 100MB
constexpr uint64_t DEFAULT_MULTIPART_CHUNK_SIZE = 8ULL * 1024 * 1024;   // 8MB
constexpr uint64_t MIN_MULTIPART_CHUNK_SIZE = 5ULL * 1024 * 1024;       // S3 minimum part size
constexpr size_t DEFAULT_LIST_PAGE_SIZE = 1000;
constexpr size_t MAX_DELETE_BATCH = 1000;                               // DeleteObjects limit

// Zip export
constexpr uint64_t DEFAULT_ZIP_STREAM_THRESHOLD = 512ULL * 1024 * 1024;  // 512MB
constexpr uint64_t DEFAULT_MAX_ZIP_SIZE = 2ULL * 1024 * 1024 * 1024;     // 2GB

// Task registry
constexpr int DEFAULT_TASK_RETENTION_SECONDS = 3600;                    // 1 hour
constexpr size_t DEFAULT_MAX_TASKS_PER_TENANT = 100;

// Transfer executor
constexpr size_t DEFAULT_TRANSFER_WORKERS = 4;
constexpr int DEFAULT_MAX_TASK_LIFETIME_SECONDS = 6 * 3600;             // 6 hours
constexpr int DEFAULT_SWEEP_INTERVAL_SECONDS = 60;

// HTTP request defaults
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 300;

} // namespace wsbridge::constants
