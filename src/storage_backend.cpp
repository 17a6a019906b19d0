#include "wsbridge/storage/backend.hpp"
#include "wsbridge/core/constants.hpp"
#include "wsbridge/core/log.hpp"
#include "wsbridge/net/http.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>

namespace wsbridge {

namespace fs = std::filesystem;

// ============================================================================
// Shared helpers
// ============================================================================

static std::chrono::system_clock::time_point to_system_time(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

// Suffix of in-flight temp files; hidden from listings
static constexpr const char* TEMP_SUFFIX = ".wsbtmp";

static fs::path temp_path_for(const fs::path& path) {
    static std::atomic<uint64_t> counter{0};
    return path.parent_path() /
        ("." + path.filename().string() + "." +
         std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "." +
         std::to_string(counter.fetch_add(1)) + TEMP_SUFFIX);
}

// ============================================================================
// LocalStorageBackend - a directory tree standing in for a bucket
// ============================================================================

class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(const fs::path& root)
        : root_(clean_root(root)) {}

    std::string type_name() const override { return "local"; }

    std::string store_id() const override { return "local:" + root_.string(); }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        auto path = key_to_path(key);

        std::error_code ec;
        auto st = fs::status(path, ec);
        if (ec || !fs::exists(st)) {
            return std::nullopt;
        }

        // "a/" only names a folder, "a" only names a file
        bool marker = key.ends_with('/');
        if (marker != fs::is_directory(st)) {
            return std::nullopt;
        }

        ObjectMetadata meta;
        meta.size = marker ? 0 : fs::file_size(path, ec);
        if (ec) return std::nullopt;

        auto ftime = fs::last_write_time(path, ec);
        if (!ec) meta.last_modified = to_system_time(ftime);

        meta.content_type = marker ? "application/x-directory" : "application/octet-stream";
        return meta;
    }

    GetResult get(const std::string& key) const override {
        GetResult result;
        auto path = key_to_path(key);

        std::error_code ec;
        if (key.ends_with('/') || !fs::is_regular_file(path, ec)) {
            result.not_found = true;
            result.error_message = "Object not found: " + key;
            return result;
        }

        uint64_t file_size = fs::file_size(path, ec);
        std::ifstream file(path, std::ios::binary);
        if (ec || !file) {
            result.error_message = "Failed to open object: " + key;
            return result;
        }

        result.data.resize(file_size);
        file.read(reinterpret_cast<char*>(result.data.data()), static_cast<std::streamsize>(file_size));
        if (!file) {
            result.data.clear();
            result.error_message = "Failed to read object: " + key;
            return result;
        }

        result.success = true;
        result.metadata.size = file_size;
        return result;
    }

    StreamResult get_stream(const std::string& key,
                            const ObjectSink& sink) const override {
        StreamResult result;
        auto path = key_to_path(key);

        std::error_code ec;
        if (key.ends_with('/') || !fs::is_regular_file(path, ec)) {
            result.not_found = true;
            result.error_message = "Object not found: " + key;
            return result;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            result.error_message = "Failed to open object: " + key;
            return result;
        }

        std::vector<char> buffer(constants::DEFAULT_STREAM_CHUNK_SIZE);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto n = static_cast<size_t>(file.gcount());
            if (n == 0) break;
            if (!sink(buffer.data(), n)) {
                result.aborted = true;
                result.error_message = "Read aborted";
                return result;
            }
            result.bytes += n;
        }

        if (file.bad()) {
            result.error_message = "Failed to read object: " + key;
            return result;
        }

        result.success = true;
        return result;
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& /*options*/) override {
        PutResult result;
        auto path = key_to_path(key);

        if (key.ends_with('/')) {
            return make_folder(path, key);
        }

        if (!prepare_parent(path, result)) return result;

        auto temp_path = temp_path_for(path);
        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                result.error_message = "Failed to create file for " + key;
                return result;
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                file.close();
                discard(temp_path);
                result.error_message = "Failed to write data for " + key;
                return result;
            }
        }

        return commit(temp_path, path, key);
    }

    PutResult put_file(const std::string& key,
                       const fs::path& source_path,
                       const PutOptions& /*options*/,
                       const ProgressCallback& progress) override {
        PutResult result;
        auto path = key_to_path(key);

        if (key.ends_with('/')) {
            result.error_message = "Cannot write file content to folder key: " + key;
            return result;
        }

        std::ifstream in(source_path, std::ios::binary);
        if (!in) {
            result.error_message = "Failed to open file: " + source_path.string();
            return result;
        }

        if (!prepare_parent(path, result)) return result;

        auto temp_path = temp_path_for(path);
        {
            std::ofstream out(temp_path, std::ios::binary);
            if (!out) {
                result.error_message = "Failed to create file for " + key;
                return result;
            }

            std::vector<char> buffer(constants::DEFAULT_STREAM_CHUNK_SIZE);
            uint64_t sent = 0;
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                auto n = in.gcount();
                if (n <= 0) break;
                out.write(buffer.data(), n);
                if (!out) {
                    result.error_message = "Failed to write data for " + key;
                    break;
                }
                sent += static_cast<uint64_t>(n);
                if (progress && !progress(sent)) {
                    result.error_message = "Upload aborted";
                    break;
                }
            }
            if (result.error_message.empty() && in.bad()) {
                result.error_message = "Failed to read file: " + source_path.string();
            }
        }

        if (!result.error_message.empty()) {
            discard(temp_path);
            return result;
        }

        return commit(temp_path, path, key);
    }

    bool remove(const std::string& key) override {
        auto path = key_to_path(key);
        std::error_code ec;
        auto st = fs::symlink_status(path, ec);
        if (ec || !fs::exists(st)) {
            return true;  // deleting a missing key is not an error
        }

        if (key.ends_with('/')) {
            // A folder with children persists through its children
            if (fs::is_directory(st) && fs::is_empty(path, ec) && !ec) {
                fs::remove(path, ec);
                if (ec) return false;
                prune_empty_parents(path);
            }
            return true;
        }

        if (fs::is_directory(st)) {
            return false;
        }

        fs::remove(path, ec);
        if (ec) return false;
        prune_empty_parents(path);
        return true;
    }

    std::vector<std::string> remove_batch(
        const std::vector<std::string>& keys) override {
        std::vector<std::string> failed;
        for (const auto& key : keys) {
            if (!remove(key)) {
                failed.push_back(key);
            }
        }
        return failed;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        std::error_code ec;
        if (!fs::is_directory(root_, ec)) {
            result.error_message = "Bucket not found: " + root_.string();
            return result;
        }

        // Only the directory holding the prefix needs scanning
        auto slash = options.prefix.rfind('/');
        std::string dir_key = slash == std::string::npos ? "" : options.prefix.substr(0, slash + 1);
        fs::path base = dir_key.empty() ? root_ : key_to_path(dir_key);
        if (!fs::is_directory(base, ec)) {
            result.success = true;
            return result;
        }

        std::vector<ListEntry> entries;
        try {
            if (options.delimiter.empty()) {
                for (const auto& entry : fs::recursive_directory_iterator(base)) {
                    if (entry.is_directory()) {
                        // Empty folders surface as markers, like zero-byte "x/" objects
                        if (fs::is_empty(entry.path()) && add_entry(entries, entry, options.prefix)) {
                            entries.back().is_directory = false;
                        }
                    } else if (entry.is_regular_file()) {
                        add_entry(entries, entry, options.prefix);
                    }
                }
            } else {
                for (const auto& entry : fs::directory_iterator(base)) {
                    if (entry.is_directory() || entry.is_regular_file()) {
                        add_entry(entries, entry, options.prefix);
                    }
                }
            }
        } catch (const fs::filesystem_error& e) {
            result.error_message = e.what();
            return result;
        }

        std::sort(entries.begin(), entries.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.key < b.key; });

        for (auto& entry : entries) {
            if (!options.continuation_token.empty() && entry.key <= options.continuation_token) {
                continue;
            }
            if (result.entries.size() >= options.max_keys) {
                result.truncated = true;
                result.continuation_token = result.entries.back().key;
                break;
            }
            result.entries.push_back(std::move(entry));
        }

        result.success = true;
        return result;
    }

    CopyResult copy(const std::string& source, const std::string& destination) override {
        CopyResult result;
        auto src_path = key_to_path(source);
        auto dst_path = key_to_path(destination);

        if (source.ends_with('/') || destination.ends_with('/')) {
            auto folder = make_folder(dst_path, destination);
            result.success = folder.success;
            result.error_message = folder.error_message;
            return result;
        }

        std::error_code ec;
        if (!fs::is_regular_file(src_path, ec)) {
            result.error_message = "Object not found: " + source;
            return result;
        }

        PutResult parent;
        if (!prepare_parent(dst_path, parent)) {
            result.error_message = parent.error_message;
            return result;
        }

        auto temp_path = temp_path_for(dst_path);
        fs::copy_file(src_path, temp_path, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            discard(temp_path);
            result.error_message = "Failed to copy " + source + ": " + ec.message();
            return result;
        }

        auto committed = commit(temp_path, dst_path, destination);
        result.success = committed.success;
        result.error_message = committed.error_message;
        return result;
    }

    ProbeResult probe() const override {
        ProbeResult result;
        std::error_code ec;
        if (fs::is_directory(root_, ec)) {
            result.status = ProbeResult::Status::Ok;
            result.http_status = 200;
            result.message = "OK";
        } else {
            result.status = ProbeResult::Status::BucketNotFound;
            result.http_status = 404;
            result.error_code = "NoSuchBucket";
            result.message = "No such directory: " + root_.string();
        }
        return result;
    }

private:
    fs::path root_;

    static fs::path clean_root(const fs::path& root) {
        auto result = fs::absolute(root).lexically_normal();
        if (!result.has_filename() && result != result.root_path()) {
            result = result.parent_path();
        }
        return result;
    }

    fs::path key_to_path(const std::string& key) const {
        std::string trimmed = key;
        while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();

        // Reject empty, absolute, and traversal keys
        if (trimmed.empty() || trimmed[0] == '/') {
            throw std::invalid_argument("Invalid storage key: '" + key + "'");
        }
        size_t pos = 0;
        while (pos <= trimmed.size()) {
            size_t slash = trimmed.find('/', pos);
            if (slash == std::string::npos) slash = trimmed.size();
            auto segment = std::string_view(trimmed).substr(pos, slash - pos);
            if (segment.empty() || segment == "." || segment == "..") {
                throw std::invalid_argument("Invalid storage key: '" + key + "'");
            }
            pos = slash + 1;
        }

        auto result = root_ / trimmed;

        // Symlinks inside the tree must not lead outside it
        std::error_code ec;
        auto canonical_root = fs::weakly_canonical(root_, ec);
        auto canonical_result = fs::weakly_canonical(result, ec);
        if (!ec) {
            auto root_str = canonical_root.string();
            auto result_str = canonical_result.string();
            if (result_str != root_str && !result_str.starts_with(root_str + "/")) {
                throw std::invalid_argument("Invalid storage key: '" + key + "' escapes the bucket");
            }
        }

        return result;
    }

    bool add_entry(std::vector<ListEntry>& entries,
                   const fs::directory_entry& entry,
                   const std::string& prefix) const {
        auto name = entry.path().filename().string();
        if (name.ends_with(TEMP_SUFFIX)) return false;

        ListEntry le;
        le.key = entry.path().lexically_relative(root_).generic_string();
        std::error_code ec;
        if (entry.is_directory(ec)) {
            le.key += '/';
            le.is_directory = true;
        } else {
            le.size = entry.file_size(ec);
            auto ftime = entry.last_write_time(ec);
            if (!ec) le.last_modified = to_system_time(ftime);
        }
        if (!le.key.starts_with(prefix) || le.key == prefix) return false;
        entries.push_back(std::move(le));
        return true;
    }

    bool prepare_parent(const fs::path& path, PutResult& result) const {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            result.error_message = "Failed to create parent of " + path.string() + ": " + ec.message();
            return false;
        }
        if (fs::is_directory(path, ec)) {
            result.error_message = "Key conflicts with an existing folder: " + path.string();
            return false;
        }
        return true;
    }

    PutResult make_folder(const fs::path& path, const std::string& key) const {
        PutResult result;
        std::error_code ec;
        fs::create_directories(path, ec);
        if (ec || !fs::is_directory(path, ec)) {
            result.error_message = "Failed to create folder " + key +
                (ec ? ": " + ec.message() : std::string());
            return result;
        }
        result.success = true;
        return result;
    }

    PutResult commit(const fs::path& temp_path, const fs::path& path, const std::string& key) const {
        PutResult result;
        std::error_code ec;
        fs::rename(temp_path, path, ec);
        if (ec) {
            discard(temp_path);
            result.error_message = "Failed to commit " + key + ": " + ec.message();
            return result;
        }
        result.success = true;
        return result;
    }

    static void discard(const fs::path& temp_path) {
        std::error_code ec;
        fs::remove(temp_path, ec);
    }

    void prune_empty_parents(const fs::path& path) const {
        std::error_code ec;
        for (auto dir = path.parent_path(); dir != root_ && dir.string().starts_with(root_.string());
             dir = dir.parent_path()) {
            if (!fs::is_empty(dir, ec) || ec) break;
            if (!fs::remove(dir, ec) || ec) break;
        }
    }
};

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Value between <tag>value</tag>, or empty
static std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Bodies of every <tag>...</tag>
static std::vector<std::string> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        results.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }

    return results;
}

static std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

static std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

}  // namespace xml

// ============================================================================
// SecureString - zeroes credential memory on destruction
// ============================================================================

class SecureString {
public:
    SecureString() = default;
    explicit SecureString(const std::string& s) : data_(s) {}
    SecureString(const SecureString& other) : data_(other.data_) {}

    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            secure_clear();
            data_ = other.data_;
        }
        return *this;
    }

    SecureString& operator=(const std::string& s) {
        secure_clear();
        data_ = s;
        return *this;
    }

    ~SecureString() {
        secure_clear();
    }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void secure_clear() {
        if (!data_.empty()) {
            volatile char* p = data_.data();
            for (size_t i = 0; i < data_.size(); ++i) {
                p[i] = 0;
            }
            data_.clear();
        }
    }

    std::string data_;
};

// ============================================================================
// S3StorageBackend - S3-compatible storage implementation
// ============================================================================

class S3StorageBackend : public StorageBackend {
public:
    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;          // Empty for AWS, custom for MinIO/etc
        SecureString access_key;
        SecureString secret_key;
        bool use_path_style = false;
        bool verify_ssl = true;
        bool unsigned_payload = false; // Skip SHA-256 payload hashing on part uploads
        uint64_t multipart_threshold = constants::DEFAULT_MULTIPART_THRESHOLD;
        uint64_t multipart_chunk_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE;
        uint32_t connect_timeout_secs = constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS;
        uint32_t request_timeout_secs = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
        uint32_t max_retries = 3;
    };

    explicit S3StorageBackend(const Config& config)
        : config_(config)
        , signer_(config.access_key.str(), config.secret_key.str(), config.region, "s3") {
        while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
            config_.endpoint.pop_back();
        }
        if (!config_.endpoint.empty() && config_.endpoint.find("://") == std::string::npos) {
            config_.endpoint = "https://" + config_.endpoint;
        }
        if (config_.multipart_chunk_size < constants::MIN_MULTIPART_CHUNK_SIZE) {
            config_.multipart_chunk_size = constants::MIN_MULTIPART_CHUNK_SIZE;
        }

        net::HttpClientConfig http_config;
        http_config.user_agent = "wsbridge-s3/1.0";
        http_config.request_timeout = std::chrono::seconds(config_.request_timeout_secs);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    std::string store_id() const override {
        return "s3:" + (config_.endpoint.empty() ? config_.region : config_.endpoint) +
               "/" + config_.bucket + "@" + config_.access_key.str();
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        auto request = net::HttpRequest::head(build_url(key));
        prepare(request);

        auto response = http_client_->execute_with_retry(request);
        if (!response.ok()) {
            if (response.status_code != 404) {
                log_debug("HEAD %s failed: %s", key.c_str(), describe_error(response).c_str());
            }
            return std::nullopt;
        }

        ObjectMetadata meta;
        meta.size = response.headers.content_length().value_or(0);
        meta.etag = response.headers.get("ETag").value_or("");
        meta.content_type = response.headers.get("Content-Type").value_or("application/octet-stream");
        if (auto lm = response.headers.get("Last-Modified")) {
            meta.last_modified = parse_http_date(*lm);
        }
        return meta;
    }

    GetResult get(const std::string& key) const override {
        GetResult result;

        auto request = net::HttpRequest::get(build_url(key));
        prepare(request);

        auto response = http_client_->execute_with_retry(request);
        if (!response.ok()) {
            result.not_found = response.status_code == 404;
            result.error_message = describe_error(response);
            return result;
        }

        result.success = true;
        result.data = std::move(response.body);
        result.metadata.size = response.headers.content_length().value_or(result.data.size());
        result.metadata.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    StreamResult get_stream(const std::string& key,
                            const ObjectSink& sink) const override {
        StreamResult result;

        auto request = net::HttpRequest::get(build_url(key));
        request.response_sink = [&result, &sink](const char* data, size_t size) {
            if (!sink(data, size)) return false;
            result.bytes += size;
            return true;
        };
        prepare(request);

        auto response = http_client_->execute_with_retry(request);
        if (response.aborted && net::is_success_status(response.status_code)) {
            result.aborted = true;
            result.error_message = "Read aborted";
            return result;
        }
        if (!response.ok()) {
            result.not_found = response.status_code == 404;
            result.error_message = describe_error(response);
            return result;
        }

        result.success = true;
        return result;
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        PutResult result;

        auto request = net::HttpRequest::put(build_url(key),
            std::vector<uint8_t>(data.begin(), data.end()));
        request.headers.set_content_type(options.content_type.empty()
            ? "application/octet-stream" : options.content_type);
        if (config_.unsigned_payload) {
            request.headers.set("X-Amz-Content-Sha256", "UNSIGNED-PAYLOAD");
        }
        prepare(request);

        // Retry with exponential backoff
        net::HttpResponse response;
        uint32_t attempts = 0;
        uint32_t max_attempts = config_.max_retries + 1;
        while (attempts < max_attempts) {
            response = http_client_->execute(request);
            if (response.ok() ||
                (!response.is_network_error && !net::is_retryable_status(response.status_code))) {
                break;
            }
            ++attempts;
            if (attempts < max_attempts) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100 * (1 << attempts)));
            }
        }

        if (!response.ok()) {
            result.error_message = describe_error(response);
            return result;
        }

        result.success = true;
        result.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    PutResult put_file(const std::string& key,
                       const fs::path& path,
                       const PutOptions& options,
                       const ProgressCallback& progress) override {
        std::error_code ec;
        uint64_t size = fs::file_size(path, ec);
        if (ec) {
            return {false, "", "Failed to stat file " + path.string() + ": " + ec.message()};
        }

        if (size > config_.multipart_threshold) {
            return put_multipart_file(key, path, size, options, progress);
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return {false, "", "Failed to open file " + path.string()};
        }

        uint64_t sent = 0;
        auto request = net::HttpRequest::put(build_url(key), {});
        request.body_source = [&file, &sent, &progress](char* buffer, size_t max) -> size_t {
            file.read(buffer, static_cast<std::streamsize>(max));
            auto n = static_cast<size_t>(file.gcount());
            if (n == 0 && file.bad()) return net::HTTP_BODY_ABORT;
            sent += n;
            if (n > 0 && progress && !progress(sent)) return net::HTTP_BODY_ABORT;
            return n;
        };
        request.body_source_size = size;
        request.headers.set_content_type(options.content_type.empty()
            ? "application/octet-stream" : options.content_type);
        // The body is read once while sending, so it cannot be hashed up front
        request.headers.set("X-Amz-Content-Sha256", "UNSIGNED-PAYLOAD");
        prepare(request);

        auto response = http_client_->execute(request);
        if (!response.ok()) {
            return {false, "", response.aborted ? "Upload aborted" : describe_error(response)};
        }

        return {true, response.headers.get("ETag").value_or(""), ""};
    }

    bool remove(const std::string& key) override {
        auto request = net::HttpRequest::del(build_url(key));
        prepare(request);

        auto response = http_client_->execute_with_retry(request);
        if (!response.ok() && response.status_code != 404) {
            log_debug("DELETE %s failed: %s", key.c_str(), describe_error(response).c_str());
            return false;
        }
        return true;
    }

    std::vector<std::string> remove_batch(
        const std::vector<std::string>& keys) override {
        std::vector<std::string> failed;

        for (size_t start = 0; start < keys.size(); start += constants::MAX_DELETE_BATCH) {
            size_t end = std::min(start + constants::MAX_DELETE_BATCH, keys.size());

            std::ostringstream body_xml;
            body_xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
            body_xml << "<Delete xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
            body_xml << "  <Quiet>true</Quiet>\n";
            for (size_t i = start; i < end; ++i) {
                body_xml << "  <Object><Key>" << xml::escape(keys[i]) << "</Key></Object>\n";
            }
            body_xml << "</Delete>";
            std::string body = body_xml.str();

            auto request = net::HttpRequest::post(build_url("") + "?delete", body);
            request.headers.set_content_type("application/xml");
            request.headers.set("Content-MD5", content_md5(body));
            prepare(request);

            auto response = http_client_->execute_with_retry(request);
            if (!response.ok()) {
                log_debug("DeleteObjects failed: %s", describe_error(response).c_str());
                failed.insert(failed.end(), keys.begin() + start, keys.begin() + end);
                continue;
            }

            std::string response_body = response.body_string();
            for (const auto& error : xml::find_elements(response_body, "Error")) {
                std::string key = xml::decode_entities(xml::get_element(error, "Key"));
                if (!key.empty()) {
                    failed.push_back(key);
                }
            }
        }

        return failed;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        std::string url = build_url("") + "?list-type=2";
        if (!options.prefix.empty()) {
            url += "&prefix=" + net::url_encode(options.prefix);
        }
        if (!options.delimiter.empty()) {
            url += "&delimiter=" + net::url_encode(options.delimiter);
        }
        url += "&max-keys=" + std::to_string(options.max_keys);
        if (!options.continuation_token.empty()) {
            url += "&continuation-token=" + net::url_encode(options.continuation_token);
        }

        auto request = net::HttpRequest::get(url);
        prepare(request);

        auto response = http_client_->execute_with_retry(request);
        if (!response.ok()) {
            result.error_message = describe_error(response);
            return result;
        }

        return parse_list_response(response.body_string());
    }

    CopyResult copy(const std::string& source, const std::string& destination) override {
        CopyResult result;

        auto request = net::HttpRequest::put(build_url(destination), {});
        request.headers.set("x-amz-copy-source",
                            "/" + config_.bucket + "/" + net::url_encode_path(source));
        prepare(request);

        auto response = http_client_->execute_with_retry(request);

        if (response.status_code == 501) {
            result.unsupported = true;
            result.error_message = "Server-side copy not implemented by the store";
            return result;
        }
        if (!response.ok()) {
            result.error_message = describe_error(response);
            return result;
        }
        // CopyObject may report failure inside a 200 body
        std::string body = response.body_string();
        if (body.find("<Error>") != std::string::npos) {
            result.error_message = "Copy failed: " + xml::get_element(body, "Code") + ": " +
                                   xml::decode_entities(xml::get_element(body, "Message"));
            return result;
        }

        result.success = true;
        return result;
    }

    ProbeResult probe() const override {
        using Status = ProbeResult::Status;
        ProbeResult result;

        if (config_.access_key.empty() || config_.secret_key.empty()) {
            result.status = Status::InvalidCredentials;
            result.message = "No credentials configured";
            return result;
        }

        auto request = net::HttpRequest::head(build_url(""));
        request.max_retries = 1;
        prepare(request);

        auto response = http_client_->execute_with_retry(request);
        result.http_status = response.status_code;

        if (response.is_network_error) {
            result.status = Status::ConnectionError;
            result.message = response.error;
            return result;
        }
        if (response.ok()) {
            result.status = Status::Ok;
            result.message = "OK";
            return result;
        }
        if (response.status_code == 404) {
            result.status = Status::BucketNotFound;
            result.error_code = "NoSuchBucket";
            result.message = describe_error(response);
            return result;
        }

        // HEAD carries no body; a zero-key listing returns the error document
        auto list_request = net::HttpRequest::get(build_url("") + "?list-type=2&max-keys=0");
        list_request.max_retries = 0;
        prepare(list_request);
        auto list_response = http_client_->execute_with_retry(list_request);
        std::string body = list_response.body_string();
        result.error_code = xml::get_element(body, "Code");
        result.message = describe_error(list_response.is_network_error ? response : list_response);

        if (result.error_code == "InvalidAccessKeyId" ||
            result.error_code == "SignatureDoesNotMatch" ||
            result.error_code == "AuthorizationHeaderMalformed") {
            result.status = Status::InvalidCredentials;
        } else if (result.error_code == "NoSuchBucket") {
            result.status = Status::BucketNotFound;
        } else if (response.status_code == 403) {
            result.status = Status::AccessDenied;
        } else {
            result.status = Status::Other;
        }
        return result;
    }

private:
    Config config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;

    void prepare(net::HttpRequest& request) const {
        request.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
        request.verify_ssl = config_.verify_ssl;
        request.max_retries = std::min<int>(request.max_retries, static_cast<int>(config_.max_retries));
        signer_.sign(request);
    }

    std::string build_url(const std::string& key) const {
        std::string url;
        if (!config_.endpoint.empty()) {
            url = config_.endpoint;
            if (config_.use_path_style) {
                url += "/" + config_.bucket;
            } else {
                auto scheme_end = url.find("://") + 3;
                url.insert(scheme_end, config_.bucket + ".");
            }
        } else if (config_.use_path_style) {
            url = "https://s3." + config_.region + ".amazonaws.com/" + config_.bucket;
        } else {
            url = "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
        }
        if (!key.empty()) {
            url += "/" + net::url_encode_path(key);
        }
        return url;
    }

    // "HTTP 403 AccessDenied: Access Denied" or the transport error
    static std::string describe_error(const net::HttpResponse& response) {
        if (!response.error.empty()) return response.error;
        std::string message = "HTTP " + std::to_string(response.status_code);
        std::string body = response.body_string();
        std::string code = xml::get_element(body, "Code");
        if (!code.empty()) {
            message += " " + code;
            std::string detail = xml::decode_entities(xml::get_element(body, "Message"));
            if (!detail.empty()) message += ": " + detail;
        }
        return message;
    }

    static std::string content_md5(const std::string& body) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        EVP_Digest(body.data(), body.size(), digest, &digest_len, EVP_md5(), nullptr);
        return net::base64_encode(std::vector<uint8_t>(digest, digest + digest_len));
    }

    static std::chrono::system_clock::time_point parse_http_date(const std::string& value) {
        std::tm tm{};
        std::istringstream iss(value);
        iss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
        if (iss.fail()) return {};
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }

    static std::chrono::system_clock::time_point parse_iso8601(const std::string& value) {
        std::tm tm{};
        int year = 0, month = 0, day = 0, hour = 0, min = 0, sec = 0, millis = 0;
        if (sscanf(value.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
                   &year, &month, &day, &hour, &min, &sec, &millis) < 6) {
            return {};
        }
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = min;
        tm.tm_sec = sec;
        time_t tt = timegm(&tm);
        if (tt == -1) return {};
        return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(millis);
    }

    // Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
    static std::string ensure_etag_quotes(const std::string& etag) {
        if (etag.empty()) return etag;
        std::string result = etag;
        if (result.front() != '"') result = "\"" + result;
        if (result.back() != '"') result += "\"";
        return result;
    }

    PutResult put_multipart_file(const std::string& key,
                                 const fs::path& path,
                                 uint64_t file_size,
                                 const PutOptions& options,
                                 const ProgressCallback& progress) {
        PutResult result;

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            result.error_message = "Failed to open file " + path.string();
            return result;
        }

        // S3 allows at most 10000 parts
        uint64_t chunk_size = std::max<uint64_t>(config_.multipart_chunk_size,
                                                 (file_size + 9999) / 10000);

        std::string upload_id = initiate_multipart_upload(key, options);
        if (upload_id.empty()) {
            result.error_message = "Failed to initiate multipart upload";
            return result;
        }

        // One part in memory at a time
        std::vector<uint8_t> buffer(static_cast<size_t>(chunk_size));
        std::vector<std::pair<int, std::string>> part_etags;
        uint64_t sent = 0;
        int part_number = 1;

        while (sent < file_size) {
            size_t n = static_cast<size_t>(std::min<uint64_t>(chunk_size, file_size - sent));
            file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(n));
            if (static_cast<size_t>(file.gcount()) != n) {
                result.error_message = "Failed to read file " + path.string();
                break;
            }

            std::string etag = upload_part(key, upload_id, part_number,
                                           std::span<const uint8_t>(buffer.data(), n));
            if (etag.empty()) {
                result.error_message = "Failed to upload part " + std::to_string(part_number);
                break;
            }
            part_etags.emplace_back(part_number, etag);
            sent += n;
            ++part_number;

            if (progress && !progress(sent)) {
                result.error_message = "Upload aborted";
                break;
            }
        }

        if (!result.error_message.empty()) {
            abort_multipart_upload(key, upload_id);
            return result;
        }

        std::string final_etag = complete_multipart_upload(key, upload_id, part_etags);
        if (final_etag.empty()) {
            abort_multipart_upload(key, upload_id);
            result.error_message = "Failed to complete multipart upload";
            return result;
        }

        result.success = true;
        result.etag = final_etag;
        return result;
    }

    std::string initiate_multipart_upload(const std::string& key, const PutOptions& options) {
        auto request = net::HttpRequest::post(build_url(key) + "?uploads", std::string());
        if (!options.content_type.empty()) {
            request.headers.set_content_type(options.content_type);
        }
        prepare(request);

        auto response = http_client_->execute_with_retry(request);
        if (!response.ok()) {
            log_error("Initiate multipart upload for %s failed: %s",
                      key.c_str(), describe_error(response).c_str());
            return "";
        }

        return xml::get_element(response.body_string(), "UploadId");
    }

    std::string upload_part(const std::string& key, const std::string& upload_id,
                            int part_number, std::span<const uint8_t> data) {
        std::string url = build_url(key) +
            "?partNumber=" + std::to_string(part_number) +
            "&uploadId=" + net::url_encode(upload_id);

        auto request = net::HttpRequest::put(url, std::vector<uint8_t>(data.begin(), data.end()));
        if (config_.unsigned_payload) {
            request.headers.set("X-Amz-Content-Sha256", "UNSIGNED-PAYLOAD");
        }
        prepare(request);

        auto response = http_client_->execute_with_retry(request);
        if (!response.ok()) {
            log_error("Upload of part %d for %s failed: %s",
                      part_number, key.c_str(), describe_error(response).c_str());
            return "";
        }

        return ensure_etag_quotes(response.headers.get("ETag").value_or(""));
    }

    std::string complete_multipart_upload(const std::string& key, const std::string& upload_id,
                                          const std::vector<std::pair<int, std::string>>& part_etags) {
        std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);

        std::ostringstream body_xml;
        body_xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body_xml << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& [part_num, etag] : part_etags) {
            body_xml << "  <Part><PartNumber>" << part_num << "</PartNumber>"
                     << "<ETag>" << xml::escape(etag) << "</ETag></Part>\n";
        }
        body_xml << "</CompleteMultipartUpload>";

        auto request = net::HttpRequest::post(url, body_xml.str());
        request.headers.set_content_type("application/xml");
        prepare(request);

        auto response = http_client_->execute_with_retry(request);
        std::string body = response.body_string();
        if (!response.ok() || body.find("<Error>") != std::string::npos) {
            log_error("Complete multipart upload for %s failed: %s",
                      key.c_str(), describe_error(response).c_str());
            return "";
        }

        std::string etag = xml::decode_entities(xml::get_element(body, "ETag"));
        return ensure_etag_quotes(etag);
    }

    void abort_multipart_upload(const std::string& key, const std::string& upload_id) {
        auto request = net::HttpRequest::del(build_url(key) + "?uploadId=" + net::url_encode(upload_id));
        prepare(request);
        auto response = http_client_->execute_with_retry(request);
        if (!response.ok()) {
            log_error("Abort multipart upload for %s failed: %s",
                      key.c_str(), describe_error(response).c_str());
        }
    }

    ListResult parse_list_response(const std::string& body) const {
        ListResult result;
        result.success = true;
        result.truncated = xml::get_element(body, "IsTruncated") == "true";
        result.continuation_token = xml::decode_entities(
            xml::get_element(body, "NextContinuationToken"));

        for (const auto& content : xml::find_elements(body, "Contents")) {
            ListEntry entry;
            entry.key = xml::decode_entities(xml::get_element(content, "Key"));
            entry.size = std::strtoull(xml::get_element(content, "Size").c_str(), nullptr, 10);
            entry.last_modified = parse_iso8601(xml::get_element(content, "LastModified"));
            entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
            result.entries.push_back(std::move(entry));
        }

        for (const auto& content : xml::find_elements(body, "CommonPrefixes")) {
            ListEntry entry;
            entry.key = xml::decode_entities(xml::get_element(content, "Prefix"));
            entry.is_directory = true;
            result.entries.push_back(std::move(entry));
        }

        return result;
    }
};

// ============================================================================
// StorageBackendFactory
// ============================================================================

static bool parse_bool_param(const std::string& name, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::invalid_argument("Invalid boolean for '" + name + "': " + value);
}

static uint64_t parse_u64_param(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        uint64_t result = std::stoull(value, &consumed);
        if (consumed == value.size()) return result;
    } catch (const std::exception&) {
        // fall through to the error below
    }
    throw std::invalid_argument("Invalid number for '" + name + "': " + value);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& config) {

    if (type == "local") {
        auto it = config.find("path");
        if (it == config.end() || it->second.empty()) {
            throw std::invalid_argument("Local backend requires 'path' config");
        }
        return std::make_unique<LocalStorageBackend>(it->second);
    }

    if (type == "s3") {
        S3StorageBackend::Config s3_config;

        auto it = config.find("bucket");
        if (it == config.end() || it->second.empty()) {
            throw std::invalid_argument("S3 backend requires 'bucket' config");
        }
        s3_config.bucket = it->second;

        if ((it = config.find("region")) != config.end() && !it->second.empty()) {
            s3_config.region = it->second;
        }
        if ((it = config.find("endpoint")) != config.end()) {
            s3_config.endpoint = it->second;
        }
        if ((it = config.find("access_key")) != config.end()) {
            s3_config.access_key = it->second;
        }
        if ((it = config.find("secret_key")) != config.end()) {
            s3_config.secret_key = it->second;
        }
        // Custom endpoints (MinIO, Ceph) default to path-style addressing
        s3_config.use_path_style = !s3_config.endpoint.empty();
        if ((it = config.find("use_path_style")) != config.end()) {
            s3_config.use_path_style = parse_bool_param(it->first, it->second);
        }
        if ((it = config.find("verify_ssl")) != config.end()) {
            s3_config.verify_ssl = parse_bool_param(it->first, it->second);
        }
        if ((it = config.find("unsigned_payload")) != config.end()) {
            s3_config.unsigned_payload = parse_bool_param(it->first, it->second);
        }
        if ((it = config.find("multipart_threshold")) != config.end()) {
            s3_config.multipart_threshold = parse_u64_param(it->first, it->second);
        }
        if ((it = config.find("multipart_chunk_size")) != config.end()) {
            s3_config.multipart_chunk_size = parse_u64_param(it->first, it->second);
        }
        if ((it = config.find("connect_timeout")) != config.end()) {
            s3_config.connect_timeout_secs = static_cast<uint32_t>(parse_u64_param(it->first, it->second));
        }
        if ((it = config.find("request_timeout")) != config.end()) {
            s3_config.request_timeout_secs = static_cast<uint32_t>(parse_u64_param(it->first, it->second));
        }
        if ((it = config.find("max_retries")) != config.end()) {
            s3_config.max_retries = static_cast<uint32_t>(parse_u64_param(it->first, it->second));
        }

        return std::make_unique<S3StorageBackend>(s3_config);
    }

    throw std::invalid_argument("Unknown storage backend type: " + type);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_local(
    const fs::path& root_path) {
    return std::make_unique<LocalStorageBackend>(root_path);
}

}  // namespace wsbridge
