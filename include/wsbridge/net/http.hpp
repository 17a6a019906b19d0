#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wsbridge::net {

enum class HttpMethod { GET, POST, PUT, DELETE, HEAD };

const char* method_name(HttpMethod method);

bool is_success_status(int status);

/// 429 and the transient 5xx statuses.
bool is_retryable_status(int status);

/// Header map keyed by lower-cased name. Iteration order is the sorted
/// name order SigV4 canonicalization needs.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    /// Repeated response headers are folded into one comma-separated value.
    void append(const std::string& name, const std::string& value);

    const std::map<std::string, std::string>& all() const { return values_; }

    void set_content_type(const std::string& content_type) { set("content-type", content_type); }
    std::optional<uint64_t> content_length() const;

private:
    std::map<std::string, std::string> values_;
};

/// Pull-style request body. Fills up to `max` bytes and returns the count;
/// 0 ends the body and HTTP_BODY_ABORT cancels the transfer.
using HttpBodySource = std::function<size_t(char* buffer, size_t max)>;
constexpr size_t HTTP_BODY_ABORT = static_cast<size_t>(-1);

/// Push-style consumer for 2xx bodies. Error bodies are still buffered into
/// HttpResponse::body. Return false to abort.
using HttpBodySink = std::function<bool(const char* data, size_t size)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // PUT only; takes precedence over `body`
    HttpBodySource body_source;
    uint64_t body_source_size = 0;

    HttpBodySink response_sink;

    std::chrono::milliseconds connect_timeout{10000};
    std::optional<std::chrono::milliseconds> total_timeout;  // client default when unset
    bool verify_ssl = true;

    int max_retries = 3;
    std::chrono::milliseconds initial_retry_delay{500};

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest del(const std::string& url);
    static HttpRequest head(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string error;
    bool is_network_error = false;
    bool aborted = false;  // a body source or sink cancelled the transfer

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

// WSBRIDGE_CONNECTION_POOL_SIZE and WSBRIDGE_REQUEST_TIMEOUT (seconds)
// override the pool size and request timeout.
struct HttpClientConfig {
    size_t pool_size = 8;
    std::chrono::milliseconds request_timeout{300000};
    size_t max_buffered_body = 64 * 1024 * 1024;  // 0 = unlimited
    std::string user_agent = "wsbridge/1.0";
};

/// Blocking HTTP client over libcurl easy handles. Handles are reused
/// across requests so keep-alive connections survive; at most `pool_size`
/// idle handles are kept.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    /// Retries network errors and retryable statuses with doubling delays.
    /// Streamed requests are never replayed.
    HttpResponse execute_with_retry(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// AWS Signature Version 4 for a single region and service.
class AwsSigV4Signer {
public:
    AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                   std::string region, std::string service);

    /// Adds host, x-amz-date, x-amz-content-sha256 and authorization headers.
    /// A pre-set x-amz-content-sha256 (UNSIGNED-PAYLOAD) is kept as is.
    void sign(HttpRequest& request) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

std::string url_encode(const std::string& str);
std::string url_encode_path(const std::string& str);  // keeps '/'

std::string base64_encode(const std::vector<uint8_t>& data);

}  // namespace wsbridge::net
