#include "wsbridge/net/http.hpp"
#include "wsbridge/core/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string_view>
#include <thread>

namespace wsbridge::net {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename T>
T env_override(const char* name, T fallback, unsigned long lo, unsigned long hi) {
    const char* env = std::getenv(name);
    if (!env) return fallback;
    try {
        unsigned long value = std::stoul(env);
        if (value >= lo && value <= hi) return T(value);
        log_error("%s=%s out of range [%lu,%lu], using default", name, env, lo, hi);
    } catch (const std::exception&) {
        log_error("invalid %s=%s, using default", name, env);
    }
    return fallback;
}

std::string percent_encode(const std::string& str, bool keep_slash) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string hex_digest(const unsigned char* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += hex[data[i] >> 4];
        out += hex[data[i] & 0x0F];
    }
    return out;
}

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

}  // namespace

// --- Helpers ---

const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    switch (status) {
        case 429: case 500: case 502: case 503: case 504:
            return true;
        default:
            return false;
    }
}

std::string url_encode(const std::string& str) {
    return percent_encode(str, false);
}

std::string url_encode_path(const std::string& str) {
    return percent_encode(str, true);
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                            static_cast<int>(data.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

// --- Headers ---

void HttpHeaders::set(const std::string& name, const std::string& value) {
    values_[lower(name)] = value;
}

void HttpHeaders::append(const std::string& name, const std::string& value) {
    auto [it, inserted] = values_.try_emplace(lower(name), value);
    if (!inserted) it->second += ", " + value;
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = values_.find(lower(name));
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto value = get("content-length");
    if (!value) return std::nullopt;
    try {
        return std::stoull(*value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// --- Requests ---

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url);
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    auto req = make_request(HttpMethod::POST, url);
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, const std::vector<uint8_t>& body) {
    auto req = make_request(HttpMethod::PUT, url);
    req.body = body;
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    return make_request(HttpMethod::DELETE, url);
}

HttpRequest HttpRequest::head(const std::string& url) {
    return make_request(HttpMethod::HEAD, url);
}

// --- Transfer state handed to curl callbacks ---

namespace {

struct Transfer {
    CURL* curl = nullptr;
    const HttpRequest* request = nullptr;
    HttpResponse* response = nullptr;
    size_t body_limit = 0;

    size_t upload_pos = 0;
    int status = 0;  // read lazily on the first body chunk
    bool too_large = false;
    bool aborted = false;

    static size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* t = static_cast<Transfer*>(userdata);
        size_t bytes = size * nmemb;
        if (t->status == 0) {
            long code = 0;
            curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &code);
            t->status = static_cast<int>(code);
        }
        if (t->request->response_sink && is_success_status(t->status)) {
            if (!t->request->response_sink(ptr, bytes)) {
                t->aborted = true;
                return 0;
            }
            return bytes;
        }
        auto& body = t->response->body;
        if (t->body_limit > 0 && body.size() + bytes > t->body_limit) {
            t->too_large = true;
            return 0;
        }
        body.insert(body.end(), ptr, ptr + bytes);
        return bytes;
    }

    static size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* t = static_cast<Transfer*>(userdata);
        size_t bytes = size * nitems;
        std::string_view line(buffer, bytes);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.remove_suffix(1);
        }
        if (line.starts_with("HTTP/")) {
            // A new status line (after 100-continue or similar) starts a fresh header block
            t->response->headers = HttpHeaders{};
            return bytes;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos) return bytes;
        auto value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        t->response->headers.append(std::string(line.substr(0, colon)), std::string(value));
        return bytes;
    }

    static size_t on_upload(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* t = static_cast<Transfer*>(userdata);
        size_t room = size * nitems;
        if (t->request->body_source) {
            size_t n = t->request->body_source(buffer, room);
            if (n == HTTP_BODY_ABORT) {
                t->aborted = true;
                return CURL_READFUNC_ABORT;
            }
            return n;
        }
        const auto& body = t->request->body;
        size_t n = std::min(room, body.size() - t->upload_pos);
        if (n > 0) {
            std::memcpy(buffer, body.data() + t->upload_pos, n);
            t->upload_pos += n;
        }
        return n;
    }
};

}  // namespace

// --- Client ---

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag curl_init;
        std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_ALL); });

        config_.pool_size = env_override<size_t>(
            "WSBRIDGE_CONNECTION_POOL_SIZE", config_.pool_size, 1, 1000);
        config_.request_timeout = std::chrono::seconds(env_override<long>(
            "WSBRIDGE_REQUEST_TIMEOUT",
            static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(
                config_.request_timeout).count()),
            5, 86400));
    }

    ~Impl() {
        std::lock_guard lock(mutex_);
        for (CURL* handle : idle_) curl_easy_cleanup(handle);
        idle_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;
        CURL* curl = checkout();
        if (!curl) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }

        Transfer transfer;
        transfer.curl = curl;
        transfer.request = &request;
        transfer.response = &response;
        transfer.body_limit = config_.max_buffered_body;

        struct curl_slist* header_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
        }
        header_list = curl_slist_append(header_list, "Expect:");

        configure(curl, request, transfer, header_list);

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            long code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
            response.status_code = static_cast<int>(code);
        } else if (transfer.too_large) {
            response.error = "response body exceeds " +
                             std::to_string(config_.max_buffered_body) + " bytes";
            response.status_code = 413;
            response.body.clear();
        } else if (transfer.aborted) {
            response.error = "transfer aborted";
            response.aborted = true;
            response.status_code = transfer.status;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        curl_slist_free_all(header_list);
        checkin(curl);
        return response;
    }

    HttpResponse execute_with_retry(const HttpRequest& request) {
        bool streamed = request.body_source || request.response_sink;
        auto delay = request.initial_retry_delay;
        for (int attempt = 0;; ++attempt) {
            HttpResponse response = execute(request);
            bool transient = response.is_network_error || is_retryable_status(response.status_code);
            if (response.aborted || !transient || streamed || attempt >= request.max_retries) {
                return response;
            }
            log_debug("retrying %s %s (%s), attempt %d", method_name(request.method),
                      request.url.c_str(),
                      response.is_network_error ? response.error.c_str()
                                                : std::to_string(response.status_code).c_str(),
                      attempt + 1);
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }

private:
    void configure(CURL* curl, const HttpRequest& request, Transfer& transfer,
                   struct curl_slist* header_list) {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
            case HttpMethod::PUT: {
                auto length = request.body_source ? request.body_source_size
                                                  : static_cast<uint64_t>(request.body.size());
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, &Transfer::on_upload);
                curl_easy_setopt(curl, CURLOPT_READDATA, &transfer);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(length));
                break;
            }
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &Transfer::on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &Transfer::on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);

        auto timeout = request.total_timeout.value_or(config_.request_timeout);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

        if (!request.verify_ssl) {
            static std::once_flag warned;
            std::call_once(warned, [] { log_error("TLS certificate verification disabled"); });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);

        // Redirects would carry a signature to another host
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    }

    CURL* checkout() {
        {
            std::lock_guard lock(mutex_);
            if (!idle_.empty()) {
                CURL* handle = idle_.back();
                idle_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void checkin(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard lock(mutex_);
        if (idle_.size() < config_.pool_size) {
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request) {
    return impl_->execute_with_retry(request);
}

// --- SigV4 ---

namespace {

struct UrlParts {
    std::string host;  // host[:port] as sent in the Host header
    std::string path;
    std::string query;
};

std::optional<UrlParts> split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return std::nullopt;
    std::string scheme = lower(url.substr(0, scheme_end));

    auto authority_begin = scheme_end + 3;
    auto authority_end = url.find_first_of("/?#", authority_begin);
    if (authority_end == std::string::npos) authority_end = url.size();
    std::string authority = url.substr(authority_begin, authority_end - authority_begin);
    if (auto at = authority.rfind('@'); at != std::string::npos) authority.erase(0, at + 1);
    if (authority.empty()) return std::nullopt;

    UrlParts parts;
    parts.host = authority;
    // Default ports are left out of the signed Host header
    auto strip = [&](const char* suffix) {
        std::string s(suffix);
        if (parts.host.size() > s.size() && parts.host.ends_with(s)) {
            parts.host.resize(parts.host.size() - s.size());
        }
    };
    if (scheme == "https") strip(":443");
    if (scheme == "http") strip(":80");

    auto rest_end = url.find('#', authority_end);
    std::string rest = url.substr(authority_end, rest_end == std::string::npos
                                                     ? std::string::npos
                                                     : rest_end - authority_end);
    auto q = rest.find('?');
    parts.path = rest.substr(0, q);
    if (q != std::string::npos) parts.query = rest.substr(q + 1);
    if (parts.path.empty()) parts.path = "/";
    return parts;
}

// Parameters arrive URL-encoded; SigV4 wants them sorted with "k=" for bare keys
std::string canonical_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        auto param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            auto eq = param.find('=');
            if (eq == std::string::npos) {
                params[param] = "";
            } else {
                params[param.substr(0, eq)] = param.substr(eq + 1);
            }
        }
        pos = amp + 1;
    }
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out += '&';
        out += key + "=" + value;
    }
    return out;
}

std::string sha256_hex(const void* data, size_t len) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(static_cast<const unsigned char*>(data), len, digest);
    return hex_digest(digest, sizeof(digest));
}

std::string hmac(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len);
    return std::string(reinterpret_cast<const char*>(digest), len);
}

std::string amz_datetime() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

}  // namespace

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                               std::string region, std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto url = split_url(request.url);
    if (!url) {
        log_error("cannot sign request with malformed url %s", request.url.c_str());
        return;
    }

    std::string datetime = amz_datetime();
    std::string date = datetime.substr(0, 8);
    std::string scope = date + "/" + region_ + "/" + service_ + "/aws4_request";

    auto payload_hash = request.headers.get("x-amz-content-sha256").value_or("");
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request.body.data(), request.body.size());
    }

    request.headers.set("host", url->host);
    request.headers.set("x-amz-date", datetime);
    request.headers.set("x-amz-content-sha256", payload_hash);

    std::string signed_headers;
    std::string canonical_headers;
    for (const auto& [name, value] : request.headers.all()) {
        if (name == "authorization") continue;
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
        canonical_headers += name + ":" + value + "\n";
    }

    std::string canonical_request = std::string(method_name(request.method)) + "\n" +
                                    url->path + "\n" +
                                    canonical_query(url->query) + "\n" +
                                    canonical_headers + "\n" +
                                    signed_headers + "\n" +
                                    payload_hash;

    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + datetime + "\n" + scope + "\n" +
                                 sha256_hex(canonical_request.data(), canonical_request.size());

    std::string key = hmac("AWS4" + secret_access_key_, date);
    key = hmac(key, region_);
    key = hmac(key, service_);
    key = hmac(key, "aws4_request");
    std::string signature = hmac(key, string_to_sign);

    request.headers.set("authorization",
                        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope +
                        ", SignedHeaders=" + signed_headers +
                        ", Signature=" + hex_digest(
                            reinterpret_cast<const unsigned char*>(signature.data()),
                            signature.size()));
}

}  // namespace wsbridge::net
