#include "s3xfer/net/http.hpp"
#include "s3xfer/core/log.hpp"

#include <curl/curl.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>

namespace s3xfer::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
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
    // Throttling and transient server errors
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

static std::string encode_impl(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string url_encode(const std::string& str) {
    return encode_impl(str, false);
}

std::string url_encode_path(const std::string& str) {
    return encode_impl(str, true);
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_digit(str[i + 1]);
            int lo = hex_digit(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        decoded += (str[i] == '+') ? ' ' : str[i];
    }
    return decoded;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it == headers_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.count(normalize_name(name)) > 0;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value) return std::nullopt;
    try {
        return std::stoull(*value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url;
    return request;
}

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest request;
    request.method = HttpMethod::HEAD;
    request.url = url;
    return request;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url;
    request.body.assign(body.begin(), body.end());
    return request;
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = url;
    request.body = std::move(body);
    return request;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest request;
    request.method = HttpMethod::DELETE;
    request.url = url;
    return request;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl parsed;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;
    parsed.scheme = url.substr(0, scheme_end);

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    parsed.host = url.substr(host_start, path_start == std::string::npos
                                             ? std::string::npos
                                             : path_start - host_start);
    if (parsed.host.empty()) return std::nullopt;

    if (path_start == std::string::npos) {
        parsed.path = "/";
        return parsed;
    }

    size_t query_start = url.find('?', path_start);
    if (query_start == std::string::npos) {
        parsed.path = url.substr(path_start);
    } else {
        parsed.path = url.substr(path_start, query_start - path_start);
        parsed.query = url.substr(query_start + 1);
    }
    if (parsed.path.empty()) parsed.path = "/";
    return parsed;
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

struct WriteContext {
    CURL* handle = nullptr;
    std::vector<uint8_t>* buffer = nullptr;
    const HttpBodySink* sink = nullptr;
    size_t max_size = 0;
    size_t current_size = 0;
    bool size_exceeded = false;
    bool sink_aborted = false;
    bool decided = false;
    bool use_sink = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    size_t bytes = size * nmemb;

    // Error bodies always go to the buffer so they can be parsed
    if (!ctx->decided) {
        long status = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
        ctx->use_sink = ctx->sink && *ctx->sink && is_success_status(static_cast<int>(status));
        ctx->decided = true;
    }

    if (ctx->use_sink) {
        if (!(*ctx->sink)(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
            ctx->sink_aborted = true;
            return 0;
        }
        return bytes;
    }

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;
    }
    ctx->buffer->insert(ctx->buffer->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a fresh header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }
    if (line.empty()) return bytes;

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = (start == std::string::npos) ? std::string() : value.substr(start);
        headers->add(name, value);
    }
    return bytes;
}

struct ReadContext {
    const uint8_t* data = nullptr;
    size_t size = 0;
    size_t pos = 0;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadContext*>(userdata);
    size_t to_copy = std::min(size * nitems, rd->size - rd->pos);
    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }
    return to_copy;
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to initialize curl handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        ReadContext read_data{request.body.data(), request.body.size(), 0};

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
            case HttpMethod::PUT:
                // Empty-body PUT still needs an explicit Content-Length: 0
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &read_data);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                                 request.body.empty() ? "" : reinterpret_cast<const char*>(request.body.data()));
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Suppress curl's automatic Expect: 100-continue on large PUTs
        headers_list = curl_slist_append(headers_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        std::vector<uint8_t> response_body;
        WriteContext write_ctx;
        write_ctx.handle = curl;
        write_ctx.buffer = &response_body;
        write_ctx.sink = &request.body_sink;
        write_ctx.max_size = config_.max_response_size;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        auto connect_timeout = request.connect_timeout.count() > 0
            ? request.connect_timeout : config_.default_connect_timeout;
        auto total_timeout = request.total_timeout.count() > 0
            ? request.total_timeout : config_.default_total_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total_timeout.count()));

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.tcp_keepalive_idle.count()));
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                             static_cast<long>(config_.tcp_keepalive_interval.count()));
        }

        bool verify = request.verify_ssl && config_.verify_ssl_by_default;
        if (!verify) {
            static std::once_flag warn_flag;
            std::call_once(warn_flag, []() {
                log_warn("SSL verification disabled; connections are open to man-in-the-middle attacks");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        if (!request.ca_bundle_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_bundle_path.c_str());
        } else if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else if (res == CURLE_WRITE_ERROR && write_ctx.sink_aborted) {
            response.error = "Response body sink rejected data";
            response.is_network_error = false;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
            response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        }

        curl_slist_free_all(headers_list);
        release_handle(curl);
        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    CURL* acquire_handle() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            return handle;
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_total_connections) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, len, hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash, &hash_len);
    return std::vector<uint8_t>(hash, hash + hash_len);
}

std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

// Query params in the URL are already encoded; sort them and give
// valueless params ("uploads", "delete") an explicit empty value.
std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            if (eq != std::string::npos) {
                params[param.substr(0, eq)] = param.substr(eq + 1);
            } else {
                params[param] = "";
            }
        }
        pos = amp + 1;
    }
    return params;
}

std::string join_query(const std::map<std::string, std::string>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out += "&";
        out += key + "=" + value;
    }
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

}  // namespace

std::string AwsSigV4Signer::credential_scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");
    auto signature = hmac_sha256(k_signing, string_to_sign);
    return to_hex(signature.data(), signature.size());
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto now = std::chrono::system_clock::now();
    std::string datetime = format_utc(now, "%Y%m%dT%H%M%SZ");
    std::string date = format_utc(now, "%Y%m%d");

    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    request.headers.set("Host", url->host);
    request.headers.set("X-Amz-Date", datetime);

    // Reuse a pre-set payload hash (UNSIGNED-PAYLOAD) or compute it
    std::string payload_hash;
    if (auto existing = request.headers.get("X-Amz-Content-Sha256"); existing && !existing->empty()) {
        payload_hash = *existing;
    } else {
        payload_hash = sha256_hex(request.body.data(), request.body.size());
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    std::map<std::string, std::string> canonical_headers;
    for (const auto& [name, value] : request.headers.all()) {
        canonical_headers[lower(name)] = value;
    }

    std::string signed_headers;
    for (const auto& [name, value] : canonical_headers) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    std::ostringstream canonical;
    canonical << http_method_to_string(request.method) << "\n"
              << url->path << "\n"
              << join_query(parse_query(url->query)) << "\n";
    for (const auto& [name, value] : canonical_headers) {
        canonical << name << ":" << value << "\n";
    }
    canonical << "\n" << signed_headers << "\n" << payload_hash;

    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + datetime + "\n" +
                                 credential_scope(date) + "\n" + sha256_hex(canonical.str());

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 "
         << "Credential=" << access_key_id_ << "/" << credential_scope(date) << ", "
         << "SignedHeaders=" << signed_headers << ", "
         << "Signature=" << calculate_signature(date, string_to_sign);
    request.headers.set("Authorization", auth.str());
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

std::string AwsSigV4Signer::presign(const PresignParams& params,
                                    std::optional<std::chrono::system_clock::time_point> now) const {
    auto when = now.value_or(std::chrono::system_clock::now());
    std::string datetime = format_utc(when, "%Y%m%dT%H%M%SZ");
    std::string date = format_utc(when, "%Y%m%d");

    auto url = ParsedUrl::parse(params.url);
    if (!url) return {};

    std::map<std::string, std::string> canonical_headers;
    canonical_headers["host"] = url->host;
    for (const auto& [name, value] : params.signed_headers) {
        canonical_headers[lower(name)] = value;
    }
    std::string signed_headers;
    for (const auto& [name, value] : canonical_headers) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    auto query = parse_query(url->query);
    for (const auto& [key, value] : params.query_params) {
        query[url_encode(key)] = url_encode(value);
    }
    query["X-Amz-Algorithm"] = "AWS4-HMAC-SHA256";
    query["X-Amz-Credential"] = url_encode(access_key_id_ + "/" + credential_scope(date));
    query["X-Amz-Date"] = datetime;
    query["X-Amz-Expires"] = std::to_string(params.expires_secs);
    query["X-Amz-SignedHeaders"] = url_encode(signed_headers);
    if (!params.session_token.empty()) {
        query["X-Amz-Security-Token"] = url_encode(params.session_token);
    }

    std::string canonical_query = join_query(query);

    std::ostringstream canonical;
    canonical << http_method_to_string(params.method) << "\n"
              << url->path << "\n"
              << canonical_query << "\n";
    for (const auto& [name, value] : canonical_headers) {
        canonical << name << ":" << value << "\n";
    }
    canonical << "\n" << signed_headers << "\n" << "UNSIGNED-PAYLOAD";

    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + datetime + "\n" +
                                 credential_scope(date) + "\n" + sha256_hex(canonical.str());

    return url->scheme + "://" + url->host + url->path + "?" + canonical_query +
           "&X-Amz-Signature=" + calculate_signature(date, string_to_sign);
}

}  // namespace s3xfer::net
