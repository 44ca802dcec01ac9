#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace s3xfer::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_retryable_status(int status);

// HTTP headers (case-insensitive names)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    // lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// Receives response body bytes as they arrive. Return false to abort.
using HttpBodySink = std::function<bool(const uint8_t* data, size_t size)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{60000};

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    // Inclusive byte range (Range: bytes=first-second)
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    // When set, 2xx response bodies stream here instead of into HttpResponse::body
    HttpBodySink body_sink;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Failure details when the request never produced a status
    std::string error;
    bool is_network_error = false;
    bool timed_out = false;
};

struct HttpClientConfig {
    size_t max_total_connections = 64;
    std::chrono::milliseconds default_connect_timeout{10000};
    std::chrono::milliseconds default_total_timeout{60000};

    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    // Bodies buffered in memory above this size are rejected (0 = unlimited)
    size_t max_response_size = 256 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "s3xfer/1.0";
    bool verbose = false;
};

/// Blocking libcurl client with a pool of reusable easy handles.
/// Safe to call execute() from many threads at once.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parameters for a query-string (presigned) SigV4 signature.
struct PresignParams {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    uint32_t expires_secs = 3600;
    // Headers the eventual caller must send verbatim (content-type, x-amz-meta-*)
    std::map<std::string, std::string> signed_headers;
    // Extra query parameters, e.g. response-content-disposition
    std::map<std::string, std::string> query_params;
    std::string session_token;
};

// AWS Signature Version 4 for S3 requests
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    void sign(HttpRequest& request) const;
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

    /// Produce a presigned URL. Uses the current time unless `now` is given.
    std::string presign(const PresignParams& params,
                        std::optional<std::chrono::system_clock::time_point> now = std::nullopt) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string credential_scope(const std::string& date) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;   // includes :port when present
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// Percent-encode everything except unreserved characters
std::string url_encode(const std::string& str);
// Same, but keeps '/' (object keys in URL paths)
std::string url_encode_path(const std::string& str);
std::string url_decode(const std::string& str);

}  // namespace s3xfer::net
