#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/core/constants.hpp"
#include "s3xfer/core/log.hpp"
#include "s3xfer/net/http.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <sstream>

namespace s3xfer::storage {

// ============================================================================
// XML parsing helpers for S3 responses (avoids regex for better reliability)
// ============================================================================

namespace xml {

// Find the value between <tag>value</tag>, returns empty string if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Contents of every <tag>...</tag> occurrence, in document order
std::vector<std::string> find_elements(const std::string& xml, const std::string& tag) {
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

// Decode XML entities (basic set used by S3)
std::string decode_entities(const std::string& s) {
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

std::string escape(const std::string& s) {
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

namespace {

// ISO 8601 as used in listings: 2023-12-15T14:30:00.000Z
std::chrono::system_clock::time_point parse_iso8601(const std::string& date_str) {
    std::tm tm = {};
    int year, month, day, hour, min, sec;
    int millis = 0;
    if (sscanf(date_str.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
               &year, &month, &day, &hour, &min, &sec, &millis) >= 6 ||
        sscanf(date_str.c_str(), "%d-%d-%dT%d:%d:%dZ",
               &year, &month, &day, &hour, &min, &sec) == 6) {
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = min;
        tm.tm_sec = sec;
        time_t tt = timegm(&tm);
        if (tt != -1) {
            return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(millis);
        }
    }
    return {};
}

// RFC 1123 as used in Last-Modified: Tue, 15 Nov 1994 08:12:31 GMT
std::chrono::system_clock::time_point parse_http_date(const std::string& date_str) {
    std::tm tm = {};
    if (strptime(date_str.c_str(), "%a, %d %b %Y %H:%M:%S", &tm) == nullptr) {
        return {};
    }
    time_t tt = timegm(&tm);
    return tt == -1 ? std::chrono::system_clock::time_point{}
                    : std::chrono::system_clock::from_time_t(tt);
}

std::string base64(const std::vector<uint8_t>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                              static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(std::max(len, 0)));
    return out;
}

std::string content_md5(const std::string& body) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_Digest(body.data(), body.size(), digest, &len, EVP_md5(), nullptr);
    return base64(std::vector<uint8_t>(digest, digest + len));
}

// Ensure ETag has surrounding quotes (required for S3 CompleteMultipartUpload)
std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

// Classify a failed HTTP exchange and fill the result's error triple
template <typename Result>
Result response_error(const net::HttpResponse& response, const std::string& context) {
    Result result;
    result.success = false;
    result.http_status = response.status_code;

    if (response.status_code == 0) {
        if (response.is_network_error) {
            result.error_kind = response.timed_out ? ErrorKind::Timeout : ErrorKind::NetworkFailure;
        } else {
            result.error_kind = ErrorKind::Io;
        }
        result.error_message = context + ": " + response.error;
        return result;
    }

    std::string body = response.body_string();
    std::string code = xml::get_element(body, "Code");
    result.error_kind = error_kind_from_s3_error(response.status_code, code);
    std::string message = xml::decode_entities(xml::get_element(body, "Message"));

    std::ostringstream oss;
    oss << context << ": HTTP " << response.status_code;
    if (!code.empty()) oss << " " << code;
    if (!message.empty()) oss << " (" << message << ")";
    if (!response.error.empty()) oss << ": " << response.error;
    result.error_message = oss.str();
    return result;
}

ObjectMetadata metadata_from_headers(const net::HttpHeaders& headers) {
    ObjectMetadata meta;
    meta.size = headers.content_length().value_or(0);
    meta.etag = headers.get("ETag").value_or("");
    meta.content_type = headers.content_type().value_or("application/octet-stream");
    if (auto last_modified = headers.get("Last-Modified")) {
        meta.last_modified = parse_http_date(*last_modified);
    }
    for (const auto& [name, value] : headers.all()) {
        if (name.starts_with("x-amz-meta-")) {
            meta.user_metadata[name.substr(11)] = value;
        }
    }
    return meta;
}

}  // namespace

// ============================================================================
// S3ObjectStore - S3-compatible store over libcurl with SigV4 signing
// ============================================================================

class S3ObjectStore : public ObjectStore {
public:
    explicit S3ObjectStore(const S3StoreConfig& config)
        : config_(config)
        , signer_(config.access_key, config.secret_key, config.region, "s3") {
        net::HttpClientConfig http_config;
        http_config.verify_ssl_by_default = config_.verify_ssl;
        http_config.default_connect_timeout = std::chrono::milliseconds(config_.connect_timeout_secs * 1000);
        http_config.default_total_timeout = std::chrono::milliseconds(config_.request_timeout_secs * 1000);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    HeadResult head(const std::string& bucket, const std::string& key) const override {
        net::HttpRequest request = net::HttpRequest::head(build_url(bucket, key));
        auto response = execute(request);

        if (!response.ok()) {
            return response_error<HeadResult>(response, "HEAD " + bucket + "/" + key);
        }

        HeadResult result;
        result.success = true;
        result.http_status = response.status_code;
        result.metadata = metadata_from_headers(response.headers);
        return result;
    }

    GetResult get(const std::string& bucket, const std::string& key,
                  const GetOptions& options) const override {
        net::HttpRequest request = net::HttpRequest::get(build_url(bucket, key));

        if (options.range_start || options.range_end) {
            uint64_t start = options.range_start.value_or(0);
            if (options.range_end) {
                if (*options.range_end <= start) {
                    return make_error<GetResult>(ErrorKind::Unknown, "Empty byte range for " + key);
                }
                request.byte_range = std::make_pair(start, *options.range_end - 1);
            } else {
                request.headers.set("Range", "bytes=" + std::to_string(start) + "-");
            }
        }
        if (options.if_match) {
            request.headers.set("If-Match", *options.if_match);
        }
        if (options.timeout.count() > 0) {
            request.total_timeout = options.timeout;
        }

        uint64_t streamed = 0;
        if (options.sink) {
            request.body_sink = [&options, &streamed](const uint8_t* data, size_t size) {
                streamed += size;
                return options.sink(data, size);
            };
        }

        auto response = execute(request);
        if (!response.ok()) {
            return response_error<GetResult>(response, "GET " + bucket + "/" + key);
        }

        GetResult result;
        result.success = true;
        result.http_status = response.status_code;
        result.metadata = metadata_from_headers(response.headers);
        result.data = std::move(response.body);
        result.bytes_received = options.sink ? streamed : result.data.size();
        return result;
    }

    PutResult put(const std::string& bucket, const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        net::HttpRequest request = net::HttpRequest::put(
            build_url(bucket, key), std::vector<uint8_t>(data.begin(), data.end()));
        apply_put_options(request, options);
        if (config_.unsigned_payload) {
            request.headers.set("x-amz-content-sha256", "UNSIGNED-PAYLOAD");
        }

        auto response = execute(request);
        if (!response.ok()) {
            return response_error<PutResult>(response, "PUT " + bucket + "/" + key);
        }

        PutResult result;
        result.success = true;
        result.http_status = response.status_code;
        result.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    MultipartInitResult initiate_multipart(const std::string& bucket,
                                           const std::string& key,
                                           const PutOptions& options) override {
        net::HttpRequest request = net::HttpRequest::post(build_url(bucket, key) + "?uploads", "");
        apply_put_options(request, options);

        auto response = execute(request);
        if (!response.ok()) {
            return response_error<MultipartInitResult>(response, "initiate multipart " + key);
        }

        std::string upload_id = xml::get_element(response.body_string(), "UploadId");
        if (upload_id.empty()) {
            return make_error<MultipartInitResult>(ErrorKind::Unknown,
                                                   "initiate multipart " + key + ": no UploadId in response");
        }

        MultipartInitResult result;
        result.success = true;
        result.http_status = response.status_code;
        result.upload_id = upload_id;
        return result;
    }

    PutResult upload_part(const std::string& bucket, const std::string& key,
                          const std::string& upload_id, uint32_t part_number,
                          std::span<const uint8_t> data,
                          std::chrono::milliseconds timeout) override {
        std::string url = build_url(bucket, key) +
            "?partNumber=" + std::to_string(part_number) +
            "&uploadId=" + net::url_encode(upload_id);

        net::HttpRequest request = net::HttpRequest::put(url,
            std::vector<uint8_t>(data.begin(), data.end()));
        if (config_.unsigned_payload) {
            request.headers.set("x-amz-content-sha256", "UNSIGNED-PAYLOAD");
        }
        if (timeout.count() > 0) {
            request.total_timeout = timeout;
        }

        auto response = execute(request);
        if (!response.ok()) {
            return response_error<PutResult>(response, "upload part " + std::to_string(part_number));
        }

        // ETag from header comes quoted - preserve quotes for CompleteMultipartUpload
        PutResult result;
        result.success = true;
        result.http_status = response.status_code;
        result.etag = ensure_etag_quotes(response.headers.get("ETag").value_or(""));
        return result;
    }

    PutResult complete_multipart(const std::string& bucket, const std::string& key,
                                 const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override {
        std::string url = build_url(bucket, key) + "?uploadId=" + net::url_encode(upload_id);

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& part : parts) {
            body << "  <Part>\n";
            body << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
            body << "    <ETag>" << xml::escape(part.etag) << "</ETag>\n";
            body << "  </Part>\n";
        }
        body << "</CompleteMultipartUpload>";

        net::HttpRequest request = net::HttpRequest::post(url, body.str());
        request.headers.set_content_type("application/xml");

        auto response = execute(request);
        std::string response_body = response.body_string();

        // CompleteMultipartUpload can fail with 200 and an <Error> body
        if (!response.ok() || response_body.find("<Error>") != std::string::npos) {
            auto result = response_error<PutResult>(response, "complete multipart " + key);
            if (response.ok()) {
                result.error_kind = ErrorKind::NetworkFailure;
                result.error_message = "complete multipart " + key + ": " +
                    xml::get_element(response_body, "Code") + " " +
                    xml::decode_entities(xml::get_element(response_body, "Message"));
            }
            return result;
        }

        // Multipart ETags have format "hash-partcount"
        PutResult result;
        result.success = true;
        result.http_status = response.status_code;
        result.etag = ensure_etag_quotes(
            xml::decode_entities(xml::get_element(response_body, "ETag")));
        return result;
    }

    OpResult abort_multipart(const std::string& bucket, const std::string& key,
                             const std::string& upload_id) override {
        std::string url = build_url(bucket, key) + "?uploadId=" + net::url_encode(upload_id);
        net::HttpRequest request = net::HttpRequest::del(url);

        auto response = execute(request);
        if (!response.ok()) {
            return response_error<OpResult>(response, "abort multipart " + upload_id);
        }
        OpResult result;
        result.success = true;
        result.http_status = response.status_code;
        return result;
    }

    MultipartListResult list_multipart_uploads(const std::string& bucket,
                                               const std::string& prefix) const override {
        MultipartListResult result;
        std::string key_marker;
        std::string upload_id_marker;

        while (true) {
            std::string url = build_url(bucket, "") + "?uploads";
            if (!key_marker.empty()) url += "&key-marker=" + net::url_encode(key_marker);
            if (!prefix.empty()) url += "&prefix=" + net::url_encode(prefix);
            if (!upload_id_marker.empty()) url += "&upload-id-marker=" + net::url_encode(upload_id_marker);

            net::HttpRequest request = net::HttpRequest::get(url);
            auto response = execute(request);
            if (!response.ok()) {
                return response_error<MultipartListResult>(response, "list multipart uploads");
            }

            std::string body = response.body_string();
            for (const auto& upload : xml::find_elements(body, "Upload")) {
                MultipartUploadInfo info;
                info.key = xml::decode_entities(xml::get_element(upload, "Key"));
                info.upload_id = xml::get_element(upload, "UploadId");
                info.initiated = parse_iso8601(xml::get_element(upload, "Initiated"));
                result.uploads.push_back(std::move(info));
            }

            if (xml::get_element(body, "IsTruncated") != "true") break;
            key_marker = xml::decode_entities(xml::get_element(body, "NextKeyMarker"));
            upload_id_marker = xml::get_element(body, "NextUploadIdMarker");
            if (key_marker.empty() && upload_id_marker.empty()) break;
        }

        result.success = true;
        result.http_status = 200;
        return result;
    }

    PutResult copy_object(const std::string& source_bucket, const std::string& source_key,
                          const std::string& dest_bucket, const std::string& dest_key) override {
        net::HttpRequest request = net::HttpRequest::put(build_url(dest_bucket, dest_key), {});
        request.headers.set("x-amz-copy-source",
                            "/" + source_bucket + "/" + net::url_encode_path(source_key));
        request.headers.set("x-amz-metadata-directive", "COPY");

        auto response = execute(request);
        std::string body = response.body_string();
        // CopyObject can also fail with 200 and an <Error> body
        if (!response.ok() || body.find("<Error>") != std::string::npos) {
            auto result = response_error<PutResult>(
                response, "copy " + source_bucket + "/" + source_key + " -> " + dest_bucket + "/" + dest_key);
            if (response.ok()) {
                result.error_kind = ErrorKind::NetworkFailure;
            }
            return result;
        }

        PutResult result;
        result.success = true;
        result.http_status = response.status_code;
        result.etag = ensure_etag_quotes(xml::decode_entities(xml::get_element(body, "ETag")));
        return result;
    }

    OpResult remove(const std::string& bucket, const std::string& key) override {
        net::HttpRequest request = net::HttpRequest::del(build_url(bucket, key));
        auto response = execute(request);
        // S3 answers 204 for missing keys as well
        if (!response.ok()) {
            return response_error<OpResult>(response, "DELETE " + bucket + "/" + key);
        }
        OpResult result;
        result.success = true;
        result.http_status = response.status_code;
        return result;
    }

    BatchDeleteResult remove_batch(const std::string& bucket,
                                   const std::vector<std::string>& keys) override {
        BatchDeleteResult result;
        if (keys.empty()) {
            result.success = true;
            return result;
        }

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<Delete xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        body << "  <Quiet>true</Quiet>\n";
        for (const auto& key : keys) {
            body << "  <Object><Key>" << xml::escape(key) << "</Key></Object>\n";
        }
        body << "</Delete>";

        std::string payload = body.str();
        net::HttpRequest request = net::HttpRequest::post(build_url(bucket, "") + "?delete", payload);
        request.headers.set_content_type("application/xml");
        request.headers.set("Content-MD5", content_md5(payload));

        auto response = execute(request);
        if (!response.ok()) {
            return response_error<BatchDeleteResult>(response, "batch delete " + bucket);
        }

        // Quiet mode reports only failures as <Error><Key>...</Key></Error>
        result.success = true;
        result.http_status = response.status_code;
        std::string response_body = response.body_string();
        for (const auto& error : xml::find_elements(response_body, "Error")) {
            std::string key = xml::decode_entities(xml::get_element(error, "Key"));
            if (!key.empty()) {
                log_debug("batch delete failed for %s: %s", key.c_str(),
                          xml::get_element(error, "Code").c_str());
                result.failed_keys.push_back(key);
            }
        }
        return result;
    }

    ListResult list(const std::string& bucket, const ListOptions& options) const override {
        std::string url = build_url(bucket, "");

        std::vector<std::string> params;
        params.push_back("list-type=2");
        if (!options.prefix.empty()) {
            params.push_back("prefix=" + net::url_encode(options.prefix));
        }
        if (!options.delimiter.empty()) {
            params.push_back("delimiter=" + net::url_encode(options.delimiter));
        }
        params.push_back("max-keys=" + std::to_string(options.max_keys));
        if (!options.continuation_token.empty()) {
            params.push_back("continuation-token=" + net::url_encode(options.continuation_token));
        }

        url += "?";
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0) url += "&";
            url += params[i];
        }

        net::HttpRequest request = net::HttpRequest::get(url);
        if (options.timeout.count() > 0) {
            request.total_timeout = options.timeout;
        }
        auto response = execute(request);
        if (!response.ok()) {
            return response_error<ListResult>(response, "list " + bucket + "/" + options.prefix);
        }
        return parse_list_response(response.body_string());
    }

    PresignResult presign(const std::string& bucket, const std::string& key,
                          const PresignOptions& options) const override {
        net::PresignParams params;
        params.method = options.method == PresignMethod::Put ? net::HttpMethod::PUT
                                                             : net::HttpMethod::GET;
        params.url = build_url(bucket, key);
        params.expires_secs = options.expires_secs;
        params.session_token = config_.session_token;

        if (options.method == PresignMethod::Put) {
            if (!options.content_type.empty()) {
                params.signed_headers["content-type"] = options.content_type;
            }
            for (const auto& [name, value] : options.metadata) {
                params.signed_headers["x-amz-meta-" + name] = value;
            }
        }
        for (const auto& [name, value] : options.response_headers) {
            params.query_params["response-" + name] = value;
        }

        std::string url = signer_.presign(params);
        if (url.empty()) {
            return make_error<PresignResult>(ErrorKind::InvalidPath, "Cannot presign " + params.url);
        }
        PresignResult result;
        result.success = true;
        result.url = url;
        return result;
    }

private:
    net::HttpResponse execute(net::HttpRequest& request) const {
        sign_request(request);
        auto response = http_client_->execute(request);
        log_debug("%s %s -> %d (%lld ms)", net::http_method_to_string(request.method),
                  request.url.c_str(), response.status_code,
                  static_cast<long long>(response.total_time.count()));
        return response;
    }

    // Sign request, using session token if configured
    void sign_request(net::HttpRequest& request) const {
        if (!config_.session_token.empty()) {
            signer_.sign_with_token(request, config_.session_token);
        } else {
            signer_.sign(request);
        }
    }

    static void apply_put_options(net::HttpRequest& request, const PutOptions& options) {
        request.headers.set_content_type(options.content_type.empty()
                                             ? "application/octet-stream"
                                             : options.content_type);
        for (const auto& [k, v] : options.metadata) {
            request.headers.set("x-amz-meta-" + k, v);
        }
        if (options.timeout.count() > 0) {
            request.total_timeout = options.timeout;
        }
    }

    std::string build_url(const std::string& bucket, const std::string& key) const {
        std::string url;
        if (!config_.endpoint.empty()) {
            url = config_.endpoint;
            while (!url.empty() && url.back() == '/') url.pop_back();
            if (config_.use_path_style) {
                url += "/" + bucket;
            } else {
                // https://host -> https://bucket.host
                size_t scheme_end = url.find("://");
                size_t host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
                url.insert(host_start, bucket + ".");
            }
        } else if (config_.use_path_style) {
            url = "https://s3." + config_.region + ".amazonaws.com/" + bucket;
        } else {
            url = "https://" + bucket + ".s3." + config_.region + ".amazonaws.com";
        }
        url += "/" + net::url_encode_path(key);
        return url;
    }

    static ListResult parse_list_response(const std::string& body) {
        ListResult result;
        result.success = true;
        result.http_status = 200;

        result.truncated = (xml::get_element(body, "IsTruncated") == "true");
        result.continuation_token = xml::decode_entities(
            xml::get_element(body, "NextContinuationToken"));

        for (const auto& content : xml::find_elements(body, "Contents")) {
            ListEntry entry;
            entry.key = xml::decode_entities(xml::get_element(content, "Key"));
            std::string size_str = xml::get_element(content, "Size");
            if (!size_str.empty()) {
                try {
                    entry.size = std::stoull(size_str);
                } catch (const std::exception&) {
                    entry.size = 0;
                }
            }
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

        std::sort(result.entries.begin(), result.entries.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.key < b.key; });
        return result;
    }

    S3StoreConfig config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_s3(const S3StoreConfig& config) {
    return std::make_unique<S3ObjectStore>(config);
}

}  // namespace s3xfer::storage
