#include "s3xfer/storage/object_store.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace s3xfer::storage {

namespace {

bool parse_flag(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

uint32_t parse_secs(const std::string& name, const std::string& value) {
    try {
        return static_cast<uint32_t>(std::stoul(value));
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for '" + name + "': " + value);
    }
}

}  // namespace

std::unique_ptr<ObjectStore> ObjectStoreFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& config) {

    if (type == "local") {
        auto it = config.find("path");
        if (it == config.end() || it->second.empty()) {
            throw std::runtime_error("Local store requires 'path' config");
        }
        return create_local(it->second);
    }

    if (type == "s3") {
        S3StoreConfig s3_config;

        auto it = config.find("region");
        if (it != config.end() && !it->second.empty()) {
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
        if ((it = config.find("session_token")) != config.end()) {
            s3_config.session_token = it->second;
        }
        if ((it = config.find("use_path_style")) != config.end()) {
            s3_config.use_path_style = parse_flag(it->second);
        }
        if ((it = config.find("verify_ssl")) != config.end()) {
            s3_config.verify_ssl = parse_flag(it->second);
        }
        if ((it = config.find("unsigned_payload")) != config.end()) {
            s3_config.unsigned_payload = parse_flag(it->second);
        }
        if ((it = config.find("connect_timeout")) != config.end()) {
            s3_config.connect_timeout_secs = parse_secs(it->first, it->second);
        }
        if ((it = config.find("request_timeout")) != config.end()) {
            s3_config.request_timeout_secs = parse_secs(it->first, it->second);
        }

        if (s3_config.access_key.empty() || s3_config.secret_key.empty()) {
            throw std::runtime_error("S3 store requires 'access_key' and 'secret_key' "
                                     "(or AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY)");
        }
        return create_s3(s3_config);
    }

    throw std::runtime_error("Unknown object store type: " + type);
}

std::string guess_content_type(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> types = {
        {"txt", "text/plain"},
        {"log", "text/plain"},
        {"md", "text/markdown"},
        {"csv", "text/csv"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"js", "application/javascript"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"yaml", "application/yaml"},
        {"yml", "application/yaml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"parquet", "application/vnd.apache.parquet"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
        {"webp", "image/webp"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
    };

    size_t slash = filename.find_last_of('/');
    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "application/octet-stream";
    }

    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

}  // namespace s3xfer::storage
