#include "s3xfer/transfer/path_resolver.hpp"
#include "s3xfer/core/constants.hpp"
#include "s3xfer/core/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace s3xfer::transfer {

namespace {

constexpr const char* FILE_SCHEME = "file://";

bool valid_bucket_name(const std::string& bucket) {
    return !bucket.empty() &&
           std::none_of(bucket.begin(), bucket.end(), [](unsigned char c) {
               return std::isspace(c) || c == '\\' || c == '?' || c == '#';
           });
}

}  // namespace

std::string CloudPath::basename() const {
    std::string trimmed = key;
    while (!trimmed.empty() && trimmed.back() == constants::PATH_SEPARATOR) {
        trimmed.pop_back();
    }
    size_t slash = trimmed.find_last_of(constants::PATH_SEPARATOR);
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

PathResolver::PathResolver(std::string default_bucket)
    : default_bucket_(std::move(default_bucket)) {}

ResolvedPath PathResolver::resolve(const std::string& raw) const {
    if (raw.empty()) {
        throw InvalidPathError("empty path");
    }
    if (raw.starts_with(constants::REMOTE_SCHEME)) {
        return parse_uri(raw);
    }
    if (looks_local(raw) || default_bucket_.empty()) {
        return resolve_local(raw);
    }
    return resolve_remote(raw);
}

CloudPath PathResolver::resolve_remote(const std::string& raw) const {
    if (raw.empty()) {
        throw InvalidPathError("empty path");
    }
    if (raw.starts_with(constants::REMOTE_SCHEME)) {
        return parse_uri(raw);
    }
    if (raw.starts_with(FILE_SCHEME)) {
        throw InvalidPathError("expected a remote path, got local URI: " + raw);
    }
    if (default_bucket_.empty()) {
        throw InvalidPathError("no bucket in '" + raw + "' and no default bucket configured");
    }

    size_t start = raw.find_first_not_of(constants::PATH_SEPARATOR);
    std::string key = (start == std::string::npos) ? std::string() : raw.substr(start);
    return CloudPath{default_bucket_, key};
}

LocalPath PathResolver::resolve_local(const std::string& raw) const {
    if (raw.empty()) {
        throw InvalidPathError("empty path");
    }
    if (raw.starts_with(constants::REMOTE_SCHEME)) {
        throw InvalidPathError("expected a local path, got remote URI: " + raw);
    }
    if (raw.starts_with(FILE_SCHEME)) {
        std::string path = raw.substr(std::strlen(FILE_SCHEME));
        if (path.empty()) {
            throw InvalidPathError("file:// URI without a path");
        }
        return LocalPath{path};
    }
    return LocalPath{expand_home(raw)};
}

std::string PathResolver::normalize_directory(const std::string& key) {
    if (key.empty() || key.back() == constants::PATH_SEPARATOR) {
        return key;
    }
    return key + constants::PATH_SEPARATOR;
}

CloudPath PathResolver::normalize_directory(const CloudPath& path) {
    return CloudPath{path.bucket, normalize_directory(path.key)};
}

std::string PathResolver::to_uri(const CloudPath& path) {
    return std::string(constants::REMOTE_SCHEME) + path.bucket + "/" + path.key;
}

std::string PathResolver::to_string(const ResolvedPath& path) {
    if (const auto* cloud = std::get_if<CloudPath>(&path)) {
        return to_uri(*cloud);
    }
    return std::get<LocalPath>(path).path;
}

CloudPath PathResolver::parse_uri(const std::string& raw) {
    std::string rest = raw.substr(std::strlen(constants::REMOTE_SCHEME));
    if (rest.empty() || rest.front() == constants::PATH_SEPARATOR) {
        throw InvalidPathError("missing bucket in '" + raw + "'");
    }

    size_t slash = rest.find(constants::PATH_SEPARATOR);
    CloudPath path;
    path.bucket = rest.substr(0, slash);
    path.key = (slash == std::string::npos) ? std::string() : rest.substr(slash + 1);

    if (!valid_bucket_name(path.bucket)) {
        throw InvalidPathError("invalid bucket name in '" + raw + "'");
    }
    return path;
}

bool PathResolver::looks_local(const std::string& raw) {
    return raw.front() == '/' || raw == "." || raw == ".." || raw == "~" ||
           raw.starts_with("./") || raw.starts_with("../") || raw.starts_with("~/") ||
           raw.starts_with(FILE_SCHEME);
}

std::string PathResolver::expand_home(const std::string& raw) {
    if (raw != "~" && !raw.starts_with("~/")) {
        return raw;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return raw;
    }
    return std::string(home) + raw.substr(1);
}

}  // namespace s3xfer::transfer
