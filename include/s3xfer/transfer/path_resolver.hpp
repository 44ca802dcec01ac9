#pragma once

#include <optional>
#include <string>
#include <variant>

namespace s3xfer::transfer {

/// A bucket/key address in the object store.
/// A key that is empty or ends in '/' addresses a directory.
struct CloudPath {
    std::string bucket;
    std::string key;

    bool is_directory() const { return key.empty() || key.back() == '/'; }

    /// Last key component, without a trailing '/'.
    std::string basename() const;

    bool operator==(const CloudPath&) const = default;
};

/// A local filesystem path, kept as given so a trailing '/' survives.
struct LocalPath {
    std::string path;

    bool is_directory_form() const { return !path.empty() && path.back() == '/'; }

    bool operator==(const LocalPath&) const = default;
};

using ResolvedPath = std::variant<CloudPath, LocalPath>;

inline bool is_remote(const ResolvedPath& p) { return std::holds_alternative<CloudPath>(p); }

/// Classifies raw path strings as local or remote.
///
///   s3://bucket/key      remote
///   s3://bucket[/]       remote, bucket root (empty key)
///   /abs, ./x, ../x, ~/x local
///   file:///abs          local
///   bare/key             remote against the default bucket when one is
///                        configured, otherwise a relative local path
///
/// Pure string manipulation; never touches the filesystem or the network.
class PathResolver {
public:
    explicit PathResolver(std::string default_bucket = "");

    /// Throws InvalidPathError for an empty string or a malformed s3:// URI.
    ResolvedPath resolve(const std::string& raw) const;

    /// Resolve a path that must be remote. Bare keys use the default bucket
    /// (leading '/' stripped); throws InvalidPathError when there is none.
    CloudPath resolve_remote(const std::string& raw) const;

    /// Resolve a path that must be local. Throws InvalidPathError on s3:// URIs.
    LocalPath resolve_local(const std::string& raw) const;

    const std::string& default_bucket() const { return default_bucket_; }

    /// Append '/' unless already present. Empty stays empty (bucket root).
    static std::string normalize_directory(const std::string& key);
    static CloudPath normalize_directory(const CloudPath& path);

    /// Render s3://bucket/key
    static std::string to_uri(const CloudPath& path);

    static std::string to_string(const ResolvedPath& path);

private:
    static CloudPath parse_uri(const std::string& raw);
    static bool looks_local(const std::string& raw);
    static std::string expand_home(const std::string& raw);

    std::string default_bucket_;
};

}  // namespace s3xfer::transfer
