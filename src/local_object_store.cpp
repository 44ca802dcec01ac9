#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/core/constants.hpp"
#include "s3xfer/core/log.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace s3xfer::storage {

namespace fs = std::filesystem;

namespace {

// Object keys become flat file names: everything except [A-Za-z0-9_~-] is
// percent-encoded, so encoded names never contain '.' or '/'. Any directory
// entry holding a '.' is therefore a sidecar or temp file, never an object.
std::string encode_name(const std::string& key) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::optional<std::string> decode_name(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] == '.') return std::nullopt;
        if (name[i] != '%') {
            key += name[i];
            continue;
        }
        if (i + 2 >= name.size()) return std::nullopt;
        int hi = hex_value(name[i + 1]);
        int lo = hex_value(name[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        key += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return key;
}

// Incremental MD5 for S3-compatible ETags
class Md5 {
public:
    Md5() : ctx_(EVP_MD_CTX_new()) {
        EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr);
    }
    ~Md5() { EVP_MD_CTX_free(ctx_); }

    Md5(const Md5&) = delete;
    Md5& operator=(const Md5&) = delete;

    void update(const void* data, size_t size) {
        EVP_DigestUpdate(ctx_, data, size);
    }

    std::vector<uint8_t> digest() {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        EVP_DigestFinal_ex(ctx_, out, &len);
        return std::vector<uint8_t>(out, out + len);
    }

    std::string hex_digest() {
        auto raw = digest();
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (uint8_t b : raw) oss << std::setw(2) << static_cast<int>(b);
        return oss.str();
    }

private:
    EVP_MD_CTX* ctx_;
};

std::vector<uint8_t> hex_to_bytes(const std::string& hex) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) break;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string random_hex(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return {};
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char b : buf) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
}

std::chrono::system_clock::time_point to_system_time(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

// Sidecar and upload descriptor files: one "name=value" per line,
// both halves percent-encoded.
using KeyValues = std::map<std::string, std::string>;

bool write_kv_file(const fs::path& path, const KeyValues& values) {
    auto temp = path;
    temp += ".tmp" + random_hex(4);
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) return false;
        for (const auto& [name, value] : values) {
            file << encode_name(name) << '=' << encode_name(value) << '\n';
        }
        if (!file) {
            std::error_code ec;
            fs::remove(temp, ec);
            return false;
        }
    }
    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

KeyValues read_kv_file(const fs::path& path) {
    KeyValues values;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto name = decode_name(line.substr(0, eq));
        auto value = decode_name(line.substr(eq + 1));
        if (name && value) values[*name] = *value;
    }
    return values;
}

constexpr const char* META_PREFIX = "meta:";

KeyValues metadata_to_kv(const std::string& content_type, const std::string& etag,
                         const std::map<std::string, std::string>& user_metadata) {
    KeyValues kv;
    kv["content-type"] = content_type;
    if (!etag.empty()) kv["etag"] = etag;
    for (const auto& [name, value] : user_metadata) {
        kv[META_PREFIX + name] = value;
    }
    return kv;
}

void kv_to_metadata(const KeyValues& kv, ObjectMetadata& meta) {
    auto it = kv.find("content-type");
    meta.content_type = (it != kv.end()) ? it->second : "application/octet-stream";
    if ((it = kv.find("etag")) != kv.end()) meta.etag = it->second;
    for (const auto& [name, value] : kv) {
        if (name.starts_with(META_PREFIX)) {
            meta.user_metadata[name.substr(std::strlen(META_PREFIX))] = value;
        }
    }
}

template <typename Result>
Result status_error(int http_status, std::string message) {
    auto result = make_error<Result>(error_kind_from_http_status(http_status), std::move(message));
    result.http_status = http_status;
    return result;
}

template <typename Result>
Result io_error(std::string message) {
    return make_error<Result>(ErrorKind::Io, std::move(message));
}

std::string quote_etag(const std::string& hex) {
    return "\"" + hex + "\"";
}

}  // namespace

// ============================================================================
// LocalObjectStore - filesystem-backed object store
//
// Layout:
//   <root>/<bucket>/<encoded key>        object data
//   <root>/<bucket>/<encoded key>.meta   content type, etag, user metadata
//   <root>/.multipart/<upload id>/       target descriptor, metadata, parts
// ============================================================================

class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(const fs::path& root)
        : root_(fs::absolute(root)) {
        fs::create_directories(root_ / MULTIPART_DIR);
    }

    std::string type_name() const override { return "local"; }

    HeadResult head(const std::string& bucket, const std::string& key) const override {
        if (auto reason = invalid_name(bucket, key); !reason.empty()) {
            return make_error<HeadResult>(ErrorKind::InvalidPath, reason);
        }

        std::shared_lock lock(mutex_);
        auto path = object_path(bucket, key);
        std::error_code ec;
        auto status = fs::status(path, ec);
        if (ec || !fs::is_regular_file(status)) {
            return status_error<HeadResult>(404, "NoSuchKey: " + bucket + "/" + key);
        }

        HeadResult result;
        result.success = true;
        result.http_status = 200;
        result.metadata.size = fs::file_size(path, ec);
        result.metadata.last_modified = to_system_time(fs::last_write_time(path, ec));
        kv_to_metadata(read_kv_file(sidecar_path(bucket, key)), result.metadata);
        return result;
    }

    GetResult get(const std::string& bucket, const std::string& key,
                  const GetOptions& options) const override {
        if (auto reason = invalid_name(bucket, key); !reason.empty()) {
            return make_error<GetResult>(ErrorKind::InvalidPath, reason);
        }

        // Open under the lock; the open stream keeps reading the same inode
        // even if a concurrent put replaces the object.
        std::ifstream file;
        ObjectMetadata meta;
        {
            std::shared_lock lock(mutex_);
            auto path = object_path(bucket, key);
            file.open(path, std::ios::binary);
            if (!file) {
                return status_error<GetResult>(404, "NoSuchKey: " + bucket + "/" + key);
            }
            std::error_code ec;
            meta.size = fs::file_size(path, ec);
            meta.last_modified = to_system_time(fs::last_write_time(path, ec));
            kv_to_metadata(read_kv_file(sidecar_path(bucket, key)), meta);
        }

        if (options.if_match && *options.if_match != meta.etag) {
            return status_error<GetResult>(412, "PreconditionFailed: ETag changed for " + key);
        }

        uint64_t start = options.range_start.value_or(0);
        uint64_t end = std::min(options.range_end.value_or(meta.size), meta.size);
        bool ranged = options.range_start.has_value() || options.range_end.has_value();
        if (ranged && (start >= meta.size || start >= end)) {
            return status_error<GetResult>(416, "InvalidRange: bytes " + std::to_string(start) +
                                                    "-" + std::to_string(end) + " of " +
                                                    std::to_string(meta.size));
        }

        GetResult result;
        result.metadata = meta;
        file.seekg(static_cast<std::streamoff>(start));

        uint64_t remaining = end - start;
        if (options.sink) {
            std::vector<char> buffer(std::min<uint64_t>(remaining, constants::MiB));
            while (remaining > 0) {
                size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
                file.read(buffer.data(), static_cast<std::streamsize>(want));
                if (!file) {
                    return io_error<GetResult>("Failed to read object data: " + key);
                }
                if (!options.sink(reinterpret_cast<const uint8_t*>(buffer.data()), want)) {
                    return io_error<GetResult>("Read aborted by sink: " + key);
                }
                remaining -= want;
                result.bytes_received += want;
            }
        } else {
            result.data.resize(remaining);
            file.read(reinterpret_cast<char*>(result.data.data()),
                      static_cast<std::streamsize>(remaining));
            if (!file) {
                return io_error<GetResult>("Failed to read object data: " + key);
            }
            result.bytes_received = remaining;
        }

        result.success = true;
        result.http_status = ranged ? 206 : 200;
        return result;
    }

    PutResult put(const std::string& bucket, const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        if (auto reason = invalid_name(bucket, key); !reason.empty()) {
            return make_error<PutResult>(ErrorKind::InvalidPath, reason);
        }

        std::error_code ec;
        fs::create_directories(bucket_dir(bucket), ec);
        auto temp = temp_path(bucket);
        Md5 md5;
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return io_error<PutResult>("Failed to create file for " + key);
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                fs::remove(temp, ec);
                return io_error<PutResult>("Failed to write data for " + key);
            }
        }
        md5.update(data.data(), data.size());

        return commit_object(bucket, key, temp, quote_etag(md5.hex_digest()),
                             options.content_type, options.metadata);
    }

    MultipartInitResult initiate_multipart(const std::string& bucket,
                                           const std::string& key,
                                           const PutOptions& options) override {
        if (auto reason = invalid_name(bucket, key); !reason.empty()) {
            return make_error<MultipartInitResult>(ErrorKind::InvalidPath, reason);
        }

        std::string upload_id = random_hex(16);
        if (upload_id.empty()) {
            return io_error<MultipartInitResult>("Failed to generate upload id");
        }

        auto dir = upload_dir(upload_id);
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return io_error<MultipartInitResult>("Failed to create upload directory: " + ec.message());
        }

        auto initiated = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        KeyValues target{{"bucket", bucket}, {"key", key}, {"initiated", std::to_string(initiated)}};
        if (!write_kv_file(dir / "target", target) ||
            !write_kv_file(dir / "meta", metadata_to_kv(options.content_type, "", options.metadata))) {
            fs::remove_all(dir, ec);
            return io_error<MultipartInitResult>("Failed to write upload descriptor");
        }

        MultipartInitResult result;
        result.success = true;
        result.http_status = 200;
        result.upload_id = upload_id;
        return result;
    }

    PutResult upload_part(const std::string& bucket, const std::string& key,
                          const std::string& upload_id, uint32_t part_number,
                          std::span<const uint8_t> data,
                          std::chrono::milliseconds /*timeout*/) override {
        if (part_number < 1 || part_number > constants::MAX_PART_COUNT) {
            return status_error<PutResult>(400, "InvalidArgument: part number " +
                                                    std::to_string(part_number));
        }
        if (!upload_matches(upload_id, bucket, key)) {
            return status_error<PutResult>(404, "NoSuchUpload: " + upload_id);
        }

        auto dir = upload_dir(upload_id);
        auto part = part_path(upload_id, part_number);
        auto temp = part;
        temp += ".tmp" + random_hex(4);
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                std::error_code ec;
                fs::remove(temp, ec);
                return io_error<PutResult>("Failed to write part " + std::to_string(part_number));
            }
        }

        Md5 md5;
        md5.update(data.data(), data.size());
        std::string etag = quote_etag(md5.hex_digest());

        std::error_code ec;
        fs::rename(temp, part, ec);
        if (ec || !write_kv_file(dir / ("etag-" + std::to_string(part_number)), {{"etag", etag}})) {
            fs::remove(temp, ec);
            return io_error<PutResult>("Failed to store part " + std::to_string(part_number));
        }

        PutResult result;
        result.success = true;
        result.http_status = 200;
        result.etag = etag;
        return result;
    }

    PutResult complete_multipart(const std::string& bucket, const std::string& key,
                                 const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override {
        if (!upload_matches(upload_id, bucket, key)) {
            return status_error<PutResult>(404, "NoSuchUpload: " + upload_id);
        }
        if (parts.empty()) {
            return status_error<PutResult>(400, "MalformedXML: no parts");
        }

        auto dir = upload_dir(upload_id);
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0 && parts[i].part_number <= parts[i - 1].part_number) {
                return status_error<PutResult>(400, "InvalidPartOrder");
            }
            auto stored = read_kv_file(dir / ("etag-" + std::to_string(parts[i].part_number)));
            if (stored["etag"].empty() || stored["etag"] != parts[i].etag) {
                return status_error<PutResult>(400, "InvalidPart: " +
                                                        std::to_string(parts[i].part_number));
            }
        }

        std::error_code ec;
        fs::create_directories(bucket_dir(bucket), ec);
        auto temp = temp_path(bucket);
        Md5 combined;
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return io_error<PutResult>("Failed to create file for " + key);
            }
            std::vector<char> buffer(constants::MiB);
            for (const auto& part : parts) {
                std::ifstream in(part_path(upload_id, part.part_number), std::ios::binary);
                while (in) {
                    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                    out.write(buffer.data(), in.gcount());
                }
                std::string hex = part.etag.substr(1, part.etag.size() - 2);
                auto raw = hex_to_bytes(hex);
                combined.update(raw.data(), raw.size());
            }
            if (!out) {
                fs::remove(temp, ec);
                return io_error<PutResult>("Failed to assemble parts for " + key);
            }
        }

        ObjectMetadata meta;
        kv_to_metadata(read_kv_file(dir / "meta"), meta);
        std::string etag = quote_etag(combined.hex_digest() + "-" + std::to_string(parts.size()));
        auto result = commit_object(bucket, key, temp, etag, meta.content_type, meta.user_metadata);
        if (result.success) {
            fs::remove_all(dir, ec);
        }
        return result;
    }

    OpResult abort_multipart(const std::string& bucket, const std::string& key,
                             const std::string& upload_id) override {
        if (!upload_matches(upload_id, bucket, key)) {
            return status_error<OpResult>(404, "NoSuchUpload: " + upload_id);
        }
        std::error_code ec;
        fs::remove_all(upload_dir(upload_id), ec);
        if (ec) {
            return io_error<OpResult>("Failed to remove upload " + upload_id + ": " + ec.message());
        }
        OpResult result;
        result.success = true;
        result.http_status = 204;
        return result;
    }

    MultipartListResult list_multipart_uploads(const std::string& bucket,
                                               const std::string& prefix) const override {
        MultipartListResult result;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(root_ / MULTIPART_DIR, ec)) {
            if (!entry.is_directory()) continue;
            auto target = read_kv_file(entry.path() / "target");
            if (target["bucket"] != bucket || !target["key"].starts_with(prefix)) continue;

            MultipartUploadInfo info;
            info.key = target["key"];
            info.upload_id = entry.path().filename().string();
            try {
                info.initiated = std::chrono::system_clock::time_point(
                    std::chrono::seconds(std::stoll(target["initiated"])));
            } catch (const std::exception&) {
                info.initiated = {};
            }
            result.uploads.push_back(std::move(info));
        }
        if (ec) {
            return io_error<MultipartListResult>("Failed to scan uploads: " + ec.message());
        }
        std::sort(result.uploads.begin(), result.uploads.end(),
                  [](const auto& a, const auto& b) { return a.key < b.key; });
        result.success = true;
        result.http_status = 200;
        return result;
    }

    PutResult copy_object(const std::string& source_bucket, const std::string& source_key,
                          const std::string& dest_bucket, const std::string& dest_key) override {
        if (auto reason = invalid_name(source_bucket, source_key); !reason.empty()) {
            return make_error<PutResult>(ErrorKind::InvalidPath, reason);
        }
        if (auto reason = invalid_name(dest_bucket, dest_key); !reason.empty()) {
            return make_error<PutResult>(ErrorKind::InvalidPath, reason);
        }

        std::ifstream in;
        ObjectMetadata meta;
        {
            std::shared_lock lock(mutex_);
            auto path = object_path(source_bucket, source_key);
            in.open(path, std::ios::binary);
            if (!in) {
                return status_error<PutResult>(404, "NoSuchKey: " + source_bucket + "/" + source_key);
            }
            std::error_code ec;
            meta.size = fs::file_size(path, ec);
            kv_to_metadata(read_kv_file(sidecar_path(source_bucket, source_key)), meta);
        }
        if (meta.size > constants::MAX_SERVER_SIDE_COPY_SIZE) {
            return status_error<PutResult>(400, "InvalidRequest: copy source larger than 5 GiB");
        }

        std::error_code ec;
        fs::create_directories(bucket_dir(dest_bucket), ec);
        auto temp = temp_path(dest_bucket);
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            out << in.rdbuf();
            if (!out) {
                fs::remove(temp, ec);
                return io_error<PutResult>("Failed to copy " + source_key);
            }
        }
        return commit_object(dest_bucket, dest_key, temp, meta.etag,
                             meta.content_type, meta.user_metadata);
    }

    OpResult remove(const std::string& bucket, const std::string& key) override {
        if (auto reason = invalid_name(bucket, key); !reason.empty()) {
            return make_error<OpResult>(ErrorKind::InvalidPath, reason);
        }

        std::unique_lock lock(mutex_);
        std::error_code ec;
        fs::remove(object_path(bucket, key), ec);
        if (ec) {
            return io_error<OpResult>("Failed to remove " + key + ": " + ec.message());
        }
        fs::remove(sidecar_path(bucket, key), ec);

        OpResult result;
        result.success = true;
        result.http_status = 204;
        return result;
    }

    BatchDeleteResult remove_batch(const std::string& bucket,
                                   const std::vector<std::string>& keys) override {
        if (auto reason = invalid_bucket(bucket); !reason.empty()) {
            return make_error<BatchDeleteResult>(ErrorKind::InvalidPath, reason);
        }
        BatchDeleteResult batch;
        batch.success = true;
        batch.http_status = 200;
        for (const auto& key : keys) {
            auto result = remove(bucket, key);
            if (!result.success) {
                log_debug("remove_batch: %s: %s", key.c_str(), result.error_message.c_str());
                batch.failed_keys.push_back(key);
            }
        }
        return batch;
    }

    ListResult list(const std::string& bucket, const ListOptions& options) const override {
        if (auto reason = invalid_bucket(bucket); !reason.empty()) {
            return make_error<ListResult>(ErrorKind::InvalidPath, reason);
        }

        ListResult result;
        std::vector<ListEntry> all;
        {
            std::shared_lock lock(mutex_);
            std::error_code ec;
            auto dir = bucket_dir(bucket);
            // A bucket nobody has written to yet lists as empty
            if (!fs::exists(dir, ec)) {
                result.success = true;
                result.http_status = 200;
                return result;
            }

            for (const auto& entry : fs::directory_iterator(dir, ec)) {
                auto key = decode_name(entry.path().filename().string());
                if (!key || !key->starts_with(options.prefix) || !entry.is_regular_file()) {
                    continue;
                }

                if (!options.delimiter.empty()) {
                    size_t pos = key->find(options.delimiter, options.prefix.size());
                    if (pos != std::string::npos) {
                        ListEntry prefix_entry;
                        prefix_entry.key = key->substr(0, pos + options.delimiter.size());
                        prefix_entry.is_directory = true;
                        all.push_back(std::move(prefix_entry));
                        continue;
                    }
                }

                ListEntry le;
                le.key = *key;
                le.size = entry.file_size(ec);
                le.last_modified = to_system_time(entry.last_write_time(ec));
                le.etag = read_kv_file(sidecar_path(bucket, *key))["etag"];
                all.push_back(std::move(le));
            }
            if (ec) {
                return io_error<ListResult>("Failed to list bucket " + bucket + ": " + ec.message());
            }
        }

        std::sort(all.begin(), all.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.key < b.key; });
        all.erase(std::unique(all.begin(), all.end(),
                              [](const ListEntry& a, const ListEntry& b) { return a.key == b.key; }),
                  all.end());

        // Continuation token is the last key of the previous page
        auto it = all.begin();
        if (!options.continuation_token.empty()) {
            it = std::upper_bound(all.begin(), all.end(), options.continuation_token,
                                  [](const std::string& token, const ListEntry& e) { return token < e.key; });
        }

        uint32_t max_keys = options.max_keys == 0 ? constants::LIST_PAGE_SIZE : options.max_keys;
        for (; it != all.end() && result.entries.size() < max_keys; ++it) {
            result.entries.push_back(*it);
        }
        if (it != all.end()) {
            result.truncated = true;
            result.continuation_token = result.entries.back().key;
        }

        result.success = true;
        result.http_status = 200;
        return result;
    }

    PresignResult presign(const std::string& bucket, const std::string& key,
                          const PresignOptions& /*options*/) const override {
        if (auto reason = invalid_name(bucket, key); !reason.empty()) {
            return make_error<PresignResult>(ErrorKind::InvalidPath, reason);
        }
        PresignResult result;
        result.success = true;
        result.url = "file://" + object_path(bucket, key).string();
        return result;
    }

private:
    static constexpr const char* MULTIPART_DIR = ".multipart";

    static std::string invalid_bucket(const std::string& bucket) {
        if (bucket.empty() || bucket.front() == '.' ||
            bucket.find('/') != std::string::npos || bucket.find('\\') != std::string::npos) {
            return "Invalid bucket name: '" + bucket + "'";
        }
        return {};
    }

    static std::string invalid_name(const std::string& bucket, const std::string& key) {
        if (auto reason = invalid_bucket(bucket); !reason.empty()) {
            return reason;
        }
        if (key.empty()) {
            return "Empty object key in bucket " + bucket;
        }
        return {};
    }

    fs::path bucket_dir(const std::string& bucket) const {
        return root_ / bucket;
    }

    fs::path object_path(const std::string& bucket, const std::string& key) const {
        return bucket_dir(bucket) / encode_name(key);
    }

    fs::path sidecar_path(const std::string& bucket, const std::string& key) const {
        auto path = object_path(bucket, key);
        path += ".meta";
        return path;
    }

    fs::path temp_path(const std::string& bucket) const {
        return bucket_dir(bucket) / (".incoming." + random_hex(8));
    }

    fs::path upload_dir(const std::string& upload_id) const {
        return root_ / MULTIPART_DIR / upload_id;
    }

    fs::path part_path(const std::string& upload_id, uint32_t part_number) const {
        return upload_dir(upload_id) / ("part-" + std::to_string(part_number));
    }

    bool upload_matches(const std::string& upload_id, const std::string& bucket,
                        const std::string& key) const {
        if (upload_id.empty() || upload_id.find('/') != std::string::npos ||
            upload_id.find('.') != std::string::npos) {
            return false;
        }
        auto target = read_kv_file(upload_dir(upload_id) / "target");
        return target["bucket"] == bucket && target["key"] == key;
    }

    // Publish a fully written temp file as the object, with its sidecar
    PutResult commit_object(const std::string& bucket, const std::string& key,
                            const fs::path& temp, const std::string& etag,
                            const std::string& content_type,
                            const std::map<std::string, std::string>& user_metadata) {
        std::unique_lock lock(mutex_);
        std::error_code ec;
        fs::rename(temp, object_path(bucket, key), ec);
        if (ec) {
            fs::remove(temp, ec);
            return io_error<PutResult>("Failed to publish " + key + ": " + ec.message());
        }
        if (!write_kv_file(sidecar_path(bucket, key),
                           metadata_to_kv(content_type, etag, user_metadata))) {
            return io_error<PutResult>("Failed to write metadata for " + key);
        }

        PutResult result;
        result.success = true;
        result.http_status = 200;
        result.etag = etag;
        return result;
    }

    fs::path root_;
    // Guards the data/sidecar pair of every object
    mutable std::shared_mutex mutex_;
};

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_local(const fs::path& root_path) {
    return std::make_unique<LocalObjectStore>(root_path);
}

}  // namespace s3xfer::storage
