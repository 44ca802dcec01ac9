#include "s3xfer/transfer/copy_orchestrator.hpp"
#include "s3xfer/core/log.hpp"
#include "s3xfer/core/retry_policy.hpp"
#include "s3xfer/metrics.hpp"
#include "s3xfer/transfer/strategy.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <unistd.h>

namespace s3xfer::transfer {

namespace fs = std::filesystem;

namespace {

/// mkstemp file owned by one copy, removed on every exit path.
class TempFile {
public:
    explicit TempFile(const std::string& dir) {
        std::error_code ec;
        fs::path base = dir.empty() ? fs::temp_directory_path(ec) : fs::path(dir);
        if (ec) base = "/tmp";
        std::string pattern = (base / "s3xfer-copy-XXXXXX").string();
        int fd = ::mkstemp(pattern.data());
        if (fd < 0) {
            error_ = "cannot create temp file in " + base.string() + ": " + std::strerror(errno);
            return;
        }
        ::close(fd);
        path_ = pattern;
    }

    ~TempFile() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
};

CloudPath with_basename(CloudPath destination, const std::string& basename) {
    if (destination.is_directory()) {
        destination.key += basename;
    }
    return destination;
}

}  // namespace

CopyOrchestrator::CopyOrchestrator(storage::ObjectStore& store, UploadEngine& uploader,
                                   DownloadEngine& downloader, TransferMetrics* metrics)
    : store_(store), uploader_(uploader), downloader_(downloader), metrics_(metrics) {}

TransferResult CopyOrchestrator::copy(const ResolvedPath& source, const ResolvedPath& destination,
                                      const TransferOptions& options,
                                      const CancellationToken& cancel) {
    if (const auto* src = std::get_if<CloudPath>(&source)) {
        if (src->is_directory()) {
            return make_error<TransferResult>(ErrorKind::InvalidPath,
                "source is a directory: " + PathResolver::to_uri(*src));
        }
        if (const auto* dst = std::get_if<CloudPath>(&destination)) {
            return copy_remote(*src, with_basename(*dst, src->basename()), options, cancel);
        }
        return downloader_.download(*src, std::get<LocalPath>(destination), options, cancel);
    }

    const auto& src = std::get<LocalPath>(source);
    if (src.is_directory_form()) {
        return make_error<TransferResult>(ErrorKind::InvalidPath, "source is a directory: " + src.path);
    }
    if (const auto* dst = std::get_if<CloudPath>(&destination)) {
        return uploader_.upload(src, with_basename(*dst, fs::path(src.path).filename().string()),
                                options, cancel);
    }
    return copy_local(src, std::get<LocalPath>(destination));
}

TransferResult CopyOrchestrator::copy_remote(const CloudPath& source, const CloudPath& destination,
                                             const TransferOptions& options,
                                             const CancellationToken& cancel) {
    ActiveTransfer active(metrics_);
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->copy_duration());

    bool fell_back = false;
    auto record = [&](TransferResult result) {
        if (metrics_) metrics_->record_copy(result.success, fell_back);
        return result;
    };

    auto head = with_retry<storage::HeadResult>(options.retry, cancel, [&] {
        return store_.head(source.bucket, source.key);
    });
    if (!head.success) {
        return record(make_error<TransferResult>(head.error_kind,
            "head " + PathResolver::to_uri(source) + ": " + head.error_message));
    }

    auto strategy = choose_copy_strategy(head.metadata.size);
    if (auto* two_phase = std::get_if<TwoPhase>(&strategy)) {
        log_debug("copy %s: %s", PathResolver::to_uri(source).c_str(), two_phase->reason.c_str());
        fell_back = true;
        return record(copy_two_phase(source, head.metadata, destination, options, cancel));
    }

    auto copied = with_retry<storage::PutResult>(options.retry, cancel, [&] {
        return store_.copy_object(source.bucket, source.key, destination.bucket, destination.key);
    });
    if (copied.success) {
        auto result = TransferResult::ok(strategy_name(strategy));
        result.bytes_transferred = head.metadata.size;
        result.parts = 1;
        result.metadata = head.metadata;
        result.metadata.etag = copied.etag;
        return record(std::move(result));
    }

    switch (copied.error_kind) {
        case ErrorKind::NotFound:
        case ErrorKind::AccessDenied:
        case ErrorKind::Aborted:
            return record(make_error<TransferResult>(copied.error_kind,
                "copy " + PathResolver::to_uri(source) + ": " + copied.error_message));
        default:
            break;
    }

    log_warn("server-side copy %s -> %s failed (%s), copying through a temp file",
             PathResolver::to_uri(source).c_str(), PathResolver::to_uri(destination).c_str(),
             copied.error_message.c_str());
    fell_back = true;
    return record(copy_two_phase(source, head.metadata, destination, options, cancel));
}

TransferResult CopyOrchestrator::copy_two_phase(const CloudPath& source,
                                                const storage::ObjectMetadata& meta,
                                                const CloudPath& destination,
                                                const TransferOptions& options,
                                                const CancellationToken& cancel) {
    TempFile temp(options.temp_dir);
    if (!temp.ok()) {
        return make_error<TransferResult>(ErrorKind::Io, temp.error());
    }

    auto down = downloader_.download(source, LocalPath{temp.path()}, options, cancel);
    if (!down.success) {
        down.error_message = "two-phase copy download: " + down.error_message;
        return down;
    }

    // Carry the source attributes over unless the caller overrides them
    TransferOptions upload_options = options;
    if (upload_options.content_type.empty()) upload_options.content_type = meta.content_type;
    for (const auto& [key, value] : meta.user_metadata) {
        upload_options.metadata.emplace(key, value);
    }

    auto up = uploader_.upload(LocalPath{temp.path()}, destination, upload_options, cancel);
    if (!up.success) {
        up.error_message = "two-phase copy upload: " + up.error_message;
        return up;
    }
    up.strategy = strategy_name(CopyStrategy{TwoPhase{}});
    return up;
}

TransferResult CopyOrchestrator::copy_local(const LocalPath& source, const LocalPath& destination) {
    fs::path src(source.path);
    std::error_code ec;
    if (!fs::exists(src, ec)) {
        return make_error<TransferResult>(ErrorKind::NotFound, "source not found: " + source.path);
    }
    if (!fs::is_regular_file(src, ec)) {
        return make_error<TransferResult>(ErrorKind::InvalidPath, "source is not a file: " + source.path);
    }

    fs::path dst(destination.path);
    if (destination.is_directory_form() || fs::is_directory(dst, ec)) {
        dst /= src.filename();
    }
    if (dst.has_parent_path()) {
        fs::create_directories(dst.parent_path(), ec);
        if (ec) {
            return make_error<TransferResult>(ErrorKind::Io,
                "cannot create " + dst.parent_path().string() + ": " + ec.message());
        }
    }

    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return make_error<TransferResult>(ErrorKind::Io,
            "cannot copy " + source.path + " to " + dst.string() + ": " + ec.message());
    }

    auto result = TransferResult::ok("local");
    result.bytes_transferred = fs::file_size(dst, ec);
    result.metadata.size = result.bytes_transferred;
    result.parts = 1;
    return result;
}

}  // namespace s3xfer::transfer
