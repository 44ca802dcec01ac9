#include "s3xfer/transfer/transfer_service.hpp"
#include "s3xfer/core/retry_policy.hpp"

#include <algorithm>
#include <filesystem>

namespace s3xfer::transfer {

namespace fs = std::filesystem;

namespace {

BatchReport rejected_batch(size_t index, const std::string& message) {
    BatchReport report;
    report.results.push_back(make_error<TransferResult>(ErrorKind::InvalidPath, message));
    report.result_indices.push_back(index);
    report.errors.push_back({index, message});
    return report;
}

}  // namespace

TransferService::TransferService(storage::ObjectStore& store, std::string default_bucket,
                                 TransferOptions defaults, SessionJournal* journal,
                                 TransferMetrics* metrics)
    : store_(store)
    , resolver_(std::move(default_bucket))
    , defaults_(std::move(defaults))
    , uploader_(store, journal, metrics)
    , downloader_(store, metrics)
    , orchestrator_(store, uploader_, downloader_, metrics)
    , batches_(orchestrator_)
    , directories_(store, orchestrator_) {}

TransferResult TransferService::upload(const std::string& source, const std::string& destination) {
    return upload(source, destination, defaults_);
}

TransferResult TransferService::upload(const std::string& source, const std::string& destination,
                                       const TransferOptions& options) {
    try {
        LocalPath src = resolver_.resolve_local(source);
        CloudPath dst = resolver_.resolve_remote(destination);
        if (dst.is_directory()) {
            dst.key += fs::path(src.path).filename().string();
        }
        return uploader_.upload(src, dst, options, cancel_);
    } catch (const InvalidPathError& e) {
        return invalid_path<TransferResult>(e);
    }
}

TransferResult TransferService::download(const std::string& source, const std::string& destination) {
    return download(source, destination, defaults_);
}

TransferResult TransferService::download(const std::string& source, const std::string& destination,
                                         const TransferOptions& options) {
    try {
        return downloader_.download(resolver_.resolve_remote(source),
                                    resolver_.resolve_local(destination), options, cancel_);
    } catch (const InvalidPathError& e) {
        return invalid_path<TransferResult>(e);
    }
}

BatchReport TransferService::batch_upload(const std::vector<std::string>& sources,
                                          const std::vector<std::string>& destinations,
                                          size_t concurrency, bool fail_fast) {
    return run_pairs(sources, destinations, concurrency, fail_fast, true);
}

BatchReport TransferService::batch_download(const std::vector<std::string>& sources,
                                            const std::vector<std::string>& destinations,
                                            size_t concurrency, bool fail_fast) {
    return run_pairs(sources, destinations, concurrency, fail_fast, false);
}

BatchReport TransferService::run_pairs(const std::vector<std::string>& sources,
                                       const std::vector<std::string>& destinations,
                                       size_t concurrency, bool fail_fast, bool uploading) {
    TransferOptions options = defaults_;
    options.concurrency = std::max<size_t>(concurrency, 1);
    options.fail_fast = fail_fast;

    if (sources.size() != destinations.size()) {
        return rejected_batch(0, "batch has " + std::to_string(sources.size()) + " sources but " +
                                 std::to_string(destinations.size()) + " destinations");
    }

    // Every path is resolved before any transfer starts
    std::vector<LocalPath> local;
    std::vector<CloudPath> remote;
    for (size_t i = 0; i < sources.size(); ++i) {
        try {
            if (uploading) {
                local.push_back(resolver_.resolve_local(sources[i]));
                CloudPath dst = resolver_.resolve_remote(destinations[i]);
                if (dst.is_directory()) {
                    dst.key += fs::path(local.back().path).filename().string();
                }
                remote.push_back(std::move(dst));
            } else {
                remote.push_back(resolver_.resolve_remote(sources[i]));
                local.push_back(resolver_.resolve_local(destinations[i]));
            }
        } catch (const InvalidPathError& e) {
            return rejected_batch(i, e.what());
        }
    }

    return uploading ? batches_.batch_upload(local, remote, options, cancel_)
                     : batches_.batch_download(remote, local, options, cancel_);
}

TransferResult TransferService::copy(const std::string& source, const std::string& destination) {
    return copy(source, destination, defaults_);
}

TransferResult TransferService::copy(const std::string& source, const std::string& destination,
                                     const TransferOptions& options) {
    try {
        return orchestrator_.copy(resolver_.resolve(source), resolver_.resolve(destination),
                                  options, cancel_);
    } catch (const InvalidPathError& e) {
        return invalid_path<TransferResult>(e);
    }
}

TransferResult TransferService::remove(const std::string& path) {
    try {
        auto resolved = resolver_.resolve(path);
        if (const auto* local = std::get_if<LocalPath>(&resolved)) {
            std::error_code ec;
            if (!fs::remove(local->path, ec)) {
                if (ec) {
                    return make_error<TransferResult>(ErrorKind::Io,
                        "cannot remove " + local->path + ": " + ec.message());
                }
                return make_error<TransferResult>(ErrorKind::NotFound, "not found: " + local->path);
            }
            return TransferResult::ok("delete");
        }

        const auto& remote = std::get<CloudPath>(resolved);
        if (remote.is_directory()) {
            return make_error<TransferResult>(ErrorKind::InvalidPath,
                "path names a directory: " + PathResolver::to_uri(remote));
        }
        auto removed = with_retry<storage::OpResult>(defaults_.retry, cancel_, [&] {
            return store_.remove(remote.bucket, remote.key);
        });
        if (!removed.success) {
            return make_error<TransferResult>(removed.error_kind,
                "delete " + PathResolver::to_uri(remote) + ": " + removed.error_message);
        }
        return TransferResult::ok("delete");
    } catch (const InvalidPathError& e) {
        return invalid_path<TransferResult>(e);
    }
}

BytesResult TransferService::get_bytes(const std::string& path) {
    try {
        CloudPath remote = resolver_.resolve_remote(path);
        if (remote.is_directory()) {
            return make_error<BytesResult>(ErrorKind::InvalidPath,
                "path names a directory: " + PathResolver::to_uri(remote));
        }

        storage::GetOptions options;
        options.timeout = defaults_.request_timeout;
        auto get = with_retry<storage::GetResult>(defaults_.retry, cancel_, [&] {
            return store_.get(remote.bucket, remote.key, options);
        });
        if (!get.success) {
            return make_error<BytesResult>(get.error_kind,
                "get " + PathResolver::to_uri(remote) + ": " + get.error_message);
        }

        BytesResult result;
        result.success = true;
        result.data = std::move(get.data);
        result.metadata = std::move(get.metadata);
        return result;
    } catch (const InvalidPathError& e) {
        return invalid_path<BytesResult>(e);
    }
}

InfoResult TransferService::object_info(const std::string& path) {
    try {
        CloudPath remote = resolver_.resolve_remote(path);

        auto from_aggregate = [](AggregateResult aggregate) {
            InfoResult result;
            result.success = aggregate.success;
            result.error_kind = aggregate.error_kind;
            result.error_message = std::move(aggregate.error_message);
            result.info = std::move(aggregate.info);
            return result;
        };

        if (remote.is_directory()) {
            return from_aggregate(directories_.aggregate(remote, defaults_, cancel_));
        }

        auto head = with_retry<storage::HeadResult>(defaults_.retry, cancel_, [&] {
            return store_.head(remote.bucket, remote.key);
        });
        if (head.success) {
            InfoResult result;
            result.success = true;
            result.info.size = head.metadata.size;
            result.info.content_type = head.metadata.content_type;
            result.info.etag = head.metadata.etag;
            result.info.last_modified = head.metadata.last_modified;
            result.info.user_metadata = head.metadata.user_metadata;
            return result;
        }
        if (head.error_kind != ErrorKind::NotFound) {
            return make_error<InfoResult>(head.error_kind,
                "head " + PathResolver::to_uri(remote) + ": " + head.error_message);
        }

        // No object: the key may still name a directory
        auto aggregate = directories_.aggregate(PathResolver::normalize_directory(remote), defaults_,
                                                cancel_);
        if (aggregate.success) {
            return from_aggregate(std::move(aggregate));
        }
        return make_error<InfoResult>(ErrorKind::NotFound, "not found: " + PathResolver::to_uri(remote));
    } catch (const InvalidPathError& e) {
        return invalid_path<InfoResult>(e);
    }
}

storage::PresignResult TransferService::presign(const PresignRequest& request) {
    if (request.expires_seconds < constants::MIN_PRESIGN_EXPIRY_SECS ||
        request.expires_seconds > constants::MAX_PRESIGN_EXPIRY_SECS) {
        return make_error<storage::PresignResult>(ErrorKind::Unknown,
            "expiry must be between " + std::to_string(constants::MIN_PRESIGN_EXPIRY_SECS) +
            " and " + std::to_string(constants::MAX_PRESIGN_EXPIRY_SECS) + " seconds");
    }
    try {
        CloudPath remote = resolver_.resolve_remote(request.path);
        if (remote.key.empty()) {
            return make_error<storage::PresignResult>(ErrorKind::InvalidPath,
                "presign needs an object key: " + PathResolver::to_uri(remote));
        }

        storage::PresignOptions options;
        options.method = request.method;
        options.expires_secs = request.expires_seconds;
        options.content_type = request.content_type;
        options.metadata = request.metadata;
        options.response_headers = request.response_headers;
        return store_.presign(remote.bucket, remote.key, options);
    } catch (const InvalidPathError& e) {
        return invalid_path<storage::PresignResult>(e);
    }
}

TransferResult TransferService::directory_create(const std::string& prefix) {
    try {
        return directories_.create(resolver_.resolve_remote(prefix), defaults_, cancel_);
    } catch (const InvalidPathError& e) {
        return invalid_path<TransferResult>(e);
    }
}

ExistsResult TransferService::directory_exists(const std::string& prefix) {
    try {
        return directories_.exists(resolver_.resolve_remote(prefix), defaults_, cancel_);
    } catch (const InvalidPathError& e) {
        return invalid_path<ExistsResult>(e);
    }
}

DirectoryDeleteResult TransferService::directory_remove(const std::string& prefix) {
    try {
        return directories_.remove(resolver_.resolve_remote(prefix), defaults_, cancel_);
    } catch (const InvalidPathError& e) {
        return invalid_path<DirectoryDeleteResult>(e);
    }
}

ListingResult TransferService::directory_list(const std::string& prefix, const ListRequest& request) {
    try {
        return directories_.list(resolver_.resolve_remote(prefix), request, defaults_, cancel_);
    } catch (const InvalidPathError& e) {
        return invalid_path<ListingResult>(e);
    }
}

DirectoryCopyResult TransferService::directory_copy(const std::string& source,
                                                    const std::string& destination, bool recurse) {
    try {
        return directories_.copy(resolver_.resolve(source), resolver_.resolve(destination),
                                 recurse, defaults_, cancel_);
    } catch (const InvalidPathError& e) {
        return invalid_path<DirectoryCopyResult>(e);
    }
}

}  // namespace s3xfer::transfer
