#include "s3xfer/transfer/directory_service.hpp"
#include "s3xfer/core/log.hpp"
#include "s3xfer/core/retry_policy.hpp"
#include "s3xfer/transfer/batch_coordinator.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fnmatch.h>
#include <set>

namespace s3xfer::transfer {

namespace fs = std::filesystem;

namespace {

constexpr const char* DIRECTORY_CONTENT_TYPE = "application/x-directory";

bool ends_with_separator(const std::string& s) {
    return !s.empty() && s.back() == constants::PATH_SEPARATOR;
}

// Last component of a relative name, without a trailing '/'
std::string entry_basename(std::string name) {
    while (ends_with_separator(name)) name.pop_back();
    size_t slash = name.find_last_of(constants::PATH_SEPARATOR);
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

bool type_matches(EntryType type, bool is_directory) {
    switch (type) {
        case EntryType::Files: return !is_directory;
        case EntryType::Directories: return is_directory;
        case EntryType::All: return true;
    }
    return true;
}

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

struct CopyItem {
    ResolvedPath source;
    ResolvedPath destination;
    std::string label;         // Reported in failed_keys
    bool placeholder = false;  // Nested directory marker, recreated rather than copied
};

}  // namespace

DirectoryService::DirectoryService(storage::ObjectStore& store, CopyOrchestrator& orchestrator)
    : store_(store), orchestrator_(orchestrator) {}

template <typename Visitor>
storage::ListResult DirectoryService::for_each_entry(const std::string& bucket,
                                                     const std::string& prefix,
                                                     const std::string& delimiter,
                                                     const TransferOptions& options,
                                                     const CancellationToken& cancel,
                                                     Visitor&& visit) {
    storage::ListOptions list_options;
    list_options.prefix = prefix;
    list_options.delimiter = delimiter;
    list_options.max_keys = constants::LIST_PAGE_SIZE;
    list_options.timeout = options.request_timeout;

    while (true) {
        auto page = with_retry<storage::ListResult>(options.retry, cancel, [&] {
            return store_.list(bucket, list_options);
        });
        if (!page.success) return page;

        for (const auto& entry : page.entries) {
            if (!visit(entry)) return page;
        }
        if (!page.truncated || page.continuation_token.empty()) return page;
        list_options.continuation_token = page.continuation_token;
    }
}

TransferResult DirectoryService::create(const CloudPath& prefix, const TransferOptions& options,
                                        const CancellationToken& cancel) {
    CloudPath dir = PathResolver::normalize_directory(prefix);
    if (dir.key.empty()) {
        // The bucket root always exists
        return TransferResult::ok("placeholder");
    }

    auto head = with_retry<storage::HeadResult>(options.retry, cancel, [&] {
        return store_.head(dir.bucket, dir.key);
    });
    if (head.success) {
        return TransferResult::ok("placeholder");
    }
    if (head.error_kind != ErrorKind::NotFound) {
        return make_error<TransferResult>(head.error_kind,
            "head " + PathResolver::to_uri(dir) + ": " + head.error_message);
    }

    storage::PutOptions put_options;
    put_options.content_type = DIRECTORY_CONTENT_TYPE;
    put_options.timeout = options.request_timeout;
    auto put = with_retry<storage::PutResult>(options.retry, cancel, [&] {
        return store_.put(dir.bucket, dir.key, {}, put_options);
    });
    if (!put.success) {
        return make_error<TransferResult>(put.error_kind,
            "create " + PathResolver::to_uri(dir) + ": " + put.error_message);
    }

    log_debug("created directory %s", PathResolver::to_uri(dir).c_str());
    auto result = TransferResult::ok("placeholder");
    result.parts = 1;
    result.metadata.etag = put.etag;
    result.metadata.content_type = DIRECTORY_CONTENT_TYPE;
    return result;
}

ExistsResult DirectoryService::exists(const CloudPath& prefix, const TransferOptions& options,
                                     const CancellationToken& cancel) {
    CloudPath dir = PathResolver::normalize_directory(prefix);

    if (!dir.key.empty()) {
        auto head = with_retry<storage::HeadResult>(options.retry, cancel, [&] {
            return store_.head(dir.bucket, dir.key);
        });
        if (head.success) {
            ExistsResult result;
            result.success = true;
            result.exists = true;
            return result;
        }
        if (head.error_kind != ErrorKind::NotFound) {
            return make_error<ExistsResult>(head.error_kind, head.error_message);
        }
    }

    bool found = false;
    auto page = for_each_entry(dir.bucket, dir.key, "", options, cancel,
                               [&](const storage::ListEntry&) {
        found = true;
        return false;
    });
    if (!page.success) {
        return make_error<ExistsResult>(page.error_kind, page.error_message);
    }

    ExistsResult result;
    result.success = true;
    result.exists = found;
    return result;
}

ListingResult DirectoryService::list(const CloudPath& prefix, const ListRequest& request,
                                     const TransferOptions& options,
                                     const CancellationToken& cancel) {
    CloudPath dir = PathResolver::normalize_directory(prefix);
    ListingResult result;
    std::set<std::string> seen;

    auto page = for_each_entry(dir.bucket, dir.key, request.recurse ? "" : "/", options, cancel,
        [&](const storage::ListEntry& item) {
            if (item.key == dir.key || item.key.size() <= dir.key.size()) return true;

            DirectoryEntry entry;
            entry.relative = item.key.substr(dir.key.size());
            entry.is_directory = item.is_directory || ends_with_separator(item.key);

            // Collapse anything past the next separator into its sub-directory
            if (!request.recurse) {
                size_t slash = entry.relative.find(constants::PATH_SEPARATOR);
                if (slash != std::string::npos && slash + 1 < entry.relative.size()) {
                    entry.relative.resize(slash + 1);
                    entry.is_directory = true;
                }
            }
            entry.key = dir.key + entry.relative;
            if (!seen.insert(entry.key).second) return true;

            if (!entry.is_directory) {
                entry.size = item.size;
                entry.last_modified = item.last_modified;
            }

            if (!type_matches(request.type, entry.is_directory)) return true;
            if (!request.filter.empty() &&
                ::fnmatch(request.filter.c_str(), entry_basename(entry.relative).c_str(), 0) != 0) {
                return true;
            }

            entry.display = format_entry(dir, entry, request.format);
            result.entries.push_back(std::move(entry));
            return true;
        });

    if (!page.success) {
        return make_error<ListingResult>(page.error_kind,
            "list " + PathResolver::to_uri(dir) + ": " + page.error_message);
    }
    result.success = true;
    return result;
}

DirectoryDeleteResult DirectoryService::remove(const CloudPath& prefix,
                                               const TransferOptions& options,
                                               const CancellationToken& cancel) {
    CloudPath dir = PathResolver::normalize_directory(prefix);

    std::vector<std::string> keys;
    auto page = for_each_entry(dir.bucket, dir.key, "", options, cancel,
                               [&](const storage::ListEntry& item) {
        keys.push_back(item.key);
        return true;
    });
    if (!page.success) {
        return make_error<DirectoryDeleteResult>(page.error_kind,
            "list " + PathResolver::to_uri(dir) + ": " + page.error_message);
    }

    DirectoryDeleteResult result;
    storage::BatchDeleteResult request_failure;  // Last chunk that failed as a whole
    for (size_t start = 0; start < keys.size(); start += constants::DELETE_BATCH_SIZE) {
        size_t end = std::min(keys.size(), start + constants::DELETE_BATCH_SIZE);
        std::vector<std::string> chunk(keys.begin() + start, keys.begin() + end);
        auto batch = with_retry<storage::BatchDeleteResult>(options.retry, cancel, [&] {
            return store_.remove_batch(dir.bucket, chunk);
        });
        if (!batch.success) {
            log_debug("delete of %zu keys under %s failed: %s", chunk.size(),
                      PathResolver::to_uri(dir).c_str(), batch.error_message.c_str());
            result.failed_keys.insert(result.failed_keys.end(), chunk.begin(), chunk.end());
            request_failure = std::move(batch);
            continue;
        }
        result.failed_keys.insert(result.failed_keys.end(), batch.failed_keys.begin(),
                                  batch.failed_keys.end());
    }
    result.deleted = keys.size() - result.failed_keys.size();

    if (!result.failed_keys.empty()) {
        // Nothing deleted at all: surface the request error kind
        bool nothing_deleted = result.deleted == 0 && request_failure.error_kind != ErrorKind::None;
        result.error_kind = nothing_deleted ? request_failure.error_kind
                                            : ErrorKind::PartialBatchFailure;
        result.error_message = std::to_string(result.failed_keys.size()) + " of " +
                               std::to_string(keys.size()) + " keys could not be deleted under " +
                               PathResolver::to_uri(dir);
        if (!request_failure.error_message.empty()) {
            result.error_message += ": " + request_failure.error_message;
        }
        log_warn("%s", result.error_message.c_str());
        return result;
    }
    log_debug("deleted %zu keys under %s", result.deleted, PathResolver::to_uri(dir).c_str());
    result.success = true;
    return result;
}

DirectoryCopyResult DirectoryService::copy(const ResolvedPath& source,
                                           const ResolvedPath& destination, bool recurse,
                                           const TransferOptions& options,
                                           const CancellationToken& cancel) {
    std::vector<std::pair<std::string, std::string>> relatives;  // (relative, label)
    std::vector<bool> placeholders;

    if (const auto* src = std::get_if<CloudPath>(&source)) {
        CloudPath dir = PathResolver::normalize_directory(*src);
        auto page = for_each_entry(dir.bucket, dir.key, recurse ? "" : "/", options, cancel,
            [&](const storage::ListEntry& item) {
                if (item.is_directory || item.key == dir.key) return true;
                relatives.emplace_back(item.key.substr(dir.key.size()), item.key);
                placeholders.push_back(ends_with_separator(item.key));
                return true;
            });
        if (!page.success) {
            return make_error<DirectoryCopyResult>(page.error_kind,
                "list " + PathResolver::to_uri(dir) + ": " + page.error_message);
        }
        if (relatives.empty()) {
            auto found = exists(dir, options, cancel);
            if (!found.success) {
                return make_error<DirectoryCopyResult>(found.error_kind, found.error_message);
            }
            if (!found.exists) {
                return make_error<DirectoryCopyResult>(ErrorKind::NotFound,
                    "directory not found: " + PathResolver::to_uri(dir));
            }
        }
    } else {
        fs::path root(std::get<LocalPath>(source).path);
        std::error_code ec;
        if (!fs::exists(root, ec)) {
            return make_error<DirectoryCopyResult>(ErrorKind::NotFound,
                "directory not found: " + root.string());
        }
        if (!fs::is_directory(root, ec)) {
            return make_error<DirectoryCopyResult>(ErrorKind::InvalidPath,
                "not a directory: " + root.string());
        }

        auto add = [&](const fs::directory_entry& entry) {
            if (!entry.is_regular_file()) return;
            std::string relative = fs::relative(entry.path(), root).generic_string();
            relatives.emplace_back(relative, relative);
            placeholders.push_back(false);
        };
        if (recurse) {
            for (auto it = fs::recursive_directory_iterator(root, ec);
                 !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                add(*it);
            }
        } else {
            for (auto it = fs::directory_iterator(root, ec);
                 !ec && it != fs::directory_iterator(); it.increment(ec)) {
                add(*it);
            }
        }
        if (ec) {
            return make_error<DirectoryCopyResult>(ErrorKind::Io,
                "cannot walk " + root.string() + ": " + ec.message());
        }
        std::sort(relatives.begin(), relatives.end());
    }

    std::vector<CopyItem> items;
    items.reserve(relatives.size());
    for (size_t i = 0; i < relatives.size(); ++i) {
        const auto& [relative, label] = relatives[i];
        CopyItem item;
        item.label = label;
        item.placeholder = placeholders[i];

        if (const auto* src = std::get_if<CloudPath>(&source)) {
            item.source = CloudPath{src->bucket, PathResolver::normalize_directory(src->key) + relative};
        } else {
            item.source = LocalPath{(fs::path(std::get<LocalPath>(source).path) / relative).string()};
        }
        if (const auto* dst = std::get_if<CloudPath>(&destination)) {
            item.destination = CloudPath{dst->bucket, PathResolver::normalize_directory(dst->key) + relative};
        } else {
            item.destination = LocalPath{(fs::path(std::get<LocalPath>(destination).path) / relative).string()};
        }
        items.push_back(std::move(item));
    }

    // Directory copy always reports every item
    auto report = BatchCoordinator::run_indexed(items.size(), options.concurrency, false,
        [&](size_t index, const CancellationToken& token) -> TransferResult {
            const auto& item = items[index];
            if (!item.placeholder) {
                return orchestrator_.copy(item.source, item.destination, options, token);
            }
            if (const auto* dst = std::get_if<CloudPath>(&item.destination)) {
                return create(*dst, options, token);
            }
            std::error_code ec;
            fs::create_directories(std::get<LocalPath>(item.destination).path, ec);
            if (ec) {
                return make_error<TransferResult>(ErrorKind::Io,
                    "cannot create " + std::get<LocalPath>(item.destination).path + ": " + ec.message());
            }
            return TransferResult::ok("placeholder");
        },
        cancel);

    DirectoryCopyResult result;
    for (size_t i = 0; i < report.results.size(); ++i) {
        if (report.results[i].success) {
            ++result.copied;
        } else {
            result.failed_keys.push_back(items[report.result_indices[i]].label);
        }
    }
    result.errors = std::move(report.errors);
    result.success = result.failed_keys.empty();
    if (!result.success) {
        result.error_kind = ErrorKind::PartialBatchFailure;
        result.error_message = std::to_string(result.failed_keys.size()) + " of " +
                               std::to_string(items.size()) + " objects failed to copy";
    }
    return result;
}

AggregateResult DirectoryService::aggregate(const CloudPath& prefix, const TransferOptions& options,
                                           const CancellationToken& cancel) {
    CloudPath dir = PathResolver::normalize_directory(prefix);

    AggregateResult result;
    result.info.is_directory = true;
    bool any = false;
    auto page = for_each_entry(dir.bucket, dir.key, "", options, cancel,
                               [&](const storage::ListEntry& item) {
        any = true;
        if (ends_with_separator(item.key)) return true;
        ++result.info.object_count;
        result.info.total_size += item.size;
        result.info.last_modified_latest = std::max(result.info.last_modified_latest, item.last_modified);
        return true;
    });
    if (!page.success) {
        return make_error<AggregateResult>(page.error_kind,
            "list " + PathResolver::to_uri(dir) + ": " + page.error_message);
    }
    if (!any && !dir.key.empty()) {
        return make_error<AggregateResult>(ErrorKind::NotFound,
            "not found: " + PathResolver::to_uri(dir));
    }
    result.success = true;
    return result;
}

std::string DirectoryService::format_entry(const CloudPath& prefix, const DirectoryEntry& entry,
                                           ListFormat format) {
    switch (format) {
        case ListFormat::Relative:
            return entry.relative;
        case ListFormat::Key:
            return entry.key;
        case ListFormat::Detailed: {
            char size[24];
            if (entry.is_directory) {
                std::snprintf(size, sizeof(size), "%12s", "DIR");
            } else {
                std::snprintf(size, sizeof(size), "%12llu", static_cast<unsigned long long>(entry.size));
            }
            std::string when = entry.is_directory ? std::string(20, ' ') : format_time(entry.last_modified);
            return std::string(size) + "  " + when + "  " +
                   PathResolver::to_uri(CloudPath{prefix.bucket, entry.key});
        }
        case ListFormat::Full:
            break;
    }
    return PathResolver::to_uri(CloudPath{prefix.bucket, entry.key});
}

}  // namespace s3xfer::transfer
