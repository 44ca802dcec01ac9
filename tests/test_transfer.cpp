// Test suite for s3xfer.
//
// Tests:
//   1. PathResolver classification and URI parsing
//   2. Strategy selection (thresholds, part sizing, range plans, copy limit)
//   3. RetryPolicy and with_retry
//   4. ConcurrencyThrottle
//   5. UploadEngine against the local store, with injected faults
//   6. DownloadEngine: single stream, ranged, partial-file cleanup, throttling
//   7. BatchCoordinator: fail-fast and collect-all
//   8. DirectoryService: create, exists, list, remove, copy
//   9. CopyOrchestrator: server-side, two-phase fallback
//  10. TransferService facade
//  11. TransferConfig CLI, JSON and environment
//  12. SessionJournal and orphan recovery
//  13. Metrics
//  14. SigV4 presigning

#include "s3xfer/core/constants.hpp"
#include "s3xfer/core/retry_policy.hpp"
#include "s3xfer/metrics.hpp"
#include "s3xfer/session_journal.hpp"
#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/transfer/batch_coordinator.hpp"
#include "s3xfer/transfer/concurrency_throttle.hpp"
#include "s3xfer/transfer/copy_orchestrator.hpp"
#include "s3xfer/transfer/directory_service.hpp"
#include "s3xfer/transfer/download_engine.hpp"
#include "s3xfer/transfer/path_resolver.hpp"
#include "s3xfer/transfer/strategy.hpp"
#include "s3xfer/transfer/transfer_service.hpp"
#include "s3xfer/transfer/upload_engine.hpp"
#include "s3xfer/transfer_config.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace s3xfer;
using namespace s3xfer::transfer;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), std::string(msg) + ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Deterministic non-repeating-looking content of `size` bytes.
static std::string pattern_data(size_t size, unsigned seed = 7) {
    std::string data(size, '\0');
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        data[i] = static_cast<char>((state >> 16) & 0xff);
    }
    return data;
}

/// Redirects stderr (where warnings go) into a file for the lifetime
/// of the object.
class StderrCapture {
public:
    explicit StderrCapture(const fs::path& file) : file_(file) {
        std::fflush(stderr);
        saved_ = ::dup(STDERR_FILENO);
        FILE* out = std::fopen(file.c_str(), "w");
        if (out) {
            ::dup2(fileno(out), STDERR_FILENO);
            std::fclose(out);
        }
    }
    ~StderrCapture() { restore(); }

    /// Restore stderr and return what was written meanwhile.
    std::string finish() {
        restore();
        return read_file(file_);
    }

private:
    void restore() {
        if (saved_ < 0) return;
        std::fflush(stderr);
        ::dup2(saved_, STDERR_FILENO);
        ::close(saved_);
        saved_ = -1;
    }

    fs::path file_;
    int saved_ = -1;
};

static std::span<const uint8_t> as_bytes(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

static bool put_string(storage::ObjectStore& store, const std::string& bucket,
                       const std::string& key, const std::string& content,
                       const std::string& content_type = "application/octet-stream") {
    storage::PutOptions options;
    options.content_type = content_type;
    return store.put(bucket, key, as_bytes(content), options).success;
}

static std::string object_string(const storage::ObjectStore& store, const std::string& bucket,
                                 const std::string& key) {
    auto get = store.get(bucket, key);
    if (!get.success) return "<missing>";
    return std::string(get.data.begin(), get.data.end());
}

/// Small sizes so that multipart and ranged paths run on kilobyte files.
static TransferOptions small_options() {
    TransferOptions o;
    o.concurrency = 4;
    o.upload_multipart_threshold = 4 * 1024;
    o.part_size = 1024;
    o.min_part_size = 1;
    o.max_buffered_parts = 3;
    o.download_multipart_threshold = 4 * 1024;
    o.download_chunk_size = 1024;
    o.retry.max_attempts = 3;
    o.retry.base_delay = 1ms;
    o.retry.max_delay = 5ms;
    o.retry.jitter = 0.0;
    return o;
}

// Detail passed to the fault callback for a whole-object GET
constexpr uint64_t WHOLE_OBJECT = UINT64_MAX;

/// Decides whether a call fails: (operation, key, part number or range start).
using FaultFn = std::function<std::optional<ErrorKind>(const std::string& op,
                                                       const std::string& key,
                                                       uint64_t detail)>;

/// ObjectStore decorator over the local store that injects failures,
/// counts calls per operation and tracks concurrent GETs.
class FaultInjectingStore : public storage::ObjectStore {
public:
    explicit FaultInjectingStore(const fs::path& root)
        : inner_(storage::ObjectStoreFactory::create_local(root)) {}

    void set_fault(FaultFn fn) {
        std::lock_guard lock(mutex_);
        fault_ = std::move(fn);
    }
    void clear_fault() { set_fault(nullptr); }

    // Set before a transfer starts
    void set_part_delay(std::chrono::milliseconds delay) { part_delay_ = delay; }
    void set_get_delay(std::chrono::milliseconds delay) { get_delay_ = delay; }
    void set_streaming(size_t piece, std::chrono::milliseconds delay) {
        stream_piece_ = piece;
        stream_delay_ = delay;
    }

    // Body bytes accepted by GET sinks while streaming is set
    uint64_t bytes_streamed() const { return bytes_streamed_.load(); }

    size_t calls(const std::string& op) const {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(op);
        return it == calls_.end() ? 0 : it->second;
    }

    size_t max_concurrent_gets() const { return max_gets_.load(); }
    storage::ObjectStore& inner() { return *inner_; }

    std::string type_name() const override { return "fault-injecting"; }

    storage::HeadResult head(const std::string& bucket, const std::string& key) const override {
        if (auto err = inject<storage::HeadResult>("head", key, 0)) return *err;
        return inner_->head(bucket, key);
    }

    storage::GetResult get(const std::string& bucket, const std::string& key,
                           const storage::GetOptions& options) const override {
        uint64_t detail = options.range_start ? *options.range_start : WHOLE_OBJECT;
        if (auto err = inject<storage::GetResult>("get", key, detail)) return *err;

        size_t now = ++gets_in_flight_;
        size_t prev = max_gets_.load();
        while (now > prev && !max_gets_.compare_exchange_weak(prev, now)) {
        }
        if (get_delay_.count() > 0) std::this_thread::sleep_for(get_delay_);

        // Re-deliver the body in small timed pieces, the way a slow link would
        storage::GetOptions streamed = options;
        if (stream_piece_ > 0 && options.sink) {
            streamed.sink = [this, &options](const uint8_t* data, size_t size) {
                for (size_t offset = 0; offset < size; offset += stream_piece_) {
                    if (offset > 0 || stream_delay_.count() > 0) {
                        std::this_thread::sleep_for(stream_delay_);
                    }
                    size_t piece = std::min(stream_piece_, size - offset);
                    if (!options.sink(data + offset, piece)) return false;
                    bytes_streamed_ += piece;
                }
                return true;
            };
        }
        auto result = inner_->get(bucket, key, streamed);
        --gets_in_flight_;
        return result;
    }

    storage::PutResult put(const std::string& bucket, const std::string& key,
                           std::span<const uint8_t> data,
                           const storage::PutOptions& options) override {
        if (auto err = inject<storage::PutResult>("put", key, 0)) return *err;
        return inner_->put(bucket, key, data, options);
    }

    storage::MultipartInitResult initiate_multipart(const std::string& bucket,
                                                    const std::string& key,
                                                    const storage::PutOptions& options) override {
        if (auto err = inject<storage::MultipartInitResult>("initiate", key, 0)) return *err;
        return inner_->initiate_multipart(bucket, key, options);
    }

    storage::PutResult upload_part(const std::string& bucket, const std::string& key,
                                   const std::string& upload_id, uint32_t part_number,
                                   std::span<const uint8_t> data,
                                   std::chrono::milliseconds timeout) override {
        if (auto err = inject<storage::PutResult>("upload_part", key, part_number)) return *err;
        if (part_delay_.count() > 0) std::this_thread::sleep_for(part_delay_);
        return inner_->upload_part(bucket, key, upload_id, part_number, data, timeout);
    }

    storage::PutResult complete_multipart(const std::string& bucket, const std::string& key,
                                          const std::string& upload_id,
                                          const std::vector<storage::CompletedPart>& parts) override {
        if (auto err = inject<storage::PutResult>("complete", key, 0)) return *err;
        return inner_->complete_multipart(bucket, key, upload_id, parts);
    }

    storage::OpResult abort_multipart(const std::string& bucket, const std::string& key,
                                      const std::string& upload_id) override {
        if (auto err = inject<storage::OpResult>("abort", key, 0)) return *err;
        return inner_->abort_multipart(bucket, key, upload_id);
    }

    storage::MultipartListResult list_multipart_uploads(const std::string& bucket,
                                                        const std::string& prefix) const override {
        return inner_->list_multipart_uploads(bucket, prefix);
    }

    storage::PutResult copy_object(const std::string& source_bucket, const std::string& source_key,
                                   const std::string& dest_bucket,
                                   const std::string& dest_key) override {
        if (auto err = inject<storage::PutResult>("copy", source_key, 0)) return *err;
        return inner_->copy_object(source_bucket, source_key, dest_bucket, dest_key);
    }

    storage::OpResult remove(const std::string& bucket, const std::string& key) override {
        if (auto err = inject<storage::OpResult>("remove", key, 0)) return *err;
        return inner_->remove(bucket, key);
    }

    // "remove_batch" fails the whole request (key is the first key, detail
    // the key count); "remove" rejects single keys inside it
    storage::BatchDeleteResult remove_batch(const std::string& bucket,
                                            const std::vector<std::string>& keys) override {
        std::string first = keys.empty() ? std::string() : keys.front();
        if (auto err = inject<storage::BatchDeleteResult>("remove_batch", first, keys.size())) {
            return *err;
        }
        std::vector<std::string> failed;
        std::vector<std::string> passed;
        for (const auto& key : keys) {
            if (inject<storage::OpResult>("remove", key, 0)) {
                failed.push_back(key);
            } else {
                passed.push_back(key);
            }
        }
        auto result = inner_->remove_batch(bucket, passed);
        result.failed_keys.insert(result.failed_keys.end(), failed.begin(), failed.end());
        return result;
    }

    storage::ListResult list(const std::string& bucket,
                             const storage::ListOptions& options) const override {
        if (auto err = inject<storage::ListResult>("list", options.prefix, 0)) return *err;
        return inner_->list(bucket, options);
    }

    storage::PresignResult presign(const std::string& bucket, const std::string& key,
                                   const storage::PresignOptions& options) const override {
        return inner_->presign(bucket, key, options);
    }

private:
    template <typename Result>
    std::optional<Result> inject(const std::string& op, const std::string& key,
                                 uint64_t detail) const {
        FaultFn fn;
        {
            std::lock_guard lock(mutex_);
            ++calls_[op];
            fn = fault_;
        }
        if (!fn) return std::nullopt;
        auto kind = fn(op, key, detail);
        if (!kind) return std::nullopt;
        return make_error<Result>(*kind, std::string("injected ") + error_kind_name(*kind) +
                                         " on " + op + " " + key);
    }

    std::unique_ptr<storage::ObjectStore> inner_;
    mutable std::mutex mutex_;
    mutable std::map<std::string, size_t> calls_;
    FaultFn fault_;
    std::chrono::milliseconds part_delay_{0};
    std::chrono::milliseconds get_delay_{0};
    size_t stream_piece_ = 0;
    std::chrono::milliseconds stream_delay_{0};
    mutable std::atomic<uint64_t> bytes_streamed_{0};
    mutable std::atomic<size_t> gets_in_flight_{0};
    mutable std::atomic<size_t> max_gets_{0};
};

/// Engines wired over one store, the way TransferService wires them.
struct Engines {
    explicit Engines(storage::ObjectStore& store, SessionJournal* journal = nullptr,
                     TransferMetrics* metrics = nullptr)
        : uploader(store, journal, metrics)
        , downloader(store, metrics)
        , orchestrator(store, uploader, downloader, metrics)
        , batches(orchestrator)
        , directories(store, orchestrator) {}

    UploadEngine uploader;
    DownloadEngine downloader;
    CopyOrchestrator orchestrator;
    BatchCoordinator batches;
    DirectoryService directories;
};

// ---------------------------------------------------------------------------
// 1. PathResolver
// ---------------------------------------------------------------------------

static void test_path_resolver() {
    std::cout << "\n=== PathResolver ===" << std::endl;

    PathResolver with_bucket("data");
    PathResolver without_bucket;

    {
        TEST(s3_uri);
        auto p = std::get<CloudPath>(with_bucket.resolve("s3://logs/2024/app.log"));
        ASSERT_EQ(p.bucket, "logs", "bucket");
        ASSERT_EQ(p.key, "2024/app.log", "key");
        ASSERT_TRUE(!p.is_directory(), "object key is not a directory");
        ASSERT_EQ(p.basename(), "app.log", "basename");
        PASS();
    }
    {
        TEST(bucket_root);
        auto a = with_bucket.resolve_remote("s3://logs");
        auto b = with_bucket.resolve_remote("s3://logs/");
        ASSERT_EQ(a.key, "", "no slash");
        ASSERT_EQ(b.key, "", "trailing slash");
        ASSERT_TRUE(a.is_directory(), "bucket root is a directory");
        PASS();
    }
    {
        TEST(directory_form);
        auto p = with_bucket.resolve_remote("s3://logs/2024/");
        ASSERT_TRUE(p.is_directory(), "trailing slash");
        ASSERT_EQ(p.basename(), "2024", "basename strips separator");
        PASS();
    }
    {
        TEST(local_forms);
        ASSERT_TRUE(!is_remote(with_bucket.resolve("/abs/file")), "absolute");
        ASSERT_TRUE(!is_remote(with_bucket.resolve("./rel")), "dot relative");
        ASSERT_TRUE(!is_remote(with_bucket.resolve("../up")), "parent relative");
        auto f = std::get<LocalPath>(with_bucket.resolve("file:///tmp/x.bin"));
        ASSERT_EQ(f.path, "/tmp/x.bin", "file uri");
        PASS();
    }
    {
        TEST(bare_key_uses_default_bucket);
        auto p = std::get<CloudPath>(with_bucket.resolve("reports/q1.csv"));
        ASSERT_EQ(p.bucket, "data", "default bucket");
        ASSERT_EQ(p.key, "reports/q1.csv", "key");
        auto stripped = with_bucket.resolve_remote("/reports/q1.csv");
        ASSERT_EQ(stripped.key, "reports/q1.csv", "leading slash stripped");
        PASS();
    }
    {
        TEST(bare_key_without_default_is_local);
        auto p = without_bucket.resolve("reports/q1.csv");
        ASSERT_TRUE(!is_remote(p), "relative local");
        PASS();
    }
    {
        TEST(home_expansion);
        const char* home = std::getenv("HOME");
        if (home && *home) {
            auto p = without_bucket.resolve_local("~/notes.txt");
            ASSERT_EQ(p.path, std::string(home) + "/notes.txt", "expanded");
        }
        PASS();
    }
    {
        TEST(malformed_paths_throw);
        auto throws = [&](const std::function<void()>& fn) {
            try {
                fn();
            } catch (const InvalidPathError&) {
                return true;
            }
            return false;
        };
        ASSERT_TRUE(throws([&] { with_bucket.resolve(""); }), "empty");
        ASSERT_TRUE(throws([&] { with_bucket.resolve("s3://"); }), "no bucket");
        ASSERT_TRUE(throws([&] { with_bucket.resolve("s3:///key"); }), "empty bucket");
        ASSERT_TRUE(throws([&] { with_bucket.resolve("s3://bad bucket/key"); }), "space in bucket");
        ASSERT_TRUE(throws([&] { without_bucket.resolve_remote("key"); }), "no default bucket");
        ASSERT_TRUE(throws([&] { with_bucket.resolve_local("s3://b/k"); }), "remote as local");
        ASSERT_TRUE(throws([&] { with_bucket.resolve_remote("file:///tmp/x"); }), "local as remote");
        PASS();
    }
    {
        TEST(normalize_and_render);
        ASSERT_EQ(PathResolver::normalize_directory("a/b"), "a/b/", "append separator");
        ASSERT_EQ(PathResolver::normalize_directory("a/b/"), "a/b/", "idempotent");
        ASSERT_EQ(PathResolver::normalize_directory(""), "", "bucket root");
        ASSERT_EQ(PathResolver::to_uri(CloudPath{"b", "k/x"}), "s3://b/k/x", "uri");
        ASSERT_EQ(PathResolver::to_string(LocalPath{"/tmp/y"}), "/tmp/y", "local string");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Strategy
// ---------------------------------------------------------------------------

static void test_strategy() {
    std::cout << "\n=== Strategy ===" << std::endl;
    using constants::GiB;
    using constants::MiB;

    TransferOptions defaults;

    {
        TEST(upload_threshold_boundary);
        auto at = choose_upload_strategy(25 * MiB, defaults);
        auto above = choose_upload_strategy(25 * MiB + 1, defaults);
        ASSERT_TRUE(std::holds_alternative<SinglePart>(at), "threshold itself is single-part");
        ASSERT_TRUE(std::holds_alternative<Multipart>(above), "one byte over is multipart");
        ASSERT_EQ(std::string(strategy_name(above)), "multipart", "name");
        PASS();
    }
    {
        TEST(thirty_mib_is_two_parts);
        auto s = std::get<Multipart>(choose_upload_strategy(30 * MiB, defaults));
        ASSERT_EQ(s.part_size, 16 * MiB, "part size");
        ASSERT_EQ(s.part_count, 2u, "part count");
        PASS();
    }
    {
        TEST(ten_mib_is_single);
        ASSERT_TRUE(std::holds_alternative<SinglePart>(choose_upload_strategy(10 * MiB, defaults)),
                    "under threshold");
        PASS();
    }
    {
        TEST(part_size_grows_for_part_limit);
        uint64_t size = 200 * GiB;
        uint64_t part = adjust_part_size(size, 5 * MiB, constants::MIN_PART_SIZE);
        ASSERT_TRUE(part > 5 * MiB, "grown");
        ASSERT_TRUE(part_count(size, part) <= constants::MAX_PART_COUNT, "within part limit");
        ASSERT_EQ(adjust_part_size(100 * MiB, 1 * MiB, constants::MIN_PART_SIZE),
                  constants::MIN_PART_SIZE, "raised to minimum");
        ASSERT_EQ(adjust_part_size(100 * MiB, 32 * MiB, constants::MIN_PART_SIZE),
                  32 * MiB, "never shrunk");
        PASS();
    }
    {
        TEST(range_plan_covers_object);
        auto plan = plan_ranges(10, 4);
        ASSERT_EQ(plan.size(), 3u, "three ranges");
        ASSERT_TRUE(plan[0] == (ByteRange{0, 4}), "first");
        ASSERT_TRUE(plan[1] == (ByteRange{4, 8}), "second");
        ASSERT_TRUE(plan[2] == (ByteRange{8, 10}), "short tail");
        ASSERT_TRUE(plan_ranges(0, 4).empty(), "empty object");
        PASS();
    }
    {
        TEST(download_threshold);
        TransferOptions o = small_options();
        ASSERT_TRUE(std::holds_alternative<SingleStream>(choose_download_strategy(4096, o)), "at threshold");
        auto ranged = std::get<Ranged>(choose_download_strategy(4097, o));
        ASSERT_EQ(ranged.plan.size(), 5u, "ranges");
        ASSERT_EQ(ranged.plan.back().length(), 1u, "tail length");
        PASS();
    }
    {
        TEST(copy_limit);
        ASSERT_TRUE(std::holds_alternative<ServerSide>(choose_copy_strategy(5 * GiB)), "at limit");
        ASSERT_TRUE(std::holds_alternative<TwoPhase>(choose_copy_strategy(5 * GiB + 1)), "over limit");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. RetryPolicy
// ---------------------------------------------------------------------------

static void test_retry_policy() {
    std::cout << "\n=== RetryPolicy ===" << std::endl;

    RetryPolicy policy;
    policy.base_delay = 1ms;
    policy.max_delay = 4ms;
    policy.jitter = 0.0;

    {
        TEST(backoff_doubles_and_caps);
        ASSERT_EQ(policy.nominal_delay(1).count(), 1, "first retry");
        ASSERT_EQ(policy.nominal_delay(2).count(), 2, "second retry");
        ASSERT_EQ(policy.nominal_delay(3).count(), 4, "third retry");
        ASSERT_EQ(policy.nominal_delay(6).count(), 4, "capped");
        PASS();
    }
    {
        TEST(status_classification);
        ASSERT_TRUE(error_kind_from_http_status(503) == ErrorKind::NetworkFailure, "503");
        ASSERT_TRUE(error_kind_from_http_status(429) == ErrorKind::NetworkFailure, "429");
        ASSERT_TRUE(error_kind_from_http_status(403) == ErrorKind::AccessDenied, "403");
        ASSERT_TRUE(error_kind_from_http_status(400) == ErrorKind::Unknown, "plain 400");
        ASSERT_TRUE(!is_retryable(ErrorKind::Unknown), "unknown is fatal");
        PASS();
    }
    {
        TEST(s3_error_code_classification);
        auto timeout = error_kind_from_s3_error(400, "RequestTimeout");
        auto skewed = error_kind_from_s3_error(403, "RequestTimeTooSkewed");
        ASSERT_TRUE(timeout == ErrorKind::Timeout, "400 RequestTimeout");
        ASSERT_TRUE(is_retryable(timeout), "RequestTimeout retried");
        ASSERT_TRUE(is_retryable(skewed), "RequestTimeTooSkewed retried");
        ASSERT_TRUE(error_kind_from_s3_error(400, "InvalidArgument") == ErrorKind::Unknown,
                    "other 400 fatal");
        ASSERT_TRUE(error_kind_from_s3_error(403, "AccessDenied") == ErrorKind::AccessDenied,
                    "falls back to status");
        ASSERT_TRUE(error_kind_from_s3_error(404, "NoSuchUpload") == ErrorKind::NotFound,
                    "NoSuchUpload");
        PASS();
    }
    {
        TEST(transient_then_success);
        int calls = 0;
        int observed = 0;
        auto result = with_retry<storage::OpResult>(policy, CancellationToken{},
            [&] {
                ++calls;
                if (calls < 3) return make_error<storage::OpResult>(ErrorKind::NetworkFailure, "reset");
                storage::OpResult ok;
                ok.success = true;
                return ok;
            },
            [&](uint32_t, ErrorKind, const std::string&) { ++observed; });
        ASSERT_TRUE(result.success, "eventually succeeds");
        ASSERT_EQ(calls, 3, "attempts");
        ASSERT_EQ(observed, 2, "retry observer calls");
        PASS();
    }
    {
        TEST(fatal_error_not_retried);
        int calls = 0;
        auto result = with_retry<storage::OpResult>(policy, CancellationToken{}, [&] {
            ++calls;
            return make_error<storage::OpResult>(ErrorKind::AccessDenied, "denied");
        });
        ASSERT_EQ(calls, 1, "single attempt");
        ASSERT_TRUE(result.error_kind == ErrorKind::AccessDenied, "kind kept");
        PASS();
    }
    {
        TEST(budget_exhausted);
        int calls = 0;
        auto result = with_retry<storage::OpResult>(policy.with_attempts(4), CancellationToken{}, [&] {
            ++calls;
            return make_error<storage::OpResult>(ErrorKind::Timeout, "slow");
        });
        ASSERT_EQ(calls, 4, "attempt budget");
        ASSERT_TRUE(result.error_kind == ErrorKind::Timeout, "last error surfaces");
        PASS();
    }
    {
        TEST(cancelled_before_start);
        CancellationToken token;
        token.cancel();
        int calls = 0;
        auto result = with_retry<storage::OpResult>(policy, token, [&] {
            ++calls;
            return storage::OpResult{};
        });
        ASSERT_EQ(calls, 0, "op never runs");
        ASSERT_TRUE(result.error_kind == ErrorKind::Aborted, "aborted");
        PASS();
    }
    {
        TEST(child_token_sees_parent);
        CancellationToken parent;
        auto child = parent.child();
        child.cancel();
        ASSERT_TRUE(!parent.cancelled(), "child cancel stays local");
        auto other = parent.child();
        parent.cancel();
        ASSERT_TRUE(other.cancelled(), "parent cancel propagates");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. ConcurrencyThrottle
// ---------------------------------------------------------------------------

static void test_throttle() {
    std::cout << "\n=== ConcurrencyThrottle ===" << std::endl;

    {
        TEST(limit_bounds_slots);
        ConcurrencyThrottle throttle(4, 2, 3);
        for (int i = 0; i < 4; ++i) {
            ASSERT_TRUE(throttle.try_acquire().has_value(), "slot granted");
        }
        ASSERT_TRUE(!throttle.try_acquire().has_value(), "fifth slot refused");
        ASSERT_EQ(throttle.in_flight(), 4u, "in flight");
        PASS();
    }
    {
        TEST(error_burst_halves_then_recovers);
        ConcurrencyThrottle throttle(4, 2, 3);
        for (int i = 0; i < 4; ++i) throttle.try_acquire();

        ASSERT_TRUE(!throttle.release(false, ErrorKind::NetworkFailure), "first error");
        ASSERT_TRUE(throttle.release(false, ErrorKind::NetworkFailure), "burst reduces");
        ASSERT_EQ(throttle.limit(), 2u, "halved");
        ASSERT_EQ(throttle.reductions(), 1u, "reduction counted");
        ASSERT_TRUE(!throttle.try_acquire().has_value(), "in-flight ranges drain first");

        throttle.release(true);
        throttle.release(true);
        ASSERT_EQ(throttle.in_flight(), 0u, "drained");
        auto slot = throttle.try_acquire();
        ASSERT_TRUE(slot.has_value(), "slot after drain");
        ASSERT_TRUE(slot->in_flight <= slot->limit, "dispatch within limit");
        throttle.release(true);
        ASSERT_EQ(throttle.limit(), 3u, "raised after recovery successes");
        PASS();
    }
    {
        TEST(non_connection_error_does_not_reduce);
        ConcurrencyThrottle throttle(4, 1, 3);
        throttle.try_acquire();
        ASSERT_TRUE(!throttle.release(false, ErrorKind::NotFound), "not found");
        ASSERT_EQ(throttle.limit(), 4u, "unchanged");
        PASS();
    }
    {
        TEST(floor_of_one);
        ConcurrencyThrottle throttle(2, 1, 100);
        throttle.try_acquire();
        throttle.release(false, ErrorKind::Timeout);
        throttle.try_acquire();
        throttle.release(false, ErrorKind::Timeout);
        ASSERT_EQ(throttle.limit(), 1u, "never below one");
        PASS();
    }
    {
        TEST(acquire_returns_on_cancel);
        ConcurrencyThrottle throttle(1, 3, 3);
        throttle.try_acquire();
        CancellationToken token;
        std::thread canceller([&] {
            std::this_thread::sleep_for(30ms);
            token.cancel();
        });
        auto slot = throttle.acquire(token);
        canceller.join();
        ASSERT_TRUE(!slot.has_value(), "no slot after cancel");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. UploadEngine
// ---------------------------------------------------------------------------

static void test_upload_engine() {
    std::cout << "\n=== UploadEngine ===" << std::endl;

    auto tmpdir = make_temp_dir("s3xfer-upload");
    FaultInjectingStore store(tmpdir / "store");
    SessionJournal journal(tmpdir / "sessions.db");
    TransferMetrics metrics;
    UploadEngine engine(store, &journal, &metrics);

    {
        TEST(single_part_round_trip);
        std::string content = pattern_data(3000, 1);
        write_file(tmpdir / "small.txt", content);
        auto result = engine.upload(LocalPath{(tmpdir / "small.txt").string()},
                                    CloudPath{"bucket", "in/small.txt"}, small_options());
        ASSERT_TRUE(result.success, "upload: " + result.error_message);
        ASSERT_EQ(result.strategy, "single-part", "strategy");
        ASSERT_EQ(result.bytes_transferred, 3000u, "bytes");
        ASSERT_TRUE(object_string(store, "bucket", "in/small.txt") == content, "content");
        auto head = store.head("bucket", "in/small.txt");
        ASSERT_EQ(head.metadata.content_type, "text/plain", "guessed content type");
        PASS();
    }
    {
        TEST(multipart_round_trip_bounded_buffers);
        std::string content = pattern_data(10 * 1024 + 100, 2);
        write_file(tmpdir / "big.bin", content);
        store.set_part_delay(5ms);
        auto options = small_options();
        options.metadata = {{"owner", "ops"}};
        auto result = engine.upload(LocalPath{(tmpdir / "big.bin").string()},
                                    CloudPath{"bucket", "in/big.bin"}, options);
        store.set_part_delay(0ms);
        ASSERT_TRUE(result.success, "upload: " + result.error_message);
        ASSERT_EQ(result.strategy, "multipart", "strategy");
        ASSERT_EQ(result.parts, 11u, "part count");
        ASSERT_TRUE(result.peak_buffered_parts >= 1, "buffers used");
        ASSERT_TRUE(result.peak_buffered_parts <= options.max_buffered_parts, "buffer window respected");
        ASSERT_TRUE(object_string(store, "bucket", "in/big.bin") == content, "content");
        ASSERT_EQ(store.head("bucket", "in/big.bin").metadata.user_metadata["owner"], "ops", "metadata");
        ASSERT_TRUE(store.list_multipart_uploads("bucket", "").uploads.empty(), "no live sessions");
        ASSERT_TRUE(journal.entries().empty(), "journal cleared");
        PASS();
    }
    {
        TEST(transient_part_failure_retried);
        std::string content = pattern_data(6 * 1024, 3);
        write_file(tmpdir / "retry.bin", content);
        std::atomic<int> part2_calls{0};
        store.set_fault([&](const std::string& op, const std::string&, uint64_t part)
                            -> std::optional<ErrorKind> {
            if (op == "upload_part" && part == 2 && part2_calls++ == 0) return ErrorKind::NetworkFailure;
            return std::nullopt;
        });
        double retries_before = metrics.part_retries_total().Value();
        auto result = engine.upload(LocalPath{(tmpdir / "retry.bin").string()},
                                    CloudPath{"bucket", "in/retry.bin"}, small_options());
        store.clear_fault();
        ASSERT_TRUE(result.success, "upload: " + result.error_message);
        ASSERT_EQ(part2_calls.load(), 2, "part 2 retried once");
        ASSERT_EQ(metrics.part_retries_total().Value() - retries_before, 1.0, "retry metric");
        ASSERT_TRUE(object_string(store, "bucket", "in/retry.bin") == content, "content");
        PASS();
    }
    {
        TEST(part_retry_exhaustion_aborts);
        std::string content = pattern_data(8 * 1024, 4);
        write_file(tmpdir / "doomed.bin", content);
        std::atomic<int> part3_calls{0};
        store.set_fault([&](const std::string& op, const std::string&, uint64_t part)
                            -> std::optional<ErrorKind> {
            if (op == "upload_part" && part == 3) {
                ++part3_calls;
                return ErrorKind::NetworkFailure;
            }
            return std::nullopt;
        });
        double aborts_before = metrics.multipart_aborts_total().Value();
        auto result = engine.upload(LocalPath{(tmpdir / "doomed.bin").string()},
                                    CloudPath{"bucket", "in/doomed.bin"}, small_options());
        store.clear_fault();
        ASSERT_TRUE(!result.success, "upload should fail");
        ASSERT_TRUE(result.error_kind == ErrorKind::NetworkFailure, "part error surfaces");
        ASSERT_EQ(part3_calls.load(), 3, "attempt budget spent on part 3");
        ASSERT_EQ(metrics.multipart_aborts_total().Value() - aborts_before, 1.0, "abort counted");
        ASSERT_TRUE(!store.head("bucket", "in/doomed.bin").success, "no object written");
        ASSERT_TRUE(store.list_multipart_uploads("bucket", "").uploads.empty(), "no orphan session");
        ASSERT_TRUE(journal.entries().empty(), "journal cleared");
        PASS();
    }
    {
        TEST(abort_failure_keeps_journal_row);
        std::string content = pattern_data(8 * 1024, 5);
        write_file(tmpdir / "stuck.bin", content);
        store.set_fault([](const std::string& op, const std::string&, uint64_t part)
                            -> std::optional<ErrorKind> {
            if (op == "upload_part" && part == 1) return ErrorKind::AccessDenied;
            if (op == "abort") return ErrorKind::NetworkFailure;
            return std::nullopt;
        });
        auto result = engine.upload(LocalPath{(tmpdir / "stuck.bin").string()},
                                    CloudPath{"bucket", "in/stuck.bin"}, small_options());
        store.clear_fault();
        ASSERT_TRUE(!result.success, "upload should fail");
        ASSERT_TRUE(result.error_kind == ErrorKind::AccessDenied, "part error kind kept");
        ASSERT_TRUE(result.error_message.find("abort failed") != std::string::npos,
                    "abort failure reported: " + result.error_message);
        ASSERT_EQ(journal.entries().size(), 1u, "journal row kept for recovery");
        ASSERT_EQ(store.list_multipart_uploads("bucket", "").uploads.size(), 1u, "session still live");

        auto report = journal.recover_orphans(store, &metrics);
        ASSERT_EQ(report.aborted, 1u, "recovered");
        ASSERT_TRUE(journal.entries().empty(), "journal cleared by recovery");
        ASSERT_TRUE(store.list_multipart_uploads("bucket", "").uploads.empty(), "session aborted");
        PASS();
    }
    {
        TEST(unjournaled_session_is_reported);
        auto db = tmpdir / "broken.db";
        SessionJournal broken(db);
        sqlite3* other = nullptr;
        ASSERT_TRUE(sqlite3_open(db.c_str(), &other) == SQLITE_OK, "second connection");
        int rc = sqlite3_exec(other, "DROP TABLE multipart_sessions", nullptr, nullptr, nullptr);
        sqlite3_close(other);
        ASSERT_TRUE(rc == SQLITE_OK, "drop journal table");

        std::string content = pattern_data(6 * 1024, 6);
        write_file(tmpdir / "unjournaled.bin", content);
        UploadEngine unjournaled(store, &broken, &metrics);
        StderrCapture capture(tmpdir / "stderr.txt");
        auto result = unjournaled.upload(LocalPath{(tmpdir / "unjournaled.bin").string()},
                                         CloudPath{"bucket", "in/unjournaled.bin"}, small_options());
        std::string warnings = capture.finish();
        ASSERT_TRUE(result.success, "upload unaffected: " + result.error_message);
        ASSERT_TRUE(object_string(store, "bucket", "in/unjournaled.bin") == content, "content");
        ASSERT_TRUE(warnings.find("is not journaled") != std::string::npos,
                    "warning logged: " + warnings);
        PASS();
    }
    {
        TEST(single_put_attempts);
        write_file(tmpdir / "flaky.txt", "flaky");
        store.set_fault([](const std::string& op, const std::string&, uint64_t)
                            -> std::optional<ErrorKind> {
            if (op == "put") return ErrorKind::Timeout;
            return std::nullopt;
        });
        size_t before = store.calls("put");
        auto options = small_options();
        options.single_put_attempts = 2;
        auto result = engine.upload(LocalPath{(tmpdir / "flaky.txt").string()},
                                    CloudPath{"bucket", "in/flaky.txt"}, options);
        store.clear_fault();
        ASSERT_TRUE(!result.success, "should fail");
        ASSERT_TRUE(result.error_kind == ErrorKind::Timeout, "kind");
        ASSERT_EQ(store.calls("put") - before, 2u, "single put attempt budget");
        PASS();
    }
    {
        TEST(missing_source);
        auto result = engine.upload(LocalPath{(tmpdir / "nope.bin").string()},
                                    CloudPath{"bucket", "in/nope.bin"}, small_options());
        ASSERT_TRUE(result.error_kind == ErrorKind::NotFound, "not found");
        PASS();
    }
    {
        TEST(directory_destination_rejected);
        auto result = engine.upload(LocalPath{(tmpdir / "small.txt").string()},
                                    CloudPath{"bucket", "in/"}, small_options());
        ASSERT_TRUE(result.error_kind == ErrorKind::InvalidPath, "invalid path");
        PASS();
    }
    {
        TEST(cancelled_upload_aborts);
        std::string content = pattern_data(8 * 1024, 6);
        write_file(tmpdir / "cancel.bin", content);
        CancellationToken token;
        store.set_part_delay(20ms);
        std::thread canceller([&] {
            std::this_thread::sleep_for(30ms);
            token.cancel();
        });
        auto result = engine.upload(LocalPath{(tmpdir / "cancel.bin").string()},
                                    CloudPath{"bucket", "in/cancel.bin"}, small_options(), token);
        canceller.join();
        store.set_part_delay(0ms);
        ASSERT_TRUE(!result.success, "should not complete");
        ASSERT_TRUE(store.list_multipart_uploads("bucket", "").uploads.empty(), "session aborted");
        ASSERT_TRUE(!store.head("bucket", "in/cancel.bin").success, "no object");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. DownloadEngine
// ---------------------------------------------------------------------------

static void test_download_engine() {
    std::cout << "\n=== DownloadEngine ===" << std::endl;

    auto tmpdir = make_temp_dir("s3xfer-download");
    FaultInjectingStore store(tmpdir / "store");
    TransferMetrics metrics;
    DownloadEngine engine(store, &metrics);

    std::string small = pattern_data(2000, 11);
    std::string large = pattern_data(16 * 1024 + 7, 12);
    put_string(store, "bucket", "obj/small.bin", small);
    put_string(store, "bucket", "obj/large.bin", large);

    {
        TEST(single_stream);
        auto dest = tmpdir / "out" / "small.bin";
        auto result = engine.download(CloudPath{"bucket", "obj/small.bin"},
                                      LocalPath{dest.string()}, small_options());
        ASSERT_TRUE(result.success, "download: " + result.error_message);
        ASSERT_EQ(result.strategy, "single-stream", "strategy");
        ASSERT_TRUE(read_file(dest) == small, "content");
        ASSERT_TRUE(!fs::exists(dest.string() + constants::PARTIAL_DOWNLOAD_SUFFIX), "no partial file");
        PASS();
    }
    {
        TEST(ranged);
        auto dest = tmpdir / "out" / "large.bin";
        size_t gets_before = store.calls("get");
        auto result = engine.download(CloudPath{"bucket", "obj/large.bin"},
                                      LocalPath{dest.string()}, small_options());
        ASSERT_TRUE(result.success, "download: " + result.error_message);
        ASSERT_EQ(result.strategy, "ranged", "strategy");
        ASSERT_EQ(result.parts, 17u, "ranges");
        ASSERT_EQ(store.calls("get") - gets_before, 17u, "one GET per range");
        ASSERT_TRUE(read_file(dest) == large, "content");
        PASS();
    }
    {
        TEST(directory_destination);
        fs::create_directories(tmpdir / "dir");
        auto result = engine.download(CloudPath{"bucket", "obj/small.bin"},
                                      LocalPath{(tmpdir / "dir").string()}, small_options());
        ASSERT_TRUE(result.success, "download: " + result.error_message);
        ASSERT_TRUE(read_file(tmpdir / "dir" / "small.bin") == small, "basename appended");
        auto target = DownloadEngine::target_path(CloudPath{"bucket", "a/b.txt"}, LocalPath{"/x/y/"});
        ASSERT_EQ(target.string(), "/x/y/b.txt", "directory form");
        PASS();
    }
    {
        TEST(missing_object);
        auto dest = tmpdir / "out" / "missing.bin";
        auto result = engine.download(CloudPath{"bucket", "obj/missing.bin"},
                                      LocalPath{dest.string()}, small_options());
        ASSERT_TRUE(result.error_kind == ErrorKind::NotFound, "not found");
        ASSERT_TRUE(!fs::exists(dest), "no file");
        PASS();
    }
    {
        TEST(failed_range_removes_partial_file);
        auto dest = tmpdir / "out" / "broken.bin";
        store.set_fault([](const std::string& op, const std::string&, uint64_t start)
                            -> std::optional<ErrorKind> {
            if (op == "get" && start == 5 * 1024) return ErrorKind::AccessDenied;
            return std::nullopt;
        });
        auto result = engine.download(CloudPath{"bucket", "obj/large.bin"},
                                      LocalPath{dest.string()}, small_options());
        store.clear_fault();
        ASSERT_TRUE(!result.success, "should fail");
        ASSERT_TRUE(result.error_kind == ErrorKind::AccessDenied, "range error surfaces");
        ASSERT_TRUE(!fs::exists(dest), "no target");
        ASSERT_TRUE(!fs::exists(dest.string() + constants::PARTIAL_DOWNLOAD_SUFFIX), "partial removed");
        PASS();
    }
    {
        TEST(failed_range_stops_sibling_streams);
        // Four 16 KiB ranges, all in flight at once; the first one is refused
        std::string wide = pattern_data(64 * 1024, 11);
        ASSERT_TRUE(put_string(store, "bucket", "obj/wide.bin", wide), "seed");
        auto options = small_options();
        options.download_chunk_size = 16 * 1024;
        options.concurrency = 4;

        store.set_fault([](const std::string& op, const std::string&, uint64_t start)
                            -> std::optional<ErrorKind> {
            if (op == "get" && start == 0) return ErrorKind::AccessDenied;
            return std::nullopt;
        });
        store.set_get_delay(5ms);
        store.set_streaming(256, 2ms);
        uint64_t streamed_before = store.bytes_streamed();
        auto dest = tmpdir / "out" / "wide.bin";
        auto started = std::chrono::steady_clock::now();
        auto result = engine.download(CloudPath{"bucket", "obj/wide.bin"},
                                      LocalPath{dest.string()}, options);
        auto elapsed = std::chrono::steady_clock::now() - started;
        uint64_t streamed = store.bytes_streamed() - streamed_before;
        store.set_streaming(0, 0ms);
        store.set_get_delay(0ms);
        store.clear_fault();

        ASSERT_TRUE(!result.success, "should fail");
        ASSERT_TRUE(result.error_kind == ErrorKind::AccessDenied, "refused range surfaces");
        // Three full sibling ranges would be 48 KiB over at least 128 ms
        ASSERT_TRUE(streamed < 3 * 16 * 1024u, "siblings stopped mid-range: " + std::to_string(streamed));
        ASSERT_TRUE(elapsed < 120ms, "returned without draining siblings");
        ASSERT_TRUE(!fs::exists(dest.string() + constants::PARTIAL_DOWNLOAD_SUFFIX), "partial removed");
        PASS();
    }
    {
        TEST(cancel_interrupts_single_stream);
        std::string body = pattern_data(3 * 1024, 12);
        ASSERT_TRUE(put_string(store, "bucket", "obj/slow.bin", body), "seed");
        store.set_streaming(128, 10ms);
        uint64_t streamed_before = store.bytes_streamed();

        CancellationToken cancel;
        std::thread canceller([&] {
            std::this_thread::sleep_for(30ms);
            cancel.cancel();
        });
        auto dest = tmpdir / "out" / "slow.bin";
        auto result = engine.download(CloudPath{"bucket", "obj/slow.bin"},
                                      LocalPath{dest.string()}, small_options(), cancel);
        canceller.join();
        uint64_t streamed = store.bytes_streamed() - streamed_before;
        store.set_streaming(0, 0ms);

        ASSERT_TRUE(!result.success, "cancelled");
        ASSERT_TRUE(result.error_kind == ErrorKind::Aborted, "aborted");
        ASSERT_TRUE(streamed < body.size(), "stream cut short: " + std::to_string(streamed));
        ASSERT_TRUE(!fs::exists(dest), "no target");
        ASSERT_TRUE(!fs::exists(dest.string() + constants::PARTIAL_DOWNLOAD_SUFFIX), "partial removed");
        PASS();
    }
    {
        TEST(failed_single_stream_keeps_existing_file);
        auto dest = tmpdir / "out" / "keep.bin";
        write_file(dest, "previous");
        store.set_fault([](const std::string& op, const std::string&, uint64_t start)
                            -> std::optional<ErrorKind> {
            if (op == "get" && start == WHOLE_OBJECT) return ErrorKind::AccessDenied;
            return std::nullopt;
        });
        auto result = engine.download(CloudPath{"bucket", "obj/small.bin"},
                                      LocalPath{dest.string()}, small_options());
        store.clear_fault();
        ASSERT_TRUE(!result.success, "should fail");
        ASSERT_EQ(read_file(dest), "previous", "existing file untouched");
        PASS();
    }
    {
        TEST(throttle_under_connection_errors);
        auto dest = tmpdir / "out" / "throttled.bin";
        std::atomic<int> ranged_calls{0};
        store.set_fault([&](const std::string& op, const std::string&, uint64_t start)
                            -> std::optional<ErrorKind> {
            if (op == "get" && start != WHOLE_OBJECT && ranged_calls++ < 8) {
                return ErrorKind::NetworkFailure;
            }
            return std::nullopt;
        });

        std::mutex observed_mutex;
        size_t violations = 0;
        size_t dispatches = 0;
        engine.set_dispatch_observer([&](const ConcurrencyThrottle::Dispatch& d) {
            std::lock_guard lock(observed_mutex);
            ++dispatches;
            if (d.in_flight > d.limit) ++violations;
        });

        auto options = small_options();
        options.throttle_error_burst = 2;
        options.retry.max_attempts = 10;
        double reductions_before = metrics.throttle_reductions_total().Value();
        double retries_before = metrics.range_retries_total().Value();
        auto result = engine.download(CloudPath{"bucket", "obj/large.bin"},
                                      LocalPath{dest.string()}, options);
        store.clear_fault();
        engine.set_dispatch_observer(nullptr);

        ASSERT_TRUE(result.success, "download: " + result.error_message);
        ASSERT_TRUE(read_file(dest) == large, "content");
        ASSERT_EQ(violations, 0u, "dispatch never exceeded the limit");
        ASSERT_EQ(dispatches, 17u + 8u, "every attempt dispatched through the throttle");
        ASSERT_TRUE(metrics.throttle_reductions_total().Value() - reductions_before >= 1.0,
                    "limit reduced");
        ASSERT_EQ(metrics.range_retries_total().Value() - retries_before, 8.0, "range retries");
        ASSERT_TRUE(store.max_concurrent_gets() <= options.concurrency, "concurrency bound");
        PASS();
    }
    {
        TEST(directory_source_rejected);
        auto result = engine.download(CloudPath{"bucket", "obj/"},
                                      LocalPath{(tmpdir / "out").string()}, small_options());
        ASSERT_TRUE(result.error_kind == ErrorKind::InvalidPath, "invalid path");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 7. BatchCoordinator
// ---------------------------------------------------------------------------

static void test_batch_coordinator() {
    std::cout << "\n=== BatchCoordinator ===" << std::endl;

    auto tmpdir = make_temp_dir("s3xfer-batch");
    FaultInjectingStore store(tmpdir / "store");
    Engines engines(store);

    std::vector<LocalPath> sources;
    std::vector<CloudPath> destinations;
    for (int i = 0; i < 5; ++i) {
        auto path = tmpdir / "src" / ("f" + std::to_string(i) + ".txt");
        if (i != 1) write_file(path, "item " + std::to_string(i));
        sources.push_back(LocalPath{path.string()});
        destinations.push_back(CloudPath{"bucket", "batch/f" + std::to_string(i) + ".txt"});
    }

    {
        TEST(fail_fast_stops_new_items);
        auto options = small_options();
        options.concurrency = 1;
        options.fail_fast = true;
        auto report = engines.batches.batch_upload(sources, destinations, options);
        ASSERT_TRUE(!report.success, "batch failed");
        ASSERT_TRUE(report.aborted, "aborted");
        ASSERT_EQ(report.results.size(), 2u, "only started items reported");
        ASSERT_EQ(report.result_indices[1], 1u, "failing index");
        ASSERT_TRUE(report.results[1].error_kind == ErrorKind::NotFound, "missing source");
        ASSERT_EQ(report.errors.size(), 1u, "one error");
        ASSERT_TRUE(!store.head("bucket", "batch/f2.txt").success, "later items never started");
        PASS();
    }
    {
        TEST(collect_all_reports_every_item);
        auto options = small_options();
        options.concurrency = 3;
        options.fail_fast = false;
        auto report = engines.batches.batch_upload(sources, destinations, options);
        ASSERT_TRUE(!report.success, "batch failed");
        ASSERT_TRUE(!report.aborted, "not aborted");
        ASSERT_EQ(report.results.size(), sources.size(), "one result per input");
        ASSERT_EQ(report.errors.size(), 1u, "one error");
        ASSERT_EQ(report.errors[0].index, 1u, "error index");
        ASSERT_EQ(object_string(store, "bucket", "batch/f4.txt"), "item 4", "others uploaded");
        PASS();
    }
    {
        TEST(batch_download);
        std::vector<CloudPath> remote = {destinations[0], destinations[2]};
        std::vector<LocalPath> local = {LocalPath{(tmpdir / "dl" / "a.txt").string()},
                                        LocalPath{(tmpdir / "dl" / "b.txt").string()}};
        auto report = engines.batches.batch_download(remote, local, small_options());
        ASSERT_TRUE(report.success, "batch succeeded");
        ASSERT_EQ(read_file(tmpdir / "dl" / "b.txt"), "item 2", "content");
        PASS();
    }
    {
        TEST(length_mismatch_rejected);
        size_t puts_before = store.calls("put");
        std::vector<CloudPath> short_list(destinations.begin(), destinations.begin() + 2);
        auto report = engines.batches.batch_upload(sources, short_list, small_options());
        ASSERT_TRUE(!report.success, "rejected");
        ASSERT_EQ(report.results.size(), 1u, "single error result");
        ASSERT_TRUE(report.results[0].error_kind == ErrorKind::InvalidPath, "invalid");
        ASSERT_EQ(store.calls("put"), puts_before, "no work done");
        PASS();
    }
    {
        TEST(pool_respects_concurrency);
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        auto report = BatchCoordinator::run_indexed(20, 4, false,
            [&](size_t, const CancellationToken&) {
                int now = ++running;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(2ms);
                --running;
                return TransferResult::ok("noop");
            });
        ASSERT_TRUE(report.success, "all ok");
        ASSERT_EQ(report.results.size(), 20u, "all ran");
        ASSERT_TRUE(peak.load() <= 4, "bounded workers");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 8. DirectoryService
// ---------------------------------------------------------------------------

static void test_directory_service() {
    std::cout << "\n=== DirectoryService ===" << std::endl;

    auto tmpdir = make_temp_dir("s3xfer-dirs");
    FaultInjectingStore store(tmpdir / "store");
    Engines engines(store);
    auto& dirs = engines.directories;

    {
        TEST(create_is_idempotent);
        auto first = dirs.create(CloudPath{"bucket", "docs"}, small_options());
        ASSERT_TRUE(first.success, "create: " + first.error_message);
        size_t puts = store.calls("put");
        auto second = dirs.create(CloudPath{"bucket", "docs/"}, small_options());
        ASSERT_TRUE(second.success, "second create");
        ASSERT_EQ(store.calls("put"), puts, "placeholder not rewritten");
        auto head = store.head("bucket", "docs/");
        ASSERT_TRUE(head.success, "placeholder exists");
        ASSERT_EQ(head.metadata.size, 0u, "zero length");
        ASSERT_EQ(head.metadata.content_type, "application/x-directory", "content type");
        PASS();
    }
    {
        TEST(exists_three_ways);
        put_string(store, "bucket", "photos/a.jpg", "jpg");
        auto placeholder = dirs.exists(CloudPath{"bucket", "docs"}, small_options());
        auto implied = dirs.exists(CloudPath{"bucket", "photos"}, small_options());
        auto absent = dirs.exists(CloudPath{"bucket", "nothing"}, small_options());
        ASSERT_TRUE(placeholder.success && placeholder.exists, "placeholder only");
        ASSERT_TRUE(implied.success && implied.exists, "objects under prefix");
        ASSERT_TRUE(absent.success && !absent.exists, "neither");
        PASS();
    }

    put_string(store, "bucket", "d/a.txt", "aaaa");
    put_string(store, "bucket", "d/b.log", "bb");
    put_string(store, "bucket", "d/sub/c.txt", "c");
    put_string(store, "bucket", "d/sub/deep/e.txt", "eeeee");

    {
        TEST(list_one_level);
        ListRequest request;
        auto result = dirs.list(CloudPath{"bucket", "d"}, request, small_options());
        ASSERT_TRUE(result.success, "list: " + result.error_message);
        ASSERT_EQ(result.entries.size(), 3u, "two files and one directory");
        std::vector<std::string> shown;
        for (const auto& e : result.entries) shown.push_back(e.display);
        std::sort(shown.begin(), shown.end());
        ASSERT_EQ(shown[0], "s3://bucket/d/a.txt", "full uri");
        ASSERT_EQ(shown[2], "s3://bucket/d/sub/", "sub-directory");
        PASS();
    }
    {
        TEST(list_recursive_with_filter);
        ListRequest request;
        request.recurse = true;
        request.filter = "*.txt";
        request.format = ListFormat::Relative;
        auto result = dirs.list(CloudPath{"bucket", "d/"}, request, small_options());
        ASSERT_TRUE(result.success, "list");
        std::vector<std::string> shown;
        for (const auto& e : result.entries) shown.push_back(e.display);
        std::sort(shown.begin(), shown.end());
        ASSERT_EQ(shown.size(), 3u, "three text files");
        ASSERT_EQ(shown[0], "a.txt", "relative");
        ASSERT_EQ(shown[2], "sub/deep/e.txt", "nested relative");
        PASS();
    }
    {
        TEST(list_type_filter);
        ListRequest request;
        request.type = EntryType::Directories;
        request.format = ListFormat::Key;
        auto result = dirs.list(CloudPath{"bucket", "d"}, request, small_options());
        ASSERT_TRUE(result.success, "list");
        ASSERT_EQ(result.entries.size(), 1u, "one directory");
        ASSERT_EQ(result.entries[0].display, "d/sub/", "key format");

        request.type = EntryType::Files;
        auto files = dirs.list(CloudPath{"bucket", "d"}, request, small_options());
        ASSERT_EQ(files.entries.size(), 2u, "two files");
        PASS();
    }
    {
        TEST(list_detailed);
        ListRequest request;
        request.format = ListFormat::Detailed;
        request.filter = "a.txt";
        auto result = dirs.list(CloudPath{"bucket", "d"}, request, small_options());
        ASSERT_EQ(result.entries.size(), 1u, "one entry");
        const auto& line = result.entries[0].display;
        ASSERT_TRUE(line.find("s3://bucket/d/a.txt") != std::string::npos, "uri: " + line);
        ASSERT_TRUE(line.find("           4") != std::string::npos, "padded size: " + line);
        PASS();
    }
    {
        TEST(aggregate);
        auto result = dirs.aggregate(CloudPath{"bucket", "d/"}, small_options());
        ASSERT_TRUE(result.success, "aggregate");
        ASSERT_TRUE(result.info.is_directory, "directory form");
        ASSERT_EQ(result.info.object_count, 4u, "objects");
        ASSERT_EQ(result.info.total_size, 12u, "bytes");
        auto missing = dirs.aggregate(CloudPath{"bucket", "nothing/"}, small_options());
        ASSERT_TRUE(missing.error_kind == ErrorKind::NotFound, "missing directory");
        PASS();
    }
    {
        TEST(copy_reports_exact_failures);
        for (int i = 0; i < 5; ++i) {
            put_string(store, "bucket", "src/f" + std::to_string(i), "content " + std::to_string(i));
        }
        store.set_fault([](const std::string& op, const std::string& key, uint64_t)
                            -> std::optional<ErrorKind> {
            if (op == "copy" && key == "src/f2") return ErrorKind::AccessDenied;
            return std::nullopt;
        });
        auto result = dirs.copy(CloudPath{"bucket", "src"}, CloudPath{"bucket", "dst/"}, true,
                                small_options());
        store.clear_fault();
        ASSERT_TRUE(!result.success, "partial failure");
        ASSERT_TRUE(result.error_kind == ErrorKind::PartialBatchFailure, "kind");
        ASSERT_EQ(result.copied, 4u, "copied");
        ASSERT_EQ(result.failed_keys.size(), 1u, "one failed key");
        ASSERT_EQ(result.failed_keys[0], "src/f2", "failed key");
        ASSERT_EQ(object_string(store, "bucket", "dst/f4"), "content 4", "copied content");
        ASSERT_TRUE(!store.head("bucket", "dst/f2").success, "failed key not written");
        PASS();
    }
    {
        TEST(copy_missing_source);
        auto result = dirs.copy(CloudPath{"bucket", "ghost/"}, CloudPath{"bucket", "x/"}, true,
                                small_options());
        ASSERT_TRUE(result.error_kind == ErrorKind::NotFound, "not found");
        PASS();
    }
    {
        TEST(copy_local_tree_up_and_down);
        write_file(tmpdir / "tree" / "a.txt", "A");
        write_file(tmpdir / "tree" / "nested" / "b.txt", "B");
        auto up = dirs.copy(LocalPath{(tmpdir / "tree").string()}, CloudPath{"bucket", "up/"}, true,
                            small_options());
        ASSERT_TRUE(up.success, "upload tree: " + up.error_message);
        ASSERT_EQ(up.copied, 2u, "two files");
        ASSERT_EQ(object_string(store, "bucket", "up/nested/b.txt"), "B", "nested key");

        auto down = dirs.copy(CloudPath{"bucket", "up/"}, LocalPath{(tmpdir / "back").string()}, true,
                              small_options());
        ASSERT_TRUE(down.success, "download tree: " + down.error_message);
        ASSERT_EQ(read_file(tmpdir / "back" / "nested" / "b.txt"), "B", "nested file");
        ASSERT_EQ(read_file(tmpdir / "back" / "a.txt"), "A", "top file");
        PASS();
    }
    {
        TEST(copy_non_recursive_skips_nested);
        auto result = dirs.copy(LocalPath{(tmpdir / "tree").string()}, CloudPath{"bucket", "flat/"},
                                false, small_options());
        ASSERT_TRUE(result.success, "copy");
        ASSERT_EQ(result.copied, 1u, "top level only");
        ASSERT_TRUE(!store.head("bucket", "flat/nested/b.txt").success, "nested skipped");
        PASS();
    }
    {
        TEST(remove_prefix);
        auto result = dirs.remove(CloudPath{"bucket", "d"}, small_options());
        ASSERT_TRUE(result.success, "remove");
        ASSERT_EQ(result.deleted, 4u, "keys deleted");
        ASSERT_TRUE(!dirs.exists(CloudPath{"bucket", "d"}, small_options()).exists, "gone");
        ASSERT_TRUE(dirs.exists(CloudPath{"bucket", "docs"}, small_options()).exists, "sibling untouched");
        PASS();
    }
    {
        TEST(remove_partial_failure);
        store.set_fault([](const std::string& op, const std::string& key, uint64_t)
                            -> std::optional<ErrorKind> {
            if (op == "remove" && key == "up/a.txt") return ErrorKind::AccessDenied;
            return std::nullopt;
        });
        auto result = dirs.remove(CloudPath{"bucket", "up/"}, small_options());
        store.clear_fault();
        ASSERT_TRUE(!result.success, "partial");
        ASSERT_TRUE(result.error_kind == ErrorKind::PartialBatchFailure, "kind");
        ASSERT_EQ(result.failed_keys.size(), 1u, "one failed key");
        ASSERT_EQ(result.failed_keys[0], "up/a.txt", "failed key");
        PASS();
    }
    {
        TEST(remove_retries_transient_request_failure);
        put_string(store, "bucket", "tmp/x", "x");
        put_string(store, "bucket", "tmp/y", "y");
        std::atomic<int> failures{0};
        store.set_fault([&](const std::string& op, const std::string&, uint64_t)
                            -> std::optional<ErrorKind> {
            if (op == "remove_batch" && failures.fetch_add(1) == 0) return ErrorKind::NetworkFailure;
            return std::nullopt;
        });
        size_t before = store.calls("remove_batch");
        auto result = dirs.remove(CloudPath{"bucket", "tmp/"}, small_options());
        store.clear_fault();
        ASSERT_TRUE(result.success, "transient failure retried: " + result.error_message);
        ASSERT_EQ(result.deleted, 2u, "both keys deleted");
        ASSERT_TRUE(result.failed_keys.empty(), "no failed keys");
        ASSERT_EQ(store.calls("remove_batch") - before, 2u, "one retry");
        ASSERT_TRUE(!store.head("bucket", "tmp/x").success, "key gone");
        PASS();
    }
    {
        TEST(remove_request_failure_keeps_kind);
        put_string(store, "bucket", "locked/a", "a");
        put_string(store, "bucket", "locked/b", "b");
        store.set_fault([](const std::string& op, const std::string&, uint64_t)
                            -> std::optional<ErrorKind> {
            if (op == "remove_batch") return ErrorKind::AccessDenied;
            return std::nullopt;
        });
        size_t before = store.calls("remove_batch");
        auto result = dirs.remove(CloudPath{"bucket", "locked/"}, small_options());
        store.clear_fault();
        ASSERT_TRUE(!result.success, "failed");
        ASSERT_TRUE(result.error_kind == ErrorKind::AccessDenied, "request error kind kept");
        ASSERT_EQ(result.failed_keys.size(), 2u, "every key reported");
        ASSERT_EQ(store.calls("remove_batch") - before, 1u, "fatal error not retried");
        ASSERT_TRUE(store.head("bucket", "locked/a").success, "objects untouched");
        PASS();
    }
    {
        TEST(listing_uses_caller_retry_budget);
        store.set_fault([](const std::string& op, const std::string&, uint64_t)
                            -> std::optional<ErrorKind> {
            if (op == "list") return ErrorKind::NetworkFailure;
            return std::nullopt;
        });
        auto options = small_options();
        options.retry.max_attempts = 2;
        size_t before = store.calls("list");
        auto result = dirs.list(CloudPath{"bucket", "d"}, ListRequest{}, options);
        size_t attempts = store.calls("list") - before;
        store.clear_fault();
        ASSERT_TRUE(!result.success, "list failed");
        ASSERT_TRUE(result.error_kind == ErrorKind::NetworkFailure, "kind");
        ASSERT_EQ(attempts, 2u, "configured attempt budget");
        PASS();
    }
    {
        TEST(listing_stops_when_cancelled);
        CancellationToken cancel;
        cancel.cancel();
        size_t before = store.calls("list");
        auto exists = dirs.exists(CloudPath{"bucket", ""}, small_options(), cancel);
        auto removed = dirs.remove(CloudPath{"bucket", "docs/"}, small_options(), cancel);
        ASSERT_TRUE(exists.error_kind == ErrorKind::Aborted, "exists aborted");
        ASSERT_TRUE(removed.error_kind == ErrorKind::Aborted, "remove aborted");
        ASSERT_EQ(store.calls("list"), before, "no listing issued");
        ASSERT_TRUE(store.head("bucket", "docs/").success, "placeholder kept");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 9. CopyOrchestrator
// ---------------------------------------------------------------------------

static void test_copy_orchestrator() {
    std::cout << "\n=== CopyOrchestrator ===" << std::endl;

    auto tmpdir = make_temp_dir("s3xfer-copy");
    FaultInjectingStore store(tmpdir / "store");
    TransferMetrics metrics;
    Engines engines(store, nullptr, &metrics);
    auto& copier = engines.orchestrator;

    std::string content = pattern_data(5000, 21);
    {
        storage::PutOptions put;
        put.content_type = "text/csv";
        put.metadata = {{"source", "export"}};
        store.put("bucket", "in/report.csv", as_bytes(content), put);
    }

    {
        TEST(server_side);
        auto result = copier.copy_remote(CloudPath{"bucket", "in/report.csv"},
                                         CloudPath{"bucket", "out/report.csv"}, small_options());
        ASSERT_TRUE(result.success, "copy: " + result.error_message);
        ASSERT_EQ(result.strategy, "server-side", "strategy");
        ASSERT_TRUE(object_string(store, "bucket", "out/report.csv") == content, "content");
        PASS();
    }
    {
        TEST(fallback_to_two_phase);
        auto staging = tmpdir / "staging";
        fs::create_directories(staging);
        store.set_fault([](const std::string& op, const std::string&, uint64_t)
                            -> std::optional<ErrorKind> {
            if (op == "copy") return ErrorKind::NetworkFailure;
            return std::nullopt;
        });
        auto options = small_options();
        options.temp_dir = staging.string();
        double fallbacks_before = metrics.copy_fallbacks_total().Value();
        auto result = copier.copy_remote(CloudPath{"bucket", "in/report.csv"},
                                         CloudPath{"bucket", "fallback/report.csv"}, options);
        store.clear_fault();
        ASSERT_TRUE(result.success, "copy: " + result.error_message);
        ASSERT_EQ(result.strategy, "two-phase", "strategy");
        ASSERT_EQ(metrics.copy_fallbacks_total().Value() - fallbacks_before, 1.0, "fallback counted");
        ASSERT_TRUE(object_string(store, "bucket", "fallback/report.csv") == content, "content");
        auto head = store.head("bucket", "fallback/report.csv");
        ASSERT_EQ(head.metadata.content_type, "text/csv", "content type carried");
        ASSERT_EQ(head.metadata.user_metadata["source"], "export", "metadata carried");
        ASSERT_TRUE(fs::is_empty(staging), "temp file removed");
        PASS();
    }
    {
        TEST(missing_source_surfaces);
        auto result = copier.copy_remote(CloudPath{"bucket", "in/none.csv"},
                                         CloudPath{"bucket", "out/none.csv"}, small_options());
        ASSERT_TRUE(result.error_kind == ErrorKind::NotFound, "not found");
        PASS();
    }
    {
        TEST(access_denied_does_not_fall_back);
        store.set_fault([](const std::string& op, const std::string&, uint64_t)
                            -> std::optional<ErrorKind> {
            if (op == "copy") return ErrorKind::AccessDenied;
            return std::nullopt;
        });
        size_t gets_before = store.calls("get");
        auto result = copier.copy_remote(CloudPath{"bucket", "in/report.csv"},
                                         CloudPath{"bucket", "denied/report.csv"}, small_options());
        store.clear_fault();
        ASSERT_TRUE(result.error_kind == ErrorKind::AccessDenied, "denied");
        ASSERT_EQ(store.calls("get"), gets_before, "no two-phase download");
        PASS();
    }
    {
        TEST(directory_destination_gets_basename);
        auto result = copier.copy(CloudPath{"bucket", "in/report.csv"}, CloudPath{"bucket", "archive/"},
                                  small_options());
        ASSERT_TRUE(result.success, "copy: " + result.error_message);
        ASSERT_TRUE(object_string(store, "bucket", "archive/report.csv") == content, "basename appended");
        PASS();
    }
    {
        TEST(local_to_local);
        write_file(tmpdir / "l" / "src.txt", "local");
        auto result = copier.copy(LocalPath{(tmpdir / "l" / "src.txt").string()},
                                  LocalPath{(tmpdir / "l" / "copy" / "dst.txt").string()}, small_options());
        ASSERT_TRUE(result.success, "copy: " + result.error_message);
        ASSERT_EQ(read_file(tmpdir / "l" / "copy" / "dst.txt"), "local", "content");
        PASS();
    }
    {
        TEST(directory_source_rejected);
        auto result = copier.copy(CloudPath{"bucket", "in/"}, CloudPath{"bucket", "x/"}, small_options());
        ASSERT_TRUE(result.error_kind == ErrorKind::InvalidPath, "invalid");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 10. TransferService
// ---------------------------------------------------------------------------

static void test_transfer_service() {
    std::cout << "\n=== TransferService ===" << std::endl;

    auto tmpdir = make_temp_dir("s3xfer-service");
    auto store = storage::ObjectStoreFactory::create_local(tmpdir / "store");
    TransferService service(*store, "data", small_options());

    write_file(tmpdir / "hello.txt", "hello world");

    {
        TEST(upload_to_bare_key_and_directory);
        auto a = service.upload((tmpdir / "hello.txt").string(), "greetings/hello.txt");
        ASSERT_TRUE(a.success, "upload: " + a.error_message);
        auto b = service.upload((tmpdir / "hello.txt").string(), "s3://data/copies/");
        ASSERT_TRUE(b.success, "upload: " + b.error_message);
        ASSERT_EQ(object_string(*store, "data", "copies/hello.txt"), "hello world", "basename appended");
        PASS();
    }
    {
        TEST(invalid_paths_are_results);
        ASSERT_TRUE(service.upload("", "x").error_kind == ErrorKind::InvalidPath, "empty source");
        ASSERT_TRUE(service.upload((tmpdir / "hello.txt").string(), "s3://").error_kind ==
                    ErrorKind::InvalidPath, "bad uri");
        ASSERT_TRUE(service.download("s3://data/x", "s3://data/y").error_kind == ErrorKind::InvalidPath,
                    "remote as local");
        ASSERT_TRUE(service.directory_list("s3:///", ListRequest{}).error_kind == ErrorKind::InvalidPath,
                    "bad list path");
        PASS();
    }
    {
        TEST(get_bytes);
        auto bytes = service.get_bytes("greetings/hello.txt");
        ASSERT_TRUE(bytes.success, "get: " + bytes.error_message);
        ASSERT_EQ(std::string(bytes.data.begin(), bytes.data.end()), "hello world", "content");
        ASSERT_TRUE(service.get_bytes("greetings/none.txt").error_kind == ErrorKind::NotFound, "missing");
        PASS();
    }
    {
        TEST(object_info);
        auto file = service.object_info("greetings/hello.txt");
        ASSERT_TRUE(file.success, "info: " + file.error_message);
        ASSERT_TRUE(!file.info.is_directory, "object");
        ASSERT_EQ(file.info.size, 11u, "size");
        auto dir = service.object_info("greetings");
        ASSERT_TRUE(dir.success, "directory info: " + dir.error_message);
        ASSERT_TRUE(dir.info.is_directory, "directory");
        ASSERT_EQ(dir.info.object_count, 1u, "count");
        ASSERT_TRUE(service.object_info("nowhere").error_kind == ErrorKind::NotFound, "missing");
        PASS();
    }
    {
        TEST(presign);
        PresignRequest request;
        request.path = "greetings/hello.txt";
        auto url = service.presign(request);
        ASSERT_TRUE(url.success, "presign: " + url.error_message);
        ASSERT_TRUE(url.url.starts_with("file://"), "local url: " + url.url);

        request.expires_seconds = 0;
        ASSERT_TRUE(!service.presign(request).success, "zero expiry rejected");
        request.expires_seconds = constants::MAX_PRESIGN_EXPIRY_SECS + 1;
        ASSERT_TRUE(!service.presign(request).success, "expiry over a week rejected");
        request.expires_seconds = constants::MAX_PRESIGN_EXPIRY_SECS;
        ASSERT_TRUE(service.presign(request).success, "one week accepted");
        request.path = "s3://data/";
        ASSERT_TRUE(service.presign(request).error_kind == ErrorKind::InvalidPath, "no key");
        PASS();
    }
    {
        TEST(copy_download_remove);
        auto copied = service.copy("greetings/hello.txt", "s3://data/moved/hello.txt");
        ASSERT_TRUE(copied.success, "copy: " + copied.error_message);
        auto down = service.download("moved/hello.txt", (tmpdir / "dl" / "").string());
        ASSERT_TRUE(down.success, "download: " + down.error_message);
        ASSERT_EQ(read_file(tmpdir / "dl" / "hello.txt"), "hello world", "downloaded");

        ASSERT_TRUE(service.remove("moved/hello.txt").success, "remove object");
        ASSERT_TRUE(service.get_bytes("moved/hello.txt").error_kind == ErrorKind::NotFound, "gone");
        ASSERT_TRUE(service.remove("moved/").error_kind == ErrorKind::InvalidPath, "directory form");
        ASSERT_TRUE(service.remove((tmpdir / "dl" / "hello.txt").string()).success, "remove local");
        ASSERT_TRUE(service.remove((tmpdir / "dl" / "hello.txt").string()).error_kind ==
                    ErrorKind::NotFound, "local missing");
        PASS();
    }
    {
        TEST(directory_operations);
        ASSERT_TRUE(service.directory_create("s3://data/empty").success, "create");
        ASSERT_TRUE(service.directory_exists("empty").exists, "exists");
        auto copy = service.directory_copy("greetings", "s3://data/mirror/", true);
        ASSERT_TRUE(copy.success, "copy: " + copy.error_message);
        ASSERT_EQ(copy.copied, 1u, "copied");
        auto removed = service.directory_remove("mirror");
        ASSERT_TRUE(removed.success, "remove");
        ASSERT_TRUE(!service.directory_exists("mirror").exists, "gone");
        PASS();
    }
    {
        TEST(batch_rejects_bad_path_before_work);
        auto report = service.batch_upload({(tmpdir / "hello.txt").string(), (tmpdir / "hello.txt").string()},
                                           {"s3://data/b1.txt", "s3://"}, 2, true);
        ASSERT_TRUE(!report.success, "rejected");
        ASSERT_EQ(report.result_indices[0], 1u, "offending index");
        ASSERT_TRUE(!store->head("data", "b1.txt").success, "nothing uploaded");
        PASS();
    }
    {
        TEST(cancel_aborts_in_flight_work);
        auto store2 = storage::ObjectStoreFactory::create_local(tmpdir / "store2");
        TransferService cancelled(*store2, "data", small_options());
        cancelled.cancel();
        auto result = cancelled.upload((tmpdir / "hello.txt").string(), "after-cancel.txt");
        ASSERT_TRUE(result.error_kind == ErrorKind::Aborted, "aborted");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 11. TransferConfig
// ---------------------------------------------------------------------------

static void test_transfer_config() {
    std::cout << "\n=== TransferConfig ===" << std::endl;

    auto tmpdir = make_temp_dir("s3xfer-config");

    {
        TEST(cli_parsing);
        const char* args[] = {
            "s3xfer",
            "--store-type", "local",
            "--local-root", "/srv/objects",
            "--bucket", "media",
            "--concurrency", "3",
            "--part-size", "8M",
            "--no-fail-fast",
            "--meta", "owner=ops",
            "-r",
            "--format", "detailed",
            "--type", "files",
            "ls", "s3://media/photos",
        };
        auto cfg = TransferConfig::from_args(21, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->store.type, "local", "store type");
        ASSERT_EQ(cfg->store.params["path"], "/srv/objects", "local root");
        ASSERT_EQ(cfg->default_bucket, "media", "bucket");
        ASSERT_EQ(cfg->concurrency, 3u, "concurrency");
        ASSERT_EQ(cfg->part_size, 8 * constants::MiB, "part size suffix");
        ASSERT_TRUE(!cfg->fail_fast, "fail fast off");
        ASSERT_EQ(cfg->metadata["owner"], "ops", "metadata");
        ASSERT_TRUE(cfg->recursive, "recursive");
        ASSERT_TRUE(cfg->list_format == ListFormat::Detailed, "format");
        ASSERT_TRUE(cfg->list_type == EntryType::Files, "type");
        ASSERT_EQ(cfg->command, "ls", "command");
        ASSERT_EQ(cfg->args.size(), 1u, "args");
        ASSERT_EQ(cfg->args[0], "s3://media/photos", "arg");
        ASSERT_EMPTY(cfg->validate(), "valid");
        PASS();
    }
    {
        TEST(unknown_flag_rejected);
        const char* args[] = {"s3xfer", "--frobnicate", "ls"};
        auto cfg = TransferConfig::from_args(3, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "should not parse");
        PASS();
    }
    {
        TEST(bad_size_rejected);
        const char* args[] = {"s3xfer", "--part-size", "12Q", "ls"};
        auto cfg = TransferConfig::from_args(4, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "should not parse");
        PASS();
    }
    {
        TEST(environment_credentials);
        setenv("AWS_ACCESS_KEY_ID", "AKIDEXAMPLE", 1);
        setenv("AWS_SECRET_ACCESS_KEY", "wJalrXUtnFEMI", 1);
        setenv("S3XFER_DEFAULT_BUCKET", "from-env", 1);
        const char* args[] = {"s3xfer", "--store-type", "s3", "--region", "eu-west-1", "info", "k"};
        auto cfg = TransferConfig::from_args(7, const_cast<char**>(args));
        unsetenv("AWS_ACCESS_KEY_ID");
        unsetenv("AWS_SECRET_ACCESS_KEY");
        unsetenv("S3XFER_DEFAULT_BUCKET");
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->store.params["access_key"], "AKIDEXAMPLE", "access key");
        ASSERT_EQ(cfg->store.params["secret_key"], "wJalrXUtnFEMI", "secret key");
        ASSERT_EQ(cfg->store.params["region"], "eu-west-1", "flag beats environment");
        ASSERT_EQ(cfg->default_bucket, "from-env", "bucket from environment");
        ASSERT_EMPTY(cfg->validate(), "valid");
        PASS();
    }
    {
        TEST(json_overlay);
        auto path = tmpdir / "s3xfer.json";
        write_file(path, R"({
            "default_bucket": "archive",
            "concurrency": 12,
            "part_size": 33554432,
            "retry": {"max_attempts": 6, "base_delay_ms": 50},
            "metadata": {"team": "infra"},
            "store": {"type": "s3", "endpoint": "http://minio:9000", "use_path_style": true,
                      "access_key": "k", "secret_key": "s"}
        })");
        TransferConfig cfg;
        ASSERT_TRUE(cfg.load_json(path), "load");
        ASSERT_EQ(cfg.default_bucket, "archive", "bucket");
        ASSERT_EQ(cfg.concurrency, 12u, "concurrency");
        ASSERT_EQ(cfg.part_size, 32 * constants::MiB, "part size");
        ASSERT_EQ(cfg.metadata["team"], "infra", "metadata");
        ASSERT_EQ(cfg.store.params["endpoint"], "http://minio:9000", "endpoint");
        ASSERT_EQ(cfg.store.params["use_path_style"], "true", "non-string param");
        auto options = cfg.to_transfer_options();
        ASSERT_EQ(options.retry.max_attempts, 6u, "retry attempts");
        ASSERT_EQ(options.retry.base_delay.count(), 50, "retry delay");
        ASSERT_EQ(options.concurrency, 12u, "options concurrency");
        PASS();
    }
    {
        TEST(json_errors);
        write_file(tmpdir / "broken.json", "{ not json");
        TransferConfig cfg;
        ASSERT_TRUE(!cfg.load_json(tmpdir / "broken.json"), "parse error");
        ASSERT_TRUE(!cfg.load_json(tmpdir / "absent.json"), "missing file");
        PASS();
    }
    {
        TEST(validation);
        TransferConfig cfg;
        cfg.store.type = "s3";
        ASSERT_TRUE(cfg.validate().find("access_key") != std::string::npos, "s3 needs credentials");
        cfg.store.type = "local";
        ASSERT_TRUE(cfg.validate().find("path") != std::string::npos, "local needs path");
        cfg.store.params["path"] = "/srv";
        ASSERT_EMPTY(cfg.validate(), "valid local");
        cfg.store.type = "ftp";
        ASSERT_TRUE(cfg.validate().find("unknown store type") != std::string::npos, "unknown type");
        cfg.store.type = "local";
        cfg.retry_jitter = 1.5;
        ASSERT_NOT_EMPTY(cfg.validate(), "jitter out of range");
        cfg.retry_jitter = 0.2;
        cfg.presign_method = "DELETE";
        ASSERT_NOT_EMPTY(cfg.validate(), "bad presign method");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 12. SessionJournal
// ---------------------------------------------------------------------------

static void test_session_journal() {
    std::cout << "\n=== SessionJournal ===" << std::endl;

    auto tmpdir = make_temp_dir("s3xfer-journal");
    auto store = storage::ObjectStoreFactory::create_local(tmpdir / "store");

    {
        TEST(record_and_remove);
        SessionJournal journal(tmpdir / "a.db");
        MultipartSession session{"upload-1", "bucket", "key/one", {}};
        ASSERT_TRUE(journal.record(session), "record");
        auto entries = journal.entries();
        ASSERT_EQ(entries.size(), 1u, "one row");
        ASSERT_EQ(entries[0].upload_id, "upload-1", "upload id");
        ASSERT_EQ(entries[0].key, "key/one", "key");
        ASSERT_EQ(entries[0].pid, static_cast<int64_t>(getpid()), "owner pid");
        ASSERT_TRUE(journal.remove("upload-1"), "remove");
        ASSERT_TRUE(journal.entries().empty(), "empty");
        PASS();
    }
    {
        TEST(rows_survive_reopen);
        {
            SessionJournal journal(tmpdir / "b.db");
            journal.record(MultipartSession{"upload-2", "bucket", "key/two", {}});
        }
        SessionJournal reopened(tmpdir / "b.db");
        ASSERT_EQ(reopened.entries().size(), 1u, "persisted");
        PASS();
    }
    {
        TEST(recover_orphans);
        SessionJournal journal(tmpdir / "c.db");
        TransferMetrics metrics;
        auto init = store->initiate_multipart("bucket", "orphan.bin");
        ASSERT_TRUE(init.success, "initiate");
        journal.record(MultipartSession{init.upload_id, "bucket", "orphan.bin", {}});
        journal.record(MultipartSession{"no-such-upload", "bucket", "gone.bin", {}});

        auto report = journal.recover_orphans(*store, &metrics);
        ASSERT_EQ(report.aborted, 1u, "aborted");
        ASSERT_EQ(report.already_gone, 1u, "already gone");
        ASSERT_TRUE(report.failed.empty(), "no failures");
        ASSERT_TRUE(journal.entries().empty(), "journal cleared");
        ASSERT_TRUE(store->list_multipart_uploads("bucket", "").uploads.empty(), "no live sessions");
        ASSERT_EQ(metrics.orphans_recovered_total().Value(), 1.0, "metric");
        PASS();
    }
    {
        TEST(bad_path_throws);
        write_file(tmpdir / "blocker", "not a directory");
        bool threw = false;
        try {
            SessionJournal journal(tmpdir / "blocker" / "j.db");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "should throw");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 13. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("s3xfer-metrics");
    auto prom_path = tmpdir / "s3xfer.prom";

    {
        TEST(serialize_contains_counters);
        TransferMetrics metrics({}, std::chrono::seconds(60), {{"command", "cp"}});
        metrics.record_upload(true, 1234);
        metrics.record_download(false, 0);
        metrics.record_copy(true, true);
        auto text = metrics.serialize();
        ASSERT_TRUE(text.find("s3xfer_uploads_total") != std::string::npos, "uploads");
        ASSERT_TRUE(text.find("s3xfer_copy_fallbacks_total") != std::string::npos, "fallbacks");
        ASSERT_TRUE(text.find("command=\"cp\"") != std::string::npos, "constant label");
        ASSERT_EQ(metrics.upload_bytes_total().Value(), 1234.0, "bytes");
        ASSERT_EQ(metrics.downloads_failure().Value(), 1.0, "download failure");
        PASS();
    }
    {
        TEST(stop_writes_prom_file);
        TransferMetrics metrics(prom_path, std::chrono::seconds(60), {{"command", "upload"}});
        metrics.start();
        metrics.record_upload(true, 10);
        metrics.stop();
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("s3xfer_upload_bytes_total") != std::string::npos, "written");
        ASSERT_TRUE(content.find("s3xfer_upload_duration_seconds") != std::string::npos, "histogram");
        ASSERT_TRUE(!fs::exists(prom_path.string() + ".tmp"), "temp file renamed");
        PASS();
    }
    {
        TEST(active_transfer_gauge);
        TransferMetrics metrics;
        {
            ActiveTransfer a(&metrics);
            ActiveTransfer b(&metrics);
            ASSERT_EQ(metrics.active_transfers().Value(), 2.0, "two active");
        }
        ASSERT_EQ(metrics.active_transfers().Value(), 0.0, "released");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 14. SigV4 presigning
// ---------------------------------------------------------------------------

static void test_s3_presign() {
    std::cout << "\n=== S3 presign ===" << std::endl;

    {
        TEST(query_signature);
        auto store = storage::ObjectStoreFactory::create("s3", {
            {"access_key", "AKIDEXAMPLE"},
            {"secret_key", "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY"},
            {"region", "us-west-2"},
            {"endpoint", "https://objects.example.com"},
            {"use_path_style", "true"},
        });
        storage::PresignOptions options;
        options.expires_secs = 900;
        auto result = store->presign("media", "clips/intro.mp4", options);
        ASSERT_TRUE(result.success, "presign: " + result.error_message);
        ASSERT_TRUE(result.url.find("objects.example.com") != std::string::npos, "host: " + result.url);
        ASSERT_TRUE(result.url.find("X-Amz-Expires=900") != std::string::npos, "expiry");
        ASSERT_TRUE(result.url.find("X-Amz-Signature=") != std::string::npos, "signature");
        ASSERT_TRUE(result.url.find("AKIDEXAMPLE") != std::string::npos, "credential scope");
        PASS();
    }
    {
        TEST(factory_rejects_missing_credentials);
        bool threw = false;
        try {
            storage::ObjectStoreFactory::create("s3", {{"region", "us-east-1"}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "should throw");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "s3xfer test suite" << std::endl;
    std::cout << "=================" << std::endl;

    test_path_resolver();
    test_strategy();
    test_retry_policy();
    test_throttle();
    test_upload_engine();
    test_download_engine();
    test_batch_coordinator();
    test_directory_service();
    test_copy_orchestrator();
    test_transfer_service();
    test_transfer_config();
    test_session_journal();
    test_metrics();
    test_s3_presign();

    std::cout << "\n=================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
