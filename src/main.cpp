#include "s3xfer/core/log.hpp"
#include "s3xfer/metrics.hpp"
#include "s3xfer/session_journal.hpp"
#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/transfer/transfer_service.hpp"
#include "s3xfer/transfer_config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>
#include <unistd.h>

using namespace s3xfer;
using transfer::TransferService;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int sig) {
    (void)sig;
    g_interrupted = 1;
}

/// Forwards SIGINT/SIGTERM to the service's cancellation token.
class InterruptWatcher {
public:
    explicit InterruptWatcher(TransferService& service) : service_(service) {
        thread_ = std::thread([this] {
            while (!done_.load()) {
                if (g_interrupted) {
                    log_warn("interrupted, cancelling transfers");
                    service_.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }
    ~InterruptWatcher() {
        done_.store(true);
        if (thread_.joinable()) thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    TransferService& service_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

bool require_args(const TransferConfig& config, size_t count, const char* usage) {
    if (config.args.size() != count) {
        std::cerr << "Usage: s3xfer " << config.command << " " << usage << "\n";
        return false;
    }
    return true;
}

int report(const transfer::TransferResult& result, const std::string& what) {
    if (!result.success) {
        log_error("%s failed (%s): %s", what.c_str(), error_kind_name(result.error_kind),
                  result.error_message.c_str());
        return 1;
    }
    log_info("%s: %llu bytes, %s, %u part(s)", what.c_str(),
             static_cast<unsigned long long>(result.bytes_transferred),
             result.strategy.c_str(), result.parts);
    return 0;
}

// "<source> <destination>" per line; blank lines and '#' comments skipped
bool read_pairs(const std::string& path, std::vector<std::string>& sources,
                std::vector<std::string>& destinations) {
    std::ifstream file;
    std::istream* in = &std::cin;
    if (path != "-") {
        file.open(path);
        if (!file) {
            log_error("cannot open batch file %s", path.c_str());
            return false;
        }
        in = &file;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(*in, line)) {
        ++line_number;
        std::istringstream fields(line);
        std::string src, dst, extra;
        if (!(fields >> src) || src[0] == '#') continue;
        if (!(fields >> dst) || (fields >> extra)) {
            log_error("%s:%zu: expected '<source> <destination>'", path.c_str(), line_number);
            return false;
        }
        sources.push_back(src);
        destinations.push_back(dst);
    }
    return true;
}

int report_batch(const transfer::BatchReport& report, size_t total, const char* what) {
    for (const auto& error : report.errors) {
        log_error("%s item %zu: %s", what, error.index, error.message.c_str());
    }
    uint64_t bytes = 0;
    for (const auto& result : report.results) {
        bytes += result.bytes_transferred;
    }
    log_info("%s: %zu of %zu item(s) started, %zu failed, %llu bytes%s", what,
             report.results.size(), total, report.errors.size(),
             static_cast<unsigned long long>(bytes), report.aborted ? ", aborted" : "");
    return report.success ? 0 : 1;
}

int run_command(const TransferConfig& config, TransferService& service,
                storage::ObjectStore& store, SessionJournal* journal, TransferMetrics& metrics) {
    const std::string& cmd = config.command;
    const auto& args = config.args;

    if (cmd == "upload") {
        if (!require_args(config, 2, "<local> <remote>")) return 2;
        return report(service.upload(args[0], args[1]), "upload " + args[0]);
    }
    if (cmd == "download") {
        if (!require_args(config, 2, "<remote> <local>")) return 2;
        return report(service.download(args[0], args[1]), "download " + args[0]);
    }
    if (cmd == "cp") {
        if (!require_args(config, 2, "<source> <destination>")) return 2;
        return report(service.copy(args[0], args[1]), "copy " + args[0]);
    }
    if (cmd == "rm") {
        if (!require_args(config, 1, "<path>")) return 2;
        auto result = service.remove(args[0]);
        if (!result.success) {
            log_error("rm failed (%s): %s", error_kind_name(result.error_kind), result.error_message.c_str());
            return 1;
        }
        return 0;
    }
    if (cmd == "cat") {
        if (!require_args(config, 1, "<remote>")) return 2;
        auto result = service.get_bytes(args[0]);
        if (!result.success) {
            log_error("cat failed (%s): %s", error_kind_name(result.error_kind), result.error_message.c_str());
            return 1;
        }
        if (!result.data.empty() &&
            std::fwrite(result.data.data(), 1, result.data.size(), stdout) != result.data.size()) {
            log_error("cat: write to stdout failed");
            return 1;
        }
        std::fflush(stdout);
        return 0;
    }
    if (cmd == "info") {
        if (!require_args(config, 1, "<remote>")) return 2;
        auto result = service.object_info(args[0]);
        if (!result.success) {
            log_error("info failed (%s): %s", error_kind_name(result.error_kind), result.error_message.c_str());
            return 1;
        }
        const auto& info = result.info;
        if (info.is_directory) {
            std::cout << "type: directory\n"
                      << "objects: " << info.object_count << "\n"
                      << "total-size: " << info.total_size << "\n";
            if (info.object_count > 0) {
                std::cout << "last-modified: " << format_time(info.last_modified_latest) << "\n";
            }
        } else {
            std::cout << "type: object\n"
                      << "size: " << info.size << "\n"
                      << "content-type: " << info.content_type << "\n"
                      << "etag: " << info.etag << "\n"
                      << "last-modified: " << format_time(info.last_modified) << "\n";
            for (const auto& [key, value] : info.user_metadata) {
                std::cout << "meta-" << key << ": " << value << "\n";
            }
        }
        return 0;
    }
    if (cmd == "presign") {
        if (!require_args(config, 1, "<remote>")) return 2;
        transfer::PresignRequest request;
        request.path = args[0];
        request.method = config.presign_method == "PUT" ? storage::PresignMethod::Put
                                                         : storage::PresignMethod::Get;
        request.expires_seconds = config.presign_expires_secs;
        request.content_type = config.content_type;
        request.metadata = config.metadata;
        auto result = service.presign(request);
        if (!result.success) {
            log_error("presign failed (%s): %s", error_kind_name(result.error_kind), result.error_message.c_str());
            return 1;
        }
        std::cout << result.url << "\n";
        return 0;
    }
    if (cmd == "mkdir") {
        if (!require_args(config, 1, "<remote>")) return 2;
        auto result = service.directory_create(args[0]);
        if (!result.success) {
            log_error("mkdir failed (%s): %s", error_kind_name(result.error_kind), result.error_message.c_str());
            return 1;
        }
        return 0;
    }
    if (cmd == "ls") {
        if (args.size() > 1) {
            std::cerr << "Usage: s3xfer ls [remote]\n";
            return 2;
        }
        transfer::ListRequest request;
        request.recurse = config.recursive;
        request.filter = config.list_filter;
        request.type = config.list_type;
        request.format = config.list_format;
        auto result = service.directory_list(args.empty() ? "/" : args[0], request);
        if (!result.success) {
            log_error("ls failed (%s): %s", error_kind_name(result.error_kind), result.error_message.c_str());
            return 1;
        }
        for (const auto& entry : result.entries) {
            std::cout << entry.display << "\n";
        }
        return 0;
    }
    if (cmd == "rmdir") {
        if (!require_args(config, 1, "<remote>")) return 2;
        auto result = service.directory_remove(args[0]);
        for (const auto& key : result.failed_keys) {
            log_error("rmdir: cannot delete %s", key.c_str());
        }
        if (!result.success) {
            log_error("rmdir failed (%s): %s", error_kind_name(result.error_kind), result.error_message.c_str());
            return 1;
        }
        log_info("rmdir %s: %zu key(s) deleted", args[0].c_str(), result.deleted);
        return 0;
    }
    if (cmd == "exists") {
        if (!require_args(config, 1, "<remote>")) return 2;
        auto result = service.directory_exists(args[0]);
        if (!result.success) {
            log_error("exists failed (%s): %s", error_kind_name(result.error_kind), result.error_message.c_str());
            return 2;
        }
        std::cout << (result.exists ? "yes" : "no") << "\n";
        return result.exists ? 0 : 1;
    }
    if (cmd == "cpdir") {
        if (!require_args(config, 2, "<source> <destination>")) return 2;
        auto result = service.directory_copy(args[0], args[1], config.recursive);
        for (const auto& error : result.errors) {
            log_error("cpdir item %zu: %s", error.index, error.message.c_str());
        }
        if (!result.success) {
            log_error("cpdir failed (%s): %s", error_kind_name(result.error_kind), result.error_message.c_str());
            return 1;
        }
        log_info("cpdir %s -> %s: %zu object(s) copied", args[0].c_str(), args[1].c_str(), result.copied);
        return 0;
    }
    if (cmd == "batch-upload" || cmd == "batch-download") {
        if (!require_args(config, 1, "<pairs-file|->")) return 2;
        std::vector<std::string> sources, destinations;
        if (!read_pairs(args[0], sources, destinations)) return 2;
        auto result = cmd == "batch-upload"
            ? service.batch_upload(sources, destinations, config.concurrency, config.fail_fast)
            : service.batch_download(sources, destinations, config.concurrency, config.fail_fast);
        return report_batch(result, sources.size(), cmd.c_str());
    }
    if (cmd == "recover") {
        if (!require_args(config, 0, "")) return 2;
        if (!journal) {
            log_error("recover needs a session journal (--journal)");
            return 2;
        }
        auto recovery = journal->recover_orphans(store, &metrics);
        log_info("recover: %zu aborted, %zu already gone, %zu owned by running processes, %zu failed",
                 recovery.aborted, recovery.already_gone, recovery.skipped_live, recovery.failed.size());
        return recovery.failed.empty() ? 0 : 1;
    }

    std::cerr << "Error: unknown command: " << cmd << " (see --help)\n";
    return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = TransferConfig::from_args(argc, argv);
    if (!config_opt) {
        return 2;
    }
    auto config = std::move(*config_opt);

    if (config.command.empty()) {
        std::cerr << "Error: no command given (see --help)\n";
        return 2;
    }

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 2;
    }

    // Redirect log output if log file specified. stdout stays attached for
    // commands that print results.
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file: " << config.log_file << "\n";
            return 2;
        }
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    set_verbose(config.verbose);
    log_debug("store: %s", config.store.type.c_str());
    for (const auto& [k, v] : config.store.params) {
        // Mask secrets in log output
        if (k.find("key") != std::string::npos || k.find("secret") != std::string::npos ||
            k.find("token") != std::string::npos) {
            log_debug("  %s: ****", k.c_str());
        } else {
            log_debug("  %s: %s", k.c_str(), v.c_str());
        }
    }

    std::unique_ptr<storage::ObjectStore> store;
    try {
        store = storage::ObjectStoreFactory::create(config.store.type, config.store.params);
    } catch (const std::exception& e) {
        log_error("cannot create object store: %s", e.what());
        return 2;
    }

    std::unique_ptr<SessionJournal> journal;
    if (!config.journal_path.empty()) {
        try {
            journal = std::make_unique<SessionJournal>(config.journal_path);
        } catch (const std::exception& e) {
            log_warn("session journal disabled: %s", e.what());
        }
    }

    TransferMetrics metrics(config.metrics_file,
                            std::chrono::seconds(config.metrics_interval_secs),
                            {{"command", config.command}});
    metrics.start();

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    TransferService service(*store, config.default_bucket, config.to_transfer_options(),
                            journal.get(), &metrics);

    int rc;
    {
        InterruptWatcher watcher(service);
        rc = run_command(config, service, *store, journal.get(), metrics);
    }

    metrics.stop();
    if (g_interrupted && rc == 0) rc = 130;
    return rc;
}
