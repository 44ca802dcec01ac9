#include "s3xfer/transfer_config.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace s3xfer {

// --- StoreConfig ---

std::string StoreConfig::validate() const {
    if (type.empty()) return "store type is required";
    auto param = [&](const char* name) -> std::string {
        auto it = params.find(name);
        return it == params.end() ? std::string() : it->second;
    };
    if (type == "s3") {
        if (param("access_key").empty())
            return "s3 store requires 'access_key' (--access-key or AWS_ACCESS_KEY_ID)";
        if (param("secret_key").empty())
            return "s3 store requires 'secret_key' (--secret-key or AWS_SECRET_ACCESS_KEY)";
    } else if (type == "local") {
        if (param("path").empty())
            return "local store requires 'path' (--local-root)";
    } else {
        return "unknown store type: " + type;
    }
    return {};
}

// --- TransferConfig ---

namespace {

// "64M", "1G", "512k" or a plain byte count
uint64_t parse_size(const std::string& text) {
    size_t pos = 0;
    uint64_t value = std::stoull(text, &pos);
    std::string suffix = text.substr(pos);
    if (suffix.empty() || suffix == "B" || suffix == "b") return value;
    switch (std::toupper(static_cast<unsigned char>(suffix[0]))) {
        case 'K': return value * constants::KiB;
        case 'M': return value * constants::MiB;
        case 'G': return value * constants::GiB;
        default: break;
    }
    throw std::invalid_argument("bad size: " + text);
}

transfer::EntryType parse_entry_type(const std::string& text) {
    if (text == "files" || text == "f") return transfer::EntryType::Files;
    if (text == "directories" || text == "dirs" || text == "d") return transfer::EntryType::Directories;
    if (text == "all") return transfer::EntryType::All;
    throw std::invalid_argument("bad entry type: " + text);
}

transfer::ListFormat parse_list_format(const std::string& text) {
    if (text == "full") return transfer::ListFormat::Full;
    if (text == "relative") return transfer::ListFormat::Relative;
    if (text == "key") return transfer::ListFormat::Key;
    if (text == "detailed") return transfer::ListFormat::Detailed;
    throw std::invalid_argument("bad list format: " + text);
}

// Map a store flag (--endpoint, --region, ...) onto a store param.
// Returns the param name, or nullptr if the flag isn't a store flag.
const char* store_param_for_flag(const std::string& arg) {
    if (arg == "--endpoint") return "endpoint";
    if (arg == "--region") return "region";
    if (arg == "--access-key") return "access_key";
    if (arg == "--secret-key") return "secret_key";
    if (arg == "--session-token") return "session_token";
    if (arg == "--local-root") return "path";
    if (arg == "--connect-timeout") return "connect_timeout";
    return nullptr;
}

void print_usage() {
    std::cerr <<
        "Usage: s3xfer [options] <command> [args...]\n"
        "\n"
        "Commands:\n"
        "  upload <local> <remote>          Upload a file\n"
        "  download <remote> <local>        Download an object\n"
        "  cp <src> <dst>                   Copy one object (local or remote on either side)\n"
        "  rm <path>                        Delete one object\n"
        "  cat <remote>                     Write object contents to stdout\n"
        "  info <remote>                    Object metadata or directory summary\n"
        "  presign <remote>                 Print a presigned URL\n"
        "  mkdir <remote>                   Create a directory placeholder\n"
        "  ls <remote>                      List a directory\n"
        "  rmdir <remote>                   Delete a directory and everything under it\n"
        "  exists <remote>                  Exit 0 if the directory exists, 1 otherwise\n"
        "  cpdir <src> <dst>                Copy a directory\n"
        "  batch-upload <file>              Upload '<local> <remote>' pairs, one per line\n"
        "  batch-download <file>            Download '<remote> <local>' pairs, one per line\n"
        "  recover                          Abort multipart uploads left by crashed runs\n"
        "\n"
        "Paths: s3://bucket/key is remote; /abs, ./rel, ~/x and file:// are local;\n"
        "a bare key is remote against --bucket when one is set.\n"
        "\n"
        "Store:\n"
        "  --store-type <s3|local>          Object store (default: s3)\n"
        "  --endpoint <url>                 Endpoint URL (MinIO etc.)\n"
        "  --region <region>                Region (default: us-east-1, or AWS_REGION)\n"
        "  --access-key <key>               Access key (or AWS_ACCESS_KEY_ID)\n"
        "  --secret-key <key>               Secret key (or AWS_SECRET_ACCESS_KEY)\n"
        "  --session-token <token>          Session token (or AWS_SESSION_TOKEN)\n"
        "  --path-style                     Path-style addressing\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --unsigned-payload               Do not hash upload payloads\n"
        "  --connect-timeout <secs>         Connect timeout (default: 10)\n"
        "  --local-root <path>              Root directory for the local store\n"
        "  --bucket <name>                  Default bucket (or S3XFER_DEFAULT_BUCKET)\n"
        "\n"
        "Transfer:\n"
        "  --concurrency <N>                Parallel parts/ranges/items (default: 8)\n"
        "  --no-fail-fast                   Batch: run every item and report all failures\n"
        "  --multipart-threshold <size>     Upload multipart above this (default: 25M)\n"
        "  --download-threshold <size>      Ranged download above this (default: 25M)\n"
        "  --part-size <size>               Multipart part size (default: 16M)\n"
        "  --chunk-size <size>              Ranged download chunk size (default: 16M)\n"
        "  --max-buffered-parts <N>         Part buffers held in memory (default: 4)\n"
        "  --request-timeout <ms>           Per-call timeout, 0 for store default\n"
        "  --retries <N>                    Attempts per call including the first (default: 4)\n"
        "  --retry-delay <ms>               First backoff delay (default: 200)\n"
        "  --temp-dir <path>                Staging directory for fallback copies\n"
        "  --content-type <type>            Content type for uploads\n"
        "  --meta <key=value>               User metadata for uploads (repeatable)\n"
        "\n"
        "Command options:\n"
        "  -r, --recursive                  ls/cpdir: descend into sub-directories\n"
        "  --filter <glob>                  ls: match entry names\n"
        "  --type <files|dirs|all>          ls: entry types (default: all)\n"
        "  --format <full|relative|key|detailed>  ls: output format (default: full)\n"
        "  --expires <secs>                 presign: lifetime (default: 3600)\n"
        "  --method <GET|PUT>               presign: method (default: GET)\n"
        "\n"
        "General:\n"
        "  --config <path>                  JSON config file\n"
        "  --journal <path>                 Multipart session journal (default: ~/.s3xfer/sessions.db)\n"
        "  --no-journal                     Disable the session journal\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --log-file <path>                Log file path\n"
        "  --verbose                        Verbose output\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<TransferConfig> TransferConfig::from_args(int argc, char* argv[]) {
    TransferConfig config;
    bool no_journal = false;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (const char* param = store_param_for_flag(arg)) {
                auto* v = next_arg(i, arg.c_str());
                if (!v) return std::nullopt;
                config.store.params[param] = v;
                continue;
            }

            if (arg == "--store-type") {
                auto* v = next_arg(i, "--store-type");
                if (!v) return std::nullopt;
                config.store.type = v;
            } else if (arg == "--path-style") {
                config.store.params["use_path_style"] = "true";
            } else if (arg == "--no-verify-ssl") {
                config.store.params["verify_ssl"] = "false";
            } else if (arg == "--unsigned-payload") {
                config.store.params["unsigned_payload"] = "true";
            } else if (arg == "--bucket") {
                auto* v = next_arg(i, "--bucket");
                if (!v) return std::nullopt;
                config.default_bucket = v;
            } else if (arg == "--concurrency") {
                auto* v = next_arg(i, "--concurrency");
                if (!v) return std::nullopt;
                config.concurrency = std::stoull(v);
            } else if (arg == "--no-fail-fast") {
                config.fail_fast = false;
            } else if (arg == "--fail-fast") {
                config.fail_fast = true;
            } else if (arg == "--multipart-threshold") {
                auto* v = next_arg(i, "--multipart-threshold");
                if (!v) return std::nullopt;
                config.upload_multipart_threshold = parse_size(v);
            } else if (arg == "--download-threshold") {
                auto* v = next_arg(i, "--download-threshold");
                if (!v) return std::nullopt;
                config.download_multipart_threshold = parse_size(v);
            } else if (arg == "--part-size") {
                auto* v = next_arg(i, "--part-size");
                if (!v) return std::nullopt;
                config.part_size = parse_size(v);
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.download_chunk_size = parse_size(v);
            } else if (arg == "--max-buffered-parts") {
                auto* v = next_arg(i, "--max-buffered-parts");
                if (!v) return std::nullopt;
                config.max_buffered_parts = std::stoull(v);
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout_ms = std::stoull(v);
            } else if (arg == "--retries") {
                auto* v = next_arg(i, "--retries");
                if (!v) return std::nullopt;
                config.retry_max_attempts = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--retry-delay") {
                auto* v = next_arg(i, "--retry-delay");
                if (!v) return std::nullopt;
                config.retry_base_delay_ms = std::stoull(v);
            } else if (arg == "--temp-dir") {
                auto* v = next_arg(i, "--temp-dir");
                if (!v) return std::nullopt;
                config.temp_dir = v;
            } else if (arg == "--content-type") {
                auto* v = next_arg(i, "--content-type");
                if (!v) return std::nullopt;
                config.content_type = v;
            } else if (arg == "--meta") {
                auto* v = next_arg(i, "--meta");
                if (!v) return std::nullopt;
                std::string kv = v;
                auto eq = kv.find('=');
                if (eq == std::string::npos || eq == 0) {
                    std::cerr << "Error: --meta expects key=value, got: " << kv << "\n";
                    return std::nullopt;
                }
                config.metadata[kv.substr(0, eq)] = kv.substr(eq + 1);
            } else if (arg == "-r" || arg == "--recursive") {
                config.recursive = true;
            } else if (arg == "--filter") {
                auto* v = next_arg(i, "--filter");
                if (!v) return std::nullopt;
                config.list_filter = v;
            } else if (arg == "--type") {
                auto* v = next_arg(i, "--type");
                if (!v) return std::nullopt;
                config.list_type = parse_entry_type(v);
            } else if (arg == "--format") {
                auto* v = next_arg(i, "--format");
                if (!v) return std::nullopt;
                config.list_format = parse_list_format(v);
            } else if (arg == "--expires") {
                auto* v = next_arg(i, "--expires");
                if (!v) return std::nullopt;
                config.presign_expires_secs = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--method") {
                auto* v = next_arg(i, "--method");
                if (!v) return std::nullopt;
                config.presign_method = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--journal") {
                auto* v = next_arg(i, "--journal");
                if (!v) return std::nullopt;
                config.journal_path = v;
            } else if (arg == "--no-journal") {
                no_journal = true;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else if (config.command.empty()) {
                config.command = arg;
            } else {
                config.args.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid argument value: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_environment();
    config.apply_defaults();
    if (no_journal) config.journal_path.clear();
    return config;
}

bool TransferConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("default_bucket")) default_bucket = j["default_bucket"].get<std::string>();
        if (j.contains("concurrency")) concurrency = j["concurrency"].get<size_t>();
        if (j.contains("fail_fast")) fail_fast = j["fail_fast"].get<bool>();
        if (j.contains("upload_multipart_threshold"))
            upload_multipart_threshold = j["upload_multipart_threshold"].get<uint64_t>();
        if (j.contains("download_multipart_threshold"))
            download_multipart_threshold = j["download_multipart_threshold"].get<uint64_t>();
        if (j.contains("part_size")) part_size = j["part_size"].get<uint64_t>();
        if (j.contains("download_chunk_size")) download_chunk_size = j["download_chunk_size"].get<uint64_t>();
        if (j.contains("max_buffered_parts")) max_buffered_parts = j["max_buffered_parts"].get<size_t>();
        if (j.contains("single_put_attempts")) single_put_attempts = j["single_put_attempts"].get<uint32_t>();
        if (j.contains("throttle_error_burst")) throttle_error_burst = j["throttle_error_burst"].get<size_t>();
        if (j.contains("throttle_recovery")) throttle_recovery = j["throttle_recovery"].get<size_t>();
        if (j.contains("request_timeout_ms")) request_timeout_ms = j["request_timeout_ms"].get<uint64_t>();
        if (j.contains("temp_dir")) temp_dir = j["temp_dir"].get<std::string>();
        if (j.contains("content_type")) content_type = j["content_type"].get<std::string>();
        if (j.contains("journal_path")) journal_path = j["journal_path"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();

        if (j.contains("retry") && j["retry"].is_object()) {
            auto& jr = j["retry"];
            if (jr.contains("max_attempts")) retry_max_attempts = jr["max_attempts"].get<uint32_t>();
            if (jr.contains("base_delay_ms")) retry_base_delay_ms = jr["base_delay_ms"].get<uint64_t>();
            if (jr.contains("max_delay_ms")) retry_max_delay_ms = jr["max_delay_ms"].get<uint64_t>();
            if (jr.contains("multiplier")) retry_multiplier = jr["multiplier"].get<double>();
            if (jr.contains("jitter")) retry_jitter = jr["jitter"].get<double>();
        }

        if (j.contains("metadata") && j["metadata"].is_object()) {
            for (auto& [key, val] : j["metadata"].items()) {
                metadata[key] = val.get<std::string>();
            }
        }

        // Store section: "type" plus string params for ObjectStoreFactory
        if (j.contains("store") && j["store"].is_object()) {
            auto& js = j["store"];
            if (js.contains("type")) store.type = js["type"].get<std::string>();
            for (auto& [key, val] : js.items()) {
                if (key == "type") continue;
                store.params[key] = val.is_string() ? val.get<std::string>() : val.dump();
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void TransferConfig::apply_environment() {
    auto fill = [&](const char* param, const char* env) {
        auto& value = store.params[param];
        if (value.empty()) {
            if (const char* v = std::getenv(env)) value = v;
        }
        if (value.empty()) store.params.erase(param);
    };

    if (store.type == "s3") {
        fill("access_key", "AWS_ACCESS_KEY_ID");
        fill("secret_key", "AWS_SECRET_ACCESS_KEY");
        fill("session_token", "AWS_SESSION_TOKEN");
        fill("region", "AWS_REGION");
    }
    if (default_bucket.empty()) {
        if (const char* v = std::getenv("S3XFER_DEFAULT_BUCKET")) default_bucket = v;
    }
}

void TransferConfig::apply_defaults() {
    if (journal_path.empty()) {
        if (const char* home = std::getenv("HOME"); home && *home) {
            journal_path = std::filesystem::path(home) / ".s3xfer" / "sessions.db";
        }
    }
    if (concurrency == 0) concurrency = 1;
    if (max_buffered_parts == 0) max_buffered_parts = 1;
    if (single_put_attempts == 0) single_put_attempts = 1;
    if (retry_max_attempts == 0) retry_max_attempts = 1;
}

std::string TransferConfig::validate() const {
    if (store.empty()) return "store type is required (--store-type)";
    auto err = store.validate();
    if (!err.empty()) return "store: " + err;
    if (concurrency == 0) return "concurrency must be > 0";
    if (part_size == 0) return "part_size must be > 0";
    if (download_chunk_size == 0) return "download_chunk_size must be > 0";
    if (part_size > constants::MAX_PART_SIZE) return "part_size must be <= 5 GiB";
    if (retry_multiplier < 1.0) return "retry multiplier must be >= 1";
    if (retry_jitter < 0.0 || retry_jitter > 1.0) return "retry jitter must be within [0, 1]";
    if (presign_method != "GET" && presign_method != "PUT") return "presign method must be GET or PUT";
    return {};
}

transfer::TransferOptions TransferConfig::to_transfer_options() const {
    transfer::TransferOptions options;
    options.concurrency = concurrency;
    options.fail_fast = fail_fast;
    options.upload_multipart_threshold = upload_multipart_threshold;
    options.part_size = part_size;
    options.max_buffered_parts = max_buffered_parts;
    options.single_put_attempts = single_put_attempts;
    options.download_multipart_threshold = download_multipart_threshold;
    options.download_chunk_size = download_chunk_size;
    options.throttle_error_burst = throttle_error_burst;
    options.throttle_recovery = throttle_recovery;
    options.request_timeout = std::chrono::milliseconds(request_timeout_ms);
    options.retry.max_attempts = retry_max_attempts;
    options.retry.base_delay = std::chrono::milliseconds(retry_base_delay_ms);
    options.retry.max_delay = std::chrono::milliseconds(retry_max_delay_ms);
    options.retry.multiplier = retry_multiplier;
    options.retry.jitter = retry_jitter;
    options.content_type = content_type;
    options.metadata = metadata;
    options.temp_dir = temp_dir;
    return options;
}

}  // namespace s3xfer
