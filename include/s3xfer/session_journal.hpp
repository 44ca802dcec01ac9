#pragma once

#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace s3xfer {

class TransferMetrics;

struct JournalEntry {
    std::string upload_id;
    std::string bucket;
    std::string key;
    int64_t pid = 0;
    int64_t created_at = 0;
};

struct RecoveryReport {
    size_t aborted = 0;        // Sessions aborted on the store
    size_t already_gone = 0;   // Store no longer knew the upload id
    size_t skipped_live = 0;   // Owner process still running
    std::vector<std::string> failed;  // Upload ids whose abort failed
};

/// SQLite journal of live multipart sessions.
///
/// A row is written when an upload is initiated and removed once it is
/// completed or aborted, so rows left behind belong to a process that died
/// mid-upload. recover_orphans() aborts those sessions on the store.
/// Safe to share between threads.
class SessionJournal {
public:
    /// Opens (creating if needed) the journal database.
    /// Throws std::runtime_error if the database cannot be opened.
    explicit SessionJournal(const std::filesystem::path& db_path);
    ~SessionJournal();

    SessionJournal(const SessionJournal&) = delete;
    SessionJournal& operator=(const SessionJournal&) = delete;

    bool record(const transfer::MultipartSession& session);
    bool remove(const std::string& upload_id);

    std::vector<JournalEntry> entries() const;

    /// Abort every journaled session whose owning process is gone.
    RecoveryReport recover_orphans(storage::ObjectStore& store, TransferMetrics* metrics = nullptr);

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
    sqlite3_stmt* stmt_select_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace s3xfer
