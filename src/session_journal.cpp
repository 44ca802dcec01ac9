#include "s3xfer/session_journal.hpp"
#include "s3xfer/core/log.hpp"
#include "s3xfer/metrics.hpp"

#include <sqlite3.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace s3xfer {

namespace {

const char* JOURNAL_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS multipart_sessions (
    upload_id   TEXT PRIMARY KEY,
    bucket      TEXT NOT NULL,
    object_key  TEXT NOT NULL,
    pid         INTEGER NOT NULL,
    created_at  INTEGER NOT NULL
);
)";

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

bool process_alive(int64_t pid) {
    if (pid <= 0) return false;
    if (::kill(static_cast<pid_t>(pid), 0) == 0) return true;
    return errno == EPERM;
}

}  // namespace

SessionJournal::SessionJournal(const std::filesystem::path& db_path) {
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open session journal: " + message);
    }

    // WAL so concurrent s3xfer processes can share one journal
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, JOURNAL_SCHEMA)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot create session journal schema in " + db_path.string());
    }

    sqlite3_prepare_v2(db_,
        "INSERT OR REPLACE INTO multipart_sessions (upload_id, bucket, object_key, pid, created_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5)",
        -1, &stmt_insert_, nullptr);

    sqlite3_prepare_v2(db_,
        "DELETE FROM multipart_sessions WHERE upload_id = ?1",
        -1, &stmt_delete_, nullptr);

    sqlite3_prepare_v2(db_,
        "SELECT upload_id, bucket, object_key, pid, created_at FROM multipart_sessions "
        "ORDER BY created_at ASC",
        -1, &stmt_select_, nullptr);

    if (!stmt_insert_ || !stmt_delete_ || !stmt_select_) {
        std::string message = sqlite3_errmsg(db_);
        if (stmt_insert_) sqlite3_finalize(stmt_insert_);
        if (stmt_delete_) sqlite3_finalize(stmt_delete_);
        if (stmt_select_) sqlite3_finalize(stmt_select_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot prepare session journal statements: " + message);
    }
}

SessionJournal::~SessionJournal() {
    if (stmt_insert_) sqlite3_finalize(stmt_insert_);
    if (stmt_delete_) sqlite3_finalize(stmt_delete_);
    if (stmt_select_) sqlite3_finalize(stmt_select_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

bool SessionJournal::record(const transfer::MultipartSession& session) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_insert_);
    sqlite3_bind_text(stmt_insert_, 1, session.upload_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 2, session.bucket.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 3, session.key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_, 4, static_cast<int64_t>(::getpid()));
    sqlite3_bind_int64(stmt_insert_, 5, now_epoch());

    int rc = sql_step_retry(stmt_insert_);
    if (rc != SQLITE_DONE) {
        log_error("journal insert failed for %s: %s", session.upload_id.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SessionJournal::remove(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_delete_);
    sqlite3_bind_text(stmt_delete_, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sql_step_retry(stmt_delete_);
    if (rc != SQLITE_DONE) {
        log_error("journal delete failed for %s: %s", upload_id.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<JournalEntry> SessionJournal::entries() const {
    std::lock_guard lock(mutex_);
    std::vector<JournalEntry> result;
    sqlite3_reset(stmt_select_);
    int rc;
    while ((rc = sql_step_retry(stmt_select_)) == SQLITE_ROW) {
        JournalEntry entry;
        entry.upload_id = column_text(stmt_select_, 0);
        entry.bucket = column_text(stmt_select_, 1);
        entry.key = column_text(stmt_select_, 2);
        entry.pid = sqlite3_column_int64(stmt_select_, 3);
        entry.created_at = sqlite3_column_int64(stmt_select_, 4);
        result.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        log_error("journal scan failed: %s", sqlite3_errmsg(db_));
    }
    return result;
}

RecoveryReport SessionJournal::recover_orphans(storage::ObjectStore& store, TransferMetrics* metrics) {
    RecoveryReport report;
    const int64_t self = static_cast<int64_t>(::getpid());

    for (const auto& entry : entries()) {
        if (entry.pid != self && process_alive(entry.pid)) {
            ++report.skipped_live;
            continue;
        }

        auto result = store.abort_multipart(entry.bucket, entry.key, entry.upload_id);
        if (result.success) {
            ++report.aborted;
            if (metrics) metrics->orphans_recovered_total().Increment();
            log_info("Recovered orphaned upload %s (%s/%s)", entry.upload_id.c_str(),
                     entry.bucket.c_str(), entry.key.c_str());
        } else if (result.error_kind == ErrorKind::NotFound) {
            ++report.already_gone;
        } else {
            report.failed.push_back(entry.upload_id);
            log_error("Cannot abort orphaned upload %s: %s", entry.upload_id.c_str(),
                      result.error_message.c_str());
            continue;
        }
        if (!remove(entry.upload_id)) {
            log_warn("Journal entry for %s left behind", entry.upload_id.c_str());
        }
    }
    return report;
}

}  // namespace s3xfer
