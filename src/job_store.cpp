#include "job_store.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <memory>
#include <ctime>

namespace fs = std::filesystem;

namespace motus {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

static const char* kJobColumns =
    "job_id, operation, src_path, dst_path, status, progress, status_text, error_text, "
    "log_text, exit_status, resumed_by_job_id, created_at, updated_at, finished_at, owner_pid";

static int64_t now_seconds() {
    return static_cast<int64_t>(std::time(nullptr));
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

static StatementPtr prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw MotusError(ErrorKind::StoreError,
                         "Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
    return StatementPtr(stmt, sqlite3_finalize);
}

static void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw MotusError(ErrorKind::StoreError, std::string(sqlite3_errmsg(db)));
    }
}

static Job read_job(sqlite3_stmt* stmt) {
    Job job;
    job.job_id = sqlite3_column_int(stmt, 0);
    job.operation = parse_operation(column_text(stmt, 1));
    job.source = column_text(stmt, 2);
    job.destination = column_text(stmt, 3);
    job.status = parse_status(column_text(stmt, 4));
    job.progress = sqlite3_column_int(stmt, 5);
    job.status_text = column_text(stmt, 6);
    job.error_text = column_text(stmt, 7);
    job.log_text = column_text(stmt, 8);
    job.exit_status = sqlite3_column_int(stmt, 9);
    job.resumed_by_job_id = sqlite3_column_type(stmt, 10) == SQLITE_NULL ? 0 : sqlite3_column_int(stmt, 10);
    job.created_at = sqlite3_column_int64(stmt, 11);
    job.updated_at = sqlite3_column_int64(stmt, 12);
    job.finished_at = sqlite3_column_type(stmt, 13) == SQLITE_NULL ? 0 : sqlite3_column_int64(stmt, 13);
    job.owner_pid = sqlite3_column_int(stmt, 14);
    return job;
}

SqliteJobStore::SqliteJobStore(const std::string& db_path) : db_path_(db_path) {
    Logger::info("[JobStore] Opening database at: " + db_path_);

    if (db_path_ != ":memory:") {
        fs::path db_dir = fs::path(db_path_).parent_path();
        std::error_code ec;
        if (!db_dir.empty()) fs::create_directories(db_dir, ec);
        if (ec) {
            throw MotusError(ErrorKind::StoreError,
                             "Cannot create database directory " + db_dir.string() + ": " + ec.message());
        }
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(db_path_.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw MotusError(ErrorKind::StoreError, "Failed to open database: " + message);
    }
    db_ = db;

    sqlite3_busy_timeout(db, 5000);
    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        create_tables();
    } catch (const MotusError&) {
        sqlite3_close(db);
        db_ = nullptr;
        throw;
    }
}

SqliteJobStore::~SqliteJobStore() {
    if (db_) {
        sqlite3* db = static_cast<sqlite3*>(db_);
        // Fold the WAL back into the main file
        sqlite3_exec(db, "PRAGMA wal_checkpoint(TRUNCATE);", nullptr, nullptr, nullptr);
        sqlite3_close(db);
        db_ = nullptr;
    }
}

void SqliteJobStore::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(static_cast<sqlite3*>(db_), sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw MotusError(ErrorKind::StoreError, message);
    }
}

void SqliteJobStore::create_tables() {
    const char* sql_jobs = R"(
        CREATE TABLE IF NOT EXISTS jobs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            job_id INTEGER NOT NULL UNIQUE,
            operation TEXT NOT NULL,
            src_path TEXT NOT NULL,
            dst_path TEXT NOT NULL,
            status TEXT NOT NULL DEFAULT 'pending',
            progress INTEGER NOT NULL DEFAULT 0,
            status_text TEXT,
            error_text TEXT,
            log_text TEXT,
            exit_status INTEGER NOT NULL DEFAULT -1,
            resumed_by_job_id INTEGER,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            finished_at INTEGER,
            owner_pid INTEGER NOT NULL DEFAULT 0
        );

        CREATE INDEX IF NOT EXISTS idx_jobs_job_id ON jobs(job_id);
        CREATE INDEX IF NOT EXISTS idx_jobs_status ON jobs(status);
    )";

    try {
        exec(sql_jobs);
        // Databases written before jobs carried their owner
        if (!has_column("jobs", "owner_pid")) {
            Logger::info("[JobStore] Adding owner_pid column");
            exec("ALTER TABLE jobs ADD COLUMN owner_pid INTEGER NOT NULL DEFAULT 0;");
        }
    } catch (const MotusError& e) {
        Logger::error("[JobStore] Failed to create jobs table: " + std::string(e.what()));
        throw;
    }
}

bool SqliteJobStore::has_column(const char* table, const char* column) {
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db, std::string("PRAGMA table_info(") + table + ")");
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        if (column_text(stmt.get(), 1) == column) return true;
    }
    if (rc != SQLITE_DONE) {
        throw MotusError(ErrorKind::StoreError, std::string(sqlite3_errmsg(db)));
    }
    return false;
}

void SqliteJobStore::create(int job_id, Operation operation, const std::string& source,
                            const std::string& destination, JobStatus status, int owner_pid) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);

    auto stmt = prepare(db,
        "INSERT INTO jobs (job_id, operation, src_path, dst_path, status, created_at, updated_at, "
        "finished_at, owner_pid) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");

    int64_t now = now_seconds();
    sqlite3_bind_int(stmt.get(), 1, job_id);
    sqlite3_bind_text(stmt.get(), 2, operation_name(operation), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 3, source.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 4, destination.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 5, status_name(status), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 6, now);
    sqlite3_bind_int64(stmt.get(), 7, now);
    if (is_terminal(status)) {
        sqlite3_bind_int64(stmt.get(), 8, now);
    } else {
        sqlite3_bind_null(stmt.get(), 8);
    }
    sqlite3_bind_int(stmt.get(), 9, owner_pid);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_CONSTRAINT) {
        throw MotusError(ErrorKind::DuplicateJob,
                         "Job with ID " + std::to_string(job_id) + " already exists");
    }
    if (rc != SQLITE_DONE) {
        throw MotusError(ErrorKind::StoreError, "Failed to create job: " + std::string(sqlite3_errmsg(db)));
    }
    Logger::debug("[JobStore] Created job " + std::to_string(job_id));
}

bool SqliteJobStore::update(int job_id, const JobUpdate& update) {
    std::string sql = "UPDATE jobs SET updated_at = ?";
    if (update.status) sql += ", status = ?";
    if (update.progress) sql += ", progress = ?";
    if (update.status_text) sql += ", status_text = ?";
    if (update.error_text) sql += ", error_text = ?";
    if (update.log_text) sql += ", log_text = ?";
    if (update.exit_status) sql += ", exit_status = ?";
    if (update.status && is_terminal(*update.status)) {
        sql += ", finished_at = COALESCE(finished_at, ?)";
    }
    sql += " WHERE job_id = ?";

    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db, sql);

    int64_t now = now_seconds();
    int idx = 1;
    sqlite3_bind_int64(stmt.get(), idx++, now);
    if (update.status) sqlite3_bind_text(stmt.get(), idx++, status_name(*update.status), -1, SQLITE_STATIC);
    if (update.progress) sqlite3_bind_int(stmt.get(), idx++, *update.progress);
    if (update.status_text) sqlite3_bind_text(stmt.get(), idx++, update.status_text->c_str(), -1, SQLITE_TRANSIENT);
    if (update.error_text) sqlite3_bind_text(stmt.get(), idx++, update.error_text->c_str(), -1, SQLITE_TRANSIENT);
    if (update.log_text) sqlite3_bind_text(stmt.get(), idx++, update.log_text->c_str(), -1, SQLITE_TRANSIENT);
    if (update.exit_status) sqlite3_bind_int(stmt.get(), idx++, *update.exit_status);
    if (update.status && is_terminal(*update.status)) sqlite3_bind_int64(stmt.get(), idx++, now);
    sqlite3_bind_int(stmt.get(), idx++, job_id);

    step_done(db, stmt.get());
    return sqlite3_changes(db) > 0;
}

std::optional<Job> SqliteJobStore::get(int job_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db, std::string("SELECT ") + kJobColumns + " FROM jobs WHERE job_id = ?");
    sqlite3_bind_int(stmt.get(), 1, job_id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return read_job(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw MotusError(ErrorKind::StoreError, std::string(sqlite3_errmsg(db)));
    }
    return std::nullopt;
}

std::vector<Job> SqliteJobStore::query_jobs(const std::string& where,
                                            const std::vector<std::string>& params,
                                            int limit, int offset) {
    std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs";
    if (!where.empty()) sql += " WHERE " + where;
    sql += " ORDER BY created_at DESC, job_id DESC LIMIT ? OFFSET ?";

    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db, sql);

    int idx = 1;
    for (const auto& param : params) {
        sqlite3_bind_text(stmt.get(), idx++, param.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(stmt.get(), idx++, limit);
    sqlite3_bind_int(stmt.get(), idx++, offset);

    std::vector<Job> jobs;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        jobs.push_back(read_job(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw MotusError(ErrorKind::StoreError, std::string(sqlite3_errmsg(db)));
    }
    return jobs;
}

std::vector<Job> SqliteJobStore::list(const std::optional<JobStatus>& status_filter, int limit, int offset) {
    if (status_filter) {
        return query_jobs("status = ?", {status_name(*status_filter)}, limit, offset);
    }
    return query_jobs("", {}, limit, offset);
}

std::vector<Job> SqliteJobStore::list_aborted(int limit, int offset) {
    return query_jobs("status IN ('failed', 'interrupted') AND resumed_by_job_id IS NULL", {}, limit, offset);
}

std::vector<Job> SqliteJobStore::list_resumable(int limit, int offset) {
    return query_jobs("status = 'interrupted' AND resumed_by_job_id IS NULL", {}, limit, offset);
}

bool SqliteJobStore::remove(int job_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db, "DELETE FROM jobs WHERE job_id = ?");
    sqlite3_bind_int(stmt.get(), 1, job_id);
    step_done(db, stmt.get());
    return sqlite3_changes(db) > 0;
}

std::vector<int> SqliteJobStore::remove_stopped() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);

    exec("BEGIN IMMEDIATE;");
    std::vector<int> ids;
    try {
        auto select = prepare(db, "SELECT job_id FROM jobs WHERE status NOT IN ('running', 'pending')");
        int rc;
        while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
            ids.push_back(sqlite3_column_int(select.get(), 0));
        }
        if (rc != SQLITE_DONE) {
            throw MotusError(ErrorKind::StoreError, std::string(sqlite3_errmsg(db)));
        }

        auto del = prepare(db, "DELETE FROM jobs WHERE status NOT IN ('running', 'pending')");
        step_done(db, del.get());
        exec("COMMIT;");
    } catch (const MotusError&) {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    Logger::info("[JobStore] Removed " + std::to_string(ids.size()) + " stopped jobs");
    return ids;
}

int SqliteJobStore::max_job_id() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db, "SELECT MAX(job_id) FROM jobs");
    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        throw MotusError(ErrorKind::StoreError, std::string(sqlite3_errmsg(db)));
    }
    if (sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL) return 0;
    return sqlite3_column_int(stmt.get(), 0);
}

std::vector<int> SqliteJobStore::active_owners() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db, "SELECT DISTINCT owner_pid FROM jobs WHERE status IN ('running', 'pending')");

    std::vector<int> owners;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        owners.push_back(sqlite3_column_int(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        throw MotusError(ErrorKind::StoreError, std::string(sqlite3_errmsg(db)));
    }
    return owners;
}

int SqliteJobStore::mark_running_as_interrupted(const std::vector<int>& owner_pids) {
    if (owner_pids.empty()) return 0;

    std::string placeholders;
    for (size_t i = 0; i < owner_pids.size(); ++i) {
        placeholders += i == 0 ? "?" : ", ?";
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db,
        "UPDATE jobs SET status = 'interrupted', "
        "finished_at = COALESCE(finished_at, ?), updated_at = ? "
        "WHERE status IN ('running', 'pending') AND owner_pid IN (" + placeholders + ")");
    int64_t now = now_seconds();
    int idx = 1;
    sqlite3_bind_int64(stmt.get(), idx++, now);
    sqlite3_bind_int64(stmt.get(), idx++, now);
    for (int owner : owner_pids) {
        sqlite3_bind_int(stmt.get(), idx++, owner);
    }
    step_done(db, stmt.get());
    return sqlite3_changes(db);
}

bool SqliteJobStore::set_resumed_by(int job_id, int new_job_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db,
        "UPDATE jobs SET resumed_by_job_id = ?, updated_at = ? "
        "WHERE job_id = ? AND status IN ('interrupted', 'failed') AND resumed_by_job_id IS NULL");
    sqlite3_bind_int(stmt.get(), 1, new_job_id);
    sqlite3_bind_int64(stmt.get(), 2, now_seconds());
    sqlite3_bind_int(stmt.get(), 3, job_id);
    step_done(db, stmt.get());
    return sqlite3_changes(db) > 0;
}

int SqliteJobStore::cleanup_old_jobs(int days) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_);
    auto stmt = prepare(db, "DELETE FROM jobs WHERE finished_at IS NOT NULL AND finished_at < ?");
    sqlite3_bind_int64(stmt.get(), 1, now_seconds() - static_cast<int64_t>(days) * 86400);
    step_done(db, stmt.get());
    int removed = sqlite3_changes(db);
    if (removed > 0) {
        Logger::info("[JobStore] Cleaned up " + std::to_string(removed) + " jobs older than " +
                     std::to_string(days) + " days");
    }
    return removed;
}

} // namespace motus
