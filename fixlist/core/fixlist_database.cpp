/*
 * File:        fixlist_database.cpp
 * Module:      fixlist-core
 * Purpose:     SQLite store for export jobs and reconciled frame ranges
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "fixlist_database.h"
#include "logging.h"
#include <sqlite3.h>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fixlist {

// ============================================================================
// FixlistDatabase::Impl (Private implementation using SQLite)
// ============================================================================

class FixlistDatabase::Impl {
public:
    sqlite3* db = nullptr;

    ~Impl() {
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }

    bool exec_sql(const std::string& sql) {
        char* err_msg = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string error = err_msg ? err_msg : "Unknown error";
            sqlite3_free(err_msg);
            FIXLIST_LOG_ERROR("SQL error: {}", error);
            return false;
        }
        return true;
    }

    bool create_schema() {
        const char* schema_sql = R"(
            CREATE TABLE IF NOT EXISTS jobs (
                job_id INTEGER PRIMARY KEY,
                script_user TEXT NOT NULL,
                machine TEXT NOT NULL,
                user_on_file TEXT NOT NULL,
                file_date TEXT NOT NULL,
                submitted_date TEXT NOT NULL
            );

            CREATE TABLE IF NOT EXISTS frames (
                frame_id INTEGER PRIMARY KEY,
                user_on_file TEXT NOT NULL,
                file_date TEXT NOT NULL,
                location TEXT NOT NULL,
                frame_range TEXT NOT NULL
            );
        )";

        return exec_sql(schema_sql);
    }

    // Prepare, bind text parameters, run the callback per row
    bool execute_query(const char* sql,
                       const std::vector<std::string>& params,
                       const std::function<void(sqlite3_stmt*)>& callback) const {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            FIXLIST_LOG_ERROR("Failed to prepare query: {}", sqlite3_errmsg(db));
            return false;
        }

        for (size_t i = 0; i < params.size(); ++i) {
            sqlite3_bind_text(stmt, static_cast<int>(i + 1), params[i].c_str(), -1, SQLITE_TRANSIENT);
        }

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            if (callback) {
                callback(stmt);
            }
        }

        bool success = (rc == SQLITE_DONE);
        if (!success) {
            FIXLIST_LOG_ERROR("Query failed: {}", sqlite3_errmsg(db));
        }
        sqlite3_finalize(stmt);
        return success;
    }

    static std::string get_string(sqlite3_stmt* stmt, int col, const std::string& default_val = "") {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
            return default_val;
        }
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        return text ? std::string(text) : default_val;
    }

    std::vector<WorkEntry> query_work(const char* sql, const std::vector<std::string>& params) const {
        std::vector<WorkEntry> entries;
        execute_query(sql, params, [&entries](sqlite3_stmt* stmt) {
            WorkEntry entry;
            entry.location = get_string(stmt, 0);
            entry.frame_range = get_string(stmt, 1);
            entries.push_back(entry);
        });
        return entries;
    }
};

// ============================================================================
// FixlistDatabase implementation
// ============================================================================

FixlistDatabase::FixlistDatabase()
    : impl_(std::make_unique<Impl>())
    , is_open_(false)
{
}

FixlistDatabase::~FixlistDatabase() {
    close();
}

bool FixlistDatabase::open(const std::string& filename) {
    close();

    int rc = sqlite3_open_v2(filename.c_str(), &impl_->db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        FIXLIST_LOG_ERROR("Cannot open database '{}': {}", filename,
                          impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory");
        if (impl_->db) {
            sqlite3_close(impl_->db);
            impl_->db = nullptr;
        }
        return false;
    }

    if (!impl_->create_schema()) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    is_open_ = true;
    FIXLIST_LOG_DEBUG("Opened database: {}", filename);
    return true;
}

void FixlistDatabase::close() {
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
    is_open_ = false;
}

bool FixlistDatabase::begin_transaction() {
    return is_open_ && impl_->exec_sql("BEGIN TRANSACTION");
}

bool FixlistDatabase::commit_transaction() {
    return is_open_ && impl_->exec_sql("COMMIT");
}

bool FixlistDatabase::rollback_transaction() {
    return is_open_ && impl_->exec_sql("ROLLBACK");
}

bool FixlistDatabase::insert_job(const JobRecord& job) {
    if (!is_open_) {
        FIXLIST_LOG_ERROR("insert_job: database is not open");
        return false;
    }

    const char* sql =
        "INSERT INTO jobs (script_user, machine, user_on_file, file_date, submitted_date) "
        "VALUES (?, ?, ?, ?, ?)";
    return impl_->execute_query(sql,
        {job.script_user, job.machine, job.user_on_file, job.file_date, job.submitted_date},
        nullptr);
}

bool FixlistDatabase::insert_frame(const FrameRecord& frame) {
    if (!is_open_) {
        FIXLIST_LOG_ERROR("insert_frame: database is not open");
        return false;
    }

    const char* sql =
        "INSERT INTO frames (user_on_file, file_date, location, frame_range) "
        "VALUES (?, ?, ?, ?)";
    return impl_->execute_query(sql,
        {frame.user_on_file, frame.file_date, frame.location, frame.frame_range},
        nullptr);
}

std::vector<JobRecord> FixlistDatabase::jobs() const {
    std::vector<JobRecord> result;
    if (!is_open_) {
        return result;
    }

    const char* sql =
        "SELECT script_user, machine, user_on_file, file_date, submitted_date "
        "FROM jobs ORDER BY job_id";
    impl_->execute_query(sql, {}, [&result](sqlite3_stmt* stmt) {
        JobRecord job;
        job.script_user = Impl::get_string(stmt, 0);
        job.machine = Impl::get_string(stmt, 1);
        job.user_on_file = Impl::get_string(stmt, 2);
        job.file_date = Impl::get_string(stmt, 3);
        job.submitted_date = Impl::get_string(stmt, 4);
        result.push_back(job);
    });
    return result;
}

std::vector<FrameRecord> FixlistDatabase::frames() const {
    std::vector<FrameRecord> result;
    if (!is_open_) {
        return result;
    }

    const char* sql =
        "SELECT user_on_file, file_date, location, frame_range "
        "FROM frames ORDER BY frame_id";
    impl_->execute_query(sql, {}, [&result](sqlite3_stmt* stmt) {
        FrameRecord frame;
        frame.user_on_file = Impl::get_string(stmt, 0);
        frame.file_date = Impl::get_string(stmt, 1);
        frame.location = Impl::get_string(stmt, 2);
        frame.frame_range = Impl::get_string(stmt, 3);
        result.push_back(frame);
    });
    return result;
}

std::vector<WorkEntry> FixlistDatabase::work_by_user(const std::string& user_on_file) const {
    if (!is_open_) {
        return {};
    }
    return impl_->query_work(
        "SELECT location, frame_range FROM frames WHERE user_on_file = ? ORDER BY frame_id",
        {user_on_file});
}

std::vector<WorkEntry> FixlistDatabase::work_before_date(const std::string& user_on_file,
                                                         const std::string& iso_date) const {
    if (!is_open_) {
        return {};
    }
    return impl_->query_work(
        "SELECT location, frame_range FROM frames "
        "WHERE user_on_file = ? AND file_date < ? ORDER BY frame_id",
        {user_on_file, iso_date});
}

std::vector<WorkEntry> FixlistDatabase::work_on_date(const std::string& user_on_file,
                                                     const std::string& iso_date) const {
    if (!is_open_) {
        return {};
    }
    return impl_->query_work(
        "SELECT location, frame_range FROM frames "
        "WHERE user_on_file = ? AND file_date = ? ORDER BY frame_id",
        {user_on_file, iso_date});
}

bool FixlistDatabase::clear() {
    if (!is_open_) {
        return false;
    }
    return impl_->exec_sql("DELETE FROM jobs; DELETE FROM frames;");
}

// ============================================================================
// DatabaseRecordSink
// ============================================================================

DatabaseRecordSink::DatabaseRecordSink(FixlistDatabase& db, std::string user_on_file, std::string file_date)
    : db_(db)
    , user_on_file_(std::move(user_on_file))
    , file_date_(std::move(file_date))
{
}

bool DatabaseRecordSink::write(const ReconciledRecord& record) {
    FrameRecord frame;
    frame.user_on_file = user_on_file_;
    frame.file_date = file_date_;
    frame.location = record.canonical_path;
    frame.frame_range = record.frame_range.to_string();
    return db_.insert_frame(frame);
}

std::string current_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace fixlist
