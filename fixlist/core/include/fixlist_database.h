/*
 * File:        fixlist_database.h
 * Module:      fixlist-core
 * Purpose:     SQLite store for export jobs and reconciled frame ranges
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "record_sink.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fixlist {

/**
 * @brief One processed export file
 */
struct JobRecord {
    std::string script_user;      // Login that ran the export
    std::string machine;          // Review tool named in the file name
    std::string user_on_file;     // Artist named in the file name
    std::string file_date;        // ISO date from the file name
    std::string submitted_date;   // ISO timestamp of the run
};

/**
 * @brief One reconciled frame range
 */
struct FrameRecord {
    std::string user_on_file;
    std::string file_date;
    std::string location;         // Canonical work-order path
    std::string frame_range;      // "N" or "N-M"
};

/**
 * @brief Location and frame range pair returned by the work queries
 */
struct WorkEntry {
    std::string location;
    std::string frame_range;
};

/**
 * @brief Reader/writer for the fixlist database
 *
 * Two tables: "jobs" (one row per export file) and "frames" (one row per
 * reconciled range). Rows come back in insertion order. Dates are ISO
 * strings, so date comparisons are plain string comparisons.
 *
 * Methods return false or an empty result on failure and log the SQLite
 * error message.
 */
class FixlistDatabase {
public:
    FixlistDatabase();
    ~FixlistDatabase();

    FixlistDatabase(const FixlistDatabase&) = delete;
    FixlistDatabase& operator=(const FixlistDatabase&) = delete;

    /// Open (creating if needed) a database file; ":memory:" is accepted
    bool open(const std::string& filename);
    void close();
    bool is_open() const { return is_open_; }

    bool begin_transaction();
    bool commit_transaction();
    bool rollback_transaction();

    bool insert_job(const JobRecord& job);
    bool insert_frame(const FrameRecord& frame);

    std::vector<JobRecord> jobs() const;
    std::vector<FrameRecord> frames() const;

    /// All work recorded for a user on file
    std::vector<WorkEntry> work_by_user(const std::string& user_on_file) const;

    /// Work for a user with a file date strictly before iso_date
    std::vector<WorkEntry> work_before_date(const std::string& user_on_file,
                                            const std::string& iso_date) const;

    /// Work for a user with a file date equal to iso_date
    std::vector<WorkEntry> work_on_date(const std::string& user_on_file,
                                        const std::string& iso_date) const;

    /// Delete every row of both tables
    bool clear();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    bool is_open_;
};

/**
 * @brief Stores records as "frames" rows tagged with one export file's identity
 */
class DatabaseRecordSink : public RecordSink {
public:
    DatabaseRecordSink(FixlistDatabase& db, std::string user_on_file, std::string file_date);

    bool write(const ReconciledRecord& record) override;

private:
    FixlistDatabase& db_;
    std::string user_on_file_;
    std::string file_date_;
};

/// Local time as "YYYY-MM-DD HH:MM:SS"
std::string current_timestamp();

} // namespace fixlist
