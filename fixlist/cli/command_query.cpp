/*
 * File:        command_query.cpp
 * Module:      fixlist-cli
 * Purpose:     Database query and maintenance commands
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_query.h"
#include "csv_writer.h"
#include "export_file_name.h"
#include "fixlist_database.h"
#include "logging.h"

#include <iostream>
#include <stdexcept>

namespace fixlist {
namespace cli {

namespace {

bool print_work(const std::vector<WorkEntry>& entries, char delimiter) {
    CsvWriter writer(std::cout, delimiter);
    for (const auto& entry : entries) {
        if (!writer.write_row({entry.location, entry.frame_range})) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

int query_command(const QueryOptions& options) {
    // Flame users come from file names alone
    if (options.mode == QueryMode::FLAME_USERS) {
        for (const auto& user : flame_users(options.file_names)) {
            std::cout << user << "\n";
        }
        return 0;
    }

    std::string user = options.user;
    std::string iso_date;

    if (options.mode == QueryMode::BEFORE_DATE) {
        try {
            user = user_from_file_name(options.export_file);
        } catch (const ExportFileNameError& e) {
            FIXLIST_LOG_ERROR("{}", e.what());
            return 1;
        }
    }

    if (options.mode == QueryMode::BEFORE_DATE || options.mode == QueryMode::ON_DATE) {
        try {
            iso_date = compact_date_to_iso(options.date);
        } catch (const std::invalid_argument& e) {
            FIXLIST_LOG_ERROR("Invalid date '{}': {}", options.date, e.what());
            return 1;
        }
    }

    FixlistDatabase db;
    if (!db.open(options.database_path)) {
        return 1;
    }

    std::vector<WorkEntry> entries;
    switch (options.mode) {
        case QueryMode::BY_USER:
            entries = db.work_by_user(user);
            break;
        case QueryMode::BEFORE_DATE:
            entries = db.work_before_date(user, iso_date);
            break;
        case QueryMode::ON_DATE:
            entries = db.work_on_date(user, iso_date);
            break;
        case QueryMode::FLAME_USERS:
            break;
    }

    FIXLIST_LOG_DEBUG("Query for user {} returned {} rows", user, entries.size());
    return print_work(entries, options.csv_delimiter) ? 0 : 1;
}

int database_command(const DatabaseOptions& options) {
    FixlistDatabase db;
    if (!db.open(options.database_path)) {
        return 1;
    }

    if (options.action == DatabaseAction::CLEAR) {
        if (!db.clear()) {
            return 1;
        }
        FIXLIST_LOG_INFO("Cleared all records from {}", options.database_path);
        return 0;
    }

    CsvWriter writer(std::cout, options.csv_delimiter);

    std::cout << "Jobs:\n";
    writer.write_row({"script_user", "machine", "user_on_file", "file_date", "submitted_date"});
    for (const auto& job : db.jobs()) {
        writer.write_row({job.script_user, job.machine, job.user_on_file, job.file_date, job.submitted_date});
    }

    std::cout << "\nFrames:\n";
    writer.write_row({"user_on_file", "file_date", "location", "frame_range"});
    for (const auto& frame : db.frames()) {
        writer.write_row({frame.user_on_file, frame.file_date, frame.location, frame.frame_range});
    }

    return std::cout ? 0 : 1;
}

} // namespace cli
} // namespace fixlist
