/*
 * File:        command_export.cpp
 * Module:      fixlist-cli
 * Purpose:     Export reconciliation command
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_export.h"
#include "csv_writer.h"
#include "export_file_name.h"
#include "fixlist_database.h"
#include "logging.h"
#include "work_order.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace fixlist {
namespace cli {

namespace {

struct ExportFile {
    std::string path;
    ExportFileInfo info;
    std::string content;
};

bool read_text_file(const std::string& path, std::string& content) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        FIXLIST_LOG_ERROR("Cannot open export file: {}", path);
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        FIXLIST_LOG_ERROR("Error reading export file: {}", path);
        return false;
    }
    content = buffer.str();
    return true;
}

// Login name of the user running the export
std::string script_user() {
    const char* login = getlogin();
    if (login && *login) {
        return login;
    }
    const char* env_user = std::getenv("USER");
    if (env_user && *env_user) {
        return env_user;
    }
    return "unknown";
}

void log_stats(const std::string& path, const PipelineStats& stats) {
    FIXLIST_LOG_INFO("{}: {} lines, {} matched, {} unmatched, {} malformed, {} records",
                     path, stats.lines_read, stats.matched_lines, stats.unmatched_lines,
                     stats.malformed_lines, stats.records_emitted);
}

// Name, grammar and content of every export file, or false before anything is written
bool load_export_files(const std::vector<std::string>& paths, std::vector<ExportFile>& files) {
    for (const auto& path : paths) {
        ExportFile file;
        file.path = path;
        try {
            file.info = parse_export_file_name(path);
        } catch (const ExportFileNameError& e) {
            FIXLIST_LOG_ERROR("{}", e.what());
            return false;
        }
        if (!read_text_file(path, file.content)) {
            return false;
        }
        FIXLIST_LOG_DEBUG("{}: machine {}, user {}, date {}, {} grammar",
                          path, file.info.machine, file.info.user_on_file, file.info.file_date,
                          export_grammar_to_string(file.info.grammar));
        files.push_back(std::move(file));
    }
    return true;
}

int export_to_csv(const ExportOptions& options, const WorkOrder& work_order,
                  const std::vector<ExportFile>& files) {
    std::ofstream out(options.csv_path);
    if (!out) {
        FIXLIST_LOG_ERROR("Cannot create CSV file: {}", options.csv_path);
        return 1;
    }

    CsvWriter writer(out, options.csv_delimiter);
    bool header_ok = writer.write_row({work_order.producer, work_order.operator_name,
                                       work_order.job, work_order.notes});
    header_ok = header_ok && writer.write_row({}) && writer.write_row({});
    if (!header_ok) {
        FIXLIST_LOG_ERROR("Failed writing CSV file: {}", options.csv_path);
        return 1;
    }

    CsvRecordSink sink(writer);
    PipelineStats total;
    for (const auto& file : files) {
        ReconciliationPipeline pipeline(work_order, file.info.grammar, options.policy);
        try {
            PipelineStats stats = pipeline.process_text(file.content, sink);
            log_stats(file.path, stats);
            total += stats;
        } catch (const ExportLineError& e) {
            FIXLIST_LOG_ERROR("{}: {}", file.path, e.what());
            return 1;
        }
    }

    out.flush();
    if (!out || total.records_rejected > 0) {
        FIXLIST_LOG_ERROR("Failed writing CSV file: {}", options.csv_path);
        return 1;
    }

    FIXLIST_LOG_INFO("Wrote {} records to {}", total.records_emitted, options.csv_path);
    return 0;
}

// Roll back the current file's rows; always a failure exit code
int abort_file(FixlistDatabase& db) {
    if (!db.rollback_transaction()) {
        FIXLIST_LOG_WARN("Rollback failed; the database may hold a partial job");
    }
    return 1;
}

int export_to_database(const ExportOptions& options, const WorkOrder& work_order,
                       const std::vector<ExportFile>& files) {
    FixlistDatabase db;
    if (!db.open(options.database_path)) {
        return 1;
    }

    const std::string user = script_user();
    size_t records = 0;

    // One transaction per export file
    for (const auto& file : files) {
        if (!db.begin_transaction()) {
            return 1;
        }

        JobRecord job;
        job.script_user = user;
        job.machine = file.info.machine;
        job.user_on_file = file.info.user_on_file;
        job.file_date = file.info.file_date;
        job.submitted_date = current_timestamp();

        if (!db.insert_job(job)) {
            return abort_file(db);
        }

        DatabaseRecordSink sink(db, file.info.user_on_file, file.info.file_date);
        ReconciliationPipeline pipeline(work_order, file.info.grammar, options.policy);
        PipelineStats stats;
        try {
            stats = pipeline.process_text(file.content, sink);
        } catch (const ExportLineError& e) {
            FIXLIST_LOG_ERROR("{}: {}", file.path, e.what());
            return abort_file(db);
        }
        log_stats(file.path, stats);

        if (stats.records_rejected > 0) {
            FIXLIST_LOG_ERROR("{}: {} records could not be stored", file.path, stats.records_rejected);
            return abort_file(db);
        }
        if (!db.commit_transaction()) {
            return 1;
        }
        records += stats.records_emitted;
    }

    FIXLIST_LOG_INFO("Stored {} jobs and {} frame records in {}", files.size(), records, options.database_path);
    return 0;
}

} // anonymous namespace

int export_command(const ExportOptions& options) {
    if (!fs::exists(options.work_order_path)) {
        FIXLIST_LOG_ERROR("Work order not found: {}", options.work_order_path);
        return 1;
    }

    WorkOrder work_order;
    try {
        work_order = load_work_order(options.work_order_path);
    } catch (const WorkOrderError& e) {
        FIXLIST_LOG_ERROR("Failed to load work order: {}", e.what());
        return 1;
    }

    FIXLIST_LOG_INFO("Work order: producer {}, operator {}, job {}, {} locations",
                     work_order.producer, work_order.operator_name, work_order.job,
                     work_order.canonical_paths.size());

    std::vector<ExportFile> files;
    if (!load_export_files(options.export_files, files)) {
        return 1;
    }

    FIXLIST_LOG_INFO("Malformed line policy: {}", malformed_line_policy_to_string(options.policy));

    if (options.target == ExportTarget::DATABASE) {
        return export_to_database(options, work_order, files);
    }
    return export_to_csv(options, work_order, files);
}

} // namespace cli
} // namespace fixlist
