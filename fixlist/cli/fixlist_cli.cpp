/*
 * File:        fixlist_cli.cpp
 * Module:      fixlist-cli
 * Purpose:     CLI application with subcommands
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "version.h"
#include "command_line.h"
#include "command_export.h"
#include "command_query.h"
#include "command_report.h"
#include "fixlist_config.h"
#include "logging.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fixlist;

namespace {

const char* const LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [global options] <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Reconcile review-tool exports against a work order and report the frames to fix.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  export --workorder FILE EXPORT...  Reconcile exports into CSV or the database\n";
    std::cerr << "  report --video FILE                Write the frame review report with thumbnails\n";
    std::cerr << "  query                              Query stored work (see below)\n";
    std::cerr << "  db show|clear                      Print or empty the database\n";
    std::cerr << "\n";
    std::cerr << "Global options:\n";
    std::cerr << "  --config FILE                  Load settings from a YAML file\n";
    std::cerr << "  --log-level LEVEL              Set logging verbosity\n";
    std::cerr << "                                 (trace, debug, info, warn, error, critical, off)\n";
    std::cerr << "                                 Default: info\n";
    std::cerr << "  --log-file FILE                Write logs to specified file\n";
    std::cerr << "  --verbose                      Same as --log-level debug\n";
    std::cerr << "  --version                      Print the version and exit\n";
    std::cerr << "\n";
    std::cerr << "Export options:\n";
    std::cerr << "  --workorder FILE               Work order listing the canonical locations\n";
    std::cerr << "  --output csv|db                Destination (default: csv)\n";
    std::cerr << "  --csv FILE                     CSV output file (default: output.csv)\n";
    std::cerr << "  --on-malformed skip|abort      Handling of malformed lines (default: skip)\n";
    std::cerr << "\n";
    std::cerr << "Report options:\n";
    std::cerr << "  --video FILE                   Video the frame numbers refer to\n";
    std::cerr << "  --report FILE                  Report output file (default: report.csv)\n";
    std::cerr << "  --thumbnail-dir DIR            Directory for PNG stills (default: thumbnails)\n";
    std::cerr << "\n";
    std::cerr << "Query options:\n";
    std::cerr << "  --user NAME                    All work for a user\n";
    std::cerr << "  --before YYYYMMDD --file NAME  Work before a date for the user in an export file name\n";
    std::cerr << "  --on YYYYMMDD --user NAME      Work for a user on a date\n";
    std::cerr << "  --flame-users NAME...          Users named in Flame export file names\n";
    std::cerr << "\n";
    std::cerr << "Database options (export, report, query, db):\n";
    std::cerr << "  --db FILE                      SQLite database (default: fixlist.db)\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " export --workorder Xytech_20230323.txt Baselight_GLopez_20230325.txt"
              << " Flame_DFlowers_20230323.txt\n";
    std::cerr << "  " << program_name << " export --output db --workorder Xytech_20230323.txt Flame_DFlowers_20230323.txt\n";
    std::cerr << "  " << program_name << " report --video twitch_nft_demo.mp4\n";
    std::cerr << "  " << program_name << " query --on 20230325 --user TDanza\n";
}

// Value following an option, or false if the option is last
bool take_value(const std::vector<std::string>& args, size_t& i, std::string& value) {
    if (i + 1 >= args.size()) {
        std::cerr << "Error: " << args[i] << " requires a value\n";
        return false;
    }
    value = args[++i];
    return true;
}

bool parse_export_args(const std::vector<std::string>& args, const FixlistConfig& config,
                       cli::ExportOptions& options) {
    options.csv_path = config.csv_output_path;
    options.csv_delimiter = config.csv_delimiter;
    options.database_path = config.database_path;
    options.policy = config.malformed_line_policy;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;

        if (arg == "--workorder") {
            if (!take_value(args, i, options.work_order_path)) return false;
        } else if (arg == "--output") {
            if (!take_value(args, i, value)) return false;
            if (value == "csv") {
                options.target = cli::ExportTarget::CSV;
            } else if (value == "db") {
                options.target = cli::ExportTarget::DATABASE;
            } else {
                std::cerr << "Error: --output must be 'csv' or 'db', got '" << value << "'\n";
                return false;
            }
        } else if (arg == "--csv") {
            if (!take_value(args, i, options.csv_path)) return false;
        } else if (arg == "--db") {
            if (!take_value(args, i, options.database_path)) return false;
        } else if (arg == "--on-malformed") {
            if (!take_value(args, i, value)) return false;
            try {
                options.policy = malformed_line_policy_from_string(value);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return false;
            }
        } else if (arg[0] != '-') {
            options.export_files.push_back(arg);
        } else {
            std::cerr << "Error: Unknown export option: " << arg << "\n";
            return false;
        }
    }

    if (options.work_order_path.empty()) {
        std::cerr << "Error: No work order specified (--workorder)\n";
        return false;
    }
    if (options.export_files.empty()) {
        std::cerr << "Error: No export files specified\n";
        return false;
    }
    return true;
}

bool parse_report_args(const std::vector<std::string>& args, const FixlistConfig& config,
                       cli::ReportOptions& options) {
    options.database_path = config.database_path;
    options.report_path = config.report_output_path;
    options.thumbnail_dir = config.thumbnail_dir;
    options.thumbnail_width = config.thumbnail_width;
    options.thumbnail_height = config.thumbnail_height;
    options.csv_delimiter = config.csv_delimiter;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--video") {
            if (!take_value(args, i, options.video_path)) return false;
        } else if (arg == "--report") {
            if (!take_value(args, i, options.report_path)) return false;
        } else if (arg == "--thumbnail-dir") {
            if (!take_value(args, i, options.thumbnail_dir)) return false;
        } else if (arg == "--db") {
            if (!take_value(args, i, options.database_path)) return false;
        } else {
            std::cerr << "Error: Unknown report option: " << arg << "\n";
            return false;
        }
    }

    if (options.video_path.empty()) {
        std::cerr << "Error: No video specified (--video)\n";
        return false;
    }
    return true;
}

bool parse_query_args(const std::vector<std::string>& args, const FixlistConfig& config,
                      cli::QueryOptions& options) {
    options.database_path = config.database_path;
    options.csv_delimiter = config.csv_delimiter;

    std::string before;
    std::string on;
    bool flame_users = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--user") {
            if (!take_value(args, i, options.user)) return false;
        } else if (arg == "--before") {
            if (!take_value(args, i, before)) return false;
        } else if (arg == "--on") {
            if (!take_value(args, i, on)) return false;
        } else if (arg == "--file") {
            if (!take_value(args, i, options.export_file)) return false;
        } else if (arg == "--flame-users") {
            flame_users = true;
        } else if (arg == "--db") {
            if (!take_value(args, i, options.database_path)) return false;
        } else if (arg[0] != '-' && flame_users) {
            options.file_names.push_back(arg);
        } else {
            std::cerr << "Error: Unknown query option: " << arg << "\n";
            return false;
        }
    }

    int modes = (flame_users ? 1 : 0) + (before.empty() ? 0 : 1) + (on.empty() ? 0 : 1);
    if (modes > 1) {
        std::cerr << "Error: --flame-users, --before and --on cannot be combined\n";
        return false;
    }

    if (flame_users) {
        options.mode = cli::QueryMode::FLAME_USERS;
    } else if (!before.empty()) {
        if (options.export_file.empty()) {
            std::cerr << "Error: --before requires --file\n";
            return false;
        }
        options.mode = cli::QueryMode::BEFORE_DATE;
        options.date = before;
    } else if (!on.empty()) {
        if (options.user.empty()) {
            std::cerr << "Error: --on requires --user\n";
            return false;
        }
        options.mode = cli::QueryMode::ON_DATE;
        options.date = on;
    } else if (!options.user.empty()) {
        options.mode = cli::QueryMode::BY_USER;
    } else {
        std::cerr << "Error: No query specified\n";
        return false;
    }
    return true;
}

bool parse_db_args(const std::vector<std::string>& args, const FixlistConfig& config,
                   cli::DatabaseOptions& options) {
    options.database_path = config.database_path;
    options.csv_delimiter = config.csv_delimiter;

    bool have_action = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--db") {
            if (!take_value(args, i, options.database_path)) return false;
        } else if (!have_action && arg == "show") {
            options.action = cli::DatabaseAction::SHOW;
            have_action = true;
        } else if (!have_action && arg == "clear") {
            options.action = cli::DatabaseAction::CLEAR;
            have_action = true;
        } else {
            std::cerr << "Error: Unknown db argument: " << arg << "\n";
            return false;
        }
    }

    if (!have_action) {
        std::cerr << "Error: db requires 'show' or 'clear'\n";
        return false;
    }
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    cli::CommandLine command_line = cli::split_command_line(std::vector<std::string>(argv + 1, argv + argc));

    if (command_line.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (command_line.show_version) {
        std::cout << "fixlist " << FIXLIST_VERSION << "\n";
        return 0;
    }

    const std::string& command = command_line.command;
    const std::vector<std::string>& command_args = command_line.command_args;
    const std::string& config_path = command_line.config_path;
    const std::string& log_level = command_line.log_level;
    const std::string& log_file = command_line.log_file;

    if (command.empty()) {
        std::cerr << "Error: No command specified\n";
        print_usage(argv[0]);
        return 1;
    }

    // Initialize logging
    fixlist::init_logging(log_level.empty() ? "info" : log_level, LOG_PATTERN, log_file);

    FixlistConfig config;
    if (!config_path.empty()) {
        try {
            config = load_config(config_path);
        } catch (const ConfigError& e) {
            FIXLIST_LOG_ERROR("{}", e.what());
            return 1;
        }

        // Command line logging options take precedence
        if (log_file.empty() && !config.log_file.empty()) {
            fixlist::init_logging(log_level.empty() ? config.log_level : log_level, LOG_PATTERN, config.log_file);
        } else if (log_level.empty()) {
            fixlist::set_log_level(config.log_level);
        }
    }

    // Dispatch to appropriate handler with exception handling
    try {
        if (command == "export") {
            cli::ExportOptions options;
            if (!parse_export_args(command_args, config, options)) {
                print_usage(argv[0]);
                return 1;
            }
            return cli::export_command(options);
        } else if (command == "report") {
            cli::ReportOptions options;
            if (!parse_report_args(command_args, config, options)) {
                print_usage(argv[0]);
                return 1;
            }
            return cli::report_command(options);
        } else if (command == "query") {
            cli::QueryOptions options;
            if (!parse_query_args(command_args, config, options)) {
                print_usage(argv[0]);
                return 1;
            }
            return cli::query_command(options);
        } else if (command == "db") {
            cli::DatabaseOptions options;
            if (!parse_db_args(command_args, config, options)) {
                print_usage(argv[0]);
                return 1;
            }
            return cli::database_command(options);
        }

        std::cerr << "Error: Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
