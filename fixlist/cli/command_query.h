/*
 * File:        command_query.h
 * Module:      fixlist-cli
 * Purpose:     Database query and maintenance commands header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <string>
#include <vector>

namespace fixlist {
namespace cli {

enum class QueryMode {
    BY_USER,        // --user
    BEFORE_DATE,    // --before with --file
    ON_DATE,        // --on with --user
    FLAME_USERS     // --flame-users
};

struct QueryOptions {
    std::string database_path;
    QueryMode mode = QueryMode::BY_USER;
    std::string user;
    std::string date;                       // YYYYMMDD
    std::string export_file;
    std::vector<std::string> file_names;    // For FLAME_USERS
    char csv_delimiter = '/';
};

int query_command(const QueryOptions& options);

enum class DatabaseAction {
    SHOW,
    CLEAR
};

struct DatabaseOptions {
    std::string database_path;
    DatabaseAction action = DatabaseAction::SHOW;
    char csv_delimiter = '/';
};

int database_command(const DatabaseOptions& options);

} // namespace cli
} // namespace fixlist
