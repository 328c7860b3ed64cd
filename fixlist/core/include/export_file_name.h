/*
 * File:        export_file_name.h
 * Module:      fixlist-core
 * Purpose:     Identity tags carried by export file names
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "export_line_parser.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace fixlist {

/**
 * @brief Thrown when an export file name cannot be interpreted
 */
class ExportFileNameError : public std::runtime_error {
public:
    explicit ExportFileNameError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Fields encoded in "<Machine>_<UserOnFile>_<YYYYMMDD>.<ext>"
 */
struct ExportFileInfo {
    std::string file_name;      // Base name without directories
    std::string machine;        // "Baselight" or "Flame"
    std::string user_on_file;
    std::string file_date;      // ISO "YYYY-MM-DD"
    ExportGrammar grammar = ExportGrammar::SINGLE_PATH;
};

/// Strip directories (either separator) from a path
std::string base_file_name(const std::string& path);

/**
 * @brief Last eight characters of a file name before its extension
 *
 * "Baselight_GLopez_20230325.txt" -> "20230325"
 */
std::string file_date_from_name(const std::string& file_name);

/**
 * @brief Convert "YYYYMMDD" to "YYYY-MM-DD"
 * @throws std::invalid_argument if the text is not a calendar date
 */
std::string compact_date_to_iso(const std::string& compact);

/**
 * @brief Grammar used by a review tool's exports
 * @throws ExportFileNameError for machines other than Baselight and Flame
 */
ExportGrammar grammar_for_machine(const std::string& machine);

/**
 * @brief Decode an export file name
 * @throws ExportFileNameError if the name does not have three '_' separated
 *         fields, the date is invalid or the machine is unknown
 */
ExportFileInfo parse_export_file_name(const std::string& path);

/**
 * @brief Second '_' separated field of a file's base name
 *
 * Neither the machine nor the date is checked: "Resolve_GLopez_x.txt"
 * gives "GLopez".
 *
 * @throws ExportFileNameError if the name has no '_' separator
 */
std::string user_from_file_name(const std::string& path);

/**
 * @brief Distinct users named in Flame export file names, in first-seen order
 *
 * Names that are not Flame exports, or cannot be decoded, are skipped.
 */
std::vector<std::string> flame_users(const std::vector<std::string>& file_names);

} // namespace fixlist
