/*
 * File:        export_file_name.cpp
 * Module:      fixlist-core
 * Purpose:     Identity tags carried by export file names
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "export_file_name.h"
#include "frame_tokens.h"
#include "logging.h"
#include <algorithm>
#include <fmt/format.h>

namespace fixlist {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (true) {
        size_t pos = s.find(sep, begin);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(begin));
            break;
        }
        parts.push_back(s.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return parts;
}

} // anonymous namespace

std::string base_file_name(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

std::string file_date_from_name(const std::string& file_name) {
    std::string stem = file_name;
    size_t dot = stem.rfind('.');
    if (dot != std::string::npos) {
        stem = stem.substr(0, dot);
    }
    if (stem.size() <= 8) {
        return stem;
    }
    return stem.substr(stem.size() - 8);
}

std::string compact_date_to_iso(const std::string& compact) {
    if (compact.size() != 8 || !is_decimal_digits(compact)) {
        throw std::invalid_argument("Invalid date '" + compact + "' (expected YYYYMMDD)");
    }

    int year = std::stoi(compact.substr(0, 4));
    int month = std::stoi(compact.substr(4, 2));
    int day = std::stoi(compact.substr(6, 2));

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        throw std::invalid_argument("Invalid date '" + compact + "'");
    }

    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

ExportGrammar grammar_for_machine(const std::string& machine) {
    if (machine == "Baselight") return ExportGrammar::SINGLE_PATH;
    if (machine == "Flame") return ExportGrammar::DUAL_PATH;
    throw ExportFileNameError("Unknown machine: " + machine);
}

ExportFileInfo parse_export_file_name(const std::string& path) {
    ExportFileInfo info;
    info.file_name = base_file_name(path);

    std::vector<std::string> fields = split(info.file_name, '_');
    if (fields.size() != 3) {
        throw ExportFileNameError("Export file name '" + info.file_name +
                                  "' is not <Machine>_<User>_<YYYYMMDD>.<ext>");
    }

    info.machine = fields[0];
    info.user_on_file = fields[1];

    std::string date_part = fields[2].substr(0, fields[2].find('.'));
    try {
        info.file_date = compact_date_to_iso(date_part);
    } catch (const std::invalid_argument& e) {
        throw ExportFileNameError("Export file name '" + info.file_name + "': " + e.what());
    }

    info.grammar = grammar_for_machine(info.machine);
    return info;
}

std::string user_from_file_name(const std::string& path) {
    std::string file_name = base_file_name(path);
    std::vector<std::string> fields = split(file_name, '_');
    if (fields.size() < 2) {
        throw ExportFileNameError("File name '" + file_name + "' has no user field");
    }
    return fields[1];
}

std::vector<std::string> flame_users(const std::vector<std::string>& file_names) {
    std::vector<std::string> names;
    for (const auto& file_name : file_names) {
        ExportFileInfo info;
        try {
            info = parse_export_file_name(file_name);
        } catch (const ExportFileNameError& e) {
            FIXLIST_LOG_WARN("Ignoring '{}': {}", file_name, e.what());
            continue;
        }
        if (info.machine != "Flame") {
            continue;
        }
        if (std::find(names.begin(), names.end(), info.user_on_file) == names.end()) {
            names.push_back(info.user_on_file);
        }
    }
    return names;
}

} // namespace fixlist
