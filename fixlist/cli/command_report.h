/*
 * File:        command_report.h
 * Module:      fixlist-cli
 * Purpose:     Frame review report command header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <string>

namespace fixlist {
namespace cli {

struct ReportOptions {
    std::string database_path;
    std::string video_path;
    std::string report_path;
    std::string thumbnail_dir;
    int thumbnail_width = 96;
    int thumbnail_height = 74;
    char csv_delimiter = '/';
};

int report_command(const ReportOptions& options);

} // namespace cli
} // namespace fixlist
