/*
 * File:        command_export.h
 * Module:      fixlist-cli
 * Purpose:     Export reconciliation command header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "reconciliation_pipeline.h"
#include <string>
#include <vector>

namespace fixlist {
namespace cli {

enum class ExportTarget {
    CSV,
    DATABASE
};

struct ExportOptions {
    std::string work_order_path;
    std::vector<std::string> export_files;
    ExportTarget target = ExportTarget::CSV;
    std::string csv_path;
    char csv_delimiter = '/';
    std::string database_path;
    MalformedLinePolicy policy = MalformedLinePolicy::SKIP;
};

int export_command(const ExportOptions& options);

} // namespace cli
} // namespace fixlist
