/*
 * File:        fixlist_config.h
 * Module:      fixlist-core
 * Purpose:     Run configuration loaded from YAML
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "reconciliation_pipeline.h"
#include <stdexcept>
#include <string>

namespace fixlist {

/**
 * @brief Thrown when a configuration file is unreadable or invalid
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Settings shared by all commands
 *
 * A configuration file is a YAML document with a top-level "fixlist" map:
 *
 *     fixlist:
 *       database: fixlist.db
 *       csv_output: output.csv
 *       csv_delimiter: "/"
 *       report_output: report.csv
 *       thumbnail_dir: thumbnails
 *       thumbnail_width: 96
 *       thumbnail_height: 74
 *       on_malformed_line: skip
 *       log_level: info
 *       log_file: ""
 *
 * Missing keys keep the defaults below.
 */
struct FixlistConfig {
    std::string database_path = "fixlist.db";
    std::string csv_output_path = "output.csv";
    char csv_delimiter = '/';
    std::string report_output_path = "report.csv";
    std::string thumbnail_dir = "thumbnails";
    int thumbnail_width = 96;
    int thumbnail_height = 74;
    MalformedLinePolicy malformed_line_policy = MalformedLinePolicy::SKIP;
    std::string log_level = "info";
    std::string log_file;
};

/**
 * @brief Parse configuration from YAML text
 * @throws ConfigError on YAML syntax errors or invalid values
 */
FixlistConfig parse_config(const std::string& yaml_text);

/**
 * @brief Load configuration from a YAML file
 * @throws ConfigError if the file cannot be parsed or holds invalid values
 */
FixlistConfig load_config(const std::string& filename);

} // namespace fixlist
