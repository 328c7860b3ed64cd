/*
 * File:        test_fixlist_config.cpp
 * Module:      fixlist-tests
 * Purpose:     YAML configuration test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "fixlist_config.h"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace fixlist;

namespace {

bool throws_config_error(const std::string& yaml) {
    try {
        parse_config(yaml);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // anonymous namespace

void test_defaults() {
    FixlistConfig config = parse_config("");
    assert(config.database_path == "fixlist.db");
    assert(config.csv_output_path == "output.csv");
    assert(config.csv_delimiter == '/');
    assert(config.report_output_path == "report.csv");
    assert(config.thumbnail_dir == "thumbnails");
    assert(config.thumbnail_width == 96);
    assert(config.thumbnail_height == 74);
    assert(config.malformed_line_policy == MalformedLinePolicy::SKIP);
    assert(config.log_level == "info");
    assert(config.log_file.empty());

    std::cout << "test_defaults: PASSED\n";
}

void test_full_config() {
    FixlistConfig config = parse_config(
        "fixlist:\n"
        "  database: /var/lib/fixlist/jobs.db\n"
        "  csv_output: fixes.csv\n"
        "  csv_delimiter: \",\"\n"
        "  report_output: review.csv\n"
        "  thumbnail_dir: stills\n"
        "  thumbnail_width: 128\n"
        "  thumbnail_height: 72\n"
        "  on_malformed_line: abort\n"
        "  log_level: debug\n"
        "  log_file: fixlist.log\n");

    assert(config.database_path == "/var/lib/fixlist/jobs.db");
    assert(config.csv_output_path == "fixes.csv");
    assert(config.csv_delimiter == ',');
    assert(config.report_output_path == "review.csv");
    assert(config.thumbnail_dir == "stills");
    assert(config.thumbnail_width == 128);
    assert(config.thumbnail_height == 72);
    assert(config.malformed_line_policy == MalformedLinePolicy::ABORT);
    assert(config.log_level == "debug");
    assert(config.log_file == "fixlist.log");

    std::cout << "test_full_config: PASSED\n";
}

void test_partial_config() {
    FixlistConfig config = parse_config("fixlist:\n  database: other.db\n");
    assert(config.database_path == "other.db");
    assert(config.csv_delimiter == '/');
    assert(config.thumbnail_width == 96);

    std::cout << "test_partial_config: PASSED\n";
}

void test_invalid_config() {
    assert(throws_config_error("other:\n  database: x.db\n"));
    assert(throws_config_error("fixlist: just-a-string\n"));
    assert(throws_config_error("fixlist:\n  csv_delimiter: \"||\"\n"));
    assert(throws_config_error("fixlist:\n  on_malformed_line: ignore\n"));
    assert(throws_config_error("fixlist:\n  thumbnail_width: 0\n"));
    assert(throws_config_error("fixlist:\n  thumbnail_height: tall\n"));
    assert(throws_config_error("fixlist: [unclosed\n"));

    std::cout << "test_invalid_config: PASSED\n";
}

void test_load_config_file() {
    const std::string filename = "test_fixlist_config.yaml";
    {
        std::ofstream out(filename);
        out << "fixlist:\n  report_output: from_file.csv\n";
    }
    FixlistConfig config = load_config(filename);
    assert(config.report_output_path == "from_file.csv");
    std::remove(filename.c_str());

    bool threw = false;
    try {
        load_config("does_not_exist_fixlist.yaml");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_load_config_file: PASSED\n";
}

int main() {
    std::cout << "Running configuration tests...\n\n";

    test_defaults();
    test_full_config();
    test_partial_config();
    test_invalid_config();
    test_load_config_file();

    std::cout << "\nAll configuration tests passed!\n";
    return 0;
}
