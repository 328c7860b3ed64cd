/*
 * File:        test_command_line.cpp
 * Module:      fixlist-tests
 * Purpose:     Command line splitting test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_line.h"
#include <cassert>
#include <iostream>

using namespace fixlist::cli;

void test_command_first() {
    CommandLine line = split_command_line({"query", "--user", "TDanza", "--db", "x.db"});
    assert(line.command == "query");
    assert(line.command_args == std::vector<std::string>({"--user", "TDanza", "--db", "x.db"}));
    assert(!line.show_help);
    assert(!line.show_version);

    std::cout << "test_command_first: PASSED\n";
}

void test_command_option_before_command() {
    CommandLine line = split_command_line({"--db", "x.db", "query", "--user", "T"});
    assert(line.command == "query");
    assert(line.command_args == std::vector<std::string>({"--db", "x.db", "--user", "T"}));

    line = split_command_line({"--workorder", "Xytech.txt", "export", "Baselight_GLopez_20230325.txt"});
    assert(line.command == "export");
    assert(line.command_args ==
           std::vector<std::string>({"--workorder", "Xytech.txt", "Baselight_GLopez_20230325.txt"}));

    std::cout << "test_command_option_before_command: PASSED\n";
}

void test_global_options_anywhere() {
    CommandLine line = split_command_line({"--config", "fixlist.yaml", "db", "show",
                                           "--log-level", "trace", "--log-file", "run.log"});
    assert(line.command == "db");
    assert(line.command_args == std::vector<std::string>({"show"}));
    assert(line.config_path == "fixlist.yaml");
    assert(line.log_level == "trace");
    assert(line.log_file == "run.log");

    line = split_command_line({"report", "-v", "--video", "demo.mp4"});
    assert(line.log_level == "debug");
    assert(line.command_args == std::vector<std::string>({"--video", "demo.mp4"}));

    std::cout << "test_global_options_anywhere: PASSED\n";
}

void test_help_and_version() {
    assert(split_command_line({"query", "--help"}).show_help);
    assert(split_command_line({"-h"}).show_help);
    assert(split_command_line({"--version", "query"}).show_version);

    CommandLine line = split_command_line({"--verbose"});
    assert(line.command.empty());

    std::cout << "test_help_and_version: PASSED\n";
}

int main() {
    std::cout << "Running command line tests...\n\n";

    test_command_first();
    test_command_option_before_command();
    test_global_options_anywhere();
    test_help_and_version();

    std::cout << "\nAll command line tests passed!\n";
    return 0;
}
