/*
 * File:        command_line.h
 * Module:      fixlist-cli
 * Purpose:     Split argv into global options, command and command options
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <string>
#include <vector>

namespace fixlist {
namespace cli {

struct CommandLine {
    std::string command;
    std::vector<std::string> command_args;
    std::string config_path;
    std::string log_level;
    std::string log_file;
    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Separate global options from the command and its arguments
 *
 * Global options may appear anywhere. A command option given before the
 * command name keeps its value with it, so "--db x.db query" selects
 * "query" rather than "x.db". Scanning stops at --help or --version.
 *
 * @param args Arguments after the program name
 */
CommandLine split_command_line(const std::vector<std::string>& args);

} // namespace cli
} // namespace fixlist
