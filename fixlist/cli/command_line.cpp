/*
 * File:        command_line.cpp
 * Module:      fixlist-cli
 * Purpose:     Split argv into global options, command and command options
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_line.h"

#include <algorithm>
#include <iterator>

namespace fixlist {
namespace cli {

namespace {

// Command options that are followed by a value
const char* const VALUE_OPTIONS[] = {
    "--workorder", "--output", "--csv", "--on-malformed", "--db",
    "--video", "--report", "--thumbnail-dir",
    "--user", "--before", "--on", "--file"
};

bool takes_value(const std::string& arg) {
    return std::find(std::begin(VALUE_OPTIONS), std::end(VALUE_OPTIONS), arg) != std::end(VALUE_OPTIONS);
}

} // anonymous namespace

CommandLine split_command_line(const std::vector<std::string>& args) {
    CommandLine result;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_next = i + 1 < args.size();

        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
            return result;
        } else if (arg == "--version") {
            result.show_version = true;
            return result;
        } else if (arg == "--config" && has_next) {
            result.config_path = args[++i];
        } else if (arg == "--log-level" && has_next) {
            result.log_level = args[++i];
        } else if (arg == "--log-file" && has_next) {
            result.log_file = args[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            result.log_level = "debug";
        } else if (result.command.empty() && takes_value(arg) && has_next) {
            result.command_args.push_back(arg);
            result.command_args.push_back(args[++i]);
        } else if (result.command.empty() && !arg.empty() && arg[0] != '-') {
            result.command = arg;
        } else {
            result.command_args.push_back(arg);
        }
    }

    return result;
}

} // namespace cli
} // namespace fixlist
