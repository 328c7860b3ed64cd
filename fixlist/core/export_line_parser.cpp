/*
 * File:        export_line_parser.cpp
 * Module:      fixlist-core
 * Purpose:     Parsers for review-tool export lines
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "export_line_parser.h"
#include "frame_tokens.h"
#include <algorithm>

namespace fixlist {

namespace {

std::vector<std::string> split_on_spaces(const std::string& line) {
    std::vector<std::string> tokens;
    size_t begin = 0;
    while (true) {
        size_t space = line.find(' ', begin);
        if (space == std::string::npos) {
            tokens.push_back(line.substr(begin));
            break;
        }
        tokens.push_back(line.substr(begin, space - begin));
        begin = space + 1;
    }
    return tokens;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string join(const std::vector<std::string>& tokens, char sep) {
    std::string result;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) result += sep;
        result += tokens[i];
    }
    return result;
}

} // anonymous namespace

std::string export_grammar_to_string(ExportGrammar grammar) {
    switch (grammar) {
        case ExportGrammar::SINGLE_PATH: return "single-path";
        case ExportGrammar::DUAL_PATH: return "dual-path";
        default: return "unknown";
    }
}

void split_export_tokens(const std::string& line,
                         std::vector<std::string>& path_tokens,
                         std::vector<std::string>& frame_tokens) {
    path_tokens.clear();
    frame_tokens.clear();
    if (line.empty()) {
        return;
    }

    std::vector<std::string> tokens = split_on_spaces(line);

    // Walk back over the frame region
    size_t boundary = tokens.size();
    while (boundary > 0 && is_frame_like_token(tokens[boundary - 1])) {
        --boundary;
    }

    path_tokens.assign(tokens.begin(), tokens.begin() + static_cast<std::ptrdiff_t>(boundary));
    frame_tokens.assign(tokens.begin() + static_cast<std::ptrdiff_t>(boundary), tokens.end());
}

std::string normalize_separators(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

ParsedLine parse_single_path_line(const std::string& line) {
    ParsedLine parsed;
    std::vector<std::string> path_tokens;
    split_export_tokens(line, path_tokens, parsed.raw_frame_tokens);

    parsed.reviewed_path = trim(normalize_separators(join(path_tokens, ' ')));
    return parsed;
}

ParsedLine parse_dual_path_line(const std::string& line) {
    ParsedLine parsed;
    if (line.empty()) {
        return parsed;
    }

    std::vector<std::string> path_tokens;
    split_export_tokens(line, path_tokens, parsed.raw_frame_tokens);

    if (path_tokens.size() != 2) {
        throw ExportLineError("Expected storage and location paths, found " +
                              std::to_string(path_tokens.size()) +
                              " path token(s) in line: " + line);
    }

    std::string storage = normalize_separators(path_tokens[0]);
    std::string location = normalize_separators(path_tokens[1]);

    // Join with exactly one separator
    while (storage.size() > 1 && storage.back() == '/') {
        storage.pop_back();
    }
    size_t location_start = location.find_first_not_of('/');
    location = (location_start == std::string::npos) ? "" : location.substr(location_start);

    if (storage == "/" || storage.empty()) {
        parsed.reviewed_path = trim(storage + location);
    } else {
        parsed.reviewed_path = trim(storage + "/" + location);
    }
    return parsed;
}

ParsedLine parse_export_line(const std::string& line, ExportGrammar grammar) {
    switch (grammar) {
        case ExportGrammar::SINGLE_PATH:
            return parse_single_path_line(line);
        case ExportGrammar::DUAL_PATH:
            return parse_dual_path_line(line);
    }
    throw ExportLineError("Unsupported export grammar");
}

} // namespace fixlist
