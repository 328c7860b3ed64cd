/*
 * File:        export_line_parser.h
 * Module:      fixlist-core
 * Purpose:     Parsers for review-tool export lines
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace fixlist {

/**
 * @brief Thrown when an export line does not fit its grammar
 */
class ExportLineError : public std::runtime_error {
public:
    explicit ExportLineError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Line grammars of the supported review tools
 *
 * SINGLE_PATH: "<path that may contain spaces> <frames...>" (Baselight)
 * DUAL_PATH:   "<storage> <location> <frames...>" (Flame)
 */
enum class ExportGrammar {
    SINGLE_PATH,
    DUAL_PATH
};

std::string export_grammar_to_string(ExportGrammar grammar);

/**
 * @brief One export line split into a path and its raw frame tokens
 *
 * raw_frame_tokens keeps the source order and may contain "<err>", "<null>"
 * and empty strings between the digit strings.
 */
struct ParsedLine {
    std::string reviewed_path;
    std::vector<std::string> raw_frame_tokens;
};

/**
 * @brief Split a line into its path region and trailing frame tokens
 *
 * The line is split on single spaces. Tokens are consumed from the end for
 * as long as they are digit strings, "<err>", "<null>" or empty. Frame
 * numbers follow paths that may themselves contain spaces and digits, so
 * the boundary can only be found by scanning backwards.
 *
 * @param line Export line without its terminating newline
 * @param path_tokens Tokens before the frame region
 * @param frame_tokens Trailing frame-like tokens, in line order
 */
void split_export_tokens(const std::string& line,
                         std::vector<std::string>& path_tokens,
                         std::vector<std::string>& frame_tokens);

/// Replace every backslash with a forward slash
std::string normalize_separators(const std::string& path);

/**
 * @brief Parse a single-path (Baselight) line
 *
 * The path region, rejoined with single spaces, becomes the reviewed path.
 * An empty line gives an empty path and no tokens.
 */
ParsedLine parse_single_path_line(const std::string& line);

/**
 * @brief Parse a dual-path (Flame) line
 *
 * The path region must hold exactly a storage and a location token, which
 * are joined with one '/'.
 *
 * @throws ExportLineError if the path region is not exactly two tokens
 */
ParsedLine parse_dual_path_line(const std::string& line);

/// Dispatch to the parser for the given grammar
ParsedLine parse_export_line(const std::string& line, ExportGrammar grammar);

} // namespace fixlist
