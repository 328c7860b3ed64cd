/*
 * File:        test_export_line_parser.cpp
 * Module:      fixlist-tests
 * Purpose:     Export line grammar test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "export_line_parser.h"
#include <cassert>
#include <iostream>

using namespace fixlist;

void test_single_path_line() {
    ParsedLine parsed = parse_single_path_line(
        "/images1/.../Hydraulx 1251 1252 1253 1260 <err> 1270 1271 1272 ");
    assert(parsed.reviewed_path == "/images1/.../Hydraulx");

    std::vector<std::string> expected = {"1251", "1252", "1253", "1260", "<err>", "1270", "1271", "1272", ""};
    assert(parsed.raw_frame_tokens == expected);

    std::cout << "test_single_path_line: PASSED\n";
}

void test_single_path_with_spaces() {
    // Path tokens are rejoined with single spaces
    ParsedLine parsed = parse_single_path_line("/images1/star wars/reel1 32 33");
    assert(parsed.reviewed_path == "/images1/star wars/reel1");
    assert(parsed.raw_frame_tokens == std::vector<std::string>({"32", "33"}));

    parsed = parse_single_path_line("C:\\images1\\starwars\\reel1 <null> 7");
    assert(parsed.reviewed_path == "C:/images1/starwars/reel1");
    assert(parsed.raw_frame_tokens == std::vector<std::string>({"<null>", "7"}));

    // An all-digit path segment followed by more path text stays in the path
    parsed = parse_single_path_line("/images1/starwars/reel1/VFX/spaces and 3874 numbers 6188 6189 6190 6191");
    assert(parsed.reviewed_path == "/images1/starwars/reel1/VFX/spaces and 3874 numbers");
    assert(parsed.raw_frame_tokens.size() == 4);
    assert(parsed.raw_frame_tokens == std::vector<std::string>({"6188", "6189", "6190", "6191"}));

    std::cout << "test_single_path_with_spaces: PASSED\n";
}

void test_single_path_without_frames() {
    ParsedLine parsed = parse_single_path_line("/images1/starwars/reel1/partA/1920x1080");
    assert(parsed.reviewed_path == "/images1/starwars/reel1/partA/1920x1080");
    assert(parsed.raw_frame_tokens.empty());

    parsed = parse_single_path_line("");
    assert(parsed.reviewed_path.empty());
    assert(parsed.raw_frame_tokens.empty());

    std::cout << "test_single_path_without_frames: PASSED\n";
}

void test_dual_path_line() {
    ParsedLine parsed = parse_dual_path_line("/net/flame-archive Avatar/reel1/VFX/Hydraulx 1260 1261 1262 1267");
    assert(parsed.reviewed_path == "/net/flame-archive/Avatar/reel1/VFX/Hydraulx");
    assert(parsed.raw_frame_tokens == std::vector<std::string>({"1260", "1261", "1262", "1267"}));

    std::cout << "test_dual_path_line: PASSED\n";
}

void test_dual_path_single_separator() {
    ParsedLine parsed = parse_dual_path_line("/net/flame-archive/ /Avatar/reel1 10");
    assert(parsed.reviewed_path == "/net/flame-archive/Avatar/reel1");

    parsed = parse_dual_path_line("\\net\\flame-archive Avatar\\reel1 10");
    assert(parsed.reviewed_path == "/net/flame-archive/Avatar/reel1");

    std::cout << "test_dual_path_single_separator: PASSED\n";
}

void test_dual_path_malformed() {
    const char* bad[] = {
        "/net/flame-archive 1260 1261",
        "/net/flame-archive Avatar reel1 1260",
    };
    for (const char* line : bad) {
        bool threw = false;
        try {
            parse_dual_path_line(line);
        } catch (const ExportLineError&) {
            threw = true;
        }
        assert(threw);
    }

    // Empty lines are not malformed
    ParsedLine parsed = parse_dual_path_line("");
    assert(parsed.reviewed_path.empty());
    assert(parsed.raw_frame_tokens.empty());

    std::cout << "test_dual_path_malformed: PASSED\n";
}

void test_grammar_dispatch() {
    const std::string line = "/net/flame-archive Avatar/reel1 5";
    assert(parse_export_line(line, ExportGrammar::DUAL_PATH).reviewed_path == "/net/flame-archive/Avatar/reel1");
    assert(parse_export_line(line, ExportGrammar::SINGLE_PATH).reviewed_path == "/net/flame-archive Avatar/reel1");

    assert(export_grammar_to_string(ExportGrammar::SINGLE_PATH) == "single-path");
    assert(export_grammar_to_string(ExportGrammar::DUAL_PATH) == "dual-path");

    std::cout << "test_grammar_dispatch: PASSED\n";
}

int main() {
    std::cout << "Running export line parser tests...\n\n";

    test_single_path_line();
    test_single_path_with_spaces();
    test_single_path_without_frames();
    test_dual_path_line();
    test_dual_path_single_separator();
    test_dual_path_malformed();
    test_grammar_dispatch();

    std::cout << "\nAll export line parser tests passed!\n";
    return 0;
}
