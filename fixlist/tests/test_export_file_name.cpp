/*
 * File:        test_export_file_name.cpp
 * Module:      fixlist-tests
 * Purpose:     Export file name decoding test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "export_file_name.h"
#include <cassert>
#include <iostream>

using namespace fixlist;

namespace {

bool throws_file_name_error(const std::string& name) {
    try {
        parse_export_file_name(name);
    } catch (const ExportFileNameError&) {
        return true;
    }
    return false;
}

} // anonymous namespace

void test_baselight_name() {
    ExportFileInfo info = parse_export_file_name("Baselight_GLopez_20230325.txt");
    assert(info.file_name == "Baselight_GLopez_20230325.txt");
    assert(info.machine == "Baselight");
    assert(info.user_on_file == "GLopez");
    assert(info.file_date == "2023-03-25");
    assert(info.grammar == ExportGrammar::SINGLE_PATH);

    std::cout << "test_baselight_name: PASSED\n";
}

void test_flame_name_with_directories() {
    ExportFileInfo info = parse_export_file_name("/data/exports/Flame_DFlowers_20230323.txt");
    assert(info.file_name == "Flame_DFlowers_20230323.txt");
    assert(info.machine == "Flame");
    assert(info.user_on_file == "DFlowers");
    assert(info.file_date == "2023-03-23");
    assert(info.grammar == ExportGrammar::DUAL_PATH);

    info = parse_export_file_name("C:\\exports\\Flame_MFelix_20230326.txt");
    assert(info.user_on_file == "MFelix");

    std::cout << "test_flame_name_with_directories: PASSED\n";
}

void test_invalid_names() {
    assert(throws_file_name_error("Resolve_GLopez_20230325.txt"));
    assert(throws_file_name_error("Baselight_20230325.txt"));
    assert(throws_file_name_error("Baselight_G_Lopez_20230325.txt"));
    assert(throws_file_name_error("Baselight_GLopez_20230230.txt"));
    assert(throws_file_name_error("Baselight_GLopez_2023032.txt"));

    std::cout << "test_invalid_names: PASSED\n";
}

void test_user_from_file_name() {
    assert(user_from_file_name("Baselight_GLopez_20230325.txt") == "GLopez");
    assert(user_from_file_name("/data/exports/Flame_DFlowers_20230323.txt") == "DFlowers");

    // Machine and date are not checked
    assert(user_from_file_name("Resolve_GLopez_anything.txt") == "GLopez");
    assert(user_from_file_name("Baselight_TDanza") == "TDanza");

    bool threw = false;
    try {
        user_from_file_name("/data/Baselight.txt");
    } catch (const ExportFileNameError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_user_from_file_name: PASSED\n";
}

void test_file_date_from_name() {
    assert(file_date_from_name("Xytech_20230323.txt") == "20230323");
    assert(file_date_from_name("Baselight_GLopez_20230325.txt") == "20230325");
    assert(file_date_from_name("Flame_DFlowers_20230323") == "20230323");
    assert(base_file_name("a/b\\Xytech_20230323.txt") == "Xytech_20230323.txt");

    std::cout << "test_file_date_from_name: PASSED\n";
}

void test_compact_dates() {
    assert(compact_date_to_iso("20240229") == "2024-02-29");
    assert(compact_date_to_iso("20001231") == "2000-12-31");

    const char* bad[] = {"20230229", "19000229", "20231301", "20230400", "2023-3-1", ""};
    for (const char* date : bad) {
        bool threw = false;
        try {
            compact_date_to_iso(date);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "test_compact_dates: PASSED\n";
}

void test_flame_users() {
    std::vector<std::string> names = {
        "Flame_DFlowers_20230323.txt",
        "Baselight_GLopez_20230325.txt",
        "Flame_MFelix_20230326.txt",
        "Flame_DFlowers_20230327.txt",
        "notes.txt",
    };
    std::vector<std::string> expected = {"DFlowers", "MFelix"};
    assert(flame_users(names) == expected);
    assert(flame_users({}).empty());

    std::cout << "test_flame_users: PASSED\n";
}

int main() {
    std::cout << "Running export file name tests...\n\n";

    test_baselight_name();
    test_flame_name_with_directories();
    test_invalid_names();
    test_user_from_file_name();
    test_file_date_from_name();
    test_compact_dates();
    test_flame_users();

    std::cout << "\nAll export file name tests passed!\n";
    return 0;
}
