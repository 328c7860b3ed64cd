/*
 * File:        test_work_order.cpp
 * Module:      fixlist-tests
 * Purpose:     Work order reader test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "work_order.h"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace fixlist;

namespace {

const char* SAMPLE_WORK_ORDER =
    "Xytech Workorder 1107\n"
    "\n"
    "Producer: Joan Jett\n"
    "Operator: John Doe\n"
    "Job: Dirtfixing\n"
    "\n"
    "\n"
    "Location:\n"
    "/hpsans13/production/starwars/reel1/partA/1920x1080\n"
    "/hpsans12/production/starwars/reel1/VFX/Hydraulx\n"
    "\n"
    "/hpsans15/production/starwars/pickups/shot_1ab/1920x1080\n"
    "\n"
    "Notes:\n"
    "Please clean files noted per Colorist Tom Brady\n";

bool throws_work_order_error(const std::string& content) {
    try {
        parse_work_order(content);
    } catch (const WorkOrderError&) {
        return true;
    }
    return false;
}

} // anonymous namespace

void test_parse_sample() {
    WorkOrder order = parse_work_order(SAMPLE_WORK_ORDER);
    assert(order.producer == "Joan Jett");
    assert(order.operator_name == "John Doe");
    assert(order.job == "Dirtfixing");
    assert(order.notes == "Please clean files noted per Colorist Tom Brady");

    assert(order.canonical_paths.size() == 3);
    assert(order.canonical_paths[0] == "/hpsans13/production/starwars/reel1/partA/1920x1080");
    assert(order.canonical_paths[1] == "/hpsans12/production/starwars/reel1/VFX/Hydraulx");
    assert(order.canonical_paths[2] == "/hpsans15/production/starwars/pickups/shot_1ab/1920x1080");

    std::cout << "test_parse_sample: PASSED\n";
}

void test_field_lookup() {
    assert(get_work_order_field("Producer", "Producer: Joan Jett  \nJob: X\n") == "Joan Jett");

    // A label with no value on its line is skipped in favour of a later one
    assert(get_work_order_field("Job", "Job: \nJob: Dirtfixing\n") == "Dirtfixing");

    bool threw = false;
    try {
        get_work_order_field("Operator", "Producer: Joan Jett\n");
    } catch (const WorkOrderError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_field_lookup: PASSED\n";
}

void test_missing_sections() {
    std::string content = SAMPLE_WORK_ORDER;

    std::string no_operator = content;
    no_operator.replace(no_operator.find("Operator: John Doe\n"), 19, "");
    assert(throws_work_order_error(no_operator));

    std::string no_location = content;
    no_location.replace(no_location.find("Location:"), 9, "Places:");
    assert(throws_work_order_error(no_location));

    std::string no_notes = content;
    no_notes.replace(no_notes.find("Notes:"), 6, "Remarks:");
    assert(throws_work_order_error(no_notes));

    std::string two_notes = content + "\nNotes:\nagain\n";
    assert(throws_work_order_error(two_notes));

    std::cout << "test_missing_sections: PASSED\n";
}

void test_backslash_paths() {
    std::string content =
        "Producer: P\nOperator: O\nJob: J\n"
        "\nLocation:\n"
        "\\\\hpsans13\\production\\reel1\n"
        "\nNotes:\n"
        "none\n";
    WorkOrder order = parse_work_order(content);
    assert(order.canonical_paths.size() == 1);
    assert(order.canonical_paths[0] == "//hpsans13/production/reel1");

    std::cout << "test_backslash_paths: PASSED\n";
}

void test_load_from_file() {
    const std::string filename = "test_work_order_sample.txt";
    {
        std::ofstream out(filename, std::ios::binary);
        out << SAMPLE_WORK_ORDER;
    }

    WorkOrder order = load_work_order(filename);
    assert(order.job == "Dirtfixing");
    assert(order.canonical_paths.size() == 3);
    std::remove(filename.c_str());

    bool threw = false;
    try {
        load_work_order("does_not_exist_workorder.txt");
    } catch (const WorkOrderError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_load_from_file: PASSED\n";
}

void test_crlf_line_endings() {
    const std::string filename = "test_work_order_crlf.txt";
    {
        std::string crlf;
        for (const char* c = SAMPLE_WORK_ORDER; *c; ++c) {
            if (*c == '\n') {
                crlf += '\r';
            }
            crlf += *c;
        }
        std::ofstream out(filename, std::ios::binary);
        out << crlf;
    }

    WorkOrder order = load_work_order(filename);
    std::remove(filename.c_str());
    assert(order.producer == "Joan Jett");
    assert(order.job == "Dirtfixing");
    assert(order.notes == "Please clean files noted per Colorist Tom Brady");
    assert(order.canonical_paths.size() == 3);
    assert(order.canonical_paths[1] == "/hpsans12/production/starwars/reel1/VFX/Hydraulx");

    std::cout << "test_crlf_line_endings: PASSED\n";
}

int main() {
    std::cout << "Running work order tests...\n\n";

    test_parse_sample();
    test_field_lookup();
    test_missing_sections();
    test_backslash_paths();
    test_load_from_file();
    test_crlf_line_endings();

    std::cout << "\nAll work order tests passed!\n";
    return 0;
}
