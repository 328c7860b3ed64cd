/*
 * File:        test_csv_writer.cpp
 * Module:      fixlist-tests
 * Purpose:     Delimited output test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "csv_writer.h"
#include <cassert>
#include <iostream>
#include <sstream>

using namespace fixlist;

void test_minimal_quoting() {
    std::ostringstream out;
    CsvWriter writer(out, '/');

    // Paths contain the delimiter and are quoted
    assert(writer.write_row({"/hpsans13/production/starwars/reel1/partA/1920x1080", "32-34"}));
    assert(out.str() == "\"/hpsans13/production/starwars/reel1/partA/1920x1080\"/32-34\n");

    assert(writer.escape("plain") == "plain");
    assert(writer.escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    assert(writer.escape("two\nlines") == "\"two\nlines\"");

    std::cout << "test_minimal_quoting: PASSED\n";
}

void test_header_block() {
    std::ostringstream out;
    CsvWriter writer(out, '/');

    writer.write_row({"Joan Jett", "John Doe", "Dirtfixing", "Please clean files noted per Colorist Tom Brady"});
    writer.write_row({});
    writer.write_row({});
    assert(out.str() == "Joan Jett/John Doe/Dirtfixing/Please clean files noted per Colorist Tom Brady\n\n\n");

    std::cout << "test_header_block: PASSED\n";
}

void test_empty_fields() {
    std::ostringstream out;
    CsvWriter writer(out);

    writer.write_row({""});
    writer.write_row({"a", "", "c"});
    assert(out.str() == "\"\"\na,,c\n");
    assert(writer.delimiter() == ',');

    std::cout << "test_empty_fields: PASSED\n";
}

void test_record_sink() {
    std::ostringstream out;
    CsvWriter writer(out, ',');
    CsvRecordSink sink(writer);

    ReconciledRecord record;
    record.canonical_path = "/hpsans12/production/starwars/reel1/VFX/Hydraulx";
    record.frame_range = FrameRange(1260);
    assert(sink.write(record));

    record.frame_range = FrameRange(1270, 1272);
    assert(sink.write(record));

    assert(out.str() ==
           "/hpsans12/production/starwars/reel1/VFX/Hydraulx,1260\n"
           "/hpsans12/production/starwars/reel1/VFX/Hydraulx,1270-1272\n");

    std::cout << "test_record_sink: PASSED\n";
}

int main() {
    std::cout << "Running CSV writer tests...\n\n";

    test_minimal_quoting();
    test_header_block();
    test_empty_fields();
    test_record_sink();

    std::cout << "\nAll CSV writer tests passed!\n";
    return 0;
}
