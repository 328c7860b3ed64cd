/*
 * File:        test_timecode.cpp
 * Module:      fixlist-tests
 * Purpose:     Timecode conversion test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "timecode.h"
#include <cassert>
#include <iostream>

using namespace fixlist;

void test_timecode_examples() {
    assert(frame_to_timecode(35, 24) == "00:00:01:11");
    assert(frame_to_timecode(1569, 24) == "00:01:05:09");
    assert(frame_to_timecode(14000, 24) == "00:09:43:08");
    assert(frame_to_timecode(0, 24) == "00:00:00:00");

    std::cout << "test_timecode_examples: PASSED\n";
}

void test_timecode_fields() {
    // 1h 2m 3s 4f at 25 fps
    FrameNumber frame = ((1 * 60 + 2) * 60 + 3) * 25 + 4;
    Timecode tc = frame_to_timecode_fields(frame, 25);
    assert(tc.hours == 1);
    assert(tc.minutes == 2);
    assert(tc.seconds == 3);
    assert(tc.frames == 4);
    assert(tc.to_string() == "01:02:03:04");

    std::cout << "test_timecode_fields: PASSED\n";
}

void test_timecode_range_limits() {
    FrameNumber last = 24LL * 60 * 60 * 24 - 1;
    assert(frame_to_timecode(last, 24) == "23:59:59:23");

    bool threw = false;
    try {
        frame_to_timecode(last + 1, 24);
    } catch (const TimecodeRangeError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        frame_to_timecode(-1, 24);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        frame_to_timecode(10, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_timecode_range_limits: PASSED\n";
}

void test_time_range() {
    assert(frame_range_to_time_range(FrameRange(35), 24) == "00:00:01:11");
    assert(frame_range_to_time_range(FrameRange(35, 1569), 24) == "00:00:01:11 - 00:01:05:09");

    std::cout << "test_time_range: PASSED\n";
}

int main() {
    std::cout << "Running timecode tests...\n\n";

    test_timecode_examples();
    test_timecode_fields();
    test_timecode_range_limits();
    test_time_range();

    std::cout << "\nAll timecode tests passed!\n";
    return 0;
}
