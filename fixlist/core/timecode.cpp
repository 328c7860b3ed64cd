/*
 * File:        timecode.cpp
 * Module:      fixlist-core
 * Purpose:     Frame number to hh:mm:ss:ff timecode conversion
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "timecode.h"
#include <fmt/format.h>

namespace fixlist {

std::string Timecode::to_string() const {
    return fmt::format("{:02d}:{:02d}:{:02d}:{:02d}", hours, minutes, seconds, frames);
}

Timecode frame_to_timecode_fields(FrameNumber frame, int fps) {
    if (fps <= 0) {
        throw std::invalid_argument(fmt::format("Invalid frame rate: {}", fps));
    }
    if (frame < 0) {
        throw TimecodeRangeError(fmt::format("Negative frame number: {}", frame));
    }

    FrameNumber second = frame / fps;
    FrameNumber frame_in_second = frame % fps;
    FrameNumber minute = second / 60;
    second %= 60;
    FrameNumber hour = minute / 60;
    minute %= 60;

    if (hour >= 24) {
        throw TimecodeRangeError(fmt::format("Frame {} at {} fps is beyond 24 hours", frame, fps));
    }

    Timecode tc;
    tc.hours = static_cast<int>(hour);
    tc.minutes = static_cast<int>(minute);
    tc.seconds = static_cast<int>(second);
    tc.frames = static_cast<int>(frame_in_second);
    return tc;
}

std::string frame_to_timecode(FrameNumber frame, int fps) {
    return frame_to_timecode_fields(frame, fps).to_string();
}

std::string frame_range_to_time_range(const FrameRange& range, int fps) {
    if (range.is_single()) {
        return frame_to_timecode(range.start, fps);
    }
    return frame_to_timecode(range.start, fps) + " - " + frame_to_timecode(range.end, fps);
}

} // namespace fixlist
