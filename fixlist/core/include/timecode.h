/*
 * File:        timecode.h
 * Module:      fixlist-core
 * Purpose:     Frame number to hh:mm:ss:ff timecode conversion
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "frame_range.h"
#include <stdexcept>
#include <string>

namespace fixlist {

/**
 * @brief Thrown when a frame cannot be expressed as a timecode
 *
 * Raised for negative frames and for frames at or beyond 24 hours; the
 * hh:mm:ss:ff format has no day rollover.
 */
class TimecodeRangeError : public std::out_of_range {
public:
    explicit TimecodeRangeError(const std::string& msg) : std::out_of_range(msg) {}
};

/**
 * @brief Non-drop-frame timecode fields
 */
struct Timecode {
    int hours = 0;
    int minutes = 0;
    int seconds = 0;
    int frames = 0;

    /// "hh:mm:ss:ff", each field zero-padded to two digits
    std::string to_string() const;
};

/**
 * @brief Split a frame number into timecode fields at an integer frame rate
 * @throws TimecodeRangeError for negative frames or hours >= 24
 * @throws std::invalid_argument if fps is not positive
 */
Timecode frame_to_timecode_fields(FrameNumber frame, int fps);

/// frame_to_timecode_fields(frame, fps).to_string()
std::string frame_to_timecode(FrameNumber frame, int fps);

/**
 * @brief Convert a range to "<start> - <end>"
 *
 * A singleton range converts to a single timecode.
 */
std::string frame_range_to_time_range(const FrameRange& range, int fps);

} // namespace fixlist
