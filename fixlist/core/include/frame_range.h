/*
 * File:        frame_range.h
 * Module:      fixlist-core
 * Purpose:     Frame ranges and range compression
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fixlist {

using FrameNumber = int64_t;

/**
 * @brief Inclusive range of frame numbers [start, end]
 *
 * A singleton range has start == end and renders without a dash ("38"),
 * a run renders as "start-end" ("1-3").
 */
struct FrameRange {
    FrameNumber start = 0;
    FrameNumber end = 0;   // inclusive

    constexpr FrameRange() noexcept = default;
    constexpr explicit FrameRange(FrameNumber frame) noexcept : start(frame), end(frame) {}
    constexpr FrameRange(FrameNumber s, FrameNumber e) noexcept : start(s), end(e) {}

    constexpr bool is_single() const noexcept { return start == end; }
    constexpr bool is_valid() const noexcept { return start >= 0 && start <= end; }
    constexpr FrameNumber size() const noexcept { return end - start + 1; }

    /// Frame used for the review still: start + (end - start) / 2
    constexpr FrameNumber middle() const noexcept { return start + (end - start) / 2; }

    constexpr bool operator==(const FrameRange& other) const noexcept {
        return start == other.start && end == other.end;
    }
    constexpr bool operator!=(const FrameRange& other) const noexcept {
        return !(*this == other);
    }

    /// "N" or "N-M"
    std::string to_string() const;
};

/**
 * @brief Parse a rendered range ("N" or "N-M") back into a FrameRange
 * @throws std::invalid_argument if the text is not a valid range
 */
FrameRange parse_frame_range(const std::string& text);

/**
 * @brief Compress an ascending frame list into maximal contiguous runs
 *
 * Single pass: a running window is extended while the next frame equals
 * end + 1, otherwise it is closed and a new window opened. Ranges are
 * returned in input order. Empty input gives an empty result.
 */
std::vector<FrameRange> compress_frames(const std::vector<FrameNumber>& frames);

/// Expand ranges back into individual frame numbers, in order
std::vector<FrameNumber> expand_ranges(const std::vector<FrameRange>& ranges);

/**
 * @brief True when a stored range gets a row in the frame review report
 *
 * Only multi-frame ranges are reviewed, and only while end <= frame_count
 * of the reference video.
 */
bool is_reportable(const FrameRange& range, FrameNumber frame_count);

/// Render every range with FrameRange::to_string()
std::vector<std::string> ranges_to_strings(const std::vector<FrameRange>& ranges);

} // namespace fixlist
