/*
 * File:        frame_range.cpp
 * Module:      fixlist-core
 * Purpose:     Frame ranges and range compression
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "frame_range.h"
#include <fmt/format.h>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace fixlist {

std::string FrameRange::to_string() const {
    if (is_single()) {
        return fmt::format("{}", start);
    }
    return fmt::format("{}-{}", start, end);
}

namespace {

FrameNumber parse_frame_number(const std::string& text, const std::string& whole) {
    if (text.empty()) {
        throw std::invalid_argument("Invalid frame range '" + whole + "'");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid frame range '" + whole + "'");
        }
    }
    try {
        return std::stoll(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Frame number out of range in '" + whole + "'");
    }
}

} // anonymous namespace

FrameRange parse_frame_range(const std::string& text) {
    size_t dash = text.find('-');
    if (dash == std::string::npos) {
        return FrameRange(parse_frame_number(text, text));
    }

    FrameRange range(parse_frame_number(text.substr(0, dash), text),
                     parse_frame_number(text.substr(dash + 1), text));
    if (!range.is_valid()) {
        throw std::invalid_argument("Frame range '" + text + "' ends before it starts");
    }
    return range;
}

std::vector<FrameRange> compress_frames(const std::vector<FrameNumber>& frames) {
    std::vector<FrameRange> ranges;
    if (frames.empty()) {
        return ranges;
    }

    FrameNumber start = frames[0];
    FrameNumber end = frames[0];

    for (size_t i = 1; i < frames.size(); ++i) {
        if (end < std::numeric_limits<FrameNumber>::max() && frames[i] == end + 1) {
            end = frames[i];
        } else {
            ranges.emplace_back(start, end);
            start = frames[i];
            end = frames[i];
        }
    }
    ranges.emplace_back(start, end);

    return ranges;
}

std::vector<FrameNumber> expand_ranges(const std::vector<FrameRange>& ranges) {
    std::vector<FrameNumber> frames;
    for (const auto& range : ranges) {
        if (range.start > range.end) {
            continue;
        }
        // Stop on end rather than stepping past it, end may be INT64_MAX
        for (FrameNumber f = range.start;; ++f) {
            frames.push_back(f);
            if (f == range.end) {
                break;
            }
        }
    }
    return frames;
}

bool is_reportable(const FrameRange& range, FrameNumber frame_count) {
    return range.is_valid() && !range.is_single() && range.end <= frame_count;
}

std::vector<std::string> ranges_to_strings(const std::vector<FrameRange>& ranges) {
    std::vector<std::string> result;
    result.reserve(ranges.size());
    for (const auto& range : ranges) {
        result.push_back(range.to_string());
    }
    return result;
}

} // namespace fixlist
