/*
 * File:        frame_tokens.cpp
 * Module:      fixlist-core
 * Purpose:     Classification of raw frame tokens from review exports
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "frame_tokens.h"
#include "logging.h"
#include <cctype>
#include <stdexcept>

namespace fixlist {

bool is_decimal_digits(const std::string& token) {
    if (token.empty()) {
        return false;
    }
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool is_frame_like_token(const std::string& token) {
    return token.empty() || token == "<err>" || token == "<null>" || is_decimal_digits(token);
}

std::optional<FrameToken> classify_frame_token(const std::string& token) {
    if (token.empty()) return FrameToken(FrameSentinel::Empty);
    if (token == "<err>") return FrameToken(FrameSentinel::Error);
    if (token == "<null>") return FrameToken(FrameSentinel::Null);

    if (!is_decimal_digits(token)) {
        return std::nullopt;
    }

    try {
        return FrameToken(static_cast<FrameNumber>(std::stoll(token)));
    } catch (const std::out_of_range&) {
        return FrameToken(FrameSentinel::OutOfRange);
    }
}

std::vector<FrameNumber> normalize_frame_tokens(const std::vector<std::string>& raw_tokens) {
    std::vector<FrameNumber> frames;
    frames.reserve(raw_tokens.size());

    for (const auto& raw : raw_tokens) {
        auto token = classify_frame_token(raw);
        if (!token) {
            continue;
        }
        if (const auto* frame = std::get_if<FrameNumber>(&*token)) {
            frames.push_back(*frame);
        } else if (std::get<FrameSentinel>(*token) == FrameSentinel::OutOfRange) {
            FIXLIST_LOG_WARN("Dropping frame token '{}': value out of range", raw);
        }
    }

    return frames;
}

} // namespace fixlist
