/*
 * File:        frame_tokens.h
 * Module:      fixlist-core
 * Purpose:     Classification of raw frame tokens from review exports
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "frame_range.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fixlist {

/**
 * @brief Non-numeric markers that review tools interleave with frame numbers
 */
enum class FrameSentinel {
    Error,       // "<err>"
    Null,        // "<null>"
    Empty,       // "" (from repeated or trailing spaces)
    OutOfRange   // all digits, but too large for a FrameNumber
};

/// A raw token is either a frame number or a sentinel
using FrameToken = std::variant<FrameNumber, FrameSentinel>;

/// True for tokens made only of ASCII decimal digits (empty is false)
bool is_decimal_digits(const std::string& token);

/// True for tokens that may trail a path in an export line:
/// digit strings, "<err>", "<null>" and the empty string
bool is_frame_like_token(const std::string& token);

/**
 * @brief Classify a raw token
 * @return The token, or std::nullopt when it is not frame-like
 */
std::optional<FrameToken> classify_frame_token(const std::string& token);

/**
 * @brief Reduce raw tokens to frame numbers
 *
 * Keeps tokens whose characters are all decimal digits, in input order.
 * Sentinels and anything else are dropped. No sorting or
 * deduplication takes place; producers already emit ascending, distinct
 * frame numbers.
 */
std::vector<FrameNumber> normalize_frame_tokens(const std::vector<std::string>& raw_tokens);

} // namespace fixlist
