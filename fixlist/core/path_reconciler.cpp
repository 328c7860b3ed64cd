/*
 * File:        path_reconciler.cpp
 * Module:      fixlist-core
 * Purpose:     Suffix-anchored matching of reviewed paths to work-order paths
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "path_reconciler.h"
#include "logging.h"
#include <algorithm>
#include <cctype>

namespace fixlist {

namespace {

std::vector<std::string> path_segments(const std::string& path) {
    std::vector<std::string> segments;
    size_t begin = 0;
    while (begin <= path.size()) {
        size_t slash = path.find('/', begin);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        std::string segment = path.substr(begin, slash - begin);
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        begin = slash + 1;
    }
    return segments;
}

// "/:C" at the end of a reversed path is a "C:/" drive prefix
bool ends_with_drive_letter(const std::string& reversed) {
    if (reversed.size() < 3) {
        return false;
    }
    size_t n = reversed.size();
    unsigned char letter = static_cast<unsigned char>(reversed[n - 1]);
    return reversed[n - 3] == '/' && reversed[n - 2] == ':' &&
           (std::isalnum(letter) || letter == '_');
}

} // anonymous namespace

std::string reversed_common_path(const std::string& a, const std::string& b) {
    std::string reversed_a(a.rbegin(), a.rend());
    std::string reversed_b(b.rbegin(), b.rend());

    std::vector<std::string> segments_a = path_segments(reversed_a);
    std::vector<std::string> segments_b = path_segments(reversed_b);

    size_t common = 0;
    size_t limit = std::min(segments_a.size(), segments_b.size());
    while (common < limit && segments_a[common] == segments_b[common]) {
        ++common;
    }
    if (common == 0) {
        return "";
    }

    // A reversed path is absolute when the input path ended with '/'
    bool both_absolute = !reversed_a.empty() && reversed_a.front() == '/' &&
                         !reversed_b.empty() && reversed_b.front() == '/';

    std::string reversed_common = both_absolute ? "/" : "";
    for (size_t i = 0; i < common; ++i) {
        if (i > 0) reversed_common += '/';
        reversed_common += segments_a[i];
    }

    std::string forward(reversed_common.rbegin(), reversed_common.rend());
    if (ends_with_drive_letter(reversed_common)) {
        return forward;
    }
    return "/" + forward;
}

PathReconciler::PathReconciler(const std::vector<std::string>& canonical_paths,
                               size_t min_shared_separators)
    : canonical_paths_(canonical_paths)
    , min_shared_separators_(min_shared_separators)
{
}

bool PathReconciler::accepts(const std::string& common_suffix) const {
    auto separators = static_cast<size_t>(std::count(common_suffix.begin(), common_suffix.end(), '/'));
    return separators >= min_shared_separators_;
}

std::optional<PathMatch> PathReconciler::reconcile(const std::string& reviewed_path) const {
    if (reviewed_path.empty()) {
        return std::nullopt;
    }

    // First match wins; later candidates are never examined
    for (size_t i = 0; i < canonical_paths_.size(); ++i) {
        const auto& canonical = canonical_paths_[i];
        std::string common = reversed_common_path(canonical, reviewed_path);
        if (accepts(common)) {
            FIXLIST_LOG_DEBUG("Matched '{}' to '{}' via '{}'", reviewed_path, canonical, common);
            PathMatch match;
            match.canonical_path = canonical;
            match.common_suffix = common;
            match.canonical_index = i;
            return match;
        }
    }

    FIXLIST_LOG_DEBUG("No work-order path matches '{}'", reviewed_path);
    return std::nullopt;
}

} // namespace fixlist
