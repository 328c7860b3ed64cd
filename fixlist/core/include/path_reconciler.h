/*
 * File:        path_reconciler.h
 * Module:      fixlist-core
 * Purpose:     Suffix-anchored matching of reviewed paths to work-order paths
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fixlist {

/**
 * @brief Longest common sub-path of two paths, anchored at their ends
 *
 * Both strings are reversed character by character and their longest common
 * path prefix is taken segment by segment (whole segments only, empty and
 * "." segments ignored). The result is reversed back and given a leading
 * '/', except when it is empty or begins with a drive letter ("C:/...").
 *
 * Examples:
 *   "/images1/starwars/reel1/partA/1920x1080",
 *   "/hpsans13/production/starwars/reel1/partA/1920x1080"
 *       -> "/starwars/reel1/partA/1920x1080"
 *   "/images1/starwars/reel1/partA/1920x1080",
 *   "/images1/starwars/reel1/partB/1920x1080"
 *       -> "/1920x1080"
 *
 * Both paths must already use forward slashes.
 */
std::string reversed_common_path(const std::string& a, const std::string& b);

/**
 * @brief Result of a successful reconciliation
 */
struct PathMatch {
    std::string canonical_path;   // Work-order path that matched
    std::string common_suffix;    // Shared trailing sub-path
    size_t canonical_index = 0;   // Position in the work-order list
};

/**
 * @brief Finds the canonical path a reviewed path refers to
 *
 * Both paths are assumed to name the same file under different mount
 * points. Candidates are tried in work-order order and the first whose
 * common suffix holds more than one separator (at least two shared trailing
 * segments) is taken. A single shared segment, such as a resolution
 * directory, is treated as coincidence.
 *
 * The reconciler keeps a reference to the path list; it must outlive it.
 */
class PathReconciler {
public:
    /// Separators a common suffix needs to be accepted
    static constexpr size_t MIN_SHARED_SEPARATORS = 2;

    explicit PathReconciler(const std::vector<std::string>& canonical_paths,
                            size_t min_shared_separators = MIN_SHARED_SEPARATORS);

    /// First accepted canonical path, or std::nullopt when none qualifies
    std::optional<PathMatch> reconcile(const std::string& reviewed_path) const;

    /// True if a common suffix holds enough separators
    bool accepts(const std::string& common_suffix) const;

    const std::vector<std::string>& canonical_paths() const { return canonical_paths_; }

private:
    const std::vector<std::string>& canonical_paths_;
    size_t min_shared_separators_;
};

} // namespace fixlist
