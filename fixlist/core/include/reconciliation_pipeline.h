/*
 * File:        reconciliation_pipeline.h
 * Module:      fixlist-core
 * Purpose:     Export text to reconciled records
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "export_line_parser.h"
#include "path_reconciler.h"
#include "record_sink.h"
#include "work_order.h"
#include <cstddef>
#include <string>

namespace fixlist {

/**
 * @brief What to do with a line that does not fit its grammar
 */
enum class MalformedLinePolicy {
    SKIP,   // Log a warning and continue with the next line
    ABORT   // Rethrow the ExportLineError
};

std::string malformed_line_policy_to_string(MalformedLinePolicy policy);

/// Parse "skip" / "abort"
/// @throws std::invalid_argument for any other value
MalformedLinePolicy malformed_line_policy_from_string(const std::string& name);

/**
 * @brief Per-run counters
 */
struct PipelineStats {
    size_t lines_read = 0;
    size_t blank_lines = 0;
    size_t malformed_lines = 0;
    size_t unmatched_lines = 0;
    size_t matched_lines = 0;
    size_t records_emitted = 0;
    size_t records_rejected = 0;   // Sink returned false

    PipelineStats& operator+=(const PipelineStats& other);
};

/**
 * @brief Turns export lines into reconciled records
 *
 * For every non-empty line: parse with the configured grammar, reduce the
 * frame tokens to frame numbers, compress them into ranges and reconcile
 * the reviewed path against the work order. A matched line emits one
 * record per range, all with the same canonical path. An unmatched line
 * emits nothing and is not an error.
 *
 * The pipeline only reads the work order, so separate pipelines (each with
 * its own sink) may run on separate threads.
 */
class ReconciliationPipeline {
public:
    ReconciliationPipeline(const WorkOrder& work_order,
                           ExportGrammar grammar,
                           MalformedLinePolicy policy = MalformedLinePolicy::SKIP);

    /**
     * @brief Process one line
     * @return Number of records emitted for the line
     * @throws ExportLineError for malformed lines under MalformedLinePolicy::ABORT
     */
    size_t process_line(const std::string& line, RecordSink& sink);

    /**
     * @brief Process every '\n'-separated line of an export file's content
     * @return Counters for this call only
     */
    PipelineStats process_text(const std::string& content, RecordSink& sink);

    /// Counters accumulated over the pipeline's lifetime
    const PipelineStats& stats() const { return stats_; }

    ExportGrammar grammar() const { return grammar_; }
    const WorkOrder& work_order() const { return work_order_; }

private:
    size_t process_line(const std::string& line, RecordSink& sink, PipelineStats& stats);

    const WorkOrder& work_order_;
    PathReconciler reconciler_;
    ExportGrammar grammar_;
    MalformedLinePolicy policy_;
    PipelineStats stats_;
};

} // namespace fixlist
