/*
 * File:        reconciliation_pipeline.cpp
 * Module:      fixlist-core
 * Purpose:     Export text to reconciled records
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "reconciliation_pipeline.h"
#include "frame_tokens.h"
#include "logging.h"
#include <sstream>
#include <stdexcept>

namespace fixlist {

std::string malformed_line_policy_to_string(MalformedLinePolicy policy) {
    switch (policy) {
        case MalformedLinePolicy::SKIP: return "skip";
        case MalformedLinePolicy::ABORT: return "abort";
        default: return "unknown";
    }
}

MalformedLinePolicy malformed_line_policy_from_string(const std::string& name) {
    if (name == "skip") return MalformedLinePolicy::SKIP;
    if (name == "abort") return MalformedLinePolicy::ABORT;
    throw std::invalid_argument("Unknown malformed line policy '" + name + "' (expected skip or abort)");
}

PipelineStats& PipelineStats::operator+=(const PipelineStats& other) {
    lines_read += other.lines_read;
    blank_lines += other.blank_lines;
    malformed_lines += other.malformed_lines;
    unmatched_lines += other.unmatched_lines;
    matched_lines += other.matched_lines;
    records_emitted += other.records_emitted;
    records_rejected += other.records_rejected;
    return *this;
}

ReconciliationPipeline::ReconciliationPipeline(const WorkOrder& work_order,
                                               ExportGrammar grammar,
                                               MalformedLinePolicy policy)
    : work_order_(work_order)
    , reconciler_(work_order.canonical_paths)
    , grammar_(grammar)
    , policy_(policy)
{
}

size_t ReconciliationPipeline::process_line(const std::string& line, RecordSink& sink) {
    PipelineStats line_stats;
    size_t emitted = process_line(line, sink, line_stats);
    stats_ += line_stats;
    return emitted;
}

size_t ReconciliationPipeline::process_line(const std::string& line, RecordSink& sink,
                                            PipelineStats& stats) {
    ++stats.lines_read;
    if (line.empty()) {
        ++stats.blank_lines;
        return 0;
    }

    ParsedLine parsed;
    try {
        parsed = parse_export_line(line, grammar_);
    } catch (const ExportLineError& e) {
        ++stats.malformed_lines;
        if (policy_ == MalformedLinePolicy::ABORT) {
            throw;
        }
        FIXLIST_LOG_WARN("Skipping malformed line: {}", e.what());
        return 0;
    }

    FIXLIST_LOG_DEBUG("-----");
    FIXLIST_LOG_DEBUG("path = '{}'", parsed.reviewed_path);
    FIXLIST_LOG_DEBUG("raw frame tokens = {}", parsed.raw_frame_tokens.size());

    std::vector<FrameRange> ranges = compress_frames(normalize_frame_tokens(parsed.raw_frame_tokens));

    auto match = reconciler_.reconcile(parsed.reviewed_path);
    if (!match) {
        ++stats.unmatched_lines;
        return 0;
    }

    ++stats.matched_lines;
    FIXLIST_LOG_DEBUG("common path = '{}'", match->common_suffix);

    size_t emitted = 0;
    for (const auto& range : ranges) {
        ReconciledRecord record;
        record.canonical_path = match->canonical_path;
        record.frame_range = range;

        if (sink.write(record)) {
            ++emitted;
        } else {
            ++stats.records_rejected;
            FIXLIST_LOG_WARN("Sink rejected record {} {}", record.canonical_path, range.to_string());
        }
    }
    stats.records_emitted += emitted;
    return emitted;
}

PipelineStats ReconciliationPipeline::process_text(const std::string& content, RecordSink& sink) {
    PipelineStats run_stats;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        process_line(line, sink, run_stats);
    }

    stats_ += run_stats;

    FIXLIST_LOG_DEBUG("Processed {} lines: {} matched, {} unmatched, {} malformed, {} records",
                      run_stats.lines_read, run_stats.matched_lines, run_stats.unmatched_lines,
                      run_stats.malformed_lines, run_stats.records_emitted);
    return run_stats;
}

} // namespace fixlist
