/*
 * File:        record_sink.h
 * Module:      fixlist-core
 * Purpose:     Destination interface for reconciled records
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "frame_range.h"
#include <string>
#include <vector>

namespace fixlist {

/**
 * @brief One frame range of one export line, keyed by its canonical path
 */
struct ReconciledRecord {
    std::string canonical_path;
    FrameRange frame_range;
};

/**
 * @brief Receives reconciled records from the pipeline
 *
 * Sinks own whatever per-file context they need (user on file, file date);
 * the pipeline only hands over the record itself.
 */
class RecordSink {
public:
    virtual ~RecordSink() = default;

    /// Accept one record
    /// @return false if the record could not be stored
    virtual bool write(const ReconciledRecord& record) = 0;
};

/**
 * @brief Sink that keeps records in memory
 */
class CollectingSink : public RecordSink {
public:
    bool write(const ReconciledRecord& record) override {
        records_.push_back(record);
        return true;
    }

    const std::vector<ReconciledRecord>& records() const { return records_; }
    void clear() { records_.clear(); }

private:
    std::vector<ReconciledRecord> records_;
};

} // namespace fixlist
