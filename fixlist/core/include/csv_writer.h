/*
 * File:        csv_writer.h
 * Module:      fixlist-core
 * Purpose:     Delimited text output and the CSV record sink
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "record_sink.h"
#include <ostream>
#include <string>
#include <vector>

namespace fixlist {

/**
 * @brief Minimal-quoting delimited row writer
 *
 * A field is quoted only when it contains the delimiter, the quote
 * character or a line break; embedded quote characters are doubled. Rows
 * end with '\n'. An empty row is written as a bare newline.
 */
class CsvWriter {
public:
    explicit CsvWriter(std::ostream& out, char delimiter = ',', char quote = '"');

    /// Write one row
    /// @return false if the stream is in a failed state afterwards
    bool write_row(const std::vector<std::string>& fields);

    /// Quote a single field if needed
    std::string escape(const std::string& field) const;

    char delimiter() const { return delimiter_; }

private:
    std::ostream& out_;
    char delimiter_;
    char quote_;
};

/**
 * @brief Writes each record as a "location, frame_range" row
 */
class CsvRecordSink : public RecordSink {
public:
    explicit CsvRecordSink(CsvWriter& writer) : writer_(writer) {}

    bool write(const ReconciledRecord& record) override;

private:
    CsvWriter& writer_;
};

} // namespace fixlist
