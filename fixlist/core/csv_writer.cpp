/*
 * File:        csv_writer.cpp
 * Module:      fixlist-core
 * Purpose:     Delimited text output and the CSV record sink
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "csv_writer.h"

namespace fixlist {

CsvWriter::CsvWriter(std::ostream& out, char delimiter, char quote)
    : out_(out)
    , delimiter_(delimiter)
    , quote_(quote)
{
}

std::string CsvWriter::escape(const std::string& field) const {
    bool needs_quotes = field.find(delimiter_) != std::string::npos ||
                        field.find(quote_) != std::string::npos ||
                        field.find_first_of("\r\n") != std::string::npos;
    if (!needs_quotes) {
        return field;
    }

    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted += quote_;
    for (char c : field) {
        if (c == quote_) {
            quoted += quote_;
        }
        quoted += c;
    }
    quoted += quote_;
    return quoted;
}

bool CsvWriter::write_row(const std::vector<std::string>& fields) {
    // A lone empty field must stay distinguishable from an empty row
    if (fields.size() == 1 && fields[0].empty()) {
        out_ << quote_ << quote_ << '\n';
        return static_cast<bool>(out_);
    }

    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out_ << delimiter_;
        }
        out_ << escape(fields[i]);
    }
    out_ << '\n';
    return static_cast<bool>(out_);
}

bool CsvRecordSink::write(const ReconciledRecord& record) {
    return writer_.write_row({record.canonical_path, record.frame_range.to_string()});
}

} // namespace fixlist
