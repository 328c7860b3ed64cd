/*
 * File:        work_order.cpp
 * Module:      fixlist-core
 * Purpose:     Work order (Xytech) document reader
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "work_order.h"
#include "export_line_parser.h"
#include "logging.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fixlist {

namespace {

const char* LOCATION_MARKER = "\nLocation:\n";
const char* NOTES_MARKER = "\nNotes:\n";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Split content around a marker that must occur exactly once
void split_once(const std::string& content, const std::string& marker,
                std::string& before, std::string& after) {
    size_t pos = content.find(marker);
    std::string name = trim(marker);
    if (pos == std::string::npos) {
        throw WorkOrderError("Error: no " + name + " section found in the work order");
    }
    if (content.find(marker, pos + marker.size()) != std::string::npos) {
        throw WorkOrderError("Error: more than one " + name + " section in the work order");
    }
    before = content.substr(0, pos);
    after = content.substr(pos + marker.size());
}

} // anonymous namespace

std::string get_work_order_field(const std::string& label, const std::string& content) {
    const std::string key = label + ": ";

    size_t pos = content.find(key);
    while (pos != std::string::npos) {
        size_t value_start = pos + key.size();
        if (value_start < content.size() && content[value_start] != '\n') {
            size_t value_end = content.find('\n', value_start);
            if (value_end == std::string::npos) {
                value_end = content.size();
            }
            return trim(content.substr(value_start, value_end - value_start));
        }
        pos = content.find(key, pos + 1);
    }

    throw WorkOrderError("Error: no " + label + " found in the work order");
}

WorkOrder parse_work_order(const std::string& raw_content) {
    // CRLF documents are read the same as LF ones
    std::string content = raw_content;
    content.erase(std::remove(content.begin(), content.end(), '\r'), content.end());

    WorkOrder order;
    order.producer = get_work_order_field("Producer", content);
    order.operator_name = get_work_order_field("Operator", content);
    order.job = get_work_order_field("Job", content);

    std::string header;
    std::string location_and_notes;
    split_once(content, LOCATION_MARKER, header, location_and_notes);

    std::string location;
    std::string notes;
    split_once(location_and_notes, NOTES_MARKER, location, notes);

    order.notes = trim(notes);

    std::istringstream lines(trim(location));
    std::string line;
    while (std::getline(lines, line)) {
        std::string path = trim(line);
        if (path.empty()) {
            continue;
        }
        order.canonical_paths.push_back(normalize_separators(path));
    }

    return order;
}

WorkOrder load_work_order(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw WorkOrderError("Cannot open work order: " + filename);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    WorkOrder order = parse_work_order(buffer.str());

    FIXLIST_LOG_DEBUG("Work order '{}': producer='{}' operator='{}' job='{}'",
                      filename, order.producer, order.operator_name, order.job);
    FIXLIST_LOG_DEBUG("Work order notes: {}", order.notes);
    for (const auto& path : order.canonical_paths) {
        FIXLIST_LOG_DEBUG("  canonical path: {}", path);
    }
    FIXLIST_LOG_INFO("Loaded work order '{}' with {} canonical paths",
                     filename, order.canonical_paths.size());
    return order;
}

} // namespace fixlist
