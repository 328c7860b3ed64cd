/*
 * File:        work_order.h
 * Module:      fixlist-core
 * Purpose:     Work order (Xytech) document reader
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace fixlist {

/**
 * @brief Thrown when a work order lacks a required field or section
 */
class WorkOrderError : public std::runtime_error {
public:
    explicit WorkOrderError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Job metadata and canonical storage paths of a work order
 *
 * A work order document looks like:
 *
 *     Xytech Workorder 1107
 *
 *     Producer: Joan Jett
 *     Operator: John Doe
 *     Job: Dirtfixing
 *
 *     Location:
 *     /hpsans13/production/starwars/reel1/partA/1920x1080
 *     /hpsans12/production/starwars/reel1/VFX/Hydraulx
 *
 *     Notes:
 *     Please clean files noted per Colorist Tom Brady
 *
 * canonical_paths keeps document order, which decides reconciliation ties.
 */
struct WorkOrder {
    std::string producer;
    std::string operator_name;
    std::string job;
    std::string notes;
    std::vector<std::string> canonical_paths;
};

/**
 * @brief Value of the first "<label>: value" line in a document
 * @throws WorkOrderError if no such line exists
 */
std::string get_work_order_field(const std::string& label, const std::string& content);

/**
 * @brief Parse work order text
 *
 * Canonical paths are the non-blank lines between the "Location:" and
 * "Notes:" marker lines, with backslashes normalized to '/'. Carriage
 * returns are dropped, so CRLF documents parse like LF ones.
 *
 * @throws WorkOrderError if Producer, Operator or Job is missing, or the
 *         Location/Notes markers are missing or repeated
 */
WorkOrder parse_work_order(const std::string& content);

/**
 * @brief Read and parse a work order file
 * @throws WorkOrderError if the file cannot be read or is malformed
 */
WorkOrder load_work_order(const std::string& filename);

} // namespace fixlist
