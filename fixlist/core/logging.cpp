/*
 * File:        logging.cpp
 * Module:      fixlist-core
 * Purpose:     Logging system implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cctype>
#include <mutex>

namespace fixlist {

static std::shared_ptr<spdlog::logger> g_logger;
static std::mutex g_logger_mutex;

namespace {

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& pattern) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("fixlist", sink);
    logger->set_pattern(pattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

bool parse_level(const std::string& level, spdlog::level::level_enum& out) {
    std::string l = level;
    for (auto& c : l) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));

    if (l == "trace") out = spdlog::level::trace;
    else if (l == "debug") out = spdlog::level::debug;
    else if (l == "info") out = spdlog::level::info;
    else if (l == "warn" || l == "warning") out = spdlog::level::warn;
    else if (l == "error") out = spdlog::level::err;
    else if (l == "critical") out = spdlog::level::critical;
    else if (l == "off") out = spdlog::level::off;
    else return false;
    return true;
}

} // anonymous namespace

void init_logging(const std::string& level, const std::string& pattern, const std::string& log_file) {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);

        // Replace any existing logger so repeated calls pick up new settings
        g_logger = make_console_logger(pattern);

        if (!log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_pattern(pattern);
                g_logger->sinks().push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                // Keep console logging only
                g_logger->warn("Cannot open log file '{}': {}", log_file, e.what());
            }
        }
    }

    set_log_level(level);
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        // Auto-initialize if not done yet
        g_logger = make_console_logger("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    return g_logger;
}

void set_log_level(const std::string& level) {
    auto logger = get_logger();

    spdlog::level::level_enum parsed = spdlog::level::info;
    if (!parse_level(level, parsed)) {
        logger->warn("Unknown log level '{}', using 'info'", level);
    }
    logger->set_level(parsed);
}

} // namespace fixlist
