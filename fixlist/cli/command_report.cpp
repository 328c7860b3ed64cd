/*
 * File:        command_report.cpp
 * Module:      fixlist-cli
 * Purpose:     Frame review report command
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_report.h"
#include "csv_writer.h"
#include "fixlist_database.h"
#include "logging.h"
#include "rgb_image.h"
#include "timecode.h"
#include "video_frame_grabber.h"

#include <fmt/format.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace fixlist {
namespace cli {

int report_command(const ReportOptions& options) {
    FixlistDatabase db;
    if (!db.open(options.database_path)) {
        return 1;
    }

    std::vector<FrameRecord> frames = db.frames();
    if (frames.empty()) {
        FIXLIST_LOG_WARN("No frame records in {}", options.database_path);
    }

    VideoFrameGrabber grabber;
    if (!grabber.open(options.video_path)) {
        return 1;
    }
    const VideoInfo& video = grabber.info();
    FIXLIST_LOG_INFO("Video {}: {} frames at {} fps", options.video_path, video.frame_count, video.fps);

    std::error_code ec;
    fs::create_directories(options.thumbnail_dir, ec);
    if (ec) {
        FIXLIST_LOG_ERROR("Cannot create thumbnail directory {}: {}", options.thumbnail_dir, ec.message());
        return 1;
    }

    std::ofstream out(options.report_path);
    if (!out) {
        FIXLIST_LOG_ERROR("Cannot create report file: {}", options.report_path);
        return 1;
    }

    CsvWriter writer(out, options.csv_delimiter);
    if (!writer.write_row({"location", "frame_range", "time_range", "thumbnail"})) {
        FIXLIST_LOG_ERROR("Failed writing report file: {}", options.report_path);
        return 1;
    }

    size_t rows = 0;
    size_t failed_thumbnails = 0;

    for (const auto& record : frames) {
        FrameRange range;
        try {
            range = parse_frame_range(record.frame_range);
        } catch (const std::invalid_argument& e) {
            FIXLIST_LOG_WARN("Skipping stored range '{}': {}", record.frame_range, e.what());
            continue;
        }

        if (!is_reportable(range, video.frame_count)) {
            FIXLIST_LOG_TRACE("Skipping {} {}", record.location, record.frame_range);
            continue;
        }

        std::string time_range;
        try {
            time_range = frame_range_to_time_range(range, video.fps);
        } catch (const TimecodeRangeError& e) {
            FIXLIST_LOG_WARN("Skipping {} {}: {}", record.location, record.frame_range, e.what());
            continue;
        }

        const FrameNumber middle = range.middle();
        std::string thumbnail_path =
            (fs::path(options.thumbnail_dir) / fmt::format("frame_{:06d}.png", middle)).string();

        RgbImage image;
        bool thumbnail_ok = grabber.grab_thumbnail(middle,
                                                   static_cast<uint32_t>(options.thumbnail_width),
                                                   static_cast<uint32_t>(options.thumbnail_height),
                                                   image) &&
                            save_png(image, thumbnail_path);
        if (!thumbnail_ok) {
            FIXLIST_LOG_WARN("No thumbnail for {} {} (frame {})", record.location, record.frame_range, middle);
            thumbnail_path.clear();
            ++failed_thumbnails;
        }

        if (!writer.write_row({record.location, record.frame_range, time_range, thumbnail_path})) {
            FIXLIST_LOG_ERROR("Failed writing report file: {}", options.report_path);
            return 1;
        }
        ++rows;
    }

    FIXLIST_LOG_INFO("Wrote {} report rows to {}", rows, options.report_path);

    if (failed_thumbnails > 0) {
        FIXLIST_LOG_ERROR("{} thumbnails could not be produced", failed_thumbnails);
        return 1;
    }
    return 0;
}

} // namespace cli
} // namespace fixlist
