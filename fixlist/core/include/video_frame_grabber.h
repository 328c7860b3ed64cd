/*
 * File:        video_frame_grabber.h
 * Module:      fixlist-core
 * Purpose:     Video probing and single-frame extraction (FFmpeg libraries)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "frame_range.h"
#include "rgb_image.h"
#include <memory>
#include <string>

namespace fixlist {

/**
 * @brief Frame count and integer frame rate of a video's first video stream
 */
struct VideoInfo {
    FrameNumber frame_count = 0;
    int fps = 0;
};

/**
 * @brief Decodes individual frames of a video file as RGB thumbnails
 *
 * Frame indices count decoded frames from the start of the first video
 * stream; requesting index N returns the first decoded frame whose index is
 * at least N. Requests in ascending order reuse the decoder position,
 * earlier indices rewind to the start.
 *
 * Requires a build with FFmpeg (HAVE_FFMPEG); otherwise open() fails.
 */
class VideoFrameGrabber {
public:
    VideoFrameGrabber();
    ~VideoFrameGrabber();

    VideoFrameGrabber(const VideoFrameGrabber&) = delete;
    VideoFrameGrabber& operator=(const VideoFrameGrabber&) = delete;

    /// Open a video and count its frames
    bool open(const std::string& path);
    void close();
    bool is_open() const;

    /// Valid after a successful open()
    const VideoInfo& info() const { return info_; }

    /**
     * @brief Decode a frame and scale it to fit max_width x max_height
     * @return false (with the reason logged) if the frame cannot be produced
     */
    bool grab_thumbnail(FrameNumber index, uint32_t max_width, uint32_t max_height, RgbImage& out);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    VideoInfo info_;
};

} // namespace fixlist
