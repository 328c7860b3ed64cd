/*
 * File:        video_frame_grabber.cpp
 * Module:      fixlist-core
 * Purpose:     Video probing and single-frame extraction (FFmpeg libraries)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "video_frame_grabber.h"
#include "logging.h"
#include <cmath>

#ifdef HAVE_FFMPEG
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}
#endif

namespace fixlist {

#ifdef HAVE_FFMPEG

namespace {

std::string av_error_string(int errnum) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    return errbuf;
}

} // anonymous namespace

class VideoFrameGrabber::Impl {
public:
    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    int stream_index = -1;

    // Index of the next frame the decoder will output
    FrameNumber next_index = 0;
    bool flushing = false;

    ~Impl() {
        cleanup();
    }

    void cleanup() {
        if (frame) {
            av_frame_free(&frame);
        }
        if (packet) {
            av_packet_free(&packet);
        }
        if (codec_ctx) {
            avcodec_free_context(&codec_ctx);
        }
        if (format_ctx) {
            avformat_close_input(&format_ctx);
        }
        stream_index = -1;
        next_index = 0;
        flushing = false;
    }

    bool open(const std::string& path, VideoInfo& info) {
        int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
        if (ret < 0) {
            FIXLIST_LOG_ERROR("Cannot open video '{}': {}", path, av_error_string(ret));
            return false;
        }

        ret = avformat_find_stream_info(format_ctx, nullptr);
        if (ret < 0) {
            FIXLIST_LOG_ERROR("Cannot read stream info of '{}': {}", path, av_error_string(ret));
            return false;
        }

        stream_index = av_find_best_stream(format_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        if (stream_index < 0) {
            FIXLIST_LOG_ERROR("No video stream in '{}'", path);
            return false;
        }

        AVStream* stream = format_ctx->streams[stream_index];
        const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
        if (!codec) {
            FIXLIST_LOG_ERROR("No decoder for the video stream of '{}'", path);
            return false;
        }

        codec_ctx = avcodec_alloc_context3(codec);
        packet = av_packet_alloc();
        frame = av_frame_alloc();
        if (!codec_ctx || !packet || !frame) {
            FIXLIST_LOG_ERROR("Out of memory opening '{}'", path);
            return false;
        }

        ret = avcodec_parameters_to_context(codec_ctx, stream->codecpar);
        if (ret < 0) {
            FIXLIST_LOG_ERROR("Cannot configure decoder: {}", av_error_string(ret));
            return false;
        }

        ret = avcodec_open2(codec_ctx, codec, nullptr);
        if (ret < 0) {
            FIXLIST_LOG_ERROR("Cannot open decoder: {}", av_error_string(ret));
            return false;
        }

        AVRational rate = stream->avg_frame_rate.num > 0 ? stream->avg_frame_rate : stream->r_frame_rate;
        if (rate.num <= 0 || rate.den <= 0) {
            FIXLIST_LOG_ERROR("Cannot determine the frame rate of '{}'", path);
            return false;
        }
        double fps = av_q2d(rate);
        info.fps = static_cast<int>(std::lround(fps));
        if (std::fabs(fps - info.fps) > 0.01) {
            FIXLIST_LOG_WARN("Video frame rate {:.3f} rounded to {} fps for timecodes", fps, info.fps);
        }

        // Count frames the way a stream copy would: one per video packet
        FrameNumber count = 0;
        while ((ret = av_read_frame(format_ctx, packet)) >= 0) {
            if (packet->stream_index == stream_index) {
                ++count;
            }
            av_packet_unref(packet);
        }
        if (ret != AVERROR_EOF) {
            FIXLIST_LOG_ERROR("Error reading '{}': {}", path, av_error_string(ret));
            return false;
        }
        info.frame_count = count;

        return rewind();
    }

    bool rewind() {
        int ret = av_seek_frame(format_ctx, stream_index, 0, AVSEEK_FLAG_BACKWARD);
        if (ret < 0) {
            FIXLIST_LOG_ERROR("Cannot seek to the start of the video: {}", av_error_string(ret));
            return false;
        }
        avcodec_flush_buffers(codec_ctx);
        next_index = 0;
        flushing = false;
        return true;
    }

    // Decode the next frame into `frame`; false at end of stream or on error
    bool decode_next() {
        while (true) {
            int ret = avcodec_receive_frame(codec_ctx, frame);
            if (ret == 0) {
                return true;
            }
            if (ret == AVERROR_EOF) {
                return false;
            }
            if (ret != AVERROR(EAGAIN)) {
                FIXLIST_LOG_ERROR("Decode error: {}", av_error_string(ret));
                return false;
            }
            if (flushing) {
                return false;
            }

            // Feed the next video packet
            while (true) {
                ret = av_read_frame(format_ctx, packet);
                if (ret < 0) {
                    // End of input: drain the decoder
                    flushing = true;
                    ret = avcodec_send_packet(codec_ctx, nullptr);
                    if (ret < 0 && ret != AVERROR_EOF) {
                        FIXLIST_LOG_ERROR("Cannot flush decoder: {}", av_error_string(ret));
                        return false;
                    }
                    break;
                }
                if (packet->stream_index == stream_index) {
                    ret = avcodec_send_packet(codec_ctx, packet);
                    av_packet_unref(packet);
                    if (ret < 0 && ret != AVERROR(EAGAIN)) {
                        FIXLIST_LOG_ERROR("Cannot send packet to decoder: {}", av_error_string(ret));
                        return false;
                    }
                    break;
                }
                av_packet_unref(packet);
            }
        }
    }

    bool seek_to_index(FrameNumber index) {
        if (index < next_index && !rewind()) {
            return false;
        }
        while (true) {
            if (!decode_next()) {
                return false;
            }
            FrameNumber current = next_index++;
            if (current >= index) {
                return true;
            }
            av_frame_unref(frame);
        }
    }

    bool scale_to(uint32_t width, uint32_t height, RgbImage& out) {
        SwsContext* sws = sws_getContext(frame->width, frame->height,
                                         static_cast<AVPixelFormat>(frame->format),
                                         static_cast<int>(width), static_cast<int>(height),
                                         AV_PIX_FMT_RGB24, SWS_AREA, nullptr, nullptr, nullptr);
        if (!sws) {
            FIXLIST_LOG_ERROR("Cannot create scaler for {}x{} frame", frame->width, frame->height);
            return false;
        }

        out.width = width;
        out.height = height;
        out.rgb_data.assign(static_cast<size_t>(width) * height * 3, 0);

        uint8_t* dst_data[4] = {out.rgb_data.data(), nullptr, nullptr, nullptr};
        int dst_linesize[4] = {static_cast<int>(width * 3), 0, 0, 0};

        sws_scale(sws, frame->data, frame->linesize, 0, frame->height, dst_data, dst_linesize);
        sws_freeContext(sws);
        return true;
    }
};

VideoFrameGrabber::VideoFrameGrabber()
    : impl_(std::make_unique<Impl>())
{
}

VideoFrameGrabber::~VideoFrameGrabber() = default;

bool VideoFrameGrabber::open(const std::string& path) {
    close();
    if (!impl_->open(path, info_)) {
        close();
        return false;
    }
    FIXLIST_LOG_DEBUG("Video '{}': {} frames at {} fps", path, info_.frame_count, info_.fps);
    return true;
}

void VideoFrameGrabber::close() {
    impl_->cleanup();
    info_ = VideoInfo();
}

bool VideoFrameGrabber::is_open() const {
    return impl_->format_ctx != nullptr;
}

bool VideoFrameGrabber::grab_thumbnail(FrameNumber index, uint32_t max_width, uint32_t max_height,
                                       RgbImage& out) {
    if (!is_open()) {
        FIXLIST_LOG_ERROR("grab_thumbnail: no video open");
        return false;
    }
    if (index < 0 || index >= info_.frame_count) {
        FIXLIST_LOG_ERROR("Frame {} is outside the video (0-{})", index, info_.frame_count - 1);
        return false;
    }

    if (!impl_->seek_to_index(index)) {
        FIXLIST_LOG_ERROR("Cannot decode frame {}", index);
        return false;
    }

    ImageSize size = thumbnail_size(static_cast<uint32_t>(impl_->frame->width),
                                    static_cast<uint32_t>(impl_->frame->height),
                                    max_width, max_height);
    bool ok = size.width > 0 && impl_->scale_to(size.width, size.height, out);
    av_frame_unref(impl_->frame);
    return ok;
}

#else // HAVE_FFMPEG

class VideoFrameGrabber::Impl {
};

VideoFrameGrabber::VideoFrameGrabber()
    : impl_(std::make_unique<Impl>())
{
}

VideoFrameGrabber::~VideoFrameGrabber() = default;

bool VideoFrameGrabber::open(const std::string& path) {
    FIXLIST_LOG_ERROR("Cannot open video '{}': fixlist was built without FFmpeg support", path);
    return false;
}

void VideoFrameGrabber::close() {
    info_ = VideoInfo();
}

bool VideoFrameGrabber::is_open() const {
    return false;
}

bool VideoFrameGrabber::grab_thumbnail(FrameNumber index, uint32_t, uint32_t, RgbImage&) {
    FIXLIST_LOG_ERROR("Cannot grab frame {}: fixlist was built without FFmpeg support", index);
    return false;
}

#endif // HAVE_FFMPEG

} // namespace fixlist
