/*
 * File:        rgb_image.cpp
 * Module:      fixlist-core
 * Purpose:     RGB still images, thumbnail sizing and PNG export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "rgb_image.h"
#include "logging.h"
#include <png.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace fixlist {

ImageSize thumbnail_size(uint32_t width, uint32_t height, uint32_t max_width, uint32_t max_height) {
    ImageSize size;
    if (width == 0 || height == 0 || max_width == 0 || max_height == 0) {
        return size;
    }

    double scale = std::min({static_cast<double>(max_width) / width,
                             static_cast<double>(max_height) / height,
                             1.0});

    size.width = std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(width * scale)));
    size.height = std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(height * scale)));
    size.width = std::min(size.width, max_width);
    size.height = std::min(size.height, max_height);
    return size;
}

bool save_png(const RgbImage& image, const std::string& filename) {
    if (!image.is_valid()) {
        FIXLIST_LOG_ERROR("Invalid image for PNG export");
        return false;
    }

    FILE* fp = fopen(filename.c_str(), "wb");
    if (!fp) {
        FIXLIST_LOG_ERROR("Failed to open file for writing: {}", filename);
        return false;
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        FIXLIST_LOG_ERROR("Failed to create PNG write structure");
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        fclose(fp);
        FIXLIST_LOG_ERROR("Failed to create PNG info structure");
        return false;
    }

    // libpng reports write errors by longjmp
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        fclose(fp);
        FIXLIST_LOG_ERROR("PNG write error: {}", filename);
        return false;
    }

    png_init_io(png, fp);

    png_set_IHDR(
        png,
        info,
        image.width,
        image.height,
        8,
        PNG_COLOR_TYPE_RGB,
        PNG_INTERLACE_NONE,
        PNG_COMPRESSION_TYPE_DEFAULT,
        PNG_FILTER_TYPE_DEFAULT
    );

    png_write_info(png, info);

    for (uint32_t y = 0; y < image.height; ++y) {
        png_bytep row = const_cast<png_bytep>(&image.rgb_data[static_cast<size_t>(y) * image.width * 3]);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);

    png_destroy_write_struct(&png, &info);
    fclose(fp);

    FIXLIST_LOG_DEBUG("Saved PNG: {} ({}x{})", filename, image.width, image.height);
    return true;
}

} // namespace fixlist
