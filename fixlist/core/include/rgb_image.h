/*
 * File:        rgb_image.h
 * Module:      fixlist-core
 * Purpose:     RGB still images, thumbnail sizing and PNG export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fixlist {

/**
 * @brief Packed 8-bit RGB image, rows top to bottom
 */
struct RgbImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgb_data;  // width * height * 3 bytes

    bool is_valid() const {
        return width > 0 && height > 0 &&
               rgb_data.size() == static_cast<size_t>(width) * height * 3;
    }
};

struct ImageSize {
    uint32_t width = 0;
    uint32_t height = 0;
};

/**
 * @brief Largest size that fits max_width x max_height with the source aspect
 *
 * Images are never enlarged; each side is at least one pixel.
 */
ImageSize thumbnail_size(uint32_t width, uint32_t height, uint32_t max_width, uint32_t max_height);

/**
 * @brief Write an image as an 8-bit RGB PNG
 * @return false (with the reason logged) on failure
 */
bool save_png(const RgbImage& image, const std::string& filename);

} // namespace fixlist
