// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file TextUtils.hpp
 * @brief Fixed-width text helpers for the diagram canvas
 *
 * The canvas is built from std::u32string so that one code point is one
 * text column. Labels come in and diagrams go out as UTF-8.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace qdraw::draw {

/**
 * @brief Decodes UTF-8 into code points.
 * @throws std::invalid_argument on malformed input
 */
[[nodiscard]] inline std::u32string fromUtf8(const std::string& text) {
    std::u32string result;
    result.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            throw std::invalid_argument("Invalid UTF-8 lead byte in '" + text + "'");
        }
        if (extra > 0 && i + extra >= text.size()) {
            throw std::invalid_argument("Truncated UTF-8 sequence in '" + text + "'");
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                throw std::invalid_argument("Invalid UTF-8 continuation in '" + text + "'");
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        result.push_back(cp);
        i += extra + 1;
    }
    return result;
}

/**
 * @brief Encodes code points as UTF-8.
 */
[[nodiscard]] inline std::string toUtf8(const std::u32string& text) {
    std::string result;
    result.reserve(text.size() * 3);
    for (char32_t cp : text) {
        if (cp < 0x80) {
            result.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return result;
}

/**
 * @brief Centers text in a field of the given width.
 *
 * When both the margin and the width are odd the extra fill character
 * goes on the left. Junction glyphs of differently sized elements in one
 * column depend on this rule to line up.
 */
[[nodiscard]] inline std::u32string center(const std::u32string& text,
                                           std::size_t width,
                                           char32_t fill) {
    if (width <= text.size()) {
        return text;
    }
    const std::size_t margin = width - text.size();
    const std::size_t left = margin / 2 + (margin & width & 1);
    return std::u32string(left, fill) + text + std::u32string(margin - left, fill);
}

/// @brief Pads text on the right up to width.
[[nodiscard]] inline std::u32string ljust(const std::u32string& text,
                                          std::size_t width,
                                          char32_t fill) {
    if (width <= text.size()) {
        return text;
    }
    return text + std::u32string(width - text.size(), fill);
}

/// @brief Pads text on the left up to width.
[[nodiscard]] inline std::u32string rjust(const std::u32string& text,
                                          std::size_t width,
                                          char32_t fill) {
    if (width <= text.size()) {
        return text;
    }
    return std::u32string(width - text.size(), fill) + text;
}

}  // namespace qdraw::draw
