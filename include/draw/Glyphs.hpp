// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Glyphs.hpp
 * @brief The fixed glyph set diagrams are restricted to
 *
 * Diagrams only use characters that a legacy single-byte code page (IBM
 * code page 437) can display: printable ASCII plus the upper half of the
 * page (box drawing, shades, guillemets, ...).
 */

#pragma once

#include <string>
#include <string_view>

namespace qdraw::draw {

/// Upper half of code page 437 (bytes 0x80 to 0xFF) in byte order.
inline constexpr std::u32string_view CP437_UPPER_HALF =
    U"ÇüéâäàåçêëèïîìÄÅ"
    U"ÉæÆôöòûùÿÖÜ¢£¥₧ƒ"
    U"áíóúñÑªº¿⌐¬½¼¡«»"
    U"░▒▓│┤╡╢╖╕╣║╗╝╜╛┐"
    U"└┴┬├─┼╞╟╚╔╩╦╠═╬╧"
    U"╨╤╥╙╘╒╓╫╪┘┌█▄▌▐▀"
    U"αßΓπΣσµτΦΘΩδ∞φε∩"
    U"≡±≥≤⌠⌡÷≈°∙·√ⁿ²■ ";

/**
 * @brief Returns true if the code point can be shown by the legacy code page.
 */
[[nodiscard]] constexpr bool isLegacyGlyph(char32_t cp) noexcept {
    if (cp >= 0x20 && cp < 0x7F) {
        return true;
    }
    return CP437_UPPER_HALF.find(cp) != std::u32string_view::npos;
}

/**
 * @brief Returns true if every code point of the text is a legacy glyph.
 */
[[nodiscard]] inline bool isLegacyText(std::u32string_view text) noexcept {
    for (char32_t cp : text) {
        if (!isLegacyGlyph(cp)) {
            return false;
        }
    }
    return true;
}

}  // namespace qdraw::draw
