// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Canvas.hpp
 * @brief Assembles columns of elements into text lines
 *
 * Every wire contributes three lines (top, mid, bot), built by
 * concatenating its elements left to right. Consecutive lines are merged
 * character by character so that connectors run through the rows in
 * between; with vertical compression the bot line of one wire and the top
 * line of the next are collapsed into a single line.
 */

#pragma once

#include "DrawOptions.hpp"
#include "Elements.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace qdraw::draw {

/// A full diagram column: one element per display row.
using Column = std::vector<DrawElement>;

/**
 * @brief Which line wins when two glyphs cannot be combined.
 */
enum class MergePriority {
    Top,     ///< Collapsing two lines into one
    Bottom   ///< Drawing a new line under an existing one
};

namespace detail {

[[nodiscard]] constexpr bool isOneOf(char32_t c, std::u32string_view set) noexcept {
    return set.find(c) != std::u32string_view::npos;
}

/// @brief Combines one glyph of an upper line with the glyph below it.
[[nodiscard]] constexpr char32_t mergeGlyph(char32_t top, char32_t bot,
                                            MergePriority priority) noexcept {
    const bool top_wins = priority == MergePriority::Top;
    if (top == bot) return top;
    if (isOneOf(top, U"┼╪") && bot == U' ') return U'│';
    if (top == U' ') return bot;
    if (isOneOf(top, U"┬╥") && isOneOf(bot, U" ║│") && top_wins) return top;
    if (top == U'┬' && bot == U' ' && !top_wins) return U'│';
    if (top == U'╥' && bot == U' ' && !top_wins) return U'║';
    if (isOneOf(top, U"┬│") && bot == U'═') return U'╪';
    if (isOneOf(top, U"┬│") && bot == U'─') return U'┼';
    if (isOneOf(top, U"└┘║│░") && bot == U' ' && top_wins) return top;
    if (isOneOf(top, U"─═") && bot == U' ') return top_wins ? top : bot;
    if (isOneOf(top, U"║╥") && bot == U'═') return U'╬';
    if (isOneOf(top, U"║╥") && bot == U'─') return U'╫';
    if (isOneOf(top, U"║╫╬") && bot == U' ') return U'║';
    if (top == U'└' && bot == U'┌') return U'├';
    if (top == U'┘' && bot == U'┐') return U'┤';
    if (isOneOf(bot, U"┐┌") && top_wins) return U'┬';
    if (isOneOf(top, U"┘└") && bot == U'─' && top_wins) return U'┴';
    return bot;
}

[[nodiscard]] inline bool isLabelChar(char32_t c) noexcept {
    return c < 0x80 && std::isalnum(static_cast<int>(c)) != 0;
}

}  // namespace detail

/**
 * @brief Merges two lines of equal length glyph by glyph.
 *
 * Crossing connectors become junctions (`┼ ╪ ╫ ╬`), touching box corners
 * become tees (`├ ┤ ┬ ┴`), and connectors arriving from above continue
 * through blank cells (`│ ║`).
 */
[[nodiscard]] inline std::u32string mergeLines(const std::u32string& top,
                                               const std::u32string& bot,
                                               MergePriority priority = MergePriority::Top) {
    std::u32string result;
    result.reserve(bot.size());
    for (std::size_t i = 0; i < bot.size(); ++i) {
        const char32_t above = i < top.size() ? top[i] : U' ';
        result.push_back(detail::mergeGlyph(above, bot[i], priority));
    }
    return result;
}

/**
 * @brief Decides whether the bot line of a wire and the top line of the
 *        next wire may share one text line.
 *
 * Except in Low mode, lines are only kept apart where a barrier segment
 * meets another glyph (a barrier can share its column with a box on a wire
 * it skips) or, in Medium mode, where box edges would touch.
 *
 * @param upper_bot Unmerged bot line of the upper wire
 * @param lower_top Unmerged top line of the lower wire
 */
[[nodiscard]] inline bool shouldCompress(const std::u32string& upper_bot,
                                         const std::u32string& lower_top,
                                         VerticalCompression mode) noexcept {
    if (mode == VerticalCompression::Low) {
        return false;
    }
    const std::size_t n = std::min(upper_bot.size(), lower_top.size());
    for (std::size_t i = 0; i < n; ++i) {
        const char32_t up = upper_bot[i];
        const char32_t down = lower_top[i];
        if (up != down && ((up == U'░' && down != U' ') || (down == U'░' && up != U' '))) {
            return false;
        }
        if (mode == VerticalCompression::High) {
            continue;
        }
        if (detail::isOneOf(up, U"┬╥") && detail::isOneOf(down, U"┴╨")) {
            return false;
        }
        if ((detail::isLabelChar(up) && down != U' ') ||
            (detail::isLabelChar(down) && up != U' ')) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Renders a sequence of columns into text lines.
 *
 * Columns must be normalized (every element of a column has the same
 * rendered length) and all have the same number of rows.
 */
[[nodiscard]] inline std::vector<std::u32string> drawRows(const std::vector<Column>& columns,
                                                          VerticalCompression mode) {
    std::vector<std::u32string> lines;
    if (columns.empty()) {
        return lines;
    }
    const std::size_t num_rows = columns.front().size();
    std::u32string previous_bot;
    for (std::size_t row = 0; row < num_rows; ++row) {
        std::u32string top;
        std::u32string mid;
        std::u32string bot;
        for (const auto& column : columns) {
            const DrawElement& element = column[row];
            top += element.top();
            mid += element.mid();
            bot += element.bot();
        }

        if (row == 0) {
            lines.push_back(top);
        } else if (shouldCompress(previous_bot, top, mode)) {
            std::u32string upper = std::move(lines.back());
            lines.back() = mergeLines(upper, top);
        } else {
            lines.push_back(mergeLines(lines.back(), top, MergePriority::Bottom));
        }
        lines.push_back(mergeLines(lines.back(), mid, MergePriority::Bottom));
        lines.push_back(mergeLines(lines.back(), bot, MergePriority::Bottom));
        previous_bot = std::move(bot);
    }
    return lines;
}

}  // namespace qdraw::draw
