// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file DrawOptions.hpp
 * @brief Global drawing parameters
 *
 * Justification, vertical compression, bit order, barrier plotting and
 * page width. The string parsers accept the option names used in
 * configuration files and command lines ("left", "medium", ...).
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace qdraw::draw {

/**
 * @brief Where the slack columns of a schedule go.
 */
enum class Justification {
    Left,   ///< Every operation as early as its wires allow
    Right,  ///< Every operation as late as its wires allow
    None    ///< One operation per column, in input order
};

/**
 * @brief How aggressively spacer rows between wires are removed.
 */
enum class VerticalCompression {
    High,    ///< Always merge neighbouring wires' edges
    Medium,  ///< Merge unless two box edges would touch
    Low      ///< Never merge; keep a spacer row between every pair of wires
};

[[nodiscard]] constexpr std::string_view justificationName(Justification j) noexcept {
    switch (j) {
        case Justification::Left:  return "left";
        case Justification::Right: return "right";
        case Justification::None:  return "none";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view compressionName(VerticalCompression c) noexcept {
    switch (c) {
        case VerticalCompression::High:   return "high";
        case VerticalCompression::Medium: return "medium";
        case VerticalCompression::Low:    return "low";
    }
    return "unknown";
}

/**
 * @brief Parses "left", "right" or "none".
 * @throws std::invalid_argument for any other value
 */
[[nodiscard]] inline Justification parseJustification(std::string_view text) {
    if (text == "left") return Justification::Left;
    if (text == "right") return Justification::Right;
    if (text == "none") return Justification::None;
    throw std::invalid_argument("Justification can only be 'left', 'right' or 'none', got '" +
                                std::string(text) + "'");
}

/**
 * @brief Parses "high", "medium" or "low".
 * @throws std::invalid_argument for any other value
 */
[[nodiscard]] inline VerticalCompression parseVerticalCompression(std::string_view text) {
    if (text == "high") return VerticalCompression::High;
    if (text == "medium") return VerticalCompression::Medium;
    if (text == "low") return VerticalCompression::Low;
    throw std::invalid_argument(
        "Vertical compression can only be 'high', 'medium' or 'low', got '" +
        std::string(text) + "'");
}

/**
 * @brief Parameters of one render call.
 */
struct DrawOptions {
    /// Draw the last qubit (and last clbit) on top.
    bool reverse_bits = false;

    /// Draw barriers; when false they still constrain column assignment.
    bool plot_barriers = true;

    Justification justify = Justification::Left;

    VerticalCompression vertical_compression = VerticalCompression::High;

    /// Maximum line width; std::nullopt renders a single unbounded page.
    std::optional<std::size_t> line_length;

    /// Append the initial value ("|0>" or "0 ") to the wire labels.
    bool initial_state = true;
};

}  // namespace qdraw::draw
