// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Types.hpp
 * @brief Common type aliases and constants for the circuit drawer
 *
 * Provides foundational types used throughout the qdraw library including
 * wire and operation indices and the layout constants shared by the
 * drawing stages.
 */

#pragma once

#include <cstddef>
#include <string>
#include <variant>

namespace qdraw {

/// @brief Type alias for qubit / clbit indices (flat, declaration order)
using WireIndex = std::size_t;

/// @brief Type alias for the position of an operation in the input list
using OpIndex = std::size_t;

/// @brief A gate parameter: numeric value or symbolic expression
using Param = std::variant<double, std::string>;

namespace constants {

/// @brief Significant digits used when printing numeric parameters
inline constexpr int PARAM_PRECISION = 5;

/// @brief Narrowest width a clipped box label is reduced to
inline constexpr std::size_t MIN_LABEL_WIDTH = 5;

/// @brief Suffix appended to clipped labels
inline constexpr const char* CLIP_MARKER = "...";

/// @brief Style of the <pre> wrapper used for the HTML form
inline constexpr const char* HTML_PRE_STYLE =
    "word-wrap: normal;white-space: pre;line-height: 15px;";

/// @brief Pi constant for rotation gates
inline constexpr double PI = 3.14159265358979323846;

}  // namespace constants

}  // namespace qdraw
