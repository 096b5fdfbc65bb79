// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Wire.hpp
 * @brief Wire and register definitions
 *
 * A wire is one horizontal rendering track: a single qubit or a single
 * classical bit. Wires belong to named registers and are identified by
 * their flat index in declaration order.
 *
 * @see Circuit.hpp for register management
 */

#pragma once

#include "Types.hpp"

#include <string>
#include <string_view>

namespace qdraw::ir {

/**
 * @brief Kind of a wire or register.
 */
enum class WireKind {
    Quantum,    ///< One qubit
    Classical   ///< One classical bit
};

/**
 * @brief Returns the name of a wire kind.
 */
[[nodiscard]] constexpr std::string_view wireKindName(WireKind kind) noexcept {
    switch (kind) {
        case WireKind::Quantum:   return "quantum";
        case WireKind::Classical: return "classical";
    }
    return "unknown";
}

/**
 * @brief A named register of wires of one kind.
 */
struct Register {
    std::string name;
    std::size_t size = 0;
    WireKind kind = WireKind::Quantum;
};

/**
 * @brief One qubit or classical bit.
 *
 * Immutable once assigned by the circuit; `index` is the position of the
 * bit inside its register.
 */
struct Wire {
    WireKind kind = WireKind::Quantum;
    std::string register_name;
    std::size_t index = 0;

    /// @brief Returns true for qubit wires.
    [[nodiscard]] bool isQuantum() const noexcept {
        return kind == WireKind::Quantum;
    }

    /// @brief Returns the display name, e.g. "q_0".
    [[nodiscard]] std::string label() const {
        return register_name + "_" + std::to_string(index);
    }

    [[nodiscard]] bool operator==(const Wire& other) const noexcept {
        return kind == other.kind && register_name == other.register_name &&
               index == other.index;
    }

    [[nodiscard]] bool operator!=(const Wire& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Validates that a wire index is within bounds.
 * @param wire The wire index to validate
 * @param num_wires Total number of wires of that kind
 * @return true if the index is valid
 */
[[nodiscard]] constexpr bool isValidWire(WireIndex wire,
                                         std::size_t num_wires) noexcept {
    return wire < num_wires;
}

}  // namespace qdraw::ir
