// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file DrawError.hpp
 * @brief Error types for circuit drawing with operation location
 *
 * Provides structured error reporting for the drawing stages. Every error
 * names the offending operation (its position in the input list) and the
 * wires involved. Errors are raised before any output is produced.
 *
 * @see LayerBuilder.hpp for wire reference checks
 * @see ElementCatalog.hpp for unsupported operations
 */
#pragma once

#include "../ir/Operation.hpp"
#include "../ir/Types.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace qdraw::draw {

/**
 * @brief Category of drawing error.
 */
enum class DrawErrorKind {
    UnsupportedOperation,       ///< No drawable form (zero wires, wrong arity)
    InconsistentWireReference,  ///< Wire index out of range, unknown/empty register
};

/**
 * @brief Get string representation of error kind.
 */
[[nodiscard]] constexpr std::string_view errorKindName(DrawErrorKind kind) noexcept {
    switch (kind) {
        case DrawErrorKind::UnsupportedOperation:      return "unsupported operation";
        case DrawErrorKind::InconsistentWireReference: return "inconsistent wire reference";
    }
    return "error";
}

/**
 * @brief Exception thrown when a circuit cannot be drawn.
 *
 * Inherits from std::runtime_error for compatibility with standard
 * exception handling. what() reads
 * "kind: operation #index (name) detail [wires ...]".
 */
class DrawError : public std::runtime_error {
public:
    /**
     * @brief Construct an error for one operation.
     * @param kind Error category
     * @param op_index Position of the operation in the input list
     * @param op_name Name of the operation
     * @param detail Description of the problem
     * @param wires Wire indices involved (may be empty)
     */
    DrawError(DrawErrorKind kind,
              OpIndex op_index,
              std::string op_name,
              std::string detail,
              std::vector<WireIndex> wires = {})
        : std::runtime_error(format(kind, op_index, op_name, detail, wires))
        , kind_(kind)
        , op_index_(op_index)
        , op_name_(std::move(op_name))
        , detail_(std::move(detail))
        , wires_(std::move(wires)) {}

    // Accessors
    [[nodiscard]] DrawErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] OpIndex operationIndex() const noexcept { return op_index_; }
    [[nodiscard]] const std::string& operationName() const noexcept { return op_name_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
    [[nodiscard]] const std::vector<WireIndex>& wires() const noexcept { return wires_; }

private:
    DrawErrorKind kind_;
    OpIndex op_index_;
    std::string op_name_;
    std::string detail_;
    std::vector<WireIndex> wires_;

    static std::string format(DrawErrorKind kind,
                              OpIndex op_index,
                              const std::string& op_name,
                              const std::string& detail,
                              const std::vector<WireIndex>& wires) {
        std::string result = fmt::format("{}: operation #{} ({}) {}",
                                         errorKindName(kind), op_index, op_name,
                                         detail);
        if (!wires.empty()) {
            result += fmt::format(" [wires {}]", fmt::join(wires, ", "));
        }
        return result;
    }
};

/**
 * @brief Stream output for DrawError.
 */
inline std::ostream& operator<<(std::ostream& os, const DrawError& error) {
    os << error.what();
    return os;
}

/**
 * @brief Helper to create an unsupported-operation error.
 */
[[nodiscard]] inline DrawError unsupportedOperation(
    OpIndex op_index,
    const ir::Operation& op,
    const std::string& detail) {
    return DrawError(DrawErrorKind::UnsupportedOperation, op_index, op.name(),
                     detail, op.qubits());
}

/**
 * @brief Helper to create an inconsistent-wire-reference error.
 */
[[nodiscard]] inline DrawError inconsistentWireReference(
    OpIndex op_index,
    const ir::Operation& op,
    const std::string& detail,
    std::vector<WireIndex> wires) {
    return DrawError(DrawErrorKind::InconsistentWireReference, op_index,
                     op.name(), detail, std::move(wires));
}

}  // namespace qdraw::draw
