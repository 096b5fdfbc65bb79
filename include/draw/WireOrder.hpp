// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file WireOrder.hpp
 * @brief Display order of wires and the wire label column
 *
 * Quantum wires are drawn first, classical wires below them. Reversing the
 * bit order reverses each group on its own, so classical rows always stay
 * under the quantum rows.
 */

#pragma once

#include "../ir/Circuit.hpp"
#include "../ir/Types.hpp"
#include "../ir/Wire.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qdraw::draw {

/**
 * @brief Maps flat qubit / clbit indices to display rows.
 *
 * Rows 0 .. numQubits()-1 are quantum, the rest classical.
 */
class WireOrder {
public:
    WireOrder(const ir::Circuit& circuit, bool reverse_bits)
        : circuit_(&circuit)
        , qubits_(circuit.qubits())
        , clbits_(circuit.clbits())
    {
        if (reverse_bits) {
            std::reverse(qubits_.begin(), qubits_.end());
            std::reverse(clbits_.begin(), clbits_.end());
        }
        reversed_ = reverse_bits;
    }

    [[nodiscard]] std::size_t numQubits() const noexcept { return qubits_.size(); }
    [[nodiscard]] std::size_t numClbits() const noexcept { return clbits_.size(); }
    [[nodiscard]] std::size_t numRows() const noexcept {
        return qubits_.size() + clbits_.size();
    }

    /// @brief Display row of a flat qubit index (caller checks the range).
    [[nodiscard]] std::size_t qubitRow(WireIndex qubit) const noexcept {
        return reversed_ ? qubits_.size() - 1 - qubit : qubit;
    }

    /// @brief Display row of a flat clbit index (caller checks the range).
    [[nodiscard]] std::size_t clbitRow(WireIndex clbit) const noexcept {
        return qubits_.size() + (reversed_ ? clbits_.size() - 1 - clbit : clbit);
    }

    [[nodiscard]] bool isClassicalRow(std::size_t row) const noexcept {
        return row >= qubits_.size();
    }

    /// @brief Wire drawn on a display row.
    [[nodiscard]] const ir::Wire& wireAt(std::size_t row) const {
        return row < qubits_.size() ? qubits_.at(row) : clbits_.at(row - qubits_.size());
    }

    /**
     * @brief Sorted display rows of a classical register.
     * @return std::nullopt if no classical register has that name
     */
    [[nodiscard]] std::optional<std::vector<std::size_t>> registerRows(
        const std::string& name) const {
        auto bits = circuit_->classicalRegisterBits(name);
        if (!bits) {
            return std::nullopt;
        }
        std::vector<std::size_t> rows;
        rows.reserve(bits->size());
        for (WireIndex bit : *bits) {
            rows.push_back(clbitRow(bit));
        }
        std::sort(rows.begin(), rows.end());
        return rows;
    }

    /**
     * @brief Wire labels in display order, right-justified to a common width.
     * @param with_initial_value Append "|0>" to qubits and "0 " to clbits
     */
    [[nodiscard]] std::vector<std::u32string> labels(bool with_initial_value) const {
        std::vector<std::u32string> result;
        result.reserve(numRows());
        for (const auto& wire : qubits_) {
            result.push_back(fromUtf8(wire.label() + (with_initial_value ? ": |0>" : ": ")));
        }
        for (const auto& wire : clbits_) {
            result.push_back(fromUtf8(wire.label() + (with_initial_value ? ": 0 " : ": ")));
        }
        std::size_t longest = 0;
        for (const auto& label : result) {
            longest = std::max(longest, label.size());
        }
        for (auto& label : result) {
            label = rjust(label, longest, U' ');
        }
        return result;
    }

private:
    const ir::Circuit* circuit_;
    std::vector<ir::Wire> qubits_;
    std::vector<ir::Wire> clbits_;
    bool reversed_ = false;
};

}  // namespace qdraw::draw
