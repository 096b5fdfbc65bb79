// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file LayerBuilder.hpp
 * @brief Column assignment for the operations of a circuit
 *
 * Groups operations into diagram columns. Each operation occupies the
 * contiguous range of display rows between its topmost and bottommost
 * wire (qubits, written clbits and the condition register), so a gate on
 * rows 0 and 3 also occupies rows 1 and 2. Barriers occupy exactly the
 * rows they list.
 *
 * Left justification places every operation one column after the last
 * column any of its rows is occupied in. Right justification runs the same
 * pass over the reversed operation list and mirrors the result. With no
 * justification every operation gets a column of its own.
 *
 * @see TextDrawing.hpp for how the schedule is rendered
 */

#pragma once

#include "../ir/Circuit.hpp"
#include "../ir/Types.hpp"
#include "DrawError.hpp"
#include "DrawOptions.hpp"
#include "WireOrder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace qdraw::draw {

/// Operation indices per column, each column in input order.
using Schedule = std::vector<std::vector<OpIndex>>;

/**
 * @brief Assigns circuit operations to diagram columns.
 *
 * Example:
 * @code
 * WireOrder order(circuit, false);
 * LayerBuilder builder(circuit, order);
 * Schedule schedule = builder.build(Justification::Left);
 * @endcode
 */
class LayerBuilder {
public:
    LayerBuilder(const ir::Circuit& circuit, const WireOrder& order)
        : circuit_(circuit)
        , order_(order)
    {}

    /**
     * @brief Checks every wire reference of an operation.
     * @throws DrawError (InconsistentWireReference) for a qubit or clbit out
     *         of range, a repeated qubit, or a condition on an unknown or
     *         empty register
     */
    void checkReferences(OpIndex index) const {
        const auto& op = circuit_.operation(index);
        const std::size_t num_qubits = circuit_.numQubits();
        const std::size_t num_clbits = circuit_.numClbits();

        for (std::size_t i = 0; i < op.qubits().size(); ++i) {
            const WireIndex q = op.qubits()[i];
            if (!ir::isValidWire(q, num_qubits)) {
                throw inconsistentWireReference(
                    index, op,
                    "references qubit " + std::to_string(q) + " but the circuit has " +
                        std::to_string(num_qubits) + " qubits",
                    {q});
            }
            for (std::size_t j = 0; j < i; ++j) {
                if (op.qubits()[j] == q) {
                    throw inconsistentWireReference(
                        index, op, "references qubit " + std::to_string(q) + " twice", {q});
                }
            }
        }
        for (WireIndex c : op.clbits()) {
            if (!ir::isValidWire(c, num_clbits)) {
                throw inconsistentWireReference(
                    index, op,
                    "references clbit " + std::to_string(c) + " but the circuit has " +
                        std::to_string(num_clbits) + " clbits",
                    {c});
            }
        }
        if (const auto& condition = op.condition()) {
            const auto bits = circuit_.classicalRegisterBits(condition->register_name);
            if (!bits) {
                throw inconsistentWireReference(
                    index, op,
                    "is conditioned on unknown register '" + condition->register_name + "'",
                    op.qubits());
            }
            if (bits->empty()) {
                throw inconsistentWireReference(
                    index, op,
                    "is conditioned on register '" + condition->register_name +
                        "' which has no bits",
                    op.qubits());
            }
        }
    }

    /**
     * @brief Display rows an operation occupies, sorted.
     * @throws DrawError (UnsupportedOperation) if the operation touches no wire
     */
    [[nodiscard]] std::vector<std::size_t> occupiedRows(OpIndex index) const {
        const auto& op = circuit_.operation(index);
        std::vector<std::size_t> rows;
        for (WireIndex q : op.qubits()) {
            rows.push_back(order_.qubitRow(q));
        }
        if (op.kind() != ir::OpKind::Barrier) {
            for (WireIndex c : op.clbits()) {
                rows.push_back(order_.clbitRow(c));
            }
            if (const auto& condition = op.condition()) {
                if (auto reg_rows = order_.registerRows(condition->register_name)) {
                    rows.insert(rows.end(), reg_rows->begin(), reg_rows->end());
                }
            }
        }
        if (rows.empty()) {
            throw unsupportedOperation(index, op, "acts on no wires");
        }
        std::sort(rows.begin(), rows.end());
        rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
        if (op.kind() == ir::OpKind::Barrier) {
            return rows;
        }

        std::vector<std::size_t> span;
        for (std::size_t row = rows.front(); row <= rows.back(); ++row) {
            span.push_back(row);
        }
        return span;
    }

    /**
     * @brief Assigns every operation to a column.
     * @return Columns left to right, each listing its operations in input order
     * @throws DrawError if an operation has an inconsistent wire reference
     */
    [[nodiscard]] Schedule build(Justification justify) const {
        const std::size_t num_ops = circuit_.numOperations();
        std::vector<std::vector<std::size_t>> spans(num_ops);
        for (OpIndex i = 0; i < num_ops; ++i) {
            checkReferences(i);
            spans[i] = occupiedRows(i);
        }

        std::vector<std::size_t> columns(num_ops);
        std::size_t num_columns = 0;
        switch (justify) {
            case Justification::None:
                for (OpIndex i = 0; i < num_ops; ++i) {
                    columns[i] = i;
                }
                num_columns = num_ops;
                break;
            case Justification::Left:
                num_columns = packEarliest(spans, columns, false);
                break;
            case Justification::Right:
                num_columns = packEarliest(spans, columns, true);
                for (auto& column : columns) {
                    column = num_columns - 1 - column;
                }
                break;
        }

        Schedule schedule(num_columns);
        for (OpIndex i = 0; i < num_ops; ++i) {
            spdlog::debug("operation #{} ({}) -> column {}", i,
                          circuit_.operation(i).name(), columns[i]);
            schedule[columns[i]].push_back(i);
        }
        return schedule;
    }

private:
    const ir::Circuit& circuit_;
    const WireOrder& order_;

    /**
     * @brief Greedy earliest-column packing.
     * @param backwards Visit operations from last to first
     * @return Number of columns used
     */
    std::size_t packEarliest(const std::vector<std::vector<std::size_t>>& spans,
                             std::vector<std::size_t>& columns,
                             bool backwards) const {
        // next_free[row]: first column in which the row is not occupied
        std::vector<std::size_t> next_free(order_.numRows(), 0);
        std::size_t num_columns = 0;
        const std::size_t num_ops = spans.size();
        for (std::size_t k = 0; k < num_ops; ++k) {
            const OpIndex i = backwards ? num_ops - 1 - k : k;
            std::size_t column = 0;
            for (std::size_t row : spans[i]) {
                column = std::max(column, next_free[row]);
            }
            for (std::size_t row : spans[i]) {
                next_free[row] = column + 1;
            }
            columns[i] = column;
            num_columns = std::max(num_columns, column + 1);
        }
        return num_columns;
    }
};

}  // namespace qdraw::draw
