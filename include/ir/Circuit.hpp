// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Circuit.hpp
 * @brief Circuit container: registers and the ordered operation list
 *
 * Provides the Circuit class handed to the drawer. A circuit owns its
 * quantum and classical registers (which define the wires) and the
 * operations in drawing order. Wire references inside operations are flat
 * indices: qubits are numbered across quantum registers in declaration
 * order, clbits likewise across classical registers.
 *
 * @see Operation.hpp for operation representation
 * @see draw/TextDrawing.hpp for rendering
 */

#pragma once

#include "Operation.hpp"
#include "Types.hpp"
#include "Wire.hpp"

#include <algorithm>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qdraw::ir {

/**
 * @brief Registers plus an ordered list of operations.
 *
 * The circuit stores operations exactly as supplied; it does not check
 * that wire references are in range. The drawer reports inconsistent
 * references together with the offending operation index.
 *
 * Example:
 * @code
 * Circuit circuit;
 * circuit.addQuantumRegister("q", 2);
 * circuit.addClassicalRegister("c", 1);
 * circuit.append(Operation::h(0));
 * circuit.append(Operation::cx(0, 1));
 * circuit.append(Operation::measure(1, 0));
 * @endcode
 */
class Circuit {
public:
    using iterator = std::vector<Operation>::iterator;
    using const_iterator = std::vector<Operation>::const_iterator;

    /// @brief Constructs a circuit without registers.
    Circuit() = default;

    /**
     * @brief Constructs a circuit with registers "q" and (optionally) "c".
     * @param num_qubits Size of the quantum register "q"
     * @param num_clbits Size of the classical register "c" (none if 0)
     */
    explicit Circuit(std::size_t num_qubits, std::size_t num_clbits = 0) {
        if (num_qubits > 0) {
            addQuantumRegister("q", num_qubits);
        }
        if (num_clbits > 0) {
            addClassicalRegister("c", num_clbits);
        }
    }

    // Move semantics (circuits can be large)
    Circuit(Circuit&&) noexcept = default;
    Circuit& operator=(Circuit&&) noexcept = default;

    // Delete copy (use clone() if needed)
    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;

    ~Circuit() noexcept = default;

    // -------------------------------------------------------------------------
    // Registers
    // -------------------------------------------------------------------------

    /**
     * @brief Adds a quantum register; its qubits follow the existing ones.
     * @throws std::invalid_argument if the name is empty or already used
     */
    void addQuantumRegister(std::string name, std::size_t size) {
        addRegister(Register{std::move(name), size, WireKind::Quantum});
    }

    /**
     * @brief Adds a classical register; its clbits follow the existing ones.
     * @throws std::invalid_argument if the name is empty or already used
     */
    void addClassicalRegister(std::string name, std::size_t size) {
        addRegister(Register{std::move(name), size, WireKind::Classical});
    }

    [[nodiscard]] const std::vector<Register>& quantumRegisters() const noexcept {
        return qregs_;
    }

    [[nodiscard]] const std::vector<Register>& classicalRegisters() const noexcept {
        return cregs_;
    }

    /// @brief Returns all qubits in declaration order.
    [[nodiscard]] std::vector<Wire> qubits() const { return flatten(qregs_); }

    /// @brief Returns all clbits in declaration order.
    [[nodiscard]] std::vector<Wire> clbits() const { return flatten(cregs_); }

    /**
     * @brief Returns the flat clbit indices of a classical register.
     * @return std::nullopt if no classical register has that name
     */
    [[nodiscard]] std::optional<std::vector<WireIndex>> classicalRegisterBits(
        const std::string& name) const {
        WireIndex offset = 0;
        for (const auto& reg : cregs_) {
            if (reg.name == name) {
                std::vector<WireIndex> bits(reg.size);
                for (std::size_t i = 0; i < reg.size; ++i) {
                    bits[i] = offset + i;
                }
                return bits;
            }
            offset += reg.size;
        }
        return std::nullopt;
    }

    // -------------------------------------------------------------------------
    // Operation Management
    // -------------------------------------------------------------------------

    /// @brief Appends an operation at the end of the drawing order.
    void append(Operation op) { ops_.push_back(std::move(op)); }

    /// @brief Appends a barrier across every qubit.
    void barrierAll() {
        std::vector<WireIndex> all(numQubits());
        for (std::size_t i = 0; i < all.size(); ++i) {
            all[i] = i;
        }
        append(Operation::barrier(std::move(all)));
    }

    /**
     * @brief Returns the operation at the specified index.
     * @throws std::out_of_range if index >= numOperations()
     */
    [[nodiscard]] const Operation& operation(std::size_t index) const {
        if (index >= ops_.size()) {
            throw std::out_of_range(
                "Operation index " + std::to_string(index) +
                " out of range [0, " + std::to_string(ops_.size()) + ")");
        }
        return ops_[index];
    }

    [[nodiscard]] const std::vector<Operation>& operations() const noexcept {
        return ops_;
    }

    /// @brief Removes all operations (registers are kept).
    void clear() noexcept { ops_.clear(); }

    // -------------------------------------------------------------------------
    // Circuit Properties
    // -------------------------------------------------------------------------

    [[nodiscard]] std::size_t numQubits() const noexcept { return totalSize(qregs_); }

    [[nodiscard]] std::size_t numClbits() const noexcept { return totalSize(cregs_); }

    [[nodiscard]] std::size_t numWires() const noexcept {
        return numQubits() + numClbits();
    }

    [[nodiscard]] std::size_t numOperations() const noexcept { return ops_.size(); }

    /// @brief Returns true if the circuit has no operations.
    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }

    // -------------------------------------------------------------------------
    // Iteration
    // -------------------------------------------------------------------------

    [[nodiscard]] iterator begin() noexcept { return ops_.begin(); }
    [[nodiscard]] iterator end() noexcept { return ops_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return ops_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return ops_.end(); }

    // -------------------------------------------------------------------------
    // Utilities
    // -------------------------------------------------------------------------

    /// @brief Creates a deep copy of the circuit.
    [[nodiscard]] Circuit clone() const {
        Circuit copy;
        copy.qregs_ = qregs_;
        copy.cregs_ = cregs_;
        copy.ops_ = ops_;
        return copy;
    }

    /// @brief Returns a multi-line listing of registers and operations.
    [[nodiscard]] std::string toString() const {
        std::string result = "Circuit(" + std::to_string(numQubits()) +
                             " qubits, " + std::to_string(numClbits()) +
                             " clbits, " + std::to_string(ops_.size()) +
                             " operations):\n";
        for (const auto& op : ops_) {
            result += "  " + op.toString() + "\n";
        }
        return result;
    }

private:
    std::vector<Register> qregs_;
    std::vector<Register> cregs_;
    std::vector<Operation> ops_;

    void addRegister(Register reg) {
        if (reg.name.empty()) {
            throw std::invalid_argument("Register name must not be empty");
        }
        auto same_name = [&reg](const Register& r) { return r.name == reg.name; };
        if (std::any_of(qregs_.begin(), qregs_.end(), same_name) ||
            std::any_of(cregs_.begin(), cregs_.end(), same_name)) {
            throw std::invalid_argument("Register '" + reg.name +
                                        "' is already defined");
        }
        if (reg.kind == WireKind::Quantum) {
            qregs_.push_back(std::move(reg));
        } else {
            cregs_.push_back(std::move(reg));
        }
    }

    static std::size_t totalSize(const std::vector<Register>& regs) noexcept {
        std::size_t total = 0;
        for (const auto& reg : regs) {
            total += reg.size;
        }
        return total;
    }

    static std::vector<Wire> flatten(const std::vector<Register>& regs) {
        std::vector<Wire> wires;
        for (const auto& reg : regs) {
            for (std::size_t i = 0; i < reg.size; ++i) {
                wires.push_back(Wire{reg.kind, reg.name, i});
            }
        }
        return wires;
    }
};

/**
 * @brief Stream output operator for Circuit.
 */
inline std::ostream& operator<<(std::ostream& os, const Circuit& circuit) {
    os << circuit.toString();
    return os;
}

}  // namespace qdraw::ir
