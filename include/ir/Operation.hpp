// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Operation.hpp
 * @brief Circuit operation representation and factory methods
 *
 * Provides the Operation class: one instruction of a circuit with its kind,
 * display name, the qubits it acts on, the classical bits it writes, its
 * parameters and an optional classical condition. Operations are plain
 * values; the drawer decides how each kind is rendered.
 *
 * @see Circuit.hpp for the operation list
 * @see draw/ElementCatalog.hpp for the rendering of each kind
 */

#pragma once

#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qdraw::ir {

/**
 * @brief Closed set of drawable operation kinds.
 *
 * Anything that is not one of the special kinds is a Gate and is drawn as
 * a labelled box (a multi-row box when it acts on several qubits).
 */
enum class OpKind {
    Gate,             ///< Named unitary drawn as a box
    Controlled,       ///< Controls on all but the last qubit, boxed target on the last
    ControlledZ,      ///< Control dot on every qubit
    ControlledPhase,  ///< Two control dots, connector labelled with the angle (cu1)
    ZZInteraction,    ///< Two control dots, connector labelled zz(angle) (rzz)
    Swap,             ///< Swap of two qubits
    ControlledSwap,   ///< Control on the first qubit, swap of the other two
    Measure,          ///< Measurement of one qubit into one classical bit
    Reset,            ///< Reset to |0>
    Barrier           ///< Scheduling barrier, no box
};

/**
 * @brief Returns the name of an operation kind as a string.
 */
[[nodiscard]] constexpr std::string_view opKindName(OpKind kind) noexcept {
    switch (kind) {
        case OpKind::Gate:            return "Gate";
        case OpKind::Controlled:      return "Controlled";
        case OpKind::ControlledZ:     return "ControlledZ";
        case OpKind::ControlledPhase: return "ControlledPhase";
        case OpKind::ZZInteraction:   return "ZZInteraction";
        case OpKind::Swap:            return "Swap";
        case OpKind::ControlledSwap:  return "ControlledSwap";
        case OpKind::Measure:         return "Measure";
        case OpKind::Reset:           return "Reset";
        case OpKind::Barrier:         return "Barrier";
    }
    return "Unknown";
}

/**
 * @brief Classical condition attached to an operation.
 *
 * The operation is applied when the value of the classical register equals
 * `value`.
 */
struct Condition {
    std::string register_name;
    std::int64_t value = 0;

    [[nodiscard]] bool operator==(const Condition& other) const noexcept {
        return register_name == other.register_name && value == other.value;
    }
};

/**
 * @brief One circuit instruction instance.
 *
 * Qubit and clbit references are flat indices into the circuit's quantum
 * and classical wires. Argument order matters: for controlled kinds the
 * target is the last qubit, and multi-qubit boxes label each row with the
 * argument position of its qubit.
 *
 * Example:
 * @code
 * auto h = Operation::h(0);                       // H on qubit 0
 * auto cx = Operation::cx(0, 1);                  // control 0, target 1
 * auto m = Operation::measure(0, 0);              // q0 -> c0
 * auto x = Operation::x(1).cIf("c", 1);           // if (c == 1) x q1
 * @endcode
 */
class Operation {
public:
    /**
     * @brief Constructs an operation with the given properties.
     * @param kind How the operation is drawn
     * @param name Gate name used for labels
     * @param qubits Qubit arguments in argument order
     * @param clbits Classical bit arguments
     * @param params Gate parameters
     */
    Operation(OpKind kind,
              std::string name,
              std::vector<WireIndex> qubits,
              std::vector<WireIndex> clbits = {},
              std::vector<Param> params = {})
        : kind_(kind)
        , name_(std::move(name))
        , qubits_(std::move(qubits))
        , clbits_(std::move(clbits))
        , params_(std::move(params))
    {}

    ~Operation() noexcept = default;
    Operation(const Operation&) = default;
    Operation& operator=(const Operation&) = default;
    Operation(Operation&&) noexcept = default;
    Operation& operator=(Operation&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Factory Methods
    // -------------------------------------------------------------------------

    /// @brief Creates a generic named gate (box or multi-qubit box).
    [[nodiscard]] static Operation gate(std::string name,
                                        std::vector<WireIndex> qubits,
                                        std::vector<Param> params = {}) {
        return Operation(OpKind::Gate, std::move(name), std::move(qubits), {},
                         std::move(params));
    }

    /// @brief Creates a Hadamard gate on the specified qubit.
    [[nodiscard]] static Operation h(WireIndex qubit) { return gate("h", {qubit}); }

    /// @brief Creates a Pauli-X gate on the specified qubit.
    [[nodiscard]] static Operation x(WireIndex qubit) { return gate("x", {qubit}); }

    /// @brief Creates a Pauli-Y gate on the specified qubit.
    [[nodiscard]] static Operation y(WireIndex qubit) { return gate("y", {qubit}); }

    /// @brief Creates a Pauli-Z gate on the specified qubit.
    [[nodiscard]] static Operation z(WireIndex qubit) { return gate("z", {qubit}); }

    /// @brief Creates an Rx rotation gate.
    [[nodiscard]] static Operation rx(WireIndex qubit, Param angle) {
        return gate("rx", {qubit}, {std::move(angle)});
    }

    /// @brief Creates an Ry rotation gate.
    [[nodiscard]] static Operation ry(WireIndex qubit, Param angle) {
        return gate("ry", {qubit}, {std::move(angle)});
    }

    /// @brief Creates an Rz rotation gate.
    [[nodiscard]] static Operation rz(WireIndex qubit, Param angle) {
        return gate("rz", {qubit}, {std::move(angle)});
    }

    /// @brief Creates a U1 phase gate.
    [[nodiscard]] static Operation u1(WireIndex qubit, Param lambda) {
        return gate("u1", {qubit}, {std::move(lambda)});
    }

    /// @brief Creates a U3 gate.
    [[nodiscard]] static Operation u3(WireIndex qubit, Param theta, Param phi,
                                      Param lambda) {
        return gate("u3", {qubit},
                    {std::move(theta), std::move(phi), std::move(lambda)});
    }

    /**
     * @brief Creates a controlled gate.
     * @param target_name Name of the gate applied on the target (e.g. "x")
     * @param controls Control qubits
     * @param target Target qubit
     * @param params Parameters of the target gate
     */
    [[nodiscard]] static Operation controlled(std::string target_name,
                                              std::vector<WireIndex> controls,
                                              WireIndex target,
                                              std::vector<Param> params = {}) {
        controls.push_back(target);
        return Operation(OpKind::Controlled, std::move(target_name),
                         std::move(controls), {}, std::move(params));
    }

    /// @brief Creates a CNOT gate with specified control and target qubits.
    [[nodiscard]] static Operation cx(WireIndex control, WireIndex target) {
        return controlled("x", {control}, target);
    }

    /// @brief Creates a controlled-Y gate.
    [[nodiscard]] static Operation cy(WireIndex control, WireIndex target) {
        return controlled("y", {control}, target);
    }

    /// @brief Creates a controlled-H gate.
    [[nodiscard]] static Operation ch(WireIndex control, WireIndex target) {
        return controlled("h", {control}, target);
    }

    /// @brief Creates a Toffoli gate.
    [[nodiscard]] static Operation ccx(WireIndex control1, WireIndex control2,
                                       WireIndex target) {
        return controlled("x", {control1, control2}, target);
    }

    /// @brief Creates a controlled Rz rotation.
    [[nodiscard]] static Operation crz(Param angle, WireIndex control,
                                       WireIndex target) {
        return controlled("rz", {control}, target, {std::move(angle)});
    }

    /// @brief Creates a controlled U3 gate.
    [[nodiscard]] static Operation cu3(Param theta, Param phi, Param lambda,
                                       WireIndex control, WireIndex target) {
        return controlled("u3", {control}, target,
                          {std::move(theta), std::move(phi), std::move(lambda)});
    }

    /// @brief Creates a CZ gate.
    [[nodiscard]] static Operation cz(WireIndex control, WireIndex target) {
        return Operation(OpKind::ControlledZ, "cz", {control, target});
    }

    /// @brief Creates a controlled phase rotation (inline angle label).
    [[nodiscard]] static Operation cu1(Param angle, WireIndex control,
                                       WireIndex target) {
        return Operation(OpKind::ControlledPhase, "cu1", {control, target}, {},
                         {std::move(angle)});
    }

    /// @brief Creates a ZZ interaction (inline zz(angle) label).
    [[nodiscard]] static Operation rzz(Param angle, WireIndex qubit1,
                                       WireIndex qubit2) {
        return Operation(OpKind::ZZInteraction, "rzz", {qubit1, qubit2}, {},
                         {std::move(angle)});
    }

    /// @brief Creates a SWAP gate between two qubits.
    [[nodiscard]] static Operation swap(WireIndex qubit1, WireIndex qubit2) {
        return Operation(OpKind::Swap, "swap", {qubit1, qubit2});
    }

    /// @brief Creates a Fredkin gate.
    [[nodiscard]] static Operation cswap(WireIndex control, WireIndex qubit1,
                                         WireIndex qubit2) {
        return Operation(OpKind::ControlledSwap, "cswap",
                         {control, qubit1, qubit2});
    }

    /// @brief Creates a measurement of qubit into clbit.
    [[nodiscard]] static Operation measure(WireIndex qubit, WireIndex clbit) {
        return Operation(OpKind::Measure, "measure", {qubit}, {clbit});
    }

    /// @brief Creates a reset of the specified qubit.
    [[nodiscard]] static Operation reset(WireIndex qubit) {
        return Operation(OpKind::Reset, "reset", {qubit});
    }

    /// @brief Creates a barrier over the listed qubits.
    [[nodiscard]] static Operation barrier(std::vector<WireIndex> qubits) {
        return Operation(OpKind::Barrier, "barrier", std::move(qubits));
    }

    /**
     * @brief Returns a copy of this operation conditioned on a register.
     * @param register_name Classical register compared
     * @param value Value the register must hold
     */
    [[nodiscard]] Operation cIf(std::string register_name,
                                std::int64_t value) const {
        Operation copy(*this);
        copy.condition_ = Condition{std::move(register_name), value};
        return copy;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] OpKind kind() const noexcept { return kind_; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const std::vector<WireIndex>& qubits() const noexcept {
        return qubits_;
    }

    [[nodiscard]] const std::vector<WireIndex>& clbits() const noexcept {
        return clbits_;
    }

    [[nodiscard]] const std::vector<Param>& params() const noexcept {
        return params_;
    }

    [[nodiscard]] const std::optional<Condition>& condition() const noexcept {
        return condition_;
    }

    /// @brief Returns true if the operation depends on a classical register.
    [[nodiscard]] bool isConditional() const noexcept {
        return condition_.has_value();
    }

    /// @brief Returns the number of qubits this operation acts on.
    [[nodiscard]] std::size_t numQubits() const noexcept {
        return qubits_.size();
    }

    // -------------------------------------------------------------------------
    // Operators
    // -------------------------------------------------------------------------

    [[nodiscard]] bool operator==(const Operation& other) const noexcept {
        return kind_ == other.kind_ && name_ == other.name_ &&
               qubits_ == other.qubits_ && clbits_ == other.clbits_ &&
               params_ == other.params_ && condition_ == other.condition_;
    }

    [[nodiscard]] bool operator!=(const Operation& other) const noexcept {
        return !(*this == other);
    }

    /// @brief Returns a string representation, e.g. "cx q[0], q[1]".
    [[nodiscard]] std::string toString() const {
        std::string result = name_;
        if (!params_.empty()) {
            result += "(";
            for (std::size_t i = 0; i < params_.size(); ++i) {
                if (i > 0) result += ",";
                if (const auto* value = std::get_if<double>(&params_[i])) {
                    result += std::to_string(*value);
                } else {
                    result += std::get<std::string>(params_[i]);
                }
            }
            result += ")";
        }
        result += " ";
        for (std::size_t i = 0; i < qubits_.size(); ++i) {
            if (i > 0) result += ", ";
            result += "q[" + std::to_string(qubits_[i]) + "]";
        }
        for (auto c : clbits_) {
            result += " -> c[" + std::to_string(c) + "]";
        }
        if (condition_) {
            result = "if(" + condition_->register_name + "==" +
                     std::to_string(condition_->value) + ") " + result;
        }
        return result;
    }

private:
    OpKind kind_;
    std::string name_;
    std::vector<WireIndex> qubits_;
    std::vector<WireIndex> clbits_;
    std::vector<Param> params_;
    std::optional<Condition> condition_;
};

}  // namespace qdraw::ir
