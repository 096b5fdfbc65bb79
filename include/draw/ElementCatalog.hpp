// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file ElementCatalog.hpp
 * @brief Maps each operation kind to the elements it draws
 *
 * The catalog turns one operation into elements on its rows of a layer,
 * plus the connector linking them:
 *
 * | Kind             | Elements                                         |
 * |------------------|--------------------------------------------------|
 * | Gate (1 qubit)   | box `┤ Name(params) ├`                           |
 * | Gate (n qubits)  | multi-row box labelled with argument positions   |
 * | Controlled       | `■` on controls, box on the last qubit           |
 * | ControlledZ      | `■` on every qubit                               |
 * | ControlledPhase  | `■ ■`, connector labelled with the angle         |
 * | ZZInteraction    | `■ ■`, connector labelled `zz(angle)`            |
 * | Swap             | `X X`                                            |
 * | ControlledSwap   | `■ X X`                                          |
 * | Measure          | `┤M├` on the qubit, `╩` on the clbit             |
 * | Reset            | `|0>`                                            |
 * | Barrier          | `░` on each listed qubit                         |
 *
 * A condition adds a `╡ = value ╞` box over the rows of its register.
 */

#pragma once

#include "../ir/Operation.hpp"
#include "../ir/Types.hpp"
#include "DrawError.hpp"
#include "Elements.hpp"
#include "Layer.hpp"
#include "TextUtils.hpp"
#include "WireOrder.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace qdraw::draw {

// =============================================================================
// Labels
// =============================================================================

/**
 * @brief Formats one parameter for a label.
 *
 * Exact integers print without a decimal part, other numbers with five
 * significant digits ("1.5708", "1e-07"). Symbolic parameters are printed
 * verbatim.
 */
[[nodiscard]] inline std::string formatParam(const Param& param) {
    if (const auto* symbol = std::get_if<std::string>(&param)) {
        return *symbol;
    }
    const double value = std::get<double>(param);
    if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15) {
        return fmt::format("{}", static_cast<std::int64_t>(value));
    }
    return fmt::format("{:.{}g}", value, constants::PARAM_PRECISION);
}

/// @brief Parameters joined by commas, e.g. "1.5708,theta,3.1416".
[[nodiscard]] inline std::string formatParams(const std::vector<Param>& params) {
    std::vector<std::string> parts;
    parts.reserve(params.size());
    for (const auto& param : params) {
        parts.push_back(formatParam(param));
    }
    return fmt::format("{}", fmt::join(parts, ","));
}

/// @brief First letter upper case, the rest lower case ("rz" -> "Rz").
[[nodiscard]] inline std::string capitalize(const std::string& name) {
    std::string result = name;
    for (std::size_t i = 0; i < result.size(); ++i) {
        const auto c = static_cast<unsigned char>(result[i]);
        result[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
    }
    return result;
}

/**
 * @brief Box label of an operation.
 * @param capitalized Capitalize the name (single-row boxes)
 */
[[nodiscard]] inline std::string boxLabel(const ir::Operation& op, bool capitalized) {
    std::string label = capitalized ? capitalize(op.name()) : op.name();
    if (!op.params().empty()) {
        label += "(" + formatParams(op.params()) + ")";
    }
    return label;
}

/**
 * @brief Shortens a label to at most `limit` columns, ending in "...".
 *
 * The limit never goes below constants::MIN_LABEL_WIDTH.
 */
[[nodiscard]] inline std::u32string clipLabel(const std::u32string& label,
                                              std::optional<std::size_t> limit) {
    if (!limit) {
        return label;
    }
    const std::size_t width = std::max(*limit, constants::MIN_LABEL_WIDTH);
    if (label.size() <= width) {
        return label;
    }
    const std::u32string marker = fromUtf8(constants::CLIP_MARKER);
    return label.substr(0, width - marker.size()) + marker;
}

// =============================================================================
// Catalog
// =============================================================================

/**
 * @brief Places the elements of operations into layers.
 */
class ElementCatalog {
public:
    /**
     * @param order Display rows of the wires
     * @param label_limit Widest box label allowed (std::nullopt: unlimited)
     */
    ElementCatalog(const WireOrder& order, std::optional<std::size_t> label_limit)
        : order_(order)
        , label_limit_(label_limit)
    {}

    /**
     * @brief Checks that an operation has a drawable form.
     * @throws DrawError (UnsupportedOperation) on a wrong number of qubits,
     *         clbits or parameters for its kind, and on a condition on a
     *         barrier or a measurement
     */
    static void checkSupported(OpIndex index, const ir::Operation& op) {
        using ir::OpKind;
        const std::size_t nq = op.numQubits();
        if (nq == 0) {
            throw unsupportedOperation(index, op, "acts on no qubits");
        }
        if (op.kind() == OpKind::Measure) {
            if (nq != 1 || op.clbits().size() != 1) {
                throw unsupportedOperation(index, op,
                                           "must measure exactly one qubit into one clbit");
            }
            if (op.isConditional()) {
                throw unsupportedOperation(index, op, "measurements cannot be conditional");
            }
            return;
        }
        if (!op.clbits().empty()) {
            throw unsupportedOperation(
                index, op,
                fmt::format("of kind {} cannot write clbits", ir::opKindName(op.kind())));
        }
        switch (op.kind()) {
            case OpKind::Controlled:
            case OpKind::ControlledZ:
                requireQubits(index, op, nq >= 2, "at least 2");
                break;
            case OpKind::ControlledPhase:
            case OpKind::ZZInteraction:
                requireQubits(index, op, nq == 2, "exactly 2");
                if (op.params().size() != 1) {
                    throw unsupportedOperation(index, op, "needs exactly one angle");
                }
                break;
            case OpKind::Swap:
                requireQubits(index, op, nq == 2, "exactly 2");
                break;
            case OpKind::ControlledSwap:
                requireQubits(index, op, nq == 3, "exactly 3");
                break;
            case OpKind::Reset:
                requireQubits(index, op, nq == 1, "exactly 1");
                break;
            case OpKind::Barrier:
                if (op.isConditional()) {
                    throw unsupportedOperation(index, op, "barriers cannot be conditional");
                }
                break;
            case OpKind::Gate:
            case OpKind::Measure:
                break;
        }
    }

    /**
     * @brief Places the elements of one operation in a layer.
     * @param plot_barriers Draw barriers (they are skipped otherwise)
     */
    void place(const ir::Operation& op, Layer& layer, bool plot_barriers) const {
        using ir::OpKind;
        const bool conditional = op.isConditional();
        const auto& qubits = op.qubits();

        switch (op.kind()) {
            case OpKind::Gate:
                if (qubits.size() == 1) {
                    layer.set(row(qubits[0]), DrawElement::box(label(op, true), conditional));
                } else {
                    layer.setQubitBox(rows(qubits), label(op, false), conditional);
                }
                break;

            case OpKind::Controlled: {
                for (std::size_t i = 0; i + 1 < qubits.size(); ++i) {
                    layer.set(row(qubits[i]), DrawElement::bullet(conditional));
                }
                layer.set(row(qubits.back()), DrawElement::box(label(op, true), conditional));
                layer.connect(Connection{rows(qubits), U""});
                break;
            }

            case OpKind::ControlledZ:
                placeBullets(op, layer, U"");
                break;

            case OpKind::ControlledPhase:
                placeBullets(op, layer, fromUtf8(formatParam(op.params().front())));
                break;

            case OpKind::ZZInteraction:
                placeBullets(op, layer,
                             fromUtf8("zz(" + formatParam(op.params().front()) + ")"));
                break;

            case OpKind::Swap:
                layer.set(row(qubits[0]), DrawElement::swap(conditional));
                layer.set(row(qubits[1]), DrawElement::swap(conditional));
                layer.connect(Connection{rows(qubits), U""});
                break;

            case OpKind::ControlledSwap:
                layer.set(row(qubits[0]), DrawElement::bullet(conditional));
                layer.set(row(qubits[1]), DrawElement::swap(conditional));
                layer.set(row(qubits[2]), DrawElement::swap(conditional));
                layer.connect(Connection{rows(qubits), U""});
                break;

            case OpKind::Measure:
                layer.set(row(qubits[0]), DrawElement::measureFrom());
                layer.set(order_.clbitRow(op.clbits()[0]), DrawElement::measureTo());
                break;

            case OpKind::Reset:
                layer.set(row(qubits[0]), DrawElement::reset(conditional));
                break;

            case OpKind::Barrier:
                if (plot_barriers) {
                    for (WireIndex q : qubits) {
                        layer.set(row(q), DrawElement::barrier());
                    }
                }
                break;
        }

        if (const auto& condition = op.condition()) {
            if (auto reg_rows = order_.registerRows(condition->register_name)) {
                layer.setClassicalBox(
                    *reg_rows, fromUtf8("= " + std::to_string(condition->value)));
                if (op.kind() == OpKind::ControlledPhase ||
                    op.kind() == OpKind::ZZInteraction) {
                    layer.alignConditionBox(rows(qubits), *reg_rows);
                }
            }
        }
    }

private:
    const WireOrder& order_;
    std::optional<std::size_t> label_limit_;

    static void requireQubits(OpIndex index, const ir::Operation& op, bool ok,
                              const char* expected) {
        if (!ok) {
            throw unsupportedOperation(
                index, op,
                fmt::format("of kind {} needs {} qubits, got {}",
                            ir::opKindName(op.kind()), expected, op.numQubits()));
        }
    }

    [[nodiscard]] std::size_t row(WireIndex qubit) const noexcept {
        return order_.qubitRow(qubit);
    }

    [[nodiscard]] std::vector<std::size_t> rows(const std::vector<WireIndex>& qubits) const {
        std::vector<std::size_t> result;
        result.reserve(qubits.size());
        for (WireIndex q : qubits) {
            result.push_back(row(q));
        }
        return result;
    }

    [[nodiscard]] std::u32string label(const ir::Operation& op, bool capitalized) const {
        return clipLabel(fromUtf8(boxLabel(op, capitalized)), label_limit_);
    }

    void placeBullets(const ir::Operation& op, Layer& layer,
                      const std::u32string& connector_label) const {
        for (WireIndex q : op.qubits()) {
            layer.set(row(q), DrawElement::bullet(op.isConditional()));
        }
        layer.connect(Connection{rows(op.qubits()), connector_label});
    }
};

}  // namespace qdraw::draw
