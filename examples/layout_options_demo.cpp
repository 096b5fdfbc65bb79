// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file layout_options_demo.cpp
 * @brief Demonstrates the layout options in detail
 *
 * Shows the same circuit under each justification, compression mode and
 * bit order.
 */

#include "draw/DrawOptions.hpp"
#include "draw/TextDrawing.hpp"
#include "ir/Circuit.hpp"

#include <iostream>
#include <string>

using namespace qdraw;

namespace {

ir::Circuit sampleCircuit() {
    ir::Circuit circuit;
    circuit.addQuantumRegister("q", 3);
    circuit.addClassicalRegister("c", 2);
    circuit.append(ir::Operation::x(0));
    circuit.append(ir::Operation::h(2));
    circuit.append(ir::Operation::cswap(0, 1, 2));
    circuit.append(ir::Operation::measure(2, 1));
    circuit.append(ir::Operation::gate("oracle", {0, 2}).cIf("c", 2));
    return circuit;
}

void show(const std::string& title, const draw::DrawOptions& options) {
    std::cout << title << "\n";
    std::cout << std::string(50, '-') << "\n";
    std::cout << draw::TextDrawing(sampleCircuit(), options) << "\n\n";
}

}  // namespace

int main() {
    std::cout << "=== Layout Options Demo ===\n\n";

    // =========================================================================
    // 1. Justification
    // =========================================================================
    for (auto justify : {draw::Justification::Left, draw::Justification::Right,
                         draw::Justification::None}) {
        draw::DrawOptions options;
        options.justify = justify;
        show("justify = " + std::string(draw::justificationName(justify)), options);
    }

    // =========================================================================
    // 2. Vertical compression
    // =========================================================================
    for (auto mode : {draw::VerticalCompression::High, draw::VerticalCompression::Medium,
                      draw::VerticalCompression::Low}) {
        draw::DrawOptions options;
        options.vertical_compression = mode;
        show("vertical_compression = " + std::string(draw::compressionName(mode)), options);
    }

    // =========================================================================
    // 3. Bit order and barriers
    // =========================================================================
    {
        draw::DrawOptions options;
        options.reverse_bits = true;
        show("reverse_bits = true", options);
    }
    {
        ir::Circuit circuit(2);
        circuit.append(ir::Operation::h(0));
        circuit.barrierAll();
        circuit.append(ir::Operation::h(1));

        draw::DrawOptions options;
        options.plot_barriers = false;
        std::cout << "plot_barriers = false\n" << std::string(50, '-') << "\n";
        std::cout << draw::TextDrawing(circuit, options) << "\n";
    }

    return 0;
}
