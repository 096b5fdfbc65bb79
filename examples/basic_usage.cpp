// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file basic_usage.cpp
 * @brief Basic usage example for qdraw
 *
 * Demonstrates:
 * - Creating circuits with named registers
 * - Drawing them as text
 * - Wrapping long circuits into pages
 * - Exporting the HTML form
 */

#include "draw/TextDrawing.hpp"
#include "ir/Circuit.hpp"

#include <iostream>
#include <string>

using namespace qdraw;

int main() {
    std::cout << "=== qdraw - Basic Usage ===\n\n";

    // =========================================================================
    // 1. Creating a circuit programmatically
    // =========================================================================
    std::cout << "1. A GHZ state on three qubits:\n\n";

    ir::Circuit ghz;
    ghz.addQuantumRegister("q", 3);
    ghz.addClassicalRegister("c", 3);
    ghz.append(ir::Operation::h(0));
    ghz.append(ir::Operation::cx(0, 1));
    ghz.append(ir::Operation::cx(1, 2));
    ghz.barrierAll();
    for (WireIndex i = 0; i < 3; ++i) {
        ghz.append(ir::Operation::measure(i, i));
    }

    std::cout << ghz << "\n";
    std::cout << draw::drawText(ghz) << "\n\n";

    // =========================================================================
    // 2. Parameters, inline labels and conditions
    // =========================================================================
    std::cout << "2. Rotations and a conditioned correction:\n\n";

    ir::Circuit rotations;
    rotations.addQuantumRegister("a", 2);
    rotations.addClassicalRegister("flag", 1);
    rotations.append(ir::Operation::rz(0, constants::PI / 4));
    rotations.append(ir::Operation::cu1(constants::PI / 2, 0, 1));
    rotations.append(ir::Operation::rzz(std::string("gamma"), 0, 1));
    rotations.append(ir::Operation::measure(1, 0));
    rotations.append(ir::Operation::x(0).cIf("flag", 1));

    std::cout << draw::TextDrawing(rotations) << "\n\n";

    // =========================================================================
    // 3. Pages
    // =========================================================================
    std::cout << "3. A long circuit cut at 40 columns:\n\n";

    ir::Circuit chain(3);
    for (int i = 0; i < 6; ++i) {
        chain.append(ir::Operation::cx(0, 1));
        chain.append(ir::Operation::cx(1, 2));
    }

    draw::DrawOptions options;
    options.line_length = 40;
    for (const auto& line : draw::TextDrawing(chain, options).lines()) {
        std::cout << line << "\n";
    }

    // =========================================================================
    // 4. HTML
    // =========================================================================
    std::cout << "\n4. HTML form of the GHZ circuit:\n\n";
    std::cout << draw::TextDrawing(ghz).html() << "\n";

    std::cout << "\n=== Done! ===\n";

    return 0;
}
