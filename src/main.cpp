// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file main.cpp
 * @brief qdraw demonstration
 *
 * Draws a few sample circuits with the qdraw::draw text renderer.
 *
 * Usage: qdraw_demo [line_length [justify [compression]]]
 *
 * The log level is read from QDRAW_LOG_LEVEL ("debug", "trace", ...).
 */

#include "draw/DrawError.hpp"
#include "draw/DrawOptions.hpp"
#include "draw/TextDrawing.hpp"
#include "ir/Circuit.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace qdraw;

ir::Circuit bellCircuit() {
    ir::Circuit circuit(2, 2);
    circuit.append(ir::Operation::h(0));
    circuit.append(ir::Operation::cx(0, 1));
    circuit.barrierAll();
    circuit.append(ir::Operation::measure(0, 0));
    circuit.append(ir::Operation::measure(1, 1));
    return circuit;
}

ir::Circuit teleportCircuit() {
    ir::Circuit circuit;
    circuit.addQuantumRegister("q", 3);
    circuit.addClassicalRegister("m0", 1);
    circuit.addClassicalRegister("m1", 1);
    circuit.append(ir::Operation::u3(0, constants::PI / 3, std::string("phi"), 0.0));
    circuit.append(ir::Operation::h(1));
    circuit.append(ir::Operation::cx(1, 2));
    circuit.append(ir::Operation::cx(0, 1));
    circuit.append(ir::Operation::h(0));
    circuit.append(ir::Operation::measure(0, 0));
    circuit.append(ir::Operation::measure(1, 1));
    circuit.append(ir::Operation::x(2).cIf("m1", 1));
    circuit.append(ir::Operation::z(2).cIf("m0", 1));
    return circuit;
}

void configureLogging() {
    if (const char* level = std::getenv("QDRAW_LOG_LEVEL")) {
        spdlog::set_level(spdlog::level::from_str(level));
    }
}

draw::DrawOptions parseArgs(int argc, char** argv) {
    draw::DrawOptions options;
    if (argc > 1) {
        options.line_length = std::stoul(argv[1]);
    }
    if (argc > 2) {
        options.justify = draw::parseJustification(argv[2]);
    }
    if (argc > 3) {
        options.vertical_compression = draw::parseVerticalCompression(argv[3]);
    }
    return options;
}

}  // namespace

int main(int argc, char** argv) {
    configureLogging();

    draw::DrawOptions options;
    try {
        options = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n"
                  << "Usage: " << argv[0] << " [line_length [left|right|none [high|medium|low]]]\n";
        return 2;
    }

    spdlog::info("justify={} compression={}", draw::justificationName(options.justify),
                 draw::compressionName(options.vertical_compression));

    try {
        std::cout << "=== Bell pair ===\n\n";
        std::cout << draw::TextDrawing(bellCircuit(), options) << "\n\n";

        std::cout << "=== Teleportation ===\n\n";
        std::cout << draw::TextDrawing(teleportCircuit(), options) << "\n\n";

        // A reference to a qubit the circuit does not have is reported, not drawn
        ir::Circuit broken(2);
        broken.append(ir::Operation::h(0));
        broken.append(ir::Operation::cx(0, 4));
        std::cout << "=== Inconsistent circuit ===\n\n";
        std::cout << draw::TextDrawing(broken, options) << "\n";
    } catch (const draw::DrawError& e) {
        std::cout << "Cannot draw: " << e << "\n";
    }

    return 0;
}
