// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file benchmark_rendering.cpp
 * @brief Benchmark suite for text rendering of quantum circuits
 *
 * Times layout and rendering on standard circuit patterns:
 * - QFT (Quantum Fourier Transform)
 * - Random circuits
 * - QAOA-style circuits
 */

#include "draw/TextDrawing.hpp"
#include "ir/Circuit.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace qdraw;

// ============================================================================
// Circuit Generators
// ============================================================================

/**
 * @brief Generates a Quantum Fourier Transform circuit.
 *
 * n Hadamards, n(n-1)/2 controlled phases and the final swap network.
 */
ir::Circuit generateQFT(std::size_t n) {
    ir::Circuit circuit(n, n);

    for (std::size_t i = 0; i < n; ++i) {
        circuit.append(ir::Operation::h(i));
        for (std::size_t j = i + 1; j < n; ++j) {
            const double angle = constants::PI / std::pow(2.0, static_cast<double>(j - i));
            circuit.append(ir::Operation::cu1(angle, j, i));
        }
    }
    for (std::size_t i = 0; i < n / 2; ++i) {
        circuit.append(ir::Operation::swap(i, n - 1 - i));
    }
    for (std::size_t i = 0; i < n; ++i) {
        circuit.append(ir::Operation::measure(i, i));
    }

    return circuit;
}

/**
 * @brief Generates a random circuit with mixed operation kinds.
 */
ir::Circuit generateRandom(std::size_t n_qubits, std::size_t n_ops, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> qubit_dist(0, n_qubits - 1);
    std::uniform_int_distribution<int> kind_dist(0, 6);
    std::uniform_real_distribution<double> angle_dist(0.0, 2 * constants::PI);

    ir::Circuit circuit(n_qubits, 1);

    for (std::size_t i = 0; i < n_ops; ++i) {
        const int kind = kind_dist(rng);
        const std::size_t q0 = qubit_dist(rng);
        std::size_t q1 = qubit_dist(rng);
        if (q1 == q0) {
            q1 = (q0 + 1) % n_qubits;
        }

        switch (kind) {
            case 0:
                circuit.append(ir::Operation::h(q0));
                break;
            case 1:
                circuit.append(ir::Operation::rz(q0, angle_dist(rng)));
                break;
            case 2:
                circuit.append(ir::Operation::cx(q0, q1));
                break;
            case 3:
                circuit.append(ir::Operation::cz(q0, q1));
                break;
            case 4:
                circuit.append(ir::Operation::swap(q0, q1));
                break;
            case 5:
                circuit.append(ir::Operation::measure(q0, 0));
                break;
            case 6:
                circuit.append(ir::Operation::x(q0).cIf("c", 1));
                break;
        }
    }

    return circuit;
}

/**
 * @brief Generates a QAOA-style circuit.
 *
 * Alternating layers of ZZ interactions on a ring and X rotations.
 */
ir::Circuit generateQAOA(std::size_t n_qubits, std::size_t p_layers) {
    ir::Circuit circuit(n_qubits);

    for (std::size_t i = 0; i < n_qubits; ++i) {
        circuit.append(ir::Operation::h(i));
    }

    for (std::size_t layer = 0; layer < p_layers; ++layer) {
        const double gamma = constants::PI / (4.0 * static_cast<double>(layer + 1));
        const double beta = constants::PI / (2.0 * static_cast<double>(layer + 1));

        for (std::size_t i = 0; i < n_qubits; ++i) {
            circuit.append(ir::Operation::rzz(gamma, i, (i + 1) % n_qubits));
        }
        circuit.barrierAll();
        for (std::size_t i = 0; i < n_qubits; ++i) {
            circuit.append(ir::Operation::rx(i, beta));
        }
    }

    return circuit;
}

// ============================================================================
// Benchmarking Infrastructure
// ============================================================================

struct BenchmarkResult {
    std::string name;
    std::size_t n_wires;
    std::size_t n_ops;
    std::size_t n_columns;
    std::size_t n_lines;
    double layout_time_ms;
    double render_time_ms;
};

BenchmarkResult runBenchmark(const std::string& name, const ir::Circuit& circuit) {
    BenchmarkResult result;
    result.name = name;
    result.n_wires = circuit.numWires();
    result.n_ops = circuit.numOperations();

    draw::DrawOptions options;
    options.line_length = 120;

    auto layout_start = std::chrono::high_resolution_clock::now();
    draw::TextDrawing drawing(circuit, options);
    auto layout_end = std::chrono::high_resolution_clock::now();
    result.layout_time_ms =
        std::chrono::duration<double, std::milli>(layout_end - layout_start).count();
    result.n_columns = drawing.numColumns();

    auto render_start = std::chrono::high_resolution_clock::now();
    const auto lines = drawing.lines();
    auto render_end = std::chrono::high_resolution_clock::now();
    result.render_time_ms =
        std::chrono::duration<double, std::milli>(render_end - render_start).count();
    result.n_lines = lines.size();

    return result;
}

void printResults(const std::vector<BenchmarkResult>& results) {
    std::cout << "\n";
    std::cout << "================================================================================\n";
    std::cout << "                          QDRAW TEXT RENDERING BENCHMARKS                        \n";
    std::cout << "================================================================================\n\n";

    std::cout << std::left << std::setw(20) << "Circuit"
              << std::right << std::setw(8) << "Wires"
              << std::setw(8) << "Ops"
              << std::setw(10) << "Columns"
              << std::setw(8) << "Lines"
              << std::setw(14) << "Layout ms"
              << std::setw(14) << "Render ms"
              << "\n";

    std::cout << std::string(82, '-') << "\n";

    double total_time = 0;
    for (const auto& r : results) {
        std::cout << std::left << std::setw(20) << r.name
                  << std::right << std::setw(8) << r.n_wires
                  << std::setw(8) << r.n_ops
                  << std::setw(10) << r.n_columns
                  << std::setw(8) << r.n_lines
                  << std::setw(14) << std::fixed << std::setprecision(2) << r.layout_time_ms
                  << std::setw(14) << std::fixed << std::setprecision(2) << r.render_time_ms
                  << "\n";
        total_time += r.layout_time_ms + r.render_time_ms;
    }

    std::cout << std::string(82, '-') << "\n";
    std::cout << std::left << std::setw(20) << "TOTAL"
              << std::right << std::setw(62) << std::fixed << std::setprecision(2)
              << total_time << " ms\n\n";
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "Generating benchmark circuits...\n";

    std::vector<BenchmarkResult> results;

    for (std::size_t n : {4UL, 8UL, 16UL}) {
        results.push_back(runBenchmark("QFT-" + std::to_string(n), generateQFT(n)));
    }

    for (auto [n, g] : std::vector<std::pair<std::size_t, std::size_t>>{
             {10, 100}, {20, 500}, {50, 1000}}) {
        results.push_back(runBenchmark(
            "Random-" + std::to_string(n) + "x" + std::to_string(g), generateRandom(n, g)));
    }

    for (auto [n, p] : std::vector<std::pair<std::size_t, std::size_t>>{
             {10, 2}, {10, 4}, {20, 2}}) {
        results.push_back(runBenchmark(
            "QAOA-" + std::to_string(n) + "-p" + std::to_string(p), generateQAOA(n, p)));
    }

    printResults(results);

    return 0;
}
