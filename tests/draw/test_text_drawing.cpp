// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_text_drawing.cpp
 * @brief Rendering tests: gate by gate, justification, multi-qubit boxes
 */

#include "draw/Glyphs.hpp"
#include "draw/TextDrawing.hpp"
#include "ir/Circuit.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <sstream>
#include <string>

namespace qdraw::draw {
namespace {

using ir::Circuit;
using ir::Operation;

constexpr double PI_2 = constants::PI / 2;

std::string joinLines(std::initializer_list<const char*> lines) {
    std::string result;
    for (const char* line : lines) {
        if (!result.empty()) result += "\n";
        result += line;
    }
    return result;
}

std::string draw(const Circuit& circuit, DrawOptions options = {}) {
    const TextDrawing drawing(circuit, options);
    for (const auto& line : drawing.lines()) {
        EXPECT_TRUE(isLegacyText(fromUtf8(line))) << "non code page 437 glyph in " << line;
    }
    return drawing.singleString();
}

Circuit twoRegisters(const char* first, const char* second, std::size_t size) {
    Circuit circuit;
    circuit.addQuantumRegister(first, size);
    circuit.addQuantumRegister(second, size);
    return circuit;
}

// =============================================================================
// Empty Inputs
// =============================================================================

TEST(TextDrawingEmptyTest, NoWiresRendersEmptyString) {
    Circuit circuit;
    EXPECT_EQ(draw(circuit), "");
    EXPECT_TRUE(TextDrawing(circuit).lines().empty());
}

TEST(TextDrawingEmptyTest, NoOperationsRendersLabelsOnly) {
    Circuit circuit(2, 1);
    const std::string expected = joinLines({
        "        ",
        "q_0: |0>",
        "        ",
        "q_1: |0>",
        "        ",
        " c_0: 0 ",
        "        ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingEmptyTest, LabelsWithoutInitialState) {
    Circuit circuit(1, 1);
    DrawOptions options;
    options.initial_state = false;
    const std::string expected = joinLines({
        "     ",
        "q_0: ",
        "     ",
        "c_0: ",
        "     ",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

// =============================================================================
// Measurement
// =============================================================================

TEST(TextDrawingMeasureTest, MeasureToClassicalBit) {
    Circuit circuit(1, 1);
    circuit.append(Operation::measure(0, 0));
    const std::string expected = joinLines({
        "        ┌─┐",
        "q_0: |0>┤M├",
        "        └╥┘",
        " c_0: 0 ═╩═",
        "           ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingMeasureTest, ThreeBitStaircase) {
    Circuit circuit(3, 3);
    for (WireIndex i = 0; i < 3; ++i) {
        circuit.append(Operation::measure(i, i));
    }
    const std::string expected = joinLines({
        "        ┌─┐      ",
        "q_0: |0>┤M├──────",
        "        └╥┘┌─┐   ",
        "q_1: |0>─╫─┤M├───",
        "         ║ └╥┘┌─┐",
        "q_2: |0>─╫──╫─┤M├",
        "         ║  ║ └╥┘",
        " c_0: 0 ═╩══╬══╬═",
        "            ║  ║ ",
        " c_1: 0 ════╩══╬═",
        "               ║ ",
        " c_2: 0 ═══════╩═",
        "                 ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingMeasureTest, ThreeBitStaircaseReversed) {
    Circuit circuit(3, 3);
    for (WireIndex i = 0; i < 3; ++i) {
        circuit.append(Operation::measure(i, i));
    }
    DrawOptions options;
    options.reverse_bits = true;
    const std::string expected = joinLines({
        "              ┌─┐",
        "q_2: |0>──────┤M├",
        "           ┌─┐└╥┘",
        "q_1: |0>───┤M├─╫─",
        "        ┌─┐└╥┘ ║ ",
        "q_0: |0>┤M├─╫──╫─",
        "        └╥┘ ║  ║ ",
        " c_2: 0 ═╬══╬══╩═",
        "         ║  ║    ",
        " c_1: 0 ═╬══╩════",
        "         ║       ",
        " c_0: 0 ═╩═══════",
        "                 ",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingMeasureTest, SeveralRegisters) {
    Circuit circuit;
    circuit.addQuantumRegister("q1", 2);
    circuit.addQuantumRegister("q2", 2);
    circuit.addClassicalRegister("c1", 2);
    circuit.addClassicalRegister("c2", 2);
    circuit.append(Operation::measure(2, 2));
    circuit.append(Operation::measure(3, 3));
    const std::string expected = joinLines({
        "               ",
        "q1_0: |0>──────",
        "               ",
        "q1_1: |0>──────",
        "         ┌─┐   ",
        "q2_0: |0>┤M├───",
        "         └╥┘┌─┐",
        "q2_1: |0>─╫─┤M├",
        "          ║ └╥┘",
        " c1_0: 0 ═╬══╬═",
        "          ║  ║ ",
        " c1_1: 0 ═╬══╬═",
        "          ║  ║ ",
        " c2_0: 0 ═╩══╬═",
        "             ║ ",
        " c2_1: 0 ════╩═",
        "               ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingMeasureTest, HtmlForm) {
    Circuit circuit(1, 1);
    circuit.append(Operation::measure(0, 0));
    const std::string expected = joinLines({
        "<pre style=\"word-wrap: normal;white-space: pre;line-height: 15px;\">        ┌─┐",
        "q_0: |0>┤M├",
        "        └╥┘",
        " c_0: 0 ═╩═",
        "           </pre>",
    });
    EXPECT_EQ(TextDrawing(circuit).html(), expected);
}

// =============================================================================
// Swaps, Controls, Resets
// =============================================================================

TEST(TextDrawingGateTest, SwapsAcrossRegisters) {
    Circuit circuit = twoRegisters("q1", "q2", 2);
    circuit.append(Operation::swap(0, 2));
    circuit.append(Operation::swap(1, 3));
    const std::string expected = joinLines({
        "               ",
        "q1_0: |0>─X────",
        "          │    ",
        "q1_1: |0>─┼──X─",
        "          │  │ ",
        "q2_0: |0>─X──┼─",
        "             │ ",
        "q2_1: |0>────X─",
        "               ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, SwapsReversed) {
    Circuit circuit = twoRegisters("q1", "q2", 2);
    circuit.append(Operation::swap(0, 2));
    circuit.append(Operation::swap(1, 3));
    DrawOptions options;
    options.reverse_bits = true;
    const std::string expected = joinLines({
        "               ",
        "q2_1: |0>────X─",
        "             │ ",
        "q2_0: |0>─X──┼─",
        "          │  │ ",
        "q1_1: |0>─┼──X─",
        "          │    ",
        "q1_0: |0>─X────",
        "               ",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingGateTest, ControlledSwaps) {
    Circuit circuit(3);
    circuit.append(Operation::cswap(0, 1, 2));
    circuit.append(Operation::cswap(1, 0, 2));
    circuit.append(Operation::cswap(2, 1, 0));
    const std::string expected = joinLines({
        "                 ",
        "q_0: |0>─■──X──X─",
        "         │  │  │ ",
        "q_1: |0>─X──■──X─",
        "         │  │  │ ",
        "q_2: |0>─X──X──■─",
        "                 ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, ControlledU3) {
    Circuit circuit(3);
    circuit.append(Operation::cu3(PI_2, PI_2, PI_2, 0, 1));
    circuit.append(Operation::cu3(PI_2, PI_2, PI_2, 2, 0));
    const std::string expected = joinLines({
        "                                    ┌──────────────────────────┐",
        "q_0: |0>─────────────■──────────────┤ U3(1.5708,1.5708,1.5708) ├",
        "        ┌────────────┴─────────────┐└────────────┬─────────────┘",
        "q_1: |0>┤ U3(1.5708,1.5708,1.5708) ├─────────────┼──────────────",
        "        └──────────────────────────┘             │              ",
        "q_2: |0>─────────────────────────────────────────■──────────────",
        "                                                                ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, ControlledU3Reversed) {
    Circuit circuit(3);
    circuit.append(Operation::cu3(PI_2, PI_2, PI_2, 0, 1));
    circuit.append(Operation::cu3(PI_2, PI_2, PI_2, 2, 0));
    DrawOptions options;
    options.reverse_bits = true;
    const std::string expected = joinLines({
        "                                                                ",
        "q_2: |0>─────────────────────────────────────────■──────────────",
        "        ┌──────────────────────────┐             │              ",
        "q_1: |0>┤ U3(1.5708,1.5708,1.5708) ├─────────────┼──────────────",
        "        └────────────┬─────────────┘┌────────────┴─────────────┐",
        "q_0: |0>─────────────■──────────────┤ U3(1.5708,1.5708,1.5708) ├",
        "                                    └──────────────────────────┘",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingGateTest, ControlledRz) {
    Circuit circuit(3);
    circuit.append(Operation::crz(PI_2, 0, 1));
    circuit.append(Operation::crz(PI_2, 2, 0));
    const std::string expected = joinLines({
        "                      ┌────────────┐",
        "q_0: |0>──────■───────┤ Rz(1.5708) ├",
        "        ┌─────┴──────┐└─────┬──────┘",
        "q_1: |0>┤ Rz(1.5708) ├──────┼───────",
        "        └────────────┘      │       ",
        "q_2: |0>────────────────────■───────",
        "                                    ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, ControlledNot) {
    Circuit circuit(3);
    circuit.append(Operation::cx(0, 1));
    circuit.append(Operation::cx(2, 0));
    const std::string expected = joinLines({
        "             ┌───┐",
        "q_0: |0>──■──┤ X ├",
        "        ┌─┴─┐└─┬─┘",
        "q_1: |0>┤ X ├──┼──",
        "        └───┘  │  ",
        "q_2: |0>───────■──",
        "                  ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, ControlledNotThenReversedNeedTwoColumns) {
    Circuit circuit(2);
    circuit.append(Operation::cx(0, 1));
    circuit.append(Operation::cx(1, 0));
    const std::string expected = joinLines({
        "             ┌───┐",
        "q_0: |0>──■──┤ X ├",
        "        ┌─┴─┐└─┬─┘",
        "q_1: |0>┤ X ├──■──",
        "        └───┘     ",
    });
    TextDrawing drawing(circuit);
    EXPECT_EQ(drawing.numColumns(), 2u);
    EXPECT_EQ(drawing.singleString(), expected);
}

TEST(TextDrawingGateTest, ControlledY) {
    Circuit circuit(3);
    circuit.append(Operation::cy(0, 1));
    circuit.append(Operation::cy(2, 0));
    const std::string expected = joinLines({
        "             ┌───┐",
        "q_0: |0>──■──┤ Y ├",
        "        ┌─┴─┐└─┬─┘",
        "q_1: |0>┤ Y ├──┼──",
        "        └───┘  │  ",
        "q_2: |0>───────■──",
        "                  ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, ControlledZ) {
    Circuit circuit(3);
    circuit.append(Operation::cz(0, 1));
    circuit.append(Operation::cz(2, 0));
    const std::string expected = joinLines({
        "              ",
        "q_0: |0>─■──■─",
        "         │  │ ",
        "q_1: |0>─■──┼─",
        "            │ ",
        "q_2: |0>────■─",
        "              ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, ControlledH) {
    Circuit circuit(3);
    circuit.append(Operation::ch(0, 1));
    circuit.append(Operation::ch(2, 0));
    const std::string expected = joinLines({
        "             ┌───┐",
        "q_0: |0>──■──┤ H ├",
        "        ┌─┴─┐└─┬─┘",
        "q_1: |0>┤ H ├──┼──",
        "        └───┘  │  ",
        "q_2: |0>───────■──",
        "                  ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, ZZInteractionLabelsConnector) {
    Circuit circuit(3);
    circuit.append(Operation::rzz(0.0, 0, 1));
    circuit.append(Operation::rzz(PI_2, 2, 1));
    const std::string expected = joinLines({
        "                             ",
        "q_0: |0>─■───────────────────",
        "         │zz(0)              ",
        "q_1: |0>─■───────■───────────",
        "                 │zz(1.5708) ",
        "q_2: |0>─────────■───────────",
        "                             ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, ControlledPhaseLabelsConnector) {
    Circuit circuit(3);
    circuit.append(Operation::cu1(PI_2, 0, 1));
    circuit.append(Operation::cu1(PI_2, 2, 0));
    const std::string expected = joinLines({
        "                          ",
        "q_0: |0>─■────────■───────",
        "         │1.5708  │       ",
        "q_1: |0>─■────────┼───────",
        "                  │1.5708 ",
        "q_2: |0>──────────■───────",
        "                          ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, ControlledPhaseReversed) {
    Circuit circuit(3);
    circuit.append(Operation::cu1(PI_2, 0, 1));
    circuit.append(Operation::cu1(PI_2, 2, 0));
    DrawOptions options;
    options.reverse_bits = true;
    const std::string expected = joinLines({
        "                          ",
        "q_2: |0>──────────■───────",
        "                  │       ",
        "q_1: |0>─■────────┼───────",
        "         │1.5708  │1.5708 ",
        "q_0: |0>─■────────■───────",
        "                          ",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingGateTest, Toffoli) {
    Circuit circuit(3);
    circuit.append(Operation::ccx(0, 1, 2));
    circuit.append(Operation::ccx(2, 0, 1));
    circuit.append(Operation::ccx(2, 1, 0));
    const std::string expected = joinLines({
        "                  ┌───┐",
        "q_0: |0>──■────■──┤ X ├",
        "          │  ┌─┴─┐└─┬─┘",
        "q_1: |0>──■──┤ X ├──■──",
        "        ┌─┴─┐└─┬─┘  │  ",
        "q_2: |0>┤ X ├──■────■──",
        "        └───┘          ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, Reset) {
    Circuit circuit = twoRegisters("q1", "q2", 2);
    circuit.append(Operation::reset(0));
    circuit.append(Operation::reset(1));
    circuit.append(Operation::reset(3));
    const std::string expected = joinLines({
        "              ",
        "q1_0: |0>─|0>─",
        "              ",
        "q1_1: |0>─|0>─",
        "              ",
        "q2_0: |0>─────",
        "              ",
        "q2_1: |0>─|0>─",
        "              ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingGateTest, SingleQubitGates) {
    Circuit circuit = twoRegisters("q1", "q2", 2);
    circuit.append(Operation::h(0));
    circuit.append(Operation::h(1));
    circuit.append(Operation::h(3));
    const std::string expected = joinLines({
        "         ┌───┐",
        "q1_0: |0>┤ H ├",
        "         ├───┤",
        "q1_1: |0>┤ H ├",
        "         └───┘",
        "q2_0: |0>─────",
        "         ┌───┐",
        "q2_1: |0>┤ H ├",
        "         └───┘",
    });
    EXPECT_EQ(draw(circuit), expected);
}

// =============================================================================
// Barriers
// =============================================================================

TEST(TextDrawingBarrierTest, OnlyListedWiresShowSeparator) {
    Circuit circuit = twoRegisters("q1", "q2", 2);
    circuit.append(Operation::barrier({0, 1}));
    circuit.append(Operation::barrier({3}));
    const std::string expected = joinLines({
        "          ░ ",
        "q1_0: |0>─░─",
        "          ░ ",
        "q1_1: |0>─░─",
        "          ░ ",
        "q2_0: |0>───",
        "          ░ ",
        "q2_1: |0>─░─",
        "          ░ ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingBarrierTest, BoxBetweenListedWiresKeepsItsEdges) {
    Circuit circuit(4);
    circuit.append(Operation::barrier({0, 2}));
    circuit.append(Operation::h(1));
    circuit.append(Operation::h(0));
    const std::string expected = joinLines({
        "          ░  ┌───┐",
        "q_0: |0>──░──┤ H ├",
        "          ░  └───┘",
        "        ┌───┐     ",
        "q_1: |0>┤ H ├─────",
        "        └───┘     ",
        "          ░       ",
        "q_2: |0>──░───────",
        "          ░       ",
        "q_3: |0>──────────",
        "                  ",
    });
    EXPECT_EQ(draw(circuit), expected);
    EXPECT_EQ(TextDrawing(circuit).schedule().front().size(), 2u);
}

TEST(TextDrawingBarrierTest, HiddenBarriersStillSchedule) {
    Circuit circuit = twoRegisters("q1", "q2", 2);
    circuit.append(Operation::h(0));
    circuit.append(Operation::h(1));
    circuit.append(Operation::barrier({0, 1}));
    circuit.append(Operation::barrier({3}));
    circuit.append(Operation::h(2));
    circuit.append(Operation::h(3));
    DrawOptions options;
    options.plot_barriers = false;
    const std::string expected = joinLines({
        "         ┌───┐     ",
        "q1_0: |0>┤ H ├─────",
        "         ├───┤     ",
        "q1_1: |0>┤ H ├─────",
        "         ├───┤     ",
        "q2_0: |0>┤ H ├─────",
        "         └───┘┌───┐",
        "q2_1: |0>─────┤ H ├",
        "              └───┘",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingBarrierTest, ColumnOfHiddenBarriersIsDropped) {
    Circuit circuit(2);
    circuit.append(Operation::h(0));
    circuit.barrierAll();
    circuit.append(Operation::h(0));
    DrawOptions options;
    options.plot_barriers = false;

    TextDrawing drawing(circuit, options);
    EXPECT_EQ(drawing.schedule().size(), 3u);
    EXPECT_EQ(drawing.numColumns(), 2u);
}

// =============================================================================
// Justification
// =============================================================================

Circuit justifyCircuit() {
    Circuit circuit;
    circuit.addQuantumRegister("q1", 2);
    circuit.addClassicalRegister("c1", 2);
    circuit.append(Operation::x(0));
    circuit.append(Operation::h(1));
    circuit.append(Operation::measure(1, 1));
    return circuit;
}

TEST(TextDrawingJustifyTest, Left) {
    DrawOptions options;
    options.justify = Justification::Left;
    const std::string expected = joinLines({
        "         ┌───┐   ",
        "q1_0: |0>┤ X ├───",
        "         ├───┤┌─┐",
        "q1_1: |0>┤ H ├┤M├",
        "         └───┘└╥┘",
        " c1_0: 0 ══════╬═",
        "               ║ ",
        " c1_1: 0 ══════╩═",
        "                 ",
    });
    EXPECT_EQ(draw(justifyCircuit(), options), expected);
}

TEST(TextDrawingJustifyTest, Right) {
    DrawOptions options;
    options.justify = Justification::Right;
    const std::string expected = joinLines({
        "              ┌───┐",
        "q1_0: |0>─────┤ X ├",
        "         ┌───┐└┬─┬┘",
        "q1_1: |0>┤ H ├─┤M├─",
        "         └───┘ └╥┘ ",
        " c1_0: 0 ═══════╬══",
        "                ║  ",
        " c1_1: 0 ═══════╩══",
        "                   ",
    });
    EXPECT_EQ(draw(justifyCircuit(), options), expected);
}

TEST(TextDrawingJustifyTest, None) {
    DrawOptions options;
    options.justify = Justification::None;
    const std::string expected = joinLines({
        "         ┌───┐        ",
        "q1_0: |0>┤ X ├────────",
        "         └───┘┌───┐┌─┐",
        "q1_1: |0>─────┤ H ├┤M├",
        "              └───┘└╥┘",
        " c1_0: 0 ═══════════╬═",
        "                    ║ ",
        " c1_1: 0 ═══════════╩═",
        "                      ",
    });
    EXPECT_EQ(draw(justifyCircuit(), options), expected);
}

TEST(TextDrawingJustifyTest, BarrierHoldsBothJustifications) {
    Circuit circuit;
    circuit.addQuantumRegister("q1", 2);
    circuit.append(Operation::h(0));
    circuit.barrierAll();
    circuit.append(Operation::h(1));
    const std::string expected = joinLines({
        "         ┌───┐ ░      ",
        "q1_0: |0>┤ H ├─░──────",
        "         └───┘ ░ ┌───┐",
        "q1_1: |0>──────░─┤ H ├",
        "               ░ └───┘",
    });
    for (auto justify : {Justification::Left, Justification::Right}) {
        DrawOptions options;
        options.justify = justify;
        EXPECT_EQ(draw(circuit, options), expected) << justificationName(justify);
    }
}

TEST(TextDrawingJustifyTest, OverlappingControlledNots) {
    Circuit circuit;
    circuit.addQuantumRegister("q1", 4);
    circuit.append(Operation::cx(0, 3));
    circuit.append(Operation::cx(1, 2));
    const std::string expected = joinLines({
        "                   ",
        "q1_0: |0>──■───────",
        "           │       ",
        "q1_1: |0>──┼────■──",
        "           │  ┌─┴─┐",
        "q1_2: |0>──┼──┤ X ├",
        "         ┌─┴─┐└───┘",
        "q1_3: |0>┤ X ├─────",
        "         └───┘     ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingJustifyTest, MeasureSpanBlocksLowerWire) {
    Circuit circuit;
    circuit.addQuantumRegister("q1", 2);
    circuit.addClassicalRegister("c1", 2);
    circuit.append(Operation::measure(0, 0));
    circuit.append(Operation::x(1));
    const std::string expected = joinLines({
        "         ┌─┐     ",
        "q1_0: |0>┤M├─────",
        "         └╥┘┌───┐",
        "q1_1: |0>─╫─┤ X ├",
        "          ║ └───┘",
        " c1_0: 0 ═╩══════",
        "                 ",
        " c1_1: 0 ════════",
        "                 ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingJustifyTest, RightMeasureSharesColumnWithWiderBox) {
    Circuit circuit;
    circuit.addQuantumRegister("q1", 2);
    circuit.addClassicalRegister("c1", 2);
    circuit.append(Operation::x(0));
    circuit.append(Operation::measure(1, 1));
    DrawOptions options;
    options.justify = Justification::Right;
    const std::string expected = joinLines({
        "         ┌───┐",
        "q1_0: |0>┤ X ├",
        "         └┬─┬┘",
        "q1_1: |0>─┤M├─",
        "          └╥┘ ",
        " c1_0: 0 ══╬══",
        "           ║  ",
        " c1_1: 0 ══╩══",
        "              ",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingJustifyTest, BoxLengthIndependentOfOtherColumns) {
    Circuit circuit;
    circuit.addQuantumRegister("q1", 3);
    circuit.append(Operation::h(0));
    circuit.append(Operation::h(0));
    circuit.append(Operation::u1(2, 0.0000001));
    const std::string expected = joinLines({
        "             ┌───┐    ┌───┐",
        "q1_0: |0>────┤ H ├────┤ H ├",
        "             └───┘    └───┘",
        "q1_1: |0>──────────────────",
        "         ┌───────────┐     ",
        "q1_2: |0>┤ U1(1e-07) ├─────",
        "         └───────────┘     ",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingJustifyTest, SmallGatesBesideLongGate) {
    Circuit circuit(3);
    circuit.append(Operation::swap(0, 1));
    circuit.append(Operation::rz(2, 11111.0));
    const std::string expected = joinLines({
        "                     ",
        "q_0: |0>──────X──────",
        "              │      ",
        "q_1: |0>──────X──────",
        "        ┌───────────┐",
        "q_2: |0>┤ Rz(11111) ├",
        "        └───────────┘",
    });
    EXPECT_EQ(draw(circuit), expected);
}

// =============================================================================
// Multi-qubit Boxes
// =============================================================================

TEST(TextDrawingMultiBoxTest, TwoQubitsReversed) {
    Circuit circuit(2);
    circuit.append(Operation::gate("twoQ", {0, 1}));
    DrawOptions options;
    options.reverse_bits = true;
    const std::string expected = joinLines({
        "        ┌───────┐",
        "q_1: |0>┤1      ├",
        "        │  twoQ │",
        "q_0: |0>┤0      ├",
        "        └───────┘",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingMultiBoxTest, CrossedArguments) {
    Circuit circuit(2);
    circuit.append(Operation::gate("twoQ", {1, 0}));
    DrawOptions options;
    options.reverse_bits = true;
    const std::string expected = joinLines({
        "        ┌───────┐",
        "q_1: |0>┤0      ├",
        "        │  twoQ │",
        "q_0: |0>┤1      ├",
        "        └───────┘",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingMultiBoxTest, ThreeQubitsCrossed) {
    Circuit circuit(3);
    circuit.append(Operation::gate("threeQ", {1, 2, 0}));
    DrawOptions options;
    options.reverse_bits = true;
    const std::string expected = joinLines({
        "        ┌─────────┐",
        "q_2: |0>┤1        ├",
        "        │         │",
        "q_1: |0>┤0 threeQ ├",
        "        │         │",
        "q_0: |0>┤2        ├",
        "        └─────────┘",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingMultiBoxTest, PassesOverMiddleWire) {
    Circuit circuit(3);
    circuit.append(Operation::gate("twoQ", {0, 2}));
    DrawOptions options;
    options.reverse_bits = true;
    const std::string expected = joinLines({
        "        ┌───────┐",
        "q_2: |0>┤1      ├",
        "        │       │",
        "q_1: |0>┤  twoQ ├",
        "        │       │",
        "q_0: |0>┤0      ├",
        "        └───────┘",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingMultiBoxTest, PassesOverTwoWires) {
    Circuit circuit(4);
    circuit.append(Operation::gate("twoQ", {0, 3}));
    DrawOptions options;
    options.reverse_bits = true;
    const std::string expected = joinLines({
        "        ┌───────┐",
        "q_3: |0>┤1      ├",
        "        │       │",
        "q_2: |0>┤       ├",
        "        │  twoQ │",
        "q_1: |0>┤       ├",
        "        │       │",
        "q_0: |0>┤0      ├",
        "        └───────┘",
    });
    EXPECT_EQ(draw(circuit, options), expected);
}

TEST(TextDrawingMultiBoxTest, NameIsNotCapitalized) {
    Circuit circuit(2);
    circuit.append(Operation::gate("multiplexer", {0, 1}));
    const std::string expected = joinLines({
        "        ┌──────────────┐",
        "q_0: |0>┤0             ├",
        "        │  multiplexer │",
        "q_1: |0>┤1             ├",
        "        └──────────────┘",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingMultiBoxTest, SingleQubitGateIsCapitalized) {
    Circuit circuit(1);
    circuit.append(Operation::gate("kraus", {0}));
    const std::string expected = joinLines({
        "        ┌───────┐",
        "q_0: |0>┤ Kraus ├",
        "        └───────┘",
    });
    EXPECT_EQ(draw(circuit), expected);
}

// =============================================================================
// Parameters
// =============================================================================

TEST(TextDrawingParamsTest, NumericAndSymbolicMix) {
    Circuit circuit(2);
    circuit.append(Operation::cu3(PI_2, std::string("theta"), constants::PI, 0, 1));
    const std::string expected = joinLines({
        "                                   ",
        "q_0: |0>─────────────■─────────────",
        "        ┌────────────┴────────────┐",
        "q_1: |0>┤ U3(1.5708,theta,3.1416) ├",
        "        └─────────────────────────┘",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingParamsTest, SymbolicExpressionsVerbatim) {
    Circuit circuit(2);
    circuit.append(Operation::cu3(PI_2, std::string("pi/2"), std::string("pi"), 0, 1));
    const std::string expected = joinLines({
        "                              ",
        "q_0: |0>──────────■───────────",
        "        ┌─────────┴──────────┐",
        "q_1: |0>┤ U3(1.5708,pi/2,pi) ├",
        "        └────────────────────┘",
    });
    EXPECT_EQ(draw(circuit), expected);
}

TEST(TextDrawingParamsTest, FormatParam) {
    EXPECT_EQ(formatParam(PI_2), "1.5708");
    EXPECT_EQ(formatParam(constants::PI), "3.1416");
    EXPECT_EQ(formatParam(0.0000001), "1e-07");
    EXPECT_EQ(formatParam(11111.0), "11111");
    EXPECT_EQ(formatParam(-2.0), "-2");
    EXPECT_EQ(formatParam(0.0), "0");
    EXPECT_EQ(formatParam(std::string("theta")), "theta");
}

TEST(TextDrawingParamsTest, BoxLabels) {
    EXPECT_EQ(boxLabel(Operation::rz(0, PI_2), true), "Rz(1.5708)");
    EXPECT_EQ(boxLabel(Operation::gate("myGate", {0, 1}), false), "myGate");
    EXPECT_EQ(boxLabel(Operation::gate("myGate", {0}), true), "Mygate");
    EXPECT_EQ(capitalize(""), "");
}

// =============================================================================
// Invariants
// =============================================================================

Circuit mixedCircuit() {
    Circuit circuit;
    circuit.addQuantumRegister("q", 4);
    circuit.addClassicalRegister("c", 2);
    circuit.append(Operation::h(0));
    circuit.append(Operation::cx(0, 3));
    circuit.append(Operation::gate("twoQ", {1, 2}, {0.25}));
    circuit.append(Operation::rzz(PI_2, 2, 3));
    circuit.append(Operation::barrier({0, 1}));
    circuit.append(Operation::measure(3, 1));
    circuit.append(Operation::x(1).cIf("c", 2));
    circuit.append(Operation::cswap(0, 1, 2));
    return circuit;
}

TEST(TextDrawingInvariantTest, AllLinesHaveTheSameLength) {
    for (auto mode : {VerticalCompression::High, VerticalCompression::Medium,
                      VerticalCompression::Low}) {
        DrawOptions options;
        options.vertical_compression = mode;
        const auto lines = TextDrawing(mixedCircuit(), options).lines();
        ASSERT_FALSE(lines.empty());
        const std::size_t width = fromUtf8(lines.front()).size();
        for (const auto& line : lines) {
            EXPECT_EQ(fromUtf8(line).size(), width) << line;
            EXPECT_TRUE(isLegacyText(fromUtf8(line))) << line;
        }
    }
}

TEST(TextDrawingInvariantTest, HighCompressionLineCount) {
    const auto lines = TextDrawing(mixedCircuit()).lines();
    // one mid line per wire plus one separator line between and around them
    EXPECT_EQ(lines.size(), 2u * 6u + 1u);
}

TEST(TextDrawingInvariantTest, ReversalKeepsLabelsAndMirrorsWireOrder) {
    Circuit circuit(3);
    circuit.append(Operation::h(0));
    circuit.append(Operation::x(2));
    DrawOptions options;
    options.reverse_bits = true;

    const auto direct = TextDrawing(circuit).lines();
    const auto reversed = TextDrawing(circuit, options).lines();
    ASSERT_EQ(direct.size(), reversed.size());
    // Mid lines of the wires come out in opposite order
    EXPECT_EQ(direct[1], reversed[5]);
    EXPECT_EQ(direct[3], reversed[3]);
    EXPECT_EQ(direct[5], reversed[1]);
}

TEST(TextDrawingInvariantTest, StreamOutputMatchesSingleString) {
    Circuit circuit(1);
    circuit.append(Operation::h(0));
    TextDrawing drawing(circuit);
    std::ostringstream os;
    os << drawing;
    EXPECT_EQ(os.str(), drawing.singleString());
    EXPECT_EQ(drawText(circuit), drawing.singleString());
}

}  // namespace
}  // namespace qdraw::draw
