// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Layer.hpp
 * @brief One diagram column: an element slot per wire row plus connectors
 *
 * A layer receives the elements of every operation scheduled in its column
 * and then links the elements of each multi-wire operation with a vertical
 * connector. Multi-row boxes (multi-qubit gates, conditions on multi-bit
 * registers) are placed as a stack of box rows instead.
 *
 * @see Elements.hpp for the element glyphs
 * @see ElementCatalog.hpp for which elements each operation places
 */

#pragma once

#include "Elements.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qdraw::draw {

/**
 * @brief Vertical connector between the elements of one operation.
 */
struct Connection {
    /// Display rows linked, sorted top to bottom.
    std::vector<std::size_t> rows;
    /// Text written right of the connector (empty for none).
    std::u32string label;
};

/**
 * @brief Element slots of one column, indexed by display row.
 */
class Layer {
public:
    Layer(std::size_t num_qubit_rows, std::size_t num_clbit_rows)
        : num_qubit_rows_(num_qubit_rows)
        , slots_(num_qubit_rows + num_clbit_rows)
    {}

    /// @brief Places an element on a display row.
    void set(std::size_t row, DrawElement element) {
        slots_.at(row) = std::move(element);
    }

    [[nodiscard]] bool isSet(std::size_t row) const {
        return slots_.at(row).has_value();
    }

    /**
     * @brief Places a multi-row qubit box over consecutive rows.
     *
     * Each box row shows the argument position of the qubit drawn on it;
     * rows the gate only passes over stay blank. The label sits on the
     * vertical centre of the box.
     *
     * @param arg_rows Display row of each qubit argument, in argument order
     * @param label Gate label
     * @param conditional Pre-connect the lower edge towards a condition box
     */
    void setQubitBox(const std::vector<std::size_t>& arg_rows,
                     const std::u32string& label,
                     bool conditional) {
        const auto [first, last] = std::minmax_element(arg_rows.begin(), arg_rows.end());
        const std::size_t top = *first;
        const std::size_t bottom = *last;

        std::vector<std::u32string> row_labels(bottom - top + 1);
        std::size_t label_width = 0;
        for (std::size_t arg = 0; arg < arg_rows.size(); ++arg) {
            auto text = std::u32string(fromUtf8(std::to_string(arg)));
            label_width = std::max(label_width, text.size());
            row_labels[arg_rows[arg] - top] = std::move(text);
        }
        for (auto& text : row_labels) {
            text = ljust(text, label_width, U' ');
        }

        const std::size_t height = bottom - top + 1;
        for (std::size_t row = top; row <= bottom; ++row) {
            ElementKind kind = ElementKind::BoxMid;
            if (row == top) {
                kind = ElementKind::BoxTop;
            } else if (row == bottom) {
                kind = ElementKind::BoxBot;
            }
            auto element = DrawElement::boxRow(kind, label, row_labels[row - top],
                                               conditional ? U'┬' : U'─');
            placeCenterLabel(element, label, row - top, height);
            set(row, std::move(element));
        }
    }

    /**
     * @brief Places a condition box over a classical register.
     * @param rows Sorted display rows of the register
     * @param label Condition label ("= value")
     */
    void setClassicalBox(const std::vector<std::size_t>& rows,
                         const std::u32string& label) {
        if (rows.size() == 1) {
            set(rows.front(), DrawElement::classicalBox(label, U'┴'));
            return;
        }
        const std::size_t top = rows.front();
        const std::size_t bottom = rows.back();
        const std::size_t height = bottom - top + 1;
        for (std::size_t row = top; row <= bottom; ++row) {
            ElementKind kind = ElementKind::ClassicalBoxMid;
            if (row == top) {
                kind = ElementKind::ClassicalBoxTop;
            } else if (row == bottom) {
                kind = ElementKind::ClassicalBoxBot;
            }
            auto element = DrawElement::classicalBoxRow(kind, label, U'┴');
            placeCenterLabel(element, label, row - top, height);
            set(row, std::move(element));
        }
    }

    /**
     * @brief Links the elements on the given rows with a vertical connector.
     *
     * The first element connects downwards, the last upwards, the ones in
     * between both ways. A label goes on the top edge of the last element
     * and widens every linked element so that it fits.
     */
    void connect(Connection connection) {
        auto& rows = connection.rows;
        std::sort(rows.begin(), rows.end());
        rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
        if (rows.size() < 2) {
            return;
        }
        for (std::size_t i = 0; i < rows.size(); ++i) {
            auto& slot = slots_.at(rows[i]);
            if (!slot) {
                continue;
            }
            const bool first = i == 0;
            const bool last = i + 1 == rows.size();
            if (last) {
                slot->connect(true, false, connection.label);
            } else {
                slot->connect(!first, true);
            }
            if (!connection.label.empty()) {
                slot->setRightFill(connection.label.size() + slot->mid().size());
            }
        }
    }

    /**
     * @brief Lines up a labelled connector with the condition box below it.
     *
     * A connector label widens the linked elements to the right only, which
     * moves their connector off the centre the condition box uses. Both are
     * padded on the left until the connector and the box junction share one
     * offset, then on the right to one length.
     *
     * @param rows Rows of the labelled connection
     * @param box_rows Sorted rows of the condition box
     */
    void alignConditionBox(const std::vector<std::size_t>& rows,
                           const std::vector<std::size_t>& box_rows) {
        std::vector<DrawElement*> linked;
        for (std::size_t row : rows) {
            if (auto& slot = slots_.at(row)) {
                linked.push_back(&*slot);
            }
        }
        std::vector<DrawElement*> box;
        for (std::size_t row : box_rows) {
            if (auto& slot = slots_.at(row)) {
                box.push_back(&*slot);
            }
        }
        if (linked.empty() || box.empty()) {
            return;
        }

        const std::size_t linked_at = linked.front()->mid().find(U'■');
        const std::size_t box_at = box.front()->top().find(U'┴');
        if (linked_at == std::u32string::npos || box_at == std::u32string::npos) {
            return;
        }
        const std::size_t offset = std::max(linked_at, box_at);
        for (DrawElement* element : linked) {
            element->setLeftFill(offset - linked_at);
        }
        for (DrawElement* element : box) {
            element->setLeftFill(offset - box_at);
        }

        std::size_t length = 0;
        for (const auto* group : {&linked, &box}) {
            for (const DrawElement* element : *group) {
                length = std::max(length, element->length());
            }
        }
        for (const auto* group : {&linked, &box}) {
            for (DrawElement* element : *group) {
                element->setRightFill(length);
            }
        }
    }

    /// @brief Returns true if no element was placed.
    [[nodiscard]] bool empty() const noexcept {
        return std::none_of(slots_.begin(), slots_.end(),
                            [](const auto& slot) { return slot.has_value(); });
    }

    /**
     * @brief Converts the layer into a full column.
     *
     * Unset rows become plain wire segments, and every element is centered
     * in the width of the widest one.
     */
    [[nodiscard]] std::vector<DrawElement> toColumn() && {
        std::vector<DrawElement> column;
        column.reserve(slots_.size());
        for (std::size_t row = 0; row < slots_.size(); ++row) {
            if (slots_[row]) {
                column.push_back(std::move(*slots_[row]));
            } else {
                column.push_back(DrawElement::emptyWire(row < num_qubit_rows_ ? U'─' : U'═'));
            }
        }
        normalizeWidth(column);
        return column;
    }

    /// @brief Centers every element of a column in the widest element's length.
    static std::size_t normalizeWidth(std::vector<DrawElement>& column) {
        std::size_t longest = 0;
        for (const auto& element : column) {
            longest = std::max(longest, element.length());
        }
        for (auto& element : column) {
            element.setLayerWidth(longest);
        }
        return longest;
    }

private:
    std::size_t num_qubit_rows_;
    std::vector<std::optional<DrawElement>> slots_;

    /**
     * @brief Writes the label on the vertical centre of a box.
     *
     * For an odd height it goes on the mid line of the centre row, for an
     * even height on the edge shared by the two centre rows (the top edge
     * of the lower one).
     */
    static void placeCenterLabel(DrawElement& element, const std::u32string& label,
                                 std::size_t offset, std::size_t height) {
        if (offset != height / 2) {
            return;
        }
        if (height % 2 == 0) {
            element.topEdge().content = label;
        } else {
            element.midEdge().content = label;
        }
    }
};

}  // namespace qdraw::draw
