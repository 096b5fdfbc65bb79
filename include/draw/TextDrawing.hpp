// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file TextDrawing.hpp
 * @brief Text diagram of a circuit: the render entry point
 *
 * Runs the drawing pipeline for one circuit:
 *
 * 1. every operation is checked (supported kind, consistent wire references);
 * 2. the LayerBuilder assigns operations to columns;
 * 3. the ElementCatalog fills one Layer per column;
 * 4. the Paginator cuts the columns into pages;
 * 5. each page is drawn into lines (Canvas.hpp).
 *
 * All checks run in the constructor, so a TextDrawing that was constructed
 * always renders.
 *
 * Example:
 * @code
 * Circuit circuit(2, 1);
 * circuit.append(Operation::h(0));
 * circuit.append(Operation::cx(0, 1));
 * circuit.append(Operation::measure(1, 0));
 *
 * DrawOptions options;
 * options.line_length = 80;
 * std::cout << TextDrawing(circuit, options) << "\n";
 * @endcode
 */

#pragma once

#include "../ir/Circuit.hpp"
#include "../ir/Types.hpp"
#include "Canvas.hpp"
#include "DrawOptions.hpp"
#include "ElementCatalog.hpp"
#include "Elements.hpp"
#include "Layer.hpp"
#include "LayerBuilder.hpp"
#include "Paginator.hpp"
#include "TextUtils.hpp"
#include "WireOrder.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace qdraw::draw {

/**
 * @brief Laid-out text diagram of a circuit.
 */
class TextDrawing {
public:
    /**
     * @brief Lays out a circuit.
     * @throws DrawError if an operation cannot be drawn; nothing is rendered
     */
    explicit TextDrawing(const ir::Circuit& circuit, DrawOptions options = {})
        : options_(options)
    {
        const WireOrder order(circuit, options_.reverse_bits);
        const LayerBuilder builder(circuit, order);
        for (OpIndex i = 0; i < circuit.numOperations(); ++i) {
            ElementCatalog::checkSupported(i, circuit.operation(i));
            builder.checkReferences(i);
        }
        schedule_ = builder.build(options_.justify);

        num_rows_ = order.numRows();
        if (num_rows_ == 0) {
            return;
        }

        for (const auto& label : order.labels(options_.initial_state)) {
            labels_.push_back(DrawElement::input(label));
        }
        for (const auto& label : order.labels(false)) {
            continuation_labels_.push_back(DrawElement::input(label));
        }

        const ElementCatalog catalog(order, labelLimit(continuation_labels_));
        for (std::size_t c = 0; c < schedule_.size(); ++c) {
            Layer layer(order.numQubits(), order.numClbits());
            for (OpIndex i : schedule_[c]) {
                catalog.place(circuit.operation(i), layer, options_.plot_barriers);
            }
            if (layer.empty()) {
                spdlog::debug("column {} has nothing to draw, dropped", c);
                continue;
            }
            columns_.push_back(std::move(layer).toColumn());
            spdlog::trace("column {} width {}", c, columns_.back().front().length());
        }
    }

    // -------------------------------------------------------------------------
    // Rendering
    // -------------------------------------------------------------------------

    /// @brief Lines of the diagram, paginated by the configured line length.
    [[nodiscard]] std::vector<std::string> lines() const {
        return lines(options_.line_length);
    }

    /**
     * @brief Lines of the diagram.
     * @param line_length Page width; std::nullopt renders a single page
     */
    [[nodiscard]] std::vector<std::string> lines(std::optional<std::size_t> line_length) const {
        std::vector<std::string> result;
        if (num_rows_ == 0) {
            return result;
        }
        const Paginator paginator(labels_, continuation_labels_);
        for (const auto& page : paginator.paginate(columns_, line_length)) {
            for (const auto& line : drawRows(page, options_.vertical_compression)) {
                result.push_back(toUtf8(line));
            }
        }
        return result;
    }

    /// @brief The diagram as one string, lines joined by '\n'.
    [[nodiscard]] std::string singleString() const {
        std::string result;
        const auto all = lines();
        for (std::size_t i = 0; i < all.size(); ++i) {
            if (i > 0) result += "\n";
            result += all[i];
        }
        return result;
    }

    /// @brief The diagram wrapped in a styled `<pre>` element.
    [[nodiscard]] std::string html() const {
        return std::string("<pre style=\"") + constants::HTML_PRE_STYLE + "\">" +
               singleString() + "</pre>";
    }

    // -------------------------------------------------------------------------
    // Layout
    // -------------------------------------------------------------------------

    /// @brief Operation indices per column, before invisible columns are dropped.
    [[nodiscard]] const Schedule& schedule() const noexcept { return schedule_; }

    /// @brief Number of drawn gate columns.
    [[nodiscard]] std::size_t numColumns() const noexcept { return columns_.size(); }

    [[nodiscard]] const DrawOptions& options() const noexcept { return options_; }

private:
    DrawOptions options_;
    std::size_t num_rows_ = 0;
    Schedule schedule_;
    Column labels_;
    Column continuation_labels_;
    std::vector<Column> columns_;

    /**
     * @brief Widest box label that fits on a continuation page.
     *
     * The page holds the labels, a `«` and a `»` marker, the box sides
     * `┤ ` and ` ├`, and a two-cell margin.
     */
    [[nodiscard]] std::optional<std::size_t> labelLimit(const Column& labels) const {
        if (!options_.line_length) {
            return std::nullopt;
        }
        constexpr std::size_t break_markers = 2;
        constexpr std::size_t box_sides = 4;
        constexpr std::size_t margin = 2;
        const std::size_t used = break_markers + box_sides + margin +
                                 (labels.empty() ? 0 : labels.front().length());
        return *options_.line_length > used ? *options_.line_length - used : 0;
    }
};

/**
 * @brief Stream output for TextDrawing.
 */
inline std::ostream& operator<<(std::ostream& os, const TextDrawing& drawing) {
    os << drawing.singleString();
    return os;
}

/**
 * @brief Draws a circuit as text.
 * @throws DrawError if an operation cannot be drawn
 */
[[nodiscard]] inline std::string drawText(const ir::Circuit& circuit,
                                          const DrawOptions& options = {}) {
    return TextDrawing(circuit, options).singleString();
}

}  // namespace qdraw::draw
