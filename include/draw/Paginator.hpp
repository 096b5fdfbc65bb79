// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Paginator.hpp
 * @brief Splits the diagram columns into pages of bounded width
 *
 * Pages are cut on column boundaries only. Every page but the last ends
 * with a `»` column; every page but the first starts with a `«` column
 * followed by the wire labels (without initial values).
 */

#pragma once

#include "Canvas.hpp"
#include "Elements.hpp"
#include "Layer.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace qdraw::draw {

/// Columns drawn together as one block of lines.
using Page = std::vector<Column>;

/**
 * @brief Cuts columns into pages.
 *
 * A column is added to the current page while it fits strictly inside the
 * remaining width (one cell stays free for the `»` marker). A column that
 * does not fit starts a new page, unless the current page holds no gate
 * column yet; a column wider than a page is then placed alone.
 */
class Paginator {
public:
    /**
     * @param labels Label column of the first page
     * @param continuation_labels Label column of the following pages
     */
    Paginator(Column labels, Column continuation_labels)
        : labels_(std::move(labels))
        , continuation_labels_(std::move(continuation_labels))
    {
        Layer::normalizeWidth(labels_);
        Layer::normalizeWidth(continuation_labels_);
    }

    /**
     * @brief Distributes gate columns over pages.
     * @param line_length Page width; std::nullopt puts everything on one page
     */
    [[nodiscard]] std::vector<Page> paginate(const std::vector<Column>& columns,
                                             std::optional<std::size_t> line_length) const {
        std::vector<Page> pages(1);
        pages.back().push_back(labels_);
        if (!line_length) {
            pages.back().insert(pages.back().end(), columns.begin(), columns.end());
            return pages;
        }

        const std::size_t num_rows = labels_.size();
        std::size_t rest = subtract(*line_length, width(labels_));
        bool holds_gate = false;
        for (const auto& column : columns) {
            const std::size_t column_width = width(column);
            if (column_width >= rest && holds_gate) {
                spdlog::debug("page {} full, starting a new page", pages.size());
                pages.back().push_back(breakColumn(num_rows, U'»'));
                pages.emplace_back();
                pages.back().push_back(breakColumn(num_rows, U'«'));
                pages.back().push_back(continuation_labels_);
                rest = subtract(*line_length, 1 + width(continuation_labels_));
                holds_gate = false;
            }
            pages.back().push_back(column);
            rest = subtract(rest, column_width);
            holds_gate = true;
        }
        return pages;
    }

private:
    Column labels_;
    Column continuation_labels_;

    [[nodiscard]] static std::size_t width(const Column& column) {
        return column.empty() ? 0 : column.front().length();
    }

    [[nodiscard]] static std::size_t subtract(std::size_t a, std::size_t b) noexcept {
        return a > b ? a - b : 0;
    }

    [[nodiscard]] static Column breakColumn(std::size_t num_rows, char32_t arrow) {
        return Column(num_rows, DrawElement::pageBreak(arrow));
    }
};

}  // namespace qdraw::draw
