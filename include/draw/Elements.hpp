// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Elements.hpp
 * @brief Drawable glyph units: one operation on one wire in one column
 *
 * A DrawElement renders as three equal-length strings (top, mid, bot): the
 * upper edge, the wire row and the lower edge of its wire at its column.
 * Each edge is a prefix, a content string centered in the element width and
 * a suffix; the result is then centered in the column width.
 *
 * @see Layer.hpp for how elements are placed and connected
 * @see ElementCatalog.hpp for which element each operation kind uses
 */

#pragma once

#include "TextUtils.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace qdraw::draw {

/**
 * @brief What an element represents on its wire.
 */
enum class ElementKind {
    EmptyWire,        ///< Plain wire segment
    Input,            ///< Wire label column
    Break,            ///< Page continuation marker
    Box,              ///< Single-row box on a qubit
    ClassicalBox,     ///< Single-row box on a classical bit (condition)
    BoxTop,           ///< First row of a multi-row qubit box
    BoxMid,           ///< Interior row of a multi-row qubit box
    BoxBot,           ///< Last row of a multi-row qubit box
    ClassicalBoxTop,  ///< First row of a multi-row condition box
    ClassicalBoxMid,  ///< Interior row of a multi-row condition box
    ClassicalBoxBot,  ///< Last row of a multi-row condition box
    MeasureFrom,      ///< Measurement box on the qubit
    MeasureTo,        ///< Measurement junction on the classical bit
    Barrier,
    Swap,
    Reset,
    Bullet            ///< Control dot
};

/**
 * @brief One edge (top, mid or bot) of an element.
 */
struct Edge {
    std::u32string prefix;
    std::u32string content;
    std::u32string suffix;
    /// Fill used to center content in the element width.
    char32_t pad = U' ';
    /// Fill used to center the edge in the column width.
    char32_t background = U' ';
    /// Glyph the content becomes when a connector reaches this edge.
    std::optional<char32_t> junction;
};

/**
 * @brief The rendered unit for one operation on one wire.
 */
class DrawElement {
public:
    explicit DrawElement(ElementKind kind, std::u32string label = U"")
        : kind_(kind)
        , label_(label)
    {
        top_.content = U" ";
        mid_.content = std::move(label);
        bot_.content = U" ";
    }

    // -------------------------------------------------------------------------
    // Rendering
    // -------------------------------------------------------------------------

    [[nodiscard]] std::u32string top() const { return render(top_); }
    [[nodiscard]] std::u32string mid() const { return render(mid_); }
    [[nodiscard]] std::u32string bot() const { return render(bot_); }

    /// @brief Rendered length: the widest of the three edges.
    [[nodiscard]] std::size_t length() const {
        return std::max({top().size(), mid().size(), bot().size()});
    }

    /// @brief Width the edge contents are centered in.
    [[nodiscard]] std::size_t width() const noexcept {
        return width_ ? *width_ : mid_.content.size();
    }

    // -------------------------------------------------------------------------
    // Connection
    // -------------------------------------------------------------------------

    /**
     * @brief Attaches a vertical connector to this element.
     * @param top A connector arrives from above
     * @param bot A connector leaves below
     * @param label Text written right of the connector on the top edge
     */
    void connect(bool top, bool bot, const std::u32string& label = U"") {
        if (top && top_.junction) {
            top_.content = std::u32string(1, *top_.junction);
        }
        if (bot && bot_.junction) {
            bot_.content = std::u32string(1, *bot_.junction);
        }
        if (!label.empty()) {
            if (!top_.suffix.empty()) {
                top_.suffix.pop_back();
            }
            top_.suffix += label;
        }
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] ElementKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::u32string& label() const noexcept { return label_; }

    [[nodiscard]] Edge& topEdge() noexcept { return top_; }
    [[nodiscard]] Edge& midEdge() noexcept { return mid_; }
    [[nodiscard]] Edge& botEdge() noexcept { return bot_; }
    [[nodiscard]] const Edge& topEdge() const noexcept { return top_; }
    [[nodiscard]] const Edge& midEdge() const noexcept { return mid_; }
    [[nodiscard]] const Edge& botEdge() const noexcept { return bot_; }

    void setWidth(std::size_t width) noexcept { width_ = width; }

    /// @brief Minimum rendered length of each edge before column centering.
    void setRightFill(std::size_t fill) noexcept { right_fill_ = fill; }

    /// @brief Wire or blank cells added left of each edge.
    void setLeftFill(std::size_t fill) noexcept { left_fill_ = fill; }

    [[nodiscard]] std::size_t layerWidth() const noexcept { return layer_width_; }
    void setLayerWidth(std::size_t width) noexcept { layer_width_ = width; }

    // -------------------------------------------------------------------------
    // Factory Methods
    // -------------------------------------------------------------------------

    /// @brief Plain wire segment ('─' for qubits, '═' for clbits).
    [[nodiscard]] static DrawElement emptyWire(char32_t wire) {
        DrawElement e(ElementKind::EmptyWire, std::u32string(1, wire));
        e.mid_.pad = e.mid_.background = wire;
        return e;
    }

    /// @brief Wire label cell of the label column.
    [[nodiscard]] static DrawElement input(std::u32string label) {
        return DrawElement(ElementKind::Input, std::move(label));
    }

    /// @brief Page continuation marker ('»' or '«') on all three edges.
    [[nodiscard]] static DrawElement pageBreak(char32_t arrow) {
        DrawElement e(ElementKind::Break);
        for (Edge* edge : {&e.top_, &e.mid_, &e.bot_}) {
            edge->prefix = std::u32string(1, arrow);
            edge->content.clear();
        }
        return e;
    }

    /**
     * @brief Box on a qubit: ┌───┐ / ┤ L ├ / └───┘.
     * @param conditional Pre-connect the lower edge towards a condition box
     */
    [[nodiscard]] static DrawElement box(std::u32string label,
                                         bool conditional = false) {
        DrawElement e(ElementKind::Box, std::move(label));
        e.top_ = Edge{U"┌─", U"─", U"─┐", U'─', U' ', U'┴'};
        e.mid_.prefix = U"┤ ";
        e.mid_.suffix = U" ├";
        e.mid_.background = U'─';
        e.bot_ = Edge{U"└─", conditional ? U"┬" : U"─", U"─┘", U'─', U' ', U'┬'};
        return e;
    }

    /// @brief Box on a classical bit: ┌─┴─┐ / ╡ L ╞ / └───┘.
    [[nodiscard]] static DrawElement classicalBox(std::u32string label,
                                                  char32_t top_connect = U'─') {
        DrawElement e(ElementKind::ClassicalBox, std::move(label));
        e.top_ = Edge{U"┌─", std::u32string(1, top_connect), U"─┐", U'─', U' ', std::nullopt};
        e.mid_.prefix = U"╡ ";
        e.mid_.suffix = U" ╞";
        e.mid_.background = U'═';
        e.bot_ = Edge{U"└─", U"─", U"─┘", U'─', U' ', std::nullopt};
        return e;
    }

    /**
     * @brief One row of a multi-row qubit box.
     * @param kind BoxTop, BoxMid or BoxBot
     * @param label Gate label (sets the width of every row)
     * @param wire_label Argument position shown on this row (may be blank)
     * @param bot_connect Lower edge content of the last row
     */
    [[nodiscard]] static DrawElement boxRow(ElementKind kind,
                                            const std::u32string& label,
                                            const std::u32string& wire_label,
                                            char32_t bot_connect = U'─') {
        DrawElement e(kind, label);
        const std::size_t fill = wire_label.size();
        const Edge side{U"│" + std::u32string(fill, U' ') + U" ", U"", U" │",
                        U' ', U' ', std::nullopt};
        e.top_ = side;
        e.bot_ = side;
        e.mid_ = Edge{U"┤" + wire_label + U" ", U"", U" ├", U' ', U'─', std::nullopt};
        if (kind == ElementKind::BoxTop) {
            e.top_ = Edge{U"┌" + std::u32string(fill, U'─'), U"─", U"──┐",
                          U'─', U' ', U'┴'};
        } else if (kind == ElementKind::BoxBot) {
            e.bot_ = Edge{U"└" + std::u32string(fill, U'─'),
                          std::u32string(1, bot_connect), U"──┘", U'─', U' ', U'┬'};
        }
        e.setWidth(label.size());
        return e;
    }

    /**
     * @brief One row of a multi-row condition box on a classical register.
     * @param kind ClassicalBoxTop, ClassicalBoxMid or ClassicalBoxBot
     * @param top_connect Upper edge content of the first row
     */
    [[nodiscard]] static DrawElement classicalBoxRow(ElementKind kind,
                                                     const std::u32string& label,
                                                     char32_t top_connect = U'─') {
        DrawElement e(kind, label);
        const Edge side{U"│ ", U"", U" │", U' ', U' ', std::nullopt};
        e.top_ = side;
        e.bot_ = side;
        e.mid_ = Edge{U"╡ ", U"", U" ╞", U' ', U'═', std::nullopt};
        if (kind == ElementKind::ClassicalBoxTop) {
            e.top_ = Edge{U"┌─", std::u32string(1, top_connect), U"─┐", U'─', U' ',
                          std::nullopt};
        } else if (kind == ElementKind::ClassicalBoxBot) {
            e.bot_ = Edge{U"└─", U"─", U"─┘", U'─', U' ', std::nullopt};
        }
        e.setWidth(label.size());
        return e;
    }

    /// @brief Measurement box on the measured qubit.
    [[nodiscard]] static DrawElement measureFrom() {
        DrawElement e(ElementKind::MeasureFrom, U"┤M├");
        e.top_.content = U"┌─┐";
        e.mid_.pad = e.mid_.background = U'─';
        e.bot_.content = U"└╥┘";
        return e;
    }

    /// @brief Measurement junction on the destination clbit.
    [[nodiscard]] static DrawElement measureTo() {
        DrawElement e(ElementKind::MeasureTo, U"═╩═");
        e.top_.content = U" ║ ";
        e.mid_.background = U'═';
        e.bot_.content = U"   ";
        return e;
    }

    /// @brief Glyph sitting directly on the wire: ─L─.
    [[nodiscard]] static DrawElement direct(ElementKind kind, std::u32string label) {
        DrawElement e(kind, std::move(label));
        e.top_ = Edge{U" ", U" ", U" ", U' ', U' ', U'│'};
        e.mid_.prefix = e.mid_.suffix = U"─";
        e.mid_.pad = e.mid_.background = U'─';
        e.bot_ = Edge{U" ", U" ", U" ", U' ', U' ', U'│'};
        return e;
    }

    /// @brief Barrier segment: ░ on all three edges, never connected.
    [[nodiscard]] static DrawElement barrier() {
        DrawElement e = direct(ElementKind::Barrier, U"░");
        e.top_.content = e.bot_.content = U"░";
        e.top_.junction = e.bot_.junction = std::nullopt;
        return e;
    }

    /// @brief Swap end point.
    [[nodiscard]] static DrawElement swap(bool conditional = false) {
        DrawElement e = direct(ElementKind::Swap, U"X");
        if (conditional) e.bot_.content = U"│";
        return e;
    }

    /// @brief Reset to |0>.
    [[nodiscard]] static DrawElement reset(bool conditional = false) {
        DrawElement e = direct(ElementKind::Reset, U"|0>");
        if (conditional) e.bot_.content = U"│";
        return e;
    }

    /// @brief Control dot.
    [[nodiscard]] static DrawElement bullet(bool conditional = false) {
        DrawElement e = direct(ElementKind::Bullet, U"■");
        e.top_.content.clear();
        e.bot_.content = conditional ? U"│" : U"";
        return e;
    }

private:
    ElementKind kind_;
    std::u32string label_;
    Edge top_;
    Edge mid_;
    Edge bot_;
    std::optional<std::size_t> width_;
    std::size_t left_fill_ = 0;
    std::size_t right_fill_ = 0;
    std::size_t layer_width_ = 0;

    [[nodiscard]] std::u32string render(const Edge& edge) const {
        std::u32string ret = std::u32string(left_fill_, edge.background) + edge.prefix +
                             center(edge.content, width(), edge.pad) + edge.suffix;
        if (right_fill_ > 0) {
            ret = ljust(ret, right_fill_, edge.background);
        }
        return center(ret, layer_width_, edge.background);
    }
};

}  // namespace qdraw::draw
