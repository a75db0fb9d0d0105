#pragma once
#include "layout.hpp"
#include <optional>

// ---------------------------------------------------------------------------
// Board view state (World resource)
//
// Written by BoardInputSystem (rect, hovered) and BoardSystem (selected);
// read by RenderSystem. No rules engine: a second click on another cell
// "moves" the selection there and clears it.
// ---------------------------------------------------------------------------

struct BoardView {
    xiangqi::layout::BoardRect           rect;
    std::optional<xiangqi::layout::Cell> hovered;
    std::optional<xiangqi::layout::Cell> selected;
};

enum class SelectAction { Selected, Deselected, Moved };

inline bool same_cell(const xiangqi::layout::Cell& a, const xiangqi::layout::Cell& b) {
    return a.row == b.row && a.col == b.col;
}

// Emitted by BoardSystem for every click it resolves.
struct PieceActionEvent {
    SelectAction          action;
    xiangqi::layout::Cell from;
    xiangqi::layout::Cell to;
    float                 x; // pixel position of the click
    float                 y;
};

// ---------------------------------------------------------------------------
// Draw colours (engine-independent RGBA, converted at draw time)
// ---------------------------------------------------------------------------

struct Color4 { float r, g, b, a; };

namespace Colors {
    constexpr Color4 Background = {0.14f, 0.12f, 0.10f, 1.0f};
    constexpr Color4 Wood       = {0.85f, 0.68f, 0.42f, 1.0f};
    constexpr Color4 Line       = {0.25f, 0.15f, 0.08f, 1.0f};
    constexpr Color4 Hover      = {1.00f, 1.00f, 1.00f, 0.25f};
    constexpr Color4 Selected   = {0.90f, 0.20f, 0.15f, 0.45f};
}
