#pragma once
#include <cmath>
#include <algorithm>
#include <optional>

namespace xiangqi::layout {

inline constexpr int BOARD_COLS = 9;
inline constexpr int BOARD_ROWS = 10;

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

struct Cell {
    int row = 0;
    int col = 0;
};

struct BoardRect {
    Rect area;
    int  square = 0; // edge of one grid cell in pixels
};

/**
 * @brief Scales an image to cover the whole screen, preserving aspect ratio,
 *        and centres it (the overflow is cropped equally on both sides).
 */
inline Rect cover_fit(int screen_w, int screen_h, int img_w, int img_h) {
    if (img_w <= 0 || img_h <= 0) return {0, 0, screen_w, screen_h};
    const double scale = std::max(static_cast<double>(screen_w) / img_w,
                                  static_cast<double>(screen_h) / img_h);
    Rect r;
    r.w = static_cast<int>(img_w * scale);
    r.h = static_cast<int>(img_h * scale);
    r.x = static_cast<int>(std::floor((screen_w - r.w) / 2.0));
    r.y = static_cast<int>(std::floor((screen_h - r.h) / 2.0));
    return r;
}

/**
 * @brief Board rectangle centred on screen with a 9:10 aspect.
 *
 * Takes 80% of the screen width; when that would not fit in 90% of the
 * height, takes 80% of the height instead.
 */
inline BoardRect board_rect(int screen_w, int screen_h) {
    int w = static_cast<int>(screen_w * 0.8);
    int h = static_cast<int>(w * 10 / 9);

    if (w > screen_h * 0.9) {
        h = static_cast<int>(screen_h * 0.8);
        w = static_cast<int>(h * 9 / 10);
    }

    BoardRect b;
    b.area   = {(screen_w - w) / 2, (screen_h - h) / 2, w, h};
    b.square = w / BOARD_COLS;
    return b;
}

/**
 * @brief Grid cell under a pixel, or nothing outside the board.
 */
inline std::optional<Cell> cell_at(const BoardRect& board, float px, float py) {
    if (board.square <= 0) return std::nullopt;
    const float lx = px - static_cast<float>(board.area.x);
    const float ly = py - static_cast<float>(board.area.y);
    if (lx < 0.0f || ly < 0.0f) return std::nullopt;

    const int col = static_cast<int>(lx) / board.square;
    const int row = static_cast<int>(ly) / board.square;
    if (col >= BOARD_COLS || row >= BOARD_ROWS) return std::nullopt;
    return Cell{row, col};
}

/**
 * @brief Pixel centre of a grid cell.
 */
inline void cell_center(const BoardRect& board, Cell cell, float& out_x, float& out_y) {
    out_x = static_cast<float>(board.area.x + cell.col * board.square) + board.square * 0.5f;
    out_y = static_cast<float>(board.area.y + cell.row * board.square) + board.square * 0.5f;
}

} // namespace xiangqi::layout
