#include "renderer.hpp"
#include "../assets.hpp"
#include "../audio_resource.hpp"
#include "../components.hpp"
#include <raylib.h>
#include <cstdio>

using namespace ecs;
using xiangqi::layout::Rect;
using xiangqi::layout::BOARD_COLS;
using xiangqi::layout::BOARD_ROWS;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

static void draw_texture_in(const Texture2D& tex, const Rect& r) {
    Rectangle src = {0, 0, static_cast<float>(tex.width), static_cast<float>(tex.height)};
    Rectangle dst = {static_cast<float>(r.x), static_cast<float>(r.y),
                     static_cast<float>(r.w), static_cast<float>(r.h)};
    DrawTexturePro(tex, src, dst, {0, 0}, 0.0f, WHITE);
}

static void draw_cell(const xiangqi::layout::BoardRect& b, xiangqi::layout::Cell c, Color col) {
    DrawRectangle(b.area.x + c.col * b.square, b.area.y + c.row * b.square,
                  b.square, b.square, col);
}

// Fallback board: wooden fill with lines through the cell centres and the river.
static void draw_grid(const xiangqi::layout::BoardRect& b) {
    DrawRectangle(b.area.x, b.area.y, b.area.w, b.area.h, to_raylib(Colors::Wood));
    const Color line = to_raylib(Colors::Line);
    const int   half = b.square / 2;
    const int   x0   = b.area.x + half;
    const int   y0   = b.area.y + half;
    const int   x1   = x0 + (BOARD_COLS - 1) * b.square;
    const int   y1   = y0 + (BOARD_ROWS - 1) * b.square;

    for (int r = 0; r < BOARD_ROWS; r++)
        DrawLine(x0, y0 + r * b.square, x1, y0 + r * b.square, line);
    for (int c = 0; c < BOARD_COLS; c++) {
        const int x = x0 + c * b.square;
        if (c == 0 || c == BOARD_COLS - 1) {
            DrawLine(x, y0, x, y1, line);
        } else {
            // Files stop at the river between rows 4 and 5
            DrawLine(x, y0, x, y0 + 4 * b.square, line);
            DrawLine(x, y0 + 5 * b.square, x, y1, line);
        }
    }
}

void RenderSystem::Update(World& world) {
    BeginDrawing();
    ClearBackground(to_raylib(Colors::Background));

    const int sw = GetScreenWidth();
    const int sh = GetScreenHeight();

    auto* assets = world.try_resource<AssetResource>();
    auto* view   = world.try_resource<BoardView>();

    // 1. Background, scaled to cover
    if (assets && assets->background.id != 0) {
        draw_texture_in(assets->background,
            xiangqi::layout::cover_fit(sw, sh, assets->background.width, assets->background.height));
    }

    // 2. Board
    if (view) {
        const auto& b = view->rect;
        if (assets && assets->board.id != 0) {
            draw_texture_in(assets->board, b.area);
        } else {
            draw_grid(b);
        }
        if (view->hovered)  draw_cell(b, *view->hovered,  to_raylib(Colors::Hover));
        if (view->selected) draw_cell(b, *view->selected, to_raylib(Colors::Selected));
    }

    // 3. HUD
    DrawText("LMB: Select / Move | P: Pause | S: Stop | M: Mute | +/-: Effects", 10, sh - 30, 20, LIGHTGRAY);
    if (auto* audio = world.try_resource<AudioResource>(); audio && audio->manager) {
        char b[64];
        std::snprintf(b, sizeof(b), "SFX %3d%%%s%s",
                      static_cast<int>(audio->manager->effects_volume() * 100.0f + 0.5f),
                      audio->muted()  ? "  MUTED"  : "",
                      audio->paused ? "  PAUSED" : "");
        DrawText(b, sw - MeasureText(b, 20) - 10, 10, 20, audio->muted() ? ORANGE : RAYWHITE);
    }
}

void RenderSystem::Present(World& /*world*/) {
    EndDrawing();
}
