#include "debug.hpp"
#include "../debug_panel.hpp"
#include <raylib.h>
#include <algorithm>
#include <string>
#include <vector>

static constexpr int   PAD      = 8;
static constexpr int   ROW_H    = 15;
static constexpr int   SEP_H    = 4;
static constexpr int   FONT_SM  = 10;
static constexpr int   FONT_MD  = 11;
static constexpr int   MIN_W    = 180;
static constexpr Color BG       = {20,  16,  12,  215};
static constexpr Color DIVIDER  = {90,  70,  50,  200};
static constexpr Color C_TITLE  = {170, 150, 120, 255};
static constexpr Color C_HEADER = {220, 170, 90,  255};
static constexpr Color C_LABEL  = {185, 175, 160, 255};
static constexpr Color C_VALUE  = {255, 250, 240, 255};

// Evaluated once per frame so the width pass and the draw pass agree.
struct OverlayRow {
    bool        header = false;
    std::string label;
    std::string value;
};

static std::vector<OverlayRow> collect(const DebugPanel& panel) {
    std::vector<OverlayRow> rows;
    rows.reserve(static_cast<size_t>(panel.line_count()));
    for (const auto& sec : panel.sections()) {
        rows.push_back({true, sec.title, {}});
        for (const auto& row : sec.rows) rows.push_back({false, row.label, row.fn()});
    }
    return rows;
}

void DebugSystem::Update(ecs::World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (IsKeyPressed(KEY_F3)) panel->visible = !panel->visible;
    if (!panel->visible) return;

    const std::vector<OverlayRow> rows = collect(*panel);

    // Value column starts after the widest label; panel width fits the widest value.
    int label_w = 0, value_w = 0;
    for (const auto& r : rows) {
        if (r.header) continue;
        label_w = std::max(label_w, MeasureText(r.label.c_str(), FONT_SM));
        value_w = std::max(value_w, MeasureText(r.value.c_str(), FONT_SM));
    }
    const int sections = static_cast<int>(panel->sections().size());
    const int panel_w  = std::max(MIN_W, PAD + 4 + label_w + PAD * 2 + value_w + PAD);
    const int panel_h  = PAD + ROW_H + PAD + static_cast<int>(rows.size()) * ROW_H + sections * SEP_H + PAD;

    // Top-left; the HUD owns the top-right corner and the bottom line.
    const int ox = 10, oy = 10;
    const int max_h = std::max(GetScreenHeight() - oy - 40, ROW_H * 2);
    const int shown_h = std::min(panel_h, max_h);

    DrawRectangle(ox, oy, panel_w, shown_h, BG);
    DrawRectangleLines(ox, oy, panel_w, shown_h, DIVIDER);
    BeginScissorMode(ox, oy, panel_w, shown_h);

    int cy = oy + PAD;
    DrawText("DEBUG", ox + PAD, cy, FONT_MD, C_TITLE);
    DrawText("[F3]", ox + panel_w - PAD - MeasureText("[F3]", FONT_SM), cy + 1, FONT_SM, DIVIDER);
    cy += ROW_H + PAD;

    const int value_x = ox + PAD + 4 + label_w + PAD * 2;
    for (const auto& r : rows) {
        if (r.header) {
            DrawLine(ox + PAD, cy, ox + panel_w - PAD, cy, DIVIDER);
            cy += SEP_H;
            DrawText(r.label.c_str(), ox + PAD, cy, FONT_MD, C_HEADER);
        } else {
            DrawText(r.label.c_str(), ox + PAD + 4, cy, FONT_SM, C_LABEL);
            DrawText(r.value.c_str(), value_x,      cy, FONT_SM, C_VALUE);
        }
        cy += ROW_H;
    }

    EndScissorMode();
}
