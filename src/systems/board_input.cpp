#include "board_input.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include <raylib.h>

using namespace ecs;
using xiangqi::layout::Cell;

static void send_command(World& world, AudioCommandEvent::Kind kind) {
    if (auto* q = world.try_resource<Events<AudioCommandEvent>>()) q->send({kind});
}

void BoardInputSystem::Update(World& world) {
    auto* view = world.try_resource<BoardView>();
    if (!view) return;

    // 1. Layout follows the window
    view->rect = xiangqi::layout::board_rect(GetScreenWidth(), GetScreenHeight());

    // 2. Hover
    Vector2 mouse = GetMousePosition();
    std::optional<Cell> cell = xiangqi::layout::cell_at(view->rect, mouse.x, mouse.y);

    bool changed = cell.has_value() != view->hovered.has_value() ||
                   (cell && !same_cell(*cell, *view->hovered));
    view->hovered = cell;
    if (changed && cell) {
        if (auto* q = world.try_resource<Events<BoardHoverEvent>>()) q->send({cell->row, cell->col});
    }

    // 3. Click
    if (cell && IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
        if (auto* q = world.try_resource<Events<BoardClickEvent>>())
            q->send({cell->row, cell->col, mouse.x, mouse.y});
    }

    // 4. Audio hotkeys
    if (IsKeyPressed(KEY_P)) send_command(world, AudioCommandEvent::Kind::TogglePause);
    if (IsKeyPressed(KEY_S)) send_command(world, AudioCommandEvent::Kind::StopAll);
    if (IsKeyPressed(KEY_M)) send_command(world, AudioCommandEvent::Kind::ToggleMute);
    if (IsKeyPressed(KEY_EQUAL) || IsKeyPressed(KEY_KP_ADD))
        send_command(world, AudioCommandEvent::Kind::EffectsUp);
    if (IsKeyPressed(KEY_MINUS) || IsKeyPressed(KEY_KP_SUBTRACT))
        send_command(world, AudioCommandEvent::Kind::EffectsDown);
}
