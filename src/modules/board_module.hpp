#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/board.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// BoardModule
//
// Adds BoardSystem to the Logic phase and registers "Board" debug rows.
//
// Pipeline placement: BoardSystem emits PieceActionEvent, which AudioSystem
// consumes in the same frame. Install before AudioModule.
// ---------------------------------------------------------------------------

struct BoardModule {
    static std::string format_cell(const std::optional<xiangqi::layout::Cell>& c) {
        if (!c) return "-";
        return "r" + std::to_string(c->row) + " c" + std::to_string(c->col);
    }

    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        pipeline.add_logic([](ecs::World& w, float dt) { BoardSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Board", "Square", [&world]() {
                auto* view = world.try_resource<BoardView>();
                return view ? std::to_string(view->rect.square) + " px" : std::string("-");
            });
            panel->watch("Board", "Hovered", [&world]() {
                auto* view = world.try_resource<BoardView>();
                return view ? format_cell(view->hovered) : std::string("-");
            });
            panel->watch("Board", "Selected", [&world]() {
                auto* view = world.try_resource<BoardView>();
                return view ? format_cell(view->selected) : std::string("-");
            });
        }
    }
};
