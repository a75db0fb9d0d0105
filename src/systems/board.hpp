#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"

// Resolves board clicks into selection changes and emits PieceActionEvent.
// Runs in the Logic phase, before AudioSystem.
class BoardSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Pure selection transition — no raylib dependency. Exposed for unit testing.
    // Returns the action taken; out_from receives the previous selection
    // (or the clicked cell when nothing was selected).
    static SelectAction apply_click(BoardView& view, xiangqi::layout::Cell cell,
                                    xiangqi::layout::Cell& out_from);
};
