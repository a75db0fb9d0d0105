#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// BoardInputSystem — Pre-Update system; reads mouse and keyboard.
//
// Recomputes the board rectangle for the current screen size, tracks the
// hovered cell and emits BoardClickEvent, BoardHoverEvent and
// AudioCommandEvent.
//
// Hotkeys: P pause/resume, S stop all, M mute, +/- effects volume.
// ---------------------------------------------------------------------------

class BoardInputSystem {
public:
    static void Update(ecs::World& world);
};
