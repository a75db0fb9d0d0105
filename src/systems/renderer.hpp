#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderSystem — Render-phase system.
//
// Update() opens the frame and draws background, board, highlights and the
// HUD. Present() closes the frame and must be the last Render-phase step so
// overlays (DebugSystem) land inside the same frame.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Update(ecs::World& world);
    static void Present(ecs::World& world);
};
