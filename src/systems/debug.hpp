#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem — Render-phase system; drives the debug overlay.
//
// Draws inside the frame opened by RenderSystem::Update; install before
// RenderSystem::Present. Toggle visibility with F3.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};
