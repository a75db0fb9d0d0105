#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// AudioSystem — Logic-phase system; consumes PieceActionEvent,
// BoardHoverEvent and AudioCommandEvent, then runs per-frame audio
// maintenance (sequence timers, channel reaping, stale-record sweep).
//
// No Register() — no lifecycle hooks. AudioResource is created by
// AudioModule.
// ---------------------------------------------------------------------------

class AudioSystem {
public:
    static void Update(ecs::World& world, float dt);
};
