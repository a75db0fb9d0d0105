#pragma once
#include "../components.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Creates the EventRegistry world resource, registers every event queue the
// game uses and installs the per-frame flush as the first Pre-Update step.
// Must be the first module installed.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(EventRegistry{});
        auto& reg = world.resource<EventRegistry>();
        reg.register_queue<BoardClickEvent>(world);
        reg.register_queue<BoardHoverEvent>(world);
        reg.register_queue<AudioCommandEvent>(world);
        reg.register_queue<PieceActionEvent>(world);

        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<EventRegistry>().flush_all();
        });
    }
};
