#pragma once
#include "../components.hpp"
#include "../pipeline.hpp"
#include "../systems/board_input.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Creates the BoardView resource and adds BoardInputSystem to the
// Pre-Update phase, after the EventBus flush.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(BoardView{});
        pipeline.add_pre_update([](ecs::World& w, float) { BoardInputSystem::Update(w); });
    }
};
