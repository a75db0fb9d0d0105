#pragma once
#include "../assets.hpp"
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// Loads the AssetResource (textures) and adds RenderSystem to the Render
// phase. install_present() closes the frame and must be the last Render
// step installed.
//
// shutdown() must be called before CloseWindow() to unload GPU resources.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        AssetResource assets;
        assets.load();
        if (assets.background.id == 0 || assets.board.id == 0)
            TraceLog(LOG_WARNING, "RENDER: Missing board textures, drawing fallback board");
        world.set_resource(assets);
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }

    static void install_present(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Present(w); });
    }

    static void shutdown(ecs::World& world) {
        world.resource<AssetResource>().unload();
    }
};
