#pragma once
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Creates the DebugPanel world resource and registers Engine-level debug
// rows (FPS, Frame Time, Window).
//
// Must be installed BEFORE any game module that wants to add its own debug
// rows, so that the DebugPanel resource exists when those modules call
// world.try_resource<DebugPanel>()->watch(...).
//
// install_overlay() adds DebugSystem to the Render phase; call it after
// RenderModule::install and before RenderModule::install_present.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, ecs::Pipeline& /*pipeline*/) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            char b[16];
            std::snprintf(b, sizeof(b), "%d ms", (int)(GetFrameTime() * 1000));
            return std::string(b);
        });
        panel.watch("Engine", "Window", []() {
            return std::to_string(GetScreenWidth()) + "x" + std::to_string(GetScreenHeight());
        });

        world.set_resource(std::move(panel));
    }

    static void install_overlay(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};
