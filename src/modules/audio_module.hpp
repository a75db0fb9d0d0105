#pragma once
#include "../audio/audio_config.hpp"
#include "../audio/raylib_backend.hpp"
#include "../audio_resource.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/audio.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// AudioModule
//
// Initialises raylib's audio device, reads the audio config (falling back to
// the built-in table), builds the AudioResource around a RaylibBackend,
// loads every configured sound and adds AudioSystem to the Logic phase.
//
// Pipeline placement: AudioSystem consumes PieceActionEvent, so install
// after BoardModule.
//
// shutdown() releases every sound and closes the audio device. Must be
// called before CloseWindow().
// ---------------------------------------------------------------------------

struct AudioModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline,
                        const std::string& config_path) {
        InitAudioDevice();
        if (!IsAudioDeviceReady())
            TraceLog(LOG_WARNING, "AUDIO: Audio device unavailable, playback will be silent");

        xiangqi::audio::AudioSettings settings = xiangqi::audio::AudioSettings::defaults();
        if (xiangqi::audio::AudioConfigLoader::load(settings, config_path)) {
            TraceLog(LOG_INFO, "CONFIG: Loaded audio config '%s' (%d sounds)",
                     config_path.c_str(), (int)settings.sounds.size());
        } else {
            TraceLog(LOG_WARNING, "CONFIG: Cannot read '%s', using built-in audio table",
                     config_path.c_str());
        }

        AudioResource audio = AudioResource::create(
            std::make_unique<xiangqi::audio::RaylibBackend>(), std::move(settings),
            []() { return GetTime(); });

        int loaded = 0;
        for (const auto& [name, result] : audio.manager->load_configured()) {
            if (result == xiangqi::audio::LoadResult::Ok) {
                loaded++;
            } else {
                TraceLog(LOG_WARNING, "AUDIO: Sound '%s' not loaded: %s",
                         name.c_str(), xiangqi::audio::to_string(result));
            }
        }
        TraceLog(LOG_INFO, "AUDIO: Loaded %d sound(s) on %d channel(s)",
                 loaded, audio.manager->channel_count());

        if (!audio.effects->play_ui("game_start"))
            TraceLog(LOG_DEBUG, "AUDIO: game_start cue unavailable");

        world.set_resource(std::move(audio));
        pipeline.add_logic([](ecs::World& w, float dt) { AudioSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Audio", "Loaded", [&world]() {
                auto* a = world.try_resource<AudioResource>();
                return a && a->manager ? std::to_string(a->manager->loaded_count()) : std::string("-");
            });
            panel->watch("Audio", "Playing", [&world]() {
                auto* a = world.try_resource<AudioResource>();
                if (!a || !a->manager) return std::string("-");
                return std::to_string(a->manager->active_count()) + " / " +
                       std::to_string(a->manager->channel_count());
            });
            panel->watch("Audio", "Volume", [&world]() {
                auto* a = world.try_resource<AudioResource>();
                if (!a || !a->manager) return std::string("-");
                char b[32];
                std::snprintf(b, sizeof(b), "M %.2f  FX %.2f",
                              a->manager->master_volume(), a->manager->effects_volume());
                return std::string(b);
            });
            panel->watch("Audio", "Queued", [&world]() {
                auto* a = world.try_resource<AudioResource>();
                return a && a->effects ? std::to_string(a->effects->pending_count()) : std::string("-");
            });
        }
    }

    static void shutdown(ecs::World& world) {
        if (auto* audio = world.try_resource<AudioResource>()) audio->unload();
        CloseAudioDevice();
    }
};
