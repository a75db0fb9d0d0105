#pragma once
#include "audio/audio_manager.hpp"
#include "audio/sound_effects.hpp"
#include "events.hpp"
#include <algorithm>
#include <memory>
#include <utility>

// ---------------------------------------------------------------------------
// AudioResource — owns the AudioManager and the SoundEffects façade built on
// it.
//
// Stored as a World resource. Created by AudioModule after InitAudioDevice()
// and released by AudioModule::shutdown() before CloseAudioDevice().
// effects is declared after manager so it is destroyed first.
// ---------------------------------------------------------------------------

struct AudioResource {
    std::shared_ptr<xiangqi::audio::AudioManager> manager;
    std::shared_ptr<xiangqi::audio::SoundEffects> effects;

    bool  paused        = false;
    float unmuted_level = -1.0f; // master volume saved by mute; < 0 while unmuted

    static constexpr float EFFECTS_STEP = 0.1f;

    static AudioResource create(std::unique_ptr<xiangqi::audio::AudioBackend> backend,
                                xiangqi::audio::AudioSettings settings,
                                xiangqi::audio::AudioManager::Clock clock = {}) {
        AudioResource r;
        r.manager = std::make_shared<xiangqi::audio::AudioManager>(
            std::move(backend), std::move(settings), std::move(clock));
        r.effects = std::make_shared<xiangqi::audio::SoundEffects>(*r.manager);
        return r;
    }

    bool muted() const { return unmuted_level >= 0.0f; }

    // Apply one hotkey command to the manager.
    void apply(AudioCommandEvent::Kind kind) {
        using Kind = AudioCommandEvent::Kind;
        switch (kind) {
            case Kind::TogglePause:
                if (paused) effects->resume_all();
                else        effects->pause_all();
                paused = !paused;
                break;
            case Kind::StopAll:
                effects->stop_all();
                paused = false;
                break;
            case Kind::ToggleMute:
                if (muted()) {
                    manager->set_master_volume(unmuted_level);
                    unmuted_level = -1.0f;
                } else {
                    unmuted_level = manager->master_volume();
                    manager->set_master_volume(0.0f);
                }
                break;
            case Kind::EffectsUp:
                manager->set_effects_volume(std::min(manager->effects_volume() + EFFECTS_STEP, 1.0f));
                break;
            case Kind::EffectsDown:
                manager->set_effects_volume(std::max(manager->effects_volume() - EFFECTS_STEP, 0.0f));
                break;
        }
    }

    void unload() {
        effects.reset();
        if (manager) manager->cleanup();
        manager.reset();
    }
};
