#include "audio.hpp"
#include "../audio_resource.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include <raylib.h>

using namespace ecs;
using xiangqi::audio::Point2;

static void play_piece_action(AudioResource& audio, const PieceActionEvent& ev) {
    auto& fx = *audio.effects;
    switch (ev.action) {
        case SelectAction::Selected: {
            // Positional click: louder near the centre, panned toward the side.
            const Point2 at{ev.x, ev.y};
            const Point2 listener{GetScreenWidth() * 0.5f, GetScreenHeight() * 0.5f};
            const float  reach = static_cast<float>(GetScreenWidth());
            if (!fx.play_spatial("select", at, listener, reach, listener.x))
                TraceLog(LOG_DEBUG, "AUDIO: select cue dropped");
            break;
        }
        case SelectAction::Deselected:
            if (!fx.play_ui("cancel"))
                TraceLog(LOG_DEBUG, "AUDIO: cancel cue dropped");
            break;
        case SelectAction::Moved:
            if (!fx.play_random_from_group("piece_move"))
                TraceLog(LOG_DEBUG, "AUDIO: no piece_move cue available");
            break;
    }
}

void AudioSystem::Update(World& world, float /*dt*/) {
    auto* audio = world.try_resource<AudioResource>();
    if (!audio || !audio->manager) return;

    if (const auto* evts = world.try_resource<Events<AudioCommandEvent>>()) {
        for (const auto& ev : evts->read()) audio->apply(ev.kind);
    }

    if (const auto* evts = world.try_resource<Events<PieceActionEvent>>()) {
        for (const auto& ev : evts->read()) play_piece_action(*audio, ev);
    }

    // One hover cue per frame at most
    if (const auto* evts = world.try_resource<Events<BoardHoverEvent>>()) {
        if (!evts->empty() && !audio->effects->play_hover())
            TraceLog(LOG_DEBUG, "AUDIO: hover cue dropped");
    }

    audio->effects->update();
    audio->manager->update();
}
