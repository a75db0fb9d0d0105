#include "audio_config.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace xiangqi::audio {

const char* to_string(SoundCategory category) {
    switch (category) {
        case SoundCategory::Ui:      return "ui";
        case SoundCategory::Piece:   return "piece";
        case SoundCategory::Game:    return "game";
        case SoundCategory::Ambient: return "ambient";
        case SoundCategory::Other:   return "other";
    }
    return "other";
}

std::optional<SoundCategory> parse_category(const std::string& s) {
    if (s == "ui")      return SoundCategory::Ui;
    if (s == "piece")   return SoundCategory::Piece;
    if (s == "game")    return SoundCategory::Game;
    if (s == "ambient") return SoundCategory::Ambient;
    if (s == "other")   return SoundCategory::Other;
    return std::nullopt;
}

SoundConfig SoundConfig::validated() const {
    SoundConfig c = *this;
    c.volume        = std::clamp(c.volume, 0.0f, 1.0f);
    c.max_instances = std::max(c.max_instances, 1);
    c.min_delay     = std::max(c.min_delay, 0.0f);
    return c;
}

SoundConfig AudioSettings::default_config(SoundCategory category) const {
    SoundConfig c;
    c.category      = category;
    c.volume        = 1.0f;
    c.max_instances = max_sound_instances;
    c.min_delay     = min_play_delay;
    return c.validated();
}

AudioSettings AudioSettings::defaults() {
    AudioSettings s;

    auto add = [&s](const char* name, SoundCategory cat, float volume, int max_instances, float min_delay) {
        SoundConfig c;
        c.category      = cat;
        c.volume        = volume;
        c.max_instances = max_instances;
        c.min_delay     = min_delay;
        s.sounds[name]  = c;
    };

    // UI feedback
    add("click",   SoundCategory::Ui, 0.8f, 3, 0.05f);
    add("select",  SoundCategory::Ui, 0.9f, 2, 0.05f);
    add("hover",   SoundCategory::Ui, 0.5f, 2, 0.10f);
    add("confirm", SoundCategory::Ui, 1.0f, 1, 0.10f);
    add("cancel",  SoundCategory::Ui, 0.8f, 1, 0.10f);

    // Pieces
    add("move",    SoundCategory::Piece, 1.0f, 2, 0.05f);
    add("move2",   SoundCategory::Piece, 1.0f, 2, 0.05f);
    add("capture", SoundCategory::Piece, 1.0f, 2, 0.10f);
    add("invalid", SoundCategory::Piece, 0.7f, 1, 0.20f);

    // Game state
    add("check",      SoundCategory::Game, 1.0f, 1, 0.50f);
    add("checkmate",  SoundCategory::Game, 1.0f, 1, 1.00f);
    add("game_start", SoundCategory::Game, 1.0f, 1, 1.00f);
    add("game_over",  SoundCategory::Game, 1.0f, 1, 1.00f);

    s.groups["piece_move"] = {"move", "move2"};
    s.groups["ui_feedback"] = {"click", "select", "confirm"};
    return s;
}

} // namespace xiangqi::audio
