#pragma once
#include "audio_manager.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace xiangqi::audio {

struct Point2 {
    float x = 0.0f;
    float y = 0.0f;
};

struct VolumeLevels {
    float master = 1.0f;
    float sfx    = 1.0f;
};

struct AudioStatus {
    int          loaded_sounds      = 0;
    int          playing_now        = 0;
    int          available_channels = 0;
    VolumeLevels volume;
};

// ---------------------------------------------------------------------------
// SoundEffects — convenience layer over AudioManager for game code.
//
// Holds a reference to the manager; the owner keeps both alive together.
// Sequences are queued and fired by update(), which must run once per frame.
// ---------------------------------------------------------------------------

class SoundEffects {
public:
    explicit SoundEffects(AudioManager& manager, std::uint32_t seed = std::random_device{}());

    bool play_click(float volume = 1.0f)   { return play_ui("click", volume); }
    bool play_select(float volume = 1.0f)  { return play_ui("select", volume); }
    bool play_hover(float volume = 0.7f)   { return play_ui("hover", volume); }
    bool play_confirm(float volume = 1.0f) { return play_ui("confirm", volume); }
    bool play_ui(const std::string& name, float volume = 1.0f);

    // Plays one loaded member of the group at random. Returns its name, or
    // nothing if the group is unknown, has no loaded member, or play failed.
    std::optional<std::string> play_random_from_group(const std::string& group, float volume = 1.0f);

    // delays[i] is the gap after names[i]; missing entries default to 0.1 s.
    // Returns how many entries started immediately.
    int  play_sequence(const std::vector<std::string>& names,
                       std::vector<float> delays = {},
                       float volume = 1.0f);
    int  pending_count() const { return static_cast<int>(pending_.size()); }
    void cancel_sequences() { pending_.clear(); }

    // Linear distance attenuation (floor 0.1), silent at max_distance and
    // beyond. Pan follows the horizontal offset over half_width.
    bool play_spatial(const std::string& name, Point2 position, Point2 listener,
                      float max_distance = 500.0f, float half_width = 400.0f);

    // Returns how many of names are loaded afterwards.
    int preload(const std::vector<std::string>& names);

    void stop_all();
    void pause_all()  { manager_.pause_all(); }
    void resume_all() { manager_.resume_all(); }

    void set_volume(std::optional<float> master, std::optional<float> sfx);
    VolumeLevels volume() const;
    AudioStatus  status();

    // Fire due sequence entries. Returns how many of them started.
    int update();

private:
    struct Pending {
        double      fire_at = 0.0;
        std::string name;
        float       volume  = 1.0f;
    };

    AudioManager&        manager_;
    std::mt19937         rng_;
    std::vector<Pending> pending_;
};

} // namespace xiangqi::audio
