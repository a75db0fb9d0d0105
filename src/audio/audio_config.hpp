#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace xiangqi::audio {

enum class SoundCategory { Ui, Piece, Game, Ambient, Other };

const char*                  to_string(SoundCategory category);
std::optional<SoundCategory> parse_category(const std::string& s);

// Per-asset playback configuration.
struct SoundConfig {
    SoundCategory category      = SoundCategory::Other;
    float         volume        = 1.0f;  // base volume, [0,1]
    int           max_instances = 3;     // concurrent instances, >= 1
    float         min_delay     = 0.05f; // seconds between play starts, >= 0
    std::string   file;                  // explicit path; empty = resolve from name

    // Clamp every field into its legal range.
    SoundConfig validated() const;
};

// ---------------------------------------------------------------------------
// AudioSettings — process-wide audio defaults plus the static sound table.
//
// defaults() carries the built-in Xiangqi table so the game runs without a
// config file; AudioConfigLoader overlays a JSON document on top.
// ---------------------------------------------------------------------------

struct AudioSettings {
    std::string              sound_dir  = "resources/sfx";
    std::vector<std::string> extensions = {".wav", ".ogg", ".mp3"};

    int   channels            = 8;
    float master_volume       = 1.0f;
    float sfx_volume          = 0.8f;
    int   max_sound_instances = 3;
    float min_play_delay      = 0.05f;
    float stale_after         = 10.0f; // seconds before an instance record is dropped

    std::map<std::string, SoundConfig>              sounds;
    std::map<std::string, std::vector<std::string>> groups;

    // Config used for a sound with no entry in the table.
    SoundConfig default_config(SoundCategory category = SoundCategory::Other) const;

    // Built-in table: UI feedback, piece movement and game-state cues.
    static AudioSettings defaults();
};

// ---------------------------------------------------------------------------
// AudioConfigLoader — reads a JSON audio config into AudioSettings.
//
// Keys absent from the document keep their current value. On failure the
// settings are left untouched. No raylib dependency.
// ---------------------------------------------------------------------------

class AudioConfigLoader {
public:
    // Returns false if the file cannot be opened or the JSON is malformed.
    static bool load(AudioSettings& settings, const std::string& path);

    // Identical to load() but parses from a string. Intended for unit testing.
    static bool load_from_string(AudioSettings& settings, const std::string& json);
};

} // namespace xiangqi::audio
