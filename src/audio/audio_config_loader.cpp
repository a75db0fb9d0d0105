#include "audio_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace xiangqi::audio {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static SoundCategory category_from(const std::string& s) {
    if (auto c = parse_category(s)) return *c;
    throw std::runtime_error("AudioConfigLoader: unknown category '" + s + "'");
}

static SoundConfig parse_sound(const json& j, const AudioSettings& s) {
    SoundConfig c   = s.default_config();
    c.category      = category_from(j.value("category", std::string("other")));
    c.volume        = j.value("volume",        c.volume);
    c.max_instances = j.value("max_instances", c.max_instances);
    c.min_delay     = j.value("min_delay",     c.min_delay);
    c.file          = j.value("file",          std::string());
    return c.validated();
}

static void apply(AudioSettings& s, const json& doc) {
    // Scalars first: per-sound defaults below depend on them.
    s.sound_dir           = doc.value("sound_dir",           s.sound_dir);
    s.channels            = doc.value("channels",            s.channels);
    s.master_volume       = doc.value("master_volume",       s.master_volume);
    s.sfx_volume          = doc.value("sfx_volume",          s.sfx_volume);
    s.max_sound_instances = doc.value("max_sound_instances", s.max_sound_instances);
    s.min_play_delay      = doc.value("min_play_delay",      s.min_play_delay);
    s.stale_after         = doc.value("stale_after",         s.stale_after);

    if (s.channels < 0)
        throw std::runtime_error("AudioConfigLoader: channels must be >= 0");
    if (s.stale_after <= 0.0f)
        throw std::runtime_error("AudioConfigLoader: stale_after must be > 0");
    s.master_volume       = std::clamp(s.master_volume, 0.0f, 1.0f);
    s.sfx_volume          = std::clamp(s.sfx_volume,    0.0f, 1.0f);
    s.max_sound_instances = std::max(s.max_sound_instances, 1);
    s.min_play_delay      = std::max(s.min_play_delay, 0.0f);

    if (doc.contains("extensions")) {
        s.extensions = doc["extensions"].get<std::vector<std::string>>();
    }

    if (doc.contains("sounds")) {
        for (const auto& [name, entry] : doc["sounds"].items()) {
            s.sounds[name] = parse_sound(entry, s);
        }
    }

    if (doc.contains("groups")) {
        for (const auto& [name, members] : doc["groups"].items()) {
            s.groups[name] = members.get<std::vector<std::string>>();
        }
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool AudioConfigLoader::load_from_string(AudioSettings& settings, const std::string& json_str) {
    try {
        json doc = json::parse(json_str);
        if (!doc.is_object()) return false;
        AudioSettings staged = settings;
        apply(staged, doc);
        settings = std::move(staged);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool AudioConfigLoader::load(AudioSettings& settings, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(settings, content);
}

} // namespace xiangqi::audio
