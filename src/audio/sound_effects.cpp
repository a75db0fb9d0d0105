#include "sound_effects.hpp"
#include <algorithm>
#include <cmath>

namespace xiangqi::audio {

static constexpr float DEFAULT_SEQUENCE_GAP = 0.1f;
static constexpr float MIN_SPATIAL_VOLUME   = 0.1f;

SoundEffects::SoundEffects(AudioManager& manager, std::uint32_t seed)
    : manager_(manager), rng_(seed) {}

bool SoundEffects::play_ui(const std::string& name, float volume) {
    return manager_.play(name, volume) == PlayResult::Ok;
}

std::optional<std::string> SoundEffects::play_random_from_group(const std::string& group, float volume) {
    const auto& groups = manager_.settings().groups;
    auto it = groups.find(group);
    if (it == groups.end()) return std::nullopt;

    std::vector<std::string> available;
    for (const auto& name : it->second) {
        if (manager_.is_loaded(name)) available.push_back(name);
    }
    if (available.empty()) return std::nullopt;

    std::uniform_int_distribution<std::size_t> pick(0, available.size() - 1);
    const std::string& chosen = available[pick(rng_)];
    if (manager_.play(chosen, volume) != PlayResult::Ok) return std::nullopt;
    return chosen;
}

int SoundEffects::play_sequence(const std::vector<std::string>& names,
                                std::vector<float> delays, float volume) {
    if (names.empty()) return 0;
    if (delays.size() < names.size()) delays.resize(names.size(), DEFAULT_SEQUENCE_GAP);

    const double start = manager_.now();
    double offset  = 0.0;
    int    started = 0;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (offset <= 0.0) {
            if (manager_.play(names[i], volume) == PlayResult::Ok) ++started;
        } else {
            pending_.push_back({start + offset, names[i], volume});
        }
        offset += std::max(delays[i], 0.0f);
    }
    return started;
}

bool SoundEffects::play_spatial(const std::string& name, Point2 position, Point2 listener,
                                float max_distance, float half_width) {
    const float dx       = position.x - listener.x;
    const float dy       = position.y - listener.y;
    const float distance = std::sqrt(dx * dx + dy * dy);
    if (distance >= max_distance) return false;

    const float volume = std::max(MIN_SPATIAL_VOLUME, 1.0f - distance / max_distance);
    const float pan    = half_width > 0.0f ? std::clamp(dx / half_width, -1.0f, 1.0f) : 0.0f;
    return manager_.play(name, volume, pan) == PlayResult::Ok;
}

int SoundEffects::preload(const std::vector<std::string>& names) {
    int loaded = 0;
    for (const auto& name : names) {
        if (manager_.load_sound(name) == LoadResult::Ok) ++loaded;
    }
    return loaded;
}

void SoundEffects::stop_all() {
    pending_.clear();
    manager_.stop_all();
}

void SoundEffects::set_volume(std::optional<float> master, std::optional<float> sfx) {
    if (master) manager_.set_master_volume(*master);
    if (sfx)    manager_.set_effects_volume(*sfx);
}

VolumeLevels SoundEffects::volume() const {
    return {manager_.master_volume(), manager_.effects_volume()};
}

AudioStatus SoundEffects::status() {
    AudioStatus s;
    s.loaded_sounds      = manager_.loaded_count();
    s.playing_now        = static_cast<int>(manager_.playing_names().size());
    s.available_channels = manager_.free_channel_count();
    s.volume             = volume();
    return s;
}

int SoundEffects::update() {
    if (pending_.empty()) return 0;
    const double now = manager_.now();

    // Entries due this frame, in schedule order.
    std::vector<Pending> due;
    auto split = std::stable_partition(pending_.begin(), pending_.end(),
        [now](const Pending& p) { return p.fire_at > now; });
    due.assign(split, pending_.end());
    pending_.erase(split, pending_.end());

    std::stable_sort(due.begin(), due.end(),
        [](const Pending& a, const Pending& b) { return a.fire_at < b.fire_at; });
    int started = 0;
    for (const auto& p : due) {
        if (manager_.play(p.name, p.volume) == PlayResult::Ok) ++started;
    }
    return started;
}

} // namespace xiangqi::audio
