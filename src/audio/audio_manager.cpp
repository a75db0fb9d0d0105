#include "audio_manager.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <utility>

namespace xiangqi::audio {

const char* to_string(LoadResult result) {
    switch (result) {
        case LoadResult::Ok:          return "ok";
        case LoadResult::NotFound:    return "not found";
        case LoadResult::DecodeError: return "decode error";
    }
    return "unknown";
}

const char* to_string(PlayResult result) {
    switch (result) {
        case PlayResult::Ok:                 return "ok";
        case PlayResult::NotLoaded:          return "not loaded";
        case PlayResult::RateLimited:        return "rate limited";
        case PlayResult::ConcurrencyLimited: return "concurrency limited";
        case PlayResult::NoChannelAvailable: return "no channel available";
    }
    return "unknown";
}

static double steady_seconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

static std::string join_path(const std::string& dir, const std::string& file) {
    if (dir.empty()) return file;
    return (std::filesystem::path(dir) / file).string();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

AudioManager::AudioManager(std::unique_ptr<AudioBackend> backend, AudioSettings settings,
                           Clock clock)
    : backend_(std::move(backend)),
      settings_(std::move(settings)),
      clock_(clock ? std::move(clock) : Clock(&steady_seconds)) {
    master_volume_  = std::clamp(settings_.master_volume, 0.0f, 1.0f);
    effects_volume_ = std::clamp(settings_.sfx_volume,    0.0f, 1.0f);
    init();
}

AudioManager::~AudioManager() {
    cleanup();
}

void AudioManager::init() {
    if (open_) return;
    backend_->open_channels(std::max(settings_.channels, 0));
    open_ = true;
}

void AudioManager::cleanup() {
    if (!open_ && sounds_.empty()) return;
    if (open_) backend_->stop_all();
    instances_.clear();
    for (auto& [name, sound] : sounds_) backend_->unload_sound(sound.handle);
    sounds_.clear();
    if (open_) backend_->close_channels();
    open_ = false;
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

std::string AudioManager::resolve_path(const std::string& name) const {
    for (const auto& ext : settings_.extensions) {
        std::string candidate = join_path(settings_.sound_dir, name + ext);
        if (backend_->file_exists(candidate)) return candidate;
    }
    // Nothing on disk; return the preferred spelling so the miss is reportable.
    const std::string ext = settings_.extensions.empty() ? std::string() : settings_.extensions.front();
    return join_path(settings_.sound_dir, name + ext);
}

LoadResult AudioManager::load_sound(const std::string& name, const std::string& path,
                                    const std::optional<SoundConfig>& config) {
    if (is_loaded(name)) return LoadResult::Ok;

    SoundConfig cfg;
    if (config) {
        cfg = *config;
    } else if (auto it = settings_.sounds.find(name); it != settings_.sounds.end()) {
        cfg = it->second;
    } else {
        cfg = settings_.default_config();
    }
    cfg = cfg.validated();

    std::string file = path;
    if (file.empty()) {
        file = cfg.file.empty() ? resolve_path(name) : join_path(settings_.sound_dir, cfg.file);
    }
    if (!backend_->file_exists(file)) return LoadResult::NotFound;

    SoundHandle handle = -1;
    try {
        handle = backend_->load_sound(file);
        backend_->set_sound_volume(handle, mix(cfg, 1.0f));
    } catch (const std::exception&) {
        if (handle >= 0) backend_->unload_sound(handle);
        return LoadResult::DecodeError;
    }

    LoadedSound sound;
    sound.handle = handle;
    sound.config = std::move(cfg);
    sound.path   = std::move(file);
    sounds_.emplace(name, std::move(sound));
    return LoadResult::Ok;
}

std::map<std::string, LoadResult> AudioManager::load_configured() {
    std::map<std::string, LoadResult> results;
    for (const auto& [name, cfg] : settings_.sounds) {
        results[name] = load_sound(name);
    }
    return results;
}

std::map<std::string, LoadResult> AudioManager::load_all() {
    std::map<std::string, LoadResult> results;
    for (const auto& file : backend_->list_files(settings_.sound_dir)) {
        const std::filesystem::path p(file);
        const std::string ext = p.extension().string();
        if (std::find(settings_.extensions.begin(), settings_.extensions.end(), ext) ==
            settings_.extensions.end())
            continue;

        const std::string name = p.stem().string();
        if (is_loaded(name) || results.count(name)) continue;
        results[name] = load_sound(name, file);
    }
    return results;
}

// ---------------------------------------------------------------------------
// Playback
// ---------------------------------------------------------------------------

float AudioManager::mix(const SoundConfig& config, float request_volume) const {
    return std::clamp(config.volume * request_volume * master_volume_ * effects_volume_, 0.0f, 1.0f);
}

int AudioManager::instances_of(const std::string& name) const {
    return static_cast<int>(std::count_if(instances_.begin(), instances_.end(),
        [&](const PlaybackInstance& i) { return i.sound == name; }));
}

void AudioManager::reap_finished() {
    instances_.erase(std::remove_if(instances_.begin(), instances_.end(),
        [this](const PlaybackInstance& i) { return !backend_->channel_busy(i.channel); }),
        instances_.end());
}

std::optional<ChannelId> AudioManager::acquire_channel() {
    const int count = channel_count();
    if (count == 0) return std::nullopt;

    // 1. A slot with no instance bound and nothing playing
    for (ChannelId ch = 0; ch < count; ++ch) {
        bool bound = std::any_of(instances_.begin(), instances_.end(),
            [ch](const PlaybackInstance& i) { return i.channel == ch; });
        if (!bound && !backend_->channel_busy(ch)) return ch;
    }

    // 2. Evict the oldest instance
    if (!instances_.empty()) {
        auto oldest = std::min_element(instances_.begin(), instances_.end(),
            [](const PlaybackInstance& a, const PlaybackInstance& b) {
                if (a.start_time != b.start_time) return a.start_time < b.start_time;
                return a.sequence < b.sequence;
            });
        ChannelId ch = oldest->channel;
        backend_->stop_channel(ch);
        instances_.erase(oldest);
        return ch;
    }

    // 3. Every channel busy with playback whose record was swept as stale
    backend_->stop_channel(0);
    return 0;
}

PlayResult AudioManager::play(const std::string& name, float volume, float pan) {
    if (!is_loaded(name) && load_sound(name) != LoadResult::Ok) {
        return PlayResult::NotLoaded;
    }
    LoadedSound& sound = sounds_.at(name);
    const double t = clock_();

    if (sound.ever_played && t - sound.last_play < sound.config.min_delay) {
        return PlayResult::RateLimited;
    }

    reap_finished();
    if (instances_of(name) >= sound.config.max_instances) {
        return PlayResult::ConcurrencyLimited;
    }

    auto channel = acquire_channel();
    if (!channel) return PlayResult::NoChannelAvailable;

    try {
        backend_->play_channel(*channel, sound.handle, mix(sound.config, volume),
                               std::clamp(pan, -1.0f, 1.0f));
    } catch (const std::exception&) {
        return PlayResult::NoChannelAvailable;
    }

    PlaybackInstance instance;
    instance.sound          = name;
    instance.start_time     = t;
    instance.sequence       = next_sequence_++;
    instance.channel        = *channel;
    instance.request_volume = volume;
    instances_.push_back(std::move(instance));

    sound.last_play   = t;
    sound.ever_played = true;
    ++sound.play_count;
    return PlayResult::Ok;
}

void AudioManager::stop_all() {
    if (open_) backend_->stop_all();
    instances_.clear();
}

int AudioManager::stop_sound(const std::string& name) {
    reap_finished();
    int stopped = 0;
    for (auto it = instances_.begin(); it != instances_.end();) {
        if (it->sound == name) {
            backend_->stop_channel(it->channel);
            it = instances_.erase(it);
            ++stopped;
        } else {
            ++it;
        }
    }
    return stopped;
}

void AudioManager::pause_all() {
    if (open_) backend_->pause_all();
}

void AudioManager::resume_all() {
    if (open_) backend_->resume_all();
}

// ---------------------------------------------------------------------------
// Volume
// ---------------------------------------------------------------------------

void AudioManager::set_master_volume(float volume) {
    master_volume_ = std::clamp(volume, 0.0f, 1.0f);
    apply_volumes();
}

void AudioManager::set_effects_volume(float volume) {
    effects_volume_ = std::clamp(volume, 0.0f, 1.0f);
    apply_volumes();
}

void AudioManager::apply_volumes() {
    for (const auto& [name, sound] : sounds_) {
        backend_->set_sound_volume(sound.handle, mix(sound.config, 1.0f));
    }
    for (const auto& i : instances_) {
        auto it = sounds_.find(i.sound);
        if (it == sounds_.end()) continue;
        backend_->set_channel_volume(i.channel, mix(it->second.config, i.request_volume));
    }
}

// ---------------------------------------------------------------------------
// Maintenance & queries
// ---------------------------------------------------------------------------

void AudioManager::update() {
    if (!open_) return;
    reap_finished();

    const double t   = clock_();
    const double max = settings_.stale_after;
    instances_.erase(std::remove_if(instances_.begin(), instances_.end(),
        [&](const PlaybackInstance& i) { return t - i.start_time >= max; }),
        instances_.end());
}

std::optional<SoundInfo> AudioManager::info(const std::string& name) const {
    auto it = sounds_.find(name);
    if (it == sounds_.end()) return std::nullopt;
    SoundInfo out;
    out.config     = it->second.config;
    out.path       = it->second.path;
    out.play_count = it->second.play_count;
    return out;
}

std::set<std::string> AudioManager::playing_names() {
    std::set<std::string> names;
    for (const auto& i : instances_) {
        if (backend_->channel_busy(i.channel)) names.insert(i.sound);
    }
    return names;
}

int AudioManager::channel_count() const {
    return open_ ? backend_->channel_count() : 0;
}

int AudioManager::free_channel_count() const {
    return std::max(channel_count() - active_count(), 0);
}

} // namespace xiangqi::audio
