#pragma once
#include "audio_backend.hpp"
#include "audio_config.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace xiangqi::audio {

enum class LoadResult { Ok, NotFound, DecodeError };

enum class PlayResult { Ok, NotLoaded, RateLimited, ConcurrencyLimited, NoChannelAvailable };

const char* to_string(LoadResult result);
const char* to_string(PlayResult result);

// Snapshot returned by AudioManager::info().
struct SoundInfo {
    SoundConfig config;
    std::string path;
    int         play_count = 0;
};

// ---------------------------------------------------------------------------
// AudioManager — owns the channel pool, the loaded sound table and the list
// of in-flight playback instances, and mediates every play request against
// the rate and concurrency limits of the requested sound.
//
// Single-threaded: call from the frame loop and its event handlers only.
// Channel completion is polled (update(), and before each channel search).
// No operation throws for missing files, limits or a full pool; backend
// exceptions are converted to LoadResult / PlayResult at the boundary.
// ---------------------------------------------------------------------------

class AudioManager {
public:
    // Seconds on a monotonic clock.
    using Clock = std::function<double()>;

    AudioManager(std::unique_ptr<AudioBackend> backend, AudioSettings settings,
                 Clock clock = {});
    ~AudioManager();

    AudioManager(const AudioManager&)            = delete;
    AudioManager& operator=(const AudioManager&) = delete;

    // Reopen the channel pool after cleanup(). No-op while open.
    void init();

    // --- Loading ---

    // Idempotent. An empty path is resolved from the name. Config precedence:
    // the one given here, then the settings table, then the defaults.
    LoadResult load_sound(const std::string& name,
                          const std::string& path = {},
                          const std::optional<SoundConfig>& config = std::nullopt);

    // Load every sound named in the settings table; never stops early.
    std::map<std::string, LoadResult> load_configured();

    // Load every file in the sound directory not already loaded.
    std::map<std::string, LoadResult> load_all();

    // --- Playback ---

    // pan: -1 = left, 0 = centre, 1 = right.
    PlayResult play(const std::string& name, float volume = 1.0f, float pan = 0.0f);

    void stop_all();
    int  stop_sound(const std::string& name);
    void pause_all();
    void resume_all();

    // Clamp to [0,1], then re-apply the baseline of every loaded sound and
    // rescale every live channel.
    void set_master_volume(float volume);
    void set_effects_volume(float volume);
    float master_volume()  const { return master_volume_; }
    float effects_volume() const { return effects_volume_; }

    // Per-frame maintenance: reap finished channels, drop stale records.
    void update();

    // Stop everything, release every buffer and close the pool.
    void cleanup();

    // --- Queries ---

    std::optional<SoundInfo> info(const std::string& name) const;
    std::set<std::string>    playing_names();
    bool is_loaded(const std::string& name) const { return sounds_.count(name) != 0; }
    int  loaded_count()  const { return static_cast<int>(sounds_.size()); }
    int  active_count()  const { return static_cast<int>(instances_.size()); }
    int  channel_count() const;
    int  free_channel_count() const;
    double now() const { return clock_(); }

    const AudioSettings& settings() const { return settings_; }
    AudioBackend&        backend()        { return *backend_; }

private:
    struct LoadedSound {
        SoundHandle handle = -1;
        SoundConfig config;
        std::string path;
        double      last_play  = 0.0;
        bool        ever_played = false;
        int         play_count = 0;
    };

    struct PlaybackInstance {
        std::string   sound;
        double        start_time = 0.0;
        std::uint64_t sequence   = 0; // tie-break for equal start times
        ChannelId     channel    = -1;
        float         request_volume = 1.0f;
    };

    std::string resolve_path(const std::string& name) const;
    float       mix(const SoundConfig& config, float request_volume) const;
    void        reap_finished();
    std::optional<ChannelId> acquire_channel();
    int         instances_of(const std::string& name) const;
    void        apply_volumes();

    std::unique_ptr<AudioBackend> backend_;
    AudioSettings                 settings_;
    Clock                         clock_;
    bool                          open_ = false;

    std::map<std::string, LoadedSound> sounds_;
    std::vector<PlaybackInstance>      instances_;
    std::uint64_t                      next_sequence_ = 0;

    float master_volume_  = 1.0f;
    float effects_volume_ = 1.0f;
};

} // namespace xiangqi::audio
