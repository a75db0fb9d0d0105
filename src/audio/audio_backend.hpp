#pragma once
#include <string>
#include <vector>

namespace xiangqi::audio {

// ---------------------------------------------------------------------------
// AudioBackend — the mixer boundary driven by AudioManager.
//
// Sounds are decoded buffers addressed by SoundHandle; channels are the slots
// of a fixed-size pool addressed by 0-based index. Every call is synchronous
// and fire-and-forget; playback itself runs on the mixer's own threads.
//
// load_sound() throws std::runtime_error when the file cannot be decoded.
// A paused channel reports busy.
// ---------------------------------------------------------------------------

using SoundHandle = int;
using ChannelId   = int;

class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    // Filesystem
    virtual bool file_exists(const std::string& path) = 0;
    // Paths of the regular files directly inside dir (non-recursive).
    virtual std::vector<std::string> list_files(const std::string& dir) = 0;

    // Sound buffers
    virtual SoundHandle load_sound(const std::string& path) = 0;
    virtual void        unload_sound(SoundHandle sound) = 0;
    virtual void        set_sound_volume(SoundHandle sound, float volume) = 0;

    // Channel pool
    virtual void open_channels(int count) = 0;
    virtual void close_channels() = 0;
    virtual int  channel_count() const = 0;

    virtual void play_channel(ChannelId channel, SoundHandle sound, float volume, float pan) = 0;
    virtual void stop_channel(ChannelId channel) = 0;
    virtual bool channel_busy(ChannelId channel) = 0;
    virtual void set_channel_volume(ChannelId channel, float volume) = 0;

    // Whole mixer
    virtual void stop_all() = 0;
    virtual void pause_all() = 0;
    virtual void resume_all() = 0;
};

} // namespace xiangqi::audio
