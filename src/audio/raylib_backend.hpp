#pragma once
#include "audio_backend.hpp"
#include <raylib.h>
#include <map>
#include <string>
#include <vector>

namespace xiangqi::audio {

// ---------------------------------------------------------------------------
// RaylibBackend — AudioBackend over raylib's raudio.
//
// raylib has no channel concept, so each channel slot holds a sound alias
// (LoadSoundAlias) of the buffer it plays: aliases share sample data but
// carry their own playback cursor, volume and pan.
//
// Requires InitAudioDevice() before use and must be destroyed before
// CloseAudioDevice().
// ---------------------------------------------------------------------------

class RaylibBackend final : public AudioBackend {
public:
    RaylibBackend() = default;
    ~RaylibBackend() override;

    RaylibBackend(const RaylibBackend&)            = delete;
    RaylibBackend& operator=(const RaylibBackend&) = delete;

    bool file_exists(const std::string& path) override;
    std::vector<std::string> list_files(const std::string& dir) override;

    SoundHandle load_sound(const std::string& path) override;
    void        unload_sound(SoundHandle sound) override;
    void        set_sound_volume(SoundHandle sound, float volume) override;

    void open_channels(int count) override;
    void close_channels() override;
    int  channel_count() const override { return static_cast<int>(slots_.size()); }

    void play_channel(ChannelId channel, SoundHandle sound, float volume, float pan) override;
    void stop_channel(ChannelId channel) override;
    bool channel_busy(ChannelId channel) override;
    void set_channel_volume(ChannelId channel, float volume) override;

    void stop_all() override;
    void pause_all() override;
    void resume_all() override;

private:
    struct Slot {
        Sound       alias{};
        SoundHandle source = -1;
        bool        bound  = false;
        bool        paused = false;
    };

    Slot& slot(ChannelId channel);
    void  release(Slot& s);

    std::map<SoundHandle, Sound> sounds_;
    SoundHandle                  next_handle_ = 0;
    std::vector<Slot>            slots_;
};

} // namespace xiangqi::audio
