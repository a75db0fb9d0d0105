#include "raylib_backend.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace xiangqi::audio {

// raylib pan: 0.5 is centre, 1.0 is full left.
static float to_raylib_pan(float pan) {
    return std::clamp(0.5f - pan * 0.5f, 0.0f, 1.0f);
}

RaylibBackend::~RaylibBackend() {
    close_channels();
    for (auto& [handle, sound] : sounds_) UnloadSound(sound);
    sounds_.clear();
}

// ---------------------------------------------------------------------------
// Filesystem
// ---------------------------------------------------------------------------

bool RaylibBackend::file_exists(const std::string& path) {
    return FileExists(path.c_str());
}

std::vector<std::string> RaylibBackend::list_files(const std::string& dir) {
    std::vector<std::string> out;
    if (!DirectoryExists(dir.c_str())) return out;

    FilePathList files = LoadDirectoryFiles(dir.c_str());
    for (unsigned int i = 0; i < files.count; i++) {
        if (IsPathFile(files.paths[i])) out.emplace_back(files.paths[i]);
    }
    UnloadDirectoryFiles(files);
    return out;
}

// ---------------------------------------------------------------------------
// Sound buffers
// ---------------------------------------------------------------------------

SoundHandle RaylibBackend::load_sound(const std::string& path) {
    Sound sound = LoadSound(path.c_str());
    // LoadSound() returns a zeroed Sound when the decoder rejects the file.
    if (sound.frameCount == 0 || sound.stream.buffer == nullptr) {
        TraceLog(LOG_WARNING, "AUDIO: Failed to decode '%s'", path.c_str());
        throw std::runtime_error("RaylibBackend: cannot decode '" + path + "'");
    }
    SoundHandle handle = next_handle_++;
    sounds_.emplace(handle, sound);
    return handle;
}

void RaylibBackend::unload_sound(SoundHandle sound) {
    auto it = sounds_.find(sound);
    if (it == sounds_.end()) return;

    // Aliases borrow the buffer's sample data; drop them first.
    for (auto& s : slots_) {
        if (s.bound && s.source == sound) release(s);
    }
    UnloadSound(it->second);
    sounds_.erase(it);
}

void RaylibBackend::set_sound_volume(SoundHandle sound, float volume) {
    SetSoundVolume(sounds_.at(sound), volume);
}

// ---------------------------------------------------------------------------
// Channel pool
// ---------------------------------------------------------------------------

void RaylibBackend::open_channels(int count) {
    close_channels();
    slots_.resize(static_cast<size_t>(std::max(count, 0)));
    TraceLog(LOG_INFO, "AUDIO: Opened %d playback channel(s)", count);
}

void RaylibBackend::close_channels() {
    for (auto& s : slots_) release(s);
    slots_.clear();
}

RaylibBackend::Slot& RaylibBackend::slot(ChannelId channel) {
    if (channel < 0 || channel >= channel_count())
        throw std::out_of_range("RaylibBackend: channel " + std::to_string(channel) + " out of range");
    return slots_[static_cast<size_t>(channel)];
}

void RaylibBackend::release(Slot& s) {
    if (!s.bound) return;
    StopSound(s.alias);
    UnloadSoundAlias(s.alias);
    s = Slot{};
}

void RaylibBackend::play_channel(ChannelId channel, SoundHandle sound, float volume, float pan) {
    Slot& s = slot(channel);
    const Sound& source = sounds_.at(sound);
    release(s);

    s.alias  = LoadSoundAlias(source);
    s.source = sound;
    s.bound  = true;
    SetSoundVolume(s.alias, volume);
    SetSoundPan(s.alias, to_raylib_pan(pan));
    PlaySound(s.alias);
}

void RaylibBackend::stop_channel(ChannelId channel) {
    release(slot(channel));
}

bool RaylibBackend::channel_busy(ChannelId channel) {
    if (channel < 0 || channel >= channel_count()) return false;
    const Slot& s = slots_[static_cast<size_t>(channel)];
    return s.bound && (s.paused || IsSoundPlaying(s.alias));
}

void RaylibBackend::set_channel_volume(ChannelId channel, float volume) {
    Slot& s = slot(channel);
    if (s.bound) SetSoundVolume(s.alias, volume);
}

// ---------------------------------------------------------------------------
// Whole mixer
// ---------------------------------------------------------------------------

void RaylibBackend::stop_all() {
    for (auto& s : slots_) release(s);
}

void RaylibBackend::pause_all() {
    for (auto& s : slots_) {
        if (s.bound && !s.paused && IsSoundPlaying(s.alias)) {
            PauseSound(s.alias);
            s.paused = true;
        }
    }
}

void RaylibBackend::resume_all() {
    for (auto& s : slots_) {
        if (s.bound && s.paused) {
            ResumeSound(s.alias);
            s.paused = false;
        }
    }
}

} // namespace xiangqi::audio
