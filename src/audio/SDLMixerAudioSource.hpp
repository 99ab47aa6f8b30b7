#pragma once
// SDLMixerAudioSource.hpp - SDL_mixer backed playback source
// SDL_mixer decodes and mixes; position comes from PlaybackClock because
// the mixer has no portable "time since play" query.

#include <filesystem>
#include "audio/PlaybackClock.hpp"
#include "audio/PlaybackSource.hpp"
#include "core/ConfigData.hpp"

// Forward declare SDL types
struct _Mix_Music;
typedef struct _Mix_Music Mix_Music;

namespace lrc {

class SDLMixerAudioSource : public PlaybackSource {
public:
    SDLMixerAudioSource();
    explicit SDLMixerAudioSource(PlaybackClock clock);
    ~SDLMixerAudioSource() override;

    SDLMixerAudioSource(const SDLMixerAudioSource&) = delete;
    SDLMixerAudioSource& operator=(const SDLMixerAudioSource&) = delete;

    // Opens the audio device
    Result<void> init(const AudioConfig& cfg);

    Result<void> load(const fs::path& path) override;
    void play() override;
    void pauseToggle() override;
    void stop() override;
    void setVolume(float volume); // 0.0 - 1.0

    bool isLoaded() const override {
        return music_ != nullptr;
    }
    bool isPlaying() const override;
    bool isPaused() const override {
        return paused_;
    }
    i64 positionMillis() const override;

    const fs::path& loadedPath() const override {
        return loadedPath_;
    }

private:
    void freeMusic();

    Mix_Music* music_{nullptr};
    PlaybackClock clock_;
    fs::path loadedPath_;
    bool paused_{false};
    bool deviceOpen_{false};
    bool sdlInitialized_{false};
};

} // namespace lrc
