#include "SDLMixerAudioSource.hpp"
#include <SDL2/SDL.h>
#include <SDL2/SDL_mixer.h>
#include <algorithm>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace lrc {

SDLMixerAudioSource::SDLMixerAudioSource() = default;

SDLMixerAudioSource::SDLMixerAudioSource(PlaybackClock clock)
    : clock_(std::move(clock)) {}

SDLMixerAudioSource::~SDLMixerAudioSource() {
    if (deviceOpen_)
        Mix_HaltMusic();
    freeMusic();
    if (deviceOpen_) {
        Mix_CloseAudio();
        Mix_Quit();
    }
    if (sdlInitialized_)
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
}

Result<void> SDLMixerAudioSource::init(const AudioConfig& cfg) {
    if (deviceOpen_)
        return Result<void>::ok();

    if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        LOG_ERROR("SDL audio init failed: {}", SDL_GetError());
        return Result<void>::err(ErrorCode::AudioDevice,
                                 std::string("SDL audio init failed: ") +
                                         SDL_GetError());
    }
    sdlInitialized_ = true;

    int flags = Mix_Init(MIX_INIT_MP3);
    if ((flags & MIX_INIT_MP3) == 0) {
        // WAV needs no decoder library, so keep going
        LOG_WARN("SDL_mixer has no MP3 support: {}", Mix_GetError());
    }

    if (Mix_OpenAudio(static_cast<int>(cfg.sampleRate),
                      MIX_DEFAULT_FORMAT,
                      static_cast<int>(cfg.channels),
                      static_cast<int>(cfg.bufferSize)) < 0) {
        LOG_ERROR("SDL_mixer init failed: {}", Mix_GetError());
        return Result<void>::err(ErrorCode::AudioDevice,
                                 std::string("Cannot open audio device: ") +
                                         Mix_GetError());
    }
    deviceOpen_ = true;
    setVolume(cfg.volume);

    LOG_INFO("SDLMixerAudioSource initialized: {} Hz, {} ch, buffer {}",
             cfg.sampleRate,
             cfg.channels,
             cfg.bufferSize);
    return Result<void>::ok();
}

Result<void> SDLMixerAudioSource::load(const fs::path& path) {
    if (auto valid = file::validateAudioPath(path); !valid) {
        LOG_WARN("Rejected audio file: {}", valid.error().message);
        return valid;
    }

    if (!deviceOpen_)
        return Result<void>::err(ErrorCode::AudioDevice,
                                 "Audio device is not open");

    Mix_Music* music = Mix_LoadMUS(path.string().c_str());
    if (!music) {
        LOG_ERROR("Failed to load music file {}: {}",
                  path.string(),
                  Mix_GetError());
        return Result<void>::err(ErrorCode::AudioDevice,
                                 std::string("Cannot decode audio: ") +
                                         Mix_GetError());
    }

    stop();
    freeMusic();
    music_ = music;
    loadedPath_ = path;
    paused_ = false;

    LOG_INFO("Loaded audio file: {}", path.string());
    return Result<void>::ok();
}

void SDLMixerAudioSource::play() {
    if (!music_) {
        LOG_WARN("No music loaded");
        return;
    }

    if (Mix_PlayMusic(music_, 1) == -1) {
        LOG_ERROR("Failed to play music: {}", Mix_GetError());
        clock_.stop();
        return;
    }
    clock_.start();
    paused_ = false;
    LOG_INFO("Playback started");
}

void SDLMixerAudioSource::pauseToggle() {
    if (!music_)
        return;

    if (paused_) {
        Mix_ResumeMusic();
        clock_.resume();
        paused_ = false;
        LOG_INFO("Playback resumed");
    } else {
        Mix_PauseMusic();
        clock_.pause();
        paused_ = true;
        LOG_INFO("Playback paused");
    }
}

void SDLMixerAudioSource::stop() {
    if (deviceOpen_)
        Mix_HaltMusic();
    clock_.stop();
    paused_ = false;
    LOG_DEBUG("Playback stopped");
}

void SDLMixerAudioSource::setVolume(float volume) {
    volume = std::clamp(volume, 0.0f, 1.0f);
    Mix_VolumeMusic(static_cast<int>(volume * MIX_MAX_VOLUME));
}

bool SDLMixerAudioSource::isPlaying() const {
    return music_ && Mix_PlayingMusic() != 0;
}

i64 SDLMixerAudioSource::positionMillis() const {
    if (!isPlaying())
        return 0;
    return clock_.elapsedMs();
}

void SDLMixerAudioSource::freeMusic() {
    if (music_) {
        Mix_FreeMusic(music_);
        music_ = nullptr;
    }
    loadedPath_.clear();
}

} // namespace lrc
