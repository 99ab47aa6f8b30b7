#pragma once
// PlaybackSource.hpp - Transport controls plus elapsed-position reporting
// Implemented by SDLMixerAudioSource; tests substitute a scripted fake.

#include <filesystem>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace lrc {

namespace fs = std::filesystem;

class PlaybackSource {
public:
    virtual ~PlaybackSource() = default;

    // NotFound if the file is missing, UnsupportedFormat for anything but
    // .mp3/.wav. On success playback is stopped and the pause flag cleared.
    virtual Result<void> load(const fs::path& path) = 0;

    // Restarts from zero. No-op without a loaded asset.
    virtual void play() = 0;
    // No-op without a loaded asset.
    virtual void pauseToggle() = 0;
    virtual void stop() = 0;

    virtual bool isLoaded() const = 0;
    // True while started, including while paused
    virtual bool isPlaying() const = 0;
    virtual bool isPaused() const = 0;

    // Milliseconds since the last play(), frozen while paused, 0 when stopped
    virtual i64 positionMillis() const = 0;

    virtual const fs::path& loadedPath() const = 0;
};

} // namespace lrc
