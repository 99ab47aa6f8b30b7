#pragma once
// SyncController.hpp - Routes user commands to the player and sync session
// Holds no widgets, so every command can be exercised without a display.

#include <filesystem>
#include <string>
#include "audio/PlaybackSource.hpp"
#include "sync/SyncSession.hpp"
#include "util/Signal.hpp"

namespace lrc {

class SyncController {
public:
    SyncController(PlaybackSource& audio, sync::SyncSession& session);

    Result<void> loadAudio(const fs::path& path);
    Result<void> loadLyrics(const fs::path& path);

    Result<void> play();
    void pauseToggle();
    void stop();

    // Tags the current line with the playback position
    Result<void> nextLine();
    Result<void> backLine();
    bool undo();

    // Preconditions for saving, checked before any confirmation prompt
    Result<void> checkSaveReady() const;
    bool needsSaveConfirmation() const;
    std::string suggestedFileName() const;
    Result<void> save(const fs::path& path);

    // Read-only snapshot for the periodic status refresh
    std::string statusText() const;

    Signal<> sessionChanged;
    Signal<> completed;
    Signal<const std::string&> statusMessage;

private:
    PlaybackSource& audio_;
    sync::SyncSession& session_;
};

} // namespace lrc
