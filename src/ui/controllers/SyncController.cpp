#include "SyncController.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "sync/LrcWriter.hpp"

namespace lrc {

SyncController::SyncController(PlaybackSource& audio,
                               sync::SyncSession& session)
    : audio_(audio), session_(session) {}

Result<void> SyncController::loadAudio(const fs::path& path) {
    auto result = audio_.load(path);
    Logger::command("loadAudio", result);
    if (!result)
        return result;

    audio_.stop();
    session_.setAudio(audio_.loadedPath());
    statusMessage.emitSignal("Audio loaded: " + path.filename().string());
    sessionChanged.emitSignal();
    return Result<void>::ok();
}

Result<void> SyncController::loadLyrics(const fs::path& path) {
    auto result = session_.loadLyricsFile(path);
    Logger::command("loadLyrics", result);
    if (!result)
        return result;

    statusMessage.emitSignal(std::to_string(session_.lineCount()) +
                             " lyric lines read.");
    sessionChanged.emitSignal();
    return Result<void>::ok();
}

Result<void> SyncController::play() {
    if (!session_.hasAudio()) {
        auto refused =
                Result<void>::err(ErrorCode::NotReady, "Load audio first.");
        Logger::command("play", refused);
        return refused;
    }

    // Always restart so the first tap lines up with a known origin
    audio_.stop();
    audio_.play();
    Logger::command("play", "restarted from 00:00.00");
    return Result<void>::ok();
}

void SyncController::pauseToggle() {
    if (!audio_.isLoaded()) {
        Logger::command("pauseToggle", "ignored, no audio");
        return;
    }

    if (!audio_.isPlaying())
        audio_.play();
    else
        audio_.pauseToggle();
    Logger::command("pauseToggle", audio_.isPaused() ? "paused" : "playing");
}

void SyncController::stop() {
    audio_.stop();
    Logger::command("stop", "stopped");
}

Result<void> SyncController::nextLine() {
    i64 pos = audio_.positionMillis();
    auto advanced = session_.advance(pos);
    Logger::command("nextLine", advanced);
    if (!advanced)
        return Result<void>::err(advanced.error());
    LOG_DEBUG("Line {} tagged {}",
              session_.cursor(),
              sync::Timestamp(pos).toString());

    sessionChanged.emitSignal();

    if (advanced.value()) {
        if (CONFIG_VIEW.sync().stopOnComplete)
            audio_.stop();
        completed.emitSignal();
    }
    return Result<void>::ok();
}

Result<void> SyncController::backLine() {
    auto result = session_.rewind();
    Logger::command("backLine", result);
    if (result)
        sessionChanged.emitSignal();
    return result;
}

bool SyncController::undo() {
    if (!session_.undoLastTimestamp()) {
        Logger::command("undo", "nothing to undo");
        return false;
    }
    Logger::command("undo", "removed last timestamp");
    sessionChanged.emitSignal();
    return true;
}

Result<void> SyncController::checkSaveReady() const {
    if (!session_.hasAudio())
        return Result<void>::err(ErrorCode::NotReady, "Load audio first.");
    if (!session_.hasLyrics())
        return Result<void>::err(ErrorCode::NotReady, "Load lyrics first.");
    return Result<void>::ok();
}

bool SyncController::needsSaveConfirmation() const {
    return session_.timestamps().empty() &&
           CONFIG_VIEW.sync().confirmEmptySave;
}

std::string SyncController::suggestedFileName() const {
    const auto& exp = CONFIG_VIEW.exporting();
    return sync::LrcWriter::defaultFileName(
            session_.audioPath(), exp.extension, exp.fallbackName);
}

Result<void> SyncController::save(const fs::path& path) {
    if (auto ready = checkSaveReady(); !ready) {
        Logger::command("save", ready);
        return ready;
    }

    const auto& exp = CONFIG_VIEW.exporting();
    sync::LrcHeader header{exp.writeHeader,
                           exp.title.empty() ? session_.audioPath().stem().string()
                                             : exp.title,
                           exp.artist,
                           exp.album,
                           exp.author};

    auto result = sync::LrcWriter::write(path, session_.exportRecords(), header);
    Logger::command("save", result);
    if (result)
        statusMessage.emitSignal("Saved: " + path.string());
    return result;
}

std::string SyncController::statusText() const {
    i64 pos = audio_.isPlaying() ? audio_.positionMillis() : 0;

    std::string status = sync::Timestamp(pos).toClock();
    status += " | Lines: " + std::to_string(session_.syncedCount()) + "/" +
              std::to_string(session_.lineCount());
    if (session_.hasAudio())
        status += " | Audio: " + session_.audioPath().filename().string();
    if (!session_.lyricsPath().empty())
        status += " | Lyrics: " + session_.lyricsPath().filename().string();
    if (audio_.isPaused())
        status += " | PAUSED";
    return status;
}

} // namespace lrc
