#pragma once
// SyncSession.hpp - Line-by-line lyric synchronisation state machine
//
// Holds the lyric lines, the timestamps tapped so far and a cursor to the
// next line awaiting a timestamp. Playback is not owned here: the caller
// passes the current position to advance() and stops playback itself when
// the session completes.

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "sync/Timestamp.hpp"
#include "util/Result.hpp"

namespace lrc::sync {

namespace fs = std::filesystem;

enum class SessionState {
    Empty,   // no lyrics loaded
    Ready,   // cursor < line count
    Complete // every line has been passed by the cursor
};

struct LrcRecord {
    Timestamp time;
    std::string text;
};

struct PreviewEntry {
    std::string tag; // "[MM:SS.CC]" or "[-]" when not tapped yet
    std::string text;
};

class SyncSession {
public:
    // Trims every line and drops the blank ones
    static std::vector<std::string> cleanLines(std::string_view text);

    Result<void> loadLyrics(const std::vector<std::string>& lines);
    Result<void> loadLyricsText(std::string_view text);
    Result<void> loadLyricsFile(const fs::path& path);

    // Only recorded for readiness and naming; sync state is untouched
    void setAudio(fs::path path);

    // Returns true when this call completed the session
    Result<bool> advance(i64 positionMillis);
    Result<void> rewind();
    // Returns false when there was nothing to undo
    bool undoLastTimestamp();

    // One record per line. Lines without a timestamp reuse the last one
    // recorded, or zero when none exist.
    std::vector<LrcRecord> exportRecords() const;

    SessionState state() const;
    bool isComplete() const {
        return state() == SessionState::Complete;
    }
    bool hasAudio() const {
        return !audioPath_.empty();
    }
    bool hasLyrics() const {
        return !lines_.empty();
    }
    bool isReady() const {
        return hasAudio() && hasLyrics();
    }

    std::size_t cursor() const {
        return cursor_;
    }
    std::size_t lineCount() const {
        return lines_.size();
    }
    std::size_t syncedCount() const {
        return std::min(timestamps_.size(), lines_.size());
    }
    const std::vector<std::string>& lines() const {
        return lines_;
    }
    const std::vector<Timestamp>& timestamps() const {
        return timestamps_;
    }
    std::vector<std::string> timestampTags() const;

    std::string currentLine() const;
    std::string nextLine() const;
    std::vector<PreviewEntry> previewEntries() const;

    const fs::path& audioPath() const {
        return audioPath_;
    }
    const fs::path& lyricsPath() const {
        return lyricsPath_;
    }

private:
    Result<void> requireReady(std::string_view action) const;

    std::vector<std::string> lines_;
    std::vector<Timestamp> timestamps_;
    std::size_t cursor_{0};

    fs::path audioPath_;
    fs::path lyricsPath_;
};

} // namespace lrc::sync
