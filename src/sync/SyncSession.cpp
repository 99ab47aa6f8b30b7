#include "SyncSession.hpp"
#include <QString>
#include <algorithm>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace lrc::sync {

namespace {
// Strips every QChar::isSpace() character, so U+00A0 and U+3000 count as blank
std::string trim(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()))
            .trimmed()
            .toStdString();
}
} // namespace

std::vector<std::string> SyncSession::cleanLines(std::string_view text) {
    std::vector<std::string> result;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();

        auto line = trim(text.substr(start, end - start));
        if (!line.empty())
            result.push_back(std::move(line));

        start = end + 1;
    }
    return result;
}

Result<void> SyncSession::loadLyrics(const std::vector<std::string>& lines) {
    std::vector<std::string> cleaned;
    cleaned.reserve(lines.size());
    for (const auto& raw : lines) {
        auto line = trim(raw);
        if (!line.empty())
            cleaned.push_back(std::move(line));
    }

    if (cleaned.empty())
        return Result<void>::err(ErrorCode::EmptyFile,
                                 "Lyric file is empty.");

    lines_ = std::move(cleaned);
    timestamps_.clear();
    cursor_ = 0;
    lyricsPath_.clear();
    LOG_DEBUG("SyncSession: loaded {} lyric lines", lines_.size());
    return Result<void>::ok();
}

Result<void> SyncSession::loadLyricsText(std::string_view text) {
    return loadLyrics(cleanLines(text));
}

Result<void> SyncSession::loadLyricsFile(const fs::path& path) {
    auto text = file::readText(path);
    if (!text)
        return Result<void>::err(text.error());

    auto loaded = loadLyricsText(text.value());
    if (!loaded)
        return loaded;

    lyricsPath_ = path;
    LOG_INFO("Lyrics loaded: {} ({} lines)", path.string(), lines_.size());
    return Result<void>::ok();
}

void SyncSession::setAudio(fs::path path) {
    audioPath_ = std::move(path);
}

Result<void> SyncSession::requireReady(std::string_view action) const {
    if (!hasAudio())
        return Result<void>::err(ErrorCode::NotReady,
                                 "Load audio before " + std::string(action) +
                                         ".");
    if (!hasLyrics())
        return Result<void>::err(ErrorCode::NotReady,
                                 "Load lyrics before " + std::string(action) +
                                         ".");
    return Result<void>::ok();
}

Result<bool> SyncSession::advance(i64 positionMillis) {
    if (auto ready = requireReady("tapping lines"); !ready)
        return Result<bool>::err(ready.error());

    if (cursor_ >= lines_.size())
        return Result<bool>::err(ErrorCode::AlreadyComplete,
                                 "All lines are already synchronized.");

    Timestamp ts(positionMillis);
    if (cursor_ < timestamps_.size()) {
        LOG_DEBUG("SyncSession: line {} retimed {} -> {}",
                  cursor_,
                  timestamps_[cursor_].toString(),
                  ts.toString());
        timestamps_[cursor_] = ts;
    } else {
        timestamps_.push_back(ts);
    }
    ++cursor_;

    bool completed = cursor_ == lines_.size();
    if (completed)
        LOG_INFO("SyncSession: all {} lines synchronized", lines_.size());
    return Result<bool>::ok(completed);
}

Result<void> SyncSession::rewind() {
    if (auto ready = requireReady("stepping back"); !ready)
        return ready;

    if (cursor_ > 0)
        --cursor_;
    return Result<void>::ok();
}

bool SyncSession::undoLastTimestamp() {
    if (timestamps_.empty())
        return false;

    timestamps_.pop_back();
    cursor_ = std::min(cursor_, timestamps_.size());
    return true;
}

std::vector<LrcRecord> SyncSession::exportRecords() const {
    std::vector<LrcRecord> records;
    records.reserve(lines_.size());

    Timestamp fallback = timestamps_.empty() ? Timestamp() : timestamps_.back();
    for (std::size_t i = 0; i < lines_.size(); ++i) {
        auto time = i < timestamps_.size() ? timestamps_[i] : fallback;
        records.push_back({time, lines_[i]});
    }
    return records;
}

SessionState SyncSession::state() const {
    if (lines_.empty())
        return SessionState::Empty;
    return cursor_ >= lines_.size() ? SessionState::Complete
                                    : SessionState::Ready;
}

std::vector<std::string> SyncSession::timestampTags() const {
    std::vector<std::string> tags;
    tags.reserve(timestamps_.size());
    for (const auto& ts : timestamps_)
        tags.push_back(ts.toString());
    return tags;
}

std::string SyncSession::currentLine() const {
    return cursor_ < lines_.size() ? lines_[cursor_] : std::string();
}

std::string SyncSession::nextLine() const {
    return cursor_ + 1 < lines_.size() ? lines_[cursor_ + 1] : std::string();
}

std::vector<PreviewEntry> SyncSession::previewEntries() const {
    std::vector<PreviewEntry> entries;
    entries.reserve(lines_.size());
    for (std::size_t i = 0; i < lines_.size(); ++i) {
        entries.push_back({i < timestamps_.size() ? timestamps_[i].toString()
                                                  : std::string("[-]"),
                           lines_[i]});
    }
    return entries;
}

} // namespace lrc::sync
