#pragma once
// LrcWriter.hpp - Renders synchronised lyrics to the timed-lyrics format
// One "[MM:SS.CC] text" line per lyric, optionally preceded by ID tags

#include <filesystem>
#include <string>
#include <vector>
#include "sync/SyncSession.hpp"
#include "util/Result.hpp"

namespace lrc::sync {

struct LrcHeader {
    bool enabled{false};
    std::string title;
    std::string artist;
    std::string album;
    std::string author;
};

class LrcWriter {
public:
    static std::string render(const std::vector<LrcRecord>& records,
                              const LrcHeader& header = {});

    // Writes UTF-8 text atomically; the error carries the OS reason
    static Result<void> write(const fs::path& path,
                              const std::vector<LrcRecord>& records,
                              const LrcHeader& header = {});

    // "<audio stem><extension>", or "<fallback><extension>" without audio
    static std::string defaultFileName(const fs::path& audioPath,
                                       const std::string& extension = ".lrc",
                                       const std::string& fallback = "output");
};

} // namespace lrc::sync
