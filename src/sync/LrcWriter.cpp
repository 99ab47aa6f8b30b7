#include "LrcWriter.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace lrc::sync {

std::string LrcWriter::render(const std::vector<LrcRecord>& records,
                              const LrcHeader& header) {
    std::string out;
    if (header.enabled) {
        out += "[ti:" + header.title + "]\n";
        out += "[ar:" + header.artist + "]\n";
        out += "[al:" + header.album + "]\n";
        out += "[by:" + header.author + "]\n";
        out += "\n";
    }

    for (const auto& rec : records) {
        out += rec.time.toString();
        out += ' ';
        out += rec.text;
        out += '\n';
    }
    return out;
}

Result<void> LrcWriter::write(const fs::path& path,
                              const std::vector<LrcRecord>& records,
                              const LrcHeader& header) {
    auto result = file::writeTextAtomic(path, render(records, header));
    if (!result) {
        LOG_ERROR("LRC export failed: {}", result.error().message);
        return result;
    }
    LOG_INFO("Saved {} lines to {}", records.size(), path.string());
    return Result<void>::ok();
}

std::string LrcWriter::defaultFileName(const fs::path& audioPath,
                                       const std::string& extension,
                                       const std::string& fallback) {
    if (audioPath.empty() || audioPath.stem().empty())
        return fallback + extension;
    return audioPath.stem().string() + extension;
}

} // namespace lrc::sync
