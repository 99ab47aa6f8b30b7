#pragma once
// FileUtils.hpp - Filesystem helpers: XDG dirs, extension checks, text I/O

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "util/Result.hpp"

namespace lrc::file {

namespace fs = std::filesystem;

inline const std::vector<std::string> audioExtensions = {".mp3", ".wav"};

fs::path configDir();
fs::path cacheDir();
void ensureDir(const fs::path& dir);

// Lower-cased extension including the dot, empty if none
std::string extension(const fs::path& path);
bool hasExtension(const fs::path& path, const std::vector<std::string>& exts);

// Existence is checked before the extension
Result<void> validateAudioPath(const fs::path& path);

// Reads the whole file as bytes; a leading UTF-8 BOM is dropped
Result<std::string> readText(const fs::path& path);

// Writes via <path>.tmp and rename so a failed write never truncates path
Result<void> writeTextAtomic(const fs::path& path, std::string_view text);

} // namespace lrc::file
