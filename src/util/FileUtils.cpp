#include "FileUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>

namespace lrc::file {

namespace {
constexpr const char* kAppDir = "lrcsync";

std::string lastOsError() {
    return std::error_code(errno, std::generic_category()).message();
}

fs::path xdgDir(const char* envVar, const char* homeFallback) {
    if (const char* xdg = std::getenv(envVar); xdg && *xdg)
        return fs::path(xdg) / kAppDir;
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / homeFallback / kAppDir;
    return fs::temp_directory_path() / kAppDir;
}
} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

void ensureDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
}

std::string extension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

bool hasExtension(const fs::path& path, const std::vector<std::string>& exts) {
    auto ext = extension(path);
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

Result<void> validateAudioPath(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return Result<void>::err(ErrorCode::NotFound,
                                 "Audio file not found: " + path.string());

    if (!hasExtension(path, audioExtensions)) {
        auto ext = extension(path);
        return Result<void>::err(
                ErrorCode::UnsupportedFormat,
                "Unsupported audio format: " + (ext.empty() ? "(none)" : ext));
    }
    return Result<void>::ok();
}

Result<std::string> readText(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return Result<std::string>::err(ErrorCode::NotFound,
                                        "File not found: " + path.string());

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Result<std::string>::err(ErrorCode::IoError,
                                        "Cannot open file: " + path.string());

    std::string text{std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>()};
    if (in.bad())
        return Result<std::string>::err(ErrorCode::IoError,
                                        "Read failed: " + path.string());

    if (text.starts_with("\xEF\xBB\xBF"))
        text.erase(0, 3);
    return Result<std::string>::ok(std::move(text));
}

Result<void> writeTextAtomic(const fs::path& path, std::string_view text) {
    fs::path tempPath = path;
    tempPath += ".tmp";
    {
        errno = 0;
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out)
            return Result<void>::err(ErrorCode::IoError,
                                     "Cannot open " + path.string() +
                                             " for writing: " + lastOsError());
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            auto cause = lastOsError();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            return Result<void>::err(ErrorCode::IoError,
                                     "Write to " + path.string() +
                                             " failed: " + cause);
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return Result<void>::err(ErrorCode::IoError,
                                 "Cannot replace " + path.string() + ": " +
                                         ec.message());
    }
    return Result<void>::ok();
}

} // namespace lrc::file
