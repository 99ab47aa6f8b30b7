#include "Config.hpp"
#include "ConfigLoader.hpp"

namespace lrc {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const fs::path& path) {
    std::lock_guard lock(mutex_);
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadDefault() {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

void Config::reset() {
    std::lock_guard lock(mutex_);
    debug_ = false;
    audio_ = AudioConfig{};
    sync_ = SyncConfig{};
    export_ = ExportConfig{};
    ui_ = UIConfig{};
    cue_ = CueConfig{};
    keyboard_ = KeyboardConfig{};
    dirty_ = false;
}

} // namespace lrc
