/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * This file defines the Config class which provides a thread-safe singleton
 * for accessing and modifying application settings. It delegates parsing
 * to ConfigParsers and file I/O to ConfigLoader.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected load and save.
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace lrc {

class ConfigLoader;

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    // Restores built-in defaults, keeping the config path
    void reset();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    // Section accessors (const)
    const AudioConfig& audio() const {
        return audio_;
    }
    const SyncConfig& sync() const {
        return sync_;
    }
    const ExportConfig& exporting() const {
        return export_;
    }
    const UIConfig& ui() const {
        return ui_;
    }
    const CueConfig& cue() const {
        return cue_;
    }
    const KeyboardConfig& keyboard() const {
        return keyboard_;
    }

    // Section accessors (mutable)
    AudioConfig& audio() {
        markDirty();
        return audio_;
    }
    SyncConfig& sync() {
        markDirty();
        return sync_;
    }
    ExportConfig& exporting() {
        markDirty();
        return export_;
    }
    UIConfig& ui() {
        markDirty();
        return ui_;
    }
    CueConfig& cue() {
        markDirty();
        return cue_;
    }
    KeyboardConfig& keyboard() {
        markDirty();
        return keyboard_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    AudioConfig audio_;
    SyncConfig sync_;
    ExportConfig export_;
    UIConfig ui_;
    CueConfig cue_;
    KeyboardConfig keyboard_;

    mutable std::mutex mutex_;
};

#define CONFIG lrc::Config::instance()
// Reads through the const accessors so the config stays clean
#define CONFIG_VIEW static_cast<const lrc::Config&>(lrc::Config::instance())

} // namespace lrc
