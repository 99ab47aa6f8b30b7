#include "ConfigLoader.hpp"
#include <sstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace lrc {

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        if (auto gen = tbl["general"].as_table()) {
            config.debug_ = (*gen)["debug"].value_or(false);
        }

        ConfigParsers::parseAudio(tbl, config.audio_);
        ConfigParsers::parseSync(tbl, config.sync_);
        ConfigParsers::parseExport(tbl, config.export_);
        ConfigParsers::parseUI(tbl, config.ui_);
        ConfigParsers::parseCue(tbl, config.cue_);
        ConfigParsers::parseKeyboard(tbl, config.keyboard_);

        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(ErrorCode::ParseError,
                                 std::string("Config parse error: ") +
                                         err.what());
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto defaultPath = configDir / "config.toml";
    config.configPath_ = defaultPath;

    if (fs::exists(defaultPath)) {
        return load(config, defaultPath);
    }

    LOG_WARN("No config file found, writing built-in defaults to {}",
             defaultPath.string());
    file::ensureDir(configDir);
    if (auto saved = save(config, defaultPath); !saved) {
        LOG_WARN("{}", saved.error().message);
    }
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    auto tbl = ConfigParsers::serialize(config.audio_,
                                        config.sync_,
                                        config.export_,
                                        config.ui_,
                                        config.cue_,
                                        config.keyboard_,
                                        config.debug_);
    std::ostringstream out;
    out << tbl << "\n";

    auto written = file::writeTextAtomic(path, out.str());
    if (!written) {
        LOG_ERROR("Failed to save config: {}", written.error().message);
        return Result<void>::err(written.error().code,
                                 "Failed to save config: " +
                                         written.error().message);
    }
    LOG_DEBUG("Config saved to: {}", path.string());
    return Result<void>::ok();
}

} // namespace lrc
