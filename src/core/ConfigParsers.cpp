#include "ConfigParsers.hpp"
#include <algorithm>

namespace lrc {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_same_v<T, f32>) {
            if (auto val = node.value<double>())
                return static_cast<f32>(*val);
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return *val < 0 && std::is_unsigned_v<T>
                               ? defaultVal
                               : static_cast<T>(*val);
        }
    }
    return defaultVal;
}

std::string normalizeExtension(std::string ext) {
    if (ext.empty())
        return ".lrc";
    if (ext.front() != '.')
        ext.insert(ext.begin(), '.');
    return ext;
}
} // namespace

void ConfigParsers::parseAudio(const toml::table& tbl, AudioConfig& cfg) {
    if (auto audio = tbl["audio"].as_table()) {
        cfg.sampleRate =
                std::clamp(get(*audio, "sample_rate", 44100u), 8000u, 192000u);
        cfg.channels = std::clamp(get(*audio, "channels", 2u), 1u, 2u);
        cfg.bufferSize =
                std::clamp(get(*audio, "buffer_size", 2048u), 256u, 16384u);
        cfg.volume = std::clamp(get(*audio, "volume", 1.0f), 0.0f, 1.0f);
    }
}

void ConfigParsers::parseSync(const toml::table& tbl, SyncConfig& cfg) {
    if (auto sync = tbl["sync"].as_table()) {
        cfg.tickIntervalMs =
                std::clamp(get(*sync, "tick_interval_ms", 100u), 10u, 1000u);
        cfg.stopOnComplete = get(*sync, "stop_on_complete", true);
        cfg.confirmEmptySave = get(*sync, "confirm_empty_save", true);
    }
}

void ConfigParsers::parseExport(const toml::table& tbl, ExportConfig& cfg) {
    if (auto exp = tbl["export"].as_table()) {
        cfg.extension = normalizeExtension(
                get(*exp, "extension", std::string(".lrc")));
        cfg.fallbackName = get(*exp, "fallback_name", std::string("output"));
        if (cfg.fallbackName.empty())
            cfg.fallbackName = "output";
        cfg.writeHeader = get(*exp, "write_header", false);
        cfg.title = get(*exp, "title", std::string());
        cfg.artist = get(*exp, "artist", std::string());
        cfg.album = get(*exp, "album", std::string());
        cfg.author = get(*exp, "author", std::string());
    }
}

void ConfigParsers::parseUI(const toml::table& tbl, UIConfig& cfg) {
    if (auto uiTbl = tbl["ui"].as_table()) {
        cfg.minWidth = std::clamp(get(*uiTbl, "min_width", 760u), 320u, 7680u);
        cfg.minHeight =
                std::clamp(get(*uiTbl, "min_height", 420u), 200u, 4320u);
        cfg.previewWidth =
                std::clamp(get(*uiTbl, "preview_width", 320u), 120u, 2000u);
    }
}

void ConfigParsers::parseCue(const toml::table& tbl, CueConfig& cfg) {
    if (auto cue = tbl["cue"].as_table()) {
        cfg.fontFamily =
                get(*cue, "font_family", std::string("Sans Serif"));
        cfg.fontSize = std::clamp(get(*cue, "font_size", 28u), 8u, 200u);
        cfg.bold = get(*cue, "bold", true);
        cfg.activeColor = Color::fromHex(
                get(*cue, "active_color", std::string("#00FF88")));
        cfg.inactiveColor = Color::fromHex(
                get(*cue, "inactive_color", std::string("#B0B0B0")));
        cfg.shadowColor = Color::fromHex(
                get(*cue, "shadow_color", std::string("#000000C0")));
    }
}

void ConfigParsers::parseKeyboard(const toml::table& tbl, KeyboardConfig& cfg) {
    if (auto kb = tbl["keyboard"].as_table()) {
        cfg.nextLine = get(*kb, "next_line", std::string("Return"));
        cfg.backLine = get(*kb, "back_line", std::string("Backspace"));
        cfg.playPause = get(*kb, "play_pause", std::string("Space"));
        cfg.undo = get(*kb, "undo", std::string("Ctrl+Z"));
        cfg.save = get(*kb, "save", std::string("Ctrl+S"));
    }
}

toml::table ConfigParsers::serialize(const AudioConfig& audio,
                                     const SyncConfig& sync,
                                     const ExportConfig& exporting,
                                     const UIConfig& ui,
                                     const CueConfig& cue,
                                     const KeyboardConfig& keyboard,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});
    root.insert("audio",
                toml::table{{"sample_rate", (i64)audio.sampleRate},
                            {"channels", (i64)audio.channels},
                            {"buffer_size", (i64)audio.bufferSize},
                            {"volume", (double)audio.volume}});

    root.insert("sync",
                toml::table{{"tick_interval_ms", (i64)sync.tickIntervalMs},
                            {"stop_on_complete", sync.stopOnComplete},
                            {"confirm_empty_save", sync.confirmEmptySave}});

    root.insert("export",
                toml::table{{"extension", exporting.extension},
                            {"fallback_name", exporting.fallbackName},
                            {"write_header", exporting.writeHeader},
                            {"title", exporting.title},
                            {"artist", exporting.artist},
                            {"album", exporting.album},
                            {"author", exporting.author}});

    root.insert("ui",
                toml::table{{"min_width", (i64)ui.minWidth},
                            {"min_height", (i64)ui.minHeight},
                            {"preview_width", (i64)ui.previewWidth}});

    root.insert("cue",
                toml::table{{"font_family", cue.fontFamily},
                            {"font_size", (i64)cue.fontSize},
                            {"bold", cue.bold},
                            {"active_color", cue.activeColor.toHex()},
                            {"inactive_color", cue.inactiveColor.toHex()},
                            {"shadow_color", cue.shadowColor.toHex()}});

    root.insert("keyboard",
                toml::table{{"next_line", keyboard.nextLine},
                            {"back_line", keyboard.backLine},
                            {"play_pause", keyboard.playPause},
                            {"undo", keyboard.undo},
                            {"save", keyboard.save}});

    return root;
}

} // namespace lrc
