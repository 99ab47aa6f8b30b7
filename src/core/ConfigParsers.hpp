/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * This file defines the ConfigParsers class which handles the conversion
 * between TOML data structures and the application's C++ configuration structs.
 * Missing keys keep their defaults; numeric values are clamped to sane ranges.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace lrc {

class ConfigParsers {
public:
    static void parseAudio(const toml::table& tbl, AudioConfig& cfg);
    static void parseSync(const toml::table& tbl, SyncConfig& cfg);
    static void parseExport(const toml::table& tbl, ExportConfig& cfg);
    static void parseUI(const toml::table& tbl, UIConfig& cfg);
    static void parseCue(const toml::table& tbl, CueConfig& cfg);
    static void parseKeyboard(const toml::table& tbl, KeyboardConfig& cfg);

    static toml::table serialize(const AudioConfig& audio,
                                 const SyncConfig& sync,
                                 const ExportConfig& exporting,
                                 const UIConfig& ui,
                                 const CueConfig& cue,
                                 const KeyboardConfig& keyboard,
                                 bool debug);
};

} // namespace lrc
