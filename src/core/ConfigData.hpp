/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * This file defines the POD (Plain Old Data) structs used to hold configuration
 * values. It is separated from the logic classes to keep headers lean and
 * avoid circular dependencies.
 */

#pragma once
#include <filesystem>
#include <string>
#include "util/Types.hpp"

namespace lrc {

namespace fs = std::filesystem;

// SDL_mixer device settings
struct AudioConfig {
    u32 sampleRate{44100};
    u32 channels{2};
    u32 bufferSize{2048};
    f32 volume{1.0f};
};

// Line synchronisation behaviour
struct SyncConfig {
    u32 tickIntervalMs{100};
    bool stopOnComplete{true};
    bool confirmEmptySave{true};
};

// Timed-lyrics export
struct ExportConfig {
    std::string extension{".lrc"};
    std::string fallbackName{"output"};
    bool writeHeader{false};
    std::string title;
    std::string artist;
    std::string album;
    std::string author;
};

// Window layout
struct UIConfig {
    u32 minWidth{760};
    u32 minHeight{420};
    u32 previewWidth{320};
};

// Current/next line display
struct CueConfig {
    std::string fontFamily{"Sans Serif"};
    u32 fontSize{28};
    bool bold{true};
    Color activeColor{Color::fromHex("#00FF88")};
    Color inactiveColor{Color::fromHex("#B0B0B0")};
    Color shadowColor{Color::fromHex("#000000C0")};
};

// Keyboard shortcuts, in QKeySequence portable text form
struct KeyboardConfig {
    std::string nextLine{"Return"};
    std::string backLine{"Backspace"};
    std::string playPause{"Space"};
    std::string undo{"Ctrl+Z"};
    std::string save{"Ctrl+S"};
};

} // namespace lrc
