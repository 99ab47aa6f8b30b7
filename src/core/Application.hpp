#pragma once
// Application.hpp - Process-wide setup: Qt app, logging, config, audio, window

#include <QApplication>
#include <filesystem>
#include <memory>
#include "util/Result.hpp"

namespace lrc {

namespace fs = std::filesystem;

class MainWindow;
class SDLMixerAudioSource;

struct AppOptions {
    bool debug{false};
    fs::path configPath;
    fs::path audioPath;
    fs::path lyricsPath;
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

private:
    std::unique_ptr<QApplication> qapp_;
    std::unique_ptr<SDLMixerAudioSource> audio_;
    std::unique_ptr<MainWindow> window_;
};

} // namespace lrc
