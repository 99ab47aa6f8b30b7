#include "Application.hpp"
#include <QCommandLineParser>
#include "Config.hpp"
#include "Logger.hpp"
#include "audio/SDLMixerAudioSource.hpp"
#include "ui/MainWindow.hpp"

namespace lrc {

Application::Application(int& argc, char** argv)
    : qapp_(std::make_unique<QApplication>(argc, argv)) {
    QApplication::setApplicationName("lrcsync");
    QApplication::setApplicationVersion("1.0.0");
}

Application::~Application() {
    window_.reset();
    audio_.reset();
    Logger::shutdown();
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
            "Tap along to a song to produce a timed-lyrics (.lrc) file");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption debugOpt({"d", "debug"}, "Enable debug logging.");
    QCommandLineOption configOpt(
            {"c", "config"}, "Use <file> as the configuration.", "file");
    QCommandLineOption audioOpt(
            {"a", "audio"}, "Load <file> (.mp3 or .wav) at start-up.", "file");
    QCommandLineOption lyricsOpt(
            {"l", "lyrics"}, "Load lyric text <file> at start-up.", "file");
    parser.addOptions({debugOpt, configOpt, audioOpt, lyricsOpt});

    if (!parser.parse(QApplication::arguments()))
        return Result<AppOptions>::err(ErrorCode::ParseError,
                                       parser.errorText().toStdString());

    // These print and exit like the Qt helpers expect
    if (parser.isSet("help"))
        parser.showHelp(0);
    if (parser.isSet("version"))
        parser.showVersion();

    if (!parser.positionalArguments().isEmpty())
        return Result<AppOptions>::err(
                ErrorCode::ParseError,
                "Unexpected argument: " +
                        parser.positionalArguments().first().toStdString());

    AppOptions opts;
    opts.debug = parser.isSet(debugOpt);
    opts.configPath = parser.value(configOpt).toStdString();
    opts.audioPath = parser.value(audioOpt).toStdString();
    opts.lyricsPath = parser.value(lyricsOpt).toStdString();
    return Result<AppOptions>::ok(std::move(opts));
}

Result<void> Application::init(const AppOptions& opts) {
    Logger::init("lrcsync", opts.debug);

    if (!opts.configPath.empty()) {
        if (!fs::exists(opts.configPath))
            return Result<void>::err(ErrorCode::NotFound,
                                     "Config file not found: " +
                                             opts.configPath.string());
        if (auto loaded = CONFIG.load(opts.configPath); !loaded)
            return loaded;
    } else if (auto loaded = CONFIG.loadDefault(); !loaded) {
        LOG_WARN("{}; using built-in defaults", loaded.error().message);
        CONFIG.reset();
    }

    if (CONFIG.debug() && !opts.debug)
        Logger::setDebug(true);

    audio_ = std::make_unique<SDLMixerAudioSource>();
    if (auto opened = audio_->init(CONFIG_VIEW.audio()); !opened) {
        // Lyrics can still be edited; loading audio will report the failure
        LOG_ERROR("{}", opened.error().message);
    }

    window_ = std::make_unique<MainWindow>(audio_.get());

    if (!opts.audioPath.empty())
        window_->openAudio(opts.audioPath);
    if (!opts.lyricsPath.empty())
        window_->openLyrics(opts.lyricsPath);

    window_->show();
    LOG_INFO("lrcsync ready");
    return Result<void>::ok();
}

int Application::exec() {
    return qapp_->exec();
}

} // namespace lrc
