#pragma once
// MainWindow.hpp - Lyric sync window: transport, tap controls, preview

#include <QMainWindow>
#include <QTimer>
#include <filesystem>
#include <memory>
#include "sync/SyncSession.hpp"
#include "util/Result.hpp"

class QLabel;
class QListWidget;
class QProgressBar;
class QPushButton;

namespace lrc {

namespace fs = std::filesystem;

class CueWidget;
class PlaybackSource;
class SyncController;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(PlaybackSource* audio, QWidget* parent = nullptr);
    ~MainWindow() override;

    // Also used for files given on the command line
    void openAudio(const fs::path& path);
    void openLyrics(const fs::path& path);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onLoadAudio();
    void onLoadLyrics();
    void onPlay();
    void onPauseToggle();
    void onStop();
    void onNextLine();
    void onBackLine();
    void onUndo();
    void onSave();
    void onTick();

private:
    void setupUI();
    void setupShortcuts();
    void setupConnections();

    void refreshCue();
    void refreshPreview();
    void refreshProgress();
    void refreshAll();

    void report(const QString& title, const Error& error);

    PlaybackSource* audio_;
    sync::SyncSession session_;
    std::unique_ptr<SyncController> controller_;

    CueWidget* cue_{nullptr};
    QListWidget* preview_{nullptr};
    QProgressBar* progress_{nullptr};
    QLabel* statusLabel_{nullptr};

    QTimer tickTimer_;
};

} // namespace lrc
