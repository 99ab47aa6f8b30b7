#include "MainWindow.hpp"
#include "CueWidget.hpp"
#include "audio/PlaybackSource.hpp"
#include "controllers/SyncController.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"

#include <QCloseEvent>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QShortcut>
#include <QStatusBar>
#include <QVBoxLayout>
#include <algorithm>

namespace lrc {

namespace {
QPushButton* makeButton(const QString& text, QWidget* parent) {
    auto* button = new QPushButton(text, parent);
    // Space and Return belong to the tap shortcuts, not to focused buttons
    button->setFocusPolicy(Qt::NoFocus);
    return button;
}

QString fromPath(const fs::path& p) {
    return QString::fromStdString(p.string());
}
} // namespace

MainWindow::MainWindow(PlaybackSource* audio, QWidget* parent)
    : QMainWindow(parent), audio_(audio) {
    setWindowTitle("lrcsync");
    const auto& ui = CONFIG_VIEW.ui();
    setMinimumSize(static_cast<int>(ui.minWidth), static_cast<int>(ui.minHeight));
    resize(static_cast<int>(ui.minWidth + ui.previewWidth),
           static_cast<int>(ui.minHeight + 120));

    controller_ = std::make_unique<SyncController>(*audio_, session_);

    setupUI();
    setupShortcuts();
    setupConnections();
    refreshAll();

    tickTimer_.start(static_cast<int>(CONFIG_VIEW.sync().tickIntervalMs));
    statusBar()->showMessage("Ready. Load audio and lyrics to start.");
}

MainWindow::~MainWindow() {
    tickTimer_.stop();
}

void MainWindow::setupUI() {
    auto* central = new QWidget(this);
    auto* root = new QVBoxLayout(central);

    auto* topBar = new QHBoxLayout();
    auto* loadAudioBtn = makeButton("Load Audio", central);
    auto* loadLyricsBtn = makeButton("Load Lyrics", central);
    auto* playBtn = makeButton("Play", central);
    auto* pauseBtn = makeButton("Pause/Resume", central);
    auto* stopBtn = makeButton("Stop", central);
    for (auto* b : {loadAudioBtn, loadLyricsBtn, playBtn, pauseBtn, stopBtn})
        topBar->addWidget(b);
    topBar->addStretch();
    root->addLayout(topBar);

    auto* body = new QHBoxLayout();

    auto* left = new QVBoxLayout();
    cue_ = new CueWidget(central);
    left->addWidget(cue_, 1);

    auto* controls = new QHBoxLayout();
    auto* backBtn = makeButton("Back Line (Backspace)", central);
    auto* nextBtn = makeButton("Next Line (Enter)", central);
    auto* undoBtn = makeButton("Undo Timestamp", central);
    auto* saveBtn = makeButton("Save LRC (Ctrl+S)", central);
    for (auto* b : {backBtn, nextBtn, undoBtn, saveBtn})
        controls->addWidget(b);
    controls->addStretch();
    left->addLayout(controls);
    body->addLayout(left, 1);

    auto* right = new QVBoxLayout();
    right->addWidget(new QLabel("Sync Preview", central));
    preview_ = new QListWidget(central);
    preview_->setFocusPolicy(Qt::NoFocus);
    preview_->setFixedWidth(
            static_cast<int>(CONFIG_VIEW.ui().previewWidth));
    right->addWidget(preview_, 1);
    body->addLayout(right);

    root->addLayout(body, 1);

    progress_ = new QProgressBar(central);
    progress_->setTextVisible(true);
    progress_->setFormat("%v / %m");
    root->addWidget(progress_);

    statusLabel_ = new QLabel(central);
    root->addWidget(statusLabel_);

    setCentralWidget(central);

    connect(loadAudioBtn, &QPushButton::clicked, this, &MainWindow::onLoadAudio);
    connect(loadLyricsBtn, &QPushButton::clicked, this, &MainWindow::onLoadLyrics);
    connect(playBtn, &QPushButton::clicked, this, &MainWindow::onPlay);
    connect(pauseBtn, &QPushButton::clicked, this, &MainWindow::onPauseToggle);
    connect(stopBtn, &QPushButton::clicked, this, &MainWindow::onStop);
    connect(backBtn, &QPushButton::clicked, this, &MainWindow::onBackLine);
    connect(nextBtn, &QPushButton::clicked, this, &MainWindow::onNextLine);
    connect(undoBtn, &QPushButton::clicked, this, &MainWindow::onUndo);
    connect(saveBtn, &QPushButton::clicked, this, &MainWindow::onSave);
}

void MainWindow::setupShortcuts() {
    const auto& kb = CONFIG_VIEW.keyboard();
    auto bind = [this](const std::string& keys, void (MainWindow::*slot)()) {
        QKeySequence seq(QString::fromStdString(keys), QKeySequence::PortableText);
        if (seq.isEmpty()) {
            LOG_WARN("Ignoring invalid shortcut '{}'", keys);
            return;
        }
        auto* shortcut = new QShortcut(seq, this);
        shortcut->setContext(Qt::WindowShortcut);
        connect(shortcut, &QShortcut::activated, this, slot);
    };

    bind(kb.nextLine, &MainWindow::onNextLine);
    bind(kb.backLine, &MainWindow::onBackLine);
    bind(kb.playPause, &MainWindow::onPauseToggle);
    bind(kb.undo, &MainWindow::onUndo);
    bind(kb.save, &MainWindow::onSave);

    // Keypad Enter taps as well
    if (kb.nextLine == "Return") {
        auto* enter = new QShortcut(QKeySequence(Qt::Key_Enter), this);
        connect(enter, &QShortcut::activated, this, &MainWindow::onNextLine);
    }
}

void MainWindow::setupConnections() {
    connect(&tickTimer_, &QTimer::timeout, this, &MainWindow::onTick);

    controller_->sessionChanged.connect([this] { refreshAll(); });

    controller_->statusMessage.connect([this](const std::string& msg) {
        statusBar()->showMessage(QString::fromStdString(msg), 5000);
    });

    controller_->completed.connect([this] {
        QMessageBox::information(this,
                                 "Done",
                                 "Every line has a timestamp. Save the LRC "
                                 "file when ready.");
    });
}

void MainWindow::openAudio(const fs::path& path) {
    auto result = controller_->loadAudio(path);
    if (!result) {
        report("Cannot Load Audio", result.error());
        return;
    }
    setWindowTitle(fromPath(path.filename()) + " - lrcsync");
}

void MainWindow::openLyrics(const fs::path& path) {
    auto result = controller_->loadLyrics(path);
    if (!result)
        report("Cannot Load Lyrics", result.error());
}

void MainWindow::onLoadAudio() {
    QString path = QFileDialog::getOpenFileName(this,
                                                "Select Audio File",
                                                QDir::homePath(),
                                                "Audio (*.mp3 *.wav);;All Files (*)");
    if (!path.isEmpty())
        openAudio(path.toStdString());
}

void MainWindow::onLoadLyrics() {
    QString path = QFileDialog::getOpenFileName(this,
                                                "Select Lyrics File",
                                                QDir::homePath(),
                                                "Text (*.txt);;All Files (*)");
    if (!path.isEmpty())
        openLyrics(path.toStdString());
}

void MainWindow::onPlay() {
    if (auto result = controller_->play(); !result)
        report("Audio Required", result.error());
}

void MainWindow::onPauseToggle() {
    controller_->pauseToggle();
}

void MainWindow::onStop() {
    controller_->stop();
}

void MainWindow::onNextLine() {
    if (auto result = controller_->nextLine(); !result)
        report("Next Line", result.error());
}

void MainWindow::onBackLine() {
    if (auto result = controller_->backLine(); !result)
        report("Back Line", result.error());
}

void MainWindow::onUndo() {
    if (!controller_->undo())
        statusBar()->showMessage("Nothing to undo", 3000);
}

void MainWindow::onSave() {
    if (auto ready = controller_->checkSaveReady(); !ready) {
        report("Save LRC", ready.error());
        return;
    }

    if (controller_->needsSaveConfirmation()) {
        auto reply = QMessageBox::question(
                this,
                "No Timestamps Yet",
                "No line has a timestamp yet. Save anyway?",
                QMessageBox::Yes | QMessageBox::No);
        if (reply != QMessageBox::Yes)
            return;
    }

    QString suggested =
            QDir(QDir::homePath())
                    .filePath(QString::fromStdString(
                            controller_->suggestedFileName()));
    QString ext = QString::fromStdString(CONFIG_VIEW.exporting().extension);
    QString path = QFileDialog::getSaveFileName(
            this,
            "Save LRC File",
            suggested,
            QString("LRC Lyrics (*%1);;All Files (*)").arg(ext));
    if (path.isEmpty())
        return;
    if (QFileInfo(path).suffix().isEmpty())
        path += ext;

    auto result = controller_->save(path.toStdString());
    if (!result) {
        report("Save Failed", result.error());
        return;
    }
    QMessageBox::information(this, "Saved", "Saved:\n" + path);
}

void MainWindow::onTick() {
    statusLabel_->setText(QString::fromStdString(controller_->statusText()));
}

void MainWindow::refreshCue() {
    cue_->setLines(QString::fromStdString(session_.currentLine()),
                   QString::fromStdString(session_.nextLine()));
    cue_->setComplete(session_.isComplete());
}

void MainWindow::refreshPreview() {
    preview_->clear();
    for (const auto& entry : session_.previewEntries()) {
        preview_->addItem(QString::fromStdString(entry.tag + " " + entry.text));
    }

    int row = static_cast<int>(session_.cursor());
    if (row < preview_->count()) {
        preview_->setCurrentRow(row);
        preview_->scrollToItem(preview_->item(row));
    }
}

void MainWindow::refreshProgress() {
    progress_->setMaximum(std::max(1, static_cast<int>(session_.lineCount())));
    progress_->setValue(static_cast<int>(session_.syncedCount()));
}

void MainWindow::refreshAll() {
    refreshCue();
    refreshPreview();
    refreshProgress();
    onTick();
}

void MainWindow::report(const QString& title, const Error& error) {
    auto text = QString::fromStdString(error.message);
    switch (error.code) {
    case ErrorCode::AlreadyComplete:
        QMessageBox::information(this, title, text);
        break;
    case ErrorCode::NotReady:
    case ErrorCode::NotFound:
    case ErrorCode::UnsupportedFormat:
    case ErrorCode::EmptyFile:
        LOG_WARN("{}: {}", title.toStdString(), error.message);
        QMessageBox::warning(this, title, text);
        break;
    default:
        LOG_ERROR("{}: {} ({})",
                  title.toStdString(),
                  error.message,
                  errorCodeName(error.code));
        QMessageBox::critical(this, title, text);
        break;
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    tickTimer_.stop();
    controller_->stop();
    if (CONFIG_VIEW.isDirty()) {
        if (auto saved = CONFIG.save(CONFIG.configPath()); !saved)
            LOG_WARN("{}", saved.error().message);
        else
            CONFIG.markClean();
    }
    event->accept();
}

} // namespace lrc
