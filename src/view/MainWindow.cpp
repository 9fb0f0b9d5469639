#include "MainWindow.h"
#include <QActionGroup>
#include <QFileDialog>
#include <QFileInfo>
#include <QMenuBar>
#include <QMimeDatabase>
#include <QStackedWidget>
#include <QUuid>
#include <QVBoxLayout>
#include <QVideoWidget>
#include <logger.h>
#include "media/DefaultBackendFactory.h"
#include "media/ExportService.h"
#include "media/MetadataService.h"

using playback::PlaybackCoordinator;

namespace view {
MainWindow::MainWindow(const playback::PlayerSettings& settings)
    : m_settings(settings)
{
    createLayout();

    m_scheduler = std::make_unique<playback::QtTaskScheduler>(this);

    media::UniversalAdapter::Options options;
    options.windowId = static_cast<int64_t>(m_universalSurface->winId());
    options.hwdec = m_settings.mpvHwdec.toStdString();
    options.vo = m_settings.mpvVo.toStdString();
    m_backendFactory = std::make_unique<media::DefaultBackendFactory>(m_primarySurface, options);
    m_exportService = new media::FFmpegExportService(m_settings.ffmpegPath, this);
    m_metadataService = new media::MetadataService(this);

    m_coordinator = std::make_unique<PlaybackCoordinator>(*m_backendFactory, *m_scheduler, m_exportService);
    m_coordinator->setSettings(m_settings);

    m_controlWidget = new ControlWidget(m_coordinator.get(), centralWidget());
    m_controlWidget->setFixedHeight(80);
    centralWidget()->layout()->addWidget(m_controlWidget);

    createMenus();

    resize(960, 600);
    setMinimumSize(800, 500);
    setWindowTitle("Tandem Player");

    connect(m_coordinator.get(), &PlaybackCoordinator::stateChanged, this, &MainWindow::onStateChanged);
    connect(m_metadataService, &media::MetadataService::metadataReady, this,
            [this](const std::string& sourceId, const media::MediaMetadata& metadata) {
                m_coordinator->updateMetadata(sourceId, metadata);
            });
}
MainWindow::~MainWindow()
{
    NEAPU_FUNC_TRACE;
    m_coordinator.reset();
}

QAction* MainWindow::addShortcutAction(QMenu* menu, const QString& text, const QList<QKeySequence>& shortcuts,
                                       std::function<void()> handler)
{
    auto* action = menu->addAction(text);
    action->setShortcuts(shortcuts);
    connect(action, &QAction::triggered, this, [handler = std::move(handler)]() { handler(); });
    return action;
}

void MainWindow::createMenus()
{
    auto* c = m_coordinator.get();

    auto* fileMenu = menuBar()->addMenu(tr("&File"));
    addShortcutAction(fileMenu, tr("&Open..."), {QKeySequence::Open}, [this]() {
        QString filePath = QFileDialog::getOpenFileName(this, tr("Open Media File"), "",
                                                        tr("Media Files (*.mp4 *.mov *.mkv *.avi *.mxf *.webm *.m4v *.mpg *.ts *.flv *.wav *.mp3 *.flac);;All Files (*)"));
        if (!filePath.isEmpty()) {
            openFile(filePath);
        }
    });
    m_retryAction = addShortcutAction(fileMenu, tr("&Retry"), {QKeySequence("Ctrl+R")}, [c]() { c->retry(); });
    m_retryAction->setEnabled(false);
    fileMenu->addSeparator();
    addShortcutAction(fileMenu, tr("Save &Screenshot"), {QKeySequence("Ctrl+S")},
                      [c]() { c->trigger(PlaybackCoordinator::Command::CaptureScreenshot); });
    addShortcutAction(fileMenu, tr("&Export Trim"), {QKeySequence("Ctrl+E")},
                      [c]() { c->trigger(PlaybackCoordinator::Command::ExportTrim); });
    fileMenu->addSeparator();
    addShortcutAction(fileMenu, tr("&Close"), {QKeySequence::Close}, [c]() { c->unload(); });
    addShortcutAction(fileMenu, tr("E&xit"), {}, [this]() { close(); });

    auto* playbackMenu = menuBar()->addMenu(tr("&Playback"));
    addShortcutAction(playbackMenu, tr("Play / Pause"), {QKeySequence(Qt::Key_Space), QKeySequence(Qt::Key_K)},
                      [c]() { c->trigger(PlaybackCoordinator::Command::TogglePlayback); });
    addShortcutAction(playbackMenu, tr("Reverse"), {QKeySequence(Qt::Key_J)}, [c]() { c->reverse(); });
    addShortcutAction(playbackMenu, tr("Fast Forward"), {QKeySequence(Qt::Key_L)}, [c]() { c->fastForward(); });
    addShortcutAction(playbackMenu, tr("Slower"), {QKeySequence("Shift+J")}, [c]() { c->rewind(); });
    playbackMenu->addSeparator();
    addShortcutAction(playbackMenu, tr("Next Frame"), {QKeySequence(Qt::Key_Right)}, [c]() { c->seekByFrames(1); });
    addShortcutAction(playbackMenu, tr("Previous Frame"), {QKeySequence(Qt::Key_Left)}, [c]() { c->seekByFrames(-1); });
    addShortcutAction(playbackMenu, tr("Forward 10 Frames"), {QKeySequence(Qt::Key_Up)}, [c]() { c->seekByFrames(10); });
    addShortcutAction(playbackMenu, tr("Back 10 Frames"), {QKeySequence(Qt::Key_Down)}, [c]() { c->seekByFrames(-10); });
    addShortcutAction(playbackMenu, tr("Forward 10 Seconds"), {QKeySequence("Shift+Right")}, [c]() { c->seekBy(10.0); });
    addShortcutAction(playbackMenu, tr("Back 10 Seconds"), {QKeySequence("Shift+Left")}, [c]() { c->seekBy(-10.0); });
    addShortcutAction(playbackMenu, tr("Go to Start"), {QKeySequence(Qt::Key_Home)}, [c]() { c->jumpToStart(); });
    addShortcutAction(playbackMenu, tr("Go to End"), {QKeySequence(Qt::Key_End)}, [c]() { c->jumpToEnd(); });
    playbackMenu->addSeparator();
    addShortcutAction(playbackMenu, tr("Mute"), {QKeySequence(Qt::Key_M)}, [c]() { c->toggleMute(); });
    addShortcutAction(playbackMenu, tr("Volume Up"), {QKeySequence("Ctrl+Up")},
                      [c]() { c->setVolume(c->state().volume + 10.0); });
    addShortcutAction(playbackMenu, tr("Volume Down"), {QKeySequence("Ctrl+Down")},
                      [c]() { c->setVolume(c->state().volume - 10.0); });
    playbackMenu->addSeparator();
    auto* loopAction = addShortcutAction(playbackMenu, tr("Loop"), {}, [c]() { c->toggleLoop(); });
    loopAction->setCheckable(true);
    connect(c, &PlaybackCoordinator::stateChanged, loopAction,
            [loopAction](const playback::PlaybackSnapshot& snapshot) { loopAction->setChecked(snapshot.state.loop); });
    addShortcutAction(playbackMenu, tr("Cycle Timecode Display"), {QKeySequence(Qt::Key_T)},
                      [c]() { c->trigger(PlaybackCoordinator::Command::CycleTimecodeDisplay); });

    auto* trimMenu = menuBar()->addMenu(tr("&Trim"));
    addShortcutAction(trimMenu, tr("Set In Point"), {QKeySequence(Qt::Key_I)}, [c]() { c->setTrimIn(); });
    addShortcutAction(trimMenu, tr("Set Out Point"), {QKeySequence(Qt::Key_O)}, [c]() { c->setTrimOut(); });
    addShortcutAction(trimMenu, tr("Go to In Point"), {QKeySequence("Shift+I")}, [c]() { c->jumpToTrimIn(); });
    addShortcutAction(trimMenu, tr("Go to Out Point"), {QKeySequence("Shift+O")}, [c]() { c->jumpToTrimOut(); });
    trimMenu->addSeparator();
    addShortcutAction(trimMenu, tr("Clear In Point"), {QKeySequence("Alt+I")}, [c]() { c->clearTrimIn(); });
    addShortcutAction(trimMenu, tr("Clear Out Point"), {QKeySequence("Alt+O")}, [c]() { c->clearTrimOut(); });
    addShortcutAction(trimMenu, tr("Clear In and Out"), {QKeySequence("Alt+X")}, [c]() { c->clearTrim(); });

    m_audioMenu = menuBar()->addMenu(tr("&Audio"));
    m_subtitleMenu = menuBar()->addMenu(tr("&Subtitles"));
    updateTrackMenus({});
}
void MainWindow::createLayout()
{
    auto* centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);

    auto* layout = new QVBoxLayout(centralWidget);
    m_videoStack = new QStackedWidget(centralWidget);
    m_primarySurface = new QVideoWidget(m_videoStack);
    // libmpv 直接渲染到原生窗口
    m_universalSurface = new QWidget(m_videoStack);
    m_universalSurface->setAttribute(Qt::WA_NativeWindow);
    m_universalSurface->setAttribute(Qt::WA_DontCreateNativeAncestors);
    m_universalSurface->setStyleSheet("background-color: black;");
    m_videoStack->addWidget(m_primarySurface);
    m_videoStack->addWidget(m_universalSurface);
    layout->addWidget(m_videoStack, 1);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);
}

void MainWindow::openFile(const QString& filePath)
{
    QFileInfo info(filePath);
    if (!info.exists()) {
        NEAPU_LOGE("File does not exist: {}", filePath.toStdString());
        return;
    }
    media::MediaSource source;
    source.id = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
    source.path = info.absoluteFilePath().toStdString();
    source.displayName = info.fileName().toStdString();
    source.byteSize = info.size();
    QMimeType mime = QMimeDatabase().mimeTypeForFile(info);
    source.hasVideo = !mime.name().startsWith("audio/");

    NEAPU_LOGI("Opening {} ({})", source.displayName, mime.name().toStdString());
    m_metadataService->request(source.id, source.path);
    m_coordinator->loadMedia(std::move(source));
}

void MainWindow::onStateChanged(const playback::PlaybackSnapshot& snapshot)
{
    if (snapshot.sourceName.empty()) {
        setWindowTitle("Tandem Player");
    } else {
        setWindowTitle(QString("Tandem Player - %1").arg(QString::fromStdString(snapshot.sourceName)));
    }
    if (snapshot.state.backend == media::BackendKind::Universal) {
        m_videoStack->setCurrentWidget(m_universalSurface);
    } else if (snapshot.state.backend == media::BackendKind::Primary) {
        m_videoStack->setCurrentWidget(m_primarySurface);
    }
    m_retryAction->setEnabled(snapshot.state.phase == playback::Phase::Failed);

    if (snapshot.tracks.audio.size() != m_menuCatalog.audio.size()
        || snapshot.tracks.subtitles.size() != m_menuCatalog.subtitles.size()
        || snapshot.tracks.selectedAudio != m_menuCatalog.selectedAudio
        || snapshot.tracks.selectedSubtitle != m_menuCatalog.selectedSubtitle
        || (!snapshot.tracks.audio.empty() && snapshot.tracks.audio.front().title != m_menuCatalog.audio.front().title)) {
        updateTrackMenus(snapshot.tracks);
    }
}

void MainWindow::updateTrackMenus(const playback::TrackCatalog& catalog)
{
    m_menuCatalog = catalog;
    qDeleteAll(m_audioMenu->findChildren<QActionGroup*>());
    qDeleteAll(m_subtitleMenu->findChildren<QActionGroup*>());
    m_audioMenu->clear();
    m_subtitleMenu->clear();

    auto* audioGroup = new QActionGroup(m_audioMenu);
    for (const auto& entry : catalog.audio) {
        auto* action = m_audioMenu->addAction(QString::fromStdString(entry.title));
        action->setToolTip(QString::fromStdString(entry.detail));
        action->setCheckable(true);
        action->setChecked(catalog.selectedAudio == entry.position);
        audioGroup->addAction(action);
        int position = entry.position;
        connect(action, &QAction::triggered, this, [this, position]() { m_coordinator->selectAudioTrack(position); });
    }
    m_audioMenu->setEnabled(!catalog.audio.empty());

    auto* subtitleGroup = new QActionGroup(m_subtitleMenu);
    auto* offAction = m_subtitleMenu->addAction(tr("Off"));
    offAction->setCheckable(true);
    offAction->setChecked(!catalog.selectedSubtitle);
    subtitleGroup->addAction(offAction);
    connect(offAction, &QAction::triggered, this, [this]() { m_coordinator->selectSubtitleTrack(std::nullopt); });
    for (const auto& entry : catalog.subtitles) {
        auto* action = m_subtitleMenu->addAction(QString::fromStdString(entry.title));
        action->setCheckable(true);
        action->setChecked(catalog.selectedSubtitle == entry.position);
        subtitleGroup->addAction(action);
        int position = entry.position;
        connect(action, &QAction::triggered, this, [this, position]() { m_coordinator->selectSubtitleTrack(position); });
    }
    m_subtitleMenu->setEnabled(!catalog.subtitles.empty());
}
} // namespace view
