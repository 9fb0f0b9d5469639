#pragma once
#include <QMainWindow>
#include <functional>
#include <memory>
#include "ControlWidget.h"
#include "playback/PlayerSettings.h"

class QStackedWidget;
class QVideoWidget;
class QMenu;
class QAction;

namespace media {
class DefaultBackendFactory;
class FFmpegExportService;
class MetadataService;
} // namespace media

namespace view {
class MainWindow final : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const playback::PlayerSettings& settings);
    ~MainWindow() override;

    void openFile(const QString& filePath);

private:
    void createMenus();
    void createLayout();
    void onStateChanged(const playback::PlaybackSnapshot& snapshot);
    void updateTrackMenus(const playback::TrackCatalog& catalog);

    QAction* addShortcutAction(QMenu* menu, const QString& text, const QList<QKeySequence>& shortcuts,
                               std::function<void()> handler);

private:
    playback::PlayerSettings m_settings;

    QStackedWidget* m_videoStack{nullptr};
    QVideoWidget* m_primarySurface{nullptr};
    QWidget* m_universalSurface{nullptr};
    ControlWidget* m_controlWidget{nullptr};

    QMenu* m_audioMenu{nullptr};
    QMenu* m_subtitleMenu{nullptr};
    QAction* m_retryAction{nullptr};
    playback::TrackCatalog m_menuCatalog;

    std::unique_ptr<playback::QtTaskScheduler> m_scheduler;
    std::unique_ptr<media::DefaultBackendFactory> m_backendFactory;
    media::FFmpegExportService* m_exportService{nullptr};
    media::MetadataService* m_metadataService{nullptr};
    // 依赖上面的调度器和工厂，必须最后构造、最先析构
    std::unique_ptr<playback::PlaybackCoordinator> m_coordinator;
};

} // namespace view
