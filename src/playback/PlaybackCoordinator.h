#pragma once
#include <QObject>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include "EventQueue.h"
#include "PlaybackState.h"
#include "PlayerSettings.h"
#include "ReverseSimulator.h"
#include "Scheduler.h"
#include "media/BackendFactory.h"
#include "media/ExportRunner.h"

namespace playback {

struct PrimaryBackend {
    std::unique_ptr<media::BackendAdapter> adapter;
};
struct UniversalBackend {
    std::unique_ptr<media::BackendAdapter> adapter;
};
// 同一时刻最多一个引擎实例
using ActiveBackend = std::variant<std::monostate, PrimaryBackend, UniversalBackend>;

class PlaybackCoordinator : public QObject {
    Q_OBJECT
public:
    enum class Command {
        TogglePlayback,
        CycleTimecodeDisplay,
        CaptureScreenshot,
        ExportTrim
    };

    static constexpr double TIME_PUBLISH_INTERVAL = 0.05;
    static constexpr double LOOP_POLL_INTERVAL = 0.1;
    static constexpr double LOOP_TOLERANCE = 0.05;
    static constexpr double TRACK_RESUME_DELAY = 0.1;
    static constexpr double EXPORT_STATUS_RESET_DELAY = 2.0;

    PlaybackCoordinator(media::BackendFactory& factory, TaskScheduler& scheduler, media::ExportRunner* exportRunner,
                        QObject* parent = nullptr);
    ~PlaybackCoordinator() override;

    void setSettings(const PlayerSettings& settings);

    void loadMedia(media::MediaSource source);
    // 只接受当前已加载源的元数据
    void updateMetadata(const std::string& sourceId, media::MediaMetadata metadata);
    void retry();
    void unload();

    void play();
    void pause();
    void togglePlayback();
    void fastForward();
    void rewind();
    void reverse();
    void stopReverse();
    void setRate(double rate);
    void stepRate(bool forward);

    void seekTo(double seconds);
    void seekBy(double seconds);
    void seekByFrames(int frames);
    void jumpToStart();
    void jumpToEnd();
    bool seekToTimecode(const std::string& input);

    void selectAudioTrack(int position);
    void selectSubtitleTrack(std::optional<int> position);

    void toggleLoop();

    void setVolume(double volume);
    void setMuted(bool muted);
    void toggleMute();

    void setTrimIn();
    void setTrimOut();
    void clearTrimIn();
    void clearTrimOut();
    void clearTrim();
    void jumpToTrimIn();
    void jumpToTrimOut();

    void cycleTimecodeDisplay();
    bool captureScreenshot();
    bool exportTrim();

    void trigger(Command command);

    PlaybackSnapshot snapshot() const;
    const PlaybackState& state() const { return m_state; }
    const TrackCatalog& tracks() const { return m_catalog; }
    const TrimRange& trim() const { return m_trim; }
    media::BackendKind activeBackend() const;
    double effectiveFrameRate() const;

signals:
    void stateChanged(const playback::PlaybackSnapshot& snapshot);

private:
    media::BackendAdapter* backend() const;
    bool isReady() const;
    media::BackendKind initialBackend() const;

    void startBackend(media::BackendKind kind, double startTime);
    void teardownBackend();
    void switchToUniversal(const std::string& reason);
    void fail(ErrorKind kind, const std::string& message);

    void drainEvents();
    void handleEvent(const media::BackendEvent& event);
    void onBackendReady();
    void onBackendFailed(const media::BackendEvent& event);
    void onEndOfMedia();
    void onPublishTick();
    void onLoopPoll();

    void rebuildCatalog();
    void applyAudioSelection();
    void applySubtitleSelection();
    void resetStatePreservingPreferences();

    double clampTime(double seconds) const;
    void publish();

    void finishScreenshot(const media::ExportResult& result);
    void finishTrimExport(const media::ExportResult& result);

private:
    media::BackendFactory& m_factory;
    TaskScheduler& m_scheduler;
    media::ExportRunner* m_exportRunner{nullptr};
    PlayerSettings m_settings;

    BackendEventQueue m_queue;
    ReverseSimulator m_reverse;

    std::optional<media::MediaSource> m_source;
    ActiveBackend m_backend;
    int m_serial{0};
    bool m_fallbackUsed{false};
    double m_pendingStart{0.0};
    bool m_playWhenReady{false};

    PlaybackState m_state;
    TrackCatalog m_catalog;
    TrimRange m_trim;

    double m_lastPublishedTime{-1.0};
    bool m_lastPublishedPlaying{false};

    ScheduledTask m_publishTask;
    ScheduledTask m_loopPollTask;
    ScheduledTask m_resumeTask;
    ScheduledTask m_screenshotResetTask;
    ScheduledTask m_trimResetTask;
};

} // namespace playback

Q_DECLARE_METATYPE(playback::PlaybackSnapshot)
