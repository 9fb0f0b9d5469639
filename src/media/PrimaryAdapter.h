#pragma once
#include <QList>
#include <QMetaObject>
#include <memory>
#include "BackendAdapter.h"

class QMediaPlayer;
class QAudioOutput;
class QObject;

namespace media {

// Qt Multimedia 后端，回调都在 GUI 线程
class PrimaryAdapter final : public BackendAdapter {
public:
    PrimaryAdapter(int serial, BackendEventSink& sink, QObject* videoOutput);
    ~PrimaryAdapter() override;
    PrimaryAdapter(const PrimaryAdapter&) = delete;
    PrimaryAdapter& operator=(const PrimaryAdapter&) = delete;

    BackendKind kind() const override { return BackendKind::Primary; }
    int serial() const override { return m_serial; }

    void prepare(const MediaSource& source, double startTime) override;

    void play() override;
    void pause() override;
    bool isPlaying() const override;

    double rate() const override;
    void setRate(double rate) override;
    RateLimits rateLimits() const override { return {1.0, 1.0, 4.0}; }

    void seek(double seconds) override;
    double currentTime() const override;
    double currentDuration() const override;

    std::vector<VideoTrackInfo> videoTracks() const override;
    std::vector<NativeTrack> enumerateAudioTracks() const override;
    std::vector<NativeTrack> enumerateSubtitleTracks() const override;
    void selectAudioTrack(int nativeId) override;
    void selectSubtitleTrack(std::optional<int> nativeId) override;

    void setVolume(double volume) override;
    void setMuted(bool muted) override;

    std::optional<double> reportedAspectRatio() const override;
    bool hasPreciseEndOfMedia() const override { return true; }

    void teardown() override;

private:
    void connectSignals();
    void post(BackendEvent::Type type, double value = 0.0, bool flag = false);
    void postFailure(const std::string& message);

    int m_serial{0};
    BackendEventSink& m_sink;
    std::unique_ptr<QMediaPlayer> m_player;
    std::unique_ptr<QAudioOutput> m_audioOutput;
    QList<QMetaObject::Connection> m_connections;
    bool m_readyPosted{false};
    bool m_tornDown{false};
};

} // namespace media
