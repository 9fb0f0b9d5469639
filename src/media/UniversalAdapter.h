#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include "BackendAdapter.h"

struct mpv_handle;
struct mpv_event;
struct mpv_node;

namespace media {

// libmpv 后端，事件线程只更新缓存并投递事件
class UniversalAdapter final : public BackendAdapter {
public:
    struct Options {
        int64_t windowId{0};
        std::string hwdec{"auto-safe"};
        std::string vo{"gpu"};
    };

    // mpv 上下文创建失败时抛出 std::runtime_error
    UniversalAdapter(int serial, BackendEventSink& sink, const Options& options);
    ~UniversalAdapter() override;
    UniversalAdapter(const UniversalAdapter&) = delete;
    UniversalAdapter& operator=(const UniversalAdapter&) = delete;

    BackendKind kind() const override { return BackendKind::Universal; }
    int serial() const override { return m_serial; }

    void prepare(const MediaSource& source, double startTime) override;

    void play() override;
    void pause() override;
    bool isPlaying() const override;

    double rate() const override;
    void setRate(double rate) override;
    RateLimits rateLimits() const override { return {0.5, 0.25, 4.0}; }

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
    bool hasPreciseEndOfMedia() const override { return false; }

    void teardown() override;

    static std::string formatChannelCount(int channels);

private:
    void eventLoop();
    void handleEvent(const mpv_event& event);
    void handlePropertyChange(const mpv_event& event);
    void refreshTrackList();
    void post(BackendEvent event);
    void command(const std::vector<std::string>& args);
    void setFlag(const char* name, bool value);
    void setDouble(const char* name, double value);
    void setString(const char* name, const std::string& value);

    int m_serial{0};
    BackendEventSink& m_sink;
    mpv_handle* m_mpv{nullptr};
    std::thread m_eventThread;
    std::atomic_bool m_stopping{false};

    std::atomic<double> m_timePos{0.0};
    std::atomic<double> m_duration{0.0};
    std::atomic<double> m_speed{1.0};
    std::atomic<double> m_aspect{0.0};
    std::atomic_bool m_paused{true};
    std::atomic_bool m_fileLoaded{false};

    mutable std::mutex m_trackMutex;
    std::vector<NativeTrack> m_audioTracks;
    std::vector<NativeTrack> m_subtitleTracks;
    std::vector<VideoTrackInfo> m_videoTracks;
};

} // namespace media
