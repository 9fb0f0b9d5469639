#pragma once
#include <optional>
#include <string>
#include <vector>
#include "MediaInfo.h"

namespace media {

enum class BackendKind {
    None,
    Primary,
    Universal
};

const char* backendKindName(BackendKind kind);

struct NativeTrack {
    int nativeId{-1};
    std::string name;
    std::optional<int> sourceIndex; // 容器流序号，引擎不提供时为空
    int channels{0};
    int sampleRate{0};
};

struct VideoTrackInfo {
    bool hasFormat{false};
    bool decodable{false};
    int width{0};
    int height{0};
};

struct RateLimits {
    double step{1.0};
    double minimum{1.0};
    double maximum{4.0};
};

struct BackendEvent {
    enum class Type {
        Ready,
        Failed,
        TimeChanged,
        DurationChanged,
        PlayingChanged,
        RateChanged,
        EndOfMedia,
        TracksChanged,
        AspectRatioChanged
    };
    enum class FailureKind {
        Recoverable,
        Terminal
    };

    Type type{Type::TimeChanged};
    int serial{0};
    double value{0.0};
    bool flag{false};
    FailureKind failure{FailureKind::Recoverable};
    std::string message;
};

// 引擎线程通过 sink 投递事件，实现必须线程安全
class BackendEventSink {
public:
    virtual ~BackendEventSink() = default;
    virtual void post(BackendEvent event) = 0;
};

class BackendAdapter {
public:
    virtual ~BackendAdapter() = default;

    virtual BackendKind kind() const = 0;
    virtual int serial() const = 0;

    // 异步，结果以 Ready / Failed 事件返回
    virtual void prepare(const MediaSource& source, double startTime) = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual bool isPlaying() const = 0;

    virtual double rate() const = 0;
    virtual void setRate(double rate) = 0;
    virtual RateLimits rateLimits() const = 0;

    virtual void seek(double seconds) = 0;
    virtual double currentTime() const = 0;
    virtual double currentDuration() const = 0;

    virtual std::vector<VideoTrackInfo> videoTracks() const = 0;
    virtual std::vector<NativeTrack> enumerateAudioTracks() const = 0;
    virtual std::vector<NativeTrack> enumerateSubtitleTracks() const = 0;
    virtual void selectAudioTrack(int nativeId) = 0;
    virtual void selectSubtitleTrack(std::optional<int> nativeId) = 0;

    // 音量 0-100
    virtual void setVolume(double volume) = 0;
    virtual void setMuted(bool muted) = 0;

    virtual std::optional<double> reportedAspectRatio() const = 0;

    // false 时由调用方轮询判断播放结束
    virtual bool hasPreciseEndOfMedia() const = 0;

    // 返回后不再有任何引擎回调
    virtual void teardown() = 0;
};

} // namespace media
