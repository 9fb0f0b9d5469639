#include "PrimaryAdapter.h"
#include <QAudioOutput>
#include <QLocale>
#include <QMediaFormat>
#include <QMediaMetaData>
#include <QMediaPlayer>
#include <QSize>
#include <QUrl>
#include <algorithm>
#include <logger.h>

namespace media {
namespace {
NativeTrack toNativeTrack(const QMediaMetaData& metaData, int index, const char* fallbackPrefix)
{
    NativeTrack track;
    track.nativeId = index;

    QStringList parts;
    parts << QString("#%1").arg(index);
    auto language = metaData.value(QMediaMetaData::Language);
    if (language.isValid()) {
        auto lang = language.value<QLocale::Language>();
        if (lang != QLocale::AnyLanguage) {
            parts << QLocale::languageToString(lang);
        }
    }
    auto title = metaData.stringValue(QMediaMetaData::Title);
    if (!title.isEmpty()) {
        parts << title;
    }
    auto codec = metaData.value(QMediaMetaData::AudioCodec);
    if (codec.isValid()) {
        auto audioCodec = codec.value<QMediaFormat::AudioCodec>();
        if (audioCodec != QMediaFormat::AudioCodec::Unspecified) {
            parts << QMediaFormat::audioCodecName(audioCodec);
        }
    }
    track.name = parts.size() > 1 ? parts.join(" • ").toStdString() : QString("%1 %2").arg(fallbackPrefix).arg(index + 1).toStdString();
    return track;
}
} // namespace

PrimaryAdapter::PrimaryAdapter(int serial, BackendEventSink& sink, QObject* videoOutput)
    : m_serial(serial), m_sink(sink)
{
    NEAPU_FUNC_TRACE;
    m_player = std::make_unique<QMediaPlayer>();
    m_audioOutput = std::make_unique<QAudioOutput>();
    m_player->setAudioOutput(m_audioOutput.get());
    if (videoOutput) {
        m_player->setVideoOutput(videoOutput);
    }
    connectSignals();
}
PrimaryAdapter::~PrimaryAdapter()
{
    teardown();
}

void PrimaryAdapter::connectSignals()
{
    auto* player = m_player.get();
    m_connections << QObject::connect(player, &QMediaPlayer::mediaStatusChanged, player, [this](QMediaPlayer::MediaStatus status) {
        switch (status) {
        case QMediaPlayer::LoadedMedia:
        case QMediaPlayer::BufferedMedia:
            if (!m_readyPosted) {
                m_readyPosted = true;
                NEAPU_LOGI("Primary backend loaded media");
                post(BackendEvent::Type::Ready);
            }
            break;
        case QMediaPlayer::InvalidMedia:
            postFailure("invalid media");
            break;
        case QMediaPlayer::EndOfMedia:
            post(BackendEvent::Type::EndOfMedia);
            break;
        default:
            break;
        }
    });
    m_connections << QObject::connect(player, &QMediaPlayer::errorOccurred, player, [this](QMediaPlayer::Error error, const QString& errorString) {
        if (error == QMediaPlayer::NoError) {
            return;
        }
        postFailure(errorString.isEmpty() ? "playback error " + std::to_string(static_cast<int>(error)) : errorString.toStdString());
    });
    m_connections << QObject::connect(player, &QMediaPlayer::positionChanged, player, [this](qint64 position) {
        post(BackendEvent::Type::TimeChanged, static_cast<double>(position) / 1000.0);
    });
    m_connections << QObject::connect(player, &QMediaPlayer::durationChanged, player, [this](qint64 duration) {
        post(BackendEvent::Type::DurationChanged, static_cast<double>(duration) / 1000.0);
    });
    m_connections << QObject::connect(player, &QMediaPlayer::playbackStateChanged, player, [this](QMediaPlayer::PlaybackState state) {
        post(BackendEvent::Type::PlayingChanged, 0.0, state == QMediaPlayer::PlayingState);
    });
    m_connections << QObject::connect(player, &QMediaPlayer::playbackRateChanged, player, [this](qreal rate) {
        post(BackendEvent::Type::RateChanged, rate);
    });
    m_connections << QObject::connect(player, &QMediaPlayer::tracksChanged, player, [this]() {
        post(BackendEvent::Type::TracksChanged);
    });
    m_connections << QObject::connect(player, &QMediaPlayer::metaDataChanged, player, [this]() {
        if (auto ratio = reportedAspectRatio()) {
            post(BackendEvent::Type::AspectRatioChanged, *ratio);
        }
    });
}

void PrimaryAdapter::post(BackendEvent::Type type, double value, bool flag)
{
    if (m_tornDown) {
        return;
    }
    BackendEvent event;
    event.type = type;
    event.serial = m_serial;
    event.value = value;
    event.flag = flag;
    m_sink.post(std::move(event));
}
void PrimaryAdapter::postFailure(const std::string& message)
{
    if (m_tornDown) {
        return;
    }
    NEAPU_LOGW("Primary backend error: {}", message);
    BackendEvent event;
    event.type = BackendEvent::Type::Failed;
    event.serial = m_serial;
    event.failure = BackendEvent::FailureKind::Recoverable;
    event.message = message;
    m_sink.post(std::move(event));
}

void PrimaryAdapter::prepare(const MediaSource& source, double startTime)
{
    NEAPU_LOGI("Primary backend opening {} at {:.3f}s", source.path, startTime);
    m_readyPosted = false;
    m_player->setSource(QUrl::fromLocalFile(QString::fromStdString(source.path)));
    if (startTime > 0.0) {
        m_player->setPosition(static_cast<qint64>(startTime * 1000.0));
    }
}
void PrimaryAdapter::play()
{
    m_player->play();
}
void PrimaryAdapter::pause()
{
    m_player->pause();
}
bool PrimaryAdapter::isPlaying() const
{
    return m_player->playbackState() == QMediaPlayer::PlayingState;
}
double PrimaryAdapter::rate() const
{
    return m_player->playbackRate();
}
void PrimaryAdapter::setRate(double rate)
{
    m_player->setPlaybackRate(rate);
}
void PrimaryAdapter::seek(double seconds)
{
    m_player->setPosition(static_cast<qint64>(seconds * 1000.0));
}
double PrimaryAdapter::currentTime() const
{
    return static_cast<double>(m_player->position()) / 1000.0;
}
double PrimaryAdapter::currentDuration() const
{
    return static_cast<double>(m_player->duration()) / 1000.0;
}

std::vector<VideoTrackInfo> PrimaryAdapter::videoTracks() const
{
    std::vector<VideoTrackInfo> tracks;
    const bool decodable = m_player->hasVideo();
    for (const auto& metaData : m_player->videoTracks()) {
        VideoTrackInfo info;
        auto resolution = metaData.value(QMediaMetaData::Resolution).toSize();
        auto codec = metaData.value(QMediaMetaData::VideoCodec);
        info.width = resolution.width();
        info.height = resolution.height();
        info.hasFormat = !resolution.isEmpty()
            || (codec.isValid() && codec.value<QMediaFormat::VideoCodec>() != QMediaFormat::VideoCodec::Unspecified);
        info.decodable = decodable;
        tracks.push_back(info);
    }
    // 部分平台不填充轨道列表
    if (tracks.empty() && decodable) {
        tracks.push_back({true, true, 0, 0});
    }
    return tracks;
}
std::vector<NativeTrack> PrimaryAdapter::enumerateAudioTracks() const
{
    std::vector<NativeTrack> tracks;
    const auto audioTracks = m_player->audioTracks();
    for (int i = 0; i < audioTracks.size(); ++i) {
        tracks.push_back(toNativeTrack(audioTracks[i], i, "Audio Track"));
    }
    return tracks;
}
std::vector<NativeTrack> PrimaryAdapter::enumerateSubtitleTracks() const
{
    std::vector<NativeTrack> tracks;
    const auto subtitleTracks = m_player->subtitleTracks();
    for (int i = 0; i < subtitleTracks.size(); ++i) {
        tracks.push_back(toNativeTrack(subtitleTracks[i], i, "Subtitle"));
    }
    return tracks;
}
void PrimaryAdapter::selectAudioTrack(int nativeId)
{
    if (m_player->activeAudioTrack() != nativeId) {
        m_player->setActiveAudioTrack(nativeId);
    }
}
void PrimaryAdapter::selectSubtitleTrack(std::optional<int> nativeId)
{
    m_player->setActiveSubtitleTrack(nativeId.value_or(-1));
}
void PrimaryAdapter::setVolume(double volume)
{
    m_audioOutput->setVolume(static_cast<float>(std::clamp(volume, 0.0, 100.0) / 100.0));
}
void PrimaryAdapter::setMuted(bool muted)
{
    m_audioOutput->setMuted(muted);
}
std::optional<double> PrimaryAdapter::reportedAspectRatio() const
{
    auto resolution = m_player->metaData().value(QMediaMetaData::Resolution).toSize();
    if (resolution.width() > 0 && resolution.height() > 0) {
        return static_cast<double>(resolution.width()) / resolution.height();
    }
    return std::nullopt;
}

void PrimaryAdapter::teardown()
{
    if (m_tornDown) {
        return;
    }
    NEAPU_FUNC_TRACE;
    m_tornDown = true;
    for (const auto& connection : m_connections) {
        QObject::disconnect(connection);
    }
    m_connections.clear();
    m_player->stop();
    m_player->setVideoOutput(nullptr);
    m_player->setSource(QUrl());
}

} // namespace media
