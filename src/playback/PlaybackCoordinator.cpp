#include "PlaybackCoordinator.h"
#include <QDateTime>
#include <QPointer>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <logger.h>

using media::BackendEvent;
using media::BackendKind;

namespace playback {

const char* phaseName(Phase phase)
{
    switch (phase) {
    case Phase::Idle:
        return "idle";
    case Phase::Preparing:
        return "preparing";
    case Phase::Ready:
        return "ready";
    case Phase::Failed:
        return "failed";
    }
    return "unknown";
}

PlaybackCoordinator::PlaybackCoordinator(media::BackendFactory& factory, TaskScheduler& scheduler,
                                         media::ExportRunner* exportRunner, QObject* parent)
    : QObject(parent)
    , m_factory(factory)
    , m_scheduler(scheduler)
    , m_exportRunner(exportRunner)
    , m_queue([this]() {
        // 可能在引擎线程调用，切回协调线程处理
        QMetaObject::invokeMethod(this, [this]() { drainEvents(); }, Qt::QueuedConnection);
    })
    , m_reverse(scheduler, [this]() { seekByFrames(-1); })
{
    qRegisterMetaType<playback::PlaybackSnapshot>("playback::PlaybackSnapshot");
}
PlaybackCoordinator::~PlaybackCoordinator()
{
    NEAPU_FUNC_TRACE;
    teardownBackend();
}
void PlaybackCoordinator::setSettings(const PlayerSettings& settings)
{
    m_settings = settings;
    m_state.timecodeMode = settings.timecodeMode;
}

media::BackendAdapter* PlaybackCoordinator::backend() const
{
    if (auto* primary = std::get_if<PrimaryBackend>(&m_backend)) {
        return primary->adapter.get();
    }
    if (auto* universal = std::get_if<UniversalBackend>(&m_backend)) {
        return universal->adapter.get();
    }
    return nullptr;
}
media::BackendKind PlaybackCoordinator::activeBackend() const
{
    if (std::holds_alternative<PrimaryBackend>(m_backend)) {
        return BackendKind::Primary;
    }
    if (std::holds_alternative<UniversalBackend>(m_backend)) {
        return BackendKind::Universal;
    }
    return BackendKind::None;
}
bool PlaybackCoordinator::isReady() const
{
    return m_state.phase == Phase::Ready && backend() != nullptr;
}
double PlaybackCoordinator::effectiveFrameRate() const
{
    if (m_source && m_source->metadata) {
        if (auto fps = m_source->metadata->frameRate()) {
            return *fps;
        }
    }
    return TimecodeEngine::DEFAULT_FPS;
}
media::BackendKind PlaybackCoordinator::initialBackend() const
{
    if (!m_settings.preferPrimary) {
        return BackendKind::Universal;
    }
    // 原生框架处理多声道音频有问题，ProRes 除外
    if (m_source && m_source->metadata && m_source->metadata->hasSurroundAudio()
        && !m_source->metadata->isProfessionalIntermediate()) {
        return BackendKind::Universal;
    }
    return BackendKind::Primary;
}

void PlaybackCoordinator::loadMedia(media::MediaSource source)
{
    NEAPU_FUNC_TRACE;
    teardownBackend();

    NEAPU_LOGI("Loading media {} ({})", source.displayName, source.path);
    m_source = std::move(source);
    m_fallbackUsed = false;
    m_playWhenReady = false;

    resetStatePreservingPreferences();
    m_state.duration = m_source->declaredDuration;
    if (m_source->metadata) {
        if (m_source->metadata->duration > 0.0) {
            m_state.duration = m_source->metadata->duration;
        }
        m_state.aspectRatio = m_source->metadata->displayAspectRatio();
    }
    if (m_state.timecodeMode == TimecodeMode::Source && !(m_source->metadata && m_source->metadata->timecode)) {
        m_state.timecodeMode = TimecodeMode::Relative;
    }
    m_catalog = TrackCatalog{};
    m_trim.clearAll();

    startBackend(initialBackend(), 0.0);
}
void PlaybackCoordinator::updateMetadata(const std::string& sourceId, media::MediaMetadata metadata)
{
    if (!m_source || m_source->id != sourceId) {
        NEAPU_LOGD("Ignoring metadata for stale source {}", sourceId);
        return;
    }
    m_source->metadata = std::move(metadata);
    const auto& meta = *m_source->metadata;
    if (meta.duration > 0.0) {
        m_source->declaredDuration = meta.duration;
        m_state.duration = meta.duration;
    }
    m_source->hasVideo = !meta.videoStreams.empty();
    if (auto ratio = meta.displayAspectRatio(); ratio && std::isfinite(*ratio) && *ratio > 0.0) {
        m_state.aspectRatio = ratio;
    }
    NEAPU_LOGI("Metadata updated: {} audio, {} subtitle streams, {:.3f} fps", meta.audioStreams.size(),
               meta.subtitleStreams.size(), effectiveFrameRate());

    if (activeBackend() == BackendKind::Primary && meta.hasSurroundAudio() && !meta.isProfessionalIntermediate()) {
        switchToUniversal("surround audio detected");
        return;
    }
    if (isReady()) {
        rebuildCatalog();
        applyAudioSelection();
    }
    publish();
}
void PlaybackCoordinator::resetStatePreservingPreferences()
{
    PlaybackState next;
    next.timecodeMode = m_state.timecodeMode;
    next.volume = m_state.volume;
    next.muted = m_state.muted;
    m_state = std::move(next);
}
void PlaybackCoordinator::retry()
{
    if (!m_source) {
        return;
    }
    NEAPU_LOGI("Retrying {}", m_source->displayName);
    auto source = *m_source;
    loadMedia(std::move(source));
}
void PlaybackCoordinator::unload()
{
    NEAPU_FUNC_TRACE;
    teardownBackend();
    m_source.reset();
    resetStatePreservingPreferences();
    m_catalog = TrackCatalog{};
    m_trim.clearAll();
    publish();
}

void PlaybackCoordinator::startBackend(media::BackendKind kind, double startTime)
{
    ++m_serial;
    m_queue.clearBefore(m_serial);
    m_pendingStart = startTime;
    m_state.phase = Phase::Preparing;
    m_state.backend = kind;
    m_state.playing = false;
    m_state.errorKind = ErrorKind::None;
    m_state.errorMessage.clear();

    NEAPU_LOGI("Starting {} backend at {:.3f}s (serial {})", media::backendKindName(kind), startTime, m_serial);
    auto created = m_factory.create(kind, m_serial, m_queue);
    if (!created) {
        fail(ErrorKind::BackendConstructionFailure, created.error());
        return;
    }
    if (kind == BackendKind::Primary) {
        m_backend = PrimaryBackend{std::move(*created)};
    } else {
        m_backend = UniversalBackend{std::move(*created)};
    }
    backend()->prepare(*m_source, startTime);
    publish();
}
void PlaybackCoordinator::teardownBackend()
{
    if (m_reverse.isActive()) {
        m_state.displayedRate = 1.0;
    }
    m_reverse.stop();
    m_publishTask.cancel();
    m_loopPollTask.cancel();
    m_resumeTask.cancel();
    if (auto* adapter = backend()) {
        NEAPU_LOGD("Tearing down {} backend (serial {})", media::backendKindName(adapter->kind()), adapter->serial());
        adapter->teardown();
    }
    m_backend = std::monostate{};
    m_queue.clearBefore(m_serial + 1);
    m_state.backend = BackendKind::None;
    m_state.playing = false;
    m_state.reverseSimulating = false;
}
void PlaybackCoordinator::switchToUniversal(const std::string& reason)
{
    double startTime = m_state.phase == Phase::Ready ? m_state.currentTime : m_pendingStart;
    m_playWhenReady = m_state.phase == Phase::Ready ? m_state.playing : m_playWhenReady;
    NEAPU_LOGW("Switching to universal backend at {:.3f}s: {}", startTime, reason);

    m_fallbackUsed = true;
    teardownBackend();
    // 音轨选择回到默认，入出点保留
    m_catalog = TrackCatalog{};
    startBackend(BackendKind::Universal, startTime);
}
void PlaybackCoordinator::fail(ErrorKind kind, const std::string& message)
{
    NEAPU_LOGE("Playback failed: {}", message);
    teardownBackend();
    m_state.phase = Phase::Failed;
    m_state.errorKind = kind;
    m_state.errorMessage = message;
    publish();
}

void PlaybackCoordinator::drainEvents()
{
    auto events = m_queue.takeAll();
    while (!events.empty()) {
        handleEvent(events.front());
        events.pop();
    }
}
void PlaybackCoordinator::handleEvent(const media::BackendEvent& event)
{
    auto* adapter = backend();
    if (!adapter || event.serial != m_serial) {
        // 已废弃的加载尝试
        return;
    }
    switch (event.type) {
    case BackendEvent::Type::Ready:
        onBackendReady();
        break;
    case BackendEvent::Type::Failed:
        onBackendFailed(event);
        break;
    case BackendEvent::Type::TimeChanged:
        if (m_state.phase == Phase::Ready && !m_reverse.isActive() && std::isfinite(event.value)) {
            m_state.currentTime = clampTime(event.value);
        }
        break;
    case BackendEvent::Type::DurationChanged:
        if (std::isfinite(event.value) && event.value > 0.0) {
            m_state.duration = event.value;
            publish();
        }
        break;
    case BackendEvent::Type::PlayingChanged:
        if (m_state.playing != event.flag) {
            m_state.playing = event.flag;
            publish();
        }
        break;
    case BackendEvent::Type::RateChanged:
        if (!m_reverse.isActive() && event.value > 0.0 && m_state.displayedRate != event.value) {
            m_state.displayedRate = event.value;
            publish();
        }
        break;
    case BackendEvent::Type::EndOfMedia:
        onEndOfMedia();
        break;
    case BackendEvent::Type::TracksChanged:
        if (m_state.phase == Phase::Ready) {
            rebuildCatalog();
            applyAudioSelection();
            applySubtitleSelection();
            publish();
        }
        break;
    case BackendEvent::Type::AspectRatioChanged:
        if (std::isfinite(event.value) && event.value > 0.0) {
            m_state.aspectRatio = event.value;
            publish();
        }
        break;
    }
}
void PlaybackCoordinator::onBackendReady()
{
    if (m_state.phase != Phase::Preparing) {
        return;
    }
    auto* adapter = backend();
    if (adapter->kind() == BackendKind::Primary && m_source->hasVideo) {
        auto videoTracks = adapter->videoTracks();
        bool hasFormat = std::any_of(videoTracks.begin(), videoTracks.end(), [](const auto& t) { return t.hasFormat; });
        bool allDecodable = std::all_of(videoTracks.begin(), videoTracks.end(), [](const auto& t) { return t.decodable; });
        if (!hasFormat || !allDecodable) {
            BackendEvent failure;
            failure.type = BackendEvent::Type::Failed;
            failure.serial = m_serial;
            failure.failure = BackendEvent::FailureKind::Recoverable;
            failure.message = hasFormat ? "video track not decodable" : "no usable video format";
            onBackendFailed(failure);
            return;
        }
    }

    m_state.phase = Phase::Ready;
    if (double duration = adapter->currentDuration(); std::isfinite(duration) && duration > 0.0) {
        m_state.duration = duration;
    }
    if (auto ratio = adapter->reportedAspectRatio(); ratio && *ratio > 0.0) {
        m_state.aspectRatio = ratio;
    }

    if (m_pendingStart > 0.0) {
        double start = clampTime(m_pendingStart);
        adapter->seek(start);
        m_state.currentTime = start;
    }
    if (m_state.displayedRate > 0.0 && m_state.displayedRate != 1.0) {
        auto limits = adapter->rateLimits();
        double rate = std::clamp(m_state.displayedRate, limits.minimum, limits.maximum);
        adapter->setRate(rate);
        m_state.displayedRate = rate;
    }

    adapter->setVolume(m_state.volume);
    adapter->setMuted(m_state.muted);

    rebuildCatalog();
    applyAudioSelection();
    applySubtitleSelection();

    if (m_playWhenReady) {
        m_playWhenReady = false;
        adapter->play();
        m_state.playing = true;
    }

    m_publishTask = m_scheduler.scheduleRepeating(TIME_PUBLISH_INTERVAL, [this]() { onPublishTick(); });
    if (!adapter->hasPreciseEndOfMedia()) {
        m_loopPollTask = m_scheduler.scheduleRepeating(LOOP_POLL_INTERVAL, [this]() { onLoopPoll(); });
    }
    NEAPU_LOGI("{} backend ready, duration {:.3f}s, {} audio tracks", media::backendKindName(adapter->kind()),
               m_state.duration, m_catalog.audio.size());
    publish();
}
void PlaybackCoordinator::onBackendFailed(const media::BackendEvent& event)
{
    auto kind = activeBackend();
    if (kind == BackendKind::Primary && !m_fallbackUsed && event.failure == BackendEvent::FailureKind::Recoverable) {
        NEAPU_LOGW("Primary backend failed: {}", event.message);
        switchToUniversal(event.message);
        return;
    }
    std::string message = event.message.empty() ? "Unsupported media format" : event.message;
    fail(ErrorKind::UnsupportedFormat, message);
}
void PlaybackCoordinator::onEndOfMedia()
{
    auto* adapter = backend();
    if (!isReady()) {
        return;
    }
    if (m_state.loop) {
        NEAPU_LOGD("End of media, looping");
        seekTo(0.0);
        play();
        return;
    }
    if (adapter->isPlaying()) {
        adapter->pause();
    }
    m_state.playing = false;
    m_state.currentTime = m_state.duration;
    publish();
}
void PlaybackCoordinator::onPublishTick()
{
    auto* adapter = backend();
    if (!adapter) {
        return;
    }
    if (!m_reverse.isActive()) {
        double time = adapter->currentTime();
        if (std::isfinite(time)) {
            m_state.currentTime = clampTime(time);
        }
        m_state.playing = adapter->isPlaying();
    }
    if (m_state.currentTime != m_lastPublishedTime || m_state.playing != m_lastPublishedPlaying) {
        publish();
    }
}
void PlaybackCoordinator::onLoopPoll()
{
    auto* adapter = backend();
    if (!adapter || !m_state.loop) {
        return;
    }
    double duration = m_state.duration;
    if (duration > 0.0 && adapter->currentTime() >= duration - LOOP_TOLERANCE) {
        onEndOfMedia();
    }
}

void PlaybackCoordinator::play()
{
    if (!isReady()) {
        return;
    }
    m_reverse.stop();
    auto* adapter = backend();
    adapter->setRate(1.0);
    adapter->play();
    m_state.reverseSimulating = false;
    m_state.displayedRate = 1.0;
    m_state.playing = true;
    publish();
}
void PlaybackCoordinator::pause()
{
    if (!isReady()) {
        return;
    }
    m_reverse.stop();
    auto* adapter = backend();
    adapter->setRate(1.0);
    adapter->pause();
    m_state.reverseSimulating = false;
    m_state.displayedRate = 1.0;
    m_state.playing = false;
    publish();
}
void PlaybackCoordinator::togglePlayback()
{
    if (!isReady()) {
        return;
    }
    if (m_reverse.isActive()) {
        stopReverse();
        return;
    }
    auto* adapter = backend();
    bool wasPlaying = adapter->isPlaying();
    adapter->setRate(1.0);
    m_state.displayedRate = 1.0;
    if (wasPlaying) {
        adapter->pause();
    } else {
        adapter->play();
    }
    m_state.playing = !wasPlaying;
    publish();
}
void PlaybackCoordinator::fastForward()
{
    if (!isReady()) {
        return;
    }
    if (m_reverse.isActive()) {
        stopReverse();
        return;
    }
    auto* adapter = backend();
    if (!adapter->isPlaying()) {
        adapter->setRate(1.0);
        adapter->play();
        m_state.displayedRate = 1.0;
        m_state.playing = true;
        publish();
        return;
    }
    stepRate(true);
}
void PlaybackCoordinator::rewind()
{
    stopReverse();
    stepRate(false);
}
void PlaybackCoordinator::reverse()
{
    if (!isReady()) {
        return;
    }
    if (!m_reverse.isActive()) {
        auto* adapter = backend();
        adapter->setRate(1.0);
        adapter->pause();
        m_state.playing = false;
    }
    m_reverse.trigger();
    m_state.reverseSimulating = true;
    m_state.displayedRate = m_reverse.displayedSpeed();
    publish();
}
void PlaybackCoordinator::stopReverse()
{
    if (!m_reverse.isActive()) {
        return;
    }
    m_reverse.stop();
    m_state.reverseSimulating = false;
    m_state.displayedRate = m_reverse.displayedSpeed();
    if (auto* adapter = backend()) {
        m_state.playing = adapter->isPlaying();
    }
    publish();
}
void PlaybackCoordinator::setRate(double rate)
{
    if (!isReady() || !std::isfinite(rate) || rate <= 0.0) {
        return;
    }
    stopReverse();
    auto* adapter = backend();
    auto limits = adapter->rateLimits();
    double clamped = std::clamp(rate, limits.minimum, limits.maximum);
    adapter->setRate(clamped);
    m_state.displayedRate = clamped;
    publish();
}
void PlaybackCoordinator::stepRate(bool forward)
{
    if (!isReady()) {
        return;
    }
    auto* adapter = backend();
    auto limits = adapter->rateLimits();
    double current = adapter->rate();
    double next = std::clamp(forward ? current + limits.step : current - limits.step, limits.minimum, limits.maximum);
    adapter->setRate(next);
    m_state.displayedRate = next;
    publish();
}

double PlaybackCoordinator::clampTime(double seconds) const
{
    if (!std::isfinite(seconds)) {
        return 0.0;
    }
    if (m_state.duration > 0.0) {
        return std::clamp(seconds, 0.0, m_state.duration);
    }
    return std::max(0.0, seconds);
}
void PlaybackCoordinator::seekTo(double seconds)
{
    if (!isReady()) {
        return;
    }
    double target = clampTime(seconds);
    m_state.currentTime = target;
    backend()->seek(target);
    publish();
}
void PlaybackCoordinator::seekBy(double seconds)
{
    seekTo(m_state.currentTime + seconds);
}
void PlaybackCoordinator::seekByFrames(int frames)
{
    seekBy(frames * TimecodeEngine::frameDuration(effectiveFrameRate()));
}
void PlaybackCoordinator::jumpToStart()
{
    seekTo(0.0);
}
void PlaybackCoordinator::jumpToEnd()
{
    seekTo(m_state.duration);
}
bool PlaybackCoordinator::seekToTimecode(const std::string& input)
{
    if (!isReady()) {
        return false;
    }
    auto result = TimecodeEngine::parseInput(input, m_state.timecodeMode, snapshot().timecodeContext());
    if (!result) {
        NEAPU_LOGD("Rejected timecode input '{}'", input);
        return false;
    }
    seekTo(*result);
    return true;
}

void PlaybackCoordinator::selectAudioTrack(int position)
{
    if (position < 0 || position >= static_cast<int>(m_catalog.audio.size())) {
        return;
    }
    if (m_catalog.selectedAudio == position) {
        return;
    }
    bool wasPlaying = isReady() && backend()->isPlaying();
    if (wasPlaying) {
        pause();
    }
    m_catalog.selectedAudio = position;
    applyAudioSelection();
    if (wasPlaying) {
        m_resumeTask = m_scheduler.scheduleOnce(TRACK_RESUME_DELAY, [this]() { play(); });
    }
    publish();
}
void PlaybackCoordinator::selectSubtitleTrack(std::optional<int> position)
{
    if (position && (*position < 0 || *position >= static_cast<int>(m_catalog.subtitles.size()))) {
        return;
    }
    m_catalog.selectedSubtitle = position;
    applySubtitleSelection();
    publish();
}
void PlaybackCoordinator::rebuildCatalog()
{
    auto* adapter = backend();
    if (!adapter) {
        return;
    }
    const media::MediaMetadata* metadata = m_source && m_source->metadata ? &*m_source->metadata : nullptr;
    m_catalog = TrackOrderingEngine::rebuild(m_catalog, metadata, adapter->enumerateAudioTracks(),
                                             adapter->enumerateSubtitleTracks());
}
void PlaybackCoordinator::applyAudioSelection()
{
    if (!isReady() || !m_catalog.selectedAudio) {
        return;
    }
    const auto& entry = m_catalog.audio[*m_catalog.selectedAudio];
    if (entry.nativeId) {
        backend()->selectAudioTrack(*entry.nativeId);
    }
}
void PlaybackCoordinator::applySubtitleSelection()
{
    if (!isReady()) {
        return;
    }
    if (m_catalog.selectedSubtitle) {
        backend()->selectSubtitleTrack(m_catalog.subtitles[*m_catalog.selectedSubtitle].nativeId);
    } else {
        backend()->selectSubtitleTrack(std::nullopt);
    }
}

void PlaybackCoordinator::toggleLoop()
{
    m_state.loop = !m_state.loop;
    NEAPU_LOGD("Loop playback {}", m_state.loop ? "on" : "off");
    publish();
}

void PlaybackCoordinator::setVolume(double volume)
{
    if (!std::isfinite(volume)) {
        return;
    }
    m_state.volume = std::clamp(volume, 0.0, 100.0);
    if (auto* adapter = backend()) {
        adapter->setVolume(m_state.volume);
    }
    publish();
}
void PlaybackCoordinator::setMuted(bool muted)
{
    m_state.muted = muted;
    if (auto* adapter = backend()) {
        adapter->setMuted(muted);
    }
    publish();
}
void PlaybackCoordinator::toggleMute()
{
    setMuted(!m_state.muted);
}

void PlaybackCoordinator::setTrimIn()
{
    if (!m_source) {
        return;
    }
    m_trim.setIn(m_state.currentTime);
    publish();
}
void PlaybackCoordinator::setTrimOut()
{
    if (!m_source) {
        return;
    }
    m_trim.setOut(m_state.currentTime);
    publish();
}
void PlaybackCoordinator::clearTrimIn()
{
    m_trim.clearIn();
    publish();
}
void PlaybackCoordinator::clearTrimOut()
{
    m_trim.clearOut();
    publish();
}
void PlaybackCoordinator::clearTrim()
{
    m_trim.clearAll();
    publish();
}
void PlaybackCoordinator::jumpToTrimIn()
{
    if (auto in = m_trim.in()) {
        seekTo(*in);
    }
}
void PlaybackCoordinator::jumpToTrimOut()
{
    if (auto out = m_trim.out()) {
        seekTo(*out);
    }
}

void PlaybackCoordinator::cycleTimecodeDisplay()
{
    bool hasSourceTimecode = m_source && m_source->metadata && m_source->metadata->timecode.has_value();
    m_state.timecodeMode = TimecodeEngine::nextMode(m_state.timecodeMode, hasSourceTimecode);
    publish();
}

bool PlaybackCoordinator::captureScreenshot()
{
    if (!m_source || !m_exportRunner || m_state.exportStatus.savingScreenshot) {
        return false;
    }
    media::ExportRequest request;
    request.kind = media::ExportRequest::Kind::Screenshot;
    request.sourcePath = m_source->path;
    request.time = m_state.currentTime;
    request.format = m_settings.screenshotFormat;
    if (m_source->metadata) {
        if (auto* video = m_source->metadata->primaryVideoStream()) {
            request.videoStream = *video;
        }
    }
    auto timestamp = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss").toStdString();
    request.outputPath = media::screenshotOutputPath(m_source->path, m_settings.screenshotDirectory.toStdString(),
                                                     request.time, request.format, timestamp);

    m_state.exportStatus.savingScreenshot = true;
    m_state.exportStatus.screenshotDone = false;
    publish();

    QPointer<PlaybackCoordinator> guard(this);
    m_exportRunner->run(request, [guard](const media::ExportResult& result) {
        if (guard) {
            guard->finishScreenshot(result);
        }
    });
    return true;
}
bool PlaybackCoordinator::exportTrim()
{
    if (!m_source || !m_exportRunner || m_state.exportStatus.exportingTrim) {
        return false;
    }
    if (!m_trim.isExportable()) {
        NEAPU_LOGW("Export requires both trim in and out points");
        return false;
    }
    media::ExportRequest request;
    request.kind = media::ExportRequest::Kind::Trim;
    request.sourcePath = m_source->path;
    request.inPoint = *m_trim.in();
    request.outPoint = *m_trim.out();
    request.outputPath = media::trimOutputPath(m_source->path, m_settings.trimDirectory.toStdString());

    m_state.exportStatus.exportingTrim = true;
    m_state.exportStatus.trimExportDone = false;
    publish();

    QPointer<PlaybackCoordinator> guard(this);
    m_exportRunner->run(request, [guard](const media::ExportResult& result) {
        if (guard) {
            guard->finishTrimExport(result);
        }
    });
    return true;
}
void PlaybackCoordinator::finishScreenshot(const media::ExportResult& result)
{
    auto& status = m_state.exportStatus;
    status.savingScreenshot = false;
    if (result.success) {
        NEAPU_LOGI("Screenshot saved: {}", result.outputPath);
        status.screenshotDone = true;
        status.lastScreenshotPath = result.outputPath;
        status.message = "Screenshot saved: " + std::filesystem::path(result.outputPath).filename().string();
        m_screenshotResetTask = m_scheduler.scheduleOnce(EXPORT_STATUS_RESET_DELAY, [this]() {
            m_state.exportStatus.screenshotDone = false;
            publish();
        });
    } else {
        NEAPU_LOGE("Screenshot failed: {}", result.message);
        status.message = "Screenshot failed: " + result.message;
    }
    publish();
}
void PlaybackCoordinator::finishTrimExport(const media::ExportResult& result)
{
    auto& status = m_state.exportStatus;
    status.exportingTrim = false;
    if (result.success) {
        NEAPU_LOGI("Trim export saved: {}", result.outputPath);
        status.trimExportDone = true;
        status.message = "Trim exported: " + std::filesystem::path(result.outputPath).filename().string();
        m_trimResetTask = m_scheduler.scheduleOnce(EXPORT_STATUS_RESET_DELAY, [this]() {
            m_state.exportStatus.trimExportDone = false;
            publish();
        });
    } else {
        NEAPU_LOGE("Trim export failed: {}", result.message);
        status.message = "Trim export failed: " + result.message;
    }
    publish();
}

void PlaybackCoordinator::trigger(Command command)
{
    switch (command) {
    case Command::TogglePlayback:
        togglePlayback();
        break;
    case Command::CycleTimecodeDisplay:
        cycleTimecodeDisplay();
        break;
    case Command::CaptureScreenshot:
        captureScreenshot();
        break;
    case Command::ExportTrim:
        exportTrim();
        break;
    }
}

PlaybackSnapshot PlaybackCoordinator::snapshot() const
{
    PlaybackSnapshot snapshot;
    if (m_source) {
        snapshot.sourceId = m_source->id;
        snapshot.sourceName = m_source->displayName;
        if (m_source->metadata) {
            snapshot.sourceTimecode = m_source->metadata->timecode;
        }
    }
    snapshot.frameRate = effectiveFrameRate();
    snapshot.state = m_state;
    snapshot.tracks = m_catalog;
    snapshot.trim = m_trim;
    return snapshot;
}
void PlaybackCoordinator::publish()
{
    m_lastPublishedTime = m_state.currentTime;
    m_lastPublishedPlaying = m_state.playing;
    emit stateChanged(snapshot());
}

} // namespace playback
