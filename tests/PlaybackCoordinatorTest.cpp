#include <QCoreApplication>
#include <gtest/gtest.h>
#include "FakeBackend.h"
#include "ManualScheduler.h"
#include "playback/PlaybackCoordinator.h"

using media::BackendEvent;
using media::BackendKind;
using playback::ErrorKind;
using playback::Phase;
using playback::PlaybackCoordinator;

namespace {
media::MediaMetadata::AudioStream audioStream(int index, int channels, bool isDefault = false)
{
    media::MediaMetadata::AudioStream stream;
    stream.index = index;
    stream.channels = channels;
    stream.isDefault = isDefault;
    stream.codec = "aac";
    stream.sampleRate = 48000;
    return stream;
}

media::MediaMetadata metadata(const std::string& videoCodec, std::vector<int> audioChannels, double fps = 24.0)
{
    media::MediaMetadata meta;
    meta.duration = 120.0;
    media::MediaMetadata::VideoStream video;
    video.index = 0;
    video.codec = videoCodec;
    video.width = 1920;
    video.height = 1080;
    video.frameRate = {static_cast<int64_t>(fps * 1000), 1000};
    meta.videoStreams.push_back(video);
    for (size_t i = 0; i < audioChannels.size(); ++i) {
        meta.audioStreams.push_back(audioStream(static_cast<int>(i) + 1, audioChannels[i], i == 0));
    }
    return meta;
}

media::MediaSource source(std::optional<media::MediaMetadata> meta = std::nullopt)
{
    media::MediaSource src;
    src.id = "clip-1";
    src.path = "/media/clip.mov";
    src.displayName = "clip.mov";
    src.declaredDuration = 120.0;
    src.metadata = std::move(meta);
    return src;
}

void drain()
{
    QCoreApplication::processEvents();
}
} // namespace

class PlaybackCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        coordinator = std::make_unique<PlaybackCoordinator>(factory, scheduler, &exporter);
        QObject::connect(coordinator.get(), &PlaybackCoordinator::stateChanged,
                         [this](const playback::PlaybackSnapshot& snapshot) {
                             ++published;
                             lastSnapshot = snapshot;
                         });
    }
    void TearDown() override { coordinator.reset(); }

    // 加载并让当前引擎就绪
    tests::FakeBackend* loadReady(media::MediaSource src = source())
    {
        coordinator->loadMedia(std::move(src));
        auto* backend = factory.latest;
        backend->post(BackendEvent::Type::Ready);
        drain();
        return backend;
    }

    tests::FakeBackendFactory factory;
    tests::ManualScheduler scheduler;
    tests::FakeExportRunner exporter;
    std::unique_ptr<PlaybackCoordinator> coordinator;
    int published{0};
    playback::PlaybackSnapshot lastSnapshot;
};

TEST_F(PlaybackCoordinatorTest, SurroundAudioSelectsUniversalImmediately)
{
    coordinator->loadMedia(source(metadata("h264", {6})));
    EXPECT_EQ(factory.count(BackendKind::Primary), 0);
    EXPECT_EQ(factory.count(BackendKind::Universal), 1);
    EXPECT_EQ(coordinator->activeBackend(), BackendKind::Universal);
    EXPECT_EQ(coordinator->state().phase, Phase::Preparing);
}

TEST_F(PlaybackCoordinatorTest, ProResKeepsPrimaryDespiteSurround)
{
    coordinator->loadMedia(source(metadata("prores", {6})));
    EXPECT_EQ(factory.count(BackendKind::Primary), 1);
    EXPECT_EQ(factory.count(BackendKind::Universal), 0);
}

TEST_F(PlaybackCoordinatorTest, StereoSourceStartsOnPrimary)
{
    auto* backend = loadReady(source(metadata("h264", {2})));
    EXPECT_EQ(backend->kind(), BackendKind::Primary);
    EXPECT_EQ(backend->preparedPath, "/media/clip.mov");
    EXPECT_EQ(coordinator->state().phase, Phase::Ready);
    EXPECT_EQ(lastSnapshot.state.phase, Phase::Ready);
    EXPECT_EQ(lastSnapshot.sourceName, "clip.mov");
    EXPECT_DOUBLE_EQ(lastSnapshot.frameRate, 24.0);
}

TEST_F(PlaybackCoordinatorTest, PreferUniversalSettingSkipsPrimary)
{
    playback::PlayerSettings settings;
    settings.preferPrimary = false;
    coordinator->setSettings(settings);
    coordinator->loadMedia(source());
    EXPECT_EQ(factory.count(BackendKind::Primary), 0);
    EXPECT_EQ(factory.count(BackendKind::Universal), 1);
}

TEST_F(PlaybackCoordinatorTest, PrimaryFailureFallsBackOnceAtCurrentPosition)
{
    auto* primary = loadReady();
    coordinator->seekTo(42.0);
    coordinator->play();
    coordinator->setTrimIn();
    coordinator->toggleLoop();

    primary->postFailure(BackendEvent::FailureKind::Recoverable);
    primary->postFailure(BackendEvent::FailureKind::Recoverable);
    drain();

    EXPECT_EQ(factory.count(BackendKind::Universal), 1);
    auto* universal = factory.latest;
    EXPECT_EQ(universal->kind(), BackendKind::Universal);
    EXPECT_DOUBLE_EQ(universal->preparedStart, 42.0);
    EXPECT_EQ(coordinator->state().phase, Phase::Preparing);

    universal->post(BackendEvent::Type::Ready);
    drain();
    EXPECT_EQ(coordinator->state().phase, Phase::Ready);
    EXPECT_EQ(coordinator->trim().in(), 42.0);
    EXPECT_TRUE(coordinator->state().loop);
    EXPECT_EQ(universal->playCount, 1);
    EXPECT_TRUE(coordinator->state().playing);
}

TEST_F(PlaybackCoordinatorTest, StalePrimaryFailureAfterFallbackIsIgnored)
{
    coordinator->loadMedia(source());
    auto* primary = factory.latest;
    auto* sink = factory.lastSink;
    int primarySerial = primary->serial();
    primary->postFailure(BackendEvent::FailureKind::Recoverable);
    drain();
    ASSERT_EQ(factory.count(BackendKind::Universal), 1);

    // 已销毁的引擎晚到的失败
    BackendEvent late;
    late.type = BackendEvent::Type::Failed;
    late.serial = primarySerial;
    sink->post(late);
    drain();

    EXPECT_EQ(factory.count(BackendKind::Universal), 1);
    EXPECT_EQ(coordinator->state().phase, Phase::Preparing);
    EXPECT_EQ(coordinator->activeBackend(), BackendKind::Universal);
}

TEST_F(PlaybackCoordinatorTest, UndecodableVideoOnPrimaryTriggersFallback)
{
    factory.configs[BackendKind::Primary].videoTracks = {{true, false, 1920, 1080}};
    coordinator->loadMedia(source());
    factory.latest->post(BackendEvent::Type::Ready);
    drain();
    EXPECT_EQ(factory.count(BackendKind::Universal), 1);
    EXPECT_EQ(coordinator->activeBackend(), BackendKind::Universal);
}

TEST_F(PlaybackCoordinatorTest, UniversalFailureIsTerminalAndRetryable)
{
    coordinator->loadMedia(source(metadata("h264", {6})));
    factory.latest->postFailure(BackendEvent::FailureKind::Terminal, "Unable to play media: unrecognized file format");
    drain();

    EXPECT_EQ(coordinator->state().phase, Phase::Failed);
    EXPECT_EQ(coordinator->state().errorKind, ErrorKind::UnsupportedFormat);
    EXPECT_EQ(coordinator->activeBackend(), BackendKind::None);
    EXPECT_EQ(lastSnapshot.state.errorMessage, "Unable to play media: unrecognized file format");

    coordinator->retry();
    EXPECT_EQ(factory.count(BackendKind::Universal), 2);
    EXPECT_EQ(coordinator->state().phase, Phase::Preparing);
}

TEST_F(PlaybackCoordinatorTest, SecondBackendFailureAfterFallbackIsTerminal)
{
    coordinator->loadMedia(source());
    factory.latest->postFailure(BackendEvent::FailureKind::Recoverable);
    drain();
    factory.latest->postFailure(BackendEvent::FailureKind::Recoverable);
    drain();
    EXPECT_EQ(factory.count(BackendKind::Universal), 1);
    EXPECT_EQ(coordinator->state().phase, Phase::Failed);
    EXPECT_EQ(coordinator->state().errorKind, ErrorKind::UnsupportedFormat);
}

TEST_F(PlaybackCoordinatorTest, ConstructionFailureIsReported)
{
    factory.failing[BackendKind::Primary] = true;
    coordinator->loadMedia(source());
    EXPECT_EQ(coordinator->state().phase, Phase::Failed);
    EXPECT_EQ(coordinator->state().errorKind, ErrorKind::BackendConstructionFailure);
    EXPECT_EQ(coordinator->state().errorMessage, "engine unavailable");
}

TEST_F(PlaybackCoordinatorTest, LateSurroundMetadataSwitchesToUniversal)
{
    auto* primary = loadReady();
    primary->setTime(12.0);
    coordinator->seekTo(12.0);
    coordinator->updateMetadata("clip-1", metadata("h264", {2, 6}));

    EXPECT_EQ(factory.count(BackendKind::Universal), 1);
    EXPECT_DOUBLE_EQ(factory.latest->preparedStart, 12.0);
}

TEST_F(PlaybackCoordinatorTest, MetadataForOtherSourceIsIgnored)
{
    loadReady();
    coordinator->updateMetadata("other", metadata("h264", {6}, 50.0));
    EXPECT_EQ(factory.count(BackendKind::Universal), 0);
    EXPECT_DOUBLE_EQ(coordinator->effectiveFrameRate(), playback::TimecodeEngine::DEFAULT_FPS);
}

TEST_F(PlaybackCoordinatorTest, SeekClampsIntoDuration)
{
    auto* backend = loadReady();
    coordinator->seekTo(500.0);
    EXPECT_DOUBLE_EQ(coordinator->state().currentTime, 120.0);
    EXPECT_DOUBLE_EQ(backend->seeks.back(), 120.0);

    coordinator->seekTo(-3.0);
    EXPECT_DOUBLE_EQ(coordinator->state().currentTime, 0.0);
    EXPECT_DOUBLE_EQ(backend->seeks.back(), 0.0);

    coordinator->seekBy(-10.0);
    EXPECT_DOUBLE_EQ(coordinator->state().currentTime, 0.0);
}

TEST_F(PlaybackCoordinatorTest, ReverseIssuesSingleFrameSeeks)
{
    auto* backend = loadReady(source(metadata("h264", {2}, 24.0)));
    coordinator->seekTo(5.0);
    backend->seeks.clear();
    coordinator->play();

    coordinator->reverse();
    EXPECT_FALSE(backend->isPlaying());
    EXPECT_TRUE(coordinator->state().reverseSimulating);
    EXPECT_DOUBLE_EQ(coordinator->state().displayedRate, -1.0);

    scheduler.advance(1.01);
    EXPECT_EQ(backend->seeks.size(), 24u);
    EXPECT_NEAR(coordinator->state().currentTime, 4.0, 1e-9);

    for (int i = 0; i < 6; ++i) {
        coordinator->reverse();
    }
    EXPECT_DOUBLE_EQ(coordinator->state().displayedRate, -4.0);

    coordinator->togglePlayback();
    EXPECT_FALSE(coordinator->state().reverseSimulating);
    EXPECT_DOUBLE_EQ(coordinator->state().displayedRate, 1.0);
    size_t seeks = backend->seeks.size();
    scheduler.advance(1.0);
    EXPECT_EQ(backend->seeks.size(), seeks);
}

TEST_F(PlaybackCoordinatorTest, ReverseIgnoresBackendTimeUpdates)
{
    auto* backend = loadReady(source(metadata("h264", {2}, 24.0)));
    coordinator->seekTo(10.0);
    coordinator->reverse();
    backend->post(BackendEvent::Type::TimeChanged, 30.0);
    drain();
    EXPECT_LT(coordinator->state().currentTime, 10.0 + 1e-9);
}

TEST_F(PlaybackCoordinatorTest, FastForwardStepsRateUpToLimit)
{
    auto* backend = loadReady();
    coordinator->fastForward();
    EXPECT_TRUE(backend->isPlaying());
    EXPECT_DOUBLE_EQ(backend->rate(), 1.0);

    for (int i = 0; i < 5; ++i) {
        coordinator->fastForward();
    }
    EXPECT_DOUBLE_EQ(backend->rate(), 4.0);
    EXPECT_DOUBLE_EQ(coordinator->state().displayedRate, 4.0);

    coordinator->rewind();
    EXPECT_DOUBLE_EQ(backend->rate(), 3.0);
    coordinator->togglePlayback();
    EXPECT_FALSE(backend->isPlaying());
    EXPECT_DOUBLE_EQ(coordinator->state().displayedRate, 1.0);
}

TEST_F(PlaybackCoordinatorTest, UniversalRateStepsByHalf)
{
    auto* backend = loadReady(source(metadata("h264", {6})));
    coordinator->fastForward();
    coordinator->fastForward();
    EXPECT_DOUBLE_EQ(backend->rate(), 1.5);
    coordinator->setRate(0.1);
    EXPECT_DOUBLE_EQ(backend->rate(), 0.25);
}

TEST_F(PlaybackCoordinatorTest, EndOfMediaStopsWithoutLoop)
{
    auto* backend = loadReady();
    coordinator->play();
    backend->post(BackendEvent::Type::EndOfMedia);
    drain();
    EXPECT_FALSE(coordinator->state().playing);
    EXPECT_FALSE(backend->isPlaying());
    EXPECT_DOUBLE_EQ(coordinator->state().currentTime, 120.0);
}

TEST_F(PlaybackCoordinatorTest, EndOfMediaLoopsToStart)
{
    auto* backend = loadReady();
    coordinator->toggleLoop();
    coordinator->play();
    backend->post(BackendEvent::Type::EndOfMedia);
    drain();
    EXPECT_DOUBLE_EQ(backend->seeks.back(), 0.0);
    EXPECT_TRUE(coordinator->state().playing);
    EXPECT_EQ(backend->playCount, 2);
}

TEST_F(PlaybackCoordinatorTest, UniversalLoopIsDetectedByPolling)
{
    auto* backend = loadReady(source(metadata("h264", {6})));
    coordinator->play();
    backend->setTime(119.97);
    scheduler.advance(0.1);
    EXPECT_TRUE(backend->seeks.empty());

    coordinator->toggleLoop();
    backend->setTime(119.97);
    scheduler.advance(0.1);
    ASSERT_FALSE(backend->seeks.empty());
    EXPECT_DOUBLE_EQ(backend->seeks.back(), 0.0);
    EXPECT_TRUE(backend->isPlaying());
}

TEST_F(PlaybackCoordinatorTest, SeekToTimecodeRejectsMalformedInput)
{
    loadReady();
    coordinator->seekTo(10.0);
    EXPECT_TRUE(coordinator->seekToTimecode("+1:30"));
    EXPECT_DOUBLE_EQ(coordinator->state().currentTime, 100.0);

    EXPECT_FALSE(coordinator->seekToTimecode("1:xx"));
    EXPECT_DOUBLE_EQ(coordinator->state().currentTime, 100.0);
    EXPECT_EQ(coordinator->state().errorKind, ErrorKind::None);
}

TEST_F(PlaybackCoordinatorTest, TrimOutBeforeInClearsIn)
{
    loadReady();
    coordinator->seekTo(5.0);
    coordinator->setTrimIn();
    coordinator->seekTo(3.0);
    coordinator->setTrimOut();
    EXPECT_FALSE(coordinator->trim().in().has_value());
    EXPECT_EQ(coordinator->trim().out(), 3.0);
    EXPECT_FALSE(coordinator->exportTrim());
    EXPECT_TRUE(exporter.requests.empty());
}

TEST_F(PlaybackCoordinatorTest, AudioSelectionMapsToNativeIdsAndResumes)
{
    factory.configs[BackendKind::Primary].audioTracks = {
        {100, "English", 1, 2, 48000},
        {200, "Commentary", 2, 2, 48000},
    };
    auto* backend = loadReady(source(metadata("h264", {2, 2})));
    ASSERT_EQ(coordinator->tracks().audio.size(), 2u);
    EXPECT_EQ(coordinator->tracks().selectedAudio, 0);
    ASSERT_FALSE(backend->selectedAudio.empty());
    EXPECT_EQ(backend->selectedAudio.back(), 100);

    coordinator->play();
    coordinator->selectAudioTrack(1);
    EXPECT_EQ(backend->selectedAudio.back(), 200);
    EXPECT_FALSE(backend->isPlaying());
    scheduler.advance(0.1);
    EXPECT_TRUE(backend->isPlaying());

    coordinator->selectAudioTrack(7);
    EXPECT_EQ(coordinator->tracks().selectedAudio, 1);
}

TEST_F(PlaybackCoordinatorTest, SubtitleSelectionCanBeTurnedOff)
{
    factory.configs[BackendKind::Primary].subtitleTracks = {{3, "English", std::nullopt, 0, 0}};
    auto* backend = loadReady();
    EXPECT_FALSE(coordinator->tracks().selectedSubtitle.has_value());

    coordinator->selectSubtitleTrack(0);
    EXPECT_EQ(backend->selectedSubtitle, 3);
    coordinator->selectSubtitleTrack(std::nullopt);
    EXPECT_FALSE(backend->selectedSubtitle.has_value());
}

TEST_F(PlaybackCoordinatorTest, ScreenshotStatusClearsAfterDelay)
{
    loadReady(source(metadata("h264", {2})));
    coordinator->seekTo(3.5);
    EXPECT_TRUE(coordinator->captureScreenshot());
    ASSERT_EQ(exporter.requests.size(), 1u);
    const auto& request = exporter.requests.front();
    EXPECT_EQ(request.kind, media::ExportRequest::Kind::Screenshot);
    EXPECT_DOUBLE_EQ(request.time, 3.5);
    ASSERT_TRUE(request.videoStream.has_value());
    EXPECT_TRUE(coordinator->state().exportStatus.savingScreenshot);
    EXPECT_FALSE(coordinator->captureScreenshot());

    exporter.complete(true);
    EXPECT_FALSE(coordinator->state().exportStatus.savingScreenshot);
    EXPECT_TRUE(coordinator->state().exportStatus.screenshotDone);
    scheduler.advance(2.0);
    EXPECT_FALSE(coordinator->state().exportStatus.screenshotDone);
}

TEST_F(PlaybackCoordinatorTest, TrimExportFailureOnlyUpdatesStatus)
{
    loadReady();
    coordinator->seekTo(2.0);
    coordinator->setTrimIn();
    coordinator->seekTo(6.0);
    coordinator->setTrimOut();
    coordinator->trigger(PlaybackCoordinator::Command::ExportTrim);
    ASSERT_EQ(exporter.requests.size(), 1u);
    EXPECT_DOUBLE_EQ(exporter.requests.front().inPoint, 2.0);
    EXPECT_DOUBLE_EQ(exporter.requests.front().outPoint, 6.0);
    EXPECT_EQ(exporter.requests.front().outputPath, "/media/clip_trimmed.mov");

    exporter.complete(false, "Invalid argument");
    const auto& status = coordinator->state().exportStatus;
    EXPECT_FALSE(status.exportingTrim);
    EXPECT_FALSE(status.trimExportDone);
    EXPECT_NE(status.message.find("Invalid argument"), std::string::npos);
    EXPECT_EQ(coordinator->state().phase, Phase::Ready);
}

TEST_F(PlaybackCoordinatorTest, TimecodeDisplayCyclesAndPersistsAcrossLoads)
{
    loadReady();
    coordinator->trigger(PlaybackCoordinator::Command::CycleTimecodeDisplay);
    EXPECT_EQ(coordinator->state().timecodeMode, playback::TimecodeMode::Frames);

    auto meta = metadata("h264", {2});
    meta.timecode = "01:00:00:00";
    loadReady(source(meta));
    EXPECT_EQ(coordinator->state().timecodeMode, playback::TimecodeMode::Frames);
    coordinator->cycleTimecodeDisplay();
    coordinator->cycleTimecodeDisplay();
    EXPECT_EQ(coordinator->state().timecodeMode, playback::TimecodeMode::Source);
    EXPECT_EQ(lastSnapshot.sourceTimecode, "01:00:00:00");
}

TEST_F(PlaybackCoordinatorTest, PublishTickFollowsBackendTime)
{
    auto* backend = loadReady();
    coordinator->play();
    int before = published;
    backend->setTime(7.25);
    scheduler.advance(0.05);
    EXPECT_DOUBLE_EQ(coordinator->state().currentTime, 7.25);
    EXPECT_GT(published, before);

    // 时间未变化时不重复推送
    before = published;
    scheduler.advance(0.2);
    EXPECT_EQ(published, before);
}

TEST_F(PlaybackCoordinatorTest, UnloadTearsDownBackend)
{
    loadReady();
    coordinator->unload();
    EXPECT_EQ(coordinator->activeBackend(), BackendKind::None);
    EXPECT_EQ(coordinator->state().phase, Phase::Idle);
    EXPECT_TRUE(lastSnapshot.sourceId.empty());
    EXPECT_EQ(scheduler.activeCount(), 0u);
}

TEST_F(PlaybackCoordinatorTest, VolumeAndMuteCarryAcrossFallback)
{
    auto* primary = loadReady();
    coordinator->setVolume(35.0);
    coordinator->setMuted(true);
    EXPECT_DOUBLE_EQ(primary->volume.value_or(-1.0), 35.0);
    EXPECT_TRUE(primary->muted.value_or(false));

    primary->postFailure(BackendEvent::FailureKind::Recoverable);
    drain();
    auto* universal = factory.latest;
    ASSERT_EQ(universal->kind(), BackendKind::Universal);
    universal->post(BackendEvent::Type::Ready);
    drain();

    EXPECT_DOUBLE_EQ(universal->volume.value_or(-1.0), 35.0);
    EXPECT_TRUE(universal->muted.value_or(false));
    EXPECT_DOUBLE_EQ(lastSnapshot.state.volume, 35.0);
    EXPECT_TRUE(lastSnapshot.state.muted);
}

TEST_F(PlaybackCoordinatorTest, VolumeIsClampedAndKeptAcrossLoads)
{
    loadReady();
    coordinator->setVolume(250.0);
    EXPECT_DOUBLE_EQ(coordinator->state().volume, 100.0);
    coordinator->setVolume(-5.0);
    EXPECT_DOUBLE_EQ(coordinator->state().volume, 0.0);
    coordinator->setVolume(60.0);
    coordinator->toggleMute();

    auto* next = loadReady();
    EXPECT_DOUBLE_EQ(coordinator->state().volume, 60.0);
    EXPECT_TRUE(coordinator->state().muted);
    EXPECT_DOUBLE_EQ(next->volume.value_or(-1.0), 60.0);
    EXPECT_TRUE(next->muted.value_or(false));

    coordinator->toggleMute();
    EXPECT_FALSE(next->muted.value_or(true));
}

TEST_F(PlaybackCoordinatorTest, FallbackDuringReverseRestoresForwardRate)
{
    loadReady();
    coordinator->reverse();
    coordinator->reverse();
    EXPECT_DOUBLE_EQ(coordinator->state().displayedRate, -2.0);

    coordinator->updateMetadata("clip-1", metadata("h264", {6}));
    EXPECT_EQ(coordinator->activeBackend(), BackendKind::Universal);
    EXPECT_FALSE(lastSnapshot.state.reverseSimulating);
    EXPECT_DOUBLE_EQ(lastSnapshot.state.displayedRate, 1.0);

    factory.latest->post(BackendEvent::Type::Ready);
    drain();
    EXPECT_EQ(coordinator->state().phase, Phase::Ready);
    EXPECT_FALSE(lastSnapshot.state.reverseSimulating);
    EXPECT_DOUBLE_EQ(lastSnapshot.state.displayedRate, 1.0);
}

TEST_F(PlaybackCoordinatorTest, TerminalFailureDuringReverseRestoresForwardRate)
{
    auto* backend = loadReady();
    coordinator->reverse();
    coordinator->reverse();

    backend->postFailure(BackendEvent::FailureKind::Terminal, "stream lost");
    drain();

    EXPECT_EQ(coordinator->state().phase, Phase::Failed);
    EXPECT_FALSE(lastSnapshot.state.reverseSimulating);
    EXPECT_DOUBLE_EQ(lastSnapshot.state.displayedRate, 1.0);
    EXPECT_EQ(scheduler.activeCount(), 0u);
}

TEST_F(PlaybackCoordinatorTest, SupersedingLoadIgnoresAbandonedReady)
{
    coordinator->loadMedia(source());
    auto* abandonedSink = factory.lastSink;
    const int abandonedSerial = factory.latest->serial();

    auto next = source(metadata("h264", {6}));
    next.id = "clip-2";
    next.path = "/media/other.mkv";
    coordinator->loadMedia(std::move(next));
    ASSERT_EQ(coordinator->activeBackend(), BackendKind::Universal);

    BackendEvent ready;
    ready.type = BackendEvent::Type::Ready;
    ready.serial = abandonedSerial;
    abandonedSink->post(std::move(ready));
    drain();

    EXPECT_EQ(coordinator->state().phase, Phase::Preparing);
    EXPECT_EQ(scheduler.activeCount(), 0u);
    EXPECT_EQ(factory.count(BackendKind::Primary), 1);
    EXPECT_EQ(factory.count(BackendKind::Universal), 1);
}
