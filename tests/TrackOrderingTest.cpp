#include <gtest/gtest.h>
#include "playback/TrackOrdering.h"

using media::MediaMetadata;
using media::NativeTrack;
using playback::TrackCatalog;
using playback::TrackOrderingEngine;

namespace {
MediaMetadata::AudioStream stream(int index, int channels, bool isDefault, std::string language = {})
{
    MediaMetadata::AudioStream s;
    s.index = index;
    s.channels = channels;
    s.isDefault = isDefault;
    s.language = std::move(language);
    s.codec = "aac";
    s.sampleRate = 48000;
    return s;
}

NativeTrack native(int id, std::optional<int> sourceIndex, std::string name = {})
{
    NativeTrack t;
    t.nativeId = id;
    t.sourceIndex = sourceIndex;
    t.name = std::move(name);
    return t;
}
} // namespace

TEST(TrackOrdering, DefaultThenChannelsThenDeclarationOrder)
{
    std::vector<MediaMetadata::AudioStream> streams{
        stream(1, 2, false),
        stream(2, 6, false),
        stream(3, 2, true),
        stream(4, 6, false),
        stream(5, 2, false),
    };
    auto order = TrackOrderingEngine::orderAudioStreams(streams);
    EXPECT_EQ(order, (std::vector<size_t>{2, 1, 3, 0, 4}));
}

TEST(TrackOrdering, MapsPositionsToNativeIdsBySourceIndex)
{
    MediaMetadata metadata;
    metadata.audioStreams = {stream(1, 2, false, "eng"), stream(2, 6, true, "nor")};
    // 引擎的顺序与容器声明顺序无关
    std::vector<NativeTrack> tracks{native(7, 2), native(3, 1)};

    auto entries = TrackOrderingEngine::buildAudioEntries(&metadata, tracks);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].position, 0);
    EXPECT_EQ(entries[0].streamIndex, 2);
    EXPECT_EQ(entries[0].nativeId, 7);
    EXPECT_EQ(entries[1].streamIndex, 1);
    EXPECT_EQ(entries[1].nativeId, 3);
    EXPECT_EQ(entries[0].title, "#2 – nor – aac");
    EXPECT_EQ(entries[0].detail, "Default • 6 ch • 48000 Hz • aac");
}

TEST(TrackOrdering, FallsBackToDeclarationOrdinalWithoutSourceIndex)
{
    MediaMetadata metadata;
    metadata.audioStreams = {stream(1, 2, false), stream(2, 6, false)};
    std::vector<NativeTrack> tracks{native(10, std::nullopt), native(11, std::nullopt)};

    auto entries = TrackOrderingEngine::buildAudioEntries(&metadata, tracks);
    ASSERT_EQ(entries.size(), 2u);
    // 6 声道排在前面，但仍对应第二个引擎轨道
    EXPECT_EQ(entries[0].nativeId, 11);
    EXPECT_EQ(entries[1].nativeId, 10);
}

TEST(TrackOrdering, AppendsUnclaimedNativeTracks)
{
    MediaMetadata metadata;
    metadata.audioStreams = {stream(1, 2, true)};
    std::vector<NativeTrack> tracks{native(1, 1), native(2, 9, "#1 • Commentary")};

    auto entries = TrackOrderingEngine::buildAudioEntries(&metadata, tracks);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].position, 1);
    EXPECT_EQ(entries[1].nativeId, 2);
    EXPECT_EQ(entries[1].title, "#1 • Commentary");
}

TEST(TrackOrdering, WithoutMetadataUsesEngineOrder)
{
    std::vector<NativeTrack> tracks{native(4, std::nullopt), native(5, std::nullopt, "Director")};
    auto entries = TrackOrderingEngine::buildAudioEntries(nullptr, tracks);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].title, "Audio Track 1");
    EXPECT_EQ(entries[1].title, "Director");
}

TEST(TrackOrdering, MetadataWithoutEngineTracksHasNoNativeIds)
{
    MediaMetadata metadata;
    metadata.audioStreams = {stream(1, 2, false)};
    auto entries = TrackOrderingEngine::buildAudioEntries(&metadata, {});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_FALSE(entries[0].nativeId.has_value());
}

TEST(TrackOrdering, SelectionIsClampedIntoCatalog)
{
    EXPECT_EQ(TrackOrderingEngine::clampAudioSelection(std::nullopt, 3), 0);
    EXPECT_EQ(TrackOrderingEngine::clampAudioSelection(5, 3), 2);
    EXPECT_EQ(TrackOrderingEngine::clampAudioSelection(1, 3), 1);
    EXPECT_FALSE(TrackOrderingEngine::clampAudioSelection(1, 0).has_value());

    EXPECT_FALSE(TrackOrderingEngine::clampSubtitleSelection(std::nullopt, 3).has_value());
    EXPECT_EQ(TrackOrderingEngine::clampSubtitleSelection(4, 2), 1);
    EXPECT_FALSE(TrackOrderingEngine::clampSubtitleSelection(0, 0).has_value());
}

TEST(TrackOrdering, RebuildKeepsSelectedPosition)
{
    TrackCatalog previous;
    previous.selectedAudio = 2;
    previous.selectedSubtitle = 0;

    std::vector<NativeTrack> audio{native(1, std::nullopt), native(2, std::nullopt), native(3, std::nullopt)};
    std::vector<NativeTrack> subtitles{native(20, std::nullopt)};
    auto catalog = TrackOrderingEngine::rebuild(previous, nullptr, audio, subtitles);
    EXPECT_EQ(catalog.selectedAudio, 2);
    EXPECT_EQ(catalog.selectedSubtitle, 0);
    EXPECT_EQ(catalog.subtitles[0].title, "Subtitle 1");

    audio.pop_back();
    catalog = TrackOrderingEngine::rebuild(catalog, nullptr, audio, {});
    EXPECT_EQ(catalog.selectedAudio, 1);
    EXPECT_FALSE(catalog.selectedSubtitle.has_value());
}
