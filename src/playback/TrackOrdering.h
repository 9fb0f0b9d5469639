#pragma once
#include <optional>
#include <string>
#include <vector>
#include "media/BackendAdapter.h"
#include "media/MediaInfo.h"

namespace playback {

struct AudioTrackEntry {
    int position{0};
    std::optional<int> nativeId;
    std::optional<int> streamIndex;
    std::string title;
    std::string detail;
    int channels{0};
    int sampleRate{0};
};

struct SubtitleTrackEntry {
    int position{0};
    int nativeId{-1};
    std::string title;
};

struct TrackCatalog {
    std::vector<AudioTrackEntry> audio;
    std::vector<SubtitleTrackEntry> subtitles;
    std::optional<int> selectedAudio;
    std::optional<int> selectedSubtitle; // 为空表示关闭字幕
};

class TrackOrderingEngine {
public:
    // 返回声明序号的展示顺序：默认流优先，声道数降序，原始顺序升序
    static std::vector<size_t> orderAudioStreams(const std::vector<media::MediaMetadata::AudioStream>& streams);

    static std::vector<AudioTrackEntry> buildAudioEntries(const media::MediaMetadata* metadata,
                                                          const std::vector<media::NativeTrack>& nativeTracks);
    static std::vector<SubtitleTrackEntry> buildSubtitleEntries(const std::vector<media::NativeTrack>& nativeTracks);

    static std::optional<int> clampAudioSelection(std::optional<int> previous, size_t count);
    static std::optional<int> clampSubtitleSelection(std::optional<int> previous, size_t count);

    // 重建目录并保留之前选择的位置
    static TrackCatalog rebuild(const TrackCatalog& previous, const media::MediaMetadata* metadata,
                                const std::vector<media::NativeTrack>& audioTracks,
                                const std::vector<media::NativeTrack>& subtitleTracks);

    static std::string formatAudioTitle(const media::MediaMetadata::AudioStream& stream, int position);
    static std::string formatAudioDetail(const media::MediaMetadata::AudioStream& stream);
};

} // namespace playback
