#include "TrackOrdering.h"
#include <algorithm>
#include <numeric>

namespace playback {
namespace {
std::string join(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) {
            result += separator;
        }
        result += part;
    }
    return result;
}

std::string nativeDetail(const media::NativeTrack& track)
{
    std::vector<std::string> details;
    if (track.channels > 0) {
        details.push_back(std::to_string(track.channels) + " ch");
    }
    if (track.sampleRate > 0) {
        details.push_back(std::to_string(track.sampleRate) + " Hz");
    }
    return join(details, " • ");
}
} // namespace

std::vector<size_t> TrackOrderingEngine::orderAudioStreams(const std::vector<media::MediaMetadata::AudioStream>& streams)
{
    std::vector<size_t> order(streams.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&streams](size_t lhs, size_t rhs) {
        const auto& a = streams[lhs];
        const auto& b = streams[rhs];
        if (a.isDefault != b.isDefault) {
            return a.isDefault;
        }
        if (a.channels != b.channels) {
            return a.channels > b.channels;
        }
        return lhs < rhs;
    });
    return order;
}

std::vector<AudioTrackEntry> TrackOrderingEngine::buildAudioEntries(const media::MediaMetadata* metadata,
                                                                    const std::vector<media::NativeTrack>& nativeTracks)
{
    std::vector<AudioTrackEntry> entries;
    std::vector<bool> claimed(nativeTracks.size(), false);

    if (metadata && !metadata->audioStreams.empty()) {
        const auto& streams = metadata->audioStreams;
        auto order = orderAudioStreams(streams);
        std::vector<std::optional<size_t>> mapping(order.size());

        // 先按容器流序号匹配，再按声明顺序补齐
        for (size_t pos = 0; pos < order.size(); ++pos) {
            const auto& stream = streams[order[pos]];
            if (stream.index < 0) {
                continue;
            }
            for (size_t i = 0; i < nativeTracks.size(); ++i) {
                if (!claimed[i] && nativeTracks[i].sourceIndex && *nativeTracks[i].sourceIndex == stream.index) {
                    mapping[pos] = i;
                    claimed[i] = true;
                    break;
                }
            }
        }
        for (size_t pos = 0; pos < order.size(); ++pos) {
            size_t ordinal = order[pos];
            if (!mapping[pos] && ordinal < nativeTracks.size() && !claimed[ordinal]) {
                mapping[pos] = ordinal;
                claimed[ordinal] = true;
            }
        }

        for (size_t pos = 0; pos < order.size(); ++pos) {
            const auto& stream = streams[order[pos]];
            AudioTrackEntry entry;
            entry.position = static_cast<int>(pos);
            entry.streamIndex = stream.index >= 0 ? std::optional<int>(stream.index) : std::nullopt;
            entry.channels = stream.channels;
            entry.sampleRate = stream.sampleRate;
            entry.title = formatAudioTitle(stream, entry.position);
            entry.detail = formatAudioDetail(stream);
            if (mapping[pos]) {
                const auto& native = nativeTracks[*mapping[pos]];
                entry.nativeId = native.nativeId;
                if (entry.title.empty()) {
                    entry.title = native.name;
                }
            }
            if (entry.title.empty()) {
                entry.title = "Audio Track " + std::to_string(pos + 1);
            }
            entries.push_back(std::move(entry));
        }
    }

    for (size_t i = 0; i < nativeTracks.size(); ++i) {
        if (claimed[i]) {
            continue;
        }
        const auto& native = nativeTracks[i];
        AudioTrackEntry entry;
        entry.position = static_cast<int>(entries.size());
        entry.nativeId = native.nativeId;
        entry.streamIndex = native.sourceIndex;
        entry.channels = native.channels;
        entry.sampleRate = native.sampleRate;
        entry.title = native.name.empty() ? "Audio Track " + std::to_string(entries.size() + 1) : native.name;
        entry.detail = nativeDetail(native);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<SubtitleTrackEntry> TrackOrderingEngine::buildSubtitleEntries(const std::vector<media::NativeTrack>& nativeTracks)
{
    std::vector<SubtitleTrackEntry> entries;
    for (const auto& native : nativeTracks) {
        SubtitleTrackEntry entry;
        entry.position = static_cast<int>(entries.size());
        entry.nativeId = native.nativeId;
        entry.title = native.name.empty() ? "Subtitle " + std::to_string(entries.size() + 1) : native.name;
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::optional<int> TrackOrderingEngine::clampAudioSelection(std::optional<int> previous, size_t count)
{
    if (count == 0) {
        return std::nullopt;
    }
    if (!previous) {
        return 0;
    }
    return std::clamp(*previous, 0, static_cast<int>(count) - 1);
}

std::optional<int> TrackOrderingEngine::clampSubtitleSelection(std::optional<int> previous, size_t count)
{
    if (count == 0 || !previous) {
        return std::nullopt;
    }
    return std::clamp(*previous, 0, static_cast<int>(count) - 1);
}

TrackCatalog TrackOrderingEngine::rebuild(const TrackCatalog& previous, const media::MediaMetadata* metadata,
                                          const std::vector<media::NativeTrack>& audioTracks,
                                          const std::vector<media::NativeTrack>& subtitleTracks)
{
    TrackCatalog catalog;
    catalog.audio = buildAudioEntries(metadata, audioTracks);
    catalog.subtitles = buildSubtitleEntries(subtitleTracks);
    catalog.selectedAudio = clampAudioSelection(previous.selectedAudio, catalog.audio.size());
    catalog.selectedSubtitle = clampSubtitleSelection(previous.selectedSubtitle, catalog.subtitles.size());
    return catalog;
}

std::string TrackOrderingEngine::formatAudioTitle(const media::MediaMetadata::AudioStream& stream, int position)
{
    std::vector<std::string> components;
    components.push_back("#" + std::to_string(stream.index >= 0 ? stream.index : position));
    if (!stream.language.empty()) {
        components.push_back(stream.language);
    }
    const std::string& codec = stream.codecLongName.empty() ? stream.codec : stream.codecLongName;
    if (!codec.empty()) {
        components.push_back(codec);
    }
    if (!stream.channelLayout.empty()) {
        components.push_back(stream.channelLayout);
    }
    return join(components, " – ");
}

std::string TrackOrderingEngine::formatAudioDetail(const media::MediaMetadata::AudioStream& stream)
{
    std::vector<std::string> details;
    if (stream.isDefault) {
        details.emplace_back("Default");
    }
    if (stream.channels > 0) {
        details.push_back(std::to_string(stream.channels) + " ch");
    }
    if (stream.sampleRate > 0) {
        details.push_back(std::to_string(stream.sampleRate) + " Hz");
    }
    const std::string& codec = stream.codecLongName.empty() ? stream.codec : stream.codecLongName;
    if (!codec.empty()) {
        details.push_back(codec);
    }
    return join(details, " • ");
}

} // namespace playback
