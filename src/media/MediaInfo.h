#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace media {

struct Rational {
    int64_t num{0};
    int64_t den{0};

    std::optional<double> value() const
    {
        if (den == 0) {
            return std::nullopt;
        }
        return static_cast<double>(num) / static_cast<double>(den);
    }
};

struct MediaMetadata {
    struct VideoStream {
        int index{-1};
        std::string codec;
        std::string codecLongName;
        std::string profile;
        int width{0};
        int height{0};
        std::string pixelFormat;
        bool hasAlpha{false};
        Rational sampleAspectRatio;
        Rational displayAspectRatio;
        Rational frameRate;
        int bitDepth{0};
        std::string colorPrimaries;
        std::string colorTransfer;
        std::string colorSpace;
        std::string colorRange;
        std::string fieldOrder;
    };

    struct AudioStream {
        int index{-1}; // 容器内的流序号
        std::string language;
        std::string title;
        std::string codec;
        std::string codecLongName;
        int sampleRate{0};
        int channels{0};
        std::string channelLayout;
        int64_t bitRate{0};
        bool isDefault{false};
    };

    struct SubtitleStream {
        int index{-1};
        std::string language;
        std::string title;
        std::string codec;
        bool isDefault{false};
        bool isForced{false};
    };

    double duration{0.0};
    std::string formatName;
    std::string formatLongName;
    int64_t sizeBytes{0};
    int64_t bitRate{0};
    std::optional<std::string> timecode;
    int64_t frameCount{0};

    std::vector<VideoStream> videoStreams;
    std::vector<AudioStream> audioStreams;
    std::vector<SubtitleStream> subtitleStreams;

    const VideoStream* primaryVideoStream() const { return videoStreams.empty() ? nullptr : &videoStreams.front(); }

    std::optional<double> frameRate() const
    {
        if (auto* video = primaryVideoStream()) {
            auto fps = video->frameRate.value();
            if (fps && *fps > 0.0) {
                return fps;
            }
        }
        return std::nullopt;
    }

    bool hasSurroundAudio() const
    {
        for (const auto& stream : audioStreams) {
            if (stream.channels > 2) {
                return true;
            }
        }
        return false;
    }

    // ProRes 系列（含 FourCC 写法）
    bool isProfessionalIntermediate() const;

    std::optional<double> displayAspectRatio() const;
};

struct MediaSource {
    std::string id;
    std::string path;
    std::string displayName;
    int64_t byteSize{0};
    double declaredDuration{0.0};
    bool hasVideo{true};
    std::optional<MediaMetadata> metadata;
};

} // namespace media
