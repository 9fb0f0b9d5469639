#include "MetadataProbe.h"
#include <cmath>
#include <memory>
#include <logger.h>
#include "Helper.h"
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/pixdesc.h>
#include <libavutil/rational.h>
}

namespace media {
namespace {
struct FormatContextCloser {
    void operator()(AVFormatContext* ctx) const
    {
        if (ctx) {
            avformat_close_input(&ctx);
        }
    }
};
using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;

std::string dictValue(const AVDictionary* dict, const char* key)
{
    const AVDictionaryEntry* entry = av_dict_get(dict, key, nullptr, 0);
    return entry && entry->value ? std::string(entry->value) : std::string();
}

Rational toRational(AVRational value)
{
    return {value.num, value.den};
}

std::string codecLongName(AVCodecID codecId)
{
    const AVCodecDescriptor* desc = avcodec_descriptor_get(codecId);
    return desc && desc->long_name ? std::string(desc->long_name) : std::string();
}

std::string fieldOrderName(AVFieldOrder order)
{
    switch (order) {
    case AV_FIELD_PROGRESSIVE:
        return "progressive";
    case AV_FIELD_TT:
        return "tt";
    case AV_FIELD_BB:
        return "bb";
    case AV_FIELD_TB:
        return "tb";
    case AV_FIELD_BT:
        return "bt";
    default:
        return {};
    }
}

MediaMetadata::VideoStream readVideoStream(AVFormatContext* fmtCtx, AVStream* stream)
{
    const AVCodecParameters* par = stream->codecpar;
    MediaMetadata::VideoStream video;
    video.index = stream->index;
    video.codec = getAVCodecIDString(par->codec_id);
    video.codecLongName = codecLongName(par->codec_id);
    if (const char* profile = avcodec_profile_name(par->codec_id, par->profile)) {
        video.profile = profile;
    }
    video.width = par->width;
    video.height = par->height;

    auto pixFmt = static_cast<AVPixelFormat>(par->format);
    video.pixelFormat = getAVPixelFormatString(pixFmt);
    if (const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(pixFmt)) {
        video.bitDepth = desc->comp[0].depth;
        video.hasAlpha = (desc->flags & AV_PIX_FMT_FLAG_ALPHA) != 0;
    }

    AVRational sar = av_guess_sample_aspect_ratio(fmtCtx, stream, nullptr);
    video.sampleAspectRatio = toRational(sar);
    if (par->width > 0 && par->height > 0) {
        AVRational dar{0, 1};
        int64_t sarNum = sar.num > 0 ? sar.num : 1;
        int64_t sarDen = sar.den > 0 ? sar.den : 1;
        av_reduce(&dar.num, &dar.den, par->width * sarNum, par->height * sarDen, 1024 * 1024);
        video.displayAspectRatio = toRational(dar);
    }

    AVRational fps = stream->avg_frame_rate;
    if (fps.num <= 0 || fps.den <= 0) {
        fps = stream->r_frame_rate;
    }
    if (fps.num > 0 && fps.den > 0) {
        video.frameRate = toRational(fps);
    }

    video.colorPrimaries = avNameOrEmpty(av_color_primaries_name(par->color_primaries));
    video.colorTransfer = avNameOrEmpty(av_color_transfer_name(par->color_trc));
    video.colorSpace = avNameOrEmpty(av_color_space_name(par->color_space));
    video.colorRange = avNameOrEmpty(av_color_range_name(par->color_range));
    video.fieldOrder = fieldOrderName(par->field_order);
    return video;
}

MediaMetadata::AudioStream readAudioStream(AVStream* stream)
{
    const AVCodecParameters* par = stream->codecpar;
    MediaMetadata::AudioStream audio;
    audio.index = stream->index;
    audio.language = dictValue(stream->metadata, "language");
    audio.title = dictValue(stream->metadata, "title");
    audio.codec = getAVCodecIDString(par->codec_id);
    audio.codecLongName = codecLongName(par->codec_id);
    audio.sampleRate = par->sample_rate;
    audio.channels = par->ch_layout.nb_channels;
    char layout[128] = {0};
    if (av_channel_layout_describe(&par->ch_layout, layout, sizeof(layout)) > 0) {
        audio.channelLayout = layout;
    }
    audio.bitRate = par->bit_rate;
    audio.isDefault = (stream->disposition & AV_DISPOSITION_DEFAULT) != 0;
    return audio;
}

MediaMetadata::SubtitleStream readSubtitleStream(AVStream* stream)
{
    MediaMetadata::SubtitleStream subtitle;
    subtitle.index = stream->index;
    subtitle.language = dictValue(stream->metadata, "language");
    subtitle.title = dictValue(stream->metadata, "title");
    subtitle.codec = getAVCodecIDString(stream->codecpar->codec_id);
    subtitle.isDefault = (stream->disposition & AV_DISPOSITION_DEFAULT) != 0;
    subtitle.isForced = (stream->disposition & AV_DISPOSITION_FORCED) != 0;
    return subtitle;
}

double containerDuration(AVFormatContext* fmtCtx)
{
    if (fmtCtx->duration != AV_NOPTS_VALUE && fmtCtx->duration > 0) {
        return static_cast<double>(fmtCtx->duration) / AV_TIME_BASE;
    }
    double maxDur = 0.0;
    for (unsigned int i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* st = fmtCtx->streams[i];
        if (st && st->duration != AV_NOPTS_VALUE && st->duration > 0) {
            const double d = static_cast<double>(st->duration) * av_q2d(st->time_base);
            if (d > maxDur) maxDur = d;
        }
    }
    return maxDur;
}
} // namespace

auto MetadataProbe::probe(const std::string& path) -> std::expected<MediaMetadata, std::string>
{
    NEAPU_FUNC_TRACE;
    AVFormatContext* rawCtx = nullptr;
    int ret = avformat_open_input(&rawCtx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        std::string errStr = getFFmpegErrorString(ret);
        NEAPU_LOGE("Failed to open input file {}: {}", path, errStr);
        return std::unexpected("Failed to open input file: " + errStr);
    }
    FormatContextPtr fmtCtx(rawCtx);

    ret = avformat_find_stream_info(fmtCtx.get(), nullptr);
    if (ret < 0) {
        std::string errStr = getFFmpegErrorString(ret);
        NEAPU_LOGE("Failed to find stream info for file {}: {}", path, errStr);
        return std::unexpected("Failed to find stream info: " + errStr);
    }

    MediaMetadata metadata;
    metadata.duration = containerDuration(fmtCtx.get());
    if (fmtCtx->iformat) {
        metadata.formatName = fmtCtx->iformat->name ? fmtCtx->iformat->name : "";
        metadata.formatLongName = fmtCtx->iformat->long_name ? fmtCtx->iformat->long_name : "";
    }
    if (fmtCtx->pb) {
        int64_t size = avio_size(fmtCtx->pb);
        metadata.sizeBytes = size > 0 ? size : 0;
    }
    metadata.bitRate = fmtCtx->bit_rate;

    std::string timecode = dictValue(fmtCtx->metadata, "timecode");
    for (unsigned int i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        if (timecode.empty()) {
            // tmcd 数据流也可能携带
            timecode = dictValue(stream->metadata, "timecode");
        }
        switch (stream->codecpar->codec_type) {
        case AVMEDIA_TYPE_VIDEO:
            if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) {
                continue;
            }
            metadata.videoStreams.push_back(readVideoStream(fmtCtx.get(), stream));
            if (metadata.frameCount == 0 && stream->nb_frames > 0) {
                metadata.frameCount = stream->nb_frames;
            }
            break;
        case AVMEDIA_TYPE_AUDIO:
            metadata.audioStreams.push_back(readAudioStream(stream));
            break;
        case AVMEDIA_TYPE_SUBTITLE:
            metadata.subtitleStreams.push_back(readSubtitleStream(stream));
            break;
        default:
            break;
        }
    }
    if (!timecode.empty()) {
        metadata.timecode = timecode;
    }
    if (metadata.frameCount == 0) {
        if (auto fps = metadata.frameRate()) {
            metadata.frameCount = std::llround(metadata.duration * *fps);
        }
    }

    if (metadata.videoStreams.empty() && metadata.audioStreams.empty()) {
        NEAPU_LOGE("No video or audio streams found in file {}", path);
        return std::unexpected(std::string("No video or audio streams found"));
    }

    NEAPU_LOGI("Probed {}: format={}, duration={:.3f}s, video={}, audio={}, subtitles={}", path,
               metadata.formatName, metadata.duration, metadata.videoStreams.size(), metadata.audioStreams.size(),
               metadata.subtitleStreams.size());
    return metadata;
}

} // namespace media
