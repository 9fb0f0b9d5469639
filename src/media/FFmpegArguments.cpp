#include "FFmpegArguments.h"
#include <algorithm>
#include <cctype>
#include <format>
#include <initializer_list>
#include <utility>

namespace media::ffmpeg_args {
namespace {
std::string lowerTrimmed(const std::string& value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    std::string result = value.substr(begin, end - begin + 1);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool isMissing(const std::string& value)
{
    return value.empty() || value == "unknown" || value == "unspecified" || value == "na";
}

std::optional<std::string> normalize(const std::string& value, std::initializer_list<const char*> allowed,
                                     std::initializer_list<std::pair<const char*, const char*>> mapping)
{
    std::string raw = lowerTrimmed(value);
    if (isMissing(raw)) {
        return std::nullopt;
    }
    for (const auto& [from, to] : mapping) {
        if (raw == from) {
            return std::string(to);
        }
    }
    for (const char* name : allowed) {
        if (raw == name) {
            return raw;
        }
    }
    return std::nullopt;
}

std::string secondsArgument(double seconds)
{
    return std::format("{}", std::max(0.0, seconds));
}

std::string screenshotPixelFormat(const ExportRequest& request)
{
    int bitDepth = 8;
    bool hasAlpha = false;
    if (request.videoStream) {
        bitDepth = request.videoStream->bitDepth > 0 ? request.videoStream->bitDepth : 8;
        hasAlpha = request.videoStream->hasAlpha;
    }
    if (request.format == ScreenshotFormat::Jxl) {
        if (bitDepth > 8) {
            return hasAlpha ? "rgba64le" : "rgb48le";
        }
        return hasAlpha ? "rgba" : "rgb24";
    }
    if (bitDepth > 8) {
        return hasAlpha ? "rgba64be" : "rgb48be";
    }
    return hasAlpha ? "rgba" : "rgb24";
}
} // namespace

std::optional<std::string> normalizeColorPrimaries(const std::string& value)
{
    return normalize(value, {"bt709", "bt470bg", "smpte170m", "smpte240m", "bt2020", "smpte432", "smpte432-1"},
                     {{"bt2020-10", "bt2020"}, {"bt2020-12", "bt2020"}});
}
std::optional<std::string> normalizeColorTransfer(const std::string& value)
{
    return normalize(value,
                     {"bt709", "smpte2084", "arib-std-b67", "iec61966-2-4", "bt470bg", "smpte170m", "bt2020-10",
                      "bt2020-12"},
                     {});
}
std::optional<std::string> normalizeColorSpace(const std::string& value)
{
    return normalize(value, {"bt709", "smpte170m", "smpte240m", "bt2020nc", "bt2020c", "bt2020ncl"},
                     {{"bt2020", "bt2020nc"}, {"bt2020-ncl", "bt2020nc"}, {"bt2020-cl", "bt2020c"}});
}
std::optional<std::string> normalizeColorRange(const std::string& value)
{
    return normalize(value, {"tv", "pc"}, {{"limited", "tv"}, {"full", "pc"}});
}

void appendColorArguments(const MediaMetadata::VideoStream& stream, std::vector<std::string>& arguments)
{
    if (auto value = normalizeColorPrimaries(stream.colorPrimaries)) {
        arguments.insert(arguments.end(), {"-color_primaries", *value});
    }
    if (auto value = normalizeColorTransfer(stream.colorTransfer)) {
        arguments.insert(arguments.end(), {"-color_trc", *value});
    }
    if (auto value = normalizeColorSpace(stream.colorSpace)) {
        arguments.insert(arguments.end(), {"-colorspace", *value});
    }
    if (auto value = normalizeColorRange(stream.colorRange)) {
        arguments.insert(arguments.end(), {"-color_range", *value});
    }
}

std::vector<std::string> buildScreenshotArguments(const ExportRequest& request)
{
    std::vector<std::string> arguments{
        "-hide_banner", "-loglevel", "error",
        "-ss", secondsArgument(request.time),
        "-i", request.sourcePath,
        "-frames:v", "1",
        "-vf", "scale=iw*sar:ih",
    };
    switch (request.format) {
    case ScreenshotFormat::Jxl:
        arguments.insert(arguments.end(),
                         {"-pix_fmt", screenshotPixelFormat(request), "-c:v", "libjxl", "-distance", "0.5", "-effort", "7"});
        break;
    case ScreenshotFormat::Png:
        arguments.insert(arguments.end(), {"-pix_fmt", screenshotPixelFormat(request), "-c:v", "png"});
        break;
    case ScreenshotFormat::Jpeg:
        arguments.insert(arguments.end(), {"-pix_fmt", "yuvj444p", "-c:v", "mjpeg", "-q:v", "2"});
        break;
    }
    if (request.videoStream) {
        appendColorArguments(*request.videoStream, arguments);
    }
    arguments.insert(arguments.end(), {"-y", request.outputPath});
    return arguments;
}

std::vector<std::string> buildTrimArguments(const ExportRequest& request)
{
    return {
        "-hide_banner", "-loglevel", "error",
        "-ss", secondsArgument(request.inPoint),
        "-i", request.sourcePath,
        "-t", secondsArgument(request.outPoint - request.inPoint),
        "-c", "copy",
        "-avoid_negative_ts", "make_zero",
        "-y", request.outputPath,
    };
}

std::vector<std::string> buildArguments(const ExportRequest& request)
{
    return request.kind == ExportRequest::Kind::Screenshot ? buildScreenshotArguments(request)
                                                           : buildTrimArguments(request);
}

} // namespace media::ffmpeg_args
