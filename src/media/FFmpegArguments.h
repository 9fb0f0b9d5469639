#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ExportRunner.h"

namespace media {

namespace ffmpeg_args {
// 不在 ffmpeg 可接受列表中的值返回空
std::optional<std::string> normalizeColorPrimaries(const std::string& value);
std::optional<std::string> normalizeColorTransfer(const std::string& value);
std::optional<std::string> normalizeColorSpace(const std::string& value);
std::optional<std::string> normalizeColorRange(const std::string& value);

void appendColorArguments(const MediaMetadata::VideoStream& stream, std::vector<std::string>& arguments);

std::vector<std::string> buildScreenshotArguments(const ExportRequest& request);
std::vector<std::string> buildTrimArguments(const ExportRequest& request);
std::vector<std::string> buildArguments(const ExportRequest& request);
} // namespace ffmpeg_args

} // namespace media
