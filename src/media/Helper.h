#pragma once
#include <string>

namespace media {
std::string getFFmpegErrorString(int errNum);

std::string getAVCodecIDString(int codecId);

std::string getAVPixelFormatString(int pixFmt);

// FFmpeg 的 "unknown" / "unspecified" 等统一视为空
std::string avNameOrEmpty(const char* name);
} // namespace media
