#pragma once
#include <functional>
#include <optional>
#include <string>
#include "MediaInfo.h"

namespace media {

enum class ScreenshotFormat {
    Png,
    Jpeg,
    Jxl
};

const char* screenshotExtension(ScreenshotFormat format);
std::optional<ScreenshotFormat> screenshotFormatFromName(const std::string& name);

struct ExportRequest {
    enum class Kind {
        Screenshot,
        Trim
    };
    Kind kind{Kind::Screenshot};
    std::string sourcePath;
    std::string outputPath;
    double time{0.0};     // 截图时间
    double inPoint{0.0};  // 裁剪区间
    double outPoint{0.0};
    ScreenshotFormat format{ScreenshotFormat::Png};
    std::optional<MediaMetadata::VideoStream> videoStream; // 像素格式与色彩信息
};

struct ExportResult {
    bool success{false};
    std::string outputPath;
    std::string message;
};

// 外部导出工具，完成回调必须在调用方线程执行
class ExportRunner {
public:
    using Completion = std::function<void(const ExportResult&)>;

    virtual ~ExportRunner() = default;
    virtual void run(const ExportRequest& request, Completion completion) = 0;
};

// <base>_<timestamp>_t<秒>.<ext>
std::string screenshotOutputPath(const std::string& sourcePath, const std::string& directory, double time,
                                 ScreenshotFormat format, const std::string& timestamp);
// <base>_trimmed.<ext>
std::string trimOutputPath(const std::string& sourcePath, const std::string& directory);

} // namespace media
