#include "ExportRunner.h"
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace media {

const char* screenshotExtension(ScreenshotFormat format)
{
    switch (format) {
    case ScreenshotFormat::Png:
        return "png";
    case ScreenshotFormat::Jpeg:
        return "jpg";
    case ScreenshotFormat::Jxl:
        return "jxl";
    }
    return "png";
}

std::optional<ScreenshotFormat> screenshotFormatFromName(const std::string& name)
{
    if (name == "png") {
        return ScreenshotFormat::Png;
    }
    if (name == "jpeg" || name == "jpg") {
        return ScreenshotFormat::Jpeg;
    }
    if (name == "jxl") {
        return ScreenshotFormat::Jxl;
    }
    return std::nullopt;
}

std::string screenshotOutputPath(const std::string& sourcePath, const std::string& directory, double time,
                                 ScreenshotFormat format, const std::string& timestamp)
{
    fs::path source(sourcePath);
    fs::path dir = directory.empty() ? source.parent_path() : fs::path(directory);
    std::string name = std::format("{}_{}_t{:.3f}.{}", source.stem().string(), timestamp, time, screenshotExtension(format));
    return (dir / name).string();
}

std::string trimOutputPath(const std::string& sourcePath, const std::string& directory)
{
    fs::path source(sourcePath);
    fs::path dir = directory.empty() ? source.parent_path() : fs::path(directory);
    return (dir / (source.stem().string() + "_trimmed" + source.extension().string())).string();
}

} // namespace media
