#pragma once
#include <QString>
#include "Timecode.h"
#include "media/ExportRunner.h"

namespace playback {

struct PlayerSettings {
    QString ffmpegPath;        // 为空时从 PATH 查找
    media::ScreenshotFormat screenshotFormat{media::ScreenshotFormat::Png};
    QString screenshotDirectory; // 为空时保存在源文件旁
    QString trimDirectory;
    TimecodeMode timecodeMode{TimecodeMode::Relative};
    bool preferPrimary{true};
    QString mpvHwdec{"auto-safe"};
    QString mpvVo{"gpu"};
    QString logDirectory{"logs"};

    static PlayerSettings load(const QString& fileName);
};

} // namespace playback
