#include "PlayerSettings.h"
#include <QSettings>
#include <logger.h>

namespace playback {
PlayerSettings PlayerSettings::load(const QString& fileName)
{
    PlayerSettings settings;
    QSettings ini(fileName, QSettings::IniFormat);
    if (ini.status() != QSettings::NoError) {
        NEAPU_LOGW("Failed to read settings {}, using defaults", fileName.toStdString());
        return settings;
    }

    settings.ffmpegPath = ini.value("export/ffmpegPath", settings.ffmpegPath).toString();
    settings.screenshotDirectory = ini.value("export/screenshotDirectory").toString();
    settings.trimDirectory = ini.value("export/trimDirectory").toString();

    auto format = ini.value("export/screenshotFormat", "png").toString().toLower().toStdString();
    if (auto parsed = media::screenshotFormatFromName(format)) {
        settings.screenshotFormat = *parsed;
    } else {
        NEAPU_LOGW("Unknown screenshot format '{}', using png", format);
    }

    auto mode = ini.value("playback/timecodeMode", "relative").toString().toLower().toStdString();
    if (auto parsed = TimecodeEngine::modeFromName(mode)) {
        settings.timecodeMode = *parsed;
    } else {
        NEAPU_LOGW("Unknown timecode mode '{}', using relative", mode);
    }

    settings.preferPrimary = ini.value("playback/preferPrimary", settings.preferPrimary).toBool();
    settings.mpvHwdec = ini.value("mpv/hwdec", settings.mpvHwdec).toString();
    settings.mpvVo = ini.value("mpv/vo", settings.mpvVo).toString();
    settings.logDirectory = ini.value("log/directory", settings.logDirectory).toString();

    NEAPU_LOGI("Settings loaded from {}: screenshot={}, timecode={}, hwdec={}", fileName.toStdString(),
               media::screenshotExtension(settings.screenshotFormat), TimecodeEngine::modeName(settings.timecodeMode),
               settings.mpvHwdec.toStdString());
    return settings;
}
} // namespace playback
