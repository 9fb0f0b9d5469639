#include "ExportService.h"
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QStringList>
#include <logger.h>
#include "FFmpegArguments.h"

namespace media {

FFmpegExportService::FFmpegExportService(QString ffmpegPath, QObject* parent)
    : QObject(parent), m_ffmpegPath(std::move(ffmpegPath))
{
}
FFmpegExportService::~FFmpegExportService() = default;

QString FFmpegExportService::resolvedFFmpegPath() const
{
    if (!m_ffmpegPath.isEmpty()) {
        return m_ffmpegPath;
    }
    return QStandardPaths::findExecutable("ffmpeg");
}

void FFmpegExportService::run(const ExportRequest& request, Completion completion)
{
    const QString program = resolvedFFmpegPath();
    const QString outputPath = QString::fromStdString(request.outputPath);
    if (program.isEmpty()) {
        NEAPU_LOGE("ffmpeg executable not found");
        ExportResult result{false, request.outputPath, "ffmpeg executable not found"};
        QMetaObject::invokeMethod(this, [completion, result] { completion(result); }, Qt::QueuedConnection);
        return;
    }

    QStringList arguments;
    for (const auto& argument : ffmpeg_args::buildArguments(request)) {
        arguments << QString::fromStdString(argument);
    }
    NEAPU_LOGI("Running {} {}", program.toStdString(), arguments.join(' ').toStdString());

    auto* process = new QProcess(this);
    connect(process, &QProcess::finished, this,
            [process, outputPath, completion](int exitCode, QProcess::ExitStatus exitStatus) {
                ExportResult result;
                result.outputPath = outputPath.toStdString();
                const QString stderrText = QString::fromUtf8(process->readAllStandardError()).trimmed();
                if (exitStatus != QProcess::NormalExit || exitCode != 0) {
                    result.message = stderrText.isEmpty() ? QString("ffmpeg exited with code %1").arg(exitCode).toStdString()
                                                          : stderrText.toStdString();
                    NEAPU_LOGE("ffmpeg failed ({}): {}", exitCode, result.message);
                } else if (!QFileInfo::exists(outputPath)) {
                    result.message = "ffmpeg finished but produced no output file";
                    NEAPU_LOGE("ffmpeg produced no output: {}", result.outputPath);
                } else {
                    result.success = true;
                    NEAPU_LOGI("ffmpeg wrote {}", result.outputPath);
                }
                process->deleteLater();
                completion(result);
            });
    connect(process, &QProcess::errorOccurred, this, [process, outputPath, completion](QProcess::ProcessError error) {
        // 只有启动失败不会再收到 finished
        if (error != QProcess::FailedToStart) {
            return;
        }
        NEAPU_LOGE("Failed to start ffmpeg: {}", process->errorString().toStdString());
        ExportResult result{false, outputPath.toStdString(), "Failed to start ffmpeg: " + process->errorString().toStdString()};
        process->deleteLater();
        completion(result);
    });
    process->start(program, arguments);
}

} // namespace media
