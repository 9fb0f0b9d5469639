#pragma once
#include <QObject>
#include <QString>
#include "ExportRunner.h"

namespace media {

// 以 QProcess 运行 ffmpeg，完成回调在本对象线程执行
class FFmpegExportService : public QObject, public ExportRunner {
    Q_OBJECT
public:
    explicit FFmpegExportService(QString ffmpegPath = {}, QObject* parent = nullptr);
    ~FFmpegExportService() override;

    void setFFmpegPath(const QString& path) { m_ffmpegPath = path; }
    // 未配置时从 PATH 查找
    QString resolvedFFmpegPath() const;

    void run(const ExportRequest& request, Completion completion) override;

private:
    QString m_ffmpegPath;
};

} // namespace media
