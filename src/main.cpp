#include <QApplication>
#include <QDebug>
#include <logger.h>
#include <string>
#include "playback/PlayerSettings.h"
#include "view/MainWindow.h"

// clang-format off
void qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    switch (type) {
    case QtDebugMsg:
        neapu::Logger(NEAPU_LOG_LEVEL_DEBUG, context.file, context.line, context.function) << msg.toStdString();
        break;
    case QtInfoMsg:
        neapu::Logger(NEAPU_LOG_LEVEL_INFO, context.file, context.line, context.function) << msg.toStdString();
        break;
    case QtWarningMsg:
        neapu::Logger(NEAPU_LOG_LEVEL_WARNING, context.file, context.line, context.function) << msg.toStdString();
        break;
    case QtCriticalMsg:
    case QtFatalMsg:
        neapu::Logger(NEAPU_LOG_LEVEL_ERROR, context.file, context.line, context.function) << msg.toStdString();
        break;
    }
}
// clang-format on

int main(int argc, char* argv[])
{
    auto settings = playback::PlayerSettings::load("TandemPlayer.ini");

    neapu::Logger::setPrintLevel(NEAPU_LOG_LEVEL_INFO);
#ifdef DEBUG
    neapu::Logger::setLogLevel(NEAPU_LOG_LEVEL_DEBUG, SOURCE_DIR "/logs", "TandemPlayer");
#else
    const std::string logDirectory = settings.logDirectory.toStdString();
    neapu::Logger::setLogLevel(NEAPU_LOG_LEVEL_DEBUG, logDirectory.c_str(), "TandemPlayer");
#endif
    qInstallMessageHandler(qtMessageHandler);

    QApplication app(argc, argv);
    QApplication::setApplicationName("TandemPlayer");

    view::MainWindow w(settings);
    w.show();

    // 命令行参数作为待打开文件
    const auto args = QApplication::arguments();
    if (args.size() > 1) {
        w.openFile(args.at(1));
    }

    return app.exec();
}
