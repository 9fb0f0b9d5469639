#include <QCoreApplication>
#include <gtest/gtest.h>
#include <logger.h>

int main(int argc, char* argv[])
{
    neapu::Logger::setPrintLevel(NEAPU_LOG_LEVEL_WARNING);
    // 协调器通过排队调用处理引擎事件，需要事件循环
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
