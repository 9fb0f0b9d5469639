#include <gtest/gtest.h>
#include "media/ExportRunner.h"

using media::ScreenshotFormat;

TEST(ExportNaming, ScreenshotNameCarriesTimestampAndTime)
{
    auto path = media::screenshotOutputPath("/media/clip.mov", "", 3.5, ScreenshotFormat::Jpeg, "20240102_030405");
    EXPECT_EQ(path, "/media/clip_20240102_030405_t3.500.jpg");

    auto elsewhere = media::screenshotOutputPath("/media/clip.mov", "/shots", 0.0, ScreenshotFormat::Jxl, "x");
    EXPECT_EQ(elsewhere, "/shots/clip_x_t0.000.jxl");
}

TEST(ExportNaming, TrimKeepsContainerExtension)
{
    EXPECT_EQ(media::trimOutputPath("/media/clip.mxf", ""), "/media/clip_trimmed.mxf");
    EXPECT_EQ(media::trimOutputPath("/media/clip.mov", "/exports"), "/exports/clip_trimmed.mov");
}

TEST(ExportNaming, ScreenshotFormatNames)
{
    EXPECT_EQ(media::screenshotFormatFromName("jpg"), ScreenshotFormat::Jpeg);
    EXPECT_EQ(media::screenshotFormatFromName("jpeg"), ScreenshotFormat::Jpeg);
    EXPECT_EQ(media::screenshotFormatFromName("png"), ScreenshotFormat::Png);
    EXPECT_FALSE(media::screenshotFormatFromName("gif").has_value());
    EXPECT_STREQ(media::screenshotExtension(ScreenshotFormat::Png), "png");
}
