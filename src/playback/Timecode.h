#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace playback {

enum class TimecodeMode {
    Relative,
    Source,
    Frames
};

// 时间码换算所需的上下文
struct TimecodeContext {
    double fps{0.0};                          // <= 0 表示未知
    std::optional<std::string> startTimecode; // 源时间码，HH:MM:SS:FF 或 HH:MM:SS;FF
    double currentTime{0.0};
};

class TimecodeEngine {
public:
    static constexpr double DEFAULT_FPS = 30.0;

    static double effectiveFps(double fps);
    static double frameDuration(double fps);

    // HH:MM:SS:FF, 非法输入返回 --:--:--:--
    static std::string format(double seconds, double fps, int64_t startOffsetFrames = 0, bool dropFrame = false);

    // 只接受四段式时间码
    static std::optional<int64_t> timecodeToFrames(std::string_view timecode, double fps);

    static std::optional<double> parseInput(std::string_view text, TimecodeMode mode, const TimecodeContext& context);

    static std::string formatForDisplay(double seconds, TimecodeMode mode, const TimecodeContext& context,
                                        bool isOutPoint = false, bool isDuration = false);

    static std::string modePrefix(TimecodeMode mode);
    static std::string modeName(TimecodeMode mode);
    static std::optional<TimecodeMode> modeFromName(std::string_view name);
    static TimecodeMode nextMode(TimecodeMode mode, bool hasSourceTimecode);

private:
    static std::optional<double> parseFrameCount(std::string_view text, const TimecodeContext& context);
    static std::optional<double> parseRelative(std::string_view text, double fps);
    static std::optional<double> parseAbsolute(std::string_view text, TimecodeMode mode, const TimecodeContext& context);
};

} // namespace playback
