#include "Timecode.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <vector>

namespace playback {
namespace {
std::string_view trim(std::string_view text)
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

// 只接受纯数字
std::optional<int64_t> toNumber(std::string_view text)
{
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::vector<int64_t>> splitGroups(std::string_view text, std::string_view separators)
{
    std::vector<int64_t> groups;
    size_t start = 0;
    while (true) {
        size_t pos = text.find_first_of(separators, start);
        auto number = toNumber(text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (!number) {
            return std::nullopt;
        }
        groups.push_back(*number);
        if (groups.size() > 4) {
            return std::nullopt;
        }
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return groups;
}

int64_t roundedFps(double fps)
{
    return std::max<int64_t>(1, std::llround(fps));
}
} // namespace

double TimecodeEngine::effectiveFps(double fps)
{
    if (!std::isfinite(fps) || fps <= 0.0) {
        return DEFAULT_FPS;
    }
    return fps;
}

double TimecodeEngine::frameDuration(double fps)
{
    return 1.0 / effectiveFps(fps);
}

std::string TimecodeEngine::format(double seconds, double fps, int64_t startOffsetFrames, bool dropFrame)
{
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return "--:--:--:--";
    }
    fps = effectiveFps(fps);
    const int64_t base = roundedFps(fps);

    int64_t totalFrames = startOffsetFrames + std::llround(seconds * fps);
    int64_t frames = totalFrames % base;
    int64_t remaining = totalFrames / base;
    int64_t secs = remaining % 60;
    remaining /= 60;
    int64_t mins = remaining % 60;
    remaining /= 60;
    int64_t hours = remaining % 24;

    return std::format("{:02}:{:02}:{:02}{}{:02}", hours, mins, secs, dropFrame ? ';' : ':', frames);
}

std::optional<int64_t> TimecodeEngine::timecodeToFrames(std::string_view timecode, double fps)
{
    auto groups = splitGroups(trim(timecode), ":;");
    if (!groups || groups->size() != 4) {
        return std::nullopt;
    }
    const int64_t base = roundedFps(effectiveFps(fps));
    const auto& g = *groups;
    return g[0] * 3600 * base + g[1] * 60 * base + g[2] * base + g[3];
}

std::optional<double> TimecodeEngine::parseInput(std::string_view text, TimecodeMode mode, const TimecodeContext& context)
{
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    const double fps = effectiveFps(context.fps);

    if (mode == TimecodeMode::Frames) {
        if (auto result = parseFrameCount(text, context)) {
            return result;
        }
    }

    if (text.starts_with("..")) {
        auto frames = toNumber(text.substr(2));
        if (!frames || *frames >= roundedFps(fps)) {
            return std::nullopt;
        }
        return std::floor(context.currentTime) + static_cast<double>(*frames) / fps;
    }

    if (text.starts_with("+..") || text.starts_with("-..")) {
        auto frames = toNumber(text.substr(3));
        if (!frames) {
            return std::nullopt;
        }
        double offset = static_cast<double>(*frames) / fps;
        return text.front() == '+' ? context.currentTime + offset : context.currentTime - offset;
    }

    if (text.front() == '+' || text.front() == '-') {
        auto offset = parseRelative(text.substr(1), fps);
        if (!offset) {
            return std::nullopt;
        }
        return text.front() == '+' ? context.currentTime + *offset : context.currentTime - *offset;
    }

    return parseAbsolute(text, mode, context);
}

std::optional<double> TimecodeEngine::parseFrameCount(std::string_view text, const TimecodeContext& context)
{
    const double fps = effectiveFps(context.fps);
    if (text.front() == '+' || text.front() == '-') {
        auto frames = toNumber(text.substr(1));
        if (!frames) {
            return std::nullopt;
        }
        double offset = static_cast<double>(*frames) / fps;
        return text.front() == '+' ? context.currentTime + offset : context.currentTime - offset;
    }
    auto frames = toNumber(text);
    if (!frames) {
        return std::nullopt;
    }
    return static_cast<double>(*frames) / fps;
}

std::optional<double> TimecodeEngine::parseRelative(std::string_view text, double fps)
{
    auto groups = splitGroups(text, ":;.");
    if (!groups) {
        return std::nullopt;
    }
    const auto& g = *groups;
    int64_t hours = 0;
    int64_t minutes = 0;
    int64_t seconds = 0;
    int64_t frames = 0;
    switch (g.size()) {
    case 1:
        seconds = g[0];
        break;
    case 2:
        // 两段时默认 分:秒，任一段超过 59 则视为 秒:帧
        if (g[0] < 60 && g[1] < 60) {
            minutes = g[0];
            seconds = g[1];
        } else {
            seconds = g[0];
            frames = g[1];
        }
        break;
    case 3:
        hours = g[0];
        minutes = g[1];
        seconds = g[2];
        break;
    case 4:
        hours = g[0];
        minutes = g[1];
        seconds = g[2];
        frames = g[3];
        break;
    default:
        return std::nullopt;
    }
    return static_cast<double>(hours * 3600 + minutes * 60 + seconds) + static_cast<double>(frames) / fps;
}

std::optional<double> TimecodeEngine::parseAbsolute(std::string_view text, TimecodeMode mode, const TimecodeContext& context)
{
    auto groups = splitGroups(text, ":;.");
    if (!groups) {
        return std::nullopt;
    }
    const double fps = effectiveFps(context.fps);
    const int64_t base = roundedFps(fps);

    // 右对齐：s / m:s / h:m:s / h:m:s:f
    int64_t parts[4] = {0, 0, 0, 0};
    const auto& g = *groups;
    if (g.size() == 4) {
        for (size_t i = 0; i < 4; ++i) {
            parts[i] = g[i];
        }
    } else {
        for (size_t i = 0; i < g.size(); ++i) {
            parts[3 - g.size() + i] = g[i];
        }
    }
    const int64_t hours = parts[0];
    const int64_t minutes = parts[1];
    const int64_t seconds = parts[2];
    const int64_t frames = parts[3];
    if (hours >= 24 || minutes >= 60 || seconds >= 60 || frames >= base) {
        return std::nullopt;
    }

    int64_t totalFrames = hours * 3600 * base + minutes * 60 * base + seconds * base + frames;
    if (mode == TimecodeMode::Source && context.startTimecode) {
        auto startFrames = timecodeToFrames(*context.startTimecode, fps);
        if (!startFrames) {
            return std::nullopt;
        }
        totalFrames -= *startFrames;
    }
    return static_cast<double>(totalFrames) / fps;
}

std::string TimecodeEngine::formatForDisplay(double seconds, TimecodeMode mode, const TimecodeContext& context,
                                             bool isOutPoint, bool isDuration)
{
    const double fps = effectiveFps(context.fps);
    // 出点显示为最后一帧之后
    const double adjusted = isOutPoint ? seconds + 1.0 / fps : seconds;

    switch (mode) {
    case TimecodeMode::Relative:
        return format(adjusted, fps);
    case TimecodeMode::Source: {
        if (isDuration || !context.startTimecode) {
            return format(adjusted, fps);
        }
        auto startFrames = timecodeToFrames(*context.startTimecode, fps);
        bool dropFrame = context.startTimecode->find(';') != std::string::npos;
        return format(adjusted, fps, startFrames.value_or(0), dropFrame);
    }
    case TimecodeMode::Frames:
        if (!std::isfinite(adjusted) || adjusted < 0.0) {
            return "--";
        }
        return std::to_string(std::llround(adjusted * fps));
    }
    return format(adjusted, fps);
}

std::string TimecodeEngine::modePrefix(TimecodeMode mode)
{
    switch (mode) {
    case TimecodeMode::Relative:
        return "REL TC";
    case TimecodeMode::Source:
        return "SRC TC";
    case TimecodeMode::Frames:
        return "FRM";
    }
    return "";
}

std::string TimecodeEngine::modeName(TimecodeMode mode)
{
    switch (mode) {
    case TimecodeMode::Relative:
        return "relative";
    case TimecodeMode::Source:
        return "source";
    case TimecodeMode::Frames:
        return "frames";
    }
    return "";
}

std::optional<TimecodeMode> TimecodeEngine::modeFromName(std::string_view name)
{
    if (name == "relative") {
        return TimecodeMode::Relative;
    }
    if (name == "source") {
        return TimecodeMode::Source;
    }
    if (name == "frames") {
        return TimecodeMode::Frames;
    }
    return std::nullopt;
}

TimecodeMode TimecodeEngine::nextMode(TimecodeMode mode, bool hasSourceTimecode)
{
    switch (mode) {
    case TimecodeMode::Relative:
        return hasSourceTimecode ? TimecodeMode::Source : TimecodeMode::Frames;
    case TimecodeMode::Source:
        return TimecodeMode::Frames;
    case TimecodeMode::Frames:
        return TimecodeMode::Relative;
    }
    return TimecodeMode::Relative;
}

} // namespace playback
