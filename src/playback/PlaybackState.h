#pragma once
#include <optional>
#include <string>
#include "Timecode.h"
#include "TrackOrdering.h"
#include "TrimRange.h"
#include "media/BackendAdapter.h"

namespace playback {

enum class Phase {
    Idle,
    Preparing,
    Ready,
    Failed
};

enum class ErrorKind {
    None,
    BackendConstructionFailure,
    DecodeOrFormatFailure,
    UnsupportedFormat,
    TimecodeParseFailure,
    ExportFailure
};

const char* phaseName(Phase phase);

struct ExportStatus {
    bool savingScreenshot{false};
    bool screenshotDone{false};
    bool exportingTrim{false};
    bool trimExportDone{false};
    std::string lastScreenshotPath;
    std::string message; // 最近一次导出的提示
};

struct PlaybackState {
    Phase phase{Phase::Idle};
    media::BackendKind backend{media::BackendKind::None};
    double currentTime{0.0};
    double duration{0.0};
    double displayedRate{1.0}; // 倒放模拟时为负，仅用于显示
    bool playing{false};
    bool reverseSimulating{false};
    bool loop{false};
    double volume{100.0}; // 0-100，跨加载与引擎切换保留
    bool muted{false};
    std::optional<double> aspectRatio;
    ErrorKind errorKind{ErrorKind::None};
    std::string errorMessage;
    TimecodeMode timecodeMode{TimecodeMode::Relative};
    ExportStatus exportStatus;
};

// 推送给界面的只读快照
struct PlaybackSnapshot {
    std::string sourceId;
    std::string sourceName;
    double frameRate{TimecodeEngine::DEFAULT_FPS};
    std::optional<std::string> sourceTimecode;
    PlaybackState state;
    TrackCatalog tracks;
    TrimRange trim;

    TimecodeContext timecodeContext() const { return {frameRate, sourceTimecode, state.currentTime}; }
};

} // namespace playback
