#include "ControlWidget.h"
#include <QSignalBlocker>
#include <QStyle>
#include <cmath>
#include <QVBoxLayout>
#include <logger.h>

using playback::TimecodeEngine;

namespace view {
ControlWidget::ControlWidget(playback::PlaybackCoordinator* coordinator, QWidget* parent)
    : QWidget(parent), m_coordinator(coordinator)
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(10, 10, 10, 10);
    layout->setSpacing(0);
    createTimelineLayout(layout);
    createControlLayout(layout);
    setLayout(layout);
    m_timelineSlider->setEnabled(false);

    connect(m_coordinator, &playback::PlaybackCoordinator::stateChanged, this, &ControlWidget::onStateChanged);
}
ControlWidget::~ControlWidget() {}

void ControlWidget::onStateChanged(const playback::PlaybackSnapshot& snapshot)
{
    const auto& state = snapshot.state;
    const auto ctx = snapshot.timecodeContext();
    const bool ready = state.phase == playback::Phase::Ready;

    m_timecodeModeButton->setText(QString::fromStdString(TimecodeEngine::modePrefix(state.timecodeMode)));
    if (!m_timecodeEdit->hasFocus()) {
        m_timecodeEdit->setText(
            QString::fromStdString(TimecodeEngine::formatForDisplay(state.currentTime, state.timecodeMode, ctx)));
    }
    m_totalTimeLabel->setText(QString::fromStdString(
        TimecodeEngine::formatForDisplay(state.duration, state.timecodeMode, ctx, false, true)));

    m_timelineSlider->setEnabled(ready);
    m_timelineSlider->setMaximum(static_cast<int>(state.duration * 1000));
    if (!m_timelineSliderDragging) {
        m_timelineSlider->setValue(static_cast<int>(state.currentTime * 1000));
    }

    m_playPauseButton->setIcon(style()->standardIcon(state.playing ? QStyle::SP_MediaPause : QStyle::SP_MediaPlay));
    m_reverseButton->setChecked(state.reverseSimulating);
    m_loopButton->setChecked(state.loop);
    for (auto* button : {m_reverseButton, m_playPauseButton, m_fastForwardButton}) {
        button->setEnabled(ready);
    }

    m_muteButton->setIcon(style()->standardIcon(state.muted ? QStyle::SP_MediaVolumeMuted : QStyle::SP_MediaVolume));
    if (!m_volumeSlider->isSliderDown()) {
        QSignalBlocker blocker(m_volumeSlider);
        m_volumeSlider->setValue(static_cast<int>(std::lround(state.volume)));
    }
    m_volumeLabel->setText(QString("%1%").arg(std::lround(state.volume)));

    m_speedLabel->setText(rateText(state));
    m_trimLabel->setText(trimText(snapshot));

    QString status;
    if (state.phase == playback::Phase::Failed) {
        status = QString::fromStdString(state.errorMessage);
    } else if (state.exportStatus.savingScreenshot) {
        status = tr("Saving screenshot...");
    } else if (state.exportStatus.exportingTrim) {
        status = tr("Exporting trim...");
    } else if (state.exportStatus.screenshotDone || state.exportStatus.trimExportDone) {
        status = QString::fromStdString(state.exportStatus.message);
    } else if (state.phase == playback::Phase::Preparing) {
        status = tr("Loading (%1)...").arg(media::backendKindName(state.backend));
    } else if (!state.exportStatus.message.empty()) {
        status = QString::fromStdString(state.exportStatus.message);
    }
    m_statusLabel->setText(status);
}

QString ControlWidget::rateText(const playback::PlaybackState& state) const
{
    if (state.displayedRate == 1.0 && !state.reverseSimulating) {
        return {};
    }
    return QString("%1x").arg(state.displayedRate, 0, 'g', 3);
}
QString ControlWidget::trimText(const playback::PlaybackSnapshot& snapshot) const
{
    const auto ctx = snapshot.timecodeContext();
    const auto mode = snapshot.state.timecodeMode;
    auto in = snapshot.trim.in();
    auto out = snapshot.trim.out();
    if (!in && !out) {
        return {};
    }
    QString text = tr("In %1  Out %2")
                       .arg(in ? QString::fromStdString(TimecodeEngine::formatForDisplay(*in, mode, ctx)) : "--")
                       .arg(out ? QString::fromStdString(TimecodeEngine::formatForDisplay(*out, mode, ctx, true)) : "--");
    if (auto length = snapshot.trim.length()) {
        text += tr("  Dur %1").arg(QString::fromStdString(TimecodeEngine::formatForDisplay(*length, mode, ctx, false, true)));
    }
    return text;
}

void ControlWidget::createTimelineLayout(QBoxLayout* parentLayout)
{
    auto* timelineLayout = new QHBoxLayout();
    timelineLayout->setContentsMargins(0, 0, 0, 0);
    timelineLayout->setSpacing(3);

    m_timecodeModeButton = new QPushButton("REL TC", this);
    m_timecodeModeButton->setFlat(true);
    m_timecodeModeButton->setToolTip(tr("Cycle timecode display (T)"));
    m_timecodeEdit = new QLineEdit("00:00:00:00", this);
    m_timecodeEdit->setFixedWidth(110);
    m_timecodeEdit->setToolTip(tr("Type a timecode, +/- offset or frame number"));
    m_timelineSlider = new QSlider(Qt::Horizontal, this);
    m_totalTimeLabel = new QLabel("00:00:00:00", this);
    timelineLayout->addWidget(m_timecodeModeButton);
    timelineLayout->addWidget(m_timecodeEdit);
    timelineLayout->addWidget(m_timelineSlider, 1);
    timelineLayout->addWidget(m_totalTimeLabel);
    parentLayout->addLayout(timelineLayout);

    connect(m_timecodeModeButton, &QPushButton::clicked, this, [this]() {
        m_coordinator->trigger(playback::PlaybackCoordinator::Command::CycleTimecodeDisplay);
    });
    connect(m_timecodeEdit, &QLineEdit::returnPressed, this, &ControlWidget::onTimecodeEntered);
    connect(m_timelineSlider, &QSlider::sliderMoved, this, &ControlWidget::onTimelineSliderMoved);
    connect(m_timelineSlider, &QSlider::sliderPressed, this, &ControlWidget::onTimelineSliderPressed);
    connect(m_timelineSlider, &QSlider::sliderReleased, this, &ControlWidget::onTimelineSliderReleased);
}

QPushButton* ControlWidget::createButton(QStyle::StandardPixmap icon, const QString& toolTip)
{
    constexpr auto BUTTON_SIZE = 36;
    constexpr auto ICON_SIZE = 24;
    auto* button = new QPushButton("", this);
    button->setIcon(style()->standardIcon(icon));
    button->setFixedSize({BUTTON_SIZE, BUTTON_SIZE});
    button->setIconSize({ICON_SIZE, ICON_SIZE});
    button->setToolTip(toolTip);
    button->setFocusPolicy(Qt::NoFocus);
    return button;
}

void ControlWidget::createControlLayout(QBoxLayout* parentLayout)
{
    auto* buttonsLayout = new QHBoxLayout();
    buttonsLayout->setContentsMargins(0, 10, 0, 0);
    buttonsLayout->setSpacing(3);

    m_reverseButton = createButton(QStyle::SP_MediaSeekBackward, tr("Reverse (J)"));
    m_reverseButton->setCheckable(true);
    buttonsLayout->addWidget(m_reverseButton);
    connect(m_reverseButton, &QPushButton::clicked, this, [this]() { m_coordinator->reverse(); });

    m_playPauseButton = createButton(QStyle::SP_MediaPlay, tr("Play / Pause (Space)"));
    buttonsLayout->addWidget(m_playPauseButton);
    connect(m_playPauseButton, &QPushButton::clicked, this, [this]() {
        m_coordinator->trigger(playback::PlaybackCoordinator::Command::TogglePlayback);
    });

    m_fastForwardButton = createButton(QStyle::SP_MediaSeekForward, tr("Fast forward (L)"));
    buttonsLayout->addWidget(m_fastForwardButton);
    connect(m_fastForwardButton, &QPushButton::clicked, this, [this]() { m_coordinator->fastForward(); });

    m_loopButton = createButton(QStyle::SP_BrowserReload, tr("Loop"));
    m_loopButton->setCheckable(true);
    buttonsLayout->addWidget(m_loopButton);
    connect(m_loopButton, &QPushButton::clicked, this, [this]() { m_coordinator->toggleLoop(); });

    m_speedLabel = new QLabel(this);
    m_speedLabel->setFixedWidth(50);
    buttonsLayout->addWidget(m_speedLabel);

    buttonsLayout->addStretch();

    m_statusLabel = new QLabel(this);
    buttonsLayout->addWidget(m_statusLabel);
    m_trimLabel = new QLabel(this);
    buttonsLayout->addWidget(m_trimLabel);

    m_muteButton = createButton(QStyle::SP_MediaVolume, tr("Mute (M)"));
    m_muteButton->setFlat(true);
    buttonsLayout->addWidget(m_muteButton);
    connect(m_muteButton, &QPushButton::clicked, this, [this]() { m_coordinator->toggleMute(); });

    auto* volumeLayout = new QHBoxLayout();
    volumeLayout->setContentsMargins(0, 3, 0, 0);
    volumeLayout->setSpacing(3);
    m_volumeSlider = new QSlider(Qt::Horizontal, this);
    m_volumeSlider->setFixedWidth(100);
    m_volumeSlider->setRange(0, 100);
    m_volumeSlider->setValue(100);
    m_volumeSlider->setFocusPolicy(Qt::NoFocus);
    volumeLayout->addWidget(m_volumeSlider);
    m_volumeLabel = new QLabel("100%", this);
    m_volumeLabel->setFixedWidth(40);
    volumeLayout->addWidget(m_volumeLabel);
    buttonsLayout->addLayout(volumeLayout);
    connect(m_volumeSlider, &QSlider::valueChanged, this, &ControlWidget::onVolumeSliderChanged);

    parentLayout->addLayout(buttonsLayout);
}

void ControlWidget::onTimelineSliderMoved(int value)
{
    double sec = static_cast<double>(value) / 1000.0;
    m_coordinator->seekTo(sec);
}
void ControlWidget::onTimelineSliderPressed()
{
    m_timelineSliderDragging = true;
    double sec = static_cast<double>(m_timelineSlider->value()) / 1000.0;
    NEAPU_LOGD("Timeline slider pressed: {} seconds", sec);
    m_coordinator->seekTo(sec);
}
void ControlWidget::onTimelineSliderReleased()
{
    m_timelineSliderDragging = false;
}
void ControlWidget::onVolumeSliderChanged(int value)
{
    m_coordinator->setVolume(static_cast<double>(value));
}
void ControlWidget::onTimecodeEntered()
{
    // 无法解析的输入保持原样
    if (m_coordinator->seekToTimecode(m_timecodeEdit->text().toStdString())) {
        m_timecodeEdit->clearFocus();
    }
}
} // namespace view
