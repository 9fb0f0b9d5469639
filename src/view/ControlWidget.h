#pragma once
#include <QBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSlider>
#include <QWidget>
#include "playback/PlaybackCoordinator.h"

namespace view {

class ControlWidget : public QWidget {
    Q_OBJECT
public:
    explicit ControlWidget(playback::PlaybackCoordinator* coordinator, QWidget* parent = nullptr);
    ~ControlWidget() override;

public slots:
    void onStateChanged(const playback::PlaybackSnapshot& snapshot);

private:
    void createTimelineLayout(QBoxLayout* parentLayout);
    void createControlLayout(QBoxLayout* parentLayout);
    QPushButton* createButton(QStyle::StandardPixmap icon, const QString& toolTip);

    void onTimelineSliderMoved(int value);
    void onTimelineSliderPressed();
    void onTimelineSliderReleased();
    void onTimecodeEntered();
    void onVolumeSliderChanged(int value);

    QString rateText(const playback::PlaybackState& state) const;
    QString trimText(const playback::PlaybackSnapshot& snapshot) const;

private:
    playback::PlaybackCoordinator* m_coordinator{nullptr};

    QPushButton* m_timecodeModeButton{nullptr};
    QLineEdit* m_timecodeEdit{nullptr};
    QLabel* m_totalTimeLabel{nullptr};
    QSlider* m_timelineSlider{nullptr};

    QPushButton* m_reverseButton{nullptr};
    QPushButton* m_playPauseButton{nullptr};
    QPushButton* m_fastForwardButton{nullptr};
    QPushButton* m_loopButton{nullptr};

    QPushButton* m_muteButton{nullptr};
    QSlider* m_volumeSlider{nullptr};
    QLabel* m_volumeLabel{nullptr};

    QLabel* m_speedLabel{nullptr};
    QLabel* m_trimLabel{nullptr};
    QLabel* m_statusLabel{nullptr};

    bool m_timelineSliderDragging{false};
};

} // namespace view
