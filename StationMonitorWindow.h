#ifndef STATIONMONITORWINDOW_H
#define STATIONMONITORWINDOW_H

#include <QMainWindow>
#include <QVector>
#include "airsynth/engine/AssetDescriptor.h"
#include "airsynth/engine/ListenerSession.h"

// Forward declare Qt classes
QT_BEGIN_NAMESPACE
class QVBoxLayout;
class QPushButton;
class QListWidget;
class QCheckBox;
class QTextEdit;
class QLabel;
class QSlider;
class QDoubleSpinBox;
class QSettings;
QT_END_NAMESPACE

class LevelMeterWidget;

// Desktop monitor for the procedural radio output: pick an asset, put it
// "on air" at an offset, and watch the meter.
class StationMonitorWindow : public QMainWindow {
    Q_OBJECT

public:
    StationMonitorWindow(const QVector<airsynth::engine::AssetDescriptor>& assets,
                         airsynth::graph::AudioGraphBuilder* graph,
                         QSettings* settings,
                         QWidget* parent = nullptr);
    ~StationMonitorWindow();

private slots:
    void onPlayClicked();
    void onStopClicked();
    void onTrackStarted(const QString& assetId, const QString& parametersJson);
    void onAudioReadyChanged(bool ready);
    void logToConsole(const QString& message);

private:
    void createWidgets();
    void createLayout();
    void createConnections();

    QVector<airsynth::engine::AssetDescriptor> m_assets;
    airsynth::engine::ListenerSession* m_session = nullptr; // child

    // UI Widgets
    QWidget* centralWidget = nullptr;
    QVBoxLayout* mainLayout = nullptr;
    QListWidget* assetList = nullptr;
    QDoubleSpinBox* offsetSpin = nullptr;
    QPushButton* playButton = nullptr;
    QPushButton* stopButton = nullptr;
    QSlider* volumeSlider = nullptr;
    QCheckBox* muteCheckBox = nullptr;
    QLabel* statusLabel = nullptr;
    QLabel* keyLabel = nullptr;
    LevelMeterWidget* levelMeter = nullptr;
    QTextEdit* logConsole = nullptr;
};

#endif // STATIONMONITORWINDOW_H
