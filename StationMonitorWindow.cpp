#include "StationMonitorWindow.h"
#include "LevelMeterWidget.h"
#include <QtWidgets>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>

using airsynth::engine::AssetDescriptor;
using airsynth::engine::ListenerSession;

StationMonitorWindow::StationMonitorWindow(const QVector<AssetDescriptor>& assets,
                                           airsynth::graph::AudioGraphBuilder* graph,
                                           QSettings* settings,
                                           QWidget* parent)
    : QMainWindow(parent), m_assets(assets) {

    airsynth::engine::EngineProfile profile = airsynth::engine::defaultEngineProfile();
    if (settings) profile = airsynth::engine::loadEngineProfile(*settings, "audio/engineProfile");
    m_session = new ListenerSession(graph, settings, profile, this);

    createWidgets();
    createLayout();
    createConnections();

    setWindowTitle("AirSynth Monitor");

    if (!m_session->initAudio()) {
        QMessageBox::warning(this, "Audio Error", "No audio output is available. The monitor will stay silent.");
    }
}

StationMonitorWindow::~StationMonitorWindow() {
    // Qt's parent-child ownership deletes the session (and its engine)
}

void StationMonitorWindow::createWidgets() {
    centralWidget = new QWidget;
    setCentralWidget(centralWidget);

    assetList = new QListWidget;
    for (const AssetDescriptor& a : m_assets) {
        const QString artist = a.artist.isEmpty() ? QString() : QString(" / %1").arg(a.artist);
        assetList->addItem(QString("[%1] %2%3").arg(a.assetType, a.title, artist));
    }
    if (!m_assets.isEmpty()) assetList->setCurrentRow(0);

    offsetSpin = new QDoubleSpinBox;
    offsetSpin->setRange(0.0, 3600.0);
    offsetSpin->setDecimals(1);
    offsetSpin->setSuffix(" s");
    offsetSpin->setToolTip("Elapsed time into the asset when it goes on air");

    playButton = new QPushButton("Play");
    stopButton = new QPushButton("Stop");

    volumeSlider = new QSlider(Qt::Horizontal);
    volumeSlider->setRange(0, 100);
    volumeSlider->setValue(int(m_session->volume() * 100.0 + 0.5));

    muteCheckBox = new QCheckBox("Mute");
    muteCheckBox->setChecked(m_session->isMuted());

    statusLabel = new QLabel("Audio: starting...");
    keyLabel = new QLabel("-");
    keyLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);

    levelMeter = new LevelMeterWidget;

    logConsole = new QTextEdit;
    logConsole->setReadOnly(true);
    logConsole->setFontFamily("Monospace");
}

void StationMonitorWindow::createLayout() {
    mainLayout = new QVBoxLayout(centralWidget);

    mainLayout->addWidget(new QLabel("Assets"));
    mainLayout->addWidget(assetList, 1);

    QHBoxLayout* transportLayout = new QHBoxLayout;
    transportLayout->setSpacing(10);
    transportLayout->addWidget(new QLabel("Start at"));
    transportLayout->addWidget(offsetSpin);
    transportLayout->addWidget(playButton);
    transportLayout->addWidget(stopButton);
    transportLayout->addStretch(1);
    mainLayout->addLayout(transportLayout);

    QHBoxLayout* outputLayout = new QHBoxLayout;
    outputLayout->setSpacing(10);
    outputLayout->addWidget(new QLabel("Volume"));
    outputLayout->addWidget(volumeSlider, 1);
    outputLayout->addWidget(muteCheckBox);
    mainLayout->addLayout(outputLayout);

    mainLayout->addWidget(levelMeter);

    QHBoxLayout* infoLayout = new QHBoxLayout;
    infoLayout->addWidget(statusLabel);
    infoLayout->addStretch(1);
    infoLayout->addWidget(keyLabel);
    mainLayout->addLayout(infoLayout);

    mainLayout->addWidget(logConsole, 1);

    resize(560, 640);
}

void StationMonitorWindow::createConnections() {
    connect(playButton, &QPushButton::clicked, this, &StationMonitorWindow::onPlayClicked);
    connect(stopButton, &QPushButton::clicked, this, &StationMonitorWindow::onStopClicked);
    connect(assetList, &QListWidget::itemDoubleClicked, this, [this](QListWidgetItem*) { onPlayClicked(); });

    connect(volumeSlider, &QSlider::valueChanged, this, [this](int v) {
        m_session->setVolume(v / 100.0);
    });
    connect(muteCheckBox, &QCheckBox::toggled, this, [this](bool checked) {
        if (checked != m_session->isMuted()) m_session->toggleMute();
    });

    connect(m_session, &ListenerSession::levelsChanged, levelMeter, &LevelMeterWidget::setLevels);
    connect(m_session, &ListenerSession::audioReadyChanged, this, &StationMonitorWindow::onAudioReadyChanged);
    connect(m_session, &ListenerSession::audioError, this, [this](const QString& message) {
        statusLabel->setText("Audio: unavailable");
        logToConsole("ERROR: " + message);
    });
    connect(m_session, &ListenerSession::trackStarted, this, &StationMonitorWindow::onTrackStarted);
    connect(m_session, &ListenerSession::playbackStopped, this, [this]() {
        keyLabel->setText("-");
        logToConsole("stopped");
    });
}

void StationMonitorWindow::onPlayClicked() {
    const int row = assetList->currentRow();
    if (row < 0 || row >= m_assets.size()) return;
    if (!m_session->isAudioReady() && !m_session->initAudio()) return;

    // Re-selecting the asset that is already on air restarts it at the new offset.
    if (m_assets[row].id == m_session->playingAssetId()) {
        m_session->setNowPlaying(AssetDescriptor(), 0.0, false);
    }
    m_session->setNowPlaying(m_assets[row], offsetSpin->value(), true);
}

void StationMonitorWindow::onStopClicked() {
    m_session->setNowPlaying(AssetDescriptor(), 0.0, false);
    levelMeter->reset();
}

void StationMonitorWindow::onTrackStarted(const QString& assetId, const QString& parametersJson) {
    const QJsonObject o = QJsonDocument::fromJson(parametersJson.toUtf8()).object();
    keyLabel->setText(QString("%1, %2 BPM").arg(o.value("key").toString()).arg(o.value("tempo_bpm").toInt()));
    logToConsole(QString("%1 %2").arg(assetId, parametersJson));
}

void StationMonitorWindow::onAudioReadyChanged(bool ready) {
    statusLabel->setText(ready ? "Audio: ready" : "Audio: closed");
    playButton->setEnabled(ready);
    stopButton->setEnabled(ready);
}

void StationMonitorWindow::logToConsole(const QString& message) {
    logConsole->append(message);
}
