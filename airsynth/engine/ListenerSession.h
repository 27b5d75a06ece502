#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QTimer>

#include "airsynth/engine/AssetDescriptor.h"
#include "airsynth/engine/EngineProfile.h"
#include "airsynth/graph/AudioGraphBuilder.h"

class QSettings;

namespace airsynth::engine {

class SynthEngine;

// Listener-side binding of the engine to the station's now-playing feed.
//
// Replays only when the on-air asset id changes, stops when playback ends,
// persists volume / mute, and polls the meter at ~30 fps while audio is up.
class ListenerSession : public QObject {
    Q_OBJECT
public:
    static constexpr const char* kVolumeKey = "radio_volume";
    static constexpr const char* kMutedKey = "radio_muted";
    static constexpr int kLevelsIntervalMs = 33;

    ListenerSession(graph::AudioGraphBuilder* graph, // not owned
                    QSettings* settings,             // not owned, may be null
                    const EngineProfile& profile = defaultEngineProfile(),
                    QObject* parent = nullptr);
    ~ListenerSession() override;

    // Creates and initialises the engine, then applies the persisted volume / mute
    // and the last now-playing state. Safe to call again after a failure.
    bool initAudio();
    bool isAudioReady() const;

    // An invalid asset (empty id) means nothing is on air.
    void setNowPlaying(const AssetDescriptor& asset, double elapsedSec, bool isPlaying);

    void setVolume(double volume);
    void toggleMute();
    double volume() const { return m_volume; }
    bool isMuted() const { return m_muted; }

    QString playingAssetId() const { return m_playingId; }
    SynthEngine* engine() const { return m_engine; }

    // Seconds from a server-reported start timestamp to `now`, never negative.
    static double elapsedSince(const QDateTime& startedAt, const QDateTime& now);

signals:
    void audioReadyChanged(bool ready);
    void audioError(const QString& message);
    void levelsChanged(double left, double right);
    // Forwarded from the engine.
    void trackStarted(const QString& assetId, const QString& parametersJson);
    void playbackStopped();

private slots:
    void onLevelsTick();

private:
    void applyNowPlaying();
    void persist();

    graph::AudioGraphBuilder* m_graph = nullptr; // not owned
    QSettings* m_settings = nullptr;             // not owned
    EngineProfile m_profile;
    SynthEngine* m_engine = nullptr;             // child

    double m_volume = 0.7;
    bool m_muted = false;

    // Last now-playing state reported by the feed.
    AssetDescriptor m_asset;
    double m_elapsedSec = 0.0;
    bool m_isPlaying = false;

    QString m_playingId;
    QTimer m_levelsTimer;
};

} // namespace airsynth::engine
