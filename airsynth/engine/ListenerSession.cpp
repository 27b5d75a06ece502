#include "airsynth/engine/ListenerSession.h"

#include "airsynth/engine/SynthEngine.h"

#include <QSettings>
#include <QtDebug>
#include <QtGlobal>

namespace airsynth::engine {

ListenerSession::ListenerSession(graph::AudioGraphBuilder* graph,
                                 QSettings* settings,
                                 const EngineProfile& profile,
                                 QObject* parent)
    : QObject(parent),
      m_graph(graph),
      m_settings(settings),
      m_profile(profile),
      m_volume(qBound(0.0, profile.defaultVolume, 1.0)) {
    if (m_settings) {
        m_volume = qBound(0.0, m_settings->value(kVolumeKey, m_volume).toDouble(), 1.0);
        m_muted = m_settings->value(kMutedKey, false).toBool();
    }
    m_levelsTimer.setInterval(kLevelsIntervalMs);
    connect(&m_levelsTimer, &QTimer::timeout, this, &ListenerSession::onLevelsTick);
}

ListenerSession::~ListenerSession() {
    m_levelsTimer.stop();
}

bool ListenerSession::isAudioReady() const {
    return m_engine && m_engine->isReady();
}

bool ListenerSession::initAudio() {
    if (isAudioReady()) return true;

    if (!m_engine) {
        m_engine = new SynthEngine(m_graph, m_profile, this);
        connect(m_engine, &SynthEngine::readyChanged, this, &ListenerSession::audioReadyChanged);
        connect(m_engine, &SynthEngine::errorOccurred, this, &ListenerSession::audioError);
        connect(m_engine, &SynthEngine::trackStarted, this, &ListenerSession::trackStarted);
        connect(m_engine, &SynthEngine::playbackStopped, this, &ListenerSession::playbackStopped);
    }
    if (!m_engine->init()) {
        qWarning() << "ListenerSession: audio unavailable";
        return false;
    }

    m_engine->setVolume(m_volume);
    m_engine->setMuted(m_muted);
    m_levelsTimer.start();
    applyNowPlaying();
    return true;
}

void ListenerSession::setNowPlaying(const AssetDescriptor& asset, double elapsedSec, bool isPlaying) {
    m_asset = asset;
    m_elapsedSec = qMax(0.0, elapsedSec);
    m_isPlaying = isPlaying;
    applyNowPlaying();
}

void ListenerSession::applyNowPlaying() {
    if (!isAudioReady()) return;

    if (!m_isPlaying || !m_asset.isValid()) {
        if (!m_playingId.isEmpty()) {
            m_engine->stop();
            m_playingId.clear();
        }
        return;
    }

    // Position updates for the same asset do not restart it.
    if (m_asset.id == m_playingId) return;

    m_playingId = m_asset.id;
    qInfo() << "ListenerSession: now playing" << m_asset.id << m_asset.title << "at" << m_elapsedSec << "s";
    m_engine->playTrack(m_asset, m_elapsedSec);
}

void ListenerSession::setVolume(double volume) {
    m_volume = qBound(0.0, volume, 1.0);
    if (m_engine) m_engine->setVolume(m_volume);
    persist();
}

void ListenerSession::toggleMute() {
    m_muted = !m_muted;
    if (m_engine) m_engine->setMuted(m_muted);
    persist();
}

void ListenerSession::persist() {
    if (!m_settings) return;
    m_settings->setValue(kVolumeKey, m_volume);
    m_settings->setValue(kMutedKey, m_muted);
}

void ListenerSession::onLevelsTick() {
    if (!isAudioReady()) return;
    const StereoLevels levels = m_engine->getLevels();
    emit levelsChanged(levels.left, levels.right);
}

double ListenerSession::elapsedSince(const QDateTime& startedAt, const QDateTime& now) {
    if (!startedAt.isValid() || !now.isValid()) return 0.0;
    return qMax(0.0, double(startedAt.msecsTo(now)) / 1000.0);
}

} // namespace airsynth::engine
