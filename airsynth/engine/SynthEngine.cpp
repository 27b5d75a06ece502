#include "airsynth/engine/SynthEngine.h"

#include <QTimer>
#include <QtDebug>
#include <QtGlobal>

#include <algorithm>
#include <cmath>

namespace airsynth::engine {

using graph::NodeId;
using graph::Param;

namespace {
// Below this an interrupted voice is cut without a ramp.
constexpr double kSilentGain = 1e-4;
// Teardown lands this long after the declick ramp ends.
constexpr int kCutGraceMs = 30;
} // namespace

SynthEngine::SynthEngine(graph::AudioGraphBuilder* graph, const EngineProfile& profile, QObject* parent)
    : QObject(parent),
      m_graph(graph),
      m_profile(profile),
      m_builder(graph, profile.retuneTimeConstantSec),
      m_volume(qBound(0.0, profile.defaultVolume, 1.0)) {}

SynthEngine::~SynthEngine() {
    if (m_state == EngineState::Ready) destroy();
}

bool SynthEngine::fail(const QString& message) {
    qWarning().noquote() << "SynthEngine:" << message;
    emit errorOccurred(message);
    return false;
}

bool SynthEngine::init() {
    if (m_state == EngineState::Ready) return true;
    if (m_state == EngineState::Destroyed) return fail("engine was destroyed; create a new one");
    if (!m_graph) return fail("no audio graph backend");

    if (!m_graph->resume()) return fail("audio output unavailable");

    m_analyser = m_graph->createAnalyser(m_profile.analyserFftSize);
    m_master = m_graph->createGain(m_muted ? 0.0 : m_volume);
    const bool wired = m_graph->connect(m_analyser, m_master) &&
                       m_graph->connect(m_master, m_graph->destination());
    if (!wired) {
        // Whatever was created is dropped with the half-built bus.
        const bool masterReleased = m_graph->release(m_master);
        const bool analyserReleased = m_graph->release(m_analyser);
        m_master = graph::kInvalidNode;
        m_analyser = graph::kInvalidNode;
        m_graph->close();
        qDebug() << "SynthEngine: partial bus released master=" << masterReleased
                 << "analyser=" << analyserReleased;
        return fail("could not build the output bus");
    }

    m_state = EngineState::Ready;
    qInfo() << "SynthEngine: ready sampleRate=" << m_graph->sampleRate()
            << "fftSize=" << m_profile.analyserFftSize;
    emit readyChanged(true);
    return true;
}

void SynthEngine::destroy() {
    if (m_state != EngineState::Ready) return;

    if (m_current) teardownVoice(m_current);
    if (m_outgoing) teardownVoice(m_outgoing);
    for (const auto& voice : m_cutting) teardownVoice(voice);
    m_current.reset();
    m_outgoing.reset();
    m_cutting.clear();

    int alreadyGone = 0;
    if (!m_graph->disconnect(m_master)) ++alreadyGone;
    if (!m_graph->release(m_master)) ++alreadyGone;
    if (!m_graph->disconnect(m_analyser)) ++alreadyGone;
    if (!m_graph->release(m_analyser)) ++alreadyGone;
    if (alreadyGone > 0) {
        qDebug() << "SynthEngine: master bus had" << alreadyGone << "primitives already released";
    }
    m_master = graph::kInvalidNode;
    m_analyser = graph::kInvalidNode;
    m_graph->close();

    m_state = EngineState::Destroyed;
    qInfo() << "SynthEngine: destroyed";
    emit readyChanged(false);
}

DerivedParameters SynthEngine::currentParameters() const {
    return m_current ? m_current->params : DerivedParameters();
}

void SynthEngine::playTrack(const AssetDescriptor& asset, double elapsedSec) {
    if (m_state != EngineState::Ready) return;

    const DerivedParameters params = deriveParameters(asset);
    const double elapsed = qMax(0.0, elapsedSec);

    // At most one voice is outgoing: a crossfade still in flight is cut short.
    cutOutgoing();

    // Old and new ramps share one start time.
    const double now = m_graph->currentTime();
    const int teardownDelayMs = int(std::lround(m_profile.crossfadeSec * 1000.0)) + m_profile.teardownGraceMs;
    retireCurrent(m_profile.crossfadeSec, teardownDelayMs);

    const NodeId trackGain = m_graph->createGain(0.0);
    if (!m_graph->connect(trackGain, m_analyser)) {
        qWarning() << "SynthEngine: could not route track gain into the master bus";
    }

    std::shared_ptr<OwnedVoice> voice = m_builder.build(params, trackGain, elapsed);
    if (!voice) {
        if (!m_graph->release(trackGain)) qDebug() << "SynthEngine: track gain already released";
        qWarning() << "SynthEngine: no voice built for" << asset.id;
        return;
    }

    const bool ramped = m_graph->setValueAtTime(trackGain, Param::Gain, 0.0, now) &&
                        m_graph->linearRampToValueAtTime(trackGain, Param::Gain, m_profile.voiceGain,
                                                         now + m_profile.crossfadeSec);
    if (!ramped) qWarning() << "SynthEngine: fade-in rejected for voice" << voice->serial;

    m_current = voice;

    const QString json = params.toJsonString();
    qInfo().noquote() << "SynthEngine: playTrack" << asset.id << "at" << elapsed << "s" << json;
    emit trackStarted(asset.id, json);
}

void SynthEngine::stop() {
    if (m_state != EngineState::Ready) return;
    if (!m_current) return;

    cutOutgoing();
    retireCurrent(m_profile.stopFadeSec, m_profile.stopGraceMs);

    qInfo() << "SynthEngine: stop";
    emit playbackStopped();
}

void SynthEngine::retireCurrent(double fadeSec, int teardownDelayMs) {
    if (!m_current) return;

    const NodeId out = m_current->outputGain;
    const double now = m_graph->currentTime();
    // Freeze the gain where it is (mid-ramp included) before fading from there.
    const double from = m_graph->paramValue(out, Param::Gain);
    const bool ramped = m_graph->cancelScheduledValues(out, Param::Gain, now) &&
                        m_graph->setValueAtTime(out, Param::Gain, from, now) &&
                        m_graph->linearRampToValueAtTime(out, Param::Gain, 0.0, now + fadeSec);
    if (!ramped) qWarning() << "SynthEngine: fade-out rejected for voice" << m_current->serial;

    m_outgoing = std::move(m_current);
    scheduleTeardown(m_outgoing, teardownDelayMs);
}

void SynthEngine::cutOutgoing() {
    if (!m_outgoing) return;
    std::shared_ptr<OwnedVoice> voice = std::move(m_outgoing);

    const NodeId out = voice->outputGain;
    const double level = m_graph->paramValue(out, Param::Gain);
    if (m_profile.cutFadeSec <= 0.0 || level <= kSilentGain) {
        teardownVoice(voice);
        return;
    }

    const double now = m_graph->currentTime();
    const bool ramped = m_graph->cancelScheduledValues(out, Param::Gain, now) &&
                        m_graph->setValueAtTime(out, Param::Gain, level, now) &&
                        m_graph->linearRampToValueAtTime(out, Param::Gain, 0.0, now + m_profile.cutFadeSec);
    if (!ramped) {
        qDebug() << "SynthEngine: declick ramp rejected for voice" << voice->serial;
        teardownVoice(voice);
        return;
    }

    m_cutting.push_back(voice);
    scheduleTeardown(voice, int(std::lround(m_profile.cutFadeSec * 1000.0)) + kCutGraceMs);
}

void SynthEngine::teardownVoice(const std::shared_ptr<OwnedVoice>& voice) {
    if (!m_builder.teardown(*voice)) {
        qDebug() << "SynthEngine: voice" << voice->serial << "was already torn down";
    }
}

void SynthEngine::scheduleTeardown(const std::shared_ptr<OwnedVoice>& voice, int delayMs) {
    std::weak_ptr<OwnedVoice> weak = voice;
    QTimer::singleShot(qMax(0, delayMs), Qt::PreciseTimer, this, [this, weak]() {
        std::shared_ptr<OwnedVoice> v = weak.lock();
        if (!v) return;
        const bool first = m_builder.teardown(*v);
        if (m_outgoing == v) m_outgoing.reset();
        m_cutting.removeAll(v);
        if (!first) qDebug() << "SynthEngine: voice" << v->serial << "was already torn down";
    });
}

void SynthEngine::setVolume(double volume) {
    if (m_state != EngineState::Ready) return;
    m_volume = qBound(0.0, volume, 1.0);
    if (m_muted) return;
    if (!m_graph->setTargetAtTime(m_master, Param::Gain, m_volume, m_graph->currentTime(),
                                  m_profile.masterSmoothingSec)) {
        qWarning() << "SynthEngine: master gain rejected volume" << m_volume;
    }
}

void SynthEngine::setMuted(bool muted) {
    if (m_state != EngineState::Ready) return;
    m_muted = muted;
    const double target = m_muted ? 0.0 : m_volume;
    if (!m_graph->setTargetAtTime(m_master, Param::Gain, target, m_graph->currentTime(),
                                  m_profile.masterSmoothingSec)) {
        qWarning() << "SynthEngine: master gain rejected mute" << m_muted;
    }
}

StereoLevels SynthEngine::getLevels() {
    StereoLevels levels;
    if (m_state != EngineState::Ready) return levels;
    if (!m_graph->byteFrequencyData(m_analyser, m_spectrum)) return levels;

    const int half = m_spectrum.size() / 2;
    if (half <= 0) return levels;

    double sumLeft = 0.0;
    double sumRight = 0.0;
    for (int i = 0; i < half; ++i) sumLeft += m_spectrum[i];
    for (int i = half; i < 2 * half; ++i) sumRight += m_spectrum[i];

    const double full = double(half) * 255.0;
    levels.left = std::min(1.0, sumLeft / full * m_profile.meterScale);
    levels.right = std::min(1.0, sumRight / full * m_profile.meterScale);
    return levels;
}

} // namespace airsynth::engine
