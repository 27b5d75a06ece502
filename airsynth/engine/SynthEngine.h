#pragma once

#include <QObject>
#include <QString>
#include <QVector>

#include <memory>

#include "airsynth/engine/AssetDescriptor.h"
#include "airsynth/engine/EngineProfile.h"
#include "airsynth/engine/OwnedVoice.h"
#include "airsynth/engine/ParameterDeriver.h"
#include "airsynth/engine/VoiceBuilder.h"
#include "airsynth/graph/AudioGraphBuilder.h"

namespace airsynth::engine {

// Approximate stereo meter, 0..1 per side. Both sides come from one mono
// spectrum split by bin index (low half = left, high half = right).
struct StereoLevels {
    double left = 0.0;
    double right = 0.0;
};

// Procedural playback engine: one current voice, at most one outgoing voice,
// crossfaded through per-voice gain stages into a shared master bus with a
// metering tap:
//
//   voice -> track gain -> analyser -> master gain -> destination
//
// Everything other than init() is a silent no-op while the engine is not Ready.
class SynthEngine : public QObject {
    Q_OBJECT
public:
    enum class EngineState {
        Uninitialized,
        Ready,
        Destroyed, // terminal
    };

    explicit SynthEngine(graph::AudioGraphBuilder* graph,
                         const EngineProfile& profile = defaultEngineProfile(),
                         QObject* parent = nullptr);
    ~SynthEngine() override;

    // Resumes the output and builds the master bus. Idempotent once Ready.
    // On failure the engine stays Uninitialized and errorOccurred() is emitted.
    bool init();

    // Tears down every voice and releases the output. Irreversible.
    void destroy();

    void playTrack(const AssetDescriptor& asset, double elapsedSec);
    void stop();

    void setVolume(double volume);
    void setMuted(bool muted);

    StereoLevels getLevels();

    bool isReady() const { return m_state == EngineState::Ready; }
    EngineState state() const { return m_state; }
    double volume() const { return m_volume; }
    bool isMuted() const { return m_muted; }
    bool hasCurrentVoice() const { return m_current != nullptr; }
    bool hasOutgoingVoice() const { return m_outgoing != nullptr; }
    // Interrupted outgoing voices still on their declick ramp.
    int cutVoiceCount() const { return int(m_cutting.size()); }
    DerivedParameters currentParameters() const;
    const EngineProfile& profile() const { return m_profile; }

    // Diagnostics
    std::shared_ptr<const OwnedVoice> currentVoice() const { return m_current; }
    std::shared_ptr<const OwnedVoice> outgoingVoice() const { return m_outgoing; }
    graph::NodeId masterGain() const { return m_master; }
    graph::NodeId analyser() const { return m_analyser; }

signals:
    void readyChanged(bool ready);
    void errorOccurred(const QString& message);
    void trackStarted(const QString& assetId, const QString& parametersJson);
    void playbackStopped();

private:
    // Fades the current voice out and hands it to the outgoing slot.
    void retireCurrent(double fadeSec, int teardownDelayMs);
    // Takes the outgoing voice off the slot: torn down at once when silent,
    // otherwise after a cutFadeSec ramp to zero.
    void cutOutgoing();
    void teardownVoice(const std::shared_ptr<OwnedVoice>& voice);
    void scheduleTeardown(const std::shared_ptr<OwnedVoice>& voice, int delayMs);
    bool fail(const QString& message);

    graph::AudioGraphBuilder* m_graph = nullptr; // not owned
    EngineProfile m_profile;
    VoiceBuilder m_builder;

    EngineState m_state = EngineState::Uninitialized;
    graph::NodeId m_master = graph::kInvalidNode;
    graph::NodeId m_analyser = graph::kInvalidNode;

    double m_volume = 0.7;
    bool m_muted = false;

    std::shared_ptr<OwnedVoice> m_current;
    std::shared_ptr<OwnedVoice> m_outgoing;
    QVector<std::shared_ptr<OwnedVoice>> m_cutting;

    QVector<quint8> m_spectrum;
};

} // namespace airsynth::engine
