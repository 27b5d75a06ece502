#pragma once

#include <QVector>

#include <memory>

#include "airsynth/engine/OwnedVoice.h"
#include "airsynth/engine/ParameterDeriver.h"
#include "airsynth/graph/AudioGraphBuilder.h"

namespace airsynth::engine {

// Builds one synthesized program per asset type against the abstract graph and
// owns the matching retune / retrigger / teardown logic.
//
// Voices never touch the master bus: everything is rooted into the caller's
// crossfade gain stage, which the voice takes over and releases on teardown.
class VoiceBuilder {
public:
    explicit VoiceBuilder(graph::AudioGraphBuilder* graph, double retuneTimeConstantSec = 0.1);

    // Builds the topology for params.assetType, starts its sources now and
    // schedules its chord / chime timers relative to `elapsedSec`.
    std::shared_ptr<OwnedVoice> build(const DerivedParameters& params,
                                      graph::NodeId outputGain,
                                      double elapsedSec);

    // Glides every role-tagged oscillator to `chord` (pad and bell voices only).
    bool retune(OwnedVoice& voice, const QVector<int>& chord);

    // Layers a fresh triad on a chime voice; strikes that have finished are released first.
    // Returns the number of notes added.
    int triggerChime(OwnedVoice& voice);

    // Cancels timers, then stops, disconnects and releases every owned node.
    // Idempotent: true on the first call, false afterwards.
    bool teardown(OwnedVoice& voice);

    // Frequency (Hz) of the tonic in octave 3.
    static double tonicFrequency(const DerivedParameters& params);

private:
    graph::NodeId own(OwnedVoice& voice, graph::NodeId node);
    graph::NodeId ownSource(OwnedVoice& voice, graph::NodeId node, double when, int& failures);

    // Each returns the number of wiring calls the graph rejected.
    int buildPad(OwnedVoice& voice, const QVector<int>& chord);
    int buildBell(OwnedVoice& voice, const QVector<int>& chord);
    int buildNoiseTexture(OwnedVoice& voice);
    int buildDrone(OwnedVoice& voice);

    void startChordSequencer(const std::shared_ptr<OwnedVoice>& voice, double elapsedSec);
    void startChimeSequencer(const std::shared_ptr<OwnedVoice>& voice, double elapsedSec);

    int releaseStrike(const ChimeStrike& strike);

    graph::AudioGraphBuilder* m_graph = nullptr; // not owned
    double m_retuneTau = 0.1;
    quint64 m_nextSerial = 1;
};

} // namespace airsynth::engine
