#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>

#include <array>
#include <memory>

#include "airsynth/engine/ParameterDeriver.h"
#include "airsynth/engine/RetriggerTimer.h"
#include "airsynth/graph/AudioGraphBuilder.h"

namespace airsynth::engine {

enum class VoiceKind {
    Pad,          // "music"
    Bell,         // "jingle"
    NoiseTexture, // "spot"
    Drone,        // "shiur"
    Chime,        // "zmanim"
};

// Exact match on the catalog asset type; anything unknown plays as a pad.
VoiceKind voiceKindForAssetType(const QString& assetType);
QString voiceKindName(VoiceKind kind);

// Pad oscillators for one chord tone, retuned by role on chord changes.
struct PadNote {
    graph::NodeId saw1 = graph::kInvalidNode; // detuned up
    graph::NodeId saw2 = graph::kInvalidNode; // detuned down
    graph::NodeId sub = graph::kInvalidNode;  // sine, one octave below
};

// FM operator pair for one chord tone.
struct BellNote {
    graph::NodeId modulator = graph::kInvalidNode;
    graph::NodeId modDepth = graph::kInvalidNode; // gain stage feeding carrier frequency
    graph::NodeId carrier = graph::kInvalidNode;
};

// One decaying chime tone; released once endTime has passed.
struct ChimeStrike {
    graph::NodeId osc = graph::kInvalidNode;
    graph::NodeId env = graph::kInvalidNode;
    double endTime = 0.0;
};

// Everything one voice created. VoiceBuilder::teardown() consumes it exactly once.
struct OwnedVoice {
    static constexpr int kChordTones = 3;

    quint64 serial = 0;
    VoiceKind kind = VoiceKind::Pad;
    DerivedParameters params;

    // Crossfade gain stage the voice is rooted into (owned, released last).
    graph::NodeId outputGain = graph::kInvalidNode;

    QVector<graph::NodeId> nodes;   // every static node, in creation order
    QVector<graph::NodeId> sources; // subset of nodes that were started

    std::array<PadNote, kChordTones> pad{};
    std::array<BellNote, kChordTones> bell{};
    QVector<ChimeStrike> chimes;

    std::unique_ptr<RetriggerTimer> chordTimer;
    std::unique_ptr<RetriggerTimer> chimeTimer;
    qint64 chordCounter = 0;

    bool tornDown = false;
};

} // namespace airsynth::engine
