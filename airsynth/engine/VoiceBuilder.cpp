#include "airsynth/engine/VoiceBuilder.h"

#include "airsynth/engine/ChordClock.h"
#include "airsynth/util/StableHash.h"
#include "airsynth/util/StableRng.h"
#include "music/MusicTheory.h"

#include <QtDebug>

#include <cmath>

namespace airsynth::engine {

using graph::FilterType;
using graph::NodeId;
using graph::Param;
using graph::Waveform;

namespace {

// Pad
constexpr double kPadDetuneUp = 1.003;
constexpr double kPadDetuneDown = 0.997;
constexpr double kPadSawGain = 0.12;
constexpr double kPadSubGain = 0.08;
constexpr double kPadCutoffHz = 800.0;
constexpr double kPadQ = 1.0;
constexpr double kPadLfoHz = 0.3;
constexpr double kPadLfoDepthHz = 200.0;

// Bell (2-op FM)
constexpr double kBellRatio = 3.5;
constexpr double kBellIndex = 2.0;
constexpr double kBellGain = 0.15;

// Noise texture
constexpr double kNoiseSeconds = 2.0;
constexpr double kNoiseQ = 8.0;
constexpr double kNoiseLfoHz = 0.5;
constexpr double kNoiseLfoDepth = 0.5; // x tonic
constexpr double kNoiseGain = 0.25;

// Drone
constexpr double kDroneGain = 0.2;
constexpr double kDroneFifthRatio = 1.5;
constexpr double kDroneFifthGain = 0.5;
constexpr double kDroneTremoloHz = 0.15;
constexpr double kDroneTremoloDepth = 0.06;
constexpr double kDroneCutoffHz = 400.0;

// Chime
constexpr int kChimeOctave = 5;
constexpr double kChimeStaggerSec = 0.15;
constexpr double kChimeAttackSec = 0.01;
constexpr double kChimeDecaySec = 2.0;
constexpr double kChimeLifeSec = 2.5;
constexpr double kChimePeak = 0.2;
constexpr double kChimeFloor = 0.001;

constexpr int kTonicOctave = 3;

} // namespace

VoiceKind voiceKindForAssetType(const QString& assetType) {
    if (assetType == "music") return VoiceKind::Pad;
    if (assetType == "jingle") return VoiceKind::Bell;
    if (assetType == "spot") return VoiceKind::NoiseTexture;
    if (assetType == "shiur") return VoiceKind::Drone;
    if (assetType == "zmanim") return VoiceKind::Chime;
    return VoiceKind::Pad;
}

QString voiceKindName(VoiceKind kind) {
    switch (kind) {
    case VoiceKind::Pad: return "pad";
    case VoiceKind::Bell: return "bell";
    case VoiceKind::NoiseTexture: return "noise";
    case VoiceKind::Drone: return "drone";
    case VoiceKind::Chime: return "chime";
    }
    return "pad";
}

VoiceBuilder::VoiceBuilder(graph::AudioGraphBuilder* graph, double retuneTimeConstantSec)
    : m_graph(graph), m_retuneTau(retuneTimeConstantSec) {}

double VoiceBuilder::tonicFrequency(const DerivedParameters& params) {
    return music::noteFrequency(music::scaleNoteToMidi(params.rootNote, params.mode, 0, kTonicOctave));
}

NodeId VoiceBuilder::own(OwnedVoice& voice, NodeId node) {
    if (node != graph::kInvalidNode) voice.nodes.push_back(node);
    return node;
}

NodeId VoiceBuilder::ownSource(OwnedVoice& voice, NodeId node, double when, int& failures) {
    own(voice, node);
    if (m_graph->start(node, when)) {
        voice.sources.push_back(node);
    } else {
        ++failures;
    }
    return node;
}

std::shared_ptr<OwnedVoice> VoiceBuilder::build(const DerivedParameters& params,
                                                NodeId outputGain,
                                                double elapsedSec) {
    if (!m_graph) return nullptr;

    auto voice = std::make_shared<OwnedVoice>();
    voice->serial = m_nextSerial++;
    voice->kind = voiceKindForAssetType(params.assetType);
    voice->params = params;
    voice->outputGain = outputGain;

    const double elapsed = qMax(0.0, elapsedSec);
    int failures = 0;
    switch (voice->kind) {
    case VoiceKind::Pad:
        failures = buildPad(*voice, chordAtTime(params, elapsed));
        startChordSequencer(voice, elapsed);
        break;
    case VoiceKind::Bell:
        failures = buildBell(*voice, chordAtTime(params, elapsed));
        startChordSequencer(voice, elapsed);
        break;
    case VoiceKind::NoiseTexture:
        failures = buildNoiseTexture(*voice);
        break;
    case VoiceKind::Drone:
        failures = buildDrone(*voice);
        break;
    case VoiceKind::Chime:
        triggerChime(*voice);
        startChimeSequencer(voice, elapsed);
        break;
    }

    if (failures > 0) {
        qWarning() << "VoiceBuilder: graph rejected" << failures << "calls while building"
                   << voiceKindName(voice->kind) << "voice" << voice->serial;
    }
    qDebug() << "VoiceBuilder: built" << voiceKindName(voice->kind) << "voice" << voice->serial
             << "nodes=" << voice->nodes.size() << "strikes=" << voice->chimes.size();
    return voice;
}

int VoiceBuilder::buildPad(OwnedVoice& voice, const QVector<int>& chord) {
    int failures = 0;
    auto ok = [&](bool r) { if (!r) ++failures; };
    const double now = m_graph->currentTime();
    const NodeId out = voice.outputGain;

    const NodeId filter = own(voice, m_graph->createFilter(FilterType::Lowpass, kPadCutoffHz, kPadQ));
    ok(m_graph->connect(filter, out));

    const NodeId lfo = ownSource(voice, m_graph->createOscillator(Waveform::Sine, kPadLfoHz), now, failures);
    const NodeId lfoDepth = own(voice, m_graph->createGain(kPadLfoDepthHz));
    ok(m_graph->connect(lfo, lfoDepth));
    ok(m_graph->connectParam(lfoDepth, filter, Param::Frequency));

    const int tones = qMin(OwnedVoice::kChordTones, chord.size());
    for (int i = 0; i < tones; ++i) {
        const double f = music::noteFrequency(chord[i]);
        PadNote& note = voice.pad[size_t(i)];

        note.saw1 = ownSource(voice, m_graph->createOscillator(Waveform::Sawtooth, f * kPadDetuneUp), now, failures);
        note.saw2 = ownSource(voice, m_graph->createOscillator(Waveform::Sawtooth, f * kPadDetuneDown), now, failures);
        note.sub = ownSource(voice, m_graph->createOscillator(Waveform::Sine, f * 0.5), now, failures);

        const NodeId g1 = own(voice, m_graph->createGain(kPadSawGain));
        const NodeId g2 = own(voice, m_graph->createGain(kPadSawGain));
        const NodeId g3 = own(voice, m_graph->createGain(kPadSubGain));
        ok(m_graph->connect(note.saw1, g1));
        ok(m_graph->connect(note.saw2, g2));
        ok(m_graph->connect(note.sub, g3));
        ok(m_graph->connect(g1, filter));
        ok(m_graph->connect(g2, filter));
        ok(m_graph->connect(g3, filter));
    }
    return failures;
}

int VoiceBuilder::buildBell(OwnedVoice& voice, const QVector<int>& chord) {
    int failures = 0;
    auto ok = [&](bool r) { if (!r) ++failures; };
    const double now = m_graph->currentTime();

    const int tones = qMin(OwnedVoice::kChordTones, chord.size());
    for (int i = 0; i < tones; ++i) {
        const double f = music::noteFrequency(chord[i]);
        BellNote& note = voice.bell[size_t(i)];

        note.modulator = ownSource(voice, m_graph->createOscillator(Waveform::Sine, f * kBellRatio), now, failures);
        note.modDepth = own(voice, m_graph->createGain(f * kBellIndex));
        note.carrier = ownSource(voice, m_graph->createOscillator(Waveform::Sine, f), now, failures);
        ok(m_graph->connect(note.modulator, note.modDepth));
        ok(m_graph->connectParam(note.modDepth, note.carrier, Param::Frequency));

        // Static level: the bell has no envelope.
        const NodeId amp = own(voice, m_graph->createGain(kBellGain));
        ok(m_graph->connect(note.carrier, amp));
        ok(m_graph->connect(amp, voice.outputGain));
    }
    return failures;
}

int VoiceBuilder::buildNoiseTexture(OwnedVoice& voice) {
    int failures = 0;
    auto ok = [&](bool r) { if (!r) ++failures; };
    const double now = m_graph->currentTime();
    const double tonic = tonicFrequency(voice.params);

    // Seeded from the parameters so a resumed spot sounds the same.
    util::StableRng rng(util::StableHash::poly31(voice.params.toJsonString()));
    const int frames = int(kNoiseSeconds * m_graph->sampleRate());
    QVector<float> samples(frames);
    for (int i = 0; i < frames; ++i) samples[i] = float(rng.nextDouble01() * 2.0 - 1.0);

    const NodeId noise = ownSource(voice, m_graph->createNoiseSource(samples, true), now, failures);
    const NodeId band = own(voice, m_graph->createFilter(FilterType::Bandpass, tonic * 2.0, kNoiseQ));
    const NodeId amp = own(voice, m_graph->createGain(kNoiseGain));
    ok(m_graph->connect(noise, band));
    ok(m_graph->connect(band, amp));
    ok(m_graph->connect(amp, voice.outputGain));

    const NodeId lfo = ownSource(voice, m_graph->createOscillator(Waveform::Sine, kNoiseLfoHz), now, failures);
    const NodeId lfoDepth = own(voice, m_graph->createGain(tonic * kNoiseLfoDepth));
    ok(m_graph->connect(lfo, lfoDepth));
    ok(m_graph->connectParam(lfoDepth, band, Param::Frequency));
    return failures;
}

int VoiceBuilder::buildDrone(OwnedVoice& voice) {
    int failures = 0;
    auto ok = [&](bool r) { if (!r) ++failures; };
    const double now = m_graph->currentTime();
    const double tonic = tonicFrequency(voice.params);

    const NodeId vca = own(voice, m_graph->createGain(kDroneGain));
    const NodeId lowpass = own(voice, m_graph->createFilter(FilterType::Lowpass, kDroneCutoffHz, 1.0));
    ok(m_graph->connect(vca, lowpass));
    ok(m_graph->connect(lowpass, voice.outputGain));

    const NodeId root = ownSource(voice, m_graph->createOscillator(Waveform::Sine, tonic), now, failures);
    ok(m_graph->connect(root, vca));

    const NodeId fifth = ownSource(voice, m_graph->createOscillator(Waveform::Sine, tonic * kDroneFifthRatio), now, failures);
    const NodeId fifthGain = own(voice, m_graph->createGain(kDroneFifthGain));
    ok(m_graph->connect(fifth, fifthGain));
    ok(m_graph->connect(fifthGain, vca));

    const NodeId tremolo = ownSource(voice, m_graph->createOscillator(Waveform::Sine, kDroneTremoloHz), now, failures);
    const NodeId tremoloDepth = own(voice, m_graph->createGain(kDroneTremoloDepth));
    ok(m_graph->connect(tremolo, tremoloDepth));
    ok(m_graph->connectParam(tremoloDepth, vca, Param::Gain));
    return failures;
}

int VoiceBuilder::triggerChime(OwnedVoice& voice) {
    if (voice.tornDown || !m_graph) return 0;
    const double now = m_graph->currentTime();

    // Drop strikes that have rung out.
    int alreadyGone = 0;
    for (int i = voice.chimes.size() - 1; i >= 0; --i) {
        if (voice.chimes[i].endTime > now) continue;
        alreadyGone += releaseStrike(voice.chimes[i]);
        voice.chimes.remove(i);
    }
    if (alreadyGone > 0) {
        qDebug() << "VoiceBuilder: chime voice" << voice.serial << "found" << alreadyGone << "released primitives";
    }

    const QVector<int> triad = music::buildChord(voice.params.rootNote, voice.params.mode, 0, kChimeOctave);
    const int tones = qMin(OwnedVoice::kChordTones, triad.size());
    int failures = 0;
    auto ok = [&](bool r) { if (!r) ++failures; };
    for (int i = 0; i < tones; ++i) {
        const double onset = now + i * kChimeStaggerSec;
        ChimeStrike strike;
        strike.osc = m_graph->createOscillator(Waveform::Sine, music::noteFrequency(triad[i]));
        strike.env = m_graph->createGain(0.0);
        strike.endTime = onset + kChimeLifeSec;

        ok(m_graph->setValueAtTime(strike.env, Param::Gain, 0.0, onset));
        ok(m_graph->linearRampToValueAtTime(strike.env, Param::Gain, kChimePeak, onset + kChimeAttackSec));
        ok(m_graph->exponentialRampToValueAtTime(strike.env, Param::Gain, kChimeFloor, onset + kChimeDecaySec));
        ok(m_graph->connect(strike.osc, strike.env));
        ok(m_graph->connect(strike.env, voice.outputGain));
        ok(m_graph->start(strike.osc, onset));
        ok(m_graph->stop(strike.osc, strike.endTime));
        voice.chimes.push_back(strike);
    }
    if (failures > 0) {
        qWarning() << "VoiceBuilder: graph rejected" << failures << "calls while striking chime voice" << voice.serial;
    }
    return tones;
}

bool VoiceBuilder::retune(OwnedVoice& voice, const QVector<int>& chord) {
    if (voice.tornDown || !m_graph) return false;
    if (voice.kind != VoiceKind::Pad && voice.kind != VoiceKind::Bell) return false;

    const double now = m_graph->currentTime();
    const int tones = qMin(OwnedVoice::kChordTones, chord.size());
    bool ok = true;
    for (int i = 0; i < tones; ++i) {
        const double f = music::noteFrequency(chord[i]);
        if (voice.kind == VoiceKind::Pad) {
            const PadNote& note = voice.pad[size_t(i)];
            if (note.saw1 == graph::kInvalidNode) continue;
            ok = m_graph->setTargetAtTime(note.saw1, Param::Frequency, f * kPadDetuneUp, now, m_retuneTau) && ok;
            ok = m_graph->setTargetAtTime(note.saw2, Param::Frequency, f * kPadDetuneDown, now, m_retuneTau) && ok;
            ok = m_graph->setTargetAtTime(note.sub, Param::Frequency, f * 0.5, now, m_retuneTau) && ok;
        } else {
            const BellNote& note = voice.bell[size_t(i)];
            if (note.carrier == graph::kInvalidNode) continue;
            ok = m_graph->setTargetAtTime(note.carrier, Param::Frequency, f, now, m_retuneTau) && ok;
            ok = m_graph->setTargetAtTime(note.modulator, Param::Frequency, f * kBellRatio, now, m_retuneTau) && ok;
            ok = m_graph->setTargetAtTime(note.modDepth, Param::Gain, f * kBellIndex, now, m_retuneTau) && ok;
        }
    }
    return ok;
}

void VoiceBuilder::startChordSequencer(const std::shared_ptr<OwnedVoice>& voice, double elapsedSec) {
    const double spc = secondsPerChord(voice->params);
    voice->chordCounter = qint64(std::floor(elapsedSec / spc));
    voice->chordTimer = std::make_unique<RetriggerTimer>();

    std::weak_ptr<OwnedVoice> weak = voice;
    voice->chordTimer->start(secondsUntilNextBoundary(spc, elapsedSec), spc, [this, weak]() {
        std::shared_ptr<OwnedVoice> v = weak.lock();
        if (!v || v->tornDown) return;
        ++v->chordCounter;
        if (!retune(*v, chordForCounter(v->params, v->chordCounter))) {
            qDebug() << "VoiceBuilder: retune rejected for voice" << v->serial;
        }
    });
}

void VoiceBuilder::startChimeSequencer(const std::shared_ptr<OwnedVoice>& voice, double elapsedSec) {
    const double period = secondsPerChime(voice->params);
    voice->chimeTimer = std::make_unique<RetriggerTimer>();

    std::weak_ptr<OwnedVoice> weak = voice;
    voice->chimeTimer->start(secondsUntilNextBoundary(period, elapsedSec), period, [this, weak]() {
        std::shared_ptr<OwnedVoice> v = weak.lock();
        if (!v || v->tornDown) return;
        triggerChime(*v);
    });
}

int VoiceBuilder::releaseStrike(const ChimeStrike& strike) {
    int alreadyGone = 0;
    if (!m_graph->stop(strike.osc, m_graph->currentTime())) ++alreadyGone;
    if (!m_graph->disconnect(strike.osc)) ++alreadyGone;
    if (!m_graph->disconnect(strike.env)) ++alreadyGone;
    if (!m_graph->release(strike.osc)) ++alreadyGone;
    if (!m_graph->release(strike.env)) ++alreadyGone;
    return alreadyGone;
}

bool VoiceBuilder::teardown(OwnedVoice& voice) {
    if (voice.tornDown) return false;
    voice.tornDown = true;

    int alreadyGone = 0;
    if (voice.chordTimer && !voice.chordTimer->cancel()) ++alreadyGone;
    if (voice.chimeTimer && !voice.chimeTimer->cancel()) ++alreadyGone;

    if (m_graph) {
        const double now = m_graph->currentTime();
        for (NodeId n : voice.sources) {
            if (!m_graph->stop(n, now)) ++alreadyGone;
        }
        for (const ChimeStrike& strike : voice.chimes) alreadyGone += releaseStrike(strike);
        for (NodeId n : voice.nodes) {
            if (!m_graph->disconnect(n)) ++alreadyGone;
        }
        for (NodeId n : voice.nodes) {
            if (!m_graph->release(n)) ++alreadyGone;
        }
        if (voice.outputGain != graph::kInvalidNode) {
            if (!m_graph->disconnect(voice.outputGain)) ++alreadyGone;
            if (!m_graph->release(voice.outputGain)) ++alreadyGone;
        }
    }

    voice.chimes.clear();
    voice.nodes.clear();
    voice.sources.clear();
    voice.pad = {};
    voice.bell = {};
    voice.outputGain = graph::kInvalidNode;

    if (alreadyGone > 0) {
        qDebug() << "VoiceBuilder: voice" << voice.serial << "teardown found" << alreadyGone
                 << "primitives already released";
    }
    return true;
}

} // namespace airsynth::engine
