#include "airsynth/engine/ChordClock.h"
#include "airsynth/engine/ListenerSession.h"
#include "airsynth/engine/OwnedVoice.h"
#include "airsynth/engine/SynthEngine.h"
#include "airsynth/engine/VoiceBuilder.h"
#include "airsynth/graph/AudioParam.h"
#include "airsynth/graph/DspGraph.h"
#include "music/MusicTheory.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QElapsedTimer>
#include <QSettings>
#include <QTemporaryDir>
#include <QtGlobal>

#include <algorithm>
#include <cmath>

using airsynth::engine::AssetDescriptor;
using airsynth::engine::DerivedParameters;
using airsynth::engine::ListenerSession;
using airsynth::engine::OwnedVoice;
using airsynth::engine::SynthEngine;
using airsynth::engine::VoiceBuilder;
using airsynth::engine::VoiceKind;
using airsynth::graph::AudioParam;
using airsynth::graph::DspGraph;
using airsynth::graph::FilterType;
using airsynth::graph::NodeId;
using airsynth::graph::Param;
using airsynth::graph::Waveform;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectNear(double a, double b, double tol, const QString& msg) {
    expect(std::fabs(a - b) <= tol, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void pumpEvents(int ms) {
    QElapsedTimer t;
    t.start();
    while (t.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }
}

static AssetDescriptor makeAsset(const QString& id, const QString& type) {
    AssetDescriptor a;
    a.id = id;
    a.title = QString("Title %1").arg(id);
    a.artist = "Station";
    a.assetType = type;
    a.category = "test";
    return a;
}

static DerivedParameters makeParams(const QString& type, int tempo = 120) {
    DerivedParameters p;
    p.rootNote = 0;
    p.mode = music::Mode::Major;
    p.tempo = tempo;
    p.progression = {0, 4, 5, 3};
    p.assetType = type;
    return p;
}

// Output gain routed to the destination, handed to the builder.
static NodeId makeOutput(DspGraph& g) {
    const NodeId out = g.createGain(1.0);
    g.connect(out, g.destination());
    return out;
}

static QVector<NodeId> allNodesOf(const OwnedVoice& v) {
    QVector<NodeId> ids = v.nodes;
    ids.push_back(v.outputGain);
    for (const auto& s : v.chimes) {
        ids.push_back(s.osc);
        ids.push_back(s.env);
    }
    return ids;
}

class FailingGraph : public DspGraph {
public:
    bool resume() override { return false; }
};

} // namespace

static void testAudioParamTimeline() {
    AudioParam linear(1.0);
    linear.setValueAtTime(0.0, 1.0);
    linear.linearRampToValueAtTime(1.0, 2.0);
    expectNear(linear.valueAt(0.5), 1.0, 1e-12, "value holds before the first event");
    expectNear(linear.valueAt(1.5), 0.5, 1e-12, "linear ramp midpoint");
    expectNear(linear.valueAt(3.0), 1.0, 1e-12, "linear ramp end value holds");

    AudioParam expo(1.0);
    expo.setValueAtTime(1.0, 0.0);
    expo.exponentialRampToValueAtTime(0.01, 2.0);
    expectNear(expo.valueAt(1.0), 0.1, 1e-9, "exponential ramp midpoint is geometric");

    AudioParam target(0.0);
    target.setTargetAtTime(1.0, 0.0, 0.1);
    expectNear(target.valueAt(0.1), 1.0 - std::exp(-1.0), 1e-9, "setTarget after one time constant");
    expectNear(target.valueAt(2.0), 1.0, 1e-6, "setTarget converges");

    AudioParam cancelled(0.0);
    cancelled.setValueAtTime(0.5, 0.0);
    cancelled.linearRampToValueAtTime(1.0, 2.0);
    cancelled.cancelScheduledValues(1.0);
    expectEq(cancelled.pendingEventCount(), 1, "cancel drops events at or after its time");
    expectNear(cancelled.valueAt(3.0), 0.5, 1e-12, "cancelled ramp leaves the held value");

    AudioParam pruned(0.0);
    pruned.setValueAtTime(0.0, 0.0);
    pruned.linearRampToValueAtTime(1.0, 1.0);
    const double before = pruned.valueAt(1.5);
    pruned.prune(1.2);
    expectEq(pruned.pendingEventCount(), 0, "prune folds elapsed events");
    expectNear(pruned.valueAt(1.5), before, 1e-12, "prune keeps the value");
    expect(pruned.isStatic(), "folded timeline is static");
}

static void testDspGraphWiring() {
    DspGraph g(48000);
    expectEq(g.nodeCount(), 0, "fresh graph has only the destination");
    expect(g.resume() && g.isRunning(), "offline graph resumes");

    const NodeId osc = g.createOscillator(Waveform::Sine, 440.0);
    const NodeId gain = g.createGain(0.5);
    expect(g.connect(osc, gain), "osc -> gain");
    expect(g.connect(gain, g.destination()), "gain -> destination");
    expect(!g.connect(gain, osc), "nothing feeds an oscillator's audio input");
    expect(!g.setValueAtTime(osc, Param::Gain, 1.0, 0.0), "oscillators have no gain param");
    expect(!g.stop(osc, 0.0), "stop before start is rejected");

    // Silent until the scheduled start.
    expect(g.start(osc, 0.5), "start");
    expect(!g.start(osc, 0.6), "second start is rejected");
    QVector<float> buf(12000);
    g.render(buf.data(), buf.size());
    float peak = 0.0f;
    for (float s : buf) peak = std::max(peak, std::fabs(s));
    expectNear(peak, 0.0, 1e-9, "silence before start");

    g.renderSeconds(0.3);
    g.render(buf.data(), 4800);
    peak = 0.0f;
    for (int i = 0; i < 4800; ++i) peak = std::max(peak, std::fabs(buf[i]));
    expect(peak > 0.45f && peak <= 0.5001f, QString("sine through 0.5 gain peaks at 0.5 (got %1)").arg(peak));
    expect(g.currentTime() > 0.6, "clock advances with rendering");

    expect(g.stop(osc, g.currentTime()), "stop after start");
    g.renderSeconds(0.01);
    g.render(buf.data(), 4800);
    peak = 0.0f;
    for (int i = 0; i < 4800; ++i) peak = std::max(peak, std::fabs(buf[i]));
    expectNear(peak, 0.0, 1e-9, "silence after stop");

    expect(g.inputsOf(gain).contains(osc), "gain lists osc as input");
    expect(g.disconnect(osc), "disconnect");
    expect(!g.inputsOf(gain).contains(osc), "disconnect drops the edge");
    expect(g.release(osc), "release");
    expect(!g.release(osc), "second release is rejected");
    expect(!g.disconnect(osc), "disconnect of a released node is rejected");
    expect(!g.hasNode(osc), "released node is gone");
    expect(!g.release(g.destination()), "destination cannot be released");

    // Releasing a sink unlinks its sources.
    const NodeId lfo = g.createOscillator(Waveform::Sine, 1.0);
    const NodeId depth = g.createGain(100.0);
    const NodeId filter = g.createFilter(FilterType::Lowpass, 500.0, 1.0);
    expect(g.connect(lfo, depth), "lfo -> depth");
    expect(g.connectParam(depth, filter, Param::Frequency), "depth -> filter.frequency");
    expect(g.paramInputsOf(filter, Param::Frequency).contains(depth), "param input recorded");
    expect(g.release(filter), "release filter");
    DspGraph::NodeInfo info;
    expect(g.nodeInfo(depth, info) && info.outputCount == 0, "source edge to a released node is gone");
    expect(g.nodeInfo(lfo, info) && info.kind == DspGraph::NodeKind::Oscillator, "node info kind");
}

static void testDspGraphFilterAndAnalyser() {
    DspGraph g(48000);
    const NodeId osc = g.createOscillator(Waveform::Square, 5000.0);
    const NodeId lowpass = g.createFilter(FilterType::Lowpass, 200.0, 0.707);
    const NodeId analyser = g.createAnalyser(256);
    g.connect(osc, lowpass);
    g.connect(lowpass, analyser);
    g.connect(analyser, g.destination());

    QVector<quint8> bins;
    expect(g.byteFrequencyData(analyser, bins), "analyser data");
    expectEq(bins.size(), 128, "fftSize/2 bins");
    expect(std::all_of(bins.begin(), bins.end(), [](quint8 b) { return b == 0; }), "silence reads as zero");
    expect(!g.byteFrequencyData(osc, bins), "oscillator is not an analyser");

    g.start(osc, 0.0);
    g.renderSeconds(0.2);
    QVector<float> buf(4800);
    g.render(buf.data(), buf.size());
    float peak = 0.0f;
    for (float s : buf) peak = std::max(peak, std::fabs(s));
    expect(peak < 0.05f, QString("lowpass at 200 Hz removes a 5 kHz square (got %1)").arg(peak));

    DspGraph loud(48000);
    const NodeId tone = loud.createOscillator(Waveform::Sine, 1000.0);
    const NodeId tap = loud.createAnalyser(256);
    loud.connect(tone, tap);
    loud.connect(tap, loud.destination());
    loud.start(tone, 0.0);
    loud.renderSeconds(0.1);
    expect(loud.byteFrequencyData(tap, bins), "analyser data with a tone");
    const auto maxIt = std::max_element(bins.begin(), bins.end());
    expect(*maxIt > 0, "tone shows up in the spectrum");
    // 1 kHz at 187.5 Hz per bin lands in bin 5.
    expect(bins[5] == *maxIt, "tone peaks in its bin");
}

static void testVoiceTopologies() {
    const double tonic = music::noteFrequency(48); // C3

    {
        DspGraph g;
        VoiceBuilder b(&g);
        const NodeId out = makeOutput(g);
        auto v = b.build(makeParams("music"), out, 0.0);
        expect(v && v->kind == VoiceKind::Pad, "music builds a pad");
        if (!v) return;
        expectEq(v->nodes.size(), 21, "pad node count");
        expectEq(v->sources.size(), 10, "pad source count");
        expect(v->chordTimer && v->chordTimer->isActive(), "pad has a chord timer");
        expect(!v->chimeTimer, "pad has no chime timer");
        DspGraph::NodeInfo info;
        expect(g.nodeInfo(v->pad[0].saw1, info) && info.waveform == Waveform::Sawtooth, "saw1 is a sawtooth");
        expect(g.nodeInfo(v->pad[0].sub, info) && info.waveform == Waveform::Sine, "sub is a sine");
        const double f = music::noteFrequency(48);
        expectNear(g.paramValue(v->pad[0].saw1, Param::Frequency), f * 1.003, 1e-6, "saw1 detuned up");
        expectNear(g.paramValue(v->pad[0].saw2, Param::Frequency), f * 0.997, 1e-6, "saw2 detuned down");
        expectNear(g.paramValue(v->pad[0].sub, Param::Frequency), f * 0.5, 1e-6, "sub one octave down");
        expectNear(g.paramValue(v->pad[1].saw1, Param::Frequency), music::noteFrequency(52) * 1.003, 1e-6, "second tone is the third");
        expect(b.teardown(*v), "pad teardown");
        expectEq(g.nodeCount(), 0, "pad teardown releases everything, output gain included");
    }

    {
        DspGraph g;
        VoiceBuilder b(&g);
        auto v = b.build(makeParams("jingle"), makeOutput(g), 0.0);
        expect(v && v->kind == VoiceKind::Bell, "jingle builds a bell");
        if (!v) return;
        expectEq(v->nodes.size(), 12, "bell node count");
        expectEq(v->sources.size(), 6, "bell source count");
        const double f = music::noteFrequency(48);
        expect(g.paramInputsOf(v->bell[0].carrier, Param::Frequency).contains(v->bell[0].modDepth),
               "modulator depth drives carrier frequency");
        expectNear(g.paramValue(v->bell[0].modulator, Param::Frequency), f * 3.5, 1e-6, "modulator ratio");
        expectNear(g.paramValue(v->bell[0].modDepth, Param::Gain), f * 2.0, 1e-6, "modulation index");
        expect(v->chordTimer != nullptr, "bell has a chord timer");
        expect(b.teardown(*v), "bell teardown");
        expectEq(g.nodeCount(), 0, "bell teardown releases everything");
    }

    {
        DspGraph g;
        VoiceBuilder b(&g);
        auto v = b.build(makeParams("spot"), makeOutput(g), 0.0);
        expect(v && v->kind == VoiceKind::NoiseTexture, "spot builds a noise texture");
        if (!v) return;
        expectEq(v->nodes.size(), 5, "noise node count");
        expectEq(v->sources.size(), 2, "noise source count");
        expect(!v->chordTimer && !v->chimeTimer, "noise has no timers");
        NodeId band = airsynth::graph::kInvalidNode;
        for (NodeId n : v->nodes) {
            DspGraph::NodeInfo info;
            if (g.nodeInfo(n, info) && info.kind == DspGraph::NodeKind::Filter) band = n;
        }
        DspGraph::NodeInfo info;
        expect(g.nodeInfo(band, info) && info.filterType == FilterType::Bandpass, "bandpass filter present");
        expectNear(g.paramValue(band, Param::Frequency), tonic * 2.0, 1e-6, "band centred on twice the tonic");
        expectEq(g.paramInputsOf(band, Param::Frequency).size(), 1, "band centre is swept");
        expect(b.teardown(*v), "noise teardown");
    }

    {
        DspGraph g;
        VoiceBuilder b(&g);
        auto v = b.build(makeParams("shiur"), makeOutput(g), 0.0);
        expect(v && v->kind == VoiceKind::Drone, "shiur builds a drone");
        if (!v) return;
        expectEq(v->nodes.size(), 7, "drone node count");
        expectEq(v->sources.size(), 3, "drone source count");
        int sines = 0;
        bool sawFifth = false;
        for (NodeId n : v->sources) {
            DspGraph::NodeInfo info;
            if (g.nodeInfo(n, info) && info.waveform == Waveform::Sine) ++sines;
            if (std::fabs(g.paramValue(n, Param::Frequency) - tonic * 1.5) < 1e-6) sawFifth = true;
        }
        expectEq(sines, 3, "drone is all sines");
        expect(sawFifth, "drone carries the perfect fifth");
        expect(b.teardown(*v), "drone teardown");
    }

    {
        DspGraph g;
        VoiceBuilder b(&g);
        auto v = b.build(makeParams("zmanim"), makeOutput(g), 0.0);
        expect(v && v->kind == VoiceKind::Chime, "zmanim builds a chime");
        if (!v) return;
        expectEq(v->nodes.size(), 0, "chime has no static nodes");
        expectEq(v->chimes.size(), 3, "first strike is a triad");
        expect(v->chimeTimer && v->chimeTimer->isActive(), "chime has a retrigger timer");
        DspGraph::NodeInfo info;
        for (int i = 0; i < v->chimes.size(); ++i) {
            expect(g.nodeInfo(v->chimes[i].osc, info), "strike oscillator exists");
            expectNear(info.startTime, 0.15 * i, 1e-9, QString("strike %1 onset is staggered").arg(i));
            expectNear(info.stopTime, 0.15 * i + 2.5, 1e-9, QString("strike %1 stops after 2.5 s").arg(i));
        }
        expectNear(g.paramValue(v->chimes[0].osc, Param::Frequency), music::noteFrequency(72), 1e-6, "chime in octave 5");
        expect(b.teardown(*v), "chime teardown");
        expectEq(g.nodeCount(), 0, "chime teardown releases strikes");
    }

    {
        DspGraph g;
        VoiceBuilder b(&g);
        auto v = b.build(makeParams("promo"), makeOutput(g), 0.0);
        expect(v && v->kind == VoiceKind::Pad, "unknown asset types play as a pad");
        if (v) expect(b.teardown(*v), "fallback teardown");
    }
}

static void testRetuneByRole() {
    DspGraph g;
    VoiceBuilder b(&g);
    const DerivedParameters p = makeParams("music", 140);
    const double spc = airsynth::engine::secondsPerChord(p);
    auto v = b.build(p, makeOutput(g), spc - 0.05);
    if (!v) {
        expect(false, "pad built for retune");
        return;
    }
    const int nodesBefore = g.nodeCount();
    expectNear(g.paramValue(v->pad[0].saw1, Param::Frequency), music::noteFrequency(48) * 1.003, 1e-6,
               "starts on progression[0]");

    pumpEvents(400);
    expectEq(v->chordTimer->firedCount(), 1, "chord boundary fired once");
    expect(v->chordCounter == 1, "chord counter advanced");

    // Glide settles within a few time constants.
    g.renderSeconds(1.0);
    const QVector<int> g3 = music::buildChord(0, music::Mode::Major, 4, 3); // G B D
    for (int i = 0; i < 3; ++i) {
        const double f = music::noteFrequency(g3[i]);
        expectNear(g.paramValue(v->pad[size_t(i)].saw1, Param::Frequency), f * 1.003, f * 0.001, "saw1 retuned");
        expectNear(g.paramValue(v->pad[size_t(i)].saw2, Param::Frequency), f * 0.997, f * 0.001, "saw2 retuned");
        expectNear(g.paramValue(v->pad[size_t(i)].sub, Param::Frequency), f * 0.5, f * 0.001, "sub retuned");
    }
    expectEq(g.nodeCount(), nodesBefore, "retune creates no nodes");

    auto drone = b.build(makeParams("shiur"), makeOutput(g), 0.0);
    expect(drone && !b.retune(*drone, g3), "drones are not retuned");
    expect(b.teardown(*v), "teardown after retune");
    expect(!b.retune(*v, g3), "torn-down voice is not retuned");
    if (drone) expect(b.teardown(*drone), "drone teardown");
}

static void testChimeLayeringAndPruning() {
    DspGraph g;
    VoiceBuilder b(&g);
    const NodeId out = makeOutput(g);
    auto v = b.build(makeParams("zmanim"), out, 0.0);
    if (!v) {
        expect(false, "chime built");
        return;
    }
    expectEq(b.triggerChime(*v), 3, "retrigger adds a triad");
    expectEq(v->chimes.size(), 6, "strikes layer without cancelling");
    expectEq(g.nodeCount(), 1 + 12, "six strikes hold two nodes each");

    g.renderSeconds(3.0);
    expectEq(b.triggerChime(*v), 3, "late retrigger");
    expectEq(v->chimes.size(), 3, "rung-out strikes are released");
    expectEq(g.nodeCount(), 1 + 6, "only live strikes hold nodes");

    expect(b.teardown(*v), "chime teardown");
    expectEq(b.triggerChime(*v), 0, "torn-down chime does not strike");
}

static void testChimeRetriggerTimer() {
    DspGraph g;
    VoiceBuilder b(&g);

    // First strike lands on the next 8-beat boundary of the elapsed offset.
    const DerivedParameters slow = makeParams("zmanim", 140);
    auto v = b.build(slow, makeOutput(g), airsynth::engine::secondsPerChime(slow) - 0.05);
    if (!v) {
        expect(false, "chime built");
        return;
    }
    expectEq(v->chimes.size(), 3, "triad on construction");
    pumpEvents(400);
    expectEq(v->chimeTimer->firedCount(), 1, "retrigger fires at the phase-aligned boundary");
    expectEq(v->chimes.size(), 6, "retrigger layers a second triad");
    expect(b.teardown(*v), "slow chime teardown");

    // Repeats every period (1 s at 480 bpm).
    const DerivedParameters fast = makeParams("zmanim", 480);
    expectNear(airsynth::engine::secondsPerChime(fast), 1.0, 1e-12, "8 beats at 480 bpm");
    auto w = b.build(fast, makeOutput(g), 0.95);
    if (!w) {
        expect(false, "fast chime built");
        return;
    }
    pumpEvents(400);
    expectEq(w->chimeTimer->firedCount(), 1, "first retrigger");
    pumpEvents(1000);
    expectEq(w->chimeTimer->firedCount(), 2, "second retrigger one period later");
    expectEq(w->chimes.size(), 9, "each retrigger layers a triad");

    // A callback that finds its voice torn down does nothing.
    w->tornDown = true;
    const int nodesBefore = g.nodeCount();
    pumpEvents(1100);
    expectEq(w->chimeTimer->firedCount(), 3, "uncancelled timer keeps firing");
    expectEq(w->chimes.size(), 9, "torn-down voice gets no new strikes");
    expectEq(g.nodeCount(), nodesBefore, "torn-down voice creates no nodes");

    // Same for the chord sequencer.
    const DerivedParameters padParams = makeParams("music", 480);
    auto pad = b.build(padParams, makeOutput(g), airsynth::engine::secondsPerChord(padParams) - 0.05);
    if (!pad) {
        expect(false, "pad built");
        return;
    }
    const double saw1Before = g.paramValue(pad->pad[0].saw1, Param::Frequency);
    pad->tornDown = true;
    pumpEvents(200);
    expectEq(pad->chordTimer->firedCount(), 1, "chord timer fired");
    expect(pad->chordCounter == 0, "torn-down voice keeps its chord counter");
    g.renderSeconds(0.5);
    expectNear(g.paramValue(pad->pad[0].saw1, Param::Frequency), saw1Before, 1e-9, "torn-down voice is not retuned");

    // Dropping the last reference takes the timer with it.
    auto dropped = b.build(fast, makeOutput(g), 0.95);
    const int nodesWithDropped = g.nodeCount();
    dropped.reset();
    pumpEvents(200);
    expectEq(g.nodeCount(), nodesWithDropped, "dropped voice never strikes again");
}

static void testTeardownIdempotenceAndStaleTimers() {
    DspGraph g;
    VoiceBuilder b(&g);
    const DerivedParameters p = makeParams("music", 140);
    auto v = b.build(p, makeOutput(g), airsynth::engine::secondsPerChord(p) - 0.03);
    if (!v) {
        expect(false, "pad built");
        return;
    }
    expect(b.teardown(*v), "first teardown");
    expect(!b.teardown(*v), "second teardown is a no-op");
    expect(v->tornDown, "voice marked torn down");
    expect(v->chordTimer->isCancelled(), "chord timer cancelled");
    expectEq(g.nodeCount(), 0, "all nodes released");

    pumpEvents(200);
    expectEq(v->chordTimer->firedCount(), 0, "cancelled timer never fires");

    // A voice dropped entirely takes its timers with it.
    auto dropped = b.build(makeParams("zmanim", 140), makeOutput(g), 0.0);
    expect(dropped != nullptr, "chime built");
    if (dropped) expect(b.teardown(*dropped), "chime teardown");
    dropped.reset();
    pumpEvents(100);
    expectEq(g.nodeCount(), 0, "nothing left after a dropped voice");
}

static void testEngineInitFailure() {
    FailingGraph g;
    SynthEngine e(&g);
    int errors = 0;
    int readyEvents = 0;
    QObject::connect(&e, &SynthEngine::errorOccurred, [&](const QString&) { ++errors; });
    QObject::connect(&e, &SynthEngine::readyChanged, [&](bool) { ++readyEvents; });

    expect(!e.init(), "init fails without output");
    expectEq(errors, 1, "failure is reported once");
    expectEq(readyEvents, 0, "no ready change on failure");
    expect(e.state() == SynthEngine::EngineState::Uninitialized, "engine stays uninitialized");

    e.playTrack(makeAsset("a1", "music"), 0.0);
    expect(!e.hasCurrentVoice(), "playTrack is a no-op before Ready");
    expectEq(g.nodeCount(), 0, "no nodes before Ready");
    e.setVolume(0.2);
    expectNear(e.volume(), 0.7, 1e-12, "setVolume is a no-op before Ready");
    e.setMuted(true);
    expect(!e.isMuted(), "setMuted is a no-op before Ready");
    e.stop();
    e.destroy();
    expect(e.state() == SynthEngine::EngineState::Uninitialized, "destroy is a no-op before Ready");
    const auto levels = e.getLevels();
    expect(levels.left == 0.0 && levels.right == 0.0, "levels are zero before Ready");
}

static void testEngineLifecycle() {
    DspGraph g;
    SynthEngine e(&g);
    int readyUp = 0;
    int readyDown = 0;
    QObject::connect(&e, &SynthEngine::readyChanged, [&](bool r) { r ? ++readyUp : ++readyDown; });

    expect(e.init(), "init");
    expect(e.init(), "init is idempotent");
    expectEq(readyUp, 1, "ready reported once");
    expect(e.isReady() && g.isRunning(), "engine ready, output running");
    expectEq(g.nodeCount(), 2, "master gain and analyser");

    e.playTrack(makeAsset("a1", "music"), 12.0);
    expect(e.hasCurrentVoice(), "current voice after playTrack");
    expect(e.currentParameters() == airsynth::engine::deriveParameters(makeAsset("a1", "music")),
           "current parameters are the derived ones");

    e.destroy();
    expect(e.state() == SynthEngine::EngineState::Destroyed, "destroyed");
    expectEq(readyDown, 1, "not-ready reported");
    expectEq(g.nodeCount(), 0, "destroy releases everything");
    expect(!g.isRunning(), "output closed");
    expect(!e.init(), "destroyed engine cannot be re-initialised");
    e.playTrack(makeAsset("a2", "music"), 0.0);
    expectEq(g.nodeCount(), 0, "playTrack after destroy is a no-op");
}

static void testCrossfade() {
    DspGraph g;
    SynthEngine e(&g);
    expect(e.init(), "init");
    QStringList started;
    QObject::connect(&e, &SynthEngine::trackStarted, [&](const QString& id, const QString&) { started << id; });

    e.playTrack(makeAsset("first", "music"), 0.0);
    g.renderSeconds(2.0);
    auto first = e.currentVoice();
    if (!first) {
        expect(false, "first voice");
        return;
    }
    expectNear(g.paramValue(first->outputGain, Param::Gain), 0.35, 1e-6, "first voice at steady gain");
    const QVector<NodeId> firstNodes = allNodesOf(*first);

    e.playTrack(makeAsset("second", "jingle"), 30.0);
    auto second = e.currentVoice();
    expect(second && second != first, "new voice is current immediately");
    expect(e.outgoingVoice() == first, "previous voice is outgoing");

    g.renderSeconds(1.5);
    expectNear(g.paramValue(second->outputGain, Param::Gain), 0.35, 0.01, "new voice reaches 0.35 after the crossfade");
    expectNear(g.paramValue(first->outputGain, Param::Gain), 0.0, 0.01, "old voice faded out");

    pumpEvents(1900);
    expect(!e.hasOutgoingVoice(), "outgoing voice cleared");
    expect(first->tornDown, "old voice torn down");
    bool anyLeft = false;
    for (NodeId n : firstNodes) anyLeft = anyLeft || g.hasNode(n);
    expect(!anyLeft, "old voice nodes released");
    expect(e.hasCurrentVoice() && !second->tornDown, "new voice keeps playing");
    expectEq(started.size(), 2, "two tracks started");

    // Three quick switches: the first outgoing voice is cut short.
    e.playTrack(makeAsset("third", "spot"), 0.0);
    auto third = e.currentVoice();
    e.playTrack(makeAsset("fourth", "shiur"), 0.0);
    expect(e.outgoingVoice() == third, "only the latest previous voice is outgoing");
    expect(!second->tornDown && e.cutVoiceCount() == 1, "interrupted voice gets a declick ramp");
    g.renderSeconds(0.03);
    expectNear(g.paramValue(second->outputGain, Param::Gain), 0.0, 1e-6, "interrupted voice silent after the ramp");
    pumpEvents(150);
    expect(second->tornDown, "interrupted voice torn down after the ramp");
    expectEq(e.cutVoiceCount(), 0, "no interrupted voices left");
}

static void testInterruptedStopFade() {
    DspGraph g;
    SynthEngine e(&g);
    expect(e.init(), "init");

    // Next track while the stop fade is still audible.
    e.playTrack(makeAsset("a1", "music"), 0.0);
    g.renderSeconds(2.0);
    auto stopped = e.currentVoice();
    e.stop();
    g.renderSeconds(0.1);
    const double midFade = g.paramValue(stopped->outputGain, Param::Gain);
    expect(midFade > 0.1, QString("stop fade still audible (got %1)").arg(midFade));

    e.playTrack(makeAsset("a2", "jingle"), 0.0);
    expect(!stopped->tornDown, "audible stop fade is not cut dead");
    expectEq(e.cutVoiceCount(), 1, "stopped voice ramps down");
    expect(!e.hasOutgoingVoice(), "nothing was current to retire");

    // The ramp starts from the level reached, not from the voice gain.
    g.renderSeconds(0.01);
    const double ramping = g.paramValue(stopped->outputGain, Param::Gain);
    expect(ramping > 0.0 && ramping < midFade, QString("declick ramp under way (got %1)").arg(ramping));
    g.renderSeconds(0.02);
    expectNear(g.paramValue(stopped->outputGain, Param::Gain), 0.0, 1e-6, "declick ramp reaches silence");
    pumpEvents(150);
    expect(stopped->tornDown && e.cutVoiceCount() == 0, "stopped voice torn down after the ramp");

    // A fade that already reached silence is torn down at once.
    auto second = e.currentVoice();
    e.stop();
    g.renderSeconds(0.5);
    e.playTrack(makeAsset("a3", "spot"), 0.0);
    expect(second->tornDown, "silent outgoing voice torn down at once");
    expectEq(e.cutVoiceCount(), 0, "silent voice needs no ramp");
}

static void testStop() {
    DspGraph g;
    SynthEngine e(&g);
    expect(e.init(), "init");
    int stops = 0;
    QObject::connect(&e, &SynthEngine::playbackStopped, [&]() { ++stops; });

    e.stop();
    expectEq(stops, 0, "stop with nothing playing is a no-op");

    e.playTrack(makeAsset("a1", "zmanim"), 5.0);
    g.renderSeconds(2.0);
    auto v = e.currentVoice();
    e.stop();
    expectEq(stops, 1, "stop reported");
    expect(!e.hasCurrentVoice() && e.outgoingVoice() == v, "stopped voice fades out");
    g.renderSeconds(0.31);
    expectNear(g.paramValue(v->outputGain, Param::Gain), 0.0, 1e-6, "faded to silence");

    pumpEvents(700);
    expect(!e.hasOutgoingVoice() && v->tornDown, "stopped voice torn down after the grace delay");
    expectEq(g.nodeCount(), 2, "only the master bus remains");
    e.stop();
    expectEq(stops, 1, "second stop is a no-op");
}

static void testDestroyDuringCrossfade() {
    DspGraph g;
    {
        SynthEngine e(&g);
        expect(e.init(), "init");
        e.playTrack(makeAsset("a1", "music"), 0.0);
        e.playTrack(makeAsset("a2", "jingle"), 0.0);
        auto current = e.currentVoice();
        auto outgoing = e.outgoingVoice();
        e.destroy();
        expect(current->tornDown && outgoing->tornDown, "destroy tears down both voices");
        expectEq(g.nodeCount(), 0, "destroy releases everything");
        pumpEvents(1900);
        expectEq(g.nodeCount(), 0, "late teardown timers are harmless");
    }

    {
        SynthEngine e(&g);
        expect(e.init(), "init");
        e.playTrack(makeAsset("a1", "music"), 0.0);
        g.renderSeconds(2.0);
        auto first = e.currentVoice();
        e.playTrack(makeAsset("a2", "jingle"), 0.0);
        e.playTrack(makeAsset("a3", "zmanim"), 0.0);
        expectEq(e.cutVoiceCount(), 1, "first voice on its declick ramp");
        e.destroy();
        expect(first->tornDown, "destroy tears down interrupted voices");
        expectEq(e.cutVoiceCount(), 0, "destroy clears interrupted voices");
        expectEq(g.nodeCount(), 0, "destroy releases everything with a voice mid-ramp");
        pumpEvents(100);
        expectEq(g.nodeCount(), 0, "declick teardown after destroy is harmless");
    }

    DspGraph g2;
    {
        SynthEngine e(&g2);
        expect(e.init(), "init");
        e.playTrack(makeAsset("a1", "music"), 0.0);
    }
    expectEq(g2.nodeCount(), 0, "engine destructor destroys");
}

static void testVolumeMuteOrdering() {
    DspGraph g;
    SynthEngine e(&g);
    expect(e.init(), "init");
    expectNear(g.paramValue(e.masterGain(), Param::Gain), 0.7, 1e-9, "default volume");

    e.setMuted(true);
    g.renderSeconds(0.5);
    expectNear(g.paramValue(e.masterGain(), Param::Gain), 0.0, 1e-6, "muted");

    e.setVolume(0.9);
    g.renderSeconds(0.5);
    expectNear(g.paramValue(e.masterGain(), Param::Gain), 0.0, 1e-6, "volume change while muted stays silent");
    expectNear(e.volume(), 0.9, 1e-12, "volume stored while muted");

    e.setMuted(false);
    g.renderSeconds(0.5);
    expectNear(g.paramValue(e.masterGain(), Param::Gain), 0.9, 1e-6, "unmute restores the new volume");

    // Calls inside one render block still resolve in call order.
    e.setMuted(true);
    e.setVolume(0.4);
    e.setMuted(false);
    g.renderSeconds(0.5);
    expectNear(g.paramValue(e.masterGain(), Param::Gain), 0.4, 1e-6, "same-tick mute/volume/unmute");

    e.setVolume(1.7);
    expectNear(e.volume(), 1.0, 1e-12, "volume clamped");
}

static void testLevels() {
    DspGraph g;
    SynthEngine e(&g);
    expect(e.init(), "init");
    auto levels = e.getLevels();
    expect(levels.left == 0.0 && levels.right == 0.0, "silent before playback");

    e.playTrack(makeAsset("a1", "music"), 0.0);
    g.renderSeconds(1.0);
    levels = e.getLevels();
    expect(levels.left > 0.0, QString("pad shows on the left meter (got %1)").arg(levels.left));
    expect(levels.left <= 1.0 && levels.right >= 0.0 && levels.right <= 1.0, "levels within [0,1]");
}

static void testListenerSession() {
    QTemporaryDir dir;
    expect(dir.isValid(), "temporary dir");
    if (!dir.isValid()) return;
    QSettings settings(dir.filePath("listener.ini"), QSettings::IniFormat);

    DspGraph g;
    ListenerSession s(&g, &settings);
    expectNear(s.volume(), 0.7, 1e-12, "default volume");

    QStringList started;
    int stops = 0;
    int levelTicks = 0;
    QObject::connect(&s, &ListenerSession::trackStarted, [&](const QString& id, const QString&) { started << id; });
    QObject::connect(&s, &ListenerSession::playbackStopped, [&]() { ++stops; });
    QObject::connect(&s, &ListenerSession::levelsChanged, [&](double, double) { ++levelTicks; });

    const AssetDescriptor a1 = makeAsset("a1", "music");
    s.setNowPlaying(a1, 10.0, true);
    expect(started.isEmpty(), "nothing plays before audio is up");

    expect(s.initAudio(), "initAudio");
    expect(s.isAudioReady(), "audio ready");
    expectEq(started.size(), 1, "pending now-playing starts on init");

    s.setNowPlaying(a1, 12.0, true);
    s.setNowPlaying(a1, 14.0, true);
    expectEq(started.size(), 1, "position updates do not restart the asset");

    s.setNowPlaying(makeAsset("b1", "jingle"), 0.0, true);
    expectEq(started.size(), 2, "new asset id replays");
    expect(s.playingAssetId() == "b1", "playing id tracked");

    s.setNowPlaying(makeAsset("b1", "jingle"), 3.0, false);
    expectEq(stops, 1, "playback end stops");
    expect(s.playingAssetId().isEmpty(), "playing id cleared");
    s.setNowPlaying(AssetDescriptor(), 0.0, true);
    expectEq(stops, 1, "nothing on air is not a second stop");

    pumpEvents(120);
    expect(levelTicks > 0, "levels polled while audio is up");

    s.setVolume(1.5);
    expectNear(s.volume(), 1.0, 1e-12, "volume clamped");
    s.toggleMute();
    expect(s.isMuted(), "muted");
    expectNear(settings.value(ListenerSession::kVolumeKey).toDouble(), 1.0, 1e-12, "volume persisted");
    expect(settings.value(ListenerSession::kMutedKey).toBool(), "mute persisted");

    DspGraph g2;
    ListenerSession restored(&g2, &settings);
    expectNear(restored.volume(), 1.0, 1e-12, "persisted volume reloads");
    expect(restored.isMuted(), "persisted mute reloads");

    const QDateTime now = QDateTime::currentDateTimeUtc();
    expectNear(ListenerSession::elapsedSince(now.addMSecs(-5000), now), 5.0, 1e-9, "elapsed since start");
    expectNear(ListenerSession::elapsedSince(now.addSecs(30), now), 0.0, 1e-12, "future start clamps to 0");
    expectNear(ListenerSession::elapsedSince(QDateTime(), now), 0.0, 1e-12, "missing start is 0");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testAudioParamTimeline();
    testDspGraphWiring();
    testDspGraphFilterAndAnalyser();
    testVoiceTopologies();
    testRetuneByRole();
    testChimeLayeringAndPruning();
    testChimeRetriggerTimer();
    testTeardownIdempotenceAndStaleTimers();
    testEngineInitFailure();
    testEngineLifecycle();
    testCrossfade();
    testStop();
    testInterruptedStopFade();
    testDestroyDuringCrossfade();
    testVolumeMuteOrdering();
    testLevels();
    testListenerSession();

    if (g_failures == 0) {
        qInfo("AirSynthEngineTests: PASS");
        return 0;
    }

    qWarning("AirSynthEngineTests: FAIL (%d failures)", g_failures);
    return 1;
}
