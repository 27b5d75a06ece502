#pragma once

#include <QVector>
#include <QtGlobal>

namespace airsynth::graph {

using NodeId = quint32;
constexpr NodeId kInvalidNode = 0u;

enum class Waveform {
    Sine,
    Sawtooth,
    Square,
    Triangle,
};

enum class FilterType {
    Lowpass,
    Bandpass,
    Highpass,
};

enum class Param {
    Gain,      // gain nodes
    Frequency, // oscillators, filters
    Q,         // filters
};

// Audio-graph construction seam. Voices and the engine only talk to this
// interface; the concrete backend decides how (and where) samples are rendered.
//
// Mutating calls return false for an unknown node or an operation that does not
// apply (e.g. stopping a node that never started). Nothing here throws.
// Times are seconds on the backend's output clock (see currentTime()).
class AudioGraphBuilder {
public:
    virtual ~AudioGraphBuilder() = default;

    // Output context
    virtual bool resume() = 0;
    virtual void close() = 0;
    virtual bool isRunning() const = 0;
    virtual double currentTime() const = 0;
    virtual int sampleRate() const = 0;
    virtual NodeId destination() const = 0;

    // Node factories
    virtual NodeId createOscillator(Waveform waveform, double frequencyHz) = 0;
    virtual NodeId createFilter(FilterType type, double frequencyHz, double q) = 0;
    virtual NodeId createGain(double gain) = 0;
    virtual NodeId createNoiseSource(const QVector<float>& samples, bool loop) = 0;
    virtual NodeId createAnalyser(int fftSize) = 0;

    // Wiring. disconnect() drops every outgoing edge of `node`.
    virtual bool connect(NodeId from, NodeId to) = 0;
    virtual bool connectParam(NodeId from, NodeId to, Param param) = 0;
    virtual bool disconnect(NodeId node) = 0;
    virtual bool release(NodeId node) = 0;

    // Scheduled sources (oscillators, noise)
    virtual bool start(NodeId node, double when) = 0;
    virtual bool stop(NodeId node, double when) = 0;

    // Parameter automation
    virtual bool setValueAtTime(NodeId node, Param param, double value, double when) = 0;
    virtual bool linearRampToValueAtTime(NodeId node, Param param, double value, double endTime) = 0;
    virtual bool exponentialRampToValueAtTime(NodeId node, Param param, double value, double endTime) = 0;
    virtual bool setTargetAtTime(NodeId node, Param param, double target, double startTime, double timeConstant) = 0;
    virtual bool cancelScheduledValues(NodeId node, Param param, double startTime) = 0;
    virtual double paramValue(NodeId node, Param param) const = 0;

    // Analyser tap: one byte (0..255) per frequency bin, fftSize/2 bins.
    virtual bool byteFrequencyData(NodeId analyser, QVector<quint8>& out) = 0;
};

} // namespace airsynth::graph
