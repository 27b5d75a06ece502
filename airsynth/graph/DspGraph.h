#pragma once

#include <QVector>

#include <map>
#include <memory>

#include "airsynth/graph/AudioGraphBuilder.h"
#include "airsynth/graph/AudioParam.h"

namespace airsynth::graph {

// In-process render graph (mono, 128-frame blocks, pull model).
//
// The clock only moves when render() is called: the hardware backend calls it
// from its pump timer, tests call it directly to render offline.
class DspGraph : public AudioGraphBuilder {
public:
    static constexpr int kBlockFrames = 128;

    enum class NodeKind {
        Destination,
        Oscillator,
        Filter,
        Gain,
        Noise,
        Analyser,
    };

    // Read-only snapshot for diagnostics and tests.
    struct NodeInfo {
        NodeKind kind = NodeKind::Gain;
        Waveform waveform = Waveform::Sine;
        FilterType filterType = FilterType::Lowpass;
        bool started = false;
        double startTime = 0.0;
        double stopTime = 0.0; // infinity while unscheduled
        int inputCount = 0;
        int outputCount = 0;
    };

    explicit DspGraph(int sampleRate = 48000);
    ~DspGraph() override;

    DspGraph(const DspGraph&) = delete;
    DspGraph& operator=(const DspGraph&) = delete;

    // AudioGraphBuilder
    bool resume() override;
    void close() override;
    bool isRunning() const override { return m_running; }
    double currentTime() const override;
    int sampleRate() const override { return m_sampleRate; }
    NodeId destination() const override { return m_destination; }

    NodeId createOscillator(Waveform waveform, double frequencyHz) override;
    NodeId createFilter(FilterType type, double frequencyHz, double q) override;
    NodeId createGain(double gain) override;
    NodeId createNoiseSource(const QVector<float>& samples, bool loop) override;
    NodeId createAnalyser(int fftSize) override;

    bool connect(NodeId from, NodeId to) override;
    bool connectParam(NodeId from, NodeId to, Param param) override;
    bool disconnect(NodeId node) override;
    bool release(NodeId node) override;

    bool start(NodeId node, double when) override;
    bool stop(NodeId node, double when) override;

    bool setValueAtTime(NodeId node, Param param, double value, double when) override;
    bool linearRampToValueAtTime(NodeId node, Param param, double value, double endTime) override;
    bool exponentialRampToValueAtTime(NodeId node, Param param, double value, double endTime) override;
    bool setTargetAtTime(NodeId node, Param param, double target, double startTime, double timeConstant) override;
    bool cancelScheduledValues(NodeId node, Param param, double startTime) override;
    double paramValue(NodeId node, Param param) const override;

    bool byteFrequencyData(NodeId analyser, QVector<quint8>& out) override;

    // Renders `frames` mono samples of the destination mix and advances the clock.
    void render(float* out, int frames);
    void renderSeconds(double seconds);

    // Diagnostics
    int nodeCount() const;  // excludes the destination
    bool hasNode(NodeId node) const;
    bool nodeInfo(NodeId node, NodeInfo& out) const;
    QVector<NodeId> inputsOf(NodeId node) const;
    QVector<NodeId> paramInputsOf(NodeId node, Param param) const;

protected:
    // Only valid before the first node is created (the backend may adopt the device rate).
    bool setSampleRate(int sampleRate);

private:
    struct Node;
    struct ParamSlot;

    NodeId addNode(std::unique_ptr<Node> node);
    Node* find(NodeId id);
    const Node* find(NodeId id) const;
    ParamSlot* slotFor(NodeId id, Param param);
    const ParamSlot* slotFor(NodeId id, Param param) const;

    const float* pull(NodeId id);
    void renderNode(Node& n);
    void sumInputs(const QVector<NodeId>& inputs, float* out);
    void renderParam(ParamSlot& slot, float* out);
    void renderBlock();
    void unlinkEdgesTo(NodeId id);

    int m_sampleRate = 48000;
    bool m_running = false;
    NodeId m_nextId = 1u;
    NodeId m_destination = kInvalidNode;
    std::map<NodeId, std::unique_ptr<Node>> m_nodes;

    quint64 m_blockIndex = 0;   // index of the next block to render
    QVector<float> m_block;     // last rendered destination block
    int m_blockReadPos = kBlockFrames;
    QVector<float> m_scratch;
};

} // namespace airsynth::graph
