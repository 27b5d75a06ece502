#include "airsynth/graph/DspGraph.h"

#include <QtGlobal>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace airsynth::graph {

namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr double kInfinity = std::numeric_limits<double>::infinity();
constexpr quint64 kNeverRendered = std::numeric_limits<quint64>::max();

// Analyser byte mapping (Web Audio defaults).
constexpr double kMinDecibels = -100.0;
constexpr double kMaxDecibels = -30.0;
constexpr double kSmoothing = 0.8;

static int floorPowerOfTwo(int n, int lo, int hi) {
    n = qBound(lo, n, hi);
    int p = lo;
    while (p * 2 <= n) p *= 2;
    return p;
}

static float oscillatorSample(Waveform w, double phase) {
    switch (w) {
    case Waveform::Sine:     return float(std::sin(kTwoPi * phase));
    case Waveform::Sawtooth: return float(2.0 * phase - 1.0);
    case Waveform::Square:   return phase < 0.5 ? 1.0f : -1.0f;
    case Waveform::Triangle: return float(1.0 - 4.0 * std::fabs(phase - 0.5));
    }
    return 0.0f;
}

} // namespace

struct DspGraph::ParamSlot {
    AudioParam automation;
    QVector<NodeId> modulators;
    QVector<float> buffer;

    explicit ParamSlot(double value = 0.0) : automation(value), buffer(kBlockFrames, 0.0f) {}
};

struct DspGraph::Node {
    struct Edge {
        NodeId to = kInvalidNode;
        bool toParam = false;
        Param param = Param::Gain;
    };

    NodeKind kind = NodeKind::Gain;
    QVector<NodeId> inputs;
    QVector<Edge> outputs;

    ParamSlot gain{1.0};
    ParamSlot frequency{440.0};
    ParamSlot q{1.0};

    // Oscillator
    Waveform waveform = Waveform::Sine;
    double phase = 0.0;

    // Filter (direct form I)
    FilterType filterType = FilterType::Lowpass;
    double b0 = 1.0, b1 = 0.0, b2 = 0.0, a1 = 0.0, a2 = 0.0;
    double x1 = 0.0, x2 = 0.0, y1 = 0.0, y2 = 0.0;

    // Scheduled sources
    bool started = false;
    double startTime = 0.0;
    double stopTime = kInfinity;

    // Noise buffer
    QVector<float> samples;
    bool loop = true;
    int position = 0;

    // Analyser
    int fftSize = 0;
    QVector<float> ring;
    int ringPos = 0;
    QVector<double> window;
    QVector<double> cosTable;
    QVector<double> sinTable;
    QVector<double> smoothed;

    // Render cache
    QVector<float> out = QVector<float>(kBlockFrames, 0.0f);
    quint64 renderedBlock = kNeverRendered;
    bool rendering = false;

    bool isSource() const { return kind == NodeKind::Oscillator || kind == NodeKind::Noise; }
};

DspGraph::DspGraph(int sampleRate)
    : m_sampleRate(qMax(8000, sampleRate)),
      m_block(kBlockFrames, 0.0f),
      m_scratch(4096, 0.0f) {
    auto dest = std::make_unique<Node>();
    dest->kind = NodeKind::Destination;
    m_destination = addNode(std::move(dest));
}

DspGraph::~DspGraph() = default;

bool DspGraph::resume() {
    m_running = true;
    return true;
}

void DspGraph::close() {
    m_running = false;
}

double DspGraph::currentTime() const {
    return double(m_blockIndex) * double(kBlockFrames) / double(m_sampleRate);
}

bool DspGraph::setSampleRate(int sampleRate) {
    if (m_nodes.size() > 1 || m_blockIndex > 0 || sampleRate < 8000) return false;
    m_sampleRate = sampleRate;
    return true;
}

NodeId DspGraph::addNode(std::unique_ptr<Node> node) {
    const NodeId id = m_nextId++;
    m_nodes.emplace(id, std::move(node));
    return id;
}

DspGraph::Node* DspGraph::find(NodeId id) {
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? nullptr : it->second.get();
}

const DspGraph::Node* DspGraph::find(NodeId id) const {
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? nullptr : it->second.get();
}

DspGraph::ParamSlot* DspGraph::slotFor(NodeId id, Param param) {
    Node* n = find(id);
    if (!n) return nullptr;
    switch (param) {
    case Param::Gain:
        return n->kind == NodeKind::Gain ? &n->gain : nullptr;
    case Param::Frequency:
        return (n->kind == NodeKind::Oscillator || n->kind == NodeKind::Filter) ? &n->frequency : nullptr;
    case Param::Q:
        return n->kind == NodeKind::Filter ? &n->q : nullptr;
    }
    return nullptr;
}

const DspGraph::ParamSlot* DspGraph::slotFor(NodeId id, Param param) const {
    return const_cast<DspGraph*>(this)->slotFor(id, param);
}

// ---- Factories ----

NodeId DspGraph::createOscillator(Waveform waveform, double frequencyHz) {
    auto n = std::make_unique<Node>();
    n->kind = NodeKind::Oscillator;
    n->waveform = waveform;
    n->frequency.automation = AudioParam(frequencyHz);
    return addNode(std::move(n));
}

NodeId DspGraph::createFilter(FilterType type, double frequencyHz, double q) {
    auto n = std::make_unique<Node>();
    n->kind = NodeKind::Filter;
    n->filterType = type;
    n->frequency.automation = AudioParam(frequencyHz);
    n->q.automation = AudioParam(q);
    return addNode(std::move(n));
}

NodeId DspGraph::createGain(double gain) {
    auto n = std::make_unique<Node>();
    n->kind = NodeKind::Gain;
    n->gain.automation = AudioParam(gain);
    return addNode(std::move(n));
}

NodeId DspGraph::createNoiseSource(const QVector<float>& samples, bool loop) {
    auto n = std::make_unique<Node>();
    n->kind = NodeKind::Noise;
    n->samples = samples;
    n->loop = loop;
    return addNode(std::move(n));
}

NodeId DspGraph::createAnalyser(int fftSize) {
    auto n = std::make_unique<Node>();
    n->kind = NodeKind::Analyser;
    const int size = floorPowerOfTwo(fftSize, 32, 2048);
    n->fftSize = size;
    n->ring = QVector<float>(size, 0.0f);
    n->window.resize(size);
    n->cosTable.resize(size);
    n->sinTable.resize(size);
    for (int i = 0; i < size; ++i) {
        const double x = kTwoPi * double(i) / double(size);
        // Blackman window.
        n->window[i] = 0.42 - 0.5 * std::cos(x) + 0.08 * std::cos(2.0 * x);
        n->cosTable[i] = std::cos(x);
        n->sinTable[i] = std::sin(x);
    }
    n->smoothed = QVector<double>(size / 2, 0.0);
    return addNode(std::move(n));
}

// ---- Wiring ----

bool DspGraph::connect(NodeId from, NodeId to) {
    Node* src = find(from);
    Node* dst = find(to);
    if (!src || !dst || from == to || src->kind == NodeKind::Destination) return false;
    if (dst->isSource()) return false;
    if (dst->inputs.contains(from)) return true;
    dst->inputs.push_back(from);
    src->outputs.push_back({to, false, Param::Gain});
    return true;
}

bool DspGraph::connectParam(NodeId from, NodeId to, Param param) {
    Node* src = find(from);
    ParamSlot* slot = slotFor(to, param);
    if (!src || !slot || from == to || src->kind == NodeKind::Destination) return false;
    if (slot->modulators.contains(from)) return true;
    slot->modulators.push_back(from);
    src->outputs.push_back({to, true, param});
    return true;
}

bool DspGraph::disconnect(NodeId node) {
    Node* n = find(node);
    if (!n) return false;
    for (const Node::Edge& e : n->outputs) {
        if (e.toParam) {
            if (ParamSlot* slot = slotFor(e.to, e.param)) slot->modulators.removeAll(node);
        } else if (Node* dst = find(e.to)) {
            dst->inputs.removeAll(node);
        }
    }
    n->outputs.clear();
    return true;
}

void DspGraph::unlinkEdgesTo(NodeId id) {
    Node* n = find(id);
    if (!n) return;
    auto dropEdges = [&](const QVector<NodeId>& sources) {
        for (NodeId s : sources) {
            Node* src = find(s);
            if (!src) continue;
            src->outputs.erase(std::remove_if(src->outputs.begin(), src->outputs.end(),
                                              [id](const Node::Edge& e) { return e.to == id; }),
                               src->outputs.end());
        }
    };
    dropEdges(n->inputs);
    dropEdges(n->gain.modulators);
    dropEdges(n->frequency.modulators);
    dropEdges(n->q.modulators);
}

bool DspGraph::release(NodeId node) {
    if (node == m_destination || !disconnect(node)) return false;
    unlinkEdgesTo(node);
    m_nodes.erase(node);
    return true;
}

// ---- Sources ----

bool DspGraph::start(NodeId node, double when) {
    Node* n = find(node);
    if (!n || !n->isSource() || n->started) return false;
    n->started = true;
    n->startTime = qMax(0.0, when);
    return true;
}

bool DspGraph::stop(NodeId node, double when) {
    Node* n = find(node);
    if (!n || !n->isSource() || !n->started) return false;
    n->stopTime = std::min(n->stopTime, std::max(when, n->startTime));
    return true;
}

// ---- Automation ----

bool DspGraph::setValueAtTime(NodeId node, Param param, double value, double when) {
    ParamSlot* slot = slotFor(node, param);
    if (!slot) return false;
    slot->automation.setValueAtTime(value, when);
    return true;
}

bool DspGraph::linearRampToValueAtTime(NodeId node, Param param, double value, double endTime) {
    ParamSlot* slot = slotFor(node, param);
    if (!slot) return false;
    slot->automation.linearRampToValueAtTime(value, endTime);
    return true;
}

bool DspGraph::exponentialRampToValueAtTime(NodeId node, Param param, double value, double endTime) {
    ParamSlot* slot = slotFor(node, param);
    if (!slot) return false;
    slot->automation.exponentialRampToValueAtTime(value, endTime);
    return true;
}

bool DspGraph::setTargetAtTime(NodeId node, Param param, double target, double startTime, double timeConstant) {
    ParamSlot* slot = slotFor(node, param);
    if (!slot) return false;
    slot->automation.setTargetAtTime(target, startTime, timeConstant);
    return true;
}

bool DspGraph::cancelScheduledValues(NodeId node, Param param, double startTime) {
    ParamSlot* slot = slotFor(node, param);
    if (!slot) return false;
    slot->automation.cancelScheduledValues(startTime);
    return true;
}

double DspGraph::paramValue(NodeId node, Param param) const {
    const ParamSlot* slot = slotFor(node, param);
    return slot ? slot->automation.valueAt(currentTime()) : 0.0;
}

// ---- Analyser ----

bool DspGraph::byteFrequencyData(NodeId analyser, QVector<quint8>& out) {
    Node* n = find(analyser);
    if (!n || n->kind != NodeKind::Analyser) return false;

    const int size = n->fftSize;
    const int bins = size / 2;
    out.resize(bins);

    QVector<double> frame(size);
    for (int i = 0; i < size; ++i) {
        frame[i] = double(n->ring[(n->ringPos + i) % size]) * n->window[i];
    }

    for (int k = 0; k < bins; ++k) {
        double re = 0.0;
        double im = 0.0;
        for (int i = 0; i < size; ++i) {
            const int idx = int((qint64(k) * i) % size);
            re += frame[i] * n->cosTable[idx];
            im -= frame[i] * n->sinTable[idx];
        }
        const double mag = std::sqrt(re * re + im * im) / double(size);
        n->smoothed[k] = kSmoothing * n->smoothed[k] + (1.0 - kSmoothing) * mag;

        const double v = n->smoothed[k];
        if (v <= 0.0) {
            out[k] = 0;
            continue;
        }
        const double db = 20.0 * std::log10(v);
        const double scaled = 255.0 * (db - kMinDecibels) / (kMaxDecibels - kMinDecibels);
        out[k] = quint8(qBound(0.0, scaled, 255.0));
    }
    return true;
}

// ---- Rendering ----

void DspGraph::sumInputs(const QVector<NodeId>& inputs, float* out) {
    std::fill(out, out + kBlockFrames, 0.0f);
    for (NodeId id : inputs) {
        const float* in = pull(id);
        for (int i = 0; i < kBlockFrames; ++i) out[i] += in[i];
    }
}

void DspGraph::renderParam(ParamSlot& slot, float* out) {
    const double t0 = currentTime();
    const double dt = 1.0 / double(m_sampleRate);
    if (slot.automation.isStatic()) {
        std::fill(out, out + kBlockFrames, float(slot.automation.valueAt(t0)));
    } else {
        for (int i = 0; i < kBlockFrames; ++i) out[i] = float(slot.automation.valueAt(t0 + i * dt));
    }
    for (NodeId id : slot.modulators) {
        const float* mod = pull(id);
        for (int i = 0; i < kBlockFrames; ++i) out[i] += mod[i];
    }
}

const float* DspGraph::pull(NodeId id) {
    static const QVector<float> kSilence(kBlockFrames, 0.0f);
    Node* n = find(id);
    if (!n) return kSilence.constData();
    if (n->renderedBlock == m_blockIndex) return n->out.constData();
    if (n->rendering) return kSilence.constData(); // feedback loop
    n->rendering = true;
    renderNode(*n);
    n->rendering = false;
    n->renderedBlock = m_blockIndex;
    return n->out.constData();
}

void DspGraph::renderNode(Node& n) {
    float* out = n.out.data();
    const double t0 = currentTime();
    const double dt = 1.0 / double(m_sampleRate);

    switch (n.kind) {
    case NodeKind::Destination:
        sumInputs(n.inputs, out);
        break;

    case NodeKind::Gain: {
        sumInputs(n.inputs, out);
        float* g = n.gain.buffer.data();
        renderParam(n.gain, g);
        for (int i = 0; i < kBlockFrames; ++i) out[i] *= g[i];
        break;
    }

    case NodeKind::Filter: {
        sumInputs(n.inputs, out);
        renderParam(n.frequency, n.frequency.buffer.data());
        renderParam(n.q, n.q.buffer.data());

        // Coefficients per block (RBJ cookbook).
        const double nyquist = 0.5 * double(m_sampleRate);
        const double f = qBound(10.0, double(n.frequency.buffer[0]), nyquist * 0.98);
        const double q = qMax(0.0001, double(n.q.buffer[0]));
        const double w0 = kTwoPi * f / double(m_sampleRate);
        const double cosw = std::cos(w0);
        const double alpha = std::sin(w0) / (2.0 * q);
        const double a0 = 1.0 + alpha;
        switch (n.filterType) {
        case FilterType::Lowpass:
            n.b0 = ((1.0 - cosw) * 0.5) / a0;
            n.b1 = (1.0 - cosw) / a0;
            n.b2 = n.b0;
            break;
        case FilterType::Bandpass:
            n.b0 = alpha / a0;
            n.b1 = 0.0;
            n.b2 = -alpha / a0;
            break;
        case FilterType::Highpass:
            n.b0 = ((1.0 + cosw) * 0.5) / a0;
            n.b1 = -(1.0 + cosw) / a0;
            n.b2 = n.b0;
            break;
        }
        n.a1 = (-2.0 * cosw) / a0;
        n.a2 = (1.0 - alpha) / a0;

        for (int i = 0; i < kBlockFrames; ++i) {
            const double x = out[i];
            const double y = n.b0 * x + n.b1 * n.x1 + n.b2 * n.x2 - n.a1 * n.y1 - n.a2 * n.y2;
            n.x2 = n.x1;
            n.x1 = x;
            n.y2 = n.y1;
            n.y1 = y;
            out[i] = float(y);
        }
        break;
    }

    case NodeKind::Oscillator: {
        float* freq = n.frequency.buffer.data();
        renderParam(n.frequency, freq);
        for (int i = 0; i < kBlockFrames; ++i) {
            const double t = t0 + i * dt;
            if (!n.started || t < n.startTime || t >= n.stopTime) {
                out[i] = 0.0f;
                continue;
            }
            out[i] = oscillatorSample(n.waveform, n.phase);
            n.phase += double(freq[i]) * dt;
            n.phase -= std::floor(n.phase);
        }
        break;
    }

    case NodeKind::Noise: {
        const int len = n.samples.size();
        for (int i = 0; i < kBlockFrames; ++i) {
            const double t = t0 + i * dt;
            if (!n.started || t < n.startTime || t >= n.stopTime || len == 0 || n.position >= len) {
                out[i] = 0.0f;
                continue;
            }
            out[i] = n.samples[n.position++];
            if (n.position >= len && n.loop) n.position = 0;
        }
        break;
    }

    case NodeKind::Analyser:
        sumInputs(n.inputs, out);
        for (int i = 0; i < kBlockFrames; ++i) {
            n.ring[n.ringPos] = out[i];
            n.ringPos = (n.ringPos + 1) % n.fftSize;
        }
        break;
    }
}

void DspGraph::renderBlock() {
    const double t0 = currentTime();
    for (auto& entry : m_nodes) {
        Node& n = *entry.second;
        n.gain.automation.prune(t0);
        n.frequency.automation.prune(t0);
        n.q.automation.prune(t0);
    }
    const float* mix = pull(m_destination);
    std::memcpy(m_block.data(), mix, sizeof(float) * kBlockFrames);
    ++m_blockIndex;
}

void DspGraph::render(float* out, int frames) {
    int written = 0;
    while (written < frames) {
        if (m_blockReadPos >= kBlockFrames) {
            renderBlock();
            m_blockReadPos = 0;
        }
        const int n = std::min(frames - written, kBlockFrames - m_blockReadPos);
        std::memcpy(out + written, m_block.constData() + m_blockReadPos, sizeof(float) * n);
        m_blockReadPos += n;
        written += n;
    }
}

void DspGraph::renderSeconds(double seconds) {
    qint64 remaining = qint64(std::llround(qMax(0.0, seconds) * double(m_sampleRate)));
    while (remaining > 0) {
        const int n = int(std::min<qint64>(remaining, m_scratch.size()));
        render(m_scratch.data(), n);
        remaining -= n;
    }
}

// ---- Diagnostics ----

int DspGraph::nodeCount() const {
    return int(m_nodes.size()) - 1;
}

bool DspGraph::hasNode(NodeId node) const {
    return find(node) != nullptr;
}

bool DspGraph::nodeInfo(NodeId node, NodeInfo& out) const {
    const Node* n = find(node);
    if (!n) return false;
    out.kind = n->kind;
    out.waveform = n->waveform;
    out.filterType = n->filterType;
    out.started = n->started;
    out.startTime = n->startTime;
    out.stopTime = n->stopTime;
    out.inputCount = n->inputs.size();
    out.outputCount = n->outputs.size();
    return true;
}

QVector<NodeId> DspGraph::inputsOf(NodeId node) const {
    const Node* n = find(node);
    return n ? n->inputs : QVector<NodeId>();
}

QVector<NodeId> DspGraph::paramInputsOf(NodeId node, Param param) const {
    const ParamSlot* slot = slotFor(node, param);
    return slot ? slot->modulators : QVector<NodeId>();
}

} // namespace airsynth::graph
