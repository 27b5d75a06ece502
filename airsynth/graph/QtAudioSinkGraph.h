#pragma once

#include <QAudioFormat>
#include <QByteArray>
#include <QObject>
#include <QTimer>
#include <QVector>

#include "airsynth/graph/DspGraph.h"

class QAudioSink;
class QIODevice;

namespace airsynth::graph {

// DspGraph rendered on the GUI thread into the default output device.
// A precise pump timer tops the push-mode QAudioSink up with whatever it has room for.
class QtAudioSinkGraph : public QObject, public DspGraph {
    Q_OBJECT
public:
    explicit QtAudioSinkGraph(int preferredSampleRate = 48000, QObject* parent = nullptr);
    ~QtAudioSinkGraph() override;

    // Opens the default output. Fails when there is no device, no usable
    // format, or the sink reports an error on start.
    bool resume() override;
    void close() override;

    int channelCount() const { return m_format.channelCount(); }

    // Duplicates the first `frames` mono samples across every channel of `format`
    // (Float, or Int16 with clipping). False for any other sample format.
    static bool encodeInterleaved(const QVector<float>& mono, int frames,
                                  const QAudioFormat& format, QByteArray& out);

    // Graph wiring wins over QObject's signal wiring on this class.
    using DspGraph::connect;
    using DspGraph::disconnect;

private slots:
    void onPump();

private:
    static constexpr int kPumpIntervalMs = 10;
    static constexpr qint64 kSinkBufferUs = 100000;

    QAudioSink* m_sink = nullptr; // child
    QIODevice* m_io = nullptr;    // owned by m_sink
    QAudioFormat m_format;
    QTimer m_pumpTimer;

    QVector<float> m_mono;
    QByteArray m_bytes;
};

} // namespace airsynth::graph
