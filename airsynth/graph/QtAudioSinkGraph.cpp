#include "airsynth/graph/QtAudioSinkGraph.h"

#include <QAudioDevice>
#include <QAudioSink>
#include <QIODevice>
#include <QMediaDevices>
#include <QtDebug>
#include <QtGlobal>

#include <cstring>

namespace airsynth::graph {

namespace {

template <typename Sample, typename Convert>
static void interleave(const QVector<float>& mono, int frames, int channels, Convert convert, QByteArray& out) {
    QVector<Sample> staged(frames * channels);
    for (int f = 0; f < frames; ++f) {
        const Sample s = convert(mono[f]);
        for (int c = 0; c < channels; ++c) staged[f * channels + c] = s;
    }
    out.resize(int(staged.size() * int(sizeof(Sample))));
    if (!out.isEmpty()) std::memcpy(out.data(), staged.constData(), size_t(out.size()));
}

} // namespace

bool QtAudioSinkGraph::encodeInterleaved(const QVector<float>& mono, int frames,
                                         const QAudioFormat& format, QByteArray& out) {
    const int channels = format.channelCount();
    if (channels <= 0 || frames < 0 || frames > mono.size()) return false;

    switch (format.sampleFormat()) {
    case QAudioFormat::Float:
        interleave<float>(mono, frames, channels, [](float v) { return v; }, out);
        return true;
    case QAudioFormat::Int16:
        interleave<qint16>(mono, frames, channels,
                           [](float v) { return qint16(qBound(-1.0f, v, 1.0f) * 32767.0f); }, out);
        return true;
    default:
        return false;
    }
}

QtAudioSinkGraph::QtAudioSinkGraph(int preferredSampleRate, QObject* parent)
    : QObject(parent), DspGraph(preferredSampleRate) {
    m_pumpTimer.setTimerType(Qt::PreciseTimer);
    m_pumpTimer.setInterval(kPumpIntervalMs);
    QObject::connect(&m_pumpTimer, &QTimer::timeout, this, &QtAudioSinkGraph::onPump);
}

QtAudioSinkGraph::~QtAudioSinkGraph() {
    close();
}

bool QtAudioSinkGraph::resume() {
    if (isRunning() && m_sink) return true;

    const QAudioDevice device = QMediaDevices::defaultAudioOutput();
    if (device.isNull()) {
        qWarning() << "QtAudioSinkGraph: no audio output device";
        return false;
    }

    QAudioFormat format;
    format.setSampleRate(sampleRate());
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Float);
    if (!device.isFormatSupported(format)) {
        format = device.preferredFormat();
        if (format.sampleFormat() != QAudioFormat::Float && format.sampleFormat() != QAudioFormat::Int16) {
            format.setSampleFormat(QAudioFormat::Int16);
        }
        if (!device.isFormatSupported(format)) {
            qWarning() << "QtAudioSinkGraph: no float or int16 format on" << device.description();
            return false;
        }
        if (format.sampleRate() != sampleRate() && !setSampleRate(format.sampleRate())) {
            qWarning() << "QtAudioSinkGraph: device wants" << format.sampleRate()
                       << "Hz but the graph already renders at" << sampleRate() << "Hz";
            return false;
        }
    }

    m_sink = new QAudioSink(device, format, this);
    m_sink->setBufferSize(int(format.bytesForDuration(kSinkBufferUs)));
    m_io = m_sink->start();
    if (!m_io || m_sink->error() != QAudio::NoError) {
        qWarning() << "QtAudioSinkGraph: sink failed to start, error" << int(m_sink->error());
        m_sink->stop();
        delete m_sink;
        m_sink = nullptr;
        m_io = nullptr;
        return false;
    }
    m_format = format;

    if (!DspGraph::resume()) return false;
    m_pumpTimer.start();
    qInfo() << "QtAudioSinkGraph: output" << device.description() << m_format.sampleRate() << "Hz"
            << m_format.channelCount() << "ch";
    return true;
}

void QtAudioSinkGraph::close() {
    m_pumpTimer.stop();
    if (m_sink) {
        m_sink->stop();
        delete m_sink;
        m_sink = nullptr;
        m_io = nullptr;
    }
    DspGraph::close();
}

void QtAudioSinkGraph::onPump() {
    if (!m_sink || !m_io) return;

    const int bytesPerFrame = m_format.bytesPerFrame();
    if (bytesPerFrame <= 0) return;
    const int frames = int(m_sink->bytesFree()) / bytesPerFrame;
    if (frames <= 0) return;

    m_mono.resize(frames);
    render(m_mono.data(), frames);

    if (!encodeInterleaved(m_mono, frames, m_format, m_bytes)) {
        qWarning() << "QtAudioSinkGraph: cannot encode sample format" << int(m_format.sampleFormat());
        m_pumpTimer.stop();
        return;
    }

    const qint64 written = m_io->write(m_bytes);
    if (written < m_bytes.size()) {
        qDebug() << "QtAudioSinkGraph: sink accepted" << written << "of" << m_bytes.size() << "bytes";
    }
}

} // namespace airsynth::graph
