#include "LevelMeterWidget.h"
#include <QtWidgets>
#include <QTimer>
#include <cmath>

LevelMeterWidget::LevelMeterWidget(QWidget* parent)
    : QWidget(parent) {
    setMinimumHeight(40);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
    // Peak decay timer (runs only while a peak is visible)
    m_decayTimer = new QTimer(this);
    m_decayTimer->setTimerType(Qt::PreciseTimer);
    m_decayTimer->setInterval(16);
    connect(m_decayTimer, &QTimer::timeout, this, [this]() {
        qint64 ms = m_decayElapsed.elapsed();
        m_decayElapsed.restart();
        if (ms <= 0) return;
        const double k = std::exp(-(ms * 0.001) / m_peakTauSec);
        m_peakLeft = std::max(m_left, m_peakLeft * k);
        m_peakRight = std::max(m_right, m_peakRight * k);
        if (m_peakLeft < 0.005 && m_peakRight < 0.005) {
            m_peakLeft = m_peakRight = 0.0;
            m_decayTimer->stop();
        }
        update();
    });
}

void LevelMeterWidget::setLevels(double left, double right) {
    m_left = std::max(0.0, std::min(1.0, left));
    m_right = std::max(0.0, std::min(1.0, right));
    m_peakLeft = std::max(m_peakLeft, m_left);
    m_peakRight = std::max(m_peakRight, m_right);
    if (!m_decayTimer->isActive() && (m_peakLeft > 0.0 || m_peakRight > 0.0)) {
        m_decayElapsed.restart();
        m_decayTimer->start();
    }
    update();
}

void LevelMeterWidget::reset() {
    m_left = m_right = 0.0;
    m_peakLeft = m_peakRight = 0.0;
    m_decayTimer->stop();
    update();
}

void LevelMeterWidget::drawBar(QPainter& p, const QRectF& r, double level, double peak, const QString& label) {
    p.fillRect(r, QColor(30, 30, 30));

    const double labelW = 18.0;
    const QRectF track(r.left() + labelW, r.top(), r.width() - labelW, r.height());
    const QRectF filled(track.left(), track.top(), track.width() * level, track.height());
    p.fillRect(filled, level > 0.85 ? m_hotColor : m_barColor);

    if (peak > 0.0) {
        const double x = track.left() + track.width() * peak;
        p.setPen(QPen(Qt::white, 2));
        p.drawLine(QPointF(x, track.top()), QPointF(x, track.bottom()));
    }

    p.setPen(Qt::lightGray);
    p.drawText(QRectF(r.left(), r.top(), labelW, r.height()), Qt::AlignCenter, label);
}

void LevelMeterWidget::paintEvent(QPaintEvent* /*event*/) {
    const int w = width();
    const int h = height();
    if (w <= 20 || h <= 4) return;

    QPainter p(this);
    p.fillRect(rect(), Qt::black);
    p.setRenderHint(QPainter::Antialiasing, false);

    const double gap = 4.0;
    const double barH = (h - gap * 3.0) / 2.0;
    drawBar(p, QRectF(gap, gap, w - 2.0 * gap, barH), m_left, m_peakLeft, "L");
    drawBar(p, QRectF(gap, gap * 2.0 + barH, w - 2.0 * gap, barH), m_right, m_peakRight, "R");
}
