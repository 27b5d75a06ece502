#ifndef LEVELMETERWIDGET_H
#define LEVELMETERWIDGET_H

#include <QWidget>
#include <QElapsedTimer>
#include <QColor>

class QTimer;

// Two horizontal bars (L/R) with a decaying peak marker.
class LevelMeterWidget : public QWidget {
    Q_OBJECT
public:
    explicit LevelMeterWidget(QWidget* parent = nullptr);
    QSize sizeHint() const override { return QSize(320, 48); }

public slots:
    void setLevels(double left, double right);
    void reset();

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    void drawBar(QPainter& p, const QRectF& r, double level, double peak, const QString& label);

    double m_left = 0.0;   // 0..1
    double m_right = 0.0;  // 0..1
    double m_peakLeft = 0.0;
    double m_peakRight = 0.0;
    double m_peakTauSec = 0.6;
    QElapsedTimer m_decayElapsed;
    QTimer* m_decayTimer = nullptr;

    QColor m_barColor = QColor(0, 200, 120);
    QColor m_hotColor = QColor(230, 80, 60);
};

#endif // LEVELMETERWIDGET_H
