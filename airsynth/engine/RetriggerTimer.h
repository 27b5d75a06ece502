#pragma once

#include <QObject>
#include <QTimer>

#include <functional>

namespace airsynth::engine {

// One-shot wakeup followed by a fixed-period repeat (chord changes, chime strikes).
// Owned by exactly one voice; cancel() is idempotent and a cancelled timer never fires again.
class RetriggerTimer : public QObject {
    Q_OBJECT
public:
    explicit RetriggerTimer(QObject* parent = nullptr);

    // Delays in seconds. A non-positive period makes the timer one-shot.
    void start(double firstDelaySec, double periodSec, std::function<void()> onFire);

    // Returns false when the timer was already cancelled.
    bool cancel();

    bool isActive() const { return !m_cancelled && (m_firstTimer.isActive() || m_periodTimer.isActive()); }
    bool isCancelled() const { return m_cancelled; }
    int firedCount() const { return m_fired; }

private slots:
    void onFirst();
    void onPeriod();

private:
    void fire();

    QTimer m_firstTimer;
    QTimer m_periodTimer;
    std::function<void()> m_onFire;
    int m_periodMs = 0;
    int m_fired = 0;
    bool m_cancelled = false;
};

} // namespace airsynth::engine
