#include "airsynth/engine/RetriggerTimer.h"

#include <cmath>

namespace airsynth::engine {

namespace {
static int toMs(double sec) {
    return sec <= 0.0 ? 0 : int(std::lround(sec * 1000.0));
}
} // namespace

RetriggerTimer::RetriggerTimer(QObject* parent)
    : QObject(parent) {
    m_firstTimer.setSingleShot(true);
    m_firstTimer.setTimerType(Qt::PreciseTimer);
    m_periodTimer.setSingleShot(false);
    m_periodTimer.setTimerType(Qt::PreciseTimer);
    connect(&m_firstTimer, &QTimer::timeout, this, &RetriggerTimer::onFirst);
    connect(&m_periodTimer, &QTimer::timeout, this, &RetriggerTimer::onPeriod);
}

void RetriggerTimer::start(double firstDelaySec, double periodSec, std::function<void()> onFire) {
    m_firstTimer.stop();
    m_periodTimer.stop();
    m_onFire = std::move(onFire);
    m_periodMs = toMs(periodSec);
    m_fired = 0;
    m_cancelled = false;
    m_firstTimer.start(toMs(firstDelaySec));
}

bool RetriggerTimer::cancel() {
    if (m_cancelled) return false;
    m_cancelled = true;
    m_firstTimer.stop();
    m_periodTimer.stop();
    m_onFire = nullptr;
    return true;
}

void RetriggerTimer::onFirst() {
    if (m_cancelled) return;
    if (m_periodMs > 0) m_periodTimer.start(m_periodMs);
    fire();
}

void RetriggerTimer::onPeriod() {
    if (m_cancelled) return;
    fire();
}

void RetriggerTimer::fire() {
    ++m_fired;
    // The callback may cancel (and drop) this timer's closure; call a copy.
    std::function<void()> cb = m_onFire;
    if (cb) cb();
}

} // namespace airsynth::engine
