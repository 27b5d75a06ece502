#include "airsynth/graph/AudioParam.h"

#include <QtGlobal>
#include <cmath>

namespace airsynth::graph {

AudioParam::AudioParam(double value) {
    m_anchor.value = value;
}

double AudioParam::holdValue(const Anchor& a, double time) {
    if (!a.targeting) return a.value;
    if (a.timeConstant <= 0.0) return a.target;
    const double dt = qMax(0.0, time - a.time);
    return a.target + (a.value - a.target) * std::exp(-dt / a.timeConstant);
}

void AudioParam::advance(Anchor& a, const Event& e) {
    switch (e.kind) {
    case Kind::SetValue:
    case Kind::LinearRamp:
    case Kind::ExponentialRamp:
        a.value = e.value;
        a.targeting = false;
        break;
    case Kind::SetTarget:
        a.value = holdValue(a, e.time);
        a.targeting = true;
        a.target = e.value;
        a.timeConstant = e.timeConstant;
        break;
    }
    a.time = e.time;
}

void AudioParam::insert(const Event& e) {
    Event ev = e;
    // Events never land before the anchor; the past is already folded.
    ev.time = qMax(ev.time, m_anchor.time);
    int pos = m_events.size();
    while (pos > 0 && m_events[pos - 1].time > ev.time) --pos;
    m_events.insert(pos, ev);
}

void AudioParam::setValueAtTime(double value, double time) {
    insert({Kind::SetValue, time, value, 0.0});
}

void AudioParam::linearRampToValueAtTime(double value, double endTime) {
    insert({Kind::LinearRamp, endTime, value, 0.0});
}

void AudioParam::exponentialRampToValueAtTime(double value, double endTime) {
    insert({Kind::ExponentialRamp, endTime, value, 0.0});
}

void AudioParam::setTargetAtTime(double target, double startTime, double timeConstant) {
    insert({Kind::SetTarget, startTime, target, qMax(0.0, timeConstant)});
}

void AudioParam::cancelScheduledValues(double startTime) {
    while (!m_events.isEmpty() && m_events.last().time >= startTime) {
        m_events.removeLast();
    }
}

double AudioParam::valueAt(double time) const {
    Anchor cur = m_anchor;
    for (const Event& e : m_events) {
        if (time < e.time) {
            const double span = e.time - cur.time;
            const double startValue = cur.value;
            if (e.kind == Kind::LinearRamp && span > 0.0) {
                const double f = (time - cur.time) / span;
                return startValue + (e.value - startValue) * f;
            }
            if (e.kind == Kind::ExponentialRamp && span > 0.0) {
                // Exponential ramps need same-sign, non-zero endpoints; otherwise hold.
                if (startValue * e.value <= 0.0) return startValue;
                const double f = (time - cur.time) / span;
                return startValue * std::pow(e.value / startValue, f);
            }
            return holdValue(cur, time);
        }
        advance(cur, e);
    }
    return holdValue(cur, time);
}

void AudioParam::prune(double time) {
    int consumed = 0;
    while (consumed < m_events.size() && m_events[consumed].time <= time) {
        advance(m_anchor, m_events[consumed]);
        ++consumed;
    }
    if (consumed > 0) m_events.remove(0, consumed);
}

} // namespace airsynth::graph
