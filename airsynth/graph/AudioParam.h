#pragma once

#include <QVector>

namespace airsynth::graph {

// Automation timeline for one node parameter (Web Audio semantics, simplified).
//
// Events are kept sorted by time. Elapsed events are folded into an anchor by
// prune(), so the list only holds what is still ahead of the render clock.
// A ramp starts from the anchor state at the previous event's time.
class AudioParam {
public:
    explicit AudioParam(double value = 0.0);

    void setValueAtTime(double value, double time);
    void linearRampToValueAtTime(double value, double endTime);
    void exponentialRampToValueAtTime(double value, double endTime);
    void setTargetAtTime(double target, double startTime, double timeConstant);
    void cancelScheduledValues(double startTime);

    double valueAt(double time) const;

    // Folds every event with time <= `time` into the anchor.
    void prune(double time);

    // True when valueAt() is constant from the anchor onwards.
    bool isStatic() const { return m_events.isEmpty() && !m_anchor.targeting; }
    int pendingEventCount() const { return m_events.size(); }

private:
    enum class Kind {
        SetValue,
        LinearRamp,
        ExponentialRamp,
        SetTarget,
    };

    struct Event {
        Kind kind = Kind::SetValue;
        double time = 0.0;
        double value = 0.0;
        double timeConstant = 0.0;
    };

    struct Anchor {
        double time = 0.0;
        double value = 0.0;
        bool targeting = false;
        double target = 0.0;
        double timeConstant = 0.0;
    };

    static double holdValue(const Anchor& a, double time);
    static void advance(Anchor& a, const Event& e);
    void insert(const Event& e);

    Anchor m_anchor;
    QVector<Event> m_events;
};

} // namespace airsynth::graph
