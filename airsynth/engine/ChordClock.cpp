#include "airsynth/engine/ChordClock.h"

#include <QtGlobal>
#include <cmath>

namespace airsynth::engine {

double secondsPerChord(const DerivedParameters& p) {
    return double(kBeatsPerChord) * 60.0 / double(qMax(1, p.tempo));
}

double secondsPerChime(const DerivedParameters& p) {
    return double(kBeatsPerChime) * 60.0 / double(qMax(1, p.tempo));
}

int chordIndexAt(const DerivedParameters& p, double elapsedSec) {
    if (p.progression.isEmpty()) return 0;
    const qint64 counter = qint64(std::floor(qMax(0.0, elapsedSec) / secondsPerChord(p)));
    return int(counter % p.progression.size());
}

QVector<int> chordForCounter(const DerivedParameters& p, qint64 counter) {
    if (p.progression.isEmpty()) return music::buildChord(p.rootNote, p.mode, 0, kChordOctave);
    const int n = p.progression.size();
    const int idx = int(((counter % n) + n) % n);
    return music::buildChord(p.rootNote, p.mode, p.progression[idx], kChordOctave);
}

QVector<int> chordAtTime(const DerivedParameters& p, double elapsedSec) {
    if (p.progression.isEmpty()) return chordForCounter(p, 0);
    return music::buildChord(p.rootNote, p.mode, p.progression[chordIndexAt(p, elapsedSec)], kChordOctave);
}

double secondsUntilNextBoundary(double periodSec, double elapsedSec) {
    if (periodSec <= 0.0) return 0.0;
    const double into = std::fmod(qMax(0.0, elapsedSec), periodSec);
    return periodSec - into;
}

} // namespace airsynth::engine
