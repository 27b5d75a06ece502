#pragma once

#include <QVector>
#include <QtGlobal>

#include "airsynth/engine/ParameterDeriver.h"

namespace airsynth::engine {

// Harmonic rhythm: one chord every 4 beats, chimes every 8 beats.
constexpr int kBeatsPerChord = 4;
constexpr int kBeatsPerChime = 8;
constexpr int kChordOctave = 3;

double secondsPerChord(const DerivedParameters& p);
double secondsPerChime(const DerivedParameters& p);

// floor(elapsed / secPerChord) mod progression length.
int chordIndexAt(const DerivedParameters& p, double elapsedSec);

// Chord sounding at `elapsedSec` into the track (octave 3).
QVector<int> chordAtTime(const DerivedParameters& p, double elapsedSec);

// Chord for an absolute chord counter (wrapped into the progression).
QVector<int> chordForCounter(const DerivedParameters& p, qint64 counter);

// Time left until the next period boundary, in (0, period].
double secondsUntilNextBoundary(double periodSec, double elapsedSec);

} // namespace airsynth::engine
