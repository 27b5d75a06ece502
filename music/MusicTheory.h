#pragma once

#include <QString>
#include <QVector>

namespace music {

enum class Mode {
    Major,
    Minor,
};

enum class ChordQuality {
    Major,
    Minor,
    Diminished,
    Sus4,
    Major7,
    Minor7,
};

// Equal temperament, A4 = 440 Hz at MIDI 69.
constexpr int kA4Midi = 69;
constexpr double kA4Hz = 440.0;

double noteFrequency(double midi);

// Normalized pitch class: 0=C, 1=C#/Db, ... 11=B.
inline int normalizePc(int pc) {
    pc %= 12;
    if (pc < 0) pc += 12;
    return pc;
}

// Spells a pitch class using either flats or sharps.
// Returns a short name like "Eb" or "D#".
QString spellPitchClass(int pc, bool preferFlats);

QString modeName(Mode mode);

// Semitone offsets from the tonic (7 entries for both modes).
const QVector<int>& scaleIntervals(Mode mode);
const QVector<int>& chordIntervals(ChordQuality quality);

// Diatonic triad quality for a scale degree (wrapped into 0..6).
ChordQuality diatonicQuality(Mode mode, int degree);

// Fixed catalog of four-chord progressions (0-indexed scale degrees), 6 per mode.
const QVector<QVector<int>>& progressionCatalog(Mode mode);

// Resolves any degree (negative or past the scale length) with floor-division wrap:
// degree -1 in octave 4 is the 7th degree of octave 3.
int scaleNoteToMidi(int rootPc, Mode mode, int degree, int octave = 4);

// Diatonic chord on `degree` as MIDI notes, root first.
QVector<int> buildChord(int rootPc, Mode mode, int degree, int octave = 3);

} // namespace music
