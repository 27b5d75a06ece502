#include "music/MusicTheory.h"

#include <cmath>

namespace music {
namespace {

static int floorDiv(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

static int wrapIndex(int a, int n) {
    return ((a % n) + n) % n;
}

static const QVector<int>& majorScale() {
    static const QVector<int> k = {0, 2, 4, 5, 7, 9, 11};
    return k;
}

static const QVector<int>& minorScale() {
    // Natural minor (Aeolian).
    static const QVector<int> k = {0, 2, 3, 5, 7, 8, 10};
    return k;
}

static const QVector<ChordQuality>& majorDegreeQualities() {
    static const QVector<ChordQuality> k = {
        ChordQuality::Major, ChordQuality::Minor, ChordQuality::Minor, ChordQuality::Major,
        ChordQuality::Major, ChordQuality::Minor, ChordQuality::Diminished,
    };
    return k;
}

static const QVector<ChordQuality>& minorDegreeQualities() {
    static const QVector<ChordQuality> k = {
        ChordQuality::Minor, ChordQuality::Diminished, ChordQuality::Major, ChordQuality::Minor,
        ChordQuality::Minor, ChordQuality::Major, ChordQuality::Major,
    };
    return k;
}

} // namespace

double noteFrequency(double midi) {
    return kA4Hz * std::pow(2.0, (midi - double(kA4Midi)) / 12.0);
}

QString spellPitchClass(int pc, bool preferFlats) {
    pc = normalizePc(pc);
    static const char* kSharps[12] = {"C","C#","D","D#","E","F","F#","G","G#","A","A#","B"};
    static const char* kFlats[12]  = {"C","Db","D","Eb","E","F","Gb","G","Ab","A","Bb","B"};
    return preferFlats ? QString::fromLatin1(kFlats[pc]) : QString::fromLatin1(kSharps[pc]);
}

QString modeName(Mode mode) {
    return mode == Mode::Major ? QStringLiteral("major") : QStringLiteral("minor");
}

const QVector<int>& scaleIntervals(Mode mode) {
    return mode == Mode::Major ? majorScale() : minorScale();
}

const QVector<int>& chordIntervals(ChordQuality quality) {
    static const QVector<int> kMajor = {0, 4, 7};
    static const QVector<int> kMinor = {0, 3, 7};
    static const QVector<int> kDim = {0, 3, 6};
    static const QVector<int> kSus4 = {0, 5, 7};
    static const QVector<int> kMaj7 = {0, 4, 7, 11};
    static const QVector<int> kMin7 = {0, 3, 7, 10};
    switch (quality) {
    case ChordQuality::Major:      return kMajor;
    case ChordQuality::Minor:      return kMinor;
    case ChordQuality::Diminished: return kDim;
    case ChordQuality::Sus4:       return kSus4;
    case ChordQuality::Major7:     return kMaj7;
    case ChordQuality::Minor7:     return kMin7;
    }
    return kMajor;
}

ChordQuality diatonicQuality(Mode mode, int degree) {
    const auto& table = (mode == Mode::Major) ? majorDegreeQualities() : minorDegreeQualities();
    return table[wrapIndex(degree, table.size())];
}

const QVector<QVector<int>>& progressionCatalog(Mode mode) {
    static const QVector<QVector<int>> kMajor = {
        {0, 4, 5, 3}, // I-V-vi-IV
        {0, 3, 4, 3}, // I-IV-V-IV
        {1, 4, 0, 0}, // ii-V-I-I
        {0, 5, 3, 4}, // I-vi-IV-V
        {0, 3, 1, 4}, // I-IV-ii-V
        {0, 3, 0, 4}, // I-IV-I-V
    };
    static const QVector<QVector<int>> kMinor = {
        {0, 3, 4, 4}, // i-iv-v-v
        {0, 5, 2, 4}, // i-VI-III-v
        {0, 6, 5, 4}, // i-VII-VI-v
        {0, 3, 6, 4}, // i-iv-VII-v
        {0, 2, 5, 4}, // i-III-VI-v
        {0, 4, 3, 6}, // i-v-iv-VII
    };
    return mode == Mode::Major ? kMajor : kMinor;
}

int scaleNoteToMidi(int rootPc, Mode mode, int degree, int octave) {
    const QVector<int>& scale = scaleIntervals(mode);
    const int n = scale.size();
    const int carry = floorDiv(degree, n);
    const int degInScale = wrapIndex(degree, n);
    return rootPc + octave * 12 + 12 + scale[degInScale] + carry * 12;
}

QVector<int> buildChord(int rootPc, Mode mode, int degree, int octave) {
    const int chordRoot = scaleNoteToMidi(rootPc, mode, degree, octave);
    const QVector<int>& intervals = chordIntervals(diatonicQuality(mode, degree));
    QVector<int> out;
    out.reserve(intervals.size());
    for (int iv : intervals) out.push_back(chordRoot + iv);
    return out;
}

} // namespace music
