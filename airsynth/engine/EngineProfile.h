#pragma once

#include <QString>

class QSettings;

namespace airsynth::engine {

// Engine timing, gain staging and metering knobs.
// Versioned and persisted via QSettings.
struct EngineProfile {
    int version = 1;

    // Crossfade / teardown
    double crossfadeSec = 1.5;     // new voice fades in, old voice fades out, over this window
    double voiceGain = 0.35;       // steady-state gain of the current voice
    int teardownGraceMs = 200;     // old voice is torn down crossfade + grace after the swap
    double stopFadeSec = 0.3;
    int stopGraceMs = 500;
    double cutFadeSec = 0.02;      // declick ramp for an outgoing voice interrupted mid-fade

    // Smoothing
    double masterSmoothingSec = 0.02;    // volume / mute time constant
    double retuneTimeConstantSec = 0.1;  // chord-change glide

    // Output
    double defaultVolume = 0.7;  // 0..1
    int sampleRate = 48000;

    // Metering
    int analyserFftSize = 256;   // power of two, 32..2048
    double meterScale = 2.5;
};

EngineProfile defaultEngineProfile();

// Persist/load profile under a prefix like "audio/engineProfile".
EngineProfile loadEngineProfile(QSettings& settings, const QString& prefix);
void saveEngineProfile(QSettings& settings, const QString& prefix, const EngineProfile& p);

} // namespace airsynth::engine
