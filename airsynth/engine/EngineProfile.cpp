#include "airsynth/engine/EngineProfile.h"

#include <QSettings>
#include <QtGlobal>
#include <algorithm>
#include <cmath>

namespace airsynth::engine {
namespace {

static int clampInt(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
static double clampD(double v, double lo, double hi) { return std::max(lo, std::min(hi, v)); }

static int readInt(QSettings& s, const QString& k, int def) { return s.value(k, def).toInt(); }
static double readD(QSettings& s, const QString& k, double def) { return s.value(k, def).toDouble(); }

static int floorPowerOfTwo(int v) {
    int p = 32;
    while (p * 2 <= v) p *= 2;
    return p;
}

} // namespace

EngineProfile defaultEngineProfile() {
    return EngineProfile();
}

EngineProfile loadEngineProfile(QSettings& settings, const QString& prefix) {
    EngineProfile p = defaultEngineProfile();
    const QString base = prefix;

    p.version = readInt(settings, base + "/version", p.version);

    p.crossfadeSec = clampD(readD(settings, base + "/crossfadeSec", p.crossfadeSec), 0.01, 30.0);
    p.voiceGain = clampD(readD(settings, base + "/voiceGain", p.voiceGain), 0.0, 1.0);
    p.teardownGraceMs = clampInt(readInt(settings, base + "/teardownGraceMs", p.teardownGraceMs), 0, 10000);
    p.stopFadeSec = clampD(readD(settings, base + "/stopFadeSec", p.stopFadeSec), 0.01, 10.0);
    p.stopGraceMs = clampInt(readInt(settings, base + "/stopGraceMs", p.stopGraceMs), 0, 10000);
    // Teardown must not cut the stop fade short.
    p.stopGraceMs = std::max(p.stopGraceMs, int(std::lround(p.stopFadeSec * 1000.0)));

    p.cutFadeSec = clampD(readD(settings, base + "/cutFadeSec", p.cutFadeSec), 0.0, 0.5);

    p.masterSmoothingSec = clampD(readD(settings, base + "/masterSmoothingSec", p.masterSmoothingSec), 0.001, 1.0);
    p.retuneTimeConstantSec = clampD(readD(settings, base + "/retuneTimeConstantSec", p.retuneTimeConstantSec), 0.001, 2.0);

    p.defaultVolume = clampD(readD(settings, base + "/defaultVolume", p.defaultVolume), 0.0, 1.0);
    p.sampleRate = clampInt(readInt(settings, base + "/sampleRate", p.sampleRate), 8000, 192000);

    p.analyserFftSize = floorPowerOfTwo(clampInt(readInt(settings, base + "/analyserFftSize", p.analyserFftSize), 32, 2048));
    p.meterScale = clampD(readD(settings, base + "/meterScale", p.meterScale), 0.1, 20.0);

    return p;
}

void saveEngineProfile(QSettings& settings, const QString& prefix, const EngineProfile& p) {
    const QString base = prefix;

    settings.setValue(base + "/version", p.version);

    settings.setValue(base + "/crossfadeSec", p.crossfadeSec);
    settings.setValue(base + "/voiceGain", p.voiceGain);
    settings.setValue(base + "/teardownGraceMs", p.teardownGraceMs);
    settings.setValue(base + "/stopFadeSec", p.stopFadeSec);
    settings.setValue(base + "/stopGraceMs", p.stopGraceMs);
    settings.setValue(base + "/cutFadeSec", p.cutFadeSec);

    settings.setValue(base + "/masterSmoothingSec", p.masterSmoothingSec);
    settings.setValue(base + "/retuneTimeConstantSec", p.retuneTimeConstantSec);

    settings.setValue(base + "/defaultVolume", p.defaultVolume);
    settings.setValue(base + "/sampleRate", p.sampleRate);

    settings.setValue(base + "/analyserFftSize", p.analyserFftSize);
    settings.setValue(base + "/meterScale", p.meterScale);
}

} // namespace airsynth::engine
