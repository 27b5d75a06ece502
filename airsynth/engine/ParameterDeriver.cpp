#include "airsynth/engine/ParameterDeriver.h"

#include "airsynth/util/StableHash.h"
#include "airsynth/util/StableRng.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace airsynth::engine {

QString DerivedParameters::keyName() const {
    const bool flats = (mode == music::Mode::Minor);
    return music::spellPitchClass(rootNote, flats) + " " + music::modeName(mode);
}

QJsonObject DerivedParameters::toJsonObject() const {
    QJsonObject o;
    o.insert("root_note", rootNote);
    o.insert("mode", music::modeName(mode));
    o.insert("key", keyName());
    o.insert("tempo_bpm", tempo);
    QJsonArray prog;
    for (int d : progression) prog.append(d);
    o.insert("progression", prog);
    o.insert("asset_type", assetType);
    return o;
}

QString DerivedParameters::toJsonString(bool compact) const {
    const QJsonDocument doc(toJsonObject());
    return QString::fromUtf8(doc.toJson(compact ? QJsonDocument::Compact : QJsonDocument::Indented));
}

QString identityString(const AssetDescriptor& asset) {
    return asset.id + '|' + asset.title + '|' + asset.artist + '|' + asset.assetType + '|' + asset.category;
}

DerivedParameters deriveParameters(const AssetDescriptor& asset) {
    util::StableRng rng(util::StableHash::poly31(identityString(asset)));

    // Draw order is part of the contract: root, mode, tempo, progression.
    DerivedParameters p;
    p.rootNote = rng.nextInt(0, 12);
    p.mode = (rng.nextDouble01() > 0.5) ? music::Mode::Major : music::Mode::Minor;
    p.tempo = 60 + rng.nextInt(0, 81);
    const auto& catalog = music::progressionCatalog(p.mode);
    p.progression = catalog[rng.nextInt(0, catalog.size())];
    p.assetType = asset.assetType;
    return p;
}

} // namespace airsynth::engine
