#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "airsynth/engine/AssetDescriptor.h"
#include "music/MusicTheory.h"

namespace airsynth::engine {

// Deterministic musical fingerprint of an asset.
// Equal identity fields always give bit-identical parameters, so resuming a
// track after a reload reproduces the same material.
struct DerivedParameters {
    int rootNote = 0;                      // pitch class 0..11
    music::Mode mode = music::Mode::Major;
    int tempo = 60;                        // BPM, 60..140
    QVector<int> progression;              // 4 scale degrees
    QString assetType;

    bool operator==(const DerivedParameters& o) const {
        return rootNote == o.rootNote && mode == o.mode && tempo == o.tempo &&
               progression == o.progression && assetType == o.assetType;
    }
    bool operator!=(const DerivedParameters& o) const { return !(*this == o); }

    // e.g. "Eb minor"
    QString keyName() const;

    QJsonObject toJsonObject() const;
    QString toJsonString(bool compact = true) const;
};

// "id|title|artist|asset_type|category"
QString identityString(const AssetDescriptor& asset);

DerivedParameters deriveParameters(const AssetDescriptor& asset);

} // namespace airsynth::engine
