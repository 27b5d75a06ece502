#pragma once

#include <QJsonObject>
#include <QString>

namespace airsynth::engine {

// Asset identity as supplied by the catalog / now-playing feed.
// Only id, title, artist, assetType and category feed parameter derivation.
struct AssetDescriptor {
    QString id;
    QString title;
    QString artist;    // empty when the catalog has none
    QString assetType; // "music", "jingle", "spot", "shiur", "zmanim", ...
    QString category;  // empty when the catalog has none
    double durationSec = 0.0;

    bool isValid() const { return !id.trimmed().isEmpty(); }

    // Parses {id, title, artist|null, asset_type, category|null, duration|null}.
    static AssetDescriptor fromJson(const QJsonObject& o);
    QJsonObject toJsonObject() const;
};

} // namespace airsynth::engine
