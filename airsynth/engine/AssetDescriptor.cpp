#include "airsynth/engine/AssetDescriptor.h"

#include <QJsonValue>

namespace airsynth::engine {
namespace {

// Catalog ids are strings, but some feeds send integers.
static QString readId(const QJsonValue& v) {
    if (v.isString()) return v.toString();
    if (v.isDouble()) return QString::number(qint64(v.toDouble()));
    return QString();
}

} // namespace

AssetDescriptor AssetDescriptor::fromJson(const QJsonObject& o) {
    AssetDescriptor a;
    a.id = readId(o.value("id"));
    a.title = o.value("title").toString();
    a.artist = o.value("artist").toString();
    a.assetType = o.value("asset_type").toString();
    a.category = o.value("category").toString();
    a.durationSec = qMax(0.0, o.value("duration").toDouble(0.0));
    return a;
}

QJsonObject AssetDescriptor::toJsonObject() const {
    QJsonObject o;
    o.insert("id", id);
    o.insert("title", title);
    o.insert("artist", artist.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(artist));
    o.insert("asset_type", assetType);
    o.insert("category", category.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(category));
    if (durationSec > 0.0) o.insert("duration", durationSec);
    return o;
}

} // namespace airsynth::engine
