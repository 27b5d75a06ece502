#include "StationMonitorWindow.h"
#include "airsynth/engine/AssetDescriptor.h"
#include "airsynth/engine/EngineProfile.h"
#include "airsynth/graph/QtAudioSinkGraph.h"
#include <QApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMessageBox>
#include <QSettings>

using airsynth::engine::AssetDescriptor;

namespace {

// One sample per asset type, plus one the engine does not know.
static QVector<AssetDescriptor> builtInAssets() {
    auto make = [](const QString& id, const QString& title, const QString& artist,
                   const QString& type, const QString& category, double duration) {
        AssetDescriptor a;
        a.id = id;
        a.title = title;
        a.artist = artist;
        a.assetType = type;
        a.category = category;
        a.durationSec = duration;
        return a;
    };
    return {
        make("a1", "Song", "X", "music", "pop", 210.0),
        make("a2", "Morning Drive", "Station Band", "music", "", 185.0),
        make("j1", "Top of the Hour", "", "jingle", "id", 8.0),
        make("s1", "Hardware Store", "", "spot", "retail", 30.0),
        make("sh1", "Weekly Portion", "Rabbi Levi", "shiur", "torah", 1800.0),
        make("z1", "Candle Lighting", "", "zmanim", "", 20.0),
        make("u1", "Station Promo", "", "promo", "", 15.0),
    };
}

static bool loadAssets(const QString& path, QVector<AssetDescriptor>& out, QString& error) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        error = QString("Cannot open %1").arg(path);
        return false;
    }
    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isArray()) {
        error = QString("%1 is not a JSON array: %2").arg(path, pe.errorString());
        return false;
    }
    for (const QJsonValue& v : doc.array()) {
        const AssetDescriptor a = AssetDescriptor::fromJson(v.toObject());
        if (a.isValid()) out.push_back(a);
    }
    if (out.isEmpty()) {
        error = QString("%1 holds no asset with an id").arg(path);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char *argv[]) {
    QApplication a(argc, argv);
    QApplication::setOrganizationName("AirSynth");
    QApplication::setApplicationName("AirSynthMonitor");

    // Optional catalog export: a JSON array of assets.
    QVector<AssetDescriptor> assets;
    const QStringList args = QApplication::arguments();
    if (args.size() > 1) {
        QString error;
        if (!loadAssets(args.at(1), assets, error)) {
            QMessageBox::critical(nullptr, "Fatal Error", error);
            return 1;
        }
    } else {
        assets = builtInAssets();
    }

    QSettings settings;
    const airsynth::engine::EngineProfile profile =
        airsynth::engine::loadEngineProfile(settings, "audio/engineProfile");

    airsynth::graph::QtAudioSinkGraph graph(profile.sampleRate);

    StationMonitorWindow w(assets, &graph, &settings);
    w.show();

    return a.exec();
}
