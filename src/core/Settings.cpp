#include "Settings.h"
#include "library/RuleMatcher.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace {

const QString kMusicRoot        = QStringLiteral("music_root");
const QString kAllSongsDir      = QStringLiteral("all_songs_dir");
const QString kPlaylistsDir     = QStringLiteral("playlists_dir");
const QString kSourceDirs       = QStringLiteral("source_dirs");
const QString kSupportedFormats = QStringLiteral("supported_formats");
const QString kSmartPlaylists   = QStringLiteral("smart_playlists");
const QString kFileNaming       = QStringLiteral("file_naming");
const QString kAutoImport       = QStringLiteral("auto_import");
const QString kBackupPlaylists  = QStringLiteral("backup_playlists");
const QString kUnknownTempo     = QStringLiteral("unknown_tempo_policy");

const QStringList kKnownKeys = {
    kMusicRoot, kAllSongsDir, kPlaylistsDir, kSourceDirs, kSupportedFormats,
    kSmartPlaylists, kFileNaming, kAutoImport, kBackupPlaylists, kUnknownTempo
};

void setError(QString* errorMessage, const QString& text)
{
    if (errorMessage)
        *errorMessage = text;
}

bool readString(const QJsonObject& json, const QString& key, QString& out, QString* errorMessage)
{
    if (!json.contains(key))
        return true;
    if (!json.value(key).isString()) {
        setError(errorMessage, QStringLiteral("`%1` must be a string").arg(key));
        return false;
    }
    out = json.value(key).toString();
    return true;
}

bool readBool(const QJsonObject& json, const QString& key, bool& out, QString* errorMessage)
{
    if (!json.contains(key))
        return true;
    if (!json.value(key).isBool()) {
        setError(errorMessage, QStringLiteral("`%1` must be a boolean").arg(key));
        return false;
    }
    out = json.value(key).toBool();
    return true;
}

bool readStringList(const QJsonObject& json, const QString& key, QStringList& out, QString* errorMessage)
{
    if (!json.contains(key))
        return true;
    if (!json.value(key).isArray()) {
        setError(errorMessage, QStringLiteral("`%1` must be a list of strings").arg(key));
        return false;
    }
    QStringList values;
    const QJsonArray array = json.value(key).toArray();
    for (const QJsonValue& v : array) {
        if (!v.isString()) {
            setError(errorMessage, QStringLiteral("`%1` must be a list of strings").arg(key));
            return false;
        }
        values.append(v.toString());
    }
    out = values;
    return true;
}

QString joinUnder(const QString& root, const QString& relative)
{
    const QString expanded = OrganizerSettings::expandHome(relative);
    if (QDir::isAbsolutePath(expanded))
        return QDir::cleanPath(expanded);
    return QDir::cleanPath(QDir(root).filePath(expanded));
}

} // namespace

// ── OrganizerSettings ───────────────────────────────────────────────
QString OrganizerSettings::expandHome(const QString& path)
{
    if (path == QStringLiteral("~"))
        return QDir::homePath();
    if (path.startsWith(QStringLiteral("~/")))
        return QDir::homePath() + path.mid(1);
    return path;
}

QString OrganizerSettings::musicRootPath() const
{
    return QDir::cleanPath(QDir(expandHome(musicRoot)).absolutePath());
}

QString OrganizerSettings::libraryPath() const
{
    return joinUnder(musicRootPath(), allSongsDir);
}

QString OrganizerSettings::playlistsPath() const
{
    return joinUnder(musicRootPath(), playlistsDir);
}

QVector<SmartPlaylistRule> OrganizerSettings::defaultSmartPlaylists()
{
    auto genres = [](const QString& name, const QStringList& terms) {
        SmartPlaylistRule rule;
        rule.playlistName = name;
        rule.predicates.append(GenreAny{terms});
        return rule;
    };

    SmartPlaylistRule highEnergy;
    highEnergy.playlistName = QStringLiteral("High Energy.m3u");
    highEnergy.predicates.append(TempoMin{120});

    SmartPlaylistRule chill;
    chill.playlistName = QStringLiteral("Chill.m3u");
    chill.predicates.append(TempoMax{90});

    return {
        highEnergy,
        chill,
        genres(QStringLiteral("Rock.m3u"),
               { QStringLiteral("rock"), QStringLiteral("alternative"), QStringLiteral("indie") }),
        genres(QStringLiteral("Jazz.m3u"),
               { QStringLiteral("jazz"), QStringLiteral("blues"), QStringLiteral("swing") }),
        genres(QStringLiteral("Classical.m3u"),
               { QStringLiteral("classical"), QStringLiteral("orchestral"), QStringLiteral("symphony") }),
        genres(QStringLiteral("Electronic.m3u"),
               { QStringLiteral("electronic"), QStringLiteral("edm"), QStringLiteral("dubstep"),
                 QStringLiteral("house"), QStringLiteral("techno") }),
        genres(QStringLiteral("Hip-Hop.m3u"),
               { QStringLiteral("hip-hop"), QStringLiteral("rap"), QStringLiteral("trap") })
    };
}

// ── Config file path ────────────────────────────────────────────────
// ~/.config/music-organizer/config.json on Linux
QString SettingsStore::defaultConfigPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
             + QStringLiteral("/music-organizer"));
    return dir.filePath(QStringLiteral("config.json"));
}

// ═══════════════════════════════════════════════════════════════════════
//  load / save
// ═══════════════════════════════════════════════════════════════════════

bool SettingsStore::load(const QString& filePath, OrganizerSettings& settings, QString* errorMessage)
{
    if (!QFileInfo::exists(filePath)) {
        settings = OrganizerSettings();
        if (!save(filePath, settings, errorMessage))
            return false;
        qDebug() << "[Settings] Created default configuration at" << filePath;
        return true;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, QStringLiteral("Cannot read %1: %2").arg(filePath, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QStringLiteral("Cannot parse %1: %2 (offset %3)")
                                   .arg(filePath, parseError.errorString())
                                   .arg(parseError.offset));
        return false;
    }
    if (!doc.isObject()) {
        setError(errorMessage, QStringLiteral("%1 must contain a JSON object").arg(filePath));
        return false;
    }

    OrganizerSettings loaded;
    QString detail;
    if (!fromJson(doc.object(), loaded, &detail)) {
        setError(errorMessage, QStringLiteral("Invalid configuration in %1: %2").arg(filePath, detail));
        return false;
    }

    settings = loaded;
    qDebug() << "[Settings] Loaded configuration from" << filePath;
    return true;
}

bool SettingsStore::save(const QString& filePath, const OrganizerSettings& settings, QString* errorMessage)
{
    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        setError(errorMessage, QStringLiteral("Cannot create directory %1").arg(info.absolutePath()));
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(errorMessage, QStringLiteral("Cannot write %1: %2").arg(filePath, file.errorString()));
        return false;
    }

    file.write(QJsonDocument(toJson(settings)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        setError(errorMessage, QStringLiteral("Cannot write %1: %2").arg(filePath, file.errorString()));
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════
//  JSON mapping
// ═══════════════════════════════════════════════════════════════════════

bool SettingsStore::fromJson(const QJsonObject& json, OrganizerSettings& settings, QString* errorMessage)
{
    OrganizerSettings s;

    if (!readString(json, kMusicRoot, s.musicRoot, errorMessage)
        || !readString(json, kAllSongsDir, s.allSongsDir, errorMessage)
        || !readString(json, kPlaylistsDir, s.playlistsDir, errorMessage)
        || !readStringList(json, kSourceDirs, s.sourceDirs, errorMessage)
        || !readStringList(json, kSupportedFormats, s.supportedFormats, errorMessage)
        || !readString(json, kFileNaming, s.fileNaming, errorMessage)
        || !readBool(json, kAutoImport, s.autoImport, errorMessage)
        || !readBool(json, kBackupPlaylists, s.backupPlaylists, errorMessage))
        return false;

    if (json.contains(kSmartPlaylists)) {
        if (!json.value(kSmartPlaylists).isObject()) {
            setError(errorMessage, QStringLiteral("`%1` must be an object").arg(kSmartPlaylists));
            return false;
        }
        s.smartPlaylists.clear();
        const QJsonObject rules = json.value(kSmartPlaylists).toObject();
        for (auto it = rules.constBegin(); it != rules.constEnd(); ++it) {
            if (!it.value().isObject()) {
                setError(errorMessage, QStringLiteral("Smart playlist \"%1\" must map to an object").arg(it.key()));
                return false;
            }
            SmartPlaylistRule rule;
            if (!RuleMatcher::parseRule(it.key(), it.value().toObject(), rule, errorMessage))
                return false;
            s.smartPlaylists.append(rule);
        }
    }

    if (json.contains(kUnknownTempo)) {
        const QString policy = json.value(kUnknownTempo).toString();
        if (policy == QStringLiteral("literal")) {
            s.unknownTempoPolicy = UnknownTempoPolicy::Literal;
        } else if (policy == QStringLiteral("exclude")) {
            s.unknownTempoPolicy = UnknownTempoPolicy::Exclude;
        } else {
            setError(errorMessage, QStringLiteral("`%1` must be \"literal\" or \"exclude\"").arg(kUnknownTempo));
            return false;
        }
    }

    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (!kKnownKeys.contains(it.key()))
            s.extraKeys.insert(it.key(), it.value());
    }

    settings = s;
    return true;
}

QJsonObject SettingsStore::toJson(const OrganizerSettings& settings)
{
    QJsonObject json = settings.extraKeys;

    QJsonObject rules;
    for (const SmartPlaylistRule& rule : settings.smartPlaylists)
        rules.insert(rule.playlistName, RuleMatcher::ruleToJson(rule));

    json.insert(kMusicRoot, settings.musicRoot);
    json.insert(kAllSongsDir, settings.allSongsDir);
    json.insert(kPlaylistsDir, settings.playlistsDir);
    json.insert(kSourceDirs, QJsonArray::fromStringList(settings.sourceDirs));
    json.insert(kSupportedFormats, QJsonArray::fromStringList(settings.supportedFormats));
    json.insert(kSmartPlaylists, rules);
    json.insert(kFileNaming, settings.fileNaming);
    json.insert(kAutoImport, settings.autoImport);
    json.insert(kBackupPlaylists, settings.backupPlaylists);
    json.insert(kUnknownTempo, settings.unknownTempoPolicy == UnknownTempoPolicy::Exclude
                                   ? QStringLiteral("exclude")
                                   : QStringLiteral("literal"));
    return json;
}
