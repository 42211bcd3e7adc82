#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "MusicData.h"

// Configuration for one organize run. Loaded once by the front end and
// handed to each component; nothing reads it through global state.
struct OrganizerSettings {
    QString musicRoot = QStringLiteral("~/Music");
    QString allSongsDir = QStringLiteral("All Songs");     // relative to musicRoot
    QString playlistsDir = QStringLiteral(".");            // relative to musicRoot
    QStringList sourceDirs = { QStringLiteral("~/Downloads"), QStringLiteral("~/Desktop") };
    QStringList supportedFormats = { QStringLiteral(".flac"), QStringLiteral(".mp3"),
                                     QStringLiteral(".wav"), QStringLiteral(".m4a"),
                                     QStringLiteral(".aac") };
    QVector<SmartPlaylistRule> smartPlaylists = defaultSmartPlaylists();
    QString fileNaming = QStringLiteral("{artist} - {title}");
    bool autoImport = false;        // reserved
    bool backupPlaylists = true;    // reserved
    UnknownTempoPolicy unknownTempoPolicy = UnknownTempoPolicy::Literal;

    // Keys this version does not know about, written back unchanged on save.
    QJsonObject extraKeys;

    // Absolute paths with "~" expanded.
    QString musicRootPath() const;
    QString libraryPath() const;
    QString playlistsPath() const;

    static QString expandHome(const QString& path);
    static QVector<SmartPlaylistRule> defaultSmartPlaylists();
};

class SettingsStore {
public:
    // <GenericConfigLocation>/music-organizer/config.json
    static QString defaultConfigPath();

    // Reads filePath into settings, backfilling missing keys from defaults.
    // A missing file is created with the defaults. Returns false for an
    // unreadable or malformed document, or a known key of the wrong type.
    static bool load(const QString& filePath, OrganizerSettings& settings,
                     QString* errorMessage = nullptr);

    static bool save(const QString& filePath, const OrganizerSettings& settings,
                     QString* errorMessage = nullptr);

    static bool fromJson(const QJsonObject& json, OrganizerSettings& settings,
                         QString* errorMessage = nullptr);
    static QJsonObject toJson(const OrganizerSettings& settings);
};
