#pragma once

#include <QObject>
#include <QString>
#include <QStringList>

#include "../Settings.h"
#include "../audio/MetadataReader.h"
#include "FilenameSynthesizer.h"
#include "PlaylistSelector.h"

struct FileOutcome {
    bool moved = false;
    QString destinationPath;
    QString errorString;
    QStringList playlistsAdded;     // playlist file names
    int playlistFailures = 0;
};

struct OrganizeSummary {
    int found = 0;
    int succeeded = 0;
    int failed = 0;
    int playlistFailures = 0;
    QStringList failures;           // "path: reason"
    QString configError;            // set when nothing was attempted
};

// The organize pipeline. For each candidate, strictly in sequence:
// read tags -> synthesize name -> resolve collision -> move -> select
// playlists -> record membership. A failing file is counted and skipped;
// only a configuration fault stops the run, before any file is touched.
class MusicOrganizer : public QObject {
    Q_OBJECT

public:
    explicit MusicOrganizer(const OrganizerSettings& settings, QObject* parent = nullptr);
    MusicOrganizer(const OrganizerSettings& settings, MetadataReader reader, QObject* parent = nullptr);

    const OrganizerSettings& settings() const { return m_settings; }
    QString libraryPath() const { return m_libraryPath; }
    QString playlistsPath() const { return m_playlistsPath; }

    // Checks the naming pattern.
    bool validateConfiguration(QString* errorMessage = nullptr) const;

    // Creates the library and playlists directories.
    bool prepareDirectories(QString* errorMessage = nullptr) const;

    // Supported files under the configured (or the given) source
    // directories, recursively, sorted and de-duplicated. Files already in
    // the library are skipped.
    QStringList findMusicFiles(const QStringList& customSourceDirs = {});

    FileOutcome organizeFile(const QString& filePath, IPlaylistSelector& selector);
    OrganizeSummary organizeFiles(const QStringList& files, IPlaylistSelector& selector);

    // validate + prepare + scan + organize
    OrganizeSummary organizeAll(IPlaylistSelector& selector, const QStringList& customSourceDirs = {});

    bool isSupportedFile(const QString& filePath) const;

signals:
    void sourceDirectoryMissing(const QString& directory);
    void fileOrganized(const QString& sourcePath, const QString& destinationPath);
    void fileFailed(const QString& sourcePath, const QString& errorString);
    void playlistsUpdated(const QString& destinationPath, const QStringList& playlistNames);
    void playlistFailed(const QString& playlistPath, const QString& errorString);

private:
    bool isInsideLibrary(const QString& filePath) const;

    OrganizerSettings m_settings;
    MetadataReader m_reader;
    FilenameSynthesizer m_synthesizer;
    QString m_libraryPath;
    QString m_playlistsPath;
    QStringList m_extensions;       // lower-case, with leading dot
};
