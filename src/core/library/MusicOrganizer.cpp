#include "MusicOrganizer.h"
#include "CollisionResolver.h"
#include "LibraryMover.h"
#include "PlaylistStore.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include <QDebug>

static QString normalizeExtension(QString extension)
{
    extension = extension.trimmed().toLower();
    if (extension.isEmpty())
        return {};
    if (!extension.startsWith(QLatin1Char('.')))
        extension.prepend(QLatin1Char('.'));
    return extension;
}

MusicOrganizer::MusicOrganizer(const OrganizerSettings& settings, QObject* parent)
    : MusicOrganizer(settings, MetadataReader(), parent)
{
}

MusicOrganizer::MusicOrganizer(const OrganizerSettings& settings, MetadataReader reader, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_reader(std::move(reader))
    , m_synthesizer(settings.fileNaming)
    , m_libraryPath(settings.libraryPath())
    , m_playlistsPath(settings.playlistsPath())
{
    for (const QString& format : settings.supportedFormats) {
        const QString ext = normalizeExtension(format);
        if (!ext.isEmpty() && !m_extensions.contains(ext))
            m_extensions.append(ext);
    }
}

// ═══════════════════════════════════════════════════════════════════════
//  setup
// ═══════════════════════════════════════════════════════════════════════

bool MusicOrganizer::validateConfiguration(QString* errorMessage) const
{
    return FilenameSynthesizer::validatePattern(m_synthesizer.pattern(), errorMessage);
}

bool MusicOrganizer::prepareDirectories(QString* errorMessage) const
{
    for (const QString& path : { m_libraryPath, m_playlistsPath }) {
        if (!QDir().mkpath(path)) {
            if (errorMessage)
                *errorMessage = QStringLiteral("Cannot create directory %1").arg(path);
            return false;
        }
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════
//  scan
// ═══════════════════════════════════════════════════════════════════════

bool MusicOrganizer::isSupportedFile(const QString& filePath) const
{
    const QString suffix = QFileInfo(filePath).suffix();
    if (suffix.isEmpty())
        return false;
    return m_extensions.contains(QLatin1Char('.') + suffix.toLower());
}

bool MusicOrganizer::isInsideLibrary(const QString& filePath) const
{
    QString library = QFileInfo(m_libraryPath).canonicalFilePath();
    if (library.isEmpty())
        return false;
    if (!library.endsWith(QLatin1Char('/')))
        library += QLatin1Char('/');
    return QFileInfo(filePath).canonicalFilePath().startsWith(library);
}

QStringList MusicOrganizer::findMusicFiles(const QStringList& customSourceDirs)
{
    const QStringList sourceDirs = customSourceDirs.isEmpty() ? m_settings.sourceDirs : customSourceDirs;

    QSet<QString> seen;
    QStringList files;

    for (const QString& configured : sourceDirs) {
        const QString dir = OrganizerSettings::expandHome(configured);
        const QFileInfo dirInfo(dir);
        if (!dirInfo.exists() || !dirInfo.isDir()) {
            qWarning() << "[MusicOrganizer] Source directory" << dir << "does not exist";
            emit sourceDirectoryMissing(dir);
            continue;
        }

        int count = 0;
        QDirIterator it(dir, QDir::Files, QDirIterator::Subdirectories);
        while (it.hasNext()) {
            const QString path = it.next();
            if (!isSupportedFile(path) || isInsideLibrary(path))
                continue;

            const QString canonical = QFileInfo(path).canonicalFilePath();
            if (canonical.isEmpty() || seen.contains(canonical))
                continue;
            seen.insert(canonical);
            files.append(canonical);
            ++count;
        }
        qDebug() << "[MusicOrganizer] Walked" << dir << ":" << count << "files";
    }

    files.sort();
    return files;
}

// ═══════════════════════════════════════════════════════════════════════
//  organizeFile
// ═══════════════════════════════════════════════════════════════════════

FileOutcome MusicOrganizer::organizeFile(const QString& filePath, IPlaylistSelector& selector)
{
    FileOutcome outcome;

    const TrackMetadata meta = m_reader.read(filePath);

    const std::optional<QString> fileName = m_synthesizer.fileNameFor(meta, &outcome.errorString);
    if (!fileName) {
        emit fileFailed(filePath, outcome.errorString);
        return outcome;
    }

    // Resolve and move back to back; nothing else writes the library meanwhile
    const QString destination = CollisionResolver::resolve(QDir(m_libraryPath).filePath(*fileName));
    const MoveResult moved = LibraryMover::move(filePath, destination);
    if (!moved.ok) {
        outcome.errorString = moved.errorString;
        emit fileFailed(filePath, outcome.errorString);
        return outcome;
    }

    outcome.moved = true;
    outcome.destinationPath = destination;
    emit fileOrganized(filePath, destination);

    OrganizedTrack track;
    track.metadata = meta;
    track.libraryPath = destination;

    const QStringList playlists = selector.selectPlaylists(track);
    for (const QString& playlist : playlists) {
        QString error;
        switch (PlaylistStore::ensureMembership(playlist, destination, &error)) {
        case MembershipResult::Added:
            outcome.playlistsAdded.append(QFileInfo(playlist).fileName());
            break;
        case MembershipResult::AlreadyPresent:
            break;
        case MembershipResult::Failed:
            ++outcome.playlistFailures;
            emit playlistFailed(playlist, error);
            break;
        }
    }

    if (!outcome.playlistsAdded.isEmpty())
        emit playlistsUpdated(destination, outcome.playlistsAdded);

    return outcome;
}

// ═══════════════════════════════════════════════════════════════════════
//  organizeFiles / organizeAll
// ═══════════════════════════════════════════════════════════════════════

OrganizeSummary MusicOrganizer::organizeFiles(const QStringList& files, IPlaylistSelector& selector)
{
    OrganizeSummary summary;
    summary.found = files.size();

    if (!validateConfiguration(&summary.configError))
        return summary;

    for (const QString& file : files) {
        const FileOutcome outcome = organizeFile(file, selector);
        if (outcome.moved) {
            ++summary.succeeded;
        } else {
            ++summary.failed;
            summary.failures.append(QStringLiteral("%1: %2").arg(file, outcome.errorString));
        }
        summary.playlistFailures += outcome.playlistFailures;
    }

    qDebug() << "[MusicOrganizer] Organized" << summary.succeeded << "of" << summary.found
             << "files," << summary.failed << "failed," << summary.playlistFailures
             << "playlist write failures";
    return summary;
}

OrganizeSummary MusicOrganizer::organizeAll(IPlaylistSelector& selector, const QStringList& customSourceDirs)
{
    OrganizeSummary summary;
    if (!validateConfiguration(&summary.configError) || !prepareDirectories(&summary.configError))
        return summary;

    const QStringList files = findMusicFiles(customSourceDirs);
    if (files.isEmpty()) {
        qDebug() << "[MusicOrganizer] No music files found";
        return summary;
    }
    return organizeFiles(files, selector);
}
