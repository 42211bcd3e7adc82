#include "InteractivePlaylistSelector.h"
#include "library/PlaylistStore.h"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

InteractivePlaylistSelector::InteractivePlaylistSelector(const QString& playlistsDir,
                                                         SmartPlaylistSelector& autoSelector,
                                                         QTextStream& in,
                                                         QTextStream& out)
    : m_playlistsDir(playlistsDir)
    , m_autoSelector(autoSelector)
    , m_in(in)
    , m_out(out)
{
}

QString InteractivePlaylistSelector::prompt(const QString& question)
{
    m_out << question;
    m_out.flush();
    if (m_in.atEnd())
        return {};
    return m_in.readLine().trimmed();
}

// Creates one empty playlist per smart playlist rule.
bool InteractivePlaylistSelector::offerSamplePlaylists()
{
    m_out << "No playlists found. Create some .m3u files in your playlists directory.\n";
    if (prompt(QStringLiteral("Create sample playlists? (y/N): ")).toLower() != QStringLiteral("y"))
        return false;

    const QDir dir(m_playlistsDir);
    for (const SmartPlaylistRule& rule : m_autoSelector.rules()) {
        QString error;
        if (PlaylistStore::createEmptyPlaylist(dir.absoluteFilePath(rule.playlistName), &error))
            m_out << "  Created: " << rule.playlistName << "\n";
        else
            m_out << "  Failed: " << error << "\n";
    }
    return true;
}

QStringList InteractivePlaylistSelector::selectPlaylists(const OrganizedTrack& track)
{
    QStringList playlists = PlaylistStore::discoverPlaylists(m_playlistsDir);
    if (playlists.isEmpty()) {
        if (!offerSamplePlaylists())
            return {};
        playlists = PlaylistStore::discoverPlaylists(m_playlistsDir);
    }

    m_out << "\nOrganized: " << track.metadata.artist << " - " << track.metadata.title << "\n";
    m_out << "Available playlists:\n";
    for (int i = 0; i < playlists.size(); ++i)
        m_out << "  " << (i + 1) << ". " << QFileInfo(playlists.at(i)).fileName() << "\n";
    m_out << "  a. Add to all smart playlists automatically\n";
    m_out << "  n. Don't add to any playlists\n";

    const QString choice = prompt(QStringLiteral(
        "\nSelect playlists (comma-separated numbers, 'a' for auto, 'n' for none): ")).toLower();

    if (choice == QStringLiteral("a"))
        return m_autoSelector.selectPlaylists(track);
    if (choice.isEmpty() || choice == QStringLiteral("n"))
        return {};

    QVector<int> indices;
    const QStringList parts = choice.split(QLatin1Char(','));
    for (const QString& part : parts) {
        bool ok = false;
        const int index = part.trimmed().toInt(&ok);
        if (!ok) {
            m_out << "Invalid input. Skipping playlist updates.\n";
            return {};
        }
        indices.append(index);
    }

    QStringList selected;
    for (int index : indices) {
        if (index < 1 || index > playlists.size()) {
            m_out << "Ignoring unknown playlist number " << index << "\n";
            continue;
        }
        const QString& playlist = playlists.at(index - 1);
        if (!selected.contains(playlist))
            selected.append(playlist);
    }
    return selected;
}
