#include "SetupWizard.h"

QString SetupWizard::ask(const QString& question)
{
    m_out << question;
    m_out.flush();
    if (m_in.atEnd())
        return {};
    return m_in.readLine().trimmed();
}

void SetupWizard::run(OrganizerSettings& settings)
{
    m_out << "Music Organizer Setup Wizard\n";
    m_out << QString(40, QLatin1Char('=')) << "\n";
    m_out << "\nLet's configure your music organizer...\n";

    const QString musicRoot = ask(QStringLiteral("Music root directory [%1]: ").arg(settings.musicRoot));
    if (!musicRoot.isEmpty())
        settings.musicRoot = musicRoot;

    const QString allSongs = ask(QStringLiteral("All songs directory (within music root) [%1]: ")
                                     .arg(settings.allSongsDir));
    if (!allSongs.isEmpty())
        settings.allSongsDir = allSongs;

    m_out << "\nCurrent source directories: " << settings.sourceDirs.join(QStringLiteral(", ")) << "\n";
    m_out << "Enter additional source directories (one per line, empty to finish):\n";
    for (;;) {
        const QString dir = ask(QStringLiteral("> "));
        if (dir.isEmpty())
            break;
        if (!settings.sourceDirs.contains(dir))
            settings.sourceDirs.append(dir);
    }
}

void SetupWizard::printConfiguration(const OrganizerSettings& settings, QTextStream& out)
{
    QStringList playlistNames;
    for (const SmartPlaylistRule& rule : settings.smartPlaylists)
        playlistNames.append(rule.playlistName);

    out << "\nCurrent Configuration:\n";
    out << "Music root: " << settings.musicRootPath() << "\n";
    out << "All songs directory: " << settings.libraryPath() << "\n";
    out << "Playlists directory: " << settings.playlistsPath() << "\n";
    out << "Source directories: " << settings.sourceDirs.join(QStringLiteral(", ")) << "\n";
    out << "Supported formats: " << settings.supportedFormats.join(QStringLiteral(", ")) << "\n";
    out << "File naming: " << settings.fileNaming << "\n";
    out << "Smart playlists: " << playlistNames.join(QStringLiteral(", ")) << "\n";
    out << "Unknown tempo: "
        << (settings.unknownTempoPolicy == UnknownTempoPolicy::Exclude ? "excluded from tempo rules"
                                                                      : "treated as 0 BPM")
        << "\n";
    out.flush();
}
