#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QTextStream>
#include <cstdio>

#include "core/Settings.h"
#include "core/audio/MetadataReader.h"
#include "core/library/MusicOrganizer.h"
#include "core/library/PlaylistSelector.h"
#include "core/library/RuleMatcher.h"
#include "cli/InteractivePlaylistSelector.h"
#include "cli/SetupWizard.h"

static bool s_verbose = false;

// ── Logging ─────────────────────────────────────────────────────────
// Every message goes to <TempLocation>/music-organizer.log; warnings and
// worse (and debug output with --verbose) are echoed to stderr.
static void installLogging()
{
    static QFile s_logFile;
    s_logFile.setFileName(QStandardPaths::writableLocation(QStandardPaths::TempLocation)
                          + QStringLiteral("/music-organizer.log"));
    if (!s_logFile.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
        std::fprintf(stderr, "Cannot open log file %s\n", qPrintable(s_logFile.fileName()));

    qInstallMessageHandler([](QtMsgType type, const QMessageLogContext&, const QString& msg) {
        static QMutex mtx;
        QMutexLocker lock(&mtx);
        const QString line = QStringLiteral("[%1] %2\n")
            .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")), msg);
        if (s_logFile.isOpen()) {
            s_logFile.write(line.toUtf8());
            s_logFile.flush();
        }
        if (type != QtDebugMsg && type != QtInfoMsg) {
            std::fputs(line.toLocal8Bit().constData(), stderr);
        } else if (s_verbose) {
            std::fputs(line.toLocal8Bit().constData(), stderr);
        }
    });
}

static bool confirm(QTextStream& in, QTextStream& out, const QString& question)
{
    out << question;
    out.flush();
    if (in.atEnd())
        return true;
    const QString answer = in.readLine().trimmed().toLower();
    return answer != QStringLiteral("n") && answer != QStringLiteral("no");
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("music-organizer"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Music Organizer - Organize your music files and playlists\n\n"
        "Examples:\n"
        "  music-organizer                        Interactive organization\n"
        "  music-organizer --auto                 Non-interactive mode\n"
        "  music-organizer --source ~/Music/New   Custom source directory\n"
        "  music-organizer --config               Show current configuration\n"
        "  music-organizer --setup                Run setup wizard"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption autoOption(QStringLiteral("auto"),
        QStringLiteral("Non-interactive mode: add files to matching smart playlists."));
    const QCommandLineOption sourceOption({ QStringLiteral("s"), QStringLiteral("source") },
        QStringLiteral("Custom source directory (can be used multiple times)."), QStringLiteral("dir"));
    const QCommandLineOption configOption(QStringLiteral("config"),
        QStringLiteral("Show current configuration."));
    const QCommandLineOption setupOption(QStringLiteral("setup"),
        QStringLiteral("Run setup wizard."));
    const QCommandLineOption guiOption(QStringLiteral("gui"),
        QStringLiteral("Launch graphical interface (if available)."));
    const QCommandLineOption configFileOption(QStringLiteral("config-file"),
        QStringLiteral("Use an alternate configuration file."), QStringLiteral("path"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"),
        QStringLiteral("Echo debug log messages to stderr."));

    parser.addOptions({ autoOption, sourceOption, configOption, setupOption,
                        guiOption, configFileOption, verboseOption });
    parser.process(app);

    s_verbose = parser.isSet(verboseOption);
    installLogging();

    QTextStream in(stdin);
    QTextStream out(stdout);
    QTextStream err(stderr);

    // ── Configuration ───────────────────────────────────────────────
    const QString configPath = parser.isSet(configFileOption)
        ? parser.value(configFileOption)
        : SettingsStore::defaultConfigPath();

    OrganizerSettings settings;
    QString error;
    if (!SettingsStore::load(configPath, settings, &error)) {
        err << "Error loading configuration: " << error << "\n";
        return 1;
    }

    if (parser.isSet(setupOption)) {
        SetupWizard(in, out).run(settings);
        if (!SettingsStore::save(configPath, settings, &error)) {
            err << "Error saving configuration: " << error << "\n";
            return 1;
        }
        out << "\nSetup complete! Configuration saved to " << configPath << "\n";
        return 0;
    }

    if (parser.isSet(configOption)) {
        SetupWizard::printConfiguration(settings, out);
        return 0;
    }

    if (parser.isSet(guiOption))
        out << "GUI not available. Using CLI mode.\n";

    // ── Pipeline ────────────────────────────────────────────────────
    MetadataReader reader;
    qDebug() << "[main] Tag back-ends:" << reader.sourceNames();

    MusicOrganizer organizer(settings, std::move(reader));

    if (!organizer.validateConfiguration(&error) || !organizer.prepareDirectories(&error)) {
        err << "Configuration error: " << error << "\n";
        return 1;
    }

    QObject::connect(&organizer, &MusicOrganizer::sourceDirectoryMissing,
                     [&out](const QString& dir) {
        out << "Warning: Source directory " << dir << " does not exist\n";
    });
    QObject::connect(&organizer, &MusicOrganizer::fileOrganized,
                     [&out](const QString& src, const QString& dst) {
        out << "Moved: " << QFileInfo(src).fileName() << " -> " << QFileInfo(dst).fileName() << "\n";
        out.flush();
    });
    QObject::connect(&organizer, &MusicOrganizer::fileFailed,
                     [&out](const QString& src, const QString& reason) {
        out << "Error organizing " << src << ": " << reason << "\n";
        out.flush();
    });
    QObject::connect(&organizer, &MusicOrganizer::playlistsUpdated,
                     [&out](const QString&, const QStringList& names) {
        out << "  Added to: " << names.join(QStringLiteral(", ")) << "\n";
    });
    QObject::connect(&organizer, &MusicOrganizer::playlistFailed,
                     [&out](const QString& playlist, const QString& reason) {
        out << "  Could not update " << QFileInfo(playlist).fileName() << ": " << reason << "\n";
    });

    const bool interactive = !parser.isSet(autoOption);
    const QStringList files = organizer.findMusicFiles(parser.values(sourceOption));

    if (files.isEmpty()) {
        out << "No music files found in source directories.\n";
        out << "Current source directories: " << settings.sourceDirs.join(QStringLiteral(", ")) << "\n";
        out << "Supported formats: " << settings.supportedFormats.join(QStringLiteral(", ")) << "\n";
        return 0;
    }

    out << "Found " << files.size() << " music file(s) to organize:\n";
    for (const QString& file : files)
        out << "  - " << file << "\n";

    if (interactive && !confirm(in, out, QStringLiteral("\nProceed with organization? (Y/n): ")))
        return 0;

    SmartPlaylistSelector smartSelector(organizer.playlistsPath(), settings.smartPlaylists,
                                        RuleMatcher(settings.unknownTempoPolicy));
    InteractivePlaylistSelector interactiveSelector(organizer.playlistsPath(), smartSelector, in, out);
    IPlaylistSelector& selector = interactive
        ? static_cast<IPlaylistSelector&>(interactiveSelector)
        : static_cast<IPlaylistSelector&>(smartSelector);

    const OrganizeSummary summary = organizer.organizeFiles(files, selector);
    if (!summary.configError.isEmpty()) {
        err << "Configuration error: " << summary.configError << "\n";
        return 1;
    }

    out << "\nOrganization complete! " << summary.succeeded << "/" << summary.found
        << " files processed.\n";
    if (summary.failed > 0) {
        out << summary.failed << " file(s) failed:\n";
        for (const QString& failure : summary.failures)
            out << "  - " << failure << "\n";
    }
    if (summary.playlistFailures > 0)
        out << summary.playlistFailures << " playlist update(s) failed.\n";

    return 0;
}
