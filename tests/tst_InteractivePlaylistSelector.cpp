#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "Settings.h"
#include "cli/InteractivePlaylistSelector.h"
#include "library/PlaylistStore.h"

static OrganizedTrack makeTrack(int tempo, const QString& genre)
{
    OrganizedTrack track;
    track.metadata.title = QStringLiteral("Song");
    track.metadata.artist = QStringLiteral("Band");
    track.metadata.tempo = tempo;
    track.metadata.genre = genre;
    track.libraryPath = QStringLiteral("/library/Band - Song.mp3");
    return track;
}

class tst_InteractivePlaylistSelector : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QStringList select(const QString& answers, const OrganizedTrack& track, QString* transcript = nullptr)
    {
        QString input = answers;
        QString output;
        QTextStream in(&input, QIODevice::ReadOnly);
        QTextStream out(&output, QIODevice::WriteOnly);

        SmartPlaylistSelector smart(m_dir.path(), OrganizerSettings::defaultSmartPlaylists());
        InteractivePlaylistSelector selector(m_dir.path(), smart, in, out);
        const QStringList result = selector.selectPlaylists(track);
        out.flush();
        if (transcript)
            *transcript = output;
        return result;
    }

    QString playlist(const QString& name) const { return QDir(m_dir.path()).absoluteFilePath(name); }

private slots:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
        for (const QString& name : { QStringLiteral("Chill.m3u"), QStringLiteral("High Energy.m3u"),
                                     QStringLiteral("Rock.m3u") })
            QVERIFY(PlaylistStore::createEmptyPlaylist(playlist(name)));
    }

    void numbers_selectListedPlaylists()
    {
        QString transcript;
        const QStringList chosen = select(QStringLiteral("1, 3\n"), makeTrack(100, QStringLiteral("Pop")), &transcript);
        QCOMPARE(chosen, QStringList({ playlist(QStringLiteral("Chill.m3u")), playlist(QStringLiteral("Rock.m3u")) }));
        QVERIFY(transcript.contains(QStringLiteral("2. High Energy.m3u")));
    }

    void duplicateNumbers_collapsed()
    {
        QCOMPARE(select(QStringLiteral("2,2\n"), makeTrack(100, QString())),
                 QStringList{ playlist(QStringLiteral("High Energy.m3u")) });
    }

    void outOfRangeNumber_ignored()
    {
        QString transcript;
        QCOMPARE(select(QStringLiteral("1,9\n"), makeTrack(100, QString()), &transcript),
                 QStringList{ playlist(QStringLiteral("Chill.m3u")) });
        QVERIFY(transcript.contains(QStringLiteral("Ignoring unknown playlist number 9")));
    }

    void auto_usesSmartRules()
    {
        const QStringList chosen = select(QStringLiteral("a\n"), makeTrack(130, QStringLiteral("Indie Rock")));
        QCOMPARE(chosen, QStringList({ playlist(QStringLiteral("High Energy.m3u")),
                                       playlist(QStringLiteral("Rock.m3u")) }));
    }

    void none_selectsNothing()
    {
        QVERIFY(select(QStringLiteral("n\n"), makeTrack(100, QString())).isEmpty());
        QVERIFY(select(QString(), makeTrack(100, QString())).isEmpty());
    }

    void garbage_selectsNothing()
    {
        QString transcript;
        QVERIFY(select(QStringLiteral("x\n"), makeTrack(100, QString()), &transcript).isEmpty());
        QVERIFY(transcript.contains(QStringLiteral("Invalid input. Skipping playlist updates.")));
    }

    void noPlaylists_offersSamples()
    {
        QTemporaryDir empty;
        QVERIFY(empty.isValid());

        QString input = QStringLiteral("y\nn\n");
        QString output;
        QTextStream in(&input, QIODevice::ReadOnly);
        QTextStream out(&output, QIODevice::WriteOnly);

        SmartPlaylistSelector smart(empty.path(), OrganizerSettings::defaultSmartPlaylists());
        InteractivePlaylistSelector selector(empty.path(), smart, in, out);
        QVERIFY(selector.selectPlaylists(makeTrack(100, QString())).isEmpty());
        QCOMPARE(PlaylistStore::discoverPlaylists(empty.path()).size(), 7);
    }
};

QTEST_MAIN(tst_InteractivePlaylistSelector)
#include "tst_InteractivePlaylistSelector.moc"
