#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "library/PlaylistStore.h"

static QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    return f.readAll();
}

static QString makeTrack(const QTemporaryDir& dir, const QString& name)
{
    const QString path = dir.filePath(name);
    QFile f(path);
    if (f.open(QIODevice::WriteOnly))
        f.write("x");
    return PlaylistStore::entryPathFor(path);
}

class tst_PlaylistStore : public QObject {
    Q_OBJECT

private slots:
    void ensureMembership_createsPlaylistAndParents()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString track = makeTrack(dir, QStringLiteral("song.mp3"));
        const QString playlist = dir.filePath(QStringLiteral("lists/nested/Rock.m3u"));

        QString error;
        QCOMPARE(PlaylistStore::ensureMembership(playlist, track, &error), MembershipResult::Added);
        QVERIFY(error.isEmpty());
        QCOMPARE(readFile(playlist), track.toUtf8() + '\n');
    }

    void ensureMembership_isIdempotent()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString track = makeTrack(dir, QStringLiteral("song.mp3"));
        const QString playlist = dir.filePath(QStringLiteral("Chill.m3u"));

        QCOMPARE(PlaylistStore::ensureMembership(playlist, track), MembershipResult::Added);
        const QByteArray first = readFile(playlist);
        QCOMPARE(PlaylistStore::ensureMembership(playlist, track), MembershipResult::AlreadyPresent);
        QCOMPARE(readFile(playlist), first);
    }

    void ensureMembership_matchesTrimmedLines()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString track = makeTrack(dir, QStringLiteral("song.mp3"));
        const QString playlist = dir.filePath(QStringLiteral("Jazz.m3u"));
        {
            QFile f(playlist);
            QVERIFY(f.open(QIODevice::WriteOnly));
            f.write("  " + track.toUtf8() + "  \r\n");
        }
        QCOMPARE(PlaylistStore::ensureMembership(playlist, track), MembershipResult::AlreadyPresent);
    }

    void ensureMembership_addsMissingTrailingNewline()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString a = makeTrack(dir, QStringLiteral("a.mp3"));
        const QString b = makeTrack(dir, QStringLiteral("b.mp3"));
        const QString playlist = dir.filePath(QStringLiteral("Mix.m3u"));
        {
            QFile f(playlist);
            QVERIFY(f.open(QIODevice::WriteOnly));
            f.write(a.toUtf8());
        }
        QCOMPARE(PlaylistStore::ensureMembership(playlist, b), MembershipResult::Added);
        QCOMPARE(PlaylistStore::entries(playlist), QStringList({ a, b }));
        QCOMPARE(readFile(playlist), a.toUtf8() + '\n' + b.toUtf8() + '\n');
    }

    void ensureMembership_preservesExistingOrder()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString playlist = dir.filePath(QStringLiteral("Order.m3u"));
        const QString c = makeTrack(dir, QStringLiteral("c.mp3"));
        const QString a = makeTrack(dir, QStringLiteral("a.mp3"));
        QCOMPARE(PlaylistStore::ensureMembership(playlist, c), MembershipResult::Added);
        QCOMPARE(PlaylistStore::ensureMembership(playlist, a), MembershipResult::Added);
        QCOMPARE(PlaylistStore::ensureMembership(playlist, c), MembershipResult::AlreadyPresent);
        QCOMPARE(PlaylistStore::entries(playlist), QStringList({ c, a }));
    }

    void discoverPlaylists_sortedM3uOnly()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QVERIFY(PlaylistStore::createEmptyPlaylist(dir.filePath(QStringLiteral("Zed.m3u"))));
        QVERIFY(PlaylistStore::createEmptyPlaylist(dir.filePath(QStringLiteral("Alpha.m3u"))));
        makeTrack(dir, QStringLiteral("notes.txt"));

        const QStringList found = PlaylistStore::discoverPlaylists(dir.path());
        QCOMPARE(found.size(), 2);
        QCOMPARE(QFileInfo(found.at(0)).fileName(), QStringLiteral("Alpha.m3u"));
        QCOMPARE(QFileInfo(found.at(1)).fileName(), QStringLiteral("Zed.m3u"));
    }

    void createEmptyPlaylist_keepsExistingContent()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString track = makeTrack(dir, QStringLiteral("song.mp3"));
        const QString playlist = dir.filePath(QStringLiteral("Keep.m3u"));
        QCOMPARE(PlaylistStore::ensureMembership(playlist, track), MembershipResult::Added);
        QVERIFY(PlaylistStore::createEmptyPlaylist(playlist));
        QCOMPARE(PlaylistStore::entries(playlist), QStringList{ track });
    }

    void entries_missingFileIsEmpty()
    {
        QVERIFY(PlaylistStore::entries(QStringLiteral("/nonexistent/dir/None.m3u")).isEmpty());
    }
};

QTEST_MAIN(tst_PlaylistStore)
#include "tst_PlaylistStore.moc"
