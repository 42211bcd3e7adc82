#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "library/CollisionResolver.h"

static void touch(const QString& path)
{
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("x");
}

class tst_CollisionResolver : public QObject {
    Q_OBJECT

private slots:
    void freePath_returnedUnchanged()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString desired = dir.filePath(QStringLiteral("Artist - Song.mp3"));
        QCOMPARE(CollisionResolver::resolve(desired), desired);
    }

    void takenPath_getsCounterSuffix()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString desired = dir.filePath(QStringLiteral("Artist - Song.mp3"));
        touch(desired);
        QCOMPARE(CollisionResolver::resolve(desired),
                 dir.filePath(QStringLiteral("Artist - Song (1).mp3")));

        touch(dir.filePath(QStringLiteral("Artist - Song (1).mp3")));
        QCOMPARE(CollisionResolver::resolve(desired),
                 dir.filePath(QStringLiteral("Artist - Song (2).mp3")));
    }

    void firstFreeCounter_isUsed()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString desired = dir.filePath(QStringLiteral("Song.flac"));
        touch(desired);
        touch(dir.filePath(QStringLiteral("Song (2).flac")));
        QCOMPARE(CollisionResolver::resolve(desired), dir.filePath(QStringLiteral("Song (1).flac")));
    }

    void candidate_keepsLastSuffixOnly()
    {
        QCOMPARE(CollisionResolver::candidate(QStringLiteral("/lib/T.N.T.mp3"), 3),
                 QStringLiteral("/lib/T.N.T (3).mp3"));
        QCOMPARE(CollisionResolver::candidate(QStringLiteral("/lib/noext"), 1),
                 QStringLiteral("/lib/noext (1)"));
    }

    void danglingSymlink_countsAsTaken()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString link = dir.filePath(QStringLiteral("Song.mp3"));
        QVERIFY(QFile::link(dir.filePath(QStringLiteral("missing-target")), link));
        QVERIFY(CollisionResolver::pathTaken(link));
        QCOMPARE(CollisionResolver::resolve(link), dir.filePath(QStringLiteral("Song (1).mp3")));
    }
};

QTEST_MAIN(tst_CollisionResolver)
#include "tst_CollisionResolver.moc"
