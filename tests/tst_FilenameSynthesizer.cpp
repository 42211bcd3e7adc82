#include <QtTest/QtTest>
#include "library/FilenameSynthesizer.h"

static TrackMetadata makeTrack(const QString& artist, const QString& title,
                               const QString& sourcePath = QStringLiteral("/in/song.mp3"))
{
    TrackMetadata t;
    t.artist = artist;
    t.title = title;
    t.album = QStringLiteral("Album");
    t.genre = QStringLiteral("Rock");
    t.trackNumber = QStringLiteral("7");
    t.sourcePath = sourcePath;
    return t;
}

class tst_FilenameSynthesizer : public QObject {
    Q_OBJECT

private slots:
    void illegalCharactersStripped()
    {
        FilenameSynthesizer synth(QStringLiteral("{artist} - {title}"));
        const auto meta = makeTrack(QStringLiteral("AC/DC"), QStringLiteral("T.N.T"));

        QString error;
        const auto name = synth.synthesize(meta, &error);
        QVERIFY(name.has_value());
        QCOMPARE(*name, QStringLiteral("ACDC - T.N.T"));
        QVERIFY(error.isEmpty());

        QCOMPARE(*synth.fileNameFor(meta), QStringLiteral("ACDC - T.N.T.mp3"));
    }

    void extensionPreservedUnchanged()
    {
        FilenameSynthesizer synth(QStringLiteral("{title}"));
        const auto meta = makeTrack(QStringLiteral("A"), QStringLiteral("Song"),
                                    QStringLiteral("/in/weird.name.FLAC"));
        QCOMPARE(*synth.fileNameFor(meta), QStringLiteral("Song.FLAC"));

        const auto bare = makeTrack(QStringLiteral("A"), QStringLiteral("Song"), QStringLiteral("/in/noext"));
        QCOMPARE(*synth.fileNameFor(bare), QStringLiteral("Song"));
    }

    void allPlaceholders()
    {
        FilenameSynthesizer synth(QStringLiteral("{track}. {artist} - {album} - {title} [{genre}]"));
        const auto name = synth.synthesize(makeTrack(QStringLiteral("Band"), QStringLiteral("Tune")));
        QVERIFY(name.has_value());
        QCOMPARE(*name, QStringLiteral("7. Band - Album - Tune [Rock]"));
    }

    void emptyComponentFallsBackToUnknown()
    {
        FilenameSynthesizer synth(QStringLiteral("{artist} - {title}"));
        QCOMPARE(*synth.synthesize(makeTrack(QStringLiteral("???"), QStringLiteral("  "))),
                 QStringLiteral("Unknown - Unknown"));
    }

    void newlinesCollapsedToSpaces()
    {
        QCOMPARE(FilenameSynthesizer::cleanComponent(QStringLiteral("Line one\nLine\rtwo")),
                 QStringLiteral("Line one Line two"));
        QCOMPARE(FilenameSynthesizer::stripIllegal(QStringLiteral("a<b>c:d\"e|f?g*h\\i")),
                 QStringLiteral("abcdefghi"));
    }

    void escapedBraces()
    {
        FilenameSynthesizer synth(QStringLiteral("{{{artist}}}"));
        QCOMPARE(*synth.synthesize(makeTrack(QStringLiteral("X"), QStringLiteral("Y"))),
                 QStringLiteral("{X}"));
    }

    void emptyResultBecomesUnknown()
    {
        FilenameSynthesizer synth(QStringLiteral("{track}"));
        auto meta = makeTrack(QStringLiteral("A"), QStringLiteral("B"));
        meta.trackNumber.clear();
        QCOMPARE(*synth.synthesize(meta), QStringLiteral("Unknown"));
    }

    // ── Configuration errors ─────────────────────────────────────
    void unknownPlaceholder_isError()
    {
        FilenameSynthesizer synth(QStringLiteral("{artist} - {year}"));
        QString error;
        QVERIFY(!synth.synthesize(makeTrack(QStringLiteral("A"), QStringLiteral("B")), &error).has_value());
        QVERIFY(error.contains(QStringLiteral("{year}")));
        QVERIFY(!FilenameSynthesizer::validatePattern(QStringLiteral("{year}")));
    }

    void unbalancedBraces_areErrors()
    {
        QString error;
        QVERIFY(!FilenameSynthesizer::validatePattern(QStringLiteral("{artist"), &error));
        QVERIFY(error.contains(QStringLiteral("unterminated")));
        QVERIFY(!FilenameSynthesizer::validatePattern(QStringLiteral("artist}"), &error));
        QVERIFY(!FilenameSynthesizer::validatePattern(QStringLiteral("{}"), &error));
    }

    void pathSeparatorInPattern_isError()
    {
        QVERIFY(!FilenameSynthesizer::validatePattern(QStringLiteral("{artist}/{title}")));
        QVERIFY(FilenameSynthesizer::validatePattern(QStringLiteral("{artist} - {title}")));
    }
};

QTEST_MAIN(tst_FilenameSynthesizer)
#include "tst_FilenameSynthesizer.moc"
