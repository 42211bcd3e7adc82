#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <variant>

// ── Fallback values ─────────────────────────────────────────────────
inline const QString kUnknownArtist = QStringLiteral("Unknown Artist");
inline const QString kUnknownAlbum  = QStringLiteral("Unknown Album");
inline const QString kUnknownGenre  = QStringLiteral("Unknown");

// ── Track Metadata ──────────────────────────────────────────────────
// Normalized tag record. Every field is filled: MetadataReader substitutes
// the fallbacks above (and the file stem for the title) when tags are
// missing or unreadable.
struct TrackMetadata {
    QString title;
    QString artist = kUnknownArtist;
    QString album  = kUnknownAlbum;
    QString genre  = kUnknownGenre;
    int     tempo  = 0;        // BPM, 0 = unknown
    QString date;
    QString trackNumber;       // "3" for a "3/12" tag, empty if absent
    QString sourcePath;        // original location, stale once the file moves
};

// ── Smart Playlist Rules ────────────────────────────────────────────
struct TempoMin {
    int bpm = 0;
};

struct TempoMax {
    int bpm = 0;
};

struct GenreAny {
    QStringList terms;
};

using RulePredicate = std::variant<TempoMin, TempoMax, GenreAny>;

// One smart playlist: all predicates must hold (an empty list matches
// every track). Keys the parser did not recognize are kept with their
// values and written back unchanged on save.
struct SmartPlaylistRule {
    QString playlistName;               // e.g. "Rock.m3u"
    QVector<RulePredicate> predicates;
    QStringList ignoredKeys;
    QJsonObject extraFields;            // ignoredKeys with their values
};

enum class UnknownTempoPolicy {
    Literal,   // tempo 0 compared as the number 0
    Exclude    // tempo 0 fails every tempo predicate
};

#endif // MUSICDATA_H
