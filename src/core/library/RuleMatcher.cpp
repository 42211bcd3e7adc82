#include "RuleMatcher.h"

#include <QJsonArray>
#include <QDebug>
#include <cmath>
#include <limits>

namespace {

const QString kMinTempoKey = QStringLiteral("min_tempo");
const QString kMaxTempoKey = QStringLiteral("max_tempo");
const QString kGenreKey    = QStringLiteral("genre");

// Accepts whole JSON numbers only; 120.5 BPM is not a valid bound.
bool readTempoBound(const QJsonValue& value, int& bpm)
{
    if (!value.isDouble())
        return false;
    const double d = value.toDouble();
    if (!std::isfinite(d) || std::floor(d) != d)
        return false;
    if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max())
        return false;
    bpm = static_cast<int>(d);
    return true;
}

void setError(QString* errorMessage, const QString& text)
{
    if (errorMessage)
        *errorMessage = text;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════
//  matching
// ═══════════════════════════════════════════════════════════════════════

bool RuleMatcher::matches(const TrackMetadata& meta, const SmartPlaylistRule& rule) const
{
    for (const RulePredicate& predicate : rule.predicates) {
        if (!matches(meta, predicate))
            return false;
    }
    return true;
}

bool RuleMatcher::matches(const TrackMetadata& meta, const RulePredicate& predicate) const
{
    if (const auto* min = std::get_if<TempoMin>(&predicate)) {
        if (!tempoKnown(meta))
            return false;
        return meta.tempo >= min->bpm;
    }

    if (const auto* max = std::get_if<TempoMax>(&predicate)) {
        if (!tempoKnown(meta))
            return false;
        return meta.tempo <= max->bpm;
    }

    const auto& genre = std::get<GenreAny>(predicate);
    for (const QString& term : genre.terms) {
        if (meta.genre.contains(term, Qt::CaseInsensitive))
            return true;
    }
    return false;
}

bool RuleMatcher::tempoKnown(const TrackMetadata& meta) const
{
    return m_policy == UnknownTempoPolicy::Literal || meta.tempo != 0;
}

// ═══════════════════════════════════════════════════════════════════════
//  parseRule
// ═══════════════════════════════════════════════════════════════════════

bool RuleMatcher::parseRule(const QString& playlistName, const QJsonObject& json,
                            SmartPlaylistRule& rule, QString* errorMessage)
{
    // Playlists live directly in the playlists directory
    if (playlistName.isEmpty() || playlistName.contains(QLatin1Char('/'))
        || playlistName.contains(QLatin1Char('\\'))
        || playlistName == QStringLiteral(".") || playlistName == QStringLiteral("..")) {
        setError(errorMessage, QStringLiteral("Smart playlist \"%1\": name must be a plain file name")
                                   .arg(playlistName));
        return false;
    }

    SmartPlaylistRule parsed;
    parsed.playlistName = playlistName;

    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        const QString key = it.key();
        const QJsonValue value = it.value();

        if (key == kMinTempoKey || key == kMaxTempoKey) {
            int bpm = 0;
            if (!readTempoBound(value, bpm)) {
                setError(errorMessage, QStringLiteral("Smart playlist \"%1\": `%2` must be an integer")
                                           .arg(playlistName, key));
                return false;
            }
            if (key == kMinTempoKey)
                parsed.predicates.append(TempoMin{bpm});
            else
                parsed.predicates.append(TempoMax{bpm});
        } else if (key == kGenreKey) {
            GenreAny genre;
            if (value.isString()) {
                genre.terms.append(value.toString());
            } else if (value.isArray()) {
                const QJsonArray terms = value.toArray();
                for (const QJsonValue& term : terms) {
                    if (!term.isString()) {
                        setError(errorMessage, QStringLiteral("Smart playlist \"%1\": every `genre` entry must be a string")
                                                   .arg(playlistName));
                        return false;
                    }
                    genre.terms.append(term.toString());
                }
            } else {
                setError(errorMessage, QStringLiteral("Smart playlist \"%1\": `genre` must be a string or a list of strings")
                                           .arg(playlistName));
                return false;
            }
            parsed.predicates.append(genre);
        } else {
            qDebug() << "[RuleMatcher] Ignoring unrecognized key" << key << "in" << playlistName;
            parsed.ignoredKeys.append(key);
            parsed.extraFields.insert(key, value);
        }
    }

    rule = parsed;
    return true;
}

QJsonObject RuleMatcher::ruleToJson(const SmartPlaylistRule& rule)
{
    QJsonObject json = rule.extraFields;
    QJsonArray genres;
    bool hasGenre = false;

    for (const RulePredicate& predicate : rule.predicates) {
        if (const auto* min = std::get_if<TempoMin>(&predicate)) {
            json.insert(kMinTempoKey, min->bpm);
        } else if (const auto* max = std::get_if<TempoMax>(&predicate)) {
            json.insert(kMaxTempoKey, max->bpm);
        } else {
            hasGenre = true;
            for (const QString& term : std::get<GenreAny>(predicate).terms)
                genres.append(term);
        }
    }

    if (hasGenre)
        json.insert(kGenreKey, genres);
    return json;
}
