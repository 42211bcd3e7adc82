#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "../MusicData.h"

class RuleMatcher {
public:
    explicit RuleMatcher(UnknownTempoPolicy policy = UnknownTempoPolicy::Literal)
        : m_policy(policy) {}

    void setUnknownTempoPolicy(UnknownTempoPolicy policy) { m_policy = policy; }
    UnknownTempoPolicy unknownTempoPolicy() const { return m_policy; }

    // Conjunction of every predicate in the rule.
    bool matches(const TrackMetadata& meta, const SmartPlaylistRule& rule) const;
    bool matches(const TrackMetadata& meta, const RulePredicate& predicate) const;

    // Builds a rule from its JSON form, e.g. {"min_tempo": 120} or
    // {"genre": ["rock", "jazz"]}. Recognized keys: min_tempo, max_tempo,
    // genre. Other keys land in ignoredKeys. A recognized key with a value of
    // the wrong type, or a playlist name that is not a plain file name,
    // fails with errorMessage set.
    static bool parseRule(const QString& playlistName, const QJsonObject& json,
                          SmartPlaylistRule& rule, QString* errorMessage = nullptr);

    // Inverse of parseRule; unrecognized keys come back with their values.
    static QJsonObject ruleToJson(const SmartPlaylistRule& rule);

private:
    bool tempoKnown(const TrackMetadata& meta) const;

    UnknownTempoPolicy m_policy;
};
