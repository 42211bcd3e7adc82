#include "PlaylistSelector.h"

#include <QDir>
#include <algorithm>

SmartPlaylistSelector::SmartPlaylistSelector(const QString& playlistsDir,
                                             QVector<SmartPlaylistRule> rules,
                                             const RuleMatcher& matcher)
    : m_playlistsDir(playlistsDir)
    , m_rules(std::move(rules))
    , m_matcher(matcher)
{
    std::stable_sort(m_rules.begin(), m_rules.end(),
                     [](const SmartPlaylistRule& a, const SmartPlaylistRule& b) {
                         return a.playlistName < b.playlistName;
                     });
}

QStringList SmartPlaylistSelector::selectPlaylists(const OrganizedTrack& track)
{
    QStringList selected;
    const QDir dir(m_playlistsDir);
    for (const SmartPlaylistRule& rule : m_rules) {
        if (m_matcher.matches(track.metadata, rule))
            selected.append(dir.absoluteFilePath(rule.playlistName));
    }
    return selected;
}
